/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Datapath project.
 */

#include "UnixSocketServer.h"

#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <cstring>
#include <cstddef>
#include <cerrno>
#include <format>
#include <sys/stat.h>
#include <Logging/Logger.h>

namespace Datapath::Streaming {

UnixSocketServer::UnixSocketServer(std::string socketPath)
    : _socketPath(std::move(socketPath))
{
}

UnixSocketServer::UnixSocketServer(std::string socketPath, UnixSocketServerConfig config)
    : _socketPath(std::move(socketPath))
    , _config(std::move(config))
{
}

UnixSocketServer::~UnixSocketServer() {
    auto closed = close();
    if (closed.failed()) {
        ENTROPY_LOG_WARNING_CAT("UnixSocketServer", closed.errorMessage);
    }
}

Result<void> UnixSocketServer::listen() {
    if (_listening.load(std::memory_order_acquire)) {
        return Result<void>::err(DatapathError::InvalidParameter, "Already listening");
    }

    // Remove a stale socket file left by an earlier run
    if (_config.unlinkOnStart) {
        ::unlink(_socketPath.c_str());
    }

    // Non-blocking for interruptible accept
#if defined(SOCK_NONBLOCK) && defined(SOCK_CLOEXEC)
    int fd = socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
#else
    int fd = socket(AF_UNIX, SOCK_STREAM, 0);
#endif

    if (fd < 0) {
        ENTROPY_LOG_ERROR_CAT("UnixSocketServer", std::string("Failed to create server socket: ") + strerror(errno));
        return Result<void>::err(DatapathError::ConnectionClosed,
            std::string("Failed to create server socket: ") + strerror(errno));
    }

#if !defined(SOCK_NONBLOCK) || !defined(SOCK_CLOEXEC)
    int flags = fcntl(fd, F_GETFL, 0);
    fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    fcntl(fd, F_SETFD, FD_CLOEXEC);
#endif

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;

    if (_socketPath.size() >= sizeof(addr.sun_path)) {
        ::close(fd);
        return Result<void>::err(DatapathError::InvalidParameter, "Socket path too long");
    }

    std::strncpy(addr.sun_path, _socketPath.c_str(), sizeof(addr.sun_path) - 1);

    // BSD-portable sockaddr length
    socklen_t addrlen = static_cast<socklen_t>(
        offsetof(sockaddr_un, sun_path) + std::strlen(addr.sun_path)
    );

    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), addrlen) < 0) {
        std::string error = std::string("Failed to bind socket: ") + strerror(errno);
        ENTROPY_LOG_ERROR_CAT("UnixSocketServer", error);
        ::close(fd);
        return Result<void>::err(DatapathError::ConnectionClosed, error);
    }

    if (_config.chmodMode >= 0) {
        ::chmod(_socketPath.c_str(), static_cast<mode_t>(_config.chmodMode));
    }

    if (::listen(fd, _config.backlog) < 0) {
        std::string error = std::string("Failed to listen on socket: ") + strerror(errno);
        ENTROPY_LOG_ERROR_CAT("UnixSocketServer", error);
        ::close(fd);
        ::unlink(_socketPath.c_str());
        return Result<void>::err(DatapathError::ConnectionClosed, error);
    }

    {
        std::lock_guard<std::mutex> lock(_fdMutex);
        _serverSocket = fd;
        _listening.store(true, std::memory_order_release);
    }
    ENTROPY_LOG_INFO_CAT("UnixSocketServer", std::string("Listening on ") + _socketPath);
    return Result<void>::ok();
}

std::shared_ptr<FramedSocket> UnixSocketServer::accept() {
    while (true) {
        int serverSocket;
        {
            std::lock_guard<std::mutex> lock(_fdMutex);
            if (!_listening.load(std::memory_order_acquire) || _serverSocket < 0) {
                return nullptr;
            }
            serverSocket = _serverSocket;
            ++_activeAccepts;
        }

        int clientSocket = -1;
        bool keepWaiting = waitForClient(serverSocket, clientSocket);

        {
            std::lock_guard<std::mutex> lock(_fdMutex);
            --_activeAccepts;
            if (!_listening.load(std::memory_order_acquire) && _activeAccepts == 0) {
                closeListenerLocked();
            }
        }

        if (clientSocket >= 0) {
            ENTROPY_LOG_DEBUG_CAT("UnixSocketServer", "Accepted Unix local connection");
            return std::make_shared<FramedSocket>(clientSocket, _config.maxMessageSize);
        }
        if (!keepWaiting) {
            return nullptr;
        }
    }
}

bool UnixSocketServer::waitForClient(int serverSocket, int& clientSocket) {
    pollfd pfd{serverSocket, POLLIN, 0};
    int ret = ::poll(&pfd, 1, _config.acceptPollIntervalMs);

    if (ret > 0 && (pfd.revents & POLLIN)) {
        clientSocket = ::accept(serverSocket, nullptr, nullptr);
        if (clientSocket >= 0) {
            return true;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
            return true;
        }
        if (_listening.load(std::memory_order_acquire)) {
            ENTROPY_LOG_WARNING_CAT("UnixSocketServer", std::string("accept() failed: ") + strerror(errno));
        }
        return false;
    }

    if (ret < 0) {
        if (errno == EINTR) {
            return true;
        }
        ENTROPY_LOG_WARNING_CAT("UnixSocketServer", std::string("poll() failed in accept: ") + strerror(errno));
        return false;
    }

    // Timeout, or the listener was shut down by close()
    return ret == 0 || _listening.load(std::memory_order_acquire);
}

void UnixSocketServer::closeListenerLocked() {
    if (_serverSocket >= 0) {
        ::close(_serverSocket);
        _serverSocket = -1;
    }
}

Result<void> UnixSocketServer::close() {
    {
        std::lock_guard<std::mutex> lock(_fdMutex);
        if (!_listening.exchange(false, std::memory_order_acq_rel)) {
            return Result<void>::ok();
        }
        if (_activeAccepts == 0) {
            closeListenerLocked();
        } else if (_serverSocket >= 0) {
            // Wake the poll; the last accept() out closes the descriptor
            ::shutdown(_serverSocket, SHUT_RDWR);
        }
    }

    if (::unlink(_socketPath.c_str()) < 0 && errno != ENOENT) {
        return Result<void>::err(DatapathError::ConnectionClosed,
            std::format("Failed to remove socket file {}: {}", _socketPath, strerror(errno)));
    }
    ENTROPY_LOG_INFO_CAT("UnixSocketServer", std::string("Closed ") + _socketPath);

    return Result<void>::ok();
}

uint64_t UnixSocketServer::classHash() const noexcept {
    static const uint64_t hash = static_cast<uint64_t>(
        Core::TypeSystem::createTypeId<UnixSocketServer>().id
    );
    return hash;
}

std::string UnixSocketServer::toString() const {
    return std::string(className()) + "@" +
           std::to_string(reinterpret_cast<uintptr_t>(this)) +
           "(path=" + _socketPath +
           ", listening=" + (isListening() ? "true" : "false") + ")";
}

} // namespace Datapath::Streaming
