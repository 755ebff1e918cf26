/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Datapath project.
 */

#include "FramedSocket.h"

#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <arpa/inet.h>
#include <cstring>
#include <cstddef>
#include <cerrno>
#include <format>
#include <Logging/Logger.h>

namespace Datapath::Streaming {

static constexpr size_t FRAME_HEADER_SIZE = sizeof(uint32_t);

static void configureSocket(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    fcntl(fd, F_SETFD, FD_CLOEXEC);

#ifdef SO_NOSIGPIPE
    // macOS: prevent SIGPIPE on this socket
    int set = 1;
    setsockopt(fd, SOL_SOCKET, SO_NOSIGPIPE, &set, sizeof(set));
#endif
}

FramedSocket::FramedSocket(int fd, size_t maxMessageSize)
    : _fd(fd)
    , _maxMessageSize(maxMessageSize)
{
    configureSocket(_fd);
}

FramedSocket::~FramedSocket() {
    shutdown();
    if (_fd >= 0) {
        ::close(_fd);
        _fd = -1;
    }
}

Result<std::shared_ptr<FramedSocket>> FramedSocket::connect(const std::string& socketPath,
                                                            size_t maxMessageSize,
                                                            int connectTimeoutMs) {
    using R = Result<std::shared_ptr<FramedSocket>>;

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (socketPath.length() >= sizeof(addr.sun_path)) {
        return R::err(DatapathError::InvalidParameter, "Socket path too long");
    }
    std::strncpy(addr.sun_path, socketPath.c_str(), sizeof(addr.sun_path) - 1);

    int fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd < 0) {
        return R::err(DatapathError::ConnectionClosed,
            std::string("Failed to create socket: ") + strerror(errno));
    }
    configureSocket(fd);

    socklen_t addrlen = static_cast<socklen_t>(offsetof(sockaddr_un, sun_path) + std::strlen(addr.sun_path));

    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), addrlen) < 0) {
        if (errno != EINPROGRESS && errno != EAGAIN) {
            std::string error = std::string("Failed to connect: ") + strerror(errno);
            ::close(fd);
            return R::err(DatapathError::ConnectionClosed, error);
        }

        pollfd pfd{fd, POLLOUT, 0};
        int ret = ::poll(&pfd, 1, connectTimeoutMs);
        if (ret <= 0) {
            ::close(fd);
            return ret == 0 ? R::err(DatapathError::Timeout, "Connection timeout")
                            : R::err(DatapathError::ConnectionClosed, std::string("Poll failed: ") + strerror(errno));
        }

        int error = 0;
        socklen_t len = sizeof(error);
        if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &error, &len) < 0 || error != 0) {
            std::string message = std::string("Connection failed: ") + strerror(error != 0 ? error : errno);
            ::close(fd);
            return R::err(DatapathError::ConnectionClosed, message);
        }
    }

    ENTROPY_LOG_DEBUG_CAT("FramedSocket", std::string("Connected to ") + socketPath);
    return R::ok(std::make_shared<FramedSocket>(fd, maxMessageSize));
}

Result<void> FramedSocket::sendAll(const uint8_t* data, size_t size, int flags) {
    size_t totalSent = 0;
    int retryCount = 0;

    while (totalSent < size) {
        if (_shutdown.load(std::memory_order_acquire)) {
            return Result<void>::err(DatapathError::ConnectionClosed, "Socket shut down");
        }

        ssize_t sent = ::send(_fd, data + totalSent, size - totalSent, flags);
        if (sent < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
                // Wait for socket to become writable
                pollfd pfd{_fd, POLLOUT, 0};
                int ret = ::poll(&pfd, 1, _sendPollTimeoutMs);
                if (ret < 0 && errno != EINTR) {
                    return Result<void>::err(DatapathError::ConnectionClosed,
                        std::string("Poll failed during send: ") + strerror(errno));
                }
                if (ret == 0 && ++retryCount > _sendMaxPolls) {
                    ENTROPY_LOG_WARNING_CAT("FramedSocket", "Unix socket send timeout");
                    return Result<void>::err(DatapathError::Timeout, "Send timeout");
                }
                continue;
            }
            return Result<void>::err(DatapathError::ConnectionClosed,
                std::string("Failed to send data: ") + strerror(errno));
        }
        totalSent += static_cast<size_t>(sent);
        retryCount = 0;
    }
    return Result<void>::ok();
}

Result<void> FramedSocket::sendFrame(const std::vector<uint8_t>& payload) {
    if (payload.size() > _maxMessageSize) {
        return Result<void>::err(DatapathError::InvalidParameter,
            std::format("Message too large: {} bytes (max {})", payload.size(), _maxMessageSize));
    }

    std::lock_guard<std::mutex> lock(_sendMutex);

    // Send flags: use MSG_NOSIGNAL on Linux to prevent SIGPIPE
    int sendFlags = 0;
#ifdef MSG_NOSIGNAL
    sendFlags |= MSG_NOSIGNAL;
#endif

    uint32_t lengthBE = htonl(static_cast<uint32_t>(payload.size()));
    auto header = sendAll(reinterpret_cast<const uint8_t*>(&lengthBE), sizeof(lengthBE), sendFlags);
    if (header.failed()) {
        return header;
    }
    auto body = sendAll(payload.data(), payload.size(), sendFlags);
    if (body.failed()) {
        return body;
    }
    return Result<void>::ok();
}

Result<std::optional<std::vector<uint8_t>>> FramedSocket::receiveFrame() {
    using R = Result<std::optional<std::vector<uint8_t>>>;
    std::lock_guard<std::mutex> lock(_receiveMutex);

    std::vector<uint8_t> buffer(65536);

    while (true) {
        if (_pending.size() >= FRAME_HEADER_SIZE) {
            uint32_t lengthBE;
            std::memcpy(&lengthBE, _pending.data(), FRAME_HEADER_SIZE);
            size_t length = ntohl(lengthBE);

            if (length > _maxMessageSize) {
                return R::err(DatapathError::InvalidMessage,
                    std::format("Frame of {} bytes exceeds maximum {}", length, _maxMessageSize));
            }

            if (_pending.size() >= FRAME_HEADER_SIZE + length) {
                std::vector<uint8_t> frame(_pending.begin() + FRAME_HEADER_SIZE,
                                           _pending.begin() + static_cast<std::ptrdiff_t>(FRAME_HEADER_SIZE + length));
                _pending.erase(_pending.begin(),
                               _pending.begin() + static_cast<std::ptrdiff_t>(FRAME_HEADER_SIZE + length));
                return R::ok(std::move(frame));
            }
        }

        if (_shutdown.load(std::memory_order_acquire)) {
            return R::ok(std::nullopt);
        }

        pollfd pfd{_fd, POLLIN, 0};
        int ret = ::poll(&pfd, 1, _pollIntervalMs);
        if (ret < 0) {
            if (errno == EINTR) {
                continue;
            }
            return R::err(DatapathError::ConnectionClosed, std::string("Poll failed: ") + strerror(errno));
        }
        if (ret == 0) {
            // Timeout, loop to check _shutdown
            continue;
        }

        ssize_t received = ::recv(_fd, buffer.data(), buffer.size(), 0);
        if (received < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
                continue;
            }
            return R::err(DatapathError::ConnectionClosed, std::string("Receive failed: ") + strerror(errno));
        }

        if (received == 0) {
            // Connection closed by peer
            if (_pending.empty()) {
                return R::ok(std::nullopt);
            }
            return R::err(DatapathError::ConnectionClosed, "Connection closed in the middle of a frame");
        }

        _pending.insert(_pending.end(), buffer.begin(), buffer.begin() + received);
    }
}

void FramedSocket::shutdown() {
    if (_shutdown.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    if (_fd >= 0) {
        // shutdown() helps unblock any pending operations
        ::shutdown(_fd, SHUT_RDWR);
    }
}

void FramedSocket::shutdownWrite() {
    std::lock_guard<std::mutex> lock(_sendMutex);
    if (_fd >= 0 && !_shutdown.load(std::memory_order_acquire)) {
        ::shutdown(_fd, SHUT_WR);
    }
}

} // namespace Datapath::Streaming
