/*
 * Counting BackendService for DataServicer tests.
 */
#pragma once

#include "../src/Streaming/Core/DatapathFault.h"
#include "../src/Streaming/Service/BackendService.h"
#include <atomic>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace Datapath::Streaming::Tests {

class MockBackend : public BackendService {
public:
    // Invocation counters
    std::atomic<int> initCalls{0};
    std::atomic<int> getCalls{0};
    std::atomic<int> asyncGetCalls{0};
    std::atomic<int> putCalls{0};
    std::atomic<int> releaseCalls{0};
    std::atomic<int> releaseAllCalls{0};
    std::atomic<int> prepCalls{0};
    std::atomic<int> shutdownCalls{0};

    // Fault injection, consumed by the next matching call
    void failNextPut(DatapathFault fault) {
        std::lock_guard<std::mutex> lk(_mx);
        _putFault = std::move(fault);
    }

    void failNextGet(DatapathFault fault) {
        std::lock_guard<std::mutex> lk(_mx);
        _getFault = std::move(fault);
    }

    void throwOnNextGet(std::string message) {
        std::lock_guard<std::mutex> lk(_mx);
        _getException = std::move(message);
    }

    // Throws a bare int, which is not a std::exception
    void throwValueOnNextPut(int value) {
        std::lock_guard<std::mutex> lk(_mx);
        _putValue = value;
    }

    void throwValueOnReleaseAll(int value) {
        std::lock_guard<std::mutex> lk(_mx);
        _releaseAllValue = value;
    }

    // Async gets complete only when completePendingGets() is called
    void setDeferAsyncGets(bool defer) {
        std::lock_guard<std::mutex> lk(_mx);
        _deferAsync = defer;
    }

    size_t completePendingGets() {
        std::vector<GetCompletion> pending;
        {
            std::lock_guard<std::mutex> lk(_mx);
            pending.swap(_pendingGets);
        }
        for (auto& completion : pending) {
            GetResponse done;
            done.valid = true;
            done.data = {0xA5};
            completion(std::move(done));
        }
        return pending.size();
    }

    std::vector<ClientId> releasedClients() const {
        std::lock_guard<std::mutex> lk(_mx);
        return _releasedClients;
    }

    std::vector<ClientId> putClients() const {
        std::lock_guard<std::mutex> lk(_mx);
        return _putClients;
    }

    // BackendService overrides
    InitResponse init(const InitRequest&) override {
        ++initCalls;
        return InitResponse{true, ""};
    }

    GetResponse getObject(const GetRequest& request, const ClientId&) override {
        ++getCalls;
        return serveGet(request);
    }

    std::optional<GetResponse> asyncGetObject(const GetRequest& request, const ClientId&,
                                              RequestId, GetCompletion completion) override {
        ++asyncGetCalls;
        {
            std::lock_guard<std::mutex> lk(_mx);
            if (_deferAsync) {
                _pendingGets.push_back(std::move(completion));
                return std::nullopt;
            }
        }
        return serveGet(request);
    }

    PutResponse putObject(const PutRequest&, const ClientId& clientId) override {
        int n = ++putCalls;
        std::lock_guard<std::mutex> lk(_mx);
        if (_putFault) {
            DatapathFault fault = *_putFault;
            _putFault.reset();
            throw fault;
        }
        if (_putValue) {
            int value = *_putValue;
            _putValue.reset();
            throw value;
        }
        _putClients.push_back(clientId);
        PutResponse response;
        response.valid = true;
        response.id = {static_cast<uint8_t>(n)};
        return response;
    }

    bool release(const ClientId&, const ObjectId& id) override {
        ++releaseCalls;
        return !id.empty();
    }

    void releaseAll(const ClientId& clientId) override {
        ++releaseAllCalls;
        std::lock_guard<std::mutex> lk(_mx);
        _releasedClients.push_back(clientId);
        if (_releaseAllValue) {
            int value = *_releaseAllValue;
            _releaseAllValue.reset();
            throw value;
        }
    }

    PrepRuntimeEnvResponse prepRuntimeEnv(const PrepRuntimeEnvRequest& request) override {
        ++prepCalls;
        return PrepRuntimeEnvResponse{request.jobConfig};
    }

    void shutdown() override { ++shutdownCalls; }

    const char* className() const noexcept override { return "MockBackend"; }

private:
    GetResponse serveGet(const GetRequest& request) {
        {
            std::lock_guard<std::mutex> lk(_mx);
            if (_getFault) {
                DatapathFault fault = *_getFault;
                _getFault.reset();
                throw fault;
            }
            if (_getException) {
                std::string message = *_getException;
                _getException.reset();
                throw std::runtime_error(message);
            }
        }
        GetResponse response;
        response.valid = true;
        response.data.assign(request.ids.size(), 0x01);
        return response;
    }

    mutable std::mutex _mx;
    std::optional<DatapathFault> _putFault;
    std::optional<DatapathFault> _getFault;
    std::optional<std::string> _getException;
    std::optional<int> _putValue;
    std::optional<int> _releaseAllValue;
    bool _deferAsync = false;
    std::vector<GetCompletion> _pendingGets;
    std::vector<ClientId> _releasedClients;
    std::vector<ClientId> _putClients;
};

} // namespace Datapath::Streaming::Tests
