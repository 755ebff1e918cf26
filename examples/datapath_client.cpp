// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at https://mozilla.org/MPL/2.0/.

#include "../src/Streaming/Core/ServerConfig.h"
#include "../src/Streaming/Service/InMemoryBackend.h"
#include "../src/Streaming/Transport/DatapathClient.h"
#include <Logging/Logger.h>
#include <format>
#include <string>

using namespace std;
using namespace Datapath::Streaming;

static DataRequest makeRequest(RequestId reqId, RequestPayload payload) {
    DataRequest request;
    request.reqId = reqId;
    request.payload = std::move(payload);
    return request;
}

int main(int argc, char** argv) {
    const string clientId = argc > 1 ? argv[1] : "example-client";

    auto configResult = ServerConfig::fromEnvironment();
    if (configResult.failed()) {
        ENTROPY_LOG_ERROR(std::format("Invalid configuration: {}", configResult.errorMessage));
        return 1;
    }
    const string socketPath = configResult.value.socketPath;

    DatapathClient client;
    auto connected = client.connect(socketPath, clientId, false);
    if (connected.failed()) {
        ENTROPY_LOG_ERROR(std::format("Failed to connect: {}", connected.errorMessage));
        return 1;
    }

    RequestId nextId = 1;

    InitRequest init;
    init.reconnectGracePeriod = 5;
    auto initResp = client.call(makeRequest(nextId++, init));
    if (initResp.failed()) {
        ENTROPY_LOG_ERROR(std::format("Init failed: {}", initResp.errorMessage));
        return 1;
    }

    auto infoResp = client.call(makeRequest(nextId++, ConnectionInfoRequest{}));
    if (infoResp.success()) {
        const auto& info = std::get<ConnectionInfoResponse>(infoResp.value.payload);
        ENTROPY_LOG_INFO(std::format("Server {} ({}), protocol {}, {} client(s)",
                                     info.serverVersion, info.serverCommit, info.protocolVersion, info.numClients));
    }

    string text = "hello from " + clientId;
    PutRequest put;
    put.data.assign(text.begin(), text.end());
    auto putResp = client.call(makeRequest(nextId++, put));
    if (putResp.failed()) {
        ENTROPY_LOG_ERROR(std::format("Put failed: {}", putResp.errorMessage));
        return 1;
    }
    ObjectId id = std::get<PutResponse>(putResp.value.payload).id;

    GetRequest get;
    get.ids.push_back(id);
    get.timeoutSeconds = 5.0;
    auto getResp = client.call(makeRequest(nextId++, get));
    if (getResp.success()) {
        const auto& result = std::get<GetResponse>(getResp.value.payload);
        auto objects = InMemoryBackend::unpackObjects(result.data);
        if (result.valid && objects && objects->size() == 1) {
            ENTROPY_LOG_INFO(std::format("Got back: {}", string(objects->front().begin(), objects->front().end())));
        } else {
            ENTROPY_LOG_WARNING(std::format("Get failed: {}", result.error));
        }
    }

    ReleaseRequest release;
    release.ids.push_back(id);
    auto releaseResp = client.call(makeRequest(nextId++, release));
    if (releaseResp.success()) {
        const auto& released = std::get<ReleaseResponse>(releaseResp.value.payload);
        ENTROPY_LOG_INFO(std::format("Released: {}", !released.ok.empty() && released.ok.front()));
    }

    // Graceful shutdown: cleanup request, then wait for the final status
    auto cleanupResp = client.call(makeRequest(nextId++, ConnectionCleanupRequest{}));
    if (cleanupResp.failed()) {
        ENTROPY_LOG_WARNING(std::format("Cleanup failed: {}", cleanupResp.errorMessage));
    }
    client.closeSend();

    auto last = client.receive();
    if (last.success() && std::holds_alternative<StreamStatus>(last.value)) {
        const auto& status = std::get<StreamStatus>(last.value);
        ENTROPY_LOG_INFO(std::format("Stream finished: {}", statusCodeToString(status.code)));
    }

    client.disconnect();
    return 0;
}
