// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at https://mozilla.org/MPL/2.0/.

#include "../src/Streaming/Core/ServerConfig.h"
#include "../src/Streaming/Service/InMemoryBackend.h"
#include "../src/Streaming/Session/DataServicer.h"
#include "../src/Streaming/Transport/DatapathServer.h"
#include <Concurrency/WorkService.h>
#include <Concurrency/WorkContractGroup.h>
#include <Logging/Logger.h>
#include <csignal>
#include <atomic>
#include <format>
#include <thread>

using namespace std;
using namespace Datapath::Streaming;
using namespace EntropyEngine::Core::Concurrency;

static atomic<bool> keepRunning{true};

void signalHandler(int) {
    keepRunning = false;
}

int main() {
    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    try {
        auto configResult = ServerConfig::fromEnvironment();
        if (configResult.failed()) {
            ENTROPY_LOG_ERROR(std::format("Invalid configuration: {}", configResult.errorMessage));
            return 1;
        }
        ServerConfig config = configResult.value;

        ENTROPY_LOG_INFO("Starting Datapath Server");
        ENTROPY_LOG_INFO(std::format("Socket path: {}", config.socketPath));

        // Worker threads for asynchronous gets
        WorkService::Config workConfig;
        workConfig.threadCount = 4;
        WorkService workService(workConfig);
        WorkContractGroup asyncGets(1024, "AsyncGets");
        workService.addWorkContractGroup(&asyncGets);
        workService.start();

        {
            auto backend = make_shared<InMemoryBackend>(&asyncGets);
            auto servicer = make_shared<DataServicer>(backend, config);
            DatapathServer server(servicer, config);

            auto started = server.start();
            if (started.failed()) {
                ENTROPY_LOG_ERROR(std::format("Failed to start: {}", started.errorMessage));
                workService.stop();
                return 1;
            }

            ENTROPY_LOG_INFO("Press Ctrl+C to quit");
            while (keepRunning) {
                this_thread::sleep_for(chrono::milliseconds(100));
            }

            server.stop();
            ENTROPY_LOG_INFO(servicer->toString());
        }

        workService.stop();
        ENTROPY_LOG_INFO("Server shutdown complete");

    } catch (const exception& e) {
        ENTROPY_LOG_ERROR(std::format("Error: {}", e.what()));
        return 1;
    }

    return 0;
}
