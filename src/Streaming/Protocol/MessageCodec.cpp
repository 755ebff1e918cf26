/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Datapath project.
 */

#include "MessageCodec.h"
#include "MessageSerializer.h"
#include "src/Streaming/Protocol/datapath.capnp.h"
#include <capnp/message.h>
#include <capnp/serialize.h>
#include <kj/exception.h>

#include <format>
#include <type_traits>

namespace Datapath::Streaming {

static kj::ArrayPtr<const kj::byte> asBytes(const std::vector<uint8_t>& v) {
    return kj::arrayPtr(v.data(), v.size());
}

static kj::StringPtr asText(const std::string& s) {
    return kj::StringPtr(s.c_str(), s.size());
}

static std::vector<uint8_t> toVector(capnp::Data::Reader data) {
    return std::vector<uint8_t>(data.begin(), data.end());
}

static std::string toString(capnp::Text::Reader text) {
    return std::string(text.cStr(), text.size());
}

static Result<void> writeBlob(Wire::Blob::Builder blob, const std::vector<uint8_t>& data,
                              const CodecOptions& options) {
    if (data.size() > options.compressionThreshold) {
        auto compressed = compress(data);
        if (compressed.failed()) {
            return Result<void>::err(compressed.error, compressed.errorMessage);
        }
        blob.setBytes(asBytes(compressed.value));
        blob.setCompressed(true);
        return Result<void>::ok();
    }
    blob.setBytes(asBytes(data));
    blob.setCompressed(false);
    return Result<void>::ok();
}

static Result<std::vector<uint8_t>> readBlob(Wire::Blob::Reader blob, const CodecOptions& options) {
    auto bytes = toVector(blob.getBytes());
    if (!blob.getCompressed()) {
        return Result<std::vector<uint8_t>>::ok(std::move(bytes));
    }
    return decompress(bytes, options.maxMessageSize);
}

static void writeIds(capnp::List<capnp::Data>::Builder list, const std::vector<ObjectId>& ids) {
    for (size_t i = 0; i < ids.size(); ++i) {
        list.set(static_cast<unsigned int>(i), asBytes(ids[i]));
    }
}

static std::vector<ObjectId> readIds(capnp::List<capnp::Data>::Reader list) {
    std::vector<ObjectId> ids;
    ids.reserve(list.size());
    for (auto id : list) {
        ids.push_back(toVector(id));
    }
    return ids;
}

static Result<void> writeRequest(Wire::DataRequest::Builder out, const DataRequest& request,
                                 const CodecOptions& options) {
    out.setReqId(request.reqId);

    return std::visit([&](const auto& payload) -> Result<void> {
        using T = std::decay_t<decltype(payload)>;
        if constexpr (std::is_same_v<T, InitRequest>) {
            auto init = out.initInit();
            init.setJobConfig(asBytes(payload.jobConfig));
            init.setInitOptions(asText(payload.initOptions));
            init.setReconnectGracePeriod(payload.reconnectGracePeriod);
        } else if constexpr (std::is_same_v<T, GetRequest>) {
            auto get = out.initGet();
            writeIds(get.initIds(static_cast<unsigned int>(payload.ids.size())), payload.ids);
            get.setTimeoutSeconds(payload.timeoutSeconds);
            get.setAsynchronous(payload.asynchronous);
        } else if constexpr (std::is_same_v<T, PutRequest>) {
            auto put = out.initPut();
            auto blob = writeBlob(put.initData(), payload.data, options);
            if (blob.failed()) {
                return blob;
            }
            put.setClientRefId(asBytes(payload.clientRefId));
        } else if constexpr (std::is_same_v<T, ReleaseRequest>) {
            auto release = out.initRelease();
            writeIds(release.initIds(static_cast<unsigned int>(payload.ids.size())), payload.ids);
        } else if constexpr (std::is_same_v<T, ConnectionInfoRequest>) {
            out.initConnectionInfo();
        } else if constexpr (std::is_same_v<T, PrepRuntimeEnvRequest>) {
            out.initPrepRuntimeEnv().setJobConfig(asBytes(payload.jobConfig));
        } else if constexpr (std::is_same_v<T, ConnectionCleanupRequest>) {
            out.initConnectionCleanup();
        } else if constexpr (std::is_same_v<T, AcknowledgeRequest>) {
            out.initAcknowledge().setReqId(payload.reqId);
        } else {
            out.setUnset();
        }
        return Result<void>::ok();
    }, request.payload);
}

static Result<DataRequest> readRequest(Wire::DataRequest::Reader in, const CodecOptions& options) {
    DataRequest request;
    request.reqId = in.getReqId();

    switch (in.which()) {
        case Wire::DataRequest::INIT: {
            auto init = in.getInit();
            InitRequest payload;
            payload.jobConfig = toVector(init.getJobConfig());
            payload.initOptions = toString(init.getInitOptions());
            payload.reconnectGracePeriod = init.getReconnectGracePeriod();
            request.payload = std::move(payload);
            break;
        }
        case Wire::DataRequest::GET: {
            auto get = in.getGet();
            GetRequest payload;
            payload.ids = readIds(get.getIds());
            payload.timeoutSeconds = get.getTimeoutSeconds();
            payload.asynchronous = get.getAsynchronous();
            request.payload = std::move(payload);
            break;
        }
        case Wire::DataRequest::PUT: {
            auto put = in.getPut();
            auto data = readBlob(put.getData(), options);
            if (data.failed()) {
                return Result<DataRequest>::err(data.error, data.errorMessage);
            }
            PutRequest payload;
            payload.data = std::move(data.value);
            payload.clientRefId = toVector(put.getClientRefId());
            request.payload = std::move(payload);
            break;
        }
        case Wire::DataRequest::RELEASE: {
            ReleaseRequest payload;
            payload.ids = readIds(in.getRelease().getIds());
            request.payload = std::move(payload);
            break;
        }
        case Wire::DataRequest::CONNECTION_INFO:
            request.payload = ConnectionInfoRequest{};
            break;
        case Wire::DataRequest::PREP_RUNTIME_ENV: {
            PrepRuntimeEnvRequest payload;
            payload.jobConfig = toVector(in.getPrepRuntimeEnv().getJobConfig());
            request.payload = std::move(payload);
            break;
        }
        case Wire::DataRequest::CONNECTION_CLEANUP:
            request.payload = ConnectionCleanupRequest{};
            break;
        case Wire::DataRequest::ACKNOWLEDGE: {
            AcknowledgeRequest payload;
            payload.reqId = in.getAcknowledge().getReqId();
            request.payload = payload;
            break;
        }
        case Wire::DataRequest::UNSET:
        default:
            // Newer peers may send kinds this build does not know
            request.payload = std::monostate{};
            break;
    }

    return Result<DataRequest>::ok(std::move(request));
}

static Result<void> writeResponse(Wire::DataResponse::Builder out, const DataResponse& response,
                                  const CodecOptions& options) {
    out.setReqId(response.reqId);

    return std::visit([&](const auto& payload) -> Result<void> {
        using T = std::decay_t<decltype(payload)>;
        if constexpr (std::is_same_v<T, InitResponse>) {
            auto init = out.initInit();
            init.setOk(payload.ok);
            init.setMessage(asText(payload.message));
        } else if constexpr (std::is_same_v<T, GetResponse>) {
            auto get = out.initGet();
            get.setValid(payload.valid);
            auto blob = writeBlob(get.initData(), payload.data, options);
            if (blob.failed()) {
                return blob;
            }
            get.setError(asText(payload.error));
        } else if constexpr (std::is_same_v<T, PutResponse>) {
            auto put = out.initPut();
            put.setId(asBytes(payload.id));
            put.setValid(payload.valid);
            put.setError(asText(payload.error));
        } else if constexpr (std::is_same_v<T, ReleaseResponse>) {
            auto ok = out.initRelease().initOk(static_cast<unsigned int>(payload.ok.size()));
            for (size_t i = 0; i < payload.ok.size(); ++i) {
                ok.set(static_cast<unsigned int>(i), payload.ok[i]);
            }
        } else if constexpr (std::is_same_v<T, ConnectionInfoResponse>) {
            auto info = out.initConnectionInfo();
            info.setNumClients(payload.numClients);
            info.setRuntimeVersion(asText(payload.runtimeVersion));
            info.setServerVersion(asText(payload.serverVersion));
            info.setServerCommit(asText(payload.serverCommit));
            info.setProtocolVersion(payload.protocolVersion);
        } else if constexpr (std::is_same_v<T, PrepRuntimeEnvResponse>) {
            out.initPrepRuntimeEnv().setJobConfig(asBytes(payload.jobConfig));
        } else if constexpr (std::is_same_v<T, ConnectionCleanupResponse>) {
            out.initConnectionCleanup();
        }
        return Result<void>::ok();
    }, response.payload);
}

static Result<DataResponse> readResponse(Wire::DataResponse::Reader in, const CodecOptions& options) {
    DataResponse response;
    response.reqId = in.getReqId();

    switch (in.which()) {
        case Wire::DataResponse::INIT: {
            auto init = in.getInit();
            InitResponse payload;
            payload.ok = init.getOk();
            payload.message = toString(init.getMessage());
            response.payload = std::move(payload);
            break;
        }
        case Wire::DataResponse::GET: {
            auto get = in.getGet();
            auto data = readBlob(get.getData(), options);
            if (data.failed()) {
                return Result<DataResponse>::err(data.error, data.errorMessage);
            }
            GetResponse payload;
            payload.valid = get.getValid();
            payload.data = std::move(data.value);
            payload.error = toString(get.getError());
            response.payload = std::move(payload);
            break;
        }
        case Wire::DataResponse::PUT: {
            auto put = in.getPut();
            PutResponse payload;
            payload.id = toVector(put.getId());
            payload.valid = put.getValid();
            payload.error = toString(put.getError());
            response.payload = std::move(payload);
            break;
        }
        case Wire::DataResponse::RELEASE: {
            ReleaseResponse payload;
            for (bool ok : in.getRelease().getOk()) {
                payload.ok.push_back(ok);
            }
            response.payload = std::move(payload);
            break;
        }
        case Wire::DataResponse::CONNECTION_INFO: {
            auto info = in.getConnectionInfo();
            ConnectionInfoResponse payload;
            payload.numClients = info.getNumClients();
            payload.runtimeVersion = toString(info.getRuntimeVersion());
            payload.serverVersion = toString(info.getServerVersion());
            payload.serverCommit = toString(info.getServerCommit());
            payload.protocolVersion = info.getProtocolVersion();
            response.payload = std::move(payload);
            break;
        }
        case Wire::DataResponse::PREP_RUNTIME_ENV: {
            PrepRuntimeEnvResponse payload;
            payload.jobConfig = toVector(in.getPrepRuntimeEnv().getJobConfig());
            response.payload = std::move(payload);
            break;
        }
        case Wire::DataResponse::CONNECTION_CLEANUP:
            response.payload = ConnectionCleanupResponse{};
            break;
        default:
            return Result<DataResponse>::err(DatapathError::InvalidMessage,
                std::format("Unknown response kind {}", static_cast<int>(in.which())));
    }

    return Result<DataResponse>::ok(std::move(response));
}

template<typename Fill>
static Result<std::vector<uint8_t>> encodeFrame(Fill&& fill) {
    try {
        capnp::MallocMessageBuilder builder;
        auto frame = builder.initRoot<Wire::Frame>();
        auto filled = fill(frame);
        if (filled.failed()) {
            return Result<std::vector<uint8_t>>::err(filled.error, filled.errorMessage);
        }
        return serialize(builder);
    } catch (const kj::Exception& e) {
        return Result<std::vector<uint8_t>>::err(DatapathError::SerializationFailed,
            std::string("Frame encoding failed: ") + e.getDescription().cStr());
    }
}

Result<std::vector<uint8_t>> encodeMetadata(const ConnectionMetadata& metadata) {
    return encodeFrame([&](Wire::Frame::Builder frame) {
        const auto& entries = metadata.entries();
        auto list = frame.initMetadata().initEntries(static_cast<unsigned int>(entries.size()));
        unsigned int i = 0;
        for (const auto& [key, value] : entries) {
            list[i].setKey(asText(key));
            list[i].setValue(asText(value));
            ++i;
        }
        return Result<void>::ok();
    });
}

Result<std::vector<uint8_t>> encodeRequest(const DataRequest& request, const CodecOptions& options) {
    return encodeFrame([&](Wire::Frame::Builder frame) {
        return writeRequest(frame.initRequest(), request, options);
    });
}

Result<std::vector<uint8_t>> encodeResponse(const DataResponse& response, const CodecOptions& options) {
    return encodeFrame([&](Wire::Frame::Builder frame) {
        return writeResponse(frame.initResponse(), response, options);
    });
}

Result<std::vector<uint8_t>> encodeStatus(const StreamStatus& status) {
    return encodeFrame([&](Wire::Frame::Builder frame) {
        auto out = frame.initStatus();
        out.setCode(static_cast<uint16_t>(status.code));
        out.setDetails(asText(status.details));
        return Result<void>::ok();
    });
}

Result<DecodedFrame> decodeFrame(const std::vector<uint8_t>& bytes, const CodecOptions& options) {
    auto words = deserialize(bytes);
    if (words.failed()) {
        return Result<DecodedFrame>::err(words.error, words.errorMessage);
    }

    try {
        capnp::FlatArrayMessageReader reader(words.value.asPtr());
        auto frame = reader.getRoot<Wire::Frame>();

        switch (frame.which()) {
            case Wire::Frame::METADATA: {
                ConnectionMetadata metadata;
                for (auto entry : frame.getMetadata().getEntries()) {
                    metadata.set(toString(entry.getKey()), toString(entry.getValue()));
                }
                return Result<DecodedFrame>::ok(DecodedFrame{std::move(metadata)});
            }
            case Wire::Frame::REQUEST: {
                auto request = readRequest(frame.getRequest(), options);
                if (request.failed()) {
                    return Result<DecodedFrame>::err(request.error, request.errorMessage);
                }
                return Result<DecodedFrame>::ok(DecodedFrame{std::move(request.value)});
            }
            case Wire::Frame::RESPONSE: {
                auto response = readResponse(frame.getResponse(), options);
                if (response.failed()) {
                    return Result<DecodedFrame>::err(response.error, response.errorMessage);
                }
                return Result<DecodedFrame>::ok(DecodedFrame{std::move(response.value)});
            }
            case Wire::Frame::STATUS: {
                auto in = frame.getStatus();
                if (in.getCode() > static_cast<uint16_t>(StatusCode::Unavailable)) {
                    return Result<DecodedFrame>::err(DatapathError::InvalidMessage,
                        std::format("Unknown status code {}", in.getCode()));
                }
                StreamStatus status;
                status.code = static_cast<StatusCode>(in.getCode());
                status.details = toString(in.getDetails());
                return Result<DecodedFrame>::ok(DecodedFrame{std::move(status)});
            }
            default:
                return Result<DecodedFrame>::err(DatapathError::InvalidMessage,
                    std::format("Unknown frame kind {}", static_cast<int>(frame.which())));
        }
    } catch (const kj::Exception& e) {
        return Result<DecodedFrame>::err(DatapathError::DeserializationFailed,
            std::string("Frame decoding failed: ") + e.getDescription().cStr());
    }
}

template<typename T>
static Result<T> decodeAs(const std::vector<uint8_t>& bytes, const CodecOptions& options, const char* expected) {
    auto frame = decodeFrame(bytes, options);
    if (frame.failed()) {
        return Result<T>::err(frame.error, frame.errorMessage);
    }
    if (!std::holds_alternative<T>(frame.value)) {
        return Result<T>::err(DatapathError::InvalidMessage,
            std::format("Expected a {} frame", expected));
    }
    return Result<T>::ok(std::get<T>(std::move(frame.value)));
}

Result<DataRequest> decodeRequest(const std::vector<uint8_t>& bytes, const CodecOptions& options) {
    return decodeAs<DataRequest>(bytes, options, "request");
}

Result<DataResponse> decodeResponse(const std::vector<uint8_t>& bytes, const CodecOptions& options) {
    return decodeAs<DataResponse>(bytes, options, "response");
}

} // namespace Datapath::Streaming
