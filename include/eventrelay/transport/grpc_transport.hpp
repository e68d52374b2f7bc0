#pragma once
#include <eventrelay/transport/transport.hpp>
#include <grpcpp/grpcpp.h>
#include "eventrelay/v1/event_service.grpc.pb.h"
#include <memory>
#include <mutex>
#include <string>

namespace EventRelay {

// Metadata key carrying the credential on every streaming call.
inline constexpr const char* API_KEY_HEADER = "x-api-key";

class GrpcDuplexStream : public DuplexStream {
public:
    GrpcDuplexStream(std::unique_ptr<grpc::ClientContext> context,
                     std::unique_ptr<grpc::ClientReaderWriter<wire::EventRequest, wire::EventResponse>> stream);

    bool write(const wire::EventRequest& request) override;
    bool read(wire::EventResponse* response) override;
    bool writesDone() override;
    grpc::Status finish() override;
    void cancel() override;

private:
    // context_ must outlive stream_
    std::unique_ptr<grpc::ClientContext> context_;
    std::unique_ptr<grpc::ClientReaderWriter<wire::EventRequest, wire::EventResponse>> stream_;
};

class GrpcConnection : public Connection {
public:
    GrpcConnection(std::string endpoint, std::shared_ptr<grpc::Channel> channel);
    ~GrpcConnection() override;

    std::unique_ptr<DuplexStream> openStream(const std::string& apiKey,
                                             const StreamContext& ctx) override;
    void close() override;
    const std::string& endpoint() const override { return endpoint_; }

private:
    std::string endpoint_;
    std::mutex mutex_;
    std::shared_ptr<grpc::Channel> channel_;
    std::unique_ptr<wire::EventService::Stub> stub_;
};

/**
 * @brief Dials the ingestion service over grpc++.
 *
 * Every dialed channel gets its own subchannel pool so N dials yield N
 * independent HTTP/2 connections, which lets the load balancer in front of
 * the service spread streams across backends.
 */
class GrpcTransport : public Transport {
public:
    std::unique_ptr<Connection> dial(const std::string& endpoint,
                                     std::chrono::milliseconds timeout,
                                     bool secure) override;
};

} // namespace EventRelay
