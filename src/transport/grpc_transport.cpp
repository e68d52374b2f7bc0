#include <eventrelay/transport/grpc_transport.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace EventRelay {

// ============================================================================
// GrpcDuplexStream
// ============================================================================

GrpcDuplexStream::GrpcDuplexStream(
        std::unique_ptr<grpc::ClientContext> context,
        std::unique_ptr<grpc::ClientReaderWriter<wire::EventRequest, wire::EventResponse>> stream)
    : context_(std::move(context)), stream_(std::move(stream)) {}

bool GrpcDuplexStream::write(const wire::EventRequest& request) {
    return stream_->Write(request);
}

bool GrpcDuplexStream::read(wire::EventResponse* response) {
    return stream_->Read(response);
}

bool GrpcDuplexStream::writesDone() {
    return stream_->WritesDone();
}

grpc::Status GrpcDuplexStream::finish() {
    return stream_->Finish();
}

void GrpcDuplexStream::cancel() {
    context_->TryCancel();
}

// ============================================================================
// GrpcConnection
// ============================================================================

GrpcConnection::GrpcConnection(std::string endpoint, std::shared_ptr<grpc::Channel> channel)
    : endpoint_(std::move(endpoint)),
      channel_(std::move(channel)),
      stub_(wire::EventService::NewStub(channel_)) {}

GrpcConnection::~GrpcConnection() {
    close();
}

std::unique_ptr<DuplexStream> GrpcConnection::openStream(const std::string& apiKey,
                                                         const StreamContext& ctx) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!stub_ || channel_->GetState(false) == GRPC_CHANNEL_SHUTDOWN) {
        spdlog::error("[GrpcConnection] Cannot open stream to {}: connection closed", endpoint_);
        return nullptr;
    }

    auto context = std::make_unique<grpc::ClientContext>();
    context->AddMetadata(API_KEY_HEADER, apiKey);
    if (ctx.deadline) {
        context->set_deadline(*ctx.deadline);
    }

    auto stream = stub_->StreamEvents(context.get());
    if (!stream) {
        spdlog::error("[GrpcConnection] StreamEvents call to {} could not be created", endpoint_);
        return nullptr;
    }
    return std::make_unique<GrpcDuplexStream>(std::move(context), std::move(stream));
}

// Dropping the last channel reference tears the HTTP/2 connection down.
void GrpcConnection::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!stub_) {
        return;
    }
    stub_.reset();
    channel_.reset();
    spdlog::debug("[GrpcConnection] Closed connection to {}", endpoint_);
}

// ============================================================================
// GrpcTransport
// ============================================================================

std::unique_ptr<Connection> GrpcTransport::dial(const std::string& endpoint,
                                                std::chrono::milliseconds timeout,
                                                bool secure) {
    std::shared_ptr<grpc::ChannelCredentials> creds = secure
        ? grpc::SslCredentials(grpc::SslCredentialsOptions())
        : grpc::InsecureChannelCredentials();

    grpc::ChannelArguments args;
    args.SetInt(GRPC_ARG_USE_LOCAL_SUBCHANNEL_POOL, 1);

    auto channel = grpc::CreateCustomChannel(endpoint, creds, args);
    if (!channel) {
        throw std::runtime_error("could not create channel to " + endpoint);
    }

    auto deadline = std::chrono::system_clock::now() + timeout;
    if (!channel->WaitForConnected(deadline)) {
        throw std::runtime_error("timed out after " + std::to_string(timeout.count()) +
                                 "ms waiting for " + endpoint);
    }

    spdlog::debug("[GrpcTransport] Connected to {} ({})", endpoint, secure ? "tls" : "plaintext");
    return std::make_unique<GrpcConnection>(endpoint, std::move(channel));
}

} // namespace EventRelay
