#include <eventrelay/core/events/event_codec.hpp>
#include <chrono>

namespace EventRelay {

    std::string EventCodec::encodeValue(const Json::Value& value) {
        if (value.isString()) {
            return value.asString();
        }
        // Compact single-line output, same shape a JSON marshaller would produce
        static thread_local Json::StreamWriterBuilder builder = [] {
            Json::StreamWriterBuilder b;
            b["indentation"] = "";
            b["emitUTF8"] = true;
            return b;
        }();
        return Json::writeString(builder, value);
    }

    wire::EventRequest EventCodec::toRequest(const Event& event) {
        wire::EventRequest req;
        req.set_user_id(event.subject_id);
        req.set_event_type(event.event_type);
        if (event.document_hash) {
            req.set_document_hash(*event.document_hash);
        }

        if (event.timestamp) {
            auto since_epoch = event.timestamp->time_since_epoch();
            auto secs = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
            // floor so that pre-epoch times keep nanos in [0, 1e9)
            if (secs > since_epoch) {
                secs -= std::chrono::seconds(1);
            }
            auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch - secs);
            req.mutable_timestamp()->set_seconds(secs.count());
            req.mutable_timestamp()->set_nanos(static_cast<int32_t>(nanos.count()));
        }

        if (!event.data.empty()) {
            auto* fields = req.mutable_metadata()->mutable_fields();
            for (const auto& [key, value] : event.data) {
                (*fields)[key] = encodeValue(value);
            }
        }
        return req;
    }

    Acknowledgement EventCodec::fromResponse(const wire::EventResponse& response) {
        Acknowledgement ack;
        ack.event_id = response.event_id();
        ack.certificate_id = response.certificate_id();
        ack.status = response.status();
        if (!response.error().empty()) {
            ack.error = response.error();
        }
        return ack;
    }

} // namespace EventRelay
