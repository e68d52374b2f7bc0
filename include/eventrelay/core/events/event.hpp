#pragma once
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <json/json.h>

namespace EventRelay {

    using Timestamp = std::chrono::system_clock::time_point;

    /**
     * @brief One unit of data submitted for ingestion.
     *
     * Values in `data` may be any JSON value. Strings travel verbatim, every
     * other value is JSON-encoded when the event is put on the wire.
     */
    struct Event {
        std::string subject_id;
        std::string event_type;
        std::optional<std::string> document_hash;
        std::map<std::string, Json::Value> data;
        std::optional<Timestamp> timestamp;

        Event() = default;
        Event(std::string subject, std::string type)
            : subject_id(std::move(subject)), event_type(std::move(type)) {}
    };

    // Submitted events are immutable; a queue element is owned by one worker at a time.
    using EventPtr = std::shared_ptr<const Event>;

    inline EventPtr makeEvent(Event e) {
        return std::make_shared<const Event>(std::move(e));
    }

    enum struct AckStatus {
        OK,
        FAILED
    };

    /**
     * @brief Per-event outcome reported by the ingestion service.
     *
     * Acknowledgements arrive asynchronously and in any order; match them by
     * event_id, never by position.
     */
    struct Acknowledgement {
        std::string event_id;
        std::string certificate_id;
        std::string status;
        std::optional<std::string> error;

        AckStatus outcome() const {
            return (status == "error" || status == "failed") ? AckStatus::FAILED : AckStatus::OK;
        }
    };

} // namespace EventRelay
