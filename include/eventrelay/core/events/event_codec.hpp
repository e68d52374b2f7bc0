#pragma once
#include <eventrelay/core/events/event.hpp>
#include "eventrelay/v1/event_service.pb.h"
#include <string>

namespace EventRelay {

namespace wire = ::eventrelay::v1;

class EventCodec {
public:
    // Builds the wire record for an event. tenant_id is left for the server.
    static wire::EventRequest toRequest(const Event& event);

    static Acknowledgement fromResponse(const wire::EventResponse& response);

    // Strings are returned as-is, everything else as compact JSON.
    static std::string encodeValue(const Json::Value& value);
};

} // namespace EventRelay
