#include "identifier.hpp"

namespace macscout::serial {

auto identifyErrorToString(IdentifyError error) noexcept -> std::string_view {
    switch (error) {
        case IdentifyError::Timeout:
            return "timeout";
        case IdentifyError::AccessDenied:
            return "access denied";
        case IdentifyError::ProtocolError:
            return "protocol error";
        case IdentifyError::Disconnected:
            return "disconnected";
        case IdentifyError::Cancelled:
            return "cancelled";
    }
    return "unknown";
}

auto IdentifyFailure::describe() const -> std::string {
    std::string text(identifyErrorToString(code));
    if (!message.empty()) {
        text += ": ";
        text += message;
    }
    return text;
}

}  // namespace macscout::serial
