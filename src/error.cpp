#include "error.hpp"

#include <cstdint>

namespace asftoken {

std::string Error::getCodeName() const {
    switch (code) {
        case ErrorCode::InvalidComponentFormat:
            return "InvalidComponentFormat";
        case ErrorCode::UnallocatedComponent:
            return "UnallocatedComponent";
        case ErrorCode::RegistryUnavailable:
            return "RegistryUnavailable";
        case ErrorCode::MalformedToken:
            return "MalformedToken";
        case ErrorCode::ChecksumMismatch:
            return "ChecksumMismatch";
        case ErrorCode::EncodingOverflow:
            return "EncodingOverflow";
        case ErrorCode::InvalidDigit:
            return "InvalidDigit";
        case ErrorCode::EntropySourceFailure:
            return "EntropySourceFailure";
        case ErrorCode::Internal:
            return "Internal";
        default:
            return "Unknown";
    }
}

crow::json::wvalue Error::toJson() const {
    crow::json::wvalue error_json;
    error_json["success"] = false;
    error_json["error"]["code"] = getCodeName();
    error_json["error"]["message"] = message;

    if (!details.empty()) {
        error_json["error"]["details"] = details;
    }

    if (code == ErrorCode::MalformedToken) {
        error_json["error"]["state"] = parserStateName(failed_state);
        error_json["error"]["offset"] = static_cast<std::uint64_t>(failed_offset);
    }

    return error_json;
}

} // namespace asftoken
