#include "token_detector.hpp"

#include <crow/logging.h>

namespace asftoken {

TokenDetector::TokenDetector(std::shared_ptr<const ComponentRegistry> registry)
    : validator_(std::move(registry)) {}

TokenDetector::Cursor::Cursor(std::string_view text, const TokenValidator& validator)
    : scanner_(text), validator_(validator) {}

void TokenDetector::Cursor::reset(std::size_t offset) {
    scanner_.reset(offset);
    stats_ = DetectionStats();
}

std::optional<Detection> TokenDetector::Cursor::next() {
    while (auto span = scanner_.next()) {
        ++stats_.candidates;

        std::string_view candidate = scanner_.text().substr(span->offset, span->length);
        auto token = validator_.verifyChecksum(splitTokenParts(candidate, span->component_length));
        if (!token) {
            ++stats_.checksum_rejects;
            CROW_LOG_DEBUG << "Discarding candidate at offset " << span->offset << ": "
                           << token.error().message;
            continue;
        }

        bool registry_checked = false;
        if (validator_.hasRegistry()) {
            auto registered = validator_.verifyComponent(token->component());
            if (registered) {
                registry_checked = true;
            } else if (registered.error().code == ErrorCode::UnallocatedComponent) {
                ++stats_.registry_rejects;
                CROW_LOG_DEBUG << "Discarding candidate at offset " << span->offset
                               << ": unallocated component " << token->component();
                continue;
            } else {
                ++stats_.registry_errors;
                CROW_LOG_WARNING << "Registry unavailable while confirming candidate at offset "
                                 << span->offset << ": " << registered.error().message;
            }
        }

        ++stats_.confirmed;
        return Detection{span->offset, span->length, std::move(*token), registry_checked};
    }

    return std::nullopt;
}

TokenDetector::Cursor TokenDetector::scan(std::string_view text) const {
    return Cursor(text, validator_);
}

std::vector<Detection> TokenDetector::detectAll(std::string_view text,
                                                std::size_t max_matches,
                                                DetectionStats* stats) const {
    std::vector<Detection> detections;
    Cursor cursor = scan(text);

    while (max_matches == 0 || detections.size() < max_matches) {
        auto detection = cursor.next();
        if (!detection) {
            break;
        }
        detections.push_back(std::move(*detection));
    }

    if (stats) {
        *stats = cursor.stats();
    }

    CROW_LOG_DEBUG << "Scan finished: " << cursor.stats().candidates << " candidates, "
                   << cursor.stats().confirmed << " confirmed";
    return detections;
}

} // namespace asftoken
