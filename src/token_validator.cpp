#include "token_validator.hpp"

#include <string>
#include <crow/logging.h>

namespace asftoken {

TokenValidator::TokenValidator(std::shared_ptr<const ComponentRegistry> registry)
    : registry_(std::move(registry)) {}

Result<Token> TokenValidator::verifyChecksum(const TokenParts& parts) const {
    auto expected = computeChecksum(parts.entropy);
    if (!expected) {
        return std::move(expected.error());
    }

    if (*expected != parts.checksum) {
        return Error::ChecksumMismatch(*expected, std::string(parts.checksum));
    }

    return Token(std::string(parts.component), std::string(parts.entropy), std::string(parts.checksum));
}

Result<bool> TokenValidator::verifyComponent(const std::string& component) const {
    if (!registry_) {
        return true;
    }

    auto allocated = registry_->isAllocated(component);
    if (!allocated) {
        return std::move(allocated.error());
    }
    if (!*allocated) {
        return Error::UnallocatedComponent(component);
    }
    return true;
}

Result<Token> TokenValidator::validate(std::string_view candidate) const {
    ParseOutcome outcome = parseToken(candidate);
    if (!outcome.accepted) {
        CROW_LOG_DEBUG << "Token rejected in state " << parserStateName(outcome.failed_state)
                       << " at offset " << outcome.failed_offset;
        return Error::MalformedToken(outcome.failed_state, outcome.failed_offset, outcome.reason);
    }

    auto token = verifyChecksum(outcome.parts);
    if (!token) {
        return token;
    }

    auto registered = verifyComponent(token->component());
    if (!registered) {
        return std::move(registered.error());
    }

    return token;
}

} // namespace asftoken
