#pragma once

#include <memory>
#include <string_view>

#include "component_registry.hpp"
#include "error.hpp"
#include "token.hpp"
#include "token_grammar.hpp"

namespace asftoken {

/**
 * Parses and verifies candidate token strings.
 *
 * Checks run in order: anchored grammar (MalformedToken), recomputed
 * checksum (ChecksumMismatch), then registry membership when a registry was
 * supplied (UnallocatedComponent or RegistryUnavailable). Without a registry
 * the validator works offline and skips the last check.
 */
class TokenValidator {
public:
    TokenValidator() = default;
    explicit TokenValidator(std::shared_ptr<const ComponentRegistry> registry);

    Result<Token> validate(std::string_view candidate) const;

    // Checksum tier only, for segments already accepted by the grammar
    Result<Token> verifyChecksum(const TokenParts& parts) const;

    // Registry tier; succeeds trivially when no registry is configured
    Result<bool> verifyComponent(const std::string& component) const;

    bool hasRegistry() const { return registry_ != nullptr; }

private:
    std::shared_ptr<const ComponentRegistry> registry_;
};

} // namespace asftoken
