#pragma once

#include <memory>
#include <string>

#include "component_registry.hpp"
#include "entropy_source.hpp"
#include "error.hpp"
#include "token.hpp"

namespace asftoken {

/**
 * Issues new tokens for allocated components.
 *
 * The component is checked for syntax first, then against the registry, and
 * only then is entropy drawn; a rejected component never consumes randomness.
 * Apart from drawing entropy the operation has no side effects, so a
 * deterministic entropy source reproduces tokens exactly.
 */
class TokenGenerator {
public:
    // Rounds of rejection sampling before the source is considered broken
    static constexpr int kMaxEntropyRounds = 64;

    TokenGenerator(std::shared_ptr<const ComponentRegistry> registry,
                   std::shared_ptr<EntropySource> entropy_source);

    Result<Token> generate(const std::string& component) const;

    /**
     * Draw kEntropyLength characters, each uniform over the base62 alphabet.
     * Bytes >= 248 are discarded so that `byte % 62` stays unbiased.
     */
    static Result<std::string> drawEntropy(EntropySource& source);

private:
    std::shared_ptr<const ComponentRegistry> registry_;
    std::shared_ptr<EntropySource> entropy_source_;
};

} // namespace asftoken
