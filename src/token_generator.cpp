#include "token_generator.hpp"

#include <stdexcept>
#include <crow/logging.h>

#include "base62.hpp"
#include "token_grammar.hpp"

namespace asftoken {

namespace {
    // Largest multiple of 62 that fits in a byte
    constexpr unsigned kUnbiasedByteLimit = 248;
}

TokenGenerator::TokenGenerator(std::shared_ptr<const ComponentRegistry> registry,
                               std::shared_ptr<EntropySource> entropy_source)
    : registry_(std::move(registry)), entropy_source_(std::move(entropy_source)) {
    if (!registry_) {
        throw std::invalid_argument("TokenGenerator requires a component registry");
    }
    if (!entropy_source_) {
        throw std::invalid_argument("TokenGenerator requires an entropy source");
    }
}

Result<std::string> TokenGenerator::drawEntropy(EntropySource& source) {
    std::string entropy;
    entropy.reserve(kEntropyLength);

    for (int round = 0; round < kMaxEntropyRounds && entropy.size() < kEntropyLength; ++round) {
        auto bytes = source.nextBytes(kEntropyLength - entropy.size());
        if (!bytes) {
            return std::move(bytes.error());
        }

        for (std::uint8_t byte : *bytes) {
            if (byte >= kUnbiasedByteLimit) {
                continue;
            }
            entropy.push_back(Base62::kAlphabet[byte % Base62::kRadix]);
            if (entropy.size() == kEntropyLength) {
                break;
            }
        }
    }

    if (entropy.size() < kEntropyLength) {
        return Error::EntropyFailure(
            "Entropy source did not yield enough usable bytes",
            "Gave up after " + std::to_string(kMaxEntropyRounds) + " rounds");
    }

    return entropy;
}

Result<Token> TokenGenerator::generate(const std::string& component) const {
    if (!isValidComponent(component)) {
        return Error::InvalidComponentFormat(component);
    }

    auto allocated = registry_->isAllocated(component);
    if (!allocated) {
        CROW_LOG_WARNING << "Registry lookup failed for component " << component
                         << ": " << allocated.error().message;
        return std::move(allocated.error());
    }
    if (!*allocated) {
        return Error::UnallocatedComponent(component);
    }

    auto entropy = drawEntropy(*entropy_source_);
    if (!entropy) {
        CROW_LOG_ERROR << "Could not draw token entropy: " << entropy.error().message;
        return std::move(entropy.error());
    }

    auto checksum = computeChecksum(*entropy);
    if (!checksum) {
        return std::move(checksum.error());
    }

    CROW_LOG_DEBUG << "Generated token for component " << component;
    return Token(component, std::move(*entropy), std::move(*checksum));
}

} // namespace asftoken
