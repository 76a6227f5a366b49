#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "error.hpp"

namespace asftoken {

/**
 * Source of uniformly random bytes for token entropy.
 *
 * Production sources must be cryptographically secure and safe to call from
 * several threads at once. Tests substitute deterministic sources.
 */
class EntropySource {
public:
    virtual ~EntropySource() = default;

    virtual Result<std::vector<std::uint8_t>> nextBytes(std::size_t count) = 0;
};

// OpenSSL RAND_bytes; fails with EntropySourceFailure, never falls back
class OpenSslEntropySource : public EntropySource {
public:
    OpenSslEntropySource() = default;

    Result<std::vector<std::uint8_t>> nextBytes(std::size_t count) override;
};

} // namespace asftoken
