#pragma once

#include <string>
#include <string_view>

#include "error.hpp"
#include "token_grammar.hpp"

namespace asftoken {

/**
 * An immutable, comparable token value: asf_<component>_<entropy><checksum>.
 *
 * Tokens are built by TokenGenerator or reconstructed by TokenValidator; the
 * constructor itself performs no checks.
 */
class Token {
public:
    Token(std::string component, std::string entropy, std::string checksum);

    const std::string& component() const { return component_; }
    const std::string& entropy() const { return entropy_; }
    const std::string& checksum() const { return checksum_; }

    // Wire form of the token
    std::string toString() const;

    std::size_t length() const;

    // SHA3-256 hex digest of the wire form
    Result<std::string> fingerprint() const;

    bool operator==(const Token& other) const;
    bool operator!=(const Token& other) const { return !(*this == other); }

private:
    std::string component_;
    std::string entropy_;
    std::string checksum_;
};

/**
 * Checksum for an entropy segment: the CRC-32 of its ASCII bytes, base62
 * encoded at width 6.
 */
Result<std::string> computeChecksum(std::string_view entropy);

/**
 * Lowercase hex SHA3-256 of the token text. Tokens are stored and looked up
 * by this digest so plaintext never needs to be persisted or logged.
 */
Result<std::string> fingerprintToken(std::string_view token_text);

} // namespace asftoken
