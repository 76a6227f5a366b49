#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "error.hpp"

namespace asftoken {

/**
 * Fixed-width base62 conversion for unsigned integers.
 *
 * The alphabet order is 0-9, A-Z, a-z, giving digit values 0-61. Encoded
 * strings are most-significant digit first and left-padded with '0'.
 */
class Base62 {
public:
    static constexpr std::string_view kAlphabet =
        "0123456789"
        "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
        "abcdefghijklmnopqrstuvwxyz";
    static constexpr std::uint64_t kRadix = 62;

    /**
     * Encode a value into exactly `width` digits.
     * @return EncodingOverflow if value >= 62^width
     */
    static Result<std::string> encode(std::uint64_t value, std::size_t width);

    /**
     * Decode a digit string, most-significant digit first.
     * @return InvalidDigit for characters outside the alphabet,
     *         EncodingOverflow if the value does not fit in 64 bits
     */
    static Result<std::uint64_t> decode(std::string_view text);

    // Digit value of c, or -1 when c is not in the alphabet
    static int digitValue(char c);

    static bool isDigit(char c) { return digitValue(c) >= 0; }
};

} // namespace asftoken
