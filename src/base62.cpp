#include "base62.hpp"

#include <algorithm>
#include <limits>

namespace asftoken {

int Base62::digitValue(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'A' && c <= 'Z') {
        return c - 'A' + 10;
    }
    if (c >= 'a' && c <= 'z') {
        return c - 'a' + 36;
    }
    return -1;
}

Result<std::string> Base62::encode(std::uint64_t value, std::size_t width) {
    std::string digits;
    const std::uint64_t original = value;

    while (value > 0) {
        if (digits.size() == width) {
            return Error::EncodingOverflow(
                "Value does not fit base62 width",
                std::to_string(original) + " needs more than " + std::to_string(width) + " digits");
        }
        digits.push_back(kAlphabet[value % kRadix]);
        value /= kRadix;
    }

    std::reverse(digits.begin(), digits.end());
    digits.insert(digits.begin(), width - digits.size(), kAlphabet[0]);
    return digits;
}

Result<std::uint64_t> Base62::decode(std::string_view text) {
    constexpr std::uint64_t kMax = std::numeric_limits<std::uint64_t>::max();
    std::uint64_t acc = 0;

    for (std::size_t i = 0; i < text.size(); ++i) {
        const int digit = digitValue(text[i]);
        if (digit < 0) {
            return Error::InvalidDigit(text[i], i);
        }
        if (acc > (kMax - static_cast<std::uint64_t>(digit)) / kRadix) {
            return Error::EncodingOverflow("Base62 value exceeds 64 bits",
                                           "Input has " + std::to_string(text.size()) + " digits");
        }
        acc = acc * kRadix + static_cast<std::uint64_t>(digit);
    }

    return acc;
}

} // namespace asftoken
