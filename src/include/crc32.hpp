#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace asftoken {

/**
 * IEEE 802.3 CRC-32 (reflected polynomial 0xEDB88320, initial register
 * 0xFFFFFFFF, final XOR 0xFFFFFFFF). Bit-for-bit compatible with zlib's crc32.
 */
class Crc32 {
public:
    static constexpr std::uint32_t kPolynomial = 0xEDB88320u;
    static constexpr std::uint32_t kInitialRegister = 0xFFFFFFFFu;
    static constexpr std::uint32_t kFinalXor = 0xFFFFFFFFu;

    // CRC of the raw bytes of a string, in order
    static std::uint32_t compute(std::string_view bytes);

    static std::uint32_t compute(const void* data, std::size_t size);

    /**
     * Advance a running register over another buffer. Start from
     * kInitialRegister and XOR the final register with kFinalXor.
     */
    static std::uint32_t update(std::uint32_t crc, const void* data, std::size_t size);

private:
    Crc32() = delete;
};

} // namespace asftoken
