#include "crc32.hpp"

#include <array>

namespace asftoken {

namespace {
    constexpr std::array<std::uint32_t, 256> makeTable() {
        std::array<std::uint32_t, 256> table{};
        for (std::uint32_t i = 0; i < 256; ++i) {
            std::uint32_t crc = i;
            for (int bit = 0; bit < 8; ++bit) {
                crc = (crc & 1u) ? (crc >> 1) ^ Crc32::kPolynomial : crc >> 1;
            }
            table[i] = crc;
        }
        return table;
    }

    constexpr std::array<std::uint32_t, 256> kTable = makeTable();
}

std::uint32_t Crc32::update(std::uint32_t crc, const void* data, std::size_t size) {
    const auto* bytes = static_cast<const unsigned char*>(data);
    for (std::size_t i = 0; i < size; ++i) {
        crc = kTable[(crc ^ bytes[i]) & 0xFFu] ^ (crc >> 8);
    }
    return crc;
}

std::uint32_t Crc32::compute(const void* data, std::size_t size) {
    return update(kInitialRegister, data, size) ^ kFinalXor;
}

std::uint32_t Crc32::compute(std::string_view bytes) {
    return compute(bytes.data(), bytes.size());
}

} // namespace asftoken
