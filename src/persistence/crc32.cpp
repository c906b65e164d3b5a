#include "persistence/crc32.hpp"

#include <array>

namespace sdb::persistence {

namespace {

constexpr uint32_t kReflectedPolynomial = 0xEDB88320u;

// One entry per byte value: the CRC remainder after shifting that byte through.
constexpr auto kTable = [] {
    std::array<uint32_t, 256> table{};
    for (std::size_t byte = 0; byte < table.size(); ++byte) {
        auto rem = static_cast<uint32_t>(byte);
        for (int bit = 0; bit < 8; ++bit) {
            rem = (rem & 1u) ? (rem >> 1) ^ kReflectedPolynomial : rem >> 1;
        }
        table[byte] = rem;
    }
    return table;
}();

} // anonymous namespace

uint32_t crc32(const uint8_t* data, std::size_t length) {
    uint32_t rem = ~0u;
    for (const uint8_t* end = data + length; data != end; ++data) {
        rem = (rem >> 8) ^ kTable[(rem ^ *data) & 0xFFu];
    }
    return ~rem;
}

} // namespace sdb::persistence
