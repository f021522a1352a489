#include "migrator/core/fingerprint.h"

#include <array>
#include <cstdio>

namespace migrator {
namespace core {
namespace {

constexpr uint32_t kCrc32Poly = 0xEDB88320u;

std::array<uint32_t, 256> MakeCrc32Table() {
    std::array<uint32_t, 256> table{};
    for (uint32_t i = 0; i < 256; ++i) {
        uint32_t c = i;
        for (int k = 0; k < 8; ++k) {
            c = (c & 1u) ? (kCrc32Poly ^ (c >> 1)) : (c >> 1);
        }
        table[i] = c;
    }
    return table;
}

std::string ToHex(uint32_t value) {
    char buf[9];
    std::snprintf(buf, sizeof(buf), "%08x", value);
    return std::string(buf, 8);
}

} // namespace

uint32_t Crc32Update(uint32_t crc, const uint8_t* data, size_t len) {
    static const std::array<uint32_t, 256> table = MakeCrc32Table();
    crc ^= 0xFFFFFFFFu;
    for (size_t i = 0; i < len; ++i) {
        crc = table[(crc ^ data[i]) & 0xFFu] ^ (crc >> 8);
    }
    return crc ^ 0xFFFFFFFFu;
}

uint32_t Crc32(const uint8_t* data, size_t len) {
    return Crc32Update(0, data, len);
}

std::string ContentFingerprint(const std::vector<uint8_t>& bytes) {
    return ToHex(Crc32(bytes.data(), bytes.size()));
}

std::string ContentFingerprint(const std::string& bytes) {
    return ToHex(Crc32(reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size()));
}

} // namespace core
} // namespace migrator
