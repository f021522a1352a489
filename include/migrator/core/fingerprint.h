#ifndef MIGRATOR_CORE_FINGERPRINT_H_
#define MIGRATOR_CORE_FINGERPRINT_H_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace migrator {
namespace core {

// CRC-32 (IEEE 802.3, reflected polynomial 0xEDB88320).
uint32_t Crc32(const uint8_t* data, size_t len);

// Continues a running CRC; pass 0 for the first chunk.
uint32_t Crc32Update(uint32_t crc, const uint8_t* data, size_t len);

// Content fingerprint compared after upload: 8 lowercase hex digits of the CRC-32.
std::string ContentFingerprint(const std::vector<uint8_t>& bytes);
std::string ContentFingerprint(const std::string& bytes);

} // namespace core
} // namespace migrator

#endif // MIGRATOR_CORE_FINGERPRINT_H_
