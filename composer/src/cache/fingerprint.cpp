#include "cache/fingerprint.hpp"

#include "common/crc32c.hpp"

namespace smc::cache {

std::string Fingerprint::to_hex() const {
    return crc32c_hex8(static_cast<uint32_t>(high >> 32)) + crc32c_hex8(static_cast<uint32_t>(high)) +
           crc32c_hex8(static_cast<uint32_t>(low >> 32)) + crc32c_hex8(static_cast<uint32_t>(low));
}

Fingerprint fingerprint_bytes(const void* data, size_t len) {
    if (!data || len == 0) {
        return {};
    }

    const auto* bytes = static_cast<const uint8_t*>(data);
    size_t half = len / 2;

    // High: CRC32C of first half combined with length
    uint32_t crc_high = smc::crc32c(bytes, half > 0 ? half : len);
    uint64_t hi = (static_cast<uint64_t>(crc_high) << 32) | static_cast<uint64_t>(len);

    // Low: CRC32C of the whole input and of the second half
    uint32_t crc_all = smc::crc32c(bytes, len);
    uint32_t crc_low = smc::crc32c(bytes + half, len - half);
    uint64_t lo = (static_cast<uint64_t>(crc_low) << 32) | static_cast<uint64_t>(crc_all);

    return {hi, lo};
}

Fingerprint fingerprint_string(std::string_view str) {
    return fingerprint_bytes(str.data(), str.size());
}

Fingerprint fingerprint_combine(Fingerprint a, Fingerprint b) {
    // Rotate `a` so that combine(a, b) != combine(b, a)
    uint64_t hi = ((a.high << 7) | (a.high >> 57)) ^ (b.high * 0x517CC1B727220A95ULL + 1);
    uint64_t lo = ((a.low << 13) | (a.low >> 51)) ^ (b.low * 0x6C62272E07BB0142ULL + 1);
    return {hi, lo};
}

} // namespace smc::cache
