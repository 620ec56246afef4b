//! # Content Fingerprints
//!
//! 128-bit fingerprints of fragment sources, composed output and resolution
//! keys. Built on CRC32C (Castagnoli) from `common/crc32c.hpp`.

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace smc::cache {

/// 128-bit content fingerprint.
struct Fingerprint {
    uint64_t high = 0;
    uint64_t low = 0;

    bool operator==(const Fingerprint& other) const = default;
    bool operator!=(const Fingerprint& other) const = default;

    /// Returns true if this fingerprint has not been computed yet.
    [[nodiscard]] bool is_zero() const {
        return high == 0 && low == 0;
    }

    /// Returns a 32-character hex string representation.
    [[nodiscard]] std::string to_hex() const;
};

/// Compute a fingerprint from raw bytes.
[[nodiscard]] Fingerprint fingerprint_bytes(const void* data, size_t len);

/// Compute a fingerprint from a string.
[[nodiscard]] Fingerprint fingerprint_string(std::string_view str);

/// Combine two fingerprints into one. Order matters.
[[nodiscard]] Fingerprint fingerprint_combine(Fingerprint a, Fingerprint b);

} // namespace smc::cache
