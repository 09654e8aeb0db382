#ifndef DEDUPSTORE_FINGERPRINT_HPP
#define DEDUPSTORE_FINGERPRINT_HPP

#include <dedupstore/defs.hpp>

#include <array>
#include <string>

namespace dedupstore {

/// Size of a content fingerprint (a SHA-256 digest), in bytes.
static constexpr size_t fingerprint_size = 32;

/// A fixed-length digest of the contents of a block. Equal contents always produce
/// equal fingerprints; equal fingerprints only imply equal contents with
/// overwhelming probability (see \ref hash_policy).
using fingerprint = std::array<byte, fingerprint_size>;

/// Computes the fingerprint of the `size` bytes at `data`.
fingerprint compute_fingerprint(const byte* data, size_t size);

/// Formats the fingerprint as a lower case hex string (for logs and error messages).
std::string to_hex(const fingerprint& fp);

} // namespace dedupstore

#endif // DEDUPSTORE_FINGERPRINT_HPP
