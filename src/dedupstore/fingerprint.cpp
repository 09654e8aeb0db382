#include <dedupstore/fingerprint.hpp>

#include <dedupstore/exception.hpp>

#include <openssl/evp.h>

namespace dedupstore {

static_assert(fingerprint_size == 32, "SHA-256 digests are 32 bytes long.");

fingerprint compute_fingerprint(const byte* data, size_t size) {
    fingerprint result;
    unsigned int length = 0;
    if (!EVP_Digest(data, size, result.data(), &length, EVP_sha256(), nullptr)
        || length != result.size()) {
        DEDUPSTORE_THROW(exception("Failed to compute the SHA-256 digest of a block."));
    }
    return result;
}

std::string to_hex(const fingerprint& fp) {
    static constexpr char hexmap[] = "0123456789abcdef";

    std::string s;
    s.reserve(2 * fp.size());
    for (byte b : fp) {
        s += hexmap[(b & 0xF0) >> 4];
        s += hexmap[b & 0x0F];
    }
    return s;
}

} // namespace dedupstore
