#ifndef DEDUPSTORE_RESOLVER_HPP
#define DEDUPSTORE_RESOLVER_HPP

#include <dedupstore/block_store.hpp>
#include <dedupstore/defs.hpp>
#include <dedupstore/fingerprint.hpp>

#include <map>
#include <memory>
#include <optional>
#include <vector>

namespace dedupstore {

/// Decides when two blocks with the same fingerprint are considered identical.
enum class hash_policy {
    /// Blocks are identical if their fingerprints and their contents are equal.
    /// Fingerprint collisions result in distinct blocks.
    verified,

    /// Blocks are identical if their fingerprints are equal. Saves a read
    /// and a comparison for every deduplicated block.
    trusted,
};

/// Returns the name of the policy.
const char* to_string(hash_policy policy);

/// Blocks created by the current write operation, by fingerprint.
using working_set = std::map<fingerprint, std::vector<block_id>>;

/// Finds an existing block with the same contents as a block that is being written.
class block_resolver {
public:
    block_resolver() = default;
    virtual ~block_resolver();

    block_resolver(const block_resolver&) = delete;
    block_resolver& operator=(const block_resolver&) = delete;

    /// The policy implemented by this resolver.
    virtual hash_policy policy() const noexcept = 0;

    /// Returns an existing block that is identical to `data` (with fingerprint `fp`),
    /// or an empty optional if no such block exists. The blocks in `created` are
    /// considered before the blocks in the store.
    virtual std::optional<block_id> resolve(block_store& blocks, const working_set& created,
                                            const fingerprint& fp, const byte* data) const = 0;

protected:
    // Returns the candidates for `fp`: blocks from the working set first, then all
    // other blocks with the same fingerprint in the store.
    static std::vector<block_id>
    candidates(block_store& blocks, const working_set& created, const fingerprint& fp);
};

/// Returns the resolver that implements the given policy.
std::unique_ptr<block_resolver> make_resolver(hash_policy policy);

} // namespace dedupstore

#endif // DEDUPSTORE_RESOLVER_HPP
