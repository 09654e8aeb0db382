#ifndef DEDUPSTORE_BLOCK_INDEX_HPP
#define DEDUPSTORE_BLOCK_INDEX_HPP

#include <dedupstore/block_store.hpp>
#include <dedupstore/defs.hpp>
#include <dedupstore/store.hpp>

#include <functional>
#include <map>
#include <optional>
#include <vector>

namespace dedupstore {

/**
 * Maps logical block addresses to the blocks that currently occupy them.
 * LBAs without a mapping read as zeros.
 *
 * The index maintains a reverse index from block ids to LBAs, so that all LBAs
 * referencing a block can be found without a full scan.
 *
 * Like \ref block_store, a block index is a view bound to a single transaction.
 * It does not touch reference counts; that is the job of the caller.
 */
class block_index {
public:
    /// Receives every visited mapping. Return false to stop.
    using mapping_callback = std::function<bool(lba_t, block_id)>;

public:
    explicit block_index(transaction& tx);

    /// Returns the block mapped at `lba`, if any.
    std::optional<block_id> lookup(lba_t lba);

    /// Returns all mappings in `[first, first + count)`.
    std::map<lba_t, block_id> lookup_range(lba_t first, u64 count);

    /// Maps `lba` to `id`. Returns the block that was previously mapped at `lba` (if any).
    std::optional<block_id> assign(lba_t lba, block_id id);

    /// Removes the mapping at `lba`. Returns the block that was mapped there (if any).
    std::optional<block_id> remove(lba_t lba);

    /// Removes all mappings in `[first, first + count)`. Returns the number of removed
    /// mappings for every affected block.
    std::map<block_id, u64> remove_range(lba_t first, u64 count);

    /// Returns all LBAs that map to the given block, in ascending order.
    std::vector<lba_t> references(block_id id);

    /// Returns the number of LBAs that map to the given block.
    u64 reference_count(block_id id);

    /// Visits all mappings in LBA order.
    void for_each(const mapping_callback& fn);

    /// Visits all entries of the reverse index in (block id, LBA) order.
    void for_each_reference(const std::function<bool(block_id, lba_t)>& fn);

private:
    void link(lba_t lba, block_id id);
    void unlink(lba_t lba, block_id id);

private:
    transaction& m_tx;
};

} // namespace dedupstore

#endif // DEDUPSTORE_BLOCK_INDEX_HPP
