#ifndef DEDUPSTORE_BLOCK_STORE_HPP
#define DEDUPSTORE_BLOCK_STORE_HPP

#include <dedupstore/assert.hpp>
#include <dedupstore/defs.hpp>
#include <dedupstore/fingerprint.hpp>
#include <dedupstore/serialization.hpp>
#include <dedupstore/store.hpp>

#include <functional>
#include <optional>
#include <ostream>
#include <vector>

namespace dedupstore {

/// Identifies a physical content block. Block ids are allocated from a
/// monotonically increasing counter and are never reused.
class block_id {
public:
    static constexpr u64 invalid_value = 0;

public:
    /// Constructs an invalid block id.
    block_id() = default;

    explicit block_id(u64 value)
        : m_value(value) {}

    bool valid() const { return m_value != invalid_value; }
    explicit operator bool() const { return valid(); }

    u64 value() const { return m_value; }

    bool operator<(const block_id& rhs) const { return m_value < rhs.m_value; }
    bool operator==(const block_id& rhs) const { return m_value == rhs.m_value; }
    bool operator!=(const block_id& rhs) const { return m_value != rhs.m_value; }

    friend std::ostream& operator<<(std::ostream& o, const block_id& id) {
        if (!id)
            o << "INVALID";
        else
            o << id.value();
        return o;
    }

    static constexpr auto get_binary_format() { return binary_format(&block_id::m_value); }

private:
    u64 m_value = invalid_value;
};

/// The persistent metadata of a block.
struct block_header {
    /// Fingerprint of the block's contents.
    fingerprint hash{};

    /// Number of LBAs that currently map to this block.
    u64 refcount = 0;

    static constexpr auto get_binary_format() {
        return binary_format(&block_header::hash, &block_header::refcount);
    }
};

/**
 * Content addressed storage of blocks with reference counts.
 *
 * A block store is a view of the block tables of a store, bound to a single
 * transaction. All changes become visible to other transactions once
 * that transaction commits.
 *
 * Blocks whose reference count drops to zero are recorded in a garbage index
 * and are removed by \ref collect_garbage(), which must be called before the
 * transaction commits.
 */
class block_store {
public:
    /// Receives the id and header of every visited block. Return false to stop.
    using block_callback = std::function<bool(block_id, const block_header&)>;

public:
    block_store(transaction& tx, u32 block_size);

    u32 block_size() const { return m_block_size; }

    /// Stores a new block with the given fingerprint and contents (exactly
    /// `block_size()` bytes). The new block has a reference count of 1.
    block_id insert(const fingerprint& fp, const byte* data);

    /// Returns the ids of all blocks with the given fingerprint, in ascending order.
    std::vector<block_id> find(const fingerprint& fp);

    /// Returns the header of the block or an empty optional if the block does not exist.
    std::optional<block_header> header(block_id id);

    /// Returns the contents of the block or an empty optional if the block does not exist.
    std::optional<bytes> try_read(block_id id);

    /// Returns the contents of the block.
    /// Throws a \ref corruption_error if the block does not exist.
    bytes read(block_id id);

    /// Returns the reference count of the block.
    /// Throws a \ref corruption_error if the block does not exist.
    u64 refcount(block_id id);

    /// Adds `delta` (which may be negative) to the reference count of the block.
    /// A block whose count reaches zero becomes garbage.
    ///
    /// Throws a \ref corruption_error if the block does not exist or if
    /// the reference count would become negative.
    void add_references(block_id id, i64 delta);

    /// Removes all blocks without references. Returns the number of removed blocks.
    u64 collect_garbage();

    /// Returns true if there are unreferenced blocks that have not been collected yet.
    bool has_garbage();

    /// Visits all blocks in id order.
    void for_each(const block_callback& fn);

private:
    block_id allocate_id();
    void put_header(block_id id, const block_header& header);

private:
    transaction& m_tx;
    u32 m_block_size = 0;
};

} // namespace dedupstore

#endif // DEDUPSTORE_BLOCK_STORE_HPP
