#ifndef DEDUPSTORE_STORE_HPP
#define DEDUPSTORE_STORE_HPP

#include <dedupstore/defs.hpp>

#include <functional>
#include <map>
#include <optional>
#include <string_view>
#include <tuple>
#include <utility>
#include <vector>

namespace dedupstore {

class store;

/// The tables of a store. Every table is an ordered map from byte strings to byte strings.
enum class table : u8 {
    /// Device geometry and counters.
    meta = 0,

    /// Block id -> block header (fingerprint, refcount).
    blocks = 1,

    /// Block id -> block contents.
    block_data = 2,

    /// Fingerprint || block id -> nothing. Finds blocks by content fingerprint.
    fingerprints = 3,

    /// Block id -> nothing. Contains all blocks with a reference count of zero.
    garbage = 4,

    /// LBA -> block id.
    mappings = 5,

    /// Block id || LBA -> nothing. Finds all LBAs that map to a block.
    references = 6,
};

/// Number of tables in a store.
static constexpr u8 table_count = 7;

/// Returns the name of the table (for logs and error messages).
const char* table_name(table t) noexcept;

/// Identifies a single key in one of the tables of a store.
struct table_key {
    dedupstore::table table = table::meta;
    bytes key;

    table_key() = default;

    table_key(dedupstore::table t, bytes k)
        : table(t)
        , key(std::move(k)) {}

    bool operator<(const table_key& other) const {
        return std::tie(table, key) < std::tie(other.table, other.key);
    }

    bool operator==(const table_key& other) const {
        return table == other.table && key == other.key;
    }
};

/// A key range `[lower, upper)` of a table that was scanned by a transaction,
/// together with the keys (and their versions) that were observed in that range.
struct range_read {
    dedupstore::table table = table::meta;
    bytes lower;
    bytes upper; // Empty means "unbounded".
    std::vector<std::pair<bytes, u64>> observed;
};

/// The accumulated effects of a transaction. Handed to the store on commit.
///
/// Versions are numbers assigned by the store whenever a key is modified. A version of 0
/// means that the key does not exist. A transaction can only commit if every key
/// it has read or written still has the version that was observed by the transaction,
/// and if every scanned range still contains exactly the observed keys and versions.
struct change_set {
    /// The store generation at the start of the transaction. Stores that rewrite
    /// their version numbers (e.g. on compaction) start a new epoch.
    u64 epoch = 0;

    /// Keys that have been put (value) or erased (no value) by the transaction.
    std::map<table_key, std::optional<bytes>> writes;

    /// Versions of all keys the transaction read or wrote, as observed at first access.
    std::map<table_key, u64> reads;

    /// Ranges scanned by the transaction.
    std::vector<range_read> ranges;
};

/// A transaction against a \ref store.
///
/// Reads observe the most recently committed state of the store, overlaid with the
/// uncommitted writes of this transaction. Writes are buffered in memory until
/// \ref commit() is called, which applies all of them atomically.
///
/// Commit fails with a \ref contention_error if another transaction modified anything
/// this transaction has observed, or if the store is currently locked by another writer.
/// The transaction is finished in either case; the caller is expected to repeat the
/// whole operation in a new transaction (see \ref run_transaction).
///
/// A transaction that is destroyed while still active is rolled back.
/// Transactions must not be shared between threads; stores can be.
class transaction {
public:
    /// Receives the key and value of every entry visited by \ref scan().
    /// Return false to stop the iteration.
    using scan_callback = std::function<bool(const bytes& key, const bytes& value)>;

public:
    /// Starts a new transaction.
    explicit transaction(store& s);

    ~transaction();

    transaction(const transaction&) = delete;
    transaction& operator=(const transaction&) = delete;

    /// The store this transaction operates on.
    store& get_store() const { return *m_store; }

    /// True until the transaction has been committed or rolled back.
    bool active() const { return m_active; }

    /// True if the transaction has not modified anything (yet).
    bool read_only() const { return m_changes.writes.empty(); }

    /// Returns the value associated with `key` or an empty optional if there is none.
    std::optional<bytes> get(table t, const bytes& key);

    /// Returns true if `key` exists in the table.
    bool contains(table t, const bytes& key);

    /// Associates `value` with `key`, replacing the existing value (if any).
    void put(table t, const bytes& key, bytes value);

    /// Removes `key` from the table. Does nothing if the key does not exist.
    void erase(table t, const bytes& key);

    /// Visits all entries with `lower <= key < upper` in ascending key order.
    /// An empty `upper` means that the range is unbounded.
    void scan(table t, const bytes& lower, const bytes& upper, const scan_callback& fn);

    /// Visits all entries whose key starts with `prefix`.
    void scan_prefix(table t, const bytes& prefix, const scan_callback& fn);

    /// Validates and applies all changes made by this transaction.
    /// Read-only transactions are validated as well: a successful commit
    /// guarantees that everything read by the transaction was a consistent state.
    ///
    /// \throws contention_error If the transaction conflicts with another transaction.
    void commit();

    /// Throws away all changes made by this transaction.
    void rollback() noexcept;

private:
    void check_active() const;

    // Records the version of `key` when it is accessed for the first time.
    void observe(const table_key& key, u64 version);

private:
    store* m_store = nullptr;
    bool m_active = false;
    change_set m_changes;
};

/// A transactional, ordered key/value store with multiple tables.
///
/// Stores are safe to use from multiple threads at the same time. Isolation
/// between concurrent transactions is implemented with optimistic concurrency control,
/// see \ref transaction.
class store {
public:
    /// The committed state of a single key.
    struct lookup_result {
        /// The version of the key (0 if the key does not exist).
        u64 version = 0;

        /// The value of the key. Empty if the key does not exist (anymore).
        std::optional<bytes> value;
    };

    /// A live key within a scanned range.
    struct range_entry {
        bytes key;
        u64 version = 0;
        bytes value;
    };

public:
    store() = default;
    virtual ~store();

    store(const store&) = delete;
    store& operator=(const store&) = delete;

    /// Name of the store implementation (for logs).
    virtual const char* name() const noexcept = 0;

private:
    friend transaction;

    // Called when a transaction starts. Returns the current epoch.
    virtual u64 do_begin() = 0;

    // Returns the committed state of a single key.
    virtual lookup_result do_get(table t, const bytes& key) = 0;

    // Returns all committed keys in [lower, upper) in ascending order.
    virtual std::vector<range_entry> do_scan(table t, const bytes& lower, const bytes& upper) = 0;

    // Validates the change set against the committed state and applies it atomically.
    // Throws contention_error if validation fails or the store is locked.
    virtual void do_commit(const change_set& changes) = 0;
};

/// Returns the smallest byte string that is greater than all strings starting with `prefix`,
/// or an empty string if no such string exists (i.e. the prefix consists of 0xFF bytes only).
bytes prefix_upper_bound(const bytes& prefix);

/// Returns the characters of `s` as a byte string (used for named keys in the meta table).
bytes to_bytes(std::string_view s);

} // namespace dedupstore

#endif // DEDUPSTORE_STORE_HPP
