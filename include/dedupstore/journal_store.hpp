#ifndef DEDUPSTORE_JOURNAL_STORE_HPP
#define DEDUPSTORE_JOURNAL_STORE_HPP

#include <dedupstore/defs.hpp>
#include <dedupstore/store.hpp>
#include <dedupstore/vfs.hpp>

#include <memory>
#include <string>

namespace dedupstore {

namespace detail {

class journal_store_impl;

} // namespace detail

/// Options for opening a \ref journal_store.
struct journal_options {
    /// Open the journal in read-only mode. Transactions can read and commit,
    /// but committing any modification fails with a \ref bad_operation.
    bool read_only = false;

    /// When enabled (the default), every commit results in an fsync() call in order to
    /// flush the new records to persistent storage. Disabling this might lose the most recent
    /// transactions on power loss but never affects the integrity of the store.
    bool sync_on_commit = true;

    /// Compact the journal automatically when it has grown beyond `compact_min_size`
    /// and most of its records have been superseded. A failed automatic compaction is
    /// logged and does not affect the commit that triggered it.
    bool auto_compact = true;

    /// Minimum size of the journal (in bytes) before automatic compaction is considered.
    u64 compact_min_size = u64(64) << 20;
};

/// Statistics about the journal file of a \ref journal_store.
struct journal_stats {
    /// Current size of the journal file, in bytes.
    u64 log_size = 0;

    /// Number of bytes occupied by records of live keys.
    u64 live_bytes = 0;

    /// Number of committed transactions that contained modifications
    /// (replayed or committed through this handle).
    u64 transactions = 0;

    /// Number of commits that failed because of a conflict or a locked journal.
    u64 conflicts = 0;

    /// Number of times the journal has been compacted by this handle.
    u64 compactions = 0;
};

/**
 * A persistent store backed by a single, append-only journal file.
 *
 * Every committed transaction is appended to the file as a sequence of put and erase
 * records, followed by a commit record that contains a checksum of the transaction.
 * The file is replayed when the store is opened; an incomplete or corrupted transaction
 * at the end of the file (e.g. after a crash) is discarded.
 *
 * The same file can be opened multiple times, by the same or by different processes.
 * Commits are serialized by an exclusive lock on the file. Transactions pick up the commits
 * of other handles when they begin and when they commit. A commit that finds the
 * file locked by another handle fails with a \ref contention_error instead of waiting.
 *
 * Superseded records are reclaimed by \ref compact(), which atomically replaces
 * the file with a new one that only contains the live keys.
 */
class journal_store final : public store {
public:
    /// Opens (or creates) the journal at `path` in the given file system.
    ///
    /// \param v
    ///     The file system. The reference must remain valid for the lifetime of the store.
    /// \param path
    ///     Path to the journal file. The file is created if it does not exist (unless
    ///     the journal is opened read only). The path `path + ".compact"` is used
    ///     as a temporary file during compaction.
    /// \param opts
    ///     Journal options.
    journal_store(vfs& v, std::string path, const journal_options& opts = journal_options());

    /// Opens (or creates) the journal at `path` in the system's file system.
    explicit journal_store(std::string path, const journal_options& opts = journal_options());

    ~journal_store();

    const char* name() const noexcept override { return "journal_store"; }

    /// Path to the journal file.
    const std::string& path() const;

    /// Returns statistics about the journal.
    journal_stats stats() const;

    /// Number of live keys in the given table (as of the last commit seen by this handle).
    size_t size(table t) const;

    /// Rewrites the journal so that it only contains live keys.
    /// Transactions that are active during the compaction will fail to commit.
    ///
    /// \throws contention_error If the journal is locked by another handle.
    void compact();

private:
    u64 do_begin() override;
    lookup_result do_get(table t, const bytes& key) override;
    std::vector<range_entry> do_scan(table t, const bytes& lower, const bytes& upper) override;
    void do_commit(const change_set& changes) override;

private:
    detail::journal_store_impl& impl() const;

private:
    std::unique_ptr<detail::journal_store_impl> m_impl;
};

} // namespace dedupstore

#endif // DEDUPSTORE_JOURNAL_STORE_HPP
