#include <dedupstore/journal_store.hpp>

#include <dedupstore/assert.hpp>
#include <dedupstore/exception.hpp>
#include <dedupstore/serialization.hpp>
#include <dedupstore/detail/deferred.hpp>

#include "detail/versioned_map.hpp"

#include <boost/crc.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cstring>
#include <limits>
#include <mutex>
#include <optional>

namespace dedupstore {

namespace detail {

namespace {

/*
 * Layout of the journal file:
 *
 *      header | transaction | transaction | ...
 *
 * A transaction is a sequence of put and erase records followed by a single commit record.
 * Put records are followed by the key and the value, erase records by the key.
 * The commit record contains the number of records in the transaction and the CRC-32
 * of all their bytes. A transaction that is not terminated by a valid commit record is
 * incomplete (e.g. because of a crash during the append) and is ignored, together with
 * everything that follows it.
 *
 * The offset just after the commit record of a transaction is used as the version
 * of all keys modified by that transaction.
 */

constexpr char journal_magic[] = "DEDUPSTORE_JOURNAL";
constexpr u32 journal_version = 1;

using magic_t = std::array<byte, 20>;

magic_t make_magic() {
    static_assert(sizeof(journal_magic) <= std::tuple_size_v<magic_t>, "Magic string too long.");

    magic_t magic{};
    std::memcpy(magic.data(), journal_magic, sizeof(journal_magic) - 1);
    return magic;
}

struct journal_header {
    magic_t magic{};
    u32 version = 0;

    static constexpr auto get_binary_format() {
        return binary_format(&journal_header::magic, &journal_header::version);
    }
};

enum record_type_t : u8 {
    record_invalid = 0,
    record_put = 1,
    record_erase = 2,
    record_commit = 3,
};

struct put_record {
    u8 type = record_put;
    u8 table_id = 0;
    u32 key_size = 0;
    u32 value_size = 0;

    static constexpr auto get_binary_format() {
        return binary_format(&put_record::type, &put_record::table_id, &put_record::key_size,
                             &put_record::value_size);
    }
};

struct erase_record {
    u8 type = record_erase;
    u8 table_id = 0;
    u32 key_size = 0;

    static constexpr auto get_binary_format() {
        return binary_format(&erase_record::type, &erase_record::table_id,
                             &erase_record::key_size);
    }
};

struct commit_record {
    u8 type = record_commit;
    u32 op_count = 0;
    u32 checksum = 0;

    static constexpr auto get_binary_format() {
        return binary_format(&commit_record::type, &commit_record::op_count,
                             &commit_record::checksum);
    }
};

// Location of a value within the journal file.
struct value_location {
    u64 offset = 0;
    u32 size = 0;
};

// Maximum number of records per transaction written by a compaction.
constexpr size_t compact_batch_size = 4096;

u32 checked_size(size_t size, const char* what) {
    if (size > std::numeric_limits<u32>::max()) {
        DEDUPSTORE_THROW(bad_argument(fmt::format("The {} is too large ({} bytes).", what, size)));
    }
    return static_cast<u32>(size);
}

// Serializes transactions into an in-memory buffer that is later appended to the journal.
class record_writer {
public:
    explicit record_writer(u64 base_offset)
        : m_base(base_offset) {}

    // Offset (in the file) just after the last buffered byte.
    u64 end_offset() const { return m_base + m_buffer.size(); }

    // Appends a put record and returns the location of the value.
    value_location put(table t, const bytes& key, const bytes& value) {
        put_record record;
        record.table_id = static_cast<u8>(t);
        record.key_size = checked_size(key.size(), "key");
        record.value_size = checked_size(value.size(), "value");
        append(record);
        append(key.data(), key.size());

        value_location location{end_offset(), record.value_size};
        append(value.data(), value.size());
        ++m_ops;
        return location;
    }

    void erase(table t, const bytes& key) {
        erase_record record;
        record.table_id = static_cast<u8>(t);
        record.key_size = checked_size(key.size(), "key");
        append(record);
        append(key.data(), key.size());
        ++m_ops;
    }

    // Terminates the current transaction.
    void commit() {
        commit_record record;
        record.op_count = m_ops;
        record.checksum = m_crc.checksum();

        auto buffer = serialize_to_buffer(record);
        m_buffer.insert(m_buffer.end(), buffer.begin(), buffer.end());
        m_crc.reset();
        m_ops = 0;
    }

    // Writes the buffered records to the file at their final offset.
    void flush(file& fd) {
        if (!m_buffer.empty()) {
            fd.write(m_base, m_buffer.data(), m_buffer.size());
            m_base += m_buffer.size();
            m_buffer.clear();
        }
    }

private:
    template<typename Record>
    void append(const Record& record) {
        auto buffer = serialize_to_buffer(record);
        append(buffer.data(), buffer.size());
    }

    void append(const byte* data, size_t size) {
        m_buffer.insert(m_buffer.end(), data, data + size);
        m_crc.process_bytes(data, size);
    }

private:
    u64 m_base = 0;
    bytes m_buffer;
    boost::crc_32_type m_crc;
    u32 m_ops = 0;
};

// Committed state of the journal: the location of every live value.
struct journal_state {
    versioned_map<value_location> index;

    // Bytes occupied by the records of all live values.
    u64 live_bytes = 0;

    void apply(table t, const bytes& key, u64 version, std::optional<value_location> location) {
        if (const auto* old = index.find(t, key))
            live_bytes -= record_bytes(key, old->payload);
        if (location)
            live_bytes += record_bytes(key, *location);
        index.assign(t, key, version, location);
    }

    static u64 record_bytes(const bytes& key, const value_location& location) {
        return serialized_size<put_record>() + key.size() + location.size;
    }
};

} // namespace

class journal_store_impl {
public:
    journal_store_impl(vfs& v, std::string path, const journal_options& opts);

    journal_store_impl(const journal_store_impl&) = delete;
    journal_store_impl& operator=(const journal_store_impl&) = delete;

    const std::string& path() const { return m_path; }
    journal_stats stats() const;
    size_t size(table t) const;

    u64 begin();
    store::lookup_result get(table t, const bytes& key);
    std::vector<store::range_entry> scan(table t, const bytes& lower, const bytes& upper);
    void commit(const change_set& changes);
    void compact();

private:
    std::unique_ptr<file> open_journal();

    // Attempts to lock the journal file without waiting. If the journal has been replaced
    // by another handle, the new file is opened and loaded instead.
    // Returns false if the lock is held by another handle.
    bool try_acquire(file::lock_mode mode);

    // Reads the journal from the start. The file must be locked.
    void load(bool writable);

    // Replays transactions appended since the last call. The file must be locked.
    // An incomplete transaction at the end of the file is removed if `truncate_tail` is true.
    void catch_up(bool truncate_tail);

    // Replays the transaction starting at `offset`. Returns the offset just after
    // the transaction or an empty optional if the transaction is incomplete.
    std::optional<u64> replay_transaction(u64 offset, u64 end);

    void validate(const change_set& changes);

    bytes read_value(const value_location& location) const;

    // Removes everything after the last complete transaction after a failed append.
    // A failure here is only logged; the next writer cuts off the tail instead.
    void discard_tail() noexcept;

    bool should_compact() const;

    // Rewrites the journal. The file must be locked exclusively.
    void compact_locked();

    // Like compact_locked(), but errors are logged instead of thrown. The commit that
    // triggered the compaction has already been written at this point.
    void try_compact_locked() noexcept;

private:
    vfs& m_vfs;
    const std::string m_path;
    const journal_options m_options;

    // Protects all members below.
    mutable std::mutex m_mutex;

    std::unique_ptr<file> m_file;

    // Offset just after the last complete transaction.
    u64 m_log_size = 0;

    // Incremented every time the version numbers are rewritten.
    u64 m_epoch = 1;

    journal_state m_state;

    // Automatic compaction is not attempted again before the journal reaches this size.
    u64 m_compact_retry_size = 0;

    u64 m_transactions = 0;
    u64 m_conflicts = 0;
    u64 m_compactions = 0;
};

journal_store_impl::journal_store_impl(vfs& v, std::string path, const journal_options& opts)
    : m_vfs(v)
    , m_path(std::move(path))
    , m_options(opts) {
    const auto mode = m_options.read_only ? file::lock_shared : file::lock_exclusive;
    while (1) {
        m_file = open_journal();
        m_file->lock(mode);
        if (m_vfs.same_file(*m_file, m_path.c_str()))
            break;

        // Replaced by a compaction between open and lock.
        m_file->unlock();
    }

    detail::deferred guard = [&] { m_file->unlock(); };
    load(!m_options.read_only);

    spdlog::info("Opened journal `{}` ({} bytes, {} transactions).", m_path, m_log_size,
                 m_transactions);
}

journal_stats journal_store_impl::stats() const {
    std::lock_guard lock(m_mutex);

    journal_stats stats;
    stats.log_size = m_log_size;
    stats.live_bytes = m_state.live_bytes;
    stats.transactions = m_transactions;
    stats.conflicts = m_conflicts;
    stats.compactions = m_compactions;
    return stats;
}

size_t journal_store_impl::size(table t) const {
    std::lock_guard lock(m_mutex);
    return m_state.index.live_count(t);
}

u64 journal_store_impl::begin() {
    std::lock_guard lock(m_mutex);

    // Pick up the commits of other handles. If a writer holds the lock right now,
    // the transaction starts from the state we already know; it will be
    // validated against the newer state on commit.
    if (try_acquire(file::lock_shared)) {
        detail::deferred guard = [&] { m_file->unlock(); };
        catch_up(false);
    }
    return m_epoch;
}

store::lookup_result journal_store_impl::get(table t, const bytes& key) {
    std::lock_guard lock(m_mutex);

    store::lookup_result result;
    if (const auto* e = m_state.index.find(t, key)) {
        result.version = e->version;
        result.value = read_value(e->payload);
    }
    return result;
}

std::vector<store::range_entry>
journal_store_impl::scan(table t, const bytes& lower, const bytes& upper) {
    std::lock_guard lock(m_mutex);

    std::vector<store::range_entry> result;
    m_state.index.for_range(t, lower, upper, [&](const bytes& key, const auto& e) {
        result.push_back(store::range_entry{key, e.version, read_value(e.payload)});
    });
    return result;
}

void journal_store_impl::validate(const change_set& changes) {
    if (changes.epoch != m_epoch || !m_state.index.validate(changes)) {
        ++m_conflicts;
        DEDUPSTORE_THROW(contention_error("Commit failed (conflicting transaction)."));
    }
}

void journal_store_impl::commit(const change_set& changes) {
    std::lock_guard lock(m_mutex);

    if (changes.writes.empty()) {
        if (try_acquire(file::lock_shared)) {
            detail::deferred guard = [&] { m_file->unlock(); };
            catch_up(false);
        }
        validate(changes);
        return;
    }

    if (m_options.read_only) {
        DEDUPSTORE_THROW(bad_operation(
            fmt::format("Cannot modify `{}`: Journal opened in read-only mode.", m_path)));
    }

    if (!try_acquire(file::lock_exclusive)) {
        ++m_conflicts;
        DEDUPSTORE_THROW(contention_error(
            fmt::format("Commit failed (journal `{}` is locked by another handle).", m_path)));
    }

    detail::deferred guard = [&] { m_file->unlock(); };
    catch_up(true);
    validate(changes);

    record_writer writer(m_log_size);
    std::vector<std::optional<value_location>> locations;
    locations.reserve(changes.writes.size());
    for (const auto& [tk, value] : changes.writes) {
        if (value) {
            locations.push_back(writer.put(tk.table, tk.key, *value));
        } else {
            writer.erase(tk.table, tk.key);
            locations.push_back(std::nullopt);
        }
    }
    writer.commit();
    try {
        writer.flush(*m_file);
        if (m_options.sync_on_commit) {
            m_file->sync();
        }
    } catch (const std::exception&) {
        discard_tail();
        throw;
    }
    // ^ This is the point of successful commit.

    const u64 version = writer.end_offset();
    auto location = locations.begin();
    for (const auto& [tk, value] : changes.writes) {
        unused(value);
        m_state.apply(tk.table, tk.key, version, *location++);
    }
    m_log_size = version;
    ++m_transactions;

    if (should_compact())
        try_compact_locked();
}

void journal_store_impl::compact() {
    std::lock_guard lock(m_mutex);

    if (m_options.read_only) {
        DEDUPSTORE_THROW(bad_operation(
            fmt::format("Cannot compact `{}`: Journal opened in read-only mode.", m_path)));
    }

    if (!try_acquire(file::lock_exclusive)) {
        DEDUPSTORE_THROW(contention_error(
            fmt::format("Cannot compact `{}`: Journal is locked by another handle.", m_path)));
    }

    detail::deferred guard = [&] { m_file->unlock(); };
    catch_up(true);
    compact_locked();
}

std::unique_ptr<file> journal_store_impl::open_journal() {
    if (m_options.read_only)
        return m_vfs.open(m_path.c_str(), vfs::read_only, vfs::open_normal);
    return m_vfs.open(m_path.c_str(), vfs::read_write, vfs::open_create);
}

bool journal_store_impl::try_acquire(file::lock_mode mode) {
    if (!m_file->try_lock(mode))
        return false;
    if (m_vfs.same_file(*m_file, m_path.c_str()))
        return true;
    m_file->unlock();

    // The journal was replaced by a compaction through another handle.
    // All version numbers change, so transactions of the old epoch cannot commit.
    while (1) {
        auto fresh = open_journal();
        if (!fresh->try_lock(mode))
            return false;
        if (m_vfs.same_file(*fresh, m_path.c_str())) {
            m_file = std::move(fresh);

            detail::deferred guard = [&] { m_file->unlock(); };
            load(mode == file::lock_exclusive);
            guard.disable();

            ++m_epoch;
            spdlog::debug("Reloaded journal `{}` after it was replaced ({} bytes).", m_path,
                          m_log_size);
            return true;
        }
    }
}

void journal_store_impl::load(bool writable) {
    m_state = journal_state();
    m_log_size = 0;

    const u64 header_size = serialized_size<journal_header>();
    const u64 size = m_file->file_size();
    if (size == 0 && writable) {
        journal_header header;
        header.magic = make_magic();
        header.version = journal_version;

        auto buffer = serialize_to_buffer(header);
        m_file->write(0, buffer.data(), buffer.size());
        m_file->sync();
        m_log_size = header_size;
        return;
    }

    if (size < header_size) {
        DEDUPSTORE_THROW(corruption_error(
            fmt::format("Invalid journal file `{}` (file too small for the header).", m_path)));
    }

    serialized_buffer<journal_header> buffer;
    m_file->read(0, buffer.data(), buffer.size());
    const journal_header header = deserialize<journal_header>(buffer.data());
    if (header.magic != make_magic()) {
        DEDUPSTORE_THROW(corruption_error(fmt::format(
            "Invalid journal file `{}` (wrong magic bytes). Did you pass the correct file?",
            m_path)));
    }
    if (header.version != journal_version) {
        DEDUPSTORE_THROW(corruption_error(
            fmt::format("Invalid journal file `{}` (unsupported version {}, expected version {}).",
                        m_path, header.version, journal_version)));
    }

    m_log_size = header_size;
    catch_up(writable);
}

void journal_store_impl::catch_up(bool truncate_tail) {
    const u64 size = m_file->file_size();
    if (size < m_log_size) {
        DEDUPSTORE_THROW(corruption_error(fmt::format(
            "Committed transactions have been removed from journal `{}` (expected at least {} "
            "bytes, file has {} bytes).",
            m_path, m_log_size, size)));
    }

    u64 offset = m_log_size;
    while (offset < size) {
        auto next = replay_transaction(offset, size);
        if (!next)
            break;
        offset = *next;
    }

    if (offset < size && truncate_tail && !m_options.read_only) {
        spdlog::warn("Discarding {} bytes of incomplete transactions at the end of `{}`.",
                     size - offset, m_path);
        m_file->truncate(offset);
        m_file->sync();
    }
    m_log_size = offset;
}

std::optional<u64> journal_store_impl::replay_transaction(u64 offset, u64 end) {
    struct pending_op {
        table t;
        bytes key;
        std::optional<value_location> location;
    };

    std::vector<pending_op> ops;
    boost::crc_32_type crc;
    bytes buffer;

    // Reads `count` bytes at `pos` into the buffer. Fails if the range exceeds the file.
    auto read_range = [&](u64 pos, u64 count) {
        if (pos > end || count > end - pos)
            return false;
        buffer.resize(count);
        m_file->read(pos, buffer.data(), buffer.size());
        return true;
    };

    while (1) {
        if (!read_range(offset, 1))
            return {};

        switch (buffer[0]) {
        case record_put: {
            if (!read_range(offset, serialized_size<put_record>()))
                return {};

            const auto record = deserialize<put_record>(buffer.data());
            if (record.table_id >= table_count)
                return {};
            crc.process_bytes(buffer.data(), buffer.size());
            offset += buffer.size();

            if (!read_range(offset, u64(record.key_size) + record.value_size))
                return {};
            crc.process_bytes(buffer.data(), buffer.size());

            pending_op op;
            op.t = static_cast<table>(record.table_id);
            op.key.assign(buffer.begin(), buffer.begin() + record.key_size);
            op.location = value_location{offset + record.key_size, record.value_size};
            ops.push_back(std::move(op));
            offset += buffer.size();
            break;
        }

        case record_erase: {
            if (!read_range(offset, serialized_size<erase_record>()))
                return {};

            const auto record = deserialize<erase_record>(buffer.data());
            if (record.table_id >= table_count)
                return {};
            crc.process_bytes(buffer.data(), buffer.size());
            offset += buffer.size();

            if (!read_range(offset, record.key_size))
                return {};
            crc.process_bytes(buffer.data(), buffer.size());

            pending_op op;
            op.t = static_cast<table>(record.table_id);
            op.key = buffer;
            ops.push_back(std::move(op));
            offset += buffer.size();
            break;
        }

        case record_commit: {
            if (!read_range(offset, serialized_size<commit_record>()))
                return {};

            const auto record = deserialize<commit_record>(buffer.data());
            if (record.op_count != ops.size() || record.checksum != crc.checksum())
                return {};
            offset += buffer.size();

            for (auto& op : ops) {
                m_state.apply(op.t, op.key, offset, op.location);
            }
            if (!ops.empty())
                ++m_transactions;
            return offset;
        }

        default: return {};
        }
    }
}

bytes journal_store_impl::read_value(const value_location& location) const {
    bytes value(location.size);
    m_file->read(location.offset, value.data(), value.size());
    return value;
}

void journal_store_impl::discard_tail() noexcept {
    try {
        m_file->truncate(m_log_size);
        m_file->sync();
    } catch (const std::exception& e) {
        spdlog::error("Failed to remove incomplete transaction from `{}`: {}", m_path, e.what());
    }
}

bool journal_store_impl::should_compact() const {
    return m_options.auto_compact && m_log_size >= m_options.compact_min_size
           && m_log_size >= m_compact_retry_size && m_state.live_bytes * 2 < m_log_size;
}

void journal_store_impl::try_compact_locked() noexcept {
    try {
        compact_locked();
    } catch (const std::exception& e) {
        m_compact_retry_size = m_log_size + std::max(m_options.compact_min_size, m_log_size / 2);
        spdlog::warn("Automatic compaction of `{}` failed, retrying at {} bytes: {}", m_path,
                     m_compact_retry_size, e.what());
    }
}

void journal_store_impl::compact_locked() {
    const std::string temp_path = m_path + ".compact";
    const u64 old_size = m_log_size;

    // The temporary file is removed unless it replaced the journal.
    detail::deferred cleanup = [&] {
        try {
            if (m_vfs.exists(temp_path.c_str()))
                m_vfs.remove(temp_path.c_str());
        } catch (const std::exception& e) {
            spdlog::warn("Failed to remove `{}`: {}", temp_path, e.what());
        }
    };

    auto out = m_vfs.open(temp_path.c_str(), vfs::read_write, vfs::open_create);
    out->truncate(0);

    {
        journal_header header;
        header.magic = make_magic();
        header.version = journal_version;

        auto buffer = serialize_to_buffer(header);
        out->write(0, buffer.data(), buffer.size());
    }

    struct pending_op {
        table t;
        const bytes* key;
        value_location location;
    };

    journal_state next;
    record_writer writer(serialized_size<journal_header>());
    std::vector<pending_op> batch;
    auto finish_batch = [&] {
        writer.commit();
        writer.flush(*out);

        const u64 version = writer.end_offset();
        for (const auto& op : batch) {
            next.apply(op.t, *op.key, version, op.location);
        }
        batch.clear();
    };

    m_state.index.for_each([&](table t, const bytes& key, const auto& e) {
        bytes value = read_value(e.payload);
        batch.push_back(pending_op{t, &key, writer.put(t, key, value)});
        if (batch.size() == compact_batch_size)
            finish_batch();
    });
    if (!batch.empty())
        finish_batch();

    out->sync();
    m_vfs.rename(temp_path.c_str(), m_path.c_str());
    cleanup.disable();
    // ^ The new journal is in place. Other handles reload it when they notice the change.

    m_file = std::move(out);
    m_state = std::move(next);
    m_log_size = writer.end_offset();
    ++m_epoch;
    ++m_compactions;

    spdlog::info("Compacted journal `{}` from {} to {} bytes.", m_path, old_size, m_log_size);
}

} // namespace detail

journal_store::journal_store(vfs& v, std::string path, const journal_options& opts)
    : m_impl(std::make_unique<detail::journal_store_impl>(v, std::move(path), opts)) {}

journal_store::journal_store(std::string path, const journal_options& opts)
    : journal_store(system_vfs(), std::move(path), opts) {}

journal_store::~journal_store() {}

const std::string& journal_store::path() const {
    return impl().path();
}

journal_stats journal_store::stats() const {
    return impl().stats();
}

size_t journal_store::size(table t) const {
    return impl().size(t);
}

void journal_store::compact() {
    impl().compact();
}

u64 journal_store::do_begin() {
    return impl().begin();
}

store::lookup_result journal_store::do_get(table t, const bytes& key) {
    return impl().get(t, key);
}

std::vector<store::range_entry>
journal_store::do_scan(table t, const bytes& lower, const bytes& upper) {
    return impl().scan(t, lower, upper);
}

void journal_store::do_commit(const change_set& changes) {
    impl().commit(changes);
}

detail::journal_store_impl& journal_store::impl() const {
    if (!m_impl) {
        DEDUPSTORE_THROW(bad_operation("Invalid store instance."));
    }
    return *m_impl;
}

} // namespace dedupstore
