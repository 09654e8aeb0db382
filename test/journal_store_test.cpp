#include <catch2/catch.hpp>

#include <dedupstore/exception.hpp>
#include <dedupstore/journal_store.hpp>
#include <dedupstore/serialization.hpp>
#include <dedupstore/vfs.hpp>

#include "test_util.hpp"

#include <fmt/format.h>

#include <memory>
#include <optional>
#include <string>

using namespace dedupstore;
using dedupstore::test::unique_path;

namespace {

bytes b(const char* s) {
    return to_bytes(s);
}

journal_options test_options() {
    journal_options opts;
    opts.sync_on_commit = false;
    opts.auto_compact = false;
    return opts;
}

void put_committed(store& s, const char* key, const bytes& value) {
    transaction tx(s);
    tx.put(table::meta, b(key), value);
    tx.commit();
}

// Forwards to the in-memory file system but fails selected operations.
class faulty_vfs : public vfs {
public:
    bool fail_sync = false;
    bool fail_compaction = false;

    const char* name() const noexcept override { return "faulty"; }

    std::unique_ptr<file> open(const char* path, access_t access, int mode) override {
        const std::string p(path);
        if (fail_compaction && p.size() > 8 && p.compare(p.size() - 8, 8, ".compact") == 0) {
            // Leave a partial file behind, as a failed write would.
            memory_vfs().open(path, vfs::read_write, vfs::open_create)->write(0, "x", 1);
            DEDUPSTORE_THROW(io_error(fmt::format("Failed to open `{}`: No space left.", path)));
        }
        return std::make_unique<faulty_file>(*this, memory_vfs().open(path, access, mode));
    }

    bool exists(const char* path) override { return memory_vfs().exists(path); }
    void remove(const char* path) override { memory_vfs().remove(path); }
    void rename(const char* from, const char* to) override { memory_vfs().rename(from, to); }

    bool same_file(file& f, const char* path) override {
        check_vfs(f);
        return memory_vfs().same_file(*static_cast<faulty_file&>(f).inner, path);
    }

private:
    struct faulty_file : file {
        faulty_vfs& owner;
        std::unique_ptr<file> inner;

        faulty_file(faulty_vfs& v, std::unique_ptr<file> f)
            : file(v)
            , owner(v)
            , inner(std::move(f)) {}

        bool read_only() const noexcept override { return inner->read_only(); }
        const char* name() const noexcept override { return inner->name(); }
        void read(u64 offset, void* buffer, size_t count) override {
            inner->read(offset, buffer, count);
        }
        void write(u64 offset, const void* buffer, size_t count) override {
            inner->write(offset, buffer, count);
        }
        u64 file_size() override { return inner->file_size(); }
        void truncate(u64 size) override { inner->truncate(size); }
        void sync() override {
            if (owner.fail_sync)
                DEDUPSTORE_THROW(io_error(fmt::format("Failed to sync `{}`.", name())));
            inner->sync();
        }
        void lock(lock_mode mode) override { inner->lock(mode); }
        bool try_lock(lock_mode mode) override { return inner->try_lock(mode); }
        void unlock() override { inner->unlock(); }
        void close() override { inner->close(); }
    };
};

std::optional<bytes> get_committed(store& s, const char* key) {
    transaction tx(s);
    auto value = tx.get(table::meta, b(key));
    tx.commit();
    return value;
}

// Header (24 bytes) + put record (10 bytes) + key + value + commit record (9 bytes).
constexpr u64 header_size = 24;
u64 single_put_size(size_t key_size, size_t value_size) {
    return 10 + key_size + value_size + 9;
}

} // namespace

TEST_CASE("journal contents survive reopening", "[journal_store]") {
    const std::string path = unique_path("journal-reopen");

    {
        journal_store s(memory_vfs(), path, test_options());
        REQUIRE(s.stats().log_size == header_size);

        put_committed(s, "a", b("1"));
        REQUIRE(s.stats().log_size == header_size + single_put_size(1, 1));

        transaction tx(s);
        tx.put(table::blocks, b("x"), b("block"));
        tx.put(table::meta, b("b"), b("2"));
        tx.erase(table::meta, b("a"));
        tx.commit();
        REQUIRE(s.stats().transactions == 2);
    }

    journal_store s(memory_vfs(), path, test_options());
    REQUIRE(s.stats().transactions == 2);
    REQUIRE(s.size(table::meta) == 1);
    REQUIRE(s.size(table::blocks) == 1);

    transaction tx(s);
    REQUIRE_FALSE(tx.contains(table::meta, b("a")));
    REQUIRE(tx.get(table::meta, b("b")) == b("2"));
    REQUIRE(tx.get(table::blocks, b("x")) == b("block"));
    tx.commit();
}

TEST_CASE("incomplete transactions are discarded", "[journal_store]") {
    const std::string path = unique_path("journal-torn");

    u64 first_size = 0;
    u64 second_size = 0;
    {
        journal_store s(memory_vfs(), path, test_options());
        put_committed(s, "a", b("1"));
        first_size = s.stats().log_size;
        put_committed(s, "b", b("2"));
        second_size = s.stats().log_size;
    }
    REQUIRE(first_size == 45);
    REQUIRE(second_size == 66);

    SECTION("torn tail") {
        auto raw = memory_vfs().open(path.c_str(), vfs::read_write);
        raw->truncate(second_size - 3);
    }

    SECTION("checksum mismatch") {
        // Last byte of the second value, just before the commit record.
        auto raw = memory_vfs().open(path.c_str(), vfs::read_write);
        const byte garbage = 'X';
        raw->write(second_size - 9 - 1, &garbage, 1);
    }

    SECTION("garbage after the last transaction") {
        auto raw = memory_vfs().open(path.c_str(), vfs::read_write);
        raw->truncate(first_size);
        const bytes junk(7, 0xEE);
        raw->write(first_size, junk.data(), junk.size());
    }

    journal_store s(memory_vfs(), path, test_options());
    REQUIRE(s.stats().log_size == first_size);
    REQUIRE(get_committed(s, "a") == b("1"));
    REQUIRE_FALSE(get_committed(s, "b"));

    // The tail was cut off, so new transactions are appended after the first one.
    auto raw = memory_vfs().open(path.c_str(), vfs::read_only);
    REQUIRE(raw->file_size() == first_size);

    put_committed(s, "c", b("3"));
    REQUIRE(s.stats().log_size == first_size + single_put_size(1, 1));
}

TEST_CASE("invalid journal files are rejected", "[journal_store]") {
    const std::string path = unique_path("journal-invalid");
    {
        auto raw = memory_vfs().open(path.c_str(), vfs::read_write, vfs::open_create);

        SECTION("wrong magic") {
            const bytes junk(header_size, 'x');
            raw->write(0, junk.data(), junk.size());
        }

        SECTION("truncated header") {
            const bytes junk(5, 'x');
            raw->write(0, junk.data(), junk.size());
        }
    }

    REQUIRE_THROWS_AS(journal_store(memory_vfs(), path, test_options()), corruption_error);
}

TEST_CASE("journal handles observe each other's commits", "[journal_store]") {
    const std::string path = unique_path("journal-shared");
    journal_store first(memory_vfs(), path, test_options());
    journal_store second(memory_vfs(), path, test_options());

    put_committed(first, "a", b("1"));
    REQUIRE(get_committed(second, "a") == b("1"));

    put_committed(second, "b", b("2"));
    REQUIRE(get_committed(first, "b") == b("2"));

    SECTION("conflicting commit") {
        transaction tx(second);
        REQUIRE(tx.get(table::meta, b("a")) == b("1"));
        tx.put(table::meta, b("c"), b("3"));

        put_committed(first, "a", b("changed"));
        REQUIRE_THROWS_AS(tx.commit(), contention_error);
        REQUIRE(second.stats().conflicts == 1);
        REQUIRE_FALSE(get_committed(first, "c"));
    }

    SECTION("journal locked by another handle") {
        auto raw = memory_vfs().open(path.c_str(), vfs::read_write);
        raw->lock(file::lock_exclusive);

        {
            // Transactions can still start and read the known state.
            transaction tx(first);
            REQUIRE(tx.get(table::meta, b("a")) == b("1"));
            tx.put(table::meta, b("c"), b("3"));
            REQUIRE_THROWS_AS(tx.commit(), contention_error);
        }

        raw->unlock();
        put_committed(first, "c", b("3"));
        REQUIRE(get_committed(second, "c") == b("3"));
    }
}

TEST_CASE("compaction removes superseded records", "[journal_store]") {
    const std::string path = unique_path("journal-compact");
    journal_store s(memory_vfs(), path, test_options());
    journal_store other(memory_vfs(), path, test_options());

    for (int i = 0; i < 20; ++i) {
        put_committed(s, "counter", serialize_to_bytes(u64(i)));
    }
    put_committed(s, "gone", b("x"));
    {
        transaction tx(s);
        tx.erase(table::meta, b("gone"));
        tx.commit();
    }

    transaction stale(other);
    REQUIRE(stale.get(table::meta, b("counter")) == serialize_to_bytes(u64(19)));
    stale.put(table::meta, b("late"), b("1"));

    const u64 before = s.stats().log_size;
    s.compact();

    const auto stats = s.stats();
    REQUIRE(stats.compactions == 1);
    REQUIRE(stats.log_size == header_size + single_put_size(7, 8));
    REQUIRE(stats.log_size < before);
    REQUIRE(stats.live_bytes == 10 + 7 + 8);
    REQUIRE_FALSE(memory_vfs().exists((path + ".compact").c_str()));

    REQUIRE(get_committed(s, "counter") == serialize_to_bytes(u64(19)));
    REQUIRE_FALSE(get_committed(s, "gone"));

    // Transactions that started before the compaction must be repeated.
    REQUIRE_THROWS_AS(stale.commit(), contention_error);

    // Other handles switch to the new file.
    REQUIRE(get_committed(other, "counter") == serialize_to_bytes(u64(19)));
    put_committed(other, "late", b("1"));
    REQUIRE(get_committed(s, "late") == b("1"));

    journal_store reopened(memory_vfs(), path, test_options());
    REQUIRE(get_committed(reopened, "late") == b("1"));
    REQUIRE(reopened.size(table::meta) == 2);
}

TEST_CASE("journals are compacted automatically", "[journal_store]") {
    const std::string path = unique_path("journal-auto");
    journal_options opts = test_options();
    opts.auto_compact = true;
    opts.compact_min_size = 1;

    journal_store s(memory_vfs(), path, opts);
    const bytes value(100, 0x42);

    // Live data still makes up more than half of the journal.
    put_committed(s, "k", value);
    REQUIRE(s.stats().compactions == 0);
    REQUIRE(s.stats().log_size == header_size + single_put_size(1, 100));

    // The first record is now dead.
    put_committed(s, "k", value);
    REQUIRE(s.stats().compactions == 1);
    REQUIRE(s.stats().log_size == header_size + single_put_size(1, 100));
    REQUIRE(get_committed(s, "k") == value);
}

TEST_CASE("read-only journals reject modifications", "[journal_store]") {
    const std::string path = unique_path("journal-ro");
    journal_options ro = test_options();
    ro.read_only = true;

    REQUIRE_THROWS_AS(journal_store(memory_vfs(), path, ro), io_error);

    journal_store writer(memory_vfs(), path, test_options());
    put_committed(writer, "a", b("1"));

    journal_store reader(memory_vfs(), path, ro);
    REQUIRE(get_committed(reader, "a") == b("1"));

    transaction tx(reader);
    tx.put(table::meta, b("b"), b("2"));
    REQUIRE_THROWS_AS(tx.commit(), bad_operation);
    REQUIRE_THROWS_AS(reader.compact(), bad_operation);

    // Commits of the writer remain visible to the reader.
    put_committed(writer, "b", b("2"));
    REQUIRE(get_committed(reader, "b") == b("2"));
}

TEST_CASE("failed appends are not committed", "[journal_store]") {
    const std::string path = unique_path("journal-sync-failure");
    faulty_vfs v;
    journal_options opts = test_options();
    opts.sync_on_commit = true;

    journal_store s(v, path, opts);
    put_committed(s, "a", b("1"));
    const u64 size = s.stats().log_size;

    v.fail_sync = true;
    {
        transaction tx(s);
        tx.put(table::meta, b("b"), b("2"));
        REQUIRE_THROWS_AS(tx.commit(), io_error);
    }
    v.fail_sync = false;

    REQUIRE(s.stats().log_size == size);
    REQUIRE(s.stats().transactions == 1);
    REQUIRE_FALSE(get_committed(s, "b"));
    REQUIRE(memory_vfs().open(path.c_str())->file_size() == size);

    journal_store reopened(memory_vfs(), path, test_options());
    REQUIRE(get_committed(reopened, "a") == b("1"));
    REQUIRE_FALSE(get_committed(reopened, "b"));
}

TEST_CASE("failed automatic compaction does not fail the commit", "[journal_store]") {
    const std::string path = unique_path("journal-compact-failure");
    faulty_vfs v;
    journal_options opts = test_options();
    opts.auto_compact = true;
    opts.compact_min_size = 1;

    journal_store s(v, path, opts);
    const bytes value(100, 0x42);
    put_committed(s, "k", value);

    v.fail_compaction = true;
    for (int i = 0; i < 3; ++i) {
        REQUIRE_NOTHROW(put_committed(s, "k", value));
    }
    REQUIRE(s.stats().compactions == 0);
    REQUIRE(s.stats().transactions == 4);
    REQUIRE(s.stats().log_size == header_size + 4 * single_put_size(1, 100));
    REQUIRE_FALSE(memory_vfs().exists((path + ".compact").c_str()));

    {
        journal_store reopened(memory_vfs(), path, test_options());
        REQUIRE(reopened.stats().transactions == 4);
        REQUIRE(get_committed(reopened, "k") == value);
    }

    // Manual compaction reports the error.
    REQUIRE_THROWS_AS(s.compact(), io_error);
    REQUIRE_FALSE(memory_vfs().exists((path + ".compact").c_str()));

    v.fail_compaction = false;
    for (int i = 0; i < 10 && s.stats().compactions == 0; ++i) {
        put_committed(s, "k", value);
    }
    REQUIRE(s.stats().compactions == 1);
    REQUIRE(get_committed(s, "k") == value);
}
