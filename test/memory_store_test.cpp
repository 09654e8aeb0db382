#include <catch2/catch.hpp>

#include <dedupstore/exception.hpp>
#include <dedupstore/memory_store.hpp>

#include <string>
#include <vector>

using namespace dedupstore;

namespace {

bytes b(const char* s) {
    return to_bytes(s);
}

std::vector<std::string> keys_of(transaction& tx, table t, const bytes& lower, const bytes& upper) {
    std::vector<std::string> keys;
    tx.scan(t, lower, upper, [&](const bytes& key, const bytes&) {
        keys.emplace_back(key.begin(), key.end());
        return true;
    });
    return keys;
}

void put_committed(store& s, table t, const char* key, const char* value) {
    transaction tx(s);
    tx.put(t, b(key), b(value));
    tx.commit();
}

} // namespace

TEST_CASE("committed writes become visible", "[memory_store]") {
    memory_store s;

    {
        transaction tx(s);
        REQUIRE(tx.read_only());
        REQUIRE_FALSE(tx.get(table::meta, b("a")));

        tx.put(table::meta, b("a"), b("1"));
        REQUIRE_FALSE(tx.read_only());
        REQUIRE(tx.get(table::meta, b("a")) == b("1"));

        // Not visible to other transactions before the commit.
        transaction other(s);
        REQUIRE_FALSE(other.contains(table::meta, b("a")));
        other.rollback();

        tx.commit();
        REQUIRE_FALSE(tx.active());
    }

    transaction tx(s);
    REQUIRE(tx.get(table::meta, b("a")) == b("1"));
    REQUIRE_FALSE(tx.contains(table::blocks, b("a")));
    REQUIRE(s.size(table::meta) == 1);
    REQUIRE(s.size(table::blocks) == 0);
}

TEST_CASE("rolled back writes are discarded", "[memory_store]") {
    memory_store s;
    put_committed(s, table::meta, "a", "1");

    {
        transaction tx(s);
        tx.put(table::meta, b("a"), b("2"));
        tx.erase(table::meta, b("a"));
        REQUIRE_FALSE(tx.contains(table::meta, b("a")));
        // Destroyed while active.
    }
    {
        transaction tx(s);
        tx.put(table::meta, b("b"), b("3"));
        tx.rollback();
        REQUIRE_FALSE(tx.active());
        REQUIRE_THROWS_AS(tx.get(table::meta, b("a")), bad_operation);
        REQUIRE_THROWS_AS(tx.commit(), bad_operation);
    }

    transaction tx(s);
    REQUIRE(tx.get(table::meta, b("a")) == b("1"));
    REQUIRE_FALSE(tx.contains(table::meta, b("b")));
}

TEST_CASE("scans include the transaction's own writes", "[memory_store]") {
    memory_store s;
    {
        transaction tx(s);
        for (const char* key : {"a", "b", "c", "d", "e"})
            tx.put(table::meta, b(key), b("x"));
        tx.put(table::blocks, b("c2"), b("y"));
        tx.commit();
    }

    transaction tx(s);
    tx.erase(table::meta, b("b"));
    tx.put(table::meta, b("c1"), b("z"));
    tx.put(table::meta, b("f"), b("z"));

    REQUIRE(keys_of(tx, table::meta, bytes(), bytes())
            == std::vector<std::string>{"a", "c", "c1", "d", "e", "f"});
    REQUIRE(keys_of(tx, table::meta, b("b"), b("d")) == std::vector<std::string>{"c", "c1"});
    REQUIRE(keys_of(tx, table::meta, b("d"), b("b")).empty());

    std::vector<std::string> prefixed;
    tx.scan_prefix(table::meta, b("c"), [&](const bytes& key, const bytes& value) {
        prefixed.emplace_back(key.begin(), key.end());
        prefixed.emplace_back(value.begin(), value.end());
        return true;
    });
    REQUIRE(prefixed == std::vector<std::string>{"c", "x", "c1", "z"});

    // Iteration stops when the callback returns false.
    size_t visited = 0;
    tx.scan(table::meta, bytes(), bytes(), [&](const bytes&, const bytes&) {
        return ++visited < 2;
    });
    REQUIRE(visited == 2);
}

TEST_CASE("prefix upper bounds", "[memory_store]") {
    REQUIRE(prefix_upper_bound(bytes{0x01, 0x02}) == bytes{0x01, 0x03});
    REQUIRE(prefix_upper_bound(bytes{0x01, 0xFF}) == bytes{0x02});
    REQUIRE(prefix_upper_bound(bytes{0xFF, 0xFF}).empty());
    REQUIRE(prefix_upper_bound(bytes()).empty());
}

TEST_CASE("conflicting transactions fail to commit", "[memory_store]") {
    memory_store s;
    put_committed(s, table::meta, "a", "1");

    SECTION("modified key") {
        transaction tx(s);
        REQUIRE(tx.get(table::meta, b("a")) == b("1"));
        tx.put(table::meta, b("b"), b("2"));

        put_committed(s, table::meta, "a", "changed");
        REQUIRE_THROWS_AS(tx.commit(), contention_error);
        REQUIRE_FALSE(tx.active());

        transaction check(s);
        REQUIRE_FALSE(check.contains(table::meta, b("b")));
    }

    SECTION("key that did not exist") {
        transaction tx(s);
        REQUIRE_FALSE(tx.contains(table::meta, b("new")));
        tx.put(table::meta, b("other"), b("2"));

        put_committed(s, table::meta, "new", "3");
        REQUIRE_THROWS_AS(tx.commit(), contention_error);
    }

    SECTION("key inserted into a scanned range") {
        transaction tx(s);
        REQUIRE(keys_of(tx, table::meta, b("a"), b("m")) == std::vector<std::string>{"a"});
        tx.put(table::blocks, b("x"), b("2"));

        put_committed(s, table::meta, "c", "3");
        REQUIRE_THROWS_AS(tx.commit(), contention_error);
    }

    SECTION("key inserted outside of a scanned range") {
        transaction tx(s);
        REQUIRE(keys_of(tx, table::meta, b("a"), b("m")) == std::vector<std::string>{"a"});
        tx.put(table::blocks, b("x"), b("2"));

        put_committed(s, table::meta, "z", "3");
        tx.commit();
    }

    SECTION("concurrent writes of the same key") {
        transaction t1(s);
        transaction t2(s);
        t1.put(table::meta, b("k"), b("1"));
        t2.put(table::meta, b("k"), b("2"));
        t1.commit();
        REQUIRE_THROWS_AS(t2.commit(), contention_error);

        transaction check(s);
        REQUIRE(check.get(table::meta, b("k")) == b("1"));
    }

    SECTION("read-only transactions are validated") {
        transaction tx(s);
        REQUIRE(tx.get(table::meta, b("a")) == b("1"));
        put_committed(s, table::meta, "a", "2");
        REQUIRE_THROWS_AS(tx.commit(), contention_error);
    }

    SECTION("reading a key that changed in the meantime") {
        transaction tx(s);
        REQUIRE(tx.get(table::meta, b("a")) == b("1"));
        put_committed(s, table::meta, "a", "2");
        REQUIRE_THROWS_AS(tx.get(table::meta, b("a")), contention_error);
    }
}

TEST_CASE("erased keys conflict like modified keys", "[memory_store]") {
    memory_store s;
    put_committed(s, table::meta, "a", "1");

    transaction tx(s);
    REQUIRE(tx.contains(table::meta, b("a")));
    tx.put(table::meta, b("b"), b("2"));

    {
        transaction other(s);
        other.erase(table::meta, b("a"));
        other.commit();
    }
    REQUIRE(s.size(table::meta) == 0);
    REQUIRE_THROWS_AS(tx.commit(), contention_error);
}

TEST_CASE("erased keys are forgotten", "[memory_store]") {
    memory_store s;

    auto erase_committed = [&](const char* key) {
        transaction tx(s);
        tx.erase(table::meta, b(key));
        tx.commit();
    };

    SECTION("keys created and erased concurrently read as absent") {
        transaction tx(s);
        REQUIRE_FALSE(tx.contains(table::meta, b("a")));
        tx.put(table::meta, b("b"), b("2"));

        put_committed(s, table::meta, "a", "1");
        erase_committed("a");

        // The key is absent again, just as the transaction observed it.
        REQUIRE_NOTHROW(tx.commit());
    }

    SECTION("recreated keys still conflict") {
        put_committed(s, table::meta, "a", "1");

        transaction tx(s);
        REQUIRE(tx.get(table::meta, b("a")) == b("1"));
        tx.put(table::meta, b("b"), b("2"));

        erase_committed("a");
        put_committed(s, table::meta, "a", "1");
        REQUIRE_THROWS_AS(tx.commit(), contention_error);
    }
}

TEST_CASE("injected contention fails commits", "[memory_store]") {
    memory_store s;
    s.inject_contention(2);

    for (int i = 0; i < 2; ++i) {
        transaction tx(s);
        tx.put(table::meta, b("a"), b("1"));
        REQUIRE_THROWS_AS(tx.commit(), contention_error);
    }
    REQUIRE(s.conflicts() == 2);
    REQUIRE(s.commits() == 0);

    put_committed(s, table::meta, "a", "1");
    REQUIRE(s.commits() == 1);
}
