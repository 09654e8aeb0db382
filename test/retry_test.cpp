#include <catch2/catch.hpp>

#include <dedupstore/exception.hpp>
#include <dedupstore/memory_store.hpp>
#include <dedupstore/retry.hpp>

#include <chrono>
#include <optional>
#include <stdexcept>

using namespace dedupstore;

namespace {

retry_policy immediate(std::optional<u32> max_attempts = {}) {
    retry_policy policy;
    policy.delay = std::chrono::milliseconds(0);
    policy.max_attempts = max_attempts;
    return policy;
}

} // namespace

TEST_CASE("transactions are committed after the function returns", "[retry]") {
    memory_store s;

    const int result = run_transaction(s, immediate(), [&](transaction& tx) {
        tx.put(table::meta, to_bytes("key"), to_bytes("value"));
        return 42;
    });
    REQUIRE(result == 42);
    REQUIRE(s.commits() == 1);

    run_transaction(s, immediate(), [&](transaction& tx) {
        REQUIRE(tx.get(table::meta, to_bytes("key")) == to_bytes("value"));
    });
    REQUIRE(s.commits() == 2);

    // The function may finish the transaction itself.
    run_transaction(s, immediate(), [&](transaction& tx) { tx.rollback(); });
    REQUIRE(s.commits() == 2);
}

TEST_CASE("contention causes the operation to be repeated", "[retry]") {
    memory_store s;
    s.inject_contention(3);

    int calls = 0;
    run_transaction(s, immediate(), [&](transaction& tx) {
        ++calls;
        tx.put(table::meta, to_bytes("key"), to_bytes("value"));
    });
    REQUIRE(calls == 4);
    REQUIRE(s.conflicts() == 3);
    REQUIRE(s.commits() == 1);

    // Contention raised by the function itself is retried as well.
    calls = 0;
    run_transaction(s, immediate(), [&](transaction&) {
        if (++calls < 3)
            DEDUPSTORE_THROW(contention_error("busy"));
    });
    REQUIRE(calls == 3);
}

TEST_CASE("the number of attempts can be limited", "[retry]") {
    memory_store s;
    s.inject_contention(5);

    int calls = 0;
    auto op = [&](transaction& tx) {
        ++calls;
        tx.put(table::meta, to_bytes("key"), to_bytes("value"));
    };
    REQUIRE_THROWS_AS(run_transaction(s, immediate(3), op), contention_error);
    REQUIRE(calls == 3);

    calls = 0;
    run_transaction(s, immediate(3), op);
    REQUIRE(calls == 3);

    transaction tx(s);
    REQUIRE(tx.contains(table::meta, to_bytes("key")));
}

TEST_CASE("other errors are not retried", "[retry]") {
    memory_store s;

    int calls = 0;
    REQUIRE_THROWS_AS(run_transaction(s, immediate(),
                                      [&](transaction& tx) {
                                          ++calls;
                                          tx.put(table::meta, to_bytes("key"), to_bytes("v"));
                                          throw std::runtime_error("failure");
                                      }),
                      std::runtime_error);
    REQUIRE(calls == 1);
    REQUIRE(s.commits() == 0);

    transaction tx(s);
    REQUIRE_FALSE(tx.contains(table::meta, to_bytes("key")));
}
