#ifndef DEDUPSTORE_MEMORY_STORE_HPP
#define DEDUPSTORE_MEMORY_STORE_HPP

#include <dedupstore/defs.hpp>
#include <dedupstore/store.hpp>

#include <memory>

namespace dedupstore {

namespace detail {

class memory_store_impl;

} // namespace detail

/**
 * A simple in-memory store. Data is not persisted in any way; everything
 * will be lost once the store instance is being destroyed.
 *
 * The store is thread safe. Its main use is for unit testing, which is
 * why it can be instructed to fail commits on purpose.
 */
class memory_store final : public store {
public:
    memory_store();
    ~memory_store();

    const char* name() const noexcept override { return "memory_store"; }

    /// The next `count` commits will fail with a \ref contention_error,
    /// as if a concurrent transaction had modified the same data.
    void inject_contention(u32 count);

    /// Number of successful commits (including read-only transactions).
    u64 commits() const;

    /// Number of commits that failed with a \ref contention_error.
    u64 conflicts() const;

    /// Number of live keys in the given table.
    size_t size(table t) const;

private:
    u64 do_begin() override;
    lookup_result do_get(table t, const bytes& key) override;
    std::vector<range_entry> do_scan(table t, const bytes& lower, const bytes& upper) override;
    void do_commit(const change_set& changes) override;

private:
    detail::memory_store_impl& impl() const;

private:
    std::unique_ptr<detail::memory_store_impl> m_impl;
};

} // namespace dedupstore

#endif // DEDUPSTORE_MEMORY_STORE_HPP
