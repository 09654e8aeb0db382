#include <dedupstore/memory_store.hpp>

#include <dedupstore/exception.hpp>

#include "detail/versioned_map.hpp"

#include <mutex>

namespace dedupstore {

namespace detail {

class memory_store_impl {
public:
    memory_store_impl() = default;

    memory_store_impl(const memory_store_impl&) = delete;
    memory_store_impl& operator=(const memory_store_impl&) = delete;

    store::lookup_result get(table t, const bytes& key) const;
    std::vector<store::range_entry> scan(table t, const bytes& lower, const bytes& upper) const;
    void commit(const change_set& changes);

    void inject_contention(u32 count);
    u64 commits() const;
    u64 conflicts() const;
    size_t size(table t) const;

private:
    mutable std::mutex m_mutex;

    // Committed data and versions.
    versioned_map<bytes> m_data;

    // Version assigned to the keys modified by the most recent commit.
    u64 m_version = 0;

    u32 m_injected_conflicts = 0;
    u64 m_commits = 0;
    u64 m_conflicts = 0;
};

store::lookup_result memory_store_impl::get(table t, const bytes& key) const {
    std::lock_guard lock(m_mutex);

    store::lookup_result result;
    if (const auto* e = m_data.find(t, key)) {
        result.version = e->version;
        result.value = e->payload;
    }
    return result;
}

std::vector<store::range_entry>
memory_store_impl::scan(table t, const bytes& lower, const bytes& upper) const {
    std::lock_guard lock(m_mutex);

    std::vector<store::range_entry> result;
    m_data.for_range(t, lower, upper, [&](const bytes& key, const auto& e) {
        result.push_back(store::range_entry{key, e.version, e.payload});
    });
    return result;
}

void memory_store_impl::commit(const change_set& changes) {
    std::lock_guard lock(m_mutex);

    if (m_injected_conflicts > 0) {
        --m_injected_conflicts;
        ++m_conflicts;
        DEDUPSTORE_THROW(contention_error("Commit failed (injected conflict)."));
    }
    if (!m_data.validate(changes)) {
        ++m_conflicts;
        DEDUPSTORE_THROW(contention_error("Commit failed (conflicting transaction)."));
    }

    ++m_commits;
    if (changes.writes.empty())
        return;

    const u64 version = ++m_version;
    for (const auto& [tk, value] : changes.writes) {
        m_data.assign(tk.table, tk.key, version, value);
    }
}

void memory_store_impl::inject_contention(u32 count) {
    std::lock_guard lock(m_mutex);
    m_injected_conflicts = count;
}

u64 memory_store_impl::commits() const {
    std::lock_guard lock(m_mutex);
    return m_commits;
}

u64 memory_store_impl::conflicts() const {
    std::lock_guard lock(m_mutex);
    return m_conflicts;
}

size_t memory_store_impl::size(table t) const {
    std::lock_guard lock(m_mutex);
    return m_data.live_count(t);
}

} // namespace detail

memory_store::memory_store()
    : m_impl(std::make_unique<detail::memory_store_impl>()) {}

memory_store::~memory_store() {}

void memory_store::inject_contention(u32 count) {
    impl().inject_contention(count);
}

u64 memory_store::commits() const {
    return impl().commits();
}

u64 memory_store::conflicts() const {
    return impl().conflicts();
}

size_t memory_store::size(table t) const {
    return impl().size(t);
}

u64 memory_store::do_begin() {
    // Versions are never rewritten, so there is only a single epoch.
    return 0;
}

store::lookup_result memory_store::do_get(table t, const bytes& key) {
    return impl().get(t, key);
}

std::vector<store::range_entry>
memory_store::do_scan(table t, const bytes& lower, const bytes& upper) {
    return impl().scan(t, lower, upper);
}

void memory_store::do_commit(const change_set& changes) {
    impl().commit(changes);
}

detail::memory_store_impl& memory_store::impl() const {
    if (!m_impl) {
        DEDUPSTORE_THROW(bad_operation("Invalid store instance."));
    }
    return *m_impl;
}

} // namespace dedupstore
