#include <dedupstore/store.hpp>

#include <dedupstore/assert.hpp>
#include <dedupstore/exception.hpp>

#include <fmt/format.h>

namespace dedupstore {

const char* table_name(table t) noexcept {
    switch (t) {
    case table::meta: return "meta";
    case table::blocks: return "blocks";
    case table::block_data: return "block_data";
    case table::fingerprints: return "fingerprints";
    case table::garbage: return "garbage";
    case table::mappings: return "mappings";
    case table::references: return "references";
    }
    return "unknown";
}

bytes prefix_upper_bound(const bytes& prefix) {
    bytes result = prefix;
    while (!result.empty() && result.back() == 0xFF)
        result.pop_back();
    if (!result.empty())
        ++result.back();
    return result;
}

bytes to_bytes(std::string_view s) {
    return bytes(s.begin(), s.end());
}

store::~store() {}

transaction::transaction(store& s)
    : m_store(&s) {
    m_changes.epoch = s.do_begin();
    m_active = true;
}

transaction::~transaction() {
    if (m_active)
        rollback();
}

void transaction::check_active() const {
    if (!m_active)
        DEDUPSTORE_THROW(bad_operation("The transaction is no longer active."));
}

void transaction::observe(const table_key& key, u64 version) {
    auto [pos, inserted] = m_changes.reads.emplace(key, version);
    if (!inserted && pos->second != version) {
        // The key was changed by a concurrent commit since we have seen it last.
        // Continuing would mix two different states of the store.
        DEDUPSTORE_THROW(contention_error(
            fmt::format("Key in table `{}` changed during the transaction.", table_name(key.table))));
    }
}

std::optional<bytes> transaction::get(table t, const bytes& key) {
    check_active();

    table_key tk(t, key);
    if (auto pos = m_changes.writes.find(tk); pos != m_changes.writes.end())
        return pos->second;

    store::lookup_result result = m_store->do_get(t, key);
    observe(tk, result.version);
    return std::move(result.value);
}

bool transaction::contains(table t, const bytes& key) {
    return get(t, key).has_value();
}

void transaction::put(table t, const bytes& key, bytes value) {
    check_active();

    table_key tk(t, key);
    if (!m_changes.reads.count(tk))
        observe(tk, m_store->do_get(t, key).version);
    m_changes.writes.insert_or_assign(std::move(tk), std::optional<bytes>(std::move(value)));
}

void transaction::erase(table t, const bytes& key) {
    check_active();

    table_key tk(t, key);
    if (!m_changes.reads.count(tk))
        observe(tk, m_store->do_get(t, key).version);
    m_changes.writes.insert_or_assign(std::move(tk), std::nullopt);
}

void transaction::scan(table t, const bytes& lower, const bytes& upper, const scan_callback& fn) {
    check_active();

    std::vector<store::range_entry> entries = m_store->do_scan(t, lower, upper);

    range_read range;
    range.table = t;
    range.lower = lower;
    range.upper = upper;
    range.observed.reserve(entries.size());

    std::map<bytes, bytes> merged;
    for (auto& entry : entries) {
        range.observed.emplace_back(entry.key, entry.version);
        merged.emplace(std::move(entry.key), std::move(entry.value));
    }
    m_changes.ranges.push_back(std::move(range));

    // Overlay our own writes within [lower, upper).
    auto first = m_changes.writes.lower_bound(table_key(t, lower));
    for (auto pos = first; pos != m_changes.writes.end(); ++pos) {
        const table_key& tk = pos->first;
        if (tk.table != t || (!upper.empty() && !(tk.key < upper)))
            break;

        if (pos->second)
            merged.insert_or_assign(tk.key, *pos->second);
        else
            merged.erase(tk.key);
    }

    for (const auto& [key, value] : merged) {
        if (!fn(key, value))
            break;
    }
}

void transaction::scan_prefix(table t, const bytes& prefix, const scan_callback& fn) {
    scan(t, prefix, prefix_upper_bound(prefix), fn);
}

void transaction::commit() {
    check_active();

    // The transaction is finished even if the commit fails.
    m_active = false;
    change_set changes = std::move(m_changes);
    m_changes = change_set();
    m_store->do_commit(changes);
}

void transaction::rollback() noexcept {
    m_active = false;
    m_changes = change_set();
}

} // namespace dedupstore
