#ifndef DEDUPSTORE_DETAIL_VERSIONED_MAP_HPP
#define DEDUPSTORE_DETAIL_VERSIONED_MAP_HPP

#include <dedupstore/defs.hpp>
#include <dedupstore/store.hpp>

#include <array>
#include <map>
#include <optional>

namespace dedupstore::detail {

/*
 * The committed state of all tables of a store, together with the version of every key.
 * Erased keys are removed and report version 0 again, like keys that never existed.
 * Validation compares the observed versions with the current ones while the store is
 * locked, so a key that was created and erased in the meantime still reads as absent.
 *
 * The payload is the value itself for in-memory stores and the location
 * of the value in the log for persistent stores.
 */
template<typename Payload>
class versioned_map {
public:
    struct entry {
        u64 version = 0;
        Payload payload;
    };

public:
    versioned_map() = default;

    // Returns the entry for the given key or null if the key does not exist.
    const entry* find(table t, const bytes& key) const {
        const auto& map = get_table(t);
        auto pos = map.find(key);
        return pos != map.end() ? &pos->second : nullptr;
    }

    // Returns the version of the given key (0 if the key does not exist).
    u64 version(table t, const bytes& key) const {
        const entry* e = find(t, key);
        return e ? e->version : 0;
    }

    // Sets the value of the given key. An empty payload erases the key.
    void assign(table t, const bytes& key, u64 version, std::optional<Payload> payload) {
        auto& map = get_table(t);
        if (!payload) {
            map.erase(key);
            return;
        }

        entry& e = map[key];
        e.version = version;
        e.payload = std::move(*payload);
    }

    // Invokes `fn(key, entry)` for all keys in [lower, upper), in key order.
    template<typename Func>
    void for_range(table t, const bytes& lower, const bytes& upper, Func&& fn) const {
        if (!upper.empty() && !(lower < upper))
            return;

        const auto& map = get_table(t);
        auto pos = map.lower_bound(lower);
        auto end = upper.empty() ? map.end() : map.lower_bound(upper);
        for (; pos != end; ++pos)
            fn(pos->first, pos->second);
    }

    // Invokes `fn(table, key, entry)` for all keys of all tables.
    template<typename Func>
    void for_each(Func&& fn) const {
        for (u8 i = 0; i < table_count; ++i) {
            for (const auto& [key, e] : m_tables[i])
                fn(static_cast<table>(i), key, e);
        }
    }

    // Returns true if nothing observed by the change set has been modified since.
    bool validate(const change_set& changes) const {
        for (const auto& [tk, observed_version] : changes.reads) {
            if (version(tk.table, tk.key) != observed_version)
                return false;
        }

        for (const range_read& range : changes.ranges) {
            auto observed = range.observed.begin();
            bool same = true;
            for_range(range.table, range.lower, range.upper, [&](const bytes& key, const entry& e) {
                if (!same)
                    return;
                if (observed == range.observed.end() || observed->first != key
                    || observed->second != e.version) {
                    same = false;
                    return;
                }
                ++observed;
            });
            if (!same || observed != range.observed.end())
                return false;
        }
        return true;
    }

    // Number of keys in the table.
    size_t live_count(table t) const { return m_tables[index_of(t)].size(); }

    void clear() {
        for (auto& map : m_tables)
            map.clear();
    }

private:
    static size_t index_of(table t) { return static_cast<size_t>(t); }

    std::map<bytes, entry>& get_table(table t) { return m_tables[index_of(t)]; }
    const std::map<bytes, entry>& get_table(table t) const { return m_tables[index_of(t)]; }

private:
    std::array<std::map<bytes, entry>, table_count> m_tables;
};

} // namespace dedupstore::detail

#endif // DEDUPSTORE_DETAIL_VERSIONED_MAP_HPP
