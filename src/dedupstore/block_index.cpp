#include <dedupstore/block_index.hpp>

#include <dedupstore/exception.hpp>
#include <dedupstore/serialization.hpp>

#include <limits>

namespace dedupstore {

namespace {

bytes mapping_key(lba_t lba) {
    return serialize_to_bytes(lba);
}

bytes reference_key(block_id id, lba_t lba) {
    return serialize_to_bytes(id, lba);
}

// Exclusive upper key of the LBA range starting at `first` (empty if unbounded).
bytes range_end_key(lba_t first, u64 count) {
    if (count > std::numeric_limits<lba_t>::max() - first)
        return bytes();
    return mapping_key(first + count);
}

} // namespace

block_index::block_index(transaction& tx)
    : m_tx(tx) {}

std::optional<block_id> block_index::lookup(lba_t lba) {
    auto value = m_tx.get(table::mappings, mapping_key(lba));
    if (!value)
        return {};
    return deserialize_at<block_id>(*value);
}

std::map<lba_t, block_id> block_index::lookup_range(lba_t first, u64 count) {
    std::map<lba_t, block_id> result;
    if (count == 0)
        return result;

    m_tx.scan(table::mappings, mapping_key(first), range_end_key(first, count),
              [&](const bytes& key, const bytes& value) {
                  result.emplace(deserialize_at<lba_t>(key), deserialize_at<block_id>(value));
                  return true;
              });
    return result;
}

std::optional<block_id> block_index::assign(lba_t lba, block_id id) {
    DEDUPSTORE_ASSERT(id, "Invalid block id.");

    auto previous = lookup(lba);
    if (previous == id)
        return previous;

    if (previous)
        unlink(lba, *previous);
    m_tx.put(table::mappings, mapping_key(lba), serialize_to_bytes(id));
    link(lba, id);
    return previous;
}

std::optional<block_id> block_index::remove(lba_t lba) {
    auto previous = lookup(lba);
    if (previous) {
        m_tx.erase(table::mappings, mapping_key(lba));
        unlink(lba, *previous);
    }
    return previous;
}

std::map<block_id, u64> block_index::remove_range(lba_t first, u64 count) {
    std::map<block_id, u64> removed;
    for (const auto& [lba, id] : lookup_range(first, count)) {
        m_tx.erase(table::mappings, mapping_key(lba));
        unlink(lba, id);
        ++removed[id];
    }
    return removed;
}

std::vector<lba_t> block_index::references(block_id id) {
    std::vector<lba_t> result;
    m_tx.scan_prefix(table::references, serialize_to_bytes(id),
                     [&](const bytes& key, const bytes&) {
                         result.push_back(deserialize_at<lba_t>(key, serialized_size<block_id>()));
                         return true;
                     });
    return result;
}

u64 block_index::reference_count(block_id id) {
    return references(id).size();
}

void block_index::for_each(const mapping_callback& fn) {
    m_tx.scan(table::mappings, bytes(), bytes(), [&](const bytes& key, const bytes& value) {
        return fn(deserialize_at<lba_t>(key), deserialize_at<block_id>(value));
    });
}

void block_index::for_each_reference(const std::function<bool(block_id, lba_t)>& fn) {
    m_tx.scan(table::references, bytes(), bytes(), [&](const bytes& key, const bytes&) {
        return fn(deserialize_at<block_id>(key),
                  deserialize_at<lba_t>(key, serialized_size<block_id>()));
    });
}

void block_index::link(lba_t lba, block_id id) {
    m_tx.put(table::references, reference_key(id, lba), bytes());
}

void block_index::unlink(lba_t lba, block_id id) {
    m_tx.erase(table::references, reference_key(id, lba));
}

} // namespace dedupstore
