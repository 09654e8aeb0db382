#include <dedupstore/block_store.hpp>

#include <dedupstore/exception.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cstring>

namespace dedupstore {

namespace {

const bytes& next_block_id_key() {
    static const bytes key = to_bytes("next_block_id");
    return key;
}

bytes block_key(block_id id) {
    return serialize_to_bytes(id);
}

bytes fingerprint_key(const fingerprint& fp, block_id id) {
    return serialize_to_bytes(fp, id);
}

} // namespace

block_store::block_store(transaction& tx, u32 block_size)
    : m_tx(tx)
    , m_block_size(block_size) {
    DEDUPSTORE_ASSERT(block_size > 0, "Invalid block size.");
}

block_id block_store::allocate_id() {
    u64 next = 1;
    if (auto value = m_tx.get(table::meta, next_block_id_key()))
        next = deserialize_at<u64>(*value);

    m_tx.put(table::meta, next_block_id_key(), serialize_to_bytes(next + 1));
    return block_id(next);
}

void block_store::put_header(block_id id, const block_header& header) {
    m_tx.put(table::blocks, block_key(id), serialize_to_bytes(header));
}

block_id block_store::insert(const fingerprint& fp, const byte* data) {
    DEDUPSTORE_ASSERT(data, "Null data pointer.");

    const block_id id = allocate_id();

    block_header header;
    header.hash = fp;
    header.refcount = 1;
    put_header(id, header);
    m_tx.put(table::block_data, block_key(id), bytes(data, data + m_block_size));
    m_tx.put(table::fingerprints, fingerprint_key(fp, id), bytes());
    return id;
}

std::vector<block_id> block_store::find(const fingerprint& fp) {
    std::vector<block_id> result;
    m_tx.scan_prefix(table::fingerprints, serialize_to_bytes(fp),
                     [&](const bytes& key, const bytes&) {
                         result.push_back(deserialize_at<block_id>(key, fingerprint_size));
                         return true;
                     });
    return result;
}

std::optional<block_header> block_store::header(block_id id) {
    DEDUPSTORE_ASSERT(id, "Invalid block id.");

    auto value = m_tx.get(table::blocks, block_key(id));
    if (!value)
        return {};
    return deserialize_at<block_header>(*value);
}

std::optional<bytes> block_store::try_read(block_id id) {
    DEDUPSTORE_ASSERT(id, "Invalid block id.");

    auto data = m_tx.get(table::block_data, block_key(id));
    if (data && data->size() != m_block_size) {
        DEDUPSTORE_THROW(corruption_error(
            fmt::format("Block {} has an invalid size (expected {} bytes, got {} bytes).",
                        id.value(), m_block_size, data->size())));
    }
    return data;
}

bytes block_store::read(block_id id) {
    auto data = try_read(id);
    if (!data) {
        DEDUPSTORE_THROW(corruption_error(
            fmt::format("The contents of block {} do not exist.", id.value())));
    }
    return std::move(*data);
}

u64 block_store::refcount(block_id id) {
    auto hdr = header(id);
    if (!hdr) {
        DEDUPSTORE_THROW(corruption_error(fmt::format("Block {} does not exist.", id.value())));
    }
    return hdr->refcount;
}

void block_store::add_references(block_id id, i64 delta) {
    if (delta == 0)
        return;

    auto hdr = header(id);
    if (!hdr) {
        DEDUPSTORE_THROW(corruption_error(
            fmt::format("Cannot change the reference count of block {}: Block does not exist.",
                        id.value())));
    }

    const u64 old_count = hdr->refcount;
    if (delta < 0 && static_cast<u64>(-delta) > old_count) {
        DEDUPSTORE_THROW(corruption_error(
            fmt::format("Reference count of block {} would become negative ({} {}).", id.value(),
                        old_count, delta)));
    }

    hdr->refcount = static_cast<u64>(static_cast<i64>(old_count) + delta);
    put_header(id, *hdr);

    if (hdr->refcount == 0) {
        m_tx.put(table::garbage, block_key(id), bytes());
    } else if (old_count == 0) {
        // Referenced again before the garbage was collected.
        m_tx.erase(table::garbage, block_key(id));
    }
}

u64 block_store::collect_garbage() {
    std::vector<block_id> garbage;
    m_tx.scan(table::garbage, bytes(), bytes(), [&](const bytes& key, const bytes&) {
        garbage.push_back(deserialize_at<block_id>(key));
        return true;
    });

    for (block_id id : garbage) {
        const auto hdr = header(id);
        if (!hdr || hdr->refcount != 0) {
            DEDUPSTORE_THROW(corruption_error(fmt::format(
                "Block {} is in the garbage index but is still referenced or does not exist.",
                id.value())));
        }

        const bytes key = block_key(id);
        m_tx.erase(table::blocks, key);
        m_tx.erase(table::block_data, key);
        m_tx.erase(table::fingerprints, fingerprint_key(hdr->hash, id));
        m_tx.erase(table::garbage, key);
    }

    if (!garbage.empty())
        spdlog::debug("Collected {} unreferenced blocks.", garbage.size());
    return garbage.size();
}

bool block_store::has_garbage() {
    bool found = false;
    m_tx.scan(table::garbage, bytes(), bytes(), [&](const bytes&, const bytes&) {
        found = true;
        return false;
    });
    return found;
}

void block_store::for_each(const block_callback& fn) {
    m_tx.scan(table::blocks, bytes(), bytes(), [&](const bytes& key, const bytes& value) {
        return fn(deserialize_at<block_id>(key), deserialize_at<block_header>(value));
    });
}

} // namespace dedupstore
