#include <dedupstore/device.hpp>

#include <dedupstore/block_index.hpp>
#include <dedupstore/block_store.hpp>
#include <dedupstore/exception.hpp>
#include <dedupstore/fingerprint.hpp>
#include <dedupstore/retry.hpp>
#include <dedupstore/serialization.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstring>
#include <map>
#include <set>

namespace dedupstore {

namespace {

// Geometry of the device, stored in the meta table when the device is created.
struct geometry {
    u32 block_size = 0;
    u64 block_count = 0;

    static constexpr auto get_binary_format() {
        return binary_format(&geometry::block_size, &geometry::block_count);
    }
};

const bytes& geometry_key() {
    static const bytes key = to_bytes("geometry");
    return key;
}

} // namespace

device::device(store& s, const device_config& config)
    : m_store(s)
    , m_config(config)
    , m_resolver(make_resolver(config.hash)) {
    m_config.validate();
    initialize();

    spdlog::info("Opened device ({} bytes, {} blocks of {} bytes, {} hashes, {}).", size(),
                 block_count(), block_size(), to_string(m_config.hash),
                 read_only() ? "read-only" : "read-write");
}

device::~device() {}

void device::initialize() {
    const bool created = run_transaction(m_store, m_config.retry, [&](transaction& tx) {
        auto value = tx.get(table::meta, geometry_key());
        if (!value) {
            // A read-only device on an empty store reads as zeros. The geometry
            // is recorded by the first writable device.
            if (read_only())
                return false;

            geometry g;
            g.block_size = block_size();
            g.block_count = block_count();
            tx.put(table::meta, geometry_key(), serialize_to_bytes(g));
            return true;
        }

        const auto g = deserialize_at<geometry>(*value);
        if (g.block_size != block_size() || g.block_count != block_count()) {
            DEDUPSTORE_THROW(config_error(fmt::format(
                "The store was created for a device of {} blocks of {} bytes, but the "
                "configuration specifies {} blocks of {} bytes.",
                g.block_count, g.block_size, block_count(), block_size())));
        }
        return false;
    });

    if (created)
        spdlog::info("Initialized a new device with {} blocks.", block_count());
}

size_hints device::block_size_hints() const {
    size_hints hints;
    hints.minimum = block_size();
    hints.preferred = block_size();
    hints.maximum = block_size();
    return hints;
}

std::pair<lba_t, u64> device::check_range(const char* op, u64 offset, u64 length) const {
    const u32 bs = block_size();
    if (offset % bs != 0 || length % bs != 0) {
        DEDUPSTORE_THROW(alignment_error(fmt::format(
            "Cannot {} {} bytes at offset {}: Offset and length must be multiples of the block "
            "size ({} bytes).",
            op, length, offset, bs)));
    }
    if (offset > size() || length > size() - offset) {
        DEDUPSTORE_THROW(bad_argument(
            fmt::format("Cannot {} {} bytes at offset {}: Range exceeds the device size ({} bytes).",
                        op, length, offset, size())));
    }
    return {offset / bs, length / bs};
}

void device::check_writable(const char* op) const {
    if (read_only()) {
        DEDUPSTORE_THROW(bad_operation(fmt::format("Cannot {}: The device is read-only.", op)));
    }
}

void device::read(u64 offset, byte* buffer, u64 length) {
    const auto range = check_range("read", offset, length);
    const lba_t first = range.first;
    const u64 count = range.second;
    if (count == 0)
        return;

    DEDUPSTORE_ASSERT(buffer, "Null buffer.");
    const u32 bs = block_size();
    run_transaction(m_store, m_config.retry, [&](transaction& tx) {
        block_index index(tx);
        block_store blocks(tx, bs);

        std::memset(buffer, 0, length);
        for (const auto& [lba, id] : index.lookup_range(first, count)) {
            auto data = blocks.try_read(id);
            if (!data) {
                // Either a concurrent trim removed the block, in which case the commit
                // fails and the read is repeated, or the store is corrupted.
                tx.commit();
                DEDUPSTORE_THROW(corruption_error(fmt::format(
                    "LBA {} is mapped to block {}, which does not exist.", lba, id.value())));
            }
            std::memcpy(buffer + (lba - first) * bs, data->data(), bs);
        }
    });
}

bytes device::read(u64 offset, u64 length) {
    check_range("read", offset, length);

    bytes result(length);
    read(offset, result.data(), length);
    return result;
}

void device::write(u64 offset, const byte* buffer, u64 length) {
    const auto range = check_range("write", offset, length);
    const lba_t first = range.first;
    const u64 count = range.second;
    check_writable("write");
    if (count == 0)
        return;

    DEDUPSTORE_ASSERT(buffer, "Null buffer.");
    const u32 bs = block_size();

    // Fingerprints do not depend on the state of the store.
    std::vector<fingerprint> fingerprints;
    fingerprints.reserve(count);
    for (u64 i = 0; i < count; ++i) {
        fingerprints.push_back(compute_fingerprint(buffer + i * bs, bs));
    }

    run_transaction(m_store, m_config.retry, [&](transaction& tx) {
        block_index index(tx);
        block_store blocks(tx, bs);
        working_set created;

        for (u64 i = 0; i < count; ++i) {
            const lba_t lba = first + i;
            const byte* chunk = buffer + i * bs;
            const fingerprint& fp = fingerprints[i];

            const auto existing = m_resolver->resolve(blocks, created, fp, chunk);
            const auto current = index.lookup(lba);
            if (existing && current == existing)
                continue;

            block_id target;
            if (existing) {
                target = *existing;
                blocks.add_references(target, 1);
            } else {
                target = blocks.insert(fp, chunk);
                created[fp].push_back(target);
            }

            index.assign(lba, target);
            if (current)
                blocks.add_references(*current, -1);
        }

        blocks.collect_garbage();
    });
}

void device::write(u64 offset, const bytes& data) {
    write(offset, data.data(), data.size());
}

void device::trim(u64 offset, u64 length) {
    discard("trim", offset, length);
}

void device::zero(u64 offset, u64 length) {
    discard("zero", offset, length);
}

void device::discard(const char* op, u64 offset, u64 length) {
    const auto range = check_range(op, offset, length);
    const lba_t first = range.first;
    const u64 count = range.second;
    check_writable(op);
    if (count == 0)
        return;

    run_transaction(m_store, m_config.retry, [&](transaction& tx) {
        block_index index(tx);
        block_store blocks(tx, block_size());

        for (const auto& [id, refs] : index.remove_range(first, count)) {
            blocks.add_references(id, -static_cast<i64>(refs));
        }
        blocks.collect_garbage();
    });
}

device_statistics device::statistics() {
    return run_transaction(m_store, m_config.retry, [&](transaction& tx) {
        block_index index(tx);
        block_store blocks(tx, block_size());

        device_statistics stats;
        index.for_each([&](lba_t, block_id) {
            ++stats.mapped_blocks;
            return true;
        });
        blocks.for_each([&](block_id, const block_header& header) {
            ++stats.stored_blocks;
            stats.references += header.refcount;
            return true;
        });
        stats.logical_bytes = stats.mapped_blocks * block_size();
        stats.physical_bytes = stats.stored_blocks * block_size();
        return stats;
    });
}

verify_report device::verify() {
    return run_transaction(m_store, m_config.retry, [&](transaction& tx) {
        block_index index(tx);
        block_store blocks(tx, block_size());

        verify_report report;
        auto error = [&](std::string message) { report.errors.push_back(std::move(message)); };

        // Mappings: count the references to every block.
        std::map<block_id, u64> mapped;
        std::set<std::pair<block_id, lba_t>> expected_refs;
        index.for_each([&](lba_t lba, block_id id) {
            ++report.checked_mappings;
            if (lba >= block_count()) {
                error(fmt::format("LBA {} is beyond the end of the device ({} blocks).", lba,
                                  block_count()));
            }
            ++mapped[id];
            expected_refs.emplace(id, lba);
            return true;
        });

        // The reverse index must contain exactly the mappings.
        index.for_each_reference([&](block_id id, lba_t lba) {
            if (expected_refs.erase(std::make_pair(id, lba)) == 0) {
                error(fmt::format("Reference (block {}, LBA {}) has no matching mapping.",
                                  id.value(), lba));
            }
            return true;
        });
        for (const auto& [id, lba] : expected_refs) {
            error(fmt::format("Mapping of LBA {} to block {} is missing from the reference index.",
                              lba, id.value()));
        }

        // Blocks: reference counts, contents and fingerprints.
        std::vector<std::pair<block_id, block_header>> headers;
        blocks.for_each([&](block_id id, const block_header& header) {
            headers.emplace_back(id, header);
            return true;
        });
        for (const auto& [id, header] : headers) {
            ++report.checked_blocks;

            u64 expected = 0;
            if (auto pos = mapped.find(id); pos != mapped.end()) {
                expected = pos->second;
                mapped.erase(pos);
            }
            if (header.refcount != expected) {
                error(fmt::format("Block {} has a reference count of {} but is mapped {} times.",
                                  id.value(), header.refcount, expected));
            }
            if (header.refcount == 0) {
                error(fmt::format("Block {} is unreferenced but has not been collected.",
                                  id.value()));
            }

            auto data = blocks.try_read(id);
            if (!data) {
                error(fmt::format("Block {} has no contents.", id.value()));
            } else if (compute_fingerprint(data->data(), data->size()) != header.hash) {
                error(fmt::format("The contents of block {} do not match its fingerprint {}.",
                                  id.value(), to_hex(header.hash)));
            }

            const auto ids = blocks.find(header.hash);
            if (std::find(ids.begin(), ids.end(), id) == ids.end()) {
                error(fmt::format("Block {} is missing from the fingerprint index.", id.value()));
            }
        }
        for (const auto& [id, refs] : mapped) {
            error(fmt::format("{} LBAs are mapped to block {}, which does not exist.", refs,
                              id.value()));
        }

        // Stale entries of the fingerprint index.
        std::vector<std::pair<fingerprint, block_id>> indexed;
        tx.scan(table::fingerprints, bytes(), bytes(), [&](const bytes& key, const bytes&) {
            indexed.emplace_back(deserialize_at<fingerprint>(key),
                                 deserialize_at<block_id>(key, fingerprint_size));
            return true;
        });
        for (const auto& [fp, id] : indexed) {
            const auto header = blocks.header(id);
            if (!header || header->hash != fp) {
                error(fmt::format("Fingerprint index entry {} refers to block {}, which does not "
                                  "exist or has a different fingerprint.",
                                  to_hex(fp), id.value()));
            }
        }

        if (blocks.has_garbage()) {
            error("The garbage index is not empty.");
        }
        return report;
    });
}

} // namespace dedupstore
