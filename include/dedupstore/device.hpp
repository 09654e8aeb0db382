#ifndef DEDUPSTORE_DEVICE_HPP
#define DEDUPSTORE_DEVICE_HPP

#include <dedupstore/config.hpp>
#include <dedupstore/defs.hpp>
#include <dedupstore/resolver.hpp>
#include <dedupstore/store.hpp>

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace dedupstore {

/// Preferred request sizes of a device, in bytes.
struct size_hints {
    u32 minimum = 0;
    u32 preferred = 0;
    u32 maximum = 0;
};

/// A snapshot of the space usage of a device.
struct device_statistics {
    /// Number of LBAs that are mapped to a block.
    u64 mapped_blocks = 0;

    /// Number of distinct blocks in the store.
    u64 stored_blocks = 0;

    /// Sum of the reference counts of all blocks.
    u64 references = 0;

    /// Bytes that would be used without deduplication.
    u64 logical_bytes = 0;

    /// Bytes used by block contents.
    u64 physical_bytes = 0;
};

/// The result of \ref device::verify().
struct verify_report {
    u64 checked_mappings = 0;
    u64 checked_blocks = 0;

    /// A description of every inconsistency that was found.
    std::vector<std::string> errors;

    bool ok() const { return errors.empty(); }
};

/**
 * A fixed-size virtual block device with deduplicated storage.
 *
 * The device is divided into blocks of `block_size()` bytes. Every block of the device
 * (identified by its logical block address) is either unmapped, in which case it reads as zeros,
 * or mapped to a content block in the store. Identical contents are stored only once.
 *
 * All offsets and lengths must be multiples of the block size. Every operation runs in
 * its own transaction, which is repeated according to the configured retry policy when
 * the store reports contention. Operations that return successfully have been committed.
 *
 * Devices are thread safe as long as the store is: any number of operations
 * can run concurrently, from any number of devices (in any number of processes)
 * that share the same store.
 */
class device {
public:
    /// Opens the device on the given store. A new store is initialized with the geometry
    /// of the configuration; an existing store must have been created with the same geometry.
    /// The store must outlive the device.
    ///
    /// \throws config_error If the configuration is invalid or does not match the store.
    device(store& s, const device_config& config);

    ~device();

    device(const device&) = delete;
    device& operator=(const device&) = delete;

    const device_config& config() const { return m_config; }

    /// Size of the device, in bytes.
    u64 size() const { return m_config.size; }

    u32 block_size() const { return m_config.block_size; }
    u64 block_count() const { return m_config.block_count(); }
    bool read_only() const { return m_config.read_only; }

    /// Minimum, preferred and maximum request sizes.
    size_hints block_size_hints() const;

    /// Reads `length` bytes at `offset` into `buffer`.
    void read(u64 offset, byte* buffer, u64 length);

    /// Reads `length` bytes at `offset`.
    bytes read(u64 offset, u64 length);

    /// Writes `length` bytes from `buffer` to `offset`.
    void write(u64 offset, const byte* buffer, u64 length);

    /// Writes `data` to `offset`.
    void write(u64 offset, const bytes& data);

    /// Discards the contents of `length` bytes at `offset`. The range reads as zeros afterwards.
    void trim(u64 offset, u64 length);

    /// Zeroes `length` bytes at `offset`. Has the same effect as \ref trim().
    void zero(u64 offset, u64 length);

    /// Returns usage statistics.
    device_statistics statistics();

    /// Checks the consistency of the mappings and the blocks in the store.
    verify_report verify();

private:
    // Checks that the given range is aligned and within the device.
    // Returns the range in blocks (first LBA, block count).
    std::pair<lba_t, u64> check_range(const char* op, u64 offset, u64 length) const;

    void check_writable(const char* op) const;

    // Removes all mappings in the given range (trim and zero).
    void discard(const char* op, u64 offset, u64 length);

    void initialize();

private:
    store& m_store;
    device_config m_config;
    std::unique_ptr<block_resolver> m_resolver;
};

} // namespace dedupstore

#endif // DEDUPSTORE_DEVICE_HPP
