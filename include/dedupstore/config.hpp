#ifndef DEDUPSTORE_CONFIG_HPP
#define DEDUPSTORE_CONFIG_HPP

#include <dedupstore/defs.hpp>
#include <dedupstore/journal_store.hpp>
#include <dedupstore/resolver.hpp>
#include <dedupstore/retry.hpp>

#include <string>

namespace dedupstore {

/// The complete configuration of a device.
struct device_config {
    /// Size of the device, in bytes. Must be a multiple of the block size.
    u64 size = 0;

    /// Size of a block, in bytes. Only \ref default_block_size is supported;
    /// the value is recorded in the store so that devices with a different geometry are rejected.
    u32 block_size = default_block_size;

    /// Path to the journal file that stores the device's data.
    std::string store_path;

    hash_policy hash = hash_policy::verified;

    retry_policy retry;

    /// Flush every commit to persistent storage.
    bool sync_on_commit = true;

    /// Reject all modifications.
    bool read_only = false;

    /// Compact the journal automatically.
    bool auto_compact = true;

    /// Number of blocks of the device.
    u64 block_count() const { return block_size ? size / block_size : 0; }

    /// Options for opening the journal at `store_path`.
    journal_options store_options() const;

    /// Throws a \ref config_error if the geometry of the device is invalid.
    void validate() const;
};

/// Parses a size with an optional unit suffix (`k`, `M`, `G`, `T`, `P` or `E`,
/// case insensitive, powers of 1024), for example `4096`, `64k` or `1G`.
/// A trailing `b` (e.g. `10kb`) is accepted as well.
///
/// \throws config_error If the value is malformed or too large.
u64 parse_size(const std::string& value);

/// Parses a boolean (`1`, `true`, `yes`, `on` or `0`, `false`, `no`, `off`).
///
/// \throws config_error If the value is malformed.
bool parse_bool(const std::string& value);

/// Builds a \ref device_config from `key=value` parameters.
///
/// Known keys:
///
///     db              path to the journal file (required)
///     size            device size, see parse_size() (required)
///     trust_hash      use the trusted hash policy (default: false)
///     retry_delay     milliseconds between attempts (default: 100)
///     retry_limit     maximum number of attempts, 0 means unlimited (default: 0)
///     sync            sync every commit (default: true)
///     read_only       reject modifications (default: false)
///     auto_compact    compact the journal automatically (default: true)
///
/// Unknown keys are logged and ignored.
class config_parser {
public:
    config_parser() = default;

    /// Applies a single parameter.
    /// \throws config_error If the value is malformed.
    void set(const std::string& key, const std::string& value);

    /// Applies a parameter in `key=value` form.
    /// \throws config_error If the parameter has no `=`.
    void set(const std::string& assignment);

    /// Returns the final configuration.
    /// \throws config_error If a required parameter is missing or the configuration is invalid.
    device_config complete() const;

private:
    device_config m_config;
    bool m_has_size = false;
    bool m_has_path = false;
};

} // namespace dedupstore

#endif // DEDUPSTORE_CONFIG_HPP
