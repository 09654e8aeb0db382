#include <dedupstore/config.hpp>

#include <dedupstore/exception.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <limits>

namespace dedupstore {

namespace {

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Parses a non-negative decimal integer. Returns the number of consumed characters (0 on error).
size_t parse_digits(const std::string& value, u64& result) {
    result = 0;
    size_t pos = 0;
    for (; pos < value.size() && std::isdigit(static_cast<unsigned char>(value[pos])); ++pos) {
        const u64 digit = static_cast<u64>(value[pos] - '0');
        if (result > (std::numeric_limits<u64>::max() - digit) / 10)
            return 0;
        result = result * 10 + digit;
    }
    return pos;
}

u64 parse_integer(const std::string& key, const std::string& value) {
    u64 result = 0;
    if (value.empty() || parse_digits(value, result) != value.size()) {
        DEDUPSTORE_THROW(
            config_error(fmt::format("Invalid value for `{}`: `{}` is not a number.", key, value)));
    }
    return result;
}

} // namespace

journal_options device_config::store_options() const {
    journal_options opts;
    opts.read_only = read_only;
    opts.sync_on_commit = sync_on_commit;
    opts.auto_compact = auto_compact;
    return opts;
}

void device_config::validate() const {
    if (block_size != default_block_size) {
        DEDUPSTORE_THROW(config_error(fmt::format(
            "Unsupported block size {} (only {} byte blocks are supported).", block_size,
            default_block_size)));
    }
    if (size == 0) {
        DEDUPSTORE_THROW(config_error("The device size must not be zero."));
    }
    if (size % block_size != 0) {
        DEDUPSTORE_THROW(config_error(fmt::format(
            "The device size ({} bytes) is not a multiple of the block size ({} bytes).", size,
            block_size)));
    }
}

u64 parse_size(const std::string& value) {
    u64 number = 0;
    const size_t digits = parse_digits(value, number);
    if (digits == 0) {
        DEDUPSTORE_THROW(config_error(fmt::format("Invalid size `{}`.", value)));
    }

    std::string suffix = lowercase(value.substr(digits));
    if (suffix.size() == 2 && suffix[1] == 'b')
        suffix.pop_back();

    unsigned shift = 0;
    if (suffix.empty() || suffix == "b") {
        shift = 0;
    } else if (suffix == "k") {
        shift = 10;
    } else if (suffix == "m") {
        shift = 20;
    } else if (suffix == "g") {
        shift = 30;
    } else if (suffix == "t") {
        shift = 40;
    } else if (suffix == "p") {
        shift = 50;
    } else if (suffix == "e") {
        shift = 60;
    } else {
        DEDUPSTORE_THROW(
            config_error(fmt::format("Invalid size `{}` (unknown unit `{}`).", value, suffix)));
    }

    if (shift > 0 && number > (std::numeric_limits<u64>::max() >> shift)) {
        DEDUPSTORE_THROW(config_error(fmt::format("Size `{}` is too large.", value)));
    }
    return number << shift;
}

bool parse_bool(const std::string& value) {
    const std::string v = lowercase(value);
    if (v == "1" || v == "true" || v == "yes" || v == "on")
        return true;
    if (v == "0" || v == "false" || v == "no" || v == "off")
        return false;
    DEDUPSTORE_THROW(config_error(fmt::format("Invalid boolean value `{}`.", value)));
}

void config_parser::set(const std::string& key, const std::string& value) {
    if (key == "db") {
        if (value.empty()) {
            DEDUPSTORE_THROW(config_error("The `db` parameter must not be empty."));
        }
        m_config.store_path = value;
        m_has_path = true;
    } else if (key == "size") {
        m_config.size = parse_size(value);
        m_has_size = true;
    } else if (key == "trust_hash") {
        m_config.hash = parse_bool(value) ? hash_policy::trusted : hash_policy::verified;
    } else if (key == "retry_delay") {
        const u64 delay = parse_integer(key, value);
        if (delay > static_cast<u64>(std::numeric_limits<std::chrono::milliseconds::rep>::max())) {
            DEDUPSTORE_THROW(config_error(fmt::format("Retry delay `{}` is too large.", value)));
        }
        m_config.retry.delay =
            std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(delay));
    } else if (key == "retry_limit") {
        const u64 limit = parse_integer(key, value);
        if (limit > std::numeric_limits<u32>::max()) {
            DEDUPSTORE_THROW(config_error(fmt::format("Retry limit `{}` is too large.", value)));
        }
        if (limit == 0)
            m_config.retry.max_attempts.reset();
        else
            m_config.retry.max_attempts = static_cast<u32>(limit);
    } else if (key == "sync") {
        m_config.sync_on_commit = parse_bool(value);
    } else if (key == "read_only") {
        m_config.read_only = parse_bool(value);
    } else if (key == "auto_compact") {
        m_config.auto_compact = parse_bool(value);
    } else {
        spdlog::warn("Ignored parameter {}={}", key, value);
    }
}

void config_parser::set(const std::string& assignment) {
    const auto pos = assignment.find('=');
    if (pos == std::string::npos || pos == 0) {
        DEDUPSTORE_THROW(config_error(
            fmt::format("Invalid parameter `{}` (expected key=value).", assignment)));
    }
    set(assignment.substr(0, pos), assignment.substr(pos + 1));
}

device_config config_parser::complete() const {
    if (!m_has_path) {
        DEDUPSTORE_THROW(config_error("The `db` parameter is required."));
    }
    if (!m_has_size) {
        DEDUPSTORE_THROW(config_error("The `size` parameter is required."));
    }

    m_config.validate();
    return m_config;
}

} // namespace dedupstore
