#include <dedupstore/config.hpp>
#include <dedupstore/device.hpp>
#include <dedupstore/exception.hpp>
#include <dedupstore/journal_store.hpp>

#include <fmt/format.h>
#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>

#include <cstdio>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

using namespace dedupstore;

namespace {

void usage(const char* program) {
    fmt::print(stderr,
               "Usage: {} key=value... COMMAND [ARGS...]\n"
               "\n"
               "Parameters:\n"
               "  db=PATH           journal file (required)\n"
               "  size=SIZE         device size, e.g. 64M (required)\n"
               "  trust_hash=BOOL   deduplicate by fingerprint only\n"
               "  retry_delay=MS    delay between attempts on contention\n"
               "  retry_limit=N     maximum number of attempts (0: unlimited)\n"
               "  sync=BOOL         sync every commit\n"
               "  read_only=BOOL    reject modifications\n"
               "  auto_compact=BOOL compact the journal automatically\n"
               "\n"
               "Commands:\n"
               "  info                          print the device geometry\n"
               "  fill OFFSET LENGTH BYTE       write LENGTH bytes with value BYTE\n"
               "  import OFFSET FILE            write the contents of FILE\n"
               "  export OFFSET LENGTH FILE     read LENGTH bytes into FILE\n"
               "  dump OFFSET LENGTH            print LENGTH bytes as hex\n"
               "  trim OFFSET LENGTH            discard LENGTH bytes\n"
               "  zero OFFSET LENGTH            zero LENGTH bytes\n"
               "  stats                         print space usage\n"
               "  verify                        check the consistency of the store\n"
               "  compact                       compact the journal file\n"
               "\n"
               "Offsets and lengths accept the same units as SIZE.\n"
               "Set SPDLOG_LEVEL=debug for diagnostic output.\n",
               program);
}

void require_args(const std::vector<std::string>& args, size_t count) {
    if (args.size() != count) {
        DEDUPSTORE_THROW(bad_argument(fmt::format("Command `{}` expects {} arguments, got {}.",
                                                  args[0], count - 1, args.size() - 1)));
    }
}

bytes read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        DEDUPSTORE_THROW(io_error(fmt::format("Failed to open `{}`.", path)));
    }
    return bytes(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

void write_file(const std::string& path, const bytes& data) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!out) {
        DEDUPSTORE_THROW(io_error(fmt::format("Failed to write `{}`.", path)));
    }
}

void dump(u64 offset, const bytes& data) {
    static constexpr size_t line_size = 32;

    for (size_t pos = 0; pos < data.size(); pos += line_size) {
        fmt::print("{:>10} -", offset + pos);
        for (size_t i = pos; i < pos + line_size && i < data.size(); ++i)
            fmt::print(" {:02x}", data[i]);
        fmt::print("\n");
    }
}

int run(store& s, const device_config& config, const std::vector<std::string>& args) {
    const std::string& command = args[0];

    if (command == "compact") {
        require_args(args, 1);
        auto* js = dynamic_cast<journal_store*>(&s);
        if (!js) {
            DEDUPSTORE_THROW(bad_operation("The store does not support compaction."));
        }
        const u64 before = js->stats().log_size;
        js->compact();
        fmt::print("Compacted `{}` from {} to {} bytes.\n", js->path(), before,
                   js->stats().log_size);
        return 0;
    }

    device dev(s, config);

    if (command == "info") {
        require_args(args, 1);
        const auto hints = dev.block_size_hints();
        fmt::print("Size:        {} bytes\n"
                   "Blocks:      {}\n"
                   "Block size:  {} bytes (minimum {}, preferred {}, maximum {})\n"
                   "Hashes:      {}\n",
                   dev.size(), dev.block_count(), dev.block_size(), hints.minimum,
                   hints.preferred, hints.maximum, to_string(config.hash));
    } else if (command == "fill") {
        require_args(args, 4);
        const u64 offset = parse_size(args[1]);
        const u64 length = parse_size(args[2]);
        const u64 value = parse_size(args[3]);
        if (value > 255) {
            DEDUPSTORE_THROW(bad_argument(fmt::format("Invalid byte value `{}`.", args[3])));
        }
        dev.write(offset, bytes(length, static_cast<byte>(value)));
    } else if (command == "import") {
        require_args(args, 3);
        dev.write(parse_size(args[1]), read_file(args[2]));
    } else if (command == "export") {
        require_args(args, 4);
        write_file(args[3], dev.read(parse_size(args[1]), parse_size(args[2])));
    } else if (command == "dump") {
        require_args(args, 3);
        const u64 offset = parse_size(args[1]);
        dump(offset, dev.read(offset, parse_size(args[2])));
    } else if (command == "trim") {
        require_args(args, 3);
        dev.trim(parse_size(args[1]), parse_size(args[2]));
    } else if (command == "zero") {
        require_args(args, 3);
        dev.zero(parse_size(args[1]), parse_size(args[2]));
    } else if (command == "stats") {
        require_args(args, 1);
        const auto stats = dev.statistics();
        fmt::print("Mapped blocks:  {}\n"
                   "Stored blocks:  {}\n"
                   "References:     {}\n"
                   "Logical bytes:  {}\n"
                   "Physical bytes: {}\n",
                   stats.mapped_blocks, stats.stored_blocks, stats.references,
                   stats.logical_bytes, stats.physical_bytes);
    } else if (command == "verify") {
        require_args(args, 1);
        const auto report = dev.verify();
        for (const auto& error : report.errors)
            fmt::print("{}\n", error);
        fmt::print("Checked {} mappings and {} blocks: {} errors.\n", report.checked_mappings,
                   report.checked_blocks, report.errors.size());
        return report.ok() ? 0 : 2;
    } else {
        DEDUPSTORE_THROW(bad_argument(fmt::format("Unknown command `{}`.", command)));
    }
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    spdlog::cfg::load_env_levels();

    config_parser parser;
    std::vector<std::string> args;
    try {
        int i = 1;
        for (; i < argc; ++i) {
            const std::string arg = argv[i];
            if (arg.find('=') == std::string::npos)
                break;
            parser.set(arg);
        }
        for (; i < argc; ++i)
            args.emplace_back(argv[i]);

        if (args.empty()) {
            usage(argv[0]);
            return 1;
        }

        const device_config config = parser.complete();
        journal_store s(config.store_path, config.store_options());
        return run(s, config, args);
    } catch (const config_error& e) {
        fmt::print(stderr, "Configuration error: {}\n", e.what());
        usage(argv[0]);
        return 1;
    } catch (const exception& e) {
        fmt::print(stderr, "Error: {} ({}:{})\n", e.what(), e.where().file(), e.where().line());
        return 1;
    }
}
