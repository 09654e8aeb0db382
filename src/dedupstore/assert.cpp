#include <dedupstore/assert.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cstdio>
#include <cstdlib>
#include <string>

namespace dedupstore::detail {

namespace {

// Logs the failure through the default logger (which may write to a file) and
// to stderr, then terminates the process.
[[noreturn]] void fail(const std::string& what, const char* file, int line) {
    spdlog::critical("{} (in {}:{})", what, file, line);
    spdlog::shutdown();

    fmt::print(stderr, "{}\n    (in {}:{})\n", what, file, line);
    std::fflush(stderr);
    std::abort();
}

bool has_text(const char* message) {
    return message && *message;
}

} // namespace

void assert_impl(const char* file, int line, const char* condition, const char* message) {
    std::string what = fmt::format("Assertion `{}` failed", condition);
    if (has_text(message))
        what += fmt::format(": {}", message);
    fail(what, file, line);
}

void unreachable_impl(const char* file, int line, const char* message) {
    std::string what = "Unreachable code executed";
    if (has_text(message))
        what += fmt::format(": {}", message);
    fail(what, file, line);
}

} // namespace dedupstore::detail
