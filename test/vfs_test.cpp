#include <catch2/catch.hpp>

#include <dedupstore/exception.hpp>
#include <dedupstore/vfs.hpp>

#include "test_util.hpp"

#include <fmt/format.h>

#include <filesystem>
#include <string>

#include <unistd.h>

using namespace dedupstore;
using dedupstore::test::unique_path;

TEST_CASE("memory vfs reads and writes", "[vfs]") {
    vfs& v = memory_vfs();
    const std::string path = unique_path("vfs-rw");

    REQUIRE_FALSE(v.exists(path.c_str()));
    REQUIRE_THROWS_AS(v.open(path.c_str(), vfs::read_write), io_error);

    {
        auto f = v.open(path.c_str(), vfs::read_write, vfs::open_create);
        REQUIRE(f->file_size() == 0);

        const char message[] = "hello world";
        f->write(10, message, sizeof(message));
        REQUIRE(f->file_size() == 10 + sizeof(message));

        char buffer[sizeof(message)];
        f->read(10, buffer, sizeof(buffer));
        REQUIRE(std::string(buffer) == message);

        REQUIRE_THROWS_AS(f->read(f->file_size() - 1, buffer, 2), io_error);

        f->truncate(5);
        REQUIRE(f->file_size() == 5);
    }

    // The file survives the handle.
    REQUIRE(v.exists(path.c_str()));
    auto f = v.open(path.c_str(), vfs::read_only);
    REQUIRE(f->read_only());
    REQUIRE(f->file_size() == 5);
    REQUIRE_THROWS_AS(f->write(0, "x", 1), io_error);
    REQUIRE_THROWS_AS(f->truncate(0), io_error);
    REQUIRE(f->file_size() == 5);

    f->close();
    REQUIRE_THROWS_AS(f->file_size(), bad_operation);

    v.remove(path.c_str());
    REQUIRE_FALSE(v.exists(path.c_str()));
}

TEST_CASE("file locks conflict between handles", "[vfs]") {
    vfs& v = memory_vfs();
    const std::string path = unique_path("vfs-lock");

    auto a = v.open(path.c_str(), vfs::read_write, vfs::open_create);
    auto b = v.open(path.c_str(), vfs::read_write);
    auto c = v.open(path.c_str(), vfs::read_write);

    SECTION("exclusive lock blocks everyone else") {
        REQUIRE(a->try_lock(file::lock_exclusive));
        REQUIRE_FALSE(b->try_lock(file::lock_shared));
        REQUIRE_FALSE(c->try_lock(file::lock_exclusive));

        a->unlock();
        REQUIRE(b->try_lock(file::lock_shared));
        REQUIRE(c->try_lock(file::lock_shared));
        REQUIRE_FALSE(a->try_lock(file::lock_exclusive));
    }

    SECTION("a shared lock can be upgraded by its only holder") {
        REQUIRE(a->try_lock(file::lock_shared));
        REQUIRE(a->try_lock(file::lock_exclusive));
        REQUIRE_FALSE(b->try_lock(file::lock_shared));
    }

    SECTION("closing a handle releases its lock") {
        REQUIRE(a->try_lock(file::lock_exclusive));
        a.reset();
        REQUIRE(b->try_lock(file::lock_exclusive));
    }
}

TEST_CASE("rename replaces files atomically", "[vfs]") {
    vfs& v = memory_vfs();
    const std::string target = unique_path("vfs-target");
    const std::string temp = unique_path("vfs-temp");

    auto old_file = v.open(target.c_str(), vfs::read_write, vfs::open_create);
    old_file->write(0, "old", 3);
    REQUIRE(v.same_file(*old_file, target.c_str()));

    {
        auto new_file = v.open(temp.c_str(), vfs::read_write, vfs::open_create);
        new_file->write(0, "new!", 4);
    }
    v.rename(temp.c_str(), target.c_str());
    REQUIRE_FALSE(v.exists(temp.c_str()));

    // The old handle still refers to the old contents.
    REQUIRE_FALSE(v.same_file(*old_file, target.c_str()));
    REQUIRE(old_file->file_size() == 3);

    auto reopened = v.open(target.c_str(), vfs::read_only);
    REQUIRE(v.same_file(*reopened, target.c_str()));
    REQUIRE(reopened->file_size() == 4);
}

TEST_CASE("system vfs supports locks and rename", "[vfs]") {
    namespace fs = std::filesystem;

    vfs& v = system_vfs();
    const fs::path dir = fs::temp_directory_path();
    const std::string path = (dir / fmt::format("dedupstore-vfs-test-{}.tmp", ::getpid())).string();
    const std::string temp = path + ".new";
    if (v.exists(path.c_str()))
        v.remove(path.c_str());

    {
        auto a = v.open(path.c_str(), vfs::read_write, vfs::open_create);
        auto b = v.open(path.c_str(), vfs::read_write);
        a->write(0, "abcd", 4);
        a->sync();
        REQUIRE(b->file_size() == 4);

        REQUIRE(a->try_lock(file::lock_exclusive));
        REQUIRE_FALSE(b->try_lock(file::lock_shared));
        a->unlock();
        REQUIRE(b->try_lock(file::lock_shared));
        b->unlock();

        {
            auto n = v.open(temp.c_str(), vfs::read_write, vfs::open_create);
            n->write(0, "xy", 2);
        }
        v.rename(temp.c_str(), path.c_str());
        REQUIRE_FALSE(v.same_file(*a, path.c_str()));

        auto c = v.open(path.c_str(), vfs::read_only);
        REQUIRE(v.same_file(*c, path.c_str()));
        REQUIRE(c->file_size() == 2);
    }

    v.remove(path.c_str());
    REQUIRE_FALSE(v.exists(path.c_str()));
}
