#include <dedupstore/vfs.hpp>

#include <dedupstore/assert.hpp>
#include <dedupstore/exception.hpp>
#include <dedupstore/detail/deferred.hpp>

#include <cerrno>
#include <string>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace dedupstore {

class unix_vfs;

class unix_file : public file {
private:
    int m_fd = -1;
    std::string m_name;
    bool m_read_only = false;

public:
    unix_file(unix_vfs& vfs, int fd, std::string name, bool read_only);

    ~unix_file();

    bool read_only() const noexcept override { return m_read_only; }

    const char* name() const noexcept override { return m_name.c_str(); }

    int fd() const;

    void read(u64 offset, void* buffer, size_t count) override;

    void write(u64 offset, const void* buffer, size_t count) override;

    u64 file_size() override;

    void truncate(u64 size) override;

    void sync() override;

    void lock(lock_mode mode) override;

    bool try_lock(lock_mode mode) override;

    void unlock() override;

    void close() override;

private:
    void check_open() const;
};

class unix_vfs : public vfs {
public:
    unix_vfs() = default;

    const char* name() const noexcept override { return "unix_vfs"; }

    std::unique_ptr<file> open(const char* path, access_t access, int mode) override;

    bool exists(const char* path) override;

    void remove(const char* path) override;

    void rename(const char* from, const char* to) override;

    bool same_file(file& f, const char* path) override;
};

static std::error_code get_errno() {
    return std::error_code(errno, std::system_category());
}

static int flock_operation(file::lock_mode mode) {
    return mode == file::lock_exclusive ? LOCK_EX : LOCK_SH;
}

// Returns the directory part of `path` ("." if there is none).
static std::string parent_directory(const std::string& path) {
    auto pos = path.find_last_of('/');
    if (pos == std::string::npos)
        return ".";
    if (pos == 0)
        return "/";
    return path.substr(0, pos);
}

unix_file::unix_file(unix_vfs& v, int fd, std::string name, bool read_only)
    : file(v)
    , m_fd(fd)
    , m_name(std::move(name))
    , m_read_only(read_only) {}

unix_file::~unix_file() {
    if (m_fd != -1)
        ::close(m_fd);
}

int unix_file::fd() const {
    check_open();

    return m_fd;
}

void unix_file::read(u64 offset, void* buffer, size_t count) {
    DEDUPSTORE_ASSERT(buffer != nullptr || count == 0, "null buffer");

    check_open();

    byte* data = reinterpret_cast<byte*>(buffer);
    while (count > 0) {
        ssize_t n = ::pread(m_fd, data, count, static_cast<off_t>(offset));
        if (n == -1) {
            if (errno == EINTR)
                continue;

            auto ec = get_errno();
            DEDUPSTORE_THROW(
                io_error(fmt::format("Failed to read from `{}`: {}.", name(), ec.message())));
        }

        if (n == 0) {
            DEDUPSTORE_THROW(io_error(
                fmt::format("Failed to read from `{}`: Unexpected end of file.", name())));
        }

        count -= static_cast<size_t>(n);
        offset += static_cast<u64>(n);
        data += n;
    }
}

void unix_file::write(u64 offset, const void* buffer, size_t count) {
    DEDUPSTORE_ASSERT(buffer != nullptr || count == 0, "null buffer");

    check_open();
    if (m_read_only) {
        DEDUPSTORE_THROW(
            io_error(fmt::format("Cannot write to `{}`: File opened in read-only mode.", name())));
    }

    const byte* data = reinterpret_cast<const byte*>(buffer);
    while (count > 0) {
        ssize_t n = ::pwrite(m_fd, data, count, static_cast<off_t>(offset));
        if (n == -1) {
            if (errno == EINTR)
                continue;

            auto ec = get_errno();
            DEDUPSTORE_THROW(
                io_error(fmt::format("Failed to write to `{}`: {}.", name(), ec.message())));
        }

        count -= static_cast<size_t>(n);
        offset += static_cast<u64>(n);
        data += n;
    }
}

u64 unix_file::file_size() {
    check_open();

    struct stat st;
    if (::fstat(m_fd, &st) == -1) {
        auto ec = get_errno();
        DEDUPSTORE_THROW(io_error(
            fmt::format("Failed to get attributes of `{}`: {}.", name(), ec.message())));
    }

    return static_cast<u64>(st.st_size);
}

void unix_file::truncate(u64 size) {
    check_open();
    if (::ftruncate(m_fd, static_cast<off_t>(size)) == -1) {
        auto ec = get_errno();
        DEDUPSTORE_THROW(
            io_error(fmt::format("Failed to truncate `{}`: {}.", name(), ec.message())));
    }
}

void unix_file::sync() {
    check_open();
    if (::fsync(m_fd) == -1) {
        auto ec = get_errno();
        DEDUPSTORE_THROW(io_error(fmt::format("Failed to sync `{}`: {}.", name(), ec.message())));
    }
}

void unix_file::lock(lock_mode mode) {
    check_open();
    while (::flock(m_fd, flock_operation(mode)) == -1) {
        if (errno == EINTR)
            continue;

        auto ec = get_errno();
        DEDUPSTORE_THROW(io_error(fmt::format("Failed to lock `{}`: {}.", name(), ec.message())));
    }
}

bool unix_file::try_lock(lock_mode mode) {
    check_open();
    while (::flock(m_fd, flock_operation(mode) | LOCK_NB) == -1) {
        if (errno == EINTR)
            continue;
        if (errno == EWOULDBLOCK)
            return false;

        auto ec = get_errno();
        DEDUPSTORE_THROW(io_error(fmt::format("Failed to lock `{}`: {}.", name(), ec.message())));
    }
    return true;
}

void unix_file::unlock() {
    check_open();
    if (::flock(m_fd, LOCK_UN) == -1) {
        auto ec = get_errno();
        DEDUPSTORE_THROW(
            io_error(fmt::format("Failed to unlock `{}`: {}.", name(), ec.message())));
    }
}

void unix_file::close() {
    if (m_fd != -1) {
        int fd = std::exchange(m_fd, -1);
        if (::close(fd) == -1) {
            auto ec = get_errno();
            DEDUPSTORE_THROW(
                io_error(fmt::format("Failed to close `{}`: {}.", name(), ec.message())));
        }
    }
}

void unix_file::check_open() const {
    if (m_fd == -1) {
        DEDUPSTORE_THROW(bad_operation("File is closed."));
    }
}

std::unique_ptr<file> unix_vfs::open(const char* path, access_t access, int mode) {
    DEDUPSTORE_ASSERT(path != nullptr, "path null pointer");

    int flags = access == read_only ? O_RDONLY : O_RDWR;
    if (mode & open_create) {
        flags |= O_CREAT;
    }
    flags |= O_CLOEXEC;
    int createmode = S_IRUSR | S_IWUSR;

    int fd = ::open(path, flags, createmode);
    if (fd == -1) {
        auto ec = get_errno();
        DEDUPSTORE_THROW(io_error(fmt::format("Failed to open `{}`: {}.", path, ec.message())));
    }

    detail::deferred guard = [&] { ::close(fd); };

    auto ret = std::make_unique<unix_file>(*this, fd, path, access == read_only);
    guard.disable();
    return ret;
}

bool unix_vfs::exists(const char* path) {
    DEDUPSTORE_ASSERT(path != nullptr, "path null pointer");

    struct stat st;
    if (::stat(path, &st) == 0)
        return true;
    if (errno == ENOENT)
        return false;

    auto ec = get_errno();
    DEDUPSTORE_THROW(io_error(fmt::format("Failed to query `{}`: {}.", path, ec.message())));
}

void unix_vfs::remove(const char* path) {
    DEDUPSTORE_ASSERT(path != nullptr, "path null pointer");

    if (::unlink(path) == -1) {
        auto ec = get_errno();
        DEDUPSTORE_THROW(io_error(fmt::format("Failed to remove `{}`: {}.", path, ec.message())));
    }
}

void unix_vfs::rename(const char* from, const char* to) {
    DEDUPSTORE_ASSERT(from != nullptr && to != nullptr, "path null pointer");

    if (::rename(from, to) == -1) {
        auto ec = get_errno();
        DEDUPSTORE_THROW(io_error(
            fmt::format("Failed to rename `{}` to `{}`: {}.", from, to, ec.message())));
    }

    // Persist the directory entry, otherwise the rename can be lost on power failure.
    const std::string dir = parent_directory(to);
    int dirfd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dirfd == -1) {
        auto ec = get_errno();
        DEDUPSTORE_THROW(
            io_error(fmt::format("Failed to open directory `{}`: {}.", dir, ec.message())));
    }

    detail::deferred guard = [&] { ::close(dirfd); };
    if (::fsync(dirfd) == -1) {
        auto ec = get_errno();
        DEDUPSTORE_THROW(
            io_error(fmt::format("Failed to sync directory `{}`: {}.", dir, ec.message())));
    }
}

bool unix_vfs::same_file(file& f, const char* path) {
    check_vfs(f);
    unix_file& uf = static_cast<unix_file&>(f);

    struct stat open_st;
    if (::fstat(uf.fd(), &open_st) == -1) {
        auto ec = get_errno();
        DEDUPSTORE_THROW(io_error(
            fmt::format("Failed to get attributes of `{}`: {}.", f.name(), ec.message())));
    }

    struct stat path_st;
    if (::stat(path, &path_st) == -1) {
        if (errno == ENOENT)
            return false;

        auto ec = get_errno();
        DEDUPSTORE_THROW(io_error(fmt::format("Failed to query `{}`: {}.", path, ec.message())));
    }

    return open_st.st_dev == path_st.st_dev && open_st.st_ino == path_st.st_ino;
}

vfs& system_vfs() {
    static unix_vfs vfs;
    return vfs;
}

} // namespace dedupstore
