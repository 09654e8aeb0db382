#include <dedupstore/vfs.hpp>

#include <dedupstore/assert.hpp>
#include <dedupstore/exception.hpp>

#include <algorithm>
#include <condition_variable>
#include <limits>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace dedupstore {

file::~file() {}

vfs::~vfs() {}

namespace {

// Content and lock state of an in-memory file. Shared between the directory entry
// and all handles of the file.
struct memory_inode {
    std::vector<byte> data;

    // Lock state, protected by the vfs mutex.
    u32 shared_holders = 0;
    bool exclusive_held = false;
};

class in_memory_vfs;

class memory_file : public file {
public:
    memory_file(in_memory_vfs& v, std::shared_ptr<memory_inode> inode, std::string name,
                bool read_only);

    ~memory_file();

    bool read_only() const noexcept override { return m_read_only; }
    const char* name() const noexcept override { return m_name.c_str(); }

    void read(u64 offset, void* buffer, size_t count) override;
    void write(u64 offset, const void* buffer, size_t count) override;
    u64 file_size() override;
    void truncate(u64 size) override;
    void sync() override { check_open(); }
    void lock(lock_mode mode) override;
    bool try_lock(lock_mode mode) override;
    void unlock() override;
    void close() override;

    const std::shared_ptr<memory_inode>& inode() const { return m_inode; }

private:
    enum held_t { held_none, held_shared, held_exclusive };

    void check_open() const;

    // True if the lock can be granted to this handle. Must hold the vfs mutex.
    bool lockable(lock_mode mode) const;

    // Grants the lock, replacing the one held by this handle (if any). Must hold the vfs mutex.
    void grant(lock_mode mode);

    // Releases the lock held by this handle (if any). Must hold the vfs mutex.
    void release();

private:
    in_memory_vfs& m_vfs;
    std::shared_ptr<memory_inode> m_inode;
    std::string m_name;
    bool m_read_only = false;
    held_t m_held = held_none;
};

class in_memory_vfs : public vfs {
public:
    in_memory_vfs() = default;

    const char* name() const noexcept override { return "memory"; }

    std::unique_ptr<file> open(const char* path, access_t access, int mode) override;

    bool exists(const char* path) override;

    void remove(const char* path) override;

    void rename(const char* from, const char* to) override;

    bool same_file(file& f, const char* path) override;

private:
    friend memory_file;

    // Protects the directory, all file contents and all lock states.
    std::mutex m_mutex;

    // Signalled whenever a lock is released.
    std::condition_variable m_lock_released;

    std::map<std::string, std::shared_ptr<memory_inode>> m_files;
};

memory_file::memory_file(in_memory_vfs& v, std::shared_ptr<memory_inode> inode,
                         std::string name, bool read_only)
    : file(v)
    , m_vfs(v)
    , m_inode(std::move(inode))
    , m_name(std::move(name))
    , m_read_only(read_only) {}

memory_file::~memory_file() {
    if (m_inode) {
        std::lock_guard lock(m_vfs.m_mutex);
        release();
    }
}

void memory_file::check_open() const {
    if (!m_inode)
        DEDUPSTORE_THROW(bad_operation("File is closed."));
}

void memory_file::read(u64 offset, void* buffer, size_t count) {
    DEDUPSTORE_ASSERT(buffer != nullptr || count == 0, "Buffer null pointer");
    check_open();

    std::lock_guard lock(m_vfs.m_mutex);
    const auto& data = m_inode->data;
    if (offset > data.size() || count > data.size() - offset) {
        DEDUPSTORE_THROW(io_error(fmt::format(
            "Failed to read from `{}`: Unexpected end of file ({}, {}).", name(), offset, count)));
    }

    auto begin = data.data() + offset;
    std::copy(begin, begin + count, reinterpret_cast<byte*>(buffer));
}

void memory_file::write(u64 offset, const void* buffer, size_t count) {
    DEDUPSTORE_ASSERT(buffer != nullptr || count == 0, "Buffer null pointer");
    check_open();
    if (m_read_only) {
        DEDUPSTORE_THROW(
            io_error(fmt::format("Cannot write to `{}`: File opened in read-only mode.", name())));
    }

    std::lock_guard lock(m_vfs.m_mutex);
    auto& data = m_inode->data;
    if (offset > std::numeric_limits<size_t>::max() - count)
        DEDUPSTORE_THROW(io_error(fmt::format("File offset too large ({} byte)", offset)));
    if (offset + count > data.size())
        data.resize(offset + count);

    auto begin = reinterpret_cast<const byte*>(buffer);
    std::copy(begin, begin + count, data.data() + offset);
}

u64 memory_file::file_size() {
    check_open();

    std::lock_guard lock(m_vfs.m_mutex);
    return m_inode->data.size();
}

void memory_file::truncate(u64 size) {
    check_open();
    if (m_read_only) {
        DEDUPSTORE_THROW(
            io_error(fmt::format("Cannot truncate `{}`: File opened in read-only mode.", name())));
    }
    if (size > std::numeric_limits<size_t>::max())
        DEDUPSTORE_THROW(io_error(fmt::format("File size too large ({} byte)", size)));

    std::lock_guard lock(m_vfs.m_mutex);
    m_inode->data.resize(size);
}

bool memory_file::lockable(lock_mode mode) const {
    const u32 other_shared = m_inode->shared_holders - (m_held == held_shared ? 1 : 0);
    const bool other_exclusive = m_inode->exclusive_held && m_held != held_exclusive;
    if (mode == lock_shared)
        return !other_exclusive;
    return !other_exclusive && other_shared == 0;
}

void memory_file::grant(lock_mode mode) {
    release();
    if (mode == lock_shared) {
        ++m_inode->shared_holders;
        m_held = held_shared;
    } else {
        m_inode->exclusive_held = true;
        m_held = held_exclusive;
    }
}

void memory_file::release() {
    switch (m_held) {
    case held_none: return;
    case held_shared:
        DEDUPSTORE_ASSERT(m_inode->shared_holders > 0, "Shared lock count underflow.");
        --m_inode->shared_holders;
        break;
    case held_exclusive: m_inode->exclusive_held = false; break;
    }
    m_held = held_none;
    m_vfs.m_lock_released.notify_all();
}

void memory_file::lock(lock_mode mode) {
    check_open();

    std::unique_lock lock(m_vfs.m_mutex);
    m_vfs.m_lock_released.wait(lock, [&] { return lockable(mode); });
    grant(mode);
}

bool memory_file::try_lock(lock_mode mode) {
    check_open();

    std::lock_guard lock(m_vfs.m_mutex);
    if (!lockable(mode))
        return false;
    grant(mode);
    return true;
}

void memory_file::unlock() {
    check_open();

    std::lock_guard lock(m_vfs.m_mutex);
    release();
}

void memory_file::close() {
    if (m_inode) {
        std::lock_guard lock(m_vfs.m_mutex);
        release();
        m_inode.reset();
    }
}

std::unique_ptr<file> in_memory_vfs::open(const char* path, access_t access, int mode) {
    DEDUPSTORE_ASSERT(path != nullptr, "path null pointer");

    std::shared_ptr<memory_inode> inode;
    {
        std::lock_guard lock(m_mutex);
        auto pos = m_files.find(path);
        if (pos != m_files.end()) {
            inode = pos->second;
        } else if (mode & open_create) {
            inode = std::make_shared<memory_inode>();
            m_files.emplace(path, inode);
        } else {
            DEDUPSTORE_THROW(
                io_error(fmt::format("Failed to open `{}`: No such file or directory.", path)));
        }
    }
    return std::make_unique<memory_file>(*this, std::move(inode), path, access == read_only);
}

bool in_memory_vfs::exists(const char* path) {
    std::lock_guard lock(m_mutex);
    return m_files.count(path) > 0;
}

void in_memory_vfs::remove(const char* path) {
    std::lock_guard lock(m_mutex);
    if (m_files.erase(path) == 0) {
        DEDUPSTORE_THROW(
            io_error(fmt::format("Failed to remove `{}`: No such file or directory.", path)));
    }
}

void in_memory_vfs::rename(const char* from, const char* to) {
    std::lock_guard lock(m_mutex);
    auto pos = m_files.find(from);
    if (pos == m_files.end()) {
        DEDUPSTORE_THROW(io_error(fmt::format(
            "Failed to rename `{}` to `{}`: No such file or directory.", from, to)));
    }

    auto inode = std::move(pos->second);
    m_files.erase(pos);
    m_files[to] = std::move(inode);
}

bool in_memory_vfs::same_file(file& f, const char* path) {
    check_vfs(f);
    const auto& inode = static_cast<memory_file&>(f).inode();

    std::lock_guard lock(m_mutex);
    auto pos = m_files.find(path);
    return pos != m_files.end() && inode && pos->second == inode;
}

} // namespace

vfs& memory_vfs() {
    static in_memory_vfs v;
    return v;
}

} // namespace dedupstore
