#ifndef DEDUPSTORE_VFS_HPP
#define DEDUPSTORE_VFS_HPP

#include <dedupstore/assert.hpp>
#include <dedupstore/defs.hpp>

#include <memory>

namespace dedupstore {

class file;
class vfs;

/// A handle to an open file.
///
/// Files support positional reads and writes and advisory whole-file locks.
/// Locks follow the semantics of BSD `flock()`: they belong to the handle
/// (not to the process), so two handles for the same file conflict with each other
/// even when they live in the same process. A handle holds at most one lock at a time,
/// locking again converts the existing lock.
class file {
public:
    /// Lock modes for \ref lock() and \ref try_lock().
    enum lock_mode {
        /// Any number of handles can hold a shared lock at the same time.
        lock_shared,

        /// At most one handle can hold an exclusive lock, and only if no other
        /// handle holds a shared lock.
        lock_exclusive,
    };

public:
    file(dedupstore::vfs& v)
        : m_vfs(v) {}

    virtual ~file();

    /// The virtual file system that this file belongs to.
    dedupstore::vfs& get_vfs() const { return m_vfs; }

    /// True if the file has been opened in read-only mode.
    virtual bool read_only() const noexcept = 0;

    /// Returns the name of this file (for error reporting only).
    virtual const char* name() const noexcept = 0;

    /// Reads exactly `count` bytes at the given offset
    /// into the provided buffer.
    virtual void read(u64 offset, void* buffer, size_t count) = 0;

    /// Writes exactly `count` bytes at the given offset
    /// from the provided buffer into the file.
    ///
    /// Writing to beyond the end of the file automatically makes the file grow.
    virtual void write(u64 offset, const void* buffer, size_t count) = 0;

    /// Returns the size of the file, in bytes.
    virtual u64 file_size() = 0;

    /// Resizes the file to the given number of bytes.
    virtual void truncate(u64 size) = 0;

    /// Writes all buffered changes of the file to the disk.
    virtual void sync() = 0;

    /// Acquires a lock on the file, waiting until it becomes available.
    virtual void lock(lock_mode mode) = 0;

    /// Attempts to acquire a lock on the file without waiting.
    /// Returns false if a conflicting lock is held through another handle.
    virtual bool try_lock(lock_mode mode) = 0;

    /// Releases the lock held by this handle (if any).
    virtual void unlock() = 0;

    /// Closes this file handle. Locks are released.
    virtual void close() = 0;

    file(const file&) = delete;
    file& operator=(const file&) = delete;

private:
    dedupstore::vfs& m_vfs;
};

/// The virtual file system provides the bare necessities for opening files.
class vfs {
public:
    /// Access mode for the open() function.
    enum access_t {
        /// Whether the file should be read-only.
        read_only,

        /// Whether the file should be both readable and writable.
        read_write,
    };

    /// Additional flags for the open() function.
    enum flags_t {
        /// Default flags.
        open_normal = 0,

        /// Whether the file should be created if it doesn't exist.
        open_create = 1 << 0,
    };

public:
    vfs() = default;

    virtual ~vfs();

    /// Name of this vfs.
    virtual const char* name() const noexcept = 0;

    /// Opens the file at the given path or throws an exception.
    virtual std::unique_ptr<file>
    open(const char* path, access_t access = read_only, int mode = open_normal) = 0;

    /// Returns true if a file exists at the given path.
    virtual bool exists(const char* path) = 0;

    /// Removes the file with the given name or throws an exception.
    /// Existing file handles can still be used after a file has been removed.
    virtual void remove(const char* path) = 0;

    /// Atomically replaces the file at `to` with the file at `from`.
    /// Handles that were opened for the old file at `to` keep referring to that old file.
    virtual void rename(const char* from, const char* to) = 0;

    /// Returns true if `f` is (still) the file that can be found under `path`,
    /// i.e. the file at that path has not been replaced or removed in the meantime.
    virtual bool same_file(file& f, const char* path) = 0;

    vfs(const vfs&) = delete;
    vfs& operator=(const vfs&) = delete;

protected:
    void check_vfs(file& f) const {
        DEDUPSTORE_CHECK(&f.get_vfs() == this, "The file does not belong to this filesystem.");
    }
};

/// Returns the current platform's file system.
///
/// \relates vfs
vfs& system_vfs();

/// Returns the in-memory file system. Files are kept alive as long as they
/// have a name or an open handle, so a file can be reopened after its handle was closed.
/// The in-memory file system is shared by the whole process.
///
/// \relates vfs
vfs& memory_vfs();

} // namespace dedupstore

#endif // DEDUPSTORE_VFS_HPP
