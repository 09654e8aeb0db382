#ifndef DEDUPSTORE_EXCEPTION_HPP
#define DEDUPSTORE_EXCEPTION_HPP

#include <exception>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

#include <fmt/format.h>

/// @defgroup exception_support Exception support macros
/// @{

/**
 * Expands to the current source location (file, line, function).
 */
#define DEDUPSTORE_SOURCE_LOCATION (::dedupstore::source_location(__FILE__, __LINE__, __func__))

/**
 * Augments an @ref dedupstore::exception with the current source location.
 */
#define DEDUPSTORE_AUGMENT_EXCEPTION(e) \
    (::dedupstore::detail::with_location((e), DEDUPSTORE_SOURCE_LOCATION))

/**
 * Throw the given @ref dedupstore::exception with added source location information.
 */
#define DEDUPSTORE_THROW(e) throw(DEDUPSTORE_AUGMENT_EXCEPTION(e))

/// @}

namespace dedupstore {

/**
 * Represents the source code location at which an exception was thrown.
 */
class source_location {
public:
    source_location() = default;

    source_location(const char* file, int line, const char* function)
        : m_file(file)
        , m_line(line)
        , m_function(function) {}

    const char* file() const { return m_file; }
    int line() const { return m_line; }
    const char* function() const { return m_function; }

private:
    const char* m_file = "";
    int m_line = 0;
    const char* m_function = "";
};

class exception;

namespace detail {

template<typename Exception>
std::decay_t<Exception> with_location(Exception&& e, const source_location& where) {
    static_assert(std::is_base_of_v<exception, std::decay_t<Exception>>,
                  "Exception must be derived from dedupstore::exception.");
    std::decay_t<Exception> result(std::forward<Exception>(e));
    result.set_where(where);
    return result;
}

} // namespace detail

/**
 * Base class for all exceptions thrown by this library.
 */
class exception : public std::runtime_error {
public:
    using runtime_error::runtime_error;

    /**
     * Returns the source code location that threw this exception.
     *
     * \note Requires that the exception was thrown using
     * @ref DEDUPSTORE_THROW, otherwise `where()` will return an empty source location.
     */
    const source_location& where() const { return m_where; }

private:
    template<typename T>
    friend std::decay_t<T> detail::with_location(T&&, const source_location&);

    void set_where(const source_location& loc) { m_where = loc; }

private:
    source_location m_where;
};

/**
 * Thrown when the device or store configuration is missing, malformed
 * or does not match an existing store. Configuration errors are fatal.
 */
class config_error : public exception {
public:
    using exception::exception;
};

/**
 * Thrown when the content of the store is known to be corrupted.
 */
class corruption_error : public exception {
public:
    using exception::exception;
};

/**
 * Thrown when data could not be read or written to secondary storage.
 */
class io_error : public exception {
public:
    using exception::exception;
};

/**
 * Thrown when a transaction could not be committed because of a concurrent
 * transaction, either because the store is locked by another writer or
 * because data observed by the transaction was changed in the meantime.
 *
 * Contention is transient: repeating the complete operation (in a new transaction)
 * is expected to succeed eventually. See \ref run_transaction.
 */
class contention_error : public exception {
public:
    using exception::exception;
};

/**
 * Exceptions of this class or its subclasses are thrown when an object
 * is being misused, i.e. it is being passed the wrong arguments
 * or it is in the wrong state.
 */
class usage_error : public exception {
public:
    using exception::exception;
};

/**
 * Thrown when an object cannot perform an operation in its current state.
 */
class bad_operation : public usage_error {
public:
    using usage_error::usage_error;
};

/**
 * Thrown when an invalid argument is being passed to some operation.
 */
class bad_argument : public usage_error {
public:
    using usage_error::usage_error;
};

/**
 * Thrown when a device offset or length is not a multiple of the block size.
 */
class alignment_error : public bad_argument {
public:
    using bad_argument::bad_argument;
};

} // namespace dedupstore

#endif // DEDUPSTORE_EXCEPTION_HPP
