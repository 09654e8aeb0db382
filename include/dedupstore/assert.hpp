#ifndef DEDUPSTORE_ASSERT_HPP
#define DEDUPSTORE_ASSERT_HPP

/// \defgroup assertions Assertion Macros
/// @{

/// Evaluates the expression `x` and gives a hint to the compiler
/// that it is likely to be false.
#define DEDUPSTORE_UNLIKELY(x) (__builtin_expect(!!(x), 0))

#ifndef NDEBUG

/// DEDUPSTORE_DEBUG is defined when this library is built in debug mode.
#    define DEDUPSTORE_DEBUG

#endif

#ifdef DEDUPSTORE_DEBUG

/// When in debug mode, check against the given condition
/// and abort the program with a message if the check fails.
/// Does nothing in release mode.
#    define DEDUPSTORE_ASSERT(cond, message)                                             \
        do {                                                                             \
            if (!(cond)) {                                                               \
                ::dedupstore::detail::assert_impl(__FILE__, __LINE__, #cond, (message)); \
            }                                                                            \
        } while (0)

#else

#    define DEDUPSTORE_ASSERT(cond, message)

#endif

/// Always check against a (rare) error condition and abort the program
/// with a message if the check fails.
#define DEDUPSTORE_CHECK(cond, message)                                              \
    do {                                                                             \
        if (DEDUPSTORE_UNLIKELY(!(cond))) {                                          \
            ::dedupstore::detail::assert_impl(__FILE__, __LINE__, #cond, (message)); \
        }                                                                            \
    } while (0)

/// Unconditionally terminate the program when unreachable code is executed.
#define DEDUPSTORE_UNREACHABLE(message) \
    (::dedupstore::detail::unreachable_impl(__FILE__, __LINE__, (message)))

/// @}

/// \cond INTERNAL
namespace dedupstore::detail {

[[noreturn]] void assert_impl(const char* file, int line, const char* cond, const char* message);
[[noreturn]] void unreachable_impl(const char* file, int line, const char* message);

} // namespace dedupstore::detail
/// \endcond

#endif // DEDUPSTORE_ASSERT_HPP
