#ifndef DEDUPSTORE_DETAIL_DEFERRED_HPP
#define DEDUPSTORE_DETAIL_DEFERRED_HPP

#include <exception>
#include <utility>

namespace dedupstore::detail {

/// An object that performs some action when the enclosing scope ends,
/// for example releasing a file lock or closing a file descriptor
/// on an error path.
///
/// The action can be cancelled with `disable()` once the protected
/// code completed successfully.
template<typename Function>
class deferred {
public:
    deferred(Function fn)
        : m_fn(std::move(fn)) {}

    ~deferred() noexcept(noexcept(std::declval<Function&>()())) {
        if (m_active) {
            try {
                m_fn();
            } catch (...) {
                // Never throw while another exception is in flight.
                if (!std::uncaught_exceptions())
                    throw;
            }
        }
    }

    /// Disables the execution of the deferred function.
    void disable() noexcept { m_active = false; }

    deferred(const deferred&) = delete;
    deferred& operator=(const deferred&) = delete;

private:
    Function m_fn;
    bool m_active = true;
};

} // namespace dedupstore::detail

#endif // DEDUPSTORE_DETAIL_DEFERRED_HPP
