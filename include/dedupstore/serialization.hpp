#ifndef DEDUPSTORE_SERIALIZATION_HPP
#define DEDUPSTORE_SERIALIZATION_HPP

#include <dedupstore/assert.hpp>
#include <dedupstore/defs.hpp>
#include <dedupstore/exception.hpp>

#include <boost/endian/conversion.hpp>

#include <array>
#include <cstring>
#include <tuple>
#include <type_traits>

namespace dedupstore {

/// \defgroup serialization Binary serialization
///
/// Every record and key that is written to the store has a fixed size binary
/// representation. Integers are stored in big endian format so that the lexicographic
/// order of serialized keys is the same as the numeric order of the values.
///
/// Record types describe their layout by implementing a static `get_binary_format()`
/// function that lists the serialized members:
///
/// \code{.cpp}
///     struct block_header {
///         fingerprint hash;
///         u64 refcount = 0;
///
///         static constexpr auto get_binary_format() {
///             return binary_format(&block_header::hash, &block_header::refcount);
///         }
///     };
/// \endcode
///
/// Members are serialized in the order in which they are listed. Changing the format
/// of a record type breaks compatibility with existing store files.
/// @{

/// Describes the serialized members of a type as a list of member data pointers.
template<typename T, typename... V>
class binary_format {
public:
    constexpr binary_format(V T::*... fields)
        : m_fields(fields...) {}

    /// Returns the description of the class' fields, as a tuple of member data pointers.
    constexpr const std::tuple<V T::*...>& fields() const { return m_fields; }

private:
    std::tuple<V T::*...> m_fields;
};

template<typename T, typename... V>
binary_format(V T::*... members)->binary_format<T, V...>;

namespace detail {

template<typename T>
struct serializer;

template<typename T, typename = void>
struct has_binary_format : std::false_type {};

template<typename T>
struct has_binary_format<T, std::void_t<decltype(T::get_binary_format())>> : std::true_type {};

template<typename T>
struct big_endian_serializer {
    static constexpr size_t size = sizeof(T);

    static void serialize(T v, byte* b) {
        boost::endian::native_to_big_inplace(v);
        std::memcpy(b, &v, sizeof(T));
    }

    static void deserialize(T& v, const byte* b) {
        std::memcpy(&v, b, sizeof(T));
        boost::endian::big_to_native_inplace(v);
    }
};

template<>
struct serializer<u8> {
    static constexpr size_t size = 1;

    static void serialize(u8 v, byte* b) { b[0] = v; }
    static void deserialize(u8& v, const byte* b) { v = b[0]; }
};

template<>
struct serializer<u16> : big_endian_serializer<u16> {};
template<>
struct serializer<u32> : big_endian_serializer<u32> {};
template<>
struct serializer<u64> : big_endian_serializer<u64> {};

template<>
struct serializer<bool> {
    static constexpr size_t size = 1;

    static void serialize(bool v, byte* b) { b[0] = v ? 1 : 0; }
    static void deserialize(bool& v, const byte* b) { v = b[0] != 0; }
};

// Arrays of raw bytes (digests, magic strings) are copied as they are.
template<size_t N>
struct serializer<std::array<byte, N>> {
    static constexpr size_t size = N;

    static void serialize(const std::array<byte, N>& v, byte* b) { std::memcpy(b, v.data(), N); }
    static void deserialize(std::array<byte, N>& v, const byte* b) { std::memcpy(v.data(), b, N); }
};

template<typename T, typename U, typename V>
constexpr size_t member_size(V U::*) {
    return serializer<V>::size;
}

// Serializes all members listed by T::get_binary_format(), in order.
template<typename T>
struct record_serializer {
    static constexpr auto format = T::get_binary_format();

    static constexpr size_t compute_size() {
        return std::apply([](auto... fields) { return (size_t(0) + ... + member_size<T>(fields)); },
                          format.fields());
    }

    static constexpr size_t size = compute_size();

    static void serialize(const T& v, byte* b) {
        std::apply(
            [&](auto... fields) {
                ((serializer<std::decay_t<decltype(v.*fields)>>::serialize(v.*fields, b),
                  b += member_size<T>(fields)),
                 ...);
            },
            format.fields());
    }

    static void deserialize(T& v, const byte* b) {
        std::apply(
            [&](auto... fields) {
                ((serializer<std::decay_t<decltype(v.*fields)>>::deserialize(v.*fields, b),
                  b += member_size<T>(fields)),
                 ...);
            },
            format.fields());
    }
};

template<typename T>
struct serializer : record_serializer<T> {
    static_assert(has_binary_format<T>::value,
                  "The type cannot be serialized: it must implement get_binary_format().");
};

} // namespace detail

/// Returns the size of the serialized representation of T, in bytes.
template<typename T>
constexpr size_t serialized_size() {
    return detail::serializer<std::remove_cv_t<T>>::size;
}

/// Returns the size of the serialized representation of `v`, in bytes.
template<typename T>
constexpr size_t serialized_size(const T&) {
    return serialized_size<T>();
}

/// Serializes `v` into the buffer, which must be at least `serialized_size<T>()` bytes large.
template<typename T>
void serialize(const T& v, byte* buffer) {
    detail::serializer<T>::serialize(v, buffer);
}

/// Deserializes an instance of `T` from the buffer.
template<typename T>
T deserialize(const byte* buffer) {
    T value{};
    detail::serializer<T>::deserialize(value, buffer);
    return value;
}

/// A stack allocated buffer large enough to hold the serialized representation
/// of values of type T.
template<typename T>
using serialized_buffer = std::array<byte, serialized_size<T>()>;

/// Serializes `v` into a stack-allocated buffer.
template<typename T>
serialized_buffer<T> serialize_to_buffer(const T& v) {
    serialized_buffer<T> buffer;
    serialize(v, buffer.data());
    return buffer;
}

/// Serializes all values into a single byte string, one after another.
/// Used to build composite store keys such as `(block id, lba)`.
template<typename... T>
bytes serialize_to_bytes(const T&... values) {
    bytes result((size_t(0) + ... + serialized_size<T>()));
    byte* out = result.data();
    ((serialize(values, out), out += serialized_size<T>()), ...);
    return result;
}

/// Deserializes an instance of `T` from `data` starting at `offset`.
/// Throws a \ref corruption_error if the byte string is too short.
template<typename T>
T deserialize_at(const bytes& data, size_t offset = 0) {
    if (offset > data.size() || data.size() - offset < serialized_size<T>()) {
        DEDUPSTORE_THROW(corruption_error(
            fmt::format("Serialized value is truncated (need {} bytes at offset {}, have {}).",
                        serialized_size<T>(), offset, data.size())));
    }
    return deserialize<T>(data.data() + offset);
}

/// @}

} // namespace dedupstore

#endif // DEDUPSTORE_SERIALIZATION_HPP
