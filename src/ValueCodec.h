// Copyright 2019 Sviatoslav Dmitriev
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt

#ifndef CONFORMANCE_VALUECODEC_H
#define CONFORMANCE_VALUECODEC_H


#include <cstdint>
#include <cstring>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include <endian.h>


//! Byte order of serialized variables
enum ByteOrder
{
    LittleEndian,               ///<Little endian byte order
    BigEndian,                  ///<Big endian byte order
#if BYTE_ORDER == BIG_ENDIAN
    Host = BigEndian,           ///<Host byte order for big endian systems
#else
    Host = LittleEndian,        ///<Host byte order for little endian systems
#endif
    Network = BigEndian
};

namespace Conformance
{
    //! Value can not be written, e.g. container is too large for the length type
    class SerializationError : public std::runtime_error
    {
    public:
        explicit SerializationError(const std::string &msg) : std::runtime_error(msg) {}
    };

    //! Value can not be read, e.g. not enough bytes left
    class DeserializationError : public std::runtime_error
    {
    public:
        explicit DeserializationError(const std::string &msg) : std::runtime_error(msg) {}
    };

namespace codecTraits
{
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wctor-dtor-privacy"

    template<class T>
    using plain_value = std::remove_cv_t<std::remove_reference_t<T>>;

    template<class T>
    std::add_lvalue_reference_t<T> ldeclval();

    template<class T, class = void>
    struct is_std_tuple : std::false_type
    {
    };

    template<class T>
    struct is_std_tuple<T, std::enable_if_t<std::is_class_v<T> && (std::tuple_size<T>::value > 0)>>
            : std::true_type
    {
    };

    template<class T>
    constexpr bool is_std_tuple_v = is_std_tuple<T>::value;

    template<class T, class = void>
    struct is_resizable : std::false_type
    {
    };

    template<class T>
    struct is_resizable<T, std::void_t<decltype(ldeclval<T>().resize(std::size(ldeclval<T>())))>>
            : std::true_type
    {
    };

    template<class T>
    constexpr bool is_resizable_v = is_resizable<T>::value;

    template<class T, class = void>
    struct is_insertable : std::false_type
    {
    };

    template<class T>
    struct is_insertable<T, std::void_t<decltype(ldeclval<T>().insert(ldeclval<T>().end(),
                                                                      *ldeclval<T>().begin()))>>
            : std::true_type
    {
    };

    template<class T>
    constexpr bool is_insertable_v = is_insertable<T>::value;

    template<class T, class = void>
    struct has_size : std::false_type
    {
    };

    template<class T>
    struct has_size<T, std::enable_if_t<std::is_integral_v<decltype(std::size(ldeclval<T>()))>>>
            : std::true_type
    {
    };

    template<class T>
    constexpr bool has_size_v = has_size<T>::value;

#pragma GCC diagnostic pop

    //! Element type that can be assigned while reading, e.g. std::pair<K, V> for std::map<K, V>
    template<class T>
    struct mutable_value
    {
        typedef plain_value<T> type;
    };

    template<class K, class V>
    struct mutable_value<std::pair<K, V>>
    {
        typedef std::pair<plain_value<K>, plain_value<V>> type;
    };

    template<class T>
    using mutable_value_t = typename mutable_value<T>::type;

    template<size_t size>
    struct unsigned_of_size
    {
    };

    template<>
    struct unsigned_of_size<1>
    {
        typedef uint8_t type;
    };

    template<>
    struct unsigned_of_size<2>
    {
        typedef uint16_t type;
    };

    template<>
    struct unsigned_of_size<4>
    {
        typedef uint32_t type;
    };

    template<>
    struct unsigned_of_size<8>
    {
        typedef uint64_t type;
    };
}

/*!
 * Trait driven encoding of plain values into a byte buffer
 * @note Used by byte channels, serializers under test only see channel read/write calls
 * @tparam order Serialization byte order
 * @tparam sizeT Type used to encode container lengths
 */
template<ByteOrder order = Network, class sizeT = uint32_t>
class ValueCodec
{
    static_assert(std::is_integral_v<sizeT> && std::is_unsigned_v<sizeT>, "Length type must be unsigned integral");

public:

    //! Type of values recognized by codec
    enum ValueType
    {
        Arithmetic,             ///<Type is arithmetic and will be simply converted to bytes (e.g. int)
        Enum,                   ///<Type is enum and will be written as its underlying type
        ArithmeticContiguous,   ///<Type stores arithmetic values contiguously, written as length and elements (e.g. std::string)
        Tuple,                  ///<Type is a tuple, each element will be written consequently (e.g. std::pair<int, int>)
        Iterable,               ///<Type is an iterable container, written as length and elements (e.g. std::list<std::string>)
        NonSerializable         ///<Type can not be serialized
    };

private:

    template<class T>
    using plain_value = codecTraits::plain_value<T>;

    template<class T, ByteOrder from, ByteOrder to>
    static plain_value<T> reorder(plain_value<T> val)
    {
        if constexpr(from != to && sizeof(plain_value<T>) > 1)
        {
            typedef typename codecTraits::unsigned_of_size<sizeof(plain_value<T>)>::type bits_t;
            bits_t bits;
            memcpy(&bits, &val, sizeof(bits));
            bits_t ret = 0;
            for (size_t i = 0; i < sizeof(bits); ++i)
            {
                ret = bits_t(ret << 8);
                ret |= bits & 0xFF;
                bits = bits_t(bits >> 8);
            }
            memcpy(&val, &ret, sizeof(ret));
        }
        return val;
    }

    static constexpr ValueType typePriority[] = {Arithmetic,
                                                 Enum,
                                                 ArithmeticContiguous,
                                                 Tuple,
                                                 Iterable,
                                                 NonSerializable};

    template<class T, ValueType tag, class = void>
    struct qualifies : public std::false_type
    {
    };

    template<class T, ValueType tag>
    static constexpr bool qualifies_v = qualifies<T, tag>::value;

    template<class T>
    struct qualifies<T, Arithmetic, std::enable_if_t<std::is_arithmetic_v<plain_value<T>> &&
                                                     (sizeof(plain_value<T>) <= 8)>>
            : public std::true_type
    {
    };

    template<class T>
    struct qualifies<T, Enum, std::enable_if_t<std::is_enum_v<plain_value<T>>>> : public std::true_type
    {
    };

    template<class T>
    struct qualifies<T, ArithmeticContiguous,
            std::enable_if_t<std::is_pointer_v<decltype(std::data(codecTraits::ldeclval<plain_value<T>>()))> &&
                             codecTraits::has_size_v<plain_value<T>> &&
                             std::is_arithmetic_v<std::remove_cv_t<std::remove_pointer_t<decltype(std::data(
                                     codecTraits::ldeclval<plain_value<T>>()))>>> &&
                             codecTraits::is_resizable_v<plain_value<T>>>>
            : public std::true_type
    {
    };

    template<class T>
    struct qualifies<T, Tuple, std::enable_if_t<codecTraits::is_std_tuple_v<plain_value<T>>>> : public std::true_type
    {
    };

    template<class T>
    struct qualifies<T, Iterable,
            std::enable_if_t<std::is_base_of_v<std::input_iterator_tag,
                    typename std::iterator_traits<decltype(std::begin(
                            codecTraits::ldeclval<plain_value<T>>()))>::iterator_category> &&
                             codecTraits::is_insertable_v<plain_value<T>> &&
                             codecTraits::has_size_v<plain_value<T>> &&
                             !std::is_same_v<std::vector<bool>, plain_value<T>>>>
            : public std::true_type
    {
    };

    template<class T>
    struct qualifies<T, NonSerializable> : public std::true_type
    {
    };

    template<class T, size_t i = 0>
    static constexpr ValueType priority_type()
    {
        if constexpr (qualifies_v<T, typePriority[i]>)
        {
            return typePriority[i];
        }
        else
        {
            return priority_type<T, i + 1>();
        }
    }

    template<class T>
    static constexpr size_t byte_minsize()
    {
        constexpr ValueType type = priority_type<T>();
        static_assert(type != NonSerializable, "Value must be serializable");
        if constexpr (type == Arithmetic)
        {
            return sizeof(plain_value<T>);
        }
        else if constexpr (type == Enum)
        {
            return sizeof(std::underlying_type_t<plain_value<T>>);
        }
        else if constexpr (type == Tuple)
        {
            return tuple_byte_minsize<plain_value<T>>();
        }
        else
        {
            return sizeof(sizeT);
        }
    }

    template<class T, size_t i = 0>
    static constexpr size_t tuple_byte_minsize()
    {
        typedef std::tuple_element_t<i, T> element_t;
        if constexpr (i + 1 == std::tuple_size_v<T>)
        {
            return byte_minsize<element_t>();
        }
        else
        {
            return byte_minsize<element_t>() + tuple_byte_minsize<T, i + 1>();
        }
    }

    static void append_length(std::vector<uint8_t> &out, size_t length)
    {
        if (length > std::numeric_limits<sizeT>::max())
        {
            throw SerializationError("Container is too large for the configured length type");
        }
        append_f(out, static_cast<sizeT>(length));
    }

    template<class T>
    static void append_f(std::vector<uint8_t> &out, const T &val)
    {
        constexpr ValueType type = priority_type<T>();
        static_assert(type != NonSerializable, "Value must be serializable");
        if constexpr (type == Arithmetic)
        {
            auto ordval = reorder<T, Host, order>(val);
            auto ptr = reinterpret_cast<const uint8_t *>(&ordval);
            out.insert(out.end(), ptr, ptr + sizeof(ordval));
        }
        else if constexpr (type == Enum)
        {
            append_f(out, static_cast<std::underlying_type_t<plain_value<T>>>(val));
        }
        else if constexpr (type == ArithmeticContiguous)
        {
            append_length(out, std::size(val));
            for (auto i = std::begin(val); i != std::end(val); ++i)
            {
                append_f(out, *i);
            }
        }
        else if constexpr (type == Tuple)
        {
            append_tuple(out, val);
        }
        else
        {
            append_length(out, std::size(val));
            for (auto &i : val)
            {
                append_f(out, i);
            }
        }
    }

    template<class T, size_t i = 0>
    static void append_tuple(std::vector<uint8_t> &out, const T &val)
    {
        append_f(out, std::get<i>(val));
        if constexpr (i + 1 < std::tuple_size_v<plain_value<T>>)
        {
            append_tuple<T, i + 1>(out, val);
        }
    }

    static void check_size(size_t &sizeLeft, size_t currentSize)
    {
        if (sizeLeft < currentSize)
        {
            throw DeserializationError("Provided serialized data size is too small");
        }
        sizeLeft -= currentSize;
    }

    static size_t take_length(const uint8_t *&ptr, size_t &restSize, size_t elementMinSize)
    {
        sizeT length;
        take_f(ptr, restSize, length);
        if (length * elementMinSize > restSize)
        {
            throw DeserializationError("Provided serialized data size is too small");
        }
        return length;
    }

    template<class T>
    static void take_f(const uint8_t *&ptr, size_t &restSize, T &val)
    {
        constexpr ValueType type = priority_type<T>();
        static_assert(type != NonSerializable, "Value must be serializable");
        if constexpr (type == Arithmetic)
        {
            plain_value<T> nval;
            check_size(restSize, sizeof(nval));
            memcpy(&nval, ptr, sizeof(nval));
            ptr += sizeof(nval);
            val = reorder<T, order, Host>(nval);
        }
        else if constexpr (type == Enum)
        {
            std::underlying_type_t<plain_value<T>> raw;
            take_f(ptr, restSize, raw);
            val = static_cast<plain_value<T>>(raw);
        }
        else if constexpr (type == ArithmeticContiguous)
        {
            typedef std::remove_cv_t<std::remove_pointer_t<decltype(std::data(val))>> element_t;
            auto length = take_length(ptr, restSize, sizeof(element_t));
            val.resize(length);
            for (auto &i : val)
            {
                take_f(ptr, restSize, i);
            }
        }
        else if constexpr (type == Tuple)
        {
            take_tuple(ptr, restSize, val);
        }
        else
        {
            typedef codecTraits::mutable_value_t<typename T::value_type> element_t;
            auto length = take_length(ptr, restSize, byte_minsize<element_t>());
            val.clear();
            for (size_t i = 0; i < length; ++i)
            {
                element_t el{};
                take_f(ptr, restSize, el);
                val.insert(val.end(), std::move(el));
            }
        }
    }

    template<class T, size_t i = 0>
    static void take_tuple(const uint8_t *&ptr, size_t &restSize, T &val)
    {
        take_f(ptr, restSize, std::get<i>(val));
        if constexpr (i + 1 < std::tuple_size_v<plain_value<T>>)
        {
            take_tuple<T, i + 1>(ptr, restSize, val);
        }
    }

public:

    /*!
     * Get codec type of a type
     * @tparam T Type to get type of
     */
    template<class T>
    static constexpr ValueType priorityType = priority_type<T>();

    /*!
     * Smallest amount of bytes a value of the type can be encoded into
     * @tparam T Serializable value type
     */
    template<class T>
    static constexpr size_t minByteSize = byte_minsize<T>();

    /*!
     * Append encoded value to the end of a buffer
     * @tparam T Serializable value type
     * @param out Buffer to append to
     * @param val Value to encode
     * @throws SerializationError if a container length does not fit sizeT
     */
    template<class T>
    static void append(std::vector<uint8_t> &out, const T &val)
    {
        append_f(out, val);
    }

    /*!
     * Decode value from provided memory chunk
     * @tparam T Serializable value type
     * @param ptr Pointer to provided memory chunk, advanced past the consumed bytes
     * @param restSize Size of provided memory chunk, decreased by the amount of consumed bytes
     * @param val Decoded value will be stored here
     * @throws DeserializationError if provided memory chunk is too small
     */
    template<class T>
    static void take(const uint8_t *&ptr, size_t &restSize, T &val)
    {
        take_f(ptr, restSize, val);
    }

    /*!
     * Get byte size of a value after encoding
     * @tparam T Serializable value type
     * @param val Value to measure size of
     */
    template<class T>
    static size_t byteSize(const T &val)
    {
        std::vector<uint8_t> out;
        append_f(out, val);
        return out.size();
    }
};

}

#endif //CONFORMANCE_VALUECODEC_H
