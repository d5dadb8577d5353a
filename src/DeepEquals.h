// Copyright 2019 Sviatoslav Dmitriev
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt

#ifndef CONFORMANCE_DEEPEQUALS_H
#define CONFORMANCE_DEEPEQUALS_H


#include "ConformanceErrors.h"

#include <fmt/format.h>

#include <cmath>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <utility>
#include <vector>

namespace Conformance
{
namespace valueTraits
{
    template<class T>
    using plain_value = std::remove_cv_t<std::remove_reference_t<T>>;

    template<class T>
    struct is_optional : std::false_type {};

    template<class T>
    struct is_optional<std::optional<T>> : std::true_type {};

    template<class T>
    constexpr bool is_optional_v = is_optional<plain_value<T>>::value;

    template<class T>
    struct is_smart_pointer : std::false_type {};

    template<class T, class D>
    struct is_smart_pointer<std::unique_ptr<T, D>> : std::true_type {};

    template<class T>
    struct is_smart_pointer<std::shared_ptr<T>> : std::true_type {};

    //! Raw or smart pointer to a single object, character pointers are treated as strings
    template<class T>
    constexpr bool is_pointer_like_v =
            (std::is_pointer_v<plain_value<T>> &&
             !std::is_same_v<std::remove_cv_t<std::remove_pointer_t<plain_value<T>>>, char>) ||
            is_smart_pointer<plain_value<T>>::value;

    template<class T>
    constexpr bool is_string_like_v = std::is_convertible_v<const plain_value<T> &, std::string_view>;

    template<class T, class = void>
    struct is_tuple_like : std::false_type {};

    template<class T>
    struct is_tuple_like<T, std::enable_if_t<(std::tuple_size<T>::value > 0)>> : std::true_type {};

    template<class T>
    constexpr bool is_tuple_like_v = is_tuple_like<plain_value<T>>::value;

    template<class T, class = void>
    struct is_iterable : std::false_type {};

    template<class T>
    struct is_iterable<T, std::void_t<decltype(std::begin(std::declval<const T &>()) !=
                                               std::end(std::declval<const T &>()))>> : std::true_type {};

    template<class T>
    constexpr bool is_iterable_v = is_iterable<plain_value<T>>::value;

    template<class T, class = void>
    struct has_equal_operator : std::false_type {};

    template<class T>
    struct is_pair : std::false_type {};

    template<class A, class B>
    struct is_pair<std::pair<A, B>> : std::true_type {};

    template<class T>
    struct has_equal_operator<T, std::enable_if_t<!is_pair<T>::value && std::is_convertible_v<
            decltype(std::declval<const T &>() == std::declval<const T &>()), bool>>> : std::true_type {};

    // std::pair::operator== is unconstrained, so look at the members
    template<class A, class B>
    struct has_equal_operator<std::pair<A, B>> : std::bool_constant<
            has_equal_operator<std::remove_cv_t<A>>::value && has_equal_operator<std::remove_cv_t<B>>::value> {};

    template<class T>
    constexpr bool has_equal_operator_v = has_equal_operator<plain_value<T>>::value;

    //! Hashed container, iteration order is meaningless
    template<class T, class = void>
    struct is_unordered : std::false_type {};

    template<class T>
    struct is_unordered<T, std::void_t<typename T::hasher>> : std::true_type {};

    template<class T>
    constexpr bool is_unordered_v = is_unordered<plain_value<T>>::value;

    template<class T, class = void>
    struct has_ostream_operator : std::false_type {};

    template<class T>
    struct has_ostream_operator<T, std::void_t<decltype(std::declval<std::ostream &>() << std::declval<const T &>())>>
            : std::true_type {};

    template<class T>
    constexpr bool has_ostream_operator_v = has_ostream_operator<plain_value<T>>::value;

    //! Value is an empty optional or a null pointer
    template<class T>
    bool isNullValue(const T &value)
    {
        if constexpr (is_optional_v<T>)
        {
            return !value.has_value();
        }
        else if constexpr (is_pointer_like_v<T>)
        {
            return value == nullptr;
        }
        else
        {
            return false;
        }
    }

    //! Dynamic type of a value, pointee type for pointers
    template<class T>
    std::type_index runtimeTypeIndex(const T &value)
    {
        if constexpr (is_pointer_like_v<T>)
        {
            typedef std::remove_reference_t<decltype(*value)> pointee_t;
            if constexpr (std::is_polymorphic_v<pointee_t>)
            {
                if (value != nullptr)
                {
                    return typeid(*value);
                }
            }
            return typeid(pointee_t);
        }
        else
        {
            return typeid(T);
        }
    }

    //! Declared type matching runtimeTypeIndex for values of T
    template<class T>
    std::type_index declaredTypeIndex()
    {
        if constexpr (is_pointer_like_v<T>)
        {
            return typeid(std::remove_reference_t<decltype(*std::declval<const T &>())>);
        }
        else
        {
            return typeid(T);
        }
    }
}

    /*!
     * Human readable representation of a value
     * @note Uses fmt when the value is formattable, operator<< otherwise
     */
    template<class T>
    std::string describe(const T &value)
    {
        using namespace valueTraits;
        if constexpr (is_optional_v<T> || is_pointer_like_v<T>)
        {
            return value ? describe(*value) : std::string("null");
        }
        else if constexpr (std::is_enum_v<T>)
        {
            return fmt::format("{}", static_cast<std::underlying_type_t<T>>(value));
        }
        else if constexpr (is_string_like_v<T>)
        {
            return fmt::format("\"{}\"", std::string_view(value));
        }
        else if constexpr (fmt::is_formattable<T>::value)
        {
            return fmt::format("{}", value);
        }
        else if constexpr (has_ostream_operator_v<T>)
        {
            std::ostringstream stream;
            stream << value;
            return stream.str();
        }
        else if constexpr (is_tuple_like_v<T>)
        {
            std::string text;
            std::apply([&text](const auto &... element)
                       {
                           ((text += (text.empty() ? "" : ", ") + describe(element)), ...);
                       }, value);
            return "(" + text + ")";
        }
        else if constexpr (is_iterable_v<T>)
        {
            std::string text;
            for (const auto &element : value)
            {
                if (!text.empty())
                {
                    text += ", ";
                }
                text += describe(element);
            }
            return "[" + text + "]";
        }
        else
        {
            return fmt::format("<{} at {}>", typeid(T).name(), fmt::ptr(&value));
        }
    }

    /*!
     * Structural equality with per type overrides
     *
     * Comparators are looked up by exact type, for polymorphic pointees by dynamic type.
     * Without a comparator values are compared as pointers, optionals, floating point numbers,
     * tuples and containers recursively and with operator== at the leaves.
     * Hashed containers are compared regardless of iteration order.
     */
    class DeepEqualsChecker
    {
    public:
        typedef std::function<bool(const void *, const void *)> ErasedComparator;

        /*!
         * Compare values of type U with a custom function
         * @note Replaces previously registered comparator for the same type
         */
        template<class U>
        DeepEqualsChecker &registerComparator(std::function<bool(const U &, const U &)> comparator)
        {
            comparators[std::type_index(typeid(U))] = [comparator](const void *expected, const void *actual)
            {
                return comparator(*static_cast<const U *>(expected), *static_cast<const U *>(actual));
            };
            return *this;
        }

        template<class U>
        bool hasComparator() const
        {
            return comparators.count(std::type_index(typeid(U))) > 0;
        }

        /*!
         * Deeply compare two values
         * @throws FixtureError if neither a comparator nor a structural rule applies to some nested type
         */
        template<class T>
        bool equals(const T &expected, const T &actual) const
        {
            using namespace valueTraits;
            auto comparator = comparators.find(std::type_index(typeid(T)));
            if (comparator != comparators.end())
            {
                return comparator->second(&expected, &actual);
            }
            if constexpr (is_pointer_like_v<T>)
            {
                if (expected == nullptr || actual == nullptr)
                {
                    return expected == nullptr && actual == nullptr;
                }
                return pointeeEquals(*expected, *actual);
            }
            else if constexpr (is_optional_v<T>)
            {
                if (!expected.has_value() || !actual.has_value())
                {
                    return expected.has_value() == actual.has_value();
                }
                return equals(*expected, *actual);
            }
            else if constexpr (std::is_floating_point_v<T>)
            {
                return (std::isnan(expected) && std::isnan(actual)) || expected == actual;
            }
            else if constexpr (is_string_like_v<T>)
            {
                return std::string_view(expected) == std::string_view(actual);
            }
            else if constexpr (is_tuple_like_v<T>)
            {
                return tupleEquals(expected, actual, std::make_index_sequence<std::tuple_size_v<T>>());
            }
            else if constexpr (is_unordered_v<T>)
            {
                return unorderedEquals(expected, actual);
            }
            else if constexpr (is_iterable_v<T>)
            {
                auto i = std::begin(expected);
                auto j = std::begin(actual);
                for (; i != std::end(expected) && j != std::end(actual); ++i, ++j)
                {
                    if (!equals(*i, *j))
                    {
                        return false;
                    }
                }
                return i == std::end(expected) && j == std::end(actual);
            }
            else if constexpr (has_equal_operator_v<T>)
            {
                return expected == actual;
            }
            else
            {
                throw FixtureError("deep equality", fmt::format("No comparator registered for type {}",
                                                                typeid(T).name()));
            }
        }

    private:
        template<class P>
        bool pointeeEquals(const P &expected, const P &actual) const
        {
            if constexpr (std::is_polymorphic_v<P>)
            {
                if (typeid(expected) != typeid(actual))
                {
                    return false;
                }
                auto comparator = comparators.find(std::type_index(typeid(expected)));
                if (comparator != comparators.end())
                {
                    return comparator->second(dynamic_cast<const void *>(&expected),
                                              dynamic_cast<const void *>(&actual));
                }
            }
            return equals(expected, actual);
        }

        //! Every expected element matches a distinct actual element
        template<class T>
        bool unorderedEquals(const T &expected, const T &actual) const
        {
            if (expected.size() != actual.size())
            {
                return false;
            }
            if constexpr (valueTraits::has_equal_operator_v<typename T::value_type>)
            {
                // operator== of the elements would bypass registered comparators
                if (comparators.empty())
                {
                    return expected == actual;
                }
            }
            std::vector<bool> matched(actual.size(), false);
            for (const auto &element : expected)
            {
                bool found = false;
                size_t index = 0;
                for (auto candidate = actual.begin(); candidate != actual.end(); ++candidate, ++index)
                {
                    if (!matched[index] && equals(element, *candidate))
                    {
                        matched[index] = true;
                        found = true;
                        break;
                    }
                }
                if (!found)
                {
                    return false;
                }
            }
            return true;
        }

        template<class T, size_t ... i>
        bool tupleEquals(const T &expected, const T &actual, std::index_sequence<i...>) const
        {
            return (equals(std::get<i>(expected), std::get<i>(actual)) && ...);
        }

        std::unordered_map<std::type_index, ErasedComparator> comparators;
    };
}

#endif //CONFORMANCE_DEEPEQUALS_H
