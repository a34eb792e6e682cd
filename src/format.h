// Copyright 2019 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "errol.h"
#include "format_digits.h"

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <iterator>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>

namespace errol {

//==================================================================================================
// Print(out, value)
//
// Appends a textual representation of value to out. The representation is selected from the
// static type of value:
//
//  - nullptr                       null
//  - bool                          true, false
//  - enumerations                  the member name from EnumTraits, or the underlying value
//  - char, char*, strings          verbatim
//  - ranges                        [e1, e2, e3]
//  - T with T::Stringify()         the result of Stringify(), or null for a null T*
//  - unions                        the name from RecordTraits
//  - records                       Name(field1, field2) using RecordTraits
//  - floating-point                Dtoa with the default precision
//  - other pointers                0x1f2e3d
//  - integers                      decimal
//
// Any other type is a compile-time error.
//
// out may be any string type providing append(const char*, size_t) and push_back(char),
// e.g. a std::basic_string with a custom allocator.
//==================================================================================================

template <typename E>
struct EnumMember
{
    E value;
    const char* name;
};

// Specialize for each enumeration to be printed:
//
//  template <>
//  struct EnumTraits<Color> {
//      static constexpr EnumMember<Color> members[] = {{Color::red, "red"}, {Color::green, "green"}};
//  };
template <typename E>
struct EnumTraits;

// Specialize for each record or union to be printed:
//
//  template <>
//  struct RecordTraits<Point> {
//      static constexpr const char* name = "Point";
//      static constexpr auto fields = std::make_tuple(&Point::x, &Point::y);
//  };
//
// Unions only need a name.
template <typename T>
struct RecordTraits;

namespace impl {

template <typename T>
struct AlwaysFalse : std::false_type {};

template <typename T, typename = void>
struct HasEnumTraits : std::false_type {};

template <typename T>
struct HasEnumTraits<T, std::void_t<decltype(EnumTraits<T>::members)>> : std::true_type {};

template <typename T, typename = void>
struct HasRecordName : std::false_type {};

template <typename T>
struct HasRecordName<T, std::void_t<decltype(RecordTraits<T>::name)>> : std::true_type {};

template <typename T, typename = void>
struct HasRecordFields : std::false_type {};

template <typename T>
struct HasRecordFields<T, std::void_t<decltype(RecordTraits<T>::fields)>> : std::true_type {};

template <typename T, typename = void>
struct HasStringify : std::false_type {};

template <typename T>
struct HasStringify<T, std::void_t<decltype(std::declval<const T&>().Stringify())>> : std::true_type {};

template <typename T, typename = void>
struct IsRange : std::false_type {};

template <typename T>
struct IsRange<T, std::void_t<decltype(std::begin(std::declval<const T&>())),
                              decltype(std::end(std::declval<const T&>()))>> : std::true_type {};

template <typename T>
using RangeElement = std::decay_t<decltype(*std::begin(std::declval<const T&>()))>;

template <typename T, typename = void>
struct IsCharRange : std::false_type {};

template <typename T>
struct IsCharRange<T, std::enable_if_t<IsRange<T>::value>> : std::is_same<RangeElement<T>, char> {};

template <typename T>
constexpr bool IsCharPointer = std::is_pointer<T>::value && std::is_same<std::remove_cv_t<std::remove_pointer_t<T>>, char>::value;

template <typename T>
constexpr bool IsCharArray = std::is_array<T>::value && std::is_same<std::remove_cv_t<std::remove_extent_t<T>>, char>::value;

template <typename T>
constexpr bool IsStringifyPointer = std::is_pointer<T>::value && HasStringify<std::remove_cv_t<std::remove_pointer_t<T>>>::value;

template <typename String>
inline void AppendChars(String& out, const char* first, const char* last)
{
    out.append(first, static_cast<size_t>(last - first));
}

template <typename String>
inline void PrintAddress(String& out, uintptr_t address)
{
    static constexpr char HexDigits[] = "0123456789abcdef";

    char buffer[2 + 2 * sizeof(uintptr_t)];
    char* const last = buffer + sizeof(buffer);
    char* first = last;
    do
    {
        *--first = HexDigits[address & 0xF];
        address >>= 4;
    }
    while (address != 0);
    *--first = 'x';
    *--first = '0';

    AppendChars(out, first, last);
}

} // namespace impl

template <typename String, typename T>
void Print(String& out, const T& value);

namespace impl {

template <typename String, typename E>
inline void PrintEnum(String& out, E value)
{
    for (const auto& member : EnumTraits<E>::members)
    {
        if (member.value == value)
        {
            out.append(member.name, std::strlen(member.name));
            return;
        }
    }

    char buffer[IntegerMinBufferLength];
    AppendChars(out, buffer, IntegerToChars(buffer, static_cast<std::underlying_type_t<E>>(value)));
}

template <typename String, typename Range>
inline void PrintRange(String& out, const Range& range)
{
    out.push_back('[');

    bool first = true;
    for (const auto& element : range)
    {
        if (!first)
            out.append(", ", 2);
        first = false;
        Print(out, element);
    }

    out.push_back(']');
}

template <typename String, typename T>
inline void PrintRecord(String& out, const T& value)
{
    const char* const name = RecordTraits<T>::name;
    out.append(name, std::strlen(name));
    out.push_back('(');

    bool first = true;
    const auto print_field = [&](auto member) {
        if (!first)
            out.append(", ", 2);
        first = false;
        Print(out, value.*member);
    };
    std::apply([&](auto... members) { (print_field(members), ...); }, RecordTraits<T>::fields);

    out.push_back(')');
}

} // namespace impl

template <typename String, typename T>
void Print(String& out, const T& value)
{
    if constexpr (std::is_same<T, std::nullptr_t>::value)
    {
        out.append("null", 4);
    }
    else if constexpr (std::is_same<T, bool>::value)
    {
        if (value)
            out.append("true", 4);
        else
            out.append("false", 5);
    }
    else if constexpr (std::is_enum<T>::value)
    {
        static_assert(impl::HasEnumTraits<T>::value, "EnumTraits<E> must be specialized to print an enumeration");
        impl::PrintEnum(out, value);
    }
    else if constexpr (std::is_same<T, char>::value)
    {
        out.push_back(value);
    }
    else if constexpr (impl::IsCharPointer<T>)
    {
        if (value != nullptr)
            out.append(value, std::strlen(value));
    }
    else if constexpr (impl::IsCharArray<T>)
    {
        // Up to the terminating null character, if any.
        const size_t size = std::extent<T>::value;
        size_t length = 0;
        while (length < size && value[length] != '\0')
            ++length;
        out.append(value, length);
    }
    else if constexpr (impl::IsCharRange<T>::value)
    {
        for (const char c : value)
            out.push_back(c);
    }
    else if constexpr (impl::IsRange<T>::value)
    {
        impl::PrintRange(out, value);
    }
    else if constexpr (impl::HasStringify<T>::value)
    {
        Print(out, value.Stringify());
    }
    else if constexpr (impl::IsStringifyPointer<T>)
    {
        if (value == nullptr)
            out.append("null", 4);
        else
            Print(out, value->Stringify());
    }
    else if constexpr (std::is_union<T>::value)
    {
        static_assert(impl::HasRecordName<T>::value, "RecordTraits<U> must be specialized to print a union");
        const char* const name = RecordTraits<T>::name;
        out.append(name, std::strlen(name));
    }
    else if constexpr (impl::HasRecordName<T>::value)
    {
        static_assert(impl::HasRecordFields<T>::value, "RecordTraits<T> must list the fields of a record");
        impl::PrintRecord(out, value);
    }
    else if constexpr (std::is_floating_point<T>::value)
    {
        char buffer[DtoaMinBufferLength];
        impl::AppendChars(out, buffer, Dtoa(buffer, static_cast<double>(value)));
    }
    else if constexpr (std::is_pointer<T>::value)
    {
        impl::PrintAddress(out, reinterpret_cast<uintptr_t>(value));
    }
    else if constexpr (std::is_integral<T>::value)
    {
        char buffer[IntegerMinBufferLength];
        impl::AppendChars(out, buffer, IntegerToChars(buffer, value));
    }
    else
    {
        static_assert(impl::AlwaysFalse<T>::value, "type cannot be printed");
    }
}

template <typename T>
std::string ToString(const T& value)
{
    std::string out;
    Print(out, value);
    return out;
}

} // namespace errol
