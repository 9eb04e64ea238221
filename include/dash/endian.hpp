/**
* \file endian.hpp
* \author DashLink developers
* \brief Wire byte order conversion for packed header structs.
* The artwork channel is little endian. Use
* \code {.cpp}
*   using member_list_t = serialization::typelist_t<u32, u16, ...>;
* \endcode
* to declare the member layout of a struct so 'cast' can convert it field by field.
* \version 0.1
* \date 2026-10-19
*
* @copyright Copyright (c) 2026.
This file is part of DashLink.

DashLink is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License as
published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.

DashLink is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty
of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU General Public License for more details.

You should have received a copy of the GNU General Public License
along with DashLink. If not, see <http: //www.gnu.org/licenses/>.
*
*/
#pragma once
#include "buffer.hpp"
#include "dash.hpp"
#include <cstring>
#include <type_traits>

namespace dash::serialization
{
template <typename... Args> struct typelist_t;

/// the type list save members in struct.
template <typename Head> struct typelist_t<Head>
{
    constexpr static bool has_next = false;
    using Type = Head;
};

// Variadic specialization
template <typename Head, typename... Args> struct typelist_t<Head, Args...>
{
    constexpr static bool has_next = true;
    /// next typelist
    using Next = typelist_t<Args...>;
    using Type = Head;
};

} // namespace dash::serialization

namespace dash::endian
{

///\note GNU extension
constexpr inline bool little_endian()
{
#ifndef __GNUC__
    return true;
#else
    return __BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__;
#endif
}

inline u16 swap16(u16 v) { return ((v & 0xFF) << 8) | ((v >> 8) & 0xFF); }

inline u32 swap32(u32 v)
{
    return ((v & 0xFF) << 24) | (((v >> 8) & 0xFF) << 16) | (((v >> 16) & 0xFF) << 8) | ((v >> 24) & 0xFF);
}

template <typename T> void cast_struct(T &val);

template <typename T, size_t N> void cast_array(T (&val)[N]);

/// cast struct between host order and wire order (little endian).
/// do nothing at little endian architecture.
template <typename T> inline void cast(T &val)
{
    if constexpr (!little_endian())
    {
        if constexpr (std::is_array_v<T>)
        {
            cast_array(val);
        }
        else
        {
            cast_struct(val);
        }
    }
}

/// not cast needed
template <> inline void cast(i8 &val) {}
template <> inline void cast(u8 &val) {}

template <> inline void cast(u16 &val)
{
    if constexpr (!little_endian())
        val = swap16(val);
}

template <> inline void cast(i16 &val) { cast(*(u16 *)&val); }

template <> inline void cast(u32 &val)
{
    if constexpr (!little_endian())
        val = swap32(val);
}

template <> inline void cast(i32 &val) { cast(*(u32 *)&val); }

/// specialization of arrays
template <typename T, size_t N> inline void cast_array(T (&val)[N])
{
    for (size_t i = 0; i < N; i++)
    {
        cast(val[i]);
    }
}

template <typename T, typename Typelist> inline void cast_struct_impl(void *val)
{
    cast<typename Typelist::Type>(*(typename Typelist::Type *)val);
    if constexpr (Typelist::has_next)
    {
        cast_struct_impl<T, typename Typelist::Next>(((char *)val) + sizeof(typename Typelist::Type));
    }
}

template <typename T> inline void cast_struct(T &val)
{
    static_assert(std::is_pod_v<T> && !std::is_union_v<T>, "struct should be a POD type.");
    using Typelist = typename T::member_list_t;
    cast<typename Typelist::Type>(*(typename Typelist::Type *)&val);

    if constexpr (Typelist::has_next)
    {
        cast_struct_impl<T, typename Typelist::Next>(((char *)&val) + sizeof(typename Typelist::Type));
    }
}

/// get struct from buffer
///\param buffer the source data
///\param val the target struct to save data after cast
template <typename T> inline bool cast_to(const buffer_t &buffer, T &val)
{
    if (buffer.get_length() < sizeof(val))
        return false;
    memcpy(&val, buffer.get(), sizeof(val));
    cast<T>(val);
    return true;
}

/// save struct to buffer
///\param val the source struct
///\param buffer the target buffer to save
///\note the original struct is not modified
template <typename T> inline bool save_to(const T &val, buffer_t &buffer)
{
    if (buffer.get_length() < sizeof(val))
        return false;
    T tmp = val;
    cast<T>(tmp);
    memcpy(buffer.get(), &tmp, sizeof(tmp));
    return true;
}

/// big endian u16 as the media channel list prefix uses
inline void put_big_u16(u16 val, byte *ptr)
{
    ptr[0] = (val >> 8) & 0xFF;
    ptr[1] = val & 0xFF;
}

inline u16 get_big_u16(const byte *ptr) { return ((u16)ptr[0] << 8) | ptr[1]; }

} // namespace dash::endian
