/**
* \file buffer.hpp
* \author DashLink developers
* \brief shared byte buffer carrying payloads and fragments
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
#include "dash.hpp"
#include <atomic>
#include <string>
#include <type_traits>
#include <vector>

namespace dash
{

/// The buffer is allocated once and shared by reference count. Copies and slices point at the same memory, so
/// one outbound payload can be cut into fragments without copying the body.
class buffer_t
{
  public:
    /// a control block used by buffer
    struct buffer_header_t
    {
        /// shared reference count
        std::atomic_int ref_count;
    };

  private:
    byte *ptr;
    buffer_header_t *header;
    u64 buffer_size;
    u64 valid_data_length;
    u64 walk_offset;

    void release();

  public:
    struct except_buffer_helper_t
    {
        buffer_t *buf;
        explicit except_buffer_helper_t(buffer_t *buf)
            : buf(buf)
        {
        }

        except_buffer_helper_t length(u64 len);
        except_buffer_helper_t origin_length();

        buffer_t &operator()() const { return *buf; }
    };

    /// init buffer with nothing, the pointer will not be initialized.
    buffer_t();
    /// allocate 'len' bytes, all of them valid and zeroed
    buffer_t(u64 len);
    /// copy 'len' bytes from 'data'
    buffer_t(const byte *data, u64 len);

    buffer_t(const buffer_t &);
    buffer_t &operator=(const buffer_t &);

    // move operation
    buffer_t(buffer_t &&buf) noexcept;
    buffer_t &operator=(buffer_t &&buf) noexcept;

    ~buffer_t();

    static buffer_t from_string(const std::string &str);
    static buffer_t from_vector(const std::vector<u8> &vec);

    template <typename T> static buffer_t from_struct(const T &val)
    {
        static_assert(std::is_pod_v<T>);
        return buffer_t((const byte *)&val, sizeof(T));
    }

    byte *get_base_ptr() const { return ptr; }

    /// get pointer at current offset
    byte *get() const { return ptr + walk_offset; }

    /// get origin data length
    u64 get_data_length() const { return valid_data_length; }

    /// get origin buffer length
    u64 get_buffer_origin_length() const { return buffer_size; }

    /// get data length start at the current offset
    u64 get_length() const { return valid_data_length - walk_offset; }

    u64 get_walk_offset() const { return walk_offset; }

    bool empty() const { return get_length() == 0; }

    /// except size to read/write
    except_buffer_helper_t expect() { return except_buffer_helper_t(this); }

    /// walk in buffer
    void walk_step(u64 delta)
    {
        walk_offset += delta;
        if (walk_offset > valid_data_length)
            walk_offset = valid_data_length;
    }

    /// shared view of [offset, offset + len) relative to the current offset, clamped to the valid data
    buffer_t slice(u64 offset, u64 len) const;

    long write_string(const std::string &str);
    std::string to_string() const;
    std::vector<u8> to_vector() const;

    /// memzero to buffer
    void clear();
};

} // namespace dash
