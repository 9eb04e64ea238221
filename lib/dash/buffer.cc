#include "dash/buffer.hpp"
#include <string.h>

namespace dash
{
buffer_t::except_buffer_helper_t buffer_t::except_buffer_helper_t::length(u64 len)
{
    if (len > buf->buffer_size)
        throw dash_param_exception("buffer length overflow");
    buf->valid_data_length = len;
    buf->walk_offset = 0;
    return *this;
}

buffer_t::except_buffer_helper_t buffer_t::except_buffer_helper_t::origin_length()
{
    buf->valid_data_length = buf->buffer_size;
    buf->walk_offset = 0;
    return *this;
}

buffer_t::buffer_t()
    : ptr(nullptr)
    , header(nullptr)
    , buffer_size(0)
    , valid_data_length(0)
    , walk_offset(0)
{
}

buffer_t::buffer_t(u64 len)
    : ptr(new byte[len == 0 ? 1 : len])
    , header(new buffer_header_t())
    , buffer_size(len)
    , valid_data_length(len)
    , walk_offset(0)
{
    header->ref_count = 1;
    memset(ptr, 0, len);
}

buffer_t::buffer_t(const byte *data, u64 len)
    : buffer_t(len)
{
    if (len > 0)
        memcpy(ptr, data, len);
}

buffer_t buffer_t::from_string(const std::string &str) { return buffer_t((const byte *)str.data(), str.size()); }

buffer_t buffer_t::from_vector(const std::vector<u8> &vec) { return buffer_t(vec.data(), vec.size()); }

buffer_t::buffer_t(const buffer_t &rh)
    : ptr(rh.ptr)
    , header(rh.header)
    , buffer_size(rh.buffer_size)
    , valid_data_length(rh.valid_data_length)
    , walk_offset(rh.walk_offset)
{
    if (header)
        header->ref_count++;
}

buffer_t &buffer_t::operator=(const buffer_t &rh)
{
    if (&rh == this)
        return *this;
    if (rh.header)
        rh.header->ref_count++;
    release();

    ptr = rh.ptr;
    header = rh.header;
    buffer_size = rh.buffer_size;
    valid_data_length = rh.valid_data_length;
    walk_offset = rh.walk_offset;
    return *this;
}

buffer_t::buffer_t(buffer_t &&buffer) noexcept
    : ptr(buffer.ptr)
    , header(buffer.header)
    , buffer_size(buffer.buffer_size)
    , valid_data_length(buffer.valid_data_length)
    , walk_offset(buffer.walk_offset)
{
    buffer.ptr = nullptr;
    buffer.header = nullptr;
    buffer.valid_data_length = 0;
    buffer.buffer_size = 0;
    buffer.walk_offset = 0;
}

buffer_t &buffer_t::operator=(buffer_t &&buffer) noexcept
{
    if (&buffer == this)
        return *this;
    release();

    ptr = buffer.ptr;
    header = buffer.header;
    buffer_size = buffer.buffer_size;
    valid_data_length = buffer.valid_data_length;
    walk_offset = buffer.walk_offset;

    buffer.ptr = nullptr;
    buffer.header = nullptr;
    buffer.valid_data_length = 0;
    buffer.buffer_size = 0;
    buffer.walk_offset = 0;
    return *this;
}

void buffer_t::release()
{
    if (ptr && header && --header->ref_count == 0)
    {
        delete[] ptr;
        delete header;
    }
    ptr = nullptr;
    header = nullptr;
}

buffer_t::~buffer_t() { release(); }

buffer_t buffer_t::slice(u64 offset, u64 len) const
{
    buffer_t view(*this);
    view.walk_step(offset);
    if (len < view.get_length())
        view.valid_data_length = view.walk_offset + len;
    return view;
}

long buffer_t::write_string(const std::string &str)
{
    auto len = str.size();
    if (len > get_length())
        len = get_length();

    memcpy(get(), str.c_str(), len);

    return len;
}

std::string buffer_t::to_string() const
{
    if (get_length() == 0)
        return std::string();
    return std::string((const char *)get(), get_length());
}

std::vector<u8> buffer_t::to_vector() const
{
    if (get_length() == 0)
        return std::vector<u8>();
    return std::vector<u8>(get(), get() + get_length());
}

void buffer_t::clear()
{
    if (ptr)
    {
        memset(get(), 0, get_length());
    }
}

} // namespace dash
