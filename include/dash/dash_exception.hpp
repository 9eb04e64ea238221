/**
* \file dash_exception.hpp
* \author DashLink developers
* \brief exceptions declaration
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
#include <exception>
#include <string>
namespace dash
{
enum class protocol_error
{
    truncated,
    bad_json,
    bad_field,
    unknown_channel,
};

static const char *protocol_error_strings[] = {"payload is shorter than its header", "payload is not valid json",
                                               "field value out of range", "write on a channel without a decoder"};

/// malformed inbound data. caught by the dispatcher, never leaves the transport
class dash_protocol_exception : public std::exception
{
    std::string str;
    protocol_error error;

  public:
    dash_protocol_exception(std::string str, protocol_error error)
        : str(str)
        , error(error)
    {
    }

    const char *what() const noexcept override { return str.c_str(); }

    protocol_error get_error() const { return error; }
};

/// invalid argument passed by the caller
class dash_param_exception : public std::exception
{
    std::string str;

  public:
    dash_param_exception(std::string str)
        : str(str)
    {
    }

    const char *what() const noexcept override { return str.c_str(); }
};

} // namespace dash
