/**
* \file throttle.hpp
* \author DashLink developers
* \brief single shared gate keeping a minimum gap between transmissions
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
#include "timer.hpp"
#include <mutex>

namespace dash
{

/// Every fragment to every peer goes through the same gate. The gate never drops or reorders, it only delays the
/// caller until 'interval' elapsed since the previous release.
class throttle_t
{
    time_source_t &source;
    microsecond_t interval;
    std::mutex mutex;
    microsecond_t last_sent;
    bool has_sent;

  public:
    throttle_t(time_source_t &source, microsecond_t interval);

    throttle_t(const throttle_t &) = delete;
    throttle_t &operator=(const throttle_t &) = delete;

    /// block until 'interval' elapsed since the last release, then record the release time
    ///\note callers are serialized, the wait is done under the gate lock
    void throttle();

    /// forget the last release. a fresh channel must not inherit stale pacing
    void reset();

    microsecond_t get_interval() const { return interval; }
};

} // namespace dash
