/**
* \file timer.hpp
* \author DashLink developers
* \brief microsecond time base, replaceable time source and the timer queue used for delayed tasks
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
#include <cstdint>
#include <functional>
#include <memory>
#include <queue>
#include <unordered_map>
#include <vector>

namespace dash
{
using microsecond_t = u64;
using timer_callback_t = std::function<void()>;
// 1ms
inline constexpr microsecond_t timer_min_precision = 1000;
using timer_id = int64_t;

struct timer_t
{
    microsecond_t timepoint;
    timer_callback_t callback;
    timer_t(microsecond_t timepoint, timer_callback_t callback)
        : timepoint(timepoint)
        , callback(callback)
    {
    }
};

struct timer_slot_t
{
    microsecond_t timepoint;
    std::vector<std::pair<timer_callback_t, bool>> callbacks;
    timer_slot_t(microsecond_t tp)
        : timepoint(tp)
    {
    }
};

using map_t = std::unordered_map<microsecond_t, timer_slot_t *>;

/// timer fires 'span' after now
timer_t make_timer(microsecond_t span, timer_callback_t callback);

struct timer_cmp
{
    bool operator()(timer_slot_t *lh, timer_slot_t *rh) const { return lh->timepoint > rh->timepoint; }
};

struct timer_registered_t
{
    timer_id id;
    microsecond_t timepoint;
};

/// timers sharing a (rounded) timepoint share one slot.
///\note not thread-safety. the owner serializes access
struct time_manager_t
{
    microsecond_t precision;
    std::priority_queue<timer_slot_t *, std::vector<timer_slot_t *>, timer_cmp> queue;
    map_t map;

    time_manager_t()
        : precision(timer_min_precision)
    {
    }
    ~time_manager_t();

    time_manager_t(const time_manager_t &) = delete;
    time_manager_t &operator=(const time_manager_t &) = delete;

    /// run every callback whose timepoint is not after 'now'
    void tick(microsecond_t now);
    timer_registered_t insert(timer_t timer);
    void cancel(timer_registered_t reg);
    /// return make_timespan_full() when queue is empty
    microsecond_t next_tick_timepoint();
    bool empty() const { return queue.empty(); }
};

std::unique_ptr<time_manager_t> create_time_manager(microsecond_t precision = timer_min_precision);

/// monotonic clock in microseconds
microsecond_t get_current_time();
/// wall clock in microseconds since the unix epoch
microsecond_t get_timestamp();

constexpr microsecond_t make_timespan(int second, int ms = 0, int us = 0)
{
    return (u64)second * 1000000 + (u64)ms * 1000 + us;
}

constexpr microsecond_t make_timespan_full() { return 0xFFFFFFFFFFFFFFFFULL; }

/// where throttles and pacing loops read time from and sleep on
class time_source_t
{
  public:
    virtual microsecond_t now() = 0;
    /// block current thread for 'span'
    virtual void sleep(microsecond_t span) = 0;
    virtual ~time_source_t(){};
};

class system_time_source_t : public time_source_t
{
  public:
    microsecond_t now() override;
    void sleep(microsecond_t span) override;

    /// process wide instance
    static system_time_source_t &instance();
};

} // namespace dash
