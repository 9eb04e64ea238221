#include "dash/timer.hpp"
#include <chrono>
#include <thread>

namespace dash
{
timer_t make_timer(microsecond_t span, timer_callback_t callback) { return timer_t(span + get_current_time(), callback); }

std::unique_ptr<time_manager_t> create_time_manager(microsecond_t precision)
{
    std::unique_ptr<time_manager_t> manager = std::make_unique<time_manager_t>();
    manager->precision = precision;
    return manager;
}

time_manager_t::~time_manager_t()
{
    while (!queue.empty())
    {
        delete queue.top();
        queue.pop();
    }
}

void time_manager_t::tick(microsecond_t now)
{
    while (!queue.empty())
    {
        auto timers = queue.top();
        if (timers->timepoint > now)
        {
            break;
        }
        queue.pop();
        map.erase(timers->timepoint);
        for (auto &i : timers->callbacks)
        {
            if (i.second)
            {
                i.first();
            }
        }
        delete timers;
    }
}

timer_registered_t time_manager_t::insert(timer_t timer)
{
    timer.timepoint = (timer.timepoint + precision - 1) / precision * precision;

    auto it = map.find(timer.timepoint);
    if (it == map.end())
    {
        it = map.emplace(timer.timepoint, new timer_slot_t(timer.timepoint)).first;
        queue.push(it->second);
    }

    it->second->callbacks.emplace_back(timer.callback, true);
    timer_registered_t reg;
    reg.id = it->second->callbacks.size();
    reg.timepoint = timer.timepoint;
    return reg;
}

void time_manager_t::cancel(timer_registered_t reg)
{
    auto it = map.find(reg.timepoint);
    if (it != map.end() && reg.id > 0 && (u64)reg.id <= it->second->callbacks.size())
    {
        it->second->callbacks[reg.id - 1].second = false;
    }
}

microsecond_t time_manager_t::next_tick_timepoint()
{
    if (!queue.empty())
    {
        auto timer = queue.top();
        return timer->timepoint;
    }

    return make_timespan_full();
}

microsecond_t get_current_time()
{
    return std::chrono::duration_cast<std::chrono::microseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

microsecond_t get_timestamp()
{
    return std::chrono::time_point_cast<std::chrono::microseconds>(std::chrono::system_clock::now())
        .time_since_epoch()
        .count();
}

microsecond_t system_time_source_t::now() { return get_current_time(); }

void system_time_source_t::sleep(microsecond_t span)
{
    std::this_thread::sleep_for(std::chrono::microseconds(span));
}

system_time_source_t &system_time_source_t::instance()
{
    static system_time_source_t source;
    return source;
}

} // namespace dash
