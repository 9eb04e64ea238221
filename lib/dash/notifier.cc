#include "dash/notifier.hpp"
#include <glog/logging.h>

namespace dash
{

loopback_notifier_t::loopback_notifier_t()
    : refuse_all(false)
{
}

bool loopback_notifier_t::notify(const peer_id_t &peer, channel_t channel, const buffer_t &data)
{
    record_t record{peer, channel, data.to_vector()};
    notify_handler_t current;
    {
        std::unique_lock<std::mutex> lock(mutex);
        if (refuse_all)
            return false;
        auto &counter = counters[peer];
        auto it = fail_points.find(peer);
        if (it != fail_points.end() && it->second == counter)
        {
            fail_points.erase(it);
            VLOG(2) << "loopback refuses notification " << counter << " to " << peer;
            return false;
        }
        counter++;
        records.push_back(record);
        current = handler;
    }
    if (current)
        current(*this, record);
    return true;
}

void loopback_notifier_t::fail_at(const peer_id_t &peer, u64 index)
{
    std::unique_lock<std::mutex> lock(mutex);
    fail_points[peer] = index;
}

void loopback_notifier_t::refuse(bool enabled)
{
    std::unique_lock<std::mutex> lock(mutex);
    refuse_all = enabled;
}

loopback_notifier_t &loopback_notifier_t::on_notify(notify_handler_t handler)
{
    std::unique_lock<std::mutex> lock(mutex);
    this->handler = handler;
    return *this;
}

std::vector<loopback_notifier_t::record_t> loopback_notifier_t::get_records() const
{
    std::unique_lock<std::mutex> lock(mutex);
    return records;
}

std::vector<loopback_notifier_t::record_t> loopback_notifier_t::get_records(const peer_id_t &peer,
                                                                            channel_t channel) const
{
    std::vector<record_t> result;
    std::unique_lock<std::mutex> lock(mutex);
    for (auto &record : records)
    {
        if (record.peer == peer && record.channel == channel)
            result.push_back(record);
    }
    return result;
}

u64 loopback_notifier_t::count() const
{
    std::unique_lock<std::mutex> lock(mutex);
    return records.size();
}

void loopback_notifier_t::clear()
{
    std::unique_lock<std::mutex> lock(mutex);
    records.clear();
    counters.clear();
    fail_points.clear();
}

} // namespace dash
