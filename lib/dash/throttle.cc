#include "dash/throttle.hpp"

namespace dash
{

throttle_t::throttle_t(time_source_t &source, microsecond_t interval)
    : source(source)
    , interval(interval)
    , last_sent(0)
    , has_sent(false)
{
}

void throttle_t::throttle()
{
    std::unique_lock<std::mutex> lock(mutex);
    if (has_sent)
    {
        auto now = source.now();
        auto elapsed = now >= last_sent ? now - last_sent : 0;
        if (elapsed < interval)
            source.sleep(interval - elapsed);
    }
    last_sent = source.now();
    has_sent = true;
}

void throttle_t::reset()
{
    std::unique_lock<std::mutex> lock(mutex);
    last_sent = 0;
    has_sent = false;
}

} // namespace dash
