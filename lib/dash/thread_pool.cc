#include "dash/thread_pool.hpp"
#include <chrono>
#include <glog/logging.h>

namespace dash
{

void thread_pool_t::run(std::function<void()> &task)
{
    try
    {
        task();
    } catch (std::exception &e)
    {
        LOG(ERROR) << "task terminated by exception: " << e.what();
    }
}

void thread_pool_t::wrapper()
{
    while (!exit)
    {
        std::function<void()> task;
        counter++;
        {
            std::unique_lock<std::mutex> lock(mutex);
            cond.wait(lock, [this]() { return !tasks.empty() || exit; });
            if (exit)
                return;
            task = std::move(tasks.front());
            tasks.pop();
            running++;
        }
        counter--;
        run(task);
        {
            std::unique_lock<std::mutex> lock(mutex);
            running--;
        }
        idle_cond.notify_all();
    }
}

void thread_pool_t::timer_wrapper()
{
    std::unique_lock<std::mutex> lock(timer_mutex);
    while (!exit)
    {
        auto next = time_manager->next_tick_timepoint();
        auto now = get_current_time();
        if (next <= now)
        {
            time_manager->tick(now);
            continue;
        }
        if (next == make_timespan_full())
            timer_cond.wait(lock);
        else
            timer_cond.wait_for(lock, std::chrono::microseconds(next - now));
    }
}

thread_pool_t::thread_pool_t(int count)
    : exit(false)
    , counter(0)
    , running(0)
    , time_manager(create_time_manager())
{
    for (auto i = 0; i < count; i++)
    {
        std::thread thread(std::bind(&thread_pool_t::wrapper, this));
        threads.emplace_back(std::move(thread));
    }
    timer_thread = std::thread(std::bind(&thread_pool_t::timer_wrapper, this));
}

thread_pool_t::~thread_pool_t()
{
    {
        // same order as the timer thread, which commits while holding timer_mutex
        std::unique_lock<std::mutex> timer_lock(timer_mutex);
        std::unique_lock<std::mutex> lock(mutex);
        exit = true;
    }
    cond.notify_all();
    idle_cond.notify_all();
    timer_cond.notify_all();

    timer_thread.join();
    for (auto &i : threads)
    {
        i.join();
    }
}

void thread_pool_t::commit(std::function<void()> task)
{
    if (exit) // don't push task
        return;
    {
        std::unique_lock<std::mutex> lock(mutex);
        tasks.emplace(std::move(task));
    }
    cond.notify_one();
}

timer_registered_t thread_pool_t::commit_after(microsecond_t span, std::function<void()> task)
{
    timer_registered_t reg;
    {
        std::unique_lock<std::mutex> lock(timer_mutex);
        reg = time_manager->insert(make_timer(span, [this, task]() { commit(task); }));
    }
    timer_cond.notify_one();
    return reg;
}

void thread_pool_t::cancel(timer_registered_t reg)
{
    std::unique_lock<std::mutex> lock(timer_mutex);
    time_manager->cancel(reg);
}

/// return idle thread count
int thread_pool_t::get_idles() const { return counter; }

/// return true if there are no tasks in task queue and no threads are running tasks.
bool thread_pool_t::empty() const
{
    std::unique_lock<std::mutex> lock(mutex);
    return tasks.empty() && running == 0;
}

void thread_pool_t::wait_idle()
{
    std::unique_lock<std::mutex> lock(mutex);
    idle_cond.wait(lock, [this]() { return (tasks.empty() && running == 0) || exit; });
}

} // namespace dash
