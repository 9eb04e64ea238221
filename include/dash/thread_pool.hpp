/**
* \file thread_pool.hpp
* \author DashLink developers
* \brief Simple thread pool running the async tasks of a transport session, with delayed commits
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
#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace dash
{

class thread_pool_t
{
  private:
    std::vector<std::thread> threads;
    mutable std::mutex mutex;
    std::condition_variable cond;
    std::condition_variable idle_cond;
    std::queue<std::function<void()>> tasks;
    // exit flag
    std::atomic_bool exit;
    std::atomic_int counter;
    int running;

    // delayed tasks
    std::thread timer_thread;
    std::mutex timer_mutex;
    std::condition_variable timer_cond;
    std::unique_ptr<time_manager_t> time_manager;

    void wrapper();
    void timer_wrapper();
    void run(std::function<void()> &task);

  public:
    ///\param count thread count in pool
    thread_pool_t(int count);

    thread_pool_t(const thread_pool_t &) = delete;
    thread_pool_t &operator=(const thread_pool_t &) = delete;

    ///\note we wait all threads to exit at here. tasks not started yet are dropped
    ~thread_pool_t();

    /// commit a task to thread pool
    ///
    ///\param task to run
    ///\return none
    void commit(std::function<void()> task);

    /// commit a task after 'span' elapsed
    ///
    ///\return the timer registered, can be cancelled by 'cancel'
    timer_registered_t commit_after(microsecond_t span, std::function<void()> task);

    /// cancel a delayed task which is not committed yet
    void cancel(timer_registered_t reg);

    /// return idle thread count
    int get_idles() const;

    /// return true if there are no tasks in task queue and no threads are running tasks.
    bool empty() const;

    /// block until the queue is empty and every thread is idle
    void wait_idle();
};

} // namespace dash
