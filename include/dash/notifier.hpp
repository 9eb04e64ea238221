/**
* \file notifier.hpp
* \author DashLink developers
* \brief radio abstraction: one call hands one notification to the stack. A loopback implementation records
* everything for the host demo and for tests.
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
#include "buffer.hpp"
#include "registry.hpp"
#include <functional>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace dash
{

class notifier_t
{
  public:
    /// hand one notification to the radio stack
    ///\return false when the stack refused it
    virtual bool notify(const peer_id_t &peer, channel_t channel, const buffer_t &data) = 0;
    virtual ~notifier_t(){};
};

/// everything notified is kept in memory
class loopback_notifier_t : public notifier_t
{
  public:
    struct record_t
    {
        peer_id_t peer;
        channel_t channel;
        std::vector<u8> data;
    };

    /// called after a notification is recorded, outside of the notifier lock
    using notify_handler_t = std::function<void(loopback_notifier_t &, const record_t &)>;

  private:
    mutable std::mutex mutex;
    std::vector<record_t> records;
    /// peer -> notifications accepted so far
    std::unordered_map<peer_id_t, u64> counters;
    /// peer -> index of the notification to refuse
    std::unordered_map<peer_id_t, u64> fail_points;
    bool refuse_all;
    notify_handler_t handler;

  public:
    loopback_notifier_t();

    loopback_notifier_t(const loopback_notifier_t &) = delete;
    loopback_notifier_t &operator=(const loopback_notifier_t &) = delete;

    bool notify(const peer_id_t &peer, channel_t channel, const buffer_t &data) override;

    /// refuse the 'index'-th (0 based, counting accepted ones) notification to 'peer'
    void fail_at(const peer_id_t &peer, u64 index);
    /// refuse everything until called with false
    void refuse(bool enabled);

    loopback_notifier_t &on_notify(notify_handler_t handler);

    std::vector<record_t> get_records() const;
    /// records for 'peer' on 'channel', in notify order
    std::vector<record_t> get_records(const peer_id_t &peer, channel_t channel) const;
    u64 count() const;
    void clear();
};

} // namespace dash
