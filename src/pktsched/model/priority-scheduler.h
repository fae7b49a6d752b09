/* -*- Mode:C++; c-file-style:"gnu"; indent-tabs-mode:nil; -*- */
/*
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License version 2 as
 * published by the Free Software Foundation;
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program; if not, write to the Free Software
 * Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA  02111-1307  USA
 */

#ifndef PRIORITY_SCHEDULER_H
#define PRIORITY_SCHEDULER_H

#include "packet-scheduler.h"

#include <queue>
#include <vector>

namespace ns3
{

/**
 * \ingroup pktsched
 *
 * Strict priority scheduling.  The buffered packet with the highest
 * priority is always served first; equal priorities are served in arrival
 * order, and packets with the same priority and arrival time in admission
 * order.  Low priority flows starve under sustained high priority load.
 *
 * If a capacity bound is configured, an arriving packet is dropped when the
 * buffer is full.
 */
class PriorityScheduler : public PacketScheduler
{
  public:
    /**
     * \brief Get the type ID.
     * \return the object TypeId
     */
    static TypeId GetTypeId();
    PriorityScheduler();
    ~PriorityScheduler() override;

    SchedulerType GetSchedulerType() const override;

    // Reasons for dropping packets
    static constexpr const char* LIMIT_EXCEEDED_DROP = "Queue limit exceeded"; //!< Tail drop

  private:
    bool DoEnqueue(Ptr<QosPacket> packet) override;
    Ptr<QosPacket> DoDequeue() override;
    void DoReset() override;

    /// A buffered packet with its admission sequence number
    struct Entry
    {
        Ptr<QosPacket> packet; //!< The packet
        uint64_t seq;          //!< Admission order
    };

    /// Heap order: true if a must be served after b
    struct ServedAfter
    {
        bool operator()(const Entry& a, const Entry& b) const;
    };

    std::priority_queue<Entry, std::vector<Entry>, ServedAfter> m_heap; //!< Buffered packets
    uint64_t m_seq{0}; //!< Next admission sequence number
};

} // namespace ns3

#endif /* PRIORITY_SCHEDULER_H */
