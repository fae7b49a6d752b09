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

#ifndef FCFS_SCHEDULER_H
#define FCFS_SCHEDULER_H

#include "packet-scheduler.h"

#include <deque>

namespace ns3
{

/**
 * \ingroup pktsched
 *
 * First-come first-served: a single FIFO queue with tail drop.
 */
class FcfsScheduler : public PacketScheduler
{
  public:
    /**
     * \brief Get the type ID.
     * \return the object TypeId
     */
    static TypeId GetTypeId();
    FcfsScheduler();
    ~FcfsScheduler() override;

    SchedulerType GetSchedulerType() const override;

    // Reasons for dropping packets
    static constexpr const char* LIMIT_EXCEEDED_DROP = "Queue limit exceeded"; //!< Tail drop

  private:
    bool DoEnqueue(Ptr<QosPacket> packet) override;
    Ptr<QosPacket> DoDequeue() override;
    void DoReset() override;

    std::deque<Ptr<QosPacket>> m_queue; //!< Packets in arrival order
};

} // namespace ns3

#endif /* FCFS_SCHEDULER_H */
