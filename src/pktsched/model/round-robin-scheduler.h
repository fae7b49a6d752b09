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

#ifndef ROUND_ROBIN_SCHEDULER_H
#define ROUND_ROBIN_SCHEDULER_H

#include "packet-scheduler.h"

#include <deque>
#include <vector>

namespace ns3
{

/**
 * \ingroup pktsched
 *
 * Round-robin over a fixed number of FIFO queues.
 *
 * A packet is placed in queue (uid mod NumQueues); the placement does not
 * depend on the flow.  Each Dequeue() scans the queues, wrapping around,
 * from the current position for the first non-empty queue, serves its head
 * packet and moves the current position one past the served queue, so
 * every non-empty queue is served once before any queue is served again.
 *
 * Service is not preemptive: a selected packet is serviced to completion.
 * The TimeQuantum attribute is accepted for configuration compatibility
 * and does not fragment service.
 *
 * If a capacity bound is configured, an arriving packet is dropped when
 * the total number of buffered packets reached the bound.
 */
class RoundRobinScheduler : public PacketScheduler
{
  public:
    /**
     * \brief Get the type ID.
     * \return the object TypeId
     */
    static TypeId GetTypeId();
    RoundRobinScheduler();
    ~RoundRobinScheduler() override;

    SchedulerType GetSchedulerType() const override;

    /**
     * \brief Set the number of queues.  The queues are rebuilt empty and the
     * scan restarts from the first queue, so the scheduler must not hold
     * any packet.
     * \param nQueues the number of queues, at least one
     */
    void SetNQueues(uint32_t nQueues);

    /**
     * \return the number of queues
     */
    uint32_t GetNQueues() const;

    /**
     * \param i the queue index
     * \return the number of packets in the i-th queue
     */
    uint32_t GetQueueLength(uint32_t i) const;

    /**
     * \return the index of the queue scanned first by the next Dequeue()
     */
    uint32_t GetCurrentQueueIndex() const;

    /**
     * \return the configured time quantum
     */
    Time GetTimeQuantum() const;

    // Reasons for dropping packets
    static constexpr const char* LIMIT_EXCEEDED_DROP = "Queue limit exceeded"; //!< Tail drop

  private:
    bool DoEnqueue(Ptr<QosPacket> packet) override;
    Ptr<QosPacket> DoDequeue() override;
    void DoReset() override;
    bool CheckConfig() override;

    uint32_t m_nQueues;                               //!< Number of queues
    Time m_timeQuantum;                               //!< Time quantum; service is never fragmented
    std::vector<std::deque<Ptr<QosPacket>>> m_queues; //!< The FIFO queues
    uint32_t m_current{0};                            //!< Next queue to scan
};

} // namespace ns3

#endif /* ROUND_ROBIN_SCHEDULER_H */
