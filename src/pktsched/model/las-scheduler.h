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

#ifndef LAS_SCHEDULER_H
#define LAS_SCHEDULER_H

#include "packet-scheduler.h"

#include <deque>
#include <map>

namespace ns3
{

/**
 * \ingroup pktsched
 *
 * Least-Attained-Service scheduling.
 *
 * Packets are classified by flow id into one FIFO queue per flow, and each
 * flow accumulates the service time it has received.  The non-empty flow
 * with the least attained service is served next, so a new flow is always
 * served ahead of flows that already received service.  Short flows get
 * low latency; long flows may starve while short flows keep arriving.
 * Ties are broken in favour of the lowest flow id.  Attained service is
 * kept for the whole run, including while a flow has no packet buffered.
 *
 * With a capacity bound, an arrival that finds the buffer full evicts the
 * last packet of the buffered flow with the most attained service (lowest
 * flow id on ties) and is then admitted.  The arriving packet itself is
 * dropped only if no buffered flow can be found.
 */
class LasScheduler : public PacketScheduler
{
  public:
    /**
     * \brief Get the type ID.
     * \return the object TypeId
     */
    static TypeId GetTypeId();
    LasScheduler();
    ~LasScheduler() override;

    SchedulerType GetSchedulerType() const override;

    /**
     * \return the number of flows currently holding packets
     */
    uint32_t GetNFlows() const;

    /**
     * \param flowId the flow id
     * \return the number of packets buffered for the flow
     */
    uint32_t GetFlowQueueLength(uint32_t flowId) const;

    /**
     * \param flowId the flow id
     * \return the service time received by the flow so far
     */
    Time GetAttainedService(uint32_t flowId) const;

    // Reasons for dropping packets
    static constexpr const char* ELEPHANT_DROP =
        "Evicted from the flow with most attained service"; //!< Fairness-aware eviction
    static constexpr const char* LIMIT_EXCEEDED_DROP =
        "Queue limit exceeded"; //!< No buffered flow to evict from

  private:
    bool DoEnqueue(Ptr<QosPacket> packet) override;
    Ptr<QosPacket> DoDequeue() override;
    void DoReset() override;

    /**
     * \brief Find the buffered flow with the most attained service.
     * \param [out] flowId the flow found
     * \return false if no flow holds packets
     */
    bool FindElephantFlow(uint32_t& flowId) const;

    std::map<uint32_t, std::deque<Ptr<QosPacket>>> m_flowQueues; //!< Per-flow FIFO queues
    std::map<uint32_t, Time> m_attainedService;                  //!< Service received by each flow
};

} // namespace ns3

#endif /* LAS_SCHEDULER_H */
