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

#ifndef FAIR_QUEUE_SCHEDULER_H
#define FAIR_QUEUE_SCHEDULER_H

#include "packet-scheduler.h"

#include <deque>
#include <map>

namespace ns3
{

/**
 * \ingroup pktsched
 *
 * Flow-based fair queueing.  Packets are classified by flow id into one
 * FIFO queue per flow.  Two selection variants are available, chosen with
 * the UseVirtualFinishTime attribute:
 *
 * - virtual finish time (default): for the head packet of each flow the
 *   candidate finish time is max(V, F_flow) + service time, where V is the
 *   global virtual time and F_flow the last finish time committed for the
 *   flow.  The flow with the smallest candidate is served; its F_flow and
 *   V are set to the candidate.  This approximates bit-by-bit round-robin.
 *
 * - virtual round-robin: every flow accumulates the service time it has
 *   been granted, independently of the other flows, and the flow with the
 *   smallest total is served.  With equal service times the active flows
 *   are served in strict rotation.
 *
 * Equal virtual finish times go to the flow whose last finish time is the
 * oldest, so that flows with equal service times rotate; remaining ties,
 * and ties of the virtual round-robin variant, go to the lowest flow id.
 *
 * With a capacity bound B and n flows holding packets (counting the flow of
 * the arriving packet), each flow may hold at most max(1, B / n) packets;
 * an arriving packet is dropped when its flow is at or above that share.
 * Flow queues that become empty are removed after each selection.
 */
class FairQueueScheduler : public PacketScheduler
{
  public:
    /**
     * \brief Get the type ID.
     * \return the object TypeId
     */
    static TypeId GetTypeId();
    FairQueueScheduler();
    ~FairQueueScheduler() override;

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
     * \brief Compute the fair share of the buffer for an arriving packet of the flow.
     * \param flowId the flow id
     * \return the per-flow limit, or 0 if there is no capacity bound
     */
    uint32_t GetPerFlowLimit(uint32_t flowId) const;

    /**
     * \return the global virtual time (virtual finish time variant)
     */
    Time GetVirtualTime() const;

    /**
     * \param flowId the flow id
     * \return the last finish time committed for the flow (virtual finish time variant)
     */
    Time GetFlowFinishTime(uint32_t flowId) const;

    /**
     * \param flowId the flow id
     * \return the service time granted to the flow so far (virtual round-robin variant)
     */
    Time GetFlowService(uint32_t flowId) const;

    // Reasons for dropping packets
    static constexpr const char* FAIR_SHARE_EXCEEDED_DROP =
        "Per-flow fair share exceeded"; //!< The flow holds its share of the buffer

  private:
    bool DoEnqueue(Ptr<QosPacket> packet) override;
    Ptr<QosPacket> DoDequeue() override;
    void DoReset() override;

    /**
     * \brief Pick the flow to serve with virtual finish times and commit its finish time
     * \return the flow id
     */
    uint32_t SelectByVirtualFinishTime();

    /**
     * \brief Pick the flow to serve with per-flow granted service and account for it
     * \return the flow id
     */
    uint32_t SelectByVirtualRoundRobin();

    bool m_useVirtualFinishTime;                                 //!< Selection variant
    std::map<uint32_t, std::deque<Ptr<QosPacket>>> m_flowQueues; //!< Per-flow FIFO queues
    Time m_virtualTime;                                          //!< Global virtual time
    std::map<uint32_t, Time> m_lastFinish;                       //!< Last finish time of each flow
    std::map<uint32_t, Time> m_flowService;                      //!< Service granted to each flow
};

} // namespace ns3

#endif /* FAIR_QUEUE_SCHEDULER_H */
