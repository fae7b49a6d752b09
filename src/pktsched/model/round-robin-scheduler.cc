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

#include "round-robin-scheduler.h"

#include "ns3/abort.h"
#include "ns3/assert.h"
#include "ns3/fatal-error.h"
#include "ns3/log.h"
#include "ns3/uinteger.h"

namespace ns3
{

NS_LOG_COMPONENT_DEFINE("RoundRobinScheduler");

NS_OBJECT_ENSURE_REGISTERED(RoundRobinScheduler);

TypeId
RoundRobinScheduler::GetTypeId()
{
    static TypeId tid =
        TypeId("ns3::RoundRobinScheduler")
            .SetParent<PacketScheduler>()
            .SetGroupName("PacketScheduling")
            .AddConstructor<RoundRobinScheduler>()
            .AddAttribute("NumQueues",
                          "The number of FIFO queues served in turn",
                          UintegerValue(3),
                          MakeUintegerAccessor(&RoundRobinScheduler::SetNQueues,
                                               &RoundRobinScheduler::GetNQueues),
                          MakeUintegerChecker<uint32_t>(1))
            .AddAttribute("TimeQuantum",
                          "The time slice of each queue; packets are always serviced "
                          "to completion",
                          TimeValue(Seconds(0.5)),
                          MakeTimeAccessor(&RoundRobinScheduler::m_timeQuantum),
                          MakeTimeChecker(Seconds(0)));
    return tid;
}

RoundRobinScheduler::RoundRobinScheduler()
    : PacketScheduler()
{
    NS_LOG_FUNCTION(this);
}

RoundRobinScheduler::~RoundRobinScheduler()
{
    NS_LOG_FUNCTION(this);
}

SchedulerType
RoundRobinScheduler::GetSchedulerType() const
{
    return SchedulerType::ROUND_ROBIN;
}

void
RoundRobinScheduler::SetNQueues(uint32_t nQueues)
{
    NS_LOG_FUNCTION(this << nQueues);
    NS_ABORT_MSG_IF(nQueues == 0, "RoundRobinScheduler needs at least one queue");
    NS_ABORT_MSG_IF(GetNPackets() > 0,
                    "Cannot change the number of queues while " << GetNPackets()
                                                                << " packets are buffered");
    m_nQueues = nQueues;
    m_queues.assign(m_nQueues, std::deque<Ptr<QosPacket>>());
    m_current = 0;
}

uint32_t
RoundRobinScheduler::GetNQueues() const
{
    return m_nQueues;
}

uint32_t
RoundRobinScheduler::GetQueueLength(uint32_t i) const
{
    NS_ASSERT_MSG(i < m_queues.size(), "Queue index " << i << " out of range");
    return m_queues[i].size();
}

uint32_t
RoundRobinScheduler::GetCurrentQueueIndex() const
{
    return m_current;
}

Time
RoundRobinScheduler::GetTimeQuantum() const
{
    return m_timeQuantum;
}

bool
RoundRobinScheduler::CheckConfig()
{
    NS_LOG_FUNCTION(this);
    if (m_nQueues == 0)
    {
        NS_LOG_ERROR("RoundRobinScheduler needs at least one queue");
        return false;
    }
    return PacketScheduler::CheckConfig();
}

bool
RoundRobinScheduler::DoEnqueue(Ptr<QosPacket> packet)
{
    NS_LOG_FUNCTION(this << packet);
    if (HasCapacityBound() && GetNPackets() >= GetMaxSize().GetValue())
    {
        NS_LOG_LOGIC("Queue full -- dropping pkt");
        DropBeforeEnqueue(packet, LIMIT_EXCEEDED_DROP);
        return false;
    }
    uint32_t index = packet->GetUid() % m_queues.size();
    m_queues[index].push_back(packet);
    NS_LOG_LOGIC("Packet " << packet->GetUid() << " placed in queue " << index);
    return true;
}

Ptr<QosPacket>
RoundRobinScheduler::DoDequeue()
{
    NS_LOG_FUNCTION(this);
    uint32_t nQueues = m_queues.size();
    for (uint32_t attempts = 0; attempts < nQueues; attempts++)
    {
        uint32_t index = (m_current + attempts) % nQueues;
        if (!m_queues[index].empty())
        {
            auto packet = m_queues[index].front();
            m_queues[index].pop_front();
            m_current = (index + 1) % nQueues;
            NS_LOG_LOGIC("Served queue " << index << "; next scan starts at " << m_current);
            return packet;
        }
    }
    NS_FATAL_ERROR("Error in round-robin logic (all queues empty)");
    return nullptr;
}

void
RoundRobinScheduler::DoReset()
{
    NS_LOG_FUNCTION(this);
    m_queues.assign(m_nQueues, std::deque<Ptr<QosPacket>>());
    m_current = 0;
}

} // namespace ns3
