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

#include "fair-queue-scheduler.h"

#include "ns3/assert.h"
#include "ns3/boolean.h"
#include "ns3/log.h"

#include <algorithm>

namespace ns3
{

NS_LOG_COMPONENT_DEFINE("FairQueueScheduler");

NS_OBJECT_ENSURE_REGISTERED(FairQueueScheduler);

TypeId
FairQueueScheduler::GetTypeId()
{
    static TypeId tid =
        TypeId("ns3::FairQueueScheduler")
            .SetParent<PacketScheduler>()
            .SetGroupName("PacketScheduling")
            .AddConstructor<FairQueueScheduler>()
            .AddAttribute("UseVirtualFinishTime",
                          "True to order flows by virtual finish time, false to order them "
                          "by the service time granted to each flow (virtual round-robin)",
                          BooleanValue(true),
                          MakeBooleanAccessor(&FairQueueScheduler::m_useVirtualFinishTime),
                          MakeBooleanChecker());
    return tid;
}

FairQueueScheduler::FairQueueScheduler()
    : PacketScheduler(),
      m_virtualTime(Seconds(0))
{
    NS_LOG_FUNCTION(this);
}

FairQueueScheduler::~FairQueueScheduler()
{
    NS_LOG_FUNCTION(this);
}

SchedulerType
FairQueueScheduler::GetSchedulerType() const
{
    return SchedulerType::FAIR_QUEUE;
}

uint32_t
FairQueueScheduler::GetNFlows() const
{
    return m_flowQueues.size();
}

uint32_t
FairQueueScheduler::GetFlowQueueLength(uint32_t flowId) const
{
    auto it = m_flowQueues.find(flowId);
    if (it == m_flowQueues.end())
    {
        return 0;
    }
    return it->second.size();
}

uint32_t
FairQueueScheduler::GetPerFlowLimit(uint32_t flowId) const
{
    if (!HasCapacityBound())
    {
        return 0;
    }
    uint32_t nFlows = m_flowQueues.size();
    if (m_flowQueues.find(flowId) == m_flowQueues.end())
    {
        nFlows++;
    }
    return std::max<uint32_t>(1, GetMaxSize().GetValue() / nFlows);
}

Time
FairQueueScheduler::GetVirtualTime() const
{
    return m_virtualTime;
}

Time
FairQueueScheduler::GetFlowFinishTime(uint32_t flowId) const
{
    auto it = m_lastFinish.find(flowId);
    if (it == m_lastFinish.end())
    {
        return Seconds(0);
    }
    return it->second;
}

Time
FairQueueScheduler::GetFlowService(uint32_t flowId) const
{
    auto it = m_flowService.find(flowId);
    if (it == m_flowService.end())
    {
        return Seconds(0);
    }
    return it->second;
}

bool
FairQueueScheduler::DoEnqueue(Ptr<QosPacket> packet)
{
    NS_LOG_FUNCTION(this << packet);
    uint32_t flowId = packet->GetFlowId();

    if (HasCapacityBound())
    {
        uint32_t limit = GetPerFlowLimit(flowId);
        uint32_t length = GetFlowQueueLength(flowId);
        NS_LOG_LOGIC("Flow " << flowId << " holds " << length << " packets, fair share "
                             << limit);
        if (length >= limit)
        {
            DropBeforeEnqueue(packet, FAIR_SHARE_EXCEEDED_DROP);
            return false;
        }
    }

    m_flowQueues[flowId].push_back(packet);
    return true;
}

uint32_t
FairQueueScheduler::SelectByVirtualFinishTime()
{
    NS_LOG_FUNCTION(this);
    bool found = false;
    uint32_t selected = 0;
    Time best;
    Time bestLastFinish;
    // equal candidates go to the flow whose last finish time is the oldest,
    // then to the lowest flow id (m_flowQueues is ordered by flow id)
    for (const auto& [flowId, queue] : m_flowQueues)
    {
        NS_ASSERT_MSG(!queue.empty(), "Empty queue of flow " << flowId << " was not pruned");
        Time lastFinish = GetFlowFinishTime(flowId);
        Time candidate =
            std::max(m_virtualTime, lastFinish) + queue.front()->GetServiceTime();
        NS_LOG_LOGIC("Flow " << flowId << " candidate finish " << candidate.As(Time::S));
        if (!found || candidate < best || (candidate == best && lastFinish < bestLastFinish))
        {
            found = true;
            selected = flowId;
            best = candidate;
            bestLastFinish = lastFinish;
        }
    }
    NS_ASSERT_MSG(found, "No flow to select");
    m_lastFinish[selected] = best;
    m_virtualTime = best;
    NS_LOG_DEBUG("Selected flow " << selected << "; virtual time "
                                  << m_virtualTime.As(Time::S));
    return selected;
}

uint32_t
FairQueueScheduler::SelectByVirtualRoundRobin()
{
    NS_LOG_FUNCTION(this);
    bool found = false;
    uint32_t selected = 0;
    Time least;
    for (const auto& [flowId, queue] : m_flowQueues)
    {
        NS_ASSERT_MSG(!queue.empty(), "Empty queue of flow " << flowId << " was not pruned");
        Time service = GetFlowService(flowId);
        if (!found || service < least)
        {
            found = true;
            selected = flowId;
            least = service;
        }
    }
    NS_ASSERT_MSG(found, "No flow to select");
    m_flowService[selected] += m_flowQueues[selected].front()->GetServiceTime();
    NS_LOG_DEBUG("Selected flow " << selected << "; granted service "
                                  << m_flowService[selected].As(Time::S));
    return selected;
}

Ptr<QosPacket>
FairQueueScheduler::DoDequeue()
{
    NS_LOG_FUNCTION(this);
    uint32_t flowId =
        m_useVirtualFinishTime ? SelectByVirtualFinishTime() : SelectByVirtualRoundRobin();

    auto it = m_flowQueues.find(flowId);
    auto packet = it->second.front();
    it->second.pop_front();
    if (it->second.empty())
    {
        NS_LOG_LOGIC("Flow " << flowId << " has no more packets");
        m_flowQueues.erase(it);
    }
    return packet;
}

void
FairQueueScheduler::DoReset()
{
    NS_LOG_FUNCTION(this);
    m_flowQueues.clear();
    m_virtualTime = Seconds(0);
    m_lastFinish.clear();
    m_flowService.clear();
}

} // namespace ns3
