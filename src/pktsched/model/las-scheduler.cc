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

#include "las-scheduler.h"

#include "ns3/assert.h"
#include "ns3/log.h"

namespace ns3
{

NS_LOG_COMPONENT_DEFINE("LasScheduler");

NS_OBJECT_ENSURE_REGISTERED(LasScheduler);

TypeId
LasScheduler::GetTypeId()
{
    static TypeId tid = TypeId("ns3::LasScheduler")
                            .SetParent<PacketScheduler>()
                            .SetGroupName("PacketScheduling")
                            .AddConstructor<LasScheduler>();
    return tid;
}

LasScheduler::LasScheduler()
    : PacketScheduler()
{
    NS_LOG_FUNCTION(this);
}

LasScheduler::~LasScheduler()
{
    NS_LOG_FUNCTION(this);
}

SchedulerType
LasScheduler::GetSchedulerType() const
{
    return SchedulerType::LAS;
}

uint32_t
LasScheduler::GetNFlows() const
{
    return m_flowQueues.size();
}

uint32_t
LasScheduler::GetFlowQueueLength(uint32_t flowId) const
{
    auto it = m_flowQueues.find(flowId);
    if (it == m_flowQueues.end())
    {
        return 0;
    }
    return it->second.size();
}

Time
LasScheduler::GetAttainedService(uint32_t flowId) const
{
    auto it = m_attainedService.find(flowId);
    if (it == m_attainedService.end())
    {
        return Seconds(0);
    }
    return it->second;
}

bool
LasScheduler::FindElephantFlow(uint32_t& flowId) const
{
    NS_LOG_FUNCTION(this);
    bool found = false;
    Time most;
    for (const auto& [id, queue] : m_flowQueues)
    {
        if (queue.empty())
        {
            continue;
        }
        Time service = GetAttainedService(id);
        if (!found || service > most)
        {
            found = true;
            flowId = id;
            most = service;
        }
    }
    return found;
}

bool
LasScheduler::DoEnqueue(Ptr<QosPacket> packet)
{
    NS_LOG_FUNCTION(this << packet);

    if (HasCapacityBound() && GetNPackets() >= GetMaxSize().GetValue())
    {
        uint32_t elephant = 0;
        if (!FindElephantFlow(elephant))
        {
            NS_LOG_LOGIC("Queue full and no flow to evict from -- dropping pkt");
            DropBeforeEnqueue(packet, LIMIT_EXCEEDED_DROP);
            return false;
        }
        auto it = m_flowQueues.find(elephant);
        auto victim = it->second.back();
        it->second.pop_back();
        if (it->second.empty())
        {
            m_flowQueues.erase(it);
        }
        NS_LOG_LOGIC("Queue full -- evicting tail of flow "
                     << elephant << " with attained service "
                     << GetAttainedService(elephant).As(Time::S));
        DropAfterEnqueue(victim, ELEPHANT_DROP);
    }

    m_flowQueues[packet->GetFlowId()].push_back(packet);
    return true;
}

Ptr<QosPacket>
LasScheduler::DoDequeue()
{
    NS_LOG_FUNCTION(this);
    bool found = false;
    uint32_t selected = 0;
    Time least;
    // lowest flow id wins on ties since the map is ordered
    for (const auto& [flowId, queue] : m_flowQueues)
    {
        if (queue.empty())
        {
            continue;
        }
        Time service = GetAttainedService(flowId);
        if (!found || service < least)
        {
            found = true;
            selected = flowId;
            least = service;
        }
    }
    NS_ASSERT_MSG(found, "No flow to select");

    auto it = m_flowQueues.find(selected);
    auto packet = it->second.front();
    it->second.pop_front();
    if (it->second.empty())
    {
        m_flowQueues.erase(it);
    }
    m_attainedService[selected] += packet->GetServiceTime();
    NS_LOG_DEBUG("Selected flow " << selected << "; attained service "
                                  << m_attainedService[selected].As(Time::S));
    return packet;
}

void
LasScheduler::DoReset()
{
    NS_LOG_FUNCTION(this);
    m_flowQueues.clear();
    m_attainedService.clear();
}

} // namespace ns3
