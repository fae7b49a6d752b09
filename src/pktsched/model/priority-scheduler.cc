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

#include "priority-scheduler.h"

#include "ns3/log.h"

namespace ns3
{

NS_LOG_COMPONENT_DEFINE("PriorityScheduler");

NS_OBJECT_ENSURE_REGISTERED(PriorityScheduler);

TypeId
PriorityScheduler::GetTypeId()
{
    static TypeId tid = TypeId("ns3::PriorityScheduler")
                            .SetParent<PacketScheduler>()
                            .SetGroupName("PacketScheduling")
                            .AddConstructor<PriorityScheduler>();
    return tid;
}

PriorityScheduler::PriorityScheduler()
    : PacketScheduler()
{
    NS_LOG_FUNCTION(this);
}

PriorityScheduler::~PriorityScheduler()
{
    NS_LOG_FUNCTION(this);
}

SchedulerType
PriorityScheduler::GetSchedulerType() const
{
    return SchedulerType::PRIORITY;
}

bool
PriorityScheduler::ServedAfter::operator()(const Entry& a, const Entry& b) const
{
    if (b.packet->HasPrecedenceOver(*a.packet))
    {
        return true;
    }
    if (a.packet->HasPrecedenceOver(*b.packet))
    {
        return false;
    }
    return a.seq > b.seq;
}

bool
PriorityScheduler::DoEnqueue(Ptr<QosPacket> packet)
{
    NS_LOG_FUNCTION(this << packet);
    if (HasCapacityBound() && m_heap.size() >= GetMaxSize().GetValue())
    {
        NS_LOG_LOGIC("Queue full -- dropping pkt");
        DropBeforeEnqueue(packet, LIMIT_EXCEEDED_DROP);
        return false;
    }
    m_heap.push({packet, m_seq++});
    return true;
}

Ptr<QosPacket>
PriorityScheduler::DoDequeue()
{
    NS_LOG_FUNCTION(this);
    auto packet = m_heap.top().packet;
    m_heap.pop();
    NS_LOG_LOGIC("Selected priority " << packet->GetPriority() << "; " << m_heap.size()
                                      << " packets left");
    return packet;
}

void
PriorityScheduler::DoReset()
{
    NS_LOG_FUNCTION(this);
    m_heap = decltype(m_heap)();
    m_seq = 0;
}

} // namespace ns3
