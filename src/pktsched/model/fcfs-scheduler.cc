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

#include "fcfs-scheduler.h"

#include "ns3/log.h"

namespace ns3
{

NS_LOG_COMPONENT_DEFINE("FcfsScheduler");

NS_OBJECT_ENSURE_REGISTERED(FcfsScheduler);

TypeId
FcfsScheduler::GetTypeId()
{
    static TypeId tid = TypeId("ns3::FcfsScheduler")
                            .SetParent<PacketScheduler>()
                            .SetGroupName("PacketScheduling")
                            .AddConstructor<FcfsScheduler>();
    return tid;
}

FcfsScheduler::FcfsScheduler()
    : PacketScheduler()
{
    NS_LOG_FUNCTION(this);
}

FcfsScheduler::~FcfsScheduler()
{
    NS_LOG_FUNCTION(this);
}

SchedulerType
FcfsScheduler::GetSchedulerType() const
{
    return SchedulerType::FCFS;
}

bool
FcfsScheduler::DoEnqueue(Ptr<QosPacket> packet)
{
    NS_LOG_FUNCTION(this << packet);
    if (HasCapacityBound() && m_queue.size() >= GetMaxSize().GetValue())
    {
        NS_LOG_LOGIC("Queue full -- dropping pkt");
        DropBeforeEnqueue(packet, LIMIT_EXCEEDED_DROP);
        return false;
    }
    m_queue.push_back(packet);
    return true;
}

Ptr<QosPacket>
FcfsScheduler::DoDequeue()
{
    NS_LOG_FUNCTION(this);
    auto packet = m_queue.front();
    m_queue.pop_front();
    return packet;
}

void
FcfsScheduler::DoReset()
{
    NS_LOG_FUNCTION(this);
    m_queue.clear();
}

} // namespace ns3
