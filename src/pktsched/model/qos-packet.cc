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

#include "qos-packet.h"

#include "ns3/abort.h"
#include "ns3/assert.h"
#include "ns3/log.h"

namespace ns3
{

NS_LOG_COMPONENT_DEFINE("QosPacket");

QosPacket::QosPacket(uint32_t uid,
                     Time arrivalTime,
                     uint32_t flowId,
                     uint32_t size,
                     Time serviceTime)
    : m_uid(uid),
      m_arrivalTime(arrivalTime),
      m_flowId(flowId),
      m_size(size),
      m_serviceTime(serviceTime)
{
    NS_LOG_FUNCTION(this << uid << arrivalTime.As(Time::S) << flowId << size
                         << serviceTime.As(Time::S));
    NS_ABORT_MSG_IF(arrivalTime.IsStrictlyNegative(),
                    "Packet " << uid << " has a negative arrival time");
    NS_ABORT_MSG_IF(flowId == 0, "Packet " << uid << " needs a strictly positive flow id");
    NS_ABORT_MSG_IF(!serviceTime.IsStrictlyPositive(),
                    "Packet " << uid << " needs a strictly positive service time");
}

Ptr<QosPacket>
QosPacket::Copy() const
{
    NS_LOG_FUNCTION(this);
    return Create<QosPacket>(m_uid, m_arrivalTime, m_flowId, m_size, m_serviceTime);
}

uint32_t
QosPacket::GetUid() const
{
    return m_uid;
}

Time
QosPacket::GetArrivalTime() const
{
    return m_arrivalTime;
}

uint32_t
QosPacket::GetFlowId() const
{
    return m_flowId;
}

uint32_t
QosPacket::GetPriority() const
{
    return m_flowId;
}

uint32_t
QosPacket::GetSize() const
{
    return m_size;
}

Time
QosPacket::GetServiceTime() const
{
    return m_serviceTime;
}

void
QosPacket::SetStartTime(Time start)
{
    NS_LOG_FUNCTION(this << start.As(Time::S));
    NS_ASSERT_MSG(!m_startTime.has_value(), "Start time of packet " << m_uid << " already set");
    m_startTime = start;
}

void
QosPacket::SetFinishTime(Time finish)
{
    NS_LOG_FUNCTION(this << finish.As(Time::S));
    NS_ASSERT_MSG(m_startTime.has_value(),
                  "Packet " << m_uid << " cannot finish before it started");
    NS_ASSERT_MSG(!m_finishTime.has_value(),
                  "Finish time of packet " << m_uid << " already set");
    m_finishTime = finish;
}

bool
QosPacket::HasStarted() const
{
    return m_startTime.has_value();
}

bool
QosPacket::HasFinished() const
{
    return m_finishTime.has_value();
}

Time
QosPacket::GetStartTime() const
{
    NS_ASSERT_MSG(m_startTime.has_value(), "Packet " << m_uid << " has not started");
    return *m_startTime;
}

Time
QosPacket::GetFinishTime() const
{
    NS_ASSERT_MSG(m_finishTime.has_value(), "Packet " << m_uid << " has not finished");
    return *m_finishTime;
}

Time
QosPacket::GetLatency() const
{
    return GetFinishTime() - m_arrivalTime;
}

Time
QosPacket::GetWaitingTime() const
{
    return GetStartTime() - m_arrivalTime;
}

bool
QosPacket::HasPrecedenceOver(const QosPacket& other) const
{
    if (m_flowId != other.m_flowId)
    {
        return m_flowId > other.m_flowId;
    }
    return m_arrivalTime < other.m_arrivalTime;
}

std::ostream&
operator<<(std::ostream& os, const QosPacket& packet)
{
    os << "QosPacket(uid=" << packet.GetUid()
       << ", arrival=" << packet.GetArrivalTime().As(Time::S)
       << ", flow=" << packet.GetFlowId() << ", size=" << packet.GetSize()
       << ", service=" << packet.GetServiceTime().As(Time::S) << ")";
    return os;
}

FlowPacketMap
GroupByFlow(const std::vector<Ptr<QosPacket>>& packets)
{
    FlowPacketMap flows;
    for (const auto& packet : packets)
    {
        flows[packet->GetFlowId()].push_back(packet);
    }
    return flows;
}

std::vector<Ptr<QosPacket>>
CopyPackets(const std::vector<Ptr<QosPacket>>& packets)
{
    std::vector<Ptr<QosPacket>> copies;
    copies.reserve(packets.size());
    for (const auto& packet : packets)
    {
        copies.push_back(packet->Copy());
    }
    return copies;
}

} // namespace ns3
