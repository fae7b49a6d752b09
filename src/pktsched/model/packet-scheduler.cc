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

#include "packet-scheduler.h"

#include "ns3/abort.h"
#include "ns3/assert.h"
#include "ns3/log.h"

#include <sstream>

namespace ns3
{

NS_LOG_COMPONENT_DEFINE("PacketScheduler");

NS_OBJECT_ENSURE_REGISTERED(PacketScheduler);

std::ostream&
operator<<(std::ostream& os, SchedulerType type)
{
    switch (type)
    {
    case SchedulerType::FCFS:
        return os << "FCFS";
    case SchedulerType::PRIORITY:
        return os << "Priority Queue";
    case SchedulerType::ROUND_ROBIN:
        return os << "Round-Robin";
    case SchedulerType::FAIR_QUEUE:
        return os << "Fair Queue";
    case SchedulerType::LAS:
        return os << "LAS Queue";
    }
    return os << "Unknown";
}

uint32_t
PacketScheduler::Stats::GetNDroppedPackets(const std::string& reason) const
{
    auto it = nDroppedPackets.find(reason);
    if (it != nDroppedPackets.end())
    {
        return it->second;
    }
    return 0;
}

void
PacketScheduler::Stats::Print(std::ostream& os) const
{
    os << std::endl
       << "Packets offered:                        " << nTotalOfferedPackets << std::endl
       << "Packets enqueued:                       " << nTotalEnqueuedPackets << std::endl
       << "Packets serviced:                       " << nTotalServicedPackets << std::endl
       << "Packets dropped:                        " << nTotalDroppedPackets << std::endl
       << "Packets dropped before enqueue:         " << nTotalDroppedPacketsBeforeEnqueue;
    for (const auto& [reason, count] : nDroppedPackets)
    {
        os << std::endl << "  " << reason << ": " << count;
    }
    os << std::endl
       << "Packets dropped after enqueue:          " << nTotalDroppedPacketsAfterEnqueue
       << std::endl;
}

std::ostream&
operator<<(std::ostream& os, const PacketScheduler::Stats& stats)
{
    stats.Print(os);
    return os;
}

TypeId
PacketScheduler::GetTypeId()
{
    static TypeId tid =
        TypeId("ns3::PacketScheduler")
            .SetParent<Object>()
            .SetGroupName("PacketScheduling")
            .AddAttribute("MaxSize",
                          "The capacity bound of the scheduler buffer, in packets "
                          "(0p means unbounded)",
                          QueueSizeValue(QueueSize(QueueSizeUnit::PACKETS, 0)),
                          MakeQueueSizeAccessor(&PacketScheduler::SetMaxSize,
                                                &PacketScheduler::GetMaxSize),
                          MakeQueueSizeChecker())
            .AddTraceSource("Enqueue",
                            "Packet admitted to the scheduler buffer",
                            MakeTraceSourceAccessor(&PacketScheduler::m_traceEnqueue),
                            "ns3::QosPacket::TracedCallback")
            .AddTraceSource("Dequeue",
                            "Packet selected and serviced by the scheduler",
                            MakeTraceSourceAccessor(&PacketScheduler::m_traceDequeue),
                            "ns3::QosPacket::TracedCallback")
            .AddTraceSource("Drop",
                            "Packet dropped by the scheduler, with the reason",
                            MakeTraceSourceAccessor(&PacketScheduler::m_traceDrop),
                            "ns3::PacketScheduler::DropTracedCallback");
    return tid;
}

PacketScheduler::PacketScheduler()
    : m_maxSize(QueueSizeUnit::PACKETS, 0),
      m_now(Seconds(0))
{
    NS_LOG_FUNCTION(this);
}

PacketScheduler::~PacketScheduler()
{
    NS_LOG_FUNCTION(this);
}

void
PacketScheduler::DoDispose()
{
    NS_LOG_FUNCTION(this);
    m_processed.clear();
    m_dropped.clear();
    Object::DoDispose();
}

void
PacketScheduler::DoInitialize()
{
    NS_LOG_FUNCTION(this);
    NS_ABORT_MSG_IF(!CheckConfig(), "Invalid configuration of scheduler " << GetName());
    Object::DoInitialize();
}

bool
PacketScheduler::CheckConfig()
{
    NS_LOG_FUNCTION(this);
    if (m_maxSize.GetUnit() != QueueSizeUnit::PACKETS)
    {
        NS_LOG_ERROR("The capacity bound of " << GetName() << " must be expressed in packets");
        return false;
    }
    return true;
}

std::string
PacketScheduler::GetName() const
{
    std::ostringstream oss;
    oss << GetSchedulerType();
    return oss.str();
}

void
PacketScheduler::SetMaxSize(QueueSize size)
{
    NS_LOG_FUNCTION(this << size);
    NS_ABORT_MSG_IF(size.GetUnit() != QueueSizeUnit::PACKETS,
                    "The capacity bound must be expressed in packets, got " << size);
    m_maxSize = size;
}

QueueSize
PacketScheduler::GetMaxSize() const
{
    return m_maxSize;
}

bool
PacketScheduler::HasCapacityBound() const
{
    return m_maxSize.GetValue() > 0;
}

bool
PacketScheduler::Enqueue(Ptr<QosPacket> packet)
{
    NS_LOG_FUNCTION(this << packet);
    NS_ASSERT_MSG(packet, "Cannot enqueue a null packet");
    if (!IsInitialized())
    {
        Initialize();
    }

    m_stats.nTotalOfferedPackets++;
    uint32_t droppedBefore [[maybe_unused]] = m_stats.nTotalDroppedPacketsBeforeEnqueue;

    bool retval = DoEnqueue(packet);
    if (retval)
    {
        m_nPackets++;
        m_stats.nTotalEnqueuedPackets++;
        NS_LOG_LOGIC("Admitted " << *packet << "; buffered packets: " << m_nPackets);
        m_traceEnqueue(packet);
    }
    else
    {
        NS_ASSERT_MSG(m_stats.nTotalDroppedPacketsBeforeEnqueue == droppedBefore + 1,
                      "A refused packet must be dropped with DropBeforeEnqueue");
    }
    return retval;
}

Ptr<QosPacket>
PacketScheduler::Dequeue()
{
    NS_LOG_FUNCTION(this);
    if (m_nPackets == 0)
    {
        NS_LOG_LOGIC("No packet available");
        return nullptr;
    }

    auto packet = DoDequeue();
    NS_ASSERT_MSG(packet, "Scheduler " << GetName() << " failed to select a packet");
    m_nPackets--;

    if (!packet->HasStarted())
    {
        packet->SetStartTime(m_now);
    }
    m_now += packet->GetServiceTime();
    packet->SetFinishTime(m_now);
    m_processed.push_back(packet);
    m_stats.nTotalServicedPackets++;

    NS_LOG_DEBUG("Serviced " << *packet << " from " << packet->GetStartTime().As(Time::S)
                             << " to " << m_now.As(Time::S));
    m_traceDequeue(packet);
    return packet;
}

bool
PacketScheduler::IsEmpty() const
{
    return m_nPackets == 0;
}

uint32_t
PacketScheduler::GetNPackets() const
{
    return m_nPackets;
}

Time
PacketScheduler::GetCurrentTime() const
{
    return m_now;
}

void
PacketScheduler::AdvanceClock(Time time)
{
    NS_LOG_FUNCTION(this << time.As(Time::S));
    NS_ASSERT_MSG(time >= m_now,
                  "Cannot move the clock back from " << m_now.As(Time::S) << " to "
                                                     << time.As(Time::S));
    m_now = time;
}

void
PacketScheduler::Reset()
{
    NS_LOG_FUNCTION(this);
    m_now = Seconds(0);
    m_nPackets = 0;
    m_processed.clear();
    m_dropped.clear();
    m_stats = Stats();
    DoReset();
}

const std::vector<Ptr<QosPacket>>&
PacketScheduler::GetProcessedPackets() const
{
    return m_processed;
}

const std::vector<Ptr<QosPacket>>&
PacketScheduler::GetDroppedPackets() const
{
    return m_dropped;
}

FlowPacketMap
PacketScheduler::GetProcessedPacketsByFlow() const
{
    return GroupByFlow(m_processed);
}

const PacketScheduler::Stats&
PacketScheduler::GetStats() const
{
    return m_stats;
}

SchedulerMetrics
PacketScheduler::GetMetrics(FlowFairnessMode mode) const
{
    NS_LOG_FUNCTION(this << mode);
    return ComputeMetrics(m_processed, m_dropped, m_now, mode);
}

void
PacketScheduler::DropBeforeEnqueue(Ptr<QosPacket> packet, const char* reason)
{
    NS_LOG_FUNCTION(this << packet << reason);
    m_stats.nTotalDroppedPackets++;
    m_stats.nTotalDroppedPacketsBeforeEnqueue++;
    m_stats.nDroppedPackets[reason]++;
    m_dropped.push_back(packet);
    NS_LOG_DEBUG("Dropped " << *packet << " before enqueue: " << reason);
    m_traceDrop(packet, reason);
}

void
PacketScheduler::DropAfterEnqueue(Ptr<QosPacket> packet, const char* reason)
{
    NS_LOG_FUNCTION(this << packet << reason);
    NS_ASSERT_MSG(m_nPackets > 0, "Cannot evict from an empty scheduler");
    m_nPackets--;
    m_stats.nTotalDroppedPackets++;
    m_stats.nTotalDroppedPacketsAfterEnqueue++;
    m_stats.nDroppedPackets[reason]++;
    m_dropped.push_back(packet);
    NS_LOG_DEBUG("Evicted " << *packet << " after enqueue: " << reason);
    m_traceDrop(packet, reason);
}

} // namespace ns3
