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

#include "traffic-generator.h"

#include "ns3/abort.h"
#include "ns3/double.h"
#include "ns3/log.h"
#include "ns3/uinteger.h"

#include <algorithm>

namespace ns3
{

NS_LOG_COMPONENT_DEFINE("TrafficGenerator");

NS_OBJECT_ENSURE_REGISTERED(TrafficGenerator);

namespace
{

/**
 * \brief Pick an index with probability proportional to its weight.
 * \param uniform the random variable to draw from
 * \param weights the weights, with a positive sum
 * \return the index drawn
 */
std::size_t
DrawWeightedIndex(Ptr<UniformRandomVariable> uniform, const std::vector<double>& weights)
{
    double total = 0;
    for (auto w : weights)
    {
        total += w;
    }
    double draw = uniform->GetValue(0, total);
    for (std::size_t i = 0; i < weights.size(); i++)
    {
        if (draw < weights[i])
        {
            return i;
        }
        draw -= weights[i];
    }
    // rounding may leave draw at the very end of the range
    return weights.size() - 1;
}

/**
 * \brief Check that a set of weights can be drawn from.  Aborts otherwise.
 * \param weights the weights
 */
void
CheckWeights(const std::vector<double>& weights)
{
    NS_ABORT_MSG_IF(weights.empty(), "At least one weight is needed");
    double total = 0;
    for (auto w : weights)
    {
        NS_ABORT_MSG_IF(w < 0, "Negative weight " << w);
        total += w;
    }
    NS_ABORT_MSG_IF(total <= 0, "The weights must have a positive sum");
}

} // namespace

std::ostream&
operator<<(std::ostream& os, TrafficScenario scenario)
{
    switch (scenario)
    {
    case TrafficScenario::MESSAGE_TEXTING:
        return os << "Message Texting";
    case TrafficScenario::VIDEO_STREAMING:
        return os << "Video Streaming";
    case TrafficScenario::ONLINE_MEETING:
        return os << "Online Meeting";
    case TrafficScenario::FILE_DOWNLOAD:
        return os << "File Download";
    case TrafficScenario::MICE_AND_ELEPHANTS:
        return os << "Mice and Elephants";
    }
    return os << "Unknown scenario";
}

TypeId
TrafficGenerator::GetTypeId()
{
    static TypeId tid =
        TypeId("ns3::TrafficGenerator")
            .SetParent<Object>()
            .SetGroupName("PacketScheduling")
            .AddConstructor<TrafficGenerator>()
            .AddAttribute("ArrivalRate",
                          "Mean number of packets (Poisson) or bursts (bursty) per second",
                          DoubleValue(1.0),
                          MakeDoubleAccessor(&TrafficGenerator::m_arrivalRate),
                          MakeDoubleChecker<double>(1e-9))
            .AddAttribute("MinServiceTime",
                          "Smallest service time of a generated packet",
                          TimeValue(Seconds(0.5)),
                          MakeTimeAccessor(&TrafficGenerator::m_minServiceTime),
                          MakeTimeChecker(NanoSeconds(1)))
            .AddAttribute("MaxServiceTime",
                          "Largest service time of a generated packet",
                          TimeValue(Seconds(2)),
                          MakeTimeAccessor(&TrafficGenerator::m_maxServiceTime),
                          MakeTimeChecker(NanoSeconds(1)))
            .AddAttribute("BurstSize",
                          "Number of packets of a burst",
                          UintegerValue(5),
                          MakeUintegerAccessor(&TrafficGenerator::m_burstSize),
                          MakeUintegerChecker<uint32_t>(1))
            .AddAttribute("BurstSpacing",
                          "Gap between consecutive packets of a burst",
                          TimeValue(MilliSeconds(10)),
                          MakeTimeAccessor(&TrafficGenerator::m_burstSpacing),
                          MakeTimeChecker(Seconds(0)));
    return tid;
}

TrafficGenerator::TrafficGenerator()
    : m_flowWeights{{1, 0.5}, {2, 0.3}, {3, 0.2}},
      m_sizeClasses{{500, 1000, 0.3}, {1000, 2000, 0.5}, {2000, 5000, 0.2}}
{
    NS_LOG_FUNCTION(this);
    m_gap = CreateObject<ExponentialRandomVariable>();
    m_uniform = CreateObject<UniformRandomVariable>();
}

TrafficGenerator::~TrafficGenerator()
{
    NS_LOG_FUNCTION(this);
}

void
TrafficGenerator::DoDispose()
{
    NS_LOG_FUNCTION(this);
    m_gap = nullptr;
    m_uniform = nullptr;
    Object::DoDispose();
}

void
TrafficGenerator::SetFlowWeights(const std::map<uint32_t, double>& weights)
{
    NS_LOG_FUNCTION(this << weights.size());
    std::vector<double> values;
    for (const auto& [flowId, weight] : weights)
    {
        NS_ABORT_MSG_IF(flowId == 0, "Flow ids must be positive");
        values.push_back(weight);
    }
    CheckWeights(values);
    m_flowWeights = weights;
}

const std::map<uint32_t, double>&
TrafficGenerator::GetFlowWeights() const
{
    return m_flowWeights;
}

void
TrafficGenerator::SetSizeClasses(const std::vector<SizeClass>& classes)
{
    NS_LOG_FUNCTION(this << classes.size());
    std::vector<double> values;
    for (const auto& c : classes)
    {
        NS_ABORT_MSG_IF(c.m_minSize > c.m_maxSize,
                        "Empty size class [" << c.m_minSize << ", " << c.m_maxSize << "]");
        values.push_back(c.m_weight);
    }
    CheckWeights(values);
    m_sizeClasses = classes;
}

const std::vector<TrafficGenerator::SizeClass>&
TrafficGenerator::GetSizeClasses() const
{
    return m_sizeClasses;
}

uint32_t
TrafficGenerator::GetNextUid() const
{
    return m_nextUid;
}

int64_t
TrafficGenerator::AssignStreams(int64_t stream)
{
    NS_LOG_FUNCTION(this << stream);
    m_gap->SetStream(stream);
    m_uniform->SetStream(stream + 1);
    return 2;
}

void
TrafficGenerator::CheckServiceTimeRange() const
{
    NS_ABORT_MSG_IF(m_maxServiceTime < m_minServiceTime,
                    "MaxServiceTime " << m_maxServiceTime.As(Time::S)
                                      << " is smaller than MinServiceTime "
                                      << m_minServiceTime.As(Time::S));
}

Time
TrafficGenerator::NextGap()
{
    return Seconds(m_gap->GetValue(1.0 / m_arrivalRate, 0));
}

Ptr<QosPacket>
TrafficGenerator::MakePacket(Time arrival,
                             uint32_t flowId,
                             uint32_t minSize,
                             uint32_t maxSize,
                             double minService,
                             double maxService)
{
    uint32_t size = m_uniform->GetInteger(minSize, maxSize);
    double service = m_uniform->GetValue(minService, maxService);
    return Create<QosPacket>(m_nextUid++, arrival, flowId, size, Seconds(service));
}

Ptr<QosPacket>
TrafficGenerator::DrawPacket(Time arrival)
{
    std::vector<uint32_t> flows;
    std::vector<double> flowWeights;
    for (const auto& [flowId, weight] : m_flowWeights)
    {
        flows.push_back(flowId);
        flowWeights.push_back(weight);
    }
    uint32_t flowId = flows[DrawWeightedIndex(m_uniform, flowWeights)];

    std::vector<double> sizeWeights;
    for (const auto& c : m_sizeClasses)
    {
        sizeWeights.push_back(c.m_weight);
    }
    const auto& sizeClass = m_sizeClasses[DrawWeightedIndex(m_uniform, sizeWeights)];

    auto packet = MakePacket(arrival,
                             flowId,
                             sizeClass.m_minSize,
                             sizeClass.m_maxSize,
                             m_minServiceTime.GetSeconds(),
                             m_maxServiceTime.GetSeconds());
    NS_LOG_LOGIC("Generated " << *packet);
    return packet;
}

std::vector<Ptr<QosPacket>>
TrafficGenerator::GeneratePoisson(uint32_t nPackets)
{
    NS_LOG_FUNCTION(this << nPackets);
    CheckServiceTimeRange();
    std::vector<Ptr<QosPacket>> packets;
    Time now;
    for (uint32_t i = 0; i < nPackets; i++)
    {
        now += NextGap();
        packets.push_back(DrawPacket(now));
    }
    return packets;
}

std::vector<Ptr<QosPacket>>
TrafficGenerator::GenerateBursty(uint32_t nPackets)
{
    NS_LOG_FUNCTION(this << nPackets);
    CheckServiceTimeRange();
    std::vector<Ptr<QosPacket>> packets;
    Time burstStart;
    while (packets.size() < nPackets)
    {
        burstStart += NextGap();
        NS_LOG_DEBUG("Burst starting at " << burstStart.As(Time::S));
        for (uint32_t i = 0; i < m_burstSize && packets.size() < nPackets; i++)
        {
            Time arrival = burstStart + m_burstSpacing * static_cast<int64_t>(i);
            packets.push_back(DrawPacket(arrival));
        }
    }
    return packets;
}

std::vector<Ptr<QosPacket>>
TrafficGenerator::GenerateScenario(TrafficScenario scenario)
{
    NS_LOG_FUNCTION(this << scenario);
    std::vector<Ptr<QosPacket>> packets;

    switch (scenario)
    {
    case TrafficScenario::MESSAGE_TEXTING:
        for (uint32_t user = 1; user <= 3; user++)
        {
            uint32_t nMessages = m_uniform->GetInteger(5, 15);
            double base = m_uniform->GetValue(0, 2);
            for (uint32_t msg = 0; msg < nMessages; msg++)
            {
                Time arrival = Seconds(base + msg * m_uniform->GetValue(0.1, 0.5));
                packets.push_back(MakePacket(arrival, user, 100, 500, 0.01, 0.05));
            }
        }
        break;
    case TrafficScenario::VIDEO_STREAMING:
        // HD stream
        for (uint32_t i = 0; i < 50; i++)
        {
            packets.push_back(MakePacket(Seconds(i * 0.1), 1, 3000, 5000, 0.3, 0.5));
        }
        // SD stream
        for (uint32_t i = 0; i < 30; i++)
        {
            Time arrival = Seconds(i * 0.15 + 0.05);
            packets.push_back(MakePacket(arrival, 2, 1000, 2000, 0.1, 0.2));
        }
        break;
    case TrafficScenario::ONLINE_MEETING:
        for (uint32_t participant = 1; participant <= 3; participant++)
        {
            // audio
            for (uint32_t i = 0; i < 30; i++)
            {
                Time arrival = Seconds(i * 0.05 + participant * 0.01);
                packets.push_back(MakePacket(arrival, participant, 200, 400, 0.02, 0.05));
            }
            // video
            for (uint32_t i = 0; i < 15; i++)
            {
                Time arrival = Seconds(i * 0.2 + participant * 0.02);
                packets.push_back(MakePacket(arrival, participant, 1500, 3000, 0.1, 0.2));
            }
        }
        break;
    case TrafficScenario::FILE_DOWNLOAD:
        for (uint32_t i = 0; i < 60; i++)
        {
            packets.push_back(MakePacket(Seconds(i * 0.05), 1, 4000, 5000, 0.4, 0.6));
        }
        for (uint32_t i = 0; i < 15; i++)
        {
            Time arrival = Seconds(i * 0.3 + 0.1);
            packets.push_back(MakePacket(arrival, 2, 500, 1000, 0.05, 0.1));
        }
        for (uint32_t i = 0; i < 10; i++)
        {
            Time arrival = Seconds(i * 0.4 + 0.2);
            packets.push_back(MakePacket(arrival, 3, 500, 1000, 0.05, 0.1));
        }
        break;
    case TrafficScenario::MICE_AND_ELEPHANTS:
        for (uint32_t i = 0; i < 40; i++)
        {
            packets.push_back(MakePacket(Seconds(i * 0.08), 1, 4000, 5000, 0.4, 0.6));
        }
        for (uint32_t i = 0; i < 35; i++)
        {
            Time arrival = Seconds(i * 0.09 + 0.5);
            packets.push_back(MakePacket(arrival, 2, 4000, 5000, 0.4, 0.6));
        }
        for (uint32_t mouse = 3; mouse <= 12; mouse++)
        {
            uint32_t nPackets = m_uniform->GetInteger(2, 4);
            double start = m_uniform->GetValue(0.2, 2.5);
            for (uint32_t i = 0; i < nPackets; i++)
            {
                Time arrival = Seconds(start + i * 0.02);
                packets.push_back(MakePacket(arrival, mouse, 200, 500, 0.02, 0.05));
            }
        }
        break;
    default:
        NS_ABORT_MSG("Unknown traffic scenario " << static_cast<int>(scenario));
    }

    std::stable_sort(packets.begin(),
                     packets.end(),
                     [](const Ptr<QosPacket>& a, const Ptr<QosPacket>& b) {
                         return a->GetArrivalTime() < b->GetArrivalTime();
                     });
    NS_LOG_INFO("Scenario " << scenario << ": " << packets.size() << " packets");
    return packets;
}

} // namespace ns3
