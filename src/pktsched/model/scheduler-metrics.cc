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

#include "scheduler-metrics.h"

#include "ns3/assert.h"
#include "ns3/log.h"

#include <algorithm>

namespace ns3
{

NS_LOG_COMPONENT_DEFINE("SchedulerMetrics");

std::ostream&
operator<<(std::ostream& os, FlowFairnessMode mode)
{
    switch (mode)
    {
    case FlowFairnessMode::LATENCY:
        return os << "LATENCY";
    case FlowFairnessMode::THROUGHPUT_RATIO:
        return os << "THROUGHPUT_RATIO";
    case FlowFairnessMode::AUTO:
        return os << "AUTO";
    }
    return os << "UNKNOWN";
}

double
FlowStats::GetThroughputRatio() const
{
    if (m_offered == 0)
    {
        return 0;
    }
    return static_cast<double>(m_processed) / m_offered;
}

uint32_t
SchedulerMetrics::GetOffered() const
{
    return m_processed + m_dropped;
}

std::ostream&
operator<<(std::ostream& os, const SchedulerMetrics& metrics)
{
    os << "processed " << metrics.m_processed << " dropped " << metrics.m_dropped
       << " dropRate " << metrics.m_dropRate << " avgLatency " << metrics.m_avgLatency
       << " avgWaiting " << metrics.m_avgWaitingTime << " throughput " << metrics.m_throughput
       << " fairness " << metrics.m_fairnessIndex << " flowFairness "
       << metrics.m_flowFairnessIndex << " (" << metrics.m_flowFairnessMode << ")";
    return os;
}

double
JainFairnessIndex(const std::vector<double>& values)
{
    if (values.size() <= 1)
    {
        return 1.0;
    }
    double sum = 0;
    double sumSq = 0;
    for (auto v : values)
    {
        sum += v;
        sumSq += v * v;
    }
    if (sumSq <= 0)
    {
        return 0.0;
    }
    // guard against rounding pushing identical samples above one
    return std::min(1.0, (sum * sum) / (values.size() * sumSq));
}

std::map<uint32_t, FlowStats>
ComputeFlowStats(const std::vector<Ptr<QosPacket>>& processed,
                 const std::vector<Ptr<QosPacket>>& dropped)
{
    std::map<uint32_t, FlowStats> flows;
    std::map<uint32_t, double> latencySums;
    for (const auto& packet : processed)
    {
        auto& stats = flows[packet->GetFlowId()];
        stats.m_offered++;
        stats.m_processed++;
        latencySums[packet->GetFlowId()] += packet->GetLatency().GetSeconds();
    }
    for (const auto& packet : dropped)
    {
        auto& stats = flows[packet->GetFlowId()];
        stats.m_offered++;
        stats.m_dropped++;
    }
    for (auto& [flowId, stats] : flows)
    {
        if (stats.m_processed > 0)
        {
            stats.m_avgLatency = latencySums[flowId] / stats.m_processed;
        }
    }
    return flows;
}

SchedulerMetrics
ComputeMetrics(const std::vector<Ptr<QosPacket>>& processed,
               const std::vector<Ptr<QosPacket>>& dropped,
               Time finalTime,
               FlowFairnessMode mode)
{
    NS_LOG_FUNCTION(processed.size() << dropped.size() << finalTime.As(Time::S) << mode);
    SchedulerMetrics metrics;
    metrics.m_processed = processed.size();
    metrics.m_dropped = dropped.size();
    metrics.m_flowFairnessMode = mode;
    metrics.m_finalTime = finalTime.GetSeconds();

    if (metrics.GetOffered() > 0)
    {
        metrics.m_dropRate = static_cast<double>(metrics.m_dropped) / metrics.GetOffered();
    }
    if (finalTime.IsStrictlyPositive())
    {
        metrics.m_throughput = metrics.m_processed / finalTime.GetSeconds();
    }

    std::vector<double> latencies;
    latencies.reserve(processed.size());
    double waitingSum = 0;
    for (const auto& packet : processed)
    {
        NS_ASSERT_MSG(packet->HasFinished(), "Processed packet " << *packet << " never finished");
        latencies.push_back(packet->GetLatency().GetSeconds());
        waitingSum += packet->GetWaitingTime().GetSeconds();
    }
    if (!latencies.empty())
    {
        double latencySum = 0;
        for (auto l : latencies)
        {
            latencySum += l;
        }
        metrics.m_avgLatency = latencySum / latencies.size();
        metrics.m_avgWaitingTime = waitingSum / latencies.size();
    }
    metrics.m_fairnessIndex = JainFairnessIndex(latencies);

    auto flows = ComputeFlowStats(processed, dropped);
    std::vector<double> flowLatencies;
    std::vector<double> flowRatios;
    for (const auto& [flowId, stats] : flows)
    {
        if (stats.m_processed > 0)
        {
            flowLatencies.push_back(stats.m_avgLatency);
        }
        flowRatios.push_back(stats.GetThroughputRatio());
    }
    metrics.m_flowLatencyFairness = JainFairnessIndex(flowLatencies);
    metrics.m_flowThroughputFairness = JainFairnessIndex(flowRatios);

    bool useRatio = (mode == FlowFairnessMode::THROUGHPUT_RATIO) ||
                    (mode == FlowFairnessMode::AUTO && metrics.m_dropped > 0);
    metrics.m_flowFairnessIndex =
        useRatio ? metrics.m_flowThroughputFairness : metrics.m_flowLatencyFairness;

    NS_LOG_DEBUG("Metrics: " << metrics);
    return metrics;
}

} // namespace ns3
