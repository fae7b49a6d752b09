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

#ifndef SCHEDULER_METRICS_H
#define SCHEDULER_METRICS_H

#include "qos-packet.h"

#include "ns3/nstime.h"
#include "ns3/ptr.h"

#include <map>
#include <ostream>
#include <vector>

namespace ns3
{

/**
 * \ingroup pktsched
 *
 * Selects what the per-flow fairness index of SchedulerMetrics is computed over.
 */
enum class FlowFairnessMode
{
    LATENCY,          //!< Jain's index over the average latency of each flow
    THROUGHPUT_RATIO, //!< Jain's index over processed/offered of each flow
    AUTO,             //!< THROUGHPUT_RATIO if any packet was dropped, LATENCY otherwise
};

std::ostream& operator<<(std::ostream& os, FlowFairnessMode mode);

/**
 * \ingroup pktsched
 *
 * Outcome of one flow over a completed run.
 */
struct FlowStats
{
    uint32_t m_offered{0};   //!< Packets of the flow seen by the scheduler
    uint32_t m_processed{0}; //!< Packets of the flow serviced
    uint32_t m_dropped{0};   //!< Packets of the flow dropped
    double m_avgLatency{0};  //!< Average latency of serviced packets (seconds)

    /// \return processed / offered, or 0 if nothing was offered
    double GetThroughputRatio() const;
};

/**
 * \ingroup pktsched
 *
 * Metrics record of a completed run.  All values are finite and
 * non-negative; fairness indices lie in [0, 1].  Times are in seconds.
 */
struct SchedulerMetrics
{
    double m_avgLatency{0}; //!< Mean of finish - arrival over processed packets
    double m_avgWaitingTime{0}; //!< Mean of start - arrival over processed packets
    double m_throughput{0}; //!< Processed packets per second of logical time
    uint32_t m_processed{0};                                     //!< Number of processed packets
    uint32_t m_dropped{0};                                       //!< Number of dropped packets
    double m_dropRate{0}; //!< dropped / (processed + dropped)
    double m_fairnessIndex{1}; //!< Jain's index over per-packet latencies
    double m_flowFairnessIndex{1}; //!< Per-flow index selected by m_flowFairnessMode
    double m_flowLatencyFairness{1}; //!< Jain's index over per-flow average latency
    double m_flowThroughputFairness{1}; //!< Jain's index over per-flow throughput ratio
    FlowFairnessMode m_flowFairnessMode{FlowFairnessMode::AUTO}; //!< Mode requested
    double m_finalTime{0}; //!< Logical clock at the end of the run

    /// \return processed + dropped
    uint32_t GetOffered() const;
};

std::ostream& operator<<(std::ostream& os, const SchedulerMetrics& metrics);

/**
 * \brief Jain's fairness index (sum x)^2 / (n * sum x^2).
 *
 * Returns 1 for fewer than two values and 0 when every value is zero.
 *
 * \param values the samples
 * \return the index, in [0, 1]
 */
double JainFairnessIndex(const std::vector<double>& values);

/**
 * \brief Per-flow outcome of a run.
 * \param processed the processed packets
 * \param dropped the dropped packets
 * \return the statistics of every flow that offered at least one packet
 */
std::map<uint32_t, FlowStats> ComputeFlowStats(const std::vector<Ptr<QosPacket>>& processed,
                                               const std::vector<Ptr<QosPacket>>& dropped);

/**
 * \brief Derive the metrics of a completed run.
 * \param processed the processed packets, all with start and finish times
 * \param dropped the dropped packets
 * \param finalTime the final value of the logical clock
 * \param mode what the per-flow fairness index is computed over
 * \return the metrics record
 */
SchedulerMetrics ComputeMetrics(const std::vector<Ptr<QosPacket>>& processed,
                                const std::vector<Ptr<QosPacket>>& dropped,
                                Time finalTime,
                                FlowFairnessMode mode = FlowFairnessMode::AUTO);

} // namespace ns3

#endif /* SCHEDULER_METRICS_H */
