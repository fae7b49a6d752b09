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

#ifndef SCHEDULER_STATS_HELPER_H
#define SCHEDULER_STATS_HELPER_H

#include "scheduler-helper.h"

#include "pktsched/packet-scheduler.h"
#include "pktsched/scheduler-metrics.h"

#include "ns3/ptr.h"

#include <map>
#include <ostream>
#include <string>
#include <vector>

namespace ns3
{

/**
 * Data structure to keep the results of one scheduler run.  m_flowStats is
 * empty when the record was built from metrics only.
 */
struct SchedulerRecord
{
    std::string m_name;                        //!< Name shown in the reports
    SchedulerMetrics m_metrics;                //!< Metrics of the run
    std::map<uint32_t, FlowStats> m_flowStats; //!< Per-flow statistics, by flow id
};

/**
 * \ingroup pktsched
 * \brief Collect the results of scheduler runs and print them as tables.
 *
 * The helper keeps one record per scheduler run, in the order they were
 * added.  At the end of an experiment it can print a comparison of the
 * metrics of all the runs and, for the runs added with their scheduler, the
 * packets dropped from each flow.  The records can also be exported for
 * custom printing or statistics handling.
 */
class SchedulerStatsHelper
{
  public:
    SchedulerStatsHelper();

    /**
     * \brief Record the current results of a scheduler, typically at the end of a run.
     * \param scheduler the scheduler
     * \param mode what the per-flow fairness index is computed over
     */
    void Add(Ptr<const PacketScheduler> scheduler,
             FlowFairnessMode mode = FlowFairnessMode::AUTO);

    /**
     * \brief Record the metrics of a run.
     * \param name name shown in the reports
     * \param metrics the metrics
     */
    void Add(const std::string& name, const SchedulerMetrics& metrics);

    /**
     * \brief Record the results of a comparison.
     * \param results the results returned by SchedulerHelper::Compare()
     */
    void Add(const SchedulerHelper::ComparisonResults& results);

    /**
     * Removes all the records.
     */
    void Reset();

    /**
     * Print the metrics of all the records as a table, one row per record.
     *
     * \param os The output stream to print to
     */
    void PrintStatistics(std::ostream& os) const;

    /**
     * Print the number and share of packets dropped from each flow, for the
     * records that carry per-flow statistics.
     *
     * \param os The output stream to print to
     */
    void PrintFlowDrops(std::ostream& os) const;

    /**
     * Returns the records, in the order they were added.
     */
    const std::vector<SchedulerRecord>& GetRecords() const;

  private:
    std::vector<SchedulerRecord> m_records; //!< The records
};

} // namespace ns3

#endif /* SCHEDULER_STATS_HELPER_H */
