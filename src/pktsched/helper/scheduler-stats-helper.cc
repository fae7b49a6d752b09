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

#include "scheduler-stats-helper.h"

#include "ns3/log.h"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <utility>

namespace ns3
{

NS_LOG_COMPONENT_DEFINE("SchedulerStatsHelper");

namespace
{

/**
 * \param value the value
 * \param precision digits after the decimal point
 * \return the value formatted with fixed notation
 */
std::string
FormatFixed(double value, int precision)
{
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

/// How the cells of a report column are lined up
enum class ColumnAlign
{
    LEFT,    //!< Text, padded at right
    DECIMAL, //!< Numbers, lined up on the decimal point and right aligned
};

/**
 * \brief Pad the cells of a report column, and its optional header, to a common width.
 *
 * DECIMAL cells without a decimal point are lined up on their last
 * character, so integer columns end up right aligned.  The header is added
 * on top after the cells are lined up.
 *
 * \param cells the cells, padded in place
 * \param header the column header, not added if empty
 * \param align how the cells are lined up
 */
void
FormatColumn(std::vector<std::string>& cells, const std::string& header, ColumnAlign align)
{
    if (align == ColumnAlign::DECIMAL)
    {
        std::size_t intWidth = 0;
        std::size_t fracWidth = 0;
        for (const auto& cell : cells)
        {
            std::size_t point = std::min(cell.find('.'), cell.size());
            intWidth = std::max(intWidth, point);
            fracWidth = std::max(fracWidth, cell.size() - point);
        }
        for (auto& cell : cells)
        {
            std::size_t point = std::min(cell.find('.'), cell.size());
            std::size_t frac = cell.size() - point;
            cell = std::string(intWidth - point, ' ') + cell + std::string(fracWidth - frac, ' ');
        }
    }
    if (!header.empty())
    {
        cells.insert(cells.begin(), header);
    }

    std::size_t width = 0;
    for (const auto& cell : cells)
    {
        width = std::max(width, cell.size());
    }
    for (auto& cell : cells)
    {
        std::string padding(width - cell.size(), ' ');
        cell = (align == ColumnAlign::LEFT) ? cell + padding : padding + cell;
    }
}

} // namespace

SchedulerStatsHelper::SchedulerStatsHelper()
{
    NS_LOG_FUNCTION(this);
}

void
SchedulerStatsHelper::Add(Ptr<const PacketScheduler> scheduler, FlowFairnessMode mode)
{
    NS_LOG_FUNCTION(this << scheduler << mode);
    SchedulerRecord record;
    record.m_name = scheduler->GetName();
    record.m_metrics = scheduler->GetMetrics(mode);
    record.m_flowStats =
        ComputeFlowStats(scheduler->GetProcessedPackets(), scheduler->GetDroppedPackets());
    m_records.push_back(record);
}

void
SchedulerStatsHelper::Add(const std::string& name, const SchedulerMetrics& metrics)
{
    NS_LOG_FUNCTION(this << name);
    SchedulerRecord record;
    record.m_name = name;
    record.m_metrics = metrics;
    m_records.push_back(record);
}

void
SchedulerStatsHelper::Add(const SchedulerHelper::ComparisonResults& results)
{
    NS_LOG_FUNCTION(this << results.size());
    for (const auto& [name, metrics] : results)
    {
        Add(name, metrics);
    }
}

void
SchedulerStatsHelper::Reset()
{
    NS_LOG_FUNCTION(this);
    m_records.clear();
}

const std::vector<SchedulerRecord>&
SchedulerStatsHelper::GetRecords() const
{
    return m_records;
}

void
SchedulerStatsHelper::PrintStatistics(std::ostream& os) const
{
    NS_LOG_FUNCTION(this);

    std::vector<std::string> names;
    // header and cells of each metric column, in print order
    std::vector<std::pair<std::string, std::vector<std::string>>> columns{
        {"Avg Latency", {}},
        {"Avg Waiting", {}},
        {"Throughput", {}},
        {"Processed", {}},
        {"Dropped", {}},
        {"Drop Rate", {}},
        {"Pkt Fair", {}},
        {"Flow Fair", {}},
    };

    for (const auto& record : m_records)
    {
        const auto& m = record.m_metrics;
        names.push_back(record.m_name);
        columns[0].second.push_back(FormatFixed(m.m_avgLatency, 4));
        columns[1].second.push_back(FormatFixed(m.m_avgWaitingTime, 4));
        columns[2].second.push_back(FormatFixed(m.m_throughput, 4));
        columns[3].second.push_back(std::to_string(m.m_processed));
        columns[4].second.push_back(std::to_string(m.m_dropped));
        columns[5].second.push_back(FormatFixed(m.m_dropRate * 100, 1) + "%");
        columns[6].second.push_back(FormatFixed(m.m_fairnessIndex, 4));
        columns[7].second.push_back(FormatFixed(m.m_flowFairnessIndex, 4));
    }

    FormatColumn(names, "Scheduler", ColumnAlign::LEFT);
    for (auto& [header, cells] : columns)
    {
        FormatColumn(cells, header, ColumnAlign::DECIMAL);
    }

    os << std::endl << "---- Scheduler comparison ----" << std::endl;
    for (std::size_t row = 0; row < names.size(); row++)
    {
        os << names[row];
        for (const auto& column : columns)
        {
            os << "  " << column.second[row];
        }
        os << std::endl;
    }
    os << "Pkt Fair: Jain's index over packet latencies; Flow Fair: Jain's index over flows"
       << std::endl;
}

void
SchedulerStatsHelper::PrintFlowDrops(std::ostream& os) const
{
    NS_LOG_FUNCTION(this);

    for (const auto& record : m_records)
    {
        if (record.m_flowStats.empty())
        {
            continue;
        }
        os << std::endl << "---- Drops by flow for " << record.m_name << " ----" << std::endl;
        if (record.m_metrics.m_dropped == 0)
        {
            os << "No packet dropped" << std::endl;
            continue;
        }

        std::vector<std::string> flows;
        std::vector<std::string> counts;
        std::vector<std::string> shares;
        for (const auto& [flowId, stats] : record.m_flowStats)
        {
            flows.push_back("Flow " + std::to_string(flowId) + ":");
            counts.push_back(std::to_string(stats.m_dropped) + "/" +
                             std::to_string(stats.m_offered));
            double share = stats.m_offered ? 100.0 * stats.m_dropped / stats.m_offered : 0;
            shares.push_back("(" + FormatFixed(share, 1) + "%)");
        }
        FormatColumn(flows, "", ColumnAlign::LEFT);
        FormatColumn(counts, "", ColumnAlign::DECIMAL);
        FormatColumn(shares, "", ColumnAlign::DECIMAL);

        for (std::size_t row = 0; row < flows.size(); row++)
        {
            os << flows[row] << " " << counts[row] << " " << shares[row] << std::endl;
        }
    }
}

} // namespace ns3
