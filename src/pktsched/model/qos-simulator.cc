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

#include "qos-simulator.h"

#include "ns3/abort.h"
#include "ns3/assert.h"
#include "ns3/log.h"

#include <algorithm>

namespace ns3
{

NS_LOG_COMPONENT_DEFINE("QosSimulator");

QosSimulator::QosSimulator()
    : m_flowFairnessMode(FlowFairnessMode::AUTO)
{
    NS_LOG_FUNCTION(this);
}

void
QosSimulator::SetFlowFairnessMode(FlowFairnessMode mode)
{
    NS_LOG_FUNCTION(this << mode);
    m_flowFairnessMode = mode;
}

FlowFairnessMode
QosSimulator::GetFlowFairnessMode() const
{
    return m_flowFairnessMode;
}

SchedulerMetrics
QosSimulator::Run(std::vector<Ptr<QosPacket>> packets,
                  Ptr<PacketScheduler> scheduler) const
{
    NS_LOG_FUNCTION(this << packets.size() << scheduler);
    NS_ABORT_MSG_IF(!scheduler, "No scheduler to run");

    std::stable_sort(packets.begin(),
                     packets.end(),
                     [](const Ptr<QosPacket>& a, const Ptr<QosPacket>& b) {
                         return a->GetArrivalTime() < b->GetArrivalTime();
                     });

    scheduler->Initialize();
    scheduler->Reset();

    NS_LOG_INFO("Running " << scheduler->GetName() << " over " << packets.size() << " packets");

    auto next = packets.begin();
    while (next != packets.end() || !scheduler->IsEmpty())
    {
        while (next != packets.end() &&
               (*next)->GetArrivalTime() <= scheduler->GetCurrentTime())
        {
            NS_LOG_LOGIC("Offering " << **next);
            scheduler->Enqueue(*next);
            ++next;
        }

        if (!scheduler->IsEmpty())
        {
            auto packet = scheduler->Dequeue();
            NS_ASSERT_MSG(packet, "Non-empty scheduler returned no packet");
            NS_LOG_DEBUG("At " << scheduler->GetCurrentTime().As(Time::S) << " serviced "
                               << *packet);
        }
        else if (next != packets.end())
        {
            NS_LOG_LOGIC("Idle until " << (*next)->GetArrivalTime().As(Time::S));
            scheduler->AdvanceClock((*next)->GetArrivalTime());
        }
    }

    NS_LOG_INFO(scheduler->GetName() << " finished at "
                                     << scheduler->GetCurrentTime().As(Time::S) << ": "
                                     << scheduler->GetProcessedPackets().size() << " processed, "
                                     << scheduler->GetDroppedPackets().size() << " dropped");
    return scheduler->GetMetrics(m_flowFairnessMode);
}

} // namespace ns3
