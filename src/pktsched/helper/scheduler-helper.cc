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

#include "scheduler-helper.h"

#include "pktsched/fair-queue-scheduler.h"
#include "pktsched/fcfs-scheduler.h"
#include "pktsched/las-scheduler.h"
#include "pktsched/priority-scheduler.h"
#include "pktsched/round-robin-scheduler.h"

#include "ns3/abort.h"
#include "ns3/log.h"
#include "ns3/queue-size.h"

namespace ns3
{

NS_LOG_COMPONENT_DEFINE("SchedulerHelper");

SchedulerHelper::SchedulerHelper()
{
    m_factory.SetTypeId(FcfsScheduler::GetTypeId());
}

Ptr<PacketScheduler>
SchedulerHelper::Create() const
{
    NS_LOG_FUNCTION(this);
    return m_factory.Create<PacketScheduler>();
}

Ptr<PacketScheduler>
SchedulerHelper::Create(SchedulerType type, uint32_t maxSize)
{
    NS_LOG_FUNCTION(type << maxSize);
    Ptr<PacketScheduler> scheduler;
    switch (type)
    {
    case SchedulerType::FCFS:
        scheduler = CreateObject<FcfsScheduler>();
        break;
    case SchedulerType::PRIORITY:
        scheduler = CreateObject<PriorityScheduler>();
        break;
    case SchedulerType::ROUND_ROBIN:
        scheduler = CreateObject<RoundRobinScheduler>();
        break;
    case SchedulerType::FAIR_QUEUE:
        scheduler = CreateObject<FairQueueScheduler>();
        break;
    case SchedulerType::LAS:
        scheduler = CreateObject<LasScheduler>();
        break;
    default:
        NS_ABORT_MSG("Unknown scheduler type " << static_cast<int>(type));
    }
    scheduler->SetMaxSize(QueueSize(QueueSizeUnit::PACKETS, maxSize));
    return scheduler;
}

std::vector<Ptr<PacketScheduler>>
SchedulerHelper::CreateAll(uint32_t maxSize)
{
    NS_LOG_FUNCTION(maxSize);
    std::vector<Ptr<PacketScheduler>> schedulers;
    for (auto type : {SchedulerType::FCFS,
                      SchedulerType::PRIORITY,
                      SchedulerType::ROUND_ROBIN,
                      SchedulerType::FAIR_QUEUE,
                      SchedulerType::LAS})
    {
        schedulers.push_back(Create(type, maxSize));
    }
    return schedulers;
}

SchedulerHelper::ComparisonResults
SchedulerHelper::Compare(const std::vector<Ptr<QosPacket>>& packets,
                         const std::vector<Ptr<PacketScheduler>>& schedulers,
                         const QosSimulator& simulator)
{
    NS_LOG_FUNCTION(packets.size() << schedulers.size());
    ComparisonResults results;
    for (const auto& scheduler : schedulers)
    {
        auto metrics = simulator.Run(CopyPackets(packets), scheduler);
        NS_LOG_INFO(scheduler->GetName() << ": " << metrics);
        results.emplace_back(scheduler->GetName(), metrics);
    }
    return results;
}

} // namespace ns3
