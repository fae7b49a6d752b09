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


// Packet dropping with a finite buffer
//
// Part 1 offers 100 bursty packets (flows weighted 0.6/0.3/0.1, 5 bursts
// per second) to FCFS, fair queue and LAS schedulers with an unbounded
// buffer, a 50 packet buffer and a 20 packet buffer, and shows the drops
// of each flow.
//
// Part 2 runs the same schedulers over application traffic:
//   scenario             buffer
//   message texting      15
//   video streaming      25
//   online meeting       30
//   file download        20
//   mice and elephants   25
// and ends with the per-flow fairness of each scheduler in each scenario.
//
// Use --part=1 or --part=2 to run only one part.

#include "pktsched/packet-scheduler.h"
#include "pktsched/qos-simulator.h"
#include "pktsched/scheduler-helper.h"
#include "pktsched/scheduler-stats-helper.h"
#include "pktsched/traffic-generator.h"

#include "ns3/core-module.h"

#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>
#include <string>
#include <vector>

using namespace ns3;

NS_LOG_COMPONENT_DEFINE("PktschedDropping");

std::vector<Ptr<PacketScheduler>>
CreateDroppingSchedulers(uint32_t capacity)
{
    return {SchedulerHelper::Create(SchedulerType::FCFS, capacity),
            SchedulerHelper::Create(SchedulerType::FAIR_QUEUE, capacity),
            SchedulerHelper::Create(SchedulerType::LAS, capacity)};
}

void
PrintFlowCounts(const std::vector<Ptr<QosPacket>>& packets)
{
    std::cout << "Packet distribution:" << std::endl;
    for (const auto& [flowId, flowPackets] : GroupByFlow(packets))
    {
        std::cout << "  Flow " << flowId << ": " << flowPackets.size() << " packets"
                  << std::endl;
    }
}

/**
 * Run the schedulers over copies of the packets and print the results.
 * Return the per-flow fairness index of each scheduler.
 */
std::map<std::string, double>
RunAndReport(const std::vector<Ptr<QosPacket>>& packets, uint32_t capacity)
{
    QosSimulator simulator;
    SchedulerStatsHelper stats;
    std::map<std::string, double> fairness;
    for (const auto& scheduler : CreateDroppingSchedulers(capacity))
    {
        auto metrics = simulator.Run(CopyPackets(packets), scheduler);
        stats.Add(scheduler);
        fairness[scheduler->GetName()] = metrics.m_flowFairnessIndex;
        NS_LOG_INFO(scheduler->GetName() << " statistics:" << std::endl << scheduler->GetStats());
    }
    stats.PrintStatistics(std::cout);
    stats.PrintFlowDrops(std::cout);
    return fairness;
}

void
RunCapacityDemo()
{
    std::cout << std::string(80, '=') << std::endl;
    std::cout << "Packet dropping: 100 bursty packets, high load" << std::endl;
    std::cout << std::string(80, '=') << std::endl;

    auto generator = CreateObject<TrafficGenerator>();
    generator->AssignStreams(0);
    generator->SetAttribute("ArrivalRate", DoubleValue(5.0));
    generator->SetFlowWeights({{1, 0.6}, {2, 0.3}, {3, 0.1}});
    auto packets = generator->GenerateBursty(100);
    PrintFlowCounts(packets);

    for (uint32_t capacity : {0, 50, 20})
    {
        std::cout << std::endl << std::string(80, '-') << std::endl;
        if (capacity == 0)
        {
            std::cout << "Buffer capacity: unbounded (no drops)" << std::endl;
        }
        else
        {
            std::cout << "Buffer capacity: " << capacity << " packets (drops when full)"
                      << std::endl;
        }
        RunAndReport(packets, capacity);
    }
}

void
RunScenarioDemo()
{
    std::cout << std::endl << std::string(80, '=') << std::endl;
    std::cout << "Realistic traffic scenarios" << std::endl;
    std::cout << std::string(80, '=') << std::endl;

    const std::vector<std::pair<TrafficScenario, uint32_t>> scenarios{
        {TrafficScenario::MESSAGE_TEXTING, 15},
        {TrafficScenario::VIDEO_STREAMING, 25},
        {TrafficScenario::ONLINE_MEETING, 30},
        {TrafficScenario::FILE_DOWNLOAD, 20},
        {TrafficScenario::MICE_AND_ELEPHANTS, 25}};

    auto generator = CreateObject<TrafficGenerator>();
    generator->AssignStreams(2);

    std::vector<std::pair<TrafficScenario, std::map<std::string, double>>> summary;
    for (const auto& [scenario, capacity] : scenarios)
    {
        std::cout << std::endl << std::string(80, '-') << std::endl;
        std::cout << "Scenario: " << scenario << std::endl;
        auto packets = generator->GenerateScenario(scenario);
        std::cout << "Total packets: " << packets.size() << ", buffer capacity: " << capacity
                  << std::endl;
        PrintFlowCounts(packets);
        summary.emplace_back(scenario, RunAndReport(packets, capacity));
    }

    std::cout << std::endl << "Flow fairness across scenarios" << std::endl;
    std::cout << std::left << std::setw(22) << "Scenario";
    for (const auto& scheduler : CreateDroppingSchedulers(0))
    {
        std::cout << std::setw(14) << scheduler->GetName();
    }
    std::cout << std::endl << std::fixed << std::setprecision(4);
    for (const auto& [scenario, fairness] : summary)
    {
        std::ostringstream name;
        name << scenario;
        std::cout << std::setw(22) << name.str();
        for (const auto& scheduler : CreateDroppingSchedulers(0))
        {
            std::cout << std::setw(14) << fairness.at(scheduler->GetName());
        }
        std::cout << std::endl;
    }
}

int
main(int argc, char* argv[])
{
    uint32_t part = 0;
    uint32_t rngRun = 1;

    CommandLine cmd(__FILE__);
    cmd.Usage("Packet dropping of FCFS, fair queue and LAS scheduling with a finite buffer");
    cmd.AddValue("part", "Part to run (1: buffer capacity, 2: scenarios, 0: both)", part);
    cmd.AddValue("rngRun", "Random number generator run", rngRun);
    cmd.Parse(argc, argv);

    if (part > 2)
    {
        std::cerr << "Unknown part " << part << std::endl;
        return 1;
    }

    RngSeedManager::SetRun(rngRun);

    if (part == 0 || part == 1)
    {
        RunCapacityDemo();
    }
    if (part == 0 || part == 2)
    {
        RunScenarioDemo();
    }
    return 0;
}
