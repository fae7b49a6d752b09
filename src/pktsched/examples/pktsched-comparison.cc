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


// Comparison of the packet scheduling disciplines
//
// Experiments (select with --experiment):
// - basic: 100 packets, 2 packets/s, flows weighted 0.5/0.3/0.2
// - high-load: 500 packets, 5 packets/s, flows weighted 0.6/0.3/0.1
// - priority-stress: 200 packets, 2.5 packets/s, mostly high priority
//   packets, followed by the per-flow latency under priority scheduling
// - variable-service: 150 packets, 2 packets/s, service times in [0.1, 5] s
// - custom: --numPackets packets at --arrivalRate, a share --highPriorityRatio
//   of flow 3 packets and the rest split 60/40 between flows 1 and 2
// - all: every experiment above except custom
//
// Every discipline runs over its own copy of the same packet stream.
// --capacity bounds the buffer of every scheduler (0 for unbounded).

#include "pktsched/packet-scheduler.h"
#include "pktsched/qos-simulator.h"
#include "pktsched/scheduler-helper.h"
#include "pktsched/scheduler-stats-helper.h"
#include "pktsched/traffic-generator.h"

#include "ns3/core-module.h"

#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

using namespace ns3;

NS_LOG_COMPONENT_DEFINE("PktschedComparison");

void
PrintHeader(const std::string& title)
{
    std::cout << std::endl << std::string(80, '=') << std::endl;
    std::cout << title << std::endl;
    std::cout << std::string(80, '=') << std::endl;
}

void
RunExperiment(const std::string& title,
              Ptr<TrafficGenerator> generator,
              uint32_t numPackets,
              uint32_t capacity)
{
    PrintHeader(title);
    auto packets = generator->GeneratePoisson(numPackets);
    std::cout << "Generated " << packets.size() << " packets" << std::endl;

    auto results = SchedulerHelper::Compare(packets, SchedulerHelper::CreateAll(capacity));

    SchedulerStatsHelper stats;
    stats.Add(results);
    stats.PrintStatistics(std::cout);
}

void
PrintPriorityFairness(const std::vector<Ptr<QosPacket>>& packets, uint32_t capacity)
{
    auto scheduler = SchedulerHelper::Create(SchedulerType::PRIORITY, capacity);
    QosSimulator simulator;
    simulator.Run(CopyPackets(packets), scheduler);

    std::cout << std::endl << "Per-flow latency under " << scheduler->GetName() << ":" << std::endl;
    std::cout << std::fixed << std::setprecision(4);
    for (const auto& [flowId, flowPackets] : scheduler->GetProcessedPacketsByFlow())
    {
        double sum = 0;
        for (const auto& p : flowPackets)
        {
            sum += p->GetLatency().GetSeconds();
        }
        std::cout << "  Flow " << flowId << ": " << flowPackets.size()
                  << " packets, average latency " << sum / flowPackets.size() << " s"
                  << std::endl;
    }
    std::cout.unsetf(std::ios_base::floatfield);
}

int
main(int argc, char* argv[])
{
    std::string experiment = "all";
    uint32_t numPackets = 100;
    double arrivalRate = 2.0;
    double highPriorityRatio = 0.2;
    uint32_t capacity = 0;
    uint32_t rngRun = 1;
    bool verbose = false;

    CommandLine cmd(__FILE__);
    cmd.Usage("Compare FCFS, priority, round-robin, fair queue and LAS scheduling");
    cmd.AddValue("experiment",
                 "Experiment to run (all, basic, high-load, priority-stress, variable-service, "
                 "custom)",
                 experiment);
    cmd.AddValue("numPackets", "Number of packets of the custom experiment", numPackets);
    cmd.AddValue("arrivalRate", "Packets per second of the custom experiment", arrivalRate);
    cmd.AddValue("highPriorityRatio",
                 "Share of flow 3 packets in the custom experiment",
                 highPriorityRatio);
    cmd.AddValue("capacity", "Buffer capacity in packets (0 for unbounded)", capacity);
    cmd.AddValue("rngRun", "Random number generator run", rngRun);
    cmd.AddValue("verbose", "Log every step of the simulator", verbose);
    cmd.Parse(argc, argv);

    if (verbose)
    {
        LogComponentEnable("QosSimulator", LOG_LEVEL_DEBUG);
    }

    if (highPriorityRatio < 0 || highPriorityRatio > 1)
    {
        std::cerr << "highPriorityRatio must be in [0, 1]" << std::endl;
        return 1;
    }

    RngSeedManager::SetRun(rngRun);

    bool all = (experiment == "all");
    bool known = all;
    int64_t stream = 0;

    if (all || experiment == "basic")
    {
        known = true;
        auto generator = CreateObject<TrafficGenerator>();
        generator->AssignStreams(stream);
        generator->SetAttribute("ArrivalRate", DoubleValue(2.0));
        generator->SetFlowWeights({{1, 0.5}, {2, 0.3}, {3, 0.2}});
        RunExperiment("Basic comparison (moderate traffic)", generator, 100, capacity);
    }
    stream += 2;

    if (all || experiment == "high-load")
    {
        known = true;
        auto generator = CreateObject<TrafficGenerator>();
        generator->AssignStreams(stream);
        generator->SetAttribute("ArrivalRate", DoubleValue(5.0));
        generator->SetFlowWeights({{1, 0.6}, {2, 0.3}, {3, 0.1}});
        RunExperiment("High traffic load", generator, 500, capacity);
    }
    stream += 2;

    if (all || experiment == "priority-stress")
    {
        known = true;
        auto generator = CreateObject<TrafficGenerator>();
        generator->AssignStreams(stream);
        generator->SetAttribute("ArrivalRate", DoubleValue(2.5));
        generator->SetFlowWeights({{1, 0.2}, {2, 0.3}, {3, 0.5}});
        PrintHeader("Priority distribution stress test");
        auto packets = generator->GeneratePoisson(200);
        SchedulerStatsHelper stats;
        stats.Add(SchedulerHelper::Compare(packets, SchedulerHelper::CreateAll(capacity)));
        stats.PrintStatistics(std::cout);
        PrintPriorityFairness(packets, capacity);
    }
    stream += 2;

    if (all || experiment == "variable-service")
    {
        known = true;
        auto generator = CreateObject<TrafficGenerator>();
        generator->AssignStreams(stream);
        generator->SetAttribute("ArrivalRate", DoubleValue(2.0));
        generator->SetAttribute("MinServiceTime", TimeValue(Seconds(0.1)));
        generator->SetAttribute("MaxServiceTime", TimeValue(Seconds(5)));
        generator->SetFlowWeights({{1, 0.4}, {2, 0.4}, {3, 0.2}});
        RunExperiment("Variable service times", generator, 150, capacity);
    }
    stream += 2;

    if (experiment == "custom")
    {
        known = true;
        auto generator = CreateObject<TrafficGenerator>();
        generator->AssignStreams(stream);
        generator->SetAttribute("ArrivalRate", DoubleValue(arrivalRate));
        generator->SetFlowWeights({{1, (1 - highPriorityRatio) * 0.6},
                                   {2, (1 - highPriorityRatio) * 0.4},
                                   {3, highPriorityRatio}});
        std::ostringstream title;
        title << "Custom simulation: " << numPackets << " packets at " << arrivalRate
              << " packets/s, " << highPriorityRatio * 100 << "% high priority";
        RunExperiment(title.str(), generator, numPackets, capacity);
    }

    if (!known)
    {
        std::cerr << "Unknown experiment " << experiment << std::endl;
        return 1;
    }
    return 0;
}
