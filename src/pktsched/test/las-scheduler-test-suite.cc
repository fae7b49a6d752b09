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


#include "pktsched/las-scheduler.h"
#include "pktsched/qos-simulator.h"

#include "ns3/queue-size.h"
#include "ns3/test.h"

#include <vector>

using namespace ns3;

/**
 * \ingroup pktsched-test
 *
 * A flow that has received no service is always selected ahead of flows
 * that have.
 */
class LasSelectionTestCase : public TestCase
{
  public:
    LasSelectionTestCase();
    void DoRun() override;
};

LasSelectionTestCase::LasSelectionTestCase()
    : TestCase("Check that the LAS scheduler serves the least served flow")
{
}

void
LasSelectionTestCase::DoRun()
{
    Ptr<LasScheduler> las = CreateObject<LasScheduler>();
    for (uint32_t uid = 0; uid < 5; uid++)
    {
        las->Enqueue(Create<QosPacket>(uid, Seconds(0), 1, 1000, Seconds(1)));
    }
    NS_TEST_EXPECT_MSG_EQ(las->Dequeue()->GetUid(), 0, "Flow 1 is alone");
    NS_TEST_EXPECT_MSG_EQ(las->GetAttainedService(1), Seconds(1), "Flow 1 attained 1 s");

    // a new flow arrives while flow 1 still has packets
    las->Enqueue(Create<QosPacket>(10, Seconds(1), 2, 1000, Seconds(0.25)));
    las->Enqueue(Create<QosPacket>(11, Seconds(1), 2, 1000, Seconds(0.25)));
    NS_TEST_EXPECT_MSG_EQ(las->Dequeue()->GetUid(), 10, "The unserved flow goes first");
    NS_TEST_EXPECT_MSG_EQ(las->Dequeue()->GetUid(),
                          11,
                          "Flow 2 still has less attained service");
    NS_TEST_EXPECT_MSG_EQ(las->GetNFlows(), 1, "Flow 2 drained and pruned");
    NS_TEST_EXPECT_MSG_EQ(las->GetAttainedService(2),
                          Seconds(0.5),
                          "Attained service survives the pruning");

    // flow 2 comes back with more packets: 0.5 s against 1 s
    las->Enqueue(Create<QosPacket>(12, Seconds(2), 2, 1000, Seconds(1)));
    NS_TEST_EXPECT_MSG_EQ(las->Dequeue()->GetUid(), 12, "Flow 2 is still the least served");
    NS_TEST_EXPECT_MSG_EQ(las->Dequeue()->GetUid(), 1, "Then flow 1 again");

    // through the simulator: mice overtake a long flow
    std::vector<Ptr<QosPacket>> packets;
    for (uint32_t uid = 0; uid < 10; uid++)
    {
        packets.push_back(Create<QosPacket>(uid, Seconds(0), 1, 5000, Seconds(1)));
    }
    packets.push_back(Create<QosPacket>(100, Seconds(3.5), 7, 200, Seconds(0.1)));
    Ptr<LasScheduler> fresh = CreateObject<LasScheduler>();
    QosSimulator simulator;
    simulator.Run(packets, fresh);
    Ptr<QosPacket> mouse;
    for (const auto& p : fresh->GetProcessedPackets())
    {
        if (p->GetUid() == 100)
        {
            mouse = p;
        }
    }
    NS_TEST_ASSERT_MSG_NE(mouse, nullptr, "The mouse packet was serviced");
    NS_TEST_EXPECT_MSG_EQ(mouse->GetStartTime(),
                          Seconds(4),
                          "The mouse is served right after the packet in service");
}

/**
 * \ingroup pktsched-test
 *
 * Eviction from the most served flow when the buffer is full.
 */
class LasEvictionTestCase : public TestCase
{
  public:
    LasEvictionTestCase();
    void DoRun() override;
};

LasEvictionTestCase::LasEvictionTestCase()
    : TestCase("Check the fairness-aware eviction of the LAS scheduler")
{
}

void
LasEvictionTestCase::DoRun()
{
    Ptr<LasScheduler> las = CreateObject<LasScheduler>();
    las->SetMaxSize(QueueSize("3p"));

    // give flow 1 some attained service
    las->Enqueue(Create<QosPacket>(0, Seconds(0), 1, 1000, Seconds(1)));
    las->Dequeue();

    las->Enqueue(Create<QosPacket>(1, Seconds(1), 1));
    las->Enqueue(Create<QosPacket>(2, Seconds(1), 1));
    las->Enqueue(Create<QosPacket>(3, Seconds(1), 2));
    NS_TEST_EXPECT_MSG_EQ(las->GetNPackets(), 3, "The buffer is full");

    NS_TEST_EXPECT_MSG_EQ(las->Enqueue(Create<QosPacket>(4, Seconds(1), 3)),
                          true,
                          "The arriving packet is admitted");
    NS_TEST_EXPECT_MSG_EQ(las->GetNPackets(), 3, "Occupancy stays at the bound");
    NS_TEST_ASSERT_MSG_EQ(las->GetDroppedPackets().size(), 1, "One packet evicted");
    NS_TEST_EXPECT_MSG_EQ(las->GetDroppedPackets()[0]->GetUid(),
                          2,
                          "The tail of the most served flow is evicted");
    NS_TEST_EXPECT_MSG_EQ(las->GetFlowQueueLength(1), 1, "Flow 1 keeps its head packet");
    NS_TEST_EXPECT_MSG_EQ(las->GetStats().GetNDroppedPackets(LasScheduler::ELEPHANT_DROP),
                          1,
                          "Recorded as an eviction");
    NS_TEST_EXPECT_MSG_EQ(las->GetStats().nTotalDroppedPacketsAfterEnqueue,
                          1,
                          "Evictions are drops after enqueue");

    // equal attained service: evict from the lowest flow id
    Ptr<LasScheduler> ties = CreateObject<LasScheduler>();
    ties->SetMaxSize(QueueSize("2p"));
    ties->Enqueue(Create<QosPacket>(0, Seconds(0), 4));
    ties->Enqueue(Create<QosPacket>(1, Seconds(0), 2));
    ties->Enqueue(Create<QosPacket>(2, Seconds(0), 3));
    NS_TEST_ASSERT_MSG_EQ(ties->GetDroppedPackets().size(), 1, "One packet evicted");
    NS_TEST_EXPECT_MSG_EQ(ties->GetDroppedPackets()[0]->GetFlowId(),
                          2,
                          "Lowest flow id among equally served flows");

    // capacity conservation over a run
    std::vector<Ptr<QosPacket>> packets;
    for (uint32_t uid = 0; uid < 60; uid++)
    {
        packets.push_back(Create<QosPacket>(uid, Seconds(0.05 * uid), uid % 4 + 1));
    }
    Ptr<LasScheduler> bounded = CreateObject<LasScheduler>();
    bounded->SetMaxSize(QueueSize("5p"));
    QosSimulator simulator;
    SchedulerMetrics m = simulator.Run(packets, bounded);
    NS_TEST_EXPECT_MSG_EQ(m.m_processed + m.m_dropped, 60, "Every packet is accounted for");
    NS_TEST_EXPECT_MSG_GT(m.m_dropped, 0, "The buffer overflowed");
}

/**
 * \ingroup pktsched-test
 *
 * The LAS scheduler test suite.
 */
static class LasSchedulerTestSuite : public TestSuite
{
  public:
    LasSchedulerTestSuite()
        : TestSuite("pktsched-las-scheduler", UNIT)
    {
        AddTestCase(new LasSelectionTestCase(), TestCase::QUICK);
        AddTestCase(new LasEvictionTestCase(), TestCase::QUICK);
    }
} g_lasSchedulerTestSuite;
