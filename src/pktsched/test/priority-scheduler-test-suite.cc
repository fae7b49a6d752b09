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


#include "pktsched/priority-scheduler.h"
#include "pktsched/qos-simulator.h"

#include "ns3/queue-size.h"
#include "ns3/test.h"

#include <vector>

using namespace ns3;

/**
 * \ingroup pktsched-test
 *
 * Service order of the priority scheduler.
 */
class PrioritySchedulerOrderTestCase : public TestCase
{
  public:
    PrioritySchedulerOrderTestCase();
    void DoRun() override;
};

PrioritySchedulerOrderTestCase::PrioritySchedulerOrderTestCase()
    : TestCase("Check that the priority scheduler serves by descending priority")
{
}

void
PrioritySchedulerOrderTestCase::DoRun()
{
    // simultaneous arrivals with distinct priorities
    std::vector<Ptr<QosPacket>> packets;
    std::vector<uint32_t> priorities{2, 5, 1, 4, 3};
    for (uint32_t i = 0; i < priorities.size(); i++)
    {
        packets.push_back(Create<QosPacket>(i, Seconds(0), priorities[i], 1000, Seconds(0.5)));
    }
    Ptr<PriorityScheduler> scheduler = CreateObject<PriorityScheduler>();
    QosSimulator simulator;
    simulator.Run(packets, scheduler);

    const auto& processed = scheduler->GetProcessedPackets();
    NS_TEST_ASSERT_MSG_EQ(processed.size(), 5, "All packets serviced");
    for (uint32_t i = 0; i < processed.size(); i++)
    {
        NS_TEST_EXPECT_MSG_EQ(processed[i]->GetPriority(),
                              5 - i,
                              "Packets must leave in strictly descending priority");
    }

    // equal priorities: earlier arrival first, then admission order
    Ptr<PriorityScheduler> ties = CreateObject<PriorityScheduler>();
    ties->AdvanceClock(Seconds(5));
    ties->Enqueue(Create<QosPacket>(10, Seconds(3), 2));
    ties->Enqueue(Create<QosPacket>(11, Seconds(1), 2));
    ties->Enqueue(Create<QosPacket>(12, Seconds(1), 2));
    ties->Enqueue(Create<QosPacket>(13, Seconds(4), 1));
    NS_TEST_EXPECT_MSG_EQ(ties->Dequeue()->GetUid(), 11, "Earliest arrival first");
    NS_TEST_EXPECT_MSG_EQ(ties->Dequeue()->GetUid(), 12, "Then admission order");
    NS_TEST_EXPECT_MSG_EQ(ties->Dequeue()->GetUid(), 10, "Then the later arrival");
    NS_TEST_EXPECT_MSG_EQ(ties->Dequeue()->GetUid(), 13, "Lower priority last");
    NS_TEST_EXPECT_MSG_EQ(ties->Dequeue(), nullptr, "Nothing left");
}

/**
 * \ingroup pktsched-test
 *
 * A high priority packet arriving while the buffer holds lower priority
 * packets overtakes them, and a full buffer tail drops.
 */
class PrioritySchedulerPreemptionTestCase : public TestCase
{
  public:
    PrioritySchedulerPreemptionTestCase();
    void DoRun() override;
};

PrioritySchedulerPreemptionTestCase::PrioritySchedulerPreemptionTestCase()
    : TestCase("Check overtaking and tail drop of the priority scheduler")
{
}

void
PrioritySchedulerPreemptionTestCase::DoRun()
{
    // packet 0 is in service when the others arrive; service is never interrupted
    std::vector<Ptr<QosPacket>> packets{Create<QosPacket>(0, Seconds(0), 1, 1000, Seconds(2)),
                                        Create<QosPacket>(1, Seconds(0.5), 1, 1000, Seconds(1)),
                                        Create<QosPacket>(2, Seconds(1), 1, 1000, Seconds(1)),
                                        Create<QosPacket>(3, Seconds(1.5), 3, 1000, Seconds(1))};
    Ptr<PriorityScheduler> scheduler = CreateObject<PriorityScheduler>();
    QosSimulator simulator;
    simulator.Run(packets, scheduler);

    const auto& processed = scheduler->GetProcessedPackets();
    NS_TEST_ASSERT_MSG_EQ(processed.size(), 4, "All packets serviced");
    NS_TEST_EXPECT_MSG_EQ(processed[0]->GetUid(), 0, "The first packet is served to completion");
    NS_TEST_EXPECT_MSG_EQ(processed[1]->GetUid(), 3, "The high priority packet overtakes");
    NS_TEST_EXPECT_MSG_EQ(processed[1]->GetStartTime(), Seconds(2), "It starts when 0 finishes");
    NS_TEST_EXPECT_MSG_EQ(processed[2]->GetUid(), 1, "Then arrival order");
    NS_TEST_EXPECT_MSG_EQ(processed[3]->GetUid(), 2, "Then arrival order");

    Ptr<PriorityScheduler> bounded = CreateObject<PriorityScheduler>();
    bounded->SetMaxSize(QueueSize("2p"));
    NS_TEST_EXPECT_MSG_EQ(bounded->Enqueue(Create<QosPacket>(0, Seconds(0), 1)), true, "Room");
    NS_TEST_EXPECT_MSG_EQ(bounded->Enqueue(Create<QosPacket>(1, Seconds(0), 1)), true, "Room");
    NS_TEST_EXPECT_MSG_EQ(bounded->Enqueue(Create<QosPacket>(2, Seconds(0), 9)),
                          false,
                          "A full buffer drops even a high priority arrival");
    NS_TEST_EXPECT_MSG_EQ(
        bounded->GetStats().GetNDroppedPackets(PriorityScheduler::LIMIT_EXCEEDED_DROP),
        1,
        "One tail drop");
}

/**
 * \ingroup pktsched-test
 *
 * The priority scheduler test suite.
 */
static class PrioritySchedulerTestSuite : public TestSuite
{
  public:
    PrioritySchedulerTestSuite()
        : TestSuite("pktsched-priority-scheduler", UNIT)
    {
        AddTestCase(new PrioritySchedulerOrderTestCase(), TestCase::QUICK);
        AddTestCase(new PrioritySchedulerPreemptionTestCase(), TestCase::QUICK);
    }
} g_prioritySchedulerTestSuite;
