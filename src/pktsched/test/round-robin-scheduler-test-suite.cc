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


#include "pktsched/round-robin-scheduler.h"

#include "ns3/nstime.h"
#include "ns3/queue-size.h"
#include "ns3/test.h"
#include "ns3/uinteger.h"

#include <set>
#include <vector>

using namespace ns3;

/**
 * \ingroup pktsched-test
 *
 * Rotation over the queues of the round-robin scheduler.
 */
class RoundRobinRotationTestCase : public TestCase
{
  public:
    RoundRobinRotationTestCase();
    void DoRun() override;
};

RoundRobinRotationTestCase::RoundRobinRotationTestCase()
    : TestCase("Check that no queue is served twice before every other non-empty queue")
{
}

void
RoundRobinRotationTestCase::DoRun()
{
    Ptr<RoundRobinScheduler> rr = CreateObject<RoundRobinScheduler>();
    NS_TEST_EXPECT_MSG_EQ(rr->SetAttributeFailSafe("NumQueues", UintegerValue(4)),
                          true,
                          "Verify that we can actually set the attribute NumQueues");
    for (uint32_t uid = 0; uid < 12; uid++)
    {
        rr->Enqueue(Create<QosPacket>(uid, Seconds(0)));
    }
    NS_TEST_EXPECT_MSG_EQ(rr->GetNQueues(), 4, "Four queues");
    for (uint32_t i = 0; i < 4; i++)
    {
        NS_TEST_EXPECT_MSG_EQ(rr->GetQueueLength(i), 3, "Packets spread by id");
    }

    // every round of 4 services visits the 4 queues once
    for (uint32_t round = 0; round < 3; round++)
    {
        std::set<uint32_t> visited;
        for (uint32_t i = 0; i < 4; i++)
        {
            Ptr<QosPacket> p = rr->Dequeue();
            NS_TEST_ASSERT_MSG_NE(p, nullptr, "A packet is available");
            NS_TEST_EXPECT_MSG_EQ(visited.insert(p->GetUid() % 4).second,
                                  true,
                                  "Queue served twice in the same round");
        }
    }
    NS_TEST_EXPECT_MSG_EQ(rr->IsEmpty(), true, "All served");

    // empty queues are skipped
    Ptr<RoundRobinScheduler> sparse = CreateObject<RoundRobinScheduler>();
    for (uint32_t uid : {0, 3, 6, 1})
    {
        sparse->Enqueue(Create<QosPacket>(uid, Seconds(0)));
    }
    NS_TEST_EXPECT_MSG_EQ(sparse->Dequeue()->GetUid(), 0, "Queue 0 first");
    NS_TEST_EXPECT_MSG_EQ(sparse->GetCurrentQueueIndex(), 1, "Pointer moves past queue 0");
    NS_TEST_EXPECT_MSG_EQ(sparse->Dequeue()->GetUid(), 1, "Then queue 1");
    NS_TEST_EXPECT_MSG_EQ(sparse->Dequeue()->GetUid(), 3, "Queue 2 is empty, back to queue 0");
    NS_TEST_EXPECT_MSG_EQ(sparse->GetCurrentQueueIndex(), 1, "Pointer moves past queue 0");
    NS_TEST_EXPECT_MSG_EQ(sparse->Dequeue()->GetUid(), 6, "Only queue 0 is left");
    NS_TEST_EXPECT_MSG_EQ(sparse->Dequeue(), nullptr, "Nothing left");
}

/**
 * \ingroup pktsched-test
 *
 * Configuration checks and capacity bound of the round-robin scheduler.
 */
class RoundRobinConfigTestCase : public TestCase
{
  public:
    RoundRobinConfigTestCase();
    void DoRun() override;
};

RoundRobinConfigTestCase::RoundRobinConfigTestCase()
    : TestCase("Check the configuration and the capacity bound of the round-robin scheduler")
{
}

void
RoundRobinConfigTestCase::DoRun()
{
    Ptr<RoundRobinScheduler> rr = CreateObject<RoundRobinScheduler>();
    NS_TEST_EXPECT_MSG_EQ(rr->SetAttributeFailSafe("NumQueues", UintegerValue(0)),
                          false,
                          "Zero queues must be rejected");
    NS_TEST_EXPECT_MSG_EQ(rr->GetNQueues(), 3, "The default is kept");
    NS_TEST_EXPECT_MSG_EQ(rr->GetTimeQuantum(), Seconds(0.5), "Default time quantum");
    NS_TEST_EXPECT_MSG_EQ(rr->SetAttributeFailSafe("TimeQuantum", TimeValue(Seconds(-1))),
                          false,
                          "A negative time quantum must be rejected");

    rr->SetMaxSize(QueueSize("4p"));
    uint32_t admitted = 0;
    for (uint32_t uid = 0; uid < 10; uid++)
    {
        admitted += rr->Enqueue(Create<QosPacket>(uid, Seconds(0))) ? 1 : 0;
    }
    NS_TEST_EXPECT_MSG_EQ(admitted, 4, "The bound applies to all the queues together");
    NS_TEST_EXPECT_MSG_EQ(rr->GetDroppedPackets().size(), 6, "The other arrivals are dropped");
    while (!rr->IsEmpty())
    {
        rr->Dequeue();
    }
    NS_TEST_EXPECT_MSG_EQ(rr->GetProcessedPackets().size() + rr->GetDroppedPackets().size(),
                          10,
                          "Every offered packet is processed or dropped");
}

/**
 * \ingroup pktsched-test
 *
 * Change of the number of queues of a scheduler that was already used.
 */
class RoundRobinReconfigureTestCase : public TestCase
{
  public:
    RoundRobinReconfigureTestCase();
    void DoRun() override;
};

RoundRobinReconfigureTestCase::RoundRobinReconfigureTestCase()
    : TestCase("Check that the number of queues can change once the scheduler is drained")
{
}

void
RoundRobinReconfigureTestCase::DoRun()
{
    Ptr<RoundRobinScheduler> rr = CreateObject<RoundRobinScheduler>();
    for (uint32_t uid = 0; uid < 3; uid++)
    {
        rr->Enqueue(Create<QosPacket>(uid, Seconds(0)));
    }
    rr->Dequeue();
    rr->Dequeue();
    NS_TEST_EXPECT_MSG_EQ(rr->GetCurrentQueueIndex(), 2, "Two queues served");
    rr->Dequeue();
    NS_TEST_ASSERT_MSG_EQ(rr->IsEmpty(), true, "Drained before the change");

    // more queues: ids above the old count get their own queue
    rr->SetAttribute("NumQueues", UintegerValue(5));
    NS_TEST_EXPECT_MSG_EQ(rr->GetNQueues(), 5, "Five queues");
    NS_TEST_EXPECT_MSG_EQ(rr->GetCurrentQueueIndex(), 0, "The scan restarts at queue 0");
    for (uint32_t uid : {4, 9, 1})
    {
        NS_TEST_EXPECT_MSG_EQ(rr->Enqueue(Create<QosPacket>(uid, Seconds(0))),
                              true,
                              "Packet admitted");
    }
    NS_TEST_EXPECT_MSG_EQ(rr->GetQueueLength(4), 2, "Ids 4 and 9 share queue 4");
    NS_TEST_EXPECT_MSG_EQ(rr->GetQueueLength(1), 1, "Id 1 in queue 1");
    NS_TEST_EXPECT_MSG_EQ(rr->Dequeue()->GetUid(), 1, "Queue 1 first");
    NS_TEST_EXPECT_MSG_EQ(rr->Dequeue()->GetUid(), 4, "Then queue 4");
    NS_TEST_EXPECT_MSG_EQ(rr->Dequeue()->GetUid(), 9, "Wrap around to queue 4 again");
    NS_TEST_ASSERT_MSG_EQ(rr->IsEmpty(), true, "Drained");

    // fewer queues: no packet is left in a queue that is no longer scanned
    rr->SetAttribute("NumQueues", UintegerValue(2));
    for (uint32_t uid = 0; uid < 6; uid++)
    {
        rr->Enqueue(Create<QosPacket>(uid, Seconds(0)));
    }
    NS_TEST_EXPECT_MSG_EQ(rr->GetQueueLength(0), 3, "Even ids in queue 0");
    NS_TEST_EXPECT_MSG_EQ(rr->GetQueueLength(1), 3, "Odd ids in queue 1");
    uint32_t served = 0;
    while (rr->Dequeue())
    {
        served++;
    }
    NS_TEST_EXPECT_MSG_EQ(served, 6, "Every buffered packet is served");
    NS_TEST_EXPECT_MSG_EQ(rr->GetNPackets(), 0, "Nothing counted as buffered");

    rr->Reset();
    NS_TEST_EXPECT_MSG_EQ(rr->GetNQueues(), 2, "Reset keeps the configured queues");
    rr->Enqueue(Create<QosPacket>(3, Seconds(0)));
    NS_TEST_EXPECT_MSG_EQ(rr->GetQueueLength(1), 1, "Id 3 in queue 1 after a reset");
}

/**
 * \ingroup pktsched-test
 *
 * The round-robin scheduler test suite.
 */
static class RoundRobinSchedulerTestSuite : public TestSuite
{
  public:
    RoundRobinSchedulerTestSuite()
        : TestSuite("pktsched-round-robin-scheduler", UNIT)
    {
        AddTestCase(new RoundRobinRotationTestCase(), TestCase::QUICK);
        AddTestCase(new RoundRobinConfigTestCase(), TestCase::QUICK);
        AddTestCase(new RoundRobinReconfigureTestCase(), TestCase::QUICK);
    }
} g_roundRobinSchedulerTestSuite;
