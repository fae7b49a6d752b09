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


#include "pktsched/fcfs-scheduler.h"
#include "pktsched/qos-simulator.h"

#include "ns3/queue-size.h"
#include "ns3/test.h"

#include <vector>

using namespace ns3;

/**
 * \ingroup pktsched-test
 *
 * Service order, timing and tail drop of the FCFS scheduler.
 */
class FcfsSchedulerTestCase : public TestCase
{
  public:
    FcfsSchedulerTestCase();
    void DoRun() override;

  private:
    /**
     * Drop trace sink.
     * \param packet the dropped packet
     * \param reason the reason of the drop
     */
    void DropTrace(Ptr<const QosPacket> packet, const char* reason);
    void RunOrderTest();
    void RunTailDropTest();
    void RunResetTest();

    std::vector<uint32_t> m_droppedUids; //!< Ids reported by the Drop trace
};

FcfsSchedulerTestCase::FcfsSchedulerTestCase()
    : TestCase("Sanity check on the FCFS scheduler")
{
}

void
FcfsSchedulerTestCase::DropTrace(Ptr<const QosPacket> packet, const char* reason)
{
    m_droppedUids.push_back(packet->GetUid());
}

void
FcfsSchedulerTestCase::RunOrderTest()
{
    // given out of arrival order; the simulator sorts them
    std::vector<Ptr<QosPacket>> packets{Create<QosPacket>(0, Seconds(2.0), 1, 1000, Seconds(1)),
                                        Create<QosPacket>(1, Seconds(0.5), 3, 1000, Seconds(1)),
                                        Create<QosPacket>(2, Seconds(1.0), 2, 1000, Seconds(1)),
                                        Create<QosPacket>(3, Seconds(7.0), 1, 1000, Seconds(1))};
    Ptr<FcfsScheduler> fcfs = CreateObject<FcfsScheduler>();
    QosSimulator simulator;
    SchedulerMetrics m = simulator.Run(packets, fcfs);

    const auto& processed = fcfs->GetProcessedPackets();
    NS_TEST_ASSERT_MSG_EQ(processed.size(), 4, "All packets serviced");
    NS_TEST_EXPECT_MSG_EQ(processed[0]->GetUid(), 1, "First arrival served first");
    NS_TEST_EXPECT_MSG_EQ(processed[1]->GetUid(), 2, "Second arrival served second");
    NS_TEST_EXPECT_MSG_EQ(processed[2]->GetUid(), 0, "Third arrival served third");
    NS_TEST_EXPECT_MSG_EQ(processed[3]->GetUid(), 3, "Last arrival served last");

    // idle until 0.5, then back to back until 3.5, idle until 7
    NS_TEST_EXPECT_MSG_EQ(processed[0]->GetStartTime(), Seconds(0.5), "Clock jumps to arrival");
    NS_TEST_EXPECT_MSG_EQ(processed[1]->GetStartTime(), Seconds(1.5), "Back to back service");
    NS_TEST_EXPECT_MSG_EQ(processed[2]->GetFinishTime(), Seconds(3.5), "Back to back service");
    NS_TEST_EXPECT_MSG_EQ(processed[3]->GetStartTime(), Seconds(7), "Clock jumps to arrival");
    NS_TEST_EXPECT_MSG_EQ(fcfs->GetCurrentTime(), Seconds(8), "Final clock");
    NS_TEST_EXPECT_MSG_EQ_TOL(m.m_throughput, 0.5, 1e-9, "4 packets in 8 seconds");
    NS_TEST_EXPECT_MSG_EQ(m.m_dropped, 0, "Nothing dropped without a bound");
    NS_TEST_EXPECT_MSG_EQ(fcfs->GetSchedulerType(), SchedulerType::FCFS, "Discipline tag");
    NS_TEST_EXPECT_MSG_EQ(fcfs->GetName(), "FCFS", "Discipline name");
}

void
FcfsSchedulerTestCase::RunTailDropTest()
{
    Ptr<FcfsScheduler> fcfs = CreateObject<FcfsScheduler>();
    NS_TEST_EXPECT_MSG_EQ(fcfs->SetAttributeFailSafe("MaxSize", QueueSizeValue(QueueSize("3p"))),
                          true,
                          "Verify that we can actually set the attribute MaxSize");
    fcfs->TraceConnectWithoutContext("Drop",
                                     MakeCallback(&FcfsSchedulerTestCase::DropTrace, this));
    m_droppedUids.clear();

    for (uint32_t i = 0; i < 5; i++)
    {
        bool admitted = fcfs->Enqueue(Create<QosPacket>(i, Seconds(0)));
        NS_TEST_EXPECT_MSG_EQ(admitted, i < 3, "Only the first three packets fit");
    }
    NS_TEST_EXPECT_MSG_EQ(fcfs->GetNPackets(), 3, "The buffer is full");
    NS_TEST_ASSERT_MSG_EQ(m_droppedUids.size(), 2, "Two drops traced");
    NS_TEST_EXPECT_MSG_EQ(m_droppedUids[0], 3, "The late arrivals are dropped");
    NS_TEST_EXPECT_MSG_EQ(m_droppedUids[1], 4, "The late arrivals are dropped");

    const auto& stats = fcfs->GetStats();
    NS_TEST_EXPECT_MSG_EQ(stats.nTotalOfferedPackets, 5, "Five offered");
    NS_TEST_EXPECT_MSG_EQ(stats.nTotalEnqueuedPackets, 3, "Three enqueued");
    NS_TEST_EXPECT_MSG_EQ(stats.GetNDroppedPackets(FcfsScheduler::LIMIT_EXCEEDED_DROP),
                          2,
                          "Two tail drops");
    NS_TEST_EXPECT_MSG_EQ(stats.nTotalDroppedPacketsAfterEnqueue, 0, "No eviction");

    Ptr<QosPacket> p = fcfs->Dequeue();
    NS_TEST_ASSERT_MSG_NE(p, nullptr, "A packet is available");
    NS_TEST_EXPECT_MSG_EQ(p->GetUid(), 0, "Head of line served first");
    NS_TEST_EXPECT_MSG_EQ(fcfs->Enqueue(Create<QosPacket>(5, Seconds(1))),
                          true,
                          "Room was made by the service");
}

void
FcfsSchedulerTestCase::RunResetTest()
{
    Ptr<FcfsScheduler> fcfs = CreateObject<FcfsScheduler>();
    NS_TEST_EXPECT_MSG_EQ(fcfs->Dequeue(), nullptr, "An empty scheduler returns no packet");
    NS_TEST_EXPECT_MSG_EQ(fcfs->IsEmpty(), true, "Nothing buffered");

    fcfs->Enqueue(Create<QosPacket>(0, Seconds(0)));
    fcfs->Enqueue(Create<QosPacket>(1, Seconds(0)));
    fcfs->Dequeue();
    fcfs->Reset();
    NS_TEST_EXPECT_MSG_EQ(fcfs->IsEmpty(), true, "Reset empties the buffer");
    NS_TEST_EXPECT_MSG_EQ(fcfs->GetCurrentTime(), Seconds(0), "Reset rewinds the clock");
    NS_TEST_EXPECT_MSG_EQ(fcfs->GetProcessedPackets().size(), 0, "Reset clears processed");
    NS_TEST_EXPECT_MSG_EQ(fcfs->GetStats().nTotalOfferedPackets, 0, "Reset clears the stats");
}

void
FcfsSchedulerTestCase::DoRun()
{
    RunOrderTest();
    RunTailDropTest();
    RunResetTest();
}

/**
 * \ingroup pktsched-test
 *
 * The FCFS scheduler test suite.
 */
static class FcfsSchedulerTestSuite : public TestSuite
{
  public:
    FcfsSchedulerTestSuite()
        : TestSuite("pktsched-fcfs-scheduler", UNIT)
    {
        AddTestCase(new FcfsSchedulerTestCase(), TestCase::QUICK);
    }
} g_fcfsSchedulerTestSuite;
