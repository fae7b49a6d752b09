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

#ifndef QOS_SIMULATOR_H
#define QOS_SIMULATOR_H

#include "packet-scheduler.h"
#include "qos-packet.h"
#include "scheduler-metrics.h"

#include "ns3/ptr.h"

#include <vector>

namespace ns3
{

/**
 * \ingroup pktsched
 *
 * Event-stepping driver of a packet scheduler.
 *
 * The simulator feeds a packet stream to one scheduler on the scheduler's
 * logical clock.  Packets are sorted by arrival time (ties keep their input
 * order) and the scheduler is reset.  Then, while packets remain to be
 * offered or the scheduler holds packets:
 *
 * -# every packet with arrival time not later than the clock is offered;
 * -# if the scheduler holds packets, one of them is selected and serviced
 *    to completion;
 * -# otherwise the clock jumps to the arrival time of the next packet.
 *
 * The run does not use the ns-3 event scheduler nor the wall clock, so the
 * resulting timeline only depends on the input.
 */
class QosSimulator
{
  public:
    QosSimulator();

    /**
     * \param mode what the per-flow fairness index of the returned metrics
     * is computed over
     */
    void SetFlowFairnessMode(FlowFairnessMode mode);

    /**
     * \return the per-flow fairness mode
     */
    FlowFairnessMode GetFlowFairnessMode() const;

    /**
     * \brief Run the scheduler over the packet stream.
     *
     * The packets are modified in place (start and finish times); use
     * CopyPackets() to run several schedulers over the same stream.
     *
     * \param packets the packets to offer
     * \param scheduler the scheduler under test
     * \return the metrics of the run
     */
    SchedulerMetrics Run(std::vector<Ptr<QosPacket>> packets,
                         Ptr<PacketScheduler> scheduler) const;

  private:
    FlowFairnessMode m_flowFairnessMode; //!< Per-flow fairness mode of the metrics
};

} // namespace ns3

#endif /* QOS_SIMULATOR_H */
