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

#ifndef SCHEDULER_HELPER_H
#define SCHEDULER_HELPER_H

#include "pktsched/packet-scheduler.h"
#include "pktsched/qos-packet.h"
#include "pktsched/qos-simulator.h"
#include "pktsched/scheduler-metrics.h"

#include "ns3/object-factory.h"
#include "ns3/ptr.h"

#include <string>
#include <utility>
#include <vector>

namespace ns3
{

/**
 * \ingroup pktsched
 *
 * \brief Build packet schedulers and run them side by side.
 *
 * A scheduler can be configured by TypeId name and attributes through
 * SetScheduler(), in the manner of the ns-3 helpers, or built with the
 * default configuration of a discipline with the static Create(SchedulerType).
 */
class SchedulerHelper
{
  public:
    /// Name and metrics of a run, in the order the schedulers were given
    typedef std::vector<std::pair<std::string, SchedulerMetrics>> ComparisonResults;

    SchedulerHelper();

    /**
     * \brief Set the type and the attributes of the schedulers created by Create().
     *
     * \tparam Ts \deduced Argument types
     * \param type the TypeId name of the scheduler, e.g. "ns3::FcfsScheduler"
     * \param [in] args Name and AttributeValue pairs to set.
     */
    template <typename... Ts>
    void SetScheduler(std::string type, Ts&&... args);

    /**
     * \brief Create a scheduler with the configured type and attributes.
     * \return the new scheduler
     */
    Ptr<PacketScheduler> Create() const;

    /**
     * \brief Create a scheduler of the given discipline with its default attributes.
     * \param type the discipline
     * \param maxSize the capacity bound in packets, 0 for unbounded
     * \return the new scheduler
     */
    static Ptr<PacketScheduler> Create(SchedulerType type, uint32_t maxSize = 0);

    /**
     * \brief Create one scheduler of every discipline, in SchedulerType order.
     * \param maxSize the capacity bound in packets, 0 for unbounded
     * \return the schedulers
     */
    static std::vector<Ptr<PacketScheduler>> CreateAll(uint32_t maxSize = 0);

    /**
     * \brief Run each scheduler over its own copy of the packet stream.
     *
     * The given packets are left untouched.
     *
     * \param packets the packet stream
     * \param schedulers the schedulers to compare
     * \param simulator the simulator used for every run
     * \return the name and metrics of each run
     */
    static ComparisonResults Compare(const std::vector<Ptr<QosPacket>>& packets,
                                     const std::vector<Ptr<PacketScheduler>>& schedulers,
                                     const QosSimulator& simulator = QosSimulator());

  private:
    ObjectFactory m_factory; //!< Scheduler factory
};

/***************************************************************
 *  Implementation of the templates declared above.
 ***************************************************************/

template <typename... Ts>
void
SchedulerHelper::SetScheduler(std::string type, Ts&&... args)
{
    m_factory.SetTypeId(type);
    m_factory.Set(std::forward<Ts>(args)...);
}

} // namespace ns3

#endif /* SCHEDULER_HELPER_H */
