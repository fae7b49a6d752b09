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

#ifndef PACKET_SCHEDULER_H
#define PACKET_SCHEDULER_H

#include "qos-packet.h"
#include "scheduler-metrics.h"

#include "ns3/nstime.h"
#include "ns3/object.h"
#include "ns3/queue-size.h"
#include "ns3/traced-callback.h"

#include <map>
#include <ostream>
#include <string>
#include <vector>

namespace ns3
{

/**
 * \ingroup pktsched
 *
 * The closed set of scheduling disciplines.
 */
enum class SchedulerType
{
    FCFS,
    PRIORITY,
    ROUND_ROBIN,
    FAIR_QUEUE,
    LAS,
};

std::ostream& operator<<(std::ostream& os, SchedulerType type);

/**
 * \ingroup pktsched
 *
 * Base class of the packet scheduling disciplines.
 *
 * A scheduler buffers the packets admitted with Enqueue() and, on each call
 * to Dequeue(), selects one of them and services it to completion on its
 * own logical clock: the packet start time is the clock value when it is
 * selected, and the clock then advances by the packet service time.
 * Serviced packets are appended to the processed list; packets refused at
 * admission or evicted from the buffer are appended to the dropped list,
 * together with the reason of the drop.
 *
 * Subclasses implement the admission policy in DoEnqueue(), the selection
 * policy in DoDequeue() and the reset of their internal containers in
 * DoReset().  They must call DropBeforeEnqueue() for a refused packet and
 * DropAfterEnqueue() for an evicted one, so that the packet count and the
 * statistics stay consistent.
 *
 * The capacity bound is the MaxSize attribute, in packets.  A value of
 * zero packets means that the buffer is unbounded.
 */
class PacketScheduler : public Object
{
  public:
    /**
     * \brief Structure that keeps the scheduler statistics
     */
    struct Stats
    {
        uint32_t nTotalOfferedPackets{0};                //!< Packets presented to Enqueue()
        uint32_t nTotalEnqueuedPackets{0};               //!< Packets admitted to the buffer
        uint32_t nTotalServicedPackets{0};               //!< Packets serviced by Dequeue()
        uint32_t nTotalDroppedPackets{0};                //!< Packets refused or evicted
        uint32_t nTotalDroppedPacketsBeforeEnqueue{0};   //!< Packets refused at admission
        uint32_t nTotalDroppedPacketsAfterEnqueue{0};    //!< Packets evicted from the buffer
        std::map<std::string, uint32_t> nDroppedPackets; //!< Drops per reason

        /**
         * \brief Get the number of packets dropped for the given reason
         * \param reason the reason why packets were dropped
         * \return the number of packets dropped for the given reason
         */
        uint32_t GetNDroppedPackets(const std::string& reason) const;

        /**
         * \brief Print the statistics.
         * \param os output stream in which the data should be printed.
         */
        void Print(std::ostream& os) const;
    };

    /**
     * \brief Get the type ID.
     * \return the object TypeId
     */
    static TypeId GetTypeId();

    PacketScheduler();
    ~PacketScheduler() override;

    /**
     * \return the discipline implemented by this scheduler
     */
    virtual SchedulerType GetSchedulerType() const = 0;

    /**
     * \return a human readable name of the discipline
     */
    std::string GetName() const;

    /**
     * \brief Admit a packet, or drop it according to the admission policy.
     *
     * Admission may evict a packet that is already buffered.
     *
     * \param packet the arriving packet
     * \return false if the arriving packet was dropped
     */
    bool Enqueue(Ptr<QosPacket> packet);

    /**
     * \brief Select the next packet and service it to completion.
     *
     * \return the serviced packet, or nullptr if no packet is available
     */
    Ptr<QosPacket> Dequeue();

    /**
     * \return true if no packet is buffered
     */
    bool IsEmpty() const;

    /**
     * \return the number of buffered packets
     */
    uint32_t GetNPackets() const;

    /**
     * \return the current value of the logical clock
     */
    Time GetCurrentTime() const;

    /**
     * \brief Move the logical clock forward over an idle period.
     * \param time the new clock value; must not be in the past
     */
    void AdvanceClock(Time time);

    /**
     * \brief Return to the initial state: clock at zero, no buffered,
     * processed or dropped packets, fresh statistics.
     */
    void Reset();

    /**
     * \brief Set the capacity bound.
     * \param size the bound; must be expressed in packets, 0 means unbounded
     */
    void SetMaxSize(QueueSize size);

    /**
     * \return the capacity bound
     */
    QueueSize GetMaxSize() const;

    /**
     * \return true if a capacity bound is configured
     */
    bool HasCapacityBound() const;

    /**
     * \return the serviced packets, in service order
     */
    const std::vector<Ptr<QosPacket>>& GetProcessedPackets() const;

    /**
     * \return the dropped packets, in drop order
     */
    const std::vector<Ptr<QosPacket>>& GetDroppedPackets() const;

    /**
     * \return the processed packets grouped by flow id
     */
    FlowPacketMap GetProcessedPacketsByFlow() const;

    /**
     * \return the statistics
     */
    const Stats& GetStats() const;

    /**
     * \brief Compute the metrics of the run so far.
     * \param mode what the per-flow fairness index is computed over
     * \return the metrics record
     */
    SchedulerMetrics GetMetrics(FlowFairnessMode mode = FlowFairnessMode::AUTO) const;

    /**
     * TracedCallback signature for drop events.
     *
     * \param [in] packet The dropped packet.
     * \param [in] reason The reason of the drop.
     */
    typedef void (*DropTracedCallback)(Ptr<const QosPacket> packet, const char* reason);

  protected:
    // Documented in base class
    void DoDispose() override;
    void DoInitialize() override;

    /**
     * \brief Record a packet refused at admission.
     * \param packet the arriving packet
     * \param reason the reason of the drop
     */
    void DropBeforeEnqueue(Ptr<QosPacket> packet, const char* reason);

    /**
     * \brief Record a buffered packet evicted by the admission policy.  The
     * subclass must already have removed it from its containers.
     * \param packet the evicted packet
     * \param reason the reason of the drop
     */
    void DropAfterEnqueue(Ptr<QosPacket> packet, const char* reason);

    /**
     * \brief Check the configuration of the discipline.  Called on initialization;
     * overriding classes must also call the base class method.
     * \return true if the configuration is valid
     */
    virtual bool CheckConfig();

  private:
    /**
     * \brief Admit the packet into the internal containers.
     * \param packet the arriving packet
     * \return false if the arriving packet was dropped with DropBeforeEnqueue()
     */
    virtual bool DoEnqueue(Ptr<QosPacket> packet) = 0;

    /**
     * \brief Remove the next packet to service from the internal containers.
     * Only called when at least one packet is buffered.
     * \return the selected packet
     */
    virtual Ptr<QosPacket> DoDequeue() = 0;

    /**
     * \brief Clear the internal containers and the discipline state.
     */
    virtual void DoReset() = 0;

    QueueSize m_maxSize;                     //!< Capacity bound (0 means unbounded)
    Time m_now;                              //!< Logical clock
    uint32_t m_nPackets{0};                  //!< Number of buffered packets
    std::vector<Ptr<QosPacket>> m_processed; //!< Serviced packets
    std::vector<Ptr<QosPacket>> m_dropped;   //!< Dropped packets
    Stats m_stats;                           //!< The scheduler statistics

    TracedCallback<Ptr<const QosPacket>> m_traceEnqueue;           //!< Packet admitted
    TracedCallback<Ptr<const QosPacket>> m_traceDequeue;           //!< Packet serviced
    TracedCallback<Ptr<const QosPacket>, const char*> m_traceDrop; //!< Packet dropped
};

/**
 * \brief Stream insertion operator.
 * \param os the stream
 * \param stats the scheduler statistics
 * \returns a reference to the stream
 */
std::ostream& operator<<(std::ostream& os, const PacketScheduler::Stats& stats);

} // namespace ns3

#endif /* PACKET_SCHEDULER_H */
