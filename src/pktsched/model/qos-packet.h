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

#ifndef QOS_PACKET_H
#define QOS_PACKET_H

#include "ns3/nstime.h"
#include "ns3/ptr.h"
#include "ns3/simple-ref-count.h"

#include <map>
#include <optional>
#include <ostream>
#include <vector>

namespace ns3
{

/**
 * \ingroup pktsched
 *
 * Arrival descriptor of a packet competing for service at a scheduler,
 * together with its timing outcome.
 *
 * The arrival fields are fixed at construction.  The start and finish
 * times are written exactly once, by the scheduler that services the
 * packet.  The flow id doubles as the packet priority: a higher value
 * means a higher priority.
 */
class QosPacket : public SimpleRefCount<QosPacket>
{
  public:
    /**
     * \brief Constructor
     * \param uid unique packet identifier
     * \param arrivalTime arrival time at the scheduler
     * \param flowId flow and priority identifier (strictly positive)
     * \param size size in bytes
     * \param serviceTime time needed to fully service the packet
     */
    QosPacket(uint32_t uid,
              Time arrivalTime,
              uint32_t flowId = 1,
              uint32_t size = 1000,
              Time serviceTime = Seconds(1));

    /**
     * \brief Return a copy of the arrival descriptor, without any timing outcome.
     *
     * Used to give each scheduler under comparison its own packet stream.
     * \return the copy
     */
    Ptr<QosPacket> Copy() const;

    uint32_t GetUid() const;
    Time GetArrivalTime() const;
    uint32_t GetFlowId() const;
    /// \return the priority; identical to the flow id
    uint32_t GetPriority() const;
    uint32_t GetSize() const;
    Time GetServiceTime() const;

    /**
     * \brief Record the time at which service starts.  May be called once.
     * \param start the start time
     */
    void SetStartTime(Time start);
    /**
     * \brief Record the time at which service completes.  May be called once,
     * after the start time was recorded.
     * \param finish the finish time
     */
    void SetFinishTime(Time finish);

    bool HasStarted() const;
    bool HasFinished() const;
    /// \return the start time; the packet must have started
    Time GetStartTime() const;
    /// \return the finish time; the packet must have finished
    Time GetFinishTime() const;

    /**
     * \brief Total latency (waiting plus service).
     * \return finish time minus arrival time; the packet must have finished
     */
    Time GetLatency() const;
    /**
     * \brief Time spent waiting before service started.
     * \return start time minus arrival time; the packet must have started
     */
    Time GetWaitingTime() const;

    /**
     * \brief Ordering used by priority based selection.
     *
     * The higher priority wins; equal priorities are broken by the earlier
     * arrival time.
     *
     * \param other the packet to compare with
     * \return true if this packet must be served before other
     */
    bool HasPrecedenceOver(const QosPacket& other) const;

    /**
     * TracedCallback signature for packet events.
     *
     * \param [in] packet The packet.
     */
    typedef void (*TracedCallback)(Ptr<const QosPacket> packet);

  private:
    uint32_t m_uid;                   //!< Unique identifier
    Time m_arrivalTime;               //!< Arrival time
    uint32_t m_flowId;                //!< Flow and priority identifier
    uint32_t m_size;                  //!< Size in bytes (informational)
    Time m_serviceTime;               //!< Service duration
    std::optional<Time> m_startTime;  //!< Set once, at first service
    std::optional<Time> m_finishTime; //!< Set once, at completion
};

std::ostream& operator<<(std::ostream& os, const QosPacket& packet);

/// Packets keyed by flow id, each vector in service order
typedef std::map<uint32_t, std::vector<Ptr<QosPacket>>> FlowPacketMap;

/**
 * \brief Group packets by flow id, preserving their relative order.
 * \param packets the packets to group
 * \return the packets of each flow
 */
FlowPacketMap GroupByFlow(const std::vector<Ptr<QosPacket>>& packets);

/**
 * \brief Deep copy a packet stream with QosPacket::Copy.
 * \param packets the stream to copy
 * \return the copied stream, in the same order
 */
std::vector<Ptr<QosPacket>> CopyPackets(const std::vector<Ptr<QosPacket>>& packets);

} // namespace ns3

#endif /* QOS_PACKET_H */
