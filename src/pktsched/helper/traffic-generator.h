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

#ifndef TRAFFIC_GENERATOR_H
#define TRAFFIC_GENERATOR_H

#include "pktsched/qos-packet.h"

#include "ns3/nstime.h"
#include "ns3/object.h"
#include "ns3/ptr.h"
#include "ns3/random-variable-stream.h"

#include <map>
#include <ostream>
#include <vector>

namespace ns3
{

/**
 * \ingroup pktsched
 *
 * Traffic patterns reproducing common applications.
 */
enum class TrafficScenario
{
    MESSAGE_TEXTING,    //!< 3 users sending short bursts of small messages
    VIDEO_STREAMING,    //!< An HD and an SD stream of regularly spaced chunks
    ONLINE_MEETING,     //!< 3 participants, each with audio and video packets
    FILE_DOWNLOAD,      //!< One aggressive bulk flow and two background flows
    MICE_AND_ELEPHANTS, //!< 2 long downloads and 10 short web flows
};

std::ostream& operator<<(std::ostream& os, TrafficScenario scenario);

/**
 * \ingroup pktsched
 *
 * \brief Generate packet streams for the schedulers.
 *
 * The generator owns its random variable streams.  Their seed and run
 * number come from the ns-3 RngSeedManager; AssignStreams() fixes the
 * stream numbers so that the generated traffic is reproducible.
 *
 * Packet ids keep increasing across calls on the same generator.
 *
 * Two arrival models are available:
 * - Poisson: exponentially distributed gaps of mean 1 / ArrivalRate;
 * - bursty: bursts of BurstSize packets spaced by BurstSpacing, with
 *   exponentially distributed gaps of mean 1 / ArrivalRate between the
 *   starts of consecutive bursts.
 *
 * The flow id of each packet is drawn from the flow weights, its size from
 * the size classes (uniformly inside the class drawn) and its service time
 * uniformly between MinServiceTime and MaxServiceTime.
 */
class TrafficGenerator : public Object
{
  public:
    /// A range of packet sizes, in bytes, and its weight
    struct SizeClass
    {
        uint32_t m_minSize; //!< Smallest size of the class
        uint32_t m_maxSize; //!< Largest size of the class
        double m_weight;    //!< Relative weight
    };

    /**
     * \brief Get the type ID.
     * \return the object TypeId
     */
    static TypeId GetTypeId();

    TrafficGenerator();
    ~TrafficGenerator() override;

    /**
     * \brief Set the relative weight of each flow id.
     * \param weights flow id to weight; weights must be non-negative with a positive sum
     */
    void SetFlowWeights(const std::map<uint32_t, double>& weights);

    /**
     * \return the flow weights
     */
    const std::map<uint32_t, double>& GetFlowWeights() const;

    /**
     * \brief Set the packet size classes.
     * \param classes the size classes; weights must be non-negative with a positive sum
     */
    void SetSizeClasses(const std::vector<SizeClass>& classes);

    /**
     * \return the packet size classes
     */
    const std::vector<SizeClass>& GetSizeClasses() const;

    /**
     * \brief Generate packets with Poisson arrivals starting at time zero.
     * \param nPackets the number of packets
     * \return the packets, in arrival order
     */
    std::vector<Ptr<QosPacket>> GeneratePoisson(uint32_t nPackets);

    /**
     * \brief Generate packets arriving in bursts starting at time zero.
     * \param nPackets the number of packets
     * \return the packets, in arrival order
     */
    std::vector<Ptr<QosPacket>> GenerateBursty(uint32_t nPackets);

    /**
     * \brief Generate the traffic of an application scenario.
     *
     * Only the random variable streams are shared with the other
     * generation methods; the attributes and weights are not used.
     *
     * \param scenario the scenario
     * \return the packets, in arrival order
     */
    std::vector<Ptr<QosPacket>> GenerateScenario(TrafficScenario scenario);

    /**
     * \return the id that the next generated packet will carry
     */
    uint32_t GetNextUid() const;

    /**
     * Assign a fixed random variable stream number to the random variables
     * used by this generator.  Return the number of streams (possibly zero)
     * that have been assigned.
     *
     * \param stream first stream index to use
     * \return the number of stream indices assigned by this generator
     */
    int64_t AssignStreams(int64_t stream);

  protected:
    void DoDispose() override;

  private:
    /**
     * \brief Draw a packet with the configured flow, size and service time laws.
     * \param arrival the arrival time
     * \return the packet
     */
    Ptr<QosPacket> DrawPacket(Time arrival);

    /**
     * \brief Create a packet with the next id.
     * \param arrival the arrival time
     * \param flowId the flow id
     * \param minSize smallest size, in bytes
     * \param maxSize largest size, in bytes
     * \param minService smallest service time, in seconds
     * \param maxService largest service time, in seconds
     * \return the packet
     */
    Ptr<QosPacket> MakePacket(Time arrival,
                              uint32_t flowId,
                              uint32_t minSize,
                              uint32_t maxSize,
                              double minService,
                              double maxService);

    /**
     * \return the length of the next exponentially distributed gap
     */
    Time NextGap();

    /**
     * \brief Check the service time range.  Aborts if it is invalid.
     */
    void CheckServiceTimeRange() const;

    double m_arrivalRate;                     //!< Mean arrivals (or bursts) per second
    Time m_minServiceTime;                    //!< Smallest service time
    Time m_maxServiceTime;                    //!< Largest service time
    uint32_t m_burstSize;                     //!< Packets per burst
    Time m_burstSpacing;                      //!< Gap between packets of a burst
    std::map<uint32_t, double> m_flowWeights; //!< Weight of each flow id
    std::vector<SizeClass> m_sizeClasses;     //!< Packet size classes
    uint32_t m_nextUid{0};                    //!< Id of the next packet

    Ptr<ExponentialRandomVariable> m_gap; //!< Inter-arrival gaps
    Ptr<UniformRandomVariable> m_uniform; //!< Classes, sizes and service times
};

} // namespace ns3

#endif /* TRAFFIC_GENERATOR_H */
