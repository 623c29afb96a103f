/*
 * Sensornet: energy-aware routing for wireless sensor networks
 *
 * SPDX-License-Identifier: GPL-2.0-only
 */
#ifndef SENSORNET_OUTCOME_H
#define SENSORNET_OUTCOME_H

#include "sensornet-packet.h"

#include "ns3/nstime.h"

#include <cstdint>
#include <iostream>

namespace ns3
{
namespace sensornet
{

/**
 * @ingroup sensornet
 * @brief Kind of an observable simulation result.
 */
enum class OutcomeKind : uint8_t
{
    NODE_DIED,
    PACKET_DELIVERED,
    PACKET_DROPPED,
    ROUND_COMPLETED,
};

/**
 * @ingroup sensornet
 * @brief Why a packet failed to reach the base station.
 */
enum class DropReason : uint8_t
{
    NONE,          ///< Not a drop
    SENDER_DIED,   ///< The sender could not afford the transmission
    RECEIVER_DIED, ///< The receiver could not afford the reception
    NEXT_HOP_DEAD, ///< The next hop was dead and no repair path exists
    NO_ROUTE,      ///< No gradient, progress or recovery neighbor
    HEAD_LOST,     ///< The cluster head died before uplinking
    CHAIN_BROKEN,  ///< A chain node died while holding the token
};

std::ostream& operator<<(std::ostream& os, OutcomeKind kind);
std::ostream& operator<<(std::ostream& os, DropReason reason);

/**
 * @ingroup sensornet
 * @brief One entry of the ordered outcome stream of a run.
 *
 * Outcomes are the only thing a run reports; metrics are pure functions of
 * the stream.  Fields that do not apply to a kind are left at their zero
 * values.
 */
struct Outcome
{
    Time time;                  ///< Simulation time of the outcome
    OutcomeKind kind;           ///< Outcome kind
    uint32_t round;             ///< Round during which it happened
    uint32_t node;              ///< Dead node, or last holder of the packet
    uint64_t packetId;          ///< Packet id (delivered/dropped)
    uint32_t source;            ///< Packet source (delivered/dropped)
    uint32_t hops;              ///< Hops travelled (delivered/dropped)
    uint32_t contributions;     ///< Readings carried (delivered/dropped)
    DropReason reason;          ///< Drop reason (dropped)
    uint32_t aliveNodes;        ///< Alive nodes at round end (round completed)
    double residualEnergy;      ///< Total remaining energy (round completed)
    uint32_t clusterHeads;      ///< Cluster heads / leaders this round (round completed)

    Outcome();

    /**
     * @param time when the node died
     * @param round the round
     * @param node the node id
     * @return a NODE_DIED outcome
     */
    static Outcome NodeDied(Time time, uint32_t round, uint32_t node);
    /**
     * @param time delivery time
     * @param round the round
     * @param packet the packet as it reached the base station
     * @return a PACKET_DELIVERED outcome
     */
    static Outcome PacketDelivered(Time time, uint32_t round, const SensorPacket& packet);
    /**
     * @param time drop time
     * @param round the round
     * @param holder node that held the packet last
     * @param packet the packet
     * @param reason why it was dropped
     * @return a PACKET_DROPPED outcome
     */
    static Outcome PacketDropped(Time time,
                                 uint32_t round,
                                 uint32_t holder,
                                 const SensorPacket& packet,
                                 DropReason reason);
    /**
     * @param time round end time
     * @param round the completed round
     * @param aliveNodes alive nodes at round end
     * @param residualEnergy total remaining energy
     * @param clusterHeads cluster heads (LEACH) or leaders (PEGASIS) of the round
     * @return a ROUND_COMPLETED outcome
     */
    static Outcome RoundCompleted(Time time,
                                  uint32_t round,
                                  uint32_t aliveNodes,
                                  double residualEnergy,
                                  uint32_t clusterHeads);
};

/**
 * Print an outcome on one line.  The format is fixed so that two runs can be
 * compared byte for byte.
 */
std::ostream& operator<<(std::ostream& os, const Outcome& o);

} // namespace sensornet
} // namespace ns3

#endif /* SENSORNET_OUTCOME_H */
