/*
 * Sensornet: energy-aware routing for wireless sensor networks
 *
 * SPDX-License-Identifier: GPL-2.0-only
 */
#ifndef SENSORNET_PACKET_H
#define SENSORNET_PACKET_H

#include "ns3/nstime.h"

#include <cstdint>
#include <iostream>
#include <limits>

namespace ns3
{
namespace sensornet
{

/// Node id meaning "no node" (broadcasts, unset cluster head, ...).
constexpr uint32_t NO_NODE = std::numeric_limits<uint32_t>::max();

/// Node id standing for the base station (the sink) in events and packets.
constexpr uint32_t BASE_STATION = std::numeric_limits<uint32_t>::max() - 1;

/**
 * @ingroup sensornet
 * @brief Kinds of scheduled actions.
 *
 * Round boundaries are driven by the simulation; every other kind belongs to
 * one of the protocol engines:
 *   ADVERTISE, JOIN_REQUEST, TDMA_SCHEDULE, AGGREGATE_SEND     - LEACH
 *   INTEREST_FLOOD, EXPLORATORY_DATA, GRADIENT_UPDATE,
 *   REINFORCE, NEGATIVE_REINFORCE                               - Directed Diffusion
 *   QUERY_FORWARD, REGION_FLOOD                                 - GEAR
 *   CHAIN_RELAY, LEADER_SEND                                    - PEGASIS
 *   SENSE, DATA_SEND                                            - shared
 */
enum MessageType : uint8_t
{
    SENSORNET_ROUND_START = 1,         ///< A new round begins
    SENSORNET_ROUND_END = 2,           ///< The current round is over
    SENSORNET_SENSE = 3,               ///< A node produces a reading and starts sending it
    SENSORNET_DATA_SEND = 4,           ///< A data packet arrives at its next hop
    SENSORNET_ADVERTISE = 5,           ///< Cluster head advertisement
    SENSORNET_JOIN_REQUEST = 6,        ///< A node joins the nearest cluster head
    SENSORNET_TDMA_SCHEDULE = 7,       ///< Cluster head broadcasts the member schedule
    SENSORNET_AGGREGATE_SEND = 8,      ///< Cluster head fuses and uplinks member data
    SENSORNET_INTEREST_FLOOD = 9,      ///< Interest (re)broadcast
    SENSORNET_EXPLORATORY_DATA = 10,   ///< Exploratory data copy arrives at a gradient neighbor
    SENSORNET_GRADIENT_UPDATE = 11,    ///< Sink evaluates observed paths
    SENSORNET_REINFORCE = 12,          ///< Positive reinforcement toward the source
    SENSORNET_NEGATIVE_REINFORCE = 13, ///< Negative reinforcement along a stale path
    SENSORNET_QUERY_FORWARD = 14,      ///< Geographic query arrives at its next hop
    SENSORNET_REGION_FLOOD = 15,       ///< Restricted flood inside the target region
    SENSORNET_CHAIN_RELAY = 16,        ///< Chain token arrives at the next chain node
    SENSORNET_LEADER_SEND = 17,        ///< Chain leader uplinks to the base station
};

/**
 * @brief Get a printable name for a message type.
 * @param type the message type
 * @return the name, or "Unknown"
 */
const char* MessageTypeName(MessageType type);

std::ostream& operator<<(std::ostream& os, MessageType type);

/**
 * @ingroup sensornet
 * @brief A packet travelling through the network.
 *
 * Packets are plain values carried inside scheduled events.  A packet may
 * carry several fused readings (@c contributions); delivery accounting counts
 * those readings, so every reading ends either delivered or dropped.
 */
struct SensorPacket
{
    uint64_t id;            ///< Unique within a run
    uint32_t source;        ///< Node that originated the first reading
    uint32_t sender;        ///< Node that transmitted this hop
    uint32_t nextHop;       ///< Receiver of this hop (may be BASE_STATION)
    uint32_t bits;          ///< Payload size in bits
    uint32_t hops;          ///< Hops travelled so far
    uint32_t contributions; ///< Number of readings fused into this packet
    Time created;           ///< When the first reading was produced

    SensorPacket()
        : id(0),
          source(NO_NODE),
          sender(NO_NODE),
          nextHop(NO_NODE),
          bits(0),
          hops(0),
          contributions(0),
          created(Time(0))
    {
    }
};

std::ostream& operator<<(std::ostream& os, const SensorPacket& p);

} // namespace sensornet
} // namespace ns3

#endif /* SENSORNET_PACKET_H */
