/*
 * Sensornet: energy-aware routing for wireless sensor networks
 *
 * SPDX-License-Identifier: GPL-2.0-only
 */
#include "sensornet-outcome.h"

#include <iomanip>

namespace ns3
{
namespace sensornet
{

std::ostream&
operator<<(std::ostream& os, OutcomeKind kind)
{
    switch (kind)
    {
    case OutcomeKind::NODE_DIED:
        os << "NodeDied";
        break;
    case OutcomeKind::PACKET_DELIVERED:
        os << "PacketDelivered";
        break;
    case OutcomeKind::PACKET_DROPPED:
        os << "PacketDropped";
        break;
    case OutcomeKind::ROUND_COMPLETED:
        os << "RoundCompleted";
        break;
    }
    return os;
}

std::ostream&
operator<<(std::ostream& os, DropReason reason)
{
    switch (reason)
    {
    case DropReason::NONE:
        os << "None";
        break;
    case DropReason::SENDER_DIED:
        os << "SenderDied";
        break;
    case DropReason::RECEIVER_DIED:
        os << "ReceiverDied";
        break;
    case DropReason::NEXT_HOP_DEAD:
        os << "NextHopDead";
        break;
    case DropReason::NO_ROUTE:
        os << "NoRoute";
        break;
    case DropReason::HEAD_LOST:
        os << "HeadLost";
        break;
    case DropReason::CHAIN_BROKEN:
        os << "ChainBroken";
        break;
    }
    return os;
}

Outcome::Outcome()
    : time(Time(0)),
      kind(OutcomeKind::ROUND_COMPLETED),
      round(0),
      node(NO_NODE),
      packetId(0),
      source(NO_NODE),
      hops(0),
      contributions(0),
      reason(DropReason::NONE),
      aliveNodes(0),
      residualEnergy(0),
      clusterHeads(0)
{
}

Outcome
Outcome::NodeDied(Time time, uint32_t round, uint32_t node)
{
    Outcome o;
    o.time = time;
    o.kind = OutcomeKind::NODE_DIED;
    o.round = round;
    o.node = node;
    return o;
}

Outcome
Outcome::PacketDelivered(Time time, uint32_t round, const SensorPacket& packet)
{
    Outcome o;
    o.time = time;
    o.kind = OutcomeKind::PACKET_DELIVERED;
    o.round = round;
    o.node = packet.sender;
    o.packetId = packet.id;
    o.source = packet.source;
    o.hops = packet.hops;
    o.contributions = packet.contributions;
    return o;
}

Outcome
Outcome::PacketDropped(Time time,
                       uint32_t round,
                       uint32_t holder,
                       const SensorPacket& packet,
                       DropReason reason)
{
    Outcome o;
    o.time = time;
    o.kind = OutcomeKind::PACKET_DROPPED;
    o.round = round;
    o.node = holder;
    o.packetId = packet.id;
    o.source = packet.source;
    o.hops = packet.hops;
    o.contributions = packet.contributions;
    o.reason = reason;
    return o;
}

Outcome
Outcome::RoundCompleted(Time time,
                        uint32_t round,
                        uint32_t aliveNodes,
                        double residualEnergy,
                        uint32_t clusterHeads)
{
    Outcome o;
    o.time = time;
    o.kind = OutcomeKind::ROUND_COMPLETED;
    o.round = round;
    o.aliveNodes = aliveNodes;
    o.residualEnergy = residualEnergy;
    o.clusterHeads = clusterHeads;
    return o;
}

std::ostream&
operator<<(std::ostream& os, const Outcome& o)
{
    os << o.time.GetNanoSeconds() << "ns r" << o.round << " " << o.kind;
    switch (o.kind)
    {
    case OutcomeKind::NODE_DIED:
        os << " node=" << o.node;
        break;
    case OutcomeKind::PACKET_DELIVERED:
        os << " packet=" << o.packetId << " source=" << o.source << " hops=" << o.hops
           << " readings=" << o.contributions;
        break;
    case OutcomeKind::PACKET_DROPPED:
        os << " packet=" << o.packetId << " source=" << o.source << " at=" << o.node
           << " hops=" << o.hops << " readings=" << o.contributions << " reason=" << o.reason;
        break;
    case OutcomeKind::ROUND_COMPLETED: {
        std::ios_base::fmtflags flags = os.flags();
        std::streamsize precision = os.precision();
        os << " alive=" << o.aliveNodes << " heads=" << o.clusterHeads << " energy=" << std::fixed
           << std::setprecision(9) << o.residualEnergy;
        os.flags(flags);
        os.precision(precision);
        break;
    }
    }
    return os;
}

} // namespace sensornet
} // namespace ns3
