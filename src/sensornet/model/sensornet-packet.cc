/*
 * Sensornet: energy-aware routing for wireless sensor networks
 *
 * SPDX-License-Identifier: GPL-2.0-only
 */
#include "sensornet-packet.h"

namespace ns3
{
namespace sensornet
{

const char*
MessageTypeName(MessageType type)
{
    switch (type)
    {
    case SENSORNET_ROUND_START:
        return "RoundStart";
    case SENSORNET_ROUND_END:
        return "RoundEnd";
    case SENSORNET_SENSE:
        return "Sense";
    case SENSORNET_DATA_SEND:
        return "DataSend";
    case SENSORNET_ADVERTISE:
        return "Advertise";
    case SENSORNET_JOIN_REQUEST:
        return "JoinRequest";
    case SENSORNET_TDMA_SCHEDULE:
        return "TdmaSchedule";
    case SENSORNET_AGGREGATE_SEND:
        return "AggregateSend";
    case SENSORNET_INTEREST_FLOOD:
        return "InterestFlood";
    case SENSORNET_EXPLORATORY_DATA:
        return "ExploratoryData";
    case SENSORNET_GRADIENT_UPDATE:
        return "GradientUpdate";
    case SENSORNET_REINFORCE:
        return "Reinforce";
    case SENSORNET_NEGATIVE_REINFORCE:
        return "NegativeReinforce";
    case SENSORNET_QUERY_FORWARD:
        return "QueryForward";
    case SENSORNET_REGION_FLOOD:
        return "RegionFlood";
    case SENSORNET_CHAIN_RELAY:
        return "ChainRelay";
    case SENSORNET_LEADER_SEND:
        return "LeaderSend";
    }
    return "Unknown";
}

std::ostream&
operator<<(std::ostream& os, MessageType type)
{
    os << MessageTypeName(type);
    return os;
}

std::ostream&
operator<<(std::ostream& os, const SensorPacket& p)
{
    os << "packet " << p.id << " source=" << p.source << " sender=" << p.sender
       << " nextHop=" << p.nextHop << " bits=" << p.bits << " hops=" << p.hops
       << " contributions=" << p.contributions;
    return os;
}

} // namespace sensornet
} // namespace ns3
