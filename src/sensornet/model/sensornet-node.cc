/* SPDX-License-Identifier: GPL-2.0-only */

#include "sensornet-node.h"

namespace ns3
{
namespace sensornet
{

std::ostream&
operator<<(std::ostream& os, NodeRole role)
{
    switch (role)
    {
    case NodeRole::NORMAL:
        os << "Normal";
        break;
    case NodeRole::UNDECIDED:
        os << "Undecided";
        break;
    case NodeRole::CLUSTER_HEAD:
        os << "ClusterHead";
        break;
    case NodeRole::CLUSTER_MEMBER:
        os << "ClusterMember";
        break;
    case NodeRole::CHAIN_MEMBER:
        os << "ChainMember";
        break;
    case NodeRole::CHAIN_LEADER:
        os << "ChainLeader";
        break;
    }
    return os;
}

} // namespace sensornet
} // namespace ns3
