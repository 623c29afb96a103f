/*
 * Sensornet: energy-aware routing for wireless sensor networks
 *
 * SPDX-License-Identifier: GPL-2.0-only
 */
#ifndef SENSORNET_NODE_H
#define SENSORNET_NODE_H

#include "ns3/vector.h"

#include <cstdint>
#include <iostream>

namespace ns3
{
namespace sensornet
{

/**
 * @ingroup sensornet
 * @brief Protocol role of a node during the current round.
 */
enum class NodeRole : uint8_t
{
    NORMAL,         ///< No special role (also: LEACH node without a head, GEAR/DD relay)
    UNDECIDED,      ///< LEACH node before cluster formation completes
    CLUSTER_HEAD,   ///< LEACH cluster head
    CLUSTER_MEMBER, ///< LEACH cluster member
    CHAIN_MEMBER,   ///< PEGASIS chain member
    CHAIN_LEADER,   ///< PEGASIS chain leader
};

std::ostream& operator<<(std::ostream& os, NodeRole role);

class EnergyModel;
class Topology;

/**
 * @ingroup sensornet
 * @brief A sensor node.
 *
 * Identity and position are fixed at construction.  Remaining energy only
 * decreases, and only through EnergyModel::Apply or Topology::MarkDead; the
 * node is alive exactly while its energy is strictly positive.
 * Protocol-specific transient state lives in the protocol engines, indexed
 * by node id.
 */
class SensorNode
{
  public:
    /**
     * Constructor
     * @param id stable node id (its index in the topology)
     * @param position the node position
     * @param energy initial energy in joules
     */
    SensorNode(uint32_t id, const Vector& position, double energy)
        : m_id(id),
          m_position(position),
          m_energy(energy),
          m_deathReported(false),
          m_role(NodeRole::NORMAL)
    {
    }

    /// @return the node id
    uint32_t GetId() const
    {
        return m_id;
    }

    /// @return the node position
    const Vector& GetPosition() const
    {
        return m_position;
    }

    /// @return the remaining energy in joules
    double GetEnergy() const
    {
        return m_energy;
    }

    /// @return true while remaining energy is positive
    bool IsAlive() const
    {
        return m_energy > 0;
    }

    /// @return the current role
    NodeRole GetRole() const
    {
        return m_role;
    }

    /**
     * Set the current role
     * @param role the role
     */
    void SetRole(NodeRole role)
    {
        m_role = role;
    }

  private:
    friend class EnergyModel;
    friend class Topology;

    uint32_t m_id;
    Vector m_position;
    double m_energy;
    /// Death is reported exactly once
    bool m_deathReported;
    NodeRole m_role;
};

} // namespace sensornet
} // namespace ns3

#endif /* SENSORNET_NODE_H */
