/*
 * Sensornet: energy-aware routing for wireless sensor networks
 *
 * SPDX-License-Identifier: GPL-2.0-only
 */
#ifndef SENSORNET_TOPOLOGY_H
#define SENSORNET_TOPOLOGY_H

#include "sensornet-node.h"

#include "ns3/vector.h"

#include <cstdint>
#include <vector>

namespace ns3
{
namespace sensornet
{

/**
 * @ingroup sensornet
 * @brief The static node field plus the base station.
 *
 * Node ids are indices into the node list.  Nodes never move; only their
 * energy changes.  Neighbor queries at the radio range are cached and the
 * cache is invalidated whenever a node dies.
 */
class Topology
{
  public:
    Topology();
    /**
     * Constructor
     * @param positions node positions; node i is at positions[i]
     * @param initialEnergy initial energy of every node in joules
     * @param baseStation base station position
     * @param radioRange one-hop communication range in meters
     */
    Topology(const std::vector<Vector>& positions,
             double initialEnergy,
             const Vector& baseStation,
             double radioRange);

    /// @return number of nodes, dead or alive
    uint32_t GetNNodes() const
    {
        return m_nodes.size();
    }

    /**
     * @param id node id
     * @return the node
     */
    const SensorNode& GetNode(uint32_t id) const;
    /**
     * @param id node id
     * @return the node
     */
    SensorNode& GetNode(uint32_t id);

    /// @return the base station position
    const Vector& GetBaseStation() const
    {
        return m_baseStation;
    }

    /// @return the radio range
    double GetRadioRange() const
    {
        return m_radioRange;
    }

    /**
     * @param id node id
     * @return true if the node is alive
     */
    bool IsAlive(uint32_t id) const;

    /**
     * @param a node id
     * @param b node id
     * @return Euclidean distance between the nodes
     */
    double Distance(uint32_t a, uint32_t b) const;
    /**
     * @param id node id
     * @return distance from the node to the base station
     */
    double DistanceToBaseStation(uint32_t id) const;
    /**
     * @param id node id
     * @param point a position
     * @return distance from the node to the point
     */
    double DistanceTo(uint32_t id, const Vector& point) const;

    /**
     * Live nodes within @p range of @p id, excluding @p id itself, in
     * ascending id order.  A dead node has no neighbors.
     * @param id node id
     * @param range range in meters
     * @return neighbor ids
     */
    std::vector<uint32_t> NeighborsWithin(uint32_t id, double range) const;
    /**
     * Live nodes within @p range of @p point, in ascending id order.
     * @param point a position
     * @param range range in meters
     * @return node ids
     */
    std::vector<uint32_t> NodesWithin(const Vector& point, double range) const;

    /// @return ids of live nodes in ascending order
    std::vector<uint32_t> GetAliveNodes() const;
    /// @return number of live nodes
    uint32_t GetNAliveNodes() const;
    /// @return total remaining energy of all nodes
    double GetResidualEnergy() const;

    /**
     * Mark a node dead.  Idempotent; drains any remaining energy.
     * @param id node id
     */
    void MarkDead(uint32_t id);

  private:
    /// Rebuild the radio range adjacency if it is stale
    void RefreshAdjacency() const;

    std::vector<SensorNode> m_nodes;
    Vector m_baseStation;
    double m_radioRange;
    /// Live neighbors at radio range, per node
    mutable std::vector<std::vector<uint32_t>> m_adjacency;
    mutable bool m_adjacencyValid;
};

} // namespace sensornet
} // namespace ns3

#endif /* SENSORNET_TOPOLOGY_H */
