/*
 * Sensornet: energy-aware routing for wireless sensor networks
 *
 * SPDX-License-Identifier: GPL-2.0-only
 */
#include "sensornet-topology.h"

#include "ns3/abort.h"
#include "ns3/log.h"

namespace ns3
{

NS_LOG_COMPONENT_DEFINE("SensornetTopology");

namespace sensornet
{

Topology::Topology()
    : m_baseStation(Vector(0, 0, 0)),
      m_radioRange(0),
      m_adjacencyValid(false)
{
}

Topology::Topology(const std::vector<Vector>& positions,
                   double initialEnergy,
                   const Vector& baseStation,
                   double radioRange)
    : m_baseStation(baseStation),
      m_radioRange(radioRange),
      m_adjacencyValid(false)
{
    m_nodes.reserve(positions.size());
    for (uint32_t i = 0; i < positions.size(); ++i)
    {
        m_nodes.emplace_back(i, positions[i], initialEnergy);
    }
    NS_LOG_DEBUG("Topology with " << m_nodes.size() << " nodes, base station at " << baseStation
                                  << ", range " << radioRange << " m");
}

const SensorNode&
Topology::GetNode(uint32_t id) const
{
    NS_ABORT_MSG_IF(id >= m_nodes.size(), "No node " << id);
    return m_nodes[id];
}

SensorNode&
Topology::GetNode(uint32_t id)
{
    NS_ABORT_MSG_IF(id >= m_nodes.size(), "No node " << id);
    return m_nodes[id];
}

bool
Topology::IsAlive(uint32_t id) const
{
    return id < m_nodes.size() && m_nodes[id].IsAlive();
}

double
Topology::Distance(uint32_t a, uint32_t b) const
{
    return CalculateDistance(GetNode(a).GetPosition(), GetNode(b).GetPosition());
}

double
Topology::DistanceToBaseStation(uint32_t id) const
{
    return CalculateDistance(GetNode(id).GetPosition(), m_baseStation);
}

double
Topology::DistanceTo(uint32_t id, const Vector& point) const
{
    return CalculateDistance(GetNode(id).GetPosition(), point);
}

void
Topology::RefreshAdjacency() const
{
    if (m_adjacencyValid)
    {
        return;
    }
    m_adjacency.assign(m_nodes.size(), std::vector<uint32_t>());
    for (uint32_t i = 0; i < m_nodes.size(); ++i)
    {
        if (!m_nodes[i].IsAlive())
        {
            continue;
        }
        for (uint32_t j = i + 1; j < m_nodes.size(); ++j)
        {
            if (m_nodes[j].IsAlive() &&
                CalculateDistance(m_nodes[i].GetPosition(), m_nodes[j].GetPosition()) <=
                    m_radioRange)
            {
                m_adjacency[i].push_back(j);
                m_adjacency[j].push_back(i);
            }
        }
    }
    m_adjacencyValid = true;
}

std::vector<uint32_t>
Topology::NeighborsWithin(uint32_t id, double range) const
{
    std::vector<uint32_t> result;
    if (!IsAlive(id))
    {
        return result;
    }
    if (range == m_radioRange)
    {
        RefreshAdjacency();
        for (uint32_t n : m_adjacency[id])
        {
            // a node may have been drained since the cache was built
            if (m_nodes[n].IsAlive())
            {
                result.push_back(n);
            }
        }
        return result;
    }
    for (uint32_t j = 0; j < m_nodes.size(); ++j)
    {
        if (j != id && m_nodes[j].IsAlive() && Distance(id, j) <= range)
        {
            result.push_back(j);
        }
    }
    return result;
}

std::vector<uint32_t>
Topology::NodesWithin(const Vector& point, double range) const
{
    std::vector<uint32_t> result;
    for (uint32_t j = 0; j < m_nodes.size(); ++j)
    {
        if (m_nodes[j].IsAlive() && CalculateDistance(m_nodes[j].GetPosition(), point) <= range)
        {
            result.push_back(j);
        }
    }
    return result;
}

std::vector<uint32_t>
Topology::GetAliveNodes() const
{
    std::vector<uint32_t> alive;
    for (const auto& n : m_nodes)
    {
        if (n.IsAlive())
        {
            alive.push_back(n.GetId());
        }
    }
    return alive;
}

uint32_t
Topology::GetNAliveNodes() const
{
    uint32_t count = 0;
    for (const auto& n : m_nodes)
    {
        if (n.IsAlive())
        {
            ++count;
        }
    }
    return count;
}

double
Topology::GetResidualEnergy() const
{
    double total = 0;
    for (const auto& n : m_nodes)
    {
        total += n.GetEnergy();
    }
    return total;
}

void
Topology::MarkDead(uint32_t id)
{
    SensorNode& node = GetNode(id);
    node.m_energy = 0;
    node.m_deathReported = true;
    node.m_role = NodeRole::NORMAL;
    m_adjacencyValid = false;
    NS_LOG_LOGIC("Node " << id << " marked dead");
}

} // namespace sensornet
} // namespace ns3
