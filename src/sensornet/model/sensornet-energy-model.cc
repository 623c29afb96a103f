/*
 * Sensornet: energy-aware routing for wireless sensor networks
 *
 * SPDX-License-Identifier: GPL-2.0-only
 */
#include "sensornet-energy-model.h"

#include "ns3/abort.h"
#include "ns3/log.h"

#include <cmath>

namespace ns3
{

NS_LOG_COMPONENT_DEFINE("SensornetEnergyModel");

namespace sensornet
{

EnergyModel::EnergyModel()
    : EnergyModel(EnergyParameters())
{
}

EnergyModel::EnergyModel(const EnergyParameters& params)
    : m_params(params)
{
    NS_ABORT_MSG_IF(params.freeSpace <= 0 || params.multipath <= 0,
                    "Amplifier constants must be positive");
    m_crossover = params.crossover > 0 ? params.crossover
                                       : std::sqrt(params.freeSpace / params.multipath);
}

double
EnergyModel::TransmitCost(double distance, uint32_t bits) const
{
    double k = bits;
    if (distance < m_crossover)
    {
        return m_params.electronics * k + m_params.freeSpace * k * distance * distance;
    }
    double d2 = distance * distance;
    return m_params.electronics * k + m_params.multipath * k * d2 * d2;
}

double
EnergyModel::ReceiveCost(uint32_t bits) const
{
    return m_params.electronics * bits;
}

double
EnergyModel::AggregationCost(uint32_t bits) const
{
    return m_params.aggregation * bits;
}

double
EnergyModel::SensingCost(uint32_t bits) const
{
    return m_params.sensing * bits;
}

double
EnergyModel::GetCrossoverDistance() const
{
    return m_crossover;
}

EnergyResult
EnergyModel::Apply(SensorNode& node, double cost) const
{
    NS_ABORT_MSG_IF(cost < 0, "Negative energy charge " << cost << " for node " << node.GetId());
    EnergyResult result = {node.m_energy, false, false};
    if (!node.IsAlive())
    {
        return result;
    }
    if (cost > node.m_energy)
    {
        NS_LOG_LOGIC("Node " << node.GetId() << " cannot afford " << cost << " J (has "
                             << node.m_energy << " J)");
        node.m_energy = 0;
    }
    else
    {
        node.m_energy -= cost;
        result.completed = true;
    }
    result.remaining = node.m_energy;
    if (!node.IsAlive() && !node.m_deathReported)
    {
        node.m_deathReported = true;
        result.died = true;
        NS_LOG_DEBUG("Node " << node.GetId() << " depleted");
    }
    return result;
}

} // namespace sensornet
} // namespace ns3
