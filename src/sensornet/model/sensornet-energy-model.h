/*
 * Sensornet: energy-aware routing for wireless sensor networks
 *
 * SPDX-License-Identifier: GPL-2.0-only
 */
#ifndef SENSORNET_ENERGY_MODEL_H
#define SENSORNET_ENERGY_MODEL_H

#include "sensornet-node.h"

#include <cstdint>

namespace ns3
{
namespace sensornet
{

/**
 * @ingroup sensornet
 * @brief First-order radio model constants.
 */
struct EnergyParameters
{
    double electronics = 50e-9;     ///< E_elec, J/bit (transmit and receive circuitry)
    double freeSpace = 10e-12;      ///< E_fs, J/bit/m^2
    double multipath = 0.0013e-12;  ///< E_mp, J/bit/m^4
    double crossover = 0;           ///< d_0 in meters; 0 derives sqrt(E_fs / E_mp)
    double aggregation = 5e-9;      ///< E_DA, J/bit fused
    double sensing = 5e-9;          ///< J/bit sensed
};

/**
 * @ingroup sensornet
 * @brief Result of charging a node for an action.
 */
struct EnergyResult
{
    double remaining; ///< Energy left after the charge
    bool completed;   ///< The node could afford the action
    bool died;        ///< The node died on this charge (reported once per node)
};

/**
 * @ingroup sensornet
 * @brief Radio energy accounting.
 *
 * Transmission costs E_elec*k + E_fs*k*d^2 below the crossover distance and
 * E_elec*k + E_mp*k*d^4 at or beyond it.  Reception costs E_elec*k.
 * The model is stateless; it only charges nodes.
 */
class EnergyModel
{
  public:
    EnergyModel();
    /**
     * Constructor
     * @param params the radio constants
     */
    explicit EnergyModel(const EnergyParameters& params);

    /**
     * @param distance the link length in meters
     * @param bits the message size
     * @return the energy needed to transmit
     */
    double TransmitCost(double distance, uint32_t bits) const;
    /**
     * @param bits the message size
     * @return the energy needed to receive
     */
    double ReceiveCost(uint32_t bits) const;
    /**
     * @param bits the number of bits fused
     * @return the energy needed to aggregate
     */
    double AggregationCost(uint32_t bits) const;
    /**
     * @param bits the reading size
     * @return the energy needed to sense
     */
    double SensingCost(uint32_t bits) const;

    /// @return the effective crossover distance
    double GetCrossoverDistance() const;
    /// @return the radio constants
    const EnergyParameters& GetParameters() const
    {
        return m_params;
    }

    /**
     * Charge a node.
     *
     * A cost larger than the remaining energy drains the node to zero and
     * the action does not complete.  A dead node is never charged.
     * @param node the node
     * @param cost the energy in joules, non-negative
     * @return the charge result
     */
    EnergyResult Apply(SensorNode& node, double cost) const;

  private:
    EnergyParameters m_params;
    double m_crossover;
};

} // namespace sensornet
} // namespace ns3

#endif /* SENSORNET_ENERGY_MODEL_H */
