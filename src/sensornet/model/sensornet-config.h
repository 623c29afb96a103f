/*
 * Sensornet: energy-aware routing for wireless sensor networks
 *
 * SPDX-License-Identifier: GPL-2.0-only
 */
#ifndef SENSORNET_CONFIG_H
#define SENSORNET_CONFIG_H

#include "sensornet-directed-diffusion.h"
#include "sensornet-energy-model.h"
#include "sensornet-gear.h"
#include "sensornet-leach.h"
#include "sensornet-pegasis.h"

#include "ns3/nstime.h"
#include "ns3/vector.h"

#include <cstdint>
#include <string>
#include <vector>

namespace ns3
{
namespace sensornet
{

/**
 * @ingroup sensornet
 * @brief Everything one run needs to know before it starts.
 */
struct SimulationConfig
{
    uint32_t nodeCount = 100;                 ///< Number of sensor nodes
    double areaWidth = 100;                   ///< Field width in meters
    double areaHeight = 100;                  ///< Field height in meters
    double initialEnergy = 0.5;               ///< Initial energy per node in joules
    Vector baseStation = Vector(50, 150, 0);  ///< Base station position
    std::string protocolName = "LEACH";       ///< Routing protocol
    int64_t randomSeed = 1;                   ///< Random stream of the run
    uint32_t roundHorizon = 1000;             ///< Maximum number of rounds
    Time roundPeriod = Seconds(1);            ///< Duration of a round
    Time hopDelay = Time(0);                  ///< Phase slot length; 0 derives it
    double radioRange = 30;                   ///< One-hop range in meters
    uint32_t dataPacketBits = 4000;           ///< Data packet size
    uint32_t controlPacketBits = 100;         ///< Control packet size
    std::vector<Vector> positions;            ///< Explicit node positions; empty places nodes at random
    EnergyParameters energy;                  ///< Radio model
    LeachParameters leach;                    ///< LEACH block
    DiffusionParameters diffusion;            ///< Directed Diffusion block
    GearParameters gear;                      ///< GEAR block
    PegasisParameters pegasis;                ///< PEGASIS block

    /**
     * Check the configuration.
     * @param reason set to a description of the first problem found
     * @return true if the configuration can be run
     */
    bool Validate(std::string& reason) const;

    /**
     * @param nodeCount number of nodes
     * @return number of phase slots a round must hold
     */
    static uint32_t SlotBudget(uint32_t nodeCount);
    /// @return the phase slot length, derived from the round period when hopDelay is 0
    Time GetEffectiveHopDelay() const;
    /// @return the GEAR target regions, defaults filled in
    std::vector<TargetRegion> GetGearRegions() const;
    /// @return the field diagonal
    double GetFieldDiagonal() const;
};

} // namespace sensornet
} // namespace ns3

#endif /* SENSORNET_CONFIG_H */
