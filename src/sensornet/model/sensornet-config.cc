/*
 * Sensornet: energy-aware routing for wireless sensor networks
 *
 * SPDX-License-Identifier: GPL-2.0-only
 */
#include "sensornet-config.h"

#include "sensornet-protocol-engine.h"

#include <cmath>
#include <sstream>

namespace ns3
{
namespace sensornet
{

namespace
{

bool
IsFinite(const Vector& v)
{
    return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
}

} // namespace

uint32_t
SimulationConfig::SlotBudget(uint32_t nodeCount)
{
    return 4 * nodeCount + 16;
}

Time
SimulationConfig::GetEffectiveHopDelay() const
{
    if (!hopDelay.IsZero())
    {
        return hopDelay;
    }
    return NanoSeconds(roundPeriod.GetNanoSeconds() / SlotBudget(nodeCount));
}

double
SimulationConfig::GetFieldDiagonal() const
{
    return std::sqrt(areaWidth * areaWidth + areaHeight * areaHeight);
}

std::vector<TargetRegion>
SimulationConfig::GetGearRegions() const
{
    if (!gear.regions.empty())
    {
        return gear.regions;
    }
    return {TargetRegion{Vector(0.75 * areaWidth, 0.75 * areaHeight, 0), gear.regionRadius},
            TargetRegion{Vector(0.25 * areaWidth, 0.25 * areaHeight, 0), gear.regionRadius}};
}

bool
SimulationConfig::Validate(std::string& reason) const
{
    std::ostringstream os;
    ProtocolKind kind;
    if (nodeCount == 0)
    {
        os << "node count must be positive";
    }
    else if (!(initialEnergy > 0) || !std::isfinite(initialEnergy))
    {
        os << "initial energy must be positive, got " << initialEnergy;
    }
    else if (!(areaWidth > 0) || !(areaHeight > 0) || !std::isfinite(areaWidth) ||
             !std::isfinite(areaHeight))
    {
        os << "area must have positive dimensions, got " << areaWidth << " x " << areaHeight;
    }
    else if (!IsFinite(baseStation) ||
             CalculateDistance(baseStation, Vector(areaWidth / 2, areaHeight / 2, 0)) >
                 10 * GetFieldDiagonal())
    {
        os << "base station " << baseStation << " is too far from the field";
    }
    else if (!(radioRange > 0))
    {
        os << "radio range must be positive";
    }
    else if (dataPacketBits == 0 || controlPacketBits == 0)
    {
        os << "packet sizes must be positive";
    }
    else if (roundHorizon == 0)
    {
        os << "round horizon must be positive";
    }
    else if (!roundPeriod.IsStrictlyPositive())
    {
        os << "round period must be positive";
    }
    else if (hopDelay.IsStrictlyNegative())
    {
        os << "hop delay must not be negative";
    }
    else if (!GetEffectiveHopDelay().IsStrictlyPositive() ||
             GetEffectiveHopDelay() * SlotBudget(nodeCount) > roundPeriod)
    {
        os << "round period " << roundPeriod.As(Time::S) << " cannot hold "
           << SlotBudget(nodeCount) << " phase slots of " << GetEffectiveHopDelay().As(Time::S);
    }
    else if (!ParseProtocolKind(protocolName, kind))
    {
        os << "unknown protocol '" << protocolName << "'";
    }
    else if (!(energy.electronics >= 0) || !(energy.freeSpace > 0) || !(energy.multipath > 0) ||
             !(energy.crossover >= 0) || !(energy.aggregation >= 0) || !(energy.sensing >= 0))
    {
        os << "invalid radio energy constants";
    }
    else if (!(leach.clusterHeadFraction > 0) || leach.clusterHeadFraction > 1)
    {
        os << "LEACH cluster head fraction must be in (0, 1], got "
           << leach.clusterHeadFraction;
    }
    else if (leach.framesPerRound == 0 ||
             2 * leach.framesPerRound + 3 >= SlotBudget(nodeCount))
    {
        os << "LEACH frames per round must be between 1 and " << nodeCount * 2 + 6;
    }
    else if (leach.clusterRadius < 0)
    {
        os << "LEACH cluster radius must not be negative";
    }
    else if (diffusion.interestInterval == 0 || diffusion.sourceCount == 0 ||
             diffusion.reinforcedRate == 0 || diffusion.sinkRange < 0)
    {
        os << "invalid Directed Diffusion parameters";
    }
    else if (gear.alpha < 0 || gear.alpha > 1)
    {
        os << "GEAR alpha must be in [0, 1], got " << gear.alpha;
    }
    else if (!(gear.regionRadius > 0) || gear.queryInterval == 0 || gear.sinkRange < 0)
    {
        os << "invalid GEAR parameters";
    }
    else if (!positions.empty() && positions.size() != nodeCount)
    {
        os << positions.size() << " positions given for " << nodeCount << " nodes";
    }
    if (os.str().empty())
    {
        for (const auto& r : gear.regions)
        {
            if (!(r.radius > 0) || !IsFinite(r.center))
            {
                os << "GEAR target region " << r.center << " needs a positive radius";
                break;
            }
        }
    }
    if (os.str().empty())
    {
        for (uint32_t i = 0; i < positions.size(); ++i)
        {
            const Vector& p = positions[i];
            if (!IsFinite(p) || p.x < 0 || p.y < 0 || p.x > areaWidth || p.y > areaHeight)
            {
                os << "node " << i << " at " << p << " lies outside the field";
                break;
            }
        }
    }
    reason = os.str();
    return reason.empty();
}

} // namespace sensornet
} // namespace ns3
