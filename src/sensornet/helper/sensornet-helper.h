/*
 * Sensornet: energy-aware routing for wireless sensor networks
 *
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * Helper class that creates configured simulation runs.
 */

#ifndef SENSORNET_HELPER_H
#define SENSORNET_HELPER_H

#include "ns3/object-factory.h"
#include "ns3/sensornet-simulation.h"

#include <string>
#include <vector>

namespace ns3
{
/**
 * @ingroup sensornet
 * @brief Helper class that creates sensornet simulation runs.
 *
 * Attributes set on the helper apply to every run it creates, so one helper
 * can stamp out the same scenario for several protocols or seeds.
 */
class SensornetHelper
{
  public:
    SensornetHelper();

    /**
     * @param name the name of the attribute to set
     * @param value the value of the attribute to set.
     *
     * This method controls the attributes of ns3::sensornet::Simulation
     */
    void Set(std::string name, const AttributeValue& value);

    /**
     * @param protocol the routing protocol of the run
     * @returns a newly-created run, not yet set up
     */
    Ptr<sensornet::Simulation> Create(std::string protocol) const;

    /**
     * Assign fixed random variable stream numbers to a set of runs, one
     * consecutive stream per run.
     *
     * @param runs the runs
     * @param stream first stream index to use
     * @return the number of stream indices assigned by this helper
     */
    int64_t AssignStreams(const std::vector<Ptr<sensornet::Simulation>>& runs, int64_t stream);

  private:
    /** the factory to create simulation runs */
    ObjectFactory m_simulationFactory;
};

} // namespace ns3

#endif /* SENSORNET_HELPER_H */
