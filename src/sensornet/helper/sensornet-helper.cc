/*
 * Sensornet: energy-aware routing for wireless sensor networks
 *
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * Helper class implementation.
 */

#include "sensornet-helper.h"

#include "ns3/assert.h"
#include "ns3/log.h"
#include "ns3/string.h"

namespace ns3
{

NS_LOG_COMPONENT_DEFINE("SensornetHelper");

SensornetHelper::SensornetHelper()
{
    m_simulationFactory.SetTypeId("ns3::sensornet::Simulation");
}

void
SensornetHelper::Set(std::string name, const AttributeValue& value)
{
    m_simulationFactory.Set(name, value);
}

Ptr<sensornet::Simulation>
SensornetHelper::Create(std::string protocol) const
{
    NS_LOG_FUNCTION(this << protocol);
    ObjectFactory factory = m_simulationFactory;
    factory.Set("Protocol", StringValue(protocol));
    return factory.Create<sensornet::Simulation>();
}

int64_t
SensornetHelper::AssignStreams(const std::vector<Ptr<sensornet::Simulation>>& runs,
                               int64_t stream)
{
    int64_t currentStream = stream;
    for (const auto& run : runs)
    {
        NS_ASSERT_MSG(run, "Null simulation run");
        currentStream += run->AssignStreams(currentStream);
    }
    return (currentStream - stream);
}

} // namespace ns3
