/*
 * Sensornet: energy-aware routing for wireless sensor networks
 *
 * SPDX-License-Identifier: GPL-2.0-only
 */
#include "sensornet-metrics.h"

#include "sensornet-simulation.h"

#include "ns3/abort.h"
#include "ns3/callback.h"
#include "ns3/log.h"

#include <iomanip>

namespace ns3
{

NS_LOG_COMPONENT_DEFINE("SensornetMetrics");

namespace sensornet
{

MetricsCollector::MetricsCollector(uint32_t nodeCount, double initialEnergy)
    : m_nodeCount(nodeCount),
      m_initialEnergy(initialEnergy),
      m_lastResidual(nodeCount * initialEnergy),
      m_clusterHeadSum(0)
{
}

void
MetricsCollector::ConnectTo(Ptr<Simulation> simulation)
{
    NS_LOG_FUNCTION(this << simulation);
    bool connected =
        simulation->TraceConnectWithoutContext("Outcome",
                                               MakeCallback(&MetricsCollector::Record, this));
    NS_ABORT_MSG_UNLESS(connected, "Could not connect to the Outcome trace source");
}

void
MetricsCollector::Record(const Outcome& outcome)
{
    MetricsSummary& s = m_summary;
    switch (outcome.kind)
    {
    case OutcomeKind::NODE_DIED:
        ++s.deadNodes;
        if (!s.firstDeathRound)
        {
            s.firstDeathRound = outcome.round;
            s.firstDeathTime = outcome.time;
            NS_LOG_INFO("First node death: node " << outcome.node << " in round "
                                                  << outcome.round);
        }
        if (!s.halfDeathRound && 2 * s.deadNodes >= m_nodeCount)
        {
            s.halfDeathRound = outcome.round;
        }
        if (!s.lastDeathRound && s.deadNodes >= m_nodeCount)
        {
            s.lastDeathRound = outcome.round;
        }
        break;
    case OutcomeKind::PACKET_DELIVERED:
        ++s.packetsDelivered;
        s.readingsDelivered += outcome.contributions;
        break;
    case OutcomeKind::PACKET_DROPPED:
        ++s.packetsDropped;
        s.readingsDropped += outcome.contributions;
        ++s.dropsByReason[outcome.reason];
        break;
    case OutcomeKind::ROUND_COMPLETED:
        ++s.rounds;
        s.aliveHistory.push_back(outcome.aliveNodes);
        s.energyHistory.push_back(outcome.residualEnergy);
        m_lastResidual = outcome.residualEnergy;
        m_clusterHeadSum += outcome.clusterHeads;
        break;
    }
}

void
MetricsCollector::RecordAll(const std::vector<Outcome>& outcomes)
{
    NS_LOG_FUNCTION(this << outcomes.size());
    for (const auto& o : outcomes)
    {
        Record(o);
    }
}

MetricsSummary
MetricsCollector::Summary() const
{
    MetricsSummary s = m_summary;
    uint64_t finished = s.readingsDelivered + s.readingsDropped;
    s.deliveryRatio = finished > 0 ? static_cast<double>(s.readingsDelivered) / finished : 0;
    s.energyConsumed = m_nodeCount * m_initialEnergy - m_lastResidual;
    s.energyPerReading =
        s.readingsDelivered > 0 ? s.energyConsumed / s.readingsDelivered : 0;
    s.averageClusterHeads =
        s.rounds > 0 ? static_cast<double>(m_clusterHeadSum) / s.rounds : 0;
    return s;
}

void
MetricsCollector::Print(std::ostream& os) const
{
    MetricsSummary s = Summary();
    auto printRound = [&os](const char* label, const std::optional<uint32_t>& round) {
        os << "  " << std::left << std::setw(24) << label;
        if (round)
        {
            os << *round;
        }
        else
        {
            os << "-";
        }
        os << std::endl;
    };

    os << "Rounds completed:         " << s.rounds << std::endl;
    printRound("First node death round:", s.firstDeathRound);
    printRound("Half network dead round:", s.halfDeathRound);
    printRound("Last node death round:", s.lastDeathRound);
    os << "Dead nodes:               " << s.deadNodes << " / " << m_nodeCount << std::endl;
    os << "Packets delivered:        " << s.packetsDelivered << " (" << s.readingsDelivered
       << " readings)" << std::endl;
    os << "Packets dropped:          " << s.packetsDropped << " (" << s.readingsDropped
       << " readings)" << std::endl;
    for (const auto& [reason, count] : s.dropsByReason)
    {
        os << "    " << reason << ": " << count << std::endl;
    }
    os << std::fixed << std::setprecision(4);
    os << "Delivery ratio:           " << s.deliveryRatio << std::endl;
    os << "Energy consumed (J):      " << s.energyConsumed << std::endl;
    os << std::setprecision(9);
    os << "Energy per reading (J):   " << s.energyPerReading << std::endl;
    os << std::setprecision(2);
    os << "Avg cluster heads/round:  " << s.averageClusterHeads << std::endl;
    os.unsetf(std::ios_base::floatfield);
}

} // namespace sensornet
} // namespace ns3
