/*
 * Sensornet: energy-aware routing for wireless sensor networks
 *
 * SPDX-License-Identifier: GPL-2.0-only
 */
#ifndef SENSORNET_METRICS_H
#define SENSORNET_METRICS_H

#include "sensornet-outcome.h"

#include "ns3/nstime.h"
#include "ns3/ptr.h"

#include <cstdint>
#include <iostream>
#include <map>
#include <optional>
#include <vector>

namespace ns3
{
namespace sensornet
{

class Simulation;

/**
 * @ingroup sensornet
 * @brief Lifetime, throughput and energy figures of one run.
 */
struct MetricsSummary
{
    std::optional<uint32_t> firstDeathRound; ///< Round of the first death
    std::optional<Time> firstDeathTime;      ///< Time of the first death
    std::optional<uint32_t> halfDeathRound;  ///< Round when half the nodes are dead
    std::optional<uint32_t> lastDeathRound;  ///< Round when the last node died
    uint32_t deadNodes = 0;
    uint32_t rounds = 0;                     ///< Completed rounds
    uint64_t packetsDelivered = 0;
    uint64_t packetsDropped = 0;
    uint64_t readingsDelivered = 0;
    uint64_t readingsDropped = 0;
    double deliveryRatio = 0;                ///< Delivered readings over all finished readings
    double energyConsumed = 0;               ///< Joules spent up to the last completed round
    double energyPerReading = 0;             ///< Joules per delivered reading
    double averageClusterHeads = 0;          ///< Heads or leaders per completed round
    std::map<DropReason, uint64_t> dropsByReason;
    std::vector<uint32_t> aliveHistory;      ///< Alive nodes after each round
    std::vector<double> energyHistory;       ///< Residual energy after each round
};

/**
 * @ingroup sensornet
 * @brief Folds an outcome stream into run metrics.
 *
 * The collector accepts outcomes one at a time, either streamed from a
 * Simulation's "Outcome" trace source or replayed in a batch afterwards;
 * both give the same summary.
 */
class MetricsCollector
{
  public:
    /**
     * Constructor
     * @param nodeCount number of nodes in the run
     * @param initialEnergy initial energy per node in joules
     */
    MetricsCollector(uint32_t nodeCount, double initialEnergy);

    /**
     * Subscribe to a run's outcome trace.  The collector must outlive the run.
     * @param simulation the run
     */
    void ConnectTo(Ptr<Simulation> simulation);

    /**
     * Fold one outcome.
     * @param outcome the outcome
     */
    void Record(const Outcome& outcome);
    /**
     * Fold a batch of outcomes, in order.
     * @param outcomes the outcomes
     */
    void RecordAll(const std::vector<Outcome>& outcomes);

    /// @return the figures so far
    MetricsSummary Summary() const;
    /**
     * Print a human readable summary.
     * @param os the output stream
     */
    void Print(std::ostream& os) const;

  private:
    uint32_t m_nodeCount;
    double m_initialEnergy;
    double m_lastResidual;
    uint64_t m_clusterHeadSum;
    MetricsSummary m_summary;
};

} // namespace sensornet
} // namespace ns3

#endif /* SENSORNET_METRICS_H */
