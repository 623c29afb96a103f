/*
 * Sensornet: energy-aware routing for wireless sensor networks
 *
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * Sensornet Comparison Simulation Script
 *
 * Compares LEACH, Directed Diffusion, GEAR and PEGASIS on the same fields:
 *   1. First node death round
 *   2. Half network death round
 *   3. Network lifetime (last death, or the horizon)
 *   4. Reading delivery ratio
 *   5. Delivered readings
 *   6. Energy consumed and energy per delivered reading
 *   7. Average cluster heads (leaders) per round
 *
 * Multi-seed sweep: mean and 95% CI half-width of every column
 *
 * Output: CSV to stdout for piping to data files.
 */

#include "ns3/core-module.h"
#include "ns3/sensornet-helper.h"
#include "ns3/sensornet-metrics.h"

#include <cmath>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

using namespace ns3;

NS_LOG_COMPONENT_DEFINE("SensornetComparison");

// =============================================================================
// Per-run result columns
// =============================================================================

/// Column names of the per-run metrics, in output order
static const std::vector<std::string> kColumns = {"firstDeath",
                                                  "halfDeath",
                                                  "lifetime",
                                                  "deliveryRatio",
                                                  "readingsDelivered",
                                                  "energyJ",
                                                  "energyPerReadingMj",
                                                  "avgClusterHeads"};

/**
 * Run one simulation.
 * @return one value per entry of kColumns; death rounds that never
 *         happened are reported as the horizon
 */
static std::vector<double>
RunSingleSimulation(const SensornetHelper& helper,
                    const std::string& protocol,
                    uint32_t nNodes,
                    double energy,
                    uint32_t rounds,
                    int64_t seed)
{
    Ptr<sensornet::Simulation> sim = helper.Create(protocol);
    sim->SetAttribute("RandomSeed", IntegerValue(seed));

    sensornet::MetricsCollector metrics(nNodes, energy);
    metrics.ConnectTo(sim);
    sim->Run();
    sensornet::MetricsSummary s = metrics.Summary();
    sim->Dispose();

    return {s.firstDeathRound ? static_cast<double>(*s.firstDeathRound) : rounds,
            s.halfDeathRound ? static_cast<double>(*s.halfDeathRound) : rounds,
            s.lastDeathRound ? static_cast<double>(*s.lastDeathRound) : s.rounds,
            s.deliveryRatio,
            static_cast<double>(s.readingsDelivered),
            s.energyConsumed,
            s.energyPerReading * 1e3,
            s.averageClusterHeads};
}

// =============================================================================
// Running sample statistics
// =============================================================================

/// Mean and variance of a metric over seeds, updated one run at a time (Welford)
class SeedSample
{
  public:
    void Add(double x)
    {
        ++m_n;
        double delta = x - m_mean;
        m_mean += delta / m_n;
        m_m2 += delta * (x - m_mean);
    }

    double GetMean() const
    {
        return m_mean;
    }

    /// Half-width of the 95% confidence interval, normal approximation
    double GetCi95() const
    {
        if (m_n < 2)
        {
            return 0.0;
        }
        double variance = m_m2 / (m_n - 1);
        return 1.96 * std::sqrt(variance / m_n);
    }

  private:
    uint32_t m_n{0};
    double m_mean{0};
    double m_m2{0};
};

// =============================================================================
// Main
// =============================================================================

int
main(int argc, char* argv[])
{
    std::string protocol = "all"; // one protocol name, or "all"
    uint32_t nNodes = 100;
    double areaSize = 100.0;
    double energy = 0.5;
    uint32_t rounds = 1000;
    double radioRange = 30.0;
    uint32_t seedStart = 1;
    uint32_t nRuns = 10;
    bool verbose = false;

    CommandLine cmd(__FILE__);
    cmd.AddValue("protocol", "Routing protocol: LEACH, DirectedDiffusion, GEAR, PEGASIS or all", protocol);
    cmd.AddValue("nNodes", "Number of sensor nodes", nNodes);
    cmd.AddValue("areaSize", "Side length of the square field in meters", areaSize);
    cmd.AddValue("energy", "Initial energy per node (J)", energy);
    cmd.AddValue("rounds", "Maximum number of rounds", rounds);
    cmd.AddValue("radioRange", "One-hop radio range in meters", radioRange);
    cmd.AddValue("seedStart", "Starting random stream (multi-seed sweep)", seedStart);
    cmd.AddValue("nRuns", "Number of runs per protocol", nRuns);
    cmd.AddValue("verbose", "Enable verbose logging", verbose);
    cmd.Parse(argc, argv);

    std::vector<std::string> protocols;
    if (protocol == "all")
    {
        protocols = {"LEACH", "DirectedDiffusion", "GEAR", "PEGASIS"};
    }
    else
    {
        sensornet::ProtocolKind kind;
        if (!sensornet::ParseProtocolKind(protocol, kind))
        {
            NS_FATAL_ERROR("Unknown protocol: "
                           << protocol << ". Use LEACH, DirectedDiffusion, GEAR, PEGASIS or all.");
        }
        protocols.push_back(sensornet::ProtocolKindName(kind));
    }
    if (nRuns == 0)
    {
        NS_FATAL_ERROR("nRuns must be positive");
    }

    if (verbose)
    {
        LogComponentEnable("SensornetComparison", LOG_LEVEL_INFO);
        LogComponentEnable("SensornetSimulation", LOG_LEVEL_INFO);
        LogComponentEnable("SensornetMetrics", LOG_LEVEL_INFO);
    }

    SensornetHelper helper;
    helper.Set("NodeCount", UintegerValue(nNodes));
    helper.Set("AreaWidth", DoubleValue(areaSize));
    helper.Set("AreaHeight", DoubleValue(areaSize));
    helper.Set("BaseStation", VectorValue(Vector(areaSize / 2, areaSize * 1.5, 0)));
    helper.Set("InitialEnergy", DoubleValue(energy));
    helper.Set("RoundHorizon", UintegerValue(rounds));
    helper.Set("RadioRange", DoubleValue(radioRange));

    // CSV header
    std::cout << "protocol,nNodes,areaSize,energy,rounds," << (nRuns == 1 ? "seed" : "nRuns");
    for (const auto& column : kColumns)
    {
        if (nRuns == 1)
        {
            std::cout << "," << column;
        }
        else
        {
            std::cout << "," << column << "_mean," << column << "_ci95";
        }
    }
    std::cout << std::endl;

    std::cout << std::fixed << std::setprecision(4);
    for (const auto& name : protocols)
    {
        std::vector<SeedSample> samples(kColumns.size());
        for (uint32_t run = 0; run < nRuns; ++run)
        {
            int64_t seed = seedStart + run;
            NS_LOG_INFO("Running " << name << " with seed " << seed);
            std::vector<double> values =
                RunSingleSimulation(helper, name, nNodes, energy, rounds, seed);
            for (std::size_t c = 0; c < values.size(); ++c)
            {
                samples[c].Add(values[c]);
            }

            if (nRuns == 1)
            {
                std::cout << name << "," << nNodes << "," << areaSize << "," << energy << ","
                          << rounds << "," << seed;
                for (double v : values)
                {
                    std::cout << "," << v;
                }
                std::cout << std::endl;
            }
        }

        if (nRuns > 1)
        {
            std::cout << name << "," << nNodes << "," << areaSize << "," << energy << ","
                      << rounds << "," << nRuns;
            for (const auto& sample : samples)
            {
                std::cout << "," << sample.GetMean() << "," << sample.GetCi95();
            }
            std::cout << std::endl;
        }
    }

    return 0;
}
