/*
 * Sensornet: energy-aware routing for wireless sensor networks
 *
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * One simulation run: topology, energy, scheduler and protocol engine,
 * driven round by round until the network dies or the horizon is reached.
 */
#ifndef SENSORNET_SIMULATION_H
#define SENSORNET_SIMULATION_H

#include "sensornet-config.h"
#include "sensornet-engine-context.h"
#include "sensornet-outcome.h"
#include "sensornet-protocol-engine.h"

#include "ns3/nstime.h"
#include "ns3/object.h"
#include "ns3/random-variable-stream.h"
#include "ns3/traced-callback.h"
#include "ns3/vector.h"

#include <memory>
#include <string>
#include <vector>

namespace ns3
{
namespace sensornet
{

/**
 * @ingroup sensornet
 * @brief State of one node at a completed round boundary.
 */
struct NodeSnapshot
{
    uint32_t id;            ///< Node id
    Vector position;        ///< Node position
    NodeRole role;          ///< Role at the round boundary
    double remainingEnergy; ///< Remaining energy in joules
    bool alive;             ///< Alive flag
};

/**
 * @ingroup sensornet
 * @brief A single simulation run.
 *
 * Every option is an attribute.  Setup() validates the configuration and
 * builds the run; Run() (or repeated Step() calls) drives it to the end.
 * The run owns its scheduler, topology, energy model, random stream and
 * engine, so runs never share state.  The outcome stream is kept in order
 * and is also fired through the "Outcome" trace source as it is produced.
 */
class Simulation : public Object
{
  public:
    /**
     * @brief Get the type ID.
     * @return the object TypeId
     */
    static TypeId GetTypeId();

    Simulation();
    ~Simulation() override;

    /**
     * TracedCallback signature for outcomes.
     * @param [in] outcome the outcome
     */
    typedef void (*OutcomeTracedCallback)(const Outcome& outcome);

    /**
     * Place the nodes explicitly instead of at random.
     * @param positions one position per node
     */
    void SetNodePositions(const std::vector<Vector>& positions);
    /**
     * Set every option from a configuration block.
     * @param config the configuration
     */
    void SetConfig(const SimulationConfig& config);
    /// @return the configuration assembled from the attributes
    SimulationConfig GetConfig() const;

    /**
     * Validate the configuration and build the run.  An invalid
     * configuration is fatal; nothing is scheduled in that case.
     */
    void Setup();
    /**
     * Fire the next event.
     * @return false once the run is over
     */
    bool Step();
    /**
     * Run to the end.
     * @return the complete outcome stream
     */
    const std::vector<Outcome>& Run();

    /// @return the outcomes produced so far
    const std::vector<Outcome>& GetOutcomes() const
    {
        return m_outcomes;
    }
    /// @return node states at the last completed round boundary
    const std::vector<NodeSnapshot>& GetSnapshot() const
    {
        return m_snapshot;
    }
    /// @return number of completed rounds
    uint32_t GetCompletedRounds() const
    {
        return m_completedRounds;
    }
    /// @return true once the run is over
    bool IsFinished() const
    {
        return m_finished;
    }
    /// @return the node field; Setup() must have run
    const Topology& GetTopology() const;
    /// @return the protocol engine; Setup() must have run
    const ProtocolEngine& GetEngine() const;
    /// @return the phase slot length in use
    Time GetHopDelay() const;

    /**
     * Assign a fixed random variable stream number to the random variables
     * used by this run.  Return the number of streams (possibly zero) that
     * have been assigned.
     *
     * @param stream first stream index to use
     * @return the number of stream indices assigned by this model
     */
    int64_t AssignStreams(int64_t stream);

  protected:
    void DoDispose() override;

  private:
    void StartRound(uint32_t round);
    void EndRound(uint32_t round);
    void Record(const std::vector<Outcome>& outcomes);
    void TakeSnapshot();
    /**
     * @param config a validated configuration
     * @return the engine for the configured protocol
     */
    static ProtocolEngine::Variant CreateEngine(const SimulationConfig& config);

    // Attributes
    uint32_t m_nodeCount;
    double m_areaWidth;
    double m_areaHeight;
    double m_initialEnergy;
    Vector m_baseStation;
    std::string m_protocol;
    int64_t m_randomSeed;
    uint32_t m_roundHorizon;
    Time m_roundPeriod;
    Time m_hopDelay;
    double m_radioRange;
    uint32_t m_dataBits;
    uint32_t m_controlBits;
    double m_electronics;
    double m_freeSpace;
    double m_multipath;
    double m_crossover;
    double m_aggregation;
    double m_sensing;
    double m_leachFraction;
    uint32_t m_leachFrames;
    double m_leachRadius;
    uint32_t m_diffusionInterval;
    uint32_t m_diffusionSources;
    double m_diffusionSinkRange;
    uint32_t m_diffusionTimeout;
    uint32_t m_diffusionRate;
    double m_gearAlpha;
    double m_gearRadius;
    uint32_t m_gearInterval;
    double m_gearSinkRange;
    std::string m_leaderPolicy;
    uint32_t m_pegasisRebuild;

    std::vector<Vector> m_positions;
    std::vector<TargetRegion> m_gearRegions;

    SimulationConfig m_config;
    Ptr<UniformRandomVariable> m_uniformRandomVariable;
    std::unique_ptr<EventScheduler> m_scheduler;
    std::unique_ptr<Topology> m_topology;
    std::unique_ptr<EnergyModel> m_energy;
    std::unique_ptr<EngineContext> m_context;
    std::unique_ptr<ProtocolEngine> m_engine;

    bool m_setup;
    bool m_finished;
    uint32_t m_completedRounds;
    std::vector<Outcome> m_outcomes;
    std::vector<NodeSnapshot> m_snapshot;

    /// Fired for every outcome, in stream order
    TracedCallback<const Outcome&> m_outcomeTrace;
};

} // namespace sensornet
} // namespace ns3

#endif /* SENSORNET_SIMULATION_H */
