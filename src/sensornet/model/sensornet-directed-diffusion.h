/*
 * Sensornet: energy-aware routing for wireless sensor networks
 *
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * Directed Diffusion: interest flooding, gradients and path reinforcement.
 */
#ifndef SENSORNET_DIRECTED_DIFFUSION_H
#define SENSORNET_DIRECTED_DIFFUSION_H

#include "sensornet-engine-context.h"
#include "sensornet-id-cache.h"

#include <cstdint>
#include <map>
#include <set>
#include <vector>

namespace ns3
{
namespace sensornet
{

/**
 * @ingroup sensornet
 * @brief Directed Diffusion parameters.
 */
struct DiffusionParameters
{
    uint32_t interestInterval = 5; ///< Rounds between interest floods
    uint32_t sourceCount = 5;      ///< Sources drawn for each interest
    double sinkRange = 0;          ///< Nodes within this range hear the sink; 0 = 3 x radio range
    uint32_t gradientTimeout = 10; ///< Rounds an unused gradient survives
    uint32_t reinforcedRate = 1;   ///< Readings per round a source sends on its reinforced path
};

/**
 * @ingroup sensornet
 * @brief A gradient: a neighbor from which the current interest was heard.
 */
struct Gradient
{
    uint32_t neighbor;  ///< Downstream neighbor (toward the sink), possibly BASE_STATION
    uint32_t hops;      ///< Hop distance of that neighbor from the sink
    uint32_t rate;      ///< Readings per round forwarded along this gradient
    bool reinforced;    ///< Part of a reinforced path
    uint32_t lastUsed;  ///< Last round the gradient was refreshed or carried data
};

/**
 * @ingroup sensornet
 * @brief What the sink observed about one exploratory path.
 */
struct PathRecord
{
    uint32_t lastHop; ///< Neighbor of the sink that delivered the copy
    Time latency;     ///< Arrival time minus reading time
    uint32_t hops;    ///< Hops travelled
    bool reinforced;  ///< The sink reinforced this path
};

/**
 * @ingroup sensornet
 * @brief Directed Diffusion protocol engine.
 *
 * Interest rounds (every interestInterval rounds) run three phases:
 *   slot 1          the sink floods the interest; every receiver records a
 *                   gradient toward the neighbor it heard it from and
 *                   rebroadcasts once per interest sequence number
 *   slot N + 2      each source sends one exploratory reading along every
 *                   gradient; every node forwards a given reading once
 *   slot 2N + 4     the sink ranks the delivering neighbors per source by
 *                   latency, then hops, then id, and reinforces the best
 *                   live one; reinforcement walks back toward the source
 *                   along first-heard upstream neighbors
 * In other rounds each source sends reinforcedRate readings along its
 * reinforced path, repairing around dead hops through the best remaining
 * gradient.
 */
class DiffusionEngine
{
  public:
    /**
     * Constructor
     * @param params protocol parameters
     * @param nNodes number of nodes
     * @param radioRange radio range, used when sinkRange is 0
     */
    DiffusionEngine(const DiffusionParameters& params, uint32_t nNodes, double radioRange);

    /**
     * Prune stale gradients and schedule the round's phases.
     * @param ctx the run context
     */
    void OnRoundStart(EngineContext& ctx);
    /**
     * Handle one Directed Diffusion event.
     * @param ev the event
     * @param ctx the run context
     */
    void OnEvent(const Event& ev, EngineContext& ctx);
    /**
     * Close the round.
     * @param ctx the run context
     */
    void OnRoundEnd(EngineContext& ctx);
    /**
     * @param topology the node field
     * @return true when no node is alive
     */
    bool IsTerminal(const Topology& topology) const;

    /// @return the sources of the current interest
    const std::vector<uint32_t>& GetSources() const
    {
        return m_sources;
    }
    /// @return the current interest sequence number
    uint32_t GetInterestSequence() const
    {
        return m_seq;
    }
    /**
     * @param node node id
     * @return the node's gradients
     */
    const std::vector<Gradient>& GetGradients(uint32_t node) const;
    /**
     * @param source source node id
     * @return the sink's path records for the source in the current interest
     */
    std::vector<PathRecord> GetSinkPaths(uint32_t source) const;
    /**
     * @param node node id
     * @param source source node id
     * @return the reinforced next hop of @p node for @p source, or NO_NODE
     */
    uint32_t GetReinforcedHop(uint32_t node, uint32_t source) const;
    /// @return the effective sink range
    double GetSinkRange() const
    {
        return m_sinkRange;
    }

  private:
    /// Per-node diffusion state
    struct NodeState
    {
        uint32_t seq = 0;
        std::vector<Gradient> gradients;
        /// Per source: neighbors that delivered exploratory data, in arrival order
        std::map<uint32_t, std::vector<uint32_t>> upstream;
        /// Per source: reinforced next hop toward the sink
        std::map<uint32_t, uint32_t> downstream;
        /// Per source: neighbor this node reinforced
        std::map<uint32_t, uint32_t> reinforcedUpstream;
    };

    void StartInterest(EngineContext& ctx);
    void SelectSources(EngineContext& ctx);
    void PruneGradients(uint32_t round);
    void HandleInterest(const Event& ev, EngineContext& ctx);
    void HandleSense(const Event& ev, EngineContext& ctx);
    void HandleExploratory(const Event& ev, EngineContext& ctx);
    void HandleGradientUpdate(const Event& ev, EngineContext& ctx);
    void HandleReinforce(const Event& ev, EngineContext& ctx);
    void HandleNegativeReinforce(const Event& ev, EngineContext& ctx);
    void HandleData(const Event& ev, EngineContext& ctx);

    /**
     * Broadcast an exploratory copy to every live gradient except @p from.
     * @param node the forwarding node
     * @param from neighbor the copy came from, or NO_NODE
     * @param packet the copy
     * @param ctx the run context
     * @return number of gradients the copy was sent along
     */
    uint32_t SpreadExploratory(uint32_t node,
                               uint32_t from,
                               SensorPacket packet,
                               EngineContext& ctx);
    /**
     * Forward a data packet one hop toward the sink along the reinforced
     * path, or the best remaining gradient.
     * @param node the holder
     * @param from neighbor the packet came from, or NO_NODE
     * @param packet the packet
     * @param attempt retries so far for this hop
     * @param ctx the run context
     */
    void ForwardData(uint32_t node,
                     uint32_t from,
                     SensorPacket packet,
                     uint32_t attempt,
                     EngineContext& ctx);
    /**
     * Send reinforcement from @p from to the next usable upstream neighbor.
     * @param from the reinforcing node, or BASE_STATION
     * @param source the source being reinforced
     * @param ctx the run context
     */
    void ReinforceUpstream(uint32_t from, uint32_t source, EngineContext& ctx);

    /**
     * @param node a node or BASE_STATION
     * @param ctx the run context
     * @return true if the base station, or a live node
     */
    bool IsReachable(uint32_t node, const EngineContext& ctx) const;
    /**
     * @param a a node
     * @param b a node or BASE_STATION
     * @param ctx the run context
     * @return link length
     */
    double LinkDistance(uint32_t a, uint32_t b, const EngineContext& ctx) const;
    Gradient* FindGradient(uint32_t node, uint32_t neighbor);
    void RefreshReinforcedFlags(uint32_t node);

    DiffusionParameters m_params;
    double m_radioRange;
    double m_sinkRange;
    uint32_t m_nNodes;
    uint32_t m_seq;
    std::vector<uint32_t> m_sources;
    std::vector<NodeState> m_state;
    /// Per node: interests already rebroadcast
    std::vector<IdCache> m_interestCache;
    /// Per node: exploratory readings already forwarded
    std::vector<IdCache> m_dataCache;
    /// Sink observations per source, current interest only
    std::map<uint32_t, std::vector<PathRecord>> m_sinkPaths;
    /// Sink's reinforced neighbor per source
    std::map<uint32_t, uint32_t> m_sinkChoice;
    /// Per source: nodes already reached by the current reinforcement
    std::map<uint32_t, std::set<uint32_t>> m_reinforceVisited;
    /// Exploratory readings not yet delivered, by packet id
    std::map<uint64_t, SensorPacket> m_exploratory;
};

} // namespace sensornet
} // namespace ns3

#endif /* SENSORNET_DIRECTED_DIFFUSION_H */
