/*
 * Sensornet: energy-aware routing for wireless sensor networks
 *
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * PEGASIS: greedy chain with a rotating leader.
 */
#ifndef SENSORNET_PEGASIS_H
#define SENSORNET_PEGASIS_H

#include "sensornet-engine-context.h"

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

namespace ns3
{
namespace sensornet
{

/**
 * @ingroup sensornet
 * @brief How the chain leader is chosen each round.
 */
enum class LeaderPolicy : uint8_t
{
    ROUND_ROBIN, ///< chain[round mod size]
    ENERGY,      ///< Highest remaining energy, lowest id on ties
};

/**
 * @brief Parse a leader policy name ("RoundRobin" or "Energy", case-insensitive).
 * @param name the name
 * @param policy the parsed policy
 * @return true on success
 */
bool ParseLeaderPolicy(const std::string& name, LeaderPolicy& policy);

std::ostream& operator<<(std::ostream& os, LeaderPolicy policy);

/**
 * @ingroup sensornet
 * @brief PEGASIS parameters.
 */
struct PegasisParameters
{
    LeaderPolicy leaderPolicy = LeaderPolicy::ROUND_ROBIN; ///< Leader rotation policy
    uint32_t rebuildInterval = 0; ///< Rebuild every N rounds; 0 only on member death
};

/**
 * @ingroup sensornet
 * @brief PEGASIS protocol engine.
 *
 * Each round a token travels from both chain ends toward the leader; every
 * holder adds its own reading, fuses it with the token and hands it on.
 * The leader uplinks the fused result at slot size + 1.  A chain is rebuilt
 * at the start of the first round in which one of its members is dead.
 */
class PegasisEngine
{
  public:
    /**
     * Constructor
     * @param params protocol parameters
     */
    explicit PegasisEngine(const PegasisParameters& params);

    /**
     * Greedy nearest-neighbor chain over the live nodes, starting from the
     * node farthest from the base station.  Ties go to the lowest id.
     * @param topology the node field
     * @return node ids in chain order
     */
    static std::vector<uint32_t> BuildChain(const Topology& topology);

    /**
     * Rebuild the chain if needed, pick the leader and start both tokens.
     * @param ctx the run context
     */
    void OnRoundStart(EngineContext& ctx);
    /**
     * Handle one PEGASIS event.
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

    /// @return the current chain
    const std::vector<uint32_t>& GetChain() const
    {
        return m_chain;
    }
    /// @return the current leader, or NO_NODE
    uint32_t GetLeader() const;
    /// @return how many times the chain was built
    uint32_t GetBuildCount() const
    {
        return m_buildCount;
    }

  private:
    /// Token direction along the chain
    enum Direction : uint32_t
    {
        FROM_HEAD = 0, ///< From chain[0] toward the leader
        FROM_TAIL = 1, ///< From chain[size-1] toward the leader
    };

    bool NeedsRebuild(const Topology& topology, uint32_t round) const;
    void Rebuild(EngineContext& ctx);
    void HandleRelay(const Event& ev, EngineContext& ctx);
    void HandleLeaderSend(const Event& ev, EngineContext& ctx);
    /**
     * Hand an empty token to the next chain position after a break.
     * @param index the position the token should move to
     * @param dir token direction
     * @param ctx the run context
     */
    void Restart(uint32_t index, Direction dir, EngineContext& ctx);
    /**
     * @param index a chain position
     * @param dir token direction
     * @return the position one step toward the leader
     */
    uint32_t Step(uint32_t index, Direction dir) const;

    PegasisParameters m_params;
    std::vector<uint32_t> m_chain;
    /// Chain position of each node id, NO_NODE when not in the chain
    std::vector<uint32_t> m_position;
    uint32_t m_leaderIndex;
    uint32_t m_lastBuildRound;
    uint32_t m_buildCount;
    /// Readings collected by the leader this round
    SensorPacket m_leaderBuffer;
    uint32_t m_leaderBits;
};

} // namespace sensornet
} // namespace ns3

#endif /* SENSORNET_PEGASIS_H */
