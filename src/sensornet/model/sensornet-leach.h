/*
 * Sensornet: energy-aware routing for wireless sensor networks
 *
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * LEACH: randomized rotating cluster heads with local aggregation.
 */
#ifndef SENSORNET_LEACH_H
#define SENSORNET_LEACH_H

#include "sensornet-engine-context.h"

#include <cstdint>
#include <vector>

namespace ns3
{
namespace sensornet
{

/**
 * @ingroup sensornet
 * @brief LEACH parameters.
 */
struct LeachParameters
{
    double clusterHeadFraction = 0.05; ///< P, desired fraction of cluster heads
    uint32_t framesPerRound = 1;       ///< Steady-state TDMA frames per round
    double clusterRadius = 0;          ///< Advertisement range; 0 covers the whole field
};

/**
 * @ingroup sensornet
 * @brief LEACH protocol engine.
 *
 * Round timeline, in phase slots from the round start:
 *   1        cluster heads advertise
 *   2        other nodes join the nearest advertised head
 *   3        heads broadcast the TDMA schedule
 *   4 + 2f   members (and headless nodes) sense and send, frame f
 *   5 + 2f   heads aggregate and uplink to the base station, frame f
 *
 * A node is eligible for election when it has not been head during the
 * last round(1/P) rounds, so two elections of the same node are always at
 * least round(1/P) rounds apart.
 */
class LeachEngine
{
  public:
    /**
     * Constructor
     * @param params protocol parameters
     * @param nNodes number of nodes
     * @param fieldDiagonal advertisement range used when clusterRadius is 0
     */
    LeachEngine(const LeachParameters& params, uint32_t nNodes, double fieldDiagonal);

    /**
     * Election threshold T(n) = P / (1 - P * (round mod round(1/P))), clamped to [0, 1].
     * @param p cluster head fraction
     * @param round the round number
     * @return the threshold
     */
    static double Threshold(double p, uint32_t round);
    /**
     * @param p cluster head fraction
     * @return the rotation cycle length round(1/P), at least 1
     */
    static uint32_t CycleLength(double p);

    /**
     * Elect cluster heads and schedule the round's phases.
     * @param ctx the run context
     */
    void OnRoundStart(EngineContext& ctx);
    /**
     * Handle one LEACH event.
     * @param ev the event
     * @param ctx the run context
     */
    void OnEvent(const Event& ev, EngineContext& ctx);
    /**
     * Relinquish head roles.
     * @param ctx the run context
     */
    void OnRoundEnd(EngineContext& ctx);
    /**
     * @param topology the node field
     * @return true when no node is alive
     */
    bool IsTerminal(const Topology& topology) const;

    /// @return cluster heads elected this round, ascending
    const std::vector<uint32_t>& GetClusterHeads() const
    {
        return m_heads;
    }
    /// @return cluster heads elected in every round so far, indexed by round
    const std::vector<std::vector<uint32_t>>& GetHeadHistory() const
    {
        return m_headHistory;
    }
    /**
     * @param node node id
     * @return the node's cluster head this round, or NO_NODE
     */
    uint32_t GetClusterHead(uint32_t node) const;
    /**
     * @param node node id
     * @param round the round
     * @return true if the node may be elected in that round
     */
    bool IsEligible(uint32_t node, uint32_t round) const;

  private:
    /// Per-node round state
    struct NodeState
    {
        int64_t lastHeadRound = -1;
        bool isHead = false;
        uint32_t head = NO_NODE;
        /// Transmit directly to the base station for the rest of the round
        bool direct = false;
        std::vector<uint32_t> heard;
        std::vector<uint32_t> members;
        /// Readings received by a head and not yet uplinked
        uint32_t pendingReadings = 0;
        uint32_t pendingBits = 0;
        uint32_t pendingHops = 0;
        Time pendingCreated;
    };

    void ElectClusterHeads(EngineContext& ctx);
    void HandleAdvertise(const Event& ev, EngineContext& ctx);
    void HandleJoinRequest(const Event& ev, EngineContext& ctx);
    void HandleSchedule(const Event& ev, EngineContext& ctx);
    void HandleSense(const Event& ev, EngineContext& ctx);
    void HandleAggregate(const Event& ev, EngineContext& ctx);
    /**
     * Send a packet straight to the base station.
     * @param node the sender
     * @param packet the packet
     * @param ctx the run context
     */
    void SendDirect(uint32_t node, SensorPacket packet, EngineContext& ctx);
    /**
     * Build a packet from a head's pending readings and clear them.
     * @param head the head
     * @param ctx the run context
     * @return the fused packet (no contributions when nothing was pending)
     */
    SensorPacket TakePending(uint32_t head, EngineContext& ctx);

    LeachParameters m_params;
    double m_advertiseRange;
    std::vector<NodeState> m_state;
    std::vector<uint32_t> m_heads;
    std::vector<std::vector<uint32_t>> m_headHistory;
};

} // namespace sensornet
} // namespace ns3

#endif /* SENSORNET_LEACH_H */
