/*
 * Sensornet: energy-aware routing for wireless sensor networks
 *
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * GEAR: geographic and energy aware routing toward target regions.
 */
#ifndef SENSORNET_GEAR_H
#define SENSORNET_GEAR_H

#include "sensornet-engine-context.h"
#include "sensornet-id-cache.h"

#include "ns3/vector.h"

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
 * @brief A circular target region.
 */
struct TargetRegion
{
    Vector center; ///< Region center
    double radius; ///< Region radius
};

/**
 * @ingroup sensornet
 * @brief GEAR parameters.
 */
struct GearParameters
{
    double alpha = 0.5;        ///< Weight of distance against inverse energy in the cost
    double regionRadius = 15;  ///< Radius of the default target regions
    uint32_t queryInterval = 1; ///< Rounds between query waves
    double sinkRange = 0;      ///< Nodes within this range uplink directly; 0 = 3 x radio range
    std::vector<TargetRegion> regions; ///< Target regions; empty selects the defaults
};

/**
 * @ingroup sensornet
 * @brief One forwarding decision of a query or reply.
 */
struct GearHop
{
    uint32_t node;           ///< The deciding node
    double distanceToRegion; ///< Its distance to the destination region center
    bool recovery;           ///< No neighbor offered progress; cost-only choice
};

/**
 * @ingroup sensornet
 * @brief GEAR protocol engine.
 *
 * Every queryInterval rounds the sink hands one query per target region to
 * its nearest live node.  Each holder forwards to the live neighbor of
 * least cost among those strictly closer to the region, where the cost is
 * the learned h(N, R) when known and
 *   alpha * distance(N, R) + (1 - alpha) / energy(N)
 * otherwise.  With no such neighbor the holder enters recovery and picks
 * the cheapest neighbor the query has not visited.  Inside the region the
 * query is flooded among in-region nodes only, and each in-region receiver
 * answers with a reading routed the same way toward the sink.
 */
class GearEngine
{
  public:
    /**
     * Constructor
     * @param params protocol parameters
     * @param nNodes number of nodes
     * @param radioRange radio range
     * @param regions target regions
     * @param baseStation base station position
     */
    GearEngine(const GearParameters& params,
               uint32_t nNodes,
               double radioRange,
               const std::vector<TargetRegion>& regions,
               const Vector& baseStation);

    /**
     * Issue the round's queries.
     * @param ctx the run context
     */
    void OnRoundStart(EngineContext& ctx);
    /**
     * Handle one GEAR event.
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

    /// @return the target regions
    const std::vector<TargetRegion>& GetRegions() const
    {
        return m_regions;
    }
    /**
     * @param topology the node field
     * @param node a live node
     * @param region destination index (target regions, then the sink region)
     * @return the estimated cost of @p node toward @p region
     */
    double EstimatedCost(const Topology& topology, uint32_t node, uint32_t region) const;
    /**
     * @param node node id
     * @param region destination index
     * @return the learned cost, or a negative value when none is known
     */
    double GetLearnedCost(uint32_t node, uint32_t region) const;
    /// @return ids of the queries issued in the latest query round
    const std::vector<uint64_t>& GetQueryIds() const
    {
        return m_queryIds;
    }
    /**
     * @param packetId a query or reply id from the latest query round
     * @return the forwarding decisions, in order
     */
    std::vector<GearHop> GetTrace(uint64_t packetId) const;
    /**
     * @param queryId a query id
     * @return in-region nodes the query reached, in order
     */
    std::vector<uint32_t> GetReached(uint64_t queryId) const;
    /**
     * @param queryId a query id
     * @return the target region index of the query
     */
    uint32_t GetQueryRegion(uint64_t queryId) const;

  private:
    /// Route state of one query or reply
    struct Route
    {
        uint32_t region = 0;
        std::set<uint32_t> visited;
        std::vector<GearHop> trace;
        std::vector<uint32_t> reached;
    };

    void IssueQuery(uint32_t region, SensorPacket packet, EngineContext& ctx);
    void HandleArrival(const Event& ev, EngineContext& ctx);
    void HandleRegionFlood(const Event& ev, EngineContext& ctx);
    void HandleReply(const Event& ev, EngineContext& ctx);
    /**
     * Make one forwarding decision for the packet at @p holder.
     * @param holder the current holder
     * @param packet the packet
     * @param region destination index
     * @param type event type of the next hop
     * @param ctx the run context
     */
    void Forward(uint32_t holder,
                 SensorPacket packet,
                 uint32_t region,
                 MessageType type,
                 EngineContext& ctx);
    /**
     * Mark an in-region node reached and schedule its rebroadcast and reply.
     * @param node the in-region node
     * @param packet the query
     * @param ctx the run context
     */
    void Reach(uint32_t node, const SensorPacket& packet, EngineContext& ctx);
    /**
     * @param region destination index
     * @return the destination center
     */
    const Vector& Center(uint32_t region) const;
    /**
     * @param region destination index
     * @return the destination radius
     */
    double Radius(uint32_t region) const;
    /**
     * @param topology the node field
     * @param node a live node
     * @param region destination index
     * @return learned cost if known, else the estimate
     */
    double Cost(const Topology& topology, uint32_t node, uint32_t region) const;

    GearParameters m_params;
    double m_radioRange;
    std::vector<TargetRegion> m_regions;
    /// Index of the sink region in the destination space
    uint32_t m_sinkRegion;
    TargetRegion m_sink;
    /// Learned cost per node and destination; negative when unknown
    std::vector<std::vector<double>> m_learned;
    /// Per node: packets already handled
    std::vector<IdCache> m_seen;
    std::map<uint64_t, Route> m_routes;
    std::vector<uint64_t> m_queryIds;
};

} // namespace sensornet
} // namespace ns3

#endif /* SENSORNET_GEAR_H */
