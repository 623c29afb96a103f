/*
 * Sensornet: energy-aware routing for wireless sensor networks
 *
 * SPDX-License-Identifier: GPL-2.0-only
 */
#include "sensornet-gear.h"

#include "ns3/log.h"

#include <limits>

namespace ns3
{

NS_LOG_COMPONENT_DEFINE("SensornetGear");

namespace sensornet
{

GearEngine::GearEngine(const GearParameters& params,
                       uint32_t nNodes,
                       double radioRange,
                       const std::vector<TargetRegion>& regions,
                       const Vector& baseStation)
    : m_params(params),
      m_radioRange(radioRange),
      m_regions(regions),
      m_sinkRegion(regions.size()),
      m_learned(nNodes, std::vector<double>(regions.size() + 1, -1.0)),
      m_seen(nNodes, IdCache(Time(0)))
{
    m_sink.center = baseStation;
    m_sink.radius = params.sinkRange > 0 ? params.sinkRange : 3 * radioRange;
}

const Vector&
GearEngine::Center(uint32_t region) const
{
    return region == m_sinkRegion ? m_sink.center : m_regions[region].center;
}

double
GearEngine::Radius(uint32_t region) const
{
    return region == m_sinkRegion ? m_sink.radius : m_regions[region].radius;
}

double
GearEngine::EstimatedCost(const Topology& topology, uint32_t node, uint32_t region) const
{
    double energy = topology.GetNode(node).GetEnergy();
    if (energy <= 0)
    {
        return std::numeric_limits<double>::infinity();
    }
    return m_params.alpha * topology.DistanceTo(node, Center(region)) +
           (1 - m_params.alpha) / energy;
}

double
GearEngine::GetLearnedCost(uint32_t node, uint32_t region) const
{
    return m_learned[node][region];
}

double
GearEngine::Cost(const Topology& topology, uint32_t node, uint32_t region) const
{
    double learned = m_learned[node][region];
    return learned >= 0 ? learned : EstimatedCost(topology, node, region);
}

std::vector<GearHop>
GearEngine::GetTrace(uint64_t packetId) const
{
    auto i = m_routes.find(packetId);
    return i == m_routes.end() ? std::vector<GearHop>() : i->second.trace;
}

std::vector<uint32_t>
GearEngine::GetReached(uint64_t queryId) const
{
    auto i = m_routes.find(queryId);
    return i == m_routes.end() ? std::vector<uint32_t>() : i->second.reached;
}

uint32_t
GearEngine::GetQueryRegion(uint64_t queryId) const
{
    auto i = m_routes.find(queryId);
    return i == m_routes.end() ? m_sinkRegion : i->second.region;
}

void
GearEngine::OnRoundStart(EngineContext& ctx)
{
    NS_LOG_FUNCTION(this << ctx.GetRound());
    if (ctx.GetRound() % m_params.queryInterval != 0)
    {
        return;
    }
    m_routes.clear();
    m_queryIds.clear();
    Time span = ctx.GetHopDelay() * (4 * m_seen.size() + 16);
    for (auto& cache : m_seen)
    {
        cache.SetLifetime(span);
    }
    for (uint32_t region = 0; region < m_regions.size(); ++region)
    {
        SensorPacket query;
        query.id = ctx.NextPacketId();
        query.source = BASE_STATION;
        query.sender = BASE_STATION;
        query.bits = ctx.GetControlBits();
        query.created = ctx.Now();
        m_queryIds.push_back(query.id);
        m_routes[query.id].region = region;
        IssueQuery(region, query, ctx);
    }
}

void
GearEngine::IssueQuery(uint32_t region, SensorPacket packet, EngineContext& ctx)
{
    const Topology& topology = ctx.GetTopology();
    uint32_t entry = NO_NODE;
    for (uint32_t id : topology.GetAliveNodes())
    {
        if (entry == NO_NODE ||
            topology.DistanceToBaseStation(id) < topology.DistanceToBaseStation(entry))
        {
            entry = id;
        }
    }
    if (entry == NO_NODE)
    {
        return;
    }
    NS_LOG_LOGIC("Query " << packet.id << " for region " << region << " enters at node "
                          << entry);
    packet.nextHop = entry;
    Event ev(SENSORNET_QUERY_FORWARD, BASE_STATION, entry);
    ev.tag = region;
    ev.packet = packet;
    // the first wave starts at slot 1; a re-issue goes out on the next slot
    Time when = ctx.Now() < ctx.SlotTime(1) ? ctx.SlotTime(1) : ctx.Now() + ctx.GetHopDelay();
    ctx.Schedule(when, ev);
}

void
GearEngine::OnEvent(const Event& ev, EngineContext& ctx)
{
    switch (ev.type)
    {
    case SENSORNET_QUERY_FORWARD:
    case SENSORNET_DATA_SEND:
        HandleArrival(ev, ctx);
        break;
    case SENSORNET_REGION_FLOOD:
        HandleRegionFlood(ev, ctx);
        break;
    case SENSORNET_SENSE:
        HandleReply(ev, ctx);
        break;
    default:
        NS_LOG_WARN("GEAR ignores event " << ev.type);
        break;
    }
}

void
GearEngine::HandleArrival(const Event& ev, EngineContext& ctx)
{
    const Topology& topology = ctx.GetTopology();
    uint32_t prev = ev.origin;
    uint32_t node = ev.target;
    uint32_t region = ev.tag;
    SensorPacket packet = ev.packet;
    Route& route = m_routes[packet.id];

    if (!topology.IsAlive(node))
    {
        if (prev == BASE_STATION)
        {
            IssueQuery(region, packet, ctx);
            return;
        }
        if (topology.IsAlive(prev))
        {
            NS_LOG_WARN("Next hop " << node << " of " << prev << " died, reselecting");
            if (!route.trace.empty() && route.trace.back().node == prev)
            {
                route.trace.pop_back();
            }
            Forward(prev, packet, region, ev.type, ctx);
            return;
        }
        NS_LOG_DEBUG("Packet " << packet.id << " lost with next hop " << node);
        ctx.Dropped(node, packet, DropReason::NEXT_HOP_DEAD);
        return;
    }
    if (!ctx.Spend(node, ctx.GetEnergyModel().ReceiveCost(packet.bits)))
    {
        ctx.Dropped(node, packet, DropReason::RECEIVER_DIED);
        return;
    }
    if (m_seen[node].IsDuplicate(packet.source, packet.id, ctx.Now()))
    {
        NS_LOG_DEBUG("Node " << node << " already handled packet " << packet.id);
        ctx.Dropped(node, packet, DropReason::NO_ROUTE);
        return;
    }
    route.visited.insert(node);
    packet.hops += 1;

    if (ev.type == SENSORNET_QUERY_FORWARD &&
        topology.DistanceTo(node, Center(region)) <= Radius(region))
    {
        route.trace.push_back(GearHop{node, topology.DistanceTo(node, Center(region)), false});
        NS_LOG_LOGIC("Query " << packet.id << " entered region " << region << " at node "
                              << node);
        Reach(node, packet, ctx);
        return;
    }
    Forward(node, packet, region, ev.type, ctx);
}

void
GearEngine::Forward(uint32_t holder,
                    SensorPacket packet,
                    uint32_t region,
                    MessageType type,
                    EngineContext& ctx)
{
    const Topology& topology = ctx.GetTopology();
    const EnergyModel& energy = ctx.GetEnergyModel();
    Route& route = m_routes[packet.id];
    double here = topology.DistanceTo(holder, Center(region));

    if (region == m_sinkRegion && here <= m_sink.radius)
    {
        route.trace.push_back(GearHop{holder, here, false});
        packet.sender = holder;
        packet.nextHop = BASE_STATION;
        if (!ctx.Spend(holder, energy.TransmitCost(here, packet.bits)))
        {
            ctx.Dropped(holder, packet, DropReason::SENDER_DIED);
            return;
        }
        packet.hops += 1;
        ctx.Delivered(packet);
        return;
    }

    std::vector<uint32_t> neighbors = topology.NeighborsWithin(holder, m_radioRange);
    uint32_t best = NO_NODE;
    double bestCost = std::numeric_limits<double>::infinity();
    for (uint32_t n : neighbors)
    {
        if (route.visited.count(n) != 0 || topology.DistanceTo(n, Center(region)) >= here)
        {
            continue;
        }
        double c = Cost(topology, n, region);
        if (best == NO_NODE || c < bestCost)
        {
            best = n;
            bestCost = c;
        }
    }
    bool recovery = best == NO_NODE;
    if (recovery)
    {
        for (uint32_t n : neighbors)
        {
            if (route.visited.count(n) != 0)
            {
                continue;
            }
            double c = Cost(topology, n, region);
            if (best == NO_NODE || c < bestCost)
            {
                best = n;
                bestCost = c;
            }
        }
    }
    route.trace.push_back(GearHop{holder, here, recovery});
    if (best == NO_NODE)
    {
        NS_LOG_DEBUG("Node " << holder << ": hole toward region " << region << ", packet "
                             << packet.id << " dropped");
        ctx.Dropped(holder, packet, DropReason::NO_ROUTE);
        return;
    }
    if (recovery)
    {
        NS_LOG_WARN("Node " << holder << ": no progress toward region " << region
                            << ", recovery through " << best);
    }

    double link = topology.Distance(holder, best);
    m_learned[holder][region] = bestCost + m_params.alpha * link +
                                (1 - m_params.alpha) / topology.GetNode(best).GetEnergy();

    packet.sender = holder;
    packet.nextHop = best;
    if (!ctx.Spend(holder, energy.TransmitCost(link, packet.bits)))
    {
        ctx.Dropped(holder, packet, DropReason::SENDER_DIED);
        return;
    }
    Event next(type, holder, best);
    next.tag = region;
    next.packet = packet;
    ctx.ScheduleNextHop(next);
}

void
GearEngine::Reach(uint32_t node, const SensorPacket& packet, EngineContext& ctx)
{
    Route& route = m_routes[packet.id];
    route.reached.push_back(node);

    Event flood(SENSORNET_REGION_FLOOD, node, NO_NODE);
    flood.tag = route.region;
    flood.packet = packet;
    ctx.ScheduleNextHop(flood);

    Event reply(SENSORNET_SENSE, node, BASE_STATION);
    reply.tag = route.region;
    ctx.ScheduleNextHop(reply);
}

void
GearEngine::HandleRegionFlood(const Event& ev, EngineContext& ctx)
{
    const Topology& topology = ctx.GetTopology();
    const EnergyModel& energy = ctx.GetEnergyModel();
    uint32_t node = ev.origin;
    uint32_t region = ev.tag;
    if (!topology.IsAlive(node) ||
        !ctx.Spend(node, energy.TransmitCost(m_radioRange, ev.packet.bits)))
    {
        return;
    }
    Route& route = m_routes[ev.packet.id];
    for (uint32_t n : topology.NeighborsWithin(node, m_radioRange))
    {
        if (topology.DistanceTo(n, Center(region)) > Radius(region))
        {
            continue;
        }
        if (!ctx.Spend(n, energy.ReceiveCost(ev.packet.bits)))
        {
            continue;
        }
        if (m_seen[n].IsDuplicate(ev.packet.source, ev.packet.id, ctx.Now()))
        {
            continue;
        }
        route.visited.insert(n);
        Reach(n, ev.packet, ctx);
    }
}

void
GearEngine::HandleReply(const Event& ev, EngineContext& ctx)
{
    uint32_t node = ev.origin;
    if (!ctx.GetTopology().IsAlive(node))
    {
        return;
    }
    SensorPacket packet = ctx.NewReading(node);
    if (!ctx.Spend(node, ctx.GetEnergyModel().SensingCost(packet.bits)))
    {
        ctx.Dropped(node, packet, DropReason::SENDER_DIED);
        return;
    }
    Route& route = m_routes[packet.id];
    route.region = m_sinkRegion;
    route.visited.insert(node);
    m_seen[node].IsDuplicate(node, packet.id, ctx.Now());
    Forward(node, packet, m_sinkRegion, SENSORNET_DATA_SEND, ctx);
}

void
GearEngine::OnRoundEnd(EngineContext& ctx)
{
    NS_LOG_FUNCTION(this << ctx.GetRound());
}

bool
GearEngine::IsTerminal(const Topology& topology) const
{
    return topology.GetNAliveNodes() == 0;
}

} // namespace sensornet
} // namespace ns3
