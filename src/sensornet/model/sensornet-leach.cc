/*
 * Sensornet: energy-aware routing for wireless sensor networks
 *
 * SPDX-License-Identifier: GPL-2.0-only
 */
#include "sensornet-leach.h"

#include "ns3/log.h"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <limits>

namespace ns3
{

NS_LOG_COMPONENT_DEFINE("SensornetLeach");

namespace sensornet
{

LeachEngine::LeachEngine(const LeachParameters& params, uint32_t nNodes, double fieldDiagonal)
    : m_params(params),
      m_advertiseRange(params.clusterRadius > 0 ? params.clusterRadius : fieldDiagonal),
      m_state(nNodes)
{
}

uint32_t
LeachEngine::CycleLength(double p)
{
    long cycle = std::lround(1.0 / p);
    return cycle < 1 ? 1 : static_cast<uint32_t>(cycle);
}

double
LeachEngine::Threshold(double p, uint32_t round)
{
    double denominator = 1.0 - p * (round % CycleLength(p));
    if (denominator <= 0)
    {
        return 1.0;
    }
    return std::min(1.0, p / denominator);
}

bool
LeachEngine::IsEligible(uint32_t node, uint32_t round) const
{
    const NodeState& s = m_state[node];
    return s.lastHeadRound < 0 ||
           static_cast<int64_t>(round) - s.lastHeadRound >=
               static_cast<int64_t>(CycleLength(m_params.clusterHeadFraction));
}

uint32_t
LeachEngine::GetClusterHead(uint32_t node) const
{
    return m_state[node].head;
}

void
LeachEngine::ElectClusterHeads(EngineContext& ctx)
{
    Topology& topology = ctx.GetTopology();
    uint32_t round = ctx.GetRound();
    std::vector<uint32_t> alive = topology.GetAliveNodes();
    double threshold = Threshold(m_params.clusterHeadFraction, round);

    m_heads.clear();
    for (uint32_t id : alive)
    {
        if (!IsEligible(id, round))
        {
            continue;
        }
        // one draw per eligible node, in ascending id order
        if (ctx.GetRandom()->GetValue(0.0, 1.0) < threshold)
        {
            m_heads.push_back(id);
        }
    }

    if (m_heads.empty() && !alive.empty())
    {
        std::vector<uint32_t> candidates;
        std::copy_if(alive.begin(), alive.end(), std::back_inserter(candidates), [&](uint32_t id) {
            return IsEligible(id, round);
        });
        if (candidates.empty())
        {
            candidates = alive;
        }
        uint32_t forced = candidates.front();
        for (uint32_t id : candidates)
        {
            if (topology.GetNode(id).GetEnergy() < topology.GetNode(forced).GetEnergy())
            {
                forced = id;
            }
        }
        NS_LOG_WARN("Round " << round << ": no cluster head elected, forcing node " << forced);
        m_heads.push_back(forced);
    }

    for (uint32_t h : m_heads)
    {
        m_state[h].isHead = true;
        m_state[h].lastHeadRound = round;
        topology.GetNode(h).SetRole(NodeRole::CLUSTER_HEAD);
    }
    m_headHistory.resize(round + 1);
    m_headHistory[round] = m_heads;
    NS_LOG_LOGIC("Round " << round << ": " << m_heads.size() << " cluster heads (T=" << threshold
                          << ")");
}

void
LeachEngine::OnRoundStart(EngineContext& ctx)
{
    NS_LOG_FUNCTION(this << ctx.GetRound());
    Topology& topology = ctx.GetTopology();
    for (auto& s : m_state)
    {
        s.isHead = false;
        s.head = NO_NODE;
        s.direct = false;
        s.heard.clear();
        s.members.clear();
        s.pendingReadings = 0;
        s.pendingBits = 0;
        s.pendingHops = 0;
    }
    std::vector<uint32_t> alive = topology.GetAliveNodes();
    for (uint32_t id : alive)
    {
        topology.GetNode(id).SetRole(NodeRole::UNDECIDED);
    }

    ElectClusterHeads(ctx);

    for (uint32_t h : m_heads)
    {
        ctx.Schedule(ctx.SlotTime(1), Event(SENSORNET_ADVERTISE, h, NO_NODE));
    }
    for (uint32_t id : alive)
    {
        if (!m_state[id].isHead)
        {
            ctx.Schedule(ctx.SlotTime(2), Event(SENSORNET_JOIN_REQUEST, id, NO_NODE));
        }
    }
    for (uint32_t h : m_heads)
    {
        ctx.Schedule(ctx.SlotTime(3), Event(SENSORNET_TDMA_SCHEDULE, h, NO_NODE));
    }
    for (uint32_t f = 0; f < m_params.framesPerRound; ++f)
    {
        for (uint32_t id : alive)
        {
            if (!m_state[id].isHead)
            {
                Event ev(SENSORNET_SENSE, id, NO_NODE);
                ev.tag = f;
                ctx.Schedule(ctx.SlotTime(4 + 2 * f), ev);
            }
        }
        for (uint32_t h : m_heads)
        {
            Event ev(SENSORNET_AGGREGATE_SEND, h, BASE_STATION);
            ev.tag = f;
            ctx.Schedule(ctx.SlotTime(5 + 2 * f), ev);
        }
    }
}

void
LeachEngine::OnEvent(const Event& ev, EngineContext& ctx)
{
    switch (ev.type)
    {
    case SENSORNET_ADVERTISE:
        HandleAdvertise(ev, ctx);
        break;
    case SENSORNET_JOIN_REQUEST:
        HandleJoinRequest(ev, ctx);
        break;
    case SENSORNET_TDMA_SCHEDULE:
        HandleSchedule(ev, ctx);
        break;
    case SENSORNET_SENSE:
        HandleSense(ev, ctx);
        break;
    case SENSORNET_AGGREGATE_SEND:
        HandleAggregate(ev, ctx);
        break;
    default:
        NS_LOG_WARN("LEACH ignores event " << ev.type);
        break;
    }
}

void
LeachEngine::HandleAdvertise(const Event& ev, EngineContext& ctx)
{
    Topology& topology = ctx.GetTopology();
    const EnergyModel& energy = ctx.GetEnergyModel();
    uint32_t head = ev.origin;
    if (!topology.IsAlive(head))
    {
        return;
    }
    if (!ctx.Spend(head, energy.TransmitCost(m_advertiseRange, ctx.GetControlBits())))
    {
        return;
    }
    for (uint32_t n : topology.NeighborsWithin(head, m_advertiseRange))
    {
        if (m_state[n].isHead)
        {
            continue;
        }
        if (ctx.Spend(n, energy.ReceiveCost(ctx.GetControlBits())))
        {
            m_state[n].heard.push_back(head);
        }
    }
}

void
LeachEngine::HandleJoinRequest(const Event& ev, EngineContext& ctx)
{
    Topology& topology = ctx.GetTopology();
    const EnergyModel& energy = ctx.GetEnergyModel();
    uint32_t node = ev.origin;
    if (!topology.IsAlive(node) || m_state[node].isHead)
    {
        return;
    }
    NodeState& s = m_state[node];
    uint32_t best = NO_NODE;
    double bestDistance = std::numeric_limits<double>::max();
    for (uint32_t h : s.heard)
    {
        if (!topology.IsAlive(h))
        {
            continue;
        }
        double d = topology.Distance(node, h);
        if (d < bestDistance || (d == bestDistance && h < best))
        {
            best = h;
            bestDistance = d;
        }
    }
    if (best == NO_NODE)
    {
        NS_LOG_LOGIC("Node " << node << " heard no cluster head, sending directly");
        s.direct = true;
        topology.GetNode(node).SetRole(NodeRole::NORMAL);
        return;
    }
    if (!ctx.Spend(node, energy.TransmitCost(bestDistance, ctx.GetControlBits())))
    {
        return;
    }
    if (!ctx.Spend(best, energy.ReceiveCost(ctx.GetControlBits())))
    {
        s.direct = true;
        topology.GetNode(node).SetRole(NodeRole::NORMAL);
        return;
    }
    s.head = best;
    m_state[best].members.push_back(node);
    topology.GetNode(node).SetRole(NodeRole::CLUSTER_MEMBER);
}

void
LeachEngine::HandleSchedule(const Event& ev, EngineContext& ctx)
{
    Topology& topology = ctx.GetTopology();
    const EnergyModel& energy = ctx.GetEnergyModel();
    uint32_t head = ev.origin;
    if (!topology.IsAlive(head) || m_state[head].members.empty())
    {
        return;
    }
    double radius = 0;
    for (uint32_t m : m_state[head].members)
    {
        radius = std::max(radius, topology.Distance(head, m));
    }
    if (!ctx.Spend(head, energy.TransmitCost(radius, ctx.GetControlBits())))
    {
        return;
    }
    for (uint32_t m : m_state[head].members)
    {
        if (topology.IsAlive(m))
        {
            ctx.Spend(m, energy.ReceiveCost(ctx.GetControlBits()));
        }
    }
}

void
LeachEngine::SendDirect(uint32_t node, SensorPacket packet, EngineContext& ctx)
{
    Topology& topology = ctx.GetTopology();
    packet.sender = node;
    packet.nextHop = BASE_STATION;
    double d = topology.DistanceToBaseStation(node);
    if (!ctx.Spend(node, ctx.GetEnergyModel().TransmitCost(d, packet.bits)))
    {
        ctx.Dropped(node, packet, DropReason::SENDER_DIED);
        return;
    }
    packet.hops += 1;
    ctx.Delivered(packet);
}

void
LeachEngine::HandleSense(const Event& ev, EngineContext& ctx)
{
    Topology& topology = ctx.GetTopology();
    const EnergyModel& energy = ctx.GetEnergyModel();
    uint32_t node = ev.origin;
    if (!topology.IsAlive(node) || m_state[node].isHead)
    {
        return;
    }
    SensorPacket packet = ctx.NewReading(node);
    if (!ctx.Spend(node, energy.SensingCost(packet.bits)))
    {
        ctx.Dropped(node, packet, DropReason::SENDER_DIED);
        return;
    }

    NodeState& s = m_state[node];
    if (s.head != NO_NODE && !s.direct && !topology.IsAlive(s.head))
    {
        NS_LOG_WARN("Node " << node << ": cluster head " << s.head
                            << " died, sending directly for the rest of round "
                            << ctx.GetRound());
        s.direct = true;
        topology.GetNode(node).SetRole(NodeRole::NORMAL);
    }
    if (s.head == NO_NODE || s.direct)
    {
        SendDirect(node, packet, ctx);
        return;
    }

    uint32_t head = s.head;
    packet.nextHop = head;
    if (!ctx.Spend(node, energy.TransmitCost(topology.Distance(node, head), packet.bits)))
    {
        ctx.Dropped(node, packet, DropReason::SENDER_DIED);
        return;
    }
    packet.hops = 1;
    if (!ctx.Spend(head, energy.ReceiveCost(packet.bits)))
    {
        ctx.Dropped(head, packet, DropReason::RECEIVER_DIED);
        return;
    }
    NodeState& h = m_state[head];
    if (h.pendingReadings == 0)
    {
        h.pendingCreated = packet.created;
    }
    h.pendingReadings += packet.contributions;
    h.pendingBits += packet.bits;
    h.pendingHops = std::max(h.pendingHops, packet.hops);
}

SensorPacket
LeachEngine::TakePending(uint32_t head, EngineContext& ctx)
{
    NodeState& h = m_state[head];
    SensorPacket packet;
    packet.id = ctx.NextPacketId();
    packet.source = head;
    packet.sender = head;
    packet.bits = ctx.GetDataBits();
    packet.hops = h.pendingHops;
    packet.contributions = h.pendingReadings;
    packet.created = h.pendingReadings > 0 ? h.pendingCreated : ctx.Now();
    h.pendingReadings = 0;
    h.pendingBits = 0;
    h.pendingHops = 0;
    return packet;
}

void
LeachEngine::HandleAggregate(const Event& ev, EngineContext& ctx)
{
    Topology& topology = ctx.GetTopology();
    const EnergyModel& energy = ctx.GetEnergyModel();
    uint32_t head = ev.origin;
    uint32_t fusedBits = m_state[head].pendingBits + ctx.GetDataBits();
    SensorPacket packet = TakePending(head, ctx);
    if (!topology.IsAlive(head))
    {
        ctx.Dropped(head, packet, DropReason::HEAD_LOST);
        return;
    }
    // the head's own reading
    packet.contributions += 1;
    if (!ctx.Spend(head, energy.SensingCost(ctx.GetDataBits())) ||
        !ctx.Spend(head, energy.AggregationCost(fusedBits)))
    {
        ctx.Dropped(head, packet, DropReason::HEAD_LOST);
        return;
    }
    SendDirect(head, packet, ctx);
}

void
LeachEngine::OnRoundEnd(EngineContext& ctx)
{
    NS_LOG_FUNCTION(this << ctx.GetRound());
    Topology& topology = ctx.GetTopology();
    for (uint32_t h : m_heads)
    {
        if (m_state[h].pendingReadings > 0)
        {
            ctx.Dropped(h, TakePending(h, ctx), DropReason::HEAD_LOST);
        }
    }
    for (uint32_t id : topology.GetAliveNodes())
    {
        topology.GetNode(id).SetRole(NodeRole::NORMAL);
    }
    for (auto& s : m_state)
    {
        s.isHead = false;
    }
}

bool
LeachEngine::IsTerminal(const Topology& topology) const
{
    return topology.GetNAliveNodes() == 0;
}

} // namespace sensornet
} // namespace ns3
