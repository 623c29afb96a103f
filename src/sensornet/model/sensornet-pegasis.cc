/*
 * Sensornet: energy-aware routing for wireless sensor networks
 *
 * SPDX-License-Identifier: GPL-2.0-only
 */
#include "sensornet-pegasis.h"

#include "ns3/log.h"

#include <algorithm>
#include <cctype>
#include <limits>

namespace ns3
{

NS_LOG_COMPONENT_DEFINE("SensornetPegasis");

namespace sensornet
{

namespace
{

std::string
ToLower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

} // namespace

bool
ParseLeaderPolicy(const std::string& name, LeaderPolicy& policy)
{
    std::string lower = ToLower(name);
    if (lower == "roundrobin" || lower == "round-robin")
    {
        policy = LeaderPolicy::ROUND_ROBIN;
        return true;
    }
    if (lower == "energy")
    {
        policy = LeaderPolicy::ENERGY;
        return true;
    }
    return false;
}

std::ostream&
operator<<(std::ostream& os, LeaderPolicy policy)
{
    os << (policy == LeaderPolicy::ROUND_ROBIN ? "RoundRobin" : "Energy");
    return os;
}

PegasisEngine::PegasisEngine(const PegasisParameters& params)
    : m_params(params),
      m_leaderIndex(0),
      m_lastBuildRound(0),
      m_buildCount(0),
      m_leaderBits(0)
{
}

std::vector<uint32_t>
PegasisEngine::BuildChain(const Topology& topology)
{
    std::vector<uint32_t> remaining = topology.GetAliveNodes();
    std::vector<uint32_t> chain;
    if (remaining.empty())
    {
        return chain;
    }

    auto start = remaining.begin();
    for (auto i = remaining.begin(); i != remaining.end(); ++i)
    {
        if (topology.DistanceToBaseStation(*i) > topology.DistanceToBaseStation(*start))
        {
            start = i;
        }
    }
    chain.push_back(*start);
    remaining.erase(start);

    while (!remaining.empty())
    {
        uint32_t end = chain.back();
        auto nearest = remaining.begin();
        for (auto i = remaining.begin(); i != remaining.end(); ++i)
        {
            if (topology.Distance(end, *i) < topology.Distance(end, *nearest))
            {
                nearest = i;
            }
        }
        chain.push_back(*nearest);
        remaining.erase(nearest);
    }
    return chain;
}

uint32_t
PegasisEngine::GetLeader() const
{
    return m_chain.empty() ? NO_NODE : m_chain[m_leaderIndex];
}

bool
PegasisEngine::NeedsRebuild(const Topology& topology, uint32_t round) const
{
    if (m_chain.empty())
    {
        return true;
    }
    for (uint32_t n : m_chain)
    {
        if (!topology.IsAlive(n))
        {
            return true;
        }
    }
    return m_params.rebuildInterval > 0 && round - m_lastBuildRound >= m_params.rebuildInterval;
}

void
PegasisEngine::Rebuild(EngineContext& ctx)
{
    const Topology& topology = ctx.GetTopology();
    m_chain = BuildChain(topology);
    m_position.assign(topology.GetNNodes(), NO_NODE);
    for (uint32_t i = 0; i < m_chain.size(); ++i)
    {
        m_position[m_chain[i]] = i;
    }
    m_lastBuildRound = ctx.GetRound();
    ++m_buildCount;
    NS_LOG_LOGIC("Round " << ctx.GetRound() << ": chain rebuilt with " << m_chain.size()
                          << " nodes");
}

uint32_t
PegasisEngine::Step(uint32_t index, Direction dir) const
{
    return dir == FROM_HEAD ? index + 1 : index - 1;
}

void
PegasisEngine::OnRoundStart(EngineContext& ctx)
{
    NS_LOG_FUNCTION(this << ctx.GetRound());
    Topology& topology = ctx.GetTopology();
    uint32_t round = ctx.GetRound();
    if (NeedsRebuild(topology, round))
    {
        Rebuild(ctx);
    }
    if (m_chain.empty())
    {
        return;
    }

    uint32_t size = m_chain.size();
    if (m_params.leaderPolicy == LeaderPolicy::ROUND_ROBIN)
    {
        m_leaderIndex = round % size;
    }
    else
    {
        uint32_t best = 0;
        for (uint32_t i = 1; i < size; ++i)
        {
            double e = topology.GetNode(m_chain[i]).GetEnergy();
            double bestEnergy = topology.GetNode(m_chain[best]).GetEnergy();
            if (e > bestEnergy || (e == bestEnergy && m_chain[i] < m_chain[best]))
            {
                best = i;
            }
        }
        m_leaderIndex = best;
    }
    for (uint32_t i = 0; i < size; ++i)
    {
        topology.GetNode(m_chain[i])
            .SetRole(i == m_leaderIndex ? NodeRole::CHAIN_LEADER : NodeRole::CHAIN_MEMBER);
    }
    NS_LOG_LOGIC("Round " << round << ": leader " << m_chain[m_leaderIndex] << " at position "
                          << m_leaderIndex);

    m_leaderBuffer = SensorPacket();
    m_leaderBits = 0;

    if (m_leaderIndex > 0)
    {
        Event ev(SENSORNET_CHAIN_RELAY, m_chain.front(), m_chain.front());
        ev.tag = FROM_HEAD;
        ctx.Schedule(ctx.SlotTime(1), ev);
    }
    if (m_leaderIndex + 1 < size)
    {
        Event ev(SENSORNET_CHAIN_RELAY, m_chain.back(), m_chain.back());
        ev.tag = FROM_TAIL;
        ctx.Schedule(ctx.SlotTime(1), ev);
    }
    ctx.Schedule(ctx.SlotTime(size + 1),
                 Event(SENSORNET_LEADER_SEND, m_chain[m_leaderIndex], BASE_STATION));
}

void
PegasisEngine::OnEvent(const Event& ev, EngineContext& ctx)
{
    switch (ev.type)
    {
    case SENSORNET_CHAIN_RELAY:
        HandleRelay(ev, ctx);
        break;
    case SENSORNET_LEADER_SEND:
        HandleLeaderSend(ev, ctx);
        break;
    default:
        NS_LOG_WARN("PEGASIS ignores event " << ev.type);
        break;
    }
}

void
PegasisEngine::Restart(uint32_t index, Direction dir, EngineContext& ctx)
{
    Event ev(SENSORNET_CHAIN_RELAY, m_chain[index], m_chain[index]);
    ev.tag = dir;
    ctx.ScheduleNextHop(ev);
}

void
PegasisEngine::HandleRelay(const Event& ev, EngineContext& ctx)
{
    Topology& topology = ctx.GetTopology();
    const EnergyModel& energy = ctx.GetEnergyModel();
    uint32_t holder = ev.target;
    uint32_t index = m_position[holder];
    Direction dir = ev.tag == FROM_HEAD ? FROM_HEAD : FROM_TAIL;
    SensorPacket token = ev.packet;
    bool carrying = token.contributions > 0;

    if (index == m_leaderIndex)
    {
        if (!carrying)
        {
            return;
        }
        if (!topology.IsAlive(holder))
        {
            ctx.Dropped(holder, token, DropReason::CHAIN_BROKEN);
            return;
        }
        if (!ctx.Spend(holder, energy.ReceiveCost(token.bits)))
        {
            ctx.Dropped(holder, token, DropReason::RECEIVER_DIED);
            return;
        }
        if (m_leaderBuffer.contributions == 0)
        {
            m_leaderBuffer = token;
        }
        else
        {
            m_leaderBuffer.contributions += token.contributions;
            m_leaderBuffer.hops = std::max(m_leaderBuffer.hops, token.hops);
            m_leaderBuffer.created = std::min(m_leaderBuffer.created, token.created);
        }
        m_leaderBits += token.bits;
        return;
    }

    if (!topology.IsAlive(holder))
    {
        NS_LOG_WARN("Chain broken at node " << holder << " in round " << ctx.GetRound());
        ctx.Dropped(holder, token, DropReason::CHAIN_BROKEN);
        Restart(Step(index, dir), dir, ctx);
        return;
    }
    if (carrying && !ctx.Spend(holder, energy.ReceiveCost(token.bits)))
    {
        ctx.Dropped(holder, token, DropReason::RECEIVER_DIED);
        Restart(Step(index, dir), dir, ctx);
        return;
    }

    // add the holder's own reading
    uint32_t fusedBits = (carrying ? token.bits : 0) + ctx.GetDataBits();
    if (!carrying)
    {
        token = ctx.NewReading(holder);
    }
    else
    {
        token.contributions += 1;
    }
    if (!ctx.Spend(holder, energy.SensingCost(ctx.GetDataBits())) ||
        (carrying && !ctx.Spend(holder, energy.AggregationCost(fusedBits))))
    {
        ctx.Dropped(holder, token, DropReason::SENDER_DIED);
        Restart(Step(index, dir), dir, ctx);
        return;
    }

    uint32_t nextIndex = Step(index, dir);
    uint32_t next = m_chain[nextIndex];
    if (!topology.IsAlive(next))
    {
        NS_LOG_WARN("Chain broken: next node " << next << " of " << holder << " is dead");
        ctx.Dropped(holder, token, DropReason::CHAIN_BROKEN);
        Restart(nextIndex, dir, ctx);
        return;
    }
    token.sender = holder;
    token.nextHop = next;
    token.bits = ctx.GetDataBits();
    if (!ctx.Spend(holder, energy.TransmitCost(topology.Distance(holder, next), token.bits)))
    {
        ctx.Dropped(holder, token, DropReason::SENDER_DIED);
        Restart(nextIndex, dir, ctx);
        return;
    }
    token.hops += 1;
    Event relay(SENSORNET_CHAIN_RELAY, holder, next);
    relay.tag = dir;
    relay.packet = token;
    ctx.ScheduleNextHop(relay);
}

void
PegasisEngine::HandleLeaderSend(const Event& ev, EngineContext& ctx)
{
    Topology& topology = ctx.GetTopology();
    const EnergyModel& energy = ctx.GetEnergyModel();
    uint32_t leader = ev.origin;
    SensorPacket packet = m_leaderBuffer;
    uint32_t collectedBits = m_leaderBits;
    m_leaderBuffer = SensorPacket();
    m_leaderBits = 0;

    if (!topology.IsAlive(leader))
    {
        ctx.Dropped(leader, packet, DropReason::CHAIN_BROKEN);
        return;
    }
    bool carrying = packet.contributions > 0;
    if (!carrying)
    {
        packet = ctx.NewReading(leader);
    }
    else
    {
        packet.contributions += 1;
    }
    if (!ctx.Spend(leader, energy.SensingCost(ctx.GetDataBits())) ||
        (carrying &&
         !ctx.Spend(leader, energy.AggregationCost(collectedBits + ctx.GetDataBits()))))
    {
        ctx.Dropped(leader, packet, DropReason::SENDER_DIED);
        return;
    }
    packet.sender = leader;
    packet.nextHop = BASE_STATION;
    packet.bits = ctx.GetDataBits();
    if (!ctx.Spend(leader, energy.TransmitCost(topology.DistanceToBaseStation(leader), packet.bits)))
    {
        ctx.Dropped(leader, packet, DropReason::SENDER_DIED);
        return;
    }
    packet.hops += 1;
    ctx.Delivered(packet);
}

void
PegasisEngine::OnRoundEnd(EngineContext& ctx)
{
    NS_LOG_FUNCTION(this << ctx.GetRound());
    if (m_leaderBuffer.contributions > 0)
    {
        ctx.Dropped(GetLeader(), m_leaderBuffer, DropReason::CHAIN_BROKEN);
        m_leaderBuffer = SensorPacket();
        m_leaderBits = 0;
    }
}

bool
PegasisEngine::IsTerminal(const Topology& topology) const
{
    return topology.GetNAliveNodes() == 0;
}

} // namespace sensornet
} // namespace ns3
