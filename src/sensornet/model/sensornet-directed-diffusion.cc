/*
 * Sensornet: energy-aware routing for wireless sensor networks
 *
 * SPDX-License-Identifier: GPL-2.0-only
 */
#include "sensornet-directed-diffusion.h"

#include "ns3/log.h"

#include <algorithm>
#include <iterator>

namespace ns3
{

NS_LOG_COMPONENT_DEFINE("SensornetDiffusion");

namespace sensornet
{

DiffusionEngine::DiffusionEngine(const DiffusionParameters& params,
                                 uint32_t nNodes,
                                 double radioRange)
    : m_params(params),
      m_radioRange(radioRange),
      m_sinkRange(params.sinkRange > 0 ? params.sinkRange : 3 * radioRange),
      m_nNodes(nNodes),
      m_seq(0),
      m_state(nNodes),
      m_interestCache(nNodes, IdCache(Time(0))),
      m_dataCache(nNodes, IdCache(Time(0)))
{
}

const std::vector<Gradient>&
DiffusionEngine::GetGradients(uint32_t node) const
{
    return m_state[node].gradients;
}

std::vector<PathRecord>
DiffusionEngine::GetSinkPaths(uint32_t source) const
{
    auto i = m_sinkPaths.find(source);
    if (i == m_sinkPaths.end())
    {
        return std::vector<PathRecord>();
    }
    return i->second;
}

uint32_t
DiffusionEngine::GetReinforcedHop(uint32_t node, uint32_t source) const
{
    auto i = m_state[node].downstream.find(source);
    return i == m_state[node].downstream.end() ? NO_NODE : i->second;
}

bool
DiffusionEngine::IsReachable(uint32_t node, const EngineContext& ctx) const
{
    return node == BASE_STATION || ctx.GetTopology().IsAlive(node);
}

double
DiffusionEngine::LinkDistance(uint32_t a, uint32_t b, const EngineContext& ctx) const
{
    if (b == BASE_STATION)
    {
        return ctx.GetTopology().DistanceToBaseStation(a);
    }
    return ctx.GetTopology().Distance(a, b);
}

Gradient*
DiffusionEngine::FindGradient(uint32_t node, uint32_t neighbor)
{
    for (auto& g : m_state[node].gradients)
    {
        if (g.neighbor == neighbor)
        {
            return &g;
        }
    }
    return nullptr;
}

void
DiffusionEngine::RefreshReinforcedFlags(uint32_t node)
{
    NodeState& s = m_state[node];
    for (auto& g : s.gradients)
    {
        g.reinforced = false;
        for (const auto& d : s.downstream)
        {
            if (d.second == g.neighbor)
            {
                g.reinforced = true;
            }
        }
        g.rate = g.reinforced ? m_params.reinforcedRate : 1;
    }
}

void
DiffusionEngine::PruneGradients(uint32_t round)
{
    for (uint32_t n = 0; n < m_state.size(); ++n)
    {
        NodeState& s = m_state[n];
        auto stale = [&](const Gradient& g) {
            return round > g.lastUsed && round - g.lastUsed > m_params.gradientTimeout;
        };
        for (const auto& g : s.gradients)
        {
            if (stale(g))
            {
                NS_LOG_LOGIC("Node " << n << ": gradient toward " << g.neighbor << " timed out");
                for (auto d = s.downstream.begin(); d != s.downstream.end();)
                {
                    d = d->second == g.neighbor ? s.downstream.erase(d) : std::next(d);
                }
            }
        }
        s.gradients.erase(std::remove_if(s.gradients.begin(), s.gradients.end(), stale),
                          s.gradients.end());
    }
}

void
DiffusionEngine::SelectSources(EngineContext& ctx)
{
    std::vector<uint32_t> alive = ctx.GetTopology().GetAliveNodes();
    std::vector<std::pair<double, uint32_t>> keyed;
    for (uint32_t id : alive)
    {
        keyed.emplace_back(ctx.GetRandom()->GetValue(0.0, 1.0), id);
    }
    std::sort(keyed.begin(), keyed.end());
    m_sources.clear();
    for (uint32_t i = 0; i < keyed.size() && i < m_params.sourceCount; ++i)
    {
        m_sources.push_back(keyed[i].second);
    }
    std::sort(m_sources.begin(), m_sources.end());
}

void
DiffusionEngine::StartInterest(EngineContext& ctx)
{
    ++m_seq;
    SelectSources(ctx);
    m_sinkPaths.clear();
    m_reinforceVisited.clear();
    m_exploratory.clear();

    Time span = ctx.GetHopDelay() * (4 * m_nNodes + 16);
    for (uint32_t n = 0; n < m_nNodes; ++n)
    {
        m_interestCache[n].SetLifetime(span);
        m_dataCache[n].SetLifetime(span);
    }
    NS_LOG_LOGIC("Round " << ctx.GetRound() << ": interest " << m_seq << " with "
                          << m_sources.size() << " sources");

    Event flood(SENSORNET_INTEREST_FLOOD, BASE_STATION, NO_NODE);
    flood.tag = m_seq;
    flood.packet.id = ctx.NextPacketId();
    flood.packet.source = BASE_STATION;
    flood.packet.sender = BASE_STATION;
    flood.packet.bits = ctx.GetControlBits();
    ctx.Schedule(ctx.SlotTime(1), flood);

    for (uint32_t src : m_sources)
    {
        Event sense(SENSORNET_SENSE, src, NO_NODE);
        sense.tag = m_seq;
        ctx.Schedule(ctx.SlotTime(m_nNodes + 2), sense);
    }

    Event update(SENSORNET_GRADIENT_UPDATE, BASE_STATION, BASE_STATION);
    update.tag = m_seq;
    ctx.Schedule(ctx.SlotTime(2 * m_nNodes + 4), update);
}

void
DiffusionEngine::OnRoundStart(EngineContext& ctx)
{
    NS_LOG_FUNCTION(this << ctx.GetRound());
    uint32_t round = ctx.GetRound();
    PruneGradients(round);
    for (uint32_t n = 0; n < m_nNodes; ++n)
    {
        RefreshReinforcedFlags(n);
    }

    if (m_seq == 0 || round % m_params.interestInterval == 0)
    {
        StartInterest(ctx);
        return;
    }
    for (uint32_t src : m_sources)
    {
        if (ctx.GetTopology().IsAlive(src))
        {
            // tag 0: steady data on the reinforced path
            ctx.Schedule(ctx.SlotTime(1), Event(SENSORNET_SENSE, src, NO_NODE));
        }
    }
}

void
DiffusionEngine::OnEvent(const Event& ev, EngineContext& ctx)
{
    switch (ev.type)
    {
    case SENSORNET_INTEREST_FLOOD:
        HandleInterest(ev, ctx);
        break;
    case SENSORNET_SENSE:
        HandleSense(ev, ctx);
        break;
    case SENSORNET_EXPLORATORY_DATA:
        HandleExploratory(ev, ctx);
        break;
    case SENSORNET_GRADIENT_UPDATE:
        HandleGradientUpdate(ev, ctx);
        break;
    case SENSORNET_REINFORCE:
        HandleReinforce(ev, ctx);
        break;
    case SENSORNET_NEGATIVE_REINFORCE:
        HandleNegativeReinforce(ev, ctx);
        break;
    case SENSORNET_DATA_SEND:
        HandleData(ev, ctx);
        break;
    default:
        NS_LOG_WARN("Directed Diffusion ignores event " << ev.type);
        break;
    }
}

void
DiffusionEngine::HandleInterest(const Event& ev, EngineContext& ctx)
{
    Topology& topology = ctx.GetTopology();
    const EnergyModel& energy = ctx.GetEnergyModel();
    uint32_t sender = ev.origin;
    uint32_t seq = ev.tag;
    std::vector<uint32_t> receivers;
    if (sender == BASE_STATION)
    {
        receivers = topology.NodesWithin(topology.GetBaseStation(), m_sinkRange);
    }
    else
    {
        if (!topology.IsAlive(sender) ||
            !ctx.Spend(sender, energy.TransmitCost(m_radioRange, ev.packet.bits)))
        {
            return;
        }
        receivers = topology.NeighborsWithin(sender, m_radioRange);
    }

    for (uint32_t r : receivers)
    {
        if (!ctx.Spend(r, energy.ReceiveCost(ev.packet.bits)))
        {
            continue;
        }
        NodeState& s = m_state[r];
        if (seq < s.seq)
        {
            continue;
        }
        if (seq > s.seq)
        {
            // a newer interest supersedes the stale gradients
            s.seq = seq;
            s.gradients.clear();
            s.upstream.clear();
        }
        Gradient* g = FindGradient(r, sender);
        if (g == nullptr)
        {
            s.gradients.push_back(Gradient{sender, ev.packet.hops, 1, false, ctx.GetRound()});
        }
        else
        {
            g->hops = std::min(g->hops, ev.packet.hops);
            g->lastUsed = ctx.GetRound();
        }
        if (!m_interestCache[r].IsDuplicate(BASE_STATION, seq, ctx.Now()))
        {
            Event flood(SENSORNET_INTEREST_FLOOD, r, NO_NODE);
            flood.tag = seq;
            flood.packet = ev.packet;
            flood.packet.sender = r;
            flood.packet.hops = ev.packet.hops + 1;
            ctx.ScheduleNextHop(flood);
        }
    }
    for (uint32_t r : receivers)
    {
        RefreshReinforcedFlags(r);
    }
}

uint32_t
DiffusionEngine::SpreadExploratory(uint32_t node,
                                   uint32_t from,
                                   SensorPacket packet,
                                   EngineContext& ctx)
{
    std::vector<uint32_t> targets;
    double range = 0;
    for (const auto& g : m_state[node].gradients)
    {
        if (g.neighbor != from && IsReachable(g.neighbor, ctx))
        {
            targets.push_back(g.neighbor);
            range = std::max(range, LinkDistance(node, g.neighbor, ctx));
        }
    }
    if (targets.empty())
    {
        return 0;
    }
    std::sort(targets.begin(), targets.end());
    // a single broadcast reaches every gradient neighbor
    if (!ctx.Spend(node, ctx.GetEnergyModel().TransmitCost(range, packet.bits)))
    {
        return 0;
    }
    packet.sender = node;
    for (uint32_t t : targets)
    {
        Event copy(SENSORNET_EXPLORATORY_DATA, node, t);
        copy.packet = packet;
        copy.packet.nextHop = t;
        ctx.ScheduleNextHop(copy);
    }
    return targets.size();
}

void
DiffusionEngine::HandleSense(const Event& ev, EngineContext& ctx)
{
    uint32_t src = ev.origin;
    if (!ctx.GetTopology().IsAlive(src))
    {
        return;
    }
    bool exploratory = ev.tag != 0;
    uint32_t readings = exploratory ? 1 : m_params.reinforcedRate;
    for (uint32_t k = 0; k < readings; ++k)
    {
        SensorPacket packet = ctx.NewReading(src);
        if (!ctx.Spend(src, ctx.GetEnergyModel().SensingCost(packet.bits)))
        {
            ctx.Dropped(src, packet, DropReason::SENDER_DIED);
            return;
        }
        if (!exploratory)
        {
            ForwardData(src, NO_NODE, packet, 0, ctx);
            continue;
        }
        m_dataCache[src].IsDuplicate(src, packet.id, ctx.Now());
        m_exploratory[packet.id] = packet;
        if (SpreadExploratory(src, NO_NODE, packet, ctx) == 0)
        {
            m_exploratory.erase(packet.id);
            ctx.Dropped(src,
                        packet,
                        ctx.GetTopology().IsAlive(src) ? DropReason::NO_ROUTE
                                                       : DropReason::SENDER_DIED);
        }
    }
}

void
DiffusionEngine::HandleExploratory(const Event& ev, EngineContext& ctx)
{
    uint32_t sender = ev.origin;
    uint32_t node = ev.target;
    SensorPacket packet = ev.packet;
    packet.hops += 1;

    if (node == BASE_STATION)
    {
        std::vector<PathRecord>& records = m_sinkPaths[packet.source];
        bool known = std::any_of(records.begin(), records.end(), [&](const PathRecord& r) {
            return r.lastHop == sender;
        });
        if (!known)
        {
            records.push_back(PathRecord{sender, ctx.Now() - packet.created, packet.hops, false});
        }
        auto pending = m_exploratory.find(packet.id);
        if (pending != m_exploratory.end())
        {
            m_exploratory.erase(pending);
            ctx.Delivered(packet);
        }
        return;
    }

    if (!ctx.GetTopology().IsAlive(node) ||
        !ctx.Spend(node, ctx.GetEnergyModel().ReceiveCost(packet.bits)))
    {
        return;
    }
    std::vector<uint32_t>& heard = m_state[node].upstream[packet.source];
    if (std::find(heard.begin(), heard.end(), sender) == heard.end())
    {
        heard.push_back(sender);
    }
    if (m_dataCache[node].IsDuplicate(packet.source, packet.id, ctx.Now()))
    {
        return;
    }
    SpreadExploratory(node, sender, packet, ctx);
}

void
DiffusionEngine::HandleGradientUpdate(const Event& ev, EngineContext& ctx)
{
    const Topology& topology = ctx.GetTopology();
    for (const auto& p : m_exploratory)
    {
        ctx.Dropped(p.second.source, p.second, DropReason::NO_ROUTE);
    }
    m_exploratory.clear();

    for (uint32_t src : m_sources)
    {
        auto found = m_sinkPaths.find(src);
        if (found == m_sinkPaths.end() || found->second.empty())
        {
            NS_LOG_DEBUG("Interest " << ev.tag << ": no exploratory path from source " << src);
            continue;
        }
        std::vector<PathRecord>& records = found->second;
        std::sort(records.begin(), records.end(), [](const PathRecord& a, const PathRecord& b) {
            if (a.latency != b.latency)
            {
                return a.latency < b.latency;
            }
            if (a.hops != b.hops)
            {
                return a.hops < b.hops;
            }
            return a.lastHop < b.lastHop;
        });
        auto previous = m_sinkChoice.find(src);
        uint32_t old = previous == m_sinkChoice.end() ? NO_NODE : previous->second;
        m_sinkChoice.erase(src);
        ReinforceUpstream(BASE_STATION, src, ctx);
        auto chosen = m_sinkChoice.find(src);
        if (old != NO_NODE && (chosen == m_sinkChoice.end() || chosen->second != old) &&
            topology.IsAlive(old))
        {
            NS_LOG_LOGIC("Source " << src << ": sink drops path through " << old);
            Event negative(SENSORNET_NEGATIVE_REINFORCE, BASE_STATION, old);
            negative.tag = src;
            negative.packet.bits = ctx.GetControlBits();
            ctx.ScheduleNextHop(negative);
        }
    }
}

void
DiffusionEngine::ReinforceUpstream(uint32_t from, uint32_t source, EngineContext& ctx)
{
    const Topology& topology = ctx.GetTopology();
    std::set<uint32_t>& visited = m_reinforceVisited[source];
    uint32_t next = NO_NODE;

    if (from == BASE_STATION)
    {
        std::vector<PathRecord>& records = m_sinkPaths[source];
        for (auto& r : records)
        {
            r.reinforced = false;
        }
        for (auto& r : records)
        {
            if (topology.IsAlive(r.lastHop) && visited.count(r.lastHop) == 0)
            {
                r.reinforced = true;
                next = r.lastHop;
                break;
            }
        }
        if (next == NO_NODE)
        {
            NS_LOG_WARN("Source " << source << ": no live path left to reinforce");
            return;
        }
        m_sinkChoice[source] = next;
    }
    else
    {
        for (uint32_t u : m_state[from].upstream[source])
        {
            if (topology.IsAlive(u) && visited.count(u) == 0)
            {
                next = u;
                break;
            }
        }
        if (next == NO_NODE)
        {
            NS_LOG_WARN("Node " << from << ": no live upstream left toward source " << source);
            return;
        }
        if (!ctx.Spend(from,
                       ctx.GetEnergyModel().TransmitCost(topology.Distance(from, next),
                                                         ctx.GetControlBits())))
        {
            return;
        }
        m_state[from].reinforcedUpstream[source] = next;
    }

    NS_LOG_LOGIC("Reinforce " << from << " -> " << next << " for source " << source);
    Event reinforce(SENSORNET_REINFORCE, from, next);
    reinforce.tag = source;
    reinforce.packet.bits = ctx.GetControlBits();
    ctx.ScheduleNextHop(reinforce);
}

void
DiffusionEngine::HandleReinforce(const Event& ev, EngineContext& ctx)
{
    uint32_t from = ev.origin;
    uint32_t node = ev.target;
    uint32_t source = ev.tag;
    m_reinforceVisited[source].insert(node);

    if (!ctx.GetTopology().IsAlive(node) ||
        !ctx.Spend(node, ctx.GetEnergyModel().ReceiveCost(ev.packet.bits)))
    {
        // fall back to the next best recorded neighbor
        if (IsReachable(from, ctx))
        {
            NS_LOG_WARN("Reinforcement target " << node << " is dead, " << from
                                                << " falls back");
            ReinforceUpstream(from, source, ctx);
        }
        return;
    }

    NodeState& s = m_state[node];
    s.downstream[source] = from;
    Gradient* g = FindGradient(node, from);
    if (g != nullptr)
    {
        g->lastUsed = ctx.GetRound();
    }
    RefreshReinforcedFlags(node);
    if (node == source)
    {
        NS_LOG_LOGIC("Reinforcement reached source " << source);
        return;
    }
    ReinforceUpstream(node, source, ctx);
}

void
DiffusionEngine::HandleNegativeReinforce(const Event& ev, EngineContext& ctx)
{
    uint32_t from = ev.origin;
    uint32_t node = ev.target;
    uint32_t source = ev.tag;
    if (!ctx.GetTopology().IsAlive(node) ||
        !ctx.Spend(node, ctx.GetEnergyModel().ReceiveCost(ev.packet.bits)))
    {
        return;
    }
    NodeState& s = m_state[node];
    auto d = s.downstream.find(source);
    if (d == s.downstream.end() || d->second != from)
    {
        return;
    }
    s.downstream.erase(d);
    // the negatively reinforced neighbor no longer draws exploratory data;
    // paths of other sources already reinforced through it stay in downstream
    s.gradients.erase(std::remove_if(s.gradients.begin(),
                                     s.gradients.end(),
                                     [from](const Gradient& g) { return g.neighbor == from; }),
                      s.gradients.end());
    NS_LOG_LOGIC("Node " << node << ": gradient toward " << from << " negatively reinforced");
    RefreshReinforcedFlags(node);

    auto up = s.reinforcedUpstream.find(source);
    if (up == s.reinforcedUpstream.end() || node == source)
    {
        return;
    }
    uint32_t next = up->second;
    s.reinforcedUpstream.erase(up);
    if (!ctx.GetTopology().IsAlive(next) ||
        !ctx.Spend(node,
                   ctx.GetEnergyModel().TransmitCost(ctx.GetTopology().Distance(node, next),
                                                     ev.packet.bits)))
    {
        return;
    }
    Event negative(SENSORNET_NEGATIVE_REINFORCE, node, next);
    negative.tag = source;
    negative.packet = ev.packet;
    ctx.ScheduleNextHop(negative);
}

void
DiffusionEngine::ForwardData(uint32_t node,
                             uint32_t from,
                             SensorPacket packet,
                             uint32_t attempt,
                             EngineContext& ctx)
{
    NodeState& s = m_state[node];
    uint32_t next = NO_NODE;
    auto d = s.downstream.find(packet.source);
    if (d != s.downstream.end() && d->second != from && IsReachable(d->second, ctx))
    {
        next = d->second;
    }
    else
    {
        const Gradient* best = nullptr;
        for (const auto& g : s.gradients)
        {
            if (g.neighbor == from || !IsReachable(g.neighbor, ctx))
            {
                continue;
            }
            if (best == nullptr || g.hops < best->hops ||
                (g.hops == best->hops && g.neighbor < best->neighbor))
            {
                best = &g;
            }
        }
        if (best != nullptr)
        {
            next = best->neighbor;
            if (d != s.downstream.end())
            {
                NS_LOG_WARN("Node " << node << ": repairing path of source " << packet.source
                                    << " through " << next);
                s.downstream[packet.source] = next;
                RefreshReinforcedFlags(node);
            }
        }
    }

    if (next == NO_NODE || packet.hops > m_nNodes || attempt > m_nNodes)
    {
        ctx.Dropped(node, packet, DropReason::NO_ROUTE);
        return;
    }
    packet.sender = node;
    packet.nextHop = next;
    if (!ctx.Spend(node, ctx.GetEnergyModel().TransmitCost(LinkDistance(node, next, ctx), packet.bits)))
    {
        ctx.Dropped(node, packet, DropReason::SENDER_DIED);
        return;
    }
    Gradient* g = FindGradient(node, next);
    if (g != nullptr)
    {
        g->lastUsed = ctx.GetRound();
    }
    Event data(SENSORNET_DATA_SEND, node, next);
    data.packet = packet;
    data.tag = attempt;
    ctx.ScheduleNextHop(data);
}

void
DiffusionEngine::HandleData(const Event& ev, EngineContext& ctx)
{
    uint32_t sender = ev.origin;
    uint32_t node = ev.target;
    SensorPacket packet = ev.packet;

    if (node == BASE_STATION)
    {
        packet.hops += 1;
        ctx.Delivered(packet);
        return;
    }
    if (!ctx.GetTopology().IsAlive(node))
    {
        if (ctx.GetTopology().IsAlive(sender))
        {
            // the dead hop is no longer reachable, so the sender picks another
            ForwardData(sender, NO_NODE, packet, ev.tag + 1, ctx);
        }
        else
        {
            ctx.Dropped(node, packet, DropReason::NEXT_HOP_DEAD);
        }
        return;
    }
    if (!ctx.Spend(node, ctx.GetEnergyModel().ReceiveCost(packet.bits)))
    {
        ctx.Dropped(node, packet, DropReason::RECEIVER_DIED);
        return;
    }
    packet.hops += 1;
    ForwardData(node, sender, packet, 0, ctx);
}

void
DiffusionEngine::OnRoundEnd(EngineContext& ctx)
{
    NS_LOG_FUNCTION(this << ctx.GetRound());
    for (const auto& p : m_exploratory)
    {
        ctx.Dropped(p.second.source, p.second, DropReason::NO_ROUTE);
    }
    m_exploratory.clear();
}

bool
DiffusionEngine::IsTerminal(const Topology& topology) const
{
    return topology.GetNAliveNodes() == 0;
}

} // namespace sensornet
} // namespace ns3
