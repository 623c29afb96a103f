/*
 * Sensornet: energy-aware routing for wireless sensor networks
 *
 * SPDX-License-Identifier: GPL-2.0-only
 */
#include "sensornet-protocol-engine.h"

#include "ns3/fatal-error.h"

#include <algorithm>
#include <cctype>
#include <utility>

namespace ns3
{
namespace sensornet
{

bool
ParseProtocolKind(const std::string& name, ProtocolKind& kind)
{
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return std::tolower(c);
    });
    if (lower == "leach")
    {
        kind = ProtocolKind::LEACH;
    }
    else if (lower == "directeddiffusion" || lower == "directed-diffusion" ||
             lower == "diffusion" || lower == "dd")
    {
        kind = ProtocolKind::DIRECTED_DIFFUSION;
    }
    else if (lower == "gear")
    {
        kind = ProtocolKind::GEAR;
    }
    else if (lower == "pegasis")
    {
        kind = ProtocolKind::PEGASIS;
    }
    else
    {
        return false;
    }
    return true;
}

std::string
ProtocolKindName(ProtocolKind kind)
{
    switch (kind)
    {
    case ProtocolKind::LEACH:
        return "LEACH";
    case ProtocolKind::DIRECTED_DIFFUSION:
        return "DirectedDiffusion";
    case ProtocolKind::GEAR:
        return "GEAR";
    case ProtocolKind::PEGASIS:
        return "PEGASIS";
    }
    return "Unknown";
}

std::ostream&
operator<<(std::ostream& os, ProtocolKind kind)
{
    os << ProtocolKindName(kind);
    return os;
}

ProtocolEngine::ProtocolEngine(Variant engine)
    : m_engine(std::move(engine))
{
}

ProtocolKind
ProtocolEngine::GetKind() const
{
    switch (m_engine.index())
    {
    case 0:
        return ProtocolKind::LEACH;
    case 1:
        return ProtocolKind::DIRECTED_DIFFUSION;
    case 2:
        return ProtocolKind::GEAR;
    case 3:
        return ProtocolKind::PEGASIS;
    }
    NS_FATAL_ERROR("Protocol engine holds no engine (variant index " << m_engine.index() << ")");
    return ProtocolKind::LEACH;
}

std::vector<Outcome>
ProtocolEngine::OnRoundStart(EngineContext& ctx)
{
    std::visit([&ctx](auto& engine) { engine.OnRoundStart(ctx); }, m_engine);
    return ctx.TakeOutcomes();
}

std::vector<Outcome>
ProtocolEngine::OnEvent(const Event& ev, EngineContext& ctx)
{
    std::visit([&ev, &ctx](auto& engine) { engine.OnEvent(ev, ctx); }, m_engine);
    return ctx.TakeOutcomes();
}

std::vector<Outcome>
ProtocolEngine::OnRoundEnd(EngineContext& ctx)
{
    std::visit([&ctx](auto& engine) { engine.OnRoundEnd(ctx); }, m_engine);
    return ctx.TakeOutcomes();
}

bool
ProtocolEngine::IsTerminal(const Topology& topology) const
{
    return std::visit([&topology](const auto& engine) { return engine.IsTerminal(topology); },
                      m_engine);
}

uint32_t
ProtocolEngine::GetClusterHeadCount() const
{
    if (const LeachEngine* leach = Get<LeachEngine>())
    {
        return leach->GetClusterHeads().size();
    }
    if (const PegasisEngine* pegasis = Get<PegasisEngine>())
    {
        return pegasis->GetLeader() == NO_NODE ? 0 : 1;
    }
    return 0;
}

} // namespace sensornet
} // namespace ns3
