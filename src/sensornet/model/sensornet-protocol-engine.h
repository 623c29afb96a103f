/*
 * Sensornet: energy-aware routing for wireless sensor networks
 *
 * SPDX-License-Identifier: GPL-2.0-only
 */
#ifndef SENSORNET_PROTOCOL_ENGINE_H
#define SENSORNET_PROTOCOL_ENGINE_H

#include "sensornet-directed-diffusion.h"
#include "sensornet-engine-context.h"
#include "sensornet-gear.h"
#include "sensornet-leach.h"
#include "sensornet-pegasis.h"

#include <iostream>
#include <string>
#include <variant>
#include <vector>

namespace ns3
{
namespace sensornet
{

/**
 * @ingroup sensornet
 * @brief The routing protocols a run can use.
 */
enum class ProtocolKind : uint8_t
{
    LEACH,
    DIRECTED_DIFFUSION,
    GEAR,
    PEGASIS,
};

/**
 * @brief Parse a protocol name, case-insensitively: "LEACH",
 * "DirectedDiffusion" (or "Diffusion", "DD"), "GEAR", "PEGASIS".
 * @param name the name
 * @param kind the parsed protocol
 * @return true on success
 */
bool ParseProtocolKind(const std::string& name, ProtocolKind& kind);

/**
 * @param kind a protocol
 * @return its canonical name
 */
std::string ProtocolKindName(ProtocolKind kind);

std::ostream& operator<<(std::ostream& os, ProtocolKind kind);

/**
 * @ingroup sensornet
 * @brief Closed set of protocol engines behind one dispatch point.
 *
 * The driver talks to every protocol through this class; the variant keeps
 * engine state by value inside the owning run.
 */
class ProtocolEngine
{
  public:
    /// The engine alternatives
    typedef std::variant<LeachEngine, DiffusionEngine, GearEngine, PegasisEngine> Variant;

    /**
     * Constructor
     * @param engine the concrete engine
     */
    explicit ProtocolEngine(Variant engine);

    /// @return which protocol this is
    ProtocolKind GetKind() const;

    /**
     * Start a round.
     * @param ctx the run context
     * @return outcomes emitted while starting the round
     */
    std::vector<Outcome> OnRoundStart(EngineContext& ctx);
    /**
     * Handle one engine event.
     * @param ev the event
     * @param ctx the run context
     * @return outcomes emitted by the event
     */
    std::vector<Outcome> OnEvent(const Event& ev, EngineContext& ctx);
    /**
     * Close a round.
     * @param ctx the run context
     * @return outcomes emitted while closing the round
     */
    std::vector<Outcome> OnRoundEnd(EngineContext& ctx);
    /**
     * @param topology the node field
     * @return true when the protocol can make no further progress
     */
    bool IsTerminal(const Topology& topology) const;
    /// @return cluster heads (LEACH) or chain leaders (PEGASIS) of the current round
    uint32_t GetClusterHeadCount() const;

    /**
     * @tparam T a concrete engine type
     * @return the engine if it is a T, else nullptr
     */
    template <class T>
    const T* Get() const
    {
        return std::get_if<T>(&m_engine);
    }

  private:
    Variant m_engine;
};

} // namespace sensornet
} // namespace ns3

#endif /* SENSORNET_PROTOCOL_ENGINE_H */
