/*
 * Sensornet: energy-aware routing for wireless sensor networks
 *
 * SPDX-License-Identifier: GPL-2.0-only
 */
#ifndef SENSORNET_ENGINE_CONTEXT_H
#define SENSORNET_ENGINE_CONTEXT_H

#include "sensornet-energy-model.h"
#include "sensornet-event-scheduler.h"
#include "sensornet-outcome.h"
#include "sensornet-topology.h"

#include "ns3/nstime.h"
#include "ns3/ptr.h"
#include "ns3/random-variable-stream.h"

#include <cstdint>
#include <vector>

namespace ns3
{
namespace sensornet
{

/**
 * @ingroup sensornet
 * @brief Per-run state shared by the driver and the protocol engine.
 *
 * Bundles the run's scheduler, topology, energy model and random stream,
 * the round clock, and the outcomes emitted while handling one event.
 * Engines charge energy through Spend() so that every death is recorded
 * exactly once and the topology learns about it immediately.
 */
class EngineContext
{
  public:
    /**
     * Constructor
     * @param scheduler the run's event queue
     * @param topology the run's node field
     * @param energy the radio model
     * @param rng the run's random stream
     * @param hopDelay the duration of one phase slot
     * @param dataBits data packet size
     * @param controlBits control packet size
     */
    EngineContext(EventScheduler& scheduler,
                  Topology& topology,
                  const EnergyModel& energy,
                  Ptr<UniformRandomVariable> rng,
                  Time hopDelay,
                  uint32_t dataBits,
                  uint32_t controlBits);

    /// @return the event queue
    EventScheduler& GetScheduler()
    {
        return m_scheduler;
    }
    /// @return the node field
    Topology& GetTopology()
    {
        return m_topology;
    }
    /// @return the node field
    const Topology& GetTopology() const
    {
        return m_topology;
    }
    /// @return the radio model
    const EnergyModel& GetEnergyModel() const
    {
        return m_energy;
    }
    /// @return the run's random stream
    Ptr<UniformRandomVariable> GetRandom() const
    {
        return m_rng;
    }

    /**
     * Enter a new round.
     * @param round the round number
     * @param start the round start time
     */
    void BeginRound(uint32_t round, Time start);
    /// @return the current round
    uint32_t GetRound() const
    {
        return m_round;
    }
    /// @return the current round start time
    Time GetRoundStart() const
    {
        return m_roundStart;
    }
    /// @return the current time
    Time Now() const
    {
        return m_scheduler.Now();
    }
    /// @return the phase slot duration
    Time GetHopDelay() const
    {
        return m_hopDelay;
    }
    /// @return data packet size in bits
    uint32_t GetDataBits() const
    {
        return m_dataBits;
    }
    /// @return control packet size in bits
    uint32_t GetControlBits() const
    {
        return m_controlBits;
    }

    /**
     * @param slot phase slot index within the current round
     * @return absolute time of the slot
     */
    Time SlotTime(uint32_t slot) const;

    /**
     * Schedule an event in the current round at an absolute time.
     * @param time fire time
     * @param ev the event; its round is set to the current round
     * @return the event handle
     */
    EventHandle Schedule(Time time, Event ev);
    /**
     * Schedule an event one phase slot from now.
     * @param ev the event
     * @return the event handle
     */
    EventHandle ScheduleNextHop(const Event& ev);

    /**
     * Charge a node and record its death if the charge drained it.
     * @param node node id
     * @param cost energy in joules
     * @return true if the node could afford the action
     */
    bool Spend(uint32_t node, double cost);

    /// @return a new packet id, unique within the run
    uint64_t NextPacketId()
    {
        return m_nextPacketId++;
    }
    /**
     * Create a packet for a fresh reading.
     * @param source the sensing node
     * @return the packet, with one contribution and data size
     */
    SensorPacket NewReading(uint32_t source);

    /**
     * Record a delivery to the base station.
     * @param packet the packet as it arrived
     */
    void Delivered(const SensorPacket& packet);
    /**
     * Record a drop.  Packets that carry no reading are not recorded.
     * @param holder node holding the packet last
     * @param packet the packet
     * @param reason why it was dropped
     */
    void Dropped(uint32_t holder, const SensorPacket& packet, DropReason reason);
    /// @return the outcomes emitted since the last call, clearing them
    std::vector<Outcome> TakeOutcomes();

  private:
    EventScheduler& m_scheduler;
    Topology& m_topology;
    const EnergyModel& m_energy;
    Ptr<UniformRandomVariable> m_rng;
    Time m_hopDelay;
    uint32_t m_dataBits;
    uint32_t m_controlBits;
    uint32_t m_round;
    Time m_roundStart;
    uint64_t m_nextPacketId;
    std::vector<Outcome> m_pending;
};

} // namespace sensornet
} // namespace ns3

#endif /* SENSORNET_ENGINE_CONTEXT_H */
