/*
 * Sensornet: energy-aware routing for wireless sensor networks
 *
 * SPDX-License-Identifier: GPL-2.0-only
 */
#include "sensornet-engine-context.h"

#include "ns3/log.h"

namespace ns3
{

NS_LOG_COMPONENT_DEFINE("SensornetEngineContext");

namespace sensornet
{

EngineContext::EngineContext(EventScheduler& scheduler,
                             Topology& topology,
                             const EnergyModel& energy,
                             Ptr<UniformRandomVariable> rng,
                             Time hopDelay,
                             uint32_t dataBits,
                             uint32_t controlBits)
    : m_scheduler(scheduler),
      m_topology(topology),
      m_energy(energy),
      m_rng(rng),
      m_hopDelay(hopDelay),
      m_dataBits(dataBits),
      m_controlBits(controlBits),
      m_round(0),
      m_roundStart(Time(0)),
      m_nextPacketId(1)
{
}

void
EngineContext::BeginRound(uint32_t round, Time start)
{
    m_round = round;
    m_roundStart = start;
}

Time
EngineContext::SlotTime(uint32_t slot) const
{
    return m_roundStart + m_hopDelay * slot;
}

EventHandle
EngineContext::Schedule(Time time, Event ev)
{
    ev.round = m_round;
    return m_scheduler.Schedule(time, ev);
}

EventHandle
EngineContext::ScheduleNextHop(const Event& ev)
{
    return Schedule(Now() + m_hopDelay, ev);
}

bool
EngineContext::Spend(uint32_t node, double cost)
{
    EnergyResult r = m_energy.Apply(m_topology.GetNode(node), cost);
    if (r.died)
    {
        NS_LOG_DEBUG("Node " << node << " died in round " << m_round << " at "
                             << Now().As(Time::S));
        m_topology.MarkDead(node);
        m_pending.push_back(Outcome::NodeDied(Now(), m_round, node));
    }
    return r.completed;
}

SensorPacket
EngineContext::NewReading(uint32_t source)
{
    SensorPacket p;
    p.id = NextPacketId();
    p.source = source;
    p.sender = source;
    p.bits = m_dataBits;
    p.hops = 0;
    p.contributions = 1;
    p.created = Now();
    return p;
}

void
EngineContext::Delivered(const SensorPacket& packet)
{
    NS_LOG_LOGIC("Delivered " << packet);
    m_pending.push_back(Outcome::PacketDelivered(Now(), m_round, packet));
}

void
EngineContext::Dropped(uint32_t holder, const SensorPacket& packet, DropReason reason)
{
    if (packet.contributions == 0)
    {
        return;
    }
    NS_LOG_LOGIC("Dropped " << packet << " at " << holder << ": " << reason);
    m_pending.push_back(Outcome::PacketDropped(Now(), m_round, holder, packet, reason));
}

std::vector<Outcome>
EngineContext::TakeOutcomes()
{
    std::vector<Outcome> out;
    out.swap(m_pending);
    return out;
}

} // namespace sensornet
} // namespace ns3
