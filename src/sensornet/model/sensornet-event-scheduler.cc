/*
 * Sensornet: energy-aware routing for wireless sensor networks
 *
 * SPDX-License-Identifier: GPL-2.0-only
 */
#include "sensornet-event-scheduler.h"

#include "ns3/abort.h"
#include "ns3/assert.h"
#include "ns3/event-impl.h"
#include "ns3/log.h"
#include "ns3/object.h"

namespace ns3
{

NS_LOG_COMPONENT_DEFINE("SensornetEventScheduler");

namespace sensornet
{

/**
 * Queue entry carrying an Event.  Entries are popped by the owning
 * EventScheduler and never invoked.
 */
class EventScheduler::QueuedEvent : public EventImpl
{
  public:
    explicit QueuedEvent(const Event& ev)
        : m_event(ev)
    {
    }

    const Event& Get() const
    {
        return m_event;
    }

  protected:
    void Notify() override
    {
        NS_FATAL_ERROR("Sensornet events are dispatched by their simulation, not invoked");
    }

  private:
    Event m_event;
};

EventScheduler::EventScheduler()
    : m_queue(CreateObject<MapScheduler>()),
      m_now(Time(0)),
      m_nextUid(1)
{
}

EventScheduler::~EventScheduler()
{
    Clear();
}

EventHandle
EventScheduler::Schedule(Time time, const Event& ev)
{
    NS_ABORT_MSG_IF(time < m_now,
                    "Event " << ev.type << " scheduled at " << time.As(Time::S)
                             << " before current time " << m_now.As(Time::S));
    Event stored = ev;
    stored.time = time;

    Scheduler::Event entry;
    entry.impl = new QueuedEvent(stored);
    entry.key.m_ts = static_cast<uint64_t>(time.GetTimeStep());
    entry.key.m_uid = m_nextUid++;
    entry.key.m_context = ev.target;
    m_queue->Insert(entry);
    m_pending.emplace(entry.key.m_uid, entry);

    NS_LOG_LOGIC("Scheduled " << ev.type << " origin=" << ev.origin << " target=" << ev.target
                              << " at " << time.As(Time::S) << " handle " << entry.key.m_uid);
    return entry.key.m_uid;
}

void
EventScheduler::Cancel(EventHandle handle)
{
    auto i = m_pending.find(handle);
    if (i == m_pending.end())
    {
        return;
    }
    m_queue->Remove(i->second);
    Release(handle);
}

bool
EventScheduler::IsPending(EventHandle handle) const
{
    return m_pending.find(handle) != m_pending.end();
}

Event
EventScheduler::Release(EventHandle handle)
{
    auto i = m_pending.find(handle);
    NS_ASSERT_MSG(i != m_pending.end(), "Event " << handle << " is not pending");
    auto impl = static_cast<QueuedEvent*>(i->second.impl);
    Event ev = impl->Get();
    m_pending.erase(i);
    impl->Unref();
    return ev;
}

std::optional<Event>
EventScheduler::PopNext()
{
    if (m_queue->IsEmpty())
    {
        return std::nullopt;
    }
    Scheduler::Event next = m_queue->RemoveNext();
    m_now = TimeStep(next.key.m_ts);
    return Release(next.key.m_uid);
}

void
EventScheduler::AdvanceTo(Time time)
{
    NS_ABORT_MSG_IF(time < m_now,
                    "Cannot move time backward to " << time.As(Time::S) << " from "
                                                    << m_now.As(Time::S));
    NS_ABORT_MSG_IF(!m_queue->IsEmpty() && PeekNextTime() < time,
                    "Advancing to " << time.As(Time::S) << " would skip a pending event at "
                                    << PeekNextTime().As(Time::S));
    m_now = time;
}

Time
EventScheduler::PeekNextTime() const
{
    NS_ABORT_MSG_IF(m_queue->IsEmpty(), "No pending event");
    return TimeStep(m_queue->PeekNext().key.m_ts);
}

void
EventScheduler::Clear()
{
    while (!m_queue->IsEmpty())
    {
        Scheduler::Event next = m_queue->RemoveNext();
        Release(next.key.m_uid);
    }
}

} // namespace sensornet
} // namespace ns3
