/*
 * Sensornet: energy-aware routing for wireless sensor networks
 *
 * SPDX-License-Identifier: GPL-2.0-only
 */
#ifndef SENSORNET_EVENT_SCHEDULER_H
#define SENSORNET_EVENT_SCHEDULER_H

#include "sensornet-packet.h"

#include "ns3/map-scheduler.h"
#include "ns3/nstime.h"
#include "ns3/ptr.h"
#include "ns3/scheduler.h"

#include <cstdint>
#include <optional>
#include <unordered_map>

namespace ns3
{
namespace sensornet
{

/**
 * @ingroup sensornet
 * @brief A scheduled action.
 *
 * @c tag is interpreted by the owning engine: interest sequence number,
 * query region index, chain direction, frame number.
 */
struct Event
{
    Time time;           ///< Fire time, set by the scheduler
    MessageType type;    ///< What happens
    uint32_t origin;     ///< Node that caused the event
    uint32_t target;     ///< Receiving node, or NO_NODE
    uint32_t round;      ///< Round the event belongs to
    uint32_t tag;        ///< Engine-specific discriminator
    SensorPacket packet; ///< Payload, if any

    Event()
        : time(Time(0)),
          type(SENSORNET_ROUND_START),
          origin(NO_NODE),
          target(NO_NODE),
          round(0),
          tag(0)
    {
    }

    /**
     * Constructor
     * @param type the event type
     * @param origin causing node
     * @param target receiving node
     */
    Event(MessageType type, uint32_t origin, uint32_t target)
        : time(Time(0)),
          type(type),
          origin(origin),
          target(target),
          round(0),
          tag(0)
    {
    }
};

/// Handle of a scheduled event
typedef uint32_t EventHandle;

/**
 * @ingroup sensornet
 * @brief Deterministic time-ordered event queue.
 *
 * Events fire in timestamp order; events with equal timestamps fire in
 * insertion order.  Time never moves backward.  Each instance owns its own
 * ns3::MapScheduler rather than the global Simulator queue, so concurrent
 * runs never share state.
 */
class EventScheduler
{
  public:
    EventScheduler();
    ~EventScheduler();

    EventScheduler(const EventScheduler&) = delete;
    EventScheduler& operator=(const EventScheduler&) = delete;

    /**
     * Schedule an event.  Scheduling in the past is a logic error.
     * @param time absolute fire time, not earlier than Now()
     * @param ev the event
     * @return a handle usable with Cancel()
     */
    EventHandle Schedule(Time time, const Event& ev);
    /**
     * Remove a pending event.  Cancelling an event that already fired or was
     * already cancelled has no effect.
     * @param handle the event handle
     */
    void Cancel(EventHandle handle);
    /**
     * @param handle the event handle
     * @return true if the event is still pending
     */
    bool IsPending(EventHandle handle) const;
    /**
     * Remove the earliest event and move the clock to its time.
     * @return the event, or nothing if the queue is empty
     */
    std::optional<Event> PopNext();
    /**
     * Move the clock forward without firing anything.  Skipping over a
     * pending event, or moving backward, is a logic error.
     * @param time the new time
     */
    void AdvanceTo(Time time);
    /// @return the current time
    Time Now() const
    {
        return m_now;
    }
    /// @return true if no event is pending
    bool IsEmpty() const
    {
        return m_queue->IsEmpty();
    }
    /// @return number of pending events
    uint32_t GetNPending() const
    {
        return m_pending.size();
    }
    /// @return time of the earliest pending event; the queue must not be empty
    Time PeekNextTime() const;
    /// Drop all pending events, keeping the clock
    void Clear();

  private:
    class QueuedEvent;

    /**
     * Detach the queue entry of a pending event and release it.
     * @param handle the event handle
     * @return the stored event
     */
    Event Release(EventHandle handle);

    Ptr<MapScheduler> m_queue; //!< Time-ordered queue of this run
    /// Queue entries of pending events, by handle
    std::unordered_map<EventHandle, Scheduler::Event> m_pending;
    Time m_now;
    uint32_t m_nextUid;
};

} // namespace sensornet
} // namespace ns3

#endif /* SENSORNET_EVENT_SCHEDULER_H */
