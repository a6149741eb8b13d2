#pragma once

#include <functional>
#include <vector>
#include <queue>
#include <cassert>
#include <string>

#include "shared/types.h"

/*!
 * @class EventScheduler
 * @brief Handles scheduling work to run at a fixed point on the GPU cycle
 *        timeline. Time itself is kept by the owner, which calls run_until()
 *        as it moves forward.
 *
 * Work is scheduled by adding an Event to the scheduler with an absolute
 * timestamp. An Event must finish executing or be cancelled before it can be
 * scheduled to run again.
 *
 * Events due at the same timestamp run in the order they were scheduled, so a
 * given sequence of calls always produces the same sequence of callbacks.
 *
 * This implementation is not thread safe.
 */
class EventScheduler {
public:
  /*!
   * @class EventScheduler::Event
   * @brief Class representing a single event that can be scheduled to run in
   *        the EventScheduler.
   */
  class Event {
  public:
    Event(const std::string &name,
          std::function<void()> callback,
          EventScheduler *const scheduler)
      : m_name(name),
        m_callback(callback),
        m_scheduler(scheduler),
        m_timestamp(NO_CYCLE),
        m_sequence(0)
    {
      return;
    }

    ~Event()
    {
      cancel();
    }

    Event(const Event &) = delete;
    Event &operator=(const Event &) = delete;

    /*!
     * @brief Return the name assigned to this event. Useful for debugging.
     */
    const std::string &name() const
    {
      return m_name;
    }

    /*!
     * @brief Schedule this Event for execution at the indicated time. The Event
     *        must not be currently scheduled.
     */
    void schedule(const cycles_t timestamp)
    {
      assert(m_timestamp == NO_CYCLE);
      m_timestamp = timestamp;
      m_scheduler->on_scheduled(this);
    }

    /*!
     * @brief Cancel execution of the event. No-op if the event is not currently
     *        scheduled.
     */
    void cancel()
    {
      if (m_timestamp != NO_CYCLE) {
        m_scheduler->cancel_event(this);
        m_timestamp = NO_CYCLE;
      }
    }

    /*!
     * @brief Move a scheduled (or idle) event to a new timestamp.
     */
    void reschedule(const cycles_t timestamp)
    {
      cancel();
      schedule(timestamp);
    }

    bool is_scheduled() const
    {
      return m_timestamp != NO_CYCLE;
    }

    /*!
     * @brief Return the time that the Event is currently scheduled to run. If
     *        not currently scheduled returns NO_CYCLE.
     */
    cycles_t timestamp() const
    {
      return m_timestamp;
    }

    /*!
     * @brief Scheduling order stamp, used to break ties between events due at
     *        the same timestamp.
     */
    u64 sequence() const
    {
      return m_sequence;
    }

  private:
    const std::string m_name;
    const std::function<void()> m_callback;
    EventScheduler *const m_scheduler;
    cycles_t m_timestamp;
    u64 m_sequence;

    /*!
     * @brief Execute the event. Should only be called by EventScheduler.
     */
    void run()
    {
      /* Update schedule state before running callback to allow the callback
       * to reschedule itself. */
      assert(m_timestamp != NO_CYCLE);
      m_timestamp = NO_CYCLE;

      m_callback();
    }

    void on_cancelled(EventScheduler *const scheduler)
    {
      assert(m_scheduler == scheduler);
      m_timestamp = NO_CYCLE;
    }

    friend EventScheduler;
  };

  EventScheduler();
  ~EventScheduler();

  EventScheduler(const EventScheduler &) = delete;
  EventScheduler &operator=(const EventScheduler &) = delete;

  /*!
   * @brief Returns true if there are currently no events scheduled.
   */
  bool empty() const
  {
    return m_queue.empty();
  }

  /*!
   * @brief Returns the timestamp of when the next event should run. If there
   *        are no events currently queued returns NO_CYCLE.
   */
  cycles_t next_timestamp() const
  {
    return m_next_timestamp;
  }

  /*!
   * @brief Run scheduled events until the specified timestamp (inclusive).
   */
  void run_until(cycles_t timestamp);

  /*!
   * @brief Handle an Event request to schedule itself.
   */
  void on_scheduled(Event *event);

  /*!
   * @brief Cancel a previously scheduled event.
   */
  void cancel_event(Event *event);

  void clear();

private:
  /*!
   * @brief Orders Event pointers by timestamp, then by scheduling order.
   */
  class EventCompare final {
  public:
    bool operator()(const Event *const a, const Event *const b) const
    {
      assert(a->timestamp() != NO_CYCLE);
      assert(b->timestamp() != NO_CYCLE);

      if (a->timestamp() != b->timestamp()) {
        return a->timestamp() > b->timestamp();
      }
      return a->sequence() > b->sequence();
    }
  };

  std::priority_queue<Event *, std::vector<Event *>, EventCompare> m_queue;

  /*!
   * @brief The timestamp of the next scheduled event or NO_CYCLE if there
   *        are no current events.
   */
  cycles_t m_next_timestamp;

  /*! @brief Stamped onto each event as it is scheduled. */
  u64 m_next_sequence;

  void update_next_timestamp();
};
