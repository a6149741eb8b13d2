#include "shared/scheduler.h"

EventScheduler::EventScheduler() : m_next_timestamp(NO_CYCLE), m_next_sequence(0)
{
  return;
}

EventScheduler::~EventScheduler()
{
  clear();
}

void
EventScheduler::clear()
{
  while (!empty()) {
    m_queue.top()->on_cancelled(this);
    m_queue.pop();
  }
  m_next_timestamp = NO_CYCLE;
}

void
EventScheduler::run_until(const cycles_t timestamp)
{
  while (!empty() && m_queue.top()->timestamp() <= timestamp) {
    auto e = m_queue.top();
    m_queue.pop();
    update_next_timestamp();
    e->run();
  }

  update_next_timestamp();
}

void
EventScheduler::on_scheduled(Event *const event)
{
  event->m_sequence = m_next_sequence++;
  m_queue.emplace(event);
  update_next_timestamp();
}

void
EventScheduler::cancel_event(Event *const event)
{
  /* The standard priority queue interface doesn't provide an interface for
   * directly removing elements. Transfer all but the removed element to a new
   * queue. */
  decltype(m_queue) old_queue = std::move(m_queue);
  m_queue                     = decltype(m_queue)();

  while (!old_queue.empty()) {
    if (old_queue.top() != event) {
      m_queue.emplace(old_queue.top());
    }

    old_queue.pop();
  }

  update_next_timestamp();
  event->on_cancelled(this);
}

void
EventScheduler::update_next_timestamp()
{
  if (!m_queue.empty()) {
    m_next_timestamp = m_queue.top()->timestamp();
  } else {
    m_next_timestamp = NO_CYCLE;
  }
}
