#include <algorithm>
#include <iterator>

#include <fmt/core.h>

#include "gpu/command_fifo.h"
#include "gpu/timing_errors.h"
#include "shared/error.h"

namespace pacer::gpu {

Log::Logger<Log::LogModule::FIFO> CommandFIFO::log;

CommandFIFO::CommandFIFO(const u32 capacity, const char *const name)
  : m_capacity(capacity),
    m_name(name)
{
  return;
}

const FifoSlot &
CommandFIFO::enqueue(const PrimitiveDescriptor &descriptor,
                     const CostEntry &cost,
                     const u64 pixel_area,
                     const cycles_t now)
{
  if (is_full()) {
    const cycles_t head_done = m_slots.front().completes_at_cycle;
    throw FifoFull(fmt::format("{} is full ({} slots), head frees at cycle {}",
                               m_name,
                               m_capacity,
                               head_done),
                   occupancy(),
                   head_done > now ? head_done - now : 0);
  }

  FifoSlot slot;
  slot.sequence = m_next_sequence++;
  slot.descriptor = descriptor;
  slot.cost = cost;
  slot.pixel_area = pixel_area;
  slot.issued_at_cycle = now;
  slot.started_at_cycle = std::max(now, busy_until());
  slot.completes_at_cycle = slot.started_at_cycle + cost.total_cycles(pixel_area);
  slot.state = m_slots.empty() ? SlotState::Draining : SlotState::Queued;

  m_slots.push_back(std::move(slot));
  _check(m_slots.size() <= m_capacity, "FIFO overflow");

  const FifoSlot &queued = m_slots.back();
  log.verbose("%s: queued #%llu %s, completes at %llu (%u/%u)",
              m_name,
              (unsigned long long)queued.sequence,
              kind_name(queued.descriptor.kind),
              (unsigned long long)queued.completes_at_cycle,
              occupancy(),
              m_capacity);
  return queued;
}

std::vector<FifoSlot>
CommandFIFO::retire(const cycles_t now)
{
  std::vector<FifoSlot> retired;
  while (!m_slots.empty() && m_slots.front().completes_at_cycle <= now) {
    retired.push_back(std::move(m_slots.front()));
    m_slots.pop_front();
  }

  if (!m_slots.empty()) {
    m_slots.front().state = SlotState::Draining;
  }

  if (!retired.empty()) {
    log.verbose("%s: retired %zu slot(s) at %llu, %u remaining",
                m_name,
                retired.size(),
                (unsigned long long)now,
                occupancy());
  }
  return retired;
}

std::vector<FifoSlot>
CommandFIFO::clear()
{
  std::vector<FifoSlot> dropped(std::make_move_iterator(m_slots.begin()),
                                std::make_move_iterator(m_slots.end()));
  m_slots.clear();

  log.debug("%s: cleared, %zu slot(s) dropped", m_name, dropped.size());
  return dropped;
}

void
CommandFIFO::restore(std::vector<FifoSlot> slots, const u64 next_sequence)
{
  if (slots.size() > m_capacity) {
    throw std::runtime_error(fmt::format(
      "saved {} holds {} slots, capacity is {}", m_name, slots.size(), m_capacity));
  }

  m_slots.clear();
  for (FifoSlot &slot : slots) {
    slot.state = m_slots.empty() ? SlotState::Draining : SlotState::Queued;
    m_slots.push_back(std::move(slot));
  }
  m_next_sequence = next_sequence;
}

const FifoSlot *
CommandFIFO::head() const
{
  return m_slots.empty() ? nullptr : &m_slots.front();
}

cycles_t
CommandFIFO::busy_until() const
{
  return m_slots.empty() ? 0 : m_slots.back().completes_at_cycle;
}

}
