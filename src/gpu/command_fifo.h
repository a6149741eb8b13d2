#pragma once

#include <deque>
#include <vector>

#include "gpu/cost_model.h"
#include "gpu/primitive.h"
#include "shared/log.h"
#include "shared/types.h"

namespace pacer::gpu {

enum class SlotState
{
  Queued,   /*!< Waiting behind the head */
  Draining, /*!< At the head, occupying the rasterizer */
};

/*!
 * @brief One occupied FIFO entry. All times are absolute engine cycles.
 */
struct FifoSlot {
  u64 sequence = 0;
  PrimitiveDescriptor descriptor;
  CostEntry cost;
  u64 pixel_area = 0;
  cycles_t issued_at_cycle = 0;
  cycles_t started_at_cycle = 0;
  cycles_t completes_at_cycle = 0;
  SlotState state = SlotState::Queued;

  cycles_t duration() const
  {
    return completes_at_cycle - started_at_cycle;
  }
};

/*!
 * @brief The GPU's command buffer. Strictly ordered: the head drains on the
 *        rasterizer while the rest wait, and a slot's completion time is known
 *        as soon as it is queued.
 *
 * The background transfer channel is a second, unbounded instance: it drains in
 * order too, but in parallel with the rasterizer.
 */
class CommandFIFO {
public:
  static constexpr u32 kCapacity = 12;
  static constexpr u32 kUnbounded = UINT32_MAX;

  explicit CommandFIFO(u32 capacity = kCapacity, const char *name = "command FIFO");

  /*!
   * @brief Queue a costed command issued at time `now`. It starts draining when
   *        everything ahead of it has completed. Throws FifoFull when all slots
   *        are occupied.
   */
  const FifoSlot &enqueue(const PrimitiveDescriptor &descriptor,
                          const CostEntry &cost,
                          u64 pixel_area,
                          cycles_t now);

  /*!
   * @brief Free every slot that has completed by `now`, oldest first.
   */
  std::vector<FifoSlot> retire(cycles_t now);

  /*!
   * @brief Drop every slot, including the one draining, and hand them back
   *        oldest first. The sequence counter keeps counting.
   */
  std::vector<FifoSlot> clear();

  /*!
   * @brief Replace the contents with previously saved slots (save states).
   */
  void restore(std::vector<FifoSlot> slots, u64 next_sequence);

  u32 occupancy() const
  {
    return u32(m_slots.size());
  }

  bool empty() const
  {
    return m_slots.empty();
  }

  bool is_full() const
  {
    return m_slots.size() >= m_capacity;
  }

  u32 capacity() const
  {
    return m_capacity;
  }

  /*! @brief The draining slot, or nullptr when idle. */
  const FifoSlot *head() const;

  /*! @brief Time the last queued slot completes, or 0 when empty. */
  cycles_t busy_until() const;

  const std::deque<FifoSlot> &slots() const
  {
    return m_slots;
  }

  u64 next_sequence() const
  {
    return m_next_sequence;
  }

private:
  static Log::Logger<Log::LogModule::FIFO> log;

  const u32 m_capacity;
  const char *const m_name;
  std::deque<FifoSlot> m_slots;
  u64 m_next_sequence = 0;
};

}
