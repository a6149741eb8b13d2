#pragma once

#include <vector>

#include "gpu/area_rasterizer.h"
#include "gpu/clock_domain.h"
#include "gpu/command_fifo.h"
#include "gpu/cost_model.h"
#include "gpu/primitive.h"
#include "gpu/texture_cache.h"
#include "gpu/timing_config.h"
#include "serialization/serializer.h"
#include "shared/log.h"
#include "shared/scheduler.h"
#include "shared/types.h"

namespace pacer::gpu {

enum class BlankPhase
{
  Active,
  HBlank,
  VBlank,
};

const char *blank_phase_name(BlankPhase phase);

/*!
 * @brief Where the beam is. cycle_in_frame counts from VBlank start, so the
 *        first kVBlankScanlines scanlines of every frame are the VBlank window.
 */
struct FrameState {
  cycles_t cycle_in_frame = 0;
  u32 scanline_index = 0;
  BlankPhase blank_phase = BlankPhase::VBlank;
  ClockStandard clock_standard = ClockStandard::NTSC;
};

/*!
 * @brief Where the cycles of one frame went. Rasterizer and transfer busy time
 *        overlap freely; each is at most the frame length.
 */
struct FrameStats {
  u64 frame_index = 0;
  cycles_t rasterizer_busy_cycles = 0;
  cycles_t transfer_busy_cycles = 0;
  cycles_t stall_cycles = 0;
  u32 commands_completed = 0;
  u32 transfers_completed = 0;

  /*! @brief Fraction of the frame the rasterizer was busy, 0..1. */
  f64 utilization(cycles_t frame_cycles) const
  {
    return frame_cycles ? f64(rasterizer_busy_cycles) / f64(frame_cycles) : 0.0;
  }
};

struct SubmitResult {
  u32 base_cycles = 0;
  f64 cycles_per_pixel = 0.0;
  u64 pixel_area = 0;
  cycles_t total_cycles = 0;

  /*! Completion time relative to the start of the current frame. May lie past
   *  the end of the frame. */
  cycles_t completes_at_cycle = 0;

  /*! Cycles the issuer was held back waiting for a FIFO slot. */
  cycles_t stall_cycles = 0;
};

/*!
 * @brief Top-level timing engine. Owns virtual GPU time, the command FIFO, the
 *        background transfer channel and the texture cache state, and keeps
 *        track of where in the frame the beam is.
 *
 * Driven cooperatively from a single thread: the host submits commands and
 * advances time, and the tracker reports which commands have finished.
 */
class FrameBudgetTracker : public serialization::Serializer {
public:
  explicit FrameBudgetTracker(const TimingConfig &config = TimingConfig());
  ~FrameBudgetTracker();

  FrameBudgetTracker(const FrameBudgetTracker &) = delete;
  FrameBudgetTracker &operator=(const FrameBudgetTracker &) = delete;

  /*!
   * @brief Validate, cost and queue a command on the rasterizer.
   *
   * Throws InvalidGeometry, UnsupportedKind or UnsupportedBlendMode without
   * changing any state. With a full FIFO, either stalls until the head slot
   * drains or throws FifoFull, depending on TimingConfig::fifo_block_on_full.
   */
  SubmitResult submit(const PrimitiveDescriptor &descriptor);

  /*!
   * @brief Queue a VRAM transfer on the background channel. It runs alongside
   *        the rasterizer and never takes a FIFO slot. Throws UnsupportedKind
   *        for anything that is not a transfer.
   */
  SubmitResult submit_transfer(const PrimitiveDescriptor &descriptor);

  /*!
   * @brief Move time forward by n cycles and return every command that
   *        completed since the last call, in completion order. Throws
   *        std::overflow_error, leaving time untouched, if the cycle counter
   *        cannot hold now() + n.
   */
  std::vector<PrimitiveDescriptor> advance_cycles(cycles_t n);

  /*!
   * @brief Skip ahead to the start of the next VBlank. Returns the number of
   *        cycles skipped, which is never zero. Completions that occur along
   *        the way are returned by the next advance_cycles() or take_completed().
   */
  cycles_t wait_for_vblank();

  /*! @brief Hand over pending completions without advancing time. */
  std::vector<PrimitiveDescriptor> take_completed();

  void clear_texture_cache();

  /*!
   * @brief Drop everything in the command FIFO, including the command on the
   *        rasterizer, and return the dropped descriptors oldest first. The
   *        transfer channel and pending completions are untouched; the next
   *        submit starts at now().
   */
  std::vector<PrimitiveDescriptor> reset_command_buffer();

  u32 occupancy() const
  {
    return m_fifo.occupancy();
  }

  u32 transfer_backlog() const
  {
    return m_transfers.occupancy();
  }

  /*! @brief Rasterizer cycles still queued past the current time. */
  cycles_t pending_rasterizer_cycles() const;

  /*! @brief True when queued rasterizer work runs past the end of this frame. */
  bool is_over_budget() const;

  cycles_t now() const
  {
    return m_now;
  }

  u64 vblank_count() const
  {
    return m_vblank_count;
  }

  const FrameState &frame_state() const
  {
    return m_state;
  }

  const FrameStats &current_frame_stats() const
  {
    return m_current_stats;
  }

  const FrameStats &last_frame_stats() const
  {
    return m_last_stats;
  }

  const ClockDomain &clock() const
  {
    return m_clock;
  }

  const TimingConfig &config() const
  {
    return m_config;
  }

  const TextureCacheTracker &texture_cache() const
  {
    return m_texture_cache;
  }

  const CommandFIFO &fifo() const
  {
    return m_fifo;
  }

  void serialize(Json::Value &snapshot) const final;
  void deserialize(const Json::Value &snapshot) final;

private:
  static Log::Logger<Log::LogModule::FRAME> log;

  const TimingConfig m_config;
  const ClockDomain m_clock;
  const AreaRasterizer m_rasterizer {};
  const CostModel m_cost_model {};
  TextureCacheTracker m_texture_cache;
  CommandFIFO m_fifo;
  CommandFIFO m_transfers;

  /* Declared before the events so the events are destroyed first. */
  EventScheduler m_scheduler;
  EventScheduler::Event m_fifo_drain;
  EventScheduler::Event m_transfer_drain;
  EventScheduler::Event m_vblank;

  cycles_t m_now = 0;
  cycles_t m_frame_start = 0;
  u64 m_vblank_count = 0;
  bool m_stalling = false;

  FrameState m_state;
  FrameStats m_current_stats;
  FrameStats m_last_stats;

  std::vector<PrimitiveDescriptor> m_completed;

  u64 prepare(const PrimitiveDescriptor &descriptor) const;
  SubmitResult make_result(const FifoSlot &slot, cycles_t stall_cycles) const;

  void advance_to(cycles_t target);
  void step_to(cycles_t timestamp);
  void update_frame_state();

  void on_fifo_drain();
  void on_transfer_drain();
  void on_vblank();
  void arm_drain(const CommandFIFO &queue, EventScheduler::Event &event);
};

}
