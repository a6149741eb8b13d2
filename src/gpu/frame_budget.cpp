#include <limits>
#include <stdexcept>

#include <fmt/core.h>

#include "gpu/descriptor_json.h"
#include "gpu/frame_budget.h"
#include "gpu/timing_errors.h"
#include "shared/error.h"

namespace pacer::gpu {

Log::Logger<Log::LogModule::FRAME> FrameBudgetTracker::log;

const char *
blank_phase_name(const BlankPhase phase)
{
  switch (phase) {
    case BlankPhase::Active:
      return "active";
    case BlankPhase::HBlank:
      return "hblank";
    case BlankPhase::VBlank:
      return "vblank";
  }
  return "unknown";
}

FrameBudgetTracker::FrameBudgetTracker(const TimingConfig &config)
  : m_config(config),
    m_clock(config.clock_standard),
    m_texture_cache(config.cache_miss_policy),
    m_fifo(CommandFIFO::kCapacity, "command FIFO"),
    m_transfers(CommandFIFO::kUnbounded, "transfer channel"),
    m_fifo_drain("gpu.fifo.drain",
                 std::bind(&FrameBudgetTracker::on_fifo_drain, this),
                 &m_scheduler),
    m_transfer_drain("gpu.transfer.drain",
                     std::bind(&FrameBudgetTracker::on_transfer_drain, this),
                     &m_scheduler),
    m_vblank("gpu.vblank", std::bind(&FrameBudgetTracker::on_vblank, this), &m_scheduler)
{
  m_state.clock_standard = m_clock.standard();
  update_frame_state();
  m_vblank.schedule(m_clock.frame_cycles());

  log.info("Timing engine up: %s, %llu cycles per frame",
           m_config.describe().c_str(),
           (unsigned long long)m_clock.frame_cycles());
}

FrameBudgetTracker::~FrameBudgetTracker()
{
  m_fifo_drain.cancel();
  m_transfer_drain.cancel();
  m_vblank.cancel();
}

u64
FrameBudgetTracker::prepare(const PrimitiveDescriptor &descriptor) const
{
  m_cost_model.check(descriptor);
  return m_rasterizer.pixel_area(descriptor);
}

SubmitResult
FrameBudgetTracker::make_result(const FifoSlot &slot, const cycles_t stall_cycles) const
{
  return SubmitResult {
    .base_cycles = slot.cost.base_cycles,
    .cycles_per_pixel = slot.cost.cycles_per_pixel,
    .pixel_area = slot.pixel_area,
    .total_cycles = slot.duration(),
    .completes_at_cycle = slot.completes_at_cycle - m_frame_start,
    .stall_cycles = stall_cycles,
  };
}

SubmitResult
FrameBudgetTracker::submit(const PrimitiveDescriptor &descriptor)
{
  const u64 area = prepare(descriptor);

  cycles_t stall_cycles = 0;
  if (m_fifo.is_full()) {
    const cycles_t head_done = m_fifo.head()->completes_at_cycle;
    if (!m_config.fifo_block_on_full) {
      log.debug("Rejecting %s, FIFO full until %llu",
                kind_name(descriptor.kind),
                (unsigned long long)head_done);
      throw FifoFull(fmt::format("command FIFO is full ({} slots), head frees in {} cycles",
                                 m_fifo.capacity(),
                                 head_done - m_now),
                     m_fifo.occupancy(),
                     head_done - m_now);
    }

    const cycles_t stall_start = m_now;
    m_stalling = true;
    while (m_fifo.is_full()) {
      advance_to(m_fifo.head()->completes_at_cycle);
    }
    m_stalling = false;
    stall_cycles = m_now - stall_start;

    log.debug("Issuer stalled %llu cycles on a full FIFO", (unsigned long long)stall_cycles);
  }

  const CacheResult cache = m_texture_cache.resolve(descriptor);
  const CostEntry cost = m_cost_model.estimate(descriptor, area, cache);

  const bool was_idle = m_fifo.empty();
  const FifoSlot &slot = m_fifo.enqueue(descriptor, cost, area, m_now);
  const SubmitResult result = make_result(slot, stall_cycles);
  if (was_idle) {
    arm_drain(m_fifo, m_fifo_drain);
  }

  if (is_over_budget()) {
    log.debug("Frame %llu over budget: FIFO busy until %llu",
              (unsigned long long)m_current_stats.frame_index,
              (unsigned long long)(m_fifo.busy_until() - m_frame_start));
  }
  return result;
}

SubmitResult
FrameBudgetTracker::submit_transfer(const PrimitiveDescriptor &descriptor)
{
  if (!is_transfer(descriptor.kind)) {
    throw UnsupportedKind(
      fmt::format("{} cannot run on the transfer channel", kind_name(descriptor.kind)));
  }

  const u64 area = prepare(descriptor);
  const CostEntry cost = m_cost_model.estimate(descriptor, area, CacheResult {});

  const bool was_idle = m_transfers.empty();
  const FifoSlot &slot = m_transfers.enqueue(descriptor, cost, area, m_now);
  const SubmitResult result = make_result(slot, 0);
  if (was_idle) {
    arm_drain(m_transfers, m_transfer_drain);
  }
  return result;
}

std::vector<PrimitiveDescriptor>
FrameBudgetTracker::advance_cycles(const cycles_t n)
{
  if (n > std::numeric_limits<cycles_t>::max() - m_now) {
    throw std::overflow_error(
      fmt::format("advancing {} cycles from cycle {} overflows the cycle counter", n, m_now));
  }
  advance_to(m_now + n);
  return take_completed();
}

cycles_t
FrameBudgetTracker::wait_for_vblank()
{
  const cycles_t skipped = m_clock.frame_cycles() - m_state.cycle_in_frame;
  advance_to(m_now + skipped);
  return skipped;
}

std::vector<PrimitiveDescriptor>
FrameBudgetTracker::take_completed()
{
  std::vector<PrimitiveDescriptor> completed;
  completed.swap(m_completed);
  return completed;
}

void
FrameBudgetTracker::clear_texture_cache()
{
  m_texture_cache.invalidate();
}

std::vector<PrimitiveDescriptor>
FrameBudgetTracker::reset_command_buffer()
{
  std::vector<PrimitiveDescriptor> dropped;
  for (FifoSlot &slot : m_fifo.clear()) {
    dropped.push_back(std::move(slot.descriptor));
  }
  m_fifo_drain.cancel();

  if (!dropped.empty()) {
    log.info("Command buffer reset at cycle %llu, %zu command(s) dropped",
             (unsigned long long)(m_now - m_frame_start),
             dropped.size());
  }
  return dropped;
}

cycles_t
FrameBudgetTracker::pending_rasterizer_cycles() const
{
  const cycles_t busy_until = m_fifo.busy_until();
  return busy_until > m_now ? busy_until - m_now : 0;
}

bool
FrameBudgetTracker::is_over_budget() const
{
  return m_fifo.busy_until() > m_frame_start + m_clock.frame_cycles();
}

void
FrameBudgetTracker::advance_to(const cycles_t target)
{
  /* Events due exactly at the target run before returning, so a command that
   * completes at the target is reported by this call. The beam position is
   * only meaningful once the frame boundary event at a timestamp has run. */
  while (m_scheduler.next_timestamp() <= target) {
    step_to(m_scheduler.next_timestamp());
    m_scheduler.run_until(m_now);
  }
  step_to(target);
  update_frame_state();
}

void
FrameBudgetTracker::step_to(const cycles_t timestamp)
{
  _check(timestamp >= m_now, "time moved backwards");
  const cycles_t elapsed = timestamp - m_now;

  if (!m_fifo.empty()) {
    m_current_stats.rasterizer_busy_cycles += elapsed;
  }
  if (!m_transfers.empty()) {
    m_current_stats.transfer_busy_cycles += elapsed;
  }
  if (m_stalling) {
    m_current_stats.stall_cycles += elapsed;
  }

  m_now = timestamp;
}

void
FrameBudgetTracker::update_frame_state()
{
  const cycles_t cycle_in_frame = m_now - m_frame_start;
  _check(cycle_in_frame < m_clock.frame_cycles(), "frame boundary was missed");

  m_state.cycle_in_frame = cycle_in_frame;
  m_state.scanline_index = u32(cycle_in_frame / ClockDomain::kCyclesPerScanline);

  const cycles_t cycle_in_line = cycle_in_frame % ClockDomain::kCyclesPerScanline;
  if (m_state.scanline_index < ClockDomain::kVBlankScanlines) {
    m_state.blank_phase = BlankPhase::VBlank;
  } else if (cycle_in_line >=
             ClockDomain::kCyclesPerScanline - ClockDomain::kHBlankCycles) {
    m_state.blank_phase = BlankPhase::HBlank;
  } else {
    m_state.blank_phase = BlankPhase::Active;
  }
}

void
FrameBudgetTracker::arm_drain(const CommandFIFO &queue, EventScheduler::Event &event)
{
  if (queue.empty()) {
    event.cancel();
  } else {
    event.reschedule(queue.head()->completes_at_cycle);
  }
}

void
FrameBudgetTracker::on_fifo_drain()
{
  for (FifoSlot &slot : m_fifo.retire(m_now)) {
    m_completed.push_back(std::move(slot.descriptor));
    ++m_current_stats.commands_completed;
  }
  arm_drain(m_fifo, m_fifo_drain);
}

void
FrameBudgetTracker::on_transfer_drain()
{
  for (FifoSlot &slot : m_transfers.retire(m_now)) {
    m_completed.push_back(std::move(slot.descriptor));
    ++m_current_stats.transfers_completed;
  }
  arm_drain(m_transfers, m_transfer_drain);
}

void
FrameBudgetTracker::on_vblank()
{
  const cycles_t frame_cycles = m_clock.frame_cycles();
  log.debug("Frame %llu done: rasterizer %.1f%%, %u commands, %llu stall cycles",
            (unsigned long long)m_current_stats.frame_index,
            m_current_stats.utilization(frame_cycles) * 100.0,
            m_current_stats.commands_completed,
            (unsigned long long)m_current_stats.stall_cycles);

  m_last_stats = m_current_stats;
  m_current_stats = FrameStats { .frame_index = m_last_stats.frame_index + 1 };

  m_frame_start = m_now;
  ++m_vblank_count;
  update_frame_state();

  m_vblank.schedule(m_frame_start + frame_cycles);
}

static Json::Value
cycles_to_json(const cycles_t cycles)
{
  return Json::Value(Json::UInt64(cycles));
}

static Json::Value
stats_to_json(const FrameStats &stats)
{
  Json::Value out(Json::objectValue);
  out["frame_index"] = cycles_to_json(stats.frame_index);
  out["rasterizer_busy_cycles"] = cycles_to_json(stats.rasterizer_busy_cycles);
  out["transfer_busy_cycles"] = cycles_to_json(stats.transfer_busy_cycles);
  out["stall_cycles"] = cycles_to_json(stats.stall_cycles);
  out["commands_completed"] = stats.commands_completed;
  out["transfers_completed"] = stats.transfers_completed;
  return out;
}

static FrameStats
stats_from_json(const Json::Value &value)
{
  FrameStats stats;
  stats.frame_index = value["frame_index"].asUInt64();
  stats.rasterizer_busy_cycles = value["rasterizer_busy_cycles"].asUInt64();
  stats.transfer_busy_cycles = value["transfer_busy_cycles"].asUInt64();
  stats.stall_cycles = value["stall_cycles"].asUInt64();
  stats.commands_completed = value["commands_completed"].asUInt();
  stats.transfers_completed = value["transfers_completed"].asUInt();
  return stats;
}

static Json::Value
queue_to_json(const CommandFIFO &queue)
{
  Json::Value out(Json::objectValue);
  out["next_sequence"] = cycles_to_json(queue.next_sequence());

  Json::Value &slots = out["slots"];
  slots = Json::Value(Json::arrayValue);
  for (const FifoSlot &slot : queue.slots()) {
    Json::Value entry(Json::objectValue);
    entry["sequence"] = cycles_to_json(slot.sequence);
    entry["descriptor"] = descriptor_to_json(slot.descriptor);
    entry["base_cycles"] = slot.cost.base_cycles;
    entry["cycles_per_pixel"] = slot.cost.cycles_per_pixel;
    entry["pixel_area"] = cycles_to_json(slot.pixel_area);
    entry["issued_at"] = cycles_to_json(slot.issued_at_cycle);
    entry["started_at"] = cycles_to_json(slot.started_at_cycle);
    entry["completes_at"] = cycles_to_json(slot.completes_at_cycle);
    slots.append(entry);
  }
  return out;
}

static void
queue_from_json(CommandFIFO &queue, const Json::Value &value, const cycles_t now)
{
  std::vector<FifoSlot> slots;
  cycles_t previous_completion = now;
  for (const Json::Value &entry : value["slots"]) {
    FifoSlot slot;
    slot.sequence = entry["sequence"].asUInt64();
    slot.descriptor = descriptor_from_json(entry["descriptor"]);
    slot.cost.base_cycles = entry["base_cycles"].asUInt();
    slot.cost.cycles_per_pixel = entry["cycles_per_pixel"].asDouble();
    slot.pixel_area = entry["pixel_area"].asUInt64();
    slot.issued_at_cycle = entry["issued_at"].asUInt64();
    slot.started_at_cycle = entry["started_at"].asUInt64();
    slot.completes_at_cycle = entry["completes_at"].asUInt64();

    /* Anything that completed by `now` would have been retired already. */
    if (slot.completes_at_cycle <= previous_completion ||
        slot.started_at_cycle > slot.completes_at_cycle) {
      throw std::runtime_error(
        fmt::format("saved slot #{} has inconsistent timing", slot.sequence));
    }
    previous_completion = slot.completes_at_cycle;
    slots.push_back(std::move(slot));
  }

  queue.restore(std::move(slots), value["next_sequence"].asUInt64());
}

void
FrameBudgetTracker::serialize(Json::Value &snapshot) const
{
  snapshot = Json::Value(Json::objectValue);
  snapshot["clock_standard"] = clock_standard_name(m_clock.standard());
  snapshot["now"] = cycles_to_json(m_now);
  snapshot["frame_start"] = cycles_to_json(m_frame_start);
  snapshot["vblank_count"] = cycles_to_json(m_vblank_count);
  snapshot["cycle_in_frame"] = cycles_to_json(m_state.cycle_in_frame);
  snapshot["scanline_index"] = m_state.scanline_index;
  snapshot["blank_phase"] = blank_phase_name(m_state.blank_phase);

  if (const auto page = m_texture_cache.bound_page()) {
    snapshot["texture_page"] = *page;
  }
  if (const auto clut = m_texture_cache.bound_clut()) {
    snapshot["clut"] = *clut;
  }

  snapshot["fifo"] = queue_to_json(m_fifo);
  snapshot["transfers"] = queue_to_json(m_transfers);

  Json::Value &pending = snapshot["pending_completions"];
  pending = Json::Value(Json::arrayValue);
  for (const PrimitiveDescriptor &descriptor : m_completed) {
    pending.append(descriptor_to_json(descriptor));
  }

  snapshot["current_stats"] = stats_to_json(m_current_stats);
  snapshot["last_stats"] = stats_to_json(m_last_stats);
}

void
FrameBudgetTracker::deserialize(const Json::Value &snapshot)
{
  if (!snapshot.isObject()) {
    throw std::runtime_error("save state must be a JSON object");
  }

  const std::string standard = snapshot["clock_standard"].asString();
  if (parse_clock_standard(standard) != m_clock.standard()) {
    throw std::runtime_error(fmt::format("save state was taken with {} timing, engine runs {}",
                                         standard,
                                         clock_standard_name(m_clock.standard())));
  }

  const cycles_t now = snapshot["now"].asUInt64();
  const cycles_t frame_start = snapshot["frame_start"].asUInt64();
  if (frame_start > now || now - frame_start >= m_clock.frame_cycles() ||
      snapshot["cycle_in_frame"].asUInt64() != now - frame_start) {
    throw std::runtime_error("save state frame position is inconsistent");
  }

  /* Decode everything before touching live state. */
  CommandFIFO fifo(CommandFIFO::kCapacity, "command FIFO");
  CommandFIFO transfers(CommandFIFO::kUnbounded, "transfer channel");
  queue_from_json(fifo, snapshot["fifo"], now);
  queue_from_json(transfers, snapshot["transfers"], now);

  std::vector<PrimitiveDescriptor> pending;
  for (const Json::Value &entry : snapshot["pending_completions"]) {
    pending.push_back(descriptor_from_json(entry));
  }

  std::optional<u32> page;
  std::optional<u32> clut;
  if (snapshot.isMember("texture_page")) {
    page = snapshot["texture_page"].asUInt();
  }
  if (snapshot.isMember("clut")) {
    clut = snapshot["clut"].asUInt();
  }

  m_fifo_drain.cancel();
  m_transfer_drain.cancel();
  m_vblank.cancel();

  m_now = now;
  m_frame_start = frame_start;
  m_vblank_count = snapshot["vblank_count"].asUInt64();
  m_stalling = false;
  m_fifo.restore(std::vector<FifoSlot>(fifo.slots().begin(), fifo.slots().end()),
                 fifo.next_sequence());
  m_transfers.restore(
    std::vector<FifoSlot>(transfers.slots().begin(), transfers.slots().end()),
    transfers.next_sequence());
  m_texture_cache.restore(page, clut);
  m_completed = std::move(pending);
  m_current_stats = stats_from_json(snapshot["current_stats"]);
  m_last_stats = stats_from_json(snapshot["last_stats"]);
  update_frame_state();

  m_vblank.schedule(m_frame_start + m_clock.frame_cycles());
  arm_drain(m_fifo, m_fifo_drain);
  arm_drain(m_transfers, m_transfer_drain);

  log.info("Restored save state at cycle %llu (frame %llu, %u queued)",
           (unsigned long long)m_now,
           (unsigned long long)m_current_stats.frame_index,
           m_fifo.occupancy());
}

}
