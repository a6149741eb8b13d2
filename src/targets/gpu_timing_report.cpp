// vim: expandtab:ts=2:sw=2

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <memory>
#include <string>

#include <fmt/core.h>
#include <json/json.h>

#include "gpu/descriptor_json.h"
#include "gpu/frame_budget.h"
#include "gpu/timing_config.h"
#include "gpu/timing_errors.h"
#include "local/settings.h"
#include "shared/argument_parser.h"
#include "shared/log.h"

using namespace pacer;

static void
print_usage(const char *program)
{
  fmt::print(stderr,
             "usage: {} --commands <file.json> [--settings-dir <dir>]\n"
             "       [--standard ntsc|pal] [--no-block] [--save-state <file.json>] [--verbose]\n"
             "       [--log-module <name>[,<name>...]]\n",
             program);
}

static Json::Value
read_json_file(const std::string &path)
{
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error(fmt::format("could not open {}", path));
  }

  Json::CharReaderBuilder builder;
  Json::Value root;
  std::string errors;
  if (!Json::parseFromStream(builder, in, &root, &errors)) {
    throw std::runtime_error(fmt::format("{}: {}", path, errors));
  }
  return root;
}

static void
write_json_file(const std::string &path, const Json::Value &root)
{
  Json::StreamWriterBuilder builder;
  builder["commentStyle"] = "None";
  builder["indentation"] = "  ";

  std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
  std::ofstream out(path, std::ofstream::binary);
  if (!out) {
    throw std::runtime_error(fmt::format("could not write {}", path));
  }
  writer->write(root, &out);
}

static void
print_frame_stats(const char *label, const gpu::FrameStats &stats, const gpu::ClockDomain &clock)
{
  const cycles_t frame_cycles = clock.frame_cycles();
  fmt::print("{} frame {}: rasterizer {} cycles ({:.1f}%), transfers {} cycles, "
             "stalled {} cycles, {} commands, {} transfers\n",
             label,
             stats.frame_index,
             stats.rasterizer_busy_cycles,
             stats.utilization(frame_cycles) * 100.0,
             stats.transfer_busy_cycles,
             stats.stall_cycles,
             stats.commands_completed,
             stats.transfers_completed);
}

/*!
 * @brief Record only the comma separated log modules. Returns false on an
 *        unknown module name.
 */
static bool
select_log_modules(const std::string &list)
{
  Log::module_hide_all();

  size_t start = 0;
  while (start <= list.size()) {
    const size_t end = std::min(list.find(',', start), list.size());
    const std::string name = list.substr(start, end - start);
    const auto module = Log::module_from_name(name);
    if (!module) {
      fmt::print(stderr, "unknown log module '{}'\n", name);
      Log::module_show_all();
      return false;
    }
    Log::module_show(*module);
    start = end + 1;
  }
  return true;
}

/*!
 * @brief Run one entry of the command stream. Returns false if the engine
 *        rejected it.
 */
static bool
run_entry(gpu::FrameBudgetTracker &tracker, const Json::Value &entry, const u32 index)
{
  if (!entry.isObject()) {
    fmt::print("{:>4}  rejected: entry is not a JSON object\n", index);
    return false;
  }

  const Json::Value &wait = entry["wait_vblank"];
  const Json::Value &advance = entry["advance"];
  const Json::Value &reset = entry["reset_command_buffer"];
  if ((!wait.isNull() && !wait.isBool()) || (!advance.isNull() && !advance.isUInt64()) ||
      (!reset.isNull() && !reset.isBool())) {
    fmt::print("{:>4}  rejected: \"wait_vblank\" and \"reset_command_buffer\" take true or "
               "false, \"advance\" a cycle count\n",
               index);
    return false;
  }

  if (reset.asBool()) {
    const auto dropped = tracker.reset_command_buffer();
    fmt::print("{:>4}  reset             {} command(s) dropped\n", index, dropped.size());
    for (const gpu::PrimitiveDescriptor &descriptor : dropped) {
      fmt::print("        dropped {}\n", gpu::kind_name(descriptor.kind));
    }
    return true;
  }

  if (wait.asBool()) {
    const cycles_t skipped = tracker.wait_for_vblank();
    fmt::print("{:>4}  wait_vblank       skipped {} cycles, now frame {}\n",
               index,
               skipped,
               tracker.current_frame_stats().frame_index);
    return true;
  }

  if (!advance.isNull()) {
    const cycles_t n = advance.asUInt64();
    const auto completed = tracker.advance_cycles(n);
    fmt::print("{:>4}  advance           {} cycles, {} completed\n", index, n, completed.size());
    return true;
  }

  try {
    const Json::Value &channel = entry["background"];
    if (!channel.isNull() && !channel.isBool()) {
      throw gpu::InvalidGeometry("\"background\" must be true or false");
    }
    const bool background = channel.asBool();
    const gpu::PrimitiveDescriptor descriptor = gpu::descriptor_from_json(entry);
    const gpu::SubmitResult result =
      background ? tracker.submit_transfer(descriptor) : tracker.submit(descriptor);

    fmt::print("{:>4}  {:<16}  area {:>7}  base {:>4}  {:>4.1f}/px  total {:>7}  "
               "done @{:>8}{}{}\n",
               index,
               gpu::kind_name(descriptor.kind),
               result.pixel_area,
               result.base_cycles,
               result.cycles_per_pixel,
               result.total_cycles,
               result.completes_at_cycle,
               background ? "  (background)" : "",
               result.stall_cycles ? fmt::format("  stalled {}", result.stall_cycles) : "");
  } catch (const gpu::FifoFull &e) {
    fmt::print("{:>4}  rejected: {} (occupancy {}, free in {})\n",
               index,
               e.what(),
               e.occupancy(),
               e.cycles_until_free());
    return false;
  } catch (const gpu::TimingError &e) {
    fmt::print("{:>4}  rejected: {}\n", index, e.what());
    return false;
  }

  return true;
}

int
main(int argc, char *argv[])
{
  const ArgumentParser arg_parser(argc, argv);

  if (arg_parser.get_flag("--help")) {
    print_usage(argv[0]);
    return 0;
  }

  const auto unknown =
    arg_parser.find_unknown({ "--no-block", "--verbose" },
                            { "--commands",
                              "--settings-dir",
                              "--standard",
                              "--save-state",
                              "--log-module" });
  if (unknown) {
    fmt::print(stderr, "unknown option '{}'\n", *unknown);
    print_usage(argv[0]);
    return 2;
  }

  const auto commands_path = arg_parser.get_string("--commands");
  if (!commands_path) {
    print_usage(argv[0]);
    return 2;
  }

  const bool verbose = arg_parser.get_flag("--verbose").value_or(false);
  Log::level = verbose ? Log::LogLevel::Debug : Log::LogLevel::Warn;
  if (const auto modules = arg_parser.get_string("--log-module")) {
    if (!select_log_modules(*modules)) {
      print_usage(argv[0]);
      return 2;
    }
  }

  std::shared_ptr<local::Settings> settings;
  if (const auto settings_dir = arg_parser.get_string("--settings-dir")) {
    settings = local::safe_load_settings(*settings_dir, "pacer.cfg");
    if (!settings) {
      fmt::print(stderr, "error: could not use settings folder '{}'\n", *settings_dir);
      return 1;
    }
  } else {
    settings = std::make_shared<local::Settings>();
  }

  gpu::TimingConfig config;
  Json::Value commands;
  try {
    config = gpu::TimingConfig::from_settings(*settings);
    if (const auto standard = arg_parser.get_string("--standard")) {
      config.clock_standard = gpu::parse_clock_standard(*standard);
    }
    if (arg_parser.get_flag("--no-block")) {
      config.fifo_block_on_full = false;
    }

    commands = read_json_file(*commands_path);
    if (commands.isObject()) {
      commands = commands["commands"];
    }
    if (!commands.isArray()) {
      throw std::runtime_error(
        fmt::format("{}: expected an array of commands", *commands_path));
    }
  } catch (const std::exception &e) {
    fmt::print(stderr, "error: {}\n", e.what());
    return 1;
  }

  gpu::FrameBudgetTracker tracker(config);
  fmt::print("{}\n", config.describe());

  u32 rejected = 0;
  for (u32 i = 0; i < commands.size(); ++i) {
    try {
      if (!run_entry(tracker, commands[i], i)) {
        ++rejected;
      }
    } catch (const std::exception &e) {
      fmt::print(stderr, "error: command {}: {}\n", i, e.what());
      return 1;
    }
  }

  const gpu::FrameState &state = tracker.frame_state();
  fmt::print("\ncycle {} of frame {} (scanline {}, {}), {} queued, {} pending cycles{}\n",
             state.cycle_in_frame,
             tracker.current_frame_stats().frame_index,
             state.scanline_index,
             gpu::blank_phase_name(state.blank_phase),
             tracker.occupancy(),
             tracker.pending_rasterizer_cycles(),
             tracker.is_over_budget() ? ", over budget" : "");
  if (tracker.vblank_count() > 0) {
    print_frame_stats("last   ", tracker.last_frame_stats(), tracker.clock());
  }
  print_frame_stats("current", tracker.current_frame_stats(), tracker.clock());
  if (rejected) {
    fmt::print("{} command(s) rejected\n", rejected);
  }

  if (const auto save_path = arg_parser.get_string("--save-state")) {
    Json::Value snapshot;
    tracker.serialize(snapshot);
    try {
      write_json_file(*save_path, snapshot);
    } catch (const std::runtime_error &e) {
      fmt::print(stderr, "error: {}\n", e.what());
      return 1;
    }
  }

  if (verbose) {
    Log::dump(stderr);
  }

  return rejected ? 1 : 0;
}
