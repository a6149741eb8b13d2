#include <cstdio>
#include <cstring>
#include <cstdarg>
#include <mutex>
#include <algorithm>
#include <initializer_list>

#include <fmt/core.h>

#include "shared/types.h"
#include "shared/log.h"

namespace Log {

static std::mutex log_mutex;
// Every module is recorded by default. The level filter applies on top.
static u32 enabled_modules = 0xFFFFFFFFu;
LogLevel level = LogLevel::Warn;

void
module_show(const LogModule module)
{
  enabled_modules |= (1lu << module);
}

void
module_show_all()
{
  enabled_modules = 0xFFFFFFFFu;
}

void
module_hide(const LogModule module)
{
  enabled_modules &= ~(1lu << module);
}

void
module_hide_all()
{
  enabled_modules = 0u;
}

bool
is_module_enabled(const LogModule module)
{
  return enabled_modules & (1lu << module);
}

const char *
module_name(const LogModule module)
{
  switch (module) {
    case CLOCK:
      return "clock";
    case COST:
      return "cost";
    case TEXCACHE:
      return "texcache";
    case FIFO:
      return "fifo";
    case FRAME:
      return "frame";
    case CONFIG:
      return "config";
  }
  return "?";
}

std::optional<LogModule>
module_from_name(std::string_view name)
{
  for (const LogModule module : { CLOCK, COST, TEXCACHE, FIFO, FRAME, CONFIG }) {
    if (name == module_name(module)) {
      return module;
    }
  }
  return std::nullopt;
}

const char *
level_name(const LogLevel log_level)
{
  switch (log_level) {
    case None:
      return "none";
    case Error:
      return "error";
    case Warn:
      return "warn";
    case Info:
      return "info";
    case Debug:
      return "debug";
    case Verbose:
      return "verbose";
  }
  return "?";
}

// Total allocated log entries that will exist during the lifetime of the application
static const u32 log_entries_size = 1 << 12;

// All the log entries themselves
static LogEntry log_entries[log_entries_size];

// The current number of log entries you can display
static u32 current_entry_count = 0;

// Current index into the entry array (wraps). This is always pointing at the next
// entry to write to. Last is current - 1, etc.
static u32 current_entry_index = 0;

// Monotonic sequence number stamped on each entry.
static u64 entry_sequence = 0;

const LogEntry &
get_nth_entry(u32 index)
{
  return log_entries[(current_entry_index + log_entries_size -
                      (current_entry_count - index)) %
                     log_entries_size];
}

u32
get_current_entry_count()
{
  return current_entry_count;
}

void
clear_all_entries()
{
  std::lock_guard<std::mutex> local_lock(log_mutex);
  current_entry_count = 0;
}

void
dump(FILE *out)
{
  std::lock_guard<std::mutex> local_lock(log_mutex);
  for (u32 i = 0; i < current_entry_count; ++i) {
    const LogEntry &entry = get_nth_entry(i);
    fmt::print(out,
               "[{:>6}] {:<8} {:<7} {}\n",
               entry.entry_time,
               module_name(entry.module),
               level_name(entry.level),
               entry.message);
  }
}

static void
emit_log_entry(LogLevel log_level, LogModule module, const char *format, va_list arglist)
{
  // Lock when adding a log entry
  std::lock_guard<std::mutex> local_lock(log_mutex);

  // Populate the next log entry
  LogEntry &log_entry(log_entries[current_entry_index]);
  vsnprintf(&log_entry.message[0], LOG_ENTRY_LENGTH, format, arglist);
  log_entry.entry_time = entry_sequence++;
  log_entry.level = log_level;
  log_entry.module = module;

  current_entry_count = ::std::min(log_entries_size, current_entry_count + 1);
  current_entry_index = (current_entry_index + 1) % log_entries_size;
}

void
info(const LogModule module, const char *format, va_list varargs)
{
  if (level >= LogLevel::Info && is_module_enabled(module)) {
    emit_log_entry(LogLevel::Info, module, format, varargs);
  }
}

void
warn(const LogModule module, const char *format, va_list varargs)
{
  if (level >= LogLevel::Warn && is_module_enabled(module)) {
    emit_log_entry(LogLevel::Warn, module, format, varargs);
  }
}

void
error(const LogModule module, const char *format, va_list varargs)
{
  if (level >= LogLevel::Error && is_module_enabled(module)) {
    emit_log_entry(LogLevel::Error, module, format, varargs);
  }
}

void
debug(const LogModule module, const char *format, va_list varargs)
{
  if (level >= LogLevel::Debug && is_module_enabled(module)) {
    emit_log_entry(LogLevel::Debug, module, format, varargs);
  }
}

void
verbose(const LogModule module, const char *format, va_list varargs)
{
  // Every command submission logs at this level, so don't even build the entry
  // unless somebody asked for it.
  if (level >= LogLevel::Verbose && is_module_enabled(module)) {
    emit_log_entry(LogLevel::Verbose, module, format, varargs);
  }
}

};
