#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

namespace pacer::local {

// Persisted key/value settings, e.g. gpu.clock_standard. Stored as a JSON
// document with a single "global" object.
class Settings {
public:
  /** Load and save settings from/to a file */
  Settings(std::string_view settings_root_dir, std::string_view settings_filename);

  /** Settings temporarily stored in memory */
  Settings();

  /** Serializes settings to file if one was provided at construction */
  ~Settings();

  /** If present, returns a setting, else returns the default. */
  std::string_view get_or_default(std::string_view key, std::string_view default_value) const;

  /** Sets a setting */
  void set(std::string_view key, std::string_view value);

  bool has(std::string_view key) const;

  void erase(std::string_view key);
  void clear();

  /** Write to the backing file now. No-op for in-memory settings. */
  void save() const;

private:
  const std::string m_settings_root_dir;
  const std::string m_settings_filename;

  std::unordered_map<std::string, std::string> m_settings;

  void serialize() const;
  void deserialize();
  void ensure_file_exists() const;
};

std::shared_ptr<Settings> safe_load_settings(std::string_view settings_root_dir,
                                             std::string_view settings_filename);

}
