#include <cassert>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <json/json.h>

#include "local/settings.h"
#include "shared/log.h"

namespace pacer::local {

static Log::Logger<Log::LogModule::CONFIG> log;

std::shared_ptr<Settings>
safe_load_settings(std::string_view settings_root_dir, std::string_view settings_filename)
{
  // Ensure the settings folder exists
  std::error_code error;
  if (!std::filesystem::is_directory(settings_root_dir, error)) {
    log.info("Recursively creating settings folder '%.*s'",
             int(settings_root_dir.size()),
             settings_root_dir.data());
    if (!std::filesystem::create_directories(settings_root_dir, error)) {
      log.error("Failed to create settings folder: %s", error.message().c_str());
      return nullptr;
    }
  }

  return std::make_shared<Settings>(settings_root_dir, settings_filename);
}

Settings::Settings() {}

Settings::Settings(std::string_view settings_root_dir, std::string_view settings_filename)
  : m_settings_root_dir(settings_root_dir),
    m_settings_filename(settings_filename)
{
  deserialize();
}

Settings::~Settings()
{
  if (!m_settings_filename.empty()) {
    serialize();
  }
}

void
Settings::set(std::string_view key, std::string_view value)
{
  assert(key.find(' ') == std::string_view::npos && "settings keys may not contain a space");
  m_settings[std::string(key)] = value;
}

std::string_view
Settings::get_or_default(std::string_view query, std::string_view default_value) const
{
  const auto it = m_settings.find(std::string(query));
  if (it != m_settings.end()) {
    return it->second;
  }

  return default_value;
}

void
Settings::erase(std::string_view key)
{
  m_settings.erase(std::string(key));
}

void
Settings::clear()
{
  m_settings = {};
}

bool
Settings::has(std::string_view key) const
{
  return m_settings.find(std::string(key)) != m_settings.end();
}

void
Settings::save() const
{
  if (!m_settings_filename.empty()) {
    serialize();
  }
}

void
Settings::serialize() const
{
  const std::filesystem::path settings_path = std::filesystem::path(m_settings_root_dir) /
                                              std::filesystem::path(m_settings_filename);

  Json::Value root;

  Json::Value &globals = root["global"];
  for (const auto &[key, value] : m_settings) {
    globals[key] = value;
  }

  Json::StreamWriterBuilder builder;
  builder["commentStyle"] = "None";
  builder["indentation"]  = "  ";

  std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
  std::ofstream out(settings_path, std::ofstream::binary);
  if (!out) {
    log.error("Could not write settings to %s", settings_path.c_str());
    return;
  }
  writer->write(root, &out);
  log.info("Wrote settings to %s", settings_path.c_str());
}

void
Settings::deserialize()
{
  const std::filesystem::path settings_path = std::filesystem::path(m_settings_root_dir) /
                                              std::filesystem::path(m_settings_filename);

  ensure_file_exists();

  try {
    std::ifstream in(settings_path);
    Json::Value root;
    in >> root;

    m_settings.clear();
    Json::Value &globals = root["global"];
    for (Json::ValueIterator it = globals.begin(); it != globals.end(); it++) {
      const std::string key   = it.key().asString();
      const std::string value = it->asString();
      m_settings[key]         = value;
    }

  } catch (const std::exception &e) {
    // An empty or hand-mangled file falls back to defaults.
    log.warn("Failed to load settings from %s, using defaults (%s)",
             settings_path.c_str(),
             e.what());
  }
}

void
Settings::ensure_file_exists() const
{
  const std::filesystem::path settings_path = std::filesystem::path(m_settings_root_dir) /
                                              std::filesystem::path(m_settings_filename);

  FILE *fp = fopen(settings_path.c_str(), "r");
  if (!fp) {
    fp = fopen(settings_path.c_str(), "w");
  }
  if (fp) {
    fclose(fp);
  }
}

} // namespace pacer::local
