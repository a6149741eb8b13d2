#include <filesystem>
#include <fstream>

#include <gtest/gtest.h>

#include "gpu/timing_config.h"
#include "local/settings.h"

using namespace pacer;

class SettingsFixture : public ::testing::Test {
protected:
  void SetUp() override
  {
    const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
    root = std::filesystem::temp_directory_path() / "pacer_tests" / info->name();
    std::filesystem::remove_all(root);
  }

  void TearDown() override
  {
    std::filesystem::remove_all(root);
  }

  std::filesystem::path root;
};

TEST(TimingConfig, defaults)
{
  const local::Settings settings;
  const gpu::TimingConfig config = gpu::TimingConfig::from_settings(settings);

  ASSERT_EQ(config.clock_standard, gpu::ClockStandard::NTSC);
  ASSERT_EQ(config.cache_miss_policy, gpu::CacheMissPolicy::PageSwitchOnly);
  ASSERT_TRUE(config.fifo_block_on_full);
}

TEST(TimingConfig, from_settings)
{
  local::Settings settings;
  settings.set("gpu.clock_standard", "pal");
  settings.set("gpu.cache_miss_policy", "disabled");
  settings.set("gpu.fifo_block_on_full", "false");

  const gpu::TimingConfig config = gpu::TimingConfig::from_settings(settings);
  ASSERT_EQ(config.clock_standard, gpu::ClockStandard::PAL);
  ASSERT_EQ(config.cache_miss_policy, gpu::CacheMissPolicy::Disabled);
  ASSERT_FALSE(config.fifo_block_on_full);
}

TEST(TimingConfig, bad_values)
{
  local::Settings settings;
  settings.set("gpu.clock_standard", "secam");
  ASSERT_THROW(gpu::TimingConfig::from_settings(settings), std::runtime_error);

  settings.erase("gpu.clock_standard");
  settings.set("gpu.fifo_block_on_full", "maybe");
  ASSERT_THROW(gpu::TimingConfig::from_settings(settings), std::runtime_error);
}

TEST(TimingConfig, store)
{
  gpu::TimingConfig config;
  config.clock_standard = gpu::ClockStandard::PAL;
  config.fifo_block_on_full = false;

  local::Settings settings;
  config.store(settings);
  ASSERT_EQ(settings.get_or_default("gpu.clock_standard", ""), "pal");
  ASSERT_EQ(settings.get_or_default("gpu.cache_miss_policy", ""), "page_switch_only");
  ASSERT_EQ(settings.get_or_default("gpu.fifo_block_on_full", ""), "false");

  const gpu::TimingConfig reloaded = gpu::TimingConfig::from_settings(settings);
  ASSERT_EQ(reloaded.clock_standard, config.clock_standard);
  ASSERT_EQ(reloaded.fifo_block_on_full, config.fifo_block_on_full);
}

TEST(Settings, in_memory)
{
  local::Settings settings;

  // Initial default value
  ASSERT_EQ(settings.get_or_default("test.key", "default_val"), "default_val");
  ASSERT_FALSE(settings.has("test.key"));

  // New user-defined value
  settings.set("test.key", "other");
  ASSERT_EQ(settings.get_or_default("test.key", "default_val"), "other");

  // Back to the default
  settings.erase("test.key");
  ASSERT_EQ(settings.get_or_default("test.key", "default_val"), "default_val");
}

TEST_F(SettingsFixture, persisted)
{
  {
    auto settings = local::safe_load_settings(root.string(), "pacer.cfg");
    ASSERT_NE(settings, nullptr);
    ASSERT_TRUE(std::filesystem::exists(root / "pacer.cfg"));
    settings->set("gpu.clock_standard", "pal");
  }

  auto settings = local::safe_load_settings(root.string(), "pacer.cfg");
  ASSERT_EQ(settings->get_or_default("gpu.clock_standard", "ntsc"), "pal");

  settings->clear();
  settings->save();
  const auto reloaded = local::safe_load_settings(root.string(), "pacer.cfg");
  ASSERT_FALSE(reloaded->has("gpu.clock_standard"));
}

TEST_F(SettingsFixture, corrupt_file_falls_back_to_defaults)
{
  std::filesystem::create_directories(root);
  std::ofstream(root / "pacer.cfg") << "{ not json";

  const auto settings = local::safe_load_settings(root.string(), "pacer.cfg");
  ASSERT_NE(settings, nullptr);
  ASSERT_FALSE(settings->has("gpu.clock_standard"));
  ASSERT_EQ(gpu::TimingConfig::from_settings(*settings).clock_standard, gpu::ClockStandard::NTSC);
}

int
main(int argc, char *argv[])
{
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
