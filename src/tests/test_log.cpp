#include <gtest/gtest.h>

#include "gpu/clock_domain.h"
#include "shared/log.h"

using namespace pacer;

static Log::Logger<Log::LogModule::FRAME> frame_log;

class LogFixture : public ::testing::Test {
protected:
  void SetUp() override
  {
    Log::level = Log::LogLevel::Debug;
    Log::module_show_all();
    Log::clear_all_entries();
  }

  void TearDown() override
  {
    Log::level = Log::LogLevel::Warn;
    Log::module_show_all();
    Log::clear_all_entries();
  }
};

TEST_F(LogFixture, level_filter)
{
  Log::level = Log::LogLevel::Warn;
  frame_log.debug("not recorded");
  frame_log.warn("frame %d late", 3);

  ASSERT_EQ(Log::get_current_entry_count(), 1u);
  const Log::LogEntry &entry = Log::get_nth_entry(0);
  ASSERT_STREQ(entry.message, "frame 3 late");
  ASSERT_EQ(entry.level, Log::LogLevel::Warn);
  ASSERT_EQ(entry.module, Log::LogModule::FRAME);
}

TEST_F(LogFixture, module_mask)
{
  Log::module_hide_all();
  Log::module_show(Log::LogModule::CLOCK);
  ASSERT_TRUE(Log::is_module_enabled(Log::LogModule::CLOCK));
  ASSERT_FALSE(Log::is_module_enabled(Log::LogModule::FRAME));

  frame_log.warn("hidden");
  const gpu::ClockDomain clock(gpu::ClockStandard::PAL);

  ASSERT_EQ(Log::get_current_entry_count(), 1u);
  ASSERT_EQ(Log::get_nth_entry(0).module, Log::LogModule::CLOCK);
  ASSERT_STREQ(Log::get_nth_entry(0).message,
               "PAL video clock 53693175 Hz, 1073863 cycles per frame");

  Log::module_hide(Log::LogModule::CLOCK);
  ASSERT_FALSE(Log::is_module_enabled(Log::LogModule::CLOCK));
  const gpu::ClockDomain ntsc(gpu::ClockStandard::NTSC);
  ASSERT_EQ(Log::get_current_entry_count(), 1u);
}

TEST_F(LogFixture, entries_are_oldest_first)
{
  frame_log.info("first");
  frame_log.info("second");

  ASSERT_EQ(Log::get_current_entry_count(), 2u);
  ASSERT_STREQ(Log::get_nth_entry(0).message, "first");
  ASSERT_STREQ(Log::get_nth_entry(1).message, "second");
}

TEST_F(LogFixture, ring_buffer_keeps_the_newest_entries)
{
  for (int i = 0; i < 5000; ++i) {
    frame_log.info("entry %d", i);
  }

  const u32 count = Log::get_current_entry_count();
  ASSERT_EQ(count, 4096u);
  ASSERT_STREQ(Log::get_nth_entry(0).message, "entry 904");
  ASSERT_STREQ(Log::get_nth_entry(count - 1).message, "entry 4999");
}

TEST_F(LogFixture, module_names)
{
  ASSERT_STREQ(Log::module_name(Log::LogModule::TEXCACHE), "texcache");
  ASSERT_EQ(Log::module_from_name("fifo"), Log::LogModule::FIFO);
  ASSERT_EQ(Log::module_from_name("clock"), Log::LogModule::CLOCK);
  ASSERT_FALSE(Log::module_from_name("gpu").has_value());
}

int
main(int argc, char *argv[])
{
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
