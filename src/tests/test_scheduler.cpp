#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "shared/scheduler.h"

class SchedulerFixture : public ::testing::Test {
protected:
  EventScheduler scheduler;
  std::vector<std::string> fired;

  std::function<void()> record(const std::string &name)
  {
    return [this, name]() { fired.push_back(name); };
  }
};

TEST_F(SchedulerFixture, runs_in_timestamp_order)
{
  EventScheduler::Event a("a", record("a"), &scheduler);
  EventScheduler::Event b("b", record("b"), &scheduler);
  EventScheduler::Event c("c", record("c"), &scheduler);

  c.schedule(300);
  a.schedule(100);
  b.schedule(200);
  ASSERT_EQ(scheduler.next_timestamp(), 100u);

  scheduler.run_until(200);
  ASSERT_EQ(fired, (std::vector<std::string> { "a", "b" }));
  ASSERT_EQ(scheduler.next_timestamp(), 300u);
  ASSERT_FALSE(a.is_scheduled());
  ASSERT_TRUE(c.is_scheduled());
}

TEST_F(SchedulerFixture, ties_run_in_scheduling_order)
{
  EventScheduler::Event a("a", record("a"), &scheduler);
  EventScheduler::Event b("b", record("b"), &scheduler);
  EventScheduler::Event c("c", record("c"), &scheduler);

  b.schedule(50);
  c.schedule(50);
  a.schedule(50);

  scheduler.run_until(50);
  ASSERT_EQ(fired, (std::vector<std::string> { "b", "c", "a" }));
  ASSERT_TRUE(scheduler.empty());
  ASSERT_EQ(scheduler.next_timestamp(), NO_CYCLE);
}

TEST_F(SchedulerFixture, cancel_and_reschedule)
{
  EventScheduler::Event a("a", record("a"), &scheduler);
  EventScheduler::Event b("b", record("b"), &scheduler);

  a.schedule(10);
  b.schedule(20);
  a.cancel();
  ASSERT_EQ(a.timestamp(), NO_CYCLE);
  ASSERT_EQ(scheduler.next_timestamp(), 20u);

  b.reschedule(5);
  ASSERT_EQ(scheduler.next_timestamp(), 5u);

  scheduler.run_until(100);
  ASSERT_EQ(fired, (std::vector<std::string> { "b" }));
}

TEST_F(SchedulerFixture, callback_may_reschedule_itself)
{
  int count = 0;
  EventScheduler::Event *self = nullptr;
  EventScheduler::Event tick(
    "tick",
    [&]() {
      if (++count < 3) {
        self->schedule(10 * (count + 1));
      }
    },
    &scheduler);
  self = &tick;

  tick.schedule(10);
  scheduler.run_until(1000);
  ASSERT_EQ(count, 3);
  ASSERT_FALSE(tick.is_scheduled());
}

int
main(int argc, char *argv[])
{
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
