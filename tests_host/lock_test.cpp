#include <Textmode/cpu/mutex.hpp>
#include <Textmode/lib/mutex.hpp>
#include <Textmode/lib/utility.hpp>
#include <Textmode/misc/console.hpp>

#include <thread>
#include <type_traits>
#include <vector>

#include "gtest/gtest.h"
#include "support/fake_screen.hpp"

namespace {

TEST(TicketLockTest, SerializesIncrements) {
  TicketLock lock;
  long counter = 0;
  constexpr int kThreads = 4;
  constexpr int kIterations = 10000;

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < kIterations; ++i) {
        lib::lock_guard guard{lock};
        counter = counter + 1;
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(kThreads * kIterations, counter);
}

TEST(TicketLockTest, GuardReleasesOnScopeExit) {
  TicketLock lock;
  {
    lib::lock_guard guard{lock};
  }
  // A second acquisition only returns if the first was released
  lib::lock_guard guard{lock};
  SUCCEED();
}

TEST(IrqTicketLockTest, IsAStaticFriendlyLockable) {
  // Executing cli faults in user mode, so only the shape is checked here
  static_assert(lib::BasicLockable<IrqTicketLock>);
  static_assert(std::is_trivially_destructible_v<IrqTicketLock>);
  SUCCEED();
}

TEST(ConsoleLockTest, HostedBuildUsesPlainTicketLock) {
  static_assert(std::is_same_v<console::Lock, TicketLock>);
  static_assert(std::is_same_v<decltype(console::global_lock), console::Lock>);
  SUCCEED();
}

struct Counted {
  explicit Counted(int value) : value{value} { ++constructions; }

  int value;
  static inline int constructions = 0;
};

TEST(LazyInitializerTest, ConstructsOnlyOnce) {
  Counted::constructions = 0;
  lib::lazy_initializer<Counted> lazy;
  EXPECT_FALSE(static_cast<bool>(lazy));

  auto& first = lazy.init(7);
  auto& second = lazy.init(9);

  EXPECT_TRUE(static_cast<bool>(lazy));
  EXPECT_EQ(&first, &second);
  EXPECT_EQ(7, lazy->value);
  EXPECT_EQ(7, (*lazy).value);
  EXPECT_EQ(1, Counted::constructions);
}

TEST(LazyInitializerTest, GetBeforeInitIsFatal) {
  lib::lazy_initializer<Counted> lazy;
  EXPECT_THROW(lazy.get(), FakePanic);
}

}  // namespace
