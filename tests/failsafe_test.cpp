/*
  Ryufish, a USI shogi search core derived from Stockfish
  Copyright (C) 2004-2025 The Stockfish developers (see AUTHORS file)

  Ryufish is free software: you can redistribute it and/or modify
  it under the terms of the GNU General Public License as published by
  the Free Software Foundation, either version 3 of the License, or
  (at your option) any later version.

  Ryufish is distributed in the hope that it will be useful,
  but WITHOUT ANY WARRANTY; without even the implied warranty of
  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
  GNU General Public License for more details.

  You should have received a copy of the GNU General Public License
  along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

#include <gtest/gtest.h>

#include "failsafe.h"
#include "search.h"

using namespace Ryufish;

namespace {

// A search that started `age` milliseconds ago and never runs any worker
std::shared_ptr<Search::SharedState> make_state(TimeControl tc, TimePoint age = 0) {
    Search::LimitsType limits;
    limits.timeControl = std::move(tc);
    limits.startTime   = now() - age;
    limits.ponderhit   = std::make_shared<std::atomic_bool>(false);
    return std::make_shared<Search::SharedState>(limits, nullptr, 1);
}

template<typename Pred>
bool wait_for(Pred pred, TimePoint timeoutMs) {
    const TimePoint start = now();
    while (!pred())
    {
        if (now() - start > timeoutMs)
            return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return true;
}

}  // namespace


TEST(FailSafeGuardTest, CeilingFollowsTheTimeControl) {

    EXPECT_EQ(FailSafeGuard::ceiling_for(FixedTime{1000}, false), 3000);
    EXPECT_EQ(FailSafeGuard::ceiling_for(FixedTime{100}, false), 1000);
    EXPECT_EQ(FailSafeGuard::ceiling_for(Fischer{60000, 30000, 1000}, false), 54000);
    EXPECT_EQ(FailSafeGuard::ceiling_for(Byoyomi{60000, 10000, 1}, false), 70000);
    EXPECT_EQ(FailSafeGuard::ceiling_for(Byoyomi{0, 10000, 1}, false), 9700);
    EXPECT_EQ(FailSafeGuard::ceiling_for(Byoyomi{0, 300, 1}, false), 1000);
    EXPECT_EQ(FailSafeGuard::ceiling_for(FixedNodes{1000}, false), 3600000);
    EXPECT_EQ(FailSafeGuard::ceiling_for(Infinite{}, true), 3600000);
}

TEST(FailSafeGuardTest, StaysQuietWhenTheSearchFinishes) {

    auto shared = make_state(FixedTime{1000});

    FailSafeGuard guard(shared, FailSafeConfig{5, 50}, [] { FAIL() << "unexpected escalation"; });
    guard.start();

    shared->finish();

    EXPECT_TRUE(wait_for([&] { return guard.stage() == FailSafeGuard::Finished; }, 2000));
    EXPECT_FALSE(shared->stopped());
}

TEST(FailSafeGuardTest, EscalatesThenGivesUp) {

#ifdef RYUFISH_FAILSAFE_ABORT
    GTEST_SKIP() << "the last stage aborts the process in this build";
#endif

    // Far beyond the ceiling from the start
    auto shared = make_state(FixedTime{100}, 5000);

    std::atomic<int> escalations{0};
    FailSafeGuard    guard(shared, FailSafeConfig{5, 50}, [&] { escalations.fetch_add(1); });
    guard.start();

    EXPECT_TRUE(wait_for([&] { return guard.stage() == FailSafeGuard::GaveUp; }, 3000));
    EXPECT_EQ(escalations.load(), 1);

    ASSERT_TRUE(shared->stopped());
    ASSERT_TRUE(shared->stop_info().has_value());
    EXPECT_EQ(shared->stop_info()->reason, Search::TerminationReason::FailSafe);
    EXPECT_TRUE(shared->stop_info()->hardTimeout);
}

TEST(FailSafeGuardTest, NoEscalationWhenTheStopIsHonoured) {

    auto shared = make_state(FixedTime{100}, 5000);

    std::atomic<int> escalations{0};
    FailSafeGuard    guard(shared, FailSafeConfig{5, 200}, [&] { escalations.fetch_add(1); });

    // Plays the search that unwinds as soon as it is told to stop
    std::thread search([&] {
        while (!shared->stopped())
            shared->wait_for_stop(5);
        shared->finish();
    });

    guard.start();
    search.join();

    std::this_thread::sleep_for(std::chrono::milliseconds(400));

    EXPECT_EQ(guard.stage(), FailSafeGuard::StopRequested);
    EXPECT_EQ(escalations.load(), 0);

    guard.stop();
}

TEST(FailSafeGuardTest, EarlierStopIsNotOverwritten) {

#ifdef RYUFISH_FAILSAFE_ABORT
    GTEST_SKIP() << "the last stage aborts the process in this build";
#endif

    auto shared = make_state(FixedTime{100}, 5000);

    Search::StopInfo info;
    info.reason = Search::TerminationReason::TimeLimit;
    shared->request_stop(info);

    FailSafeGuard guard(shared, FailSafeConfig{5, 20}, [] {});
    guard.start();

    EXPECT_TRUE(wait_for([&] { return guard.stage() == FailSafeGuard::GaveUp; }, 3000));
    EXPECT_EQ(shared->stop_info()->reason, Search::TerminationReason::TimeLimit);
}

TEST(FailSafeGuardTest, PonderhitRecomputesTheCeilingOnce) {

    auto shared = make_state(Ponder{std::make_shared<const TimeControl>(FixedTime{2000})});

    FailSafeGuard guard(shared, FailSafeConfig{5, 50}, [] {});
    EXPECT_EQ(guard.ceiling(), 3600000);

    guard.start();
    shared->limits.ponderhit->store(true, std::memory_order_release);

    EXPECT_TRUE(wait_for([&] { return guard.ceiling() == 6000; }, 2000));

    shared->finish();
    guard.stop();
}

TEST(FailSafeGuardTest, PonderTimeDoesNotCountAgainstTheCeiling) {

    // Pondered five seconds, far beyond the ceiling of the inner control
    auto shared = make_state(Ponder{std::make_shared<const TimeControl>(FixedTime{300})}, 5000);
    shared->limits.ponderhit->store(true, std::memory_order_release);

    std::atomic<int> escalations{0};
    FailSafeGuard    guard(shared, FailSafeConfig{5, 50}, [&] { escalations.fetch_add(1); });
    guard.start();

    EXPECT_TRUE(wait_for([&] { return guard.ceiling() == 1000; }, 2000));
    std::this_thread::sleep_for(std::chrono::milliseconds(300));

    EXPECT_EQ(guard.stage(), FailSafeGuard::Watching);
    EXPECT_FALSE(shared->stopped());
    EXPECT_EQ(escalations.load(), 0);

    shared->finish();
    EXPECT_TRUE(wait_for([&] { return guard.stage() == FailSafeGuard::Finished; }, 2000));
}
