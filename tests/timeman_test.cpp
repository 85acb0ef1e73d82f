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

#include <memory>

#include <gtest/gtest.h>

#include "timeman.h"

using namespace Ryufish;

namespace {

void init(TimeManagement& tm, const TimeControl& tc, Color us = BLACK, int ply = 0) {
    tm.init(tc, us, ply, TimeOptions{});
}

}  // namespace


TEST(TimeManagementTest, FischerThresholdsAreOrdered) {

    TimeManagement tm;
    init(tm, Fischer{10000, 10000, 0});

    const TimePoint soft = tm.soft_limit();
    const TimePoint opt  = tm.opt_limit();
    const TimePoint hard = tm.hard_limit();

    EXPECT_LT(soft, opt);
    EXPECT_LE(opt * 2, soft * 3);
    EXPECT_LE(opt * 10, hard * 8);
    EXPECT_EQ(tm.planned_limit(), TimeManagement::Unlimited);
}

TEST(TimeManagementTest, FischerUsesTheClockOfTheSideToMove) {

    TimeManagement black, white;
    init(black, Fischer{60000, 6000, 0}, BLACK);
    init(white, Fischer{60000, 6000, 0}, WHITE);

    EXPECT_LT(black.soft_limit(), white.soft_limit());
    EXPECT_LT(black.hard_limit(), white.hard_limit());
}

TEST(TimeManagementTest, FischerWithAlmostNoTimeLeft) {

    TimeManagement tm;
    init(tm, Fischer{400, 400, 0});

    EXPECT_EQ(tm.soft_limit(), 50);
    EXPECT_EQ(tm.hard_limit(), 100);
}

TEST(TimeManagementTest, FixedTimeThresholds) {

    TimeManagement tm;
    init(tm, FixedTime{1000});

    EXPECT_EQ(tm.soft_limit(), 890);
    EXPECT_EQ(tm.hard_limit(), 990);
    // Soft is above 80% of hard here, opt stays at 80% of hard
    EXPECT_EQ(tm.opt_limit(), 792);
    EXPECT_LE(tm.opt_limit() * 10, tm.hard_limit() * 8);
}

TEST(TimeManagementTest, ByoyomiThresholds) {

    TimeManagement periodOnly;
    init(periodOnly, Byoyomi{0, 10000, 3});

    EXPECT_EQ(periodOnly.hard_limit(), 8880);
    EXPECT_EQ(periodOnly.soft_limit(), 7104);
    EXPECT_EQ(periodOnly.opt_limit(), 7104);

    // The main time runs out before a period would be longer than it
    TimeManagement finalPush;
    init(finalPush, Byoyomi{1000, 1000, 1});

    EXPECT_EQ(finalPush.hard_limit(), 760);
    EXPECT_EQ(finalPush.soft_limit(), 710);

    TimeManagement mainTime;
    init(mainTime, Byoyomi{60000, 10000, 1});

    EXPECT_EQ(mainTime.soft_limit(), 12000);
    EXPECT_EQ(mainTime.hard_limit(), 30000);
}

TEST(TimeManagementTest, ShouldStopBetweenSoftAndHard) {

    TimeManagement tm;
    init(tm, FixedTime{1000});

    EXPECT_FALSE(tm.should_stop(0));
    EXPECT_FALSE(tm.should_stop(tm.soft_limit() - 1));
    EXPECT_TRUE(tm.should_stop(tm.hard_limit()));
    EXPECT_TRUE(tm.should_stop(tm.hard_limit() + 500));
}

TEST(TimeManagementTest, NodeBudget) {

    TimeManagement tm;
    init(tm, FixedNodes{1000});

    EXPECT_EQ(tm.node_budget(), 1000u);
    EXPECT_EQ(tm.hard_limit(), TimeManagement::Unlimited);
    EXPECT_FALSE(tm.should_stop(100000, 999));
    EXPECT_TRUE(tm.should_stop(0, 1000));
}

TEST(TimeManagementTest, InfiniteNeverStops) {

    TimeManagement tm;
    init(tm, Infinite{});

    EXPECT_FALSE(tm.should_stop(100000000, 100000000));
    EXPECT_EQ(tm.poll_interval(0, 20), 20);
}

TEST(TimeManagementTest, RoundUpToWholeSeconds) {

    TimeManagement tm;
    init(tm, Byoyomi{0, 10000, 3});

    // At least MinimumThinkingTime, minus the network delay
    EXPECT_EQ(tm.round_up(500), 1880);
    EXPECT_EQ(tm.round_up(2500), 2880);
    // Never earlier than the input
    EXPECT_EQ(tm.round_up(2950), 3880);
    // Never later than hard
    EXPECT_EQ(tm.round_up(9500), tm.hard_limit());
}

TEST(TimeManagementTest, SafetyMarginShrinksWithTheClock) {

    TimeManagement tm;
    init(tm, Byoyomi{0, 10000, 3});

    EXPECT_EQ(tm.safety_margin(20000), 1120);
    EXPECT_EQ(tm.safety_margin(6000), 500);
    EXPECT_EQ(tm.safety_margin(3000), 200);
    EXPECT_EQ(tm.safety_margin(400), 80);
    EXPECT_EQ(tm.safety_margin(0), 0);
}

TEST(TimeManagementTest, PollSchedulesTheEndBeforeStopping) {

    TimeManagement tm;
    init(tm, FixedTime{1000});
    tm.start_polling();

    FinalizeReason reason;

    EXPECT_FALSE(tm.poll(100, 0, reason));
    EXPECT_EQ(tm.phase(), TimeManagement::Polling);

    // Inside the safety window the end is scheduled, not enforced
    EXPECT_FALSE(tm.poll(900, 0, reason));
    EXPECT_EQ(tm.phase(), TimeManagement::NearLimit);
    EXPECT_EQ(tm.planned_limit(), 890);

    EXPECT_TRUE(tm.poll(895, 0, reason));
    EXPECT_EQ(reason, FinalizeReason::NearHard);
    EXPECT_EQ(tm.phase(), TimeManagement::Stopped);

    // A stopped time manager does not fire again
    EXPECT_FALSE(tm.poll(2000, 0, reason));
}

TEST(TimeManagementTest, PollReportsHardLimit) {

    TimeManagement tm;
    init(tm, FixedTime{1000});
    tm.start_polling();

    FinalizeReason reason;
    EXPECT_TRUE(tm.poll(995, 0, reason));
    EXPECT_EQ(reason, FinalizeReason::Hard);
}

TEST(TimeManagementTest, PollReportsNodeBudget) {

    TimeManagement tm;
    init(tm, FixedNodes{5000});
    tm.start_polling();

    FinalizeReason reason;
    EXPECT_FALSE(tm.poll(10, 4999, reason));
    EXPECT_TRUE(tm.poll(10, 5000, reason));
    EXPECT_EQ(reason, FinalizeReason::TimeManagerStop);
}

TEST(TimeManagementTest, AdviceOnlyTightensThePlannedEnd) {

    TimeManagement tm;
    init(tm, Byoyomi{0, 10000, 3});
    tm.start_polling();

    // Before soft nothing is planned
    tm.advise_after_iteration(1000);
    EXPECT_EQ(tm.planned_limit(), TimeManagement::Unlimited);
    EXPECT_EQ(tm.phase(), TimeManagement::Polling);

    tm.advise_after_iteration(7200);
    EXPECT_EQ(tm.planned_limit(), 7880);
    EXPECT_EQ(tm.phase(), TimeManagement::NearLimit);

    // A later iteration would plan later, the earlier end is kept
    tm.advise_after_iteration(8500);
    EXPECT_EQ(tm.planned_limit(), 7880);

    EXPECT_FALSE(tm.should_stop(7879));
    EXPECT_TRUE(tm.should_stop(7880));
}

TEST(TimeManagementTest, PlannedEndIsNeverBeforeSoft) {

    TimeManagement tm;
    init(tm, FixedTime{5000});
    tm.start_polling();

    tm.advise_after_iteration(tm.soft_limit());

    EXPECT_GE(tm.planned_limit(), tm.soft_limit());
    EXPECT_LE(tm.planned_limit(), tm.hard_limit());
}

TEST(TimeManagementTest, PonderhitAppliesTheInnerControl) {

    TimeManagement tm;
    init(tm, Ponder{std::make_shared<const TimeControl>(FixedTime{1000})});

    EXPECT_TRUE(tm.pondering());
    EXPECT_EQ(tm.hard_limit(), TimeManagement::Unlimited);
    EXPECT_FALSE(tm.should_stop(1000000));

    tm.on_ponderhit(5000);

    EXPECT_FALSE(tm.pondering());
    EXPECT_EQ(tm.hard_limit(), 990);

    // Limits are counted from the ponderhit
    EXPECT_FALSE(tm.should_stop(5000 + 989));
    EXPECT_TRUE(tm.should_stop(5000 + 990));
}

TEST(TimeManagementTest, ByoyomiPartialPeriod) {

    TimeManagement tm;
    init(tm, Byoyomi{0, 1000, 5});

    tm.update_after_move(2500);

    const ByoyomiState s = tm.byoyomi_state();
    EXPECT_EQ(s.periodsLeft, 3);
    EXPECT_EQ(s.currentPeriodMs, 500);
    EXPECT_TRUE(s.inByoyomi);
    EXPECT_FALSE(tm.should_stop(0));
}

TEST(TimeManagementTest, ByoyomiExactPeriodRestartsInFull) {

    TimeManagement tm;
    init(tm, Byoyomi{0, 1000, 5});

    tm.update_after_move(1000);

    const ByoyomiState s = tm.byoyomi_state();
    EXPECT_EQ(s.periodsLeft, 4);
    EXPECT_EQ(s.currentPeriodMs, 1000);
}

TEST(TimeManagementTest, ByoyomiMainTimeIsUsedFirst) {

    TimeManagement tm;
    init(tm, Byoyomi{3000, 1000, 2});

    tm.update_after_move(2000);

    ByoyomiState s = tm.byoyomi_state();
    EXPECT_EQ(s.mainLeftMs, 1000);
    EXPECT_EQ(s.periodsLeft, 2);
    EXPECT_FALSE(s.inByoyomi);

    tm.update_after_move(1500);

    s = tm.byoyomi_state();
    EXPECT_EQ(s.mainLeftMs, 0);
    EXPECT_TRUE(s.inByoyomi);
    EXPECT_EQ(s.periodsLeft, 2);
    EXPECT_EQ(s.currentPeriodMs, 500);
}

TEST(TimeManagementTest, ByoyomiExhaustedForcesStop) {

    TimeManagement tm;
    init(tm, Byoyomi{0, 1000, 3});

    tm.update_after_move(3500);

    const ByoyomiState s = tm.byoyomi_state();
    EXPECT_EQ(s.periodsLeft, 0);
    EXPECT_EQ(s.currentPeriodMs, 0);
    EXPECT_TRUE(tm.should_stop(0));

    tm.start_polling();
    FinalizeReason reason;
    EXPECT_TRUE(tm.poll(0, 0, reason));
    EXPECT_EQ(reason, FinalizeReason::Hard);
}

TEST(TimeManagementTest, PollIntervalStaysWithinBounds) {

    TimeManagement tm;
    init(tm, FixedTime{1000});
    tm.start_polling();

    EXPECT_EQ(tm.poll_interval(0, 20), 20);
    EXPECT_GE(tm.poll_interval(880, 20), 1);
    EXPECT_LE(tm.poll_interval(880, 20), 20);
    EXPECT_EQ(tm.poll_interval(5000, 20), 1);
}

TEST(TimeManagementTest, PvChangeHoldsBackTheOptionalStop) {

    TimeManagement tm;
    init(tm, FixedTime{5000});
    tm.start_polling();

    ASSERT_EQ(tm.opt_limit(), 3992);

    FinalizeReason reason;

    // Changed 10ms ago at depth 20, settles after 180ms
    tm.on_pv_change(3990, 20);
    EXPECT_FALSE(tm.is_pv_stable(4000));
    EXPECT_FALSE(tm.poll(4000, 0, reason));
    EXPECT_EQ(tm.phase(), TimeManagement::Polling);
    EXPECT_EQ(tm.planned_limit(), TimeManagement::Unlimited);

    EXPECT_TRUE(tm.is_pv_stable(4200));
    EXPECT_FALSE(tm.poll(4200, 0, reason));
    EXPECT_EQ(tm.phase(), TimeManagement::NearLimit);
    EXPECT_EQ(tm.planned_limit(), 4790);
}

TEST(TimeManagementTest, NearHardIgnoresPvStability) {

    TimeManagement tm;
    init(tm, FixedTime{5000});
    tm.start_polling();

    FinalizeReason reason;

    tm.on_pv_change(4780, 30);
    EXPECT_FALSE(tm.poll(4795, 0, reason));
    EXPECT_EQ(tm.planned_limit(), 4790);

    EXPECT_TRUE(tm.poll(4796, 0, reason));
    EXPECT_EQ(reason, FinalizeReason::NearHard);
}

TEST(TimeManagementTest, AdviceWaitsForAStablePv) {

    TimeManagement tm;
    init(tm, Byoyomi{0, 10000, 3});
    tm.start_polling();

    tm.on_pv_change(7150, 10);
    tm.advise_after_iteration(7200);
    EXPECT_EQ(tm.planned_limit(), TimeManagement::Unlimited);

    tm.advise_after_iteration(7300);
    EXPECT_EQ(tm.planned_limit(), 7880);
}

TEST(TimeManagementTest, PonderhitResetsPvStability) {

    TimeManagement tm;
    init(tm, Ponder{std::make_shared<const TimeControl>(Fischer{60000, 60000, 1000})});

    // A change while pondering belongs to the old time base
    tm.on_pv_change(3000, 10);
    tm.on_ponderhit(5000);

    EXPECT_FALSE(tm.is_pv_stable(5000));
    EXPECT_FALSE(tm.is_pv_stable(5080));
    EXPECT_TRUE(tm.is_pv_stable(5100));

    // The threshold grows with the depth of the change
    tm.on_pv_change(5100, 12);
    EXPECT_FALSE(tm.is_pv_stable(5100));
    EXPECT_FALSE(tm.is_pv_stable(5240));
    EXPECT_TRUE(tm.is_pv_stable(5250));
}

TEST(TimeManagementTest, CriticalClockStopsAtSoft) {

    TimeManagement tm;
    init(tm, Fischer{400, 400, 0});
    tm.start_polling();

    EXPECT_TRUE(tm.is_time_critical(0));

    tm.on_pv_change(45, 5);
    EXPECT_FALSE(tm.should_stop(49));
    EXPECT_TRUE(tm.should_stop(50));

    FinalizeReason reason;
    EXPECT_FALSE(tm.poll(40, 0, reason));
    EXPECT_TRUE(tm.poll(60, 0, reason));
    EXPECT_EQ(reason, FinalizeReason::NearHard);
}

TEST(TimeManagementTest, OverrunIsCritical) {

    TimeManagement tm;
    init(tm, FixedTime{1000});

    EXPECT_FALSE(tm.is_time_critical(0));
    EXPECT_FALSE(tm.is_time_critical(1089));
    EXPECT_TRUE(tm.is_time_critical(1090));
}

TEST(TimeManagementTest, ByoyomiAfterPonderhitChargesOnlyOurTime) {

    TimeManagement tm;
    init(tm, Ponder{std::make_shared<const TimeControl>(Byoyomi{0, 1000, 3})});

    // Nothing to charge before the ponderhit
    tm.update_after_move(4000);
    EXPECT_FALSE(tm.byoyomi_active());

    tm.on_ponderhit(5000);
    tm.update_after_move(5400);

    const ByoyomiState s = tm.byoyomi_state();
    EXPECT_EQ(s.periodsLeft, 3);
    EXPECT_EQ(s.currentPeriodMs, 600);
}
