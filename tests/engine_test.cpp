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
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "engine.h"
#include "test_game.h"

using namespace Ryufish;
using Testing::TakeAwayGame;
using Testing::TreeGame;

namespace {

using Search::TerminationReason;

// Engine with its output captured instead of printed
class EngineTest: public ::testing::Test {
   protected:
    void SetUp() override { make_engine(std::make_shared<Testing::NullEvaluator>()); }

    void make_engine(std::shared_ptr<const Eval::Evaluator> eval) {
        engine = std::make_unique<Engine>(std::move(eval));

        engine->set_on_bestmove([this](const Bestmove& bm) {
            std::lock_guard<std::mutex> lk(mutex);
            bestmoves.push_back(bm);
        });
        engine->set_on_update_full([this](const Search::InfoFull& info) {
            std::lock_guard<std::mutex> lk(mutex);
            infos.push_back(info);
        });
        engine->set_on_finalize([this](uint64_t, FinalizeReason reason) {
            std::lock_guard<std::mutex> lk(mutex);
            finalizes.push_back(reason);
        });
    }

    void TearDown() override { engine.reset(); }

    size_t emitted() {
        std::lock_guard<std::mutex> lk(mutex);
        return bestmoves.size();
    }

    Bestmove last() {
        std::lock_guard<std::mutex> lk(mutex);
        return bestmoves.back();
    }

    static void sleep(int ms) { std::this_thread::sleep_for(std::chrono::milliseconds(ms)); }

    std::unique_ptr<Engine>       engine;
    std::mutex                    mutex;
    std::vector<Bestmove>         bestmoves;
    std::vector<Search::InfoFull> infos;
    std::vector<FinalizeReason>   finalizes;
};

Search::LimitsType depth_limits(Depth d) {
    Search::LimitsType limits;
    limits.depth = d;
    return limits;
}

Search::LimitsType time_limits(TimeControl tc) {
    Search::LimitsType limits;
    limits.timeControl = std::move(tc);
    return limits;
}

}  // namespace


TEST_F(EngineTest, HasTheUsiOptions) {

    const OptionsMap& options = engine->get_options();

    for (const char* name : {"Threads", "USI_Hash", "Clear Hash", "USI_Ponder", "NetworkDelay",
                             "NetworkDelay2", "MinimumThinkingTime", "SlowMover", "StopPollNodes",
                             "TimePollMaxMs", "FailSafePollMs", "FailSafeGraceMs",
                             "FinalizeGraceMs", "Debug Log File"})
        EXPECT_EQ(options.count(name), 1u) << name;

    EXPECT_EQ(int(options["threads"]), 1);
    EXPECT_EQ(int(options["USI_Hash"]), 16);
}

TEST_F(EngineTest, RejectsInvalidOptionValues) {

    OptionsMap& options = engine->get_options();

    EXPECT_FALSE(options.set("NoSuchOption", "1"));
    EXPECT_FALSE(options.set("Threads", "0"));
    EXPECT_FALSE(options.set("Threads", "many"));
    EXPECT_FALSE(options.set("USI_Ponder", "maybe"));

    EXPECT_EQ(int(options["Threads"]), 1);
    EXPECT_EQ(engine->threads_count(), 1u);

    EXPECT_TRUE(options.set("Threads", "3"));
    EXPECT_EQ(engine->threads_count(), 3u);
}

TEST_F(EngineTest, OptionNamesCompareAsUnsignedBytes) {

    const CaseInsensitiveLess less;

    EXPECT_TRUE(less("abc", "\xE9t\xE9"));
    EXPECT_FALSE(less("\xE9t\xE9", "abc"));
    EXPECT_FALSE(less("THREADS", "threads"));
    EXPECT_FALSE(less("threads", "THREADS"));
}

TEST_F(EngineTest, DepthSearchFindsTheWin) {

    engine->go(TakeAwayGame(5), depth_limits(6));
    engine->wait_for_search_finished();

    ASSERT_EQ(emitted(), 1u);

    const Bestmove bm = last();
    EXPECT_EQ(bm.bestmove, "t1");
    EXPECT_EQ(bm.result.score, mate_in(3));
    EXPECT_EQ(bm.result.depth, 6);
    EXPECT_EQ(bm.stopInfo.reason, TerminationReason::DepthLimit);
    EXPECT_FALSE(bm.stopInfo.hardTimeout);
    EXPECT_GE(bm.result.elapsed, 1);

    auto shared = engine->last_search();
    ASSERT_TRUE(shared);
    EXPECT_TRUE(shared->finished());
    EXPECT_TRUE(shared->drained());

    std::lock_guard<std::mutex> lk(mutex);
    ASSERT_FALSE(infos.empty());
    EXPECT_EQ(infos.back().depth, 6);
}

TEST_F(EngineTest, ThreadsVoteForTheSameWin) {

    ASSERT_TRUE(engine->get_options().set("Threads", "4"));

    engine->go(TakeAwayGame(9), depth_limits(8));
    engine->wait_for_search_finished();

    ASSERT_EQ(emitted(), 1u);
    EXPECT_EQ(last().bestmove, "t1");
    EXPECT_EQ(last().result.score, mate_in(5));
}

TEST_F(EngineTest, NoLegalMovesEmitsResign) {

    engine->go(TakeAwayGame(0), time_limits(FixedTime{1000}));
    engine->wait_for_search_finished();

    ASSERT_EQ(emitted(), 1u);

    const Bestmove bm = last();
    EXPECT_EQ(bm.bestmove, "resign");
    EXPECT_TRUE(bm.ponder.empty());
    EXPECT_EQ(bm.result.bestMove, Move::none());
    EXPECT_EQ(bm.result.score, mated_in(0));
    EXPECT_EQ(bm.stopInfo.reason, TerminationReason::NoLegalMoves);
}

TEST_F(EngineTest, InfiniteSearchWaitsForStop) {

    make_engine(std::make_shared<Testing::HashEvaluator>());

    engine->go(TreeGame(6), time_limits(Infinite{}));

    sleep(300);
    EXPECT_EQ(emitted(), 0u);
    EXPECT_TRUE(engine->searching());

    engine->stop();
    engine->wait_for_search_finished();

    ASSERT_EQ(emitted(), 1u);

    const Bestmove bm = last();
    EXPECT_NE(bm.bestmove, "resign");
    EXPECT_EQ(bm.stopInfo.reason, TerminationReason::UserStop);
    EXPECT_GT(bm.result.depth, 0);

    std::lock_guard<std::mutex> lk(mutex);
    ASSERT_EQ(finalizes.size(), 1u);
    EXPECT_EQ(finalizes[0], FinalizeReason::UserStop);
}

TEST_F(EngineTest, FinishedInfiniteSearchStillWaitsForStop) {

    // Solved long before the stop arrives
    engine->go(TakeAwayGame(6), time_limits(Infinite{}));

    sleep(500);
    EXPECT_EQ(emitted(), 0u);

    engine->stop();
    engine->wait_for_search_finished();

    ASSERT_EQ(emitted(), 1u);
    EXPECT_EQ(last().bestmove, "t2");
    EXPECT_EQ(last().stopInfo.reason, TerminationReason::UserStop);
}

TEST_F(EngineTest, NodeLimit) {

    make_engine(std::make_shared<Testing::HashEvaluator>());

    engine->go(TreeGame(6), time_limits(FixedNodes{20000}));
    engine->wait_for_search_finished();

    ASSERT_EQ(emitted(), 1u);

    const Bestmove bm = last();
    EXPECT_EQ(bm.stopInfo.reason, TerminationReason::NodeLimit);
    EXPECT_GE(bm.result.nodes, 20000u);
    EXPECT_NE(bm.bestmove, "resign");
}

TEST_F(EngineTest, FixedTimeStopsBetweenSoftAndHard) {

    make_engine(std::make_shared<Testing::HashEvaluator>());

    engine->go(TreeGame(6), time_limits(FixedTime{300}));
    engine->wait_for_search_finished();

    ASSERT_EQ(emitted(), 1u);

    const Bestmove bm = last();
    EXPECT_EQ(bm.stopInfo.reason, TerminationReason::TimeLimit);
    EXPECT_EQ(bm.stopInfo.softLimit, 260);
    EXPECT_EQ(bm.stopInfo.hardLimit, 290);
    EXPECT_GE(bm.stopInfo.elapsed, 260);
    EXPECT_LT(bm.result.elapsed, 600);

    std::lock_guard<std::mutex> lk(mutex);
    ASSERT_EQ(finalizes.size(), 1u);
    EXPECT_NE(finalizes[0], FinalizeReason::UserStop);
}

TEST_F(EngineTest, PonderhitSwitchesToTheClock) {

    make_engine(std::make_shared<Testing::HashEvaluator>());

    const auto inner = std::make_shared<const TimeControl>(FixedTime{300});
    engine->go(TreeGame(6), time_limits(Ponder{inner}));

    sleep(200);
    EXPECT_EQ(emitted(), 0u);

    const TimePoint ponderhitTime = now();
    engine->ponderhit();
    engine->wait_for_search_finished();

    ASSERT_EQ(emitted(), 1u);
    EXPECT_GE(now() - ponderhitTime, 250);
    EXPECT_EQ(last().stopInfo.reason, TerminationReason::TimeLimit);
}

TEST_F(EngineTest, LongPonderKeepsTheWholeClock) {

    make_engine(std::make_shared<Testing::HashEvaluator>());

    // The fail-safe ceiling of this control is one second
    const auto inner = std::make_shared<const TimeControl>(FixedTime{300});
    engine->go(TreeGame(6), time_limits(Ponder{inner}));

    sleep(1300);
    EXPECT_EQ(emitted(), 0u);

    const TimePoint ponderhitTime = now();
    engine->ponderhit();
    engine->wait_for_search_finished();

    ASSERT_EQ(emitted(), 1u);
    EXPECT_GE(now() - ponderhitTime, 250);
    EXPECT_EQ(last().stopInfo.reason, TerminationReason::TimeLimit);
}

TEST_F(EngineTest, ByoyomiClockIsChargedAfterEachMove) {

    make_engine(std::make_shared<Testing::HashEvaluator>());
    EXPECT_FALSE(engine->byoyomi_state().has_value());

    engine->go(TreeGame(6), time_limits(Byoyomi{0, 1000, 2}));
    engine->wait_for_search_finished();
    ASSERT_EQ(emitted(), 1u);

    auto state = engine->byoyomi_state();
    ASSERT_TRUE(state.has_value());
    EXPECT_TRUE(state->inByoyomi);
    EXPECT_EQ(state->periodsLeft, 2);
    EXPECT_EQ(state->currentPeriodMs, 1000 - last().result.elapsed);

    // Main time is used before the periods
    engine->go(TreeGame(6, 2), time_limits(Byoyomi{3000, 1000, 1}));
    engine->wait_for_search_finished();
    ASSERT_EQ(emitted(), 2u);

    state = engine->byoyomi_state();
    ASSERT_TRUE(state.has_value());
    EXPECT_FALSE(state->inByoyomi);
    EXPECT_EQ(state->periodsLeft, 1);
    EXPECT_EQ(state->mainLeftMs, 3000 - last().result.elapsed);

    ASSERT_TRUE(engine->get_options().set("Clear Hash", ""));
    EXPECT_FALSE(engine->byoyomi_state().has_value());
}

TEST_F(EngineTest, HugeNodeBudget) {

    make_engine(std::make_shared<Testing::HashEvaluator>());

    engine->go(TreeGame(6), time_limits(FixedNodes{uint64_t(1) << 50}));

    sleep(100);
    EXPECT_TRUE(engine->searching());

    engine->stop();
    engine->wait_for_search_finished();

    ASSERT_EQ(emitted(), 1u);
    EXPECT_EQ(last().stopInfo.reason, TerminationReason::UserStop);
    EXPECT_GT(last().result.nodes, 0u);
}

TEST_F(EngineTest, StopWithoutSearchIsHarmless) {

    engine->stop();
    engine->ponderhit();
    engine->wait_for_search_finished();

    EXPECT_FALSE(engine->searching());
    EXPECT_EQ(emitted(), 0u);
}

TEST_F(EngineTest, ExternalStopFlag) {

    make_engine(std::make_shared<Testing::HashEvaluator>());

    Search::LimitsType limits;
    limits.stop = std::make_shared<std::atomic_bool>(false);

    engine->go(TreeGame(6), limits);

    sleep(100);
    limits.stop->store(true, std::memory_order_release);

    engine->wait_for_search_finished();

    ASSERT_EQ(emitted(), 1u);
    EXPECT_EQ(last().stopInfo.reason, TerminationReason::UserStop);
}

TEST_F(EngineTest, RacingStopsEmitExactlyOnce) {

    make_engine(std::make_shared<Testing::HashEvaluator>());
    ASSERT_TRUE(engine->get_options().set("Threads", "4"));
    ASSERT_TRUE(engine->get_options().set("FinalizeGraceMs", "0"));

    for (int i = 0; i < 20; ++i)
    {
        engine->go(TreeGame(6, uint64_t(i) + 1), time_limits(FixedTime{60}));

        std::thread stopper([&, i] {
            sleep(40 + i % 5 * 5);
            engine->stop();
        });

        engine->wait_for_search_finished();
        stopper.join();
    }

    std::map<uint64_t, int> perSession;
    {
        std::lock_guard<std::mutex> lk(mutex);
        for (const auto& bm : bestmoves)
            perSession[bm.sessionId]++;
    }

    EXPECT_EQ(perSession.size(), 20u);
    for (const auto& [session, count] : perSession)
        EXPECT_EQ(count, 1) << "session " << session;
}

TEST_F(EngineTest, FailSafeRacingStopEmitsExactlyOnce) {

#ifdef RYUFISH_FAILSAFE_ABORT
    GTEST_SKIP() << "the last fail-safe stage aborts the process in this build";
#endif

    // Workers notice a stop only every 20ms, long after the fail-safe grace
    make_engine(std::make_shared<Testing::SlowEvaluator>(20));

    OptionsMap& options = engine->get_options();
    ASSERT_TRUE(options.set("Threads", "2"));
    ASSERT_TRUE(options.set("FailSafePollMs", "1"));
    ASSERT_TRUE(options.set("FailSafeGraceMs", "2"));
    ASSERT_TRUE(options.set("FinalizeGraceMs", "0"));

    for (int i = 0; i < 10; ++i)
    {
        // Started long ago, so the time keeper and the fail-safe fire at once
        Search::LimitsType limits = time_limits(FixedTime{100});
        limits.startTime          = now() - 5000;

        engine->go(TreeGame(6, uint64_t(i) + 1), limits);

        std::thread stopper([&, i] {
            sleep(i % 3);
            engine->stop();
        });

        engine->wait_for_search_finished();
        stopper.join();
    }

    std::map<uint64_t, int> perSession;
    {
        std::lock_guard<std::mutex> lk(mutex);
        for (const auto& bm : bestmoves)
        {
            perSession[bm.sessionId]++;
            EXPECT_NE(bm.bestmove, "resign");
        }
    }

    EXPECT_EQ(perSession.size(), 10u);
    for (const auto& [session, count] : perSession)
        EXPECT_EQ(count, 1) << "session " << session;
}

TEST_F(EngineTest, SessionsAdvance) {

    engine->go(TakeAwayGame(5), depth_limits(3));
    engine->wait_for_search_finished();
    const uint64_t first = last().sessionId;

    engine->go(TakeAwayGame(7), depth_limits(4));
    engine->wait_for_search_finished();

    EXPECT_EQ(last().sessionId, first + 1);
    EXPECT_EQ(last().bestmove, "t3");
}

TEST_F(EngineTest, ClearHashEmptiesTheTable) {

    make_engine(std::make_shared<Testing::HashEvaluator>());

    engine->go(TreeGame(6), time_limits(FixedTime{300}));
    engine->wait_for_search_finished();

    EXPECT_GT(engine->hashfull(), 0);

    ASSERT_TRUE(engine->get_options().set("Clear Hash", ""));
    EXPECT_EQ(engine->hashfull(), 0);
}
