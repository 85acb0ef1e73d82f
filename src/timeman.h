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

#ifndef TIMEMAN_H_INCLUDED
#define TIMEMAN_H_INCLUDED

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <limits>
#include <memory>
#include <mutex>
#include <thread>
#include <variant>

#include "misc.h"
#include "types.h"

namespace Ryufish {

class OptionsMap;

namespace Search {
struct LimitsType;
class SharedState;
}

// The time controls a search can be started with. Each one carries exactly
// the fields it needs.
struct FixedTime {
    TimePoint msPerMove;
};

struct Fischer {
    TimePoint white, black, increment;
};

struct Byoyomi {
    TimePoint mainTime, period;
    int       periods;
};

struct FixedNodes {
    uint64_t nodes;
};

struct Infinite {};

struct Ponder;

using TimeControl = std::variant<FixedTime, Fischer, Byoyomi, FixedNodes, Infinite, Ponder>;

// Pondering on the opponent's time. The inner control takes over at ponderhit.
struct Ponder {
    std::shared_ptr<const TimeControl> inner;
};

// Why the time manager (or the fail-safe) asked for the search to be finalized
enum class FinalizeReason {
    Hard,
    NearHard,
    Planned,
    TimeManagerStop,
    UserStop
};

const char* to_string(FinalizeReason reason);

// Values of the time related options, decoupled from OptionsMap so that the
// allocation can be computed without an engine.
struct TimeOptions {
    TimePoint networkDelay        = 120;
    TimePoint networkDelay2       = 1120;
    TimePoint minimumThinkingTime = 2000;
    int       slowMover           = 100;

    static TimeOptions from(const OptionsMap& options);
};

struct ByoyomiState {
    int       periodsLeft     = 0;
    TimePoint currentPeriodMs = 0;
    TimePoint mainLeftMs      = 0;
    bool      inByoyomi       = false;
};

// The TimeManagement class computes the optimal time to think depending on
// the maximum available time, the game move number, and other parameters.
//
// Four thresholds are derived from the time control:
//   soft    - fine to stop once the current iteration completes
//   opt     - preferable to stop, crossing it schedules the end of the search
//   hard    - must stop
//   planned - the wall clock instant the search was scheduled to end at,
//             unset until the search gets near a mandatory limit
//
// All of them are measured from the start of the search, or from ponderhit
// once the ponder search was converted. They are atomics because the main
// search worker and the time keeper thread read and tighten them concurrently.
class TimeManagement {
   public:
    static constexpr TimePoint Unlimited = std::numeric_limits<TimePoint>::max();

    enum Phase {
        Idle,
        Polling,
        NearLimit,
        Stopped
    };

    void init(const Search::LimitsType& limits, Color us, int ply, const OptionsMap& options);
    void init(const TimeControl& tc, Color us, int ply, const TimeOptions& options);

    void start_polling();
    void mark_stopped();

    TimePoint soft_limit() const { return softLimit.load(std::memory_order_relaxed); }
    TimePoint opt_limit() const { return optLimit.load(std::memory_order_relaxed); }
    TimePoint hard_limit() const { return hardLimit.load(std::memory_order_relaxed); }
    TimePoint planned_limit() const { return plannedLimit.load(std::memory_order_relaxed); }
    uint64_t  node_budget() const { return nodeBudget; }
    bool      pondering() const { return isPondering.load(std::memory_order_acquire); }
    Phase     phase() const { return Phase(curPhase.load(std::memory_order_acquire)); }

    // Pure decision, elapsed is measured from the start of the search
    bool should_stop(TimePoint elapsed, uint64_t nodes = 0) const;

    // One step of the polling state machine. Schedules the planned end when
    // entering the near-limit window and returns true with the finalize reason
    // once the search must stop.
    bool poll(TimePoint elapsed, uint64_t nodes, FinalizeReason& reason);

    // How long the time keeper may sleep before it has to look again
    TimePoint poll_interval(TimePoint elapsed, TimePoint maxInterval) const;

    // Called after every completed iteration of the main search job. May
    // tighten the planned end, never loosens it.
    void advise_after_iteration(TimePoint elapsed);

    // The best root move of the main job changed. A fresh change holds back
    // the optional stops for a while, longer at higher depths.
    void on_pv_change(TimePoint elapsed, Depth depth);
    bool is_pv_stable(TimePoint elapsed) const;

    // Too little time left to wait for a stable PV
    bool is_time_critical(TimePoint elapsed) const;

    void on_ponderhit(TimePoint elapsed);

    // Byoyomi bookkeeping once the move has been played. Elapsed is measured
    // from the start of the search, time spent pondering is not charged.
    void         update_after_move(TimePoint elapsed);
    bool         byoyomi_active() const;
    ByoyomiState byoyomi_state() const;

    TimePoint round_up(TimePoint t0) const;
    TimePoint safety_margin(TimePoint timeLeft) const;

   private:
    void      compute_limits(const TimeControl& tc);
    TimePoint effective(TimePoint elapsed) const;
    void      tighten_planned(TimePoint candidate, bool nearHard);

    TimeOptions opts;
    Color       us  = BLACK;
    int         ply = 0;

    std::atomic<TimePoint> softLimit{Unlimited};
    std::atomic<TimePoint> optLimit{Unlimited};
    std::atomic<TimePoint> hardLimit{Unlimited};
    std::atomic<TimePoint> plannedLimit{Unlimited};
    std::atomic<TimePoint> ponderhitOffset{0};
    std::atomic<int>       curPhase{Idle};
    std::atomic_bool       isPondering{false};
    std::atomic_bool       nearHardScheduled{false};
    std::atomic_bool       forfeited{false};
    std::atomic_bool       criticalClock{false};
    std::atomic<TimePoint> lastPvChange{0};
    std::atomic<TimePoint> pvThreshold{0};
    uint64_t               nodeBudget = 0;

    std::shared_ptr<const TimeControl> ponderInner;

    mutable std::mutex byoyomiMutex;
    bool               byoyomiActive = false;
    TimePoint          periodLength  = 0;
    ByoyomiState       byoyomi;
};


// TimeKeeper is the thread running the TimeManagement state machine for one
// search. It samples the elapsed time and node count, and when a limit is
// crossed it records the StopInfo, raises the stop flag and asks for a
// finalize notification.
class TimeKeeper {
   public:
    using FinalizeFn = std::function<void(FinalizeReason)>;

    TimeKeeper(std::shared_ptr<TimeManagement>     tm,
               std::shared_ptr<Search::SharedState> sharedState,
               TimePoint                            maxPollMs,
               FinalizeFn                           onFinalize);
    ~TimeKeeper();

    TimeKeeper(const TimeKeeper&)            = delete;
    TimeKeeper& operator=(const TimeKeeper&) = delete;

    void start();
    void stop();

   private:
    void idle_loop();

    std::shared_ptr<TimeManagement>      tm;
    std::shared_ptr<Search::SharedState> shared;
    TimePoint                            maxPoll;
    FinalizeFn                           onFinalize;

    std::mutex              mutex;
    std::condition_variable cv;
    bool                    exit = false;
    std::thread             stdThread;
};

}  // namespace Ryufish

#endif  // #ifndef TIMEMAN_H_INCLUDED
