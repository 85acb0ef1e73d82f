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

#ifndef FAILSAFE_H_INCLUDED
#define FAILSAFE_H_INCLUDED

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

#include "misc.h"
#include "timeman.h"

namespace Ryufish {

namespace Search {
class SharedState;
}

struct FailSafeConfig {
    TimePoint pollMs  = 100;
    TimePoint graceMs = 500;
};

// FailSafeGuard is a watchdog thread that knows nothing of the time
// manager. It derives a generous ceiling from the raw time control and, when
// a search outlives it, escalates in stages: stop request, second stop request
// with fallback emission, then a fatal report. Built with
// RYUFISH_FAILSAFE_ABORT the last stage aborts the process.
class FailSafeGuard {
   public:
    using EscalateFn = std::function<void()>;

    enum Stage {
        Watching,
        StopRequested,
        Escalated,
        GaveUp,
        Finished
    };

    FailSafeGuard(std::shared_ptr<Search::SharedState> sharedState,
                  FailSafeConfig                       config,
                  EscalateFn                           onEscalate);
    ~FailSafeGuard();

    FailSafeGuard(const FailSafeGuard&)            = delete;
    FailSafeGuard& operator=(const FailSafeGuard&) = delete;

    void start();
    void stop();

    Stage     stage() const { return Stage(curStage.load(std::memory_order_acquire)); }
    TimePoint ceiling() const { return curCeiling.load(std::memory_order_relaxed); }

    static TimePoint ceiling_for(const TimeControl& tc, bool depthLimited);

   private:
    void idle_loop();
    bool wait_for_finish(TimePoint ms);
    void request_stop();

    std::shared_ptr<Search::SharedState> shared;
    FailSafeConfig                       config;
    EscalateFn                           onEscalate;

    std::atomic<TimePoint> curCeiling{0};
    std::atomic<int>       curStage{Watching};

    std::mutex              mutex;
    std::condition_variable cv;
    bool                    exit = false;
    std::thread             stdThread;
};

}  // namespace Ryufish

#endif  // #ifndef FAILSAFE_H_INCLUDED
