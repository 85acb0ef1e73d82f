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

#include "failsafe.h"

#include <algorithm>
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <variant>

#include "search.h"

namespace Ryufish {

namespace {

constexpr TimePoint DefaultCeilingMs    = 60 * 60 * 1000;
constexpr TimePoint MinCeilingMs        = 1000;
constexpr TimePoint MinDepthOnlyCeiling = 10000;

}  // namespace


FailSafeGuard::FailSafeGuard(std::shared_ptr<Search::SharedState> sharedState,
                             FailSafeConfig                       cfg,
                             EscalateFn                           escalate) :
    shared(std::move(sharedState)),
    config(cfg),
    onEscalate(std::move(escalate)) {

    config.pollMs  = std::max(TimePoint(1), config.pollMs);
    config.graceMs = std::max(TimePoint(0), config.graceMs);

    curCeiling = ceiling_for(shared->limits.timeControl, shared->limits.depth > 0);
}

FailSafeGuard::~FailSafeGuard() { stop(); }


// The ceiling is far above anything the time manager would allow, it only
// triggers when the search does not react to a stop.
TimePoint FailSafeGuard::ceiling_for(const TimeControl& tc, bool depthLimited) {

    TimePoint ceiling = DefaultCeilingMs;

    if (const auto* ft = std::get_if<FixedTime>(&tc))
        ceiling = ft->msPerMove * 3;

    else if (const auto* f = std::get_if<Fischer>(&tc))
        ceiling = std::max(f->white, f->black) * 9 / 10;

    else if (const auto* b = std::get_if<Byoyomi>(&tc))
        ceiling = b->mainTime > 0 ? b->mainTime + b->period
                                  : std::max(b->period - 300, TimePoint(100));

    const bool depthOnly = depthLimited && std::holds_alternative<Infinite>(tc);

    return std::max(ceiling, depthOnly ? MinDepthOnlyCeiling : MinCeilingMs);
}


void FailSafeGuard::start() {
    assert(!stdThread.joinable());
    stdThread = std::thread(&FailSafeGuard::idle_loop, this);
}


void FailSafeGuard::stop() {
    {
        std::lock_guard<std::mutex> lk(mutex);
        exit = true;
    }
    cv.notify_all();

    if (stdThread.joinable())
        stdThread.join();
}


// Returns true if the guard was stopped or the search finished within ms
bool FailSafeGuard::wait_for_finish(TimePoint ms) {
    std::unique_lock<std::mutex> lk(mutex);
    return cv.wait_for(lk, std::chrono::milliseconds(ms),
                       [&] { return exit || shared->finished(); });
}


void FailSafeGuard::request_stop() {

    Search::StopInfo info;
    info.reason       = Search::TerminationReason::FailSafe;
    info.elapsed      = shared->elapsed();
    info.nodes        = shared->nodes_searched();
    info.depthReached = shared->best_depth();
    info.hardTimeout  = true;

    shared->request_stop(info);
}


void FailSafeGuard::idle_loop() {

    const auto& tc          = shared->limits.timeControl;
    const auto* ponder      = std::get_if<Ponder>(&tc);
    bool        ponderTaken = false;
    TimePoint   ponderhitAt = 0;

    while (!wait_for_finish(config.pollMs))
    {
        // Once, at ponderhit, the ceiling follows the inner time control
        if (ponder && !ponderTaken && ponder->inner && shared->limits.ponderhit
            && shared->limits.ponderhit->load(std::memory_order_acquire))
        {
            ponderTaken = true;
            ponderhitAt = shared->elapsed();
            curCeiling  = ceiling_for(*ponder->inner, shared->limits.depth > 0);
        }

        // Time spent pondering does not count against the clock
        const TimePoint elapsed = shared->elapsed() - ponderhitAt;

        if (elapsed <= ceiling())
            continue;

        sync_cout << "info string FAIL-SAFE: search exceeded the hard timeout of " << ceiling()
                  << "ms (elapsed " << elapsed << "ms), requesting stop" << sync_endl;

        request_stop();
        curStage = StopRequested;

        if (wait_for_finish(config.graceMs))
            break;

        sync_cout << "info string FAIL-SAFE: search still running " << config.graceMs
                  << "ms after the stop request, emitting the best known move" << sync_endl;

        request_stop();

        if (onEscalate)
            onEscalate();

        curStage = Escalated;

        if (wait_for_finish(config.graceMs))
            break;

        sync_cout << "info string FAIL-SAFE: fatal, search did not terminate" << sync_endl;

#ifdef RYUFISH_FAILSAFE_ABORT
        std::abort();
#endif

        curStage = GaveUp;
        return;
    }

    if (shared->finished())
    {
        int expected = Watching;
        curStage.compare_exchange_strong(expected, Finished);
    }
}

}  // namespace Ryufish
