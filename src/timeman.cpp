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

#include "timeman.h"

#include <algorithm>
#include <cassert>
#include <chrono>
#include <cstdint>

#include "search.h"
#include "ucioption.h"

namespace Ryufish {

namespace {

// A clock below this without increment leaves no room for planning
constexpr TimePoint CriticalFischerMs = 500;

// Lower bound of the final push when main time and one period are all that is left
constexpr TimePoint CriticalByoyomiMs = 100;

// A best move that changed within this many ms (plus the slope per depth)
// is not trusted enough to stop at the soft limit
constexpr TimePoint PvBaseThresholdMs = 80;
constexpr TimePoint PvDepthSlopeMs    = 5;

// Games last long in shogi, so the horizon shrinks slowly with the game ply
int moves_left(int ply) { return ply < 60 ? 60 : ply < 160 ? 40 : 20; }

TimePoint sub(TimePoint a, TimePoint b) { return std::max(TimePoint(0), a - b); }

}  // namespace


const char* to_string(FinalizeReason reason) {
    switch (reason)
    {
    case FinalizeReason::Hard :
        return "hard";
    case FinalizeReason::NearHard :
        return "near-hard";
    case FinalizeReason::Planned :
        return "planned";
    case FinalizeReason::TimeManagerStop :
        return "time-manager";
    case FinalizeReason::UserStop :
        return "user";
    }
    return "unknown";
}


TimeOptions TimeOptions::from(const OptionsMap& options) {
    TimeOptions o;
    o.networkDelay        = TimePoint(options["NetworkDelay"]);
    o.networkDelay2       = TimePoint(options["NetworkDelay2"]);
    o.minimumThinkingTime = TimePoint(options["MinimumThinkingTime"]);
    o.slowMover           = int(options["SlowMover"]);
    return o;
}


void TimeManagement::init(const Search::LimitsType& limits,
                          Color                     us_,
                          int                       ply_,
                          const OptionsMap&         options) {
    init(limits.timeControl, us_, ply_, TimeOptions::from(options));
}


// Called at the beginning of the search and calculates the thresholds the
// search is allowed to use. Pondering starts with unlimited thresholds and
// the inner control is applied at ponderhit.
void TimeManagement::init(const TimeControl& tc, Color us_, int ply_, const TimeOptions& options) {

    opts = options;
    us   = us_;
    ply  = ply_;

    plannedLimit.store(Unlimited, std::memory_order_relaxed);
    ponderhitOffset.store(0, std::memory_order_relaxed);
    nearHardScheduled = false;
    forfeited         = false;
    curPhase          = Idle;
    lastPvChange.store(0, std::memory_order_relaxed);
    pvThreshold.store(PvBaseThresholdMs, std::memory_order_relaxed);

    if (const auto* p = std::get_if<Ponder>(&tc))
    {
        ponderInner = p->inner;
        softLimit.store(Unlimited, std::memory_order_relaxed);
        optLimit.store(Unlimited, std::memory_order_relaxed);
        hardLimit.store(Unlimited, std::memory_order_relaxed);
        nodeBudget = 0;
        isPondering.store(true, std::memory_order_release);
        return;
    }

    ponderInner.reset();
    isPondering.store(false, std::memory_order_release);
    compute_limits(tc);
}


void TimeManagement::compute_limits(const TimeControl& tc) {

    TimePoint soft = Unlimited, hard = Unlimited;
    nodeBudget     = 0;
    criticalClock  = false;

    {
        std::lock_guard<std::mutex> lk(byoyomiMutex);
        byoyomiActive = false;
        periodLength  = 0;
        byoyomi       = ByoyomiState();
    }

    if (const auto* ft = std::get_if<FixedTime>(&tc))
    {
        const TimePoint delay = std::min(TimePoint(10), opts.networkDelay);

        soft = sub(ft->msPerMove * 9 / 10 * opts.slowMover / 100, delay);
        hard = sub(ft->msPerMove, delay);
    }
    else if (const auto* f = std::get_if<Fischer>(&tc))
    {
        const TimePoint remaining = us == WHITE ? f->white : f->black;

        if (!f->increment && remaining < CriticalFischerMs)
        {
            soft          = 50;
            hard          = 100;
            criticalClock = true;
        }
        else
        {
            const TimePoint base = remaining / moves_left(ply) + f->increment * 8 / 10;

            soft = base * opts.slowMover / 100;
            hard = std::min(4 * soft, remaining * 8 / 10);
            soft = sub(soft, opts.networkDelay);
            hard = sub(hard, opts.networkDelay);
        }
    }
    else if (const auto* b = std::get_if<Byoyomi>(&tc))
    {
        {
            std::lock_guard<std::mutex> lk(byoyomiMutex);
            byoyomiActive             = true;
            periodLength              = b->period;
            byoyomi.mainLeftMs        = b->mainTime;
            byoyomi.periodsLeft       = b->periods;
            byoyomi.currentPeriodMs   = b->periods > 0 ? b->period : 0;
            byoyomi.inByoyomi         = b->mainTime == 0;
        }

        if (b->mainTime > 0 && b->period > 0 && b->mainTime * 10 < b->period * 12)
        {
            // Final push, the rest of the main time and one period
            const TimePoint total = b->mainTime + b->period;
            const TimePoint finalMs = std::max(sub(total, opts.networkDelay + opts.networkDelay2),
                                             std::min(total, CriticalByoyomiMs));
            hard          = finalMs;
            soft          = sub(finalMs, 50);
            criticalClock = true;
        }
        else if (b->mainTime > 0)
        {
            soft = b->mainTime / 5 * opts.slowMover / 100;
            hard = b->mainTime / 2;
        }
        else
        {
            hard = b->period > 2 * opts.networkDelay2 ? b->period - opts.networkDelay2
                                                      : b->period / 2;
            soft = std::min(b->period * 8 / 10 * opts.slowMover / 100, hard * 8 / 10);
        }
    }
    else if (const auto* n = std::get_if<FixedNodes>(&tc))
        nodeBudget = n->nodes;

    if (hard != Unlimited)
    {
        hard = std::max(hard, TimePoint(1));
        soft = std::min(soft, hard);
    }

    // opt never exceeds 80% of hard, even when soft already does. The planned
    // end is clamped to [soft, hard] so crossing opt early only schedules it.
    TimePoint opt = Unlimited;
    if (hard != Unlimited)
        opt = std::min(std::max(soft * 3 / 2, soft + 1), hard * 8 / 10);

    softLimit.store(soft, std::memory_order_relaxed);
    optLimit.store(opt, std::memory_order_relaxed);
    hardLimit.store(hard, std::memory_order_relaxed);
}


void TimeManagement::start_polling() {
    int expected = Idle;
    curPhase.compare_exchange_strong(expected, Polling);
}

void TimeManagement::mark_stopped() { curPhase = Stopped; }


TimePoint TimeManagement::effective(TimePoint elapsed) const {
    return sub(elapsed, ponderhitOffset.load(std::memory_order_relaxed));
}


bool TimeManagement::should_stop(TimePoint elapsed, uint64_t nodes) const {

    if (forfeited)
        return true;

    // We should not stop pondering until told so
    if (pondering())
        return false;

    if (nodeBudget && nodes >= nodeBudget)
        return true;

    const TimePoint e = effective(elapsed);
    return e >= hard_limit() || e >= planned_limit()
        || (e >= soft_limit() && is_time_critical(elapsed));
}


bool TimeManagement::poll(TimePoint elapsed, uint64_t nodes, FinalizeReason& reason) {

    if (phase() == Stopped)
        return false;

    if (forfeited)
    {
        reason = FinalizeReason::Hard;
        mark_stopped();
        return true;
    }

    if (pondering())
        return false;

    if (nodeBudget && nodes >= nodeBudget)
    {
        reason = FinalizeReason::TimeManagerStop;
        mark_stopped();
        return true;
    }

    const TimePoint e    = effective(elapsed);
    const TimePoint hard = hard_limit();

    if (e >= hard)
    {
        reason = FinalizeReason::Hard;
        mark_stopped();
        return true;
    }

    if (e >= planned_limit())
    {
        reason = nearHardScheduled ? FinalizeReason::NearHard : FinalizeReason::Planned;
        mark_stopped();
        return true;
    }

    if (e >= soft_limit() && is_time_critical(elapsed))
    {
        reason = FinalizeReason::NearHard;
        mark_stopped();
        return true;
    }

    // Entering the near-limit window only schedules the end of the search.
    // Crossing opt waits for the best move to settle down.
    if (phase() == Polling && hard != Unlimited)
    {
        const TimePoint margin   = safety_margin(hard);
        const bool      nearHard = e >= hard - margin;

        if (nearHard || (e >= opt_limit() && is_pv_stable(elapsed)))
        {
            tighten_planned(nearHard ? hard - margin : std::min(round_up(e), hard - margin),
                            nearHard || round_up(e) > hard - margin);
            curPhase = NearLimit;
        }
    }

    return false;
}


TimePoint TimeManagement::poll_interval(TimePoint elapsed, TimePoint maxInterval) const {

    const TimePoint hard = hard_limit();
    TimePoint       next = std::min(hard, planned_limit());

    if (pondering() || next == Unlimited)
        return maxInterval;

    if (phase() == Polling)
        next = std::min({next, opt_limit(), hard - safety_margin(hard)});

    return std::clamp((next - effective(elapsed)) / 8, TimePoint(1), maxInterval);
}


void TimeManagement::advise_after_iteration(TimePoint elapsed) {

    const TimePoint hard = hard_limit();

    if (pondering() || hard == Unlimited || phase() == Stopped)
        return;

    const TimePoint e = effective(elapsed);

    if (e < soft_limit() || !is_pv_stable(elapsed))
        return;

    // The margin shrinks as the clock runs low
    const TimePoint margin    = safety_margin(hard - e);
    TimePoint       candidate = round_up(e);
    bool            nearHard  = false;

    if (candidate > hard - margin)
    {
        candidate = std::max(hard - margin, e);
        nearHard  = true;
    }

    tighten_planned(candidate, nearHard);

    int expected = Polling;
    curPhase.compare_exchange_strong(expected, NearLimit);
}


void TimeManagement::on_pv_change(TimePoint elapsed, Depth depth) {
    lastPvChange.store(effective(elapsed), std::memory_order_relaxed);
    pvThreshold.store(PvBaseThresholdMs + std::max(depth, 0) * PvDepthSlopeMs,
                      std::memory_order_relaxed);
}

bool TimeManagement::is_pv_stable(TimePoint elapsed) const {
    return effective(elapsed) - lastPvChange.load(std::memory_order_relaxed)
         > pvThreshold.load(std::memory_order_relaxed);
}

bool TimeManagement::is_time_critical(TimePoint elapsed) const {

    if (forfeited || criticalClock)
        return true;

    // Overran hard by more than 10%, the time keeper fell behind
    const TimePoint hard = hard_limit();
    return hard != Unlimited && effective(elapsed) > hard + hard / 10;
}


// The planned end stays within [soft, hard] and only ever moves earlier
void TimeManagement::tighten_planned(TimePoint candidate, bool nearHard) {

    candidate = std::clamp(candidate, soft_limit(), hard_limit());

    TimePoint current = plannedLimit.load(std::memory_order_relaxed);
    while (candidate < current)
        if (plannedLimit.compare_exchange_weak(current, candidate, std::memory_order_relaxed))
        {
            nearHardScheduled = nearHard;
            break;
        }
}


// Rounds the elapsed time up to the next whole second as seen by the GUI,
// the first second of thinking is always paid for so at least
// MinimumThinkingTime is used.
TimePoint TimeManagement::round_up(TimePoint t0) const {

    TimePoint t = std::max((t0 + 999) / 1000 * 1000, opts.minimumThinkingTime);

    t -= opts.networkDelay;

    if (t < t0)
        t += 1000;

    return std::min(t, hard_limit());
}


TimePoint TimeManagement::safety_margin(TimePoint timeLeft) const {

    const TimePoint tier = timeLeft >= 10000 ? 1200
                         : timeLeft >= 5000  ? 500
                         : timeLeft >= 2000  ? 200
                                             : 100;

    return std::max(TimePoint(0), std::min({tier, opts.networkDelay2, timeLeft / 5}));
}


// The ponder search continues as a normal search from now on, with the
// thresholds of the inner control counted from the ponderhit instant.
void TimeManagement::on_ponderhit(TimePoint elapsed) {

    if (!pondering())
        return;

    ponderhitOffset.store(elapsed, std::memory_order_relaxed);

    // PV changes seen while pondering belong to the old time base
    lastPvChange.store(0, std::memory_order_relaxed);
    pvThreshold.store(PvBaseThresholdMs, std::memory_order_relaxed);

    compute_limits(ponderInner ? *ponderInner : TimeControl(Infinite{}));
    isPondering.store(false, std::memory_order_release);
}


// Main time is consumed first, then whole periods. A period that is used up
// exactly restarts in full, so only the remainder of the last one is kept.
void TimeManagement::update_after_move(TimePoint elapsed) {

    std::lock_guard<std::mutex> lk(byoyomiMutex);

    if (!byoyomiActive)
        return;

    TimePoint spent = effective(elapsed);

    if (byoyomi.mainLeftMs > 0)
    {
        const TimePoint used = std::min(spent, byoyomi.mainLeftMs);
        byoyomi.mainLeftMs -= used;
        spent -= used;

        if (byoyomi.mainLeftMs > 0)
            return;

        byoyomi.inByoyomi = true;
    }

    while (byoyomi.periodsLeft > 0 && spent >= byoyomi.currentPeriodMs)
    {
        spent -= byoyomi.currentPeriodMs;
        byoyomi.periodsLeft--;
        byoyomi.currentPeriodMs = periodLength;
    }

    if (byoyomi.periodsLeft == 0)
    {
        byoyomi.currentPeriodMs = 0;
        forfeited               = true;
    }
    else
        byoyomi.currentPeriodMs -= spent;
}


bool TimeManagement::byoyomi_active() const {
    std::lock_guard<std::mutex> lk(byoyomiMutex);
    return byoyomiActive;
}

ByoyomiState TimeManagement::byoyomi_state() const {
    std::lock_guard<std::mutex> lk(byoyomiMutex);
    return byoyomi;
}


TimeKeeper::TimeKeeper(std::shared_ptr<TimeManagement>      timeman,
                       std::shared_ptr<Search::SharedState> sharedState,
                       TimePoint                            maxPollMs,
                       FinalizeFn                           finalize) :
    tm(std::move(timeman)),
    shared(std::move(sharedState)),
    maxPoll(std::max(TimePoint(1), maxPollMs)),
    onFinalize(std::move(finalize)) {}

TimeKeeper::~TimeKeeper() { stop(); }


void TimeKeeper::start() {
    assert(!stdThread.joinable());

    tm->start_polling();
    stdThread = std::thread(&TimeKeeper::idle_loop, this);
}


void TimeKeeper::stop() {
    {
        std::lock_guard<std::mutex> lk(mutex);
        exit = true;
    }
    cv.notify_all();

    if (stdThread.joinable())
        stdThread.join();
}


// The time keeper sleeps a fraction of the distance to the next limit, so
// it wakes up often near a deadline and rarely far from one.
void TimeKeeper::idle_loop() {

    while (true)
    {
        const TimePoint interval = tm->poll_interval(shared->elapsed(), maxPoll);

        {
            std::unique_lock<std::mutex> lk(mutex);
            cv.wait_for(lk, std::chrono::milliseconds(interval), [&] { return exit; });

            if (exit)
                return;
        }

        if (shared->stopped())
        {
            tm->mark_stopped();
            return;
        }

        const auto& ponderhit = shared->limits.ponderhit;
        if (tm->pondering() && ponderhit && ponderhit->load(std::memory_order_acquire))
            tm->on_ponderhit(shared->elapsed());

        const TimePoint elapsed = shared->elapsed();
        const uint64_t  nodes   = shared->nodes_searched();
        FinalizeReason  reason;

        if (tm->poll(elapsed, nodes, reason))
        {
            Search::StopInfo info;
            info.reason = reason == FinalizeReason::TimeManagerStop
                          ? Search::TerminationReason::NodeLimit
                          : Search::TerminationReason::TimeLimit;
            info.elapsed      = elapsed;
            info.nodes        = nodes;
            info.depthReached = shared->best_depth();
            info.hardTimeout  = reason == FinalizeReason::Hard;
            info.softLimit    = tm->soft_limit();
            info.hardLimit    = tm->hard_limit();
            info.plannedLimit = tm->planned_limit();

            shared->request_stop(info);

            if (onFinalize)
                onFinalize(reason);

            return;
        }
    }
}

}  // namespace Ryufish
