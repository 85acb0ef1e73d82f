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

#include "engine.h"

#include <algorithm>
#include <atomic>
#include <cassert>
#include <iostream>
#include <optional>
#include <unordered_map>
#include <utility>

#include "failsafe.h"

namespace Ryufish {

namespace {

constexpr int MaxHashMB = 33554432;

std::string format_score(Value v) {

    if (v == -VALUE_INFINITE)
        return "cp 0";

    if (is_win(v))
        return "mate " + std::to_string(VALUE_MATE - v);

    if (is_loss(v))
        return "mate -" + std::to_string(VALUE_MATE + v);

    return "cp " + std::to_string(v);
}

void print_info(const Search::InfoFull& info) {
    sync_cout << "info depth " << info.depth << " seldepth " << info.selDepth << " score "
              << format_score(info.score) << " time " << info.timeMs << " nodes " << info.nodes
              << " nps " << info.nps << " hashfull " << info.hashfull << " pv " << info.pv
              << sync_endl;
}

void print_bestmove(const Bestmove& bm) {
    sync_cout << "bestmove " << bm.bestmove << (bm.ponder.empty() ? "" : " ponder " + bm.ponder)
              << sync_endl;
}

TimePoint limit_or_zero(TimePoint t) { return t == TimeManagement::Unlimited ? 0 : t; }

}  // namespace


Engine::Engine(std::shared_ptr<const Eval::Evaluator> eval) :
    evaluator(std::move(eval)),
    tt(std::make_shared<TranspositionTable>(16)),
    threads(tt),
    onBestmove(print_bestmove),
    onUpdateFull(print_info) {

    assert(evaluator);

    options.add("Debug Log File", Option("", [](const Option& o) {
                    start_logger(o);
                    return std::nullopt;
                }));

    options.add("Threads", Option(1, 1, 1024, [this](const Option&) {
                    resize_threads();
                    return std::optional<std::string>("Using " + std::to_string(threads.size())
                                                      + (threads.size() > 1 ? " threads" : " thread"));
                }));

    options.add("USI_Hash", Option(16, 1, MaxHashMB, [this](const Option& o) {
                    set_tt_size(size_t(int(o)));
                    return std::nullopt;
                }));

    options.add("Clear Hash", Option([this](const Option&) {
                    search_clear();
                    return std::nullopt;
                }));

    options.add("USI_Ponder", Option(false));
    options.add("NetworkDelay", Option(120, 0, 10000));
    options.add("NetworkDelay2", Option(1120, 0, 10000));
    options.add("MinimumThinkingTime", Option(2000, 1000, 100000));
    options.add("SlowMover", Option(100, 1, 1000));
    options.add("StopPollNodes", Option(1024, 1, 1 << 20));
    options.add("TimePollMaxMs", Option(20, 1, 1000));
    options.add("FailSafePollMs", Option(100, 1, 10000));
    options.add("FailSafeGraceMs", Option(500, 0, 60000));
    options.add("FinalizeGraceMs", Option(200, 0, 60000));

    options.add_info_listener([](const std::optional<std::string>& str) {
        if (str.has_value())
            sync_cout << "info string " << *str << sync_endl;
    });
}

Engine::~Engine() {
    stop();
    wait_for_search_finished();
}


void Engine::go(const Position& pos, Search::LimitsType limits) {

    wait_for_search_finished();

    if (!limits.startTime)
        limits.startTime = now();

    if (limits.is_ponder() && !limits.ponderhit)
        limits.ponderhit = std::make_shared<std::atomic_bool>(false);

    auto tm = std::make_shared<TimeManagement>();
    tm->init(limits, pos.side_to_move(), pos.game_ply(), options);

    tt->new_search();

    auto shared = std::make_shared<Search::SharedState>(limits, tm, ++sessionCounter);
    shared->stopPollNodes = options["StopPollNodes"];
    shared->set_on_update_full(onUpdateFull);

    {
        std::lock_guard<std::mutex> lk(mutex);
        current = shared;
    }

    searchThread = std::thread(&Engine::search_loop, this, shared, pos.clone());
}


void Engine::stop() {

    auto shared = last_search();

    if (!shared || shared->finished())
        return;

    Search::StopInfo info;
    info.reason       = Search::TerminationReason::UserStop;
    info.elapsed      = shared->elapsed();
    info.nodes        = shared->nodes_searched();
    info.depthReached = shared->best_depth();

    if (shared->request_stop(info))
        notify_finalize(*shared, FinalizeReason::UserStop);
}


void Engine::ponderhit() {

    auto shared = last_search();

    if (shared && shared->limits.ponderhit)
        shared->limits.ponderhit->store(true, std::memory_order_release);
}


void Engine::wait_for_search_finished() {
    if (searchThread.joinable())
        searchThread.join();
}


bool Engine::searching() const {
    auto shared = last_search();
    return shared && !shared->finished();
}


void Engine::set_tt_size(size_t mb) {
    wait_for_search_finished();
    tt->resize(mb);
}


void Engine::resize_threads() {
    wait_for_search_finished();
    threads.set(size_t(int(options["Threads"])));
}


void Engine::search_clear() {
    wait_for_search_finished();
    tt->clear();

    std::lock_guard<std::mutex> lk(mutex);
    byoyomi.reset();
}


int Engine::hashfull(int maxAge) const { return tt->hashfull(maxAge); }


void Engine::set_on_bestmove(OnBestmove&& f) { onBestmove = std::move(f); }

void Engine::set_on_update_full(OnUpdateFull&& f) { onUpdateFull = std::move(f); }

void Engine::set_on_finalize(OnFinalize&& f) { onFinalize = std::move(f); }


OptionsMap& Engine::get_options() { return options; }

const OptionsMap& Engine::get_options() const { return options; }


std::shared_ptr<Search::SharedState> Engine::last_search() const {
    std::lock_guard<std::mutex> lk(mutex);
    return current;
}


std::optional<ByoyomiState> Engine::byoyomi_state() const {
    std::lock_guard<std::mutex> lk(mutex);
    return byoyomi;
}


// Charges the time of the move about to be played to the byoyomi clock
void Engine::update_clock(TimeManagement& tm, TimePoint elapsed) {

    tm.update_after_move(elapsed);

    if (!tm.byoyomi_active())
        return;

    const ByoyomiState state = tm.byoyomi_state();

    if (state.inByoyomi && state.periodsLeft == 0)
        sync_cout << "info string all byoyomi periods used, the move is late" << sync_endl;

    std::lock_guard<std::mutex> lk(mutex);
    byoyomi = state;
}


// Body of the search thread. It starts the helpers, hands one job per pool
// thread to the pool and collects their results. Whatever happens, the
// result of the search is emitted once and the shared state is finished.
void Engine::search_loop(std::shared_ptr<Search::SharedState> shared,
                         std::unique_ptr<Position>            rootPos) {

    const auto& limits = shared->limits;

    // A depth capped search without a clock ends on its own. Infinite and
    // ponder searches never do, after a ponderhit the time keeper decides.
    const bool infinite = limits.is_infinite() && !limits.depth;
    auto       mustWait = [&] {
        return infinite
            || (limits.is_ponder() && !limits.ponderhit->load(std::memory_order_acquire));
    };

    MoveList legal;
    rootPos->generate(legal, LEGAL);

    std::vector<Move> rootMoves;
    for (Move m : legal)
        if (limits.searchmoves.empty()
            || std::count(limits.searchmoves.begin(), limits.searchmoves.end(), m))
            rootMoves.push_back(m);

    if (rootMoves.empty())
    {
        while (!shared->stopped() && mustWait())
            shared->wait_for_stop(IdlePollMs);

        Search::SearchResult result;
        result.score   = mated_in(0);
        result.elapsed = std::max(TimePoint(1), shared->elapsed());

        Search::StopInfo info;
        info.reason  = Search::TerminationReason::NoLegalMoves;
        info.elapsed = result.elapsed;
        shared->request_stop(info);

        info             = final_stop_info(*shared, 0);
        info.reason      = Search::TerminationReason::NoLegalMoves;
        info.hardTimeout = false;
        emit(*shared, *rootPos, result, info);
        shared->finish();
        return;
    }

    // Until an iteration completes, the first root move is the answer
    Search::RootSnapshot initial;
    initial.sessionId = shared->sessionId;
    initial.rootKey   = rootPos->key();
    initial.bestMove  = rootMoves[0];
    initial.pv        = {rootMoves[0]};
    initial.depth     = 0;
    shared->publish_root(initial);

    // The fallback emission may run on the guard thread, it formats moves
    // with its own copy of the root position.
    std::shared_ptr<const Position> fallbackPos = rootPos->clone();

    TimeKeeper keeper(shared->timeman, shared, options["TimePollMaxMs"],
                      [this, &shared](FinalizeReason reason) { notify_finalize(*shared, reason); });

    FailSafeGuard guard(shared,
                        FailSafeConfig{options["FailSafePollMs"], options["FailSafeGraceMs"]},
                        [this, &shared, fallbackPos]() { emit_snapshot(*shared, *fallbackPos); });

    keeper.start();
    guard.start();

    auto channel = std::make_shared<ResultChannel>();

    std::vector<SearchJob> jobs;
    for (size_t i = 0; i < threads.size(); ++i)
        jobs.push_back(SearchJob{rootPos->clone(), shared, evaluator, i == 0});

    threads.dispatch(std::move(jobs), channel);

    const TimePoint finalizeGrace = options["FinalizeGraceMs"];
    TimePoint       stopSeen      = 0;

    while (!shared->drained())
    {
        shared->wait_until_drained(stopSeen ? IdlePollMs : TimePoint(50), !stopSeen);

        if (!stopSeen && shared->stopped())
            stopSeen = now();

        if (stopSeen && !shared->emission_claimed() && now() - stopSeen >= finalizeGrace)
        {
            sync_cout << "info string workers still running " << finalizeGrace
                      << "ms after the stop, emitting the best known move" << sync_endl;

            emit_snapshot(*shared, *fallbackPos);
        }
    }

    while (!shared->stopped() && mustWait())
        shared->wait_for_stop(IdlePollMs);

    std::vector<WorkerResult> results = channel->drain();
    Search::SearchResult      best    = best_result(results, *shared);

    // The workers ran out of work without being stopped
    if (!shared->stopped())
    {
        Search::StopInfo done;
        done.reason = limits.depth && best.depth >= limits.depth
                      ? Search::TerminationReason::DepthLimit
                      : Search::TerminationReason::Completed;
        done.elapsed      = shared->elapsed();
        done.nodes        = shared->nodes_searched();
        done.depthReached = best.depth;
        shared->request_stop(done);
    }

    keeper.stop();

    best.nodes   = shared->nodes_searched();
    best.elapsed = std::max(TimePoint(1), shared->elapsed());
    best.nps     = best.nodes * 1000 / uint64_t(best.elapsed);

    if (shared->timeman)
        update_clock(*shared->timeman, best.elapsed);

    emit(*shared, *rootPos, best, final_stop_info(*shared, best.depth));

    shared->finish();
    guard.stop();
}


// Picks the result to emit with the thread voting of Stockfish: each worker
// votes for its best move with a weight growing with its score and depth.
// Shortest mates win outright. Without any usable result the published root
// snapshot is used.
Search::SearchResult Engine::best_result(const std::vector<WorkerResult>& results,
                                         const Search::SharedState&       shared) const {

    std::vector<const Search::SearchResult*> candidates;
    Depth                                    maxDepth = 0;

    for (const auto& wr : results)
        if (wr.result && wr.result->bestMove)
        {
            candidates.push_back(&*wr.result);
            maxDepth = std::max(maxDepth, wr.result->depth);
        }

    // Jobs stopped before their first iteration carry no score
    if (maxDepth > 0)
        candidates.erase(std::remove_if(candidates.begin(), candidates.end(),
                                        [](const Search::SearchResult* r) { return r->depth == 0; }),
                         candidates.end());

    const Search::RootSnapshot snapshot = shared.root_snapshot();

    if (candidates.empty() || snapshot.depth > maxDepth)
    {
        Search::SearchResult r;
        r.bestMove = snapshot.bestMove;
        r.ponder   = snapshot.ponder;
        r.pv       = snapshot.pv;
        r.score    = snapshot.score;
        r.depth    = snapshot.depth;
        return r;
    }

    std::unordered_map<Move, int64_t, Move::MoveHash> votes;

    Value minScore = VALUE_INFINITE;
    for (const auto* r : candidates)
        minScore = std::min(minScore, r->score);

    for (const auto* r : candidates)
        votes[r->bestMove] += int64_t(r->score - minScore + 14) * r->depth;

    const Search::SearchResult* best = candidates[0];

    for (const auto* r : candidates)
    {
        if (r == best)
            continue;

        if (is_win(best->score))
        {
            // Make sure we pick the shortest mate
            if (r->score > best->score)
                best = r;
        }
        else if (is_win(r->score)
                 || (!is_loss(r->score)
                     && (is_loss(best->score) || votes[r->bestMove] > votes[best->bestMove]
                         || (votes[r->bestMove] == votes[best->bestMove]
                             && r->depth > best->depth))))
            best = r;
    }

    return *best;
}


Search::StopInfo Engine::final_stop_info(const Search::SharedState& shared, Depth depth) const {

    Search::StopInfo info;

    if (auto recorded = shared.stop_info())
        info = *recorded;
    else
    {
        // The stop flag was raised directly by the owner of an external flag
        info.reason  = Search::TerminationReason::UserStop;
        info.elapsed = shared.elapsed();
        info.nodes   = shared.nodes_searched();
    }

    info.depthReached = std::max(info.depthReached, depth);

    if (shared.timeman)
    {
        info.softLimit    = limit_or_zero(shared.timeman->soft_limit());
        info.hardLimit    = limit_or_zero(shared.timeman->hard_limit());
        info.plannedLimit = limit_or_zero(shared.timeman->planned_limit());
    }

    return info;
}


void Engine::emit(Search::SharedState&        shared,
                  const Position&             rootPos,
                  const Search::SearchResult& result,
                  const Search::StopInfo&     info) {

    if (!shared.claim_emission())
        return;

    Bestmove bm;
    bm.sessionId = shared.sessionId;
    bm.bestmove  = result.bestMove ? rootPos.move_to_string(result.bestMove) : "resign";
    bm.ponder    = result.bestMove && result.ponder ? rootPos.move_to_string(result.ponder) : "";
    bm.result    = result;
    bm.stopInfo  = info;

    if (onBestmove)
        onBestmove(bm);
}


// Emits the deepest published root line, used when the workers did not
// return in time.
void Engine::emit_snapshot(Search::SharedState& shared, const Position& rootPos) {

    if (shared.emission_claimed())
        return;

    const Search::RootSnapshot snapshot = shared.root_snapshot();

    Search::SearchResult r;
    r.bestMove = snapshot.bestMove;
    r.ponder   = snapshot.ponder;
    r.pv       = snapshot.pv;
    r.score    = snapshot.score;
    r.depth    = snapshot.depth;
    r.nodes    = shared.nodes_searched();
    r.elapsed  = std::max(TimePoint(1), shared.elapsed());
    r.nps      = r.nodes * 1000 / uint64_t(r.elapsed);

    emit(shared, rootPos, r, final_stop_info(shared, snapshot.depth));
}


void Engine::notify_finalize(const Search::SharedState& shared, FinalizeReason reason) {
    if (onFinalize)
        onFinalize(shared.sessionId, reason);
}

}  // namespace Ryufish
