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

#include "search.h"

#include <algorithm>
#include <cassert>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <utility>

#include "tt.h"

namespace Ryufish {

using namespace Search;

namespace {

Value value_to_tt(Value v, int ply);
Value value_from_tt(Value v, int ply);
void  update_pv(Move* pv, Move move, const Move* childPv);

}  // namespace


const char* Search::to_string(TerminationReason reason) {
    switch (reason)
    {
    case TerminationReason::None :
        return "none";
    case TerminationReason::Completed :
        return "completed";
    case TerminationReason::DepthLimit :
        return "depth";
    case TerminationReason::NodeLimit :
        return "nodes";
    case TerminationReason::TimeLimit :
        return "time";
    case TerminationReason::UserStop :
        return "user";
    case TerminationReason::FailSafe :
        return "fail-safe";
    case TerminationReason::NoLegalMoves :
        return "no-legal-moves";
    }
    return "unknown";
}


Search::SharedState::SharedState(const LimitsType&               lim,
                         std::shared_ptr<TimeManagement> tm,
                         uint64_t                        id) :
    limits(lim),
    timeman(std::move(tm)),
    sessionId(id),
    stop(lim.stop ? lim.stop : std::make_shared<std::atomic_bool>(false)),
    nodes(lim.nodes ? lim.nodes : std::make_shared<std::atomic<uint64_t>>(0)),
    qnodes(lim.qnodes ? lim.qnodes : std::make_shared<std::atomic<uint64_t>>(0)) {}


// The StopInfo is recorded before the flag is raised, both under the lock,
// so that whoever observes stopped() also observes stop_info().
bool Search::SharedState::request_stop(const StopInfo& info) {

    bool recorded = false;
    {
        std::lock_guard<std::mutex> lk(mutex);

        if (!stopInfo)
        {
            stopInfo = info;
            recorded = true;
        }

        stop->store(true, std::memory_order_release);
    }
    cv.notify_all();

    return recorded;
}


std::optional<StopInfo> Search::SharedState::stop_info() const {
    std::lock_guard<std::mutex> lk(mutex);
    return stopInfo;
}


void Search::SharedState::publish_root(const RootSnapshot& s) {
    std::lock_guard<std::mutex> lk(mutex);

    if (s.depth >= snapshot.depth)
    {
        snapshot = s;
        bestDepth.store(s.depth, std::memory_order_relaxed);
    }
}


RootSnapshot Search::SharedState::root_snapshot() const {
    std::lock_guard<std::mutex> lk(mutex);
    return snapshot;
}


void Search::SharedState::work_dispatched(size_t n) { pendingWork.fetch_add(n, std::memory_order_acq_rel); }

void Search::SharedState::work_started() { activeWorkers.fetch_add(1, std::memory_order_acq_rel); }

void Search::SharedState::work_completed() {
    {
        std::lock_guard<std::mutex> lk(mutex);
        assert(activeWorkers > 0 && pendingWork > 0);

        activeWorkers.fetch_sub(1, std::memory_order_acq_rel);
        pendingWork.fetch_sub(1, std::memory_order_acq_rel);
    }
    cv.notify_all();
}

// A queued job that was dropped without running
void Search::SharedState::work_cancelled() {
    {
        std::lock_guard<std::mutex> lk(mutex);
        assert(pendingWork > 0);

        pendingWork.fetch_sub(1, std::memory_order_acq_rel);
    }
    cv.notify_all();
}


bool Search::SharedState::wait_until_drained(TimePoint timeoutMs, bool orStopped) {
    std::unique_lock<std::mutex> lk(mutex);
    cv.wait_for(lk, std::chrono::milliseconds(timeoutMs),
                [&] { return drained() || (orStopped && stopped()); });
    return drained();
}


bool Search::SharedState::wait_for_stop(TimePoint timeoutMs) {
    std::unique_lock<std::mutex> lk(mutex);
    return cv.wait_for(lk, std::chrono::milliseconds(timeoutMs), [&] { return stopped(); });
}


void Search::SharedState::finish() {
    {
        std::lock_guard<std::mutex> lk(mutex);
        isFinished.store(true, std::memory_order_release);
    }
    cv.notify_all();
}


Search::Worker::Worker(std::shared_ptr<TranspositionTable> transpositionTable, size_t threadId) :
    rng(1),
    threadIdx(threadId),
    tt(std::move(transpositionTable)) {
    clear();
}


void Search::Worker::clear() {
    for (auto& h : mainHistory)
        h.fill(0);
}


// Called by the pool thread for every job. Each job gets its own seed so
// that helpers searching the same root order their moves differently.
SearchResult Search::Worker::start_searching(Position&                    pos,
                                     std::shared_ptr<SharedState> sharedState,
                                     const Eval::Evaluator&       eval,
                                     bool                         mainJob) {

    rootPos   = &pos;
    shared    = std::move(sharedState);
    evaluator = &eval;
    isMainJob = mainJob;
    rng       = PRNG(mix_seed(shared->sessionId, pos.key(), threadIdx));
    jobStart  = now();

    clear();

    rootDepth = completedDepth = 0;
    selDepth                   = 0;
    nodes                      = 0;
    stopPollNodes              = std::max(1, shared->stopPollNodes);
    callsCnt                   = stopPollNodes;

    const auto& searchmoves = shared->limits.searchmoves;

    MoveList legal;
    pos.generate(legal, LEGAL);

    rootMoves.clear();
    for (Move m : legal)
        if (searchmoves.empty() || std::count(searchmoves.begin(), searchmoves.end(), m))
            rootMoves.emplace_back(m);

    SearchResult result;

    if (rootMoves.empty())
        result.score = mated_in(0);
    else
    {
        iterative_deepening();

        const RootMove& best = rootMoves[0];

        result.bestMove = best.pv[0];
        result.ponder   = best.pv.size() > 1 ? best.pv[1] : Move::none();
        result.pv       = best.pv;
        result.score    = best.score != -VALUE_INFINITE ? best.score : best.previousScore;
        result.depth    = completedDepth;
        result.selDepth = best.selDepth;
    }

    result.nodes   = nodes;
    result.elapsed = now() - jobStart;

    rootPos   = nullptr;
    evaluator = nullptr;
    shared.reset();

    return result;
}


// Main iterative deepening loop. It calls search() repeatedly with increasing
// depth until the allocated thinking time has been consumed, the user stops
// the search, or the maximum search depth is reached.
void Search::Worker::iterative_deepening() {

    Move pv[MAX_PLY + 1];

    Stack  stack[MAX_PLY + 10] = {};
    Stack* ss                  = stack + 7;

    for (int i = 7; i > 0; --i)
        (ss - i)->staticEval = VALUE_NONE;

    for (int i = 0; i <= MAX_PLY + 2; ++i)
        (ss + i)->ply = i;

    ss->pv = pv;

    const Depth depthCap     = shared->limits.depth;
    Move        lastBestMove = Move::none();

    // Iterative deepening loop until requested to stop or the target depth is reached
    while (++rootDepth < MAX_PLY && !shared->stopped() && !(depthCap && rootDepth > depthCap))
    {
        // Save the last iteration's scores before the first PV line is searched
        for (RootMove& rm : rootMoves)
            rm.previousScore = rm.score;

        selDepth = 0;

        search<Root>(*rootPos, ss, -VALUE_INFINITE, VALUE_INFINITE, rootDepth);

        // Sort the PV lines searched so far. A stable sort keeps the
        // previously best move first when the iteration was cut short.
        std::stable_sort(rootMoves.begin(), rootMoves.end());

        // If the search has been stopped, the root moves of an unfinished
        // iteration are not trusted beyond the first one.
        if (shared->stopped())
            break;

        completedDepth = rootDepth;

        const RootMove& best = rootMoves[0];

        RootSnapshot snapshot;
        snapshot.sessionId = shared->sessionId;
        snapshot.rootKey   = rootPos->key();
        snapshot.bestMove  = best.pv[0];
        snapshot.ponder    = best.pv.size() > 1 ? best.pv[1] : Move::none();
        snapshot.pv        = best.pv;
        snapshot.score     = best.score;
        snapshot.depth     = completedDepth;
        shared->publish_root(snapshot);

        if (!isMainJob)
            continue;

        report(completedDepth);

        if (!shared->timeman)
            continue;

        if (best.pv[0] != lastBestMove)
        {
            lastBestMove = best.pv[0];
            shared->timeman->on_pv_change(elapsed(), completedDepth);
        }

        shared->timeman->advise_after_iteration(elapsed());
    }
}


// Main search function for both PV and non-PV nodes
template<NodeType nodeType>
Value Search::Worker::search(Position& pos, Stack* ss, Value alpha, Value beta, Depth depth) {

    constexpr bool PvNode   = nodeType != NonPV;
    constexpr bool rootNode = nodeType == Root;

    // Dive into quiescence search when the depth reaches zero
    if (depth <= 0)
        return qsearch<PvNode ? PV : NonPV>(pos, ss, alpha, beta);

    assert(-VALUE_INFINITE <= alpha && alpha < beta && beta <= VALUE_INFINITE);
    assert(PvNode || (alpha == beta - 1));
    assert(0 < depth && depth < MAX_PLY);

    Move  pv[MAX_PLY + 1];
    Move  bestMove  = Move::none();
    Value bestValue = -VALUE_INFINITE;
    Value value     = -VALUE_INFINITE;
    int   moveCount = 0;

    // Step 1. Initialize node
    ss->inCheck          = pos.in_check();
    ss->moveCount        = 0;
    (ss + 2)->killers[0] = (ss + 2)->killers[1] = Move::none();

    count_node(false);

    // Used to send selDepth info to GUI (selDepth counts from 1, ply from 0)
    if (PvNode && selDepth < ss->ply + 1)
        selDepth = ss->ply + 1;

    if (!rootNode)
    {
        // Step 2. Check for aborted search and immediate draw
        if (shared->stopped_relaxed() || pos.is_draw(ss->ply) || ss->ply >= MAX_PLY)
            return (ss->ply >= MAX_PLY && !ss->inCheck) ? evaluate(pos) : VALUE_DRAW;

        // Step 3. Mate distance pruning. Even if we mate at the next move our
        // score would be at best mate_in(ss->ply + 1), but if alpha is already
        // bigger because a shorter mate was found upward in the tree then there
        // is no need to search because we will never beat the current alpha.
        alpha = std::max(mated_in(ss->ply), alpha);
        beta  = std::min(mate_in(ss->ply + 1), beta);
        if (alpha >= beta)
            return alpha;
    }

    // Step 4. Transposition table lookup
    const Key posKey                   = pos.key();
    auto [ttHit, ttData, ttWriter]     = tt->probe(posKey, pos);
    ss->ttHit                          = ttHit;
    const Move  ttMove                 = rootNode ? rootMoves[0].pv[0] : ttData.move;
    const Value ttValue                = ttHit ? value_from_tt(ttData.value, ss->ply) : VALUE_NONE;
    ss->ttPv                           = PvNode || (ttHit && ttData.is_pv);

    // At non-PV nodes we check for an early TT cutoff
    if (!PvNode && ttHit && ttData.depth >= depth && is_valid(ttValue)
        && (ttData.bound & (ttValue >= beta ? BOUND_LOWER : BOUND_UPPER)))
        return ttValue;

    // Step 5. Static evaluation of the position
    Value unadjustedEval = VALUE_NONE;

    if (ss->inCheck)
        ss->staticEval = VALUE_NONE;
    else if (ttHit && is_valid(ttData.eval))
        ss->staticEval = unadjustedEval = ttData.eval;
    else
    {
        ss->staticEval = unadjustedEval = evaluate(pos);

        // Static evaluation is saved as it was before adjustment by correction history
        ttWriter.write(posKey, VALUE_NONE, ss->ttPv, BOUND_NONE, DEPTH_UNSEARCHED, Move::none(),
                       unadjustedEval, tt->generation());
    }

    MoveList moves;
    pos.generate(moves, LEGAL);
    order_moves(pos, ss, moves, ttMove);

    // Step 6. Loop through all legal moves until no moves remain
    // or a beta cutoff occurs.
    for (Move move : moves)
    {
        // At root obey the "searchmoves" option and skip moves not listed in
        // the RootMove list.
        if (rootNode && !std::count(rootMoves.begin(), rootMoves.end(), move))
            continue;

        ss->moveCount = ++moveCount;

        if (PvNode)
            (ss + 1)->pv = nullptr;

        // Speculative prefetch as early as possible
        tt->prefetch(pos.key_after(move), ~pos.side_to_move());

        ss->currentMove = move;
        pos.do_move(move);

        // Step 7. Null window search for every move but the first at PV nodes
        if (!PvNode || moveCount > 1)
            value = -search<NonPV>(pos, ss + 1, -(alpha + 1), -alpha, depth - 1);

        // For PV nodes only, do a full PV search on the first move or after a
        // fail high, otherwise let the parent node fail low with value <= alpha
        // and try another move.
        if (PvNode && (moveCount == 1 || value > alpha))
        {
            (ss + 1)->pv    = pv;
            (ss + 1)->pv[0] = Move::none();

            value = -search<PV>(pos, ss + 1, -beta, -alpha, depth - 1);
        }

        // Step 8. Undo move
        pos.undo_move(move);

        assert(value > -VALUE_INFINITE && value < VALUE_INFINITE);

        // Finished searching the move. If a stop occurred, the return value of
        // the search cannot be trusted, and we return immediately without updating
        // best move, principal variation nor transposition table.
        if (shared->stopped_relaxed())
            return VALUE_ZERO;

        if (rootNode)
        {
            RootMove& rm = *std::find(rootMoves.begin(), rootMoves.end(), move);

            // PV move or new best move?
            if (moveCount == 1 || value > alpha)
            {
                rm.score    = value;
                rm.selDepth = selDepth;
                rm.pv.resize(1);

                assert((ss + 1)->pv);

                for (Move* m = (ss + 1)->pv; *m != Move::none(); ++m)
                    rm.pv.push_back(*m);
            }
            else
                // All other moves but the PV are set to the lowest value: this
                // is not a problem when sorting because the sort is stable and the
                // move position in the list is preserved - just the PV is pushed up.
                rm.score = -VALUE_INFINITE;
        }

        if (value > bestValue)
        {
            bestValue = value;

            if (value > alpha)
            {
                bestMove = move;

                if (PvNode && !rootNode)  // Update pv even in fail-high case
                    update_pv(ss->pv, move, (ss + 1)->pv);

                if (value >= beta)
                    break;  // Fail high

                alpha = value;  // Update alpha! Always alpha < beta
            }
        }
    }

    // Step 9. Check for mate. A side without legal moves loses, there is
    // no stalemate in shogi.
    if (!moveCount)
        bestValue = mated_in(ss->ply);

    // If there is a move that produces search value greater than alpha,
    // we update the stats of searched moves.
    else if (bestMove && bestValue >= beta && !pos.is_capture(bestMove))
        update_quiet_stats(pos, ss, bestMove, depth);

    // Write gathered information in transposition table
    ttWriter.write(posKey, value_to_tt(bestValue, ss->ply), ss->ttPv,
                   bestValue >= beta    ? BOUND_LOWER
                   : PvNode && bestMove ? BOUND_EXACT
                                        : BOUND_UPPER,
                   depth, bestMove, unadjustedEval, tt->generation());

    assert(bestValue > -VALUE_INFINITE && bestValue < VALUE_INFINITE);

    return bestValue;
}


// Quiescence search function, which is called by the main search function
// with zero depth, or recursively with further decreasing depth. With depth <= 0,
// we "should" be using static eval only, but tactical moves may confuse the
// static eval. To fight this horizon effect, we implement this qsearch of
// tactical moves.
template<NodeType nodeType>
Value Search::Worker::qsearch(Position& pos, Stack* ss, Value alpha, Value beta) {

    static_assert(nodeType != Root);
    constexpr bool PvNode = nodeType == PV;

    assert(alpha >= -VALUE_INFINITE && alpha < beta && beta <= VALUE_INFINITE);
    assert(PvNode || (alpha == beta - 1));

    Move  pv[MAX_PLY + 1];
    Move  bestMove = Move::none();
    Value bestValue, value;

    // Step 1. Initialize node
    if (PvNode)
    {
        (ss + 1)->pv = pv;
        ss->pv[0]    = Move::none();
    }

    ss->inCheck = pos.in_check();

    count_node(true);

    // Used to send selDepth info to GUI (selDepth counts from 1, ply from 0)
    if (PvNode && selDepth < ss->ply + 1)
        selDepth = ss->ply + 1;

    // Step 2. Check for an immediate draw or maximum ply reached
    if (pos.is_draw(ss->ply) || ss->ply >= MAX_PLY)
        return (ss->ply >= MAX_PLY && !ss->inCheck) ? evaluate(pos) : VALUE_DRAW;

    assert(0 <= ss->ply && ss->ply < MAX_PLY);

    // Step 3. Transposition table lookup
    const Key posKey               = pos.key();
    auto [ttHit, ttData, ttWriter] = tt->probe(posKey, pos);
    ss->ttHit                      = ttHit;
    const Value ttValue            = ttHit ? value_from_tt(ttData.value, ss->ply) : VALUE_NONE;
    const bool  pvHit              = ttHit && ttData.is_pv;

    // At non-PV nodes we check for an early TT cutoff
    if (!PvNode && ttData.depth >= DEPTH_QS && is_valid(ttValue)
        && (ttData.bound & (ttValue >= beta ? BOUND_LOWER : BOUND_UPPER)))
        return ttValue;

    // Step 4. Static evaluation of the position
    Value unadjustedEval = VALUE_NONE;

    if (ss->inCheck)
        bestValue = -VALUE_INFINITE;
    else
    {
        unadjustedEval = ttHit && is_valid(ttData.eval) ? ttData.eval : evaluate(pos);
        ss->staticEval = bestValue = unadjustedEval;

        // ttValue can be used as a better position evaluation
        if (is_valid(ttValue) && !is_decisive(ttValue)
            && (ttData.bound & (ttValue > bestValue ? BOUND_LOWER : BOUND_UPPER)))
            bestValue = ttValue;

        // Stand pat. Return immediately if static value is at least beta
        if (bestValue >= beta)
        {
            if (!ttHit)
                ttWriter.write(posKey, value_to_tt(bestValue, ss->ply), false, BOUND_LOWER,
                               DEPTH_UNSEARCHED, Move::none(), unadjustedEval, tt->generation());
            return bestValue;
        }

        if (bestValue > alpha)
            alpha = bestValue;
    }

    // Evasions when in check, captures otherwise
    MoveList moves;
    pos.generate(moves, ss->inCheck ? LEGAL : CAPTURES);
    order_moves(pos, ss, moves, ttData.move);

    // Step 5. Loop through the moves until no moves remain or a beta cutoff occurs
    for (Move move : moves)
    {
        // Speculative prefetch as early as possible
        tt->prefetch(pos.key_after(move), ~pos.side_to_move());

        ss->currentMove = move;
        pos.do_move(move);
        value = -qsearch<nodeType>(pos, ss + 1, -beta, -alpha);
        pos.undo_move(move);

        assert(value > -VALUE_INFINITE && value < VALUE_INFINITE);

        if (shared->stopped_relaxed())
            return VALUE_ZERO;

        // Step 6. Check for a new best move
        if (value > bestValue)
        {
            bestValue = value;

            if (value > alpha)
            {
                bestMove = move;

                if (PvNode)  // Update pv even in fail-high case
                    update_pv(ss->pv, move, (ss + 1)->pv);

                if (value < beta)  // Update alpha here!
                    alpha = value;
                else
                    break;  // Fail high
            }
        }
    }

    // Step 7. Check for mate. All legal moves have been searched when in
    // check, so no move at all means mate.
    if (ss->inCheck && bestValue == -VALUE_INFINITE)
    {
        assert(moves.empty());
        return mated_in(ss->ply);
    }

    // Save gathered info in transposition table
    ttWriter.write(posKey, value_to_tt(bestValue, ss->ply), pvHit,
                   bestValue >= beta ? BOUND_LOWER : BOUND_UPPER, DEPTH_QS, bestMove, unadjustedEval,
                   tt->generation());

    assert(bestValue > -VALUE_INFINITE && bestValue < VALUE_INFINITE);

    return bestValue;
}


// Keeps evaluations away from the mate range
Value Search::Worker::evaluate(const Position& pos) {
    return std::clamp(evaluator->evaluate(pos), VALUE_MATED_IN_MAX_PLY + 1,
                      VALUE_MATE_IN_MAX_PLY - 1);
}


// Sorts the moves in place: TT move, captures, killers, then quiet moves by
// history. The low bits are random, they only break ties and are what makes
// the helpers of a Lazy SMP search diverge.
void Search::Worker::order_moves(const Position& pos, Stack* ss, MoveList& moves, Move ttMove) {

    int64_t     scores[MAX_MOVES];
    const Color us = pos.side_to_move();

    for (size_t i = 0; i < moves.size(); ++i)
    {
        const Move m = moves[i];

        int64_t s = m == ttMove           ? int64_t(1) << 30
                  : pos.is_capture(m)     ? int64_t(1) << 28
                  : m == ss->killers[0]   ? (int64_t(1) << 27)
                  : m == ss->killers[1]   ? (int64_t(1) << 27) - 1
                                          : int64_t(mainHistory[us][m.raw()]);

        scores[i] = s * 8 + int64_t(rng.rand<uint32_t>() & 7);
    }

    // Insertion sort, move lists are short
    for (size_t i = 1; i < moves.size(); ++i)
    {
        const Move    m = moves[i];
        const int64_t s = scores[i];
        size_t        j = i;

        for (; j > 0 && scores[j - 1] < s; --j)
        {
            moves[j]  = moves[j - 1];
            scores[j] = scores[j - 1];
        }

        moves[j]  = m;
        scores[j] = s;
    }
}


void Search::Worker::update_quiet_stats(const Position& pos, Stack* ss, Move move, Depth depth) {

    if (ss->killers[0] != move)
    {
        ss->killers[1] = ss->killers[0];
        ss->killers[0] = move;
    }

    // History gravity keeps the entries within [-8192, 8192]
    int16_t&  entry = mainHistory[pos.side_to_move()][move.raw()];
    const int bonus = std::min(depth * depth, 1024);

    entry = int16_t(entry + bonus - entry * bonus / 8192);
}


void Search::Worker::count_node(bool qnode) {

    ++nodes;
    shared->add_nodes(1);

    if (qnode)
        shared->add_qnodes(1);

    if (--callsCnt <= 0)
        check_limits();
}


// Called every StopPollNodes nodes. Time limits are watched by the time
// keeper thread, the worker only enforces the node budget.
void Search::Worker::check_limits() {

    const uint64_t budget = shared->limits.node_budget();

    // When using nodes, ensure checking rate is not lower than 0.1% of nodes
    callsCnt = budget ? int(std::min(uint64_t(stopPollNodes), budget / 1024 + 1)) : stopPollNodes;

    if (budget && shared->nodes_searched() >= budget && !shared->stopped())
    {
        StopInfo info;
        info.reason       = TerminationReason::NodeLimit;
        info.elapsed      = elapsed();
        info.nodes        = shared->nodes_searched();
        info.depthReached = shared->best_depth();

        shared->request_stop(info);
    }
}


void Search::Worker::report(Depth depth) {

    const RootMove& rm = rootMoves[0];

    std::string pv;
    for (Move m : rm.pv)
        pv += rootPos->move_to_string(m) + " ";

    // Remove last whitespace
    if (!pv.empty())
        pv.pop_back();

    const uint64_t  nodesSearched = shared->nodes_searched();
    const TimePoint time          = std::max(TimePoint(1), elapsed());

    InfoFull info;
    info.depth    = depth;
    info.selDepth = rm.selDepth;
    info.score    = rm.score != -VALUE_INFINITE ? rm.score : rm.previousScore;
    info.timeMs   = size_t(time);
    info.nodes    = size_t(nodesSearched);
    info.nps      = size_t(nodesSearched * 1000 / time);
    info.hashfull = tt->hashfull();
    info.pv       = pv;

    shared->update_full(info);
}


namespace {

// Adjusts a mate score from "plies to mate from the root" to
// "plies to mate from the current position". Standard scores are unchanged.
// The function is called before storing a value in the transposition table.
Value value_to_tt(Value v, int ply) {

    if (!is_valid(v))
        return v;

    return is_win(v) ? v + ply : is_loss(v) ? v - ply : v;
}


// Inverse of value_to_tt(): it adjusts a mate score from the transposition
// table (which refers to the plies to mate/be mated from current position) to
// "plies to mate/be mated from the root".
Value value_from_tt(Value v, int ply) {

    if (!is_valid(v))
        return VALUE_NONE;

    return is_win(v) ? v - ply : is_loss(v) ? v + ply : v;
}


// Adds current move and appends child pv[]
void update_pv(Move* pv, Move move, const Move* childPv) {

    for (*pv++ = move; childPv && *childPv != Move::none();)
        *pv++ = *childPv++;
    *pv = Move::none();
}

}  // namespace

}  // namespace Ryufish
