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

#ifndef SEARCH_H_INCLUDED
#define SEARCH_H_INCLUDED

#include <array>
#include <atomic>
#include <cassert>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "evaluate.h"
#include "misc.h"
#include "position.h"
#include "timeman.h"
#include "types.h"

namespace Ryufish {

// Different node types, used as a template parameter
enum NodeType {
    NonPV,
    PV,
    Root
};

class TranspositionTable;

namespace Search {

// Stack struct keeps track of the information we need to remember from nodes
// shallower and deeper in the tree during the search. Each search thread has
// its own array of Stack objects, indexed by the current ply.
struct Stack {
    Move* pv;
    int   ply;
    Move  currentMove;
    Move  killers[2];
    Value staticEval;
    int   moveCount;
    bool  inCheck;
    bool  ttPv;
    bool  ttHit;
};


// RootMove struct is used for moves at the root of the tree.
struct RootMove {

    explicit RootMove(Move m) :
        pv(1, m) {}
    bool operator==(const Move& m) const { return pv[0] == m; }
    // Sort in descending order
    bool operator<(const RootMove& m) const {
        return m.score != score ? m.score < score : m.previousScore < previousScore;
    }

    Value             score         = -VALUE_INFINITE;
    Value             previousScore = -VALUE_INFINITE;
    int               selDepth      = 0;
    std::vector<Move> pv;
};

using RootMoves = std::vector<RootMove>;


// LimitsType struct stores information sent by the caller about the analysis required.
// The optional shared handles let the caller own the stop flag, the node
// counters and the ponderhit flag; when absent the search creates its own.
struct LimitsType {

    bool use_time_management() const {
        return std::holds_alternative<FixedTime>(timeControl)
            || std::holds_alternative<Fischer>(timeControl)
            || std::holds_alternative<Byoyomi>(timeControl);
    }

    bool is_infinite() const { return std::holds_alternative<Infinite>(timeControl); }
    bool is_ponder() const { return std::holds_alternative<Ponder>(timeControl); }

    uint64_t node_budget() const {
        const auto* fn = std::get_if<FixedNodes>(&timeControl);
        return fn ? fn->nodes : 0;
    }

    TimeControl       timeControl = Infinite{};
    Depth             depth       = 0;  // 0 means no depth cap
    TimePoint         startTime   = 0;
    std::vector<Move> searchmoves;

    std::shared_ptr<std::atomic_bool>      stop;
    std::shared_ptr<std::atomic<uint64_t>> nodes;
    std::shared_ptr<std::atomic<uint64_t>> qnodes;
    std::shared_ptr<std::atomic_bool>      ponderhit;
};


enum class TerminationReason {
    None,
    Completed,
    DepthLimit,
    NodeLimit,
    TimeLimit,
    UserStop,
    FailSafe,
    NoLegalMoves
};

const char* to_string(TerminationReason reason);

// Why and when a search ended. Recorded once per search by whoever stops it
// first, the limits are filled in when the result is emitted.
struct StopInfo {
    TerminationReason reason       = TerminationReason::None;
    TimePoint         elapsed      = 0;
    uint64_t          nodes        = 0;
    Depth             depthReached = 0;
    bool              hardTimeout  = false;
    TimePoint         softLimit    = 0;
    TimePoint         hardLimit    = 0;
    TimePoint         plannedLimit = 0;
};

struct SearchResult {
    Move              bestMove = Move::none();
    Move              ponder   = Move::none();
    std::vector<Move> pv;
    Value             score    = -VALUE_INFINITE;
    Depth             depth    = 0;
    int               selDepth = 0;
    uint64_t          nodes    = 0;
    TimePoint         elapsed  = 0;
    uint64_t          nps      = 0;
};

// Best line of the deepest completed iteration, used when the result has to
// be emitted before the workers returned.
struct RootSnapshot {
    uint64_t          sessionId = 0;
    Key               rootKey   = 0;
    Move              bestMove  = Move::none();
    Move              ponder    = Move::none();
    std::vector<Move> pv;
    Value             score = -VALUE_INFINITE;
    Depth             depth = 0;
};

struct InfoFull {
    int         depth;
    int         selDepth;
    Value       score;
    size_t      timeMs;
    size_t      nodes;
    size_t      nps;
    int         hashfull;
    std::string pv;
};


// The SharedState class is the coordination state of one top-level search,
// shared by every job of the search, the time keeper, the fail-safe guard
// and the orchestrator. It lives exactly as long as its longest user.
class SharedState {
   public:
    using UpdateFull = std::function<void(const InfoFull&)>;

    SharedState(const LimitsType& limits, std::shared_ptr<TimeManagement> tm, uint64_t sessionId);

    SharedState(const SharedState&)            = delete;
    SharedState& operator=(const SharedState&) = delete;

    void add_nodes(uint64_t n) { nodes->fetch_add(n, std::memory_order_relaxed); }
    void add_qnodes(uint64_t n) { qnodes->fetch_add(n, std::memory_order_relaxed); }
    uint64_t nodes_searched() const { return nodes->load(std::memory_order_relaxed); }
    uint64_t qnodes_searched() const { return qnodes->load(std::memory_order_relaxed); }

    bool stopped() const { return stop->load(std::memory_order_acquire); }
    bool stopped_relaxed() const { return stop->load(std::memory_order_relaxed); }

    // Records info if no StopInfo was recorded yet and raises the stop flag.
    // Returns true if this call recorded its StopInfo.
    bool                    request_stop(const StopInfo& info);
    std::optional<StopInfo> stop_info() const;

    // Exactly-once token for the result of this search
    bool claim_emission() { return !emitted.exchange(true, std::memory_order_acq_rel); }
    bool emission_claimed() const { return emitted.load(std::memory_order_acquire); }

    // Keeps the deepest snapshot, ties go to the latest one
    void         publish_root(const RootSnapshot& snapshot);
    RootSnapshot root_snapshot() const;
    Depth        best_depth() const { return bestDepth.load(std::memory_order_relaxed); }

    void   work_dispatched(size_t n);
    void   work_started();
    void   work_completed();
    void   work_cancelled();
    size_t pending_work() const { return pendingWork.load(std::memory_order_acquire); }
    size_t active_workers() const { return activeWorkers.load(std::memory_order_acquire); }
    bool   drained() const { return pending_work() == 0 && active_workers() == 0; }

    // Waits until every dispatched job returned or the timeout expired, or
    // also until a stop was requested when orStopped is set. Returns drained().
    bool wait_until_drained(TimePoint timeoutMs, bool orStopped = false);

    // Waits until a stop was requested or the timeout expired. Returns stopped().
    bool wait_for_stop(TimePoint timeoutMs);

    void finish();
    bool finished() const { return isFinished.load(std::memory_order_acquire); }

    TimePoint elapsed() const { return now() - limits.startTime; }

    void set_on_update_full(UpdateFull f) { onUpdateFull = std::move(f); }
    void update_full(const InfoFull& info) const {
        if (onUpdateFull)
            onUpdateFull(info);
    }

    const LimitsType                      limits;
    const std::shared_ptr<TimeManagement> timeman;
    const uint64_t                        sessionId;

    // Set before the jobs are dispatched, read-only afterwards
    int stopPollNodes = 1024;

   private:
    std::shared_ptr<std::atomic_bool>      stop;
    std::shared_ptr<std::atomic<uint64_t>> nodes, qnodes;

    mutable std::mutex      mutex;
    std::condition_variable cv;
    std::optional<StopInfo> stopInfo;
    RootSnapshot            snapshot;
    std::atomic<Depth>      bestDepth{0};
    std::atomic<size_t>     pendingWork{0}, activeWorkers{0};
    std::atomic_bool        emitted{false}, isFinished{false};
    UpdateFull              onUpdateFull;
};


// Search::Worker is the class that does the actual search. Each pool thread
// owns one, it is reused across jobs and never shared.
class Worker {
   public:
    Worker(std::shared_ptr<TranspositionTable> tt, size_t threadId);

    // Resets the move ordering tables, called at the start of every job
    void clear();

    // Runs iterative deepening on rootPos until the depth cap, the last
    // ply, or a stop. rootPos belongs to the job and is used in place.
    SearchResult start_searching(Position&                    rootPos,
                                 std::shared_ptr<SharedState> sharedState,
                                 const Eval::Evaluator&       evaluator,
                                 bool                         mainJob);

    size_t id() const { return threadIdx; }

    // Public move ordering tables
    using ButterflyHistory = std::array<std::array<int16_t, 1 << 16>, COLOR_NB>;
    ButterflyHistory mainHistory;

   private:
    void iterative_deepening();

    template<NodeType nodeType>
    Value search(Position& pos, Stack* ss, Value alpha, Value beta, Depth depth);

    template<NodeType nodeType>
    Value qsearch(Position& pos, Stack* ss, Value alpha, Value beta);

    void order_moves(const Position& pos, Stack* ss, MoveList& moves, Move ttMove);
    void update_quiet_stats(const Position& pos, Stack* ss, Move move, Depth depth);
    void count_node(bool qnode);
    void check_limits();
    void report(Depth depth);

    Value     evaluate(const Position& pos);
    TimePoint elapsed() const { return shared->elapsed(); }

    // Member Variables
    Position*                    rootPos  = nullptr;
    const Eval::Evaluator*       evaluator = nullptr;
    std::shared_ptr<SharedState> shared;
    bool                         isMainJob = false;

    RootMoves rootMoves;
    Depth     rootDepth, completedDepth;
    int       selDepth;
    uint64_t  nodes;
    int       callsCnt;
    int       stopPollNodes;
    TimePoint jobStart;
    PRNG      rng;

    size_t                              threadIdx;
    std::shared_ptr<TranspositionTable> tt;
};

}  // namespace Search
}  // namespace Ryufish

#endif  // #ifndef SEARCH_H_INCLUDED
