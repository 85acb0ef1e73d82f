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

#ifndef ENGINE_H_INCLUDED
#define ENGINE_H_INCLUDED

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "evaluate.h"
#include "position.h"
#include "search.h"
#include "thread.h"
#include "timeman.h"
#include "tt.h"
#include "ucioption.h"

namespace Ryufish {

// What is sent once per search as the final answer
struct Bestmove {
    uint64_t             sessionId;
    std::string          bestmove;  // "resign" when there is no move
    std::string          ponder;    // empty when there is no ponder move
    Search::SearchResult result;
    Search::StopInfo     stopInfo;
};

class Engine {
   public:
    using InfoFull     = Search::InfoFull;
    using OnBestmove   = std::function<void(const Bestmove&)>;
    using OnUpdateFull = std::function<void(const InfoFull&)>;
    using OnFinalize   = std::function<void(uint64_t, FinalizeReason)>;

    explicit Engine(std::shared_ptr<const Eval::Evaluator> evaluator);
    ~Engine();

    Engine(const Engine&)            = delete;
    Engine& operator=(const Engine&) = delete;

    // Non blocking call to start searching. The callbacks run on the
    // search threads and must not call back into go() or wait_for_search_finished().
    void go(const Position& pos, Search::LimitsType limits);
    // Non blocking call to stop searching
    void stop();
    void ponderhit();

    // Blocking call to wait for search to finish
    void wait_for_search_finished();
    bool searching() const;

    void set_tt_size(size_t mb);
    void resize_threads();
    void search_clear();
    int  hashfull(int maxAge = 0) const;

    void set_on_bestmove(OnBestmove&&);
    void set_on_update_full(OnUpdateFull&&);
    void set_on_finalize(OnFinalize&&);

    OptionsMap&       get_options();
    const OptionsMap& get_options() const;

    size_t threads_count() const { return threads.size(); }

    // Shared state of the current or last search, nullptr before the first go()
    std::shared_ptr<Search::SharedState> last_search() const;

    // Byoyomi clock after the last move played under byoyomi, reset by search_clear()
    std::optional<ByoyomiState> byoyomi_state() const;

   private:
    void search_loop(std::shared_ptr<Search::SharedState> shared,
                     std::unique_ptr<Position>            rootPos);

    Search::SearchResult best_result(const std::vector<WorkerResult>& results,
                                     const Search::SharedState&       shared) const;
    Search::StopInfo     final_stop_info(const Search::SharedState& shared, Depth depth) const;

    void emit(Search::SharedState&        shared,
              const Position&             rootPos,
              const Search::SearchResult& result,
              const Search::StopInfo&     info);
    void emit_snapshot(Search::SharedState& shared, const Position& rootPos);
    void notify_finalize(const Search::SharedState& shared, FinalizeReason reason);
    void update_clock(TimeManagement& tm, TimePoint elapsed);

    OptionsMap                             options;
    std::shared_ptr<const Eval::Evaluator> evaluator;
    std::shared_ptr<TranspositionTable>    tt;
    ThreadPool                             threads;

    std::thread                          searchThread;
    mutable std::mutex                   mutex;
    std::shared_ptr<Search::SharedState> current;
    uint64_t                             sessionCounter = 0;
    std::optional<ByoyomiState>          byoyomi;

    OnBestmove   onBestmove;
    OnUpdateFull onUpdateFull;
    OnFinalize   onFinalize;
};

}  // namespace Ryufish

#endif  // #ifndef ENGINE_H_INCLUDED
