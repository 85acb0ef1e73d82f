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

#ifndef THREAD_H_INCLUDED
#define THREAD_H_INCLUDED

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "misc.h"
#include "position.h"
#include "search.h"
#include "thread_win32_osx.h"
#include "types.h"

namespace Ryufish {

class TranspositionTable;
class ThreadPool;

// Idle threads look at the job queues at least this often
constexpr TimePoint IdlePollMs = 5;

// One unit of Lazy SMP work: a private copy of the root position and the
// handle of the search it contributes to.
struct SearchJob {
    std::unique_ptr<Position>              rootPos;
    std::shared_ptr<Search::SharedState>   shared;
    std::shared_ptr<const Eval::Evaluator> evaluator;
    bool                                   mainJob = false;
};

// An empty result means the job made no contribution
struct WorkerResult {
    size_t                              workerId;
    std::optional<Search::SearchResult> result;
};

// Results flow from the pool threads to whoever dispatched the jobs
class ResultChannel {
   public:
    void                        send(WorkerResult r);
    std::optional<WorkerResult> receive(TimePoint timeoutMs);
    std::vector<WorkerResult>   drain();

   private:
    std::mutex               mutex;
    std::condition_variable  cv;
    std::deque<WorkerResult> results;
};


// The Thread class encapsulates a single thread of execution. It owns a
// search worker and takes jobs from the pool's queues until told to exit.
class Thread {

    ThreadPool&      pool;
    size_t           idx;
    std::atomic_bool exit{false};

   public:
    Thread(ThreadPool& threadPool, std::shared_ptr<TranspositionTable> tt, size_t n);
    virtual ~Thread();

    void   request_exit();
    size_t id() const { return idx; }

    std::unique_ptr<Search::Worker> worker;

   private:
    friend class ThreadPool;

    void idle_loop();
    void run(SearchJob& job, ResultChannel& results);

    // Started last, once the worker exists
    NativeThread stdThread;
};


// The ThreadPool class manages all threads and the two job queues they
// share. High priority jobs are always taken first.
class ThreadPool {

   public:
    explicit ThreadPool(std::shared_ptr<TranspositionTable> tt);
    ~ThreadPool();

    ThreadPool(const ThreadPool&)            = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Grows or shrinks the pool. Removed threads finish their current job first.
    void set(size_t requested);

    // Enqueues the jobs. The pending work of each job's search is accounted
    // before the job becomes visible to the threads.
    void dispatch(std::vector<SearchJob> jobs, std::shared_ptr<ResultChannel> results,
                  bool highPriority = false);

    size_t queued() const;

    size_t size() const noexcept { return threads.size(); }
    bool   empty() const noexcept { return threads.empty(); }

   private:
    friend class Thread;

    struct QueuedJob {
        SearchJob                      job;
        std::shared_ptr<ResultChannel> results;
    };

    std::optional<QueuedJob> next_job(const Thread& th);

    mutable std::mutex                   mutex;
    std::condition_variable              cv;
    std::deque<QueuedJob>                jobs, priorityJobs;
    std::vector<std::unique_ptr<Thread>> threads;
    std::shared_ptr<TranspositionTable>  tt;
};

}  // namespace Ryufish

#endif  // #ifndef THREAD_H_INCLUDED
