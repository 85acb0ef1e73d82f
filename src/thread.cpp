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

#include "thread.h"

#include <algorithm>
#include <cassert>
#include <chrono>
#include <exception>
#include <iostream>
#include <utility>

#include "tt.h"

namespace Ryufish {

void ResultChannel::send(WorkerResult r) {
    {
        std::lock_guard<std::mutex> lk(mutex);
        results.push_back(std::move(r));
    }
    cv.notify_one();
}


std::optional<WorkerResult> ResultChannel::receive(TimePoint timeoutMs) {
    std::unique_lock<std::mutex> lk(mutex);

    if (!cv.wait_for(lk, std::chrono::milliseconds(timeoutMs), [&] { return !results.empty(); }))
        return std::nullopt;

    WorkerResult r = std::move(results.front());
    results.pop_front();
    return r;
}


std::vector<WorkerResult> ResultChannel::drain() {
    std::lock_guard<std::mutex> lk(mutex);

    std::vector<WorkerResult> out(std::make_move_iterator(results.begin()),
                                  std::make_move_iterator(results.end()));
    results.clear();
    return out;
}


// Constructor launches the thread, which immediately goes looking for jobs
// in idle_loop(). The worker is built before the thread starts.
Thread::Thread(ThreadPool& threadPool, std::shared_ptr<TranspositionTable> tt, size_t n) :
    pool(threadPool),
    idx(n),
    worker(std::make_unique<Search::Worker>(std::move(tt), n)),
    stdThread(&Thread::idle_loop, this) {}


// Destructor joins the thread, the exit flag must have been raised by
// request_exit() so that the thread leaves idle_loop() after its current job.
Thread::~Thread() {

    assert(exit);

    stdThread.join();
}


void Thread::request_exit() {
    {
        std::lock_guard<std::mutex> lk(pool.mutex);
        exit = true;
    }
    pool.cv.notify_all();
}


// Thread gets parked here, blocked on the pool's condition variable with a
// bounded wait, when it has no work to do.
void Thread::idle_loop() {

    while (!exit)
    {
        std::optional<ThreadPool::QueuedJob> queued = pool.next_job(*this);

        if (!queued)
            continue;

        run(queued->job, *queued->results);
    }
}


void Thread::run(SearchJob& job, ResultChannel& results) {

    auto shared = job.shared;
    shared->work_started();

    const TimePoint start = now();

    WorkerResult wr{idx, std::nullopt};

    try
    {
        wr.result = worker->start_searching(*job.rootPos, shared, *job.evaluator, job.mainJob);
    } catch (const std::exception& e)
    {
        sync_cout << "info string worker " << idx << " failed: " << e.what() << sync_endl;
        wr.result.reset();
    }

    // Normalize the timing so that a very short job never reports zero time
    if (wr.result)
    {
        Search::SearchResult& r = *wr.result;
        r.elapsed               = std::max(TimePoint(1), std::max(r.elapsed, now() - start));
        r.nps                   = r.nodes * 1000 / uint64_t(r.elapsed);
    }

    // The job position is released before the job counts as done
    job.rootPos.reset();

    results.send(std::move(wr));
    shared->work_completed();
}


// Creates the pool with a single thread
ThreadPool::ThreadPool(std::shared_ptr<TranspositionTable> transpositionTable) :
    tt(std::move(transpositionTable)) {
    set(1);
}


// Destructor stops every thread. Queued jobs that never started are
// cancelled so that whoever waits on their search is released.
ThreadPool::~ThreadPool() {

    set(0);

    std::lock_guard<std::mutex> lk(mutex);

    for (auto* q : {&priorityJobs, &jobs})
        for (auto& qj : *q)
            qj.job.shared->work_cancelled();

    priorityJobs.clear();
    jobs.clear();
}


// Creates/destroys threads to match the requested number. Created and
// launched threads immediately go to sleep in idle_loop. Thread ids stay
// dense, the last threads are the ones removed.
void ThreadPool::set(size_t requested) {

    while (threads.size() < requested)
        threads.push_back(std::make_unique<Thread>(*this, tt, threads.size()));

    while (threads.size() > requested)
    {
        threads.back()->request_exit();
        threads.pop_back();  // Joins after the current job
    }
}


void ThreadPool::dispatch(std::vector<SearchJob>         newJobs,
                          std::shared_ptr<ResultChannel> results,
                          bool                           highPriority) {

    for (auto& job : newJobs)
    {
        assert(job.rootPos && job.shared && job.evaluator);
        job.shared->work_dispatched(1);
    }

    {
        std::lock_guard<std::mutex> lk(mutex);

        auto& queue = highPriority ? priorityJobs : jobs;
        for (auto& job : newJobs)
            queue.push_back(QueuedJob{std::move(job), results});
    }

    cv.notify_all();
}


size_t ThreadPool::queued() const {
    std::lock_guard<std::mutex> lk(mutex);
    return jobs.size() + priorityJobs.size();
}


std::optional<ThreadPool::QueuedJob> ThreadPool::next_job(const Thread& th) {

    std::unique_lock<std::mutex> lk(mutex);

    cv.wait_for(lk, std::chrono::milliseconds(IdlePollMs),
                [&] { return th.exit || !priorityJobs.empty() || !jobs.empty(); });

    if (th.exit)
        return std::nullopt;

    for (auto* q : {&priorityJobs, &jobs})
        if (!q->empty())
        {
            QueuedJob qj = std::move(q->front());
            q->pop_front();
            return qj;
        }

    return std::nullopt;
}

}  // namespace Ryufish
