#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

#include "util/Expected.hpp"

namespace evidhash {

/**
 * @brief Fixed-size worker pool with bounded waiting
 *
 * Jobs are independent closures run in FIFO order by threadCount workers.
 * Queue state lives in a shared block owned jointly by the pool and its
 * workers, so abandon() can detach the workers when a caller has stopped
 * waiting for them.
 *
 * Usage:
 *   WorkerPool pool(4);
 *   pool.submit([] { work(); });
 *   if (!pool.waitFor(std::chrono::seconds(3))) pool.abandon();
 */
class WorkerPool {
public:
    /// Throws std::system_error if a worker thread cannot be started
    explicit WorkerPool(size_t threadCount);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// Queue a job; fails once the pool is stopping
    Expected<void> submit(std::function<void()> job);

    /**
     * @brief Block until fewer than maxQueued jobs are waiting to start
     * @return false if the timeout elapsed first
     */
    bool waitForCapacity(size_t maxQueued, std::chrono::milliseconds timeout);

    /// Block until every submitted job has finished
    void wait();

    /// Like wait(), but gives up after timeout; returns true if drained
    bool waitFor(std::chrono::milliseconds timeout);

    /// Drop jobs that have not started yet; returns how many were dropped
    size_t discardPending();

    /// Stop accepting work and detach workers still running a job
    void abandon();

    size_t threadCount() const { return workers.size(); }
    size_t queued() const;
    size_t running() const;

private:
    struct Shared {
        std::mutex mtx;
        std::condition_variable workCv;   // Workers wait for jobs
        std::condition_variable stateCv;  // Waiters watch queue/running changes
        std::queue<std::function<void()>> jobs;
        size_t runningJobs{0};
        bool stop{false};
    };

    static void workerLoop(std::shared_ptr<Shared> shared);

    std::shared_ptr<Shared> shared;
    std::vector<std::thread> workers;
    bool detached{false};
};

}
