#include "util/WorkerPool.hpp"

#include <exception>

#include "util/Logger.hpp"

namespace evidhash {

WorkerPool::WorkerPool(size_t threadCount) : shared(std::make_shared<Shared>()) {
    if (threadCount == 0) threadCount = 1;
    workers.reserve(threadCount);
    try {
        for (size_t i = 0; i < threadCount; ++i) {
            workers.emplace_back(&WorkerPool::workerLoop, shared);
        }
    } catch (...) {
        // Unwind the workers that did start, then report the failure
        {
            std::scoped_lock lock(shared->mtx);
            shared->stop = true;
        }
        shared->workCv.notify_all();
        for (auto& w : workers) {
            if (w.joinable()) w.join();
        }
        throw;
    }
}

WorkerPool::~WorkerPool() {
    if (detached) return;
    {
        std::scoped_lock lock(shared->mtx);
        shared->stop = true;
    }
    shared->workCv.notify_all();
    for (auto& w : workers) {
        if (w.joinable()) w.join();
    }
}

Expected<void> WorkerPool::submit(std::function<void()> job) {
    {
        std::scoped_lock lock(shared->mtx);
        if (shared->stop) {
            return Error{ErrorCode::InternalError, "submit on stopped WorkerPool"};
        }
        shared->jobs.push(std::move(job));
    }
    shared->workCv.notify_one();
    return {};
}

bool WorkerPool::waitForCapacity(size_t maxQueued, std::chrono::milliseconds timeout) {
    std::unique_lock lock(shared->mtx);
    return shared->stateCv.wait_for(lock, timeout, [this, maxQueued] {
        return shared->jobs.size() < maxQueued;
    });
}

void WorkerPool::wait() {
    std::unique_lock lock(shared->mtx);
    shared->stateCv.wait(lock, [this] {
        return shared->jobs.empty() && shared->runningJobs == 0;
    });
}

bool WorkerPool::waitFor(std::chrono::milliseconds timeout) {
    std::unique_lock lock(shared->mtx);
    return shared->stateCv.wait_for(lock, timeout, [this] {
        return shared->jobs.empty() && shared->runningJobs == 0;
    });
}

size_t WorkerPool::discardPending() {
    size_t dropped = 0;
    {
        std::scoped_lock lock(shared->mtx);
        dropped = shared->jobs.size();
        std::queue<std::function<void()>>().swap(shared->jobs);
    }
    shared->stateCv.notify_all();
    return dropped;
}

void WorkerPool::abandon() {
    if (detached) return;
    {
        std::scoped_lock lock(shared->mtx);
        shared->stop = true;
        std::queue<std::function<void()>>().swap(shared->jobs);
    }
    shared->workCv.notify_all();
    for (auto& w : workers) {
        if (w.joinable()) w.detach();
    }
    detached = true;
}

size_t WorkerPool::queued() const {
    std::scoped_lock lock(shared->mtx);
    return shared->jobs.size();
}

size_t WorkerPool::running() const {
    std::scoped_lock lock(shared->mtx);
    return shared->runningJobs;
}

void WorkerPool::workerLoop(std::shared_ptr<Shared> shared) {
    while (true) {
        std::function<void()> job;
        {
            std::unique_lock lock(shared->mtx);
            shared->workCv.wait(lock, [&] { return shared->stop || !shared->jobs.empty(); });
            if (shared->stop && shared->jobs.empty()) return;
            job = std::move(shared->jobs.front());
            shared->jobs.pop();
            ++shared->runningJobs;
        }
        shared->stateCv.notify_all();

        try {
            job();
        } catch (const std::exception& e) {
            Logger::instance().error(std::string("worker job failed: ") + e.what());
        }

        {
            std::scoped_lock lock(shared->mtx);
            --shared->runningJobs;
        }
        shared->stateCv.notify_all();
    }
}

}
