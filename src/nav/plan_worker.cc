#include "nav/plan_worker.h"

#include <utility>

#include "core/log.h"

namespace delve::nav {

PlanWorker::PlanWorker(const world::WorldView& world, PathfinderConfig config)
    : m_world(world), m_config(config) {
    m_thread = std::thread([this]() { workerLoop(); });
}

PlanWorker::~PlanWorker() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopping = true;
    }
    cancelAll();
    m_wake.notify_all();
    if (m_thread.joinable()) {
        m_thread.join();
    }
}

std::future<PathResult> PlanWorker::submitPath(PathRequest request) {
    auto cancel = std::make_shared<core::CancelToken>();
    request.cancel = cancel.get();
    auto task = std::make_shared<std::packaged_task<PathResult()>>(
        [this, request = std::move(request)]() { return findPath(request, m_world, m_config); });
    std::future<PathResult> future = task->get_future();
    enqueue(Job{std::move(cancel), [task]() { (*task)(); }});
    return future;
}

std::future<Tour> PlanWorker::submitTour(
    std::vector<core::Cell3i> nodes,
    std::optional<core::Cell3i> startNode,
    std::optional<core::Cell3i> endNode,
    DistanceFunction distance
) {
    auto cancel = std::make_shared<core::CancelToken>();
    auto task = std::make_shared<std::packaged_task<Tour()>>(
        [nodes = std::move(nodes), startNode, endNode, distance = std::move(distance), token = cancel.get()]() {
            return shortestTour(nodes, startNode, endNode, distance, token);
        });
    std::future<Tour> future = task->get_future();
    enqueue(Job{std::move(cancel), [task]() { (*task)(); }});
    return future;
}

void PlanWorker::cancelAll() {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const Job& job : m_jobs) {
        job.cancel->cancel();
    }
    if (m_running) {
        m_running->cancel();
    }
    DELVE_LOGD("worker") << "cancelled " << m_jobs.size() << " queued jobs" << (m_running ? " and the running job" : "");
}

std::size_t PlanWorker::pendingJobs() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_jobs.size() + (m_running ? 1u : 0u);
}

void PlanWorker::enqueue(Job job) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopping) {
            job.cancel->cancel();
        }
        m_jobs.push_back(std::move(job));
    }
    m_wake.notify_one();
}

void PlanWorker::workerLoop() {
    std::size_t completed = 0;
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_wake.wait(lock, [this]() { return m_stopping || !m_jobs.empty(); });
            // Queued jobs are drained even when stopping so every future becomes ready.
            if (m_jobs.empty()) {
                break;
            }
            job = std::move(m_jobs.front());
            m_jobs.pop_front();
            m_running = job.cancel;
        }

        job.run();
        ++completed;

        std::lock_guard<std::mutex> lock(m_mutex);
        m_running.reset();
    }
    DELVE_LOGD("worker") << "plan worker stopped after " << completed << " jobs";
}

} // namespace delve::nav
