#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "core/cancel.h"
#include "core/grid3.h"
#include "nav/pathfinder.h"
#include "nav/tour.h"
#include "world/block_class.h"

// Navigation PlanWorker subsystem
// Responsible for: running path and tour planning on one background thread with cancellation.
// Should NOT do: mutate the world or follow paths.
namespace delve::nav {

// The world must outlive the worker and must not be written while jobs run.
class PlanWorker {
public:
    explicit PlanWorker(const world::WorldView& world, PathfinderConfig config = {});
    ~PlanWorker();

    PlanWorker(const PlanWorker&) = delete;
    PlanWorker& operator=(const PlanWorker&) = delete;

    // The job's own token replaces request.cancel.
    std::future<PathResult> submitPath(PathRequest request);
    std::future<Tour> submitTour(
        std::vector<core::Cell3i> nodes,
        std::optional<core::Cell3i> startNode = std::nullopt,
        std::optional<core::Cell3i> endNode = std::nullopt,
        DistanceFunction distance = heuristicEuclidean);

    // Cancels queued and running jobs; their futures still become ready.
    void cancelAll();
    [[nodiscard]] std::size_t pendingJobs() const;

private:
    struct Job {
        std::shared_ptr<core::CancelToken> cancel;
        std::function<void()> run;
    };

    void enqueue(Job job);
    void workerLoop();

    const world::WorldView& m_world;
    PathfinderConfig m_config;

    mutable std::mutex m_mutex;
    std::condition_variable m_wake;
    std::deque<Job> m_jobs;
    std::shared_ptr<core::CancelToken> m_running;
    bool m_stopping = false;
    std::thread m_thread;
};

} // namespace delve::nav
