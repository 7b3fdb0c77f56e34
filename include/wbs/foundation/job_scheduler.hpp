#pragma once

/// @file job_scheduler.hpp
/// @brief SimJobScheduler wrapping kcenon thread_system for batch execution.

#include "wbs/foundation/sim_result.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <thread>
#include <vector>

namespace wbs::foundation {

/// Priority levels for scheduled jobs.
///
/// Maps to kcenon::thread::job_priority internally.
enum class JobPriority { High, Normal, Low };

/// Worker pool used to run independent combats of a batch in parallel.
///
/// Each job is fire-and-wait: schedule() returns an id that wait() blocks
/// on. Hides thread_system behind PIMPL.
///
/// Example:
/// @code
///   SimJobScheduler scheduler(4);
///   auto ids = scheduler.scheduleBatch(std::move(jobs));
///   if (ids) {
///       auto done = scheduler.waitAll(ids.value());
///   }
/// @endcode
class SimJobScheduler {
public:
    using JobId = uint64_t;
    using JobFunc = std::function<void()>;

    explicit SimJobScheduler(std::size_t numThreads = std::thread::hardware_concurrency());

    ~SimJobScheduler();

    SimJobScheduler(const SimJobScheduler&) = delete;
    SimJobScheduler& operator=(const SimJobScheduler&) = delete;
    SimJobScheduler(SimJobScheduler&&) noexcept;
    SimJobScheduler& operator=(SimJobScheduler&&) noexcept;

    /// Schedule a single job.
    SimResult<JobId> schedule(JobFunc job, JobPriority priority = JobPriority::Normal);

    /// Schedule every job in @p jobs at Normal priority.
    /// Stops at the first enqueue failure; already queued jobs still run.
    SimResult<std::vector<JobId>> scheduleBatch(std::vector<JobFunc> jobs);

    /// Block until the job completes. JobNotFound for unknown ids,
    /// ThreadError if the job threw.
    SimResult<void> wait(JobId id);

    /// Wait for every id; reports the first failure after all have finished.
    SimResult<void> waitAll(const std::vector<JobId>& ids);

    /// Ask a pending job not to run. JobCancelled if it already finished.
    SimResult<void> cancel(JobId id);

    [[nodiscard]] std::size_t workerCount() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace wbs::foundation
