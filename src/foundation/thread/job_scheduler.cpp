/// @file job_scheduler.cpp
/// @brief SimJobScheduler implementation wrapping kcenon thread_system.

#include "wbs/foundation/job_scheduler.hpp"

// kcenon thread_system headers (hidden behind PIMPL)
#include <kcenon/thread/core/thread_pool.h>
#include <kcenon/thread/core/thread_worker.h>
#include <kcenon/thread/core/job_builder.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <future>
#include <mutex>
#include <string>
#include <unordered_map>

namespace wbs::foundation {

static kcenon::thread::job_priority mapPriority(JobPriority p) {
    switch (p) {
        case JobPriority::High:   return kcenon::thread::job_priority::high;
        case JobPriority::Normal: return kcenon::thread::job_priority::normal;
        case JobPriority::Low:    return kcenon::thread::job_priority::low;
    }
    return kcenon::thread::job_priority::normal;
}

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct SimJobScheduler::Impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::size_t workers{0};
    std::atomic<uint64_t> nextJobId{1};

    // JobId -> completion future and cancellation flag.
    std::unordered_map<JobId, std::shared_future<void>> futures;
    std::unordered_map<JobId, std::shared_ptr<std::atomic<bool>>> cancelFlags;

    std::mutex mutex;
};

// ---------------------------------------------------------------------------
// Construction / Destruction / Move
// ---------------------------------------------------------------------------
SimJobScheduler::SimJobScheduler(std::size_t numThreads)
    : impl_(std::make_unique<Impl>())
{
    impl_->workers = std::max<std::size_t>(1, numThreads);
    impl_->pool = std::make_shared<kcenon::thread::thread_pool>("SimJobScheduler");

    std::vector<std::unique_ptr<kcenon::thread::thread_worker>> workers;
    workers.reserve(impl_->workers);
    for (std::size_t i = 0; i < impl_->workers; ++i) {
        workers.push_back(std::make_unique<kcenon::thread::thread_worker>());
    }
    impl_->pool->enqueue_batch(std::move(workers));
    impl_->pool->start();
}

SimJobScheduler::~SimJobScheduler() {
    if (impl_ && impl_->pool) {
        impl_->pool->stop(false); // graceful: finish queued combats
    }
}

SimJobScheduler::SimJobScheduler(SimJobScheduler&&) noexcept = default;
SimJobScheduler& SimJobScheduler::operator=(SimJobScheduler&&) noexcept = default;

// ---------------------------------------------------------------------------
// schedule()
// ---------------------------------------------------------------------------
SimResult<SimJobScheduler::JobId> SimJobScheduler::schedule(
    JobFunc job, JobPriority priority)
{
    auto id = impl_->nextJobId.fetch_add(1, std::memory_order_relaxed);
    auto cancelFlag = std::make_shared<std::atomic<bool>>(false);
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future().share();

    auto threadJob = kcenon::thread::job_builder()
        .name("wbs_job_" + std::to_string(id))
        .priority(mapPriority(priority))
        .work([fn = std::move(job), cancelFlag, promise]()
              -> kcenon::common::VoidResult {
            try {
                if (!cancelFlag->load(std::memory_order_acquire)) {
                    fn();
                }
                promise->set_value();
            } catch (...) {
                // Hand the exception to wait(), which reports ThreadError.
                promise->set_exception(std::current_exception());
            }
            return kcenon::common::VoidResult::ok(std::monostate{});
        })
        .build();

    // Register before enqueue so a fast worker cannot finish an unknown id.
    {
        std::lock_guard lock(impl_->mutex);
        impl_->futures[id] = future;
        impl_->cancelFlags[id] = cancelFlag;
    }

    auto enqResult = impl_->pool->enqueue(std::move(threadJob));
    if (enqResult.is_err()) {
        std::lock_guard lock(impl_->mutex);
        impl_->futures.erase(id);
        impl_->cancelFlags.erase(id);
        return SimResult<JobId>::err(
            SimError(ErrorCode::JobScheduleFailed, "failed to enqueue job"));
    }

    return SimResult<JobId>::ok(id);
}

SimResult<std::vector<SimJobScheduler::JobId>> SimJobScheduler::scheduleBatch(
    std::vector<JobFunc> jobs)
{
    std::vector<JobId> ids;
    ids.reserve(jobs.size());
    for (auto& job : jobs) {
        auto scheduled = schedule(std::move(job));
        if (!scheduled) {
            // Drain what was queued so no job outlives the caller's state.
            static_cast<void>(waitAll(ids));
            return SimResult<std::vector<JobId>>::err(scheduled.error());
        }
        ids.push_back(scheduled.value());
    }
    return SimResult<std::vector<JobId>>::ok(std::move(ids));
}

// ---------------------------------------------------------------------------
// wait() / waitAll()
// ---------------------------------------------------------------------------
SimResult<void> SimJobScheduler::wait(JobId id) {
    std::shared_future<void> future;
    {
        std::lock_guard lock(impl_->mutex);
        auto it = impl_->futures.find(id);
        if (it == impl_->futures.end()) {
            return SimResult<void>::err(
                SimError(ErrorCode::JobNotFound, "job not found: " + std::to_string(id)));
        }
        future = it->second;
    }

    auto outcome = SimResult<void>::ok();
    try {
        future.get();
    } catch (const std::exception& e) {
        outcome = SimResult<void>::err(
            SimError(ErrorCode::ThreadError, std::string("job execution failed: ") + e.what()));
    } catch (...) {
        outcome = SimResult<void>::err(
            SimError(ErrorCode::ThreadError, "job execution failed"));
    }

    // Forget the job whether it succeeded or threw.
    {
        std::lock_guard lock(impl_->mutex);
        impl_->futures.erase(id);
        impl_->cancelFlags.erase(id);
    }
    return outcome;
}

SimResult<void> SimJobScheduler::waitAll(const std::vector<JobId>& ids) {
    auto outcome = SimResult<void>::ok();
    for (auto id : ids) {
        auto waited = wait(id);
        if (!waited && outcome) {
            outcome = std::move(waited);
        }
    }
    return outcome;
}

// ---------------------------------------------------------------------------
// cancel()
// ---------------------------------------------------------------------------
SimResult<void> SimJobScheduler::cancel(JobId id) {
    std::lock_guard lock(impl_->mutex);

    auto flagIt = impl_->cancelFlags.find(id);
    if (flagIt == impl_->cancelFlags.end()) {
        return SimResult<void>::err(
            SimError(ErrorCode::JobNotFound, "job not found: " + std::to_string(id)));
    }

    auto futIt = impl_->futures.find(id);
    if (futIt != impl_->futures.end()) {
        auto status = futIt->second.wait_for(std::chrono::seconds(0));
        if (status == std::future_status::ready) {
            return SimResult<void>::err(
                SimError(ErrorCode::JobCancelled, "job already completed"));
        }
    }

    flagIt->second->store(true, std::memory_order_release);
    return SimResult<void>::ok();
}

std::size_t SimJobScheduler::workerCount() const noexcept {
    return impl_ ? impl_->workers : 0;
}

} // namespace wbs::foundation
