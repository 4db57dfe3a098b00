#pragma once
#include <atomic>
#include <chrono>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <boost/asio/thread_pool.hpp>

#include "fetch/fetcher.hpp"
#include "fetch/provider_readiness.hpp"
#include "job/job_tracker.hpp"
#include "lake/logical_request.hpp"
#include "lake/request_expander.hpp"
#include "normalize/normalizer_router.hpp"
#include "storage/object_store.hpp"

enum class SubmitMode { Async, Sync };

const char* to_cstr(SubmitMode m);
// Throws std::invalid_argument for anything but "async" / "sync".
SubmitMode parse_submit_mode(std::string_view s);

// What a caller sees of a submitted request.
struct JobReport {
    std::string id;                      // empty when every partition was skipped
    JobState state{JobState::Open};
    std::size_t completed{0};
    std::size_t total{0};
    bool committed{false};
    std::size_t rows_written{0};
    std::vector<FailedSlot> failed_slots;
    std::vector<std::string> written_keys;
    std::vector<std::string> unwritten_keys;
    std::vector<std::string> skipped_keys;
    std::optional<std::string> commit_error;
};

// Handle returned by submit. A null job means nothing needed fetching: the request is
// complete with zero parts.
struct JobHandle {
    std::shared_ptr<Job> job;
    std::vector<std::string> skipped_keys;

    std::string id() const { return job ? job->id() : std::string{}; }
    JobSnapshot snapshot() const;
    // Blocks until committed or aborted.
    void wait() const;
    bool wait_for(std::chrono::milliseconds timeout) const;
    JobReport report() const;
};

struct DispatcherOptions {
    std::size_t max_workers{2};
    // Final reports of settled or cancelled jobs kept for poll, oldest evicted first.
    std::size_t retained_reports{1024};
};

// Turns one LogicalRequest into slot-indexed sub-requests, runs them on a bounded
// worker pool and commits the finalized job, one object per partition key.
class FanoutDispatcher {
public:
    // `readiness` may be null when no provider-backed kind will be submitted.
    FanoutDispatcher(DispatcherOptions opts,
                     std::shared_ptr<IFetcher> fetcher,
                     std::shared_ptr<IObjectStore> store,
                     std::shared_ptr<IProviderReadiness> readiness,
                     RequestExpander expander = RequestExpander{});
    ~FanoutDispatcher();

    FanoutDispatcher(const FanoutDispatcher&) = delete;
    FanoutDispatcher& operator=(const FanoutDispatcher&) = delete;

    // Throws InvalidRangeError / EmptyExpansionError / ProviderNotReadyError before any
    // fetch. Async returns once every sub-request is queued; Sync after commit.
    JobHandle submit(const LogicalRequest& req, SubmitMode mode);

    // Live jobs, then the retained reports of finished ones.
    std::optional<JobReport> poll(const std::string& job_id) const;

    // Aborts an open job. Queued sub-requests skip the fetch; late completions drop.
    bool cancel(const std::string& job_id);

    // Drains the pool; further submits throw. Idempotent. Every submit that got past the
    // shutdown check has its sub-requests queued before the pool is joined.
    void shutdown();

    const JobTracker& tracker() const { return tracker_; }

private:
    using SubRequestList = std::vector<SubRequest>;

    void run_subrequest(const std::shared_ptr<Job>& job,
                        const std::shared_ptr<const SubRequestList>& subs,
                        std::size_t slot);
    void finalize(Job& job, const SubRequestList& subs);
    // Moves a settled or aborted job from the live maps to the retained reports.
    void retire(const std::string& job_id);

    DispatcherOptions opts_;
    std::shared_ptr<IFetcher> fetcher_;
    std::shared_ptr<IObjectStore> store_;
    std::shared_ptr<IProviderReadiness> readiness_;
    RequestExpander expander_;
    NormalizerRouter router_;
    JobTracker tracker_;

    mutable std::mutex handles_mtx_;
    std::unordered_map<std::string, JobHandle> handles_;
    std::unordered_map<std::string, JobReport> finished_;
    std::deque<std::string> finished_order_;

    // Held across the shutdown check and the posts of one submit, and by shutdown before join.
    std::mutex lifecycle_mtx_;
    std::atomic<bool> shut_down_{false};
    boost::asio::thread_pool pool_;
};
