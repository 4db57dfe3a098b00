#include "fanout_dispatcher.hpp"
#include "lake/errors.hpp"
#include "schema/table_codec.hpp"
#include "util/log.hpp"

#include <boost/asio/post.hpp>

#include <stdexcept>

const char* to_cstr(SubmitMode m)
{
    return m == SubmitMode::Sync ? "sync" : "async";
}

SubmitMode parse_submit_mode(std::string_view s)
{
    if (s == "async") return SubmitMode::Async;
    if (s == "sync")  return SubmitMode::Sync;
    throw std::invalid_argument("unknown submit mode '" + std::string(s) + "'");
}

JobSnapshot JobHandle::snapshot() const
{
    if (!job) return JobSnapshot{0, 0, JobState::Finalized};
    return job->snapshot();
}

void JobHandle::wait() const
{
    if (job) job->wait_settled();
}

bool JobHandle::wait_for(std::chrono::milliseconds timeout) const
{
    return !job || job->wait_settled_for(timeout);
}

JobReport JobHandle::report() const
{
    JobReport r;
    r.skipped_keys = skipped_keys;
    if (!job) {
        r.state = JobState::Finalized;
        r.committed = true;
        return r;
    }

    r.id = job->id();
    const auto snap = job->snapshot();
    r.state = snap.state;
    r.completed = snap.completed;
    r.total = snap.total;
    r.failed_slots = job->failed_slots();
    if (auto result = job->commit_result()) {
        r.committed = true;
        r.rows_written = result->rows_written;
        r.written_keys = std::move(result->written_keys);
        r.unwritten_keys = std::move(result->unwritten_keys);
        r.commit_error = std::move(result->error);
    }
    return r;
}

FanoutDispatcher::FanoutDispatcher(DispatcherOptions opts,
                                   std::shared_ptr<IFetcher> fetcher,
                                   std::shared_ptr<IObjectStore> store,
                                   std::shared_ptr<IProviderReadiness> readiness,
                                   RequestExpander expander)
    : opts_(opts)
    , fetcher_(std::move(fetcher))
    , store_(std::move(store))
    , readiness_(std::move(readiness))
    , expander_(std::move(expander))
    , pool_(opts.max_workers == 0 ? 1 : opts.max_workers)
{
    if (!fetcher_ || !store_) {
        throw std::invalid_argument("dispatcher needs a fetcher and an object store");
    }
    log_info("dispatch") << "worker pool of " << (opts_.max_workers == 0 ? 1 : opts_.max_workers)
                         << " writing to " << store_->describe();
}

FanoutDispatcher::~FanoutDispatcher()
{
    shutdown();
}

void FanoutDispatcher::shutdown()
{
    {
        std::scoped_lock lk(lifecycle_mtx_);
        if (shut_down_.exchange(true)) return;
    }
    pool_.join();
    log_info("dispatch") << "worker pool drained";
}

JobHandle FanoutDispatcher::submit(const LogicalRequest& req, SubmitMode mode)
{
    if (shut_down_.load()) {
        throw std::runtime_error("dispatcher is shut down");
    }

    // Validates; no I/O before this point.
    auto partitions = expander_.plan(req);
    if (partitions.empty()) {
        throw EmptyExpansionError(describe(req) + " contains no trading days");
    }

    JobHandle handle;
    if (!req.force_refresh) {
        std::vector<PartitionPlan> pending;
        for (auto& p : partitions) {
            if (store_->exists(p.key.path)) {
                log_info("dispatch") << "skip existing " << p.key.path;
                handle.skipped_keys.push_back(p.key.path);
            } else {
                pending.push_back(std::move(p));
            }
        }
        partitions = std::move(pending);
        if (partitions.empty()) {
            log_info("dispatch") << describe(req) << ": all " << handle.skipped_keys.size()
                                 << " partitions exist, nothing to fetch";
            return handle;
        }
    }

    auto subs = std::make_shared<const SubRequestList>(expander_.expand(req, partitions));
    if (subs->empty()) {
        throw EmptyExpansionError(describe(req) + " expanded into zero sub-requests");
    }

    if (needs_provider(req.kind) && readiness_ && !readiness_->ready()) {
        throw ProviderNotReadyError("data provider terminal is not ready");
    }

    {
        std::scoped_lock lifecycle(lifecycle_mtx_);
        if (shut_down_.load()) {
            throw std::runtime_error("dispatcher is shut down");
        }
        handle.job = tracker_.create(subs->size());
        {
            std::scoped_lock lk(handles_mtx_);
            handles_.emplace(handle.job->id(), handle);
        }
        log_info("dispatch") << handle.job->id() << ": " << describe(req) << " -> " << subs->size()
                             << " sub-requests over " << partitions.size() << " partitions";

        for (std::size_t slot = 0; slot < subs->size(); ++slot) {
            boost::asio::post(pool_, [this, job = handle.job, subs, slot] { run_subrequest(job, subs, slot); });
        }
    }

    if (mode == SubmitMode::Sync) {
        handle.wait();
    }
    return handle;
}

void FanoutDispatcher::run_subrequest(const std::shared_ptr<Job>& job,
                                      const std::shared_ptr<const SubRequestList>& subs,
                                      std::size_t slot)
{
    const SubRequest& sr = (*subs)[slot];
    if (job->aborted()) {
        log_debug("dispatch") << job->id() << ": slot " << slot << " skipped, job aborted";
        return;
    }

    std::shared_ptr<const CanonicalTable> table;
    std::optional<FailedSlot> failure;
    try {
        table = router_.normalize(fetcher_->fetch(sr), sr.kind);
    } catch (const PermanentFetchError& e) {
        failure = FailedSlot{slot, sr.url, e.what()};
    } catch (const TransientFetchError& e) {
        failure = FailedSlot{slot, sr.url, std::string("transient failure: ") + e.what()};
    } catch (const SchemaMismatchError& e) {
        failure = FailedSlot{slot, sr.url, std::string("schema mismatch: ") + e.what()};
    } catch (const std::exception& e) {
        failure = FailedSlot{slot, sr.url, e.what()};
    }

    CompletionOutcome outcome;
    if (failure) {
        log_warn("dispatch") << job->id() << ": slot " << slot << " failed: " << failure->reason;
        outcome = job->record_failure(slot, std::make_shared<const CanonicalTable>(sr.kind), std::move(*failure));
    } else {
        outcome = job->record_completion(slot, std::move(table));
    }

    if (outcome == CompletionOutcome::Finalizer) {
        finalize(*job, *subs);
    }
}

void FanoutDispatcher::finalize(Job& job, const SubRequestList& subs)
{
    const auto tables = job.tables();

    // Group slots by target key; slots are numbered in partition order.
    std::vector<std::pair<std::string, std::vector<std::size_t>>> groups;
    for (const auto& sr : subs) {
        if (groups.empty() || groups.back().first != sr.key.path) {
            groups.emplace_back(sr.key.path, std::vector<std::size_t>{});
        }
        groups.back().second.push_back(sr.slot);
    }

    CommitResult result;
    for (const auto& [key, slots] : groups) {
        std::vector<std::shared_ptr<const CanonicalTable>> parts;
        bool any_ok = false;
        for (auto slot : slots) {
            parts.push_back(tables[slot]);
            any_ok = any_ok || !job.slot_failed(slot);
        }
        if (!any_ok) {
            log_warn("dispatch") << job.id() << ": every sub-request for " << key << " failed, not written";
            result.unwritten_keys.push_back(key);
            continue;
        }

        try {
            const auto merged = CanonicalTable::concat(subs.front().kind, parts);
            store_->put(key, TableCodec::encode(merged));
            result.rows_written += merged.num_rows();
            result.written_keys.push_back(key);
            log_info("dispatch") << job.id() << ": wrote " << merged.num_rows() << " rows to " << key;
        } catch (const std::exception& e) {
            log_error("dispatch") << job.id() << ": commit of " << key << " failed: " << e.what();
            const std::string msg = key + ": " + e.what();
            result.error = result.error ? *result.error + "; " + msg : msg;
        }
    }

    const auto failed = job.failed_slots().size();
    log_info("dispatch") << job.id() << ": finalized, " << result.rows_written << " rows, " << failed
                         << " failed slots";
    job.settle(std::move(result));
    retire(job.id());
}

void FanoutDispatcher::retire(const std::string& job_id)
{
    std::scoped_lock lk(handles_mtx_);
    auto it = handles_.find(job_id);
    if (it == handles_.end()) return;
    finished_[job_id] = it->second.report();
    handles_.erase(it);
    tracker_.release(job_id);

    finished_order_.push_back(job_id);
    while (finished_order_.size() > opts_.retained_reports) {
        finished_.erase(finished_order_.front());
        finished_order_.pop_front();
    }
}

std::optional<JobReport> FanoutDispatcher::poll(const std::string& job_id) const
{
    std::scoped_lock lk(handles_mtx_);
    if (auto it = handles_.find(job_id); it != handles_.end()) return it->second.report();
    if (auto it = finished_.find(job_id); it != finished_.end()) return it->second;
    return std::nullopt;
}

bool FanoutDispatcher::cancel(const std::string& job_id)
{
    const bool aborted = tracker_.cancel(job_id);
    if (aborted) {
        log_info("dispatch") << job_id << ": cancelled";
        retire(job_id);
    }
    return aborted;
}
