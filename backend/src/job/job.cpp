#include "job.hpp"
#include "lake/errors.hpp"
#include "util/log.hpp"

#include <algorithm>

const char* to_cstr(JobState s)
{
    switch (s) {
        case JobState::Open:      return "open";
        case JobState::Finalized: return "finalized";
        case JobState::Aborted:   return "aborted";
    }
    return "unknown";
}

Job::Job(std::string id, std::size_t total_parts)
    : id_(std::move(id)), total_(total_parts)
{
    if (total_parts == 0) {
        throw InvalidJobError("job " + id_ + ": total_parts must be >= 1");
    }
    slots_.resize(total_parts);
}

CompletionOutcome Job::fill_locked(std::size_t slot, std::shared_ptr<const CanonicalTable> table)
{
    if (state_ == JobState::Aborted) {
        log_debug("job") << id_ << ": dropped late completion for slot " << slot;
        return CompletionOutcome::Dropped;
    }
    if (state_ == JobState::Finalized) {
        throw JobAlreadyFinalizedError("job " + id_ + ": completion for slot " + std::to_string(slot) +
                                       " after finalize");
    }
    if (slot >= total_) {
        throw InvalidJobError("job " + id_ + ": slot " + std::to_string(slot) + " out of range (total " +
                              std::to_string(total_) + ")");
    }
    if (!table) {
        throw InvalidJobError("job " + id_ + ": null table for slot " + std::to_string(slot));
    }
    if (slots_[slot]) {
        throw InvalidJobError("job " + id_ + ": slot " + std::to_string(slot) + " written twice");
    }

    slots_[slot] = std::move(table);
    if (++completed_ == total_) {
        state_ = JobState::Finalized;
        return CompletionOutcome::Finalizer;
    }
    return CompletionOutcome::Recorded;
}

CompletionOutcome Job::record_completion(std::size_t slot, std::shared_ptr<const CanonicalTable> table)
{
    std::scoped_lock lk(mu_);
    return fill_locked(slot, std::move(table));
}

CompletionOutcome Job::record_failure(std::size_t slot, std::shared_ptr<const CanonicalTable> sentinel,
                                      FailedSlot failure)
{
    std::scoped_lock lk(mu_);
    failure.slot = slot;
    auto outcome = fill_locked(slot, std::move(sentinel));
    if (outcome != CompletionOutcome::Dropped) {
        failures_.push_back(std::move(failure));
    }
    return outcome;
}

bool Job::abort()
{
    {
        std::scoped_lock lk(mu_);
        if (state_ != JobState::Open) return false;
        state_ = JobState::Aborted;
        release_slots_locked();
    }
    settled_cv_.notify_all();
    return true;
}

JobSnapshot Job::snapshot() const
{
    std::scoped_lock lk(mu_);
    return JobSnapshot{completed_, total_, state_};
}

bool Job::aborted() const
{
    std::scoped_lock lk(mu_);
    return state_ == JobState::Aborted;
}

std::vector<std::shared_ptr<const CanonicalTable>> Job::tables() const
{
    std::scoped_lock lk(mu_);
    if (state_ != JobState::Finalized) {
        throw InvalidJobError("job " + id_ + ": tables requested while " + to_cstr(state_));
    }
    if (result_) {
        throw InvalidJobError("job " + id_ + ": tables already released after commit");
    }
    return slots_;
}

std::vector<FailedSlot> Job::failed_slots() const
{
    std::vector<FailedSlot> out;
    {
        std::scoped_lock lk(mu_);
        out = failures_;
    }
    std::sort(out.begin(), out.end(), [](const FailedSlot& a, const FailedSlot& b) { return a.slot < b.slot; });
    return out;
}

bool Job::slot_failed(std::size_t slot) const
{
    std::scoped_lock lk(mu_);
    return std::any_of(failures_.begin(), failures_.end(), [&](const FailedSlot& f) { return f.slot == slot; });
}

void Job::release_slots_locked()
{
    std::vector<std::shared_ptr<const CanonicalTable>>().swap(slots_);
}

void Job::settle(CommitResult result)
{
    {
        std::scoped_lock lk(mu_);
        if (state_ != JobState::Finalized) {
            throw InvalidJobError("job " + id_ + ": settle while " + to_cstr(state_));
        }
        if (result_) {
            throw JobAlreadyFinalizedError("job " + id_ + ": settled twice");
        }
        result_ = std::move(result);
        release_slots_locked();
    }
    settled_cv_.notify_all();
}

std::optional<CommitResult> Job::commit_result() const
{
    std::scoped_lock lk(mu_);
    return result_;
}

void Job::wait_settled() const
{
    std::unique_lock lk(mu_);
    settled_cv_.wait(lk, [&] { return settled_locked(); });
}

bool Job::wait_settled_for(std::chrono::milliseconds timeout) const
{
    std::unique_lock lk(mu_);
    return settled_cv_.wait_for(lk, timeout, [&] { return settled_locked(); });
}
