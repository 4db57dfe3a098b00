#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "schema/canonical_table.hpp"

enum class JobState : std::uint8_t { Open, Finalized, Aborted };

const char* to_cstr(JobState s);

enum class CompletionOutcome : std::uint8_t {
    Recorded,   // slot filled, job still open
    Finalizer,  // this call filled the last slot; the caller owns finalize
    Dropped,    // job was aborted; completion ignored
};

struct FailedSlot {
    std::size_t slot{0};
    std::string url;
    std::string reason;
};

struct JobSnapshot {
    std::size_t completed{0};
    std::size_t total{0};
    JobState state{JobState::Open};

    bool finalized() const { return state == JobState::Finalized; }
    bool aborted() const { return state == JobState::Aborted; }
};

// Result of writing a finalized job to the object store.
struct CommitResult {
    std::size_t rows_written{0};
    std::vector<std::string> written_keys;
    std::vector<std::string> unwritten_keys;   // every slot for the key failed
    std::optional<std::string> error;
};

// Completion state for one logical request split into total_parts slots.
//
// Open -> Finalized when the last slot is filled, Open -> Aborted on cancel. Both are
// terminal. One mutex guards the whole fill + count + compare sequence, so exactly one
// record_* call ever returns Finalizer. Tables are kept by slot, not by arrival, and are
// released once the job is settled or aborted; the failure list and commit result stay.
class Job {
public:
    // Throws InvalidJobError when total_parts == 0.
    Job(std::string id, std::size_t total_parts);

    Job(const Job&) = delete;
    Job& operator=(const Job&) = delete;

    const std::string& id() const noexcept { return id_; }
    std::size_t total_parts() const noexcept { return total_; }

    // Throws JobAlreadyFinalizedError on a finalized job, InvalidJobError for a bad slot,
    // a null table or a slot written twice. Aborted jobs drop the completion.
    CompletionOutcome record_completion(std::size_t slot, std::shared_ptr<const CanonicalTable> table);

    // Same contract; `sentinel` is the empty table that stands in for the failed slot.
    CompletionOutcome record_failure(std::size_t slot, std::shared_ptr<const CanonicalTable> sentinel,
                                     FailedSlot failure);

    // Open -> Aborted. Returns false when the job is already terminal.
    bool abort();

    JobSnapshot snapshot() const;
    bool aborted() const;

    // Slot tables in slot order. Throws InvalidJobError before finalize and after settle.
    std::vector<std::shared_ptr<const CanonicalTable>> tables() const;
    // Sorted by slot.
    std::vector<FailedSlot> failed_slots() const;
    bool slot_failed(std::size_t slot) const;

    // Finalizer publishes the commit outcome, drops the slot tables and wakes waiters.
    void settle(CommitResult result);
    std::optional<CommitResult> commit_result() const;

    // Blocks until the job is committed or aborted.
    void wait_settled() const;
    bool wait_settled_for(std::chrono::milliseconds timeout) const;

private:
    CompletionOutcome fill_locked(std::size_t slot, std::shared_ptr<const CanonicalTable> table);
    bool settled_locked() const { return state_ == JobState::Aborted || result_.has_value(); }
    void release_slots_locked();

    const std::string id_;
    const std::size_t total_;

    mutable std::mutex mu_;
    mutable std::condition_variable settled_cv_;
    std::size_t completed_{0};
    JobState state_{JobState::Open};
    std::vector<std::shared_ptr<const CanonicalTable>> slots_;   // nullptr = not yet filled
    std::vector<FailedSlot> failures_;
    std::optional<CommitResult> result_;
};
