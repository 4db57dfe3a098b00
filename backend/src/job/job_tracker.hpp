#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "job.hpp"

// Registry of live jobs, addressed by id for polling and cancellation.
class JobTracker {
public:
    // Throws InvalidJobError when total_parts == 0.
    std::shared_ptr<Job> create(std::size_t total_parts);

    std::shared_ptr<Job> find(const std::string& id) const;

    // Aborts an open job. False for unknown ids and jobs already terminal.
    bool cancel(const std::string& id);

    // Forgets a settled or aborted job. Holders of the shared_ptr keep it alive.
    bool release(const std::string& id);

    JobSnapshot snapshot(const std::string& id) const;  // throws InvalidJobError for unknown ids

    std::vector<std::string> ids() const;
    std::size_t size() const;

private:
    std::string next_id();

    mutable std::mutex mtx_;
    std::unordered_map<std::string, std::shared_ptr<Job>> jobs_;
    std::atomic<std::uint64_t> seq_{1};
};
