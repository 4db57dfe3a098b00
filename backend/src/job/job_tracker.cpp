#include "job_tracker.hpp"
#include "lake/errors.hpp"

#include <sstream>

std::string JobTracker::next_id()
{
    std::uint64_t v = seq_.fetch_add(1, std::memory_order_relaxed);
    std::ostringstream os;
    os << "job-" << v;
    return os.str();
}

std::shared_ptr<Job> JobTracker::create(std::size_t total_parts)
{
    auto job = std::make_shared<Job>(next_id(), total_parts);
    std::scoped_lock lk(mtx_);
    jobs_.emplace(job->id(), job);
    return job;
}

std::shared_ptr<Job> JobTracker::find(const std::string& id) const
{
    std::scoped_lock lk(mtx_);
    auto it = jobs_.find(id);
    return it == jobs_.end() ? nullptr : it->second;
}

bool JobTracker::cancel(const std::string& id)
{
    auto job = find(id);
    return job && job->abort();
}

bool JobTracker::release(const std::string& id)
{
    std::scoped_lock lk(mtx_);
    return jobs_.erase(id) > 0;
}

JobSnapshot JobTracker::snapshot(const std::string& id) const
{
    auto job = find(id);
    if (!job) throw InvalidJobError("unknown job " + id);
    return job->snapshot();
}

std::vector<std::string> JobTracker::ids() const
{
    std::scoped_lock lk(mtx_);
    std::vector<std::string> out;
    out.reserve(jobs_.size());
    for (const auto& kv : jobs_) out.push_back(kv.first);
    return out;
}

std::size_t JobTracker::size() const
{
    std::scoped_lock lk(mtx_);
    return jobs_.size();
}
