#include "object_store.hpp"

#include <map>
#include <mutex>

class MemoryObjectStore final : public IObjectStore
{
    mutable std::mutex mtx_;
    std::map<std::string, Bytes> objects_;

public:
    void put(const std::string &key, const Bytes &bytes) override
    {
        std::scoped_lock lk(mtx_);
        objects_[key] = bytes;
    }

    std::optional<Bytes> get(const std::string &key) const override
    {
        std::scoped_lock lk(mtx_);
        auto it = objects_.find(key);
        if (it == objects_.end())
            return std::nullopt;
        return it->second;
    }

    bool exists(const std::string &key) const override
    {
        std::scoped_lock lk(mtx_);
        return objects_.count(key) != 0;
    }

    std::vector<std::string> list(const std::string &prefix) const override
    {
        std::scoped_lock lk(mtx_);
        std::vector<std::string> keys;
        for (auto it = objects_.lower_bound(prefix); it != objects_.end(); ++it)
        {
            if (it->first.compare(0, prefix.size(), prefix) != 0)
                break;
            keys.push_back(it->first);
        }
        return keys;
    }

    std::string describe() const override { return "memory"; }
};

std::unique_ptr<IObjectStore> make_memory_store() { return std::make_unique<MemoryObjectStore>(); }
