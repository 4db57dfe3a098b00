#include "object_store.hpp"
#include "lake/errors.hpp"

#include <algorithm>
#include <atomic>
#include <fstream>
#include <iterator>
#include <system_error>

namespace fs = std::filesystem;

namespace
{
    std::atomic<std::uint64_t> g_tmp_seq{1};

    void check_key(const std::string &key)
    {
        if (key.empty() || key.front() == '/' || key.find("..") != std::string::npos) {
            throw StorageError("invalid object key '" + key + "'");
        }
    }
}

// Objects are plain files under root; writes go through a temp file and a rename.
class FilesystemObjectStore final : public IObjectStore
{
public:
    explicit FilesystemObjectStore(fs::path root) : root_(std::move(root))
    {
        std::error_code ec;
        fs::create_directories(root_, ec);
        if (ec) throw StorageError("cannot create " + root_.string() + ": " + ec.message());
    }

    void put(const std::string &key, const Bytes &bytes) override
    {
        check_key(key);
        const fs::path target = root_ / key;
        std::error_code ec;
        fs::create_directories(target.parent_path(), ec);
        if (ec) throw StorageError("cannot create " + target.parent_path().string() + ": " + ec.message());

        fs::path tmp = target;
        tmp += ".tmp" + std::to_string(g_tmp_seq.fetch_add(1, std::memory_order_relaxed));
        {
            std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
            if (!out) throw StorageError("cannot open " + tmp.string() + " for writing");
            out.write(reinterpret_cast<const char *>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
            if (!out) throw StorageError("short write to " + tmp.string());
        }
        fs::rename(tmp, target, ec);
        if (ec) {
            fs::remove(tmp, ec);
            throw StorageError("cannot move object into " + target.string());
        }
    }

    std::optional<Bytes> get(const std::string &key) const override
    {
        check_key(key);
        std::ifstream in(root_ / key, std::ios::binary);
        if (!in) return std::nullopt;
        Bytes bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        if (in.bad()) throw StorageError("read failed for " + key);
        return bytes;
    }

    bool exists(const std::string &key) const override
    {
        check_key(key);
        std::error_code ec;
        return fs::is_regular_file(root_ / key, ec);
    }

    std::vector<std::string> list(const std::string &prefix) const override
    {
        // Walk from the deepest directory named by the prefix.
        const auto slash = prefix.rfind('/');
        const fs::path start = slash == std::string::npos ? root_ : root_ / prefix.substr(0, slash);

        std::vector<std::string> keys;
        std::error_code ec;
        if (!fs::is_directory(start, ec)) return keys;

        fs::recursive_directory_iterator it(start, ec), end;
        if (ec) throw StorageError("cannot list " + start.string() + ": " + ec.message());
        for (; it != end; it.increment(ec)) {
            if (ec) throw StorageError("cannot list " + start.string() + ": " + ec.message());
            if (!it->is_regular_file()) continue;
            std::string key = it->path().lexically_relative(root_).generic_string();
            if (key.find(".tmp") != std::string::npos) continue;
            if (key.compare(0, prefix.size(), prefix) == 0) keys.push_back(std::move(key));
        }
        std::sort(keys.begin(), keys.end());
        return keys;
    }

    std::string describe() const override { return "filesystem:" + root_.string(); }

private:
    fs::path root_;
};

std::unique_ptr<IObjectStore> make_filesystem_store(fs::path root)
{
    return std::make_unique<FilesystemObjectStore>(std::move(root));
}
