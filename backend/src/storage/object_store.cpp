#include "object_store.hpp"

namespace
{
    std::vector<std::string_view> segments(std::string_view s)
    {
        std::vector<std::string_view> out;
        std::size_t pos = 0;
        while (true) {
            auto slash = s.find('/', pos);
            if (slash == std::string_view::npos) {
                out.push_back(s.substr(pos));
                return out;
            }
            out.push_back(s.substr(pos, slash - pos));
            pos = slash + 1;
        }
    }

    bool segment_match(std::string_view p, std::string_view s)
    {
        std::size_t pi = 0, si = 0;
        std::size_t star = std::string_view::npos, mark = 0;
        while (si < s.size()) {
            if (pi < p.size() && p[pi] == '*') {
                star = pi++;
                mark = si;
            } else if (pi < p.size() && p[pi] == s[si]) {
                ++pi;
                ++si;
            } else if (star != std::string_view::npos) {
                pi = star + 1;
                si = ++mark;
            } else {
                return false;
            }
        }
        while (pi < p.size() && p[pi] == '*') ++pi;
        return pi == p.size();
    }
}

bool glob_match(std::string_view pattern, std::string_view key)
{
    const auto ps = segments(pattern);
    const auto ks = segments(key);
    if (ps.size() != ks.size()) return false;
    for (std::size_t i = 0; i < ps.size(); ++i) {
        if (!segment_match(ps[i], ks[i])) return false;
    }
    return true;
}

std::string literal_prefix(std::string_view pattern)
{
    auto star = pattern.find('*');
    if (star == std::string_view::npos) return std::string(pattern);
    auto slash = pattern.rfind('/', star);
    return slash == std::string_view::npos ? std::string{} : std::string(pattern.substr(0, slash + 1));
}

std::vector<std::vector<StoredObject>> IObjectStore::get_many(const std::vector<std::string> &patterns) const
{
    std::vector<std::vector<StoredObject>> out;
    out.reserve(patterns.size());
    for (const auto &pattern : patterns) {
        std::vector<StoredObject> found;
        if (pattern.find('*') == std::string::npos) {
            if (auto bytes = get(pattern)) found.push_back(StoredObject{pattern, std::move(*bytes)});
        } else {
            for (const auto &key : list(literal_prefix(pattern))) {
                if (!glob_match(pattern, key)) continue;
                // listed objects may be deleted before the read
                if (auto bytes = get(key)) found.push_back(StoredObject{key, std::move(*bytes)});
            }
        }
        out.push_back(std::move(found));
    }
    return out;
}
