#pragma once
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "util/bytes.hpp"

struct StoredObject {
    std::string key;
    Bytes bytes;
};

// Object store capability. Keys are '/'-separated paths. I/O failures throw
// StorageError; a missing key is a normal answer, not an error.
class IObjectStore
{
public:
    virtual ~IObjectStore() = default;

    virtual void put(const std::string &key, const Bytes &bytes) = 0;
    virtual std::optional<Bytes> get(const std::string &key) const = 0;
    virtual bool exists(const std::string &key) const = 0;
    // Keys starting with `prefix`, sorted.
    virtual std::vector<std::string> list(const std::string &prefix) const = 0;
    virtual std::string describe() const = 0;

    // One entry per pattern, in pattern order. '*' matches within one path segment.
    // An empty entry means nothing matched the pattern.
    std::vector<std::vector<StoredObject>> get_many(const std::vector<std::string> &patterns) const;
};

// '*' matches any run of characters inside a single path segment.
bool glob_match(std::string_view pattern, std::string_view key);

// Leading part of the pattern before the first segment holding a '*'.
std::string literal_prefix(std::string_view pattern);

// factories
std::unique_ptr<IObjectStore> make_memory_store();
std::unique_ptr<IObjectStore> make_filesystem_store(std::filesystem::path root);
