#pragma once
#include <stdexcept>
#include <string>

// Bad input, rejected before any I/O.
struct InvalidRangeError : std::runtime_error {
    using std::runtime_error::runtime_error;
};
struct EmptyExpansionError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// A payload or a stored partition disagrees with the schema registry.
struct SchemaMismatchError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Fetch failures. Transient ones are retried by the transport layer;
// a permanent one marks the sub-request's slot as failed.
struct TransientFetchError : std::runtime_error {
    using std::runtime_error::runtime_error;
};
struct PermanentFetchError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Job contract violations (dispatcher bugs).
struct InvalidJobError : std::logic_error {
    using std::logic_error::logic_error;
};
struct JobAlreadyFinalizedError : std::logic_error {
    using std::logic_error::logic_error;
};

// The data provider (local terminal) is not reachable.
struct ProviderNotReadyError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Object store I/O failure (not "missing": that is a normal answer).
struct StorageError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

class MissingPartitionError : public std::runtime_error {
public:
    explicit MissingPartitionError(std::string key)
        : std::runtime_error("missing partition: " + key), key_(std::move(key)) {}

    const std::string& key() const noexcept { return key_; }

private:
    std::string key_;
};
