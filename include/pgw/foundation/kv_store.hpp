#pragma once

/// @file kv_store.hpp
/// @brief Versioned key-value store seam for state shared across gateway
///        replicas (flags, breaker state, budget counters, service mode).

#include "pgw/foundation/gateway_result.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace pgw::foundation {

/// A stored value and its per-key version. Version 0 is never stored; it
/// stands for "absent" in compareAndSet().
struct VersionedValue {
    std::string value;
    uint64_t version{0};
};

using KeyValueEntries = std::vector<std::pair<std::string, VersionedValue>>;

/// Durable store contract required by the gateway.
///
/// Only optimistic concurrency is assumed: no transactions, no queries
/// beyond prefix scans. Implementations must be thread-safe.
class IKeyValueStore {
public:
    virtual ~IKeyValueStore() = default;

    /// @return nullopt when the key is absent.
    [[nodiscard]] virtual GatewayResult<std::optional<VersionedValue>>
    get(std::string_view key) const = 0;

    /// Write @p value only if the key's current version equals
    /// @p expectedVersion (0 = key must be absent).
    /// @return true if written, false on a version conflict.
    virtual GatewayResult<bool> compareAndSet(std::string_view key,
                                              uint64_t expectedVersion,
                                              std::string value) = 0;

    /// All entries whose key starts with @p prefix, ordered by key.
    [[nodiscard]] virtual GatewayResult<KeyValueEntries>
    scan(std::string_view prefix) const = 0;

    /// @return true if the key existed.
    virtual GatewayResult<bool> remove(std::string_view key) = 0;
};

/// Thread-safe in-process store used for single-instance deployments and
/// tests.
class InMemoryKeyValueStore : public IKeyValueStore {
public:
    [[nodiscard]] GatewayResult<std::optional<VersionedValue>>
    get(std::string_view key) const override;

    GatewayResult<bool> compareAndSet(std::string_view key,
                                      uint64_t expectedVersion,
                                      std::string value) override;

    [[nodiscard]] GatewayResult<KeyValueEntries>
    scan(std::string_view prefix) const override;

    GatewayResult<bool> remove(std::string_view key) override;

    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, VersionedValue, std::less<>> entries_;
};

/// Computes the next value of a key from its current value.
/// Returning nullopt means "no write needed" and ends the update.
using KeyMutator = std::function<GatewayResult<std::optional<std::string>>(
    const std::optional<VersionedValue>& current)>;

/// Optimistic read-modify-write: read, mutate, compareAndSet, and retry on
/// conflict up to @p attempts times. The mutator may run more than once and
/// must not have side effects beyond its captured outputs.
///
/// @return StoreConflict when every attempt lost the race.
GatewayResult<void> updateWithRetry(IKeyValueStore& store,
                                    std::string_view key,
                                    const KeyMutator& mutator,
                                    int attempts = 8);

/// Serialize a record map as a single-line YAML flow mapping.
[[nodiscard]] std::string encodeRecord(const YAML::Node& record);

/// Parse a stored record. Anything but a mapping is RecordCorrupt.
[[nodiscard]] GatewayResult<YAML::Node> decodeRecord(std::string_view text);

}  // namespace pgw::foundation
