/// @file kv_store.cpp
/// @brief InMemoryKeyValueStore, optimistic update loop and record codec.

#include "pgw/foundation/kv_store.hpp"

namespace pgw::foundation {

GatewayResult<std::optional<VersionedValue>>
InMemoryKeyValueStore::get(std::string_view key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return GatewayResult<std::optional<VersionedValue>>::ok(std::nullopt);
    }
    return GatewayResult<std::optional<VersionedValue>>::ok(it->second);
}

GatewayResult<bool> InMemoryKeyValueStore::compareAndSet(std::string_view key,
                                                         uint64_t expectedVersion,
                                                         std::string value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    uint64_t currentVersion = (it == entries_.end()) ? 0 : it->second.version;
    if (currentVersion != expectedVersion) {
        return GatewayResult<bool>::ok(false);
    }
    if (it == entries_.end()) {
        entries_.emplace(std::string(key), VersionedValue{std::move(value), 1});
    } else {
        it->second.value = std::move(value);
        ++it->second.version;
    }
    return GatewayResult<bool>::ok(true);
}

GatewayResult<KeyValueEntries>
InMemoryKeyValueStore::scan(std::string_view prefix) const {
    std::lock_guard<std::mutex> lock(mutex_);
    KeyValueEntries out;
    for (auto it = entries_.lower_bound(prefix); it != entries_.end(); ++it) {
        if (it->first.compare(0, prefix.size(), prefix) != 0) {
            break;
        }
        out.emplace_back(it->first, it->second);
    }
    return GatewayResult<KeyValueEntries>::ok(std::move(out));
}

GatewayResult<bool> InMemoryKeyValueStore::remove(std::string_view key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return GatewayResult<bool>::ok(false);
    }
    entries_.erase(it);
    return GatewayResult<bool>::ok(true);
}

std::size_t InMemoryKeyValueStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

GatewayResult<void> updateWithRetry(IKeyValueStore& store,
                                    std::string_view key,
                                    const KeyMutator& mutator,
                                    int attempts) {
    for (int attempt = 0; attempt < attempts; ++attempt) {
        auto current = store.get(key);
        if (!current) {
            return GatewayResult<void>::err(current.error());
        }

        auto next = mutator(current.value());
        if (!next) {
            return GatewayResult<void>::err(next.error());
        }
        if (!next.value().has_value()) {
            return GatewayResult<void>::ok();
        }

        uint64_t expected = current.value() ? current.value()->version : 0;
        auto written = store.compareAndSet(key, expected, std::move(*next.value()));
        if (!written) {
            return GatewayResult<void>::err(written.error());
        }
        if (written.value()) {
            return GatewayResult<void>::ok();
        }
    }
    return GatewayResult<void>::err(
        GatewayError(ErrorCode::StoreConflict,
                     "update of '" + std::string(key) + "' lost every retry"));
}

std::string encodeRecord(const YAML::Node& record) {
    YAML::Emitter out;
    out.SetMapFormat(YAML::Flow);
    out.SetSeqFormat(YAML::Flow);
    out << record;
    return out.c_str();
}

GatewayResult<YAML::Node> decodeRecord(std::string_view text) {
    try {
        auto node = YAML::Load(std::string(text));
        if (!node.IsMap()) {
            return GatewayResult<YAML::Node>::err(
                GatewayError(ErrorCode::RecordCorrupt, "stored record is not a mapping"));
        }
        return GatewayResult<YAML::Node>::ok(node);
    } catch (const YAML::Exception& e) {
        return GatewayResult<YAML::Node>::err(
            GatewayError(ErrorCode::RecordCorrupt, std::string("unparsable record: ") + e.what()));
    }
}

}  // namespace pgw::foundation
