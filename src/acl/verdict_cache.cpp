// ---------------------------------------------------------------------------
// verdict_cache.cpp
//
// shard 단위 mutex 로 보호되는 판정 캐시 구현.
// ---------------------------------------------------------------------------

#include "acl/verdict_cache.hpp"

#include <functional>
#include <string>

namespace {

// "<길이>:<값>" 형식. 값에 어떤 문자가 들어 있어도 경계가 모호해지지 않는다.
void append_field(std::string& key, std::string_view field) {
    key.append(std::to_string(field.size()));
    key.push_back(':');
    key.append(field);
}

}  // namespace

std::string make_cache_key(std::string_view resource,
                           std::string_view operation,
                           std::string_view principal_name,
                           std::string_view principal_type) {
    std::string key;
    key.reserve(resource.size() + operation.size() +
                principal_name.size() + principal_type.size() + 16);
    append_field(key, resource);
    append_field(key, operation);
    append_field(key, principal_name);
    append_field(key, principal_type);
    return key;
}

VerdictCache::Shard& VerdictCache::shard_for(const std::string& key) {
    const std::size_t hash = std::hash<std::string>{}(key);
    return shards_[(hash >> 8) & (kShardCount - 1)];
}

const VerdictCache::Shard& VerdictCache::shard_for(const std::string& key) const {
    const std::size_t hash = std::hash<std::string>{}(key);
    return shards_[(hash >> 8) & (kShardCount - 1)];
}

std::optional<bool> VerdictCache::lookup(const std::string& key) {
    const Shard& shard = shard_for(key);
    {
        const std::lock_guard<std::mutex> lock(shard.mutex);
        const auto it = shard.entries.find(key);
        if (it != shard.entries.end()) {
            hits_.fetch_add(1, std::memory_order_relaxed);
            return it->second;
        }
    }
    misses_.fetch_add(1, std::memory_order_relaxed);
    return std::nullopt;
}

void VerdictCache::insert(const std::string& key, bool verdict) {
    Shard& shard = shard_for(key);
    const std::lock_guard<std::mutex> lock(shard.mutex);
    shard.entries.insert_or_assign(key, verdict);
}

void VerdictCache::clear() {
    for (auto& shard : shards_) {
        const std::lock_guard<std::mutex> lock(shard.mutex);
        shard.entries.clear();
    }
}

std::size_t VerdictCache::size() const {
    std::size_t total = 0;
    for (const auto& shard : shards_) {
        const std::lock_guard<std::mutex> lock(shard.mutex);
        total += shard.entries.size();
    }
    return total;
}
