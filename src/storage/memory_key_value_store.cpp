#include "rup/storage/key_value_store.hpp"

namespace rup::storage {

MemoryKeyValueStore::MemoryKeyValueStore(std::size_t quota_bytes) : quota_bytes_(quota_bytes) {}

Result<void> MemoryKeyValueStore::put(const std::string& key, const std::string& value) {
    std::unique_lock lock(mutex_);

    const auto it = values_.find(key);
    const std::size_t previous = it == values_.end() ? 0 : it->second.size();
    const std::size_t projected = used_bytes_ - previous + value.size();
    if (quota_bytes_ != 0 && projected > quota_bytes_) {
        return Err<void>(ErrorCode::Storage, "quota exceeded writing " + key);
    }

    values_[key] = value;
    used_bytes_ = projected;
    return Ok();
}

Result<std::string> MemoryKeyValueStore::get(const std::string& key) const {
    std::shared_lock lock(mutex_);
    const auto it = values_.find(key);
    if (it == values_.end()) {
        return Err<std::string>(ErrorCode::NotFound, "no record for " + key);
    }
    return Ok(it->second);
}

Result<void> MemoryKeyValueStore::remove(const std::string& key) {
    std::unique_lock lock(mutex_);
    const auto it = values_.find(key);
    if (it != values_.end()) {
        used_bytes_ -= it->second.size();
        values_.erase(it);
    }
    return Ok();
}

Result<std::vector<std::string>> MemoryKeyValueStore::keys() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> result;
    result.reserve(values_.size());
    for (const auto& [key, value] : values_) {
        result.push_back(key);
    }
    return Ok(std::move(result));
}

std::size_t MemoryKeyValueStore::used_bytes() const {
    std::shared_lock lock(mutex_);
    return used_bytes_;
}

} // namespace rup::storage
