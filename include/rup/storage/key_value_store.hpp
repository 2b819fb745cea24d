/**
 * @file key_value_store.hpp
 * @brief Durable string key-value stores backing the session store
 *
 * WHY THIS FILE EXISTS:
 * Session records must survive a restart. The engine only needs four
 * operations from its persistence layer, so the backend is an interface:
 * a directory of JSON documents on disk, or a volatile map for tests.
 *
 * ATOMICITY:
 * put() replaces a whole record in one step. A crash between two puts
 * leaves either the old or the new record, never a mix.
 */

#pragma once

#include "rup/core/result.hpp"

#include <cstddef>
#include <filesystem>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

namespace rup::storage {

class KeyValueStore {
public:
    virtual ~KeyValueStore() = default;

    virtual Result<void> put(const std::string& key, const std::string& value) = 0;

    /// ErrorCode::NotFound when the key is absent.
    virtual Result<std::string> get(const std::string& key) const = 0;

    /// Removing an absent key succeeds.
    virtual Result<void> remove(const std::string& key) = 0;

    virtual Result<std::vector<std::string>> keys() const = 0;
};

/**
 * @brief Volatile store with an optional byte quota
 *
 * When quota_bytes is non-zero, a put that would push the total size of
 * stored values past the quota fails with ErrorCode::Storage, mirroring a
 * browser's quota-exceeded error.
 */
class MemoryKeyValueStore : public KeyValueStore {
public:
    explicit MemoryKeyValueStore(std::size_t quota_bytes = 0);

    Result<void> put(const std::string& key, const std::string& value) override;
    Result<std::string> get(const std::string& key) const override;
    Result<void> remove(const std::string& key) override;
    Result<std::vector<std::string>> keys() const override;

    std::size_t used_bytes() const;

private:
    std::size_t quota_bytes_;
    std::size_t used_bytes_ = 0;
    std::map<std::string, std::string> values_;
    mutable std::shared_mutex mutex_;
};

/**
 * @brief One file per key inside a directory
 *
 * FILE LAYOUT:
 * <root>/<escaped key>.json
 *
 * Writes go to "<file>.tmp" first and are renamed over the target, so a
 * reader never observes a half-written record. Keys are percent-escaped
 * so any identifier the server hands out maps to a safe file name.
 */
class FileKeyValueStore : public KeyValueStore {
public:
    explicit FileKeyValueStore(std::filesystem::path root);

    Result<void> put(const std::string& key, const std::string& value) override;
    Result<std::string> get(const std::string& key) const override;
    Result<void> remove(const std::string& key) override;
    Result<std::vector<std::string>> keys() const override;

    const std::filesystem::path& root() const noexcept { return root_; }

    static std::string escape_key(const std::string& key);
    static std::string unescape_key(const std::string& escaped);

private:
    std::filesystem::path path_for(const std::string& key) const;

    std::filesystem::path root_;
    mutable std::mutex mutex_;
};

} // namespace rup::storage
