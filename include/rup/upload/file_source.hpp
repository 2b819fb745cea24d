#pragma once

#include "rup/core/result.hpp"
#include "rup/upload/types.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace rup::upload {

/**
 * @brief One enumerated file: its selection-relative path, size and bytes
 *
 * Handles are ephemeral unless reacquirable() is true, in which case
 * locator() identifies the file well enough for a FileSourceResolver to
 * open it again after a restart.
 */
class FileSource {
public:
    virtual ~FileSource() = default;

    [[nodiscard]] virtual const std::string& relative_path() const noexcept = 0;
    [[nodiscard]] virtual std::uint64_t size() const noexcept = 0;
    [[nodiscard]] virtual bool reacquirable() const noexcept = 0;

    /// False once the underlying handle is gone (file deleted, resized, detached).
    [[nodiscard]] virtual bool available() const = 0;

    [[nodiscard]] virtual std::string locator() const { return {}; }

    virtual Result<std::vector<std::uint8_t>> read_chunk(std::uint64_t offset, std::uint32_t length) const = 0;

    /// Last component of relative_path().
    [[nodiscard]] std::string file_name() const;
};

using FileSourcePtr = std::shared_ptr<FileSource>;

/**
 * @brief File on the local filesystem; always re-acquirable by absolute path
 */
class LocalFileSource : public FileSource {
public:
    LocalFileSource(std::filesystem::path absolute_path, std::string relative_path, std::uint64_t size);

    static Result<FileSourcePtr> open(const std::filesystem::path& absolute_path, std::string relative_path);

    const std::string& relative_path() const noexcept override { return relative_path_; }
    std::uint64_t size() const noexcept override { return size_; }
    bool reacquirable() const noexcept override { return true; }
    bool available() const override;
    std::string locator() const override { return absolute_path_.string(); }

    Result<std::vector<std::uint8_t>> read_chunk(std::uint64_t offset, std::uint32_t length) const override;

private:
    std::filesystem::path absolute_path_;
    std::string relative_path_;
    std::uint64_t size_ = 0;
};

/**
 * @brief In-memory bytes, the equivalent of a browser File object
 *
 * Not re-acquirable by default. detach() simulates the handle going away.
 */
class MemoryFileSource : public FileSource {
public:
    MemoryFileSource(std::string relative_path, std::vector<std::uint8_t> bytes, bool reacquirable = false);

    const std::string& relative_path() const noexcept override { return relative_path_; }
    std::uint64_t size() const noexcept override { return bytes_.size(); }
    bool reacquirable() const noexcept override { return reacquirable_; }
    bool available() const override { return attached_; }
    std::string locator() const override { return reacquirable_ ? "memory:" + relative_path_ : std::string(); }

    Result<std::vector<std::uint8_t>> read_chunk(std::uint64_t offset, std::uint32_t length) const override;

    void detach() noexcept { attached_ = false; }

private:
    std::string relative_path_;
    std::vector<std::uint8_t> bytes_;
    bool reacquirable_ = false;
    bool attached_ = true;
};

/**
 * @brief Re-opens the source of a persisted session after a restart
 */
class FileSourceResolver {
public:
    virtual ~FileSourceResolver() = default;

    /// Returns nullptr when the handle cannot be re-acquired.
    virtual FileSourcePtr reacquire(const UploadSession& session) const = 0;
};

/// Resolver for platforms without re-acquirable handles.
class NullFileSourceResolver : public FileSourceResolver {
public:
    FileSourcePtr reacquire(const UploadSession&) const override { return nullptr; }
};

/// Re-opens LocalFileSource locators if the file still exists with the recorded size.
class LocalFileSourceResolver : public FileSourceResolver {
public:
    FileSourcePtr reacquire(const UploadSession& session) const override;
};

} // namespace rup::upload
