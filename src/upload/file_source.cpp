#include "rup/upload/file_source.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

namespace rup::upload {
namespace fs = std::filesystem;

std::string FileSource::file_name() const {
    const auto& path = relative_path();
    const auto slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

LocalFileSource::LocalFileSource(fs::path absolute_path, std::string relative_path, std::uint64_t size)
    : absolute_path_(std::move(absolute_path)),
      relative_path_(std::move(relative_path)),
      size_(size) {}

Result<FileSourcePtr> LocalFileSource::open(const fs::path& absolute_path, std::string relative_path) {
    std::error_code ec;
    if (!fs::is_regular_file(absolute_path, ec)) {
        return Err<FileSourcePtr>(ErrorCode::Io, "not a regular file: " + absolute_path.string());
    }
    const auto size = fs::file_size(absolute_path, ec);
    if (ec) {
        return Err<FileSourcePtr>(ErrorCode::Io, "cannot stat " + absolute_path.string() + ": " + ec.message());
    }
    FileSourcePtr source = std::make_shared<LocalFileSource>(absolute_path, std::move(relative_path), size);
    return Ok(std::move(source));
}

bool LocalFileSource::available() const {
    std::error_code ec;
    if (!fs::is_regular_file(absolute_path_, ec)) {
        return false;
    }
    const auto current = fs::file_size(absolute_path_, ec);
    return !ec && current == size_;
}

Result<std::vector<std::uint8_t>> LocalFileSource::read_chunk(std::uint64_t offset, std::uint32_t length) const {
    if (offset + length > size_) {
        return Err<std::vector<std::uint8_t>>(ErrorCode::Validation,
                                              "read past end of " + relative_path_);
    }

    std::ifstream input(absolute_path_, std::ios::binary);
    if (!input) {
        return Err<std::vector<std::uint8_t>>(ErrorCode::Io, "failed to open " + absolute_path_.string());
    }

    std::vector<std::uint8_t> buffer(length);
    input.seekg(static_cast<std::streamoff>(offset));
    input.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(length));
    if (static_cast<std::uint64_t>(input.gcount()) != length) {
        return Err<std::vector<std::uint8_t>>(ErrorCode::Io, "short read from " + absolute_path_.string());
    }
    return Ok(std::move(buffer));
}

MemoryFileSource::MemoryFileSource(std::string relative_path, std::vector<std::uint8_t> bytes, bool reacquirable)
    : relative_path_(std::move(relative_path)),
      bytes_(std::move(bytes)),
      reacquirable_(reacquirable) {}

Result<std::vector<std::uint8_t>> MemoryFileSource::read_chunk(std::uint64_t offset, std::uint32_t length) const {
    if (!attached_) {
        return Err<std::vector<std::uint8_t>>(ErrorCode::Io, "file handle detached: " + relative_path_);
    }
    if (offset + length > bytes_.size()) {
        return Err<std::vector<std::uint8_t>>(ErrorCode::Validation, "read past end of " + relative_path_);
    }
    const auto begin = bytes_.begin() + static_cast<std::ptrdiff_t>(offset);
    return Ok(std::vector<std::uint8_t>(begin, begin + length));
}

FileSourcePtr LocalFileSourceResolver::reacquire(const UploadSession& session) const {
    if (session.source_locator.empty()) {
        return nullptr;
    }
    auto opened = LocalFileSource::open(session.source_locator, session.relative_path);
    if (opened.is_error()) {
        spdlog::debug("Cannot re-acquire {}: {}", session.source_locator, opened.error().message);
        return nullptr;
    }
    if (opened.value()->size() != session.total_size) {
        spdlog::warn("Source {} changed size ({} -> {}), not resuming", session.source_locator,
                     session.total_size, opened.value()->size());
        return nullptr;
    }
    return opened.value();
}

} // namespace rup::upload
