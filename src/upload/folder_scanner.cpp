#include "rup/upload/folder_scanner.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>

namespace rup::upload {
namespace fs = std::filesystem;

namespace {

std::string join_path(const std::string& parent, const std::string& name) {
    return parent.empty() ? name : parent + "/" + name;
}

void sort_by_name(std::vector<ScanEntryPtr>& entries) {
    std::sort(entries.begin(), entries.end(), [](const ScanEntryPtr& a, const ScanEntryPtr& b) {
        return a->name() < b->name();
    });
}

} // namespace

FilesystemEntry::FilesystemEntry(fs::path path, bool follow_directory_link)
    : path_(std::move(path)), follow_directory_link_(follow_directory_link) {}

std::string FilesystemEntry::name() const {
    auto name = path_.filename().string();
    if (name.empty()) {
        name = path_.parent_path().filename().string();
    }
    return name;
}

bool FilesystemEntry::is_directory() const {
    std::error_code ec;
    return fs::is_directory(path_, ec);
}

Result<std::vector<ScanEntryPtr>> FilesystemEntry::children() const {
    std::vector<ScanEntryPtr> entries;
    std::error_code ec;
    if (!follow_directory_link_ && fs::is_symlink(fs::symlink_status(path_, ec))) {
        return Err<std::vector<ScanEntryPtr>>(ErrorCode::Scan, "not following directory link " + path_.string());
    }
    fs::directory_iterator it(path_, ec);
    if (ec) {
        return Err<std::vector<ScanEntryPtr>>(ErrorCode::Scan, "cannot list " + path_.string() + ": " + ec.message());
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        entries.push_back(std::make_shared<FilesystemEntry>(it->path()));
    }
    if (ec) {
        return Err<std::vector<ScanEntryPtr>>(ErrorCode::Scan, "listing " + path_.string() + " failed: " + ec.message());
    }
    return Ok(std::move(entries));
}

Result<FileSourcePtr> FilesystemEntry::open(const std::string& relative_path) const {
    return LocalFileSource::open(path_, relative_path);
}

Selection Selection::from_paths(const std::vector<fs::path>& paths) {
    Selection selection;
    for (const auto& path : paths) {
        selection.entries.push_back(std::make_shared<FilesystemEntry>(path, true));
    }
    return selection;
}

FolderScanner::FolderScanner(ProgressCallback on_progress) : on_progress_(std::move(on_progress)) {}

ScanResult FolderScanner::scan(const Selection& selection) {
    cancelled_.store(false);
    ScanResult result;
    FolderScanProgress progress;

    // Flat file lists carry their own paths; order them the same way as trees.
    std::vector<FileSourcePtr> flat;
    std::copy_if(selection.files.begin(), selection.files.end(), std::back_inserter(flat),
                 [](const FileSourcePtr& source) { return source != nullptr; });
    std::stable_sort(flat.begin(), flat.end(), [](const FileSourcePtr& a, const FileSourcePtr& b) {
        return a->relative_path() < b->relative_path();
    });

    auto roots = selection.entries;
    sort_by_name(roots);
    progress.total_files_estimate = flat.size() + roots.size();

    for (auto& source : flat) {
        if (is_cancelled()) {
            break;
        }
        progress.total_files_estimate -= 1;
        add_file(std::move(source), result, progress);
    }

    // Explicit stack: reversed push keeps lexicographic pop order
    std::vector<Pending> stack;
    for (auto it = roots.rbegin(); it != roots.rend(); ++it) {
        stack.push_back({*it, (*it)->name()});
    }

    while (!stack.empty()) {
        if (is_cancelled()) {
            break;
        }
        Pending item = std::move(stack.back());
        stack.pop_back();
        progress.total_files_estimate -= 1;

        if (item.entry->is_directory()) {
            visit_directory(item, stack, result, progress);
        } else {
            visit_file(item, result, progress);
        }
    }

    result.cancelled = is_cancelled();
    if (result.cancelled) {
        spdlog::info("Scan cancelled after {} files", result.files.size());
    } else {
        spdlog::debug("Scan finished: {} files, {} bytes, {} skipped", result.files.size(), result.total_size,
                      result.skipped.size());
    }
    return result;
}

void FolderScanner::visit_file(const Pending& item, ScanResult& result, FolderScanProgress& progress) {
    auto opened = item.entry->open(item.path);
    if (opened.is_error()) {
        spdlog::warn("Skipping unreadable file {}: {}", item.path, opened.error().message);
        result.skipped.push_back(item.path);
        return;
    }
    add_file(std::move(opened.value()), result, progress);
}

void FolderScanner::visit_directory(const Pending& item, std::vector<Pending>& stack, ScanResult& result,
                                    FolderScanProgress& progress) {
    auto listing = item.entry->children();
    if (listing.is_error()) {
        spdlog::warn("Skipping unreadable directory {}: {}", item.path, listing.error().message);
        result.skipped.push_back(item.path);
        return;
    }

    result.directories.try_emplace(item.path);
    const auto slash = item.path.find_last_of('/');
    if (slash != std::string::npos) {
        auto& parent = result.directories[item.path.substr(0, slash)].subfolders;
        if (std::find(parent.begin(), parent.end(), item.path) == parent.end()) {
            parent.push_back(item.path);
        }
    }

    auto children = std::move(listing.value());
    sort_by_name(children);
    progress.total_files_estimate += children.size();
    for (auto it = children.rbegin(); it != children.rend(); ++it) {
        stack.push_back({*it, join_path(item.path, (*it)->name())});
    }
}

void FolderScanner::add_file(FileSourcePtr source, ScanResult& result, FolderScanProgress& progress) {
    const auto size = source->size();
    progress.files_scanned += 1;
    progress.bytes_scanned += size;
    progress.current_path = source->relative_path();

    record_in_directories(result, source->relative_path(), size);
    result.total_size += size;
    result.files.push_back(std::move(source));
    report(progress);
}

void FolderScanner::report(const FolderScanProgress& progress) const {
    if (on_progress_) {
        on_progress_(progress);
    }
}

void FolderScanner::record_in_directories(ScanResult& result, const std::string& file_path, std::uint64_t size) {
    std::size_t pos = file_path.find('/');
    while (pos != std::string::npos) {
        auto& summary = result.directories[file_path.substr(0, pos)];
        summary.files += 1;
        summary.bytes += size;
        pos = file_path.find('/', pos + 1);
    }
}

} // namespace rup::upload
