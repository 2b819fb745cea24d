#pragma once

#include "rup/core/cancellation.hpp"
#include "rup/core/result.hpp"
#include "rup/upload/file_source.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace rup::upload {

/**
 * @brief Node of a directory-entry tree (drag-and-drop item, picked folder)
 */
class ScanEntry {
public:
    virtual ~ScanEntry() = default;

    [[nodiscard]] virtual std::string name() const = 0;
    [[nodiscard]] virtual bool is_directory() const = 0;

    /// Directory listing. Order does not matter; the scanner sorts by name.
    virtual Result<std::vector<std::shared_ptr<ScanEntry>>> children() const = 0;

    /// Opens a file entry as a FileSource carrying @p relative_path.
    virtual Result<FileSourcePtr> open(const std::string& relative_path) const = 0;
};

using ScanEntryPtr = std::shared_ptr<ScanEntry>;

/**
 * @brief Entry backed by a path on the local filesystem
 *
 * Links to directories below a selected root are not followed; listing
 * one fails and the scanner records it as skipped. A root the user picked
 * explicitly is followed even when it is a link.
 */
class FilesystemEntry : public ScanEntry {
public:
    explicit FilesystemEntry(std::filesystem::path path, bool follow_directory_link = false);

    std::string name() const override;
    bool is_directory() const override;
    Result<std::vector<ScanEntryPtr>> children() const override;
    Result<FileSourcePtr> open(const std::string& relative_path) const override;

private:
    std::filesystem::path path_;
    bool follow_directory_link_;
};

/**
 * @brief What the user picked: a flat file list and/or entry trees
 */
struct Selection {
    std::vector<FileSourcePtr> files;   ///< File-picker list, relative paths already set
    std::vector<ScanEntryPtr> entries;  ///< Drag-and-drop items, possibly directories

    static Selection from_paths(const std::vector<std::filesystem::path>& paths);
};

struct DirectorySummary {
    std::size_t files = 0;              ///< Files anywhere below this directory
    std::uint64_t bytes = 0;
    std::vector<std::string> subfolders;
};

struct ScanResult {
    std::vector<FileSourcePtr> files;
    std::vector<std::string> skipped;   ///< Unreadable directories and files
    std::uint64_t total_size = 0;
    std::map<std::string, DirectorySummary> directories;
    bool cancelled = false;
};

struct FolderScanProgress {
    std::size_t files_scanned = 0;
    std::size_t total_files_estimate = 0;  ///< Files seen plus entries discovered but not yet visited
    std::string current_path;
    std::uint64_t bytes_scanned = 0;
};

/**
 * @brief Flattens a selection into FileSources, depth-first, name-ordered
 *
 * Unreadable subtrees land in ScanResult::skipped and the scan goes on.
 * cancel() is checked between steps; a cancelled scan returns what it found
 * so far with cancelled = true.
 */
class FolderScanner {
public:
    using ProgressCallback = std::function<void(const FolderScanProgress&)>;

    explicit FolderScanner(ProgressCallback on_progress = {});

    ScanResult scan(const Selection& selection);

    void cancel() { cancelled_.store(true); }
    [[nodiscard]] bool is_cancelled() const noexcept { return cancelled_.load(); }

private:
    struct Pending {
        ScanEntryPtr entry;
        std::string path;
    };

    void visit_file(const Pending& item, ScanResult& result, FolderScanProgress& progress);
    void visit_directory(const Pending& item, std::vector<Pending>& stack, ScanResult& result,
                         FolderScanProgress& progress);
    void add_file(FileSourcePtr source, ScanResult& result, FolderScanProgress& progress);
    void report(const FolderScanProgress& progress) const;

    static void record_in_directories(ScanResult& result, const std::string& file_path, std::uint64_t size);

    ProgressCallback on_progress_;
    std::atomic<bool> cancelled_{false};
};

} // namespace rup::upload
