#include "rup/storage/key_value_store.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace rup::storage {
namespace fs = std::filesystem;

namespace {

constexpr const char* kRecordExtension = ".json";
constexpr const char* kTempExtension = ".tmp";

bool is_safe_char(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '_' || c == '.';
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

FileKeyValueStore::FileKeyValueStore(fs::path root) : root_(std::move(root)) {
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec) {
        spdlog::error("Cannot create session store directory {}: {}", root_.string(), ec.message());
    }
}

std::string FileKeyValueStore::escape_key(const std::string& key) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < key.size(); ++i) {
        const auto c = static_cast<unsigned char>(key[i]);
        // A leading dot would hide the record file
        if (is_safe_char(c) && !(i == 0 && c == '.')) {
            oss << key[i];
        } else {
            oss << '%' << std::uppercase << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c)
                << std::nouppercase << std::dec;
        }
    }
    return oss.str();
}

std::string FileKeyValueStore::unescape_key(const std::string& escaped) {
    std::string key;
    key.reserve(escaped.size());
    for (std::size_t i = 0; i < escaped.size(); ++i) {
        if (escaped[i] == '%' && i + 2 < escaped.size()) {
            const int high = hex_value(escaped[i + 1]);
            const int low = hex_value(escaped[i + 2]);
            if (high >= 0 && low >= 0) {
                key.push_back(static_cast<char>(high * 16 + low));
                i += 2;
                continue;
            }
        }
        key.push_back(escaped[i]);
    }
    return key;
}

fs::path FileKeyValueStore::path_for(const std::string& key) const {
    return root_ / (escape_key(key) + kRecordExtension);
}

Result<void> FileKeyValueStore::put(const std::string& key, const std::string& value) {
    std::lock_guard lock(mutex_);
    const auto target = path_for(key);
    auto temp = target;
    temp += kTempExtension;

    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Err<void>(ErrorCode::Storage, "cannot open " + temp.string() + " for writing");
        }
        out.write(value.data(), static_cast<std::streamsize>(value.size()));
        out.flush();
        if (!out) {
            std::error_code ignored;
            fs::remove(temp, ignored);
            return Err<void>(ErrorCode::Storage, "write failed for " + temp.string());
        }
    }

    std::error_code ec;
    fs::rename(temp, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp, ignored);
        return Err<void>(ErrorCode::Storage, "cannot replace " + target.string() + ": " + ec.message());
    }
    return Ok();
}

Result<std::string> FileKeyValueStore::get(const std::string& key) const {
    std::lock_guard lock(mutex_);
    const auto path = path_for(key);
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<std::string>(ErrorCode::NotFound, "no record for " + key);
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return Ok(buffer.str());
}

Result<void> FileKeyValueStore::remove(const std::string& key) {
    std::lock_guard lock(mutex_);
    std::error_code ec;
    fs::remove(path_for(key), ec);
    if (ec) {
        return Err<void>(ErrorCode::Storage, "cannot remove record " + key + ": " + ec.message());
    }
    return Ok();
}

Result<std::vector<std::string>> FileKeyValueStore::keys() const {
    std::lock_guard lock(mutex_);
    std::vector<std::string> result;
    std::error_code ec;
    fs::directory_iterator it(root_, ec);
    if (ec) {
        return Err<std::vector<std::string>>(ErrorCode::Storage, "cannot list " + root_.string() + ": " + ec.message());
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        const auto& path = it->path();
        if (path.extension() != kRecordExtension) {
            continue;
        }
        result.push_back(unescape_key(path.stem().string()));
    }
    if (ec) {
        return Err<std::vector<std::string>>(ErrorCode::Storage, "listing " + root_.string() + " failed: " + ec.message());
    }
    return Ok(std::move(result));
}

} // namespace rup::storage
