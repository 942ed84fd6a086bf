#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

#include <boost/json/value.hpp>

namespace infra::storage {

// Single JSON document on disk, replaced atomically on every save.
class JsonFileStore {
public:
    explicit JsonFileStore(std::filesystem::path path);

    // nullopt when the file does not exist. Throws domain::DecodeError when the content does
    // not parse and std::runtime_error when it cannot be read.
    std::optional<boost::json::value> load() const;

    // Writes <file>.tmp and renames it over the target. Throws std::runtime_error.
    void save(const boost::json::value& document) const;

    // Moves the current file aside as <file>.corrupt.<unix>.bak and returns the new path.
    std::filesystem::path backupCorrupt() const;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    mutable std::mutex fileMutex_;
};

// Append-only text log, one record per line. Never truncated.
class AppendOnlyLog {
public:
    explicit AppendOnlyLog(std::filesystem::path path);

    // Throws std::runtime_error when the line could not be written.
    void append(const std::string& line);

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    std::mutex fileMutex_;
};

// Indented rendering of a JSON value with stable key order (insertion order of the object).
std::string pretty_json(const boost::json::value& value);

}  // namespace infra::storage
