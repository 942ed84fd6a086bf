#include "infra/storage/JsonFileStore.h"

#include <chrono>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <boost/json.hpp>

#include "domain/Errors.h"
#include "logging/Log.h"

namespace infra::storage {
namespace {

namespace fs = std::filesystem;
namespace json = boost::json;

constexpr logging::LogCategory kLogCategory = logging::LogCategory::WORKSPACE;

void ensureParent(const fs::path& path) {
    if (path.parent_path().empty()) {
        return;
    }
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        throw std::runtime_error("cannot create directory " + path.parent_path().string() + ": " + ec.message());
    }
}

void writeIndent(std::string& out, int depth) {
    out.append(static_cast<std::size_t>(depth) * 2U, ' ');
}

void prettyInto(std::string& out, const json::value& value, int depth) {
    switch (value.kind()) {
    case json::kind::object: {
        const auto& obj = value.get_object();
        if (obj.empty()) {
            out.append("{}");
            return;
        }
        out.append("{\n");
        bool first = true;
        for (const auto& member : obj) {
            if (!first) {
                out.append(",\n");
            }
            first = false;
            writeIndent(out, depth + 1);
            out.append(json::serialize(json::string(member.key())));
            out.append(": ");
            prettyInto(out, member.value(), depth + 1);
        }
        out.push_back('\n');
        writeIndent(out, depth);
        out.push_back('}');
        return;
    }
    case json::kind::array: {
        const auto& arr = value.get_array();
        if (arr.empty()) {
            out.append("[]");
            return;
        }
        out.append("[\n");
        bool first = true;
        for (const auto& element : arr) {
            if (!first) {
                out.append(",\n");
            }
            first = false;
            writeIndent(out, depth + 1);
            prettyInto(out, element, depth + 1);
        }
        out.push_back('\n');
        writeIndent(out, depth);
        out.push_back(']');
        return;
    }
    default:
        out.append(json::serialize(value));
        return;
    }
}

}  // namespace

std::string pretty_json(const json::value& value) {
    std::string out;
    prettyInto(out, value, 0);
    out.push_back('\n');
    return out;
}

JsonFileStore::JsonFileStore(fs::path path)
    : path_(std::move(path)) {}

std::optional<json::value> JsonFileStore::load() const {
    std::lock_guard<std::mutex> lock(fileMutex_);
    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        return std::nullopt;
    }

    std::ifstream input(path_, std::ios::binary);
    if (!input) {
        throw std::runtime_error("unable to open " + path_.string());
    }
    const std::string content((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());

    json::error_code parseEc;
    auto document = json::parse(content, parseEc);
    if (parseEc) {
        throw domain::DecodeError(path_.string() + ": " + parseEc.message());
    }
    return document;
}

void JsonFileStore::save(const json::value& document) const {
    std::lock_guard<std::mutex> lock(fileMutex_);
    ensureParent(path_);

    fs::path tmp = path_;
    tmp += ".tmp";
    {
        std::ofstream output(tmp, std::ios::binary | std::ios::trunc);
        if (!output) {
            throw std::runtime_error("unable to open " + tmp.string() + " for writing");
        }
        output << pretty_json(document);
        output.flush();
        if (!output) {
            throw std::runtime_error("short write to " + tmp.string());
        }
    }

    std::error_code ec;
    fs::rename(tmp, path_, ec);
    if (ec) {
        fs::remove(tmp, ec);
        throw std::runtime_error("unable to replace " + path_.string() + ": " + ec.message());
    }
}

fs::path JsonFileStore::backupCorrupt() const {
    std::lock_guard<std::mutex> lock(fileMutex_);
    const auto unixSeconds = std::chrono::duration_cast<std::chrono::seconds>(
                          std::chrono::system_clock::now().time_since_epoch())
                          .count();

    fs::path backup;
    std::error_code ec;
    for (int suffix = 0;; ++suffix) {
        std::ostringstream name;
        name << path_.filename().string() << ".corrupt." << unixSeconds;
        if (suffix > 0) {
            name << '-' << suffix;
        }
        name << ".bak";
        backup = path_.parent_path() / name.str();
        if (!fs::exists(backup, ec)) {
            break;
        }
    }

    fs::rename(path_, backup, ec);
    if (ec) {
        throw std::runtime_error("unable to back up " + path_.string() + ": " + ec.message());
    }
    LOG_WARN(kLogCategory, "unreadable %s moved to %s", path_.string().c_str(), backup.string().c_str());
    return backup;
}

AppendOnlyLog::AppendOnlyLog(fs::path path)
    : path_(std::move(path)) {}

void AppendOnlyLog::append(const std::string& line) {
    std::lock_guard<std::mutex> lock(fileMutex_);
    ensureParent(path_);
    std::ofstream output(path_, std::ios::binary | std::ios::app);
    if (!output) {
        throw std::runtime_error("unable to open " + path_.string() + " for append");
    }
    output << line << '\n';
    output.flush();
    if (!output) {
        throw std::runtime_error("short write to " + path_.string());
    }
}

}  // namespace infra::storage
