/**
 * @file file_store.cpp
 * @brief File namespace mirror.
 *
 * @copyright Copyright (c) 2024 mmbind Contributors
 * @license MIT License
 */

#include "mmbind_client/file_store.hpp"

#include <mmbind/core/errors.hpp>
#include <mmbind/utils/logger.hpp>
#include <mmbind/utils/string_utils.hpp>

#include <charconv>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace mmbind {
namespace client {

namespace {

// "<dir> name  size" for directories, "[indent]name  size" for files
const std::regex& listingPattern() {
    static const std::regex pattern(R"(^(?:(<dir> )|\s*)(.*?)\s+(\d+)$)");
    return pattern;
}

}  // namespace

FileStore::FileStore(Connection& connection, std::string cwd)
    : connection_(&connection)
    , cwd_(std::move(cwd))
{
    list();
}

std::optional<ListingEntry> FileStore::parseListingLine(const std::string& line) {
    std::smatch match;
    if (!std::regex_match(line, match, listingPattern())) {
        return std::nullopt;
    }

    ListingEntry entry;
    entry.directory = match[1].matched;
    entry.name = match[2].str();
    if (entry.name.empty()) {
        return std::nullopt;
    }

    const std::string digits = match[3].str();
    const auto result = std::from_chars(digits.data(), digits.data() + digits.size(), entry.size);
    if (result.ec != std::errc()) {
        return std::nullopt;
    }
    return entry;
}

std::vector<std::string> FileStore::list() {
    const ResponseFrame frame = request("file list", {cwd_});

    std::map<std::string, FileEntry> entries;
    std::istringstream lines(frame.responseText());
    std::string line;
    while (std::getline(lines, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        auto entry = parseListingLine(line);
        if (!entry) {
            throw core::ParseError("malformed listing of '" + cwd_ + "': '" + line + "'");
        }

        if (entry->directory) {
            entries[entry->name] = std::make_unique<FileStore>(
                *connection_, utils::join_path(cwd_, entry->name));
        } else {
            entries[entry->name] = entry->size;
        }
    }

    entries_.swap(entries);
    LOG_DEBUG("FileStore", "Listed {} entries in {}", entries_.size(), cwd_);
    return names();
}

const FileEntry& FileStore::get(const std::string& name) const {
    auto it = entries_.find(name);
    if (it == entries_.end()) {
        throw std::out_of_range("no entry '" + name + "' in " + cwd_);
    }
    return it->second;
}

bool FileStore::contains(const std::string& name) const {
    return entries_.count(name) > 0;
}

bool FileStore::isDirectory(const std::string& name) const {
    auto it = entries_.find(name);
    return it != entries_.end() &&
           std::holds_alternative<std::unique_ptr<FileStore>>(it->second);
}

const FileStore& FileStore::directory(const std::string& name) const {
    const auto* store = std::get_if<std::unique_ptr<FileStore>>(&get(name));
    if (!store) {
        throw std::out_of_range("'" + name + "' in " + cwd_ + " is not a directory");
    }
    return **store;
}

int64_t FileStore::fileSize(const std::string& name) const {
    const auto* size = std::get_if<int64_t>(&get(name));
    if (!size) {
        throw std::out_of_range("'" + name + "' in " + cwd_ + " is a directory");
    }
    return *size;
}

std::vector<std::string> FileStore::names() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        result.push_back(entry.first);
    }
    return result;
}

void FileStore::remove(const std::string& name) {
    if (!contains(name)) {
        throw std::out_of_range("no entry '" + name + "' in " + cwd_);
    }

    // Remote first: a failed delete must leave the mirror as it was
    request("file delete", {utils::join_path(cwd_, name)});
    entries_.erase(name);
    LOG_DEBUG("FileStore", "Deleted {}", utils::join_path(cwd_, name));
}

ResponseFrame FileStore::fetch(const std::string& name) {
    return request("file get", {utils::join_path(cwd_, name)});
}

ResponseFrame FileStore::status() {
    return request("file status", {});
}

ResponseFrame FileStore::request(const std::string& command,
                                 const std::vector<std::string>& args) {
    ResponseFrame frame = connection_->send(command, args);

    // Replies from other mesh hosts are not part of this mirror
    if (connection_->streamingOutstanding()) {
        const size_t ignored = connection_->drainStream().collect().size();
        LOG_WARN("FileStore", "Ignoring {} additional frames for '{}'", ignored, command);
    }
    return frame;
}

}  // namespace client
}  // namespace mmbind
