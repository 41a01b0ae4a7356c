/**
 * @file file_store.hpp
 * @brief Local mirror of the daemon's file namespace.
 *
 * The daemon lists a directory one entry per line:
 * @code
 * <dir> images      4096
 *       notes.txt   12
 * @endcode
 * A FileStore holds one directory: file names map to sizes and directories
 * to nested stores, listed recursively.
 *
 * @copyright Copyright (c) 2024 mmbind Contributors
 * @license MIT License
 */

#pragma once

#include "mmbind_client/connection.hpp"
#include "mmbind_client/export.hpp"
#include "mmbind_client/response_frame.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace mmbind {
namespace client {

class FileStore;

/**
 * @brief A mirrored entry: a file size or a nested directory.
 */
using FileEntry = std::variant<int64_t, std::unique_ptr<FileStore>>;

/**
 * @brief One parsed line of a directory listing.
 */
struct ListingEntry {
    bool directory = false;
    std::string name;
    int64_t size = 0;
};

/**
 * @class FileStore
 * @brief Explicit mapping over one remote directory.
 *
 * Nothing is mutated implicitly: the mirror changes only through list()
 * and remove(). Borrows the connection.
 */
class MMBIND_CLIENT_API FileStore {
public:
    /**
     * @brief Mirror @p cwd, listing it immediately.
     * @throws core::ParseError on a malformed listing line.
     * @throws core::CommandError if the daemon rejects the listing.
     */
    explicit FileStore(Connection& connection, std::string cwd = "/");

    // Non-copyable
    FileStore(const FileStore&) = delete;
    FileStore& operator=(const FileStore&) = delete;

    /**
     * @brief Re-list the directory and its subdirectories.
     *
     * The mirror is replaced only once the whole listing parsed.
     *
     * @return Sorted entry names
     */
    std::vector<std::string> list();

    /**
     * @brief Entry by name.
     * @throws std::out_of_range if there is none.
     */
    const FileEntry& get(const std::string& name) const;

    bool contains(const std::string& name) const;
    bool isDirectory(const std::string& name) const;

    /**
     * @brief Nested store of a directory entry.
     * @throws std::out_of_range if @p name is not a directory.
     */
    const FileStore& directory(const std::string& name) const;

    /**
     * @brief Size of a file entry.
     * @throws std::out_of_range if @p name is not a file.
     */
    int64_t fileSize(const std::string& name) const;

    std::vector<std::string> names() const;
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    /**
     * @brief Delete an entry on the daemon, then drop it locally.
     *
     * If the remote delete fails the mirror is unchanged.
     *
     * @throws std::out_of_range if the name is unknown.
     * @throws core::CommandError if the daemon refuses.
     */
    void remove(const std::string& name);

    /**
     * @brief Ask the daemon to fetch a file from the mesh. The mirror
     *        picks it up on the next list().
     */
    ResponseFrame fetch(const std::string& name);

    /**
     * @brief Status of in-flight transfers.
     */
    ResponseFrame status();

    /// Absolute path of this directory on the daemon
    const std::string& cwd() const { return cwd_; }

    /**
     * @brief Parse one listing line.
     * @return nullopt if the line does not match the listing format
     */
    static std::optional<ListingEntry> parseListingLine(const std::string& line);

private:
    ResponseFrame request(const std::string& command, const std::vector<std::string>& args);

    Connection* connection_;
    std::string cwd_;
    std::map<std::string, FileEntry> entries_;
};

}  // namespace client
}  // namespace mmbind
