#ifndef ARCHIVE_DIRS_FILESYSTEM_FILESYSTEM_H
# define ARCHIVE_DIRS_FILESYSTEM_FILESYSTEM_H

# include <filesystem>
# include <functional>
# include <format>
# include <string>
# include <vector>

/**
 * filesystem
 *
 * Controlled interface to the native filesystem.
 *
 * Design goals:
 * - Centralize all std::filesystem interaction
 * - Enforce path invariants via path_t
 * - Provide explicit, single-level listing
 *
 * All functions throw std::runtime_error on failure.
 */
namespace filesystem {

/**
 * relative_path_t
 *
 * Invariants:
 * - Always relative
 *
 * Semantics:
 * - Represents a relative filesystem location
 */
class relative_path_t {
public:
    friend class path_t;

public:
    relative_path_t(const std::filesystem::path& relative_path);

    /**
     * Returns the string representation.
    */
    std::string string() const;

    const std::filesystem::path& to_native_path() const;

private:
    std::filesystem::path m_relative_path;
};

/**
 * path_t
 *
 * Invariants:
 * - Always absolute
 * - Always lexically normalized
 * - Never ends in a separator, unless it is the root
 *
 * Semantics:
 * - Represents a concrete filesystem location
 * - All path composition enforces containment
 */
class path_t {
public:
    /**
     * Constructs a normalized absolute path, relative paths are resolved against the current working directory.
     */
    path_t(const std::filesystem::path& path);

    /**
     * Returns the final path component.
     */
    std::string filename() const;

    /**
     * Returns the native string representation.
    */
    const char* c_str() const;

    /**
     * Returns the string representation.
    */
    std::string string() const;

    /**
     * Returns the file extension, including the leading dot.
     */
    std::string extension() const;

    /**
     * Lexical equality comparison.
     */
    bool operator==(const path_t& other) const;

    /**
     * Lexical ordering, used to sort listings.
     */
    bool operator<(const path_t& other) const;

    /**
     * Joins a relative path component.
     *
     * Invariant:
     * - The resulting path must be a strict lexical child of the base path
     *
     * Throws if:
     * - The result escapes the base path
     * - The result is identical to the base path
     */
    path_t operator/(const relative_path_t& relative_path) const;

    const std::filesystem::path& to_native_path() const;

private:
    std::filesystem::path m_path;
};

/**
 * Expands a leading home reference in a user supplied path.
 *
 * - POSIX: `~` and `~/rest` expand against $HOME, falling back to the passwd entry of the current user,
 *   `~user/rest` expands against the home directory of `user`
 * - Windows: a leading `~` is replaced by %USERPROFILE%
 *
 * Paths without a leading `~`, and `~user` forms naming an unknown user, are returned unchanged.
 * No existence check is performed.
 */
std::string expand_home(const std::string& path);

/**
 * Expands the home reference and returns the normalized absolute path.
 */
path_t resolve(const std::string& path);

struct list_predicate_t {
    list_predicate_t(std::function<bool(const path_t& path)>&& predicate);

    static list_predicate_t is_dir;
    static list_predicate_t is_symlink;

    /**
     * Matches entries whose basename starts with a dot.
     */
    static list_predicate_t is_hidden;

    /**
     * Matches entries by extension, including the leading dot.
     */
    static list_predicate_t extension(const std::string& extension);

    std::function<bool(const path_t& path)> predicate;
    bool operator()(const path_t& path) const;

    list_predicate_t operator&&(list_predicate_t b) const;
    list_predicate_t operator!() const;
};

/**
 * Lists the immediate children of `dir` for which `predicate` holds.
 *
 * - Does not descend into subdirectories
 * - The result is sorted lexicographically
 */
std::vector<path_t> list(const path_t& dir, const list_predicate_t& predicate);

/**
 * Creates all missing parent directories.
 */
void create_directories(const path_t& path);

/**
 * Checks whether a path exists.
 */
bool exists(const path_t& path);

/**
 * Returns the size of a regular file in bytes.
 */
std::uintmax_t file_size(const path_t& path);

/**
 * Removes a single file or empty directory.
 */
bool remove(const path_t& path);

/**
 * Checks whether the path refers to a regular file.
 */
bool is_regular_file(const path_t& path);

/**
 * Checks whether the path refers to a directory, following symbolic links.
 */
bool is_directory(const path_t& path);

/**
 * Checks whether the path itself is a symbolic link.
 */
bool is_symlink(const path_t& path);

/**
 * Access checks for the calling process, as reported by access(2).
 */
bool is_readable(const path_t& path);
bool is_writable(const path_t& path);
bool is_executable(const path_t& path);

} // namespace filesystem

namespace std {

template <>
struct formatter<::filesystem::path_t> : formatter<std::string> {
    auto format(const ::filesystem::path_t& path, auto& ctx) const {
        return formatter<std::string>::format(path.string(), ctx);
    }
};

template <>
struct formatter<::filesystem::relative_path_t> : formatter<std::string> {
    auto format(const ::filesystem::relative_path_t& relative_path, auto& ctx) const {
        return formatter<std::string>::format(relative_path.string(), ctx);
    }
};

} // namespace std

#endif // ARCHIVE_DIRS_FILESYSTEM_FILESYSTEM_H
