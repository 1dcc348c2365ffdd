#ifndef ARCHIVE_DIRS_TAR_TAR_H
# define ARCHIVE_DIRS_TAR_TAR_H

# include "../filesystem/filesystem.h"
# include "../process/process.h"

# include <optional>
# include <string>
# include <vector>

/**
 * tar
 *
 * Drives an external tar-compatible executable, the archive format itself is never touched here.
 */
namespace tar {

inline const constexpr char* TAR_NAME = "tar";

// Used by locate() only, the process layer that runs the archiver is POSIX.
# ifdef _WIN32
inline const constexpr char* TAR_PATH = "C:\\Windows\\System32\\tar.exe";
# endif

/**
 * Locates the archiver.
 *
 * - With `explicit_path`, that path must name an executable regular file
 * - Otherwise TAR_NAME is looked up in PATH (TAR_PATH on Windows)
 *
 * Returns std::nullopt when no usable archiver is found.
 */
std::optional<filesystem::path_t> locate(const std::optional<std::string>& explicit_path);

/**
 * Builds the argument list of `tar -cf <tar_file> -C <source_dir> <entry_name>`.
 *
 * An entry name starting with '-' is preceded by `--`, so it is never read as an option.
 */
std::vector<process::process_arg_t> create_args(const filesystem::path_t& tar_binary, const filesystem::path_t& source_dir, const std::string& entry_name, const filesystem::path_t& tar_file);

/**
 * Creates an uncompressed archive `tar_file` holding `source_dir/entry_name`, stored under `entry_name`.
 *
 * The archiver's standard streams are discarded. An existing `tar_file` is overwritten, callers check first.
 * Throws if the archiver cannot be started, exits with a non-zero code or is terminated by a signal.
 */
void create(const filesystem::path_t& tar_binary, const filesystem::path_t& source_dir, const std::string& entry_name, const filesystem::path_t& tar_file);

} // namespace tar

#endif // ARCHIVE_DIRS_TAR_TAR_H
