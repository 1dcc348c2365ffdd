#ifndef ARCHIVE_DIRS_ARCHIVER_ARCHIVER_H
# define ARCHIVE_DIRS_ARCHIVER_ARCHIVER_H

# include "../config/config.h"
# include "../filesystem/filesystem.h"
# include "../report/report.h"

# include <cstdint>
# include <optional>
# include <ostream>
# include <string>
# include <vector>

/**
 * archiver
 *
 * Archives every immediate, non-hidden subdirectory of a source directory into `<name>.tar` in an output directory.
 *
 * A run goes through:
 *   validate source -> locate tar -> prepare output -> enumerate -> archive each entry -> summarize
 *
 * Every step before the per-entry loop throws std::runtime_error on failure and ends the run.
 * Inside the loop an entry can only be skipped or fail, the loop always continues.
 */
namespace archiver {

enum class outcome_t {
    CREATED,
    SKIPPED,
    FAILED
};

struct entry_result_t {
    std::string name;
    outcome_t outcome;
    std::optional<std::uintmax_t> size;
};

/**
 * Resolves `directory` and checks that it exists, is a directory and is readable.
 */
filesystem::path_t validate_source(const std::string& directory);

/**
 * Returns the archiver executable, or throws if none can be found.
 */
filesystem::path_t locate_tar(const std::optional<std::string>& tar);

/**
 * Creates `output_dir` with its parents if it is missing, then checks that it is a writable directory.
 * `specified` tells whether the output directory was given explicitly or defaulted to the source.
 */
void prepare_output(const filesystem::path_t& output_dir, bool specified, std::ostream& os);

/**
 * Immediate subdirectories of `source_dir`, sorted by name.
 * Hidden entries, symbolic links and `output_dir` itself are left out.
 */
std::vector<filesystem::path_t> enumerate(const filesystem::path_t& source_dir, const filesystem::path_t& output_dir);

/**
 * Archives a single entry of `source_dir` into `output_dir`.
 *
 * An existing `<name>.tar` is never touched. On failure any partial archive is removed.
 */
entry_result_t archive_entry(const filesystem::path_t& tar_binary, const filesystem::path_t& source_dir, const filesystem::path_t& output_dir, const filesystem::path_t& entry, bool verbose, std::ostream& os);

/**
 * Sorted names of the `.tar` files in `output_dir`, or std::nullopt if it cannot be listed.
 */
std::optional<std::vector<std::string>> list_archives(const filesystem::path_t& output_dir);

/**
 * Performs a whole run, writing progress to `os`.
 */
report::summary_t run(const config::options_t& options, std::ostream& os);

} // namespace archiver

#endif // ARCHIVE_DIRS_ARCHIVER_ARCHIVER_H
