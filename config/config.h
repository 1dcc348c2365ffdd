#ifndef ARCHIVE_DIRS_CONFIG_CONFIG_H
# define ARCHIVE_DIRS_CONFIG_CONFIG_H

# include "../filesystem/filesystem.h"

# include <optional>
# include <string>
# include <string_view>
# include <vector>

/**
 * config
 *
 * Options of a run, gathered from an optional JSON configuration file and the command line.
 * The command line overrides the file.
 *
 * All functions throw std::runtime_error on malformed input.
 */
namespace config {

inline const constexpr char* PROGRAM_NAME = "archive-dirs";

struct options_t {
    std::optional<std::string> directory;
    std::optional<std::string> output;
    std::optional<std::string> tar;
    std::optional<std::string> config_file;
    bool verbose = false;
    bool help = false;
};

/**
 * Parses command line arguments, `args` excludes the program name.
 *
 * Accepted forms: `-d <value>`, `--directory <value>`, `--directory=<value>`.
 * Repeated options keep the last value.
 */
options_t parse_args(const std::vector<std::string>& args);

/**
 * Reads a configuration file holding a single JSON object.
 *
 * Recognised keys: "directory", "output", "tar" (non-empty strings) and "verbose" (boolean).
 * Unknown keys are rejected.
 */
options_t load_file(const filesystem::path_t& config_file);

/**
 * Overlays `overrides` on top of `defaults`.
 */
options_t merge(const options_t& defaults, const options_t& overrides);

/**
 * Parses the command line, then loads and merges the configuration file it names, if any.
 * Throws if no source directory is given by either.
 */
options_t load(const std::vector<std::string>& args);

std::string usage(std::string_view program);

} // namespace config

#endif // ARCHIVE_DIRS_CONFIG_CONFIG_H
