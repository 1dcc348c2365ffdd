#ifndef ARCHIVE_DIRS_REPORT_REPORT_H
# define ARCHIVE_DIRS_REPORT_REPORT_H

# include "../filesystem/filesystem.h"

# include <cstdint>
# include <optional>
# include <ostream>
# include <string>
# include <vector>

/**
 * report
 *
 * Every line the tool prints during a run. Nothing here touches the filesystem.
 */
namespace report {

inline constexpr size_t MAX_LISTED_ARCHIVES = 20;

struct summary_t {
    size_t total = 0;
    size_t created = 0;
    size_t failed = 0;
    size_t skipped = 0;
};

/**
 * Human readable byte count.
 *
 * Below 1024 the exact count is printed, e.g. "512 B".
 * Otherwise the value is divided by 1024 until it fits, up to TB, and printed with one decimal, e.g. "1.5 KB".
 */
std::string format_size(std::uintmax_t bytes);

void output_choice(std::ostream& os, const filesystem::path_t& output_dir, bool specified);
void output_creating(std::ostream& os, const filesystem::path_t& output_dir);
void output_created(std::ostream& os, const filesystem::path_t& output_dir);
void configuration(std::ostream& os, const filesystem::path_t& source_dir, const filesystem::path_t& output_dir);

void no_directories(std::ostream& os);
void found(std::ostream& os, size_t total);

void processing(std::ostream& os, size_t index, size_t total, const std::string& name);
void skipped(std::ostream& os, const std::string& tar_name);
void creating(std::ostream& os, const filesystem::path_t& tar_file);
void command(std::ostream& os, const std::string& command_line);
void created(std::ostream& os, const std::string& tar_name, std::optional<std::uintmax_t> size);
void failed(std::ostream& os, const std::string& name, const std::string& reason);
void cleanup_failed(std::ostream& os, const std::string& reason);
void entry_done(std::ostream& os);

void summary(std::ostream& os, const filesystem::path_t& source_dir, const filesystem::path_t& output_dir, const summary_t& summary);

/**
 * Lists up to MAX_LISTED_ARCHIVES archive names, followed by the number left out.
 * `tar_names` is std::nullopt when the output directory could not be listed.
 */
void archives(std::ostream& os, const filesystem::path_t& output_dir, const std::optional<std::vector<std::string>>& tar_names);

void done(std::ostream& os);

} // namespace report

#endif // ARCHIVE_DIRS_REPORT_REPORT_H
