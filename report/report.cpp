#include "report.h"

#include <array>
#include <format>

namespace report {

static constexpr std::string_view RULE = "========================================";
static constexpr std::string_view THIN_RULE = "----------------------------------------";

std::string format_size(std::uintmax_t bytes) {
    static constexpr std::array<std::string_view, 5> units = { "B", "KB", "MB", "GB", "TB" };

    double size = static_cast<double>(bytes);
    size_t unit_index = 0;
    while (1024 <= size && unit_index < units.size() - 1) {
        size /= 1024;
        ++unit_index;
    }

    if (unit_index == 0) {
        return std::format("{} {}", bytes, units[unit_index]);
    }
    return std::format("{:.1f} {}", size, units[unit_index]);
}

void output_choice(std::ostream& os, const filesystem::path_t& output_dir, bool specified) {
    if (specified) {
        os << std::format("Output directory specified: {}", output_dir) << std::endl;
    } else {
        os << std::format("Output directory not specified. Using source directory: {}", output_dir) << std::endl;
    }
}

void output_creating(std::ostream& os, const filesystem::path_t& output_dir) {
    os << std::format("Output directory '{}' does not exist. Creating it...", output_dir) << std::endl;
}

void output_created(std::ostream& os, const filesystem::path_t& output_dir) {
    os << std::format("Created output directory: {}", output_dir) << std::endl;
}

void configuration(std::ostream& os, const filesystem::path_t& source_dir, const filesystem::path_t& output_dir) {
    if (source_dir == output_dir) {
        os << "Note: Output directory is same as source directory." << std::endl;
    }

    os << RULE << std::endl;
    os << "Archive Configuration:" << std::endl;
    os << RULE << std::endl;
    os << std::format("Source directory: {}", source_dir) << std::endl;
    os << std::format("Output directory: {}", output_dir) << std::endl;
    os << std::endl;
}

void no_directories(std::ostream& os) {
    os << "No directories found in source directory." << std::endl;
}

void found(std::ostream& os, size_t total) {
    os << std::format("Found {} {} to archive.", total, total == 1 ? "directory" : "directories") << std::endl;
    os << std::endl;
}

void processing(std::ostream& os, size_t index, size_t total, const std::string& name) {
    os << std::format("[{}/{}] Processing: {}", index, total, name) << std::endl;
}

void skipped(std::ostream& os, const std::string& tar_name) {
    os << std::format("  ⚠️  Archive already exists in output directory: {}", tar_name) << std::endl;
    os << "  Skipping..." << std::endl;
}

void creating(std::ostream& os, const filesystem::path_t& tar_file) {
    os << std::format("  Creating: {}", tar_file) << std::endl;
}

void command(std::ostream& os, const std::string& command_line) {
    os << std::format("  {}", command_line) << std::endl;
}

void created(std::ostream& os, const std::string& tar_name, std::optional<std::uintmax_t> size) {
    if (size.has_value()) {
        os << std::format("  ✓ Created: {} ({})", tar_name, format_size(size.value())) << std::endl;
    } else {
        os << std::format("  ✓ Created: {}", tar_name) << std::endl;
    }
}

void failed(std::ostream& os, const std::string& name, const std::string& reason) {
    os << std::format("  ✗ Failed to create archive for: {}", name) << std::endl;
    os << std::format("  Reason: {}", reason) << std::endl;
}

void cleanup_failed(std::ostream& os, const std::string& reason) {
    os << std::format("  Could not remove partial archive: {}", reason) << std::endl;
}

void entry_done(std::ostream& os) {
    os << std::endl;
}

void summary(std::ostream& os, const filesystem::path_t& source_dir, const filesystem::path_t& output_dir, const summary_t& summary) {
    os << RULE << std::endl;
    os << "Archiving Summary:" << std::endl;
    os << RULE << std::endl;
    os << std::format("Source directory: {}", source_dir) << std::endl;
    os << std::format("Output directory: {}", output_dir) << std::endl;
    os << std::format("Total directories found: {}", summary.total) << std::endl;
    os << std::format("Successfully archived: {}", summary.created) << std::endl;
    os << std::format("Failed: {}", summary.failed) << std::endl;
    os << std::format("Skipped (already exists): {}", summary.skipped) << std::endl;
    os << THIN_RULE << std::endl;
}

void archives(std::ostream& os, const filesystem::path_t& output_dir, const std::optional<std::vector<std::string>>& tar_names) {
    os << std::endl;
    os << std::format("Archives created in: {}", output_dir) << std::endl;
    os << "File format: directory_name.tar (uncompressed)" << std::endl;
    os << std::endl;
    os << "Created archives:" << std::endl;

    if (!tar_names.has_value()) {
        os << "(Unable to list archives)" << std::endl;
        return ;
    }

    const auto& names = tar_names.value();
    for (size_t i = 0; i < names.size() && i < MAX_LISTED_ARCHIVES; ++i) {
        os << names[i] << std::endl;
    }

    if (MAX_LISTED_ARCHIVES < names.size()) {
        os << std::format("... and {} more", names.size() - MAX_LISTED_ARCHIVES) << std::endl;
    }
}

void done(std::ostream& os) {
    os << std::endl;
    os << "Done!" << std::endl;
}

} // namespace report
