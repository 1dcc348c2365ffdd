#include "archiver.h"
#include "../process/process.h"
#include "../tar/tar.h"

#include <format>

namespace archiver {

// A path whose status cannot be read, e.g. below a directory without search permission, counts as absent.
static bool is_accessible(const filesystem::path_t& path) {
    try {
        return filesystem::exists(path);
    } catch (const std::runtime_error&) {
        return false;
    }
}

filesystem::path_t validate_source(const std::string& directory) {
    const auto source_dir = filesystem::resolve(directory);

    if (!is_accessible(source_dir)) {
        throw std::runtime_error(std::format("Source directory '{}' does not exist or is not accessible.", source_dir));
    }

    if (!filesystem::is_directory(source_dir)) {
        throw std::runtime_error(std::format("Source path '{}' is not a directory.", source_dir));
    }

    if (!filesystem::is_readable(source_dir)) {
        throw std::runtime_error(std::format("Cannot read source directory '{}'. Permission denied.", source_dir));
    }

    return source_dir;
}

filesystem::path_t locate_tar(const std::optional<std::string>& tar) {
    const auto tar_binary = tar::locate(tar);
    if (!tar_binary.has_value()) {
        if (tar.has_value()) {
            throw std::runtime_error(std::format("tar command '{}' not found or not executable.", tar.value()));
        }
        throw std::runtime_error("tar command not found. Please ensure tar is installed and in your PATH.");
    }

    return tar_binary.value();
}

void prepare_output(const filesystem::path_t& output_dir, bool specified, std::ostream& os) {
    report::output_choice(os, output_dir, specified);

    bool output_exists = false;
    try {
        output_exists = filesystem::exists(output_dir);
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(std::format("Failed to create output directory '{}': {}", output_dir, e.what()));
    }

    if (!output_exists) {
        report::output_creating(os, output_dir);
        try {
            filesystem::create_directories(output_dir);
        } catch (const std::runtime_error& e) {
            throw std::runtime_error(std::format("Failed to create output directory '{}': {}", output_dir, e.what()));
        }
        report::output_created(os, output_dir);
    }

    if (!filesystem::is_directory(output_dir)) {
        throw std::runtime_error(std::format("Output path '{}' is not a directory.", output_dir));
    }

    if (!filesystem::is_writable(output_dir)) {
        throw std::runtime_error(std::format("Cannot write to output directory '{}'. Permission denied.", output_dir));
    }
}

std::vector<filesystem::path_t> enumerate(const filesystem::path_t& source_dir, const filesystem::path_t& output_dir) {
    using predicate_t = filesystem::list_predicate_t;

    const auto not_output_dir = predicate_t {
        [output_dir](const filesystem::path_t& path) {
            return !(path == output_dir);
        }
    };

    try {
        return filesystem::list(source_dir, !predicate_t::is_hidden && !predicate_t::is_symlink && predicate_t::is_dir && not_output_dir);
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(std::format("Failed to read source directory: {}", e.what()));
    }
}

static void discard_partial(const filesystem::path_t& tar_file, std::ostream& os) {
    try {
        if (filesystem::exists(tar_file)) {
            filesystem::remove(tar_file);
        }
    } catch (const std::runtime_error& e) {
        report::cleanup_failed(os, e.what());
    }
}

entry_result_t archive_entry(const filesystem::path_t& tar_binary, const filesystem::path_t& source_dir, const filesystem::path_t& output_dir, const filesystem::path_t& entry, bool verbose, std::ostream& os) {
    entry_result_t result = {
        .name = entry.filename(),
        .outcome = outcome_t::FAILED,
        .size = std::nullopt
    };

    const auto tar_name = result.name + ".tar";
    const auto tar_file = output_dir / filesystem::relative_path_t(tar_name);

    bool already_exists = false;
    try {
        already_exists = filesystem::exists(tar_file) || filesystem::is_symlink(tar_file);
    } catch (const std::runtime_error& e) {
        report::failed(os, result.name, e.what());
        return result;
    }

    if (already_exists) {
        report::skipped(os, tar_name);
        result.outcome = outcome_t::SKIPPED;
        return result;
    }

    report::creating(os, tar_file);
    if (verbose) {
        report::command(os, process::to_string(tar::create_args(tar_binary, source_dir, result.name, tar_file)));
    }

    try {
        tar::create(tar_binary, source_dir, result.name, tar_file);
    } catch (const std::runtime_error& e) {
        report::failed(os, result.name, e.what());
        discard_partial(tar_file, os);
        return result;
    }

    result.outcome = outcome_t::CREATED;
    try {
        result.size = filesystem::file_size(tar_file);
    } catch (const std::runtime_error&) {
        // printed without a size
    }
    report::created(os, tar_name, result.size);

    return result;
}

std::optional<std::vector<std::string>> list_archives(const filesystem::path_t& output_dir) {
    std::vector<std::string> tar_names;
    try {
        for (const auto& tar_file : filesystem::list(output_dir, filesystem::list_predicate_t::extension(".tar"))) {
            tar_names.push_back(tar_file.filename());
        }
    } catch (const std::runtime_error&) {
        return std::nullopt;
    }

    return tar_names;
}

report::summary_t run(const config::options_t& options, std::ostream& os) {
    if (!options.directory.has_value()) {
        throw std::runtime_error("archiver::run: no source directory given");
    }

    const auto source_dir = validate_source(options.directory.value());
    const auto tar_binary = locate_tar(options.tar);

    const auto output_dir = options.output.has_value() ? filesystem::resolve(options.output.value()) : source_dir;
    prepare_output(output_dir, options.output.has_value(), os);

    report::configuration(os, source_dir, output_dir);

    const auto entries = enumerate(source_dir, output_dir);

    report::summary_t summary;
    if (entries.empty()) {
        report::no_directories(os);
        return summary;
    }

    summary.total = entries.size();
    report::found(os, summary.total);

    for (size_t i = 0; i < entries.size(); ++i) {
        report::processing(os, i + 1, summary.total, entries[i].filename());

        const auto result = archive_entry(tar_binary, source_dir, output_dir, entries[i], options.verbose, os);
        switch (result.outcome) {
            case outcome_t::CREATED: {
                ++summary.created;
            } break ;
            case outcome_t::SKIPPED: {
                ++summary.skipped;
            } break ;
            case outcome_t::FAILED: {
                ++summary.failed;
            } break ;
        }

        report::entry_done(os);
    }

    report::summary(os, source_dir, output_dir, summary);

    if (0 < summary.created) {
        report::archives(os, output_dir, list_archives(output_dir));
    }

    report::done(os);

    return summary;
}

} // namespace archiver
