#include "tar.h"

#include <format>

namespace tar {

std::optional<filesystem::path_t> locate(const std::optional<std::string>& explicit_path) {
    if (explicit_path.has_value()) {
        const auto path = filesystem::resolve(explicit_path.value());
        if (!filesystem::is_regular_file(path) || !filesystem::is_executable(path)) {
            return std::nullopt;
        }
        return path;
    }

#ifdef _WIN32
    const auto path = filesystem::path_t(TAR_PATH);
    if (!filesystem::is_regular_file(path)) {
        return std::nullopt;
    }
    return path;
#else
    return process::find_executable(TAR_NAME);
#endif
}

std::vector<process::process_arg_t> create_args(const filesystem::path_t& tar_binary, const filesystem::path_t& source_dir, const std::string& entry_name, const filesystem::path_t& tar_file) {
    std::vector<process::process_arg_t> args = {
        tar_binary,
        "-cf",
        tar_file,
        "-C",
        source_dir
    };

    if (entry_name.starts_with("-")) {
        args.push_back("--");
    }
    args.push_back(entry_name);

    return args;
}

void create(const filesystem::path_t& tar_binary, const filesystem::path_t& source_dir, const std::string& entry_name, const filesystem::path_t& tar_file) {
    if (!filesystem::is_directory(source_dir / filesystem::relative_path_t(entry_name))) {
        throw std::runtime_error(std::format("tar::create: '{}' is not a directory in '{}'", entry_name, source_dir));
    }

    const int create_process_result = process::create_and_wait(create_args(tar_binary, source_dir, entry_name, tar_file), process::stdio_t::DISCARD);
    if (0 < create_process_result) {
        throw std::runtime_error(std::format("tar::create: tar command failed with exit code {}", create_process_result));
    } else if (create_process_result < 0) {
        throw std::runtime_error(std::format("tar::create: tar command terminated by signal {}", -create_process_result));
    }
}

} // namespace tar
