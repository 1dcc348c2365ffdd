#include "process.h"

#include <cstdlib>
#include <cstring>
#include <format>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace process {

static void discard_stdio() {
    const int dev_null = open("/dev/null", O_WRONLY);
    if (dev_null == -1) {
        throw std::runtime_error(std::format("process::discard_stdio: failed to open /dev/null: {}", std::strerror(errno)));
    }

    if (dup2(dev_null, STDOUT_FILENO) == -1 || dup2(dev_null, STDERR_FILENO) == -1) {
        const int dup2_errno = errno;
        close(dev_null);
        throw std::runtime_error(std::format("process::discard_stdio: dup2 failed: {}", std::strerror(dup2_errno)));
    }

    close(dev_null);
}

int create_and_wait(const std::vector<process_arg_t>& args, stdio_t stdio) {
    if (args.empty()) {
        throw std::runtime_error("process::create_and_wait: no program given");
    }

    const auto pid = fork();
    if (pid == -1) {
        throw std::runtime_error(std::format("process::create_and_wait: fork failed: {}", std::strerror(errno)));
    }

    if (pid == 0) {
        try {
            if (stdio == stdio_t::DISCARD) {
                discard_stdio();
            }
            exec(args);
        } catch (const std::exception&) {
            // the parent only sees the exit code
            _exit(EXEC_FAILURE_EXIT_CODE);
        }
    }

    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            throw std::runtime_error(std::format("process::create_and_wait: waitpid failed: {}", std::strerror(errno)));
        }
    }

    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        const int return_value = -WTERMSIG(status);
        if (0 <= return_value) {
            throw std::runtime_error(std::format("process::create_and_wait: unreachable state reached after waitpid, WIFSIGNALED but non-negative return value: {}", return_value));
        }
        return return_value;
    } else {
        throw std::runtime_error(std::format("process::create_and_wait: unreachable state reached after waitpid, status: {}", status));
    }
}

[[noreturn]] void exec(const std::vector<process_arg_t>& args) {
    std::vector<char*> cargs;
    for (const auto& arg : args) {
        cargs.push_back(const_cast<char*>(std::visit([](const auto& v) { return v.c_str(); }, arg)));
    }
    cargs.push_back(nullptr);

    if (execv(cargs[0], cargs.data()) == -1) {
        throw std::runtime_error(std::format("process::exec: execv failed: {}", std::strerror(errno)));
    }
    throw std::runtime_error("process::exec: unreachable state reached after execv");
}

std::string to_string(const std::vector<process_arg_t>& args) {
    std::string result;
    for (const auto& arg : args) {
        if (!result.empty()) {
            result += " ";
        }
        result += std::visit([](const auto& v) { return std::string(v.c_str()); }, arg);
    }
    return result;
}

std::optional<filesystem::path_t> find_executable(const std::string& name) {
    if (name.empty()) {
        return std::nullopt;
    }

    const auto is_candidate = [](const filesystem::path_t& path) {
        return filesystem::is_regular_file(path) && filesystem::is_executable(path);
    };

    if (name.find('/') != std::string::npos) {
        const auto path = filesystem::resolve(name);
        if (is_candidate(path)) {
            return path;
        }
        return std::nullopt;
    }

    const char* env_path = std::getenv("PATH");
    const std::string search_path = env_path && *env_path ? env_path : "/usr/bin:/bin";

    size_t begin = 0;
    while (begin <= search_path.size()) {
        auto end = search_path.find(':', begin);
        if (end == std::string::npos) {
            end = search_path.size();
        }

        const auto dir = search_path.substr(begin, end - begin);
        const auto candidate = filesystem::path_t(dir.empty() ? "." : dir) / filesystem::relative_path_t(name);
        if (is_candidate(candidate)) {
            return candidate;
        }

        begin = end + 1;
    }

    return std::nullopt;
}

} // namespace process
