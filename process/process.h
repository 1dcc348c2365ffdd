#ifndef ARCHIVE_DIRS_PROCESS_PROCESS_H
# define ARCHIVE_DIRS_PROCESS_PROCESS_H

# include "../filesystem/filesystem.h"

# include <optional>
# include <string>
# include <variant>
# include <vector>

namespace process {

using process_arg_t = std::variant<std::string, filesystem::path_t>;

/**
 * What happens to the standard output and error of a child process.
 */
enum class stdio_t {
    INHERIT,
    DISCARD
};

/**
 * Exit code reported when the child could not execute the requested program.
 */
inline constexpr int EXEC_FAILURE_EXIT_CODE = 127;

/**
 * Creates a new process with the given arguments and waits for it to complete.
 * The first argument is the path of the program, it is not looked up in PATH.
 * Returns a non-negative exit code on success, or the negated value of the signal that caused the process to terminate.
 * A program that cannot be executed yields EXEC_FAILURE_EXIT_CODE.
 */
int create_and_wait(const std::vector<process_arg_t>& args, stdio_t stdio = stdio_t::INHERIT);

/**
 * Replaces the current process with a new process with the given arguments.
 */
[[noreturn]] void exec(const std::vector<process_arg_t>& args);

/**
 * Joins the arguments with spaces, as a shell command line would read.
 */
std::string to_string(const std::vector<process_arg_t>& args);

/**
 * Searches the directories of the PATH environment variable for an executable regular file called `name`.
 * Names containing a separator are not searched, they are checked directly.
 */
std::optional<filesystem::path_t> find_executable(const std::string& name);

} // namespace process

#endif // ARCHIVE_DIRS_PROCESS_PROCESS_H
