#ifndef ARCHIVE_DIRS_TESTS_TEST_SUPPORT_H
# define ARCHIVE_DIRS_TESTS_TEST_SUPPORT_H

# include <cstdlib>
# include <cstring>
# include <filesystem>
# include <format>
# include <fstream>
# include <iterator>
# include <optional>
# include <stdexcept>
# include <string>

# include <sys/stat.h>
# include <unistd.h>

namespace test_support {

/**
 * Throw-away directory under the system temporary directory, removed with everything in it on destruction.
 */
class temp_dir_t {
public:
    temp_dir_t() {
        std::string path_template = (std::filesystem::temp_directory_path() / "archive_dirs_test_XXXXXX").string();
        if (mkdtemp(path_template.data()) == nullptr) {
            throw std::runtime_error(std::format("temp_dir_t: mkdtemp failed: {}", std::strerror(errno)));
        }
        m_path = path_template;
    }

    ~temp_dir_t() {
        restore_permissions(m_path);
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    temp_dir_t(const temp_dir_t&) = delete;
    temp_dir_t& operator=(const temp_dir_t&) = delete;

    const std::filesystem::path& path() const {
        return m_path;
    }

    std::filesystem::path mkdir(const std::string& relative_path) const {
        const auto dir = m_path / relative_path;
        std::filesystem::create_directories(dir);
        return dir;
    }

    std::filesystem::path write(const std::string& relative_path, const std::string& contents) const {
        const auto file = m_path / relative_path;
        std::filesystem::create_directories(file.parent_path());
        std::ofstream ofs(file, std::ios::binary | std::ios::trunc);
        if (!ofs) {
            throw std::runtime_error(std::format("temp_dir_t::write: failed to open '{}'", file.string()));
        }
        ofs << contents;
        return file;
    }

    /**
     * Writes an executable shell script.
     */
    std::filesystem::path script(const std::string& relative_path, const std::string& body) const {
        const auto file = write(relative_path, "#!/bin/sh\n" + body + "\n");
        std::filesystem::permissions(file, std::filesystem::perms::owner_all | std::filesystem::perms::group_read | std::filesystem::perms::group_exec);
        return file;
    }

private:
    // tests may leave directories without read or search permission behind
    static void restore_permissions(const std::filesystem::path& dir) {
        std::error_code ec;
        std::filesystem::permissions(dir, std::filesystem::perms::owner_all, std::filesystem::perm_options::add, ec);
        for (auto it = std::filesystem::directory_iterator(dir, ec); !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
            std::error_code entry_ec;
            if (!it->is_symlink(entry_ec) && it->is_directory(entry_ec)) {
                restore_permissions(it->path());
            }
        }
    }

    std::filesystem::path m_path;
};

inline std::string read(const std::filesystem::path& file) {
    std::ifstream ifs(file, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
}

/**
 * Sets an environment variable for the lifetime of the object, restoring the previous value afterwards.
 */
class scoped_env_t {
public:
    scoped_env_t(const std::string& name, const std::string& value):
        m_name(name)
    {
        const char* previous = std::getenv(name.c_str());
        if (previous) {
            m_previous = previous;
        }
        setenv(name.c_str(), value.c_str(), 1);
    }

    ~scoped_env_t() {
        if (m_previous.has_value()) {
            setenv(m_name.c_str(), m_previous->c_str(), 1);
        } else {
            unsetenv(m_name.c_str());
        }
    }

    scoped_env_t(const scoped_env_t&) = delete;
    scoped_env_t& operator=(const scoped_env_t&) = delete;

private:
    std::string m_name;
    std::optional<std::string> m_previous;
};

inline bool running_as_root() {
    return geteuid() == 0;
}

} // namespace test_support

#endif // ARCHIVE_DIRS_TESTS_TEST_SUPPORT_H
