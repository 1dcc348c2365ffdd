#include "filesystem.h"

#include <algorithm>
#include <cstdlib>
#include <format>

#ifndef _WIN32
# include <pwd.h>
# include <unistd.h>
#endif

namespace filesystem {

static std::filesystem::file_status status_of(const path_t& path, bool follow_symlinks, std::string_view caller) {
    std::error_code ec;
    const auto result = follow_symlinks ? std::filesystem::status(path.to_native_path(), ec) : std::filesystem::symlink_status(path.to_native_path(), ec);
    if (ec && result.type() != std::filesystem::file_type::not_found) {
        throw std::runtime_error(std::format("{}: failed to get status of path '{}': {}", caller, path.string(), ec.message()));
    }
    return result;
}

relative_path_t::relative_path_t(const std::filesystem::path& relative_path):
    m_relative_path(relative_path)
{
    if (m_relative_path.is_absolute()) {
        throw std::runtime_error(std::format("relative_path_t: path '{}' is absolute", m_relative_path.string()));
    }
}

std::string relative_path_t::string() const {
    return m_relative_path.string();
}

const std::filesystem::path& relative_path_t::to_native_path() const {
    return m_relative_path;
}

path_t::path_t(const std::filesystem::path& path):
    m_path(std::filesystem::absolute(path).lexically_normal())
{
    if (m_path.has_relative_path() && !m_path.has_filename()) {
        m_path = m_path.parent_path();
    }
}

std::string path_t::filename() const {
    return m_path.filename().string();
}

const char* path_t::c_str() const {
    return m_path.c_str();
}

std::string path_t::string() const {
    return m_path.string();
}

std::string path_t::extension() const {
    return m_path.extension().string();
}

bool path_t::operator==(const path_t& other) const {
    return m_path == other.m_path;
}

bool path_t::operator<(const path_t& other) const {
    return m_path < other.m_path;
}

path_t path_t::operator/(const relative_path_t& relative_path) const {
    path_t result(m_path / relative_path.to_native_path());

    const auto rel = result.m_path.lexically_relative(m_path);
    if (rel.empty() || rel == "." || rel.native().starts_with("..")) {
        throw std::runtime_error(std::format("operator/: path '{}' must not escape the base path '{}'", result.m_path.string(), m_path.string()));
    }

    return result;
}

const std::filesystem::path& path_t::to_native_path() const {
    return m_path;
}

std::string expand_home(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }

#ifdef _WIN32
    const char* user_profile = std::getenv("USERPROFILE");
    return std::string(user_profile ? user_profile : "") + path.substr(1);
#else
    const auto separator = path.find('/');
    const auto user = path.substr(1, separator == std::string::npos ? std::string::npos : separator - 1);
    const auto rest = separator == std::string::npos ? std::string() : path.substr(separator);

    std::string home;
    if (user.empty()) {
        const char* env_home = std::getenv("HOME");
        if (env_home && *env_home) {
            home = env_home;
        } else {
            const passwd* pw = getpwuid(getuid());
            if (!pw || !pw->pw_dir) {
                return path;
            }
            home = pw->pw_dir;
        }
    } else {
        const passwd* pw = getpwnam(user.c_str());
        if (!pw || !pw->pw_dir) {
            return path;
        }
        home = pw->pw_dir;
    }

    while (1 < home.size() && home.back() == '/') {
        home.pop_back();
    }
    if (home == "/" && !rest.empty()) {
        return rest;
    }

    return home + rest;
#endif
}

path_t resolve(const std::string& path) {
    if (path.empty()) {
        throw std::runtime_error("resolve: path is empty");
    }

    return path_t(expand_home(path));
}

list_predicate_t::list_predicate_t(std::function<bool(const path_t& path)>&& predicate):
    predicate(std::move(predicate))
{
}

bool list_predicate_t::operator()(const path_t& path) const {
    return predicate(path);
}

list_predicate_t list_predicate_t::operator&&(list_predicate_t b) const {
    return list_predicate_t {
        [a = *this, b](const path_t& path) {
            return a(path) && b(path);
        }
    };
}

list_predicate_t list_predicate_t::operator!() const {
    return list_predicate_t {
        [a = *this](const path_t& path) {
            return !a(path);
        }
    };
}

list_predicate_t list_predicate_t::is_dir = {
    [](const path_t& path) {
        return filesystem::is_directory(path);
    }
};

list_predicate_t list_predicate_t::is_symlink = {
    [](const path_t& path) {
        return filesystem::is_symlink(path);
    }
};

list_predicate_t list_predicate_t::is_hidden = {
    [](const path_t& path) {
        return path.filename().starts_with(".");
    }
};

list_predicate_t list_predicate_t::extension(const std::string& extension) {
    return {
        [=](const path_t& path) {
            return path.extension() == extension;
        }
    };
}

std::vector<path_t> list(const path_t& dir, const list_predicate_t& predicate) {
    std::vector<path_t> result;

    std::error_code ec;
    for (auto it = std::filesystem::directory_iterator(dir.to_native_path(), ec); !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
        const auto path = path_t(dir.to_native_path() / it->path().filename());
        if (predicate(path)) {
            result.push_back(path);
        }
    }
    if (ec) {
        throw std::runtime_error(std::format("list: failed to iterate directory '{}': {}", dir.string(), ec.message()));
    }

    std::sort(result.begin(), result.end());

    return result;
}

void create_directories(const path_t& path) {
    std::error_code ec;
    std::filesystem::create_directories(path.to_native_path(), ec);
    if (ec) {
        throw std::runtime_error(std::format("create_directories: failed to create directories for path '{}': {}", path.string(), ec.message()));
    }
}

bool exists(const path_t& path) {
    std::error_code ec;
    const bool result = std::filesystem::exists(path.to_native_path(), ec);
    if (ec) {
        throw std::runtime_error(std::format("exists: failed to check existence of path '{}': {}", path.string(), ec.message()));
    }
    return result;
}

std::uintmax_t file_size(const path_t& path) {
    std::error_code ec;
    const std::uintmax_t result = std::filesystem::file_size(path.to_native_path(), ec);
    if (ec) {
        throw std::runtime_error(std::format("file_size: failed to get file size of path '{}': {}", path.string(), ec.message()));
    }
    return result;
}

bool remove(const path_t& path) {
    std::error_code ec;
    const bool result = std::filesystem::remove(path.to_native_path(), ec);
    if (ec) {
        throw std::runtime_error(std::format("remove: failed to remove path '{}': {}", path.string(), ec.message()));
    }
    return result;
}

bool is_regular_file(const path_t& path) {
    return std::filesystem::is_regular_file(status_of(path, true, "is_regular_file"));
}

bool is_directory(const path_t& path) {
    return std::filesystem::is_directory(status_of(path, true, "is_directory"));
}

bool is_symlink(const path_t& path) {
    return std::filesystem::is_symlink(status_of(path, false, "is_symlink"));
}

#ifdef _WIN32

bool is_readable(const path_t& path) {
    return exists(path);
}

bool is_writable(const path_t& path) {
    std::error_code ec;
    const auto perms = std::filesystem::status(path.to_native_path(), ec).permissions();
    return !ec && (perms & std::filesystem::perms::owner_write) != std::filesystem::perms::none;
}

bool is_executable(const path_t& path) {
    return is_regular_file(path);
}

#else

bool is_readable(const path_t& path) {
    return access(path.c_str(), R_OK) == 0;
}

bool is_writable(const path_t& path) {
    return access(path.c_str(), W_OK) == 0;
}

bool is_executable(const path_t& path) {
    return access(path.c_str(), X_OK) == 0;
}

#endif

} // namespace filesystem
