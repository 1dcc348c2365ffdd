#include "config.h"

#include <nlohmann/json.hpp>

#include <format>
#include <fstream>

namespace config {

options_t parse_args(const std::vector<std::string>& args) {
    options_t options;

    for (size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];

        std::string name = arg;
        std::optional<std::string> inline_value;
        if (arg.starts_with("--")) {
            const auto equals = arg.find('=');
            if (equals != std::string::npos) {
                name = arg.substr(0, equals);
                inline_value = arg.substr(equals + 1);
            }
        }

        const auto take_value = [&]() {
            if (inline_value.has_value()) {
                return inline_value.value();
            }
            if (i + 1 == args.size()) {
                throw std::runtime_error(std::format("option '{}' requires a value", name));
            }
            return args[++i];
        };

        const auto reject_value = [&]() {
            if (inline_value.has_value()) {
                throw std::runtime_error(std::format("option '{}' does not take a value", name));
            }
        };

        if (name == "-d" || name == "--directory") {
            options.directory = take_value();
        } else if (name == "-o" || name == "--output") {
            options.output = take_value();
        } else if (name == "-c" || name == "--config") {
            options.config_file = take_value();
        } else if (name == "-t" || name == "--tar") {
            options.tar = take_value();
        } else if (name == "-v" || name == "--verbose") {
            reject_value();
            options.verbose = true;
        } else if (name == "-h" || name == "--help") {
            reject_value();
            options.help = true;
        } else if (name.starts_with("-") && name != "-") {
            throw std::runtime_error(std::format("unknown option '{}'", name));
        } else {
            throw std::runtime_error(std::format("unexpected argument '{}'", arg));
        }
    }

    for (const auto* value : { &options.directory, &options.output, &options.config_file, &options.tar }) {
        if (value->has_value() && value->value().empty()) {
            throw std::runtime_error("option values must not be empty");
        }
    }

    return options;
}

options_t load_file(const filesystem::path_t& config_file) {
    if (!filesystem::exists(config_file)) {
        throw std::runtime_error(std::format("config file '{}' does not exist", config_file));
    }

    nlohmann::json config_json;
    {
        std::ifstream ifs(config_file.to_native_path());
        if (!ifs) {
            throw std::runtime_error(std::format("failed to open config file '{}'", config_file));
        }

        try {
            config_json = nlohmann::json::parse(ifs);
        } catch (const nlohmann::json::parse_error& e) {
            throw std::runtime_error(std::format("failed to parse json file '{}': {}", config_file, e.what()));
        }
    }

    if (!config_json.is_object()) {
        throw std::runtime_error(std::format("invalid config file '{}': top level value must be an object", config_file));
    }

    options_t options;
    for (const auto& [key, value] : config_json.items()) {
        if (key == "directory" || key == "output" || key == "tar") {
            if (!value.is_string()) {
                throw std::runtime_error(std::format("invalid config file '{}': '{}' must be a string", config_file, key));
            }
            const std::string value_str = value.get<std::string>();
            if (value_str.empty()) {
                throw std::runtime_error(std::format("invalid config file '{}': '{}' must not be empty", config_file, key));
            }

            if (key == "directory") {
                options.directory = value_str;
            } else if (key == "output") {
                options.output = value_str;
            } else {
                options.tar = value_str;
            }
        } else if (key == "verbose") {
            if (!value.is_boolean()) {
                throw std::runtime_error(std::format("invalid config file '{}': '{}' must be a boolean", config_file, key));
            }
            options.verbose = value.get<bool>();
        } else {
            throw std::runtime_error(std::format("invalid config file '{}': unknown key '{}'", config_file, key));
        }
    }

    return options;
}

options_t merge(const options_t& defaults, const options_t& overrides) {
    options_t result = defaults;

    if (overrides.directory.has_value()) {
        result.directory = overrides.directory;
    }
    if (overrides.output.has_value()) {
        result.output = overrides.output;
    }
    if (overrides.tar.has_value()) {
        result.tar = overrides.tar;
    }
    if (overrides.config_file.has_value()) {
        result.config_file = overrides.config_file;
    }
    result.verbose = defaults.verbose || overrides.verbose;
    result.help = defaults.help || overrides.help;

    return result;
}

options_t load(const std::vector<std::string>& args) {
    const auto cli_options = parse_args(args);
    if (cli_options.help) {
        return cli_options;
    }

    options_t options = cli_options;
    if (cli_options.config_file.has_value()) {
        options = merge(load_file(filesystem::resolve(cli_options.config_file.value())), cli_options);
    }

    if (!options.directory.has_value()) {
        throw std::runtime_error("missing required option '--directory <path>'");
    }

    return options;
}

std::string usage(std::string_view program) {
    return std::format(
        "OVERVIEW: Archive all directories in a specified directory into separate uncompressed tar files\n"
        "\n"
        "Creates an individual tar archive for each subdirectory found in the source directory.\n"
        "Archives are uncompressed and saved as <directory_name>.tar, existing archives are never overwritten.\n"
        "\n"
        "USAGE: {} --directory <path> [--output <path>] [--config <file>] [--tar <path>] [--verbose]\n"
        "\n"
        "OPTIONS:\n"
        "  -d, --directory <path>  Source directory containing directories to archive\n"
        "  -o, --output <path>     Output directory for tar files (default: same as source directory)\n"
        "  -c, --config <file>     JSON file with \"directory\", \"output\", \"tar\" and \"verbose\" defaults\n"
        "  -t, --tar <path>        tar executable to use instead of the one found in PATH\n"
        "  -v, --verbose           Print each tar command before running it\n"
        "  -h, --help              Show help information\n"
        "\n"
        "EXAMPLES:\n"
        "  {} -d /home/user/projects\n"
        "  {} -d /srv/projects -o /srv/backups\n"
        "  {} --directory ~/Documents --output ~/archives\n",
        program, program, program, program
    );
}

} // namespace config
