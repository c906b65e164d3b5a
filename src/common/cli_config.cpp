#include "common/cli_config.hpp"

#include <array>
#include <format>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <boost/program_options.hpp>

namespace po = boost::program_options;

namespace sdb {

namespace {

constexpr std::array<std::string_view, 7> kLogLevels{
    "trace", "debug", "info", "warn", "error", "critical", "off"};

// Validate the fully populated CliConfig.
void validate(const CliConfig& cfg) {
    if (cfg.data_dir.empty()) {
        throw std::runtime_error("--data-dir must not be empty");
    }
    if (!is_valid_database_name(cfg.database)) {
        throw std::runtime_error(
            std::format("--database must be a plain directory name, got '{}'", cfg.database));
    }

    bool known_level = false;
    for (auto level : kLogLevels) {
        if (cfg.log_level == level) {
            known_level = true;
            break;
        }
    }
    if (!known_level) {
        throw std::runtime_error(
            std::format("--log-level must be one of trace|debug|info|warn|error|critical|off, "
                        "got '{}'", cfg.log_level));
    }
}

} // anonymous namespace

bool is_valid_database_name(std::string_view name) noexcept {
    if (name.empty() || name == "." || name == "..") {
        return false;
    }
    return name.find_first_of("/\\") == std::string_view::npos &&
           name.find('\0') == std::string_view::npos;
}

// ── add_options ───────────────────────────────────────────────────────────────

void add_options(po::options_description& desc) {
    desc.add_options()
        ("data-dir",
            po::value<std::string>()->default_value("./dbs"),
            "Storage root; each database lives in a subdirectory")
        ("database,d",
            po::value<std::string>()->default_value("default"),
            "Database selected at startup")
        ("log-level,l",
            po::value<std::string>()->default_value("warn"),
            "Log level: trace|debug|info|warn|error|critical|off")
        ("strict-schema",
            po::bool_switch()->default_value(false),
            "Reject malformed field:type tokens and unknown field types");
}

// ── parse_config ──────────────────────────────────────────────────────────────

CliConfig parse_config(int argc, char* argv[]) {
    po::options_description generic("schemadb options");
    generic.add_options()
        ("help,h",
            "Show this help message and exit")
        ("config,c",
            po::value<std::string>(),
            "Read further options from an INI-style file");

    po::options_description file_options("Configuration");
    add_options(file_options);

    po::options_description hidden;
    hidden.add_options()
        ("command", po::value<std::vector<std::string>>(), "command and arguments");

    po::options_description cmdline;
    cmdline.add(generic).add(file_options).add(hidden);

    po::options_description visible;
    visible.add(generic).add(file_options);

    po::positional_options_description positional;
    positional.add("command", -1);

    po::variables_map vm;
    try {
        po::store(
            po::command_line_parser(argc, argv)
                .options(cmdline)
                .positional(positional)
                .run(),
            vm);

        if (vm.count("help")) {
            std::ostringstream oss;
            oss << "Usage: schemadb [options] [command [args...]]\n\n" << visible;
            CliConfig cfg{};
            cfg.help_text = oss.str();
            return cfg;
        }

        if (vm.count("config")) {
            const auto path = vm["config"].as<std::string>();
            po::store(po::parse_config_file(path.c_str(), file_options), vm);
        }

        po::notify(vm);
    } catch (const po::error& e) {
        throw std::runtime_error(std::format("Argument error: {}", e.what()));
    }

    CliConfig cfg;
    cfg.data_dir      = vm["data-dir"].as<std::string>();
    cfg.database      = vm["database"].as<std::string>();
    cfg.log_level     = vm["log-level"].as<std::string>();
    cfg.strict_schema = vm["strict-schema"].as<bool>();
    if (vm.count("command")) {
        cfg.command = vm["command"].as<std::vector<std::string>>();
    }

    validate(cfg);
    return cfg;
}

} // namespace sdb
