// =============================================================================
// sprocket CLI - Stored routine loader
// =============================================================================
//
// Usage:
//   sprocket <command> [options]
//
// Commands:
//   load        Compile routine sources and load them into the database
//   version     Show version information
//   help        Show this help message
//
// Examples:
//   sprocket -c etc/sprocket.yaml load
//   sprocket -d shop load lib/psql/tst_foo.psql
//
// =============================================================================

#include <cstring>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "sprocket/config.hpp"
#include "sprocket/db/connection.hpp"
#include "sprocket/error.hpp"
#include "sprocket/loader/routine_loader.hpp"
#include "sprocket/logging.hpp"

namespace sprocket::cli {
    int cmd_load(int argc, char* argv[]);
    int cmd_version(int argc, char* argv[]);
    int cmd_help(int argc, char* argv[]);
}

// =============================================================================
// Version Info
// =============================================================================

#define SPROCKET_VERSION_MAJOR 1
#define SPROCKET_VERSION_MINOR 0
#define SPROCKET_VERSION_PATCH 0
#define SPROCKET_VERSION_STRING "1.0.0"

// =============================================================================
// Command Registry
// =============================================================================

struct Command {
    const char* name;
    const char* description;
    int (*handler)(int argc, char* argv[]);
};

static const Command g_commands[] = {
    {"load",    "Compile routine sources and load them into the database", sprocket::cli::cmd_load},
    {"version", "Show version information", sprocket::cli::cmd_version},
    {"help",    "Show this help message", sprocket::cli::cmd_help},
    {nullptr, nullptr, nullptr}
};

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    std::string config_file = "sprocket.yaml";
    bool config_given = false;
    std::optional<std::string> database;
    std::optional<std::string> user;
    std::optional<std::string> host;
    std::optional<std::string> port;
    bool verbose = false;
    bool quiet = false;
};

static GlobalOptions g_options;

// The configuration file, then the environment, then the command line.
static sprocket::LoaderConfig resolve_config() {
    sprocket::LoaderConfig config;
    if (g_options.config_given || std::filesystem::exists(g_options.config_file)) {
        config = sprocket::load_config(g_options.config_file);
    } else {
        config = sprocket::default_config();
        sprocket::apply_env_overrides(config.database);
    }

    if (g_options.database) config.database.database = *g_options.database;
    if (g_options.user) config.database.user = *g_options.user;
    if (g_options.host) config.database.host = *g_options.host;
    if (g_options.port) {
        config.database.port = static_cast<unsigned int>(std::strtoul(g_options.port->c_str(), nullptr, 10));
    }
    return config;
}

namespace sprocket::cli {

// =============================================================================
// Help Command
// =============================================================================

int cmd_help([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "sprocket - Stored Routine Loader\n";
    std::cout << "Version " << SPROCKET_VERSION_STRING << "\n\n";
    std::cout << "Usage: sprocket [options] <command> [arguments]\n\n";
    std::cout << "Commands:\n";

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        std::cout << "  " << cmd->name;
        for (size_t i = strlen(cmd->name); i < 12; ++i) std::cout << ' ';
        std::cout << cmd->description << "\n";
    }

    std::cout << "\nGlobal Options:\n";
    std::cout << "  -c, --config <file>     Configuration file (default: sprocket.yaml)\n";
    std::cout << "  -d, --database <name>   Database name\n";
    std::cout << "  -U, --user <user>       Database user (default: root)\n";
    std::cout << "  -h, --host <host>       Database host (default: localhost)\n";
    std::cout << "  -p, --port <port>       Database port (default: 3306)\n";
    std::cout << "  -v, --verbose           Verbose output\n";
    std::cout << "  -q, --quiet             Only report warnings and errors\n";
    std::cout << "\nEnvironment:\n";
    std::cout << "  SPROCKET_DB_HOST, SPROCKET_DB_PORT, SPROCKET_DB_USER,\n";
    std::cout << "  SPROCKET_DB_PASS, SPROCKET_DB_NAME\n";
    std::cout << "\nExamples:\n";
    std::cout << "  sprocket -c etc/sprocket.yaml load\n";
    std::cout << "  sprocket load lib/psql/tst_foo.psql\n";

    return 0;
}

// =============================================================================
// Version Command
// =============================================================================

int cmd_version([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "sprocket " << SPROCKET_VERSION_STRING << "\n";
    return 0;
}

// =============================================================================
// Load Command
// =============================================================================

int cmd_load(int argc, char* argv[]) {
    std::vector<std::string> files;
    for (int i = 0; i < argc; ++i) {
        files.push_back(argv[i]);
    }

    try {
        LoaderConfig config = resolve_config();

        Logger& logger = Logger::getInstance();
        logger.setLevel(parse_log_level(config.log_level));
        if (g_options.verbose) logger.setLevel(LogLevel::DEBUG);
        if (g_options.quiet) logger.setLevel(LogLevel::WARN);
        logger.setOutputFile(config.log_file);

        db::MySqlDataLayer db(config.database);
        loader::RoutineLoader routine_loader(db, config);

        int failures = files.empty() ? routine_loader.load_all() : routine_loader.load_list(files);
        return failures == 0 ? 0 : 1;
    } catch (const SprocketException& e) {
        LOG_ERROR(e.what());
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR("Error: ", e.what());
        return 1;
    }
}

}  // namespace sprocket::cli

// =============================================================================
// Main Entry Point
// =============================================================================

int parse_global_options(int& argc, char**& argv) {
    int i = 1;  // Skip program name
    while (i < argc) {
        std::string arg = argv[i];

        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            g_options.config_file = argv[++i];
            g_options.config_given = true;
        } else if ((arg == "-d" || arg == "--database") && i + 1 < argc) {
            g_options.database = argv[++i];
        } else if ((arg == "-U" || arg == "--user") && i + 1 < argc) {
            g_options.user = argv[++i];
        } else if ((arg == "-h" || arg == "--host") && i + 1 < argc) {
            g_options.host = argv[++i];
        } else if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
            g_options.port = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            g_options.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            g_options.quiet = true;
        } else {
            // First non-option is the command
            break;
        }
        ++i;
    }

    // Shift argv to point to command
    argc -= i;
    argv += i;
    return 0;
}

int main(int argc, char* argv[]) {
    parse_global_options(argc, argv);

    if (argc < 1) {
        sprocket::cli::cmd_help(0, nullptr);
        return 1;
    }

    const char* cmd_name = argv[0];
    ++argv;
    --argc;

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        if (strcmp(cmd->name, cmd_name) == 0) {
            return cmd->handler(argc, argv);
        }
    }

    std::cerr << "Unknown command: " << cmd_name << "\n";
    std::cerr << "Run 'sprocket help' for usage.\n";
    return 1;
}
