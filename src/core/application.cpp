/*
 * Primus C++ - Application Implementation
 */
#include <primus/core/application.hpp>
#include <primus/core/logger.hpp>
#include <primus/core/utils.hpp>

#include <iostream>
#include <csignal>
#include <cstring>
#include <unistd.h>

namespace primus {

// ============================================================================
// Utility Functions
// ============================================================================

namespace {

void print_usage(const char* prog) {
    std::cout << AppInfo::NAME << " - policy and isolation core\n\n"
              << "Usage: " << prog << " [options]\n\n"
              << "Options:\n"
              << "  --config <path>  Configuration file (default: config.json)\n"
              << "  -h, --help       Show this help message\n"
              << "  -v, --version    Show version\n\n"
              << "Lines read from stdin are commands (/help) or chat turns.\n";
}

void print_version() {
    std::cout << AppInfo::NAME << " v" << AppInfo::VERSION << "\n";
}

void signal_handler(int sig) {
    (void)sig;
    Application::instance().stop();
}

} // anonymous namespace

// ============================================================================
// Application Implementation
// ============================================================================

Application& Application::instance() {
    static Application app;
    return app;
}

Application::Application()
    : running_(true)
    , config_file_("config.json") {}

bool Application::parse_args(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            running_ = false;
            return false;
        }
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            print_version();
            running_ = false;
            return false;
        }
        if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_file_ = std::string(argv[++i]);
            continue;
        }
        LOG_WARN("Ignoring unknown argument: %s", argv[i]);
    }
    return true;
}

void Application::setup_logging() {
    Logger::instance().set_level(parse_log_level(config_.get_string("log_level", "info")));
}

bool Application::init(int argc, char* argv[]) {
    if (!parse_args(argc, argv)) {
        return false;
    }

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    LOG_INFO("%s v%s starting...", AppInfo::NAME, AppInfo::VERSION);

    if (access(config_file_.c_str(), R_OK) == 0) {
        if (!config_.load(config_file_)) {
            LOG_ERROR("Failed to load config from %s: %s", config_file_.c_str(), config_.last_error().c_str());
            return false;
        }
        LOG_INFO("Loaded config from %s", config_file_.c_str());
    } else {
        LOG_WARN("No config at %s, using defaults", config_file_.c_str());
    }

    setup_logging();

    if (!runtime_.init(config_)) {
        LOG_ERROR("Runtime initialization failed: %s", runtime_.last_error().c_str());
        return false;
    }

    // Inference runs outside this process; chat turns report that no backend is attached
    dispatcher_.reset(new CommandDispatcher(runtime_, nullptr));
    register_core_commands(*dispatcher_);
    return true;
}

int Application::run() {
    LOG_INFO("Reading commands from stdin (/help for a list)");

    std::string line;
    while (running_.load() && std::getline(std::cin, line)) {
        std::string reply = dispatcher_->dispatch(line);
        if (!reply.empty()) {
            std::cout << reply << std::endl;
        }
    }
    return 0;
}

void Application::shutdown() {
    LOG_INFO("Shutting down...");
    runtime_.shutdown();
    LOG_INFO("Goodbye!");
}

} // namespace primus
