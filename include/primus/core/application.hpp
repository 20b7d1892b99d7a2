/*
 * Primus C++ - Application
 *
 * Process lifecycle for the line-oriented front end: argument parsing,
 * configuration, logging setup, runtime initialisation and the stdin loop.
 */
#ifndef primus_CORE_APPLICATION_HPP
#define primus_CORE_APPLICATION_HPP

#include <primus/core/config.hpp>
#include <primus/core/runtime.hpp>
#include <primus/core/commands.hpp>
#include <atomic>
#include <memory>
#include <string>

namespace primus {

struct AppInfo {
    static constexpr const char* NAME = "Primus";
    static constexpr const char* VERSION = "0.3.0";
};

class Application {
public:
    static Application& instance();

    // False for --help/--version or on a fatal error (see is_running)
    bool init(int argc, char* argv[]);
    int run();
    void shutdown();

    void stop() { running_ = false; }
    bool is_running() const { return running_.load(); }

    Runtime& runtime() { return runtime_; }
    const Config& config() const { return config_; }

private:
    Application();
    Application(const Application&);
    Application& operator=(const Application&);

    bool parse_args(int argc, char* argv[]);
    void setup_logging();

    std::atomic<bool> running_;
    std::string config_file_;
    Config config_;
    Runtime runtime_;
    std::unique_ptr<CommandDispatcher> dispatcher_;
};

} // namespace primus

#endif // primus_CORE_APPLICATION_HPP
