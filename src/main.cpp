#include "config.h"
#include "decision_recorder.h"
#include "interruption_classifier.h"
#include "interruption_session.h"
#include "logger.h"
#include "scenarios.h"
#include "stop_signal.h"
#include "utils.h"
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <unistd.h>

namespace interrupt_filter {

static void print_usage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [--config PATH] [--show-config] [--check]\n"
              << "\n"
              << "Reads transcripts from stdin, one per line, and prints ACTION<TAB>reason.\n"
              << "  :speak    agent starts speaking\n"
              << "  :silent   agent stops speaking\n"
              << "  :stats    print decision counts\n"
              << "  :quit     exit\n";
}

/// Config directory next to the executable (build/../config), if it has filter.json
static std::string default_config_path() {
    char buf[1024];
    ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len == -1) return "";
    buf[len] = '\0';
    std::string exe_dir(buf);
    size_t pos = exe_dir.find_last_of('/');
    if (pos == std::string::npos) return "";
    std::string config_dir = exe_dir.substr(0, pos) + "/../config";
    std::ifstream test(config_dir + "/filter.json");
    return test.good() ? config_dir : "";
}

static void apply_logging(const Config& config) {
    LogLevel level = Logger::parse_level(config.logging.level);
    if (!config.logging.file.empty()) {
        Logger::shutdown();
        Logger::initialize(level, config.logging.file);
    } else {
        Logger::set_level(level);
    }
}

static void show_config(const Config& config) {
    std::cout << config.to_json().dump(2) << "\n";
    for (const auto& phrase : config.lexicon.overlapping_phrases()) {
        std::cout << "warning: \"" << phrase << "\" is in both ignore and interrupt lists\n";
    }
}

static int run_interactive(const Config& config) {
    std::unique_ptr<DecisionRecorder> recorder;
    if (config.recording.enabled) {
        recorder = std::make_unique<DecisionRecorder>(config.recording.session_log_dir,
                                                      config.recording.max_events);
        auto started = recorder->start_session();
        if (!started) {
            Logger::error("Decision recording disabled: " + started.error().message);
            recorder.reset();
        } else {
            recorder->set_session_metadata("config", config.source_path.empty() ? "defaults" : config.source_path);
            recorder->set_session_metadata("debounce_ms", std::to_string(config.lexicon.debounce_window().count()));
        }
    }

    InterruptionSession session(config.lexicon, recorder.get());
    LOG_FILTER("Session " + session.id() + " ready; agent silent. Type :speak to start agent speech.");

    std::string line;
    while (!stop_requested() && std::getline(std::cin, line)) {
        std::string command = utils::trim_copy(line);
        if (command == ":quit") break;
        if (command == ":speak") {
            session.on_agent_speech_started();
            std::cout << "# agent speaking" << std::endl;
            continue;
        }
        if (command == ":silent") {
            session.on_agent_speech_finished();
            std::cout << "# agent silent" << std::endl;
            continue;
        }
        if (command == ":stats") {
            SessionStats s = session.stats();
            std::cout << "# swallowed=" << s.swallowed << " responded=" << s.responded
                      << " interrupted=" << s.interrupted << " total=" << s.total() << std::endl;
            continue;
        }

        ClassificationResult result = session.on_transcript(line);
        std::cout << action_to_string(result.action) << "\t" << result.reason << std::endl;
    }
    if (stop_requested()) {
        // getline failed with EINTR
        std::cin.clear();
        LOG_FILTER("Stop requested, shutting down");
    }

    SessionStats s = session.stats();
    LOG_FILTER("Session " + session.id() + " finished: " + std::to_string(s.total()) + " decisions (" +
               std::to_string(s.interrupted) + " interrupts, " + std::to_string(s.swallowed) + " swallowed)");

    if (recorder) {
        auto written = recorder->finalize_session();
        if (!written) {
            Logger::error(written.error().message);
            return 1;
        }
        LOG_FILTER("Decision log written to " + recorder->get_session_path());
    }
    return 0;
}

} // namespace interrupt_filter

int main(int argc, char* argv[]) {
    using namespace interrupt_filter;

    Logger::initialize(LogLevel::INFO);

    std::string config_path;
    bool want_show_config = false;
    bool want_check = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            Logger::shutdown();
            return 0;
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--show-config") {
            want_show_config = true;
        } else if (arg == "--check") {
            want_check = true;
        } else if (!arg.empty() && arg[0] != '-' && config_path.empty()) {
            config_path = arg;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage(argv[0]);
            Logger::shutdown();
            return 2;
        }
    }

    if (config_path.empty()) {
        config_path = default_config_path();
    }
    Config config = config_path.empty() ? Config() : Config::load_from_file(config_path);
    apply_logging(config);

    int result = 0;
    if (want_show_config) {
        show_config(config);
    } else if (want_check) {
        InterruptionClassifier classifier(config.lexicon);
        int failed = run_scenarios(classifier, builtin_scenarios(), std::cout);
        result = failed == 0 ? 0 : 1;
    } else {
        auto handlers = install_stop_handlers();
        if (!handlers) {
            Logger::warn("Ctrl-C will not stop the session cleanly: " + handlers.error().message);
        }
        result = run_interactive(config);
    }

    Logger::shutdown();
    return result;
}
