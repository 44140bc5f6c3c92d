#pragma once

#include "lexicon.h"
#include "errors.h"
#include "core/constants.h"
#include <string>
#include <nlohmann/json.hpp>

namespace interrupt_filter {

struct LoggingConfig {
    std::string level = "info";  ///< "debug" | "info" | "warn" | "error"
    std::string file;            ///< Append log lines here too (empty = console only)
};

/// Per-session decision log (see DecisionRecorder)
struct RecordingConfig {
    bool enabled = false;
    std::string session_log_dir = constants::recording::DEFAULT_SESSION_LOG_DIR;
    size_t max_events = constants::recording::MAX_BUFFERED_EVENTS;  ///< 0 = no limit
};

struct Config {
    Lexicon lexicon = Lexicon::defaults();
    LoggingConfig logging;
    RecordingConfig recording;

    /// Path the config was loaded from (empty when defaults were used)
    std::string source_path;

    /**
     * @brief Load configuration from a JSON file, or from filter.json inside a directory
     *
     * Never fails: a missing or unparsable file yields defaults (logged), and
     * a malformed lexicon section keeps the previous lexicon (logged).
     */
    static Config load_from_file(const std::string& path);

    /**
     * @brief Apply a parsed JSON document onto cfg
     * @param config_dir Directory used to resolve a relative lexicon_file
     * @return First lexicon error encountered (other sections are still applied)
     */
    static Result<void> apply_json(Config& cfg, const nlohmann::json& j, const std::string& config_dir = "");

    /// Effective configuration, canonical phrase lists included
    nlohmann::json to_json() const;
};

} // namespace interrupt_filter
