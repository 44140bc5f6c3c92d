#include "config.h"
#include "logger.h"
#include "path_utils.h"
#include <fstream>
#include <filesystem>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

constexpr const char* DEFAULT_CONFIG_FILENAME = "filter.json";

/// Load a standalone lexicon file (same keys as the inline "lexicon" section) over cfg.lexicon.
interrupt_filter::Result<void> apply_lexicon_file(interrupt_filter::Config& cfg, const std::string& path) {
    std::ifstream lf(path);
    if (!lf.is_open()) {
        return interrupt_filter::make_io_error("Could not open lexicon file " + path);
    }
    json lexicon_j;
    try {
        lf >> lexicon_j;
    } catch (const json::exception& e) {
        return interrupt_filter::make_parse_error("Failed to parse " + path + ": " + e.what());
    }
    auto lexicon = interrupt_filter::Lexicon::from_json(lexicon_j, cfg.lexicon);
    if (!lexicon) {
        return interrupt_filter::make_error(lexicon.error().type, path + ": " + lexicon.error().message);
    }
    cfg.lexicon = lexicon.value();
    return {};
}

} // anonymous namespace

namespace interrupt_filter {

Result<void> Config::apply_json(Config& cfg, const json& j, const std::string& config_dir) {
    Result<void> status;

    // Logging config
    if (j.contains("logging") && j["logging"].is_object()) {
        auto& l = j["logging"];
        if (l.contains("level") && l["level"].is_string()) cfg.logging.level = l["level"].get<std::string>();
        if (l.contains("file") && l["file"].is_string())
            cfg.logging.file = resolve_relative(config_dir, l["file"].get<std::string>());
    }

    // Decision recording
    if (j.contains("recording") && j["recording"].is_object()) {
        auto& r = j["recording"];
        if (r.contains("enabled") && r["enabled"].is_boolean()) cfg.recording.enabled = r["enabled"].get<bool>();
        if (r.contains("session_log_dir") && r["session_log_dir"].is_string())
            cfg.recording.session_log_dir = resolve_relative(config_dir, r["session_log_dir"].get<std::string>());
        if (r.contains("max_events") && r["max_events"].is_number_integer() &&
            r["max_events"].get<int64_t>() >= 0)
            cfg.recording.max_events = r["max_events"].get<size_t>();
    }

    // Inline lexicon, then lexicon_file on top of it
    if (j.contains("lexicon")) {
        auto lexicon = Lexicon::from_json(j["lexicon"], cfg.lexicon);
        if (lexicon) {
            cfg.lexicon = lexicon.value();
        } else {
            status = lexicon.error();
        }
    }
    if (j.contains("lexicon_file")) {
        if (!j["lexicon_file"].is_string()) {
            if (status) status = make_parse_error("lexicon_file must be a string");
        } else {
            auto r = apply_lexicon_file(cfg, resolve_relative(config_dir, j["lexicon_file"].get<std::string>()));
            if (!r && status) status = r.error();
        }
    }

    return status;
}

Config Config::load_from_file(const std::string& path) {
    Config cfg;

    std::string file_path = expand_path(path);
    std::error_code ec;
    if (fs::is_directory(file_path, ec) && !ec) {
        while (!file_path.empty() && file_path.back() == '/') file_path.pop_back();
        file_path += std::string("/") + DEFAULT_CONFIG_FILENAME;
    }

    std::ifstream file(file_path);
    if (!file.is_open()) {
        Logger::warn("Could not open config file: " + file_path + ". Using defaults.");
        return cfg;
    }
    json j;
    try { file >> j; } catch (const json::exception& e) {
        Logger::error("Error parsing config JSON: " + std::string(e.what()));
        return cfg;
    }
    if (!j.is_object()) {
        Logger::error("Config root must be a JSON object: " + file_path);
        return cfg;
    }

    auto status = apply_json(cfg, j, parent_dir(file_path));
    if (!status) {
        Logger::error("Lexicon configuration rejected, keeping previous word lists: " + status.error().message);
    }
    cfg.source_path = file_path;

    LOG_LEXICON("Loaded " + std::to_string(cfg.lexicon.ignore_phrases().size()) + " ignore, " +
                std::to_string(cfg.lexicon.interrupt_phrases().size()) + " interrupt, " +
                std::to_string(cfg.lexicon.filler_phrases().size()) + " filler phrases; debounce " +
                std::to_string(cfg.lexicon.debounce_window().count()) + "ms");
    return cfg;
}

json Config::to_json() const {
    json j;
    j["lexicon"] = {
        {"ignore_phrases", lexicon.ignore_phrases()},
        {"interrupt_phrases", lexicon.interrupt_phrases()},
        {"filler_phrases", lexicon.filler_phrases()},
        {"stop_words", lexicon.stop_words()},
        {"debounce_ms", lexicon.debounce_window().count()}
    };
    j["logging"] = {
        {"level", logging.level},
        {"file", logging.file}
    };
    j["recording"] = {
        {"enabled", recording.enabled},
        {"session_log_dir", recording.session_log_dir},
        {"max_events", recording.max_events}
    };
    return j;
}

} // namespace interrupt_filter
