/**
 * Tests for the word lists and configuration loading.
 * Asserts:
 * - Default lists answer membership queries in canonical form.
 * - Phrase canonicalization follows the stop-word set.
 * - JSON lexicons override per section and reject malformed input.
 * - Config files fall back to defaults on missing/bad input.
 *
 * Run from build dir: ./test_lexicon_config
 */

#include "config.h"
#include "lexicon.h"
#include "logger.h"
#include "path_utils.h"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <unistd.h>
#include <nlohmann/json.hpp>

using namespace interrupt_filter;
using json = nlohmann::json;
namespace fs = std::filesystem;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static void write_file(const fs::path& path, const std::string& contents) {
    std::ofstream f(path);
    f << contents;
}

int main() {
    Logger::initialize(LogLevel::ERROR);

    // --- Default lexicon ---
    const Lexicon& lex = Lexicon::defaults();
    ASSERT(lex.is_ignore_phrase("yeah"));
    ASSERT(lex.is_ignore_phrase("uh-huh"));
    ASSERT(lex.is_ignore_phrase("sounds good"));
    ASSERT(lex.is_interrupt_phrase("stop"));
    ASSERT(lex.is_interrupt_phrase("never mind"));
    ASSERT(lex.is_interrupt_phrase("don't say that"));
    ASSERT(lex.is_interrupt_phrase("just sec"));
    // Raw list entries match as written
    ASSERT(lex.is_interrupt_phrase("just a sec"));
    ASSERT(lex.is_interrupt_phrase("hold on"));
    ASSERT(lex.is_interrupt_phrase("Hold on!"));
    ASSERT(lex.is_ignore_phrase("Got it."));
    ASSERT(lex.is_acceptable("Kind of"));
    ASSERT(!lex.is_ignore_phrase("the"));
    ASSERT(lex.is_filler_phrase("you know"));
    ASSERT(lex.is_filler_phrase("literally"));
    ASSERT(!lex.is_filler_phrase("yeah"));
    ASSERT(lex.is_stop_word("the"));
    ASSERT(lex.is_stop_word("at"));
    ASSERT(lex.is_stop_word("The"));
    ASSERT(!lex.is_stop_word("yeah"));
    ASSERT(lex.is_acceptable("kind of"));
    ASSERT(lex.is_acceptable("okay"));
    ASSERT(!lex.is_acceptable("stop"));
    ASSERT(!lex.is_acceptable("banana"));
    ASSERT(!lex.is_ignore_phrase(""));
    ASSERT(lex.max_phrase_words() == 3);
    ASSERT(lex.overlapping_phrases().empty());
    ASSERT(lex.debounce_window() == Duration(150));
    ASSERT(lex.stop_words().size() == 7);
    ASSERT(lex.canonicalize("Just A Sec!") == "just sec");
    ASSERT(lex.canonicalize("  The  ") == "");

    // --- Construction rules ---
    Lexicon overlap({"yeah", "wait"}, {"wait"}, {}, {});
    ASSERT(overlap.overlapping_phrases().size() == 1);
    ASSERT(overlap.is_ignore_phrase("wait") && overlap.is_interrupt_phrase("wait"));

    Lexicon too_long({"one two three four", "one two"}, {}, {}, {});
    ASSERT(too_long.ignore_phrases().size() == 1);
    ASSERT(too_long.max_phrase_words() == 2);

    Lexicon stop_only({"the", "The end"}, {}, {}, {"the"});
    ASSERT(stop_only.ignore_phrases().size() == 1);
    ASSERT(stop_only.is_ignore_phrase("end"));

    Lexicon empty_lists({}, {}, {}, {});
    ASSERT(empty_lists.max_phrase_words() == 1);
    ASSERT(!empty_lists.is_acceptable("yeah"));

    // --- from_json ---
    auto only_interrupt = Lexicon::from_json(json{{"interrupt_phrases", {"halt", "Break Break"}}});
    ASSERT(only_interrupt.is_ok());
    if (only_interrupt) {
        const Lexicon& l = only_interrupt.value();
        ASSERT(l.is_interrupt_phrase("halt"));
        ASSERT(l.is_interrupt_phrase("break break"));
        ASSERT(!l.is_interrupt_phrase("stop"));
        ASSERT(l.is_ignore_phrase("yeah"));  // untouched sections come from base
        ASSERT(l.debounce_window() == Duration(150));
    }

    // Changing stop words re-canonicalizes the inherited phrases
    auto no_stop_words = Lexicon::from_json(json{{"stop_words", json::array()}});
    ASSERT(no_stop_words.is_ok());
    if (no_stop_words) {
        ASSERT(no_stop_words.value().is_interrupt_phrase("just a sec"));
        ASSERT(no_stop_words.value().is_interrupt_phrase("hold on"));
        ASSERT(!no_stop_words.value().is_stop_word("the"));
    }

    auto slower = Lexicon::from_json(json{{"debounce_ms", 300}});
    ASSERT(slower.is_ok() && slower.value().debounce_window() == Duration(300));

    auto not_object = Lexicon::from_json(json::array({"yeah"}));
    ASSERT(not_object.is_error() && not_object.error().type == ErrorType::ParseError);

    auto not_array = Lexicon::from_json(json{{"ignore_phrases", "yeah"}});
    ASSERT(not_array.is_error() && not_array.error().type == ErrorType::ParseError);

    auto bad_entry = Lexicon::from_json(json{{"filler_phrases", {"so", 3}}});
    ASSERT(bad_entry.is_error() && bad_entry.error().type == ErrorType::ParseError);

    auto negative = Lexicon::from_json(json{{"debounce_ms", -5}});
    ASSERT(negative.is_error() && negative.error().type == ErrorType::InvalidConfig);

    auto text_debounce = Lexicon::from_json(json{{"debounce_ms", "fast"}});
    ASSERT(text_debounce.is_error() && text_debounce.error().type == ErrorType::ParseError);

    bool threw = false;
    try {
        (void)negative.value();
    } catch (const std::runtime_error&) {
        threw = true;
    }
    ASSERT(threw);

    // --- Path helpers ---
    ASSERT(resolve_relative("/etc/filter", "lexicon.json") == "/etc/filter/lexicon.json");
    ASSERT(resolve_relative("/etc/filter/", "lexicon.json") == "/etc/filter/lexicon.json");
    ASSERT(resolve_relative("/etc/filter", "/abs/lexicon.json") == "/abs/lexicon.json");
    ASSERT(resolve_relative("", "lexicon.json") == "lexicon.json");
    ASSERT(parent_dir("/etc/filter/filter.json") == "/etc/filter");
    ASSERT(parent_dir("filter.json") == "");
    ASSERT(parent_dir("/filter.json") == "/");

    // --- Logger level parsing ---
    ASSERT(Logger::parse_level("DEBUG") == LogLevel::DEBUG);
    ASSERT(Logger::parse_level(" warning ") == LogLevel::WARN);
    ASSERT(Logger::parse_level("error") == LogLevel::ERROR);
    ASSERT(Logger::parse_level("loud", LogLevel::INFO) == LogLevel::INFO);

    // --- Config::apply_json ---
    {
        Config cfg;
        json j = {
            {"logging", {{"level", "debug"}, {"file", "filter.log"}}},
            {"recording", {{"enabled", true}, {"session_log_dir", "logs"}, {"max_events", 500}}},
            {"lexicon", {{"ignore_phrases", {"roger"}}, {"debounce_ms", 200}}}
        };
        auto status = Config::apply_json(cfg, j, "/etc/filter");
        ASSERT(status.is_ok());
        ASSERT(cfg.logging.level == "debug");
        ASSERT(cfg.logging.file == "/etc/filter/filter.log");
        ASSERT(cfg.recording.enabled);
        ASSERT(cfg.recording.session_log_dir == "/etc/filter/logs");
        ASSERT(cfg.recording.max_events == 500);
        ASSERT(cfg.lexicon.is_ignore_phrase("roger"));
        ASSERT(!cfg.lexicon.is_ignore_phrase("yeah"));
        ASSERT(cfg.lexicon.debounce_window() == Duration(200));

        json dumped = cfg.to_json();
        ASSERT(dumped["lexicon"]["debounce_ms"] == 200);
        ASSERT(dumped["lexicon"]["ignore_phrases"].size() == 1);
        ASSERT(dumped["recording"]["enabled"] == true);
        ASSERT(dumped["recording"]["max_events"] == 500);
    }
    {
        // Malformed lexicon: error reported, other sections still applied, lexicon untouched
        Config cfg;
        json j = {
            {"logging", {{"level", "warn"}}},
            {"lexicon", {{"interrupt_phrases", 42}}}
        };
        auto status = Config::apply_json(cfg, j);
        ASSERT(status.is_error());
        ASSERT(cfg.logging.level == "warn");
        ASSERT(cfg.lexicon.is_interrupt_phrase("stop"));
    }

    // --- Config::load_from_file ---
    fs::path dir = fs::temp_directory_path() / ("interrupt_filter_cfg_" + std::to_string(getpid()));
    fs::create_directories(dir);

    {
        Config missing = Config::load_from_file((dir / "nope.json").string());
        ASSERT(missing.source_path.empty());
        ASSERT(missing.lexicon.is_interrupt_phrase("stop"));
    }
    {
        write_file(dir / "broken.json", "{ \"lexicon\": ");
        Config broken = Config::load_from_file((dir / "broken.json").string());
        ASSERT(broken.source_path.empty());
        ASSERT(broken.lexicon.is_ignore_phrase("yeah"));
    }
    {
        write_file(dir / "words.json", R"({"interrupt_phrases": ["halt"], "debounce_ms": 250})");
        write_file(dir / "filter.json", R"({
            "lexicon": {"ignore_phrases": ["roger", "copy that"]},
            "lexicon_file": "words.json",
            "recording": {"enabled": true, "session_log_dir": "sessions"}
        })");

        // Directory path resolves to filter.json inside it
        Config cfg = Config::load_from_file(dir.string());
        ASSERT(cfg.source_path == (dir / "filter.json").string());
        ASSERT(cfg.lexicon.is_ignore_phrase("roger"));
        ASSERT(cfg.lexicon.is_ignore_phrase("copy that"));
        ASSERT(cfg.lexicon.is_interrupt_phrase("halt"));
        ASSERT(!cfg.lexicon.is_interrupt_phrase("stop"));
        ASSERT(cfg.lexicon.debounce_window() == Duration(250));
        ASSERT(cfg.recording.enabled);
        ASSERT(cfg.recording.session_log_dir == (dir / "sessions").string());
    }
    {
        write_file(dir / "dangling.json", R"({"lexicon_file": "missing_words.json"})");
        Config cfg = Config::load_from_file((dir / "dangling.json").string());
        ASSERT(!cfg.source_path.empty());
        ASSERT(cfg.lexicon.is_interrupt_phrase("stop"));
    }

    std::error_code ec;
    fs::remove_all(dir, ec);

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All lexicon/config tests passed.\n";
    return 0;
}
