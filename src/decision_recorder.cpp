#include "decision_recorder.h"
#include "core/constants.h"
#include "logger.h"
#include <fstream>
#include <sstream>
#include <iomanip>
#include <ctime>
#include <deque>
#include <filesystem>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace interrupt_filter {

class DecisionRecorder::Impl {
public:
    Impl(const std::string& session_dir, size_t max_events)
        : session_dir_(session_dir), max_events_(max_events), session_started_(false) {}

    ~Impl() {
        if (session_started_) {
            auto r = finalize_session();
            if (!r) {
                Logger::warn("[Recorder] " + r.error().message);
            }
        }
    }

    Result<void> start_session() {
        std::lock_guard<std::mutex> lock(mutex_);

        // Session ID from local start time
        auto now = std::time(nullptr);
        std::tm local_tm{};
        localtime_r(&now, &local_tm);
        std::stringstream ss;
        ss << std::put_time(&local_tm, "%Y%m%d_%H%M%S");
        std::string base_id = ss.str();

        std::error_code ec;
        std::string id = base_id;
        for (int suffix = 2; fs::exists(fs::path(session_dir_) / id, ec); ++suffix) {
            id = base_id + "_" + std::to_string(suffix);
        }

        fs::create_directories(fs::path(session_dir_) / id, ec);
        if (ec) {
            return make_io_error("Cannot create session directory " +
                                 (fs::path(session_dir_) / id).string() + ": " + ec.message());
        }

        session_id_ = id;
        session_started_ = true;
        events_.clear();
        dropped_ = 0;
        metadata_.clear();
        session_start_time_ = Clock::now();
        LOG_SESSION("Recording decisions to " + get_session_path());
        return {};
    }

    void set_session_metadata(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!session_started_) return;
        metadata_[key] = value;
    }

    void record_decision(const std::string& transcript, bool agent_speaking,
                         const ClassificationResult& result) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!session_started_) return;

        DecisionEvent event;
        event.timestamp_ms = ms_since(session_start_time_);
        event.event_type = "decision";
        event.data = transcript;
        event.agent_speaking = agent_speaking;
        event.action = action_to_string(result.action);
        event.reason = result.reason;
        push_event(std::move(event));
    }

    void record_event(const std::string& event_type, const std::string& data) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!session_started_) return;

        DecisionEvent event;
        event.timestamp_ms = ms_since(session_start_time_);
        event.event_type = event_type;
        event.data = data;
        push_event(std::move(event));
    }

    Result<void> finalize_session() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!session_started_) return {};
        session_started_ = false;

        std::string log_filename = get_session_path() + "/" + constants::recording::SESSION_LOG_FILENAME;
        return write_session_log(log_filename);
    }

    bool is_active() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return session_started_;
    }

    size_t event_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_.size();
    }

    size_t dropped_event_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return dropped_;
    }

    std::string get_session_id() const {
        return session_id_;
    }

    std::string get_session_path() const {
        return session_dir_ + "/" + session_id_;
    }

private:
    // Caller holds mutex_
    void push_event(DecisionEvent event) {
        if (max_events_ > 0 && events_.size() >= max_events_) {
            if (dropped_ == 0) {
                Logger::warn("[Recorder] Event buffer full (" + std::to_string(max_events_) +
                             "), dropping oldest events");
            }
            events_.pop_front();
            dropped_++;
        }
        events_.push_back(std::move(event));
    }

    Result<void> write_session_log(const std::string& path) const {
        json log;
        log["session_id"] = session_id_;
        log["dropped_events"] = dropped_;
        log["metadata"] = json::object();
        for (const auto& [key, value] : metadata_) {
            log["metadata"][key] = value;
        }

        json events = json::array();
        for (const auto& e : events_) {
            json entry = {
                {"timestamp_ms", e.timestamp_ms},
                {"event_type", e.event_type},
                {"data", e.data}
            };
            if (e.event_type == "decision") {
                entry["agent_speaking"] = e.agent_speaking;
                entry["action"] = e.action;
                entry["reason"] = e.reason;
            }
            events.push_back(std::move(entry));
        }
        log["events"] = std::move(events);

        std::ofstream file(path);
        if (!file.is_open()) {
            return make_io_error("Cannot open session log for writing: " + path);
        }
        // Transcripts may carry invalid UTF-8 from STT; replace rather than throw
        file << log.dump(2, ' ', false, json::error_handler_t::replace) << "\n";
        if (!file) {
            return make_io_error("Failed writing session log: " + path);
        }
        return {};
    }

    mutable std::mutex mutex_;
    std::string session_dir_;
    std::string session_id_;
    size_t max_events_;
    bool session_started_;
    std::deque<DecisionEvent> events_;
    size_t dropped_ = 0;
    std::map<std::string, std::string> metadata_;
    TimePoint session_start_time_;
};

DecisionRecorder::DecisionRecorder(const std::string& session_dir, size_t max_events)
    : pimpl_(std::make_unique<Impl>(session_dir, max_events)) {}

DecisionRecorder::~DecisionRecorder() = default;

Result<void> DecisionRecorder::start_session() {
    return pimpl_->start_session();
}

void DecisionRecorder::set_session_metadata(const std::string& key, const std::string& value) {
    pimpl_->set_session_metadata(key, value);
}

void DecisionRecorder::record_decision(const std::string& transcript, bool agent_speaking,
                                       const ClassificationResult& result) {
    pimpl_->record_decision(transcript, agent_speaking, result);
}

void DecisionRecorder::record_event(const std::string& event_type, const std::string& data) {
    pimpl_->record_event(event_type, data);
}

Result<void> DecisionRecorder::finalize_session() {
    return pimpl_->finalize_session();
}

bool DecisionRecorder::is_active() const {
    return pimpl_->is_active();
}

size_t DecisionRecorder::event_count() const {
    return pimpl_->event_count();
}

size_t DecisionRecorder::dropped_event_count() const {
    return pimpl_->dropped_event_count();
}

std::string DecisionRecorder::get_session_id() const {
    return pimpl_->get_session_id();
}

std::string DecisionRecorder::get_session_path() const {
    return pimpl_->get_session_path();
}

} // namespace interrupt_filter
