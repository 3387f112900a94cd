#pragma once

#include "gateway/response_recorder.hpp"
#include "gateway/types.hpp"

#include <filesystem>
#include <fstream>
#include <mutex>
#include <print>
#include <stdexcept>

/**
 * Audit log of exchange responses and session transitions.
 *
 * Writes <output_dir>/responses.csv and <output_dir>/sessions.csv. Each line is
 * flushed as soon as it is written so the log survives an abrupt stop.
 */
class CSVResponseRecorder : public ResponseRecorder {
public:
    explicit CSVResponseRecorder(const std::filesystem::path& output_dir) {
        std::filesystem::create_directories(output_dir);
        responses_file_.open(output_dir / "responses.csv");
        sessions_file_.open(output_dir / "sessions.csv");
        if (!responses_file_.is_open() || !sessions_file_.is_open()) {
            throw std::runtime_error("Failed to open output files in: " + output_dir.string());
        }
        write_headers();
    }

    ~CSVResponseRecorder() override { flush(); }

    CSVResponseRecorder(const CSVResponseRecorder&) = delete;
    CSVResponseRecorder& operator=(const CSVResponseRecorder&) = delete;

    void record(const ResponseRecord& r) override {
        std::lock_guard<std::mutex> lk(mu_);
        std::println(responses_file_, "{},{},{},{}", r.timestamp.value(), r.order_id.value(),
                     verdict_to_string(r.verdict), r.latency.value());
        responses_file_.flush();
    }

    void record_session_event(const SessionEvent& e) override {
        std::lock_guard<std::mutex> lk(mu_);
        std::println(sessions_file_, "{},{},{}", e.timestamp.value(),
                     session_event_to_string(e.type), e.username);
        sessions_file_.flush();
    }

    void flush() {
        std::lock_guard<std::mutex> lk(mu_);
        responses_file_.flush();
        sessions_file_.flush();
    }

private:
    std::mutex mu_;
    std::ofstream responses_file_;
    std::ofstream sessions_file_;

    void write_headers() {
        std::println(responses_file_, "timestamp,order_id,verdict,latency_us");
        std::println(sessions_file_, "timestamp,event,username");
    }
};
