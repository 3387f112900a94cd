#include <gtest/gtest.h>

#include "persistence/csv_response_recorder.hpp"
#include "persistence/summary_writer.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

// =============================================================================
// Test Fixture with Temporary Directory
// =============================================================================

class PersistenceTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Create unique temp directory for each test
        test_dir_ = fs::temp_directory_path() /
                    ("order_gateway_test_" + std::to_string(test_counter_++));
        fs::create_directories(test_dir_);
    }

    void TearDown() override {
        if (fs::exists(test_dir_)) {
            fs::remove_all(test_dir_);
        }
    }

    fs::path test_dir_;
    static inline int test_counter_ = 0;

    std::string read_file(const fs::path& path) {
        std::ifstream file(path);
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    // Lines in a file, excluding the header
    size_t count_data_lines(const fs::path& path) {
        std::ifstream file(path);
        size_t count = 0;
        std::string line;
        while (std::getline(file, line)) {
            ++count;
        }
        return count > 0 ? count - 1 : 0;
    }
};

// =============================================================================
// CSVResponseRecorder
// =============================================================================

TEST_F(PersistenceTest, RecorderCreatesFilesWithHeaders) {
    CSVResponseRecorder recorder(test_dir_);

    EXPECT_TRUE(fs::exists(test_dir_ / "responses.csv"));
    EXPECT_TRUE(fs::exists(test_dir_ / "sessions.csv"));
    EXPECT_EQ(read_file(test_dir_ / "responses.csv"), "timestamp,order_id,verdict,latency_us\n");
    EXPECT_EQ(read_file(test_dir_ / "sessions.csv"), "timestamp,event,username\n");
}

TEST_F(PersistenceTest, RecorderCreatesMissingOutputDirectory) {
    fs::path nested = test_dir_ / "a" / "b";
    CSVResponseRecorder recorder(nested);
    EXPECT_TRUE(fs::exists(nested / "responses.csv"));
}

TEST_F(PersistenceTest, RecorderWritesResponse) {
    CSVResponseRecorder recorder(test_dir_);
    recorder.record(ResponseRecord{.order_id = OrderID{42},
                                   .verdict = Verdict::ACCEPT,
                                   .latency = Timestamp{51'234},
                                   .timestamp = Timestamp{1'700'000'000'000'000}});

    // Visible without an explicit flush.
    std::string content = read_file(test_dir_ / "responses.csv");
    EXPECT_NE(content.find("1700000000000000,42,ACCEPT,51234"), std::string::npos);
}

TEST_F(PersistenceTest, RecorderWritesSessionEvents) {
    CSVResponseRecorder recorder(test_dir_);
    recorder.record_session_event(SessionEvent{
        .type = SessionEventType::LOGON, .username = "trader1", .timestamp = Timestamp{100}});
    recorder.record_session_event(SessionEvent{
        .type = SessionEventType::LOGOUT, .username = "trader1", .timestamp = Timestamp{200}});

    std::string content = read_file(test_dir_ / "sessions.csv");
    EXPECT_NE(content.find("100,LOGON,trader1"), std::string::npos);
    EXPECT_NE(content.find("200,LOGOUT,trader1"), std::string::npos);
    EXPECT_EQ(count_data_lines(test_dir_ / "sessions.csv"), 2);
}

TEST_F(PersistenceTest, RecorderHandlesConcurrentWriters) {
    {
        CSVResponseRecorder recorder(test_dir_);
        std::vector<std::thread> threads;
        for (std::uint64_t t = 0; t < 4; ++t) {
            threads.emplace_back([&recorder, t] {
                for (std::uint64_t i = 0; i < 50; ++i) {
                    recorder.record(ResponseRecord{.order_id = OrderID{t * 1000 + i},
                                                   .verdict = Verdict::REJECT,
                                                   .latency = Timestamp{1},
                                                   .timestamp = Timestamp{i}});
                }
            });
        }
        for (auto& th : threads) {
            th.join();
        }
    }

    EXPECT_EQ(count_data_lines(test_dir_ / "responses.csv"), 200);

    std::ifstream file(test_dir_ / "responses.csv");
    std::string line;
    std::getline(file, line);
    while (std::getline(file, line)) {
        EXPECT_NE(line.find(",REJECT,1"), std::string::npos) << line;
    }
}

TEST_F(PersistenceTest, RecorderThrowsOnInvalidDirectory) {
    fs::path blocker = test_dir_ / "not_a_dir";
    std::ofstream(blocker) << "x";
    EXPECT_THROW(CSVResponseRecorder recorder(blocker), std::exception);
}

// =============================================================================
// SummaryWriter
// =============================================================================

TEST_F(PersistenceTest, ConfigJsonOmitsPassword) {
    GatewayConfig config;
    config.credentials = Credentials{.username = "trader1", .password = "hunter2"};
    config.session.window = SessionWindow{.open = make_time_of_day(9, 15, 0),
                                          .close = make_time_of_day(15, 30, 0)};
    config.throttle.max_orders_per_second = 3;

    nlohmann::json j = to_json(config);

    EXPECT_EQ(j["username"], "trader1");
    EXPECT_EQ(j["session"]["open"], "09:15:00");
    EXPECT_EQ(j["session"]["close"], "15:30:00");
    EXPECT_EQ(j["throttle"]["max_orders_per_second"], 3);
    EXPECT_EQ(j.dump().find("hunter2"), std::string::npos);
}

TEST_F(PersistenceTest, SummaryWriterWritesConfigAndStats) {
    GatewayConfig config;
    config.credentials.username = "trader1";
    config.throttle.max_orders_per_second = 3;

    GatewayStats stats{.submitted = 10,
                       .sent = 7,
                       .queued = 4,
                       .rejected = 3,
                       .modified = 2,
                       .cancelled = 1,
                       .ignored = 5,
                       .still_queued = 0};

    SummaryWriter writer;
    writer.set_config(config);
    writer.set_stats(stats);
    writer.set_run_window(Timestamp{0}, Timestamp{MICROS_PER_SECOND});
    writer.write(test_dir_);

    ASSERT_TRUE(fs::exists(test_dir_ / "summary.json"));
    auto j = nlohmann::json::parse(read_file(test_dir_ / "summary.json"));

    EXPECT_EQ(j["config"]["username"], "trader1");
    EXPECT_EQ(j["stats"]["submitted"], 10);
    EXPECT_EQ(j["stats"]["sent"], 7);
    EXPECT_EQ(j["stats"]["rejected"], 3);
    EXPECT_EQ(j["stats"]["ignored"], 5);
    EXPECT_TRUE(j.contains("run"));
    EXPECT_TRUE(j["run"].contains("started_at"));
}

TEST_F(PersistenceTest, SummaryWriterOmitsRunWindowWhenUnset) {
    SummaryWriter writer;
    writer.set_stats(GatewayStats{});
    writer.write(test_dir_);

    auto j = nlohmann::json::parse(read_file(test_dir_ / "summary.json"));
    EXPECT_FALSE(j.contains("run"));
    EXPECT_EQ(j["stats"]["still_queued"], 0);
}
