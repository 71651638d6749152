/**
 * @file event_emitter_test.cpp
 * @brief Unit tests for the built-in event emitters
 */

#include <jobq/queue/event_emitter.hpp>

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

using namespace jobq;
using namespace jobq::queue;

// =============================================================================
// Mock Logger for Testing
// =============================================================================

namespace {

class MockLogger final : public di::ILogger {
public:
    void trace(std::string_view) override {}
    void debug(std::string_view message) override { record("DEBUG", message); }
    void info(std::string_view message) override { record("INFO", message); }
    void warn(std::string_view message) override { record("WARN", message); }
    void error(std::string_view message) override { record("ERROR", message); }
    void fatal(std::string_view) override {}

    [[nodiscard]] bool is_enabled(integration::log_level) const noexcept override {
        return true;
    }

    [[nodiscard]] std::vector<std::string> lines() const {
        std::lock_guard lock(mutex_);
        return lines_;
    }

private:
    void record(const char* level, std::string_view message) {
        std::lock_guard lock(mutex_);
        lines_.push_back(std::string(level) + " " + std::string(message));
    }

    mutable std::mutex mutex_;
    std::vector<std::string> lines_;
};

}  // namespace

TEST_CASE("logging_event_emitter writes one line per event", "[queue][events]") {
    auto logger = std::make_shared<MockLogger>();
    logging_event_emitter emitter(logger);

    emitter.on_job_started("a");
    emitter.on_job_progress("a", 3, 8);
    emitter.on_job_completed("a", std::string("xyz"));
    emitter.on_job_failed("b", "disk full");
    emitter.on_job_cancelled("c");

    auto lines = logger->lines();
    REQUIRE(lines.size() == 5);
    CHECK(lines[0] == "INFO job-started id=a");
    CHECK(lines[1] == "DEBUG job-progress id=a 3/8");
    CHECK(lines[2] == "INFO job-completed id=a output_bytes=3");
    CHECK(lines[3] == "WARN job-failed id=b error=disk full");
    CHECK(lines[4] == "INFO job-cancelled id=c");
}

TEST_CASE("logging_event_emitter without logger is silent", "[queue][events]") {
    logging_event_emitter emitter;
    emitter.on_job_started("a");
    emitter.on_job_completed("a", std::nullopt);
    SUCCEED();
}

TEST_CASE("null_emitter is shared", "[queue][events]") {
    auto first = null_emitter();
    auto second = null_emitter();
    REQUIRE(first != nullptr);
    CHECK(first == second);
    first->on_job_failed("a", "ignored");
}
