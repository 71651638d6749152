/**
 * @file job_types_test.cpp
 * @brief Unit tests for job value types and the status state machine
 */

#include <jobq/queue/job_types.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace jobq::queue;

TEST_CASE("job_status string conversion", "[queue][types]") {
    for (auto status : {job_status::queued, job_status::running, job_status::completed,
                        job_status::failed, job_status::cancelled}) {
        auto parsed = job_status_from_string(to_string(status));
        REQUIRE(parsed.has_value());
        CHECK(*parsed == status);
    }

    CHECK_FALSE(job_status_from_string("paused").has_value());
    CHECK_FALSE(job_status_from_string("").has_value());
}

TEST_CASE("job_status state machine", "[queue][types]") {
    SECTION("queued may start or be cancelled") {
        CHECK(is_valid_transition(job_status::queued, job_status::running));
        CHECK(is_valid_transition(job_status::queued, job_status::cancelled));
        CHECK_FALSE(is_valid_transition(job_status::queued, job_status::completed));
        CHECK_FALSE(is_valid_transition(job_status::queued, job_status::failed));
    }

    SECTION("running finishes or is recovered to queued") {
        CHECK(is_valid_transition(job_status::running, job_status::completed));
        CHECK(is_valid_transition(job_status::running, job_status::failed));
        CHECK(is_valid_transition(job_status::running, job_status::cancelled));
        CHECK(is_valid_transition(job_status::running, job_status::queued));
    }

    SECTION("terminal states are final") {
        for (auto from : {job_status::completed, job_status::failed, job_status::cancelled}) {
            CHECK(is_terminal_status(from));
            for (auto to : {job_status::queued, job_status::running, job_status::completed,
                            job_status::failed, job_status::cancelled}) {
                CHECK_FALSE(is_valid_transition(from, to));
            }
        }
        CHECK_FALSE(is_terminal_status(job_status::queued));
        CHECK_FALSE(is_terminal_status(job_status::running));
    }
}

TEST_CASE("job_priority conversion", "[queue][types]") {
    CHECK(std::string(to_string(job_priority::high)) == "high");
    CHECK(job_priority_from_string("low") == job_priority::low);
    CHECK(job_priority_from_string("bogus") == job_priority::normal);

    CHECK(job_priority_from_int(-3) == job_priority::low);
    CHECK(job_priority_from_int(1) == job_priority::normal);
    CHECK(job_priority_from_int(7) == job_priority::high);

    CHECK(static_cast<int>(job_priority::low) < static_cast<int>(job_priority::normal));
    CHECK(static_cast<int>(job_priority::normal) < static_cast<int>(job_priority::high));
}

TEST_CASE("job_progress percent", "[queue][types]") {
    CHECK(job_progress{}.percent() == 0.0);
    CHECK(job_progress{5, 10}.percent() == 50.0);
    CHECK(job_progress{12, 10}.percent() == 100.0);
}

TEST_CASE("job_record helpers", "[queue][types]") {
    job_record record;
    CHECK(record.can_cancel());
    CHECK(record.can_reorder());
    CHECK_FALSE(record.is_finished());

    record.status = job_status::running;
    CHECK(record.can_cancel());
    CHECK_FALSE(record.can_reorder());

    record.status = job_status::failed;
    record.result = job_result::failure("boom");
    CHECK(record.is_finished());
    CHECK_FALSE(record.can_cancel());
    CHECK(record.result->error_message == "boom");
    CHECK_FALSE(record.result->output.has_value());
}

TEST_CASE("queue_config defaults", "[queue][types]") {
    queue_config config;
    CHECK_FALSE(config.db_path.has_value());
    CHECK(config.cooldown == std::chrono::milliseconds{0});
    CHECK(config.max_consecutive == 0);
    CHECK(config.poll_interval == std::chrono::seconds{3});
    CHECK(config.auto_start);
}
