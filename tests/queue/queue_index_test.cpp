/**
 * @file queue_index_test.cpp
 * @brief Unit tests for the priority/FIFO queue index
 */

#include <jobq/queue/queue_index.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <string>
#include <vector>

using namespace jobq::queue;

namespace {

const auto base_time = job_clock::time_point{std::chrono::seconds{1'700'000'000}};

auto make_record(const std::string& id, job_priority priority, int offset_ms,
                 job_status status = job_status::queued) -> job_record {
    job_record record;
    record.job_id = id;
    record.priority = priority;
    record.status = status;
    record.created_at = base_time + std::chrono::milliseconds{offset_ms};
    record.updated_at = record.created_at;
    return record;
}

auto dispatch_order(const queue_index& index) -> std::vector<std::string> {
    std::vector<std::string> ids;
    for (const auto& entry : index.snapshot()) {
        ids.push_back(entry.job_id);
    }
    return ids;
}

}  // namespace

TEST_CASE("queue_index priority then FIFO", "[queue][index]") {
    queue_index index;
    REQUIRE(index.insert(make_record("n1", job_priority::normal, 0)));
    REQUIRE(index.insert(make_record("l1", job_priority::low, 1)));
    REQUIRE(index.insert(make_record("h1", job_priority::high, 2)));
    REQUIRE(index.insert(make_record("n2", job_priority::normal, 3)));
    REQUIRE(index.insert(make_record("h2", job_priority::high, 4)));

    CHECK(index.size() == 5);
    CHECK(index.size(job_priority::high) == 2);
    CHECK(dispatch_order(index) ==
          std::vector<std::string>{"h1", "h2", "n1", "n2", "l1"});

    auto next = index.peek_next();
    REQUIRE(next.has_value());
    CHECK(next->job_id == "h1");

    SECTION("duplicate insert is rejected") {
        CHECK_FALSE(index.insert(make_record("h1", job_priority::low, 9)));
        CHECK(index.size() == 5);
    }

    SECTION("remove") {
        CHECK(index.remove("h1"));
        CHECK_FALSE(index.remove("h1"));
        CHECK_FALSE(index.contains("h1"));
        CHECK(index.peek_next()->job_id == "h2");
    }
}

TEST_CASE("queue_index reorder keeps created_at", "[queue][index]") {
    queue_index index;
    REQUIRE(index.insert(make_record("old", job_priority::low, 0)));
    REQUIRE(index.insert(make_record("mid", job_priority::high, 5)));
    REQUIRE(index.insert(make_record("new", job_priority::high, 10)));

    REQUIRE(index.reorder("old", job_priority::high));
    CHECK(dispatch_order(index) == std::vector<std::string>{"old", "mid", "new"});
    CHECK(index.size(job_priority::low) == 0);

    REQUIRE(index.reorder("mid", job_priority::low));
    CHECK(dispatch_order(index) == std::vector<std::string>{"old", "new", "mid"});

    CHECK(index.reorder("new", job_priority::high));
    CHECK_FALSE(index.reorder("ghost", job_priority::high));
}

TEST_CASE("queue_index equal timestamps fall back to id", "[queue][index]") {
    queue_index index;
    REQUIRE(index.insert(make_record("b", job_priority::normal, 0)));
    REQUIRE(index.insert(make_record("a", job_priority::normal, 0)));
    CHECK(dispatch_order(index) == std::vector<std::string>{"a", "b"});
}

TEST_CASE("queue_index rebuild keeps only queued records", "[queue][index]") {
    queue_index index;
    REQUIRE(index.insert(make_record("stale", job_priority::high, 0)));

    index.rebuild({
        make_record("q1", job_priority::normal, 1),
        make_record("r1", job_priority::high, 2, job_status::running),
        make_record("c1", job_priority::high, 3, job_status::completed),
        make_record("q2", job_priority::high, 4),
    });

    CHECK(index.size() == 2);
    CHECK_FALSE(index.contains("stale"));
    CHECK(dispatch_order(index) == std::vector<std::string>{"q2", "q1"});

    index.clear();
    CHECK(index.empty());
    CHECK_FALSE(index.peek_next().has_value());
}
