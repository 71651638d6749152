/**
 * @file memory_job_store_test.cpp
 * @brief Unit tests for memory_job_store
 */

#include <jobq/storage/memory_job_store.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace jobq;
using namespace jobq::storage;
using jobq::queue::job_clock;
using jobq::queue::job_priority;
using jobq::queue::job_record;
using jobq::queue::job_result;
using jobq::queue::job_status;

namespace {

auto make_record(const std::string& id, job_priority priority,
                 job_clock::time_point created) -> job_record {
    job_record record;
    record.job_id = id;
    record.payload = {"echo", "payload-" + id};
    record.priority = priority;
    record.status = job_status::queued;
    record.created_at = created;
    record.updated_at = created;
    return record;
}

const auto base_time = job_clock::time_point{std::chrono::seconds{1'700'000'000}};

auto ids_of(const std::vector<job_record>& records) -> std::vector<std::string> {
    std::vector<std::string> ids;
    for (const auto& r : records) {
        ids.push_back(r.job_id);
    }
    return ids;
}

}  // namespace

TEST_CASE("memory_job_store insert and get", "[storage][memory]") {
    memory_job_store store;

    SECTION("inserted record is returned as a copy") {
        REQUIRE(store.insert(make_record("a", job_priority::normal, base_time)).is_ok());

        auto fetched = store.get("a");
        REQUIRE(fetched.is_ok());
        REQUIRE(fetched.value().has_value());
        CHECK(fetched.value()->payload.data == "payload-a");
        CHECK(fetched.value()->status == job_status::queued);
        CHECK(fetched.value()->attempt_count == 0);
    }

    SECTION("unknown id yields empty optional") {
        auto fetched = store.get("missing");
        REQUIRE(fetched.is_ok());
        CHECK_FALSE(fetched.value().has_value());
    }

    SECTION("duplicate id is rejected") {
        REQUIRE(store.insert(make_record("a", job_priority::normal, base_time)).is_ok());
        auto again = store.insert(make_record("a", job_priority::high, base_time));
        REQUIRE(again.is_err());
        CHECK(again.error().code == error_codes::duplicate_job);
    }

    CHECK_FALSE(store.is_durable());
}

TEST_CASE("memory_job_store update_status", "[storage][memory]") {
    memory_job_store store;
    REQUIRE(store.insert(make_record("a", job_priority::normal, base_time)).is_ok());

    SECTION("moving to running increments attempt_count") {
        auto at = base_time + std::chrono::seconds{5};
        REQUIRE(store.update_status("a", job_status::running, std::nullopt, at).is_ok());

        auto record = store.get("a").value();
        REQUIRE(record);
        CHECK(record->status == job_status::running);
        CHECK(record->attempt_count == 1);
        CHECK(record->updated_at == at);
        CHECK(record->created_at == base_time);
    }

    SECTION("moving back to queued does not count an attempt") {
        REQUIRE(store.update_status("a", job_status::running, std::nullopt, base_time).is_ok());
        REQUIRE(store.update_status("a", job_status::queued, std::nullopt, base_time).is_ok());
        CHECK(store.get("a").value()->attempt_count == 1);
    }

    SECTION("terminal result is stored") {
        REQUIRE(store.update_status("a", job_status::failed,
                                    job_result::failure("boom"), base_time)
                    .is_ok());
        auto record = store.get("a").value();
        REQUIRE(record->result.has_value());
        CHECK(record->result->error_message == "boom");
    }

    SECTION("unknown id is reported") {
        auto result = store.update_status("nope", job_status::running, std::nullopt, base_time);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::job_not_found);
    }
}

TEST_CASE("memory_job_store ordering", "[storage][memory]") {
    memory_job_store store;
    REQUIRE(store.insert(make_record("low-1", job_priority::low, base_time)).is_ok());
    REQUIRE(store.insert(make_record("norm-2", job_priority::normal,
                                     base_time + std::chrono::seconds{2})).is_ok());
    REQUIRE(store.insert(make_record("high-3", job_priority::high,
                                     base_time + std::chrono::seconds{3})).is_ok());
    REQUIRE(store.insert(make_record("norm-1", job_priority::normal,
                                     base_time + std::chrono::seconds{1})).is_ok());

    SECTION("scan_by_status orders by priority then created_at") {
        auto queued = store.scan_by_status(job_status::queued);
        REQUIRE(queued.is_ok());
        CHECK(ids_of(queued.value()) ==
              std::vector<std::string>{"high-3", "norm-1", "norm-2", "low-1"});
    }

    SECTION("scan_all lists running jobs first") {
        REQUIRE(store.update_status("low-1", job_status::running, std::nullopt, base_time)
                    .is_ok());
        auto all = store.scan_all();
        REQUIRE(all.is_ok());
        REQUIRE(all.value().size() == 4);
        CHECK(all.value().front().job_id == "low-1");
    }

    SECTION("count_by_status") {
        CHECK(store.count_by_status(job_status::queued).value() == 4);
        CHECK(store.count_by_status(job_status::running).value() == 0);
    }

    SECTION("latest_created_at") {
        auto latest = store.latest_created_at();
        REQUIRE(latest.is_ok());
        REQUIRE(latest.value().has_value());
        CHECK(*latest.value() == base_time + std::chrono::seconds{3});
    }
}

TEST_CASE("memory_job_store delete_older_than", "[storage][memory]") {
    memory_job_store store;
    for (const char* id : {"old-done", "new-done", "old-queued"}) {
        REQUIRE(store.insert(make_record(id, job_priority::normal, base_time)).is_ok());
    }
    REQUIRE(store.update_status("old-done", job_status::completed, job_result::success(),
                                base_time).is_ok());
    REQUIRE(store.update_status("new-done", job_status::completed, job_result::success(),
                                base_time + std::chrono::hours{2}).is_ok());

    auto removed = store.delete_older_than(
        {job_status::completed, job_status::failed, job_status::cancelled},
        base_time + std::chrono::hours{1});
    REQUIRE(removed.is_ok());
    CHECK(removed.value() == 1);

    CHECK_FALSE(store.get("old-done").value().has_value());
    CHECK(store.get("new-done").value().has_value());
    CHECK(store.get("old-queued").value().has_value());
}

TEST_CASE("memory_job_store concurrent readers see whole records", "[storage][memory]") {
    memory_job_store store;
    REQUIRE(store.insert(make_record("a", job_priority::normal, base_time)).is_ok());

    std::thread writer([&store] {
        for (int i = 0; i < 200; ++i) {
            auto status = (i % 2 == 0) ? job_status::running : job_status::queued;
            (void)store.update_status("a", status, std::nullopt, base_time);
        }
    });

    for (int i = 0; i < 200; ++i) {
        auto record = store.get("a").value();
        REQUIRE(record);
        CHECK((record->status == job_status::running || record->status == job_status::queued));
    }
    writer.join();
}
