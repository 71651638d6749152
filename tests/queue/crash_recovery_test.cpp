/**
 * @file crash_recovery_test.cpp
 * @brief Tests for restart behavior over a durable store
 */

#include <jobq/queue/queue_manager.hpp>
#include <jobq/storage/memory_job_store.hpp>
#include <jobq/storage/sqlite_job_store.hpp>

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

using namespace jobq;
using namespace jobq::queue;
using namespace std::chrono_literals;

namespace {

class temp_db_path {
public:
    temp_db_path() {
        static std::atomic<int> counter{0};
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path() /
                ("jobq_recovery_test_" + std::to_string(stamp) + "_" +
                 std::to_string(counter.fetch_add(1)) + ".db");
    }

    ~temp_db_path() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
        std::filesystem::remove(path_.string() + "-wal", ec);
        std::filesystem::remove(path_.string() + "-shm", ec);
    }

    temp_db_path(const temp_db_path&) = delete;
    auto operator=(const temp_db_path&) -> temp_db_path& = delete;

    [[nodiscard]] auto get() const -> const std::filesystem::path& { return path_; }

private:
    std::filesystem::path path_;
};

struct run_order {
    std::mutex mutex;
    std::vector<std::string> ids;
};

auto make_registry(const std::shared_ptr<run_order>& order)
    -> std::shared_ptr<handler_registry> {
    auto registry = std::make_shared<handler_registry>();
    auto result = registry->register_handler(
        "render", [order](const job_payload&, job_context& ctx) {
            std::lock_guard lock(order->mutex);
            order->ids.push_back(ctx.job_id());
            return job_outcome::success();
        });
    REQUIRE(result.is_ok());
    return registry;
}

auto make_config(const temp_db_path& path) -> queue_config {
    queue_config config;
    config.db_path = path.get();
    config.poll_interval = 50ms;
    config.auto_start = false;
    return config;
}

auto await_job(queue_manager& manager, const std::string& id) -> job_record {
    auto waiting = manager.wait_for_completion(id);
    REQUIRE(waiting.is_ok());
    auto& future = waiting.value();
    REQUIRE(future.wait_for(5s) == std::future_status::ready);
    return future.get();
}

auto enqueue_job(queue_manager& manager, const std::string& id, job_priority priority)
    -> void {
    enqueue_options options;
    options.job_id = id;
    REQUIRE(manager.enqueue({"render", id}, priority, options).is_ok());
}

}  // namespace

TEST_CASE("interrupted job is re-queued after restart", "[queue][recovery]") {
    temp_db_path path;
    auto order = std::make_shared<run_order>();
    job_clock::time_point interrupted_created_at;

    // First process: two jobs queued, one of them picked up when it "crashes"
    {
        auto created = queue_manager::create(make_config(path), make_registry(order));
        REQUIRE(created.is_ok());
        auto& manager = *created.value();
        CHECK(manager.store()->is_durable());

        enqueue_job(manager, "interrupted", job_priority::normal);
        enqueue_job(manager, "urgent", job_priority::high);

        auto record = manager.get("interrupted").value();
        REQUIRE(record);
        interrupted_created_at = record->created_at;
    }
    {
        auto store = storage::sqlite_job_store::open(path.get());
        REQUIRE(store.is_ok());
        REQUIRE(store.value()
                    ->update_status("interrupted", job_status::running, std::nullopt,
                                    job_clock::now())
                    .is_ok());
    }

    // Second process
    auto created = queue_manager::create(make_config(path), make_registry(order));
    REQUIRE(created.is_ok());
    auto& manager = *created.value();

    CHECK(manager.recovered_count() == 1);
    CHECK(manager.queued_count() == 2);
    CHECK_FALSE(manager.has_running_job());

    auto recovered = manager.get("interrupted").value();
    REQUIRE(recovered);
    CHECK(recovered->status == job_status::queued);
    CHECK(recovered->attempt_count == 1);
    CHECK(recovered->created_at == interrupted_created_at);

    enqueue_job(manager, "fresh", job_priority::normal);
    auto fresh = manager.get("fresh").value();
    REQUIRE(fresh);
    CHECK(fresh->created_at > interrupted_created_at);

    manager.start();
    auto finished = await_job(manager, "fresh");
    CHECK(finished.status == job_status::completed);

    auto rerun = manager.get("interrupted").value();
    REQUIRE(rerun);
    CHECK(rerun->status == job_status::completed);
    CHECK(rerun->attempt_count == 2);

    std::lock_guard lock(order->mutex);
    CHECK(order->ids == std::vector<std::string>{"urgent", "interrupted", "fresh"});
}

TEST_CASE("finished jobs are untouched by recovery", "[queue][recovery]") {
    temp_db_path path;
    auto order = std::make_shared<run_order>();

    {
        auto config = make_config(path);
        config.auto_start = true;
        auto created = queue_manager::create(config, make_registry(order));
        REQUIRE(created.is_ok());
        enqueue_job(*created.value(), "done", job_priority::low);
        CHECK(await_job(*created.value(), "done").status == job_status::completed);
    }

    auto created = queue_manager::create(make_config(path), make_registry(order));
    REQUIRE(created.is_ok());
    CHECK(created.value()->recovered_count() == 0);
    CHECK(created.value()->queued_count() == 0);

    auto record = created.value()->get("done").value();
    REQUIRE(record);
    CHECK(record->status == job_status::completed);
    CHECK(record->attempt_count == 1);
}

TEST_CASE("recovery works over a caller-supplied store", "[queue][recovery]") {
    auto store = std::make_shared<storage::memory_job_store>();

    job_record stuck;
    stuck.job_id = "stuck";
    stuck.payload = {"render", "{}"};
    stuck.status = job_status::running;
    stuck.attempt_count = 3;
    stuck.created_at = job_clock::now() - 1h;
    stuck.updated_at = stuck.created_at;
    REQUIRE(store->insert(stuck).is_ok());

    auto order = std::make_shared<run_order>();
    queue_config config;
    config.poll_interval = 50ms;

    auto created = queue_manager::create(config, store, make_registry(order));
    REQUIRE(created.is_ok());
    CHECK(created.value()->recovered_count() == 1);

    auto record = await_job(*created.value(), "stuck");
    CHECK(record.status == job_status::completed);
    CHECK(record.attempt_count == 4);
}

TEST_CASE("unopenable database fails creation", "[queue][recovery]") {
    queue_config config;
    config.db_path = "/nonexistent-dir/for/jobq/queue.db";
    config.auto_start = false;

    auto order = std::make_shared<run_order>();
    auto created = queue_manager::create(config, make_registry(order));
    REQUIRE(created.is_err());
    CHECK(is_store_error(created.error().code));
}
