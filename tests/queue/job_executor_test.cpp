/**
 * @file job_executor_test.cpp
 * @brief Unit tests for handler_registry, job_context and job_executor
 */

#include <jobq/queue/job_executor.hpp>

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace jobq;
using namespace jobq::queue;

namespace {

auto make_record(const std::string& type_tag, const std::string& data = {}) -> job_record {
    job_record record;
    record.job_id = "job-1";
    record.payload = {type_tag, data};
    record.status = job_status::running;
    record.attempt_count = 1;
    return record;
}

auto make_context(cancel_flag flag = nullptr, job_context::progress_sink sink = nullptr)
    -> job_context {
    return job_context("job-1", 1, std::move(flag), std::move(sink));
}

}  // namespace

TEST_CASE("handler_registry registration", "[queue][registry]") {
    handler_registry registry;

    auto noop = [](const job_payload&, job_context&) { return job_outcome::success(); };

    REQUIRE(registry.register_handler("render", noop).is_ok());
    CHECK(registry.contains("render"));
    CHECK(registry.find("render") != nullptr);
    CHECK(registry.find("encode") == nullptr);

    SECTION("duplicate tag is rejected") {
        auto result = registry.register_handler("render", noop);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::invalid_argument);
    }

    SECTION("empty tag and null handler are rejected") {
        CHECK(registry.register_handler("", noop).is_err());
        CHECK(registry.register_handler("encode", std::shared_ptr<job_handler>{}).is_err());
    }

    SECTION("tags are listed sorted") {
        REQUIRE(registry.register_handler("archive", noop).is_ok());
        CHECK(registry.type_tags() == std::vector<std::string>{"archive", "render"});
    }

    SECTION("unregister") {
        CHECK(registry.unregister_handler("render"));
        CHECK_FALSE(registry.unregister_handler("render"));
        CHECK_FALSE(registry.contains("render"));
    }
}

TEST_CASE("job_context progress and cancellation", "[queue][context]") {
    std::vector<job_progress> reported;
    auto flag = std::make_shared<std::atomic<bool>>(false);
    auto context = make_context(flag, [&](const job_progress& p) { reported.push_back(p); });

    CHECK(context.job_id() == "job-1");
    CHECK(context.attempt() == 1);
    CHECK_FALSE(context.is_cancelled());

    context.report_progress(2, 4);
    context.report_progress(9, 4);
    REQUIRE(reported.size() == 2);
    CHECK(reported[0].current_step == 2);
    CHECK(reported[1].current_step == 4);
    CHECK(context.last_progress().total_steps == 4);

    flag->store(true);
    CHECK(context.is_cancelled());

    auto detached = make_context();
    CHECK_FALSE(detached.is_cancelled());
    detached.report_progress(1, 2);
    CHECK(detached.last_progress().current_step == 1);
}

TEST_CASE("job_executor maps handler outcomes", "[queue][executor]") {
    auto registry = std::make_shared<handler_registry>();
    REQUIRE(registry
                ->register_handler("echo",
                                   [](const job_payload& payload, job_context&) {
                                       return job_outcome::success(payload.data);
                                   })
                .is_ok());
    REQUIRE(registry
                ->register_handler("fail",
                                   [](const job_payload&, job_context&) {
                                       return job_outcome::failure("bad input");
                                   })
                .is_ok());
    REQUIRE(registry
                ->register_handler("throw",
                                   [](const job_payload&, job_context&) -> job_outcome {
                                       throw std::runtime_error("exploded");
                                   })
                .is_ok());
    REQUIRE(registry
                ->register_handler("throw-int",
                                   [](const job_payload&, job_context&) -> job_outcome {
                                       throw 42;
                                   })
                .is_ok());
    REQUIRE(registry
                ->register_handler("cancel",
                                   [](const job_payload&, job_context& ctx) {
                                       return ctx.is_cancelled() ? job_outcome::cancelled()
                                                                 : job_outcome::success();
                                   })
                .is_ok());

    REQUIRE(registry
                ->register_handler("self-cancel",
                                   [](const job_payload&, job_context&) {
                                       return job_outcome::cancelled();
                                   })
                .is_ok());

    job_executor executor(registry);
    CHECK(executor.registry() == registry);

    SECTION("success carries output") {
        auto context = make_context();
        auto result = executor.execute(make_record("echo", "frame-7"), context);
        CHECK(result.status == job_status::completed);
        REQUIRE(result.result.output.has_value());
        CHECK(*result.result.output == "frame-7");
    }

    SECTION("failure carries message") {
        auto context = make_context();
        auto result = executor.execute(make_record("fail"), context);
        CHECK(result.status == job_status::failed);
        CHECK(result.result.error_message == "bad input");
    }

    SECTION("exceptions become failures") {
        auto context = make_context();
        auto result = executor.execute(make_record("throw"), context);
        CHECK(result.status == job_status::failed);
        CHECK(result.result.error_message == "exploded");

        auto other = executor.execute(make_record("throw-int"), context);
        CHECK(other.status == job_status::failed);
        CHECK_FALSE(other.result.error_message.empty());
    }

    SECTION("acknowledged cancellation") {
        auto flag = std::make_shared<std::atomic<bool>>(true);
        auto context = make_context(flag);
        auto result = executor.execute(make_record("cancel"), context);
        CHECK(result.status == job_status::cancelled);
        CHECK(result.result.error_message == "cancelled");
    }

    SECTION("cancellation without a request fails") {
        auto context = make_context();
        auto result = executor.execute(make_record("self-cancel"), context);
        CHECK(result.status == job_status::failed);
        CHECK(result.result.error_message == "handler cancelled without a cancel request");

        auto flag = std::make_shared<std::atomic<bool>>(true);
        auto requested = make_context(flag);
        CHECK(executor.execute(make_record("self-cancel"), requested).status ==
              job_status::cancelled);
    }

    SECTION("unknown type tag fails") {
        auto context = make_context();
        auto result = executor.execute(make_record("missing"), context);
        CHECK(result.status == job_status::failed);
        CHECK(result.result.error_message.find("missing") != std::string::npos);
    }
}
