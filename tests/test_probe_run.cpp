#include <catch2/catch.hpp>

#include "fakes.hpp"
#include "probe_run.hpp"

namespace {

Contacts make_contacts() {
    Contacts c;
    c.recipients = {"ops@example.com"};
    c.script_recipients = {"dev@example.com"};
    c.source_account = "monitor";
    c.source_service = "@example.com";
    return c;
}

struct RunFixture {
    std::shared_ptr<ScriptedExecutor::Script> script = std::make_shared<ScriptedExecutor::Script>();
    ProbeRun run{std::make_unique<ScriptedExecutor>(script)};
};

} // anonymous namespace

TEST_CASE_METHOD(RunFixture, "healthy endpoint yields UP and no notification", "[run]") {
    std::vector<TestDefinition> tests = {make_test("api")};
    script->outcomes["api"] = HttpResponse{200, ""};

    auto summary = run.run(tests);
    REQUIRE(summary.results.size() == 1);
    CHECK(summary.results[0].status == ProbeStatus::UP);
    CHECK_FALSE(summary.has_failures());
    CHECK(ProbeRun::plan_notifications(summary, tests, make_contacts()).empty());
}

TEST_CASE_METHOD(RunFixture, "503 yields one SERVICE_DOWN request to recipients", "[run]") {
    std::vector<TestDefinition> tests = {make_test("api")};
    script->outcomes["api"] = HttpResponse{503, "unavailable"};

    auto summary = run.run(tests);
    REQUIRE(summary.results.size() == 1);
    CHECK(summary.results[0].status == ProbeStatus::DOWN);
    CHECK(summary.results[0].detail == "503");

    auto requests = ProbeRun::plan_notifications(summary, tests, make_contacts());
    REQUIRE(requests.size() == 1);
    CHECK(requests[0].category == NotificationCategory::SERVICE_DOWN);
    CHECK(requests[0].recipients == std::vector<std::string>{"ops@example.com"});
    REQUIRE(requests[0].entries.size() == 1);
    CHECK(requests[0].entries[0].test_name == "api");
    CHECK(requests[0].entries[0].detail == "503");
    CHECK(requests[0].entries[0].url == "https://svc/api");
    CHECK(requests[0].entries[0].accepted_codes == std::vector<int>{200});
}

TEST_CASE_METHOD(RunFixture, "timeout yields one SCRIPT_ERROR request to script recipients", "[run]") {
    std::vector<TestDefinition> tests = {make_test("api")};
    script->outcomes["api"] = ProbeFailure{FailureKind::TRANSPORT,
                                           "Timeout was reached: Operation timed out after 60000 ms"};

    auto summary = run.run(tests);
    REQUIRE(summary.results.size() == 1);
    CHECK(summary.results[0].status == ProbeStatus::ERROR);
    CHECK(summary.results[0].detail.find("Timeout") != std::string::npos);

    auto requests = ProbeRun::plan_notifications(summary, tests, make_contacts());
    REQUIRE(requests.size() == 1);
    CHECK(requests[0].category == NotificationCategory::SCRIPT_ERROR);
    CHECK(requests[0].recipients == std::vector<std::string>{"dev@example.com"});
}

TEST_CASE_METHOD(RunFixture, "DOWN and ERROR in one run give two requests with their own subsets", "[run]") {
    std::vector<TestDefinition> tests = {make_test("web"), make_test("db"), make_test("queue")};
    script->outcomes["web"] = HttpResponse{500, ""};
    script->outcomes["db"] = HttpResponse{200, ""};
    script->outcomes["queue"] = ProbeFailure{FailureKind::TRANSPORT, "Couldn't connect to server"};

    auto summary = run.run(tests);
    auto requests = ProbeRun::plan_notifications(summary, tests, make_contacts());
    REQUIRE(requests.size() == 2);

    CHECK(requests[0].category == NotificationCategory::SERVICE_DOWN);
    REQUIRE(requests[0].entries.size() == 1);
    CHECK(requests[0].entries[0].test_name == "web");

    CHECK(requests[1].category == NotificationCategory::SCRIPT_ERROR);
    REQUIRE(requests[1].entries.size() == 1);
    CHECK(requests[1].entries[0].test_name == "queue");
}

TEST_CASE_METHOD(RunFixture, "empty test set gives an empty summary and no requests", "[run]") {
    std::vector<TestDefinition> tests;

    auto summary = run.run(tests);
    CHECK(summary.results.empty());
    CHECK(script->calls.empty());
    CHECK(ProbeRun::plan_notifications(summary, tests, make_contacts()).empty());
}

TEST_CASE_METHOD(RunFixture, "results follow input order regardless of failures", "[run]") {
    std::vector<TestDefinition> tests = {make_test("zeta"), make_test("alpha"),
                                         make_test("mid"), make_test("beta")};
    script->outcomes["zeta"] = ProbeFailure{FailureKind::TRANSPORT, "refused"};
    script->outcomes["alpha"] = HttpResponse{404, ""};
    script->outcomes["beta"] = HttpResponse{200, ""};

    auto summary = run.run(tests);
    REQUIRE(summary.results.size() == tests.size());
    for (size_t i = 0; i < tests.size(); ++i) {
        CHECK(summary.results[i].test_name == tests[i].name);
    }
    CHECK(script->calls == std::vector<std::string>{"zeta", "alpha", "mid", "beta"});
}

TEST_CASE_METHOD(RunFixture, "an executor that throws does not stop later tests", "[run]") {
    std::vector<TestDefinition> tests = {make_test("first"), make_test("broken"), make_test("last")};
    script->throwing = {"broken"};
    script->outcomes["last"] = HttpResponse{502, ""};

    auto summary = run.run(tests);
    REQUIRE(summary.results.size() == 3);
    CHECK(summary.results[0].status == ProbeStatus::UP);
    CHECK(summary.results[1].status == ProbeStatus::ERROR);
    CHECK(summary.results[1].detail.find("executor blew up") != std::string::npos);
    CHECK(summary.results[2].status == ProbeStatus::DOWN);

    CHECK(summary.down().size() == 1);
    CHECK(summary.errors().size() == 1);
}

TEST_CASE_METHOD(RunFixture, "test with no accepted codes is reported as a script error", "[run]") {
    std::vector<TestDefinition> tests = {make_test("misconfigured", {})};
    script->outcomes["misconfigured"] = HttpResponse{200, ""};

    auto summary = run.run(tests);
    auto requests = ProbeRun::plan_notifications(summary, tests, make_contacts());
    REQUIRE(requests.size() == 1);
    CHECK(requests[0].category == NotificationCategory::SCRIPT_ERROR);
}

TEST_CASE("ProbeRun rejects a null executor", "[run]") {
    CHECK_THROWS_AS(ProbeRun(nullptr), std::invalid_argument);
}

TEST_CASE_METHOD(RunFixture, "invalid definition is reported as a script error while the rest still run", "[run]") {
    auto broken = make_test("broken");
    broken.accepted_codes.clear();
    broken.config_error = "`tests.broken.accept` contains invalid status code 99";
    std::vector<TestDefinition> tests = {make_test("web"), broken, make_test("db")};
    script->outcomes["db"] = HttpResponse{500, ""};

    auto summary = run.run(tests);
    REQUIRE(summary.results.size() == 3);
    CHECK(summary.results[0].status == ProbeStatus::UP);
    CHECK(summary.results[1].status == ProbeStatus::ERROR);
    CHECK(summary.results[1].detail.find("invalid status code 99") != std::string::npos);
    CHECK(summary.results[2].status == ProbeStatus::DOWN);

    // No request is made for the broken test
    CHECK(script->calls == std::vector<std::string>{"web", "db"});

    auto requests = ProbeRun::plan_notifications(summary, tests, make_contacts());
    REQUIRE(requests.size() == 2);
    CHECK(requests[1].category == NotificationCategory::SCRIPT_ERROR);
    REQUIRE(requests[1].entries.size() == 1);
    CHECK(requests[1].entries[0].test_name == "broken");
    CHECK(requests[1].entries[0].url == "https://svc/broken");
}
