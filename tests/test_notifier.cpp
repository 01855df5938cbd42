#include <catch2/catch.hpp>

#include "fakes.hpp"
#include "notifier.hpp"
#include "run_report.hpp"
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

namespace {

MonitorConfig make_config() {
    MonitorConfig config;
    config.contacts.recipients = {"ops@example.com", "lead@example.com"};
    config.contacts.script_recipients = {"dev@example.com"};
    config.contacts.source_account = "monitor";
    config.contacts.source_service = "@example.com";
    config.email.subject = "Service alert";
    return config;
}

NotificationRequest down_request() {
    NotificationRequest request;
    request.category = NotificationCategory::SERVICE_DOWN;
    request.recipients = {"ops@example.com", "lead@example.com"};
    request.entries.push_back({"api_health", "503", "https://svc/health", {200, 204}});
    request.entries.push_back({"search", "404", "https://svc/search", {200}});
    return request;
}

} // anonymous namespace

TEST_CASE("service-down body lists each entry in order", "[notify]") {
    std::string body = NotificationComposer::format_body(down_request());

    CHECK(body ==
          "Test `api health`\n"
          "\tURL: https://svc/health\n"
          "\tExpected status codes: [200, 204]\n"
          "\tGot: 503\n"
          "\n"
          "Test `search`\n"
          "\tURL: https://svc/search\n"
          "\tExpected status codes: [200]\n"
          "\tGot: 404\n");
}

TEST_CASE("script-error body uses the failure description", "[notify]") {
    NotificationRequest request;
    request.category = NotificationCategory::SCRIPT_ERROR;
    request.entries.push_back({"queue", "Couldn't connect to server", "https://q", {200}});

    std::string body = NotificationComposer::format_body(request);
    CHECK(body.find("\tError: Couldn't connect to server\n") != std::string::npos);
    CHECK(body.find("Got:") == std::string::npos);
}

TEST_CASE("subjects depend on the category", "[notify]") {
    EmailMetadata email;
    email.subject = "Service alert";
    CHECK(NotificationComposer::subject_for(NotificationCategory::SERVICE_DOWN, email) == "Service alert");
    CHECK(NotificationComposer::subject_for(NotificationCategory::SCRIPT_ERROR, email) ==
          "Service alert (script error)");

    email.script_subject = "Monitor broken";
    CHECK(NotificationComposer::subject_for(NotificationCategory::SCRIPT_ERROR, email) == "Monitor broken");
}

TEST_CASE("composed message is addressed from the source account", "[notify]") {
    auto message = NotificationComposer::compose(down_request(), make_config());
    CHECK(message.from == "monitor@example.com");
    CHECK(message.to == std::vector<std::string>{"ops@example.com", "lead@example.com"});
    CHECK(message.subject == "Service alert");
}

TEST_CASE("rendered message has headers and CRLF line endings", "[notify]") {
    EmailMessage message;
    message.from = "monitor@example.com";
    message.to = {"a@example.com", "b@example.com"};
    message.subject = "Alert\nInjected: header";
    message.body = "line one\nline two\n";

    std::string text = NotificationComposer::render(message, 0);
    CHECK(text.find("To: a@example.com, b@example.com\r\n") != std::string::npos);
    CHECK(text.find("From: monitor@example.com\r\n") != std::string::npos);
    CHECK(text.find("Subject: Alert Injected: header\r\n") != std::string::npos);
    CHECK(text.find("\r\n\r\nline one\r\nline two\r\n") != std::string::npos);
}

TEST_CASE("deliver sends one message per request", "[notify]") {
    RecordingNotifier notifier;
    NotificationRequest errors;
    errors.category = NotificationCategory::SCRIPT_ERROR;
    errors.recipients = {"dev@example.com"};
    errors.entries.push_back({"queue", "refused", "https://q", {200}});

    deliver_notifications({down_request(), errors}, make_config(), notifier);

    REQUIRE(notifier.sent.size() == 2);
    CHECK(notifier.sent[0].subject == "Service alert");
    CHECK(notifier.sent[1].to == std::vector<std::string>{"dev@example.com"});
    CHECK(notifier.sent[1].subject == "Service alert (script error)");
}

TEST_CASE("delivery failure propagates to the caller", "[notify]") {
    RecordingNotifier notifier;
    notifier.fail = true;
    CHECK_THROWS_AS(deliver_notifications({down_request()}, make_config(), notifier), NotifyError);
}

TEST_CASE("no requests means nothing is sent", "[notify]") {
    RecordingNotifier notifier;
    deliver_notifications({}, make_config(), notifier);
    CHECK(notifier.sent.empty());
}

TEST_CASE("dry-run notifier prints the rendered message with LF line endings", "[notify]") {
    std::ostringstream out;
    auto notifier = create_dry_run_notifier(out);
    notifier->send(NotificationComposer::compose(down_request(), make_config()));

    std::string text = out.str();
    CHECK(text.rfind("Date: ", 0) == 0);
    CHECK(text.find("Subject: Service alert\n") != std::string::npos);
    CHECK(text.find("MIME-Version: 1.0\n") != std::string::npos);
    CHECK(text.find("Content-Type: text/plain; charset=utf-8\n") != std::string::npos);
    CHECK(text.find("\n\nTest `api health`\n") != std::string::npos);
    CHECK(text.find('\r') == std::string::npos);
}

TEST_CASE("smtp notifier refuses to send without a password", "[notify]") {
    unsetenv("EMAIL_APP_PASSWORD");
    auto config = make_config();
    auto notifier = create_smtp_notifier(config.smtp, config.contacts);
    CHECK_THROWS_AS(notifier->send(NotificationComposer::compose(down_request(), config)), NotifyError);
}

TEST_CASE("smtp transport failure is a NotifyError with the curl reason", "[notify]") {
    setenv("EMAIL_APP_PASSWORD", "app-password", 1);
    auto config = make_config();
    config.smtp.host = "127.0.0.1";
    config.smtp.port = 1;   // nothing listens here
    config.smtp.use_starttls = true;
    config.smtp.timeout_seconds = 5;
    auto notifier = create_smtp_notifier(config.smtp, config.contacts);

    CHECK_THROWS_WITH(notifier->send(NotificationComposer::compose(down_request(), config)),
                      Catch::Contains("Error sending email"));
    unsetenv("EMAIL_APP_PASSWORD");
}

TEST_CASE("run report lists results and counts", "[report]") {
    RunSummary summary;
    summary.results = {{"web", ProbeStatus::UP, "200"},
                       {"db", ProbeStatus::DOWN, "503"},
                       {"queue", ProbeStatus::ERROR, "refused"}};

    auto report = nlohmann::json::parse(RunReport::to_json(summary));
    REQUIRE(report["results"].size() == 3);
    CHECK(report["results"][0]["test"] == "web");
    CHECK(report["results"][1]["status"] == "DOWN");
    CHECK(report["results"][2]["detail"] == "refused");
    CHECK(report["down"] == 1);
    CHECK(report["errors"] == 1);

    std::string path = "service_monitor_test_report.json";
    REQUIRE(RunReport::save_to_file(summary, path));
    std::ifstream in(path);
    CHECK(nlohmann::json::parse(in)["results"].size() == 3);
    in.close();
    std::remove(path.c_str());

    CHECK_FALSE(RunReport::save_to_file(summary, "/nonexistent/dir/report.json"));
}
