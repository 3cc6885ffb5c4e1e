#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "wallet/middleware.hpp"

namespace {

wallet::Request MakeTestRequest(boost::beast::http::verb verb, const std::string& target,
                                const std::string& request_id_header = "", bool set_header = false) {
  wallet::HttpRequest message{verb, target, 11};
  if (set_header) {
    message.set(wallet::kRequestIdHeader, request_id_header);
  }
  return wallet::MakeRequest(std::move(message));
}

struct CapturedLogs {
  std::vector<nlohmann::json> lines;

  std::shared_ptr<wallet::Observability> MakeObservability() {
    return std::make_shared<wallet::Observability>(wallet::LogLevel::kDebug, [this](const std::string& line) {
      lines.push_back(nlohmann::json::parse(line));
    });
  }
};

struct RequestIdCase {
  std::string name;
  std::string header_value;
  bool set_header;
  bool expect_generated;
};

class RequestIdMiddlewareTest : public ::testing::TestWithParam<RequestIdCase> {};

TEST_P(RequestIdMiddlewareTest, ResolvesAndEchoesId) {
  const auto& param = GetParam();
  std::string seen_id;
  std::string seen_header;
  auto handler = wallet::WithRequestId([&](wallet::ResponseWriter& w, const wallet::Request& r) {
    seen_id = wallet::GetRequestId(r.context);
    seen_header = w.Header(wallet::kRequestIdHeader);
  });

  wallet::HttpResponse response;
  wallet::MessageResponseWriter writer(response);
  handler(writer, MakeTestRequest(boost::beast::http::verb::get, "/test", param.header_value, param.set_header));

  ASSERT_FALSE(seen_id.empty());
  if (param.expect_generated) {
    EXPECT_GE(seen_id.size(), 22u);
  } else {
    EXPECT_EQ(seen_id, param.header_value);
  }
  EXPECT_EQ(seen_header, seen_id);
  EXPECT_EQ(std::string(response[wallet::kRequestIdHeader]), seen_id);
}

INSTANTIATE_TEST_SUITE_P(Headers, RequestIdMiddlewareTest,
                         ::testing::Values(RequestIdCase{"NoHeaderGeneratesNew", "", false, true},
                                           RequestIdCase{"BlankHeaderGeneratesNew", " ", true, true},
                                           RequestIdCase{"ExistingHeaderIsReused", "test-request-123", true, false}),
                         [](const ::testing::TestParamInfo<RequestIdCase>& info) { return info.param.name; });

TEST(RequestIdMiddlewareFallbackTest, UsesSentinelWhenRandomFails) {
  std::string seen_id;
  auto handler = wallet::WithRequestId(
      [&](wallet::ResponseWriter&, const wallet::Request& r) { seen_id = wallet::GetRequestId(r.context); },
      [](unsigned char*, std::size_t) { return false; });
  wallet::HttpResponse response;
  wallet::MessageResponseWriter writer(response);
  handler(writer, MakeTestRequest(boost::beast::http::verb::post, "/pay"));
  EXPECT_EQ(seen_id, wallet::kFallbackRequestId);
  EXPECT_EQ(std::string(response[wallet::kRequestIdHeader]), wallet::kFallbackRequestId);
}

TEST(InstrumentationMiddlewareTest, LogsStartAndEndWithStatusAndDuration) {
  CapturedLogs logs;
  auto inner = [](wallet::ResponseWriter& w, const wallet::Request&) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    w.WriteHeader(200);
    w.Write("OK");
  };
  auto handler = wallet::WithRequestId(wallet::WithInstrumentation(inner, logs.MakeObservability()));

  wallet::HttpResponse response;
  wallet::MessageResponseWriter writer(response);
  handler(writer, MakeTestRequest(boost::beast::http::verb::post, "/test?x=1", "trace-1", true));

  ASSERT_EQ(logs.lines.size(), 2u);
  const auto& start = logs.lines[0];
  const auto& end = logs.lines[1];

  EXPECT_EQ(start["event"], "request.start");
  EXPECT_EQ(start["method"], "POST");
  EXPECT_EQ(start["path"], "/test");
  EXPECT_EQ(start["requestId"], "trace-1");

  EXPECT_EQ(end["event"], "request.end");
  EXPECT_EQ(end["method"], "POST");
  EXPECT_EQ(end["path"], "/test");
  EXPECT_EQ(end["requestId"], "trace-1");
  EXPECT_EQ(end["status"], 200);
  EXPECT_GE(end["durationUs"].get<long long>(), 5000);
  EXPECT_EQ(response.body(), "OK");
}

TEST(InstrumentationMiddlewareTest, RecordsExplicitErrorStatus) {
  CapturedLogs logs;
  auto inner = [](wallet::ResponseWriter& w, const wallet::Request&) { w.WriteHeader(404); };
  auto handler = wallet::WithInstrumentation(inner, logs.MakeObservability());

  wallet::HttpResponse response;
  wallet::MessageResponseWriter writer(response);
  handler(writer, MakeTestRequest(boost::beast::http::verb::get, "/missing"));

  ASSERT_EQ(logs.lines.size(), 2u);
  EXPECT_EQ(logs.lines[1]["status"], 404);
  // 컨텍스트에 ID가 없으면 빈 문자열로 남긴다.
  EXPECT_EQ(logs.lines[1]["requestId"], "");
  EXPECT_EQ(response.result_int(), 404u);
}

TEST(InstrumentationMiddlewareTest, FailingSinkDoesNotAffectResponse) {
  auto observability = std::make_shared<wallet::Observability>(
      wallet::LogLevel::kInfo, [](const std::string&) { throw std::runtime_error("disk full"); });
  bool called = false;
  auto handler = wallet::WithInstrumentation(
      [&](wallet::ResponseWriter& w, const wallet::Request&) {
        called = true;
        w.WriteHeader(201);
        w.Write("created");
      },
      observability);

  wallet::HttpResponse response;
  wallet::MessageResponseWriter writer(response);
  EXPECT_NO_THROW(handler(writer, MakeTestRequest(boost::beast::http::verb::post, "/pay")));
  EXPECT_TRUE(called);
  EXPECT_EQ(response.result_int(), 201u);
  EXPECT_EQ(response.body(), "created");
}

TEST(InstrumentationMiddlewareTest, NonStandardSinkThrowIsContained) {
  auto observability =
      std::make_shared<wallet::Observability>(wallet::LogLevel::kInfo, [](const std::string&) { throw 42; });
  auto handler = wallet::WithRequestId(wallet::WithInstrumentation(
      [](wallet::ResponseWriter& w, const wallet::Request&) { w.Write("current balance: 1000, current bank: 0"); },
      observability));

  wallet::HttpResponse response;
  wallet::MessageResponseWriter writer(response);
  EXPECT_NO_THROW(handler(writer, MakeTestRequest(boost::beast::http::verb::post, "/pay", "trace-42", true)));
  EXPECT_EQ(response.result_int(), 200u);
  EXPECT_EQ(response.body(), "current balance: 1000, current bank: 0");
  EXPECT_EQ(std::string(response[wallet::kRequestIdHeader]), "trace-42");
}

TEST(ObservabilityTest, DropsEventsBelowLevel) {
  std::vector<std::string> lines;
  wallet::Observability observability(wallet::LogLevel::kWarn,
                                      [&](const std::string& line) { lines.push_back(line); });
  observability.Log(wallet::LogContext{wallet::LogLevel::kInfo, "id", "ignored", {}});
  observability.Log(wallet::LogContext{wallet::LogLevel::kWarn, "id", "kept", {{"reason", "x"}}});
  ASSERT_EQ(lines.size(), 1u);
  auto json = nlohmann::json::parse(lines[0]);
  EXPECT_EQ(json["event"], "kept");
  EXPECT_EQ(json["level"], "warn");
  EXPECT_EQ(json["reason"], "x");
  EXPECT_TRUE(json.contains("ts"));
}

TEST(ObservabilityTest, ParsesLogLevels) {
  EXPECT_TRUE(wallet::ParseLogLevel("debug") == wallet::LogLevel::kDebug);
  EXPECT_TRUE(wallet::ParseLogLevel("warning") == wallet::LogLevel::kWarn);
  EXPECT_FALSE(wallet::ParseLogLevel("verbose").has_value());
}

}  // namespace
