#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <stdexcept>

#include "interface/rest_api_handler.hpp"
#include "test_doubles.hpp"

using namespace transcode_service;
using namespace transcode_service::test;

namespace {

const std::string kQueue = "transcoding-video";

// Counts depth reads so tests can see the request path never touches the broker
class CountingQueue : public InMemoryJobQueue {
public:
  using InMemoryJobQueue::InMemoryJobQueue;

  std::expected<long, std::string> depth(const std::string& queue) override {
    ++reads;
    return InMemoryJobQueue::depth(queue);
  }

  std::atomic<int> reads{0};
};

class ThrowingHandler : public common::RestApiHandlerBase {
protected:
  http::response<http::string_body> doHandleRequest(http::request<http::string_body>&&) override {
    throw std::runtime_error("socket closed");
  }
};

struct StatusFixture {
  explicit StatusFixture(std::shared_ptr<CountingQueue> q = std::make_shared<CountingQueue>())
    : queue(std::move(q)),
      registry(std::make_shared<RecordingRegistry>()),
      cfg{.url = "redis://localhost", .name = kQueue, .max_capacity = 10, .consumer_tag = "test",
          .requeue_on_failure = false},
      scheduler(std::make_shared<AdmissionScheduler>(
        queue, registry, cfg, config::SchedulerConfig{.interval = std::chrono::seconds(60)},
        config::StorageConfig{.upload_dir = "uploads", .output_dir = "out"})),
      consumer(std::make_shared<JobConsumer>(
        queue, [](const JobMessage&) -> std::expected<void, std::string> { return {}; }, cfg)),
      handler(scheduler, consumer, cfg) {}

  http::response<http::string_body> get(const std::string& target, http::verb verb = http::verb::get) {
    http::request<http::string_body> req{verb, target, 11};
    req.keep_alive(true);
    return handler.handleRequest(std::move(req));
  }

  std::shared_ptr<CountingQueue> queue;
  std::shared_ptr<RecordingRegistry> registry;
  config::QueueConfig cfg;
  std::shared_ptr<AdmissionScheduler> scheduler;
  std::shared_ptr<JobConsumer> consumer;
  RestApiHandler handler;
};

} // namespace

TEST(RestApiHandlerTest, RootAnswersLiveness) {
  StatusFixture f;
  auto res = f.get("/");
  EXPECT_EQ(res.result(), http::status::ok);
  EXPECT_EQ(res.body(), "Transcoding service is running");
  EXPECT_TRUE(res.keep_alive());
}

TEST(RestApiHandlerTest, StatusReportsQueueSchedulerAndConsumer) {
  StatusFixture f;
  f.queue->seed(kQueue, "{}");
  f.queue->seed(kQueue, "{}");

  auto before = nlohmann::json::parse(f.get("/api/transcode/status").body());
  EXPECT_EQ(before["queue"]["name"], kQueue);
  EXPECT_EQ(before["queue"]["capacity"], 10);
  EXPECT_TRUE(before["queue"]["depth"].is_null());
  EXPECT_TRUE(before["scheduler"]["last_cycle"].is_null());
  EXPECT_EQ(before["consumer"]["acknowledged"], 0);

  f.scheduler->runCycle();
  f.consumer->handleDelivery(Delivery{.message_id = "x", .body = "garbage"});

  auto res = f.get("/api/transcode/status?verbose=1");
  ASSERT_EQ(res.result(), http::status::ok);
  auto after = nlohmann::json::parse(res.body());
  EXPECT_EQ(after["queue"]["depth"], 2);
  EXPECT_TRUE(after["queue"].contains("observed_at"));
  EXPECT_EQ(after["scheduler"]["last_cycle"]["available"], 8);
  EXPECT_EQ(after["scheduler"]["last_cycle"]["skipped"], false);
  EXPECT_EQ(after["consumer"]["rejected"], 1);
}

TEST(RestApiHandlerTest, StatusNeverReadsTheBroker) {
  StatusFixture f;
  f.scheduler->runCycle();
  const int reads = f.queue->reads.load();

  for (int i = 0; i < 3; ++i) {
    EXPECT_EQ(f.get("/api/transcode/status").result(), http::status::ok);
  }
  EXPECT_EQ(f.queue->reads.load(), reads);
}

TEST(RestApiHandlerTest, DepthErrorIsReportedInline) {
  StatusFixture f(std::make_shared<CountingQueue>(false));
  f.scheduler->runCycle();
  auto body = nlohmann::json::parse(f.get("/api/transcode/status").body());
  EXPECT_TRUE(body["queue"]["depth"].is_null());
  EXPECT_NE(body["queue"]["error"].get<std::string>().find(kQueueNotInitialized), std::string::npos);
}

TEST(RestApiHandlerTest, UnknownRoutesAreNotFound) {
  StatusFixture f;
  EXPECT_EQ(f.get("/api/video/upload").result(), http::status::not_found);
  EXPECT_EQ(f.get("/", http::verb::post).result(), http::status::not_found);

  auto body = nlohmann::json::parse(f.get("/nope").body());
  EXPECT_EQ(body["success"], false);
}

TEST(RestApiHandlerTest, HandlerExceptionBecomesServerError) {
  ThrowingHandler handler;
  http::request<http::string_body> req{http::verb::get, "/", 11};
  auto res = handler.handleRequest(std::move(req));
  EXPECT_EQ(res.result(), http::status::internal_server_error);
  auto body = nlohmann::json::parse(res.body());
  EXPECT_NE(body["error"].get<std::string>().find("socket closed"), std::string::npos);
}
