#include "application/admission_scheduler.hpp"
#include "application/job_consumer.hpp"
#include "application/transcode_orchestrator.hpp"
#include "common/config/config.hpp"
#include "common/restful/http_server.hpp"
#include "common/thread_pool.hpp"
#include "infrastructure/av_media_probe.hpp"
#include "infrastructure/http_registry_client.hpp"
#include "infrastructure/redis_job_queue.hpp"
#include "infrastructure/subprocess_encoder.hpp"
#include "interface/rest_api_handler.hpp"
#include <csignal>
#include <filesystem>
#include <iostream>
#include <boost/asio.hpp>

int main(int argc, char** argv) {
  try {
    const auto& cfg = config::Config::getInstance();
    const auto& storage = cfg.getStorage();
    const auto& queue_cfg = cfg.getQueue();
    std::filesystem::create_directories(storage.output_dir);

    common::ThreadPool pool(cfg.getEncoder().workers);

    auto registry = std::make_shared<transcode_service::HttpRegistryClient>(cfg.getRegistry());

    auto encoder = std::make_shared<transcode_service::SubprocessEncoder>(cfg.getEncoder());
    if (!encoder->available()) {
      std::cerr << "[Init] " << cfg.getEncoder().ffmpeg_path
                << " -version failed, every encode will be reported as Error" << std::endl;
    }

    std::shared_ptr<transcode_service::MediaProbe> probe =
      std::make_shared<transcode_service::AvMediaProbe>();

    transcode_service::TranscodeOrchestrator orchestrator(registry, encoder, probe, pool, storage);

    // Everything holding the queue is declared after the orchestrator, so the
    // consumer threads are joined before the orchestrator goes away.
    auto queue = std::make_shared<transcode_service::RedisJobQueue>(
      cfg.getRedis(), cfg.getQueuePool(), queue_cfg.consumer_tag);
    if (auto res = queue->connect(); !res) {
      std::cerr << "[Init] " << res.error() << std::endl;
      return 1;
    }
    if (auto res = queue->assertQueue(queue_cfg.name, true); !res) {
      std::cerr << "[Init] Failed to assert queue " << queue_cfg.name << ": " << res.error() << std::endl;
      return 1;
    }

    if (auto res = registry->ping(); !res) {
      std::cerr << "[Init] Task registry unreachable at " << cfg.getRegistry().base_url << ": "
                << res.error() << std::endl;
      return 1;
    }

    auto consumer = std::make_shared<transcode_service::JobConsumer>(
      queue,
      [&orchestrator](const transcode_service::JobMessage& job) -> std::expected<void, std::string> {
        auto result = orchestrator.run(job);
        if (!result) {
          return std::unexpected(result.error());
        }
        return {};
      },
      queue_cfg);

    auto scheduler = std::make_shared<transcode_service::AdmissionScheduler>(
      queue, registry, queue_cfg, cfg.getScheduler(), storage);

    // REST status API
    const auto& service_config = cfg.getService();
    boost::asio::io_context ioc{1};
    auto http_endpoint = boost::asio::ip::tcp::endpoint{
      boost::asio::ip::make_address(service_config.host),
      static_cast<unsigned short>(service_config.port)
    };
    auto api_handler = std::make_shared<transcode_service::RestApiHandler>(scheduler, consumer, queue_cfg);
    common::HttpServer http_server{ioc, http_endpoint, api_handler};

    if (auto res = consumer->start(); !res) {
      std::cerr << "[Init] Failed to start consumer: " << res.error() << std::endl;
      return 1;
    }
    scheduler->start();

    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signal_number) {
      if (ec) {
        return;
      }
      std::cout << "[Init] signal " << signal_number << " received, shutting down" << std::endl;
      http_server.stop();
      ioc.stop();
    });

    std::cout << "HTTP Server listening on " << cfg.getServiceIpPort() << std::endl;
    http_server.run();
    ioc.run();

    scheduler->stop();
    consumer->stop();
    std::cout << "[Init] stopped" << std::endl;
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
