#pragma once

#include <cstddef>
#include <string>
#include <chrono>

namespace config {

struct ConnectionPoolConfig{
  size_t min_connections;
  size_t max_connections;
  std::chrono::milliseconds timeout;
  std::chrono::seconds idle_timeout;
};

struct RedisConfig {
  std::string host;
  unsigned int port;
  int db;
};

struct QueueConfig {
  std::string url;            // redis://host:port[/db]
  std::string name;
  long max_capacity;          // admission ceiling
  std::string consumer_tag;   // stable across restarts, names the processing lists
  bool requeue_on_failure;
};

struct SchedulerConfig {
  std::chrono::milliseconds interval;
};

struct StorageConfig {
  std::string upload_dir;
  std::string output_dir;
};

struct RegistryConfig {
  std::string base_url;       // always ends with '/'
  std::chrono::milliseconds timeout;
};

struct EncoderConfig {
  std::string ffmpeg_path;
  std::string codec_lib;
  std::string audio_codec;
  std::string preset;
  int segment_seconds;
  unsigned int workers;
};

struct ServiceConfig {
  std::string host;
  int port;
};

// Throws std::invalid_argument when the url is not redis://host[:port][/db]
RedisConfig parseQueueUrl(const std::string& url);

class Config {
public:
static Config& getInstance() {
  static Config instance;
  return instance;
}

// Delete copy/move constructors and assign operators
Config(const Config&) = delete;
Config& operator=(const Config&) = delete;
Config(Config&&) = delete;
Config& operator=(Config&&) = delete;

// Re-reads every setting from the environment, falling back to defaults
void reload();

// Getters
const QueueConfig& getQueue() const { return queue_; }
const RedisConfig& getRedis() const { return redis_; }
const ConnectionPoolConfig& getQueuePool() const { return queue_cp_; }
const SchedulerConfig& getScheduler() const { return scheduler_; }
const StorageConfig& getStorage() const { return storage_; }
const RegistryConfig& getRegistry() const { return registry_; }
const EncoderConfig& getEncoder() const { return encoder_; }
const ServiceConfig& getService() const { return service_; }
std::string getServiceIpPort() const { return service_.host+":"+std::to_string(service_.port);}

private:
  Config();

  QueueConfig queue_;
  RedisConfig redis_;
  ConnectionPoolConfig queue_cp_;
  SchedulerConfig scheduler_;
  StorageConfig storage_;
  RegistryConfig registry_;
  EncoderConfig encoder_;
  ServiceConfig service_;
};

} // namespace config
