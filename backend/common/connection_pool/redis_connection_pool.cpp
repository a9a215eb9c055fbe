#include "common/connection_pool/redis_connection_pool.hpp"
#include <cstdarg>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <hiredis/hiredis.h>

namespace common {

RedisConnection& RedisConnection::operator=(RedisConnection&& other) noexcept {
  if (this != &other) {
    if (conn_) {
      redisFree(conn_);
    }
    conn_ = other.conn_;
    other.conn_ = nullptr;
  }
  return *this;
}

bool RedisConnection::isValid() const {
  if (!conn_ || conn_->err) return false;
  auto reply = command("PING");
  if (!reply || reply->type != REDIS_REPLY_STATUS) return false;
  return !std::strcmp(reply->str, "PONG");
}

RedisReplyPtr RedisConnection::command(const char* format, ...) const {
  va_list ap;
  va_start(ap, format);
  void* reply = redisvCommand(conn_, format, ap);
  va_end(ap);
  return RedisReplyPtr(static_cast<redisReply*>(reply), freeReplyObject);
}

std::string RedisConnection::errorString() const {
  if (!conn_) return "no redis context";
  if (conn_->err) return conn_->errstr;
  return "unknown redis error";
}

RedisConnectionPool::RedisConnectionPool(const config::RedisConfig& redis, const config::ConnectionPoolConfig& cp)
  : ConnectionPool(cp), redis_config_(redis) {
  if (cp_config_.min_connections > 0 && prefill() == 0) {
    throw std::runtime_error("Unable to connect to redis at " + redis_config_.host + ":" +
                             std::to_string(redis_config_.port));
  }
}

std::unique_ptr<Connection> RedisConnectionPool::createConnection() {
  auto timeout_ms = cp_config_.timeout.count();
  timeval tv{
    .tv_sec = static_cast<time_t>(timeout_ms / 1000),
    .tv_usec = static_cast<suseconds_t>((timeout_ms % 1000) * 1000)
  };
  redisContext* ctx = redisConnectWithTimeout(redis_config_.host.c_str(), static_cast<int>(redis_config_.port), tv);
  if (ctx == NULL) {
    return nullptr;
  }
  if (ctx->err) {
    std::cerr << "[Queue] redis connect failed: " << ctx->errstr << std::endl;
    redisFree(ctx);
    return nullptr;
  }

  auto conn = std::make_unique<RedisConnection>(ctx);
  if (redis_config_.db != 0) {
    auto reply = conn->command("SELECT %d", redis_config_.db);
    if (!reply || reply->type == REDIS_REPLY_ERROR) {
      std::cerr << "[Queue] redis SELECT " << redis_config_.db << " failed" << std::endl;
      return nullptr;
    }
  }
  return conn;
}

} // namespace common
