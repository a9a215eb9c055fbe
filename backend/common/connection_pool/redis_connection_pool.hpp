#pragma once

#include "common/config/config.hpp"
#include "common/connection_pool/connection_pool.hpp"
#include <hiredis/hiredis.h>
#include <memory>

namespace common {

using RedisReplyPtr = std::unique_ptr<redisReply, void(*)(void*)>;

class RedisConnection : public Connection {
public:
  RedisConnection(redisContext* conn): conn_(conn) {}
  ~RedisConnection() override { if (conn_) redisFree(conn_); }

  redisContext* get() const { return conn_; }
  bool isValid() const override;

  // printf-style redisCommand; the reply is null when the transport failed (see errorString)
  RedisReplyPtr command(const char* format, ...) const;
  std::string errorString() const;

  RedisConnection(RedisConnection&& other) noexcept: conn_(other.conn_) {other.conn_ = nullptr; }
  RedisConnection& operator=(RedisConnection&& other) noexcept;

private:
  redisContext* conn_ = nullptr;
};


class RedisConnectionPool final : public ConnectionPool{
public:
  // Throws std::runtime_error when not a single connection can be opened
  RedisConnectionPool(const config::RedisConfig& redis, const config::ConnectionPoolConfig& cp);
  ~RedisConnectionPool() override = default;

  std::unique_ptr<Connection> createConnection() override;

private:
  config::RedisConfig redis_config_;
};

class RedisConnectionGuard final : public ConnectionGuard{
  using ConnectionGuard::ConnectionGuard;
public:
  RedisConnection& connection() const {
    return *static_cast<RedisConnection*>(conn_.get());
  }
  redisContext* get() const {
    return connection().get();
  }

};
} // namespace common
