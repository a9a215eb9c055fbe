#pragma once

#include <memory>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <queue>

#include "common/config/config.hpp"

namespace common {

// RAII: a live broker/database session, closed when the object is destroyed
class Connection {
public:
  virtual ~Connection() = default;
  virtual bool isValid() const = 0;

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  Connection() = default;
  Connection(Connection&&) = default;
  Connection& operator=(Connection&&) = default;
};


/*
  idle connections kept in the pool <= min_connections
  active connections = borrowed by callers
  idle + active <= max_connections
*/
class ConnectionPool {
public:
virtual ~ConnectionPool();

// Throws std::runtime_error on timeout, shutdown or when a new connection cannot be created
std::unique_ptr<Connection> getConnectionFromPool();

void returnConnection(std::unique_ptr<Connection> conn);

size_t activeConnections() const { return active_connections_; }
size_t availableConnections() const;

ConnectionPool(const ConnectionPool&) = delete;
ConnectionPool& operator=(const ConnectionPool&) = delete;

protected:
  ConnectionPool(const config::ConnectionPoolConfig& cfg): cp_config_(cfg){};
  virtual std::unique_ptr<Connection> createConnection() = 0;

  // Opens min_connections sessions up front, returns how many succeeded
  size_t prefill();

  bool validateConnection(Connection* conn);

  config::ConnectionPoolConfig cp_config_;
  std::queue<std::unique_ptr<Connection>> pool_;
  mutable std::mutex mutex_;
  std::condition_variable condition_;
  std::atomic<size_t> active_connections_{0};
  std::atomic<bool> shutdown_{false};
};

// RAII: borrows a connection on construction, gives it back on destruction
class ConnectionGuard {
public:
  ConnectionGuard(ConnectionPool& pool) : pool_(pool) { conn_ = pool_.getConnectionFromPool(); }
  ~ConnectionGuard() { if (conn_) pool_.returnConnection(std::move(conn_)); }

  Connection* operator->() const { return conn_.get(); }
  Connection& operator*() const { return *conn_; }

  bool valid() const { return conn_ != nullptr; }

  ConnectionGuard(const ConnectionGuard&) = delete;
  ConnectionGuard& operator=(const ConnectionGuard&) = delete;

protected:
  ConnectionPool& pool_;
  std::unique_ptr<Connection> conn_;
};

} // namespace common
