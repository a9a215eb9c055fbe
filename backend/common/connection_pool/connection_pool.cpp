#include "common/connection_pool/connection_pool.hpp"
#include <stdexcept>

namespace common {

ConnectionPool::~ConnectionPool() {
  shutdown_.store(true);
  condition_.notify_all();

  std::lock_guard<std::mutex> lock(mutex_);
  while (!pool_.empty()) {
    pool_.pop();
  }
}

size_t ConnectionPool::prefill() {
  size_t opened = 0;
  for (size_t i = 0; i < cp_config_.min_connections; ++i) {
    auto conn = createConnection();
    if (!conn) {
      continue;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    pool_.push(std::move(conn));
    ++opened;
  }
  return opened;
}

bool ConnectionPool::validateConnection(Connection* conn) {
  return conn && conn->isValid();
}

std::unique_ptr<Connection> ConnectionPool::getConnectionFromPool() {
  std::unique_lock<std::mutex> lock(mutex_);

  // wait until an idle connection exists or a new one may be opened
  auto deadline = std::chrono::steady_clock::now() + cp_config_.timeout;

  while (pool_.empty() && active_connections_.load() >= cp_config_.max_connections && !shutdown_.load()) {
    if (condition_.wait_until(lock, deadline) == std::cv_status::timeout) {
      throw std::runtime_error("Connection pool timeout");
    }
  }

  if (shutdown_.load()) {
    throw std::runtime_error("Connection pool is shutting down");
  }

  std::unique_ptr<Connection> conn;

  while (!pool_.empty()) {
    conn = std::move(pool_.front());
    pool_.pop();
    if (validateConnection(conn.get())) {
      break;
    }
    conn.reset();
  }

  if (!conn && active_connections_.load() >= cp_config_.max_connections) {
    throw std::runtime_error("Connection pool exhausted");
  }

  if (!conn) {
    // reserve the slot before unlocking so concurrent callers cannot overshoot max_connections
    active_connections_.fetch_add(1);
    lock.unlock();
    conn = createConnection();
    lock.lock();

    if (!conn) {
      active_connections_.fetch_sub(1);
      condition_.notify_one();
      throw std::runtime_error("Failed to create connection");
    }
    return conn;
  }

  active_connections_.fetch_add(1);
  return conn;
}

void ConnectionPool::returnConnection(std::unique_ptr<Connection> conn) {
  if (!conn) return;
  std::lock_guard<std::mutex> lock(mutex_);

  active_connections_.fetch_sub(1);

  if (shutdown_.load() || !validateConnection(conn.get()) || pool_.size() >= cp_config_.min_connections) {
    conn.reset();
  } else {
    pool_.push(std::move(conn));
  }
  condition_.notify_one();
}

size_t ConnectionPool::availableConnections() const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto active = active_connections_.load();
  return active >= cp_config_.max_connections ? 0 : cp_config_.max_connections - active;
}

} // namespace common
