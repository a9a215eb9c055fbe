#include "redis_job_queue.hpp"
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <nlohmann/json.hpp>
#include <uuid/uuid.h>

namespace transcode_service {

namespace {

std::string newMessageId() {
  uuid_t uuid;
  uuid_generate(uuid);
  char uuid_str[37];
  uuid_unparse(uuid, uuid_str);
  return uuid_str;
}

long long epochMillis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::system_clock::now().time_since_epoch()).count();
}

std::expected<void, std::string> checkReply(const common::RedisConnection& conn,
                                            const common::RedisReplyPtr& reply,
                                            const std::string& what) {
  if (!reply) {
    return std::unexpected(what + " failed: " + conn.errorString());
  }
  if (reply->type == REDIS_REPLY_ERROR) {
    return std::unexpected(what + " failed: " + std::string(reply->str, reply->len));
  }
  return {};
}

// Envelope written by publish(); anything else is handed over verbatim
Delivery unwrap(const std::string& raw) {
  try {
    auto envelope = nlohmann::json::parse(raw);
    if (envelope.is_object() && envelope.contains("body") && envelope["body"].is_string()) {
      return Delivery{
        .message_id = envelope.value("message_id", std::string{}),
        .body = envelope["body"].get<std::string>()
      };
    }
  } catch (const std::exception&) {
  }
  return Delivery{.message_id = "", .body = raw};
}

const char* kRenewScript =
  "if redis.call('GET', KEYS[1]) == ARGV[1] then return redis.call('PEXPIRE', KEYS[1], ARGV[2]) end return 0";
const char* kReleaseScript =
  "if redis.call('GET', KEYS[1]) == ARGV[1] then return redis.call('DEL', KEYS[1]) end return 0";

constexpr std::chrono::milliseconds kClaimRetry{5000};

void pause(const std::stop_token& stop, std::chrono::milliseconds duration) {
  std::mutex mtx;
  std::condition_variable_any cv;
  std::unique_lock<std::mutex> lock(mtx);
  cv.wait_for(lock, stop, duration, [] { return false; });
}

} // namespace

RedisJobQueue::RedisJobQueue(config::RedisConfig redis, config::ConnectionPoolConfig pool, std::string consumer_tag)
  : redis_cfg_(std::move(redis)),
    pool_cfg_(pool),
    consumer_tag_(std::move(consumer_tag)),
    instance_id_(newMessageId()) {}

RedisJobQueue::~RedisJobQueue() {
  stop();
}

std::string RedisJobQueue::processingKey(const std::string& queue, const std::string& tag, unsigned int slot) {
  return queue + ":processing:" + tag + ":" + std::to_string(slot);
}

std::string RedisJobQueue::ownerKey(const std::string& processing) {
  return processing + ":owner";
}

std::expected<void, std::string> RedisJobQueue::connect() {
  std::lock_guard<std::mutex> lock(init_mutex_);
  if (connected()) {
    return {};
  }

  try {
    auto pool = std::make_unique<common::RedisConnectionPool>(redis_cfg_, pool_cfg_);
    {
      common::RedisConnectionGuard conn(*pool);
      if (!conn.connection().isValid()) {
        return std::unexpected<std::string>("redis did not answer PING");
      }
    }
    pool_ = std::move(pool);
  } catch (const std::exception& e) {
    return std::unexpected(std::string("Failed to connect queue transport: ") + e.what());
  }

  connected_.store(true, std::memory_order_release);
  std::cout << "[Queue] connected to redis " << redis_cfg_.host << ":" << redis_cfg_.port
            << "/" << redis_cfg_.db << std::endl;
  return {};
}

std::expected<void, std::string> RedisJobQueue::assertQueue(const std::string& queue, bool durable) {
  if (!connected()) {
    return std::unexpected<std::string>(kQueueNotInitialized);
  }

  try {
    common::RedisConnectionGuard guard(*pool_);
    auto& conn = guard.connection();
    const auto meta = queue + ":meta";
    auto reply = conn.command("HSET %b durable %d declared_at %lld",
                              meta.data(), meta.size(), durable ? 1 : 0, epochMillis());
    if (auto ok = checkReply(conn, reply, "HSET " + meta); !ok) {
      return ok;
    }

    if (durable) {
      auto aof = conn.command("CONFIG GET appendonly");
      if (!aof || aof->type != REDIS_REPLY_ARRAY) {
        std::cerr << "[Queue] cannot verify broker persistence for durable queue " << queue << std::endl;
      } else if (aof->elements == 2 && aof->element[1]->type == REDIS_REPLY_STRING &&
                 std::string(aof->element[1]->str, aof->element[1]->len) != "yes") {
        std::cerr << "[Queue] appendonly is disabled: queue " << queue
                  << " will not survive a broker restart" << std::endl;
      }
    }
  } catch (const std::exception& e) {
    return std::unexpected(std::string("assertQueue failed: ") + e.what());
  }
  return {};
}

std::expected<void, std::string> RedisJobQueue::publish(const std::string& queue, const std::string& payload, bool persistent) {
  if (!connected()) {
    return std::unexpected<std::string>(kQueueNotInitialized);
  }

  nlohmann::json envelope = {
    {"message_id", newMessageId()},
    {"persistent", persistent},
    {"published_at", epochMillis()},
    {"body", payload}
  };
  const auto raw = envelope.dump();

  try {
    common::RedisConnectionGuard guard(*pool_);
    auto& conn = guard.connection();
    auto reply = conn.command("LPUSH %b %b", queue.data(), queue.size(), raw.data(), raw.size());
    return checkReply(conn, reply, "LPUSH " + queue);
  } catch (const std::exception& e) {
    return std::unexpected(std::string("publish failed: ") + e.what());
  }
}

std::expected<long, std::string> RedisJobQueue::depth(const std::string& queue) {
  if (!connected()) {
    return std::unexpected<std::string>(kQueueNotInitialized);
  }

  try {
    common::RedisConnectionGuard guard(*pool_);
    auto& conn = guard.connection();
    auto reply = conn.command("LLEN %b", queue.data(), queue.size());
    if (auto ok = checkReply(conn, reply, "LLEN " + queue); !ok) {
      return std::unexpected(ok.error());
    }
    if (reply->type != REDIS_REPLY_INTEGER) {
      return std::unexpected<std::string>("LLEN " + queue + " returned a non-integer reply");
    }
    return static_cast<long>(reply->integer);
  } catch (const std::exception& e) {
    return std::unexpected(std::string("depth failed: ") + e.what());
  }
}

std::expected<void, std::string> RedisJobQueue::consume(const std::string& queue, unsigned int prefetch, DeliveryHandler handler) {
  if (!connected()) {
    return std::unexpected<std::string>(kQueueNotInitialized);
  }
  if (prefetch == 0) {
    return std::unexpected<std::string>("prefetch must be at least 1");
  }
  if (!handler) {
    return std::unexpected<std::string>("consume requires a handler");
  }

  std::lock_guard<std::mutex> lock(consumers_mutex_);
  // one slot per prefetch unit, each with at most one unacknowledged delivery
  for (unsigned int i = 0; i < prefetch; ++i) {
    auto processing = processingKey(queue, consumer_tag_, next_slot_++);
    consumers_.emplace_back([this, queue, processing, handler](std::stop_token stop) {
      slotLoop(stop, queue, processing, handler);
    });
  }
  return {};
}

void RedisJobQueue::stop() {
  std::vector<std::jthread> consumers;
  {
    std::lock_guard<std::mutex> lock(consumers_mutex_);
    consumers.swap(consumers_);
  }
  for (auto& consumer : consumers) {
    consumer.request_stop();
  }
  // joined on destruction
  consumers.clear();
}

size_t RedisJobQueue::activeConnections() const {
  return connected() ? pool_->activeConnections() : 0;
}

void RedisJobQueue::slotLoop(std::stop_token stop, std::string queue, std::string processing, DeliveryHandler handler) {
  std::cout << "[Queue] consumer slot " << processing << " attached to " << queue << std::endl;

  bool waiting = false;
  while (!stop.stop_requested()) {
    std::unique_ptr<common::RedisConnectionGuard> guard;
    try {
      guard = std::make_unique<common::RedisConnectionGuard>(*pool_);
    } catch (const std::exception& e) {
      std::cerr << "[Queue] consumer slot " << processing << " has no connection: " << e.what() << std::endl;
      pause(stop, std::chrono::seconds(1));
      continue;
    }
    auto& conn = guard->connection();

    auto claimed = claimSlot(conn, processing);
    if (!claimed || !*claimed) {
      if (!claimed) {
        std::cerr << "[Queue] " << claimed.error() << std::endl;
      } else if (!waiting) {
        std::cerr << "[Queue] " << processing << " is held by another consumer, waiting for it to lapse"
                  << " (CONSUMER_TAG must be unique per process)" << std::endl;
      }
      waiting = claimed.has_value();
      guard.reset();
      pause(stop, kClaimRetry);
      continue;
    }
    waiting = false;
    std::jthread lease([this, processing](std::stop_token lease_stop) {
      holdSlot(lease_stop, processing);
    });

    if (auto recovered = recoverUnacked(conn, queue, processing); !recovered) {
      std::cerr << "[Queue] " << recovered.error() << std::endl;
      lease = std::jthread();
      guard.reset();
      pause(stop, std::chrono::seconds(1));
      continue;
    } else if (*recovered > 0) {
      std::cout << "[Queue] returned " << *recovered << " unacknowledged deliveries to " << queue << std::endl;
    }

    while (!stop.stop_requested()) {
      // one second block so that stop requests are observed
      auto reply = conn.command("BRPOPLPUSH %b %b %d",
                                queue.data(), queue.size(), processing.data(), processing.size(), 1);
      if (!reply) {
        std::cerr << "[Queue] consumer connection lost: " << conn.errorString() << std::endl;
        break;
      }
      if (reply->type == REDIS_REPLY_NIL) {
        continue;
      }
      if (reply->type != REDIS_REPLY_STRING) {
        std::cerr << "[Queue] unexpected reply to BRPOPLPUSH"
                  << (reply->type == REDIS_REPLY_ERROR ? ": " + std::string(reply->str, reply->len) : "")
                  << std::endl;
        pause(stop, std::chrono::seconds(1));
        continue;
      }

      const std::string raw(reply->str, reply->len);
      reply.reset();
      const auto delivery = unwrap(raw);

      auto outcome = DeliveryOutcome::reject(false);
      try {
        outcome = handler(delivery);
      } catch (const std::exception& e) {
        std::cerr << "[Queue] handler threw for message " << delivery.message_id << ", rejecting: "
                  << e.what() << std::endl;
      }

      if (auto settled = settle(conn, queue, processing, raw, outcome); !settled) {
        // stays in the processing list; recovery returns it to the queue
        std::cerr << "[Queue] could not settle message " << delivery.message_id << ": "
                  << settled.error() << std::endl;
        break;
      }
    }

    lease = std::jthread();
    if (stop.stop_requested()) {
      releaseSlot(conn, processing);
    }
    guard.reset();
    if (!stop.stop_requested()) {
      pause(stop, std::chrono::seconds(1));
    }
  }

  std::cout << "[Queue] consumer slot " << processing << " stopped" << std::endl;
}

std::expected<bool, std::string> RedisJobQueue::claimSlot(common::RedisConnection& conn,
                                                          const std::string& processing) {
  const auto owner = ownerKey(processing);
  const auto lease = static_cast<long long>(kSlotLease.count());
  auto reply = conn.command("SET %b %b NX PX %lld", owner.data(), owner.size(),
                            instance_id_.data(), instance_id_.size(), lease);
  if (auto ok = checkReply(conn, reply, "SET " + owner); !ok) {
    return std::unexpected(ok.error());
  }
  if (reply->type == REDIS_REPLY_STATUS) {
    return true;
  }

  // already ours when this process reconnects after losing its connection
  auto renewed = conn.command("EVAL %s 1 %b %b %lld", kRenewScript, owner.data(), owner.size(),
                              instance_id_.data(), instance_id_.size(), lease);
  if (auto ok = checkReply(conn, renewed, "EVAL renew " + owner); !ok) {
    return std::unexpected(ok.error());
  }
  return renewed->type == REDIS_REPLY_INTEGER && renewed->integer == 1;
}

void RedisJobQueue::holdSlot(std::stop_token stop, const std::string& processing) {
  const auto owner = ownerKey(processing);
  while (!stop.stop_requested()) {
    pause(stop, kSlotLease / 3);
    if (stop.stop_requested()) {
      break;
    }
    try {
      common::RedisConnectionGuard guard(*pool_);
      auto& conn = guard.connection();
      auto reply = conn.command("EVAL %s 1 %b %b %lld", kRenewScript, owner.data(), owner.size(),
                                instance_id_.data(), instance_id_.size(),
                                static_cast<long long>(kSlotLease.count()));
      if (auto ok = checkReply(conn, reply, "EVAL renew " + owner); !ok) {
        std::cerr << "[Queue] " << ok.error() << std::endl;
      } else if (reply->type == REDIS_REPLY_INTEGER && reply->integer == 0) {
        std::cerr << "[Queue] claim on " << processing << " was lost" << std::endl;
      }
    } catch (const std::exception& e) {
      std::cerr << "[Queue] cannot renew claim on " << processing << ": " << e.what() << std::endl;
    }
  }
}

void RedisJobQueue::releaseSlot(common::RedisConnection& conn, const std::string& processing) {
  const auto owner = ownerKey(processing);
  auto reply = conn.command("EVAL %s 1 %b %b", kReleaseScript, owner.data(), owner.size(),
                            instance_id_.data(), instance_id_.size());
  if (auto ok = checkReply(conn, reply, "EVAL release " + owner); !ok) {
    // expires on its own
    std::cerr << "[Queue] " << ok.error() << std::endl;
  }
}

std::expected<size_t, std::string> RedisJobQueue::recoverUnacked(common::RedisConnection& conn,
                                                                 const std::string& queue,
                                                                 const std::string& processing) {
  auto pending = conn.command("LRANGE %b 0 -1", processing.data(), processing.size());
  if (auto ok = checkReply(conn, pending, "LRANGE " + processing); !ok) {
    return std::unexpected(ok.error());
  }
  if (pending->type != REDIS_REPLY_ARRAY || pending->elements == 0) {
    return 0;
  }

  // processing lists grow at the head, so pushing in LRANGE order puts the oldest delivery next in line
  auto multi = conn.command("MULTI");
  if (auto ok = checkReply(conn, multi, "MULTI"); !ok) {
    return std::unexpected(ok.error());
  }
  for (size_t i = 0; i < pending->elements; ++i) {
    const auto* item = pending->element[i];
    auto queued = conn.command("RPUSH %b %b", queue.data(), queue.size(), item->str, item->len);
    if (auto ok = checkReply(conn, queued, "RPUSH " + queue); !ok) {
      conn.command("DISCARD");
      return std::unexpected(ok.error());
    }
  }
  auto del = conn.command("DEL %b", processing.data(), processing.size());
  if (auto ok = checkReply(conn, del, "DEL " + processing); !ok) {
    conn.command("DISCARD");
    return std::unexpected(ok.error());
  }
  auto exec = conn.command("EXEC");
  if (auto ok = checkReply(conn, exec, "EXEC"); !ok) {
    return std::unexpected(ok.error());
  }
  if (exec->type != REDIS_REPLY_ARRAY) {
    return std::unexpected<std::string>("recovery transaction for " + processing + " was aborted");
  }
  return pending->elements;
}

std::expected<void, std::string> RedisJobQueue::settle(common::RedisConnection& conn,
                                                       const std::string& queue,
                                                       const std::string& processing,
                                                       const std::string& raw,
                                                       const DeliveryOutcome& outcome) {
  if (outcome.kind == DeliveryOutcome::Kind::Reject && outcome.requeue) {
    auto multi = conn.command("MULTI");
    if (auto ok = checkReply(conn, multi, "MULTI"); !ok) {
      return ok;
    }
    auto removed = conn.command("LREM %b 1 %b", processing.data(), processing.size(), raw.data(), raw.size());
    if (auto ok = checkReply(conn, removed, "LREM " + processing); !ok) {
      conn.command("DISCARD");
      return ok;
    }
    // back to the consumption end: redelivered before newer messages
    auto requeued = conn.command("RPUSH %b %b", queue.data(), queue.size(), raw.data(), raw.size());
    if (auto ok = checkReply(conn, requeued, "RPUSH " + queue); !ok) {
      conn.command("DISCARD");
      return ok;
    }
    auto exec = conn.command("EXEC");
    if (auto ok = checkReply(conn, exec, "EXEC"); !ok) {
      return ok;
    }
    if (exec->type != REDIS_REPLY_ARRAY) {
      return std::unexpected<std::string>("requeue transaction was aborted");
    }
    return {};
  }

  // Ack and reject-without-requeue both drop the delivery for good
  auto removed = conn.command("LREM %b 1 %b", processing.data(), processing.size(), raw.data(), raw.size());
  return checkReply(conn, removed, "LREM " + processing);
}

} // namespace transcode_service
