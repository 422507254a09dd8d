#include "warden/shared/replay_ledger.h"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <unordered_map>
#include <utility>

#include <sw/redis++/redis++.h>

#include "redis_client.h"

namespace warden::shared {
namespace {

void ValidateId(const std::string& id) {
  if (id.empty()) {
    throw SharedStoreError(SharedStoreError::Kind::InvalidArgument,
                           "replay id is required");
  }
}

class InMemoryReplayLedger final : public ReplayLedger {
 public:
  explicit InMemoryReplayLedger(Clock clock) : clock_(std::move(clock)) {}

  bool InsertIfAbsent(const std::string& id, TimePoint first_seen,
                      TimePoint expires_at) override {
    ValidateId(id);
    const auto now = clock_();
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = records_.find(id);
    if (it != records_.end() && now < it->second.expires_at) {
      return false;
    }
    records_[id] = Record{first_seen, expires_at};
    return true;
  }

  std::optional<TimePoint> FirstSeen(const std::string& id) override {
    const auto now = clock_();
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = records_.find(id);
    if (it == records_.end() || now >= it->second.expires_at) {
      return std::nullopt;
    }
    return it->second.first_seen;
  }

  std::size_t DeleteExpired() override {
    const auto now = clock_();
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t removed = 0;
    for (auto it = records_.begin(); it != records_.end();) {
      if (now >= it->second.expires_at) {
        it = records_.erase(it);
        ++removed;
      } else {
        ++it;
      }
    }
    return removed;
  }

 private:
  struct Record {
    TimePoint first_seen;
    TimePoint expires_at;
  };

  Clock clock_;
  std::mutex mutex_;
  std::unordered_map<std::string, Record> records_;
};

std::string ReplayKey(const std::string& id) { return "warden:replay:" + id; }

std::int64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

class RedisReplayLedger final : public ReplayLedger {
 public:
  RedisReplayLedger(const std::string& redis_uri, Clock clock)
      : clock_(std::move(clock)), redis_(ConnectRedis(redis_uri)) {}

  bool InsertIfAbsent(const std::string& id, TimePoint first_seen,
                      TimePoint expires_at) override {
    ValidateId(id);
    const auto ttl = std::max(
        std::chrono::milliseconds(1000),
        std::chrono::duration_cast<std::chrono::milliseconds>(expires_at -
                                                              clock_()));
    try {
      return redis_->set(ReplayKey(id), std::to_string(ToUnixMillis(first_seen)),
                         ttl, sw::redis::UpdateType::NOT_EXIST);
    } catch (const sw::redis::Error& ex) {
      ThrowUnavailable(ex);
    }
  }

  std::optional<TimePoint> FirstSeen(const std::string& id) override {
    sw::redis::OptionalString value;
    try {
      value = redis_->get(ReplayKey(id));
    } catch (const sw::redis::Error& ex) {
      ThrowUnavailable(ex);
    }
    if (!value) {
      return std::nullopt;
    }
    try {
      return TimePoint(std::chrono::milliseconds(std::stoll(*value)));
    } catch (const std::exception&) {
      throw SharedStoreError(SharedStoreError::Kind::Unavailable,
                             "corrupt replay record");
    }
  }

  // Keys are written with a PX expiry, so Redis drops them server-side.
  std::size_t DeleteExpired() override { return 0; }

 private:
  Clock clock_;
  std::unique_ptr<sw::redis::Redis> redis_;
};

}  // namespace

std::shared_ptr<ReplayLedger> CreateReplayLedger(
    const SharedStoreConfig& config, Clock clock) {
  if (!clock) {
    clock = SystemClock();
  }
  if (config.backend == SharedStoreBackend::InMemory) {
    return std::make_shared<InMemoryReplayLedger>(std::move(clock));
  }
  if (config.redis_uri.empty()) {
    throw SharedStoreError(SharedStoreError::Kind::InvalidArgument,
                           "redis URI is required for redis backend");
  }
  return std::make_shared<RedisReplayLedger>(config.redis_uri,
                                             std::move(clock));
}

}  // namespace warden::shared
