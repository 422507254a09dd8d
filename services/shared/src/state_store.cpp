#include "warden/shared/state_store.h"

#include <cstdint>
#include <iterator>
#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

#include <sw/redis++/redis++.h>

#include "redis_client.h"
#include "warden/shared/periodic_task.h"

namespace warden::shared {
namespace {

void ValidateEntry(const CsrfStateEntry& entry, std::chrono::seconds ttl) {
  if (entry.key.empty()) {
    throw SharedStoreError(SharedStoreError::Kind::InvalidArgument,
                           "state key is required");
  }
  if (entry.expires_at == TimePoint{} && ttl.count() <= 0) {
    throw SharedStoreError(SharedStoreError::Kind::InvalidArgument,
                           "state TTL must be positive");
  }
}

TimePoint ResolveExpiry(const CsrfStateEntry& entry, std::chrono::seconds ttl,
                        TimePoint now) {
  return entry.expires_at != TimePoint{} ? entry.expires_at : now + ttl;
}

// Owns the optional background sweep shared by both backends.
class CleanupRunner {
 public:
  void Start(const StateStoreOptions& options, std::function<std::size_t()> sweep) {
    if (!options.background_cleanup) {
      return;
    }
    auto report = options.on_cleanup;
    task_ = std::make_unique<PeriodicTask>(
        options.cleanup_interval, [sweep = std::move(sweep), report] {
          try {
            const auto removed = sweep();
            if (report) {
              report(removed, "");
            }
          } catch (const SharedStoreError& ex) {
            if (report) {
              report(0, ex.what());
            }
          }
        });
    task_->Start();
  }

  void Stop() {
    if (task_) {
      task_->Stop();
    }
  }

 private:
  std::unique_ptr<PeriodicTask> task_;
};

class InMemoryStateStore final : public StateStore {
 public:
  explicit InMemoryStateStore(StateStoreOptions options)
      : options_(std::move(options)) {
    cleanup_.Start(options_, [this] { return Cleanup(); });
  }

  ~InMemoryStateStore() override { cleanup_.Stop(); }

  using StateStore::Set;

  void Set(const CsrfStateEntry& entry, std::chrono::seconds ttl) override {
    ValidateEntry(entry, ttl);
    auto stored = entry;
    stored.expires_at = ResolveExpiry(entry, ttl, options_.clock());
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[stored.key] = std::move(stored);
  }

  std::optional<CsrfStateEntry> ValidateAndConsume(
      const std::string& key) override {
    const auto now = options_.clock();
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = entries_.find(key);
    if (it == entries_.end()) {
      return std::nullopt;
    }
    auto entry = std::move(it->second);
    entries_.erase(it);
    if (now >= entry.expires_at) {
      return std::nullopt;
    }
    return entry;
  }

  std::size_t Cleanup() override {
    const auto now = options_.clock();
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
      if (now >= it->second.expires_at) {
        it = entries_.erase(it);
        ++removed;
      } else {
        ++it;
      }
    }
    return removed;
  }

  void Stop() override { cleanup_.Stop(); }

  std::chrono::seconds default_ttl() const override {
    return options_.default_ttl;
  }

 private:
  StateStoreOptions options_;
  std::mutex mutex_;
  std::unordered_map<std::string, CsrfStateEntry> entries_;
  CleanupRunner cleanup_;
};

constexpr char kStateIndexKey[] = "warden:state:index";

std::string StateKey(const std::string& key) { return "warden:state:" + key; }

std::int64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

class RedisStateStore final : public StateStore {
 public:
  RedisStateStore(const std::string& redis_uri, StateStoreOptions options)
      : options_(std::move(options)), redis_(ConnectRedis(redis_uri)) {
    cleanup_.Start(options_, [this] { return Cleanup(); });
  }

  ~RedisStateStore() override { cleanup_.Stop(); }

  using StateStore::Set;

  void Set(const CsrfStateEntry& entry, std::chrono::seconds ttl) override {
    ValidateEntry(entry, ttl);
    const auto now = options_.clock();
    const auto expires_at = ResolveExpiry(entry, ttl, now);
    if (now >= expires_at) {
      return;
    }
    const auto key = StateKey(entry.key);
    std::unordered_map<std::string, std::string> fields;
    fields.emplace("provider", entry.provider);
    fields.emplace("redirect_uri", entry.redirect_uri);
    fields.emplace("code_verifier", entry.code_verifier);
    fields.emplace("nonce", entry.nonce);
    fields.emplace("expires_at_ms", std::to_string(ToUnixMillis(expires_at)));
    try {
      auto tx = redis_->transaction();
      tx.del(key)
          .hset(key, fields.begin(), fields.end())
          .pexpireat(key, static_cast<long long>(ToUnixMillis(expires_at)))
          .zadd(kStateIndexKey, entry.key,
                static_cast<double>(ToUnixSeconds(expires_at)));
      tx.exec();
    } catch (const sw::redis::Error& ex) {
      ThrowUnavailable(ex);
    }
  }

  std::optional<CsrfStateEntry> ValidateAndConsume(
      const std::string& key) override {
    const auto redis_key = StateKey(key);
    std::unordered_map<std::string, std::string> fields;
    try {
      auto tx = redis_->transaction();
      auto replies =
          tx.hgetall(redis_key).del(redis_key).zrem(kStateIndexKey, key).exec();
      replies.get(0, std::inserter(fields, fields.begin()));
    } catch (const sw::redis::Error& ex) {
      ThrowUnavailable(ex);
    }
    if (fields.empty()) {
      return std::nullopt;
    }
    CsrfStateEntry entry;
    entry.key = key;
    entry.provider = fields["provider"];
    entry.redirect_uri = fields["redirect_uri"];
    entry.code_verifier = fields["code_verifier"];
    entry.nonce = fields["nonce"];
    try {
      entry.expires_at =
          TimePoint(std::chrono::milliseconds(std::stoll(fields["expires_at_ms"])));
    } catch (const std::exception&) {
      throw SharedStoreError(SharedStoreError::Kind::Unavailable,
                             "corrupt state record");
    }
    if (options_.clock() >= entry.expires_at) {
      return std::nullopt;
    }
    return entry;
  }

  std::size_t Cleanup() override {
    const auto now = static_cast<double>(ToUnixSeconds(options_.clock()));
    const sw::redis::BoundedInterval<double> expired(
        0, now, sw::redis::BoundType::CLOSED);
    std::vector<std::string> keys;
    try {
      redis_->zrangebyscore(kStateIndexKey, expired, std::back_inserter(keys));
      for (const auto& key : keys) {
        redis_->del(StateKey(key));
      }
      redis_->zremrangebyscore(kStateIndexKey, expired);
    } catch (const sw::redis::Error& ex) {
      ThrowUnavailable(ex);
    }
    return keys.size();
  }

  void Stop() override { cleanup_.Stop(); }

  std::chrono::seconds default_ttl() const override {
    return options_.default_ttl;
  }

 private:
  StateStoreOptions options_;
  std::unique_ptr<sw::redis::Redis> redis_;
  CleanupRunner cleanup_;
};

}  // namespace

std::shared_ptr<StateStore> CreateStateStore(const SharedStoreConfig& config,
                                             StateStoreOptions options) {
  if (options.default_ttl.count() <= 0) {
    throw SharedStoreError(SharedStoreError::Kind::InvalidArgument,
                           "state TTL must be positive");
  }
  if (options.background_cleanup && options.cleanup_interval.count() <= 0) {
    throw SharedStoreError(SharedStoreError::Kind::InvalidArgument,
                           "state cleanup interval must be positive");
  }
  if (!options.clock) {
    options.clock = SystemClock();
  }
  if (config.backend == SharedStoreBackend::InMemory) {
    return std::make_shared<InMemoryStateStore>(std::move(options));
  }
  if (config.redis_uri.empty()) {
    throw SharedStoreError(SharedStoreError::Kind::InvalidArgument,
                           "redis URI is required for redis backend");
  }
  return std::make_shared<RedisStateStore>(config.redis_uri, std::move(options));
}

}  // namespace warden::shared
