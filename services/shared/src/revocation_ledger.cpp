#include "warden/shared/revocation_ledger.h"

#include <cstdint>
#include <iterator>
#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

#include <sw/redis++/redis++.h>

#include "redis_client.h"

namespace warden::shared {
namespace {

void ValidateEntry(const RevocationEntry& entry) {
  if (entry.token_id.empty()) {
    throw SharedStoreError(SharedStoreError::Kind::InvalidArgument,
                           "token id is required");
  }
  if (entry.expires_at == TimePoint{}) {
    throw SharedStoreError(SharedStoreError::Kind::InvalidArgument,
                           "revocation expiry is required");
  }
}

void ValidateUserId(const std::string& user_id) {
  if (user_id.empty()) {
    throw SharedStoreError(SharedStoreError::Kind::InvalidArgument,
                           "user id is required");
  }
}

// Cut-offs keep millisecond precision so that a token minted later in the
// same second as the revocation stays valid.
TimePoint TruncateToMillis(TimePoint tp) {
  return std::chrono::time_point_cast<std::chrono::milliseconds>(tp);
}

class InMemoryRevocationLedger final : public RevocationLedger {
 public:
  explicit InMemoryRevocationLedger(RevocationLedgerOptions options)
      : options_(std::move(options)) {}

  void Add(const RevocationEntry& entry) override {
    ValidateEntry(entry);
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[entry.token_id] = entry;
  }

  bool IsRevoked(const std::string& token_id) override {
    return Find(token_id).has_value();
  }

  std::optional<RevocationEntry> Find(const std::string& token_id) override {
    const auto now = options_.clock();
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = entries_.find(token_id);
    if (it == entries_.end() || now >= it->second.expires_at) {
      return std::nullopt;
    }
    return it->second;
  }

  void RevokeAllForUser(const std::string& user_id,
                        const std::string& /*reason*/) override {
    ValidateUserId(user_id);
    const auto now = options_.clock();
    std::lock_guard<std::mutex> lock(mutex_);
    user_cutoffs_[user_id] = UserCutoff{
        TruncateToMillis(now), now + options_.user_revocation_ttl};
  }

  bool IsUserRevoked(const std::string& user_id, TimePoint issued_at) override {
    const auto now = options_.clock();
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = user_cutoffs_.find(user_id);
    if (it == user_cutoffs_.end() || now >= it->second.expires_at) {
      return false;
    }
    return issued_at <= it->second.cutoff;
  }

  std::size_t DeleteExpired() override {
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
    for (auto it = user_cutoffs_.begin(); it != user_cutoffs_.end();) {
      if (now >= it->second.expires_at) {
        it = user_cutoffs_.erase(it);
      } else {
        ++it;
      }
    }
    return removed;
  }

 private:
  struct UserCutoff {
    TimePoint cutoff;
    TimePoint expires_at;
  };

  RevocationLedgerOptions options_;
  std::mutex mutex_;
  std::unordered_map<std::string, RevocationEntry> entries_;
  std::unordered_map<std::string, UserCutoff> user_cutoffs_;
};

constexpr char kExpiryIndexKey[] = "warden:revoked:index";

std::string RevokedKey(const std::string& token_id) {
  return "warden:revoked:" + token_id;
}

std::string UserCutoffKey(const std::string& user_id) {
  return "warden:revoked-user-ms:" + user_id;
}

class RedisRevocationLedger final : public RevocationLedger {
 public:
  RedisRevocationLedger(const std::string& redis_uri,
                        RevocationLedgerOptions options)
      : options_(std::move(options)), redis_(ConnectRedis(redis_uri)) {}

  void Add(const RevocationEntry& entry) override {
    ValidateEntry(entry);
    const auto now = options_.clock();
    if (now >= entry.expires_at) {
      return;
    }
    std::unordered_map<std::string, std::string> fields;
    fields.emplace("user_id", entry.user_id.value_or(""));
    fields.emplace("reason", entry.reason);
    fields.emplace("expires_at", std::to_string(ToUnixSeconds(entry.expires_at)));
    fields.emplace("revoked_at", std::to_string(ToUnixSeconds(entry.revoked_at)));
    const auto key = RevokedKey(entry.token_id);
    try {
      auto tx = redis_->transaction();
      tx.hset(key, fields.begin(), fields.end())
          .expireat(key, static_cast<long long>(
                                   ToUnixSeconds(entry.expires_at)))
          .zadd(kExpiryIndexKey, entry.token_id,
                static_cast<double>(ToUnixSeconds(entry.expires_at)));
      tx.exec();
    } catch (const sw::redis::Error& ex) {
      ThrowUnavailable(ex);
    }
  }

  bool IsRevoked(const std::string& token_id) override {
    return Find(token_id).has_value();
  }

  std::optional<RevocationEntry> Find(const std::string& token_id) override {
    std::unordered_map<std::string, std::string> fields;
    try {
      redis_->hgetall(RevokedKey(token_id),
                      std::inserter(fields, fields.begin()));
    } catch (const sw::redis::Error& ex) {
      ThrowUnavailable(ex);
    }
    if (fields.empty()) {
      return std::nullopt;
    }
    RevocationEntry entry;
    entry.token_id = token_id;
    if (!fields["user_id"].empty()) {
      entry.user_id = fields["user_id"];
    }
    entry.reason = fields["reason"];
    entry.expires_at = ParseSeconds(fields["expires_at"]);
    entry.revoked_at = ParseSeconds(fields["revoked_at"]);
    if (options_.clock() >= entry.expires_at) {
      return std::nullopt;
    }
    return entry;
  }

  void RevokeAllForUser(const std::string& user_id,
                        const std::string& /*reason*/) override {
    ValidateUserId(user_id);
    const auto cutoff = ToUnixMillis(options_.clock());
    try {
      redis_->set(UserCutoffKey(user_id), std::to_string(cutoff),
                  std::chrono::duration_cast<std::chrono::milliseconds>(
                      options_.user_revocation_ttl));
    } catch (const sw::redis::Error& ex) {
      ThrowUnavailable(ex);
    }
  }

  bool IsUserRevoked(const std::string& user_id, TimePoint issued_at) override {
    sw::redis::OptionalString value;
    try {
      value = redis_->get(UserCutoffKey(user_id));
    } catch (const sw::redis::Error& ex) {
      ThrowUnavailable(ex);
    }
    if (!value) {
      return false;
    }
    return issued_at <= ParseMillis(*value);
  }

  std::size_t DeleteExpired() override {
    const auto now = static_cast<double>(ToUnixSeconds(options_.clock()));
    const sw::redis::BoundedInterval<double> expired(
        0, now, sw::redis::BoundType::CLOSED);
    std::vector<std::string> token_ids;
    try {
      redis_->zrangebyscore(kExpiryIndexKey, expired,
                            std::back_inserter(token_ids));
      for (const auto& token_id : token_ids) {
        redis_->del(RevokedKey(token_id));
      }
      redis_->zremrangebyscore(kExpiryIndexKey, expired);
    } catch (const sw::redis::Error& ex) {
      ThrowUnavailable(ex);
    }
    return token_ids.size();
  }

 private:
  static std::int64_t ParseInteger(const std::string& value) {
    try {
      return static_cast<std::int64_t>(std::stoll(value));
    } catch (const std::exception&) {
      throw SharedStoreError(SharedStoreError::Kind::Unavailable,
                             "corrupt revocation timestamp");
    }
  }

  static TimePoint ParseSeconds(const std::string& value) {
    return value.empty() ? TimePoint{} : FromUnixSeconds(ParseInteger(value));
  }

  static TimePoint ParseMillis(const std::string& value) {
    return value.empty() ? TimePoint{} : FromUnixMillis(ParseInteger(value));
  }

  RevocationLedgerOptions options_;
  std::unique_ptr<sw::redis::Redis> redis_;
};

}  // namespace

std::shared_ptr<RevocationLedger> CreateRevocationLedger(
    const SharedStoreConfig& config, RevocationLedgerOptions options) {
  if (options.user_revocation_ttl.count() <= 0) {
    throw SharedStoreError(SharedStoreError::Kind::InvalidArgument,
                           "user revocation TTL must be positive");
  }
  if (!options.clock) {
    options.clock = SystemClock();
  }
  if (config.backend == SharedStoreBackend::InMemory) {
    return std::make_shared<InMemoryRevocationLedger>(std::move(options));
  }
  if (config.redis_uri.empty()) {
    throw SharedStoreError(SharedStoreError::Kind::InvalidArgument,
                           "redis URI is required for redis backend");
  }
  return std::make_shared<RedisRevocationLedger>(config.redis_uri,
                                                 std::move(options));
}

}  // namespace warden::shared
