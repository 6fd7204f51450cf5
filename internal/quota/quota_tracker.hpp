#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace workflow::quota {

struct QuotaCounter {
  std::int64_t used      = 0;
  std::int64_t limit     = 0;
  std::int64_t remaining = 0;
};

struct CostTracking {
  std::int64_t total_tokens   = 0;
  std::int64_t input_tokens   = 0;
  std::int64_t output_tokens  = 0;
  std::int64_t image_count    = 0;
  std::int64_t total_requests = 0;
  double       total_cost_usd = 0.0;
};

// Self-reported status of one external service, keyed by quota type
// ("tokens_per_minute", "requests_per_day", ...).
struct QuotaUsage {
  std::map<std::string, QuotaCounter> quotas;
  CostTracking                        cost;
};

struct QuotaCheck {
  std::vector<std::string> exhausted_types;
  util::TimePoint          reset_at;
  std::int64_t             wait_seconds = 0;

  bool Exceeded() const {
    return !exhausted_types.empty();
  }
};

struct UsageBucket {
  util::TimePoint hour;
  std::size_t     snapshots      = 0;
  std::int64_t    total_tokens   = 0;
  double          total_cost_usd = 0.0;
  double          avg_tokens     = 0.0;

  // Snapshots reported by items that are parked on quota right now.
  std::size_t quota_exceeded = 0;
};

/*
  QuotaTracker

  "Latest snapshot wins": the most recent usage snapshot inside the
  recency window is the service's current status; no snapshot means
  unconstrained. A quota type is exhausted when its reported
  `remaining` is <= 0 and its limit row is active (types without a
  limit row count as active).

  Reset times are clock aligned: the next full minute for *_minute
  types, the next UTC midnight for *_day types, now otherwise. The
  configured window_seconds does not move them.
*/
class QuotaTracker {
 public:
  struct Options {
    std::chrono::seconds recency_window{std::chrono::hours(24)};
  };

  QuotaTracker(std::shared_ptr<db::Repository> repository, std::shared_ptr<const util::Clock> clock, Options options);
  QuotaTracker(std::shared_ptr<db::Repository> repository, std::shared_ptr<const util::Clock> clock);

  void RecordUsage(const std::string& service_name, const QuotaUsage& usage, const std::optional<std::string>& workflow_id = std::nullopt);
  void RecordUsage(db::Transaction& tx, const std::string& service_name, const QuotaUsage& usage,
                   const std::optional<std::string>& workflow_id = std::nullopt);

  std::optional<QuotaUsage> CurrentUsage(const std::string& service_name);
  std::optional<QuotaUsage> CurrentUsage(db::Transaction& tx, const std::string& service_name);

  bool                     IsExceeded(const std::string& service_name, const std::string& quota_type);
  std::vector<std::string> ExceededTypes(const std::string& service_name);
  std::vector<std::string> ExceededTypes(db::Transaction& tx, const std::string& service_name);

  // Earliest reset among exhausted types; now when nothing is exhausted.
  util::TimePoint EstimateResetTime(const std::string& service_name);

  QuotaCheck CheckQuota(const std::string& service_name);
  QuotaCheck CheckQuota(db::Transaction& tx, const std::string& service_name);

  // Throws util::QuotaExceeded when any quota type is exhausted.
  void Require(const std::string& service_name);

  // ------------------------------------------------------------------
  // Limits
  // ------------------------------------------------------------------

  void UpsertLimit(const std::string& service_name, const std::string& quota_type, std::int64_t limit_value, std::int64_t window_seconds,
                   bool is_active = true);
  std::vector<db::model::QuotaLimitRecord> ListLimits(const std::string& service_name = {});

  // Insert-if-absent; returns the number of rows created.
  std::size_t SeedLimits(const std::vector<db::model::QuotaLimitRecord>& limits);
  std::size_t SeedDefaultLimits();

  static std::vector<db::model::QuotaLimitRecord> DefaultLimits();

  // Hourly buckets of snapshots over [now - window, now], oldest first.
  std::vector<UsageBucket> UsageSummary(const std::string& service_name, std::chrono::hours window);

  // usage_data JSON document.
  static std::string EncodeUsage(const std::string& service_name, const QuotaUsage& usage);
  static QuotaUsage  DecodeUsage(const std::string& usage_data);

 private:
  util::TimePoint ResetTimeFor(const std::string& quota_type, util::TimePoint now) const;
  uint64_t        RecencyCutoffMs() const;

  std::shared_ptr<db::Repository>    repository_;
  std::shared_ptr<const util::Clock> clock_;
  Options                            options_;
};

} // namespace workflow::quota
