#include "quota_tracker.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "internal/model/payload_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace workflow::quota {

namespace {

using google::protobuf::Struct;

bool EndsWith(const std::string& value, std::string_view suffix) {
  return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

void SetNumber(Struct& out, const std::string& key, double value) {
  (*out.mutable_fields())[key].set_number_value(value);
}

double Number(const Struct& in, const std::string& key) {
  const auto it = in.fields().find(key);
  if (it == in.fields().end() || it->second.kind_case() != google::protobuf::Value::kNumberValue) return 0.0;
  return it->second.number_value();
}

std::int64_t Integer(const Struct& in, const std::string& key) {
  return static_cast<std::int64_t>(std::llround(Number(in, key)));
}

const Struct* Child(const Struct& in, const std::string& key) {
  const auto it = in.fields().find(key);
  if (it == in.fields().end() || it->second.kind_case() != google::protobuf::Value::kStructValue) return nullptr;
  return &it->second.struct_value();
}

db::model::QuotaLimitRecord MakeLimit(const std::string& service_name, const std::string& quota_type, std::int64_t limit_value,
                                      std::int64_t window_seconds, bool is_active = true) {
  db::model::QuotaLimitRecord limit;
  limit.service_name   = service_name;
  limit.quota_type     = quota_type;
  limit.limit_value    = limit_value;
  limit.window_seconds = window_seconds;
  limit.is_active      = is_active;
  return limit;
}

} // namespace

QuotaTracker::QuotaTracker(std::shared_ptr<db::Repository> repository, std::shared_ptr<const util::Clock> clock, Options options)
    : repository_(std::move(repository)), clock_(std::move(clock)), options_(options) {
  if (options_.recency_window.count() <= 0) throw std::invalid_argument("quota tracker: recency window must be positive");
}

QuotaTracker::QuotaTracker(std::shared_ptr<db::Repository> repository, std::shared_ptr<const util::Clock> clock)
    : QuotaTracker(std::move(repository), std::move(clock), Options{}) {
}

// ------------------------------------------------------------------
// usage_data codec
// ------------------------------------------------------------------

std::string QuotaTracker::EncodeUsage(const std::string& service_name, const QuotaUsage& usage) {
  Struct doc;
  (*doc.mutable_fields())["service"].set_string_value(service_name);

  auto* quotas = (*doc.mutable_fields())["quotas"].mutable_struct_value();
  for (const auto& [type, counter] : usage.quotas) {
    auto* entry = (*quotas->mutable_fields())[type].mutable_struct_value();
    SetNumber(*entry, "used", static_cast<double>(counter.used));
    SetNumber(*entry, "limit", static_cast<double>(counter.limit));
    SetNumber(*entry, "remaining", static_cast<double>(counter.remaining));
  }

  auto* cost = (*doc.mutable_fields())["cost_tracking"].mutable_struct_value();
  SetNumber(*cost, "total_tokens", static_cast<double>(usage.cost.total_tokens));
  SetNumber(*cost, "total_requests", static_cast<double>(usage.cost.total_requests));
  SetNumber(*cost, "total_cost_usd", usage.cost.total_cost_usd);
  auto* breakdown = (*cost->mutable_fields())["breakdown"].mutable_struct_value();
  SetNumber(*breakdown, "input_tokens", static_cast<double>(usage.cost.input_tokens));
  SetNumber(*breakdown, "output_tokens", static_cast<double>(usage.cost.output_tokens));
  SetNumber(*breakdown, "image_count", static_cast<double>(usage.cost.image_count));

  return model::PrintObject(doc);
}

QuotaUsage QuotaTracker::DecodeUsage(const std::string& usage_data) {
  const auto doc = model::ParseObject(usage_data);

  QuotaUsage usage;
  if (const auto* quotas = Child(doc, "quotas")) {
    for (const auto& [type, value] : quotas->fields()) {
      if (value.kind_case() != google::protobuf::Value::kStructValue) continue;
      const auto&  entry = value.struct_value();
      QuotaCounter counter;
      counter.used  = Integer(entry, "used");
      counter.limit = Integer(entry, "limit");
      // Callers may report used/limit only.
      counter.remaining = entry.fields().count("remaining") ? Integer(entry, "remaining") : std::max<std::int64_t>(0, counter.limit - counter.used);
      usage.quotas.emplace(type, counter);
    }
  }

  if (const auto* cost = Child(doc, "cost_tracking")) {
    usage.cost.total_tokens   = Integer(*cost, "total_tokens");
    usage.cost.total_requests = Integer(*cost, "total_requests");
    usage.cost.total_cost_usd = Number(*cost, "total_cost_usd");
    if (const auto* breakdown = Child(*cost, "breakdown")) {
      usage.cost.input_tokens  = Integer(*breakdown, "input_tokens");
      usage.cost.output_tokens = Integer(*breakdown, "output_tokens");
      usage.cost.image_count   = Integer(*breakdown, "image_count");
    }
  }
  return usage;
}

// ------------------------------------------------------------------
// Snapshots
// ------------------------------------------------------------------

uint64_t QuotaTracker::RecencyCutoffMs() const {
  const uint64_t now    = clock_->NowMillis();
  const uint64_t window = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(options_.recency_window).count());
  return now > window ? now - window : 0;
}

void QuotaTracker::RecordUsage(db::Transaction& tx, const std::string& service_name, const QuotaUsage& usage,
                               const std::optional<std::string>& workflow_id) {
  if (service_name.empty()) throw std::invalid_argument("record usage: service name must not be empty");

  db::model::QuotaUsageRecord record;
  record.log_id        = util::NewId();
  record.workflow_id   = workflow_id;
  record.service_name  = service_name;
  record.usage_data    = EncodeUsage(service_name, usage);
  record.created_at_ms = clock_->NowMillis();
  db::ThrowIfDbError(repository_->InsertQuotaUsage(tx, record), "record quota usage");
}

void QuotaTracker::RecordUsage(const std::string& service_name, const QuotaUsage& usage, const std::optional<std::string>& workflow_id) {
  auto tx = repository_->Begin();
  RecordUsage(*tx, service_name, usage, workflow_id);
  tx->Commit();

  WORKFLOW_LOG_DEBUG("quota usage recorded", {observability::StringField("service", service_name),
                                              observability::IntField("total_tokens", usage.cost.total_tokens),
                                              observability::IntField("total_requests", usage.cost.total_requests)});
}

std::optional<QuotaUsage> QuotaTracker::CurrentUsage(db::Transaction& tx, const std::string& service_name) {
  auto latest = repository_->LatestQuotaUsage(tx, service_name, RecencyCutoffMs());
  if (!latest) return std::nullopt;
  return DecodeUsage(latest->usage_data);
}

std::optional<QuotaUsage> QuotaTracker::CurrentUsage(const std::string& service_name) {
  auto tx    = repository_->Begin();
  auto usage = CurrentUsage(*tx, service_name);
  tx->Commit();
  return usage;
}

std::vector<std::string> QuotaTracker::ExceededTypes(db::Transaction& tx, const std::string& service_name) {
  std::vector<std::string> exhausted;

  auto usage = CurrentUsage(tx, service_name);
  if (!usage) return exhausted;

  for (const auto& [type, counter] : usage->quotas) {
    if (counter.remaining > 0) continue;
    auto limit = repository_->GetQuotaLimit(tx, service_name, type);
    if (limit && !limit->is_active) continue;
    exhausted.push_back(type);
  }
  return exhausted;
}

std::vector<std::string> QuotaTracker::ExceededTypes(const std::string& service_name) {
  auto tx        = repository_->Begin();
  auto exhausted = ExceededTypes(*tx, service_name);
  tx->Commit();
  return exhausted;
}

bool QuotaTracker::IsExceeded(const std::string& service_name, const std::string& quota_type) {
  const auto exhausted = ExceededTypes(service_name);
  return std::find(exhausted.begin(), exhausted.end(), quota_type) != exhausted.end();
}

util::TimePoint QuotaTracker::ResetTimeFor(const std::string& quota_type, util::TimePoint now) const {
  if (EndsWith(quota_type, "_minute")) return util::NextMinuteBoundary(now);
  if (EndsWith(quota_type, "_day")) return util::NextUtcMidnight(now);
  return now;
}

QuotaCheck QuotaTracker::CheckQuota(db::Transaction& tx, const std::string& service_name) {
  const auto now = clock_->Now();

  QuotaCheck check;
  check.exhausted_types = ExceededTypes(tx, service_name);
  check.reset_at        = now;

  bool first = true;
  for (const auto& type : check.exhausted_types) {
    const auto reset = ResetTimeFor(type, now);
    if (first || reset < check.reset_at) check.reset_at = reset;
    first = false;
  }
  check.wait_seconds = std::chrono::duration_cast<std::chrono::seconds>(check.reset_at - now).count();
  return check;
}

QuotaCheck QuotaTracker::CheckQuota(const std::string& service_name) {
  auto tx    = repository_->Begin();
  auto check = CheckQuota(*tx, service_name);
  tx->Commit();
  return check;
}

util::TimePoint QuotaTracker::EstimateResetTime(const std::string& service_name) {
  return CheckQuota(service_name).reset_at;
}

void QuotaTracker::Require(const std::string& service_name) {
  const auto check = CheckQuota(service_name);
  if (!check.Exceeded()) return;

  std::string types;
  for (const auto& type : check.exhausted_types) {
    if (!types.empty()) types += ",";
    types += type;
  }
  WORKFLOW_LOG_WARN("quota exceeded", {observability::StringField("service", service_name), observability::StringField("quota_types", types),
                                       observability::IntField("wait_seconds", check.wait_seconds)});
  throw util::QuotaExceeded(service_name + " quota exceeded: " + types, service_name, check.wait_seconds);
}

// ------------------------------------------------------------------
// Limits
// ------------------------------------------------------------------

void QuotaTracker::UpsertLimit(const std::string& service_name, const std::string& quota_type, std::int64_t limit_value,
                               std::int64_t window_seconds, bool is_active) {
  if (service_name.empty() || quota_type.empty()) throw std::invalid_argument("quota limit: service and quota type are required");
  if (limit_value <= 0 || window_seconds <= 0) throw std::invalid_argument("quota limit: limit and window must be positive");

  const uint64_t now = clock_->NowMillis();
  auto           tx  = repository_->Begin();

  auto record = repository_->GetQuotaLimit(*tx, service_name, quota_type);
  if (!record) {
    record                = MakeLimit(service_name, quota_type, limit_value, window_seconds, is_active);
    record->limit_id      = util::NewId();
    record->created_at_ms = now;
  }
  record->limit_value    = limit_value;
  record->window_seconds = window_seconds;
  record->is_active      = is_active;
  record->updated_at_ms  = now;

  db::ThrowIfDbError(repository_->UpsertQuotaLimit(*tx, *record), "upsert quota limit");
  tx->Commit();
}

std::vector<db::model::QuotaLimitRecord> QuotaTracker::ListLimits(const std::string& service_name) {
  auto tx     = repository_->Begin();
  auto limits = repository_->ListQuotaLimits(*tx, service_name);
  tx->Commit();
  return limits;
}

std::vector<db::model::QuotaLimitRecord> QuotaTracker::DefaultLimits() {
  return {
      MakeLimit("gemini", "tokens_per_minute", 4'000'000, 60),
      MakeLimit("gemini", "tokens_per_day", 1'000'000'000, 86'400),
      MakeLimit("gemini", "requests_per_minute", 15, 60),
      MakeLimit("gemini", "requests_per_day", 1'500, 86'400),
  };
}

std::size_t QuotaTracker::SeedLimits(const std::vector<db::model::QuotaLimitRecord>& limits) {
  const uint64_t now     = clock_->NowMillis();
  std::size_t    created = 0;

  auto tx = repository_->Begin();
  for (const auto& limit : limits) {
    if (repository_->GetQuotaLimit(*tx, limit.service_name, limit.quota_type)) continue;

    auto record          = limit;
    record.limit_id      = util::NewId();
    record.created_at_ms = now;
    record.updated_at_ms = now;
    db::ThrowIfDbError(repository_->UpsertQuotaLimit(*tx, record), "seed quota limit");
    ++created;
  }
  tx->Commit();

  if (created > 0) {
    WORKFLOW_LOG_INFO("quota limits seeded", {observability::IntField("created", static_cast<std::int64_t>(created))});
  }
  return created;
}

std::size_t QuotaTracker::SeedDefaultLimits() {
  return SeedLimits(DefaultLimits());
}

std::vector<UsageBucket> QuotaTracker::UsageSummary(const std::string& service_name, std::chrono::hours window) {
  const auto     now   = clock_->Now();
  const uint64_t since = util::ToUnixMillis(now - window);

  auto tx        = repository_->Begin();
  auto snapshots = repository_->ListQuotaUsage(*tx, service_name, since);

  std::map<std::string, bool> parked;
  for (const auto& snapshot : snapshots) {
    if (!snapshot.workflow_id || parked.count(*snapshot.workflow_id)) continue;
    const auto item               = repository_->GetWorkflow(*tx, *snapshot.workflow_id);
    parked[*snapshot.workflow_id] = item && item->state == model::WorkflowState::kQuotaExceeded;
  }
  tx->Commit();

  std::map<util::TimePoint, UsageBucket> buckets;
  for (const auto& snapshot : snapshots) {
    const auto hour  = util::HourBucket(util::FromUnixMillis(snapshot.created_at_ms));
    auto&      entry = buckets[hour];
    entry.hour       = hour;
    entry.snapshots += 1;
    if (snapshot.workflow_id && parked[*snapshot.workflow_id]) entry.quota_exceeded += 1;

    const auto usage = DecodeUsage(snapshot.usage_data);
    entry.total_tokens += usage.cost.total_tokens;
    entry.total_cost_usd += usage.cost.total_cost_usd;
  }

  std::vector<UsageBucket> out;
  out.reserve(buckets.size());
  for (auto& [hour, bucket] : buckets) {
    bucket.avg_tokens = static_cast<double>(bucket.total_tokens) / static_cast<double>(bucket.snapshots);
    out.push_back(bucket);
  }
  return out;
}

} // namespace workflow::quota
