#include <chrono>
#include <cstddef>
#include <iostream>
#include <optional>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

using workflow::factory::Build;
using workflow::util::FormatIso8601;
using workflow::util::FromUnixMillis;

static void Usage() {
  std::cout << "Usage:\n"
            << "  workflowctl <config.yaml> init\n"
            << "  workflowctl <config.yaml> limits [service]\n"
            << "  workflowctl <config.yaml> seed-limits\n"
            << "  workflowctl <config.yaml> deadletters [all]\n"
            << "  workflowctl <config.yaml> resolve <deadletter_id> <notes>\n"
            << "  workflowctl <config.yaml> backlog [limit]\n"
            << "  workflowctl <config.yaml> resume [limit]\n"
            << "  workflowctl <config.yaml> events [limit]\n"
            << "  workflowctl <config.yaml> stats [hours]\n"
            << "  workflowctl <config.yaml> status <workflow_id>\n"
            << "  workflowctl <config.yaml> history <workflow_id>\n";
}

static std::string Millis(uint64_t ms) {
  return FormatIso8601(FromUnixMillis(ms));
}

static std::string Millis(const std::optional<uint64_t>& ms) {
  return ms ? Millis(*ms) : "-";
}

static bool CheckId(const char* text) {
  if (workflow::util::IsValidId(text)) return true;
  std::cerr << "not an id: " << text << "\n";
  return false;
}

static std::size_t OptionalCount(int argc, char** argv, int index, std::size_t fallback) {
  return argc > index ? static_cast<std::size_t>(std::stoull(argv[index])) : fallback;
}

static int Run(const workflow::factory::Runtime& rt, const std::string& cmd, int argc, char** argv) {
  using workflow::model::ToString;

  // ------------------------------------------------------------

  if (cmd == "init") {
    std::cout << "schema ready\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "limits") {
    const std::string service = argc > 3 ? argv[3] : "";
    for (const auto& limit : rt.quota->ListLimits(service)) {
      std::cout << limit.service_name << " " << limit.quota_type << " limit=" << limit.limit_value << " window=" << limit.window_seconds << "s"
                << (limit.is_active ? "" : " (inactive)") << "\n";
    }
    return 0;
  }

  if (cmd == "seed-limits") {
    std::cout << "created " << rt.quota->SeedDefaultLimits() << " default limits\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "deadletters") {
    const bool unresolved_only = !(argc > 3 && std::string(argv[3]) == "all");
    for (const auto& entry : rt.manager->DeadLetters(unresolved_only)) {
      std::cout << entry.deadletter_id << " workflow=" << entry.workflow_id << " failures=" << entry.failure_count
                << " last_failure=" << Millis(entry.last_failure_at_ms) << " resolved=" << Millis(entry.resolved_at_ms) << "\n"
                << "  " << entry.error_message << "\n";
    }
    return 0;
  }

  if (cmd == "resolve") {
    if (argc < 5) {
      Usage();
      return 1;
    }
    if (!CheckId(argv[3])) return 1;
    auto entry = rt.deadletters->Resolve(argv[3], argv[4]);
    std::cout << "resolved " << entry.deadletter_id << " at " << Millis(entry.resolved_at_ms) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "backlog") {
    for (const auto& item : rt.manager->QuotaExceededBacklog(OptionalCount(argc, argv, 3, 0))) {
      std::cout << item.id << " state=" << workflow::model::ToString(item.state) << " stage=" << item.stage << " priority=" << item.priority << " quota_hits=" << item.quota_exceeded_count
                << " next_retry=" << Millis(item.next_retry_at_ms) << "\n";
    }
    return 0;
  }

  if (cmd == "resume") {
    std::cout << "resumed " << rt.manager->ResumeEligible(OptionalCount(argc, argv, 3, 0)) << " workflows\n";
    return 0;
  }

  if (cmd == "events") {
    for (const auto& event : rt.manager->UnprocessedEvents(OptionalCount(argc, argv, 3, 50))) {
      std::cout << event.sequence << " " << Millis(event.created_at_ms) << " " << event.event_type << " workflow=" << event.workflow_id << " "
                << event.event_data << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "stats") {
    const auto window  = std::chrono::hours(static_cast<long>(OptionalCount(argc, argv, 3, 24)));
    const auto summary = rt.views->Summarize(window);

    std::cout << "total=" << summary.total << " error_rate=" << summary.error_rate_percent << "%\n";
    for (const auto& [state, count] : summary.state_distribution) std::cout << "  " << ToString(state) << ": " << count << "\n";

    const auto& d = summary.durations;
    std::cout << "durations(s): n=" << d.count << " avg=" << d.average << " min=" << d.minimum << " max=" << d.maximum << " median=" << d.median
              << " p95=" << d.p95 << "\n";

    for (const auto& bucket : summary.throughput) std::cout << "  " << Millis(bucket.hour_ms) << " completed=" << bucket.count << "\n";
    for (const auto& edge : rt.views->TransitionCounts(window)) {
      std::cout << "  " << ToString(edge.from) << " -> " << ToString(edge.to) << ": " << edge.count << "\n";
    }
    return 0;
  }

  if (cmd == "status") {
    if (argc < 4) {
      Usage();
      return 1;
    }
    if (!CheckId(argv[3])) return 1;
    auto item = rt.manager->Get(argv[3]);
    if (!item) throw workflow::util::NotFound(std::string("workflow ") + argv[3] + " not found");

    std::cout << item->id << "\n"
              << "  state=" << ToString(item->state) << " version=" << item->version << " stage=" << item->stage << "\n"
              << "  priority=" << item->priority << " retries=" << item->retry_count << "/" << item->max_retries
              << " next_retry=" << Millis(item->next_retry_at_ms) << "\n"
              << "  lease=" << item->lease_holder.value_or("-") << " since " << Millis(item->lease_acquired_at_ms) << "\n"
              << "  queued=" << Millis(item->queued_at_ms) << " started=" << Millis(item->processing_started_at_ms)
              << " completed=" << Millis(item->completed_at_ms) << "\n";
    if (item->last_error) std::cout << "  last_error=" << *item->last_error << "\n";
    return 0;
  }

  if (cmd == "history") {
    if (argc < 4) {
      Usage();
      return 1;
    }
    if (!CheckId(argv[3])) return 1;
    for (const auto& t : rt.manager->History(argv[3])) {
      std::cout << t.sequence << " " << Millis(t.created_at_ms) << " " << ToString(t.from_state) << " -> " << ToString(t.to_state)
                << " stage=" << t.stage << " actor=" << t.actor << " reason=" << t.reason << "\n";
    }
    return 0;
  }

  Usage();
  return 1;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  const std::string config_path = argv[1];
  const std::string cmd         = argv[2];

  try {
    auto config = workflow::config::ConfigLoader::LoadFromYaml(config_path);

    workflow::observability::InitializeMetrics(config);
    workflow::observability::InitializeLogging(config);

    auto runtime = Build(config);
    int  rc      = Run(runtime, cmd, argc, argv);

    workflow::observability::ShutdownLogging();
    workflow::observability::ShutdownMetrics();
    return rc;
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    workflow::observability::ShutdownLogging();
    workflow::observability::ShutdownMetrics();
    return 2;
  }
}
