#include "structured_payload.hpp"

namespace workflow::model {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace

std::string_view ToString(LeaseChange change) {
  switch (change) {
    case LeaseChange::kAcquired:
      return "acquired";
    case LeaseChange::kReleased:
      return "released";
    case LeaseChange::kTakenOver:
      return "taken_over";
  }
  return "unknown";
}

std::string_view EventTypeOf(const StructuredPayload& payload) {
  return std::visit(Overloaded{
                        [](const Attributes&) -> std::string_view { return "custom"; },
                        [](const StateChanged&) -> std::string_view { return "state_changed"; },
                        [](const LeaseChanged& lease) -> std::string_view {
                          switch (lease.change) {
                            case LeaseChange::kAcquired:
                              return "lease_acquired";
                            case LeaseChange::kReleased:
                              return "lease_released";
                            case LeaseChange::kTakenOver:
                              return "lease_taken_over";
                          }
                          return "lease_changed";
                        },
                        [](const RetryScheduled&) -> std::string_view { return "retry_scheduled"; },
                        [](const DeadLettered&) -> std::string_view { return "dead_lettered"; },
                        [](const QuotaExhausted&) -> std::string_view { return "quota_exceeded"; },
                        [](const Enqueued&) -> std::string_view { return "workflow_created"; },
                    },
                    payload);
}

Attributes Merge(Attributes base, const Attributes& overlay) {
  for (const auto& [key, value] : overlay) {
    base.insert_or_assign(key, value);
  }
  return base;
}

} // namespace workflow::model
