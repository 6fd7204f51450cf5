#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/core/transition_engine.hpp"
#include "internal/core/workflow_manager.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/deadletter/deadletter_store.hpp"
#include "internal/events/event_emitter.hpp"
#include "internal/lease/lease_manager.hpp"
#include "internal/quota/quota_tracker.hpp"
#include "internal/retry/retry_scheduler.hpp"
#include "internal/util/time.hpp"
#include "internal/views/workflow_views.hpp"

namespace workflow::factory {

/*
  Runtime

  Owns every long-lived component. All of them share one repository
  and one clock.
*/
struct Runtime {
  std::shared_ptr<const util::Clock> clock;
  std::shared_ptr<db::Repository>    repository;

  std::shared_ptr<events::EventEmitter>        emitter;
  std::shared_ptr<core::TransitionEngine>      engine;
  std::shared_ptr<lease::LeaseManager>         leases;
  std::shared_ptr<quota::QuotaTracker>         quota;
  std::shared_ptr<deadletter::DeadLetterStore> deadletters;
  std::shared_ptr<retry::RetryScheduler>       scheduler;
  std::shared_ptr<core::WorkflowManager>       manager;
  std::shared_ptr<views::WorkflowViews>        views;
};

/*
  Build

  Constructs the whole engine from runtime config: opens the backend,
  applies the schema, wires the components and seeds quota limits.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
Runtime Build(const runtime::config::RuntimeConfig& config, std::shared_ptr<const util::Clock> clock = nullptr);

// Seeds quota limits from config on an already built runtime.
void Bootstrap(const runtime::config::RuntimeConfig& config, const Runtime& runtime);

} // namespace workflow::factory
