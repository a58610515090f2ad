#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

#include "internal/core/job_store.hpp"
#include "internal/core/publish_orchestrator.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/release/release_assembler.hpp"
#include "internal/runtime/worker_pool.hpp"
#include "internal/service/publish_service.hpp"
#include "internal/storage/storage_factory.hpp"

namespace masterplan::factory {

/*
  Application

  Owns all long-lived objects used by the server. Everything here lives
  for the lifetime of the process; Shutdown() stops the pools after
  cancelling whatever is still running.
*/
struct Application {
  Application() = default;
  Application(Application&&) = default;
  Application& operator=(Application&&) = default;
  ~Application() { Shutdown(); }

  std::shared_ptr<db::Repository>   repository;
  storage::StorageFactory::Stores   stores;

  std::unique_ptr<runtime::WorkerPool> job_pool;
  std::unique_ptr<runtime::WorkerPool> encode_pool;

  std::shared_ptr<core::JobStore>            jobs;
  std::shared_ptr<release::ReleaseAssembler> releases;
  std::shared_ptr<core::PublishOrchestrator> orchestrator;
  std::shared_ptr<service::PublishService>   publish_service;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;

  // Idempotent.
  void Shutdown();
};

// Repository for the configured backend; sqlite schema is bootstrapped.
std::shared_ptr<db::Repository> BuildRepository(const masterplan::runtime::config::RuntimeConfig& config);

/*
  Build

  Constructs the entire backend based on runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB and storage types.
*/
Application Build(const masterplan::runtime::config::RuntimeConfig& config);

} // namespace masterplan::factory
