#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/core/draft_catalog.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/publish_server.hpp"
#include "internal/imaging/raster_image.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#if MASTERPLAN_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace masterplan::factory {

using namespace masterplan;

std::shared_ptr<db::Repository> BuildRepository(const masterplan::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if MASTERPLAN_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    sqlite_db->Configure();
    sqlite_db->BootstrapSchema();
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const masterplan::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Persistence and storage
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);
  app.stores     = storage::StorageFactory::Build(config.storage());

  // ------------------------------------------------------------------
  // Worker pools
  // ------------------------------------------------------------------
  app.job_pool    = std::make_unique<runtime::WorkerPool>("jobs", config.workers().job_threads());
  app.encode_pool = std::make_unique<runtime::WorkerPool>("encode", config.workers().encode_threads());
  app.job_pool->Start();
  app.encode_pool->Start();

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  app.jobs = std::make_shared<core::JobStore>(app.repository);
  app.jobs->RecoverInterrupted();

  release::ReleaseAssembler::Options release_options;
  release_options.write_dzi_descriptor = config.release().write_dzi_descriptor();
  release_options.label_precision      = config.geometry().label_precision();
  release_options.curve_tolerance      = config.geometry().curve_tolerance();
  app.releases = std::make_shared<release::ReleaseAssembler>(app.stores.releases, app.repository, release_options);

  core::PublishOrchestrator::Options options;
  options.tile_defaults.tile_size = config.tiles().tile_size();
  options.tile_defaults.overlap   = config.tiles().overlap();
  options.tile_defaults.quality   = config.tiles().quality();
  auto format                     = imaging::ParseTileFormat(config.tiles().format());
  if (!format) {
    throw std::runtime_error("unsupported tiles.format '" + config.tiles().format() + "'");
  }
  options.tile_defaults.format = *format;
  options.label_precision      = config.geometry().label_precision();
  options.curve_tolerance      = config.geometry().curve_tolerance();
  options.write_dzi_descriptor = config.release().write_dzi_descriptor();
  options.default_published_by = config.release().default_published_by();

  auto drafts      = std::make_shared<core::DraftCatalog>(app.stores.releases);
  app.orchestrator = std::make_shared<core::PublishOrchestrator>(app.jobs, drafts, app.releases, app.stores.releases, app.stores.scratch,
                                                                 *app.job_pool, *app.encode_pool, options);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.orchestrator = app.orchestrator;
  ctx.jobs         = app.jobs;
  ctx.releases     = app.releases;

  app.publish_service = std::make_shared<service::PublishService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::PublishServer>(app.publish_service));

  MASTERPLAN_LOG_INFO("application built", {observability::IntField("job_threads", static_cast<int64_t>(app.job_pool->Threads())),
                                            observability::IntField("encode_threads", static_cast<int64_t>(app.encode_pool->Threads())),
                                            observability::BoolField("sqlite", config.database().has_sqlite())});
  return app;
}

void Application::Shutdown() {
  if (orchestrator) {
    orchestrator->CancelAll();
  }
  // job tasks wait on encode tasks, so the job pool drains first
  if (job_pool) {
    job_pool->Stop();
  }
  if (encode_pool) {
    encode_pool->Stop();
  }
}

} // namespace masterplan::factory
