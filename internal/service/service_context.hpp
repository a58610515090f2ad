#pragma once

#include <memory>

namespace masterplan::core {
class JobStore;
class PublishOrchestrator;
} // namespace masterplan::core
namespace masterplan::release { class ReleaseAssembler; }

namespace masterplan::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<masterplan::core::PublishOrchestrator> orchestrator;
  std::shared_ptr<masterplan::core::JobStore>            jobs;
  std::shared_ptr<masterplan::release::ReleaseAssembler> releases;
};

}
