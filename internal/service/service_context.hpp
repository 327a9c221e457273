#pragma once

#include <memory>

namespace songqueue::catalog { class CatalogLookup; }
namespace songqueue::session { class SessionResolver; }
namespace songqueue::queue { class QueueStore; }
namespace songqueue::core {
class AdmissionController;
class RequestStateMachine;
class QueueReader;
}
namespace songqueue::db { class Repository; }

namespace songqueue::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<songqueue::db::Repository> repository;
  std::shared_ptr<songqueue::catalog::CatalogLookup> catalog;
  std::shared_ptr<songqueue::session::SessionResolver> sessions;
  std::shared_ptr<songqueue::queue::QueueStore> store;
  std::shared_ptr<songqueue::core::AdmissionController> admission;
  std::shared_ptr<songqueue::core::RequestStateMachine> state_machine;
  std::shared_ptr<songqueue::core::QueueReader> reader;
};

}
