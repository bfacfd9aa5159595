#pragma once

#include <memory>

namespace credpool::core {
class PoolAllocator;
class AssignmentTypeManager;
class CredentialLifecycle;
class SettingsStore;
} // namespace credpool::core
namespace credpool::importer {
class ImportPipeline;
}

namespace credpool::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<credpool::core::PoolAllocator>         allocator;
  std::shared_ptr<credpool::core::AssignmentTypeManager> assignment_types;
  std::shared_ptr<credpool::core::CredentialLifecycle>   lifecycle;
  std::shared_ptr<credpool::core::SettingsStore>         settings;
  std::shared_ptr<credpool::importer::ImportPipeline>    importer;
};

} // namespace credpool::service
