#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/service/pool_service.hpp"

namespace credpool::factory {

/*
  Application

  Owns all long-lived objects of one process.
*/
struct Application {
  std::shared_ptr<db::Repository>        repository;
  std::shared_ptr<service::PoolService>  pool_service;
};

/*
  Selects the backend named by config.database, opens it and brings
  its schema up to date. This is the ONLY place that knows concrete
  DB types.
*/
std::shared_ptr<db::Repository> BuildRepository(const credpool::runtime::config::RuntimeConfig& config);

// Composition root: repository, core components and the service facade.
Application Build(const credpool::runtime::config::RuntimeConfig& config);

} // namespace credpool::factory
