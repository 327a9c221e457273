#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

#include "internal/db/api/repository.hpp"
#include "internal/service/catalog_service.hpp"
#include "internal/service/request_service.hpp"
#include "internal/service/service_context.hpp"

namespace songqueue::factory {

/*
  Application

  Owns all long-lived objects used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  service::ServiceContext context;

  std::shared_ptr<service::RequestService> request_service;
  std::shared_ptr<service::CatalogService> catalog_service;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  BuildRepository

  Opens the configured backend and bootstraps its schema.
  This and Build() are the ONLY places allowed to know concrete DB types.
*/
std::shared_ptr<db::Repository> BuildRepository(const songqueue::runtime::config::RuntimeConfig& config);

// Core components and services over an existing repository. No transport.
service::ServiceContext BuildContext(std::shared_ptr<db::Repository> repository,
                                     const songqueue::runtime::config::RuntimeConfig& config);

// Composition root of the daemon.
Application Build(const songqueue::runtime::config::RuntimeConfig& config);

} // namespace songqueue::factory
