#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/db/api/repository.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/queue_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/time.hpp"

namespace labelq::factory {

/*
  Application

  Owns all long-lived singletons used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository> repository;
  service::ServiceContext context;

  std::shared_ptr<service::QueueService> queue_service;
  std::shared_ptr<service::AdminService> admin_service;
};

/*
  Build

  Constructs the entire backend based on runtime config: opens the
  database and bootstraps its schema, releases leftover reservations when
  configured, and registers the images already on disk.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
Application Build(const labelq::runtime::config::RuntimeConfig& config, labelq::util::NowFn now = labelq::util::Now);

std::shared_ptr<db::Repository> BuildRepository(const labelq::runtime::config::RuntimeConfig& config);

// Reverts every live reservation; phase is only used for logging.
uint64_t ReleaseReservations(const Application& app, const char* phase);

}
