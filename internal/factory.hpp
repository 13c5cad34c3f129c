#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/db/api/repository.hpp"
#include "internal/pipeline/stage_context.hpp"
#include "internal/storage/object_store.hpp"
#include "internal/weather/observation_source.hpp"

namespace flightline::factory {

/*
  Build

  Constructs the warehouse, object store and observation source from
  runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB and storage types.
*/
pipeline::StageContext Build(const flightline::runtime::config::RuntimeConfig& config);

std::shared_ptr<db::Repository> BuildRepository(const flightline::runtime::config::RuntimeConfig& config);

} // namespace flightline::factory
