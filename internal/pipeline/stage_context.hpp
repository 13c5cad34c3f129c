#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/db/api/repository.hpp"
#include "internal/storage/object_store.hpp"
#include "internal/weather/observation_source.hpp"

namespace flightline::pipeline {

/*
  Long-lived collaborators shared by every stage of one run.
*/
struct StageContext {
  std::shared_ptr<db::Repository>             repository;
  std::shared_ptr<storage::ObjectStore>       store;
  std::shared_ptr<weather::ObservationSource> observations;

  flightline::runtime::config::RuntimeConfig config;
};

} // namespace flightline::pipeline
