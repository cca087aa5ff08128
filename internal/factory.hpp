#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/db/api/repository.hpp"
#include "internal/pipeline/ranking_pipeline.hpp"

namespace powerscore::factory {

/*
  Application

  Everything one batch run needs, built from a validated config.
  The repository lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository> repository;
  pipeline::PipelineSettings      settings;
};

/*
  Selects the configured database backend and bootstraps its schema.

  NOTE:
  This is the ONLY place allowed to know concrete DB types.
*/
std::shared_ptr<db::Repository> BuildRepository(const powerscore::runtime::config::RuntimeConfig& config);

// Converts the non-rating sections into pipeline settings. Validates first.
pipeline::PipelineSettings BuildPipelineSettings(const powerscore::runtime::config::RuntimeConfig& config);

/*
  Composition root of the engine and the admin tool.

  Throws util::InvalidConfig before any database is opened.
*/
Application Build(const powerscore::runtime::config::RuntimeConfig& config);

} // namespace powerscore::factory
