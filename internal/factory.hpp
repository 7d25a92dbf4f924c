#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/core/message_tree.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/service/message_service.hpp"

namespace convtree::factory {

/*
  RuntimeDependencies

  Owns every long-lived object of the process.
*/
struct RuntimeDependencies {
  std::shared_ptr<db::Repository> repository;
  std::shared_ptr<core::MessageTree> tree;
  std::shared_ptr<service::MessageService> message_service;
};

core::MessageTreeOptions TreeOptionsFromConfig(const convtree::runtime::config::RuntimeConfig& config);

/*
  BuildRuntime

  Composition root. The only place that knows concrete repository
  types; bootstraps the schema for SQL backends.
*/
RuntimeDependencies BuildRuntime(const convtree::runtime::config::RuntimeConfig& config);

} // namespace convtree::factory
