#pragma once

#include <memory>

namespace convtree::core { class MessageTree; }

namespace convtree::service {

/*
  Dependency container handed to the service facade.
*/
struct ServiceContext {
  std::shared_ptr<convtree::core::MessageTree> tree;
};

} // namespace convtree::service
