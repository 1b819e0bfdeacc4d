#pragma once

#include <memory>

namespace streamgate::core {
class TokenStore;
class AccessPolicy;
} // namespace streamgate::core

namespace streamgate::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<streamgate::core::TokenStore>   store;
  std::shared_ptr<streamgate::core::AccessPolicy> access;
};

} // namespace streamgate::service
