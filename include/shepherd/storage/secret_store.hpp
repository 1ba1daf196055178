#pragma once

#include "shepherd/core/error.hpp"
#include "shepherd/model/claim.hpp"
#include "shepherd/util/id.hpp"

namespace shepherd {

class SecretStore {
public:
  virtual ~SecretStore() = default;

  // Insert or replace.
  [[nodiscard]] virtual auto put(const TokenSecret& secret) -> Result<void> = 0;
  [[nodiscard]] virtual auto get(const SecretName& name)
      -> Result<TokenSecret> = 0;
  // NotFound when absent.
  [[nodiscard]] virtual auto remove(const SecretName& name) -> Result<void> = 0;
};

}  // namespace shepherd
