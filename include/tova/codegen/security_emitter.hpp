// tova/codegen/security_emitter.hpp - Server-side lowering of `security` blocks
//
// All security blocks of a program merge into one policy: the last `auth`
// wins, roles and protect rules accumulate in source order. The policy is
// emitted as plain JS (role table, authenticator, protect rules) plus one
// Hono middleware that enforces it.
//
#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "tova/codegen/base_emitter.hpp"

namespace tova::codegen
{

/// `/admin/**` -> `\/admin\/.*`; `*` stays inside one path segment.
[[nodiscard]] std::string glob_to_regex(std::string_view pattern);

class SecurityEmitter : public BaseEmitter
{
public:
  explicit SecurityEmitter(EmitContext & ctx) : BaseEmitter(ctx) {}

  void collect(const std::vector<const NamedBlock *> & blocks);

  [[nodiscard]] bool empty() const noexcept
  {
    return auth_ == nullptr && roles_.empty() && protects_.empty();
  }

  [[nodiscard]] bool uses_jwt() const noexcept
  {
    return auth_ != nullptr && auth_->authKind == "jwt";
  }

  /// Role table, authenticator, protect rules and the enforcing middleware.
  /// Expects `app` to be in scope.
  std::string emit_server_policy();

private:
  std::string emit_roles();
  std::string emit_auth();
  std::string emit_protect_rules();
  std::string emit_middleware();

  const SecurityAuth * auth_ = nullptr;
  std::vector<const SecurityRole *> roles_;
  std::vector<const SecurityProtect *> protects_;
};

}  // namespace tova::codegen
