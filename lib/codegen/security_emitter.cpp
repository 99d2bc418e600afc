// tova/codegen/security_emitter.cpp - Server-side lowering of `security` blocks
#include "tova/codegen/security_emitter.hpp"

#include <fmt/format.h>

#include <string_view>

namespace tova::codegen
{

std::string glob_to_regex(std::string_view pattern)
{
  constexpr std::string_view k_specials = ".+?^${}()|[]\\/";
  std::string out;
  for (size_t i = 0; i < pattern.size(); ++i) {
    const char c = pattern[i];
    if (c == '*') {
      if (i + 1 < pattern.size() && pattern[i + 1] == '*') {
        out += ".*";
        ++i;
      } else {
        out += "[^/]*";
      }
      continue;
    }
    if (k_specials.find(c) != std::string_view::npos) out += '\\';
    out += c;
  }
  return out;
}

namespace
{

const Expr * find_entry(gsl::span<ConfigField *> entries, std::string_view key)
{
  for (const auto * e : entries) {
    if (e->key == key) return e->value;
  }
  return nullptr;
}

const Expr * find_property(const Expr * object, std::string_view key)
{
  const auto * obj = dyn_cast<ObjectLiteral>(object);
  if (obj == nullptr) return nullptr;
  for (const auto * p : obj->properties) {
    if (p->key == key) return p->value;
  }
  return nullptr;
}

}  // namespace

void SecurityEmitter::collect(const std::vector<const NamedBlock *> & blocks)
{
  for (const auto * block : blocks) {
    for (const Stmt * s : block->body) {
      if (const auto * auth = dyn_cast<SecurityAuth>(s)) {
        auth_ = auth;
      } else if (const auto * role = dyn_cast<SecurityRole>(s)) {
        roles_.push_back(role);
      } else if (const auto * protect = dyn_cast<SecurityProtect>(s)) {
        protects_.push_back(protect);
      }
    }
  }
}

std::string SecurityEmitter::emit_roles()
{
  std::vector<std::string> lines{"// Security roles", "const __securityRoles = {"};
  for (const auto * role : roles_) {
    std::vector<std::string> perms;
    for (const auto p : role->permissions) perms.push_back(quote_js(p));
    lines.push_back(fmt::format("  {}: [{}],", quote_js(role->name), join(perms, ", ")));
  }
  lines.emplace_back("};");
  lines.emplace_back("function __getUserRoles(user) {");
  lines.emplace_back("  if (!user) return [];");
  lines.emplace_back("  if (Array.isArray(user.roles)) return user.roles;");
  lines.emplace_back("  if (user.role) return [user.role];");
  lines.emplace_back("  return [];");
  lines.emplace_back("}");
  lines.emplace_back("function __hasRole(user, roleName) {");
  lines.emplace_back("  return __getUserRoles(user).includes(roleName);");
  lines.emplace_back("}");
  lines.emplace_back("function __hasPermission(user, permission) {");
  lines.emplace_back("  for (const r of __getUserRoles(user)) {");
  lines.emplace_back("    const perms = __securityRoles[r];");
  lines.emplace_back("    if (perms && perms.includes(permission)) return true;");
  lines.emplace_back("  }");
  lines.emplace_back("  return false;");
  lines.emplace_back("}");
  return join(lines, "\n");
}

std::string SecurityEmitter::emit_auth()
{
  std::vector<std::string> fields{"type: " + quote_js(auth_->authKind)};
  for (const auto * e : auth_->entries) {
    fields.push_back(std::string(e->key) + ": " + emit_expr(e->value));
  }

  std::vector<std::string> lines{"// Authentication"};
  lines.push_back("const __authConfig = { " + join(fields, ", ") + " };");
  lines.emplace_back("async function __authenticate(c) {");
  if (auth_->authKind == "jwt") {
    lines.emplace_back("  const header = c.req.header(\"Authorization\") || \"\";");
    lines.emplace_back("  if (!header.startsWith(\"Bearer \")) return null;");
    lines.emplace_back("  try {");
    lines.emplace_back("    return await verify(header.slice(7), __authConfig.secret);");
    lines.emplace_back("  } catch (_) {");
    lines.emplace_back("    return null;");
    lines.emplace_back("  }");
  } else if (auth_->authKind == "api_key") {
    lines.emplace_back("  const key = c.req.header(__authConfig.header || \"X-API-Key\");");
    lines.emplace_back("  if (!key) return null;");
    lines.emplace_back("  const keys = __authConfig.keys || [];");
    lines.emplace_back("  return keys.includes(key) ? { key } : null;");
  } else {
    lines.emplace_back("  return null;");
  }
  lines.emplace_back("}");
  return join(lines, "\n");
}

std::string SecurityEmitter::emit_protect_rules()
{
  std::vector<std::string> lines{"// Route protection", "const __protectRules = ["};
  for (const auto * p : protects_) {
    const std::string require = p->require.empty() ? "authenticated" : std::string(p->require);
    std::string max = "null";
    std::string window = "null";
    if (const Expr * rl = find_entry(p->entries, "rate_limit")) {
      if (const Expr * m = find_property(rl, "max")) max = emit_expr(m);
      if (const Expr * w = find_property(rl, "window")) window = emit_expr(w);
    }
    lines.push_back(fmt::format(
      "  {{ pattern: /^{}$/, require: {}, rateLimit: {{ max: {}, window: {} }} }},",
      glob_to_regex(p->path), quote_js(require), max, window));
  }
  lines.emplace_back("];");
  lines.emplace_back("function __checkProtection(path, user) {");
  lines.emplace_back("  for (const rule of __protectRules) {");
  lines.emplace_back("    if (!rule.pattern.test(path)) continue;");
  lines.emplace_back("    if (!user) return { allowed: false, reason: \"Authentication required\" };");
  lines.emplace_back(
    "    if (rule.require !== \"authenticated\" && !__hasRole(user, rule.require)) return { allowed: "
    "false, reason: \"Insufficient permissions\" };");
  lines.emplace_back("    return { allowed: true, rateLimit: rule.rateLimit };");
  lines.emplace_back("  }");
  lines.emplace_back("  return { allowed: true, rateLimit: null };");
  lines.emplace_back("}");
  return join(lines, "\n");
}

std::string SecurityEmitter::emit_middleware()
{
  std::vector<std::string> lines{"app.use(\"*\", async (c, next) => {"};
  lines.emplace_back(
    auth_ != nullptr ? "  const user = await __authenticate(c);" : "  const user = null;");
  lines.emplace_back("  c.set(\"user\", user);");
  if (!protects_.empty()) {
    lines.emplace_back("  const check = __checkProtection(c.req.path, user);");
    lines.emplace_back(
      "  if (!check.allowed) return c.json({ error: check.reason }, user ? 403 : 401);");
  }
  lines.emplace_back("  await next();");
  lines.emplace_back("});");
  return join(lines, "\n");
}

std::string SecurityEmitter::emit_server_policy()
{
  std::vector<std::string> sections;
  // Protect rules check roles even when no role is declared.
  if (!roles_.empty() || !protects_.empty()) sections.push_back(emit_roles());
  if (auth_ != nullptr) sections.push_back(emit_auth());
  if (!protects_.empty()) sections.push_back(emit_protect_rules());
  if (auth_ != nullptr || !protects_.empty()) sections.push_back(emit_middleware());
  return join(sections, "\n\n");
}

}  // namespace tova::codegen
