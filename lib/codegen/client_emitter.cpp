// tova/codegen/client_emitter.cpp - Browser output with fine-grained reactivity
#include "tova/codegen/client_emitter.hpp"

#include <fmt/format.h>

#include <algorithm>

#include "tova/ast/visitor.hpp"

namespace tova::codegen
{

namespace
{

/// Reads of tracked names, outside nested lambdas.
template <typename Pred>
class TrackedReadFinder : public ConstRecursiveAstVisitor<TrackedReadFinder<Pred>>
{
public:
  explicit TrackedReadFinder(Pred pred) : pred_(std::move(pred)) {}

  bool found = false;

  bool visit_identifier(const Identifier * node)
  {
    if (pred_(node->name)) {
      found = true;
      return false;
    }
    return true;
  }

  bool visit_lambda_expr(const LambdaExpr * /*node*/) { return true; }

private:
  Pred pred_;
};

/// `server.fn(...)` calls, outside nested functions.
class RpcCallFinder : public ConstRecursiveAstVisitor<RpcCallFinder>
{
  using Base = ConstRecursiveAstVisitor<RpcCallFinder>;

public:
  bool found = false;

  bool visit_call_expr(const CallExpr * node)
  {
    if (is_rpc_call(node)) {
      found = true;
      return false;
    }
    return Base::visit_call_expr(node);
  }

  bool visit_lambda_expr(const LambdaExpr * /*node*/) { return true; }
  bool visit_function_decl(const FunctionDecl * /*node*/) { return true; }

  static bool is_rpc_call(const CallExpr * node)
  {
    const auto * m = dyn_cast<MemberExpr>(node->callee);
    if (m == nullptr) return false;
    const auto * obj = dyn_cast<Identifier>(m->object);
    return obj != nullptr && obj->name == "server";
  }
};

bool calls_server(gsl::span<Stmt *> body)
{
  RpcCallFinder finder;
  for (const Stmt * s : body) {
    if (!finder.visit(s)) break;
  }
  return finder.found;
}

std::string setter_name(std::string_view name) { return "set" + capitalize(name); }

/// `+=` -> `+`.
std::string_view binary_part(AssignOp op)
{
  const std::string_view full = to_string(op);
  return full.substr(0, full.size() - 1);
}

const std::vector<std::string> k_runtime_imports = {
  "createSignal", "createEffect", "createComputed", "mount", "tova_el", "tova_fragment",
};

}  // namespace

// ============================================================================
// Tracking
// ============================================================================

bool ClientEmitter::is_state(std::string_view name) const
{
  return stateNames_.count(std::string(name)) != 0 && !is_declared(name);
}

bool ClientEmitter::is_tracked(std::string_view name) const
{
  const std::string key(name);
  return (stateNames_.count(key) != 0 || computedNames_.count(key) != 0) && !is_declared(name);
}

bool ClientEmitter::reads_tracked(const AstNode * node) const
{
  auto pred = [this](std::string_view name) { return is_tracked(name); };
  TrackedReadFinder<decltype(pred)> finder(pred);
  finder.visit(node);
  return finder.found;
}

// ============================================================================
// Overrides
// ============================================================================

std::string ClientEmitter::emit_expr(const Expr * expr)
{
  if (const auto * lambda = dyn_cast<LambdaExpr>(expr)) {
    const bool saved = awaitRpc_;
    awaitRpc_ = false;
    std::string out = BaseEmitter::emit_expr(lambda);
    awaitRpc_ = saved;
    return out;
  }
  const auto * call = dyn_cast<CallExpr>(expr);
  if (call && awaitRpc_ && RpcCallFinder::is_rpc_call(call)) {
    return "(await " + BaseEmitter::emit_expr(expr) + ")";
  }
  return BaseEmitter::emit_expr(expr);
}

std::string ClientEmitter::emit_stmt(const Stmt * stmt)
{
  // Client functions that call the server become async and await the stubs.
  if (const auto * fn = dyn_cast<FunctionDecl>(stmt); fn && calls_server(fn->body)) {
    const bool saved = awaitRpc_;
    awaitRpc_ = true;
    std::string out = emit_function(fn, true);
    awaitRpc_ = saved;
    return out;
  }
  return BaseEmitter::emit_stmt(stmt);
}

std::string ClientEmitter::emit_identifier(const Identifier * node)
{
  if (is_tracked(node->name)) {
    return std::string(node->name) + "()";
  }
  return BaseEmitter::emit_identifier(node);
}

std::string ClientEmitter::emit_assignment(const Assignment * node)
{
  if (node->targets.size() == 1 && node->values.size() == 1) {
    if (const auto * id = dyn_cast<Identifier>(node->targets[0]); id && is_state(id->name)) {
      return ind() + setter_name(id->name) + "(" + emit_expr(node->values[0]) + ");";
    }
  }
  return BaseEmitter::emit_assignment(node);
}

std::string ClientEmitter::emit_compound_assign(const CompoundAssign * node)
{
  if (const auto * id = dyn_cast<Identifier>(node->target); id && is_state(id->name)) {
    return fmt::format(
      "{}{}(__prev => __prev {} {});", ind(), setter_name(id->name), binary_part(node->op),
      emit_expr(node->value));
  }
  return BaseEmitter::emit_compound_assign(node);
}

void ClientEmitter::emit_jsx_attribute(
  const JsxAttribute * attr, bool is_component, std::vector<std::string> & props)
{
  const Expr * value = attr->value;
  const bool dynamic = value != nullptr && !isa<LambdaExpr>(value) && reads_tracked(value);

  switch (attr->attrKind) {
    case JsxAttributeKind::Plain:
      if (dynamic) {
        const std::string name = attr->name == "class" ? "className" : std::string(attr->name);
        props.push_back(
          (is_js_identifier(name) ? name : quote_js(name)) + ": () => " + emit_expr(value));
        return;
      }
      break;
    case JsxAttributeKind::Event:
      if (dynamic) {
        props.push_back("on" + capitalize(attr->name) + ": (e) => (" + emit_expr(value) + ")(e)");
        return;
      }
      break;
    case JsxAttributeKind::Bind: {
      if (value == nullptr) break;
      const std::string prop(attr->name);
      props.push_back(prop + ": () => " + emit_expr(value));
      std::string assign;
      if (const auto * id = dyn_cast<Identifier>(value); id && is_state(id->name)) {
        assign = setter_name(id->name) + "(e.target." + prop + ");";
      } else {
        assign = BaseEmitter::emit_expr(value) + " = e.target." + prop + ";";
      }
      props.push_back("onInput: (e) => { " + assign + " }");
      return;
    }
    case JsxAttributeKind::Use:
      if (dynamic) {
        props.push_back(quote_js("use:" + std::string(attr->name)) + ": () => " + emit_expr(value));
        return;
      }
      break;
    case JsxAttributeKind::Spread:
      break;
  }
  BaseEmitter::emit_jsx_attribute(attr, is_component, props);
}

std::string ClientEmitter::emit_jsx_child(const AstNode * child)
{
  switch (child->get_kind()) {
    case NodeKind::JsxExprChild: {
      const Expr * e = cast<JsxExprChild>(child)->expr;
      if (reads_tracked(e)) return "() => " + emit_expr(e);
      break;
    }
    case NodeKind::JsxIf:
      if (reads_tracked(child)) return "() => " + BaseEmitter::emit_jsx_child(child);
      break;
    case NodeKind::JsxFor: {
      const auto * f = cast<JsxFor>(child);
      if (!reads_tracked(f->iterable)) break;
      const std::string iter = emit_expr(f->iterable);
      const std::string vars = f->secondVar.empty()
                                 ? std::string(f->variable)
                                 : fmt::format("[{}, {}]", f->variable, f->secondVar);
      push_scope();
      declare(f->variable);
      if (!f->secondVar.empty()) declare(f->secondVar);
      const std::string body = emit_jsx_group(f->children);
      pop_scope();
      return "() => " + iter + ".map((" + vars + ") => " + body + ")";
    }
    default:
      break;
  }
  return BaseEmitter::emit_jsx_child(child);
}

std::string ClientEmitter::emit_region_member(const Stmt * stmt)
{
  switch (stmt->get_kind()) {
    case NodeKind::StateDecl:
      return emit_signal(cast<StateDecl>(stmt));
    case NodeKind::ComputedDecl:
      return emit_computed(cast<ComputedDecl>(stmt));
    case NodeKind::EffectDecl:
      return emit_effect(cast<EffectDecl>(stmt));
    case NodeKind::ComponentDecl:
      return emit_component(cast<ComponentDecl>(stmt));
    case NodeKind::StoreDecl:
      return emit_store(cast<StoreDecl>(stmt));
    default:
      return BaseEmitter::emit_region_member(stmt);
  }
}

// ============================================================================
// Reactive declarations
// ============================================================================

std::string ClientEmitter::emit_signal(const StateDecl * node)
{
  const std::string init = emit_expr(node->init);
  stateNames_.emplace(node->name);
  return fmt::format(
    "{}const [{}, {}] = createSignal({});", ind(), node->name, setter_name(node->name), init);
}

std::string ClientEmitter::emit_computed(const ComputedDecl * node)
{
  computedNames_.emplace(node->name);
  return fmt::format(
    "{}const {} = createComputed(() => {});", ind(), node->name, emit_expr(node->expr));
}

std::string ClientEmitter::emit_effect(const EffectDecl * node)
{
  const std::string outer = ind();
  if (!calls_server(node->body)) {
    return outer + "createEffect(() => " + brace(emit_block(node->body)) + ");";
  }

  const bool saved = awaitRpc_;
  awaitRpc_ = true;
  ++indent_;
  const std::string body = emit_block(node->body);
  --indent_;
  awaitRpc_ = saved;
  return outer + "createEffect(() => {\n" + outer + "  (async () => {\n" + body + "\n" + outer +
         "  })();\n" + outer + "});";
}

std::string ClientEmitter::emit_component(const ComponentDecl * node)
{
  declare(node->name);
  const auto saved_state = stateNames_;
  const auto saved_computed = computedNames_;

  push_scope();
  for (const auto * p : node->params) declare(p->name);
  const std::string params = node->params.empty() ? "" : "{ " + emit_params(node->params) + " }";

  std::vector<const Expr *> roots;
  std::vector<std::string> lines;
  ++indent_;
  for (const Stmt * s : node->body) {
    if (const auto * es = dyn_cast<ExprStmt>(s); es && isa<JsxElement>(es->expr)) {
      roots.push_back(es->expr);
      continue;
    }
    std::string code = emit_stmt(s);
    if (!code.empty()) lines.push_back(std::move(code));
  }
  if (roots.size() == 1) {
    lines.push_back(ind() + "return " + emit_expr(roots[0]) + ";");
  } else if (roots.size() > 1) {
    std::vector<std::string> parts;
    for (const Expr * r : roots) parts.push_back(emit_expr(r));
    lines.push_back(ind() + "return tova_fragment([" + join(parts, ", ") + "]);");
  }
  --indent_;
  pop_scope();

  stateNames_ = saved_state;
  computedNames_ = saved_computed;

  std::string code = ind() + "function " + std::string(node->name) + "(" + params + ") " +
                     brace(join(lines, "\n"));
  if (!node->style.empty()) {
    code += "\n" + ind() + "if (typeof document !== \"undefined\") {\n";
    code += ind() + "  const __style = document.createElement(\"style\");\n";
    code += fmt::format(
      "{}  __style.setAttribute(\"data-tova-component\", {});\n", ind(), quote_js(node->name));
    code += ind() + "  __style.textContent = " + quote_js(node->style) + ";\n";
    code += ind() + "  document.head.appendChild(__style);\n";
    code += ind() + "}";
  }
  return code;
}

std::string ClientEmitter::emit_store(const StoreDecl * node)
{
  declare(node->name);
  const auto saved_state = stateNames_;
  const auto saved_computed = computedNames_;

  std::vector<std::string> lines;
  std::vector<std::string> members;
  ++indent_;
  push_scope();
  for (const Stmt * s : node->body) {
    std::string code = emit_stmt(s);
    if (!code.empty()) lines.push_back(std::move(code));
    if (const auto * st = dyn_cast<StateDecl>(s)) {
      members.push_back(fmt::format("get {}() {{ return {}(); }}", st->name, st->name));
      members.push_back(fmt::format("set {}(v) {{ {}(v); }}", st->name, setter_name(st->name)));
    } else if (const auto * c = dyn_cast<ComputedDecl>(s)) {
      members.push_back(fmt::format("get {}() {{ return {}(); }}", c->name, c->name));
    } else if (const auto * fn = dyn_cast<FunctionDecl>(s)) {
      members.emplace_back(fn->name);
    }
  }
  std::string ret = ind() + "return {";
  for (const auto & m : members) ret += "\n" + ind() + "  " + m + ",";
  ret += members.empty() ? "};" : "\n" + ind() + "};";
  lines.push_back(std::move(ret));
  pop_scope();
  --indent_;

  stateNames_ = saved_state;
  computedNames_ = saved_computed;

  return ind() + "const " + std::string(node->name) + " = (() => " + brace(join(lines, "\n")) +
         ")();";
}

std::string ClientEmitter::emit_rpc_stubs(const std::vector<const FunctionDecl *> & serverFunctions)
{
  std::vector<std::string> lines;
  lines.emplace_back("async function __rpc(name, args) {");
  lines.emplace_back(
    "  const res = await fetch(`/rpc/${name}`, { method: \"POST\", headers: { \"Content-Type\": "
    "\"application/json\" }, body: JSON.stringify({ __args: args }) });");
  lines.emplace_back("  if (!res.ok) throw new Error(`RPC ${name} failed with status ${res.status}`);");
  lines.emplace_back("  const data = await res.json();");
  lines.emplace_back("  return data.result;");
  lines.emplace_back("}");
  lines.emplace_back("const server = {");
  for (const auto * fn : serverFunctions) {
    lines.push_back(
      fmt::format("  {}: (...args) => __rpc({}, args),", fn->name, quote_js(fn->name)));
  }
  lines.emplace_back("};");
  return join(lines, "\n");
}

// ============================================================================
// Module
// ============================================================================

std::string ClientEmitter::generate(
  const std::vector<const NamedBlock *> & blocks, const std::string & shared,
  const std::vector<const FunctionDecl *> & serverFunctions)
{
  std::vector<const StateDecl *> states;
  std::vector<const ComputedDecl *> computeds;
  std::vector<const EffectDecl *> effects;
  std::vector<const ComponentDecl *> components;
  std::vector<const StoreDecl *> stores;
  std::vector<const Stmt *> other;

  for (const auto * block : blocks) {
    for (const Stmt * s : block->body) {
      switch (s->get_kind()) {
        case NodeKind::StateDecl:
          states.push_back(cast<StateDecl>(s));
          break;
        case NodeKind::ComputedDecl:
          computeds.push_back(cast<ComputedDecl>(s));
          break;
        case NodeKind::EffectDecl:
          effects.push_back(cast<EffectDecl>(s));
          break;
        case NodeKind::ComponentDecl:
          components.push_back(cast<ComponentDecl>(s));
          break;
        case NodeKind::StoreDecl:
          stores.push_back(cast<StoreDecl>(s));
          break;
        default:
          other.push_back(s);
          break;
      }
    }
  }

  // Every function may read any module-level signal, whatever its position.
  for (const auto * s : states) stateNames_.emplace(s->name);
  for (const auto * c : computeds) computedNames_.emplace(c->name);

  std::vector<std::string> sections;
  sections.push_back(
    "import { " + join(k_runtime_imports, ", ") + " } from \"./runtime/reactivity.js\";");
  if (!shared.empty()) sections.push_back(shared);
  if (!serverFunctions.empty()) sections.push_back(emit_rpc_stubs(serverFunctions));

  auto section = [&sections](std::string_view title, std::vector<std::string> lines) {
    if (lines.empty()) return;
    sections.push_back(fmt::format("// {}\n{}", title, join(lines, "\n")));
  };

  std::vector<std::string> lines;
  for (const auto * s : states) lines.push_back(emit_signal(s));
  section("Reactive state", std::move(lines));

  lines.clear();
  for (const auto * c : computeds) lines.push_back(emit_computed(c));
  section("Computed values", std::move(lines));

  lines.clear();
  for (const auto * s : other) {
    std::string code = emit_stmt(s);
    if (!code.empty()) lines.push_back(std::move(code));
  }
  if (!lines.empty()) sections.push_back(join(lines, "\n"));

  lines.clear();
  for (const auto * s : stores) lines.push_back(emit_store(s));
  section("Stores", std::move(lines));

  lines.clear();
  for (const auto * c : components) lines.push_back(emit_component(c));
  section("Components", std::move(lines));

  lines.clear();
  for (const auto * e : effects) lines.push_back(emit_effect(e));
  section("Effects", std::move(lines));

  const bool has_app = std::any_of(
    components.begin(), components.end(), [](const ComponentDecl * c) { return c->name == "App"; });
  if (has_app) {
    sections.emplace_back(
      "document.addEventListener(\"DOMContentLoaded\", () => {\n"
      "  mount(App, document.getElementById(\"app\") || document.body);\n"
      "});");
  }

  return join(sections, "\n\n") + "\n";
}

}  // namespace tova::codegen
