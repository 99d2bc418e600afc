// tova/ast/json_visitor.cpp - JSON serialization implementation
//
#include "tova/ast/json_visitor.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

#include "tova/ast/ast.hpp"
#include "tova/ast/ast_enums.hpp"
#include "tova/ast/visitor.hpp"
#include "tova/basic/source_manager.hpp"

namespace tova
{
namespace
{

using nlohmann::json;

// ============================================================================
// Helper functions
// ============================================================================

json j_range(SourceRange r)
{
  if (r.is_invalid()) {
    return json{{"start", nullptr}, {"end", nullptr}};
  }
  return json{{"start", r.get_begin().get_offset()}, {"end", r.get_end().get_offset()}};
}

json j_names(gsl::span<std::string_view> names)
{
  json arr = json::array();
  for (const auto n : names) {
    arr.push_back(std::string(n));
  }
  return arr;
}

json j_opt_name(std::string_view name)
{
  return name.empty() ? json(nullptr) : json(std::string(name));
}

// ============================================================================
// JsonVisitor
// ============================================================================

class JsonVisitor : public ConstAstVisitor<JsonVisitor, json>
{
public:
  json child(const AstNode * node) { return node ? visit(node) : json(nullptr); }

  template <typename T>
  json list(gsl::span<T *> nodes)
  {
    json arr = json::array();
    for (const auto * n : nodes) {
      arr.push_back(child(n));
    }
    return arr;
  }

  static json make(std::string_view type, const AstNode * node)
  {
    return json{{"type", std::string(type)}, {"range", j_range(node->get_range())}};
  }

  // --- Expressions -----------------------------------------------------------

  json visit_number_literal(const NumberLiteral * n)
  {
    json j = make("NumberLiteral", n);
    j["value"] = n->value;
    j["text"] = std::string(n->text);
    j["isFloat"] = n->isFloat;
    return j;
  }

  json visit_string_literal(const StringLiteral * n)
  {
    json j = make("StringLiteral", n);
    j["value"] = std::string(n->value);
    return j;
  }

  json visit_template_literal(const TemplateLiteral * n)
  {
    json j = make("TemplateLiteral", n);
    j["parts"] = list(n->parts);
    return j;
  }

  json visit_bool_literal(const BoolLiteral * n)
  {
    json j = make("BoolLiteral", n);
    j["value"] = n->value;
    return j;
  }

  json visit_nil_literal(const NilLiteral * n) { return make("NilLiteral", n); }

  json visit_identifier(const Identifier * n)
  {
    json j = make("Identifier", n);
    j["name"] = std::string(n->name);
    return j;
  }

  json visit_binary_expr(const BinaryExpr * n)
  {
    json j = make("BinaryExpr", n);
    j["op"] = std::string(to_string(n->op));
    j["lhs"] = child(n->lhs);
    j["rhs"] = child(n->rhs);
    return j;
  }

  json visit_unary_expr(const UnaryExpr * n)
  {
    json j = make("UnaryExpr", n);
    j["op"] = std::string(to_string(n->op));
    j["operand"] = child(n->operand);
    return j;
  }

  json visit_chained_comparison(const ChainedComparison * n)
  {
    json j = make("ChainedComparison", n);
    j["operands"] = list(n->operands);
    json ops = json::array();
    for (const auto op : n->ops) {
      ops.push_back(std::string(to_string(op)));
    }
    j["ops"] = std::move(ops);
    return j;
  }

  json visit_membership_expr(const MembershipExpr * n)
  {
    json j = make("MembershipExpr", n);
    j["value"] = child(n->value);
    j["collection"] = child(n->collection);
    j["negated"] = n->negated;
    return j;
  }

  json visit_range_expr(const RangeExpr * n)
  {
    json j = make("RangeExpr", n);
    j["start"] = child(n->start);
    j["end"] = child(n->end);
    j["inclusive"] = n->inclusive;
    return j;
  }

  json visit_call_expr(const CallExpr * n)
  {
    json j = make("CallExpr", n);
    j["callee"] = child(n->callee);
    j["args"] = list(n->args);
    return j;
  }

  json visit_named_argument(const NamedArgument * n)
  {
    json j = make("NamedArgument", n);
    j["name"] = std::string(n->name);
    j["value"] = child(n->value);
    return j;
  }

  json visit_member_expr(const MemberExpr * n)
  {
    json j = make("MemberExpr", n);
    j["object"] = child(n->object);
    j["property"] = std::string(n->property);
    j["optional"] = n->optional;
    return j;
  }

  json visit_index_expr(const IndexExpr * n)
  {
    json j = make("IndexExpr", n);
    j["object"] = child(n->object);
    j["index"] = child(n->index);
    return j;
  }

  json visit_slice_expr(const SliceExpr * n)
  {
    json j = make("SliceExpr", n);
    j["object"] = child(n->object);
    j["start"] = child(n->start);
    j["end"] = child(n->end);
    j["step"] = child(n->step);
    return j;
  }

  json visit_propagate_expr(const PropagateExpr * n)
  {
    json j = make("PropagateExpr", n);
    j["operand"] = child(n->operand);
    return j;
  }

  json visit_await_expr(const AwaitExpr * n)
  {
    json j = make("AwaitExpr", n);
    j["operand"] = child(n->operand);
    return j;
  }

  json visit_spread_expr(const SpreadExpr * n)
  {
    json j = make("SpreadExpr", n);
    j["operand"] = child(n->operand);
    return j;
  }

  json visit_lambda_expr(const LambdaExpr * n)
  {
    json j = make("LambdaExpr", n);
    j["params"] = list(n->params);
    j["async"] = n->isAsync;
    if (n->isBlock) {
      j["body"] = list(n->body);
    } else {
      j["body"] = child(n->bodyExpr);
    }
    return j;
  }

  json visit_match_expr(const MatchExpr * n)
  {
    json j = make("MatchExpr", n);
    j["subject"] = child(n->subject);
    j["arms"] = list(n->arms);
    return j;
  }

  json visit_if_expr(const IfExpr * n)
  {
    json j = make("IfExpr", n);
    j["condition"] = child(n->condition);
    j["then"] = list(n->thenBody);
    j["elifs"] = list(n->elifs);
    j["else"] = list(n->elseBody);
    return j;
  }

  json visit_array_literal(const ArrayLiteral * n)
  {
    json j = make("ArrayLiteral", n);
    j["elements"] = list(n->elements);
    return j;
  }

  json visit_object_literal(const ObjectLiteral * n)
  {
    json j = make("ObjectLiteral", n);
    j["properties"] = list(n->properties);
    return j;
  }

  json visit_list_comprehension(const ListComprehension * n)
  {
    json j = make("ListComprehension", n);
    j["element"] = child(n->element);
    j["variable"] = std::string(n->variable);
    j["secondVar"] = j_opt_name(n->secondVar);
    j["iterable"] = child(n->iterable);
    j["condition"] = child(n->condition);
    return j;
  }

  json visit_dict_comprehension(const DictComprehension * n)
  {
    json j = make("DictComprehension", n);
    j["key"] = child(n->key);
    j["value"] = child(n->value);
    j["variable"] = std::string(n->variable);
    j["secondVar"] = j_opt_name(n->secondVar);
    j["iterable"] = child(n->iterable);
    j["condition"] = child(n->condition);
    return j;
  }

  json visit_tuple_expr(const TupleExpr * n)
  {
    json j = make("TupleExpr", n);
    j["elements"] = list(n->elements);
    return j;
  }

  json visit_pipe_expr(const PipeExpr * n)
  {
    json j = make("PipeExpr", n);
    j["lhs"] = child(n->lhs);
    j["rhs"] = child(n->rhs);
    return j;
  }

  json visit_spawn_expr(const SpawnExpr * n)
  {
    json j = make("SpawnExpr", n);
    j["operand"] = child(n->operand);
    return j;
  }

  json visit_jsx_element(const JsxElement * n)
  {
    json j = make("JsxElement", n);
    j["tag"] = std::string(n->tag);
    j["attributes"] = list(n->attributes);
    j["children"] = list(n->children);
    j["selfClosing"] = n->selfClosing;
    return j;
  }

  // --- Types -----------------------------------------------------------------

  json visit_named_type(const NamedType * n)
  {
    json j = make("NamedType", n);
    j["name"] = std::string(n->name);
    j["typeArgs"] = list(n->typeArgs);
    return j;
  }

  json visit_array_type(const ArrayType * n)
  {
    json j = make("ArrayType", n);
    j["element"] = child(n->elementType);
    return j;
  }

  json visit_tuple_type(const TupleType * n)
  {
    json j = make("TupleType", n);
    j["elements"] = list(n->elements);
    return j;
  }

  json visit_function_type(const FunctionType * n)
  {
    json j = make("FunctionType", n);
    j["params"] = list(n->params);
    j["returnType"] = child(n->returnType);
    return j;
  }

  // --- Statements ------------------------------------------------------------

  json visit_expr_stmt(const ExprStmt * n)
  {
    json j = make("ExprStmt", n);
    j["expr"] = child(n->expr);
    return j;
  }

  json visit_assignment(const Assignment * n)
  {
    json j = make("Assignment", n);
    j["targets"] = list(n->targets);
    j["values"] = list(n->values);
    j["annotation"] = child(n->type);
    return j;
  }

  json visit_var_decl(const VarDecl * n)
  {
    json j = make("VarDecl", n);
    j["names"] = j_names(n->names);
    j["values"] = list(n->values);
    j["annotation"] = child(n->type);
    return j;
  }

  json visit_let_destructure(const LetDestructure * n)
  {
    json j = make("LetDestructure", n);
    j["isObject"] = n->isObject;
    j["keys"] = j_names(n->keys);
    j["names"] = j_names(n->names);
    j["value"] = child(n->value);
    return j;
  }

  json visit_compound_assign(const CompoundAssign * n)
  {
    json j = make("CompoundAssign", n);
    j["op"] = std::string(to_string(n->op));
    j["target"] = child(n->target);
    j["value"] = child(n->value);
    return j;
  }

  json visit_if_stmt(const IfStmt * n)
  {
    json j = make("IfStmt", n);
    j["condition"] = child(n->condition);
    j["then"] = list(n->thenBody);
    j["elifs"] = list(n->elifs);
    j["else"] = n->hasElse ? list(n->elseBody) : json(nullptr);
    return j;
  }

  json visit_for_stmt(const ForStmt * n)
  {
    json j = make("ForStmt", n);
    j["variable"] = std::string(n->variable);
    j["secondVar"] = j_opt_name(n->secondVar);
    j["iterable"] = child(n->iterable);
    j["body"] = list(n->body);
    j["else"] = n->hasElse ? list(n->elseBody) : json(nullptr);
    return j;
  }

  json visit_while_stmt(const WhileStmt * n)
  {
    json j = make("WhileStmt", n);
    j["condition"] = child(n->condition);
    j["body"] = list(n->body);
    return j;
  }

  json visit_try_stmt(const TryStmt * n)
  {
    json j = make("TryStmt", n);
    j["body"] = list(n->body);
    j["catchParam"] = j_opt_name(n->catchParam);
    j["catch"] = n->hasCatch ? list(n->catchBody) : json(nullptr);
    j["finally"] = n->hasFinally ? list(n->finallyBody) : json(nullptr);
    return j;
  }

  json visit_return_stmt(const ReturnStmt * n)
  {
    json j = make("ReturnStmt", n);
    j["value"] = child(n->value);
    return j;
  }

  json visit_break_stmt(const BreakStmt * n) { return make("BreakStmt", n); }

  json visit_continue_stmt(const ContinueStmt * n) { return make("ContinueStmt", n); }

  json visit_guard_stmt(const GuardStmt * n)
  {
    json j = make("GuardStmt", n);
    j["condition"] = child(n->condition);
    j["else"] = list(n->elseBody);
    return j;
  }

  json visit_concurrent_block(const ConcurrentBlock * n)
  {
    json j = make("ConcurrentBlock", n);
    j["mode"] = std::string(to_string(n->mode));
    j["timeout"] = child(n->timeout);
    j["body"] = list(n->body);
    return j;
  }

  json visit_select_stmt(const SelectStmt * n)
  {
    json j = make("SelectStmt", n);
    j["cases"] = list(n->cases);
    return j;
  }

  // --- Declarations ----------------------------------------------------------

  json visit_function_decl(const FunctionDecl * n)
  {
    json j = make("FunctionDecl", n);
    j["name"] = std::string(n->name);
    j["typeParams"] = j_names(n->typeParams);
    j["params"] = list(n->params);
    j["returnType"] = child(n->returnType);
    j["body"] = list(n->body);
    j["async"] = n->isAsync;
    j["pub"] = n->isPub;
    if (!n->docs.empty()) {
      j["docs"] = j_names(n->docs);
    }
    return j;
  }

  json visit_type_decl(const TypeDecl * n)
  {
    json j = make("TypeDecl", n);
    j["name"] = std::string(n->name);
    j["typeParams"] = j_names(n->typeParams);
    j["variants"] = list(n->variants);
    j["fields"] = list(n->fields);
    j["derive"] = j_names(n->derives);
    return j;
  }

  json visit_type_alias_decl(const TypeAliasDecl * n)
  {
    json j = make("TypeAliasDecl", n);
    j["name"] = std::string(n->name);
    j["aliasedType"] = child(n->aliasedType);
    return j;
  }

  json visit_interface_decl(const InterfaceDecl * n)
  {
    json j = make("InterfaceDecl", n);
    j["name"] = std::string(n->name);
    j["members"] = list(n->members);
    return j;
  }

  json visit_import_decl(const ImportDecl * n)
  {
    json j = make("ImportDecl", n);
    j["source"] = std::string(n->source);
    j["default"] = j_opt_name(n->defaultName);
    json specs = json::array();
    for (size_t i = 0; i < n->names.size(); ++i) {
      specs.push_back(
        json{{"name", std::string(n->names[i])}, {"local", std::string(n->local_name(i))}});
    }
    j["specifiers"] = std::move(specs);
    return j;
  }

  json visit_named_block(const NamedBlock * n)
  {
    json j = make("NamedBlock", n);
    j["kind"] = std::string(to_string(n->blockKind));
    j["name"] = j_opt_name(n->name);
    j["body"] = list(n->body);
    return j;
  }

  json visit_state_decl(const StateDecl * n)
  {
    json j = make("StateDecl", n);
    j["name"] = std::string(n->name);
    j["annotation"] = child(n->type);
    j["init"] = child(n->init);
    return j;
  }

  json visit_computed_decl(const ComputedDecl * n)
  {
    json j = make("ComputedDecl", n);
    j["name"] = std::string(n->name);
    j["expr"] = child(n->expr);
    return j;
  }

  json visit_effect_decl(const EffectDecl * n)
  {
    json j = make("EffectDecl", n);
    j["body"] = list(n->body);
    return j;
  }

  json visit_component_decl(const ComponentDecl * n)
  {
    json j = make("ComponentDecl", n);
    j["name"] = std::string(n->name);
    j["params"] = list(n->params);
    j["body"] = list(n->body);
    j["style"] = j_opt_name(n->style);
    return j;
  }

  json visit_store_decl(const StoreDecl * n)
  {
    json j = make("StoreDecl", n);
    j["name"] = std::string(n->name);
    j["body"] = list(n->body);
    return j;
  }

  json visit_route_decl(const RouteDecl * n)
  {
    json j = make("RouteDecl", n);
    j["method"] = std::string(n->method);
    j["path"] = std::string(n->path);
    j["handler"] = child(n->handler);
    return j;
  }

  json visit_middleware_decl(const MiddlewareDecl * n)
  {
    json j = make("MiddlewareDecl", n);
    j["function"] = child(n->function);
    return j;
  }

  json visit_config_field(const ConfigField * n)
  {
    json j = make("ConfigField", n);
    j["key"] = std::string(n->key);
    j["value"] = child(n->value);
    return j;
  }

  json visit_edge_binding(const EdgeBinding * n)
  {
    json j = make("EdgeBinding", n);
    j["kind"] = std::string(to_string(n->bindingKind));
    j["name"] = std::string(n->name);
    j["default"] = child(n->defaultValue);
    return j;
  }

  json visit_deploy_env_block(const DeployEnvBlock * n)
  {
    json j = make("DeployEnvBlock", n);
    j["entries"] = list(n->entries);
    return j;
  }

  json visit_deploy_db_block(const DeployDbBlock * n)
  {
    json j = make("DeployDbBlock", n);
    j["engine"] = std::string(n->engine);
    j["entries"] = list(n->entries);
    return j;
  }

  json visit_security_auth(const SecurityAuth * n)
  {
    json j = make("SecurityAuth", n);
    j["kind"] = std::string(n->authKind);
    j["entries"] = list(n->entries);
    return j;
  }

  json visit_security_role(const SecurityRole * n)
  {
    json j = make("SecurityRole", n);
    j["name"] = std::string(n->name);
    j["can"] = j_names(n->permissions);
    return j;
  }

  json visit_security_protect(const SecurityProtect * n)
  {
    json j = make("SecurityProtect", n);
    j["path"] = std::string(n->path);
    j["require"] = j_opt_name(n->require);
    j["entries"] = list(n->entries);
    return j;
  }

  // --- Patterns --------------------------------------------------------------

  json visit_wildcard_pattern(const WildcardPattern * n) { return make("WildcardPattern", n); }

  json visit_binding_pattern(const BindingPattern * n)
  {
    json j = make("BindingPattern", n);
    j["name"] = std::string(n->name);
    return j;
  }

  json visit_literal_pattern(const LiteralPattern * n)
  {
    json j = make("LiteralPattern", n);
    j["literal"] = child(n->literal);
    return j;
  }

  json visit_range_pattern(const RangePattern * n)
  {
    json j = make("RangePattern", n);
    j["start"] = child(n->start);
    j["end"] = child(n->end);
    j["inclusive"] = n->inclusive;
    return j;
  }

  json visit_variant_pattern(const VariantPattern * n)
  {
    json j = make("VariantPattern", n);
    j["name"] = std::string(n->name);
    j["fields"] = list(n->fields);
    return j;
  }

  json visit_array_pattern(const ArrayPattern * n)
  {
    json j = make("ArrayPattern", n);
    j["elements"] = list(n->elements);
    return j;
  }

  json visit_tuple_pattern(const TuplePattern * n)
  {
    json j = make("TuplePattern", n);
    j["elements"] = list(n->elements);
    return j;
  }

  // --- Supporting nodes ------------------------------------------------------

  json visit_param(const Param * n)
  {
    json j = make("Param", n);
    j["name"] = std::string(n->name);
    j["annotation"] = child(n->type);
    j["default"] = child(n->defaultValue);
    return j;
  }

  json visit_match_arm(const MatchArm * n)
  {
    json j = make("MatchArm", n);
    j["pattern"] = child(n->pattern);
    j["guard"] = child(n->guard);
    if (n->isBlock) {
      j["body"] = list(n->body);
    } else {
      j["body"] = child(n->bodyExpr);
    }
    return j;
  }

  json visit_elif_clause(const ElifClause * n)
  {
    json j = make("ElifClause", n);
    j["condition"] = child(n->condition);
    j["body"] = list(n->body);
    return j;
  }

  json visit_type_variant(const TypeVariant * n)
  {
    json j = make("TypeVariant", n);
    j["name"] = std::string(n->name);
    j["fields"] = list(n->fields);
    return j;
  }

  json visit_type_field(const TypeField * n)
  {
    json j = make("TypeField", n);
    j["name"] = std::string(n->name);
    j["annotation"] = child(n->type);
    return j;
  }

  json visit_object_property(const ObjectProperty * n)
  {
    json j = make("ObjectProperty", n);
    j["key"] = j_opt_name(n->key);
    j["value"] = child(n->value);
    j["shorthand"] = n->shorthand;
    return j;
  }

  json visit_select_case(const SelectCase * n)
  {
    json j = make("SelectCase", n);
    j["kind"] = std::string(to_string(n->caseKind));
    j["binding"] = j_opt_name(n->binding);
    j["channel"] = child(n->channel);
    j["value"] = child(n->value);
    j["body"] = list(n->body);
    return j;
  }

  json visit_jsx_attribute(const JsxAttribute * n)
  {
    json j = make("JsxAttribute", n);
    j["kind"] = std::string(to_string(n->attrKind));
    j["name"] = std::string(n->name);
    j["value"] = child(n->value);
    return j;
  }

  json visit_jsx_text(const JsxText * n)
  {
    json j = make("JsxText", n);
    j["text"] = std::string(n->text);
    return j;
  }

  json visit_jsx_expr_child(const JsxExprChild * n)
  {
    json j = make("JsxExprChild", n);
    j["expr"] = child(n->expr);
    return j;
  }

  json visit_jsx_for(const JsxFor * n)
  {
    json j = make("JsxFor", n);
    j["variable"] = std::string(n->variable);
    j["secondVar"] = j_opt_name(n->secondVar);
    j["iterable"] = child(n->iterable);
    j["key"] = child(n->key);
    j["children"] = list(n->children);
    return j;
  }

  json visit_jsx_if(const JsxIf * n)
  {
    json j = make("JsxIf", n);
    j["condition"] = child(n->condition);
    j["children"] = list(n->children);
    j["elifs"] = list(n->elifs);
    j["else"] = n->hasElse ? list(n->elseChildren) : json(nullptr);
    return j;
  }

  json visit_program(const Program * n)
  {
    json j = make("Program", n);
    j["body"] = list(n->body);
    return j;
  }
};

}  // namespace

nlohmann::json to_json(const AstNode * node)
{
  JsonVisitor v;
  return v.child(node);
}

nlohmann::json to_json(const Program * program)
{
  JsonVisitor v;
  return v.child(program);
}

}  // namespace tova
