#include <gtest/gtest.h>

#include <string>

#include "tova/ast/ast.hpp"
#include "tova/basic/casting.hpp"
#include "tova/basic/errors.hpp"
#include "tova/test_support/parse_helpers.hpp"

using namespace tova;
using tova::test_support::parse;

namespace
{

Stmt * first_stmt(const ParsedUnit & unit)
{
  if (unit.program == nullptr || unit.program->body.empty()) return nullptr;
  return unit.program->body[0];
}

Expr * first_expr(const ParsedUnit & unit)
{
  auto * stmt = dyn_cast<ExprStmt>(first_stmt(unit));
  return stmt ? stmt->expr : nullptr;
}

std::string parse_error_message(const std::string & src)
{
  try {
    (void)parse(src);
  } catch (const ParseError & e) {
    return e.diagnostic().message;
  }
  return {};
}

}  // namespace

TEST(SyntaxParser, MultiplicationBindsTighterThanAddition)
{
  auto unit = parse("a + b * c");
  auto * add = dyn_cast<BinaryExpr>(first_expr(*unit));
  ASSERT_NE(add, nullptr);
  EXPECT_EQ(add->op, BinaryOp::Add);

  auto * lhs = dyn_cast<Identifier>(add->lhs);
  ASSERT_NE(lhs, nullptr);
  EXPECT_EQ(lhs->name, "a");

  auto * mul = dyn_cast<BinaryExpr>(add->rhs);
  ASSERT_NE(mul, nullptr);
  EXPECT_EQ(mul->op, BinaryOp::Mul);
  EXPECT_EQ(cast<Identifier>(mul->lhs)->name, "b");
  EXPECT_EQ(cast<Identifier>(mul->rhs)->name, "c");
}

TEST(SyntaxParser, PowerIsRightAssociative)
{
  auto unit = parse("2 ** 3 ** 2");
  auto * outer = dyn_cast<BinaryExpr>(first_expr(*unit));
  ASSERT_NE(outer, nullptr);
  EXPECT_EQ(outer->op, BinaryOp::Pow);
  EXPECT_TRUE(isa<NumberLiteral>(outer->lhs));
  auto * inner = dyn_cast<BinaryExpr>(outer->rhs);
  ASSERT_NE(inner, nullptr);
  EXPECT_EQ(inner->op, BinaryOp::Pow);
}

TEST(SyntaxParser, BareAssignmentIsImmutableBinding)
{
  auto unit = parse("total = 1..10");
  auto * assign = dyn_cast<Assignment>(first_stmt(*unit));
  ASSERT_NE(assign, nullptr);
  ASSERT_EQ(assign->targets.size(), 1U);
  EXPECT_EQ(cast<Identifier>(assign->targets[0])->name, "total");

  auto * range = dyn_cast<RangeExpr>(assign->values[0]);
  ASSERT_NE(range, nullptr);
  EXPECT_FALSE(range->inclusive);
}

TEST(SyntaxParser, MultipleAssignment)
{
  auto unit = parse("a, b = 1, 2");
  auto * assign = dyn_cast<Assignment>(first_stmt(*unit));
  ASSERT_NE(assign, nullptr);
  EXPECT_EQ(assign->targets.size(), 2U);
  EXPECT_EQ(assign->values.size(), 2U);
}

TEST(SyntaxParser, VarDeclaration)
{
  auto unit = parse("var count = 0");
  auto * decl = dyn_cast<VarDecl>(first_stmt(*unit));
  ASSERT_NE(decl, nullptr);
  ASSERT_EQ(decl->names.size(), 1U);
  EXPECT_EQ(decl->names[0], "count");
}

TEST(SyntaxParser, PipeExpression)
{
  auto unit = parse("items |> filter(is_even)");
  auto * pipe = dyn_cast<PipeExpr>(first_expr(*unit));
  ASSERT_NE(pipe, nullptr);
  EXPECT_TRUE(isa<Identifier>(pipe->lhs));
  EXPECT_TRUE(isa<CallExpr>(pipe->rhs));
}

TEST(SyntaxParser, FunctionWithDefaultsAndReturnType)
{
  auto unit = parse(
    "/// Greets someone\n"
    "fn greet(name: String, greeting = \"Hello\") -> String {\n"
    "  \"{greeting}, {name}\"\n"
    "}\n");
  auto * fn = dyn_cast<FunctionDecl>(first_stmt(*unit));
  ASSERT_NE(fn, nullptr);
  EXPECT_EQ(fn->name, "greet");
  ASSERT_EQ(fn->params.size(), 2U);
  EXPECT_NE(fn->params[0]->type, nullptr);
  EXPECT_NE(fn->params[1]->defaultValue, nullptr);
  auto * ret = dyn_cast<NamedType>(fn->returnType);
  ASSERT_NE(ret, nullptr);
  EXPECT_EQ(ret->name, "String");
  ASSERT_EQ(fn->docs.size(), 1U);
  EXPECT_EQ(fn->docs[0], "Greets someone");
  ASSERT_EQ(fn->body.size(), 1U);
}

TEST(SyntaxParser, TypeDeclarationWithVariants)
{
  auto unit = parse(
    "type Shape {\n"
    "  Circle(radius: Float)\n"
    "  Rect(w: Float, h: Float)\n"
    "  Empty\n"
    "}\n");
  auto * decl = dyn_cast<TypeDecl>(first_stmt(*unit));
  ASSERT_NE(decl, nullptr);
  ASSERT_EQ(decl->variants.size(), 3U);
  EXPECT_EQ(decl->variants[0]->name, "Circle");
  EXPECT_EQ(decl->variants[0]->fields.size(), 1U);
  EXPECT_EQ(decl->variants[1]->fields.size(), 2U);
  EXPECT_TRUE(decl->variants[2]->fields.empty());
  EXPECT_TRUE(decl->fields.empty());
}

TEST(SyntaxParser, RecordTypeDeclaration)
{
  auto unit = parse("type Point { x: Int\n y: Int }");
  auto * decl = dyn_cast<TypeDecl>(first_stmt(*unit));
  ASSERT_NE(decl, nullptr);
  EXPECT_TRUE(decl->variants.empty());
  ASSERT_EQ(decl->fields.size(), 2U);
  EXPECT_EQ(decl->fields[1]->name, "y");
}

TEST(SyntaxParser, MatchPatternsDistinguishVariantsFromBindings)
{
  auto unit = parse(
    "match shape {\n"
    "  Circle(r) => r\n"
    "  0 => 0\n"
    "  other => other\n"
    "  _ => nil\n"
    "}\n");
  auto * m = dyn_cast<MatchExpr>(first_expr(*unit));
  ASSERT_NE(m, nullptr);
  ASSERT_EQ(m->arms.size(), 4U);

  auto * variant = dyn_cast<VariantPattern>(m->arms[0]->pattern);
  ASSERT_NE(variant, nullptr);
  EXPECT_EQ(variant->name, "Circle");
  ASSERT_EQ(variant->fields.size(), 1U);
  EXPECT_TRUE(isa<BindingPattern>(variant->fields[0]));

  EXPECT_TRUE(isa<LiteralPattern>(m->arms[1]->pattern));
  EXPECT_TRUE(isa<BindingPattern>(m->arms[2]->pattern));
  EXPECT_TRUE(isa<WildcardPattern>(m->arms[3]->pattern));
}

TEST(SyntaxParser, ServerBlockWithRoute)
{
  auto unit = parse(
    "server {\n"
    "  fn list_users(req) { [] }\n"
    "  route GET \"/api/users\" => list_users\n"
    "}\n");
  auto * block = dyn_cast<NamedBlock>(first_stmt(*unit));
  ASSERT_NE(block, nullptr);
  EXPECT_EQ(block->blockKind, BlockKind::Server);
  EXPECT_TRUE(block->name.empty());
  ASSERT_EQ(block->body.size(), 2U);

  auto * route = dyn_cast<RouteDecl>(block->body[1]);
  ASSERT_NE(route, nullptr);
  EXPECT_EQ(route->method, "GET");
  EXPECT_EQ(route->path, "/api/users");
}

TEST(SyntaxParser, ClientBlockWithStateAndComponent)
{
  auto unit = parse(
    "client {\n"
    "  state count = 0\n"
    "  component App {\n"
    "    <div class=\"box\">{count}</div>\n"
    "  }\n"
    "}\n");
  auto * block = dyn_cast<NamedBlock>(first_stmt(*unit));
  ASSERT_NE(block, nullptr);
  EXPECT_EQ(block->blockKind, BlockKind::Client);
  ASSERT_EQ(block->body.size(), 2U);
  EXPECT_TRUE(isa<StateDecl>(block->body[0]));

  auto * component = dyn_cast<ComponentDecl>(block->body[1]);
  ASSERT_NE(component, nullptr);
  EXPECT_EQ(component->name, "App");
  ASSERT_EQ(component->body.size(), 1U);

  auto * stmt = dyn_cast<ExprStmt>(component->body[0]);
  ASSERT_NE(stmt, nullptr);
  auto * div = dyn_cast<JsxElement>(stmt->expr);
  ASSERT_NE(div, nullptr);
  EXPECT_EQ(div->tag, "div");
  EXPECT_EQ(div->attributes.size(), 1U);
  ASSERT_EQ(div->children.size(), 1U);
  EXPECT_TRUE(isa<JsxExprChild>(div->children[0]));
}

TEST(SyntaxParser, NamedDeployBlockRequiresName)
{
  auto unit = parse("deploy \"prod\" {\n  server: \"root@example.com\"\n  instances: 2\n}\n");
  auto * block = dyn_cast<NamedBlock>(first_stmt(*unit));
  ASSERT_NE(block, nullptr);
  EXPECT_EQ(block->blockKind, BlockKind::Deploy);
  EXPECT_EQ(block->name, "prod");
  ASSERT_EQ(block->body.size(), 2U);
  EXPECT_EQ(cast<ConfigField>(block->body[0])->key, "server");
}

TEST(SyntaxParser, ContextualBlockWordsStayUsableAsNames)
{
  auto unit = parse("edge = 5\ncli = edge + 1");
  ASSERT_EQ(unit->program->body.size(), 2U);
  EXPECT_TRUE(isa<Assignment>(unit->program->body[0]));
  EXPECT_TRUE(isa<Assignment>(unit->program->body[1]));
}

TEST(SyntaxParser, ConcurrentBlockWithMode)
{
  auto unit = parse(
    "async fn load() {\n"
    "  concurrent cancel_on_error {\n"
    "    a = spawn fetch_a()\n"
    "  }\n"
    "}\n");
  auto * fn = dyn_cast<FunctionDecl>(first_stmt(*unit));
  ASSERT_NE(fn, nullptr);
  EXPECT_TRUE(fn->isAsync);
  ASSERT_EQ(fn->body.size(), 1U);
  auto * block = dyn_cast<ConcurrentBlock>(fn->body[0]);
  ASSERT_NE(block, nullptr);
  EXPECT_EQ(block->mode, ConcurrentMode::CancelOnError);
  ASSERT_EQ(block->body.size(), 1U);
  auto * assign = dyn_cast<Assignment>(block->body[0]);
  ASSERT_NE(assign, nullptr);
  EXPECT_TRUE(isa<SpawnExpr>(assign->values[0]));
}

TEST(SyntaxParser, MutIsRejectedWithHint)
{
  try {
    (void)parse("mut x = 0");
    FAIL() << "expected ParseError";
  } catch (const ParseError & e) {
    EXPECT_EQ(e.diagnostic().message, "'mut' is not supported in Tova");
    ASSERT_TRUE(e.hint().has_value());
    EXPECT_EQ(*e.hint(), "Use 'var' for mutable variables: var x = 0");
  }
}

TEST(SyntaxParser, LetRequiresDestructuring)
{
  EXPECT_EQ(parse_error_message("let x = 5"), "'let' is only used for destructuring in Tova");
}

TEST(SyntaxParser, ErrorLocationPointsAtOffendingToken)
{
  try {
    (void)parse("x = 1\ny = (2 + \n");
    FAIL() << "expected ParseError";
  } catch (const ParseError & e) {
    EXPECT_GE(e.diagnostic().line, 2U);
  }
}
