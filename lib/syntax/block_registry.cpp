// tova/syntax/block_registry.cpp - Region grammar registrations
#include "tova/syntax/block_registry.hpp"

#include "tova/syntax/parser.hpp"

namespace tova::syntax
{

namespace
{

bool opens_body(const Token & next, const Token & /*after*/)
{
  return next.kind == TokenKind::LBrace;
}

bool opens_optionally_named_body(const Token & next, const Token & after)
{
  if (next.kind == TokenKind::LBrace) return true;
  return next.kind == TokenKind::String && after.kind == TokenKind::LBrace;
}

bool opens_named_body(const Token & next, const Token & after)
{
  return next.kind == TokenKind::String && after.kind == TokenKind::LBrace;
}

bool opens_concurrent(const Token & next, const Token & /*after*/)
{
  if (next.kind == TokenKind::LBrace) return true;
  if (next.kind != TokenKind::Identifier) return false;
  return next.text == "all" || next.text == "cancel_on_error" || next.text == "first" ||
         next.text == "timeout";
}

}  // namespace

bool BlockEntry::matches(const Token & t, const Token & next, const Token & after) const
{
  if (keyword == TokenKind::Identifier) {
    if (t.kind != TokenKind::Identifier || t.text != contextual) return false;
  } else if (t.kind != keyword) {
    return false;
  }
  return lookahead == nullptr || lookahead(next, after);
}

BlockRegistry::BlockRegistry()
{
  add({"client", TokenKind::KwClient, {}, opens_optionally_named_body, &Parser::parse_client_block,
       BlockKind::Client, false});
  add({"server", TokenKind::KwServer, {}, opens_optionally_named_body, &Parser::parse_server_block,
       BlockKind::Server, false});
  add({"shared", TokenKind::KwShared, {}, opens_optionally_named_body, &Parser::parse_shared_block,
       BlockKind::Shared, false});
  add({"edge", TokenKind::Identifier, "edge", opens_optionally_named_body,
       &Parser::parse_edge_block, BlockKind::Edge, false});
  add({"deploy", TokenKind::Identifier, "deploy", opens_named_body, &Parser::parse_deploy_block,
       BlockKind::Deploy, false});
  add({"security", TokenKind::Identifier, "security", opens_body, &Parser::parse_security_block,
       BlockKind::Security, false});
  add({"cli", TokenKind::Identifier, "cli", opens_body, &Parser::parse_cli_block, BlockKind::Cli,
       false});

  add({"concurrent", TokenKind::Identifier, "concurrent", opens_concurrent,
       &Parser::parse_concurrent_block, std::nullopt, true});
  add({"select", TokenKind::Identifier, "select", opens_body, &Parser::parse_select_stmt,
       std::nullopt, true});
}

const BlockRegistry & BlockRegistry::instance()
{
  static const BlockRegistry registry;
  return registry;
}

const BlockEntry * BlockRegistry::find(
  const Token & t, const Token & next, const Token & after, bool top_level) const
{
  for (const auto & entry : entries_) {
    if (!entry.statementLevel && !top_level) continue;
    if (entry.matches(t, next, after)) return &entry;
  }
  return nullptr;
}

}  // namespace tova::syntax
