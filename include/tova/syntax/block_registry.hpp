// tova/syntax/block_registry.hpp - Detection table for region grammars
//
// Each region grammar (client, server, edge, ...) registers how it is
// recognised and which Parser member parses it. The core statement parser
// consults the table instead of hard-coding region syntax.
//
#pragma once

#include <optional>
#include <string_view>
#include <vector>

#include "tova/ast/ast_enums.hpp"
#include "tova/syntax/token.hpp"

namespace tova
{
class Stmt;
}

namespace tova::syntax
{

class Parser;

/**
 * One registered region grammar.
 *
 * A block is detected either by a leading keyword token (`keyword`) or by a
 * contextual identifier spelled `contextual`. In both cases `lookahead`
 * must accept the two following tokens before the sub-parser runs.
 */
struct BlockEntry
{
  using Lookahead = bool (*)(const Token & next, const Token & after);
  using SubParser = Stmt * (Parser::*)();

  std::string_view name;
  TokenKind keyword = TokenKind::Identifier;
  std::string_view contextual;
  Lookahead lookahead = nullptr;
  SubParser parse = nullptr;
  std::optional<BlockKind> kind;  ///< unset for statement-level blocks
  bool statementLevel = false;    ///< allowed inside function bodies

  [[nodiscard]] bool matches(const Token & t, const Token & next, const Token & after) const;
};

/**
 * Static table of region grammars, populated once on first use.
 */
class BlockRegistry
{
public:
  [[nodiscard]] static const BlockRegistry & instance();

  /**
   * Find the block that starts at `t`.
   *
   * @param top_level true when parsing module-level statements; regions
   *                  are only recognised there
   */
  [[nodiscard]] const BlockEntry * find(
    const Token & t, const Token & next, const Token & after, bool top_level) const;

  [[nodiscard]] const std::vector<BlockEntry> & entries() const noexcept { return entries_; }

private:
  BlockRegistry();

  void add(BlockEntry entry) { entries_.push_back(entry); }

  std::vector<BlockEntry> entries_;
};

}  // namespace tova::syntax
