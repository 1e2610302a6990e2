#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace tl {

enum class SymbolKind : std::uint8_t {
  Tag,    // kick
  InPath  // inpath:res/audio/
};

struct Symbol {
  SymbolKind kind{SymbolKind::Tag};
  std::string value;
};

enum class ExprKind : std::uint8_t {
  And,
  Or,
  Not,  // lhs only
  Term  // term only
};

// Query syntax tree. Whitespace (or `&`) joins terms with AND, `|` is OR and
// binds looser, a leading `-` or `~` negates, parentheses group.
struct Expr {
  ExprKind kind{ExprKind::Term};
  std::unique_ptr<Expr> lhs;
  std::unique_ptr<Expr> rhs;
  Symbol term;
};

std::unique_ptr<Expr> makeTag(const std::string& name);
std::unique_ptr<Expr> makeInPath(const std::string& prefix);
std::unique_ptr<Expr> makeAnd(std::unique_ptr<Expr> a, std::unique_ptr<Expr> b);
std::unique_ptr<Expr> makeOr(std::unique_ptr<Expr> a, std::unique_ptr<Expr> b);
std::unique_ptr<Expr> makeNot(std::unique_ptr<Expr> a);

// Pre-order, depth-first, left child before right.
void forEachNode(const Expr& root, const std::function<void(const Expr&)>& fn);

// Blank text yields a null tree, which matches everything.
// Returns false (and leaves `out` untouched) on malformed text.
bool parseQuery(const std::string& text, std::unique_ptr<Expr>& out,
                std::string* errorOut = nullptr);

// Tags never match: items carry no tags yet. InPath is a prefix test on the
// '/'-separated path relative to the repository root.
bool matchesPath(const Expr* expr, const std::string& relPath);

// Fully parenthesized form, e.g. "((a & b) | ~inpath:x)".
std::string exprToString(const Expr& expr);

} // namespace tl
