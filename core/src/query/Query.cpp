#include "tl/query/Query.hpp"

#include <cctype>
#include <cstring>
#include <stdexcept>
#include <utility>
#include <vector>

namespace tl {

namespace {

constexpr const char* kInPathPrefix = "inpath:";

std::unique_ptr<Expr> makeTerm(SymbolKind kind, const std::string& value) {
  auto e = std::make_unique<Expr>();
  e->kind = ExprKind::Term;
  e->term.kind = kind;
  e->term.value = value;
  return e;
}

std::unique_ptr<Expr> makeBinary(ExprKind kind, std::unique_ptr<Expr> a,
                                 std::unique_ptr<Expr> b) {
  auto e = std::make_unique<Expr>();
  e->kind = kind;
  e->lhs = std::move(a);
  e->rhs = std::move(b);
  return e;
}

// Recursive descent over the query text; throws std::runtime_error on
// malformed input.
class QueryParser {
public:
  explicit QueryParser(const std::string& text) : text_(text) {}

  std::unique_ptr<Expr> parse() {
    std::unique_ptr<Expr> e = parseOr();
    skipSpace();
    if (!atEnd()) fail(std::string("unexpected '") + text_[pos_] + "'");
    return e;
  }

  bool blank() {
    skipSpace();
    return atEnd();
  }

private:
  std::unique_ptr<Expr> parseOr() {
    std::unique_ptr<Expr> lhs = parseAnd();
    for (;;) {
      skipSpace();
      if (atEnd() || text_[pos_] != '|') return lhs;
      ++pos_;
      lhs = makeOr(std::move(lhs), parseAnd());
    }
  }

  std::unique_ptr<Expr> parseAnd() {
    std::unique_ptr<Expr> lhs = parseUnary();
    for (;;) {
      skipSpace();
      if (atEnd() || text_[pos_] == '|' || text_[pos_] == ')') return lhs;
      if (text_[pos_] == '&') ++pos_;
      lhs = makeAnd(std::move(lhs), parseUnary());
    }
  }

  std::unique_ptr<Expr> parseUnary() {
    skipSpace();
    if (atEnd()) fail("expected a term");
    char c = text_[pos_];
    if (c == '-' || c == '~') {
      ++pos_;
      return makeNot(parseUnary());
    }
    if (c == '(') {
      ++pos_;
      std::unique_ptr<Expr> inner = parseOr();
      skipSpace();
      if (atEnd() || text_[pos_] != ')') fail("missing ')'");
      ++pos_;
      return inner;
    }
    if (isOperator(c)) fail(std::string("unexpected '") + c + "'");

    std::size_t start = pos_;
    while (!atEnd() && !std::isspace(static_cast<unsigned char>(text_[pos_])) &&
           !isOperator(text_[pos_])) {
      ++pos_;
    }
    std::string word = text_.substr(start, pos_ - start);

    const std::size_t prefixLen = std::strlen(kInPathPrefix);
    if (word.compare(0, prefixLen, kInPathPrefix) == 0) {
      std::string path = word.substr(prefixLen);
      if (path.empty()) fail("inpath: needs a path");
      return makeInPath(path);
    }
    return makeTag(word);
  }

  static bool isOperator(char c) {
    return c == '|' || c == '&' || c == '(' || c == ')';
  }

  void skipSpace() {
    while (!atEnd() && std::isspace(static_cast<unsigned char>(text_[pos_]))) ++pos_;
  }

  bool atEnd() const { return pos_ >= text_.size(); }

  [[noreturn]] void fail(const std::string& what) const {
    throw std::runtime_error("query: " + what + " at offset " + std::to_string(pos_));
  }

  const std::string& text_;
  std::size_t pos_{0};
};

} // namespace

std::unique_ptr<Expr> makeTag(const std::string& name) {
  return makeTerm(SymbolKind::Tag, name);
}

std::unique_ptr<Expr> makeInPath(const std::string& prefix) {
  return makeTerm(SymbolKind::InPath, prefix);
}

std::unique_ptr<Expr> makeAnd(std::unique_ptr<Expr> a, std::unique_ptr<Expr> b) {
  return makeBinary(ExprKind::And, std::move(a), std::move(b));
}

std::unique_ptr<Expr> makeOr(std::unique_ptr<Expr> a, std::unique_ptr<Expr> b) {
  return makeBinary(ExprKind::Or, std::move(a), std::move(b));
}

std::unique_ptr<Expr> makeNot(std::unique_ptr<Expr> a) {
  auto e = std::make_unique<Expr>();
  e->kind = ExprKind::Not;
  e->lhs = std::move(a);
  return e;
}

void forEachNode(const Expr& root, const std::function<void(const Expr&)>& fn) {
  std::vector<const Expr*> stack;
  stack.push_back(&root);
  while (!stack.empty()) {
    const Expr* node = stack.back();
    stack.pop_back();
    fn(*node);
    if (node->rhs) stack.push_back(node->rhs.get());
    if (node->lhs) stack.push_back(node->lhs.get());
  }
}

bool parseQuery(const std::string& text, std::unique_ptr<Expr>& out,
                std::string* errorOut) {
  QueryParser parser(text);
  if (parser.blank()) {
    out.reset();
    return true;
  }
  try {
    out = parser.parse();
  } catch (const std::runtime_error& e) {
    if (errorOut) *errorOut = e.what();
    return false;
  }
  return true;
}

bool matchesPath(const Expr* expr, const std::string& relPath) {
  if (!expr) return true;
  switch (expr->kind) {
    case ExprKind::And:
      return matchesPath(expr->lhs.get(), relPath) && matchesPath(expr->rhs.get(), relPath);
    case ExprKind::Or:
      return matchesPath(expr->lhs.get(), relPath) || matchesPath(expr->rhs.get(), relPath);
    case ExprKind::Not:
      return !matchesPath(expr->lhs.get(), relPath);
    case ExprKind::Term:
      if (expr->term.kind == SymbolKind::Tag) return false;
      return relPath.compare(0, expr->term.value.size(), expr->term.value) == 0;
  }
  return false;
}

std::string exprToString(const Expr& expr) {
  switch (expr.kind) {
    case ExprKind::And:
      return "(" + exprToString(*expr.lhs) + " & " + exprToString(*expr.rhs) + ")";
    case ExprKind::Or:
      return "(" + exprToString(*expr.lhs) + " | " + exprToString(*expr.rhs) + ")";
    case ExprKind::Not:
      return "~" + exprToString(*expr.lhs);
    case ExprKind::Term:
      if (expr.term.kind == SymbolKind::InPath) return kInPathPrefix + expr.term.value;
      return expr.term.value;
  }
  return {};
}

} // namespace tl
