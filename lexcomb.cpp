#include <lexcomb.h>

#include <re2/re2.h>

#include <algorithm>
#include <ostream>
#include <sstream>
#include <utility>

#include <cstring>

// Note to readers:
//
// This file is maintained using Vim's fold markers. To view this file with a
// more organization / easier navigation, ensure that Vim is using fold markers
// by running the command:
//
// :set foldmethod=marker

namespace lexcomb {

// {{{ Stream
//===========

namespace {

using UChar = unsigned char;

/// Computes the one-based line and column of a byte offset. Continuation bytes
/// of UTF-8 sequences do not count as columns.
void
computePosition(const char* base, size_t offset, size_t& ln, size_t& col)
{
  ln = 1;
  col = 1;

  for (size_t i = 0; i < offset; i++) {

    char c = base[i];

    if (c == '\n') {
      ln++;
      col = 1;
    } else if ((static_cast<UChar>(c) & 0xc0) != 0x80) {
      col++;
    }
  }
}

} // namespace

Stream::Stream(const char* input)
  : base(input ? input : "")
  , length(input ? std::strlen(input) : 0)
{}

bool
Stream::startsWith(const std::string& text) const noexcept
{
  if (text.size() > this->length)
    return false;

  return std::memcmp(this->getData(), text.data(), text.size()) == 0;
}

Stream
Stream::advance(size_t count) const noexcept
{
  count = std::min(count, this->length);

  Stream next(*this);

  next.offset += count;

  next.length -= count;

  return next;
}

size_t
Stream::getLine() const noexcept
{
  size_t ln = 1;
  size_t col = 1;

  computePosition(this->base, this->offset, ln, col);

  return ln;
}

size_t
Stream::getColumn() const noexcept
{
  size_t ln = 1;
  size_t col = 1;

  computePosition(this->base, this->offset, ln, col);

  return col;
}

std::string
Stream::toString() const
{
  return std::string(this->getData(), this->length);
}

bool
Stream::operator==(const Stream& other) const noexcept
{
  return (this->base == other.base) && (this->offset == other.offset) &&
         (this->length == other.length);
}

//===========
// }}} Stream

// {{{ Match Tree
//===============

namespace {

class MatchTreePrinter final
{
public:
  MatchTreePrinter(std::ostream& s)
    : stream(s)
  {}

  void print(const MatchTree& tree)
  {
    if (tree.isToken()) {
      this->printToken(tree.getToken());
      return;
    }

    this->indent() << "list:" << std::endl;

    this->indentLevel++;

    if (tree.getChildCount() == 0)
      this->indent() << "(empty)" << std::endl;

    for (size_t i = 0; i < tree.getChildCount(); i++)
      this->print(tree.getChild(i));

    this->indentLevel--;
  }

private:
  void printToken(const std::string& token)
  {
    static const char hexDigits[] = "0123456789abcdef";

    this->indent() << '\'';

    for (char c : token) {

      switch (c) {
        case '\t':
          this->stream << "\\t";
          continue;
        case '\r':
          this->stream << "\\r";
          continue;
        case '\n':
          this->stream << "\\n";
          continue;
        case '\'':
          this->stream << "\\'";
          continue;
        case '\\':
          this->stream << "\\\\";
          continue;
      }

      if (static_cast<UChar>(c) < static_cast<UChar>(' ')) {
        this->stream << "\\x";
        this->stream << hexDigits[(static_cast<UChar>(c) >> 4) & 15];
        this->stream << hexDigits[static_cast<UChar>(c) & 15];
        continue;
      }

      this->stream << c;
    }

    this->stream << '\'' << std::endl;
  }

  auto indent() -> std::ostream&
  {
    for (size_t i = 0; i < this->indentLevel; i++)
      this->stream << "  ";

    return this->stream;
  }

  std::ostream& stream;

  size_t indentLevel = 0;
};

const MatchTree&
nullTree()
{
  static MatchTree tree;
  return tree;
}

} // namespace

MatchTree
MatchTree::makeToken(std::string text)
{
  MatchTree tree;
  tree.leaf = true;
  tree.text = std::move(text);
  return tree;
}

MatchTree
MatchTree::makeList(std::vector<MatchTree> children)
{
  MatchTree tree;
  tree.children = std::move(children);
  return tree;
}

const MatchTree&
MatchTree::getChild(size_t index) const noexcept
{
  if (index >= this->children.size())
    return nullTree();
  else
    return this->children[index];
}

void
MatchTree::appendChild(MatchTree&& child)
{
  this->children.emplace_back(std::move(child));
}

void
MatchTree::flatten(std::vector<std::string>& tokens) const
{
  if (this->leaf) {
    tokens.push_back(this->text);
    return;
  }

  for (const auto& child : this->children)
    child.flatten(tokens);
}

std::vector<std::string>
MatchTree::flatten() const
{
  std::vector<std::string> tokens;

  this->flatten(tokens);

  return tokens;
}

std::string
MatchTree::concat() const
{
  std::string joined;

  for (const auto& token : this->flatten())
    joined += token;

  return joined;
}

void
MatchTree::print(std::ostream& stream) const
{
  MatchTreePrinter printer(stream);

  printer.print(*this);
}

bool
MatchTree::operator==(const MatchTree& other) const
{
  return (this->leaf == other.leaf) && (this->text == other.text) &&
         (this->children == other.children);
}

//===============
// }}} Match Tree

// {{{ Rule Printer
//=================

namespace {

class RulePrinter final : public RuleVisitor
{
public:
  RulePrinter(std::ostream& s)
    : stream(s)
  {}

  bool visit(const LiteralRule& literalRule) override
  {
    this->stream << '\'' << literalRule.getText() << '\'';
    return true;
  }

  bool visit(const PatternRule& patternRule) override
  {
    this->stream << '/' << patternRule.getExpr() << '/';
    return true;
  }

  bool visit(const SequenceRule& sequenceRule) override
  {
    return this->printList(sequenceRule.getChildren(), " ");
  }

  bool visit(const AlternationRule& alternationRule) override
  {
    return this->printList(alternationRule.getChildren(), " | ");
  }

  bool visit(const RepetitionRule& repetitionRule) override
  {
    this->printChild(repetitionRule.getChild());
    this->stream << '*';
    return true;
  }

  bool visit(const OptionalRule& optionalRule) override
  {
    if (optionalRule.getChild())
      this->printChild(optionalRule.getChild());
    else
      this->stream << "()";

    this->stream << '?';

    return true;
  }

  bool visit(const AtomRule& atomRule) override
  {
    this->stream << '<';
    this->printChild(atomRule.getChild());
    this->stream << '>';
    return true;
  }

  bool visit(const IgnoreRule& ignoreRule) override
  {
    this->stream << "ignore(";
    this->printChild(ignoreRule.getChild());
    this->stream << ", ";
    this->printChild(ignoreRule.getDiscard());
    this->stream << ')';
    return true;
  }

private:
  void printChild(const RulePtr& child)
  {
    if (child)
      child->accept(*this);
    else
      this->stream << "<null>";
  }

  bool printList(const std::vector<RulePtr>& children, const char* separator)
  {
    this->stream << '(';

    for (size_t i = 0; i < children.size(); i++) {

      if (i > 0)
        this->stream << separator;

      this->printChild(children[i]);
    }

    this->stream << ')';

    return true;
  }

  std::ostream& stream;
};

} // namespace

std::string
Rule::toString() const
{
  std::ostringstream stream;

  RulePrinter printer(stream);

  this->accept(printer);

  return stream.str();
}

//=================
// }}} Rule Printer

// {{{ Rule Kinds
//===============

namespace {

/// Finds out whether a rule is of the kind @p Target.
template<typename Target>
class KindFinder final : public RuleVisitor
{
public:
  const Target* getFound() const noexcept { return this->found; }

  bool visit(const LiteralRule& r) override { return this->take(r); }
  bool visit(const PatternRule& r) override { return this->take(r); }
  bool visit(const SequenceRule& r) override { return this->take(r); }
  bool visit(const AlternationRule& r) override { return this->take(r); }
  bool visit(const RepetitionRule& r) override { return this->take(r); }
  bool visit(const OptionalRule& r) override { return this->take(r); }
  bool visit(const AtomRule& r) override { return this->take(r); }
  bool visit(const IgnoreRule& r) override { return this->take(r); }

private:
  bool take(const Target& r)
  {
    this->found = &r;
    return true;
  }

  template<typename Other>
  bool take(const Other&)
  {
    return false;
  }

  const Target* found = nullptr;
};

/// @return The rule as a @p Target, or null if it is of another kind.
template<typename Target>
const Target*
findKind(const Rule* rule)
{
  if (!rule)
    return nullptr;

  KindFinder<Target> finder;

  rule->accept(finder);

  return finder.getFound();
}

} // namespace

//===============
// }}} Rule Kinds

// {{{ Results
//============

namespace {

/// The longest piece of remaining input quoted in a diagnostic.
const size_t maxExcerptLength = 32;

std::string
makeExcerpt(const Stream& stream)
{
  const char* data = stream.getData();

  size_t length = 0;

  while ((length < stream.getLength()) && (length < maxExcerptLength)) {

    if (data[length] == '\n')
      break;

    length++;
  }

  std::string excerpt(data, length);

  if (length < stream.getLength())
    excerpt += "...";

  return excerpt;
}

std::string
describePosition(const Stream& stream)
{
  if (stream.empty())
    return "at end of input";

  return "at '" + makeExcerpt(stream) + "'";
}

} // namespace

std::string
Failure::getMessage() const
{
  if (this->kind == FailureKind::RemainingInput)
    return "unhandled input '" + makeExcerpt(this->stream) + "'";

  if (!this->rule)
    return "failed to match a null rule " + describePosition(this->stream);

  const auto* patternRule = findKind<PatternRule>(this->rule.get());

  if (patternRule && !patternRule->isValid()) {
    return "invalid pattern '" + patternRule->getExpr() +
           "': " + patternRule->getError();
  }

  return "failed to match " + this->rule->toString() + " " +
         describePosition(this->stream);
}

void
Failure::print(std::ostream& stream, const char* name) const
{
  if (name)
    stream << name << ':';

  stream << this->stream.getLine() << ':' << this->stream.getColumn();

  stream << ": error: " << this->getMessage() << std::endl;
}

MatchResult
MatchResult::success(const Stream& remaining, MatchTree&& tree)
{
  MatchResult result;
  result.failed = false;
  result.stream = remaining;
  result.tree = std::move(tree);
  return result;
}

MatchResult
MatchResult::failure(Failure&& info)
{
  MatchResult result;
  result.failed = true;
  result.stream = info.getStream();
  result.failureInfo = std::move(info);
  return result;
}

bool
MatchResult::operator==(const MatchResult& other) const
{
  if (this->failed != other.failed)
    return false;

  if (this->failed) {
    return (this->failureInfo.getKind() == other.failureInfo.getKind()) &&
           (this->failureInfo.getRule() == other.failureInfo.getRule()) &&
           (this->failureInfo.getStream() == other.failureInfo.getStream());
  }

  return (this->stream == other.stream) && (this->tree == other.tree);
}

LexResult
LexResult::accept(std::vector<std::string>&& tokens)
{
  LexResult result;
  result.failed = false;
  result.tokens = std::move(tokens);
  return result;
}

LexResult
LexResult::reject(const Failure& failure)
{
  LexResult result;
  result.failed = true;
  result.failureInfo = failure;
  return result;
}

void
LexResult::printFailure(std::ostream& stream, const char* name) const
{
  if (this->failed)
    this->failureInfo.print(stream, name);
}

//============
// }}} Results

// {{{ Pattern Rule
//=================

PatternRule::PatternRule(const std::string& e)
  : expr(e)
{
  re2::RE2::Options options;

  options.set_log_errors(false);

  this->regex.reset(new re2::RE2(this->expr, options));
}

PatternRule::~PatternRule() = default;

bool
PatternRule::isValid() const noexcept
{
  return this->regex && this->regex->ok();
}

std::string
PatternRule::getError() const
{
  if (this->isValid())
    return "";

  return this->regex->error();
}

bool
PatternRule::matchPrefix(const Stream& stream, size_t& length) const
{
  if (!this->isValid())
    return false;

  re2::StringPiece text(stream.getData(), stream.getLength());

  re2::StringPiece submatch;

  auto anchor = re2::RE2::ANCHOR_START;

  if (!this->regex->Match(text, 0, text.size(), anchor, &submatch, 1))
    return false;

  length = submatch.size();

  return true;
}

//=================
// }}} Pattern Rule

// {{{ Matcher
//============

namespace {

MatchResult
matchRule(const RulePtr& rule, const Stream& stream, bool ignoreWhitespace);

/// Matches a single rule at a single position. A new matcher is made for every
/// rule that is visited, so that the result of a child does not overwrite the
/// state of its parent.
class RuleMatcher final : public RuleVisitor
{
public:
  RuleMatcher(const RulePtr& r, const Stream& s, bool ignoreWS)
    : rule(r)
    , stream(s)
    , ignoreWhitespace(ignoreWS)
  {}

  MatchResult takeResult() { return std::move(this->result); }

  bool visit(const LiteralRule& literalRule) override
  {
    auto input = this->skipWhitespace(this->stream);

    const auto& text = literalRule.getText();

    if (!input.startsWith(text))
      return this->fail(input);

    return this->succeed(input.advance(text.size()),
                         MatchTree::makeToken(text));
  }

  bool visit(const PatternRule& patternRule) override
  {
    auto input = this->skipWhitespace(this->stream);

    size_t length = 0;

    if (!patternRule.matchPrefix(input, length))
      return this->fail(input);

    std::string text(input.getData(), length);

    return this->succeed(input.advance(length),
                         MatchTree::makeToken(std::move(text)));
  }

  bool visit(const SequenceRule& sequenceRule) override
  {
    auto input = this->stream;

    MatchTree tree;

    for (const auto& child : sequenceRule.getChildren()) {

      auto childResult = this->matchChild(child, input);

      if (!childResult.matched())
        return this->propagate(std::move(childResult));

      input = childResult.getStream();

      tree.appendChild(std::move(childResult.getTree()));
    }

    return this->succeed(input, std::move(tree));
  }

  bool visit(const AlternationRule& alternationRule) override
  {
    for (const auto& child : alternationRule.getChildren()) {

      auto childResult = this->matchChild(child, this->stream);

      if (childResult.matched())
        return this->propagate(std::move(childResult));
    }

    return this->fail(this->stream);
  }

  bool visit(const RepetitionRule& repetitionRule) override
  {
    auto input = this->stream;

    MatchTree tree;

    for (;;) {

      auto childResult = this->matchChild(repetitionRule.getChild(), input);

      if (!childResult.matched())
        break;

      // An empty match would repeat forever.
      if (childResult.getStream().getOffset() == input.getOffset())
        break;

      input = childResult.getStream();

      tree.appendChild(std::move(childResult.getTree()));
    }

    return this->succeed(input, std::move(tree));
  }

  bool visit(const OptionalRule& optionalRule) override
  {
    if (optionalRule.getChild()) {

      const auto& child = optionalRule.getChild();

      auto childResult = this->matchChild(child, this->stream);

      if (childResult.matched())
        return this->propagate(std::move(childResult));
    }

    return this->succeed(this->stream, MatchTree());
  }

  bool visit(const AtomRule& atomRule) override
  {
    auto childResult = this->matchChild(atomRule.getChild(), this->stream);

    if (!childResult.matched())
      return this->propagate(std::move(childResult));

    std::vector<MatchTree> atom;

    atom.emplace_back(MatchTree::makeToken(childResult.getTree().concat()));

    return this->succeed(childResult.getStream(),
                         MatchTree::makeList(std::move(atom)));
  }

  bool visit(const IgnoreRule& ignoreRule) override
  {
    auto input = this->stream;

    if (this->ignoreWhitespace) {

      auto discardResult = this->matchChild(ignoreRule.getDiscard(), input);

      if (discardResult.matched())
        input = discardResult.getStream();
    }

    return this->propagate(this->matchChild(ignoreRule.getChild(), input));
  }

private:
  MatchResult matchChild(const RulePtr& child, const Stream& input) const
  {
    return matchRule(child, input, this->ignoreWhitespace);
  }

  Stream skipWhitespace(const Stream& input) const
  {
    if (!this->ignoreWhitespace)
      return input;

    auto wsResult = matchRule(whitespace(), input, false);

    if (wsResult.matched())
      return wsResult.getStream();
    else
      return input;
  }

  bool succeed(const Stream& remaining, MatchTree&& tree)
  {
    this->result = MatchResult::success(remaining, std::move(tree));
    return true;
  }

  bool fail(const Stream& at)
  {
    Failure failure(FailureKind::FailedMatching, this->rule, at);
    this->result = MatchResult::failure(std::move(failure));
    return false;
  }

  bool propagate(MatchResult&& childResult)
  {
    this->result = std::move(childResult);
    return this->result.matched();
  }

  const RulePtr& rule;

  Stream stream;

  bool ignoreWhitespace = false;

  MatchResult result = MatchResult::failure(Failure());
};

MatchResult
matchRule(const RulePtr& rule, const Stream& stream, bool ignoreWhitespace)
{
  if (!rule) {
    Failure failure(FailureKind::FailedMatching, nullptr, stream);
    return MatchResult::failure(std::move(failure));
  }

  RuleMatcher matcher(rule, stream, ignoreWhitespace);

  rule->accept(matcher);

  return matcher.takeResult();
}

} // namespace

MatchResult
match(const RulePtr& rule, const Stream& stream, bool ignoreWhitespace)
{
  return matchRule(rule, stream, ignoreWhitespace);
}

//============
// }}} Matcher

// {{{ Composition
//================

Operand::Operand(const char* text)
  : rule(literal(text ? text : ""))
{}

Operand::Operand(const std::string& text)
  : rule(literal(text))
{}

namespace {

std::vector<RulePtr>
toRules(std::initializer_list<Operand> operands)
{
  std::vector<RulePtr> rules;

  for (const auto& operand : operands)
    rules.push_back(operand.getRule());

  return rules;
}

} // namespace

RulePtr
literal(const std::string& text)
{
  return std::make_shared<LiteralRule>(text);
}

RulePtr
pattern(const std::string& expr)
{
  return std::make_shared<PatternRule>(expr);
}

/// Every code point Unicode treats as white space. RE2's \s alone only covers
/// ASCII tab, newline, form feed, carriage return and space.
const RulePtr&
whitespace()
{
  static const RulePtr rule =
    pattern("[\\s\\v\\x{1c}-\\x{1f}\\x{85}\\p{Z}]+");
  return rule;
}

RulePtr
sequence(const Operand& a, const Operand& b)
{
  return std::make_shared<SequenceRule>(toRules({ a, b }));
}

RulePtr
sequence(std::initializer_list<Operand> operands)
{
  return std::make_shared<SequenceRule>(toRules(operands));
}

RulePtr
alternate(const Operand& a, const Operand& b)
{
  const auto* alternationRule = findKind<AlternationRule>(a.getRule().get());

  if (!alternationRule)
    return std::make_shared<AlternationRule>(toRules({ a, b }));

  auto children = alternationRule->getChildren();

  children.push_back(b.getRule());

  return std::make_shared<AlternationRule>(std::move(children));
}

RulePtr
alternate(std::initializer_list<Operand> operands)
{
  return std::make_shared<AlternationRule>(toRules(operands));
}

RulePtr
repeat(const RulePtr& rule)
{
  return std::make_shared<RepetitionRule>(rule);
}

RulePtr
optional(const RulePtr& rule)
{
  return std::make_shared<OptionalRule>(rule);
}

RulePtr
optional()
{
  return std::make_shared<OptionalRule>();
}

RulePtr
atomize(const RulePtr& rule)
{
  return std::make_shared<AtomRule>(rule);
}

RulePtr
capture(const RulePtr& rule)
{
  return std::make_shared<SequenceRule>(std::vector<RulePtr>(1, rule));
}

RulePtr
ignore(const RulePtr& rule, const RulePtr& discard)
{
  return std::make_shared<IgnoreRule>(rule, discard);
}

RulePtr
multiple(const RulePtr& rule)
{
  const auto* patternRule = findKind<PatternRule>(rule.get());
  if (patternRule)
    return pattern("(?:" + patternRule->getExpr() + ")+");

  const auto* optionalRule = findKind<OptionalRule>(rule.get());
  if (optionalRule) {

    if (!optionalRule->getChild())
      return rule;

    return repeat(optionalRule->getChild());
  }

  return sequence(rule, repeat(rule));
}

RulePtr
exactly(const RulePtr& rule, size_t count)
{
  return std::make_shared<SequenceRule>(std::vector<RulePtr>(count, rule));
}

RulePtr
many(const RulePtr& rule, size_t min, size_t max)
{
  max = std::max(min, max);

  std::vector<RulePtr> children(min, rule);

  auto optionalRule = optional(rule);

  for (size_t i = min; i < max; i++)
    children.push_back(optionalRule);

  return std::make_shared<SequenceRule>(std::move(children));
}

//================
// }}} Composition

// {{{ Lexer
//==========

LexResult
lex(const RulePtr& rule, const Stream& stream, bool ignoreWhitespace)
{
  std::vector<RulePtr> chain;

  const auto* sequenceRule = findKind<SequenceRule>(rule.get());

  if (sequenceRule)
    chain = sequenceRule->getChildren();
  else
    chain.push_back(rule);

  std::vector<std::string> tokens;

  auto input = stream;

  for (const auto& link : chain) {

    auto result = matchRule(link, input, ignoreWhitespace);

    if (!result.matched())
      return LexResult::reject(result.getFailure());

    input = result.getStream();

    result.getTree().flatten(tokens);
  }

  if (!input.empty()) {
    Failure failure(FailureKind::RemainingInput, nullptr, input);
    return LexResult::reject(failure);
  }

  return LexResult::accept(std::move(tokens));
}

//==========
// }}} Lexer

} // namespace lexcomb
