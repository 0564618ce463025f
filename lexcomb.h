#ifndef LEXCOMB_H
#define LEXCOMB_H

#include <stddef.h>

#include <initializer_list>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace re2 {

class RE2;

} // namespace re2

namespace lexcomb {

class Rule;

/// Rules are immutable once built, so a single instance may be shared by any
/// number of parent rules.
using RulePtr = std::shared_ptr<const Rule>;

// {{{ Stream
//===========

/// @brief A view of the input that has not been consumed yet.
///
/// @detail Streams never own the text they refer to. The caller is required to
/// keep the input alive for as long as any stream, match result or failure
/// derived from it is in use. Advancing a stream returns a new stream, the
/// original is left untouched.
class Stream final
{
public:
  Stream() = default;

  /// @param input The beginning of the input. Does not have to be
  /// null-terminated.
  ///
  /// @param len The number of bytes in the input.
  Stream(const char* input, size_t len)
    : base(input)
    , length(len)
  {}

  /// Constructs a stream from a null-terminated string.
  Stream(const char* input);

  /// @note The string must outlive the stream.
  explicit Stream(const std::string& input)
    : Stream(input.data(), input.size())
  {}

  const char* getData() const noexcept { return this->base + this->offset; }

  size_t getLength() const noexcept { return this->length; }

  /// @return The number of bytes between the beginning of the original input
  /// and the beginning of this stream.
  size_t getOffset() const noexcept { return this->offset; }

  bool empty() const noexcept { return this->length == 0; }

  bool startsWith(const std::string& text) const noexcept;

  /// @return A stream that begins @p count bytes further. The count is clamped
  /// to the length of the stream.
  Stream advance(size_t count) const noexcept;

  /// The line and column are one-based and are computed from the original
  /// input. They exist for diagnostic purposes only.
  size_t getLine() const noexcept;

  size_t getColumn() const noexcept;

  std::string toString() const;

  bool operator==(const Stream& other) const noexcept;

  bool operator!=(const Stream& other) const noexcept
  {
    return !(*this == other);
  }

private:
  const char* base = "";
  size_t offset = 0;
  size_t length = 0;
};

//===========
// }}} Stream

// {{{ Match Tree
//===============

/// @brief The text consumed by a successful match.
///
/// @detail A match tree is either a single token or an ordered list of match
/// trees. The nesting follows the shape of the rule that produced it.
/// Flattening the tree depth-first gives the token sequence.
class MatchTree final
{
public:
  /// Constructs an empty list.
  MatchTree() = default;

  static MatchTree makeToken(std::string text);

  static MatchTree makeList(std::vector<MatchTree> children);

  bool isToken() const noexcept { return this->leaf; }

  /// @return The token text, or an empty string if this is a list.
  const std::string& getToken() const noexcept { return this->text; }

  size_t getChildCount() const noexcept { return this->children.size(); }

  const MatchTree& getChild(size_t index) const noexcept;

  void appendChild(MatchTree&& child);

  /// Appends the tokens of this tree, in order, to @p tokens.
  void flatten(std::vector<std::string>& tokens) const;

  std::vector<std::string> flatten() const;

  /// @return All tokens of the tree joined together.
  std::string concat() const;

  void print(std::ostream&) const;

  bool operator==(const MatchTree& other) const;

  bool operator!=(const MatchTree& other) const { return !(*this == other); }

private:
  bool leaf = false;

  std::string text;

  std::vector<MatchTree> children;
};

//===============
// }}} Match Tree

// {{{ Results
//============

enum class FailureKind
{
  /// A rule that was required to match did not match.
  FailedMatching,
  /// Lexing matched every rule but left input behind.
  RemainingInput
};

/// Describes why a match or a lex call was rejected.
class Failure final
{
public:
  Failure() = default;

  Failure(FailureKind k, RulePtr r, const Stream& s)
    : kind(k)
    , rule(std::move(r))
    , stream(s)
  {}

  FailureKind getKind() const noexcept { return this->kind; }

  /// @return The rule that failed. This is null for @ref
  /// FailureKind::RemainingInput.
  const RulePtr& getRule() const noexcept { return this->rule; }

  /// @return The stream at the point of failure.
  const Stream& getStream() const noexcept { return this->stream; }

  std::string getMessage() const;

  /// Prints the failure as a single diagnostic line.
  ///
  /// @param name The name of the input, used as a prefix. May be null.
  void print(std::ostream&, const char* name = nullptr) const;

private:
  FailureKind kind = FailureKind::FailedMatching;

  RulePtr rule;

  Stream stream;
};

class MatchResult final
{
public:
  static MatchResult success(const Stream& remaining, MatchTree&& tree);

  static MatchResult failure(Failure&& failure);

  bool matched() const noexcept { return !this->failed; }

  /// @return The input left after the match.
  const Stream& getStream() const noexcept { return this->stream; }

  const MatchTree& getTree() const noexcept { return this->tree; }

  MatchTree& getTree() noexcept { return this->tree; }

  const Failure& getFailure() const noexcept { return this->failureInfo; }

  bool operator==(const MatchResult& other) const;

private:
  MatchResult() = default;

  bool failed = false;

  Stream stream;

  MatchTree tree;

  Failure failureInfo;
};

class LexResult final
{
public:
  static LexResult accept(std::vector<std::string>&& tokens);

  static LexResult reject(const Failure& failure);

  bool hasFailure() const noexcept { return this->failed; }

  const Failure& getFailure() const noexcept { return this->failureInfo; }

  /// @note Empty whenever @ref LexResult::hasFailure returns true. A partial
  /// token sequence is never kept.
  const std::vector<std::string>& getTokens() const noexcept
  {
    return this->tokens;
  }

  /// Does nothing if lexing succeeded.
  void printFailure(std::ostream&, const char* name = nullptr) const;

private:
  LexResult() = default;

  bool failed = false;

  std::vector<std::string> tokens;

  Failure failureInfo;
};

//============
// }}} Results

// {{{ Rules
//==========

class LiteralRule;
class PatternRule;
class SequenceRule;
class AlternationRule;
class RepetitionRule;
class OptionalRule;
class AtomRule;
class IgnoreRule;

class RuleVisitor
{
public:
  virtual ~RuleVisitor() = default;
  virtual bool visit(const LiteralRule&) = 0;
  virtual bool visit(const PatternRule&) = 0;
  virtual bool visit(const SequenceRule&) = 0;
  virtual bool visit(const AlternationRule&) = 0;
  virtual bool visit(const RepetitionRule&) = 0;
  virtual bool visit(const OptionalRule&) = 0;
  virtual bool visit(const AtomRule&) = 0;
  virtual bool visit(const IgnoreRule&) = 0;
};

class Rule
{
public:
  virtual ~Rule() = default;

  virtual bool accept(RuleVisitor&) const = 0;

  /// @return A short description of the rule, used in diagnostics.
  std::string toString() const;
};

/// Matches an exact piece of text.
class LiteralRule final : public Rule
{
public:
  explicit LiteralRule(std::string t)
    : text(std::move(t))
  {}

  bool accept(RuleVisitor& v) const override { return v.visit(*this); }

  const std::string& getText() const noexcept { return this->text; }

private:
  std::string text;
};

/// Matches a regular expression anchored at the beginning of the stream.
class PatternRule final : public Rule
{
public:
  /// The expression is compiled once, here. Compile errors are kept and can
  /// be queried with @ref PatternRule::getError.
  explicit PatternRule(const std::string& expr);

  ~PatternRule();

  bool accept(RuleVisitor& v) const override { return v.visit(*this); }

  const std::string& getExpr() const noexcept { return this->expr; }

  bool isValid() const noexcept;

  /// @return The compile error, or an empty string if the expression is valid.
  std::string getError() const;

  /// @param length Set to the number of bytes matched on success.
  ///
  /// @return False if the expression does not match at the start of the
  /// stream or if the expression is invalid.
  bool matchPrefix(const Stream& stream, size_t& length) const;

private:
  std::string expr;

  std::unique_ptr<re2::RE2> regex;
};

class SequenceRule final : public Rule
{
public:
  explicit SequenceRule(std::vector<RulePtr> c)
    : children(std::move(c))
  {}

  bool accept(RuleVisitor& v) const override { return v.visit(*this); }

  const std::vector<RulePtr>& getChildren() const noexcept
  {
    return this->children;
  }

private:
  std::vector<RulePtr> children;
};

/// Ordered choice. The first child that matches wins.
class AlternationRule final : public Rule
{
public:
  explicit AlternationRule(std::vector<RulePtr> c)
    : children(std::move(c))
  {}

  bool accept(RuleVisitor& v) const override { return v.visit(*this); }

  const std::vector<RulePtr>& getChildren() const noexcept
  {
    return this->children;
  }

private:
  std::vector<RulePtr> children;
};

/// Zero or more, greedy.
class RepetitionRule final : public Rule
{
public:
  explicit RepetitionRule(RulePtr c)
    : child(std::move(c))
  {}

  bool accept(RuleVisitor& v) const override { return v.visit(*this); }

  const RulePtr& getChild() const noexcept { return this->child; }

private:
  RulePtr child;
};

/// Zero or one. Without a child this matches the empty string.
class OptionalRule final : public Rule
{
public:
  explicit OptionalRule(RulePtr c = nullptr)
    : child(std::move(c))
  {}

  bool accept(RuleVisitor& v) const override { return v.visit(*this); }

  /// @note May be null.
  const RulePtr& getChild() const noexcept { return this->child; }

private:
  RulePtr child;
};

/// Concatenates the tokens of its child into a single token.
class AtomRule final : public Rule
{
public:
  explicit AtomRule(RulePtr c)
    : child(std::move(c))
  {}

  bool accept(RuleVisitor& v) const override { return v.visit(*this); }

  const RulePtr& getChild() const noexcept { return this->child; }

private:
  RulePtr child;
};

/// Skips the discard rule, when whitespace skipping is on, before matching the
/// child.
class IgnoreRule final : public Rule
{
public:
  IgnoreRule(RulePtr c, RulePtr d)
    : child(std::move(c))
    , discard(std::move(d))
  {}

  bool accept(RuleVisitor& v) const override { return v.visit(*this); }

  const RulePtr& getChild() const noexcept { return this->child; }

  const RulePtr& getDiscard() const noexcept { return this->discard; }

private:
  RulePtr child;

  RulePtr discard;
};

//==========
// }}} Rules

// {{{ Composition
//================

/// An argument to @ref sequence or @ref alternate. Strings are turned into
/// literal rules.
class Operand final
{
public:
  Operand(RulePtr r)
    : rule(std::move(r))
  {}

  Operand(const char* text);

  Operand(const std::string& text);

  const RulePtr& getRule() const noexcept { return this->rule; }

private:
  RulePtr rule;
};

RulePtr
literal(const std::string& text);

RulePtr
pattern(const std::string& expr);

/// @return The shared pattern that matches one or more whitespace characters.
const RulePtr&
whitespace();

/// Always produces a new two-element sequence. Sequences given as operands
/// are not flattened.
RulePtr
sequence(const Operand& a, const Operand& b);

RulePtr
sequence(std::initializer_list<Operand> operands);

/// If @p a is already an alternation, @p b is appended to a copy of its
/// children. Otherwise a new two-element alternation is made.
RulePtr
alternate(const Operand& a, const Operand& b);

RulePtr
alternate(std::initializer_list<Operand> operands);

RulePtr
repeat(const RulePtr& rule);

RulePtr
optional(const RulePtr& rule);

/// @return An optional rule without a child. It always matches nothing.
RulePtr
optional();

RulePtr
atomize(const RulePtr& rule);

/// Wraps the rule in a one-element sequence, adding one level of nesting to
/// its match tree.
RulePtr
capture(const RulePtr& rule);

RulePtr
ignore(const RulePtr& rule, const RulePtr& discard = whitespace());

/// One or more occurrences of the rule.
RulePtr
multiple(const RulePtr& rule);

/// A sequence of exactly @p count copies of the rule.
RulePtr
exactly(const RulePtr& rule, size_t count);

/// At least @p min and at most @p max occurrences of the rule.
RulePtr
many(const RulePtr& rule, size_t min, size_t max);

//================
// }}} Composition

// {{{ Matching
//=============

/// Matches the rule at the beginning of the stream. The stream does not have to
/// be consumed entirely.
MatchResult
match(const RulePtr& rule, const Stream& stream, bool ignoreWhitespace = false);

/// @brief Matches the rule against the entire stream and returns the flattened
/// tokens.
///
/// @detail A rule that is not a sequence is treated as a sequence of one. The
/// children of the sequence are matched in order and their tokens are
/// collected as they are produced. The call fails on the first child that does
/// not match, or if any input is left after the last child.
LexResult
lex(const RulePtr& rule, const Stream& stream, bool ignoreWhitespace = false);

//=============
// }}} Matching

} // namespace lexcomb

#endif // LEXCOMB_H
