#ifndef LEXCOMB_POSTFIX_H
#define LEXCOMB_POSTFIX_H

#include <lexcomb.h>

#include <iosfwd>
#include <string>
#include <vector>

namespace lexcomb {

namespace postfix {

/// @brief Makes the rule for integer expressions in postfix notation.
///
/// @detail The rule is a number followed by any number of numbers or
/// operators. The operators are '+', '-', '*', '/' and '^'. The rule only
/// tokenizes, it does not check that the expression is well formed.
RulePtr
makePostfixRule();

/// @brief Evaluates the tokens of a postfix expression with a stack.
///
/// @detail Division rounds toward negative infinity and '^' raises to an
/// integer power. Errors, such as a missing operand, division by zero or a
/// value that does not fit in a long long, are written to @p errStream.
///
/// @return True on success, in which case @p result contains the value.
bool
evaluatePostfix(const std::vector<std::string>& tokens,
                long long& result,
                std::ostream& errStream);

} // namespace postfix

} // namespace lexcomb

#endif // LEXCOMB_POSTFIX_H
