#include "postfix.h"

#include <limits>
#include <ostream>

#include <cerrno>
#include <cstdlib>

namespace lexcomb {

namespace postfix {

namespace {

bool
isDigit(char c) noexcept
{
  return (c >= '0') && (c <= '9');
}

bool
isNumber(const std::string& token) noexcept
{
  return !token.empty() && isDigit(token[0]);
}

using Limits = std::numeric_limits<long long>;

/// Each of the checked operations returns false, and leaves @p out untouched,
/// when the exact result does not fit in a long long.
bool
checkedAdd(long long a, long long b, long long& out) noexcept
{
  if ((b > 0) && (a > (Limits::max() - b)))
    return false;

  if ((b < 0) && (a < (Limits::min() - b)))
    return false;

  out = a + b;

  return true;
}

bool
checkedSubtract(long long a, long long b, long long& out) noexcept
{
  if ((b < 0) && (a > (Limits::max() + b)))
    return false;

  if ((b > 0) && (a < (Limits::min() + b)))
    return false;

  out = a - b;

  return true;
}

bool
checkedMultiply(long long a, long long b, long long& out) noexcept
{
  if ((a == 0) || (b == 0)) {
    out = 0;
    return true;
  }

  if (a > 0) {
    if ((b > 0) ? (a > (Limits::max() / b)) : (b < (Limits::min() / a)))
      return false;
  } else {
    if ((b > 0) ? (a < (Limits::min() / b)) : (b < (Limits::max() / a)))
      return false;
  }

  out = a * b;

  return true;
}

/// Raises by repeated squaring, so the exponent may be arbitrarily large.
bool
checkedPower(long long base, long long exponent, long long& out) noexcept
{
  long long value = 1;

  while (exponent > 0) {

    if ((exponent & 1) && !checkedMultiply(value, base, value))
      return false;

    exponent >>= 1;

    if ((exponent > 0) && !checkedMultiply(base, base, base))
      return false;
  }

  out = value;

  return true;
}

/// The caller rejects a zero divisor.
bool
floorDivide(long long a, long long b, long long& out) noexcept
{
  if ((a == Limits::min()) && (b == -1))
    return false;

  auto quotient = a / b;

  if (((a % b) != 0) && ((a < 0) != (b < 0)))
    quotient--;

  out = quotient;

  return true;
}

bool
reportOverflow(const std::string& op, std::ostream& errStream)
{
  errStream << "integer overflow in '" << op << "'" << std::endl;
  return false;
}

bool
applyOperator(const std::string& op,
              long long lhs,
              long long rhs,
              long long& value,
              std::ostream& errStream)
{
  if (op == "+")
    return checkedAdd(lhs, rhs, value) || reportOverflow(op, errStream);

  if (op == "-")
    return checkedSubtract(lhs, rhs, value) || reportOverflow(op, errStream);

  if (op == "*")
    return checkedMultiply(lhs, rhs, value) || reportOverflow(op, errStream);

  if (op == "/") {

    if (rhs == 0) {
      errStream << "division by zero" << std::endl;
      return false;
    }

    return floorDivide(lhs, rhs, value) || reportOverflow(op, errStream);
  }

  if (op == "^") {

    if (rhs < 0) {
      errStream << "negative exponent '" << rhs << "'" << std::endl;
      return false;
    }

    return checkedPower(lhs, rhs, value) || reportOverflow(op, errStream);
  }

  errStream << "unknown operator '" << op << "'" << std::endl;

  return false;
}

} // namespace

RulePtr
makePostfixRule()
{
  auto number = pattern("[0-9]+");

  auto term = alternate({ number, "+", "-", "*", "/", "^" });

  return sequence(number, repeat(term));
}

bool
evaluatePostfix(const std::vector<std::string>& tokens,
                long long& result,
                std::ostream& errStream)
{
  std::vector<long long> stack;

  for (const auto& token : tokens) {

    if (isNumber(token)) {

      errno = 0;

      auto number = std::strtoll(token.c_str(), nullptr, 10);

      if (errno == ERANGE) {
        errStream << "number out of range '" << token << "'" << std::endl;
        return false;
      }

      stack.push_back(number);

      continue;
    }

    if (stack.size() < 2) {
      errStream << "not enough operands for '" << token << "'" << std::endl;
      return false;
    }

    auto rhs = stack.back();

    stack.pop_back();

    auto lhs = stack.back();

    stack.pop_back();

    long long value = 0;

    if (!applyOperator(token, lhs, rhs, value, errStream))
      return false;

    stack.push_back(value);
  }

  if (stack.size() != 1) {
    errStream << stack.size() << " values left on the stack" << std::endl;
    return false;
  }

  result = stack.back();

  return true;
}

} // namespace postfix

} // namespace lexcomb
