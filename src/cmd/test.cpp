#include "cmd/test.hpp"

#include <cmath>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "eval/evaluator.hpp"
#include "form/expander.hpp"
#include "form/expression_util.hpp"
#include "form/operators.hpp"
#include "form/simplifier.hpp"
#include "sys/log.hpp"

Test::Test(const Settings& settings) : settings(settings) {}

void Test::all() {
  symbol();
  expression();
  print();
  simplify();
  expand();
  eval();
  operators();
  config();
}

Expression num(double value) { return ExpressionUtil::newNumber(value); }

Expression var(const std::string& name) {
  return ExpressionUtil::newVariable(name);
}

Expression add(const Expression& a, const Expression& b) {
  return ExpressionUtil::add(a, b);
}

Expression sub(const Expression& a, const Expression& b) {
  return ExpressionUtil::sub(a, b);
}

Expression mul(const Expression& a, const Expression& b) {
  return ExpressionUtil::mul(a, b);
}

Expression div(const Expression& a, const Expression& b) {
  return ExpressionUtil::div(a, b);
}

Expression power(const Expression& a, const Expression& b) {
  return ExpressionUtil::pow(a, b);
}

void check_true(bool condition, const std::string& msg) {
  if (!condition) {
    Log::get().error(msg, true);
  }
}

void check_str(const Expression& e, const std::string& s) {
  if (e.toString() != s) {
    Log::get().error("Expected " + e.toString() + " to be " + s, true);
  }
}

void check_eq(const Expression& a, const Expression& b) {
  if (a != b) {
    Log::get().error(
        "Expected " + a.toString() + " to be equal to " + b.toString(), true);
  }
}

void check_ne(const Expression& a, const Expression& b) {
  if (a == b) {
    Log::get().error(
        "Expected " + a.toString() + " to differ from " + b.toString(), true);
  }
}

void check_simplify(const Expression& e, const std::string& s) {
  auto once = Simplifier::simplify(e);
  check_str(once, s);
  auto twice = Simplifier::simplify(once);
  if (twice != once || twice.toString() != once.toString()) {
    Log::get().error("Simplification of " + e.toString() +
                         " is not idempotent: " + once.toString() + " vs " +
                         twice.toString(),
                     true);
  }
}

void check_value(const EvalResult& r, double expected) {
  if (!r.ok()) {
    Log::get().error("Unexpected evaluation error: " + r.error.toString(),
                     true);
  }
  if (std::abs(r.value - expected) > 1e-12) {
    Log::get().error("Expected " + std::to_string(r.value) + " to be " +
                         std::to_string(expected),
                     true);
  }
}

void check_error(const EvalResult& r, EvalError::Type type,
                 const std::string& msg) {
  if (r.ok()) {
    Log::get().error("Expected evaluation error: " + msg, true);
  }
  if (r.error.type != type || r.error.toString() != msg) {
    Log::get().error("Unexpected evaluation error: " + r.error.toString(),
                     true);
  }
}

void Test::symbol() {
  Log::get().info("Testing symbol");
  check_true(Symbol("x") == Symbol("x"), "Expected equal symbols");
  check_true(Symbol("x") != Symbol("y"), "Expected different symbols");
  check_true(Symbol("a") < Symbol("b"), "Expected a to be less than b");
  check_true(!(Symbol("b") < Symbol("a")), "Expected b not less than a");
  check_true(Symbol("alpha").toString() == "alpha", "Unexpected symbol name");
  check_true(var("x").symbol == Symbol("x"), "Unexpected variable symbol");
}

void Test::expression() {
  Log::get().info("Testing expression");
  const auto x = var("x");
  const auto y = var("y");
  const auto z = var("z");

  // default expression is the constant zero
  Expression zero;
  check_true(zero.isConstant(0), "Expected zero constant");

  // commutative operations compare as multisets
  check_eq(add(x, y), add(y, x));
  check_eq(mul(x, y), mul(y, x));
  check_eq(add(mul(x, y), z), add(z, mul(y, x)));
  check_ne(sub(x, y), sub(y, x));
  check_ne(div(x, y), div(y, x));
  check_ne(power(x, y), power(y, x));
  check_ne(add(x, y), add(add(x, y), z));
  check_ne(add(x, x), add(x, y));
  check_ne(add(x, y), mul(x, y));
  check_ne(num(1), num(2));
  check_eq(num(0), num(-0.0));

  // strict total order
  std::vector<Expression> exprs = {num(1),    num(2),      x,
                                   y,         add(x, y),   mul(x, y),
                                   sub(x, y), div(x, y),   power(x, y),
                                   add(x, z), mul(num(2), x)};
  for (size_t i = 0; i < exprs.size(); i++) {
    for (size_t j = 0; j < exprs.size(); j++) {
      const auto& a = exprs[i];
      const auto& b = exprs[j];
      if (i == j) {
        check_true(a.compare(b) == 0, "Expected equal: " + a.toString());
      } else {
        check_true((a < b) != (b < a),
                   "Unexpected order: " + a.toString() + ", " + b.toString());
      }
    }
  }

  // builders flatten sums and products
  check_true(add(add(x, y), z).children.size() == 3, "Expected flat sum");
  check_true(add(x, add(y, z)).children.size() == 3, "Expected flat sum");
  check_true(mul(mul(x, y), mul(y, z)).children.size() == 4,
             "Expected flat product");
  check_true(sub(sub(x, y), z).children.size() == 2,
             "Expected binary difference");
  check_true(add(mul(x, y), z).children.size() == 2, "Expected nested sum");

  // sub-expressions
  const auto e = add(x, mul(num(2), y));
  check_true(e.contains(y), "Expected y in " + e.toString());
  check_true(e.contains(mul(y, num(2))), "Expected 2y in " + e.toString());
  check_true(!e.contains(z), "Unexpected z in " + e.toString());
  check_true(e.contains(Expression::Type::PRODUCT), "Expected product");
  check_true(!e.contains(Expression::Type::POWER), "Unexpected power");
  check_true(e.numTerms() == 5, "Unexpected number of terms");

  std::set<Symbol> symbols;
  ExpressionUtil::collectSymbols(power(add(x, y), add(z, x)), symbols);
  check_true(symbols.size() == 3, "Unexpected number of symbols");
  check_true(symbols.count(Symbol("z")) == 1, "Expected symbol z");

  // copies are deep
  auto original = add(x, y);
  auto copy = original;
  copy.children[0] = z;
  check_str(original, "x + y");
  check_str(copy, "y + z");
}

void Test::print() {
  Log::get().info("Testing print");
  const auto x = var("x");
  const auto y = var("y");
  const auto z = var("z");

  // numbers and variables
  check_str(num(2.5), "2.5");
  check_str(num(-3), "-3");
  check_str(num(0.1), "0.1");
  check_str(num(100), "100");
  check_str(num(-0.0), "0");
  check_str(var("alpha"), "alpha");

  // sums
  check_str(add(x, y), "x + y");
  check_str(add(y, x), "x + y");
  check_str(add(num(1), x), "x + 1");
  check_str(add(x, num(-3)), "x - 3");
  check_str(add(x, mul(num(-1), y)), "x - y");
  check_str(add(y, mul(num(-1), x)), "-x + y");
  check_str(add(mul(num(-2), x), y), "-2x + y");
  check_str(add(sub(x, y), z), "x - y + z");
  check_str(add(power(y, num(2)), mul(num(2), x)), "y^2 + 2x");
  check_str(Expression(Expression::Type::SUM), "0");
  check_str(Expression(Expression::Type::SUM,
                       {x, Expression(Expression::Type::SUM,
                                      {mul(num(-1), y), z})}),
            "x - y + z");

  // differences
  check_str(sub(x, y), "x - y");
  check_str(sub(sub(x, y), z), "x - y - z");
  check_str(sub(x, sub(y, z)), "x - (y - z)");
  check_str(sub(x, add(y, z)), "x - (y + z)");
  check_str(sub(add(x, y), z), "x + y - z");
  check_str(sub(x, num(-3)), "x - (-3)");

  // products
  check_str(mul(num(2), x), "2x");
  check_str(mul(x, num(2)), "2x");
  check_str(mul(num(0.5), x), "0.5x");
  check_str(mul(x, y), "x*y");
  check_str(mul(mul(num(2), x), y), "2xy");
  check_str(mul(num(3), power(x, num(2))), "3x^2");
  check_str(mul(mul(num(3), power(x, num(2))), y), "3x^2*y");
  check_str(mul(mul(num(2), x), power(y, num(2))), "2xy^2");
  check_str(mul(num(2), var("ab")), "2*ab");
  check_str(mul(mul(num(2), var("a")), var("b")), "2ab");
  check_str(mul(num(2), add(x, y)), "2*(x + y)");
  check_str(mul(num(-1), x), "-x");
  check_str(mul(num(-1), add(x, y)), "-(x + y)");
  check_str(Expression(Expression::Type::PRODUCT), "1");

  // fractions
  check_str(div(x, y), "x/y");
  check_str(div(add(x, num(1)), y), "(x + 1)/y");
  check_str(div(x, sub(y, z)), "x/(y - z)");
  check_str(div(x, mul(y, z)), "x/(y*z)");
  check_str(div(x, div(y, z)), "x/(y/z)");
  check_str(div(div(x, y), z), "x/y/z");

  // powers
  check_str(power(x, num(2)), "x^2");
  check_str(power(add(x, y), num(2)), "(x + y)^2");
  check_str(power(sub(x, y), num(2)), "(x - y)^2");
  check_str(power(div(x, y), num(2)), "(x/y)^2");
  check_str(power(mul(x, y), num(2)), "(x*y)^2");
  check_str(power(x, add(y, num(1))), "x^(y + 1)");
  check_str(power(power(x, num(2)), num(3)), "(x^2)^3");
  check_str(power(x, num(-1)), "x^(-1)");
  check_str(power(num(-2), x), "(-2)^x");
  check_str(power(mul(num(-1), x), num(2)), "(-x)^2");
  check_str(power(add(add(x, x), mul(y, y)), z), "(y*y + x + x)^z");
}

void Test::simplify() {
  Log::get().info("Testing simplify");
  const auto x = var("x");
  const auto y = var("y");
  const auto a = var("a");
  const auto b = var("b");

  // constant folding
  check_eq(Simplifier::simplify(add(num(2), num(3))), num(5));
  check_simplify(sub(num(5), num(3)), "2");
  check_simplify(div(num(6), num(3)), "2");
  check_simplify(power(num(2), num(3)), "8");
  check_simplify(power(power(num(2), num(2)), num(3)), "64");
  check_simplify(div(add(num(2), num(2)), num(2)), "2");

  // like terms
  check_eq(Simplifier::simplify(add(x, x)), mul(num(2), x));
  check_simplify(add(x, x), "2x");
  check_simplify(add(add(add(x, mul(num(2), x)), num(3)), num(4)), "3x + 7");
  check_simplify(add(x, mul(num(-1), x)), "0");
  check_simplify(add(add(x, y), mul(num(-1), y)), "x");
  check_simplify(add(mul(x, y), mul(y, x)), "2xy");
  check_simplify(add(mul(mul(num(2), x), y), mul(mul(num(3), y), x)), "5xy");
  check_simplify(add(add(x, num(1)), add(x, num(1))), "2x + 2");
  check_simplify(add(num(3), mul(num(-2), x)), "-2x + 3");
  check_simplify(add(power(y, num(2)), add(x, x)), "y^2 + 2x");
  const auto y1 = add(y, num(1));
  const auto collapsed = add(add(mul(num(2), y1), mul(num(-1), y1)), y);
  check_simplify(collapsed, "2y + 1");
  check_true(Simplifier::simplify(collapsed).children.size() == 2,
             "Expected flat sum");

  // like factors
  check_simplify(mul(x, x), "x^2");
  check_simplify(mul(x, power(x, num(2))), "x^3");
  check_simplify(mul(x, power(x, num(-1))), "1");
  check_simplify(mul(power(x, a), power(x, b)), "x^(a + b)");
  check_simplify(mul(mul(mul(num(2), x), num(3)), y), "6xy");
  check_simplify(mul(num(2), add(x, y)), "2*(x + y)");
  check_simplify(mul(num(-1), add(x, y)), "-(x + y)");

  // neutral and absorbing elements
  check_eq(Simplifier::simplify(mul(x, num(0))), num(0));
  check_eq(Simplifier::simplify(mul(x, num(1))), x);
  check_eq(Simplifier::simplify(power(x, num(0))), num(1));
  check_simplify(power(num(0), num(0)), "1");
  check_simplify(power(x, num(1)), "x");
  check_simplify(power(num(1), x), "1");
  check_simplify(sub(x, num(0)), "x");
  check_simplify(div(x, num(1)), "x");
  check_simplify(Expression(Expression::Type::SUM), "0");
  check_simplify(Expression(Expression::Type::PRODUCT), "1");
  check_simplify(Expression(Expression::Type::SUM, {x}), "x");
  check_simplify(Expression(Expression::Type::PRODUCT, {y}), "y");

  // kept literally
  check_simplify(sub(x, y), "x - y");
  check_simplify(sub(add(x, x), y), "2x - y");
  check_simplify(div(x, y), "x/y");
  check_simplify(div(num(1), num(0)), "1/0");
  check_simplify(power(add(add(x, x), mul(y, y)), var("z")), "(y^2 + 2x)^z");

  // idempotence and order independence
  std::vector<Expression> exprs = {
      add(mul(num(3), power(x, num(2))), sub(y, mul(num(2), x))),
      mul(add(x, y), add(y, x)),
      div(add(x, num(0)), mul(y, num(1))),
      power(mul(x, y), add(a, b)),
      mul(power(mul(x, y), a), power(mul(y, x), sub(num(1), a))),
      add(add(div(x, y), div(x, y)), num(-4)),
      mul(mul(power(num(2), x), power(num(2), y)), num(0.5)),
      add(add(mul(num(3), add(x, y)), mul(num(-2), add(y, x))), x),
      add(mul(num(-1), add(x, num(1))), mul(num(2), add(x, num(1))))};
  for (const auto& e : exprs) {
    auto once = Simplifier::simplify(e);
    check_eq(Simplifier::simplify(once), once);
    check_str(Simplifier::simplify(once), once.toString());
  }
  check_str(Simplifier::simplify(add(add(x, y), a)),
            Simplifier::simplify(add(a, add(y, x))).toString());
}

void Test::expand() {
  Log::get().info("Testing expand");
  const auto x = var("x");
  const auto y = var("y");
  const auto z = var("z");
  const auto a = var("a");
  const auto b = var("b");
  const auto c = var("c");
  const auto d = var("d");
  Expander expander;

  auto square = expander.expand(power(add(x, y), num(2)));
  check_str(Simplifier::simplify(square), "x^2 + 2xy + y^2");
  check_str(expander.expand(mul(num(2), add(x, y))), "2x + 2y");
  check_str(expander.expand(mul(add(a, b), add(c, d))),
            "a*c + a*d + b*c + b*d");
  check_str(expander.expand(mul(add(x, num(1)), sub(x, num(1)))), "x^2 - 1");
  check_str(expander.expand(power(sub(x, y), num(2))), "x^2 - 2xy + y^2");
  check_str(expander.expand(power(add(x, num(1)), num(3))),
            "x^3 + 3x^2 + 3x + 1");
  check_str(expander.expand(power(add(x, y), num(3))),
            "x^3 + 3x^2*y + 3xy^2 + y^3");
  check_str(expander.expand(power(add(x, y), num(0))), "1");
  check_str(expander.expand(power(mul(num(2), x), num(2))), "4x^2");

  // unsupported exponents and wrappers are kept
  check_str(expander.expand(power(add(x, y), z)), "(x + y)^z");
  check_str(expander.expand(power(add(x, num(1)), num(0.5))), "(x + 1)^0.5");
  check_str(expander.expand(power(add(x, num(1)), num(-1))), "(x + 1)^(-1)");
  check_str(expander.expand(div(add(x, y), num(2))), "(x + y)/2");
  check_str(expander.expand(sub(num(3), num(1))), "2");
  check_str(expander.expand(sub(mul(x, add(y, num(1))), z)), "x*y + x - z");

  // sums behind neutral operations are distributed, too
  auto hidden = mul(div(add(x, num(2)), num(1)), num(3));
  check_str(expander.expand(hidden), "3x + 6");
  check_str(expander.expand(mul(sub(add(x, y), num(0)), x)), "x^2 + x*y");
  check_eq(expander.expand(expander.expand(hidden)), expander.expand(hidden));

  // large exponents are multiplied out step by step
  auto big = expander.expand(power(add(x, y), num(24)));
  check_true(big.type == Expression::Type::SUM && big.children.size() == 25,
             "Unexpected number of terms: " + std::to_string(big.numTerms()));
  check_true(big.contains(mul(mul(num(2704156), power(x, num(12))),
                              power(y, num(12)))),
             "Expected middle binomial coefficient");
  Bindings ones;
  ones[Symbol("x")] = 1;
  ones[Symbol("y")] = 1;
  check_value(Evaluator::eval(big, ones), 16777216);
  check_str(expander.expand(power(add(x, num(1)), num(32))).children.front(),
            "x^32");

  // exponent limit from settings
  auto limited = settings;
  limited.max_expansion_exponent = 2;
  check_str(Expander(limited).expand(power(add(x, num(1)), num(3))),
            "(x + 1)^3");
  check_str(Expander(limited).expand(power(add(x, num(1)), num(2))),
            "x^2 + 2x + 1");

  // expansion preserves the value
  Bindings vars;
  vars[Symbol("x")] = 2;
  vars[Symbol("y")] = 5;
  auto cube = power(add(x, y), num(3));
  check_value(Evaluator::eval(expander.expand(cube), vars), 343);
  check_value(Evaluator::eval(cube, vars), 343);
}

void Test::eval() {
  Log::get().info("Testing eval");
  const auto x = var("x");
  const auto y = var("y");
  const auto z = var("z");

  Bindings vars;
  vars[Symbol("x")] = 4;
  vars[Symbol("y")] = 3;
  vars[Symbol("z")] = 2;
  auto e = power(add(add(x, x), mul(y, y)), z);
  check_value(Evaluator::eval(e, vars), 289);
  check_value(Evaluator::eval(Simplifier::simplify(e), vars), 289);
  check_value(Evaluator::eval(num(1.5), {}), 1.5);
  check_value(Evaluator::eval(sub(x, y), vars), 1);
  check_value(Evaluator::eval(div(y, z), vars), 1.5);
  check_value(Evaluator::eval(Expression(Expression::Type::SUM), {}), 0);
  check_value(Evaluator::eval(Expression(Expression::Type::PRODUCT), {}), 1);

  Bindings small;
  small[Symbol("x")] = 2;
  small[Symbol("y")] = 3;
  auto sum = add(x, y);
  auto difference = sub(x, y);
  auto quotient = div(y, x);
  auto product = mul(x, y);
  auto combined = mul(mul(power(sum, difference), quotient), product);
  check_value(Evaluator::eval(combined, small), 1.8);

  // errors
  check_error(Evaluator::eval(var("w"), {}), EvalError::Type::UNBOUND_SYMBOL,
              "unbound symbol: w");
  check_error(Evaluator::eval(div(num(1), num(0)), {}),
              EvalError::Type::DIVISION_BY_ZERO, "division by zero");
  check_error(Evaluator::eval(div(x, sub(y, y)), vars),
              EvalError::Type::DIVISION_BY_ZERO, "division by zero");
  check_error(Evaluator::eval(sub(var("u"), div(num(1), num(0))), vars),
              EvalError::Type::UNBOUND_SYMBOL, "unbound symbol: u");
  check_error(Evaluator::eval(add(x, mul(y, var("v"))), vars),
              EvalError::Type::UNBOUND_SYMBOL, "unbound symbol: v");
  auto r = Evaluator::eval(div(num(1), num(0)), {});
  check_true(r.error.symbol.name.empty(), "Unexpected symbol in error");

  // domain errors of powers are not evaluation errors
  auto nan = Evaluator::eval(power(num(-8), num(1.0 / 3)), {});
  check_true(nan.ok(), "Expected successful evaluation");
  check_true(std::isnan(nan.value), "Expected NaN");
}

void Test::operators() {
  Log::get().info("Testing operators");
  const auto x = var("x");
  const auto y = var("y");

  check_eq(x + y, ExpressionUtil::add(x, y));
  check_eq(x - y, ExpressionUtil::sub(x, y));
  check_eq(x * y, ExpressionUtil::mul(x, y));
  check_eq(x / y, ExpressionUtil::div(x, y));
  check_eq(pow(x, y), ExpressionUtil::pow(x, y));
  check_str((x + y) * x - 2, "x*(x + y) - 2");
  check_str(-x, "-x");
  check_str(x / 2, "x/2");
  check_str(pow(x, 2), "x^2");
  check_str(2 * x, "2x");
  check_str(1 + x, "x + 1");
  check_str(1 - x, "1 - x");
  check_str(Simplifier::simplify(x + x + y * y), "y^2 + 2x");
}

std::vector<std::string> parseTestArgs(Settings& settings,
                                       std::vector<std::string> args) {
  std::vector<char*> argv;
  for (auto& a : args) {
    argv.push_back(&a[0]);
  }
  return settings.parseArgs(static_cast<int>(argv.size()), argv.data());
}

void Test::config() {
  Log::get().info("Testing config");
  const auto level = Log::get().level;
  Settings s;
  check_true(
      s.max_expansion_exponent == Settings::DEFAULT_MAX_EXPANSION_EXPONENT,
      "Unexpected default exponent limit");
  auto unparsed =
      parseTestArgs(s, {"symcalc_test", "-e", "5", "-l", "warn", "print"});
  Log::get().level = level;
  check_true(unparsed.size() == 1 && unparsed[0] == "print",
             "Unexpected unparsed arguments");
  check_true(s.max_expansion_exponent == 5, "Unexpected exponent limit");
  std::vector<std::string> printed;
  s.printArgs(printed);
  check_true(printed.size() == 2 && printed[0] == "-e" && printed[1] == "5",
             "Unexpected printed arguments");

  const std::vector<std::vector<std::string>> invalid = {
      {"symcalc_test", "-e", "-3"},
      {"symcalc_test", "-q"},
      {"symcalc_test", "-e"},
      {"symcalc_test", "-l", "verbose"}};
  for (const auto& args : invalid) {
    Settings t;
    bool failed = false;
    Log::get().silent = true;
    try {
      parseTestArgs(t, args);
    } catch (const std::runtime_error&) {
      failed = true;
    }
    Log::get().silent = false;
    Log::get().level = level;
    check_true(failed, "Expected invalid arguments: " + args.back());
  }
}
