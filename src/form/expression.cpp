#include "form/expression.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <sstream>
#include <stdexcept>

#include "form/expression_util.hpp"

Expression::Expression() : type(Expression::Type::CONSTANT), value(0.0) {}

Expression::Expression(Type type, const Symbol& symbol, double value)
    : type(type), symbol(symbol), value(value) {}

Expression::Expression(Type type, std::initializer_list<Expression> children)
    : type(type), value(0.0) {
  for (auto& c : children) {
    newChild(c);
  }
}

Expression::Expression(const Expression& e) { *this = e; }

Expression::Expression(Expression&& e) { *this = std::move(e); }

Expression& Expression::operator=(const Expression& e) {
  if (this != &e) {
    type = e.type;
    symbol = e.symbol;
    value = e.value;
    children = e.children;
  }
  return *this;
}

Expression& Expression::operator=(Expression&& e) {
  if (this != &e) {
    type = e.type;
    symbol = std::move(e.symbol);
    value = e.value;
    children = std::move(e.children);
  }
  return *this;
}

int compareValues(double a, double b) {
  // NaN is ordered after all other values so that the order stays total
  if (std::isnan(a) || std::isnan(b)) {
    if (std::isnan(a) && std::isnan(b)) {
      return 0;
    }
    return std::isnan(a) ? 1 : -1;
  }
  if (a < b) {
    return -1;
  } else if (b < a) {
    return 1;
  }
  return 0;
}

int Expression::compare(const Expression& e) const {
  if (type < e.type) {
    return -1;
  } else if (e.type < type) {
    return 1;
  }
  // same type => compare content
  switch (type) {
    case Expression::Type::CONSTANT:
      return compareValues(value, e.value);
    case Expression::Type::VARIABLE:
      if (symbol < e.symbol) {
        return -1;
      } else if (e.symbol < symbol) {
        return 1;
      } else {
        return 0;
      }
    case Expression::Type::SUM:
    case Expression::Type::PRODUCT:
      return compareUnordered(e);
    case Expression::Type::DIFFERENCE:
    case Expression::Type::FRACTION:
    case Expression::Type::POWER:
      return compareChildren(e);
  }
  return 0;  // equal
}

bool Expression::contains(const Expression& e) const {
  if (*this == e) {
    return true;
  }
  return std::any_of(children.begin(), children.end(),
                     [&](const Expression& c) { return c.contains(e); });
}

bool Expression::contains(Type t) const {
  if (type == t) {
    return true;
  }
  return std::any_of(children.begin(), children.end(),
                     [&](const Expression& c) { return c.contains(t); });
}

bool Expression::isConstant(double v) const {
  return type == Expression::Type::CONSTANT && value == v;
}

size_t Expression::numTerms() const {
  size_t result = 1;
  for (const auto& c : children) {
    result += c.numTerms();
  }
  return result;
}

void Expression::assertNumChildren(size_t num) const {
  if (children.size() != num) {
    throw std::runtime_error("unexpected number of children: " +
                             std::to_string(children.size()));
  }
}

int Expression::compareChildren(const Expression& e) const {
  if (children.size() < e.children.size()) {
    return -1;
  } else if (children.size() > e.children.size()) {
    return 1;
  }
  // same number of children => compare them one by one
  for (size_t i = 0; i < children.size(); i++) {
    auto r = children[i].compare(e.children[i]);
    if (r != 0) {
      return r;
    }
  }
  return 0;  // equal
}

int Expression::compareUnordered(const Expression& e) const {
  if (children.size() < e.children.size()) {
    return -1;
  } else if (children.size() > e.children.size()) {
    return 1;
  }
  // compare the children as multisets: sort both sides first
  auto less = [](const Expression* a, const Expression* b) {
    return a->compare(*b) < 0;
  };
  std::vector<const Expression*> lhs, rhs;
  for (size_t i = 0; i < children.size(); i++) {
    lhs.push_back(&children[i]);
    rhs.push_back(&e.children[i]);
  }
  std::sort(lhs.begin(), lhs.end(), less);
  std::sort(rhs.begin(), rhs.end(), less);
  for (size_t i = 0; i < lhs.size(); i++) {
    auto r = lhs[i]->compare(*rhs[i]);
    if (r != 0) {
      return r;
    }
  }
  return 0;  // equal
}

Expression& Expression::newChild(const Expression& e) {
  children.push_back(e);
  return children.back();
}

std::ostream& operator<<(std::ostream& out, const Expression& e) {
  e.print(out, true, false, Expression::Type::CONSTANT);
  return out;
}

std::string Expression::toString() const {
  std::stringstream ss;
  print(ss, true, false, Expression::Type::CONSTANT);
  return ss.str();
}

std::string formatNumber(double value) {
  if (std::isnan(value)) {
    return "nan";
  }
  if (value == 0.0) {
    return "0";  // no negative zero
  }
  char buffer[64];
  auto r = std::to_chars(buffer, buffer + sizeof(buffer), value);
  return std::string(buffer, r.ptr);
}

void Expression::print(std::ostream& out, bool isRoot, bool isRight,
                       Expression::Type parentType) const {
  const bool brackets = needsBrackets(isRoot, isRight, parentType);
  if (brackets) {
    out << "(";
  }
  auto extracted = ExpressionUtil::extractSign(*this);
  if (extracted.second) {
    out << "-";
  }
  extracted.first.printExtracted(out);
  if (brackets) {
    out << ")";
  }
}

void Expression::printExtracted(std::ostream& out) const {
  switch (type) {
    case Expression::Type::CONSTANT:
      out << formatNumber(value);
      break;
    case Expression::Type::VARIABLE:
      out << symbol;
      break;
    case Expression::Type::SUM:
      printSum(out);
      break;
    case Expression::Type::DIFFERENCE:
      assertNumChildren(2);
      printBinary(out, " - ");
      break;
    case Expression::Type::PRODUCT:
      printProduct(out);
      break;
    case Expression::Type::FRACTION:
      assertNumChildren(2);
      printBinary(out, "/");
      break;
    case Expression::Type::POWER:
      assertNumChildren(2);
      printBinary(out, "^");
      break;
  }
}

int precedence(Expression::Type type) {
  switch (type) {
    case Expression::Type::SUM:
    case Expression::Type::DIFFERENCE:
      return 1;
    case Expression::Type::PRODUCT:
    case Expression::Type::FRACTION:
      return 2;
    case Expression::Type::POWER:
      return 3;
    case Expression::Type::CONSTANT:
    case Expression::Type::VARIABLE:
      return 4;
  }
  return 4;
}

bool Expression::needsBrackets(bool isRoot, bool isRight,
                               Expression::Type parentType) const {
  if (isRoot || parentType == Expression::Type::SUM) {
    return false;
  }
  // a leading minus binds weaker than any binary operator
  if (ExpressionUtil::extractSign(*this).second) {
    return true;
  }
  // n-ary nodes with a single child print like that child
  if ((type == Expression::Type::SUM || type == Expression::Type::PRODUCT) &&
      children.size() == 1) {
    return children[0].needsBrackets(isRoot, isRight, parentType);
  }
  const int prec = precedence(type);
  switch (parentType) {
    case Expression::Type::DIFFERENCE:
      return isRight ? prec <= 1 : prec < 1;
    case Expression::Type::PRODUCT:
      return prec < 2;
    case Expression::Type::FRACTION:
      return isRight ? prec <= 2 : prec < 2;
    case Expression::Type::POWER:
      return isRight ? prec < 3 : prec <= 3;
    case Expression::Type::CONSTANT:
    case Expression::Type::VARIABLE:
    case Expression::Type::SUM:
      break;
  }
  return false;
}

void Expression::printSum(std::ostream& out) const {
  if (children.empty()) {
    out << "0";  // empty sum
    return;
  }
  std::vector<Expression> terms;
  for (const auto& c : children) {
    ExpressionUtil::flatten(Expression::Type::SUM, c, terms);
  }
  ExpressionUtil::sortTerms(terms);
  for (size_t i = 0; i < terms.size(); i++) {
    if (i == 0) {
      terms[i].print(out, false, false, Expression::Type::SUM);
      continue;
    }
    auto extracted = ExpressionUtil::extractSign(terms[i]);
    if (extracted.second) {
      out << " - ";
      extracted.first.print(out, false, true, Expression::Type::SUM);
    } else {
      out << " + ";
      terms[i].print(out, false, true, Expression::Type::SUM);
    }
  }
}

bool isSingleLetter(const Expression& e) {
  return e.type == Expression::Type::VARIABLE && e.symbol.name.size() == 1;
}

// single letter variables and their powers, e.g. x or x^2
bool isJuxtaposable(const Expression& e) {
  return isSingleLetter(e) ||
         (e.type == Expression::Type::POWER && e.children.size() == 2 &&
          isSingleLetter(e.children[0]));
}

void Expression::printProduct(std::ostream& out) const {
  if (children.empty()) {
    out << "1";  // empty product
    return;
  }
  auto factors = children;  // copy
  ExpressionUtil::sortFactors(factors);
  // leading coefficient followed by variables and their powers: 2xy, 3x^2
  // a factor after a power is still separated: 3x^2*y
  const bool juxtapose =
      factors.size() > 1 &&
      factors.front().type == Expression::Type::CONSTANT &&
      std::all_of(factors.begin() + 1, factors.end(), isJuxtaposable);
  for (size_t i = 0; i < factors.size(); i++) {
    if (i > 0 && !(juxtapose && (i == 1 || isSingleLetter(factors[i - 1])))) {
      out << "*";
    }
    factors[i].print(out, false, i > 0, Expression::Type::PRODUCT);
  }
}

void Expression::printBinary(std::ostream& out, const std::string& op) const {
  children[0].print(out, false, false, type);
  out << op;
  children[1].print(out, false, true, type);
}
