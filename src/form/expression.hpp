#pragma once

#include <initializer_list>
#include <iostream>
#include <string>
#include <vector>

#include "form/symbol.hpp"

/**
 * Algebraic expression representation. An expression is a tree where every
 * node has a type, an optional symbol and an optional value. The symbol is
 * used for variables. The value is used for constants. Sums and products are
 * n-ary; differences, fractions and powers have exactly two children.
 *
 * Sums and products are commutative: comparing two of them ignores the order
 * of their children, and printing them uses a canonical order.
 *
 * Example: (2x + y^2)^z
 */
class Expression {
 public:
  enum class Type {
    CONSTANT,
    VARIABLE,
    SUM,
    DIFFERENCE,
    PRODUCT,
    FRACTION,
    POWER
  };

  Expression();

  explicit Expression(Type type, const Symbol& symbol = Symbol(),
                      double value = 0.0);

  Expression(Type type, std::initializer_list<Expression> children);

  Expression(const Expression& e);

  Expression(Expression&& e);

  Expression& operator=(const Expression& e);

  Expression& operator=(Expression&& e);

  inline bool operator==(const Expression& e) const { return compare(e) == 0; }

  inline bool operator!=(const Expression& e) const { return compare(e) != 0; }

  inline bool operator<(const Expression& e) const { return compare(e) == -1; }

  inline bool operator>(const Expression& e) const { return compare(e) == 1; }

  int compare(const Expression& e) const;

  bool contains(const Expression& e) const;

  bool contains(Type t) const;

  bool isConstant(double v) const;

  size_t numTerms() const;

  Expression& newChild(const Expression& e);

  friend std::ostream& operator<<(std::ostream& out, const Expression& e);

  std::string toString() const;

  Type type;
  Symbol symbol;
  double value;
  std::vector<Expression> children;

 private:
  void assertNumChildren(size_t num) const;

  int compareChildren(const Expression& e) const;

  int compareUnordered(const Expression& e) const;

  void print(std::ostream& out, bool isRoot, bool isRight,
             Expression::Type parentType) const;

  void printExtracted(std::ostream& out) const;

  void printSum(std::ostream& out) const;

  void printProduct(std::ostream& out) const;

  void printBinary(std::ostream& out, const std::string& op) const;

  bool needsBrackets(bool isRoot, bool isRight,
                     Expression::Type parentType) const;
};
