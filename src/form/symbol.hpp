#pragma once

#include <iostream>
#include <string>

/**
 * Named variable of an expression. Symbols are compared and ordered by their
 * names and are used as keys when binding values for evaluation.
 */
class Symbol {
 public:
  Symbol() = default;

  explicit Symbol(const std::string& name);

  inline bool operator==(const Symbol& s) const { return name == s.name; }

  inline bool operator!=(const Symbol& s) const { return name != s.name; }

  inline bool operator<(const Symbol& s) const { return name < s.name; }

  friend std::ostream& operator<<(std::ostream& out, const Symbol& s);

  const std::string& toString() const { return name; }

  std::string name;
};
