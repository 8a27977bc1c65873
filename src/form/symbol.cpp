#include "form/symbol.hpp"

Symbol::Symbol(const std::string& name) : name(name) {}

std::ostream& operator<<(std::ostream& out, const Symbol& s) {
  out << s.name;
  return out;
}
