/***
 * Name: pytdc::sema::RawDef
 * Purpose: One converted `def` before same-name definitions are merged.
 */
#pragma once

#include <cstddef>
#include <string>
#include "pytd/Decls.h"
#include "sema/Decorator.h"

namespace pytdc::sema {

struct RawDef {
  std::string name;
  int line{0};
  Decorator decorator{}; // Tag::None when undecorated
  bool external{false};
  pytd::Signature signature{};
  size_t positionalCount{0}; // ordinary parameters, self included
};

} // namespace pytdc::sema
