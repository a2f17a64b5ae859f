// -----------------------------------------------------------------------------
// control_layout.cpp — SystemControl revision lookup
// -----------------------------------------------------------------------------
#include "radarlink/control_layout.hpp"

#include <cstring>

namespace radarlink {

bool control_layout_by_name(const char* name, ControlLayout& out) {
  if (!name) return false;
  const ControlLayout known[] = { ControlLayout::icd40(), ControlLayout::extended44() };
  for (const auto& l : known) {
    if (std::strcmp(l.name, name) == 0) { out = l; return true; }
  }
  return false;
}

} // namespace radarlink
