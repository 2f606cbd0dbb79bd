#pragma once

#include <string>

namespace offline::util {

/*
  Operation and conflict ids: random RFC4122 v4 UUIDs in canonical
  lowercase form (8-4-4-4-12).
*/
std::string NewId();

} // namespace offline::util
