/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "utils/MemoryProbe.hpp"
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace GlyphRain {

double parseStatmResidentMB(const std::string &statm, long pageSize) {
  if (pageSize <= 0) {
    return 0.0;
  }

  std::istringstream stream(statm);
  unsigned long sizePages = 0;
  unsigned long residentPages = 0;
  if (!(stream >> sizePages >> residentPages)) {
    return 0.0;
  }
  return static_cast<double>(residentPages) * static_cast<double>(pageSize) /
         (1024.0 * 1024.0);
}

double residentMemoryMB() {
  std::ifstream file("/proc/self/statm");
  if (!file.is_open()) {
    return 0.0;
  }

  std::string line;
  if (!std::getline(file, line)) {
    return 0.0;
  }
  return parseStatmResidentMB(line, sysconf(_SC_PAGESIZE));
}

} // namespace GlyphRain
