/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MEMORY_PROBE_HPP
#define MEMORY_PROBE_HPP

#include <string>

namespace GlyphRain {

/**
 * @brief Resident set size of this process in MB, read from /proc/self/statm
 * @return 0.0 when the information is unavailable
 */
double residentMemoryMB();

/**
 * @brief Parses a statm line ("size resident shared ...") into MB
 * @return 0.0 for malformed input
 */
double parseStatmResidentMB(const std::string &statm, long pageSize);

} // namespace GlyphRain

#endif // MEMORY_PROBE_HPP
