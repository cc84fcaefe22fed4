/**
 * @file types.cpp
 * @brief Core type implementations
 */

#include "syncboard/types.h"
#include <cstdio>
#include <iomanip>
#include <sstream>

namespace syncboard {

// ============================================================================
// Time
// ============================================================================

int64_t to_unix_millis(WallTime time) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             time.time_since_epoch())
      .count();
}

WallTime from_unix_millis(int64_t millis) {
  return WallTime(std::chrono::duration_cast<WallClock::duration>(
      std::chrono::milliseconds(millis)));
}

// ============================================================================
// Helpers
// ============================================================================

std::string to_hex(const Byte *data, size_t length) {
  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (size_t i = 0; i < length; ++i) {
    oss << std::setw(2) << static_cast<int>(data[i]);
  }
  return oss.str();
}

std::string format_size(uint64_t bytes) {
  double size = static_cast<double>(bytes);
  const char *units[] = {"B", "KB", "MB", "GB", "TB"};
  int i = 0;
  while (size >= 1024 && i < 4) {
    size /= 1024;
    i++;
  }
  char buf[32];
  if (i == 0) {
    std::snprintf(buf, sizeof(buf), "%llu B",
                  static_cast<unsigned long long>(bytes));
  } else {
    std::snprintf(buf, sizeof(buf), "%.1f %s", size, units[i]);
  }
  return std::string(buf);
}

} // namespace syncboard
