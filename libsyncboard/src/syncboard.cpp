/**
 * @file syncboard.cpp
 * @brief Library-wide definitions
 */

#include "syncboard/syncboard.h"

namespace syncboard {

// ============================================================================
// Version Information
// ============================================================================

VersionInfo get_version() { return VersionInfo{}; }

} // namespace syncboard
