#pragma once

#define TASKD_VERSION_MAJOR 0
#define TASKD_VERSION_MINOR 1
#define TASKD_VERSION_PATCH 0

#define TASKD_VERSION_STRING "0.1.0"

// For compile-time version checks
#define TASKD_VERSION \
  (TASKD_VERSION_MAJOR * 10000 + TASKD_VERSION_MINOR * 100 + TASKD_VERSION_PATCH)

namespace taskd {

inline const char* Version() { return TASKD_VERSION_STRING; }

}  // namespace taskd
