#pragma once

#define HARVEST_VERSION_MAJOR 0
#define HARVEST_VERSION_MINOR 3
#define HARVEST_VERSION_PATCH 0

#define HARVEST_VERSION_STR_HELPER(x) #x
#define HARVEST_VERSION_STR(x) HARVEST_VERSION_STR_HELPER(x)

#define HARVEST_VERSION_STRING                                                                                                                                \
    HARVEST_VERSION_STR(HARVEST_VERSION_MAJOR) "." HARVEST_VERSION_STR(HARVEST_VERSION_MINOR) "." HARVEST_VERSION_STR(HARVEST_VERSION_PATCH)

inline const char *HarvestVersionString() { return HARVEST_VERSION_STRING; }
inline int HarvestVersionMajor() { return HARVEST_VERSION_MAJOR; }
inline int HarvestVersionMinor() { return HARVEST_VERSION_MINOR; }
inline int HarvestVersionPatch() { return HARVEST_VERSION_PATCH; }
