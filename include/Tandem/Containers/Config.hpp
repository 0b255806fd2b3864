/// @file Config.hpp
/// @brief Compile-time configuration for Tandem::Containers.
#pragma once

// Number of entries an AdaptiveMap keeps in its linear representation. The insert that
// would grow a linear map past this count migrates it to the hashed representation.
#ifndef TANDEM_LINEAR_LIMIT
#define TANDEM_LINEAR_LIMIT 32
#endif

// Entry and raw-entry handles record the map's mutation counter when they are created and
// re-check it on every call. Set to 0 to compile the checks out.
#ifndef TANDEM_CHECK_HANDLES
#define TANDEM_CHECK_HANDLES 1
#endif

static_assert(TANDEM_LINEAR_LIMIT > 0, "TANDEM_LINEAR_LIMIT must be positive");
