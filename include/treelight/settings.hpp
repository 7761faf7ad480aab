#ifndef TREELIGHT_SETTINGS_HPP
#define TREELIGHT_SETTINGS_HPP

#include <cstddef>

#include "ulight/impl/platform.h"

#ifndef NDEBUG // debug builds
#define TREELIGHT_DEBUG 1
#define TREELIGHT_IF_DEBUG(...) __VA_ARGS__
#define TREELIGHT_IF_NOT_DEBUG(...)
#else // release builds
#define TREELIGHT_IF_DEBUG(...)
#define TREELIGHT_IF_NOT_DEBUG(...) __VA_ARGS__
#endif

#ifdef ULIGHT_CLANG
#define TREELIGHT_CLANG 1
#endif

#ifdef ULIGHT_GCC
#define TREELIGHT_GCC 1
#endif

#define TREELIGHT_UNREACHABLE() __builtin_unreachable()

namespace treelight {

/// @brief If `true`, the current build is a debug build (not a release build).
inline constexpr bool is_debug_build = TREELIGHT_IF_DEBUG(true) TREELIGHT_IF_NOT_DEBUG(false);

/// @brief The default maximum nesting of injected sub-documents.
/// A document that is not injected anywhere has depth zero.
/// Injections that would exceed this depth are left unhighlighted.
inline constexpr std::size_t default_max_injection_depth = 8;

/// @brief The default amount of matching steps that may be spent on matching a single pattern
/// at a single node before the remaining alternatives are abandoned.
inline constexpr std::size_t default_match_step_limit = 1 << 16;

} // namespace treelight

#endif
