#pragma once

#if defined(__GNUC__) || defined(__clang__)
#define SHAPEDTEXT_UNREACHABLE() __builtin_unreachable()
#elif defined(_MSC_VER)
#define SHAPEDTEXT_UNREACHABLE() __assume(false)
#else
#include <cassert>
#define SHAPEDTEXT_UNREACHABLE() assert(0)
#endif
