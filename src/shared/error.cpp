#include <cstdio>
#include <exception>

#include <fmt/core.h>

#include "shared/error.h"

void
___check(bool condition,
         const char *file,
         int line,
         const char *func,
         const char *message)
{
  if (!condition) {
    fmt::print(stderr, "Invariant violated: {}:{}: {}: {}\n", file, line, func, message);
    std::terminate();
  }
}
