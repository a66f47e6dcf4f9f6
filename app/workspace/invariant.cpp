#include "invariant.h"

#include <cstdio>
#include <stdexcept>

void reportInvariantViolation(const char* where, const std::string& detail)
{
    fprintf(stderr, "[layout] invariant violated in %s: %s\n", where, detail.c_str());
#ifdef TERMDECK_STRICT_INVARIANTS
    throw std::logic_error(std::string(where) + ": " + detail);
#endif
}
