// core.hpp - umbrella header for core utilities (error handling, parsing, raii scopes, thread hand-off)
//
// Usage:
//   #include <unified_ring/core.hpp>
// NOLINTBEGIN(misc-include-cleaner)
#pragma once
#include "unified_ring/core/error.hpp"
#include "unified_ring/core/mailbox.hpp"
#include "unified_ring/core/parse.hpp"
#include "unified_ring/core/raii.hpp"
// NOLINTEND(misc-include-cleaner)
