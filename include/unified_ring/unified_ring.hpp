// unified_ring.hpp - umbrella header: the animation core, the widget and persistence
//
// Usage:
//   #include <unified_ring/unified_ring.hpp>
// NOLINTBEGIN(misc-include-cleaner)
#pragma once
#include "unified_ring/anim/keyframe.hpp"
#include "unified_ring/anim/ring_animator.hpp"
#include "unified_ring/anim/timeline.hpp"
#include "unified_ring/core.hpp"
#include "unified_ring/io/ring_io.hpp"
#include "unified_ring/widgets/progress_ring.hpp"
#include "unified_ring/widgets/ring_geometry.hpp"
#include "unified_ring/widgets/saved_state.hpp"
// NOLINTEND(misc-include-cleaner)
