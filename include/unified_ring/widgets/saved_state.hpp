// saved_state.hpp - What a progress_ring persists across restarts
#pragma once

namespace unified_ring {

    struct ring_saved_state {
        int  progress      = 0;
        bool indeterminate = true;

        [[nodiscard]] constexpr bool operator==(const ring_saved_state &) const noexcept = default;
    };

} // namespace unified_ring
