#pragma once

#include "utils/types.hpp"

// Daily trading window [open, close) in local time of day.
struct SessionWindow {
    TimeOfDay open;
    TimeOfDay close;

    // Throws std::invalid_argument unless open < close and both fall within one day.
    void validate() const;

    [[nodiscard]] constexpr bool contains(TimeOfDay tod) const noexcept {
        return open <= tod && tod < close;
    }
};
