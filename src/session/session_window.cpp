#include "session/session_window.hpp"

#include "time/clock.hpp"

#include <stdexcept>
#include <string>

void SessionWindow::validate() const {
    if (open.value() >= SECONDS_PER_DAY || close.value() > SECONDS_PER_DAY) {
        throw std::invalid_argument("Session window must lie within a single day");
    }
    if (close <= open) {
        throw std::invalid_argument("Session close (" + format_time_of_day(close) +
                                    ") must be after open (" + format_time_of_day(open) +
                                    ")");
    }
}
