#pragma once

#include "gateway/types.hpp"

/**
 * Append-only sink for exchange responses and session transitions.
 *
 * Implementations must be safe to call from several threads and must not block the
 * caller for long: the dispatcher records inline after every send.
 */
class ResponseRecorder {
public:
    virtual ~ResponseRecorder() = default;

    virtual void record(const ResponseRecord& record) = 0;
    virtual void record_session_event(const SessionEvent& event) = 0;
};
