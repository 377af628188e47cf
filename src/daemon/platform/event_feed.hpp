#pragma once

#include "niri/types.hpp"

#include <string>

// Live event stream of the compositor, read on its own connection.
class EventFeed {
public:
    enum class ReadStatus { Ok, Eof, Error };

    virtual ~EventFeed() = default;
    virtual bool subscribe() = 0;
    // Blocks until the next event. On Error, `error` describes the problem
    // and the feed stays usable; Eof means the compositor went away.
    virtual ReadStatus read_event(Event& event, std::string& error) = 0;
    // Unblocks a pending read_event(), which then reports Eof.
    virtual void interrupt() = 0;
};
