#pragma once

#include "classnote/transcript.h"

#include <cstdint>
#include <string>
#include <vector>

namespace classnote {

struct live_line {
    std::string text;
    speaker_id  speaker;
    int64_t     timestamp = 0; // unix time, ms
};

// Caption state for cloud-live mode: finals become lines, the latest
// partial is the current line until a final replaces it.
class LiveLines {
public:
    // true if a final line was appended
    bool apply(const realtime_event & event);

    const std::vector<live_line> & lines() const { return m_lines; }
    const std::string & current() const { return m_current; }

    // finals in order, newline separated
    std::string text() const;

private:
    std::vector<live_line> m_lines;
    std::string            m_current;
};

} // namespace classnote
