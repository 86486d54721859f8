#include "classnote/live-lines.h"

#include <chrono>

namespace classnote {

bool LiveLines::apply(const realtime_event & event) {
    if (!event.is_final) {
        m_current = event.transcript;
        return false;
    }

    live_line line;
    line.text      = event.transcript;
    line.speaker   = event.words.empty() ? speaker_id(0) : event.words.front().speaker;
    line.timestamp = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();

    m_lines.push_back(std::move(line));
    m_current.clear();

    return true;
}

std::string LiveLines::text() const {
    std::string result;
    for (const auto & line : m_lines) {
        if (!result.empty()) {
            result += "\n";
        }
        result += line.text;
    }
    return result;
}

} // namespace classnote
