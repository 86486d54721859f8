#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace classnote {

// Speaker identity as reported by a diarization collaborator.
// The value carries no meaning beyond equality; use speaker_label() for display.
class speaker_id {
public:
    speaker_id() = default;
    explicit speaker_id(int32_t value) : m_value(value) {}

    int32_t value() const { return m_value; }

    bool operator==(const speaker_id & other) const { return m_value == other.m_value; }
    bool operator!=(const speaker_id & other) const { return m_value != other.m_value; }

private:
    int32_t m_value = 0;
};

// "Speaker N", 1-based for display
std::string speaker_label(speaker_id id);

enum class session_mode {
    lecture,
    meeting,
};

const char * session_mode_name(session_mode mode);
bool session_mode_parse(const std::string & name, session_mode & mode);

struct transcript_segment {
    int32_t     index = 0;
    std::string text;
    double      start_time = 0.0; // seconds since recording start
    double      end_time   = 0.0;

    std::optional<speaker_id> speaker;
    std::string               speaker_label;

    int64_t created_at = 0; // unix time, ms

    double duration() const { return end_time - start_time; }
};

struct realtime_word {
    std::string text;
    double      start = 0.0;
    double      end   = 0.0;
    speaker_id  speaker;
};

struct realtime_event {
    std::string session_id;
    bool        is_final = false;
    std::string transcript;

    std::optional<double>      confidence;
    std::vector<realtime_word> words;
};

struct chapter_marker {
    std::string id;
    double      time_seconds = 0.0;
    std::string title;
};

struct diarization_interval {
    speaker_id speaker;
    double     start = 0.0;
    double     end   = 0.0;
};

// consecutive run of words attributed to one speaker
struct speaker_block {
    speaker_id  speaker;
    std::string text;
    double      start = 0.0;
    double      end   = 0.0;
};

} // namespace classnote
