#pragma once

#include "classnote/transcript.h"

#include <cstdint>
#include <string>
#include <vector>

namespace classnote {

struct segmenter_params {
    int32_t max_chars       = 500;   // close once the open segment has this many characters
    int32_t min_split_chars = 50;    // never force-close below this (only finality can)
    double  max_seconds     = 180.0; // close once the open segment is this old
};

enum class close_reason {
    none,
    final,       // recognizer reported a terminal hypothesis
    max_chars,
    max_seconds,
    stop,        // forced by the caller ending the recording
};

const char * close_reason_name(close_reason reason);

// Everything the segmentation state machine knows about one recording.
struct segmenter_state {
    bool        open = false;   // a segment is accumulating
    int32_t     index = 0;      // index of the open segment
    std::string text;           // open segment text
    size_t      n_chars = 0;    // code points in text
    size_t      n_delivered = 0; // code points of the current hypothesis already consumed
    double      t_start = 0.0;  // open segment start, seconds since recording start

    std::string closed_text;    // closed segments, newline separated
    std::vector<transcript_segment> segments;
};

struct segmenter_step {
    std::string  delta;              // newly appended text (empty if none)
    close_reason reason = close_reason::none;
    bool         closed  = false;    // segment holds a newly closed segment
    bool         restart = false;    // recognition session must be restarted
    bool         ended   = false;    // recording is over (finality)
    transcript_segment segment;
};

// Turns a stream of growing recognition hypotheses into closed segments.
// Not thread-safe: callers serialize access.
class Segmenter {
public:
    explicit Segmenter(const segmenter_params & params = segmenter_params());

    void begin(double t);

    // hypothesis is the full text of the current recognition session
    segmenter_step feed(const std::string & hypothesis, bool is_final, double t);

    // close the open segment as final; returns false if it was empty
    bool finish(double t, transcript_segment & segment);

    bool is_open() const { return m_state.open; }

    std::string partial_text() const;

    const segmenter_state & state() const { return m_state; }
    const segmenter_params & params() const { return m_params; }

private:
    close_reason check_close(bool is_final, double t) const;
    transcript_segment close_segment(double t);
    void open_segment(double t);

    segmenter_params m_params;
    segmenter_state  m_state;
};

} // namespace classnote
