#pragma once

#include "classnote/transcript.h"

#include <string>
#include <vector>

namespace classnote {

constexpr double CLASSNOTE_DIARIZATION_MAX_GAP = 0.2; // seconds

// Assigns a speaker to every segment whose midpoint falls in [start, end) of
// an interval. Segments matching no interval inherit the speaker of the
// previous labelled segment; those before any match stay unlabelled.
// Text and times are left untouched.
void align_speakers(std::vector<transcript_segment> & segments, const std::vector<diarization_interval> & intervals);

// joins consecutive intervals of the same speaker separated by less than max_gap
std::vector<diarization_interval> merge_intervals(
        const std::vector<diarization_interval> & intervals,
        double max_gap = CLASSNOTE_DIARIZATION_MAX_GAP);

// Groups timed words into speaker blocks. Each interval collects the words
// whose midpoint lies within it; adjacent blocks of the same speaker closer
// than max_gap are joined.
std::vector<speaker_block> align_words(
        const std::vector<realtime_word> & words,
        const std::vector<diarization_interval> & intervals,
        double max_gap = CLASSNOTE_DIARIZATION_MAX_GAP);

// Speaker diarization collaborator: produces speaker intervals for a
// recorded audio file.
class Diarizer {
public:
    virtual ~Diarizer() = default;

    virtual bool diarize(const std::string & audio_path, std::vector<diarization_interval> & intervals, std::string & error) = 0;
};

// Reads intervals exported by an external diarization tool:
//   [{"speaker": 0, "start": 0.0, "end": 4.2}, ...]
// or the same array under a "segments" key.
class JsonDiarizer : public Diarizer {
public:
    explicit JsonDiarizer(const std::string & path) : m_path(path) {}

    bool diarize(const std::string & audio_path, std::vector<diarization_interval> & intervals, std::string & error) override;

private:
    std::string m_path;
};

} // namespace classnote
