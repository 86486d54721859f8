#pragma once

#include "classnote/transcript.h"

#include <cstdint>
#include <string>
#include <vector>

namespace classnote {

constexpr int32_t CLASSNOTE_CHAPTER_TITLE_MAX_CHARS = 20;

// Short navigation title: the text up to the first sentence or clause
// separator, at most 20 code points. Falls back to a generic label per mode.
std::string chapter_title(const std::string & text, session_mode mode);

// one chapter per segment: "ch-<segment index>" at the segment start
std::vector<chapter_marker> chapters_from_segments(const std::vector<transcript_segment> & segments, session_mode mode);

// Consecutive segments shorter than min_duration are merged into one
// "merged-<n>" chapter, flushed when a long segment (or the last one) is
// reached; that segment then becomes its own "ch-<n>" chapter.
std::vector<chapter_marker> merge_into_chapters(
        const std::vector<transcript_segment> & segments,
        double min_duration = 60.0,
        session_mode mode = session_mode::meeting);

// evenly spaced placeholders while the recording is still running
std::vector<chapter_marker> quick_chapters(double duration, int32_t count);

// a non-empty remote list replaces the local one
std::vector<chapter_marker> select_chapters(
        const std::vector<chapter_marker> & local,
        const std::vector<chapter_marker> & remote);

} // namespace classnote
