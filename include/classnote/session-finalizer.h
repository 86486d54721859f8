#pragma once

#include "classnote/chapter-api.h"
#include "classnote/diarization.h"
#include "classnote/session-store.h"
#include "classnote/transcript.h"

#include <string>
#include <vector>

namespace classnote {

struct finalize_params {
    std::string  session_id;
    std::string  audio_path;
    session_mode mode = session_mode::lecture;

    bool   merge_chapters   = false; // merge short segments instead of one chapter per segment
    double min_chapter_secs = 60.0;
};

struct session_transcript {
    std::vector<transcript_segment> segments;
    std::vector<chapter_marker>     chapters;

    bool diarized        = false;
    bool remote_chapters = false;
};

// Post-processing after a recording has stopped, over a snapshot of its
// segments: local chapters, remote chapters when the backend provides them,
// speaker alignment, then the local cache. Every collaborator is optional
// and its failure only degrades the result.
session_transcript finalize_session(
        const std::vector<transcript_segment> & segments,
        const finalize_params & params,
        Diarizer      * diarizer,
        ChapterSource * chapter_source,
        SessionStore  * store);

} // namespace classnote
