#include "classnote/session-finalizer.h"
#include "classnote/chapters.h"
#include "classnote/log.h"

#include <exception>
#include <future>

namespace classnote {

session_transcript finalize_session(
        const std::vector<transcript_segment> & segments,
        const finalize_params & params,
        Diarizer      * diarizer,
        ChapterSource * chapter_source,
        SessionStore  * store) {
    session_transcript result;
    result.segments = segments;

    // diarization runs alongside chapter generation
    std::future<bool> diarization;
    std::vector<diarization_interval> intervals;
    std::string diarization_error;

    if (diarizer && !segments.empty()) {
        diarization = std::async(std::launch::async, [&]() {
            return diarizer->diarize(params.audio_path, intervals, diarization_error);
        });
    }

    result.chapters = params.merge_chapters
        ? merge_into_chapters(segments, params.min_chapter_secs, params.mode)
        : chapters_from_segments(segments, params.mode);

    if (chapter_source && !params.session_id.empty()) {
        const std::vector<chapter_marker> remote = chapter_source->generate(params.session_id);
        if (remote.empty()) {
            CLASSNOTE_LOG_INFO("%s: no chapters from backend, keeping %zu local chapters\n", __func__, result.chapters.size());
        } else {
            result.remote_chapters = true;
        }
        result.chapters = select_chapters(result.chapters, remote);
    }

    if (diarization.valid()) {
        bool ok = false;
        try {
            ok = diarization.get();
        } catch (const std::exception & e) {
            diarization_error = e.what();
        }

        if (ok && !intervals.empty()) {
            align_speakers(result.segments, merge_intervals(intervals));
            result.diarized = true;
        } else {
            CLASSNOTE_LOG_WARN("%s: diarization unavailable, keeping segments without speakers: %s\n", __func__,
                    diarization_error.empty() ? "no speaker intervals" : diarization_error.c_str());
        }
    }

    if (store && !params.session_id.empty()) {
        if (!store->save_segments(params.session_id, result.segments)) {
            CLASSNOTE_LOG_WARN("%s: failed to cache segments\n", __func__);
        }
        if (!store->save_chapters(params.session_id, result.chapters)) {
            CLASSNOTE_LOG_WARN("%s: failed to cache chapters\n", __func__);
        }
    }

    CLASSNOTE_LOG_INFO("%s: %zu segments, %zu chapters%s%s\n", __func__,
            result.segments.size(), result.chapters.size(),
            result.remote_chapters ? ", chapters from backend" : "",
            result.diarized ? ", diarized" : "");

    return result;
}

} // namespace classnote
