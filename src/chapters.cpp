#include "classnote/chapters.h"
#include "classnote/utf8.h"

namespace classnote {

static const char * k_title_separators[] = {
    "\xE3\x80\x82", // 。
    "\xE3\x80\x81", // 、
    "\xEF\xBC\x81", // ！
    "\xEF\xBC\x9F", // ？
    ".", ",", "!", "?",
};

static const char * fallback_title(session_mode mode) {
    return mode == session_mode::meeting ? "meeting content" : "lecture content";
}

std::string chapter_title(const std::string & text, session_mode mode) {
    const std::string trimmed = trim(text);

    size_t end = trimmed.size();
    for (const char * sep : k_title_separators) {
        const size_t pos = trimmed.find(sep);
        if (pos != std::string::npos && pos < end) {
            end = pos;
        }
    }

    const std::string first = trimmed.substr(0, end);
    if (first.empty()) {
        return fallback_title(mode);
    }

    if (utf8_length(first) > (size_t) CLASSNOTE_CHAPTER_TITLE_MAX_CHARS) {
        return utf8_substr(first, 0, CLASSNOTE_CHAPTER_TITLE_MAX_CHARS) + "...";
    }

    return first;
}

std::vector<chapter_marker> chapters_from_segments(const std::vector<transcript_segment> & segments, session_mode mode) {
    std::vector<chapter_marker> chapters;
    chapters.reserve(segments.size());

    for (const auto & segment : segments) {
        chapter_marker chapter;
        chapter.id           = "ch-" + std::to_string(segment.index);
        chapter.time_seconds = segment.start_time;
        chapter.title        = chapter_title(segment.text, mode);
        chapters.push_back(std::move(chapter));
    }

    return chapters;
}

std::vector<chapter_marker> merge_into_chapters(
        const std::vector<transcript_segment> & segments,
        double min_duration,
        session_mode mode) {
    std::vector<chapter_marker> chapters;

    if (segments.empty()) {
        return chapters;
    }

    double      cur_start = segments[0].start_time;
    std::string cur_text;
    int32_t     n = 0;

    for (size_t i = 0; i < segments.size(); ++i) {
        const auto & segment = segments[i];

        if (segment.duration() >= min_duration || i == segments.size() - 1) {
            if (!cur_text.empty()) {
                chapter_marker merged;
                merged.id           = "merged-" + std::to_string(n++);
                merged.time_seconds = cur_start;
                merged.title        = chapter_title(cur_text, mode);
                chapters.push_back(std::move(merged));
            }

            chapter_marker chapter;
            chapter.id           = "ch-" + std::to_string(n++);
            chapter.time_seconds = segment.start_time;
            chapter.title        = chapter_title(segment.text, mode);
            chapters.push_back(std::move(chapter));

            cur_text.clear();
        } else {
            if (cur_text.empty()) {
                cur_start = segment.start_time;
            }
            cur_text += segment.text + " ";
        }
    }

    return chapters;
}

std::vector<chapter_marker> quick_chapters(double duration, int32_t count) {
    std::vector<chapter_marker> chapters;

    if (count <= 0) {
        return chapters;
    }

    const double interval = duration/count;

    for (int32_t i = 0; i < count; ++i) {
        chapter_marker chapter;
        chapter.id           = "quick-" + std::to_string(i);
        chapter.time_seconds = i*interval;
        chapter.title        = "Section " + std::to_string(i + 1);
        chapters.push_back(std::move(chapter));
    }

    return chapters;
}

std::vector<chapter_marker> select_chapters(
        const std::vector<chapter_marker> & local,
        const std::vector<chapter_marker> & remote) {
    return remote.empty() ? local : remote;
}

} // namespace classnote
