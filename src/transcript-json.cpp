#include "classnote/transcript-json.h"

#include <cstdint>
#include <limits>

using json = nlohmann::json;

namespace classnote {

bool json_is_speaker_tag(const json & j) {
    if (j.is_number_unsigned()) {
        return j.get<uint64_t>() <= (uint64_t) std::numeric_limits<int32_t>::max();
    }
    if (j.is_number_integer()) {
        const int64_t v = j.get<int64_t>();
        return v >= std::numeric_limits<int32_t>::min() && v <= std::numeric_limits<int32_t>::max();
    }
    return false;
}

static speaker_id speaker_from_json(const json & j) {
    if (!json_is_speaker_tag(j)) {
        if (j.is_number_integer()) {
            throw json::out_of_range::create(406, "speaker tag out of range: " + j.dump(), &j);
        }
        throw json::type_error::create(302, "speaker tag must be an integer, got " + j.dump(), &j);
    }
    return speaker_id(j.get<int32_t>());
}

void to_json(json & j, const transcript_segment & segment) {
    j = json{
        {"index",            segment.index},
        {"text",             segment.text},
        {"startTimeSeconds", segment.start_time},
        {"endTimeSeconds",   segment.end_time},
        {"createdAt",        segment.created_at},
    };

    if (segment.speaker) {
        j["speakerTag"]   = segment.speaker->value();
        j["speakerLabel"] = segment.speaker_label;
    }
}

void from_json(const json & j, transcript_segment & segment) {
    segment = transcript_segment();

    j.at("index").get_to(segment.index);
    j.at("text").get_to(segment.text);
    j.at("startTimeSeconds").get_to(segment.start_time);

    segment.end_time   = j.value("endTimeSeconds", segment.start_time);
    segment.created_at = j.value("createdAt", (int64_t) 0);

    if (j.contains("speakerTag") && !j["speakerTag"].is_null()) {
        segment.speaker       = speaker_from_json(j["speakerTag"]);
        segment.speaker_label = j.value("speakerLabel", speaker_label(*segment.speaker));
    }
}

void to_json(json & j, const chapter_marker & chapter) {
    j = json{
        {"id",           chapter.id},
        {"time_seconds", chapter.time_seconds},
        {"title",        chapter.title},
    };
}

void from_json(const json & j, chapter_marker & chapter) {
    chapter = chapter_marker();

    j.at("time_seconds").get_to(chapter.time_seconds);
    j.at("title").get_to(chapter.title);

    chapter.id = j.value("id", std::string());
}

void to_json(json & j, const diarization_interval & interval) {
    j = json{
        {"speaker", interval.speaker.value()},
        {"start",   interval.start},
        {"end",     interval.end},
    };
}

void from_json(const json & j, diarization_interval & interval) {
    interval.speaker = speaker_from_json(j.at("speaker"));
    j.at("start").get_to(interval.start);
    j.at("end").get_to(interval.end);
}

void to_json(json & j, const speaker_block & block) {
    j = json{
        {"speaker", speaker_label(block.speaker)},
        {"text",    block.text},
        {"start",   block.start},
        {"end",     block.end},
    };
}

} // namespace classnote
