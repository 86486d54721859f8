#pragma once

#include "classnote/transcript.h"

#include <nlohmann/json.hpp>

// nlohmann::json conversions for the data model, found by ADL.
// Missing optional keys read as defaults; a missing required key or a type
// mismatch (including a speaker tag out of range) throws nlohmann::json::exception.

namespace classnote {

void to_json  (nlohmann::json & j, const transcript_segment & segment);
void from_json(const nlohmann::json & j, transcript_segment & segment);

void to_json  (nlohmann::json & j, const chapter_marker & chapter);
void from_json(const nlohmann::json & j, chapter_marker & chapter);

void to_json  (nlohmann::json & j, const diarization_interval & interval);
void from_json(const nlohmann::json & j, diarization_interval & interval);

void to_json  (nlohmann::json & j, const speaker_block & block);

// true if j is an integer that fits a speaker id
bool json_is_speaker_tag(const nlohmann::json & j);

} // namespace classnote
