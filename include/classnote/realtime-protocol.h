#pragma once

#include "classnote/transcript.h"

#include <cstdint>
#include <string>

namespace classnote {

// Sent as the first frame after the connection is established.
struct realtime_config {
    std::string language_code = "ja-JP";
    int32_t     sample_rate_hertz = 16000;
    bool        enable_speaker_diarization = true;
    int32_t     speaker_count = 2;
    std::string model = "default";
};

std::string realtime_start_frame(const realtime_config & config);
std::string realtime_stop_frame();

// ws(s)://<host>[/<base path>]/ws/stream/<session_id>?token=<token>
// https maps to wss, every other scheme to ws. Empty if base_url is invalid.
std::string realtime_url(const std::string & base_url, const std::string & session_id, const std::string & token);

enum class realtime_message_kind {
    transcript,   // event holds a partial or final result
    server_error, // error holds the server message
    ignored,      // well-formed, but nothing to dispatch
    invalid,      // neither schema matched
};

const char * realtime_message_kind_name(realtime_message_kind kind);

struct realtime_message {
    realtime_message_kind kind = realtime_message_kind::invalid;

    realtime_event event;
    std::string    error;

    bool legacy = false; // decoded with the loose schema
};

// Decodes one text frame. The strict schema is tried first:
//   {"event": "partial"|"final"|"error", "sessionId", "transcript",
//    "confidence"?, "words": [{"word", "start", "end", "speakerTag"}], "message"?}
// and only if that fails, the loose one:
//   {"event": "partial"|"final"|"transcript", "transcript"|"text", "speakerTag"|"speaker"}
realtime_message realtime_decode(const std::string & payload);

} // namespace classnote
