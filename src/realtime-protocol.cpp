#include "classnote/realtime-protocol.h"
#include "classnote/transcript-json.h"
#include "classnote/url.h"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace classnote {

std::string realtime_start_frame(const realtime_config & config) {
    json frame = {
        {"event", "start"},
        {"config", {
            {"languageCode",             config.language_code},
            {"sampleRateHertz",          config.sample_rate_hertz},
            {"enableSpeakerDiarization", config.enable_speaker_diarization},
            {"speakerCount",             config.speaker_count},
            {"model",                    config.model},
        }},
    };
    return frame.dump();
}

std::string realtime_stop_frame() {
    return json{{"event", "stop"}}.dump();
}

std::string realtime_url(const std::string & base_url, const std::string & session_id, const std::string & token) {
    url_parts parts;
    if (!parse_url(base_url, parts)) {
        return "";
    }

    std::string path = parts.target;
    const size_t p_query = path.find('?');
    if (p_query != std::string::npos) {
        path = path.substr(0, p_query);
    }

    const bool        tls    = parts.scheme == "https";
    const std::string scheme = tls ? "wss" : "ws";

    std::string base = scheme + "://" + parts.host;
    if (parts.port != (tls ? "443" : "80")) {
        base += ":" + parts.port;
    }
    base += path;

    return url_join(base, "ws/stream/" + url_encode(session_id)) + "?token=" + url_encode(token);
}

const char * realtime_message_kind_name(realtime_message_kind kind) {
    switch (kind) {
        case realtime_message_kind::transcript:   return "transcript";
        case realtime_message_kind::server_error: return "server_error";
        case realtime_message_kind::ignored:      return "ignored";
        case realtime_message_kind::invalid:      return "invalid";
    }
    return "invalid";
}

static bool decode_primary(const json & j, realtime_message & msg) {
    if (!j.is_object() || !j.contains("event") || !j["event"].is_string()) {
        return false;
    }

    const std::string event = j["event"].get<std::string>();

    if (event == "error") {
        msg.kind = realtime_message_kind::server_error;
        if (j.contains("message") && j["message"].is_string()) {
            msg.error = j["message"].get<std::string>();
        }
        return true;
    }

    if (event != "partial" && event != "final") {
        return false;
    }

    if (!j.contains("transcript") || !j["transcript"].is_string()) {
        return false;
    }

    realtime_event ev;
    ev.is_final   = event == "final";
    ev.transcript = j["transcript"].get<std::string>();

    if (j.contains("sessionId") && !j["sessionId"].is_null()) {
        if (!j["sessionId"].is_string()) {
            return false;
        }
        ev.session_id = j["sessionId"].get<std::string>();
    }

    if (j.contains("confidence") && !j["confidence"].is_null()) {
        if (!j["confidence"].is_number()) {
            return false;
        }
        ev.confidence = j["confidence"].get<double>();
    }

    if (j.contains("words") && !j["words"].is_null()) {
        if (!j["words"].is_array()) {
            return false;
        }
        for (const auto & w : j["words"]) {
            if (!w.is_object() ||
                !w.contains("word")  || !w["word"].is_string() ||
                !w.contains("start") || !w["start"].is_number() ||
                !w.contains("end")   || !w["end"].is_number()) {
                return false;
            }

            realtime_word word;
            word.text  = w["word"].get<std::string>();
            word.start = w["start"].get<double>();
            word.end   = w["end"].get<double>();

            if (w.contains("speakerTag") && !w["speakerTag"].is_null()) {
                if (!json_is_speaker_tag(w["speakerTag"])) {
                    return false;
                }
                word.speaker = speaker_id(w["speakerTag"].get<int32_t>());
            }

            ev.words.push_back(std::move(word));
        }
    }

    msg.kind  = realtime_message_kind::transcript;
    msg.event = std::move(ev);

    return true;
}

static bool decode_legacy(const json & j, realtime_message & msg) {
    if (!j.is_object()) {
        return false;
    }

    std::string event;
    if (j.contains("event") && j["event"].is_string()) {
        event = j["event"].get<std::string>();
    }

    if (event == "error") {
        // logged by the caller, never dispatched
        msg.kind = realtime_message_kind::server_error;
        if (j.contains("message") && j["message"].is_string()) {
            msg.error = j["message"].get<std::string>();
        }
        msg.legacy = true;
        return true;
    }

    if (event != "partial" && event != "final" && event != "transcript") {
        return false;
    }

    std::string text;
    if (j.contains("transcript") && j["transcript"].is_string()) {
        text = j["transcript"].get<std::string>();
    } else if (j.contains("text") && j["text"].is_string()) {
        text = j["text"].get<std::string>();
    }

    int32_t speaker = 0;
    if (j.contains("speakerTag") && json_is_speaker_tag(j["speakerTag"])) {
        speaker = j["speakerTag"].get<int32_t>();
    } else if (j.contains("speaker") && json_is_speaker_tag(j["speaker"])) {
        speaker = j["speaker"].get<int32_t>();
    }

    realtime_event ev;
    ev.is_final   = event == "final";
    ev.transcript = text;

    if (j.contains("sessionId") && j["sessionId"].is_string()) {
        ev.session_id = j["sessionId"].get<std::string>();
    }

    // one word spanning the whole text
    realtime_word word;
    word.text    = text;
    word.speaker = speaker_id(speaker);
    ev.words.push_back(std::move(word));

    msg.kind   = realtime_message_kind::transcript;
    msg.event  = std::move(ev);
    msg.legacy = true;

    return true;
}

realtime_message realtime_decode(const std::string & payload) {
    realtime_message msg;

    json j;
    try {
        j = json::parse(payload);
    } catch (const json::exception &) {
        return msg;
    }

    try {
        if (decode_primary(j, msg)) {
            return msg;
        }
        msg = realtime_message();
        if (decode_legacy(j, msg)) {
            return msg;
        }
    } catch (const json::exception &) {
        // a value of the wrong type
    }

    msg = realtime_message();

    // well-formed frames we do not dispatch (acks, status updates)
    if (j.is_object() && j.contains("event") && j["event"].is_string()) {
        msg.kind = realtime_message_kind::ignored;
    }

    return msg;
}

} // namespace classnote
