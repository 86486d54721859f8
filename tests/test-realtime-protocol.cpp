#include "classnote/realtime-protocol.h"
#include "classnote/url.h"

#include <nlohmann/json.hpp>

#include <cstdio>
#include <string>

#ifdef NDEBUG
#undef NDEBUG
#endif
#include <cassert>

using json = nlohmann::json;
using namespace classnote;

void test_start_frame() {
    const json frame = json::parse(realtime_start_frame(realtime_config()));

    assert(frame.at("event") == "start");

    const json & config = frame.at("config");
    assert(config.at("languageCode") == "ja-JP");
    assert(config.at("sampleRateHertz") == 16000);
    assert(config.at("enableSpeakerDiarization") == true);
    assert(config.at("speakerCount") == 2);
    assert(config.at("model") == "default");

    assert(json::parse(realtime_stop_frame()) == json({{"event", "stop"}}));
}

void test_url() {
    assert(realtime_url("https://api.example.com", "abc", "t0k") == "wss://api.example.com/ws/stream/abc?token=t0k");
    assert(realtime_url("http://localhost:8080/", "s 1", "a+b/c") == "ws://localhost:8080/ws/stream/s%201?token=a%2Bb%2Fc");
    assert(realtime_url("https://example.com/api/", "id", "") == "wss://example.com/api/ws/stream/id?token=");
    assert(realtime_url("not a url", "id", "x").empty());

    url_parts parts;
    assert(parse_url("wss://host.example:9000/ws/stream/x?token=y", parts));
    assert(parts.tls());
    assert(parts.host == "host.example");
    assert(parts.port == "9000");
    assert(parts.target == "/ws/stream/x?token=y");
    assert(url_host_header(parts) == "host.example:9000");

    assert(parse_url("http://host", parts));
    assert(!parts.tls());
    assert(parts.port == "80");
    assert(parts.target == "/");
    assert(url_host_header(parts) == "host");

    assert(parse_url("https://host:443/x", parts));
    assert(url_host_header(parts) == "host");

    assert(!parse_url("ftp://host/file", parts));
    assert(!parse_url("http://:80/", parts));
    assert(!parse_url("http://host:80a/", parts));
    assert(!parse_url("http://host:\xC3\xA9/", parts));
}

void test_primary_final() {
    const std::string payload = R"({
        "event": "final",
        "sessionId": "s1",
        "transcript": "hello world",
        "confidence": 0.93,
        "words": [
            {"word": "hello", "start": 0.0, "end": 0.4, "speakerTag": 1},
            {"word": "world", "start": 0.5, "end": 0.9}
        ]
    })";

    const realtime_message msg = realtime_decode(payload);
    assert(msg.kind == realtime_message_kind::transcript);
    assert(!msg.legacy);
    assert(msg.event.is_final);
    assert(msg.event.session_id == "s1");
    assert(msg.event.transcript == "hello world");
    assert(msg.event.confidence && *msg.event.confidence == 0.93);
    assert(msg.event.words.size() == 2);
    assert(msg.event.words[0].text == "hello");
    assert(msg.event.words[0].end == 0.4);
    assert(msg.event.words[0].speaker == speaker_id(1));
    assert(msg.event.words[1].speaker == speaker_id(0));
}

void test_primary_partial_minimal() {
    const realtime_message msg = realtime_decode(R"({"event": "partial", "transcript": "hel"})");
    assert(msg.kind == realtime_message_kind::transcript);
    assert(!msg.legacy);
    assert(!msg.event.is_final);
    assert(msg.event.transcript == "hel");
    assert(!msg.event.confidence);
    assert(msg.event.words.empty());
}

void test_legacy_partial() {
    const realtime_message msg = realtime_decode(R"({"event": "partial", "text": "おはよう", "speaker": 2})");
    assert(msg.kind == realtime_message_kind::transcript);
    assert(msg.legacy);
    assert(!msg.event.is_final);
    assert(msg.event.transcript == "おはよう");
    assert(msg.event.words.size() == 1);
    assert(msg.event.words[0].text == "おはよう");
    assert(msg.event.words[0].speaker == speaker_id(2));
    assert(msg.event.words[0].start == 0.0);
    assert(msg.event.words[0].end == 0.0);
}

void test_legacy_transcript_event() {
    // "transcript" events are only understood by the loose schema and are not final
    const realtime_message msg = realtime_decode(R"({"event": "transcript", "transcript": "abc", "speakerTag": 1})");
    assert(msg.kind == realtime_message_kind::transcript);
    assert(msg.legacy);
    assert(!msg.event.is_final);
    assert(msg.event.words[0].speaker == speaker_id(1));

    // a malformed word list makes the strict schema fail
    const realtime_message bad_words = realtime_decode(R"({"event": "final", "transcript": "x", "words": [{"word": 1}]})");
    assert(bad_words.kind == realtime_message_kind::transcript);
    assert(bad_words.legacy);
    assert(bad_words.event.is_final);
    assert(bad_words.event.transcript == "x");
}

void test_speaker_tag_range() {
    // a tag that does not fit a speaker id is rejected by the strict schema, never truncated
    const realtime_message wide = realtime_decode(
            R"({"event": "final", "transcript": "x", "words": [{"word": "x", "start": 0, "end": 1, "speakerTag": 4294967297}]})");
    assert(wide.kind == realtime_message_kind::transcript);
    assert(wide.legacy);
    assert(wide.event.words.size() == 1);
    assert(wide.event.words[0].speaker == speaker_id(0));

    const realtime_message legacy = realtime_decode(R"({"event": "partial", "text": "y", "speaker": -3000000000})");
    assert(legacy.kind == realtime_message_kind::transcript);
    assert(legacy.event.words[0].speaker == speaker_id(0));

    const realtime_message max = realtime_decode(R"({"event": "partial", "text": "z", "speakerTag": 2147483647})");
    assert(max.event.words[0].speaker == speaker_id(2147483647));
}

void test_error_and_dropped_frames() {
    const realtime_message err = realtime_decode(R"({"event": "error", "message": "quota exceeded"})");
    assert(err.kind == realtime_message_kind::server_error);
    assert(err.error == "quota exceeded");

    assert(realtime_decode(R"({"event": "ready"})").kind == realtime_message_kind::ignored);
    assert(realtime_decode("not json").kind == realtime_message_kind::invalid);
    assert(realtime_decode("[1, 2, 3]").kind == realtime_message_kind::invalid);
    assert(realtime_decode(R"({"transcript": "no event"})").kind == realtime_message_kind::invalid);
}

int main() {
    test_start_frame();
    test_url();
    test_primary_final();
    test_primary_partial_minimal();
    test_legacy_partial();
    test_legacy_transcript_event();
    test_speaker_tag_range();
    test_error_and_dropped_frames();

    printf("test-realtime-protocol: OK\n");

    return 0;
}
