#include "classnote/chapter-api.h"
#include "classnote/live-lines.h"
#include "classnote/session-finalizer.h"
#include "classnote/session-store.h"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

#ifdef NDEBUG
#undef NDEBUG
#endif
#include <cassert>

using namespace classnote;

static transcript_segment make_segment(int32_t index, double start, double end, const std::string & text) {
    transcript_segment segment;
    segment.index      = index;
    segment.start_time = start;
    segment.end_time   = end;
    segment.text       = text;
    segment.created_at = 1700000000000 + index;
    return segment;
}

class fake_diarizer : public Diarizer {
public:
    bool diarize(const std::string & audio_path, std::vector<diarization_interval> & result, std::string & error) override {
        requested = audio_path;
        if (fail) {
            error = "model missing";
            return false;
        }
        result = intervals;
        return true;
    }

    std::vector<diarization_interval> intervals;
    std::string requested;
    bool fail = false;
};

class throwing_diarizer : public Diarizer {
public:
    bool diarize(const std::string &, std::vector<diarization_interval> &, std::string &) override {
        throw std::runtime_error("diarizer crashed");
    }
};

class fake_chapter_source : public ChapterSource {
public:
    std::vector<chapter_marker> generate(const std::string & session_id) override {
        requested = session_id;
        return chapters;
    }

    std::vector<chapter_marker> chapters;
    std::string requested;
};

static std::string temp_dir(const char * name) {
    const auto dir = std::filesystem::temp_directory_path() / name;
    std::filesystem::remove_all(dir);
    return dir.string();
}

void test_store_round_trip() {
    const std::string dir = temp_dir("classnote_test_store");
    SessionStore store(dir);

    std::vector<transcript_segment> segments = {
        make_segment(0, 0.0, 5.0, "first"),
        make_segment(1, 5.0, 9.5, "二つ目"),
    };
    segments[1].speaker       = speaker_id(1);
    segments[1].speaker_label = "Speaker 2";

    assert(store.save_segments("s1", segments));
    assert(std::filesystem::exists(std::filesystem::path(dir) / "segments_s1.json"));

    const auto loaded = store.load_segments("s1");
    assert(loaded.size() == 2);
    assert(loaded[0].text == "first");
    assert(!loaded[0].speaker);
    assert(loaded[1].text == "二つ目");
    assert(loaded[1].end_time == 9.5);
    assert(loaded[1].speaker && *loaded[1].speaker == speaker_id(1));
    assert(loaded[1].speaker_label == "Speaker 2");
    assert(loaded[1].created_at == 1700000000001);

    const std::vector<chapter_marker> chapters = { {"ch-0", 0.0, "first"}, {"ch-1", 5.0, "second"} };
    assert(store.save_chapters("s1", chapters));

    const auto loaded_chapters = store.load_chapters("s1");
    assert(loaded_chapters.size() == 2);
    assert(loaded_chapters[1].id == "ch-1");
    assert(loaded_chapters[1].time_seconds == 5.0);

    // the cache file uses the original key names
    std::ifstream fin(store.segments_path("s1"));
    const std::string raw((std::istreambuf_iterator<char>(fin)), std::istreambuf_iterator<char>());
    assert(raw.find("\"startTimeSeconds\"") != std::string::npos);
    assert(raw.find("\"speakerTag\"") != std::string::npos);

    std::filesystem::remove_all(dir);
}

void test_store_missing_and_corrupt() {
    const std::string dir = temp_dir("classnote_test_store_corrupt");
    SessionStore store(dir);

    assert(store.load_segments("none").empty());
    assert(store.load_chapters("none").empty());

    std::filesystem::create_directories(dir);
    {
        std::ofstream fout(store.chapters_path("bad"));
        fout << "[{\"id\": 1";
    }
    assert(store.load_chapters("bad").empty());

    {
        std::ofstream fout(store.segments_path("bad"));
        fout << "[{\"text\": \"missing index\"}]";
    }
    assert(store.load_segments("bad").empty());

    {
        std::ofstream fout(store.segments_path("wide"));
        fout << R"([{"index": 0, "text": "x", "startTimeSeconds": 0, "speakerTag": 5000000000}])";
    }
    assert(store.load_segments("wide").empty());

    std::filesystem::remove_all(dir);
}

void test_store_session_id_stays_in_dir() {
    const std::string dir = temp_dir("classnote_test_store_ids");
    SessionStore store(dir);

    const std::vector<chapter_marker> chapters = { {"ch-0", 0.0, "first"} };
    assert(store.save_chapters("../escape", chapters));
    assert(store.save_chapters("a/b\\c", chapters));

    for (const auto & id : { std::string("../escape"), std::string("a/b\\c") }) {
        const std::filesystem::path path = store.chapters_path(id);
        assert(path.parent_path() == std::filesystem::path(dir));
        assert(std::filesystem::exists(path));
        assert(store.load_chapters(id).size() == 1);
    }

    assert(!std::filesystem::exists(std::filesystem::path(dir).parent_path() / "escape.json"));

    std::filesystem::remove_all(dir);
}

void test_parse_chapters_response() {
    std::vector<chapter_marker> chapters;

    assert(parse_chapters_response(R"({"chapters": [{"id": "a", "time_seconds": 0, "title": "Intro"}, {"time_seconds": 42.5, "title": "Main"}]})", chapters));
    assert(chapters.size() == 2);
    assert(chapters[0].id == "a");
    assert(chapters[0].title == "Intro");
    assert(chapters[1].id == "ch-1");
    assert(chapters[1].time_seconds == 42.5);

    assert(parse_chapters_response(R"({"chapters": []})", chapters));
    assert(chapters.empty());

    assert(!parse_chapters_response(R"({"detail": "not found"})", chapters));
    assert(!parse_chapters_response(R"({"chapters": [{"title": "no time"}]})", chapters));
    assert(chapters.empty());
    assert(!parse_chapters_response("<html>", chapters));
}

void test_finalize_local() {
    const std::vector<transcript_segment> segments = {
        make_segment(0,  0.0,  5.0, "Hello, everyone"),
        make_segment(1,  5.0, 12.0, "Next topic. Details"),
    };

    fake_diarizer diarizer;
    diarizer.intervals = {
        { speaker_id(0), 0.0, 3.0 },
        { speaker_id(0), 3.1, 6.0 },
        { speaker_id(1), 6.0, 15.0 },
    };

    const std::string dir = temp_dir("classnote_test_finalize");
    SessionStore store(dir);

    finalize_params params;
    params.session_id = "s2";
    params.audio_path = "s2.wav";

    const session_transcript result = finalize_session(segments, params, &diarizer, nullptr, &store);

    assert(diarizer.requested == "s2.wav");
    assert(result.diarized);
    assert(!result.remote_chapters);

    assert(result.segments.size() == 2);
    assert(*result.segments[0].speaker == speaker_id(0));
    assert(*result.segments[1].speaker == speaker_id(1));
    assert(result.segments[1].text == "Next topic. Details");

    assert(result.chapters.size() == 2);
    assert(result.chapters[0].title == "Hello");
    assert(result.chapters[1].title == "Next topic");
    assert(result.chapters[1].time_seconds == 5.0);

    assert(store.load_segments("s2").size() == 2);
    assert(store.load_chapters("s2").size() == 2);

    std::filesystem::remove_all(dir);
}

void test_finalize_degrades() {
    const std::vector<transcript_segment> segments = {
        make_segment(0,  0.0, 10.0, "short one"),
        make_segment(1, 10.0, 20.0, "short two"),
        make_segment(2, 20.0, 90.0, "long one"),
    };

    finalize_params params;
    params.session_id     = "s3";
    params.mode           = session_mode::meeting;
    params.merge_chapters = true;

    // failing diarization keeps the segments without speakers
    fake_diarizer diarizer;
    diarizer.fail = true;

    fake_chapter_source empty_backend;

    session_transcript result = finalize_session(segments, params, &diarizer, &empty_backend, nullptr);
    assert(!result.diarized);
    assert(!result.segments[0].speaker);
    assert(empty_backend.requested == "s3");
    assert(!result.remote_chapters);
    assert(result.chapters.size() == 2);
    assert(result.chapters[0].id == "merged-0");

    // a throwing diarizer degrades the same way
    throwing_diarizer crashing;
    result = finalize_session(segments, params, &crashing, nullptr, nullptr);
    assert(!result.diarized);
    assert(result.segments.size() == 3);

    // non-empty backend chapters replace the local ones
    fake_chapter_source backend;
    backend.chapters = { {"ai-0", 0.0, "Opening"}, {"ai-1", 20.0, "Discussion"} };

    result = finalize_session(segments, params, nullptr, &backend, nullptr);
    assert(result.remote_chapters);
    assert(result.chapters.size() == 2);
    assert(result.chapters[1].title == "Discussion");
}

void test_live_lines() {
    LiveLines lines;

    realtime_event partial;
    partial.transcript = "good mor";
    assert(!lines.apply(partial));
    assert(lines.current() == "good mor");
    assert(lines.lines().empty());

    realtime_event final_event;
    final_event.is_final   = true;
    final_event.transcript = "good morning";
    realtime_word word;
    word.text    = "good";
    word.speaker = speaker_id(1);
    final_event.words.push_back(word);

    assert(lines.apply(final_event));
    assert(lines.current().empty());
    assert(lines.lines().size() == 1);
    assert(lines.lines()[0].speaker == speaker_id(1));

    realtime_event no_words;
    no_words.is_final   = true;
    no_words.transcript = "bye";
    assert(lines.apply(no_words));
    assert(lines.lines()[1].speaker == speaker_id(0));

    assert(lines.text() == "good morning\nbye");
}

int main() {
    test_store_round_trip();
    test_store_missing_and_corrupt();
    test_store_session_id_stays_in_dir();
    test_parse_chapters_response();
    test_finalize_local();
    test_finalize_degrades();
    test_live_lines();

    printf("test-session: OK\n");

    return 0;
}
