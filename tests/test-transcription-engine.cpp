#include "classnote/transcription-engine.h"

#include <atomic>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#ifdef NDEBUG
#undef NDEBUG
#endif
#include <cassert>

using namespace classnote;

// recognition session driven by the test
class fake_session : public RecognitionSession {
public:
    explicit fake_session(const recognition_handler & handler) : handler(handler) {}

    void append(const float * /*samples*/, size_t n_samples) override {
        n_appended += n_samples;
    }

    void finish() override {
        finished = true;
    }

    void cancel() override {
        cancelled = true;
    }

    void emit(const std::string & text, bool is_final = false) {
        recognition_event event;
        event.text     = text;
        event.is_final = is_final;
        handler(event);
    }

    void emit_status(recognition_status status, const std::string & message) {
        recognition_event event;
        event.status  = status;
        event.message = message;
        handler(event);
    }

    recognition_handler handler;

    std::atomic<size_t> n_appended{0};
    std::atomic<bool>   finished{false};
    std::atomic<bool>   cancelled{false};
};

// sessions stay alive after the engine releases them so the test can replay stale events
class fake_recognizer : public Recognizer {
public:
    std::unique_ptr<RecognitionSession> start(const recognition_handler & handler, std::string & error) override {
        std::lock_guard<std::mutex> lock(mutex);
        if (!available) {
            error = "speech recognition not authorized";
            return nullptr;
        }

        auto session = std::make_shared<fake_session>(handler);
        sessions.push_back(session);

        return std::unique_ptr<RecognitionSession>(new session_ref(session));
    }

    std::shared_ptr<fake_session> session(size_t i) {
        std::lock_guard<std::mutex> lock(mutex);
        return sessions.at(i);
    }

    size_t n_sessions() {
        std::lock_guard<std::mutex> lock(mutex);
        return sessions.size();
    }

    bool available = true;

private:
    class session_ref : public RecognitionSession {
    public:
        explicit session_ref(std::shared_ptr<fake_session> session) : m_session(std::move(session)) {}

        void append(const float * samples, size_t n_samples) override { m_session->append(samples, n_samples); }
        void finish() override { m_session->finish(); }
        void cancel() override { m_session->cancel(); }

    private:
        std::shared_ptr<fake_session> m_session;
    };

    std::mutex mutex;
    std::vector<std::shared_ptr<fake_session>> sessions;
};

class fake_source : public AudioSource {
public:
    bool start(const audio_callbacks & cb, std::string & error) override {
        if (fail_start) {
            error = "microphone unavailable";
            return false;
        }
        callbacks = cb;
        running   = true;
        return true;
    }

    void stop() override {
        running = false;
    }

    int32_t sample_rate() const override { return 16000; }

    void push(size_t n_samples) {
        std::vector<float> samples(n_samples, 0.25f);
        callbacks.on_samples(samples.data(), samples.size());
    }

    audio_callbacks callbacks;

    bool fail_start = false;
    std::atomic<bool> running{false};
};

// callbacks observed by the test
struct recorder {
    void attach(TranscriptionEngine & engine) {
        engine.on_partial([this](const std::string & text, const std::string & delta) {
            std::lock_guard<std::mutex> lock(mutex);
            partial = text;
            deltas += delta;
            partial_thread = std::this_thread::get_id();
        });
        engine.on_segment([this](const transcript_segment & segment, bool is_final) {
            std::lock_guard<std::mutex> lock(mutex);
            segments.push_back(segment);
            finals.push_back(is_final);
            segment_thread = std::this_thread::get_id();
        });
        engine.on_state([this](engine_state state) {
            std::lock_guard<std::mutex> lock(mutex);
            states.push_back(state);
            state_threads.push_back(std::this_thread::get_id());
        });
    }

    std::mutex mutex;
    std::string partial;
    std::string deltas;
    std::vector<transcript_segment> segments;
    std::vector<bool> finals;
    std::vector<engine_state> states;

    std::thread::id              partial_thread;
    std::thread::id              segment_thread;
    std::vector<std::thread::id> state_threads;
};

static std::string temp_wav(const char * name) {
    return (std::filesystem::temp_directory_path() / name).string();
}

void test_end_to_end() {
    fake_recognizer recognizer;
    fake_source     source;

    engine_params params;
    params.audio_path = temp_wav("classnote_test_e2e.wav");

    TranscriptionEngine engine(recognizer, source, params);
    recorder rec;
    rec.attach(engine);

    assert(engine.state() == engine_state::idle);
    assert(engine.start());
    assert(engine.state() == engine_state::listening);
    assert(recognizer.n_sessions() == 1);
    assert(source.running);

    auto session = recognizer.session(0);
    session->emit("Hello");
    session->emit("Hello, today");
    engine.sync();
    assert(engine.partial_text() == "Hello, today");

    session->emit("Hello, today we discuss AI.", true);

    assert(engine.wait_stopped(5000));
    engine.sync();
    assert(engine.state() == engine_state::stopped);
    assert(engine.last_error().empty());

    const auto segments = engine.segments();
    assert(segments.size() == 1);
    assert(segments[0].index == 0);
    assert(segments[0].text == "Hello, today we discuss AI.");
    assert(segments[0].start_time == 0.0);

    {
        std::lock_guard<std::mutex> lock(rec.mutex);
        assert(rec.deltas == "Hello, today we discuss AI.");
        assert(rec.segments.size() == 1);
        assert(rec.finals[0]);
        assert(rec.states.front() == engine_state::listening);
        assert(rec.states.back() == engine_state::stopped);
    }

    // stop order: capture stopped, session cancelled
    assert(!source.running);
    assert(session->cancelled);

    // stopping again is harmless
    engine.stop();
    assert(engine.segments().size() == 1);

    std::filesystem::remove(params.audio_path);
}

void test_restart_on_close() {
    fake_recognizer recognizer;
    fake_source     source;

    engine_params params;
    params.segmenter.max_chars       = 60;
    params.segmenter.min_split_chars = 10;
    params.audio_path = temp_wav("classnote_test_restart.wav");

    TranscriptionEngine engine(recognizer, source, params);
    recorder rec;
    rec.attach(engine);

    assert(engine.start());

    auto first = recognizer.session(0);
    const std::string long_text(60, 'a');
    first->emit(long_text);
    engine.sync();

    // the segment closed and a new recognition session replaced the old one
    assert(recognizer.n_sessions() == 2);
    assert(first->cancelled);
    assert(engine.state() == engine_state::listening);
    assert(engine.segments().size() == 1);
    assert(engine.segments()[0].text == long_text);

    // late events of the replaced session are dropped
    first->emit(long_text + "zzz");
    engine.sync();
    assert(engine.partial_text() == long_text + "\n");

    // the new session starts from zero delivered characters
    auto second = recognizer.session(1);
    second->emit("bc");
    engine.sync();
    assert(engine.partial_text() == long_text + "\nbc");

    engine.stop();
    assert(engine.state() == engine_state::stopped);
    assert(second->cancelled);

    const auto segments = engine.segments();
    assert(segments.size() == 2);
    assert(segments[0].index == 0);
    assert(segments[1].index == 1);
    assert(segments[1].text == "bc");
    assert(segments[1].start_time >= segments[0].start_time);

    {
        std::lock_guard<std::mutex> lock(rec.mutex);
        assert(rec.finals.size() == 2);
        assert(!rec.finals[0]);
        assert(rec.finals[1]);

        bool saw_closing = false;
        for (auto state : rec.states) {
            saw_closing |= state == engine_state::closing;
        }
        assert(saw_closing);
    }

    std::filesystem::remove(params.audio_path);
}

void test_callback_threads() {
    fake_recognizer recognizer;
    fake_source     source;

    engine_params params;
    params.audio_path = temp_wav("classnote_test_threads.wav");

    TranscriptionEngine engine(recognizer, source, params);
    recorder rec;
    rec.attach(engine);

    const std::thread::id caller = std::this_thread::get_id();

    assert(engine.start());
    recognizer.session(0)->emit("some words");
    engine.sync();
    engine.stop();
    engine.sync();

    std::lock_guard<std::mutex> lock(rec.mutex);

    // start() reports listening on the caller's thread
    assert(rec.states.front() == engine_state::listening);
    assert(rec.state_threads.front() == caller);

    // everything else comes from the serial queue
    assert(rec.partial_thread != std::thread::id());
    assert(rec.partial_thread != caller);
    assert(rec.segment_thread == rec.partial_thread);
    assert(rec.states.back() == engine_state::stopped);
    assert(rec.state_threads.back() == rec.partial_thread);

    std::filesystem::remove(params.audio_path);
}

void test_cancelled_is_suppressed() {
    fake_recognizer recognizer;
    fake_source     source;

    engine_params params;
    params.audio_path = temp_wav("classnote_test_cancel.wav");

    TranscriptionEngine engine(recognizer, source, params);
    assert(engine.start());

    recognizer.session(0)->emit_status(recognition_status::cancelled, "cancelled");
    engine.sync();

    assert(engine.state() == engine_state::listening);
    assert(engine.last_error().empty());

    engine.stop();
    std::filesystem::remove(params.audio_path);
}

void test_recognizer_failure_stops() {
    fake_recognizer recognizer;
    fake_source     source;

    engine_params params;
    params.audio_path = temp_wav("classnote_test_fail.wav");

    TranscriptionEngine engine(recognizer, source, params);
    recorder rec;
    rec.attach(engine);

    assert(engine.start());

    auto session = recognizer.session(0);
    session->emit("partial words");
    session->emit_status(recognition_status::failed, "network down");

    assert(engine.wait_stopped(5000));
    assert(engine.last_error().find("network down") != std::string::npos);

    // the open segment is kept as the final one
    assert(engine.segments().size() == 1);
    assert(engine.segments()[0].text == "partial words");
    assert(!source.running);

    std::filesystem::remove(params.audio_path);
}

void test_start_failures() {
    // recognizer unavailable
    {
        fake_recognizer recognizer;
        recognizer.available = false;
        fake_source source;

        engine_params params;
        params.audio_path = temp_wav("classnote_test_unavailable.wav");

        TranscriptionEngine engine(recognizer, source, params);
        assert(!engine.start());
        assert(engine.last_error() == "speech recognition not authorized");
        assert(engine.state() == engine_state::stopped);
        assert(!source.running);

        std::filesystem::remove(params.audio_path);
    }

    // audio source unavailable
    {
        fake_recognizer recognizer;
        fake_source source;
        source.fail_start = true;

        engine_params params;
        params.audio_path = temp_wav("classnote_test_nomic.wav");

        TranscriptionEngine engine(recognizer, source, params);
        assert(!engine.start());
        assert(engine.last_error() == "microphone unavailable");
        assert(engine.state() == engine_state::stopped);
        assert(recognizer.session(0)->cancelled);

        std::filesystem::remove(params.audio_path);
    }

    // audio file cannot be created
    {
        fake_recognizer recognizer;
        fake_source source;

        engine_params params;
        params.audio_path = (std::filesystem::temp_directory_path() / "classnote-no-such-dir" / "x.wav").string();

        TranscriptionEngine engine(recognizer, source, params);
        assert(!engine.start());
        assert(!engine.last_error().empty());
        assert(recognizer.n_sessions() == 0);
    }
}

void test_audio_capture() {
    fake_recognizer recognizer;
    fake_source     source;

    engine_params params;
    params.segmenter.max_chars       = 20;
    params.segmenter.min_split_chars = 5;
    params.audio_path = temp_wav("classnote_test_audio.wav");

    TranscriptionEngine engine(recognizer, source, params);
    assert(engine.start());

    source.push(1600);
    source.push(1600);
    engine.sync();
    assert(recognizer.session(0)->n_appended == 3200);

    // a restart does not interrupt capture: later audio goes to the new session
    recognizer.session(0)->emit(std::string(20, 'x'));
    engine.sync();
    assert(recognizer.n_sessions() == 2);

    source.push(800);
    engine.sync();
    assert(recognizer.session(0)->n_appended == 3200);
    assert(recognizer.session(1)->n_appended == 800);

    // end of input asks the active session for a final result
    source.callbacks.on_end("");
    engine.sync();
    assert(recognizer.session(1)->finished);

    recognizer.session(1)->emit("done", true);
    assert(engine.wait_stopped(5000));

    // one WAV for the whole recording
    assert(std::filesystem::file_size(params.audio_path) == 44 + 2*(3200 + 800));

    std::filesystem::remove(params.audio_path);
}

void test_capture_error_stops() {
    fake_recognizer recognizer;
    fake_source     source;

    engine_params params;
    params.audio_path = temp_wav("classnote_test_capture_error.wav");

    TranscriptionEngine engine(recognizer, source, params);
    assert(engine.start());

    source.callbacks.on_end("device lost");

    assert(engine.wait_stopped(5000));
    assert(engine.last_error().find("device lost") != std::string::npos);
    assert(engine.segments().empty());

    std::filesystem::remove(params.audio_path);
}

int main() {
    test_end_to_end();
    test_restart_on_close();
    test_callback_threads();
    test_cancelled_is_suppressed();
    test_recognizer_failure_stops();
    test_start_failures();
    test_audio_capture();
    test_capture_error_stops();

    printf("test-transcription-engine: OK\n");

    return 0;
}
