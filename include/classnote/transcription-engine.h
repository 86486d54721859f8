#pragma once

#include "classnote/audio-source.h"
#include "classnote/recognizer.h"
#include "classnote/segmenter.h"
#include "classnote/serial-queue.h"
#include "classnote/transcript.h"
#include "classnote/wav-writer.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace classnote {

enum class engine_state {
    idle,
    listening,
    closing,   // a segment is being closed and recognition restarted
    stopped,
};

const char * engine_state_name(engine_state state);

struct engine_params {
    segmenter_params segmenter;
    std::string      audio_path = "recording.wav";
};

// Local transcription: captures audio to a WAV file while feeding an
// on-device recognizer, and cuts its hypotheses into closed segments.
//
// Threads:
//  - the audio source delivers buffers; they are only queued
//  - an audio worker writes the file and feeds the active recognition session
//  - a serial queue owns every segmentation state change
// Partial and segment callbacks run on the serial queue. on_state runs on
// the serial queue too, except for the transitions made inside start()
// (listening, or stopped on failure), which run on the caller's thread.
class TranscriptionEngine {
public:
    using partial_callback = std::function<void(const std::string & text, const std::string & delta)>;
    using segment_callback = std::function<void(const transcript_segment & segment, bool is_final)>;
    using state_callback   = std::function<void(engine_state state)>;

    TranscriptionEngine(Recognizer & recognizer, AudioSource & source, const engine_params & params);
    ~TranscriptionEngine();

    TranscriptionEngine(const TranscriptionEngine &) = delete;
    TranscriptionEngine & operator=(const TranscriptionEngine &) = delete;

    // set before start()
    void on_partial(partial_callback cb) { m_on_partial = std::move(cb); }
    void on_segment(segment_callback cb) { m_on_segment = std::move(cb); }
    void on_state  (state_callback   cb) { m_on_state   = std::move(cb); }

    // false if the recognizer, the audio file or the audio source cannot be started
    bool start();

    // closes the open segment as final and releases audio and recognizer
    void stop();

    // wait until the recording has ended on its own (finality or error)
    bool wait_stopped(int timeout_ms);

    // wait until queued audio and recognition events have been processed
    void sync();

    engine_state state() const;
    std::string  last_error() const;

    std::string partial_text() const;
    std::vector<transcript_segment> segments() const;

    const std::string & audio_path() const { return m_params.audio_path; }

private:
    struct audio_chunk {
        std::vector<float> samples;
        bool               end = false;
        std::string        error;
    };

    double elapsed() const;
    void   set_state(engine_state state);

    recognition_handler make_handler(uint64_t generation);

    // audio path
    void push_chunk(audio_chunk chunk);
    void audio_loop();

    // serial queue
    void handle_recognition(uint64_t generation, const recognition_event & event);
    void restart_recognition();
    void shutdown(const std::string & error);
    void release();

    Recognizer &  m_recognizer;
    AudioSource & m_source;
    engine_params m_params;

    partial_callback m_on_partial;
    segment_callback m_on_segment;
    state_callback   m_on_state;

    Segmenter    m_segmenter;
    engine_state m_state = engine_state::idle;
    std::string  m_last_error;

    mutable std::mutex      m_mutex;
    std::condition_variable m_cv_state;

    std::chrono::steady_clock::time_point m_t_start;

    // audio worker
    std::deque<audio_chunk> m_audio;
    bool                    m_audio_stop = false;
    bool                    m_audio_busy = false;
    std::mutex              m_audio_mutex;
    std::condition_variable m_audio_cv;
    std::condition_variable m_audio_cv_idle;
    std::thread             m_audio_thread;
    wav_writer              m_wav;

    // active recognition session
    std::mutex                          m_session_mutex;
    std::unique_ptr<RecognitionSession> m_session;
    std::atomic<uint64_t>               m_generation{0};

    serial_queue m_queue;
};

} // namespace classnote
