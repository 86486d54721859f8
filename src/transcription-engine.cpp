#include "classnote/transcription-engine.h"
#include "classnote/log.h"

namespace classnote {

const char * engine_state_name(engine_state state) {
    switch (state) {
        case engine_state::idle:      return "idle";
        case engine_state::listening: return "listening";
        case engine_state::closing:   return "closing";
        case engine_state::stopped:   return "stopped";
    }
    return "idle";
}

TranscriptionEngine::TranscriptionEngine(Recognizer & recognizer, AudioSource & source, const engine_params & params)
    : m_recognizer(recognizer), m_source(source), m_params(params), m_segmenter(params.segmenter) {
}

TranscriptionEngine::~TranscriptionEngine() {
    stop();
    m_queue.stop();
    if (m_audio_thread.joinable()) {
        {
            std::lock_guard<std::mutex> lock(m_audio_mutex);
            m_audio_stop = true;
        }
        m_audio_cv.notify_all();
        m_audio_thread.join();
    }
}

bool TranscriptionEngine::start() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state != engine_state::idle) {
            CLASSNOTE_LOG_ERROR("%s: engine already started (state = %s)\n", __func__, engine_state_name(m_state));
            return false;
        }
        m_segmenter = Segmenter(m_params.segmenter);
        m_segmenter.begin(0.0);
        m_last_error.clear();
        m_t_start = std::chrono::steady_clock::now();
    }

    auto fail = [this](const std::string & error) {
        CLASSNOTE_LOG_ERROR("%s: %s\n", "start", error.c_str());
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_last_error = error;
        }
        set_state(engine_state::stopped);
        release();
        return false;
    };

    if (!m_wav.open(m_params.audio_path, (uint32_t) m_source.sample_rate(), 16, 1)) {
        return fail("failed to open audio file '" + m_params.audio_path + "'");
    }

    set_state(engine_state::listening);

    {
        std::lock_guard<std::mutex> lock(m_session_mutex);
        std::string error;
        const uint64_t generation = ++m_generation;
        m_session = m_recognizer.start(make_handler(generation), error);
        if (!m_session) {
            return fail(error.empty() ? "recognizer is not available" : error);
        }
    }

    {
        std::lock_guard<std::mutex> lock(m_audio_mutex);
        m_audio.clear();
        m_audio_stop = false;
    }
    m_audio_thread = std::thread(&TranscriptionEngine::audio_loop, this);

    audio_callbacks callbacks;
    callbacks.on_samples = [this](const float * samples, size_t n_samples) {
        audio_chunk chunk;
        chunk.samples.assign(samples, samples + n_samples);
        push_chunk(std::move(chunk));
    };
    callbacks.on_end = [this](const std::string & error) {
        audio_chunk chunk;
        chunk.end   = true;
        chunk.error = error;
        push_chunk(std::move(chunk));
    };

    std::string error;
    if (!m_source.start(callbacks, error)) {
        return fail(error.empty() ? "failed to start audio capture" : error);
    }

    CLASSNOTE_LOG_INFO("%s: listening, writing audio to '%s'\n", __func__, m_params.audio_path.c_str());

    return true;
}

void TranscriptionEngine::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state == engine_state::idle || m_state == engine_state::stopped) {
            return;
        }
    }

    if (m_queue.is_current()) {
        shutdown("");
        return;
    }

    if (!m_queue.post([this]() { shutdown(""); })) {
        return;
    }

    std::unique_lock<std::mutex> lock(m_mutex);
    m_cv_state.wait(lock, [&]{ return m_state == engine_state::stopped; });
}

bool TranscriptionEngine::wait_stopped(int timeout_ms) {
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_cv_state.wait_for(lock, std::chrono::milliseconds(timeout_ms), [&]{ return m_state == engine_state::stopped; });
}

void TranscriptionEngine::sync() {
    {
        std::unique_lock<std::mutex> lock(m_audio_mutex);
        m_audio_cv_idle.wait(lock, [&]{ return m_audio.empty() && !m_audio_busy; });
    }
    m_queue.drain();
}

engine_state TranscriptionEngine::state() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

std::string TranscriptionEngine::last_error() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_last_error;
}

std::string TranscriptionEngine::partial_text() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_segmenter.partial_text();
}

std::vector<transcript_segment> TranscriptionEngine::segments() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_segmenter.state().segments;
}

double TranscriptionEngine::elapsed() const {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - m_t_start).count();
}

void TranscriptionEngine::set_state(engine_state state) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state == state) {
            return;
        }
        m_state = state;
    }

    CLASSNOTE_LOG_DEBUG("%s: %s\n", __func__, engine_state_name(state));

    if (m_on_state) {
        m_on_state(state);
    }

    m_cv_state.notify_all();
}

recognition_handler TranscriptionEngine::make_handler(uint64_t generation) {
    return [this, generation](const recognition_event & event) {
        m_queue.post([this, generation, event]() {
            handle_recognition(generation, event);
        });
    };
}

//
// audio path
//

void TranscriptionEngine::push_chunk(audio_chunk chunk) {
    {
        std::lock_guard<std::mutex> lock(m_audio_mutex);
        m_audio.push_back(std::move(chunk));
    }
    m_audio_cv.notify_one();
}

void TranscriptionEngine::audio_loop() {
    bool write_failed = false;

    while (true) {
        audio_chunk chunk;
        {
            std::unique_lock<std::mutex> lock(m_audio_mutex);
            m_audio_cv.wait(lock, [&]{ return m_audio_stop || !m_audio.empty(); });
            if (m_audio.empty()) {
                break;
            }
            chunk = std::move(m_audio.front());
            m_audio.pop_front();
            m_audio_busy = true;
        }

        if (chunk.end) {
            if (!chunk.error.empty()) {
                const std::string error = "audio capture failed: " + chunk.error;
                m_queue.post([this, error]() { shutdown(error); });
            } else {
                CLASSNOTE_LOG_INFO("%s: end of audio input\n", __func__);
                std::lock_guard<std::mutex> lock(m_session_mutex);
                if (m_session) {
                    m_session->finish();
                }
            }
        } else {
            if (!write_failed && !m_wav.write(chunk.samples.data(), chunk.samples.size())) {
                write_failed = true;
                const std::string error = "failed to write audio file '" + m_params.audio_path + "'";
                m_queue.post([this, error]() { shutdown(error); });
            }

            std::lock_guard<std::mutex> lock(m_session_mutex);
            if (m_session) {
                m_session->append(chunk.samples.data(), chunk.samples.size());
            }
        }

        {
            std::lock_guard<std::mutex> lock(m_audio_mutex);
            m_audio_busy = false;
            if (m_audio.empty()) {
                m_audio_cv_idle.notify_all();
            }
        }
    }

    std::lock_guard<std::mutex> lock(m_audio_mutex);
    m_audio_busy = false;
    m_audio_cv_idle.notify_all();
}

//
// serial queue
//

void TranscriptionEngine::handle_recognition(uint64_t generation, const recognition_event & event) {
    if (generation != m_generation.load()) {
        // from a session that has already been replaced
        return;
    }

    if (state() != engine_state::listening) {
        return;
    }

    if (event.status == recognition_status::cancelled) {
        CLASSNOTE_LOG_DEBUG("%s: recognition session cancelled\n", __func__);
        return;
    }

    if (event.status != recognition_status::ok) {
        shutdown(std::string("recognition ") + recognition_status_name(event.status) +
                 (event.message.empty() ? "" : ": " + event.message));
        return;
    }

    segmenter_step step;
    std::string partial;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        step    = m_segmenter.feed(event.text, event.is_final, elapsed());
        partial = m_segmenter.partial_text();
    }

    if (!step.delta.empty() && m_on_partial) {
        m_on_partial(partial, step.delta);
    }

    if (step.closed) {
        CLASSNOTE_LOG_INFO("%s: segment %d closed (%s, %.1f - %.1f s)\n", __func__,
                step.segment.index, close_reason_name(step.reason), step.segment.start_time, step.segment.end_time);
        if (m_on_segment) {
            m_on_segment(step.segment, step.ended);
        }
    }

    if (step.restart) {
        set_state(engine_state::closing);
        restart_recognition();
        if (state() == engine_state::closing) {
            set_state(engine_state::listening);
        }
    }

    if (step.ended) {
        shutdown("");
    }
}

void TranscriptionEngine::restart_recognition() {
    std::string error;
    {
        std::lock_guard<std::mutex> lock(m_session_mutex);

        const uint64_t generation = ++m_generation;

        if (m_session) {
            m_session->cancel();
            m_session.reset();
        }

        m_session = m_recognizer.start(make_handler(generation), error);
        if (m_session) {
            CLASSNOTE_LOG_DEBUG("%s: recognition session %llu started\n", __func__, (unsigned long long) generation);
            return;
        }
    }

    shutdown("failed to restart recognition" + (error.empty() ? std::string() : ": " + error));
}

void TranscriptionEngine::shutdown(const std::string & error) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state == engine_state::stopped || m_state == engine_state::idle) {
            return;
        }
        if (!error.empty()) {
            m_last_error = error;
        }
    }

    if (!error.empty()) {
        CLASSNOTE_LOG_ERROR("%s: %s\n", __func__, error.c_str());
    }

    // 1. the open segment becomes the final one
    transcript_segment segment;
    bool closed = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        closed = m_segmenter.finish(elapsed(), segment);
    }
    if (closed) {
        CLASSNOTE_LOG_INFO("%s: segment %d closed (stop, %.1f - %.1f s)\n", __func__,
                segment.index, segment.start_time, segment.end_time);
        if (m_on_segment) {
            m_on_segment(segment, true);
        }
    }

    // 2. - 4.
    release();

    set_state(engine_state::stopped);

    CLASSNOTE_LOG_INFO("%s: stopped, %zu segments\n", __func__, segments().size());
}

void TranscriptionEngine::release() {
    // stop audio capture
    m_source.stop();

    // close the audio file once everything captured so far is written
    if (m_audio_thread.joinable()) {
        {
            std::lock_guard<std::mutex> lock(m_audio_mutex);
            m_audio_stop = true;
        }
        m_audio_cv.notify_all();
        m_audio_thread.join();
    }
    if (!m_wav.close()) {
        CLASSNOTE_LOG_WARN("%s: failed to flush audio file '%s'\n", __func__, m_params.audio_path.c_str());
    }

    // cancel the in-flight recognition session
    std::lock_guard<std::mutex> lock(m_session_mutex);
    ++m_generation;
    if (m_session) {
        m_session->cancel();
        m_session.reset();
    }
}

} // namespace classnote
