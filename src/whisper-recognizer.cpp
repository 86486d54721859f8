#include "classnote/whisper-recognizer.h"
#include "classnote/log.h"
#include "classnote/utf8.h"

#include "whisper.h"

#include <atomic>
#include <condition_variable>
#include <stdexcept>
#include <vector>

namespace classnote {

class WhisperSession : public RecognitionSession {
public:
    WhisperSession(WhisperRecognizer & owner, const recognition_handler & handler)
        : m_owner(owner), m_handler(handler) {
        const auto & params = owner.params();
        m_n_samples_step = std::max(1, (int) (1e-3*params.step_ms*WHISPER_SAMPLE_RATE));
        m_n_samples_len  = std::max(m_n_samples_step, (int) (1e-3*params.length_ms*WHISPER_SAMPLE_RATE));

        m_thread = std::thread(&WhisperSession::worker_loop, this);
    }

    ~WhisperSession() override {
        cancel();
    }

    void append(const float * samples, size_t n_samples) override {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_finishing || m_cancelled) {
                return;
            }
            m_pcm_new.insert(m_pcm_new.end(), samples, samples + n_samples);
        }
        m_cv.notify_one();
    }

    void finish() override {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_finishing = true;
        }
        m_cv.notify_one();
    }

    void cancel() override {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_cancelled = true;
            m_abort     = true;
        }
        m_cv.notify_one();

        if (m_thread.joinable()) {
            m_thread.join();
        }
    }

private:
    void emit(const std::string & text, bool is_final, recognition_status status, const std::string & message) {
        recognition_event event;
        event.text     = text;
        event.is_final = is_final;
        event.status   = status;
        event.message  = message;
        m_handler(event);
    }

    void worker_loop() {
        std::string committed;
        std::string last;
        std::vector<float> window;

        while (true) {
            bool finishing = false;
            {
                std::unique_lock<std::mutex> lock(m_mutex);
                m_cv.wait(lock, [&]{
                    return m_cancelled || m_finishing || (int) m_pcm_new.size() >= m_n_samples_step;
                });
                if (m_cancelled) {
                    break;
                }
                finishing = m_finishing;

                window.insert(window.end(), m_pcm_new.begin(), m_pcm_new.end());
                m_pcm_new.clear();
            }

            std::string text;
            if (!window.empty() && !m_owner.transcribe(window, &m_abort, text)) {
                if (m_abort) {
                    emit(last, false, recognition_status::cancelled, "");
                } else {
                    emit(last, false, recognition_status::failed, "failed to process audio");
                }
                break;
            }

            const std::string hypothesis = trim(committed + text);

            if (finishing) {
                emit(hypothesis, true, recognition_status::ok, "");
                break;
            }

            if (hypothesis != last) {
                emit(hypothesis, false, recognition_status::ok, "");
                last = hypothesis;
            }

            if ((int) window.size() >= m_n_samples_len) {
                committed += text;
                window.clear();
            }
        }
    }

    WhisperRecognizer & m_owner;
    recognition_handler m_handler;

    int m_n_samples_step = 0;
    int m_n_samples_len  = 0;

    std::vector<float> m_pcm_new;

    bool m_finishing = false;
    bool m_cancelled = false;
    std::atomic<bool> m_abort{false}; // read by the whisper abort callback

    std::mutex              m_mutex;
    std::condition_variable m_cv;
    std::thread             m_thread;
};

WhisperRecognizer::WhisperRecognizer(const whisper_recognizer_params & params) : m_params(params) {
    if (m_params.language != "auto" && whisper_lang_id(m_params.language.c_str()) == -1) {
        CLASSNOTE_LOG_ERROR("%s: unknown language '%s'\n", __func__, m_params.language.c_str());
        throw std::runtime_error("unknown language");
    }

    struct whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu    = m_params.use_gpu;
    cparams.flash_attn = m_params.flash_attn;

    m_ctx = whisper_init_from_file_with_params(m_params.model.c_str(), cparams);
    if (m_ctx == nullptr) {
        CLASSNOTE_LOG_ERROR("%s: failed to initialize whisper context from '%s'\n", __func__, m_params.model.c_str());
        throw std::runtime_error("failed to initialize whisper context");
    }

    if (!whisper_is_multilingual(m_ctx)) {
        if (m_params.language != "en" || m_params.translate) {
            m_params.language  = "en";
            m_params.translate = false;
            CLASSNOTE_LOG_WARN("%s: model is not multilingual, ignoring language and translation options\n", __func__);
        }
    }

    CLASSNOTE_LOG_INFO("%s: step = %.1f sec, len = %.1f sec, %d threads, lang = %s\n", __func__,
            1e-3*m_params.step_ms, 1e-3*m_params.length_ms, m_params.n_threads, m_params.language.c_str());
}

WhisperRecognizer::~WhisperRecognizer() {
    if (m_ctx) {
        whisper_free(m_ctx);
        m_ctx = nullptr;
    }
}

std::unique_ptr<RecognitionSession> WhisperRecognizer::start(const recognition_handler & handler, std::string & error) {
    if (!m_ctx) {
        error = "whisper context is not initialized";
        return nullptr;
    }
    return std::unique_ptr<RecognitionSession>(new WhisperSession(*this, handler));
}

bool WhisperRecognizer::transcribe(const std::vector<float> & pcm, const std::atomic<bool> * abort_flag, std::string & text) {
    std::lock_guard<std::mutex> lock(m_ctx_mutex);

    whisper_full_params wparams = whisper_full_default_params(
            m_params.beam_size > 1 ? WHISPER_SAMPLING_BEAM_SEARCH : WHISPER_SAMPLING_GREEDY);

    wparams.print_progress   = false;
    wparams.print_special    = false;
    wparams.print_realtime   = false;
    wparams.print_timestamps = false;
    wparams.translate        = m_params.translate;
    wparams.single_segment   = true;
    wparams.no_context       = true;
    wparams.max_tokens       = m_params.max_tokens;
    wparams.language         = m_params.language.c_str();
    wparams.n_threads        = m_params.n_threads;
    wparams.audio_ctx        = m_params.audio_ctx;

    wparams.beam_search.beam_size = m_params.beam_size;
    wparams.temperature_inc       = m_params.no_fallback ? 0.0f : wparams.temperature_inc;

    wparams.abort_callback = [](void * user_data) {
        return ((const std::atomic<bool> *) user_data)->load();
    };
    wparams.abort_callback_user_data = (void *) abort_flag;

    if (whisper_full(m_ctx, wparams, pcm.data(), pcm.size()) != 0) {
        if (!*abort_flag) {
            CLASSNOTE_LOG_ERROR("%s: failed to process audio\n", __func__);
        }
        return false;
    }

    if (*abort_flag) {
        return false;
    }

    text.clear();
    const int n_segments = whisper_full_n_segments(m_ctx);
    for (int i = 0; i < n_segments; ++i) {
        text += whisper_full_get_segment_text(m_ctx, i);
    }

    return true;
}

} // namespace classnote
