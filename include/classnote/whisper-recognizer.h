#pragma once

#include "classnote/recognizer.h"

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

struct whisper_context;

namespace classnote {

struct whisper_recognizer_params {
    int32_t n_threads  = std::min(4, (int32_t) std::thread::hardware_concurrency());
    int32_t step_ms    = 3000;  // re-run inference after this much new audio
    int32_t length_ms  = 10000; // window length; older audio is committed
    int32_t max_tokens = 32;
    int32_t audio_ctx  = 0;
    int32_t beam_size  = -1;

    bool translate   = false;
    bool no_fallback = false;
    bool use_gpu     = true;
    bool flash_attn  = false;

    std::string language = "ja";
    std::string model    = "models/ggml-base.bin";
};

// On-device recognition on libwhisper. Each session keeps a sliding window
// of audio that is re-transcribed every step_ms; the hypothesis is the text
// of committed windows followed by the text of the current window.
// Input must be 16 kHz mono.
class WhisperRecognizer : public Recognizer {
public:
    // throws std::runtime_error if the model cannot be loaded
    explicit WhisperRecognizer(const whisper_recognizer_params & params);
    ~WhisperRecognizer() override;

    WhisperRecognizer(const WhisperRecognizer &) = delete;
    WhisperRecognizer & operator=(const WhisperRecognizer &) = delete;

    std::unique_ptr<RecognitionSession> start(const recognition_handler & handler, std::string & error) override;

    const whisper_recognizer_params & params() const { return m_params; }

private:
    friend class WhisperSession;

    // transcribes pcm into text; returns false on failure or abort
    bool transcribe(const std::vector<float> & pcm, const std::atomic<bool> * abort_flag, std::string & text);

    whisper_recognizer_params m_params;

    whisper_context * m_ctx = nullptr;
    std::mutex        m_ctx_mutex;
};

} // namespace classnote
