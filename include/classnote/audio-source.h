#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace classnote {

struct audio_callbacks {
    // called on the source's own thread; must not block
    std::function<void(const float * samples, size_t n_samples)> on_samples;

    // end of input (error empty) or a capture failure
    std::function<void(const std::string & error)> on_end;
};

class AudioSource {
public:
    virtual ~AudioSource() = default;

    virtual bool start(const audio_callbacks & callbacks, std::string & error) = 0;
    virtual void stop() = 0;

    virtual int32_t sample_rate() const = 0;
};

enum class pcm_format {
    f32,
    s16,
};

bool pcm_format_parse(const std::string & name, pcm_format & format);

struct pcm_source_params {
    std::string input       = "-"; // "-" = stdin
    pcm_format  format      = pcm_format::s16;
    int32_t     sample_rate = 16000;
    int32_t     chunk_ms    = 100;
    bool        realtime    = false; // pace delivery at the stream's sample rate
};

// Raw little-endian PCM from a file, pipe or stdin, read on a background thread.
class PcmFileSource : public AudioSource {
public:
    explicit PcmFileSource(const pcm_source_params & params);
    ~PcmFileSource() override;

    bool start(const audio_callbacks & callbacks, std::string & error) override;
    void stop() override;

    int32_t sample_rate() const override { return m_params.sample_rate; }

private:
    // state shared with the reader thread; outlives the source if the thread is detached
    struct reader_state {
        std::mutex       mutex;
        audio_callbacks  callbacks;
        std::atomic_bool stop{false};
    };

    static void reader_loop(std::shared_ptr<reader_state> state, pcm_source_params params, FILE * in);

    pcm_source_params m_params;

    FILE * m_in = nullptr;
    bool   m_owns_input = false;

    std::atomic_bool m_running{false};

    std::shared_ptr<reader_state> m_state;

    std::thread m_thread;
};

} // namespace classnote
