#include "classnote/audio-source.h"
#include "classnote/log.h"

#include <algorithm>
#include <chrono>
#include <cstring>
#include <vector>

#if defined(_WIN32)
#include <fcntl.h>
#include <io.h>
#else
#include <cerrno>
#include <poll.h>
#include <unistd.h>
#endif

namespace classnote {

bool pcm_format_parse(const std::string & name, pcm_format & format) {
    if (name == "f32") {
        format = pcm_format::f32;
        return true;
    }
    if (name == "s16") {
        format = pcm_format::s16;
        return true;
    }
    return false;
}

PcmFileSource::PcmFileSource(const pcm_source_params & params) : m_params(params) {
    if (m_params.chunk_ms <= 0) {
        m_params.chunk_ms = 100;
    }
}

PcmFileSource::~PcmFileSource() {
    stop();
}

bool PcmFileSource::start(const audio_callbacks & callbacks, std::string & error) {
    if (m_running) {
        error = "audio source already running";
        return false;
    }

#if defined(_WIN32)
    _setmode(_fileno(stdin), _O_BINARY);
#endif

    if (m_params.input == "-") {
        m_in = stdin;
        m_owns_input = false;
    } else {
        m_in = fopen(m_params.input.c_str(), "rb");
        m_owns_input = true;
    }

    if (!m_in) {
        error = "failed to open input '" + m_params.input + "'";
        CLASSNOTE_LOG_ERROR("%s: %s\n", __func__, error.c_str());
        return false;
    }

    m_state = std::make_shared<reader_state>();
    m_state->callbacks = callbacks;

    m_running = true;
    m_thread  = std::thread(&PcmFileSource::reader_loop, m_state, m_params, m_in);

    return true;
}

void PcmFileSource::stop() {
    if (!m_running && !m_thread.joinable()) {
        return;
    }

    if (m_state) {
        m_state->stop = true;

        // no callback runs once this returns
        std::lock_guard<std::mutex> lock(m_state->mutex);
        m_state->callbacks = audio_callbacks();
    }

    if (m_thread.joinable()) {
#if defined(_WIN32)
        if (!m_owns_input) {
            // a read from stdin cannot be interrupted
            m_thread.detach();
        } else {
            m_thread.join();
        }
#else
        m_thread.join();
#endif
    }

    if (m_owns_input && m_in) {
        fclose(m_in);
    }
    m_in = nullptr;

    m_state.reset();
    m_running = false;
}

// > 0: bytes read, 0: end of input or stop requested, < 0: read error
static long read_input(FILE * in, uint8_t * buf, size_t size, const std::atomic_bool & stop) {
#if defined(_WIN32)
    const size_t n_read = fread(buf, 1, size, in);
    if (n_read == 0) {
        return ferror(in) ? -1 : 0;
    }
    return (long) n_read;
#else
    const int fd = fileno(in);

    while (!stop) {
        pollfd pfd = { fd, POLLIN, 0 };

        const int rc = poll(&pfd, 1, 100);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            return -1;
        }
        if (rc == 0) {
            continue;
        }

        const ssize_t n_read = read(fd, buf, size);
        if (n_read < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            return -1;
        }

        return (long) n_read;
    }

    return 0;
#endif
}

void PcmFileSource::reader_loop(std::shared_ptr<reader_state> state, pcm_source_params params, FILE * in) {
    const size_t bytes_per_sample = (params.format == pcm_format::f32) ? 4 : 2;
    const size_t n_chunk = std::max<size_t>(1, (size_t) params.sample_rate*params.chunk_ms/1000);

    std::vector<uint8_t> buffer(n_chunk*bytes_per_sample);
    std::vector<uint8_t> carry;
    std::vector<float>   samples;

    auto t_next = std::chrono::steady_clock::now();

    std::string error;

    while (!state->stop) {
        const long n_read = read_input(in, buffer.data(), buffer.size(), state->stop);

        if (n_read <= 0) {
            if (n_read < 0) {
                error = "read error on input '" + params.input + "'";
            }
            break;
        }

        std::vector<uint8_t> data;
        data.reserve(carry.size() + n_read);
        data.insert(data.end(), carry.begin(), carry.end());
        data.insert(data.end(), buffer.begin(), buffer.begin() + n_read);
        carry.clear();

        const size_t n_samples = data.size() / bytes_per_sample;
        const size_t rem       = data.size() % bytes_per_sample;

        if (rem > 0) {
            carry.insert(carry.end(), data.end() - rem, data.end());
        }

        if (n_samples == 0) {
            continue;
        }

        samples.resize(n_samples);

        if (params.format == pcm_format::f32) {
            for (size_t i = 0; i < n_samples; ++i) {
                float v = 0.0f;
                memcpy(&v, &data[i*4], sizeof(float));
                samples[i] = v;
            }
        } else {
            for (size_t i = 0; i < n_samples; ++i) {
                int16_t v = 0;
                memcpy(&v, &data[i*2], sizeof(int16_t));
                samples[i] = v / 32768.0f;
            }
        }

        {
            std::lock_guard<std::mutex> lock(state->mutex);
            if (state->stop) {
                break;
            }
            if (state->callbacks.on_samples) {
                state->callbacks.on_samples(samples.data(), samples.size());
            }
        }

        if (params.realtime) {
            t_next += std::chrono::microseconds((int64_t) n_samples*1000000/params.sample_rate);
            std::this_thread::sleep_until(t_next);
        }
    }

    std::lock_guard<std::mutex> lock(state->mutex);
    if (!state->stop && state->callbacks.on_end) {
        state->callbacks.on_end(error);
    }
}

} // namespace classnote
