#pragma once

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <string>

namespace classnote {

// 16-bit PCM WAV writer. The header is kept valid after every write so the
// file stays playable if the process dies mid-recording.
class wav_writer {
public:
    wav_writer() = default;
    ~wav_writer();

    wav_writer(const wav_writer &) = delete;
    wav_writer & operator=(const wav_writer &) = delete;

    bool open(const std::string & filename, uint32_t sample_rate, uint16_t bits_per_sample, uint16_t channels);
    bool write(const float * data, size_t length);
    bool close();

    bool is_open() const { return m_file.is_open(); }

    const std::string & filename() const { return m_filename; }
    uint32_t n_samples() const { return m_data_size / sizeof(int16_t); }

private:
    bool write_header(uint32_t sample_rate, uint16_t bits_per_sample, uint16_t channels);
    bool update_sizes();

    std::ofstream m_file;
    std::string   m_filename;
    uint32_t      m_data_size = 0;
};

} // namespace classnote
