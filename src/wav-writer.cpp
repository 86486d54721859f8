#include "classnote/wav-writer.h"
#include "classnote/log.h"

#include <algorithm>
#include <vector>

namespace classnote {

wav_writer::~wav_writer() {
    close();
}

bool wav_writer::open(const std::string & filename, uint32_t sample_rate, uint16_t bits_per_sample, uint16_t channels) {
    close();

    m_file.open(filename, std::ios::binary | std::ios::trunc);
    if (!m_file.is_open()) {
        CLASSNOTE_LOG_ERROR("%s: failed to open '%s' for writing\n", __func__, filename.c_str());
        return false;
    }

    m_filename  = filename;
    m_data_size = 0;

    return write_header(sample_rate, bits_per_sample, channels);
}

bool wav_writer::write_header(uint32_t sample_rate, uint16_t bits_per_sample, uint16_t channels) {
    const uint32_t sub_chunk_size = 16;
    const uint16_t audio_format   = 1; // PCM
    const uint32_t byte_rate      = sample_rate * channels * bits_per_sample / 8;
    const uint16_t block_align    = channels * bits_per_sample / 8;

    m_file.write("RIFF", 4);
    m_file.write("\0\0\0\0", 4); // placeholder for file size
    m_file.write("WAVE", 4);
    m_file.write("fmt ", 4);

    m_file.write(reinterpret_cast<const char *>(&sub_chunk_size),  4);
    m_file.write(reinterpret_cast<const char *>(&audio_format),    2);
    m_file.write(reinterpret_cast<const char *>(&channels),        2);
    m_file.write(reinterpret_cast<const char *>(&sample_rate),     4);
    m_file.write(reinterpret_cast<const char *>(&byte_rate),       4);
    m_file.write(reinterpret_cast<const char *>(&block_align),     2);
    m_file.write(reinterpret_cast<const char *>(&bits_per_sample), 2);

    m_file.write("data", 4);
    m_file.write("\0\0\0\0", 4); // placeholder for data size

    return m_file.good();
}

bool wav_writer::write(const float * data, size_t length) {
    if (!m_file.is_open()) {
        return false;
    }

    std::vector<int16_t> pcm16(length);
    for (size_t i = 0; i < length; ++i) {
        const float v = std::min(1.0f, std::max(-1.0f, data[i]));
        pcm16[i] = int16_t(v*32767);
    }

    m_file.write(reinterpret_cast<const char *>(pcm16.data()), pcm16.size()*sizeof(int16_t));
    m_data_size += pcm16.size()*sizeof(int16_t);

    return update_sizes();
}

bool wav_writer::update_sizes() {
    const uint32_t file_size = 36 + m_data_size;

    m_file.seekp(4, std::ios::beg);
    m_file.write(reinterpret_cast<const char *>(&file_size), 4);
    m_file.seekp(40, std::ios::beg);
    m_file.write(reinterpret_cast<const char *>(&m_data_size), 4);
    m_file.seekp(0, std::ios::end);

    return m_file.good();
}

bool wav_writer::close() {
    if (!m_file.is_open()) {
        return true;
    }
    m_file.flush();
    const bool ok = m_file.good();
    m_file.close();
    return ok;
}

} // namespace classnote
