#include "classnote/segmenter.h"
#include "classnote/log.h"
#include "classnote/utf8.h"

#include <chrono>

namespace classnote {

static int64_t now_unix_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

const char * close_reason_name(close_reason reason) {
    switch (reason) {
        case close_reason::none:        return "none";
        case close_reason::final:       return "final";
        case close_reason::max_chars:   return "max_chars";
        case close_reason::max_seconds: return "max_seconds";
        case close_reason::stop:        return "stop";
    }
    return "none";
}

Segmenter::Segmenter(const segmenter_params & params) : m_params(params) {
    if (m_params.min_split_chars < 0) {
        m_params.min_split_chars = 0;
    }
}

void Segmenter::begin(double t) {
    m_state = segmenter_state();
    m_state.open    = true;
    m_state.t_start = t;

    CLASSNOTE_LOG_DEBUG("%s: max_chars = %d, min_split_chars = %d, max_seconds = %.1f\n",
            __func__, m_params.max_chars, m_params.min_split_chars, m_params.max_seconds);
}

segmenter_step Segmenter::feed(const std::string & hypothesis, bool is_final, double t) {
    segmenter_step step;

    if (!m_state.open) {
        CLASSNOTE_LOG_WARN("%s: no open segment, dropping hypothesis\n", __func__);
        return step;
    }

    // a hypothesis that did not grow (or shrank) delivers nothing
    const size_t n_hyp = utf8_length(hypothesis);
    if (n_hyp > m_state.n_delivered) {
        step.delta = utf8_substr(hypothesis, m_state.n_delivered);

        m_state.text        += step.delta;
        m_state.n_chars     += n_hyp - m_state.n_delivered;
        m_state.n_delivered  = n_hyp;
    }

    step.reason = check_close(is_final, t);
    if (step.reason == close_reason::none) {
        return step;
    }

    CLASSNOTE_LOG_DEBUG("%s: closing segment %d (%s, %zu chars)\n",
            __func__, m_state.index, close_reason_name(step.reason), m_state.n_chars);

    if (step.reason == close_reason::final) {
        step.ended = true;
        if (!m_state.text.empty()) {
            step.segment = close_segment(t);
            step.closed  = true;
        }
        m_state.open = false;
        return step;
    }

    step.segment = close_segment(t);
    step.closed  = true;
    step.restart = true;

    open_segment(t);

    return step;
}

bool Segmenter::finish(double t, transcript_segment & segment) {
    if (!m_state.open) {
        return false;
    }

    m_state.open = false;

    if (m_state.text.empty()) {
        return false;
    }

    segment = close_segment(t);

    return true;
}

std::string Segmenter::partial_text() const {
    return m_state.closed_text + m_state.text;
}

close_reason Segmenter::check_close(bool is_final, double t) const {
    if (is_final) {
        return close_reason::final;
    }

    if ((int64_t) m_state.n_chars < m_params.min_split_chars) {
        return close_reason::none;
    }

    if ((int64_t) m_state.n_chars >= m_params.max_chars) {
        return close_reason::max_chars;
    }

    if (t - m_state.t_start >= m_params.max_seconds) {
        return close_reason::max_seconds;
    }

    return close_reason::none;
}

transcript_segment Segmenter::close_segment(double t) {
    transcript_segment segment;
    segment.index      = m_state.index;
    segment.text       = m_state.text;
    segment.start_time = m_state.t_start;
    segment.end_time   = t < m_state.t_start ? m_state.t_start : t;
    segment.created_at = now_unix_ms();

    m_state.segments.push_back(segment);
    m_state.closed_text += m_state.text + "\n";

    m_state.text.clear();
    m_state.n_chars = 0;

    return segment;
}

void Segmenter::open_segment(double t) {
    m_state.open        = true;
    m_state.index      += 1;
    m_state.text.clear();
    m_state.n_chars     = 0;
    m_state.n_delivered = 0;
    m_state.t_start     = t;
}

} // namespace classnote
