#include "classnote/diarization.h"
#include "classnote/log.h"
#include "classnote/transcript-json.h"
#include "classnote/utf8.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>

using json = nlohmann::json;

namespace classnote {

void align_speakers(std::vector<transcript_segment> & segments, const std::vector<diarization_interval> & intervals) {
    std::optional<speaker_id> last;

    for (auto & segment : segments) {
        const double mid = 0.5*(segment.start_time + segment.end_time);

        for (const auto & interval : intervals) {
            if (mid >= interval.start && mid < interval.end) {
                last = interval.speaker;
                break;
            }
        }

        if (last) {
            segment.speaker       = *last;
            segment.speaker_label = speaker_label(*last);
        }
    }
}

std::vector<diarization_interval> merge_intervals(const std::vector<diarization_interval> & intervals, double max_gap) {
    std::vector<diarization_interval> merged;

    for (const auto & interval : intervals) {
        if (!merged.empty() && merged.back().speaker == interval.speaker && interval.start - merged.back().end < max_gap) {
            merged.back().end = std::max(merged.back().end, interval.end);
        } else {
            merged.push_back(interval);
        }
    }

    return merged;
}

std::vector<speaker_block> align_words(
        const std::vector<realtime_word> & words,
        const std::vector<diarization_interval> & intervals,
        double max_gap) {
    std::vector<speaker_block> blocks;

    size_t i_word = 0;

    for (const auto & interval : intervals) {
        std::string text;

        while (i_word < words.size()) {
            const auto & word = words[i_word];
            const double mid = 0.5*(word.start + word.end);
            if (mid < interval.start) {
                ++i_word;
                continue;
            }
            if (mid > interval.end) {
                break;
            }

            const std::string cleaned = trim(word.text);
            if (!cleaned.empty()) {
                if (!text.empty()) {
                    text += " ";
                }
                text += cleaned;
            }
            ++i_word;
        }

        if (text.empty()) {
            continue;
        }

        if (!blocks.empty() && blocks.back().speaker == interval.speaker && interval.start - blocks.back().end < max_gap) {
            blocks.back().text += " " + text;
            blocks.back().end   = interval.end;
        } else {
            speaker_block block;
            block.speaker = interval.speaker;
            block.text    = text;
            block.start   = interval.start;
            block.end     = interval.end;
            blocks.push_back(std::move(block));
        }
    }

    return blocks;
}

bool JsonDiarizer::diarize(const std::string & audio_path, std::vector<diarization_interval> & intervals, std::string & error) {
    std::ifstream fin(m_path);
    if (!fin) {
        error = "failed to open '" + m_path + "'";
        return false;
    }

    try {
        json j = json::parse(fin);
        if (j.is_object() && j.contains("segments")) {
            j = j["segments"];
        }
        intervals = j.get<std::vector<diarization_interval>>();
    } catch (const json::exception & e) {
        error = "failed to parse '" + m_path + "': " + e.what();
        return false;
    }

    std::stable_sort(intervals.begin(), intervals.end(), [](const diarization_interval & a, const diarization_interval & b) {
        return a.start < b.start;
    });

    CLASSNOTE_LOG_INFO("%s: %zu speaker intervals for '%s'\n", __func__, intervals.size(), audio_path.c_str());

    return true;
}

} // namespace classnote
