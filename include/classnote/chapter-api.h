#pragma once

#include "classnote/transcript.h"

#include <cstdint>
#include <string>
#include <vector>

namespace classnote {

// Backend chapter generation collaborator.
class ChapterSource {
public:
    virtual ~ChapterSource() = default;

    // empty on any failure
    virtual std::vector<chapter_marker> generate(const std::string & session_id) = 0;
};

struct chapter_api_params {
    std::string base_url;  // e.g. https://api.example.com
    std::string token;     // bearer token

    int32_t timeout_ms = 15000; // whole request, connect to last byte
};

// POST <base_url>/sessions/<id>/chapters/generate over HTTP(S)
class ChapterApi : public ChapterSource {
public:
    explicit ChapterApi(const chapter_api_params & params);

    std::vector<chapter_marker> generate(const std::string & session_id) override;

    std::string last_error() const { return m_last_error; }

private:
    bool post(const std::string & url, const std::string & body, std::string & response);

    chapter_api_params m_params;
    std::string        m_last_error;
};

// {"chapters": [{"id"?, "time_seconds", "title"}]}; false if the body does
// not match. Chapters without an id get "ch-<position>".
bool parse_chapters_response(const std::string & body, std::vector<chapter_marker> & chapters);

} // namespace classnote
