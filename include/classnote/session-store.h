#pragma once

#include "classnote/transcript.h"

#include <string>
#include <vector>

namespace classnote {

// Per-session JSON cache of segments and chapters:
//   <dir>/segments_<session id>.json
//   <dir>/chapters_<session id>.json
// The session id is percent-encoded in the file name, so it never leaves <dir>.
// A missing or unreadable file reads as an empty list.
class SessionStore {
public:
    explicit SessionStore(const std::string & dir);

    bool save_segments(const std::string & session_id, const std::vector<transcript_segment> & segments);
    bool save_chapters(const std::string & session_id, const std::vector<chapter_marker> & chapters);

    std::vector<transcript_segment> load_segments(const std::string & session_id) const;
    std::vector<chapter_marker>     load_chapters(const std::string & session_id) const;

    std::string segments_path(const std::string & session_id) const;
    std::string chapters_path(const std::string & session_id) const;

private:
    bool write_file(const std::string & path, const std::string & data);

    std::string m_dir;
};

} // namespace classnote
