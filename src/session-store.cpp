#include "classnote/session-store.h"
#include "classnote/log.h"
#include "classnote/transcript-json.h"
#include "classnote/url.h"

#include <filesystem>
#include <fstream>

using json = nlohmann::json;

namespace fs = std::filesystem;

namespace classnote {

template <typename T>
static std::vector<T> load_list(const std::string & path) {
    std::vector<T> result;

    std::ifstream fin(path);
    if (!fin) {
        return result;
    }

    try {
        result = json::parse(fin).get<std::vector<T>>();
    } catch (const json::exception & e) {
        CLASSNOTE_LOG_WARN("%s: ignoring corrupt cache '%s': %s\n", __func__, path.c_str(), e.what());
        result.clear();
    }

    return result;
}

SessionStore::SessionStore(const std::string & dir) : m_dir(dir.empty() ? "." : dir) {
}

std::string SessionStore::segments_path(const std::string & session_id) const {
    return (fs::path(m_dir) / ("segments_" + url_encode(session_id) + ".json")).string();
}

std::string SessionStore::chapters_path(const std::string & session_id) const {
    return (fs::path(m_dir) / ("chapters_" + url_encode(session_id) + ".json")).string();
}

bool SessionStore::save_segments(const std::string & session_id, const std::vector<transcript_segment> & segments) {
    return write_file(segments_path(session_id), json(segments).dump(2));
}

bool SessionStore::save_chapters(const std::string & session_id, const std::vector<chapter_marker> & chapters) {
    return write_file(chapters_path(session_id), json(chapters).dump(2));
}

std::vector<transcript_segment> SessionStore::load_segments(const std::string & session_id) const {
    return load_list<transcript_segment>(segments_path(session_id));
}

std::vector<chapter_marker> SessionStore::load_chapters(const std::string & session_id) const {
    return load_list<chapter_marker>(chapters_path(session_id));
}

bool SessionStore::write_file(const std::string & path, const std::string & data) {
    std::error_code ec;
    fs::create_directories(m_dir, ec);
    if (ec) {
        CLASSNOTE_LOG_ERROR("%s: failed to create '%s': %s\n", __func__, m_dir.c_str(), ec.message().c_str());
        return false;
    }

    // write to a temporary file, then rename over the old cache
    const std::string tmp = path + ".tmp";
    {
        std::ofstream fout(tmp, std::ios::binary | std::ios::trunc);
        if (!fout) {
            CLASSNOTE_LOG_ERROR("%s: failed to open '%s' for writing\n", __func__, tmp.c_str());
            return false;
        }
        fout << data;
        fout.flush();
        if (!fout) {
            CLASSNOTE_LOG_ERROR("%s: failed to write '%s'\n", __func__, tmp.c_str());
            return false;
        }
    }

    fs::rename(tmp, path, ec);
    if (ec) {
        CLASSNOTE_LOG_ERROR("%s: failed to rename '%s': %s\n", __func__, tmp.c_str(), ec.message().c_str());
        fs::remove(tmp, ec);
        return false;
    }

    return true;
}

} // namespace classnote
