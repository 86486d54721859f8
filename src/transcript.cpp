#include "classnote/transcript.h"

namespace classnote {

std::string speaker_label(speaker_id id) {
    return "Speaker " + std::to_string(id.value() + 1);
}

const char * session_mode_name(session_mode mode) {
    switch (mode) {
        case session_mode::lecture: return "lecture";
        case session_mode::meeting: return "meeting";
    }
    return "lecture";
}

bool session_mode_parse(const std::string & name, session_mode & mode) {
    if (name == "lecture") {
        mode = session_mode::lecture;
        return true;
    }
    if (name == "meeting") {
        mode = session_mode::meeting;
        return true;
    }
    return false;
}

} // namespace classnote
