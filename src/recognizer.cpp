#include "classnote/recognizer.h"

namespace classnote {

const char * recognition_status_name(recognition_status status) {
    switch (status) {
        case recognition_status::ok:          return "ok";
        case recognition_status::cancelled:   return "cancelled";
        case recognition_status::unavailable: return "unavailable";
        case recognition_status::failed:      return "failed";
    }
    return "failed";
}

} // namespace classnote
