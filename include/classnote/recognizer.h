#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace classnote {

enum class recognition_status {
    ok,
    cancelled,   // the session was ended on purpose; not an error
    unavailable, // the capability cannot be used (no model, not authorized, ...)
    failed,
};

const char * recognition_status_name(recognition_status status);

struct recognition_event {
    std::string        text;      // full hypothesis of the session so far
    bool               is_final = false;
    recognition_status status   = recognition_status::ok;
    std::string        message;   // error description when status != ok
};

using recognition_handler = std::function<void(const recognition_event &)>;

// One recognition session: audio in, growing hypotheses out.
// The handler may be called from any thread.
class RecognitionSession {
public:
    virtual ~RecognitionSession() = default;

    // must return quickly; called from the audio path
    virtual void append(const float * samples, size_t n_samples) = 0;

    // no more audio; the session reports a final hypothesis and ends
    virtual void finish() = 0;

    // end the session now; blocks until the handler will no longer be called
    virtual void cancel() = 0;
};

// On-device recognition capability. Only one session is active at a time.
class Recognizer {
public:
    virtual ~Recognizer() = default;

    // returns nullptr and sets error when the capability is unavailable
    virtual std::unique_ptr<RecognitionSession> start(const recognition_handler & handler, std::string & error) = 0;
};

} // namespace classnote
