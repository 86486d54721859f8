#pragma once

#include "classnote/realtime-protocol.h"
#include "classnote/serial-queue.h"
#include "classnote/transcript.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/executor_work_guard.hpp>

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace classnote {

struct realtime_client_params {
    std::string base_url;   // backend base URL, e.g. https://api.example.com
    std::string session_id;
    std::string token;      // bearer token, sent as the "token" query parameter

    realtime_config config;

    int32_t timeout_ms       = 10000; // connect and handshakes
    int32_t close_timeout_ms = 3000;
};

class realtime_connection;

// Cloud streaming transcription over a WebSocket (ws:// or wss://).
//
// Audio goes out as raw binary frames; results come back as JSON text
// frames that are decoded off the network thread and delivered, in
// receive order, to the on_event subscriber. A receive failure ends the
// connection for good: construct a new client to reconnect.
class RealtimeClient {
public:
    using event_callback  = std::function<void(const realtime_event & event)>;
    using closed_callback = std::function<void(const std::string & error)>;

    explicit RealtimeClient(const realtime_client_params & params);
    ~RealtimeClient();

    RealtimeClient(const RealtimeClient &) = delete;
    RealtimeClient & operator=(const RealtimeClient &) = delete;

    // set before connect(); called on the decode queue
    void on_event (event_callback  cb) { m_on_event  = std::move(cb); }
    void on_closed(closed_callback cb) { m_on_closed = std::move(cb); }

    // blocking up to timeout_ms: resolve, connect, handshake, then send the start frame
    bool connect();

    // s16le PCM, sent as-is in one binary frame
    void send_audio(const int16_t * samples, size_t n_samples);
    void send_audio(const float * samples, size_t n_samples);

    void send_stop();

    // close once queued frames are written; blocks up to close_timeout_ms
    void disconnect();

    bool is_open() const;

    std::string last_error() const;

    const std::string & url() const { return m_url; }

private:
    void handle_frame(const std::string & payload);
    void handle_closed(const std::string & error);
    void set_error(const std::string & error);

    realtime_client_params m_params;
    std::string            m_url;

    event_callback  m_on_event;
    closed_callback m_on_closed;

    boost::asio::io_context  m_ioc;
    boost::asio::ssl::context m_ssl_ctx;

    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> m_work;
    std::thread m_io_thread;

    std::shared_ptr<realtime_connection> m_conn;

    bool        m_open   = false;
    bool        m_closed = false;
    std::string m_last_error;

    mutable std::mutex      m_mutex;
    std::condition_variable m_cv_closed;

    serial_queue m_decode_queue;
};

} // namespace classnote
