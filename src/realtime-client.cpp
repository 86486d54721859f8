#include "classnote/realtime-client.h"
#include "classnote/log.h"
#include "classnote/url.h"

#include "net-common.h"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <boost/core/ignore_unused.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <algorithm>
#include <chrono>
#include <deque>
#include <utility>
#include <vector>

namespace classnote {

namespace websocket = beast::websocket;
using tcp = net::ip::tcp;

using plain_ws = websocket::stream<beast::tcp_stream>;
using tls_ws   = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;

class realtime_connection {
public:
    using message_callback = std::function<void(std::string payload)>;
    using closed_callback  = std::function<void(const std::string & error)>; // empty on a normal close

    virtual ~realtime_connection() = default;

    // blocking, runs ioc until done; fails after timeout
    virtual bool handshake(net::io_context & ioc, const url_parts & url, const tcp::resolver::results_type & endpoints,
            std::chrono::milliseconds timeout, std::string & error) = 0;

    // starts the receive loop; callbacks run on the io thread
    virtual void run(message_callback on_message, closed_callback on_closed) = 0;

    virtual void send(std::string payload, bool binary) = 0;

    // close after every queued frame has been written
    virtual void close() = 0;
};

static void tls_handshake(net::io_context &, plain_ws &, const std::string &, beast::error_code &) {
}

static void tls_handshake(net::io_context & ioc, tls_ws & ws, const std::string & host, beast::error_code & ec) {
    // SNI
    if (!SSL_set_tlsext_host_name(ws.next_layer().native_handle(), host.c_str())) {
        ec = beast::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category());
        return;
    }
    ws.next_layer().set_verify_callback(net::ssl::host_name_verification(host));

    run_blocking(ioc, ec, [&](auto handler) {
        ws.next_layer().async_handshake(net::ssl::stream_base::client, std::move(handler));
    });
}

template <typename Stream>
class connection : public realtime_connection, public std::enable_shared_from_this<connection<Stream>> {
public:
    template <typename... Args>
    explicit connection(Args &&... args) : m_ws(std::forward<Args>(args)...) {
    }

    bool handshake(net::io_context & ioc, const url_parts & url, const tcp::resolver::results_type & endpoints,
            std::chrono::milliseconds timeout, std::string & error) override {
        beast::error_code ec;

        // connect and TLS are bounded by the socket expiry
        beast::get_lowest_layer(m_ws).expires_after(timeout);

        run_blocking(ioc, ec, [&](auto handler) {
            beast::get_lowest_layer(m_ws).async_connect(endpoints, std::move(handler));
        });
        if (ec) {
            error = "connect: " + ec.message();
            return false;
        }

        tls_handshake(ioc, m_ws, url.host, ec);
        if (ec) {
            error = "tls handshake: " + ec.message();
            return false;
        }

        // the websocket layer keeps its own timers from here on
        beast::get_lowest_layer(m_ws).expires_never();

        websocket::stream_base::timeout opt = websocket::stream_base::timeout::suggested(beast::role_type::client);
        opt.handshake_timeout = timeout;

        m_ws.set_option(opt);
        m_ws.set_option(websocket::stream_base::decorator([](websocket::request_type & req) {
            req.set(beast::http::field::user_agent, "classnote");
        }));

        const std::string host = url_host_header(url);

        run_blocking(ioc, ec, [&](auto handler) {
            m_ws.async_handshake(host, url.target, std::move(handler));
        });
        if (ec) {
            error = "websocket handshake: " + ec.message();
            return false;
        }

        return true;
    }

    void run(message_callback on_message, closed_callback on_closed) override {
        m_on_message = std::move(on_message);
        m_on_closed  = std::move(on_closed);

        net::dispatch(m_ws.get_executor(),
                beast::bind_front_handler(&connection::do_read, this->shared_from_this()));
    }

    void send(std::string payload, bool binary) override {
        auto self = this->shared_from_this();
        net::post(m_ws.get_executor(), [self, payload = std::move(payload), binary]() mutable {
            if (self->m_done || self->m_close_requested) {
                return;
            }
            self->m_queue.emplace_back(std::move(payload), binary);
            if (self->m_queue.size() == 1) {
                self->do_write();
            }
        });
    }

    void close() override {
        auto self = this->shared_from_this();
        net::post(m_ws.get_executor(), [self]() {
            self->m_close_requested = true;
            if (self->m_queue.empty()) {
                self->do_close();
            }
        });
    }

private:
    void do_read() {
        m_ws.async_read(m_buffer,
                beast::bind_front_handler(&connection::on_read, this->shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t bytes_transferred) {
        boost::ignore_unused(bytes_transferred);

        if (ec) {
            finish(fail(ec, "read") ? ec.message() : "");
            return;
        }

        if (m_ws.got_text()) {
            m_on_message(beast::buffers_to_string(m_buffer.data()));
        } else {
            CLASSNOTE_LOG_DEBUG("%s: ignoring binary frame (%zu bytes)\n", __func__, m_buffer.size());
        }

        m_buffer.consume(m_buffer.size());

        do_read();
    }

    void do_write() {
        m_ws.binary(m_queue.front().second);
        m_ws.async_write(net::buffer(m_queue.front().first),
                beast::bind_front_handler(&connection::on_write, this->shared_from_this()));
    }

    void on_write(beast::error_code ec, std::size_t bytes_transferred) {
        boost::ignore_unused(bytes_transferred);

        if (ec) {
            fail(ec, "write");
            m_queue.clear();
            return;
        }

        m_queue.pop_front();

        if (!m_queue.empty()) {
            do_write();
        } else if (m_close_requested) {
            do_close();
        }
    }

    void do_close() {
        if (m_close_sent || m_done) {
            return;
        }
        m_close_sent = true;

        // the pending read completes with websocket::error::closed
        m_ws.async_close(websocket::close_code::normal, [self = this->shared_from_this()](beast::error_code ec) {
            if (ec) {
                fail(ec, "close", false);
            }
        });
    }

    void finish(const std::string & error) {
        if (m_done) {
            return;
        }
        m_done = true;
        m_queue.clear();
        m_on_closed(error);
    }

    Stream             m_ws;
    beast::flat_buffer m_buffer;

    std::deque<std::pair<std::string, bool>> m_queue; // payload, binary

    bool m_close_requested = false;
    bool m_close_sent      = false;
    bool m_done            = false;

    message_callback m_on_message;
    closed_callback  m_on_closed;
};

RealtimeClient::RealtimeClient(const realtime_client_params & params)
    : m_params(params), m_ssl_ctx(net::ssl::context::tls_client) {
    make_ssl_context(m_ssl_ctx);
    m_url = realtime_url(m_params.base_url, m_params.session_id, m_params.token);
}

RealtimeClient::~RealtimeClient() {
    disconnect();
    m_decode_queue.stop();
}

bool RealtimeClient::connect() {
    if (m_conn) {
        set_error("already connected");
        return false;
    }

    url_parts url;
    if (m_url.empty() || !parse_url(m_url, url)) {
        set_error("invalid backend url '" + m_params.base_url + "'");
        return false;
    }

    CLASSNOTE_LOG_INFO("%s: connecting to %s://%s:%s/ws/stream/%s\n", __func__,
            url.scheme.c_str(), url.host.c_str(), url.port.c_str(), m_params.session_id.c_str());

    beast::error_code ec;
    tcp::resolver resolver(m_ioc);
    const auto endpoints = resolver.resolve(url.host, url.port, ec);
    if (ec) {
        set_error("resolve '" + url.host + "': " + ec.message());
        return false;
    }

    std::shared_ptr<realtime_connection> conn;
    if (url.tls()) {
        conn = std::make_shared<connection<tls_ws>>(net::make_strand(m_ioc), m_ssl_ctx);
    } else {
        conn = std::make_shared<connection<plain_ws>>(net::make_strand(m_ioc));
    }

    std::string error;
    if (!conn->handshake(m_ioc, url, endpoints, std::chrono::milliseconds(m_params.timeout_ms), error)) {
        set_error(error);
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_conn   = conn;
        m_open   = true;
        m_closed = false;
    }

    m_ioc.restart();
    m_work.emplace(net::make_work_guard(m_ioc));
    m_io_thread = std::thread([this]() {
        try {
            m_ioc.run();
        } catch (const std::exception & e) {
            CLASSNOTE_LOG_ERROR("%s: exception in io thread: %s\n", "connect", e.what());
        }
    });

    conn->run(
        [this](std::string payload) {
            m_decode_queue.post([this, payload = std::move(payload)]() { handle_frame(payload); });
        },
        [this](const std::string & error) {
            m_decode_queue.post([this, error]() { handle_closed(error); });
        });

    conn->send(realtime_start_frame(m_params.config), false);

    CLASSNOTE_LOG_INFO("%s: connected, language = %s, sample rate = %d, diarization = %d, speakers = %d\n", __func__,
            m_params.config.language_code.c_str(), m_params.config.sample_rate_hertz,
            m_params.config.enable_speaker_diarization ? 1 : 0, m_params.config.speaker_count);

    return true;
}

void RealtimeClient::send_audio(const int16_t * samples, size_t n_samples) {
    if (!is_open() || n_samples == 0) {
        return;
    }
    m_conn->send(std::string((const char *) samples, n_samples*sizeof(int16_t)), true);
}

void RealtimeClient::send_audio(const float * samples, size_t n_samples) {
    std::vector<int16_t> pcm16(n_samples);
    for (size_t i = 0; i < n_samples; ++i) {
        const float v = std::max(-1.0f, std::min(1.0f, samples[i]));
        pcm16[i] = (int16_t) (v*32767.0f);
    }
    send_audio(pcm16.data(), pcm16.size());
}

void RealtimeClient::send_stop() {
    if (!is_open()) {
        return;
    }
    m_conn->send(realtime_stop_frame(), false);
}

void RealtimeClient::disconnect() {
    if (!m_io_thread.joinable()) {
        return;
    }

    m_conn->close();

    {
        std::unique_lock<std::mutex> lock(m_mutex);
        if (!m_cv_closed.wait_for(lock, std::chrono::milliseconds(m_params.close_timeout_ms), [&]{ return m_closed; })) {
            CLASSNOTE_LOG_WARN("%s: close handshake timed out\n", __func__);
        }
    }

    m_work.reset();
    m_ioc.stop();
    m_io_thread.join();

    m_decode_queue.drain();

    std::lock_guard<std::mutex> lock(m_mutex);
    m_open = false;
}

bool RealtimeClient::is_open() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_open && !m_closed;
}

std::string RealtimeClient::last_error() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_last_error;
}

void RealtimeClient::set_error(const std::string & error) {
    CLASSNOTE_LOG_ERROR("%s: %s\n", __func__, error.c_str());
    std::lock_guard<std::mutex> lock(m_mutex);
    m_last_error = error;
}

void RealtimeClient::handle_frame(const std::string & payload) {
    const realtime_message msg = realtime_decode(payload);

    switch (msg.kind) {
        case realtime_message_kind::transcript:
            {
                CLASSNOTE_LOG_DEBUG("%s: %s%s, %zu words\n", __func__,
                        msg.event.is_final ? "final" : "partial", msg.legacy ? " (legacy)" : "", msg.event.words.size());
                if (m_on_event) {
                    m_on_event(msg.event);
                }
            } break;
        case realtime_message_kind::server_error:
            {
                CLASSNOTE_LOG_ERROR("%s: server error: %s\n", __func__, msg.error.c_str());
            } break;
        case realtime_message_kind::ignored:
            {
                CLASSNOTE_LOG_DEBUG("%s: ignoring frame: %s\n", __func__, payload.c_str());
            } break;
        case realtime_message_kind::invalid:
            {
                CLASSNOTE_LOG_WARN("%s: dropping undecodable frame (%zu bytes)\n", __func__, payload.size());
            } break;
    }
}

void RealtimeClient::handle_closed(const std::string & error) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_closed = true;
        if (!error.empty()) {
            m_last_error = error;
        }
    }
    m_cv_closed.notify_all();

    if (error.empty()) {
        CLASSNOTE_LOG_INFO("%s: connection closed\n", __func__);
    } else {
        CLASSNOTE_LOG_ERROR("%s: connection lost: %s\n", __func__, error.c_str());
    }

    if (m_on_closed) {
        m_on_closed(error);
    }
}

} // namespace classnote
