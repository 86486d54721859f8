#include "classnote/chapter-api.h"
#include "classnote/log.h"
#include "classnote/transcript-json.h"
#include "classnote/url.h"

#include "net-common.h"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <chrono>

using json = nlohmann::json;

namespace classnote {

namespace http = beast::http;
using tcp = net::ip::tcp;

bool parse_chapters_response(const std::string & body, std::vector<chapter_marker> & chapters) {
    chapters.clear();

    try {
        const json j = json::parse(body);
        if (!j.is_object() || !j.contains("chapters") || !j["chapters"].is_array()) {
            return false;
        }

        chapters = j["chapters"].get<std::vector<chapter_marker>>();
    } catch (const json::exception & e) {
        CLASSNOTE_LOG_WARN("%s: invalid chapters response: %s\n", __func__, e.what());
        chapters.clear();
        return false;
    }

    for (size_t i = 0; i < chapters.size(); ++i) {
        if (chapters[i].id.empty()) {
            chapters[i].id = "ch-" + std::to_string(i);
        }
    }

    return true;
}

template <typename Stream>
static void http_exchange(net::io_context & ioc, Stream & stream, const http::request<http::string_body> & req, http::response<http::string_body> & res, beast::error_code & ec) {
    run_blocking(ioc, ec, [&](auto handler) {
        http::async_write(stream, req, std::move(handler));
    });
    if (ec) {
        return;
    }

    beast::flat_buffer buffer;
    run_blocking(ioc, ec, [&](auto handler) {
        http::async_read(stream, buffer, res, std::move(handler));
    });
}

ChapterApi::ChapterApi(const chapter_api_params & params) : m_params(params) {
}

std::vector<chapter_marker> ChapterApi::generate(const std::string & session_id) {
    std::vector<chapter_marker> chapters;

    const std::string url = url_join(m_params.base_url, "sessions/" + url_encode(session_id) + "/chapters/generate");

    std::string response;
    if (!post(url, "{}", response)) {
        CLASSNOTE_LOG_WARN("%s: chapter generation failed: %s\n", __func__, m_last_error.c_str());
        return chapters;
    }

    if (!parse_chapters_response(response, chapters)) {
        m_last_error = "unexpected chapters response";
        CLASSNOTE_LOG_WARN("%s: %s\n", __func__, m_last_error.c_str());
        return chapters;
    }

    CLASSNOTE_LOG_INFO("%s: received %zu chapters\n", __func__, chapters.size());

    return chapters;
}

bool ChapterApi::post(const std::string & url, const std::string & body, std::string & response) {
    url_parts parts;
    if (!parse_url(url, parts)) {
        m_last_error = "invalid url '" + url + "'";
        return false;
    }

    http::request<http::string_body> req{http::verb::post, parts.target, 11};
    req.set(http::field::host, url_host_header(parts));
    req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    req.set(http::field::content_type, "application/json");
    req.set(http::field::accept, "application/json");
    if (!m_params.token.empty()) {
        req.set(http::field::authorization, "Bearer " + m_params.token);
    }
    req.body() = body;
    req.prepare_payload();

    net::io_context ioc;
    beast::error_code ec;

    tcp::resolver resolver(ioc);
    const auto endpoints = resolver.resolve(parts.host, parts.port, ec);
    if (ec) {
        m_last_error = "resolve '" + parts.host + "': " + ec.message();
        return false;
    }

    // one deadline for connect, handshake, request and response
    const auto timeout = std::chrono::milliseconds(m_params.timeout_ms);

    http::response<http::string_body> res;

    if (parts.tls()) {
        net::ssl::context ctx(net::ssl::context::tls_client);
        make_ssl_context(ctx);

        beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);
        if (!SSL_set_tlsext_host_name(stream.native_handle(), parts.host.c_str())) {
            ec = beast::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category());
            m_last_error = "tls: " + ec.message();
            return false;
        }
        stream.set_verify_callback(net::ssl::host_name_verification(parts.host));

        beast::get_lowest_layer(stream).expires_after(timeout);

        run_blocking(ioc, ec, [&](auto handler) {
            beast::get_lowest_layer(stream).async_connect(endpoints, std::move(handler));
        });
        if (!ec) {
            run_blocking(ioc, ec, [&](auto handler) {
                stream.async_handshake(net::ssl::stream_base::client, std::move(handler));
            });
        }
        if (!ec) {
            http_exchange(ioc, stream, req, res, ec);
        }
        if (ec) {
            m_last_error = "request: " + ec.message();
            return false;
        }

        beast::error_code ec_close;
        beast::get_lowest_layer(stream).expires_after(std::chrono::seconds(1));
        run_blocking(ioc, ec_close, [&](auto handler) {
            stream.async_shutdown(std::move(handler));
        });
        if (ec_close) {
            // the response is already complete
            fail(ec_close, "shutdown", false);
        }
    } else {
        beast::tcp_stream stream(ioc);
        stream.expires_after(timeout);

        run_blocking(ioc, ec, [&](auto handler) {
            stream.async_connect(endpoints, std::move(handler));
        });
        if (!ec) {
            http_exchange(ioc, stream, req, res, ec);
        }
        if (ec) {
            m_last_error = "request: " + ec.message();
            return false;
        }

        beast::error_code ec_close;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec_close);
    }

    if (res.result() != http::status::ok && res.result() != http::status::created) {
        m_last_error = "HTTP " + std::to_string(res.result_int());
        return false;
    }

    response = res.body();

    return true;
}

} // namespace classnote
