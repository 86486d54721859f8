#pragma once

// Boost.Beast helpers shared by the network clients (internal)

#include "classnote/log.h"

#include <boost/asio/error.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/websocket/error.hpp>

#include <string>

namespace classnote {

namespace beast = boost::beast;
namespace net   = boost::asio;

// errors that mean the peer or we ended the connection on purpose
inline bool is_normal_close(const beast::error_code & ec) {
    return ec == net::error::operation_aborted ||
           ec == beast::websocket::error::closed ||
           ec == net::error::eof ||
           ec == net::ssl::error::stream_truncated;
}

// logs a failed operation; returns false for a normal close
inline bool fail(const beast::error_code & ec, const char * what, bool is_error = true) {
    if (is_normal_close(ec)) {
        CLASSNOTE_LOG_DEBUG("%s: operation stopped or socket closed normally (%s)\n", what, ec.message().c_str());
        return false;
    }
    if (is_error) {
        CLASSNOTE_LOG_ERROR("%s: %s (code: %d)\n", what, ec.message().c_str(), ec.value());
    } else {
        CLASSNOTE_LOG_WARN("%s: %s (code: %d)\n", what, ec.message().c_str(), ec.value());
    }
    return true;
}

// Starts one asynchronous operation and runs ioc until it completes. The
// operation must be bounded by a stream expiry or a websocket timeout.
template <typename Initiate>
void run_blocking(net::io_context & ioc, beast::error_code & ec, Initiate && initiate) {
    ioc.restart();
    initiate([&ec](beast::error_code result, auto &&...) { ec = result; });
    ioc.run();
}

inline void make_ssl_context(net::ssl::context & ctx) {
    beast::error_code ec;
    ctx.set_default_verify_paths(ec);
    if (ec) {
        CLASSNOTE_LOG_WARN("%s: failed to load default CA certificates: %s\n", __func__, ec.message().c_str());
    }
    ctx.set_verify_mode(net::ssl::verify_peer);
}

} // namespace classnote
