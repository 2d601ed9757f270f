#include "network/websocket_channel.hpp"
#include <boost/asio/post.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <iostream>

namespace network {

namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;
namespace net = boost::asio;

WebSocketUrl parse_websocket_url(const std::string& url) {
    const std::string scheme = "ws://";
    if (url.compare(0, scheme.size(), scheme) != 0) {
        throw core::VoiceError(core::ErrorKind::ConnectionFailed,
                               "unsupported URL (expected ws://host[:port]/path): " + url);
    }

    const std::string rest = url.substr(scheme.size());
    const auto slash = rest.find('/');
    const std::string authority = rest.substr(0, slash);

    WebSocketUrl parsed;
    parsed.target = slash == std::string::npos ? "/" : rest.substr(slash);

    const auto colon = authority.rfind(':');
    if (colon == std::string::npos) {
        parsed.host = authority;
        parsed.port = "80";
    } else {
        parsed.host = authority.substr(0, colon);
        parsed.port = authority.substr(colon + 1);
        if (parsed.port.empty() ||
            parsed.port.find_first_not_of("0123456789") != std::string::npos) {
            throw core::VoiceError(core::ErrorKind::ConnectionFailed, "invalid port in URL: " + url);
        }
    }

    if (parsed.host.empty()) {
        throw core::VoiceError(core::ErrorKind::ConnectionFailed, "missing host in URL: " + url);
    }
    return parsed;
}

WebSocketChannel::WebSocketChannel(std::chrono::milliseconds connect_timeout)
    : connect_timeout_(connect_timeout), resolver_(ioc_), ws_(ioc_) {}

WebSocketChannel::~WebSocketChannel() {
    close();
    if (io_thread_.joinable()) {
        io_thread_.join();
    }
}

void WebSocketChannel::open(const std::string& url, std::shared_ptr<ChannelListener> listener) {
    if (io_thread_.joinable()) {
        throw core::VoiceError(core::ErrorKind::ConnectionFailed, "channel was already opened");
    }

    url_ = parse_websocket_url(url);
    listener_ = std::move(listener);

    std::cout << "📡 Connecting to " << url_.host << ":" << url_.port << url_.target << std::endl;

    work_.emplace(net::make_work_guard(ioc_));
    resolver_.async_resolve(url_.host, url_.port,
                            beast::bind_front_handler(&WebSocketChannel::on_resolve, this));
    io_thread_ = std::thread([this] { ioc_.run(); });
}

bool WebSocketChannel::send(const std::string& text) {
    if (!open_ || closing_) {
        std::cerr << "⚠️  Channel not open, message dropped (" << text.size() << " bytes)" << std::endl;
        return false;
    }

    // Posted before the close, so it is queued ahead of it
    net::post(ioc_, [this, text]() {
        if (!open_ || close_sent_) {
            return;
        }
        outbox_.push_back(text);
        if (outbox_.size() == 1) {
            do_write();
        }
    });
    return true;
}

void WebSocketChannel::close() {
    if (closing_.exchange(true)) {
        return;
    }
    net::post(ioc_, [this]() { do_close(); });
}

void WebSocketChannel::on_resolve(error_code ec, tcp::resolver::results_type results) {
    if (ec) {
        return fail("resolve", ec);
    }

    beast::get_lowest_layer(ws_).expires_after(connect_timeout_);
    beast::get_lowest_layer(ws_).async_connect(
        results, beast::bind_front_handler(&WebSocketChannel::on_connect, this));
}

void WebSocketChannel::on_connect(error_code ec, tcp::resolver::results_type::endpoint_type endpoint) {
    if (ec) {
        return fail("connect", ec);
    }

    // The websocket layer takes over timeouts from here
    beast::get_lowest_layer(ws_).expires_never();

    websocket::stream_base::timeout timeouts{};
    timeouts.handshake_timeout = connect_timeout_;
    timeouts.idle_timeout = websocket::stream_base::none();
    timeouts.keep_alive_pings = false;
    ws_.set_option(timeouts);

    ws_.set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
        req.set(beast::http::field::user_agent, std::string("slide_voice ") + BOOST_BEAST_VERSION_STRING);
    }));

    const std::string host = url_.host + ":" + std::to_string(endpoint.port());
    ws_.async_handshake(host, url_.target,
                        beast::bind_front_handler(&WebSocketChannel::on_handshake, this));
}

void WebSocketChannel::on_handshake(error_code ec) {
    if (ec) {
        return fail("handshake", ec);
    }

    ws_.text(true);
    ever_opened_ = true;
    open_ = true;
    std::cout << "✓ WebSocket connected" << std::endl;

    listener_->on_open();
    do_read();
}

void WebSocketChannel::do_read() {
    ws_.async_read(buffer_, beast::bind_front_handler(&WebSocketChannel::on_read, this));
}

void WebSocketChannel::on_read(error_code ec, std::size_t) {
    if (ec) {
        if (ec == websocket::error::closed) {
            const auto& reason = ws_.reason();
            report_close(closing_ ? "closed locally"
                                  : "closed by peer (code " + std::to_string(reason.code) + ")");
        } else {
            report_close(closing_ ? "closed locally" : ec.message());
        }
        return;
    }

    if (!ws_.got_text()) {
        std::cerr << "⚠️  Binary frame ignored (" << buffer_.size() << " bytes)" << std::endl;
        buffer_.consume(buffer_.size());
        return do_read();
    }

    std::string text = beast::buffers_to_string(buffer_.data());
    buffer_.consume(buffer_.size());
    listener_->on_message(std::move(text));
    do_read();
}

void WebSocketChannel::do_write() {
    ws_.async_write(net::buffer(outbox_.front()),
                    beast::bind_front_handler(&WebSocketChannel::on_write, this));
}

void WebSocketChannel::on_write(error_code ec, std::size_t) {
    if (ec) {
        // The pending read observes the same failure and reports the close
        std::cerr << "❌ WebSocket write failed: " << ec.message() << std::endl;
        outbox_.clear();
        return;
    }

    outbox_.pop_front();
    if (!open_) {
        return;
    }
    if (!outbox_.empty()) {
        do_write();
    } else if (closing_ && !close_sent_) {
        start_close();
    }
}

void WebSocketChannel::do_close() {
    if (open_) {
        // Queued messages go out first; on_write starts the close when the outbox drains
        if (outbox_.empty()) {
            start_close();
        }
        return;
    }

    // Not connected yet (or already gone): abandon whatever is in flight
    resolver_.cancel();
    error_code ignored;
    beast::get_lowest_layer(ws_).socket().close(ignored);
    work_.reset();
}

void WebSocketChannel::start_close() {
    if (close_sent_) {
        return;
    }
    close_sent_ = true;
    ws_.async_close(websocket::close_code::normal, [](error_code ec) {
        if (ec && ec != net::error::operation_aborted) {
            std::cerr << "⚠️  WebSocket close handshake: " << ec.message() << std::endl;
        }
    });
}

void WebSocketChannel::fail(const std::string& what, error_code ec) {
    if (ever_opened_) {
        report_close(what + ": " + ec.message());
        return;
    }

    work_.reset();
    if (closing_) {
        return;
    }

    const auto kind = ec == beast::error::timeout ? core::ErrorKind::ConnectionTimeout
                                                  : core::ErrorKind::ConnectionFailed;
    std::cerr << "❌ [" << core::to_string(kind) << "] WebSocket " << what << ": " << ec.message() << std::endl;
    listener_->on_error(kind, what + ": " + ec.message());
}

void WebSocketChannel::report_close(const std::string& reason) {
    open_ = false;
    work_.reset();
    if (ever_opened_ && !close_reported_.exchange(true)) {
        std::cout << "📴 WebSocket closed: " << reason << std::endl;
        listener_->on_close(reason);
    }
}

}
