#ifndef SLIDE_VOICE_WEBSOCKET_CHANNEL_HPP
#define SLIDE_VOICE_WEBSOCKET_CHANNEL_HPP

#include "core/non_copyable.hpp"
#include "network/transport_channel.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <string>
#include <memory>
#include <deque>
#include <thread>
#include <atomic>
#include <optional>
#include <chrono>

namespace network {
    struct WebSocketUrl {
        std::string host;
        std::string port;
        std::string target;
    };

    // Parses ws://host[:port][/path]. Throws core::VoiceError(ConnectionFailed).
    WebSocketUrl parse_websocket_url(const std::string& url);

    // WebSocket client on a private io_context thread. All socket work runs on
    // that thread; send() and close() post onto it.
    class WebSocketChannel : public TransportChannel, private core::NonCopyable {
    public:
        explicit WebSocketChannel(std::chrono::milliseconds connect_timeout = std::chrono::seconds(10));
        ~WebSocketChannel() override;

        void open(const std::string& url, std::shared_ptr<ChannelListener> listener) override;
        bool send(const std::string& text) override;
        void close() override;
        bool is_open() const override { return open_; }

    private:
        using tcp = boost::asio::ip::tcp;
        using error_code = boost::beast::error_code;

        void on_resolve(error_code ec, tcp::resolver::results_type results);
        void on_connect(error_code ec, tcp::resolver::results_type::endpoint_type endpoint);
        void on_handshake(error_code ec);
        void do_read();
        void on_read(error_code ec, std::size_t bytes);
        void do_write();
        void on_write(error_code ec, std::size_t bytes);
        void do_close();
        void start_close();

        void fail(const std::string& what, error_code ec);
        void report_close(const std::string& reason);

        std::chrono::milliseconds connect_timeout_;

        boost::asio::io_context ioc_;
        std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_;
        tcp::resolver resolver_;
        boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
        boost::beast::flat_buffer buffer_;
        std::thread io_thread_;

        WebSocketUrl url_;
        std::shared_ptr<ChannelListener> listener_;
        std::deque<std::string> outbox_;
        bool close_sent_ = false;

        std::atomic<bool> open_{false};
        std::atomic<bool> closing_{false};
        std::atomic<bool> ever_opened_{false};
        std::atomic<bool> close_reported_{false};
    };
}

#endif
