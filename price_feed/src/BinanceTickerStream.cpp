#include "BinanceTickerStream.hpp"
#include "TickerParser.hpp"
#include "log.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <openssl/err.h>

#include <cctype>
#include <chrono>
#include <memory>

namespace beast     = boost::beast;
namespace http      = beast::http;
namespace websocket = beast::websocket;
namespace net       = boost::asio;
namespace ssl       = net::ssl;
using tcp           = net::ip::tcp;

static std::string to_lower_copy(const std::string& s) {
    std::string out = s;
    for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

namespace {

// resolve -> connect -> TLS -> websocket handshake -> read loop.
// Ends (no more pending work) on the first error; error() says why.
class TickerSession : public std::enable_shared_from_this<TickerSession> {
public:
    using TextHandler = std::function<void(const std::string&)>;

    TickerSession(net::io_context& ioc, ssl::context& ctx,
                  std::string host, std::string port, std::string target,
                  std::chrono::milliseconds idle_timeout, TextHandler on_text)
        : resolver_(net::make_strand(ioc)),
          ws_(net::make_strand(ioc), ctx),
          host_(std::move(host)),
          port_(std::move(port)),
          target_(std::move(target)),
          idle_timeout_(idle_timeout),
          on_text_(std::move(on_text))
    {}

    void run() {
        resolver_.async_resolve(host_, port_,
            beast::bind_front_handler(&TickerSession::on_resolve, shared_from_this()));
    }

    const std::string& error() const { return error_; }
    bool connected() const { return connected_; }

private:
    void on_resolve(beast::error_code ec, tcp::resolver::results_type results) {
        if (ec) return fail(ec, "resolve");

        beast::get_lowest_layer(ws_).expires_after(std::chrono::seconds(10));
        beast::get_lowest_layer(ws_).async_connect(results,
            beast::bind_front_handler(&TickerSession::on_connect, shared_from_this()));
    }

    void on_connect(beast::error_code ec, tcp::resolver::results_type::endpoint_type ep) {
        if (ec) return fail(ec, "connect");

        beast::get_lowest_layer(ws_).expires_after(std::chrono::seconds(10));

        // SNI, otherwise the TLS handshake fails against Binance
        if (!SSL_set_tlsext_host_name(ws_.next_layer().native_handle(), host_.c_str())) {
            ec = beast::error_code(static_cast<int>(::ERR_get_error()),
                                   net::error::get_ssl_category());
            return fail(ec, "sni");
        }

        host_header_ = host_ + ':' + std::to_string(ep.port());

        ws_.next_layer().async_handshake(ssl::stream_base::client,
            beast::bind_front_handler(&TickerSession::on_ssl_handshake, shared_from_this()));
    }

    void on_ssl_handshake(beast::error_code ec) {
        if (ec) return fail(ec, "ssl_handshake");

        // websocket has its own timeouts from here on
        beast::get_lowest_layer(ws_).expires_never();

        websocket::stream_base::timeout opt{};
        opt.handshake_timeout = std::chrono::seconds(10);
        opt.idle_timeout      = idle_timeout_;
        opt.keep_alive_pings  = false;
        ws_.set_option(opt);

        ws_.set_option(websocket::stream_base::decorator(
            [](websocket::request_type& req) {
                req.set(http::field::user_agent, "poly_maker");
            }));

        ws_.async_handshake(host_header_, target_,
            beast::bind_front_handler(&TickerSession::on_handshake, shared_from_this()));
    }

    void on_handshake(beast::error_code ec) {
        if (ec) return fail(ec, "ws_handshake");

        connected_ = true;
        log_info("STREAM", "Connected wss://", host_header_, target_);
        do_read();
    }

    void do_read() {
        ws_.async_read(buffer_,
            beast::bind_front_handler(&TickerSession::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t) {
        if (ec) return fail(ec, "read");

        std::string text = beast::buffers_to_string(buffer_.data());
        buffer_.consume(buffer_.size());
        on_text_(text);
        do_read();
    }

    void fail(beast::error_code ec, const char* what) {
        error_ = std::string(what) + ": " + ec.message();
    }

private:
    tcp::resolver resolver_;
    websocket::stream<beast::ssl_stream<beast::tcp_stream>> ws_;
    beast::flat_buffer buffer_;

    std::string host_;
    std::string port_;
    std::string target_;
    std::string host_header_;
    std::chrono::milliseconds idle_timeout_;
    TextHandler on_text_;

    std::string error_;
    bool connected_ = false;
};

} // namespace

BinanceTickerStream::BinanceTickerStream(TickerStreamParams p, MsClock clock)
    : p_(std::move(p)),
      slot_(p_.stale_after_ms, std::move(clock)),
      backoff_(p_.reconnect_base_ms, p_.reconnect_max_ms)
{}

BinanceTickerStream::~BinanceTickerStream() {
    stop();
}

void BinanceTickerStream::start() {
    if (running_.exchange(true)) {
        log_warn("STREAM", "already running");
        return;
    }
    if (worker_.joinable()) worker_.join(); // left over from an earlier stop()

    log_info("STREAM", "Starting ", p_.symbol, " ticker stream");
    worker_ = std::thread(&BinanceTickerStream::connection_loop, this);

    if (slot_.wait_for_first(p_.startup_timeout_ms)) {
        auto s = slot_.latest();
        log_info("STREAM", "Feed started: ", p_.symbol, " $", s ? s->value : 0.0);
    } else {
        log_warn("STREAM", "Feed started but no price received within ",
                 p_.startup_timeout_ms, " ms");
    }
}

void BinanceTickerStream::stop() {
    if (!running_.exchange(false)) {
        if (worker_.joinable()) worker_.join();
        return;
    }

    log_info("STREAM", "Stopping ", p_.symbol, " ticker stream");
    {
        std::lock_guard<std::mutex> lk(ctl_mtx_);
        if (interrupt_) interrupt_();
    }
    ctl_cv_.notify_all();

    if (worker_.joinable()) worker_.join();
}

std::optional<PriceSample> BinanceTickerStream::current() const {
    return slot_.fresh();
}

bool BinanceTickerStream::is_healthy() const {
    return running_.load() && slot_.fresh().has_value();
}

void BinanceTickerStream::on_update(Listener cb) {
    slot_.add_listener(std::move(cb));
}

bool BinanceTickerStream::handle_message(const std::string& text) {
    TickerParse r = parse_ticker_frame(text, p_.symbol);

    switch (r.kind) {
        case TickerParse::Kind::Price:
            slot_.publish(r.price);
            session_ticks_.fetch_add(1);
            return true;

        case TickerParse::Kind::Malformed: {
            std::uint64_t n = malformed_.fetch_add(1) + 1;
            // first few in full, then every 100th
            if (n <= 5 || n % 100 == 0) {
                log_warn("STREAM", "dropped malformed frame #", n, ": ",
                         text.substr(0, 160));
            }
            return false;
        }

        case TickerParse::Kind::Ignored:
            break;
    }
    return false;
}

void BinanceTickerStream::connection_loop() {
    while (running_.load()) {
        session_ticks_.store(0);
        attempts_.fetch_add(1);
        try {
            run_session();
        } catch (const std::exception& e) {
            log_error("STREAM", "session setup failed: ", e.what());
        }

        if (!running_.load()) break;

        if (session_ticks_.load() > 0) backoff_.reset();
        const std::int64_t delay = backoff_.next_delay_ms();

        log_warn("STREAM", "Reconnecting to Binance in ", delay, " ms (attempt ",
                 backoff_.attempts(), ")");

        std::unique_lock<std::mutex> lk(ctl_mtx_);
        ctl_cv_.wait_for(lk, std::chrono::milliseconds(delay),
                         [this]{ return !running_.load(); });
    }
}

void BinanceTickerStream::run_session() {
    // ctx outlives ioc: pending handlers own the session, which references ctx
    ssl::context ctx(ssl::context::tlsv12_client);
    ctx.set_default_verify_paths();
    ctx.set_verify_mode(ssl::verify_peer);

    net::io_context ioc;

    {
        std::lock_guard<std::mutex> lk(ctl_mtx_);
        if (!running_.load()) return;
        interrupt_ = [&ioc]{ ioc.stop(); };
    }

    const std::string target = "/ws/" + to_lower_copy(p_.symbol) + "@ticker";

    auto session = std::make_shared<TickerSession>(
        ioc, ctx, p_.host, p_.port, target,
        std::chrono::milliseconds(p_.idle_timeout_ms),
        [this](const std::string& text) { handle_message(text); });

    try {
        session->run();
        ioc.run();
    } catch (const std::exception& e) {
        log_error("STREAM", "session error: ", e.what());
    }

    {
        std::lock_guard<std::mutex> lk(ctl_mtx_);
        interrupt_ = nullptr;
    }

    if (!running_.load()) return;

    if (!session->error().empty()) {
        log_error("STREAM", "Binance WebSocket ", session->error());
    } else {
        log_warn("STREAM", "Binance WebSocket closed");
    }
}
