#include "hrvrng_entropy.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <fstream>
#include <sstream>
#include <system_error>
#include <thread>

#include <sys/random.h>

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <nlohmann/json.hpp>
#include <openssl/err.h>

#define LOG_TAG "HrvEntropy"
#include "hrvrng_log.h"

namespace hrvrng {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

// ------------------------------
// SecureFallbackSource
// ------------------------------

static bool readUrandom(uint8_t* dst, size_t n) {
    std::ifstream f("/dev/urandom", std::ios::binary);
    if (!f.good()) return false;
    f.read(reinterpret_cast<char*>(dst), static_cast<std::streamsize>(n));
    return static_cast<size_t>(f.gcount()) == n;
}

std::vector<uint8_t> SecureFallbackSource::bytes(size_t n) {
    std::vector<uint8_t> out(n);
    size_t got = 0;
    while (got < n) {
        ssize_t r = ::getrandom(out.data() + got, n - got, 0);
        if (r < 0) {
            if (errno == EINTR) continue;
            const int err = errno;
            LOGW("getrandom failed (errno=%d), reading /dev/urandom", err);
            if (!readUrandom(out.data() + got, n - got)) {
                throw std::system_error(err, std::generic_category(), "no OS entropy source");
            }
            got = n;
            break;
        }
        got += static_cast<size_t>(r);
    }
    return out;
}

// ------------------------------
// HTTPS transport
// ------------------------------

namespace {

// One GET over TLS, driven on a private io_context bounded by run_for()
struct HttpsRequest {
    HttpsRequest(net::io_context& ioc, ssl::context& ctx, const std::string& host,
                 const std::string& port, const std::string& target, std::chrono::milliseconds timeout)
        : resolver_(ioc), stream_(ioc, ctx), host_(host), port_(port), timeout_(timeout) {
        req_.version(11);
        req_.method(http::verb::get);
        req_.target(target);
        req_.set(http::field::host, host);
        req_.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
        req_.set(http::field::accept, "application/json");
    }

    bool prepare() {
        // SNI is required by most TLS front ends
        if (!SSL_set_tlsext_host_name(stream_.native_handle(), host_.c_str())) {
            ec_ = beast::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category());
            return false;
        }
        stream_.set_verify_callback(ssl::host_name_verification(host_));
        return true;
    }

    void run() {
        resolver_.async_resolve(host_, port_, [this](beast::error_code ec, tcp::resolver::results_type results) {
            if (ec) { fail(ec); return; }
            beast::get_lowest_layer(stream_).expires_after(timeout_);
            beast::get_lowest_layer(stream_).async_connect(results, [this](beast::error_code ec, tcp::endpoint) {
                if (ec) { fail(ec); return; }
                onConnect();
            });
        });
    }

    void onConnect() {
        stream_.async_handshake(ssl::stream_base::client, [this](beast::error_code ec) {
            if (ec) { fail(ec); return; }
            http::async_write(stream_, req_, [this](beast::error_code ec, std::size_t) {
                if (ec) { fail(ec); return; }
                http::async_read(stream_, buffer_, res_, [this](beast::error_code ec, std::size_t) {
                    if (ec) { fail(ec); return; }
                    done_ = true;
                    beast::get_lowest_layer(stream_).close();
                });
            });
        });
    }

    void fail(beast::error_code ec) { ec_ = ec; }

    tcp::resolver resolver_;
    beast::ssl_stream<beast::tcp_stream> stream_;
    std::string host_;
    std::string port_;
    std::chrono::milliseconds timeout_;
    http::request<http::empty_body> req_;
    beast::flat_buffer buffer_;
    http::response<http::string_body> res_;
    beast::error_code ec_;
    bool done_ {false};
};

} // namespace

HttpResponse httpsGet(const std::string& host, const std::string& port,
                      const std::string& target, double timeoutSec) {
    HttpResponse out;
    const auto timeout = std::chrono::milliseconds(static_cast<long long>(std::max(0.1, timeoutSec) * 1000.0));
    try {
        net::io_context ioc;
        ssl::context ctx(ssl::context::tls_client);
        ctx.set_default_verify_paths();
        ctx.set_verify_mode(ssl::verify_peer);

        HttpsRequest req(ioc, ctx, host, port, target, timeout);
        if (!req.prepare()) {
            out.error = ErrorKind::SourceUnavailable;
            out.message = "tls setup: " + req.ec_.message();
            return out;
        }
        req.run();
        ioc.run_for(timeout);
        if (!req.done_) {
            ioc.stop();
            out.error = ErrorKind::SourceUnavailable;
            out.message = req.ec_ ? req.ec_.message() : std::string("timeout");
            return out;
        }
        out.status = static_cast<int>(req.res_.result_int());
        out.body = std::move(req.res_.body());
    } catch (const boost::system::system_error& e) {
        out.error = ErrorKind::SourceUnavailable;
        out.message = e.what();
    }
    return out;
}

// ------------------------------
// OnlineEntropyFetcher
// ------------------------------

OnlineEntropyFetcher::OnlineEntropyFetcher(const OnlineOptions& opt, HttpGet get)
    : opt_(opt), get_(std::move(get)) {
    if (opt_.maxChunk == 0) opt_.maxChunk = 1024;
}

std::string OnlineEntropyFetcher::buildTarget(size_t length) const {
    std::ostringstream os;
    os << opt_.path << "?length=" << length << "&type=uint8";
    return os.str();
}

ByteResult OnlineEntropyFetcher::parseResponse(const std::string& body) {
    nlohmann::json obj;
    try {
        obj = nlohmann::json::parse(body);
    } catch (const nlohmann::json::exception& e) {
        return ByteResult::failure(ErrorKind::MalformedResponse, std::string("json: ") + e.what());
    }
    if (!obj.is_object()) return ByteResult::failure(ErrorKind::MalformedResponse, "response is not an object");
    auto succ = obj.find("success");
    if (succ != obj.end() && succ->is_boolean() && !succ->get<bool>()) {
        return ByteResult::failure(ErrorKind::MalformedResponse, "service reported success=false");
    }
    auto data = obj.find("data");
    if (data == obj.end() || !data->is_array() || data->empty()) {
        return ByteResult::failure(ErrorKind::MalformedResponse, "missing data array");
    }
    std::vector<uint8_t> bytes;
    bytes.reserve(data->size());
    for (const auto& v : *data) {
        if (!v.is_number_integer()) return ByteResult::failure(ErrorKind::MalformedResponse, "non-integer in data");
        const long long x = v.get<long long>();
        if (x < 0 || x > 255) return ByteResult::failure(ErrorKind::MalformedResponse, "value out of uint8 range");
        bytes.push_back(static_cast<uint8_t>(x));
    }
    return ByteResult::success(std::move(bytes));
}

ByteResult OnlineEntropyFetcher::fetch(size_t n) {
    if (n == 0) return ByteResult::success({});
    if (!get_) return ByteResult::failure(ErrorKind::SourceUnavailable, "no http transport");

    std::vector<uint8_t> out;
    out.reserve(n);
    while (out.size() < n) {
        const size_t ask = std::min(n - out.size(), opt_.maxChunk);
        HttpResponse resp = get_(opt_.host, opt_.port, buildTarget(ask), opt_.timeoutSec);
        if (resp.error != ErrorKind::Ok) {
            return ByteResult::failure(resp.error, resp.message);
        }
        if (resp.status != 200) {
            return ByteResult::failure(ErrorKind::SourceUnavailable, "http status " + std::to_string(resp.status));
        }
        ByteResult part = parseResponse(resp.body);
        if (!part.ok()) return part;
        const size_t take = std::min(part.bytes.size(), n - out.size());
        out.insert(out.end(), part.bytes.begin(), part.bytes.begin() + static_cast<std::ptrdiff_t>(take));
        LOGD("online chunk: asked=%zu got=%zu total=%zu/%zu", ask, part.bytes.size(), out.size(), n);
        // rate limit between requests
        if (out.size() < n && opt_.chunkDelayMs > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(opt_.chunkDelayMs));
        }
    }
    return ByteResult::success(std::move(out));
}

// ------------------------------
// EntropySourceChain
// ------------------------------

EntropySourceChain::EntropySourceChain(std::unique_ptr<EntropySource> spectral,
                                       std::unique_ptr<EntropySource> online,
                                       SecureFallbackSource& fallback)
    : spectral_(std::move(spectral)), online_(std::move(online)), fallback_(fallback) {}

void EntropySourceChain::setLast(const char* source) {
    std::lock_guard<std::mutex> lock(lastM_);
    last_ = source;
}

std::string EntropySourceChain::lastSource() const {
    std::lock_guard<std::mutex> lock(lastM_);
    return last_;
}

bool EntropySourceChain::accept(const ByteResult& r, size_t n, const char* source) {
    switch (r.error) {
        case ErrorKind::Ok:
            if (r.bytes.size() >= n) return true;
            LOGW("%s returned %zu of %zu bytes, falling through", source, r.bytes.size(), n);
            return false;
        case ErrorKind::SourceUnavailable:
            LOGI("%s unavailable (%s): %s", source, errorCode(r.error), r.message.c_str());
            return false;
        case ErrorKind::MalformedResponse:
            LOGW("%s malformed response (%s): %s", source, errorCode(r.error), r.message.c_str());
            return false;
        case ErrorKind::DeviceConnectFailed:
        case ErrorKind::ParseError:
            break;
    }
    LOGE("%s returned unexpected error kind %s: %s", source, errorName(r.error), r.message.c_str());
    return false;
}

ByteResult EntropySourceChain::fetch(size_t n) {
    if (n == 0) return ByteResult::success({});

    if (spectral_ && spectral_->available()) {
        ByteResult r = spectral_->fetch(n);
        if (accept(r, n, spectral_->name())) {
            r.bytes.resize(n);
            setLast(spectral_->name());
            return r;
        }
    }
    if (online_ && online_->available()) {
        ByteResult r = online_->fetch(n);
        if (accept(r, n, online_->name())) {
            r.bytes.resize(n);
            setLast(online_->name());
            return r;
        }
    }
    setLast(fallback_.name());
    return ByteResult::success(fallback_.bytes(n));
}

} // namespace hrvrng
