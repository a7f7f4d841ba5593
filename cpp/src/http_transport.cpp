#include "tiergate/remote_verifier.hpp"
#include "tiergate/logging.hpp"
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <format>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = net::ip::tcp;

namespace tiergate
{
    namespace
    {
        using PlainStream = beast::tcp_stream;
        using TlsStream = beast::ssl_stream<beast::tcp_stream>;

        template <class Stream>
        Stream make_stream(net::io_context &ioc, ssl::context &ctx);

        template <>
        PlainStream make_stream<PlainStream>(net::io_context &ioc, ssl::context &)
        {
            return PlainStream(ioc);
        }

        template <>
        TlsStream make_stream<TlsStream>(net::io_context &ioc, ssl::context &ctx)
        {
            return TlsStream(ioc, ctx);
        }

        /**
         * One request/response exchange driven by the caller's io_context.
         * resolve -> connect -> [handshake] -> write -> read
         */
        template <class Stream>
        class Exchange : public std::enable_shared_from_this<Exchange<Stream>>
        {
            static constexpr bool kTls = std::is_same_v<Stream, TlsStream>;

        public:
            Exchange(net::io_context &ioc,
                     ssl::context &ctx,
                     http::request<http::string_body> req,
                     std::chrono::milliseconds timeout)
                : resolver_(ioc),
                  stream_(make_stream<Stream>(ioc, ctx)),
                  req_(std::move(req)),
                  timeout_(timeout)
            {
            }

            void run(const std::string &host, std::uint16_t port)
            {
                beast::error_code literal_ec;
                const auto literal = net::ip::make_address(host, literal_ec);

                if constexpr (kTls)
                {
                    // SNI carries DNS names only
                    if (literal_ec && !SSL_set_tlsext_host_name(stream_.native_handle(), host.c_str()))
                    {
                        beast::error_code ec{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
                        return fail(ec, "TLS SNI setup");
                    }
                    stream_.set_verify_callback(ssl::host_name_verification(host));
                }

                if (!literal_ec)
                {
                    // No resolver thread for address literals
                    lowest().expires_after(timeout_);
                    lowest().async_connect(
                        tcp::endpoint(literal, port),
                        beast::bind_front_handler(&Exchange::on_connect, this->shared_from_this()));
                    return;
                }

                resolver_.async_resolve(
                    host,
                    std::to_string(port),
                    beast::bind_front_handler(&Exchange::on_resolve, this->shared_from_this()));
            }

            bool done() const { return done_; }

            Result<HttpResponse> result() const
            {
                if (error_)
                    return std::unexpected(*error_);
                return response_;
            }

        private:
            beast::tcp_stream &lowest()
            {
                return beast::get_lowest_layer(stream_);
            }

            void on_resolve(beast::error_code ec, tcp::resolver::results_type results)
            {
                if (ec)
                    return fail(ec, "resolve");

                lowest().expires_after(timeout_);
                lowest().async_connect(
                    results,
                    beast::bind_front_handler(&Exchange::on_range_connect, this->shared_from_this()));
            }

            void on_range_connect(beast::error_code ec, tcp::resolver::results_type::endpoint_type)
            {
                on_connect(ec);
            }

            void on_connect(beast::error_code ec)
            {
                if (ec)
                    return fail(ec, "connect");

                if constexpr (kTls)
                {
                    stream_.async_handshake(
                        ssl::stream_base::client,
                        beast::bind_front_handler(&Exchange::on_handshake, this->shared_from_this()));
                }
                else
                {
                    do_write();
                }
            }

            void on_handshake(beast::error_code ec)
            {
                if (ec)
                    return fail(ec, "TLS handshake");
                do_write();
            }

            void do_write()
            {
                http::async_write(stream_, req_,
                                  beast::bind_front_handler(&Exchange::on_write, this->shared_from_this()));
            }

            void on_write(beast::error_code ec, std::size_t)
            {
                if (ec)
                    return fail(ec, "write");

                http::async_read(stream_, buffer_, res_,
                                 beast::bind_front_handler(&Exchange::on_read, this->shared_from_this()));
            }

            void on_read(beast::error_code ec, std::size_t)
            {
                if (ec)
                    return fail(ec, "read");

                response_.status = res_.result_int();
                response_.body = std::move(res_.body());
                done_ = true;

                // Best effort; the response is already complete.
                beast::error_code ignored;
                lowest().socket().shutdown(tcp::socket::shutdown_both, ignored);
            }

            void fail(beast::error_code ec, const char *what)
            {
                if (ec == beast::error::timeout)
                    error_ = TiergateError::network(std::format("{} timed out", what));
                else
                    error_ = TiergateError::network(std::format("{} failed: {}", what, ec.message()));
                done_ = true;
            }

            tcp::resolver resolver_;
            Stream stream_;
            beast::flat_buffer buffer_;
            http::request<http::string_body> req_;
            http::response<http::string_body> res_;
            std::chrono::milliseconds timeout_;

            bool done_{false};
            HttpResponse response_;
            std::optional<TiergateError> error_;
        };

        template <class Stream>
        Result<HttpResponse> run_exchange(ssl::context &ctx,
                                          const HttpUrl &url,
                                          http::request<http::string_body> req,
                                          std::chrono::milliseconds timeout)
        {
            net::io_context ioc;
            auto exchange = std::make_shared<Exchange<Stream>>(ioc, ctx, std::move(req), timeout);
            exchange->run(url.host, url.port);

            // Resolution has no per-operation timer; bound the whole exchange.
            ioc.run_for(timeout);

            if (!exchange->done())
            {
                ioc.stop();
                return std::unexpected(TiergateError::network("verifier request timed out"));
            }
            return exchange->result();
        }
    } // namespace

    class BeastHttpTransport::Impl
    {
    public:
        Impl() : ssl_ctx_(ssl::context::tls_client)
        {
            ssl_ctx_.set_default_verify_paths();
            ssl_ctx_.set_verify_mode(ssl::verify_peer);
        }

        Result<HttpResponse> post(const HttpUrl &url,
                                  const std::map<std::string, std::string> &headers,
                                  const std::string &body,
                                  std::chrono::milliseconds timeout)
        {
            http::request<http::string_body> req{http::verb::post, url.target, 11};
            req.set(http::field::host, url.authority());
            for (const auto &[name, value] : headers)
                req.set(name, value);
            req.body() = body;
            req.prepare_payload();

            if (url.scheme == "https")
                return run_exchange<TlsStream>(ssl_ctx_, url, std::move(req), timeout);
            return run_exchange<PlainStream>(ssl_ctx_, url, std::move(req), timeout);
        }

    private:
        ssl::context ssl_ctx_;
    };

    BeastHttpTransport::BeastHttpTransport() : impl_(std::make_unique<Impl>()) {}
    BeastHttpTransport::~BeastHttpTransport() = default;

    Result<HttpResponse> BeastHttpTransport::post(
        const HttpUrl &url,
        const std::map<std::string, std::string> &headers,
        const std::string &body,
        std::chrono::milliseconds timeout)
    {
        return impl_->post(url, headers, body, timeout);
    }

} // namespace tiergate
