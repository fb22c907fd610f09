#include "market/yahoo_price_source.hpp"

#include <cmath>
#include <exception>
#include <utility>
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <nlohmann/json.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

namespace quotebridge::market {

namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace ssl = boost::asio::ssl;
using nlohmann::json;

namespace {

std::optional<double> positive_price(const json& value) {
    if (!value.is_number()) {
        return std::nullopt;
    }
    const double price = value.get<double>();
    if (!std::isfinite(price) || price <= 0.0) {
        return std::nullopt;
    }
    return price;
}

// Runs the one pending async step to completion and rethrows its failure.
void run_step(boost::asio::io_context& ioc, boost::system::error_code& ec) {
    ec = {};
    ioc.restart();
    ioc.run();
    if (ec) {
        throw boost::system::system_error(ec);
    }
}

}  // namespace

YahooPriceSource::YahooPriceSource(LiveSourceConfig config,
                                   core::logging::Logger& logger)
    : config_(std::move(config)), logger_(logger) {}

std::optional<double> YahooPriceSource::fetch(const std::string& symbol) {
    if (symbol.empty()) {
        return std::nullopt;
    }
    const std::string target =
        "/v8/finance/chart/" + symbol + "?interval=1m&range=1d";
    const auto body = http_get(target);
    if (!body.has_value()) {
        return std::nullopt;
    }
    return parse_chart_body(body.value());
}

std::optional<double> YahooPriceSource::parse_chart_body(const std::string& body) {
    const json payload = json::parse(body, nullptr, false);
    if (payload.is_discarded() || !payload.is_object()) {
        return std::nullopt;
    }

    const auto chart_it = payload.find("chart");
    if (chart_it == payload.end() || !chart_it->is_object()) {
        return std::nullopt;
    }
    const auto result_it = chart_it->find("result");
    if (result_it == chart_it->end() || !result_it->is_array() || result_it->empty()) {
        return std::nullopt;
    }
    const auto& first = result_it->front();
    if (!first.is_object()) {
        return std::nullopt;
    }

    const auto meta_it = first.find("meta");
    if (meta_it != first.end() && meta_it->is_object()) {
        const auto market_it = meta_it->find("regularMarketPrice");
        if (market_it != meta_it->end()) {
            if (auto price = positive_price(*market_it)) {
                return price;
            }
        }
    }

    // Fall back to the most recent minute close.
    const auto indicators_it = first.find("indicators");
    if (indicators_it == first.end() || !indicators_it->is_object()) {
        return std::nullopt;
    }
    const auto quote_it = indicators_it->find("quote");
    if (quote_it == indicators_it->end() || !quote_it->is_array() || quote_it->empty()) {
        return std::nullopt;
    }
    const auto& quote = quote_it->front();
    if (!quote.is_object()) {
        return std::nullopt;
    }
    const auto close_it = quote.find("close");
    if (close_it == quote.end() || !close_it->is_array()) {
        return std::nullopt;
    }
    for (auto it = close_it->rbegin(); it != close_it->rend(); ++it) {
        if (auto price = positive_price(*it)) {
            return price;
        }
    }
    return std::nullopt;
}

std::optional<std::string> YahooPriceSource::http_get(const std::string& target) {
    std::string stage = "init";
    try {
        boost::asio::io_context ioc;
        ssl::context ctx(ssl::context::tls_client);
        ctx.set_default_verify_paths();
        ctx.set_options(ssl::context::default_workarounds);
        ctx.set_verify_mode(ssl::verify_peer);

        beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);
        boost::asio::ip::tcp::resolver resolver(ioc);

        stage = "sni";
        if (!SSL_set_tlsext_host_name(stream.native_handle(), config_.host.c_str())) {
            const auto err = static_cast<int>(::ERR_get_error());
            boost::system::error_code ec(err, boost::asio::error::get_ssl_category());
            throw boost::system::system_error(ec);
        }

        stage = "resolve";
        const auto results = resolver.resolve(config_.host, config_.port);

        // tcp_stream expiry only applies to async operations, so every network
        // step below is started async and driven to completion on `ioc`.
        boost::system::error_code ec;
        const auto record = [&ec](const boost::system::error_code& result, auto&&...) {
            ec = result;
        };

        stage = "connect";
        beast::get_lowest_layer(stream).expires_after(config_.timeout);
        beast::get_lowest_layer(stream).async_connect(results, record);
        run_step(ioc, ec);

        stage = "tls_handshake";
        beast::get_lowest_layer(stream).expires_after(config_.timeout);
        stream.async_handshake(ssl::stream_base::client, record);
        run_step(ioc, ec);

        http::request<http::string_body> req{http::verb::get, target, 11};
        req.set(http::field::host, config_.host);
        req.set(http::field::user_agent, "Mozilla/5.0 (quotebridge)");
        req.set(http::field::accept, "application/json");

        stage = "write";
        beast::get_lowest_layer(stream).expires_after(config_.timeout);
        http::async_write(stream, req, record);
        run_step(ioc, ec);

        stage = "read";
        beast::flat_buffer buffer;
        http::response<http::string_body> res;
        beast::get_lowest_layer(stream).expires_after(config_.timeout);
        http::async_read(stream, buffer, res, record);
        run_step(ioc, ec);

        // Many servers drop the connection without close_notify; the body is
        // already complete, so a failed TLS shutdown only gets logged.
        beast::get_lowest_layer(stream).expires_after(config_.timeout);
        stream.async_shutdown(record);
        ioc.restart();
        ioc.run();
        if (ec) {
            logger_.debug("Live source TLS shutdown: " + ec.message());
        }

        if (res.result() != http::status::ok) {
            logger_.debug("Live source returned HTTP " +
                          std::to_string(res.result_int()) + " for " + target);
            return std::nullopt;
        }
        return res.body();
    } catch (const std::exception& ex) {
        logger_.debug("Live source failed at " + stage + ": " + ex.what());
        return std::nullopt;
    }
}

}  // namespace quotebridge::market
