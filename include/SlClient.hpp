#pragma once
#include <chrono>
#include <string>
#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>
#include "DepartureSource.hpp"

// HTTPS client for the public SL Transport API. One connection per request.
class SlClient : public DepartureSource
{
private:
    boost::asio::io_context& ioContext;
    boost::asio::ssl::context sslContext;
    std::chrono::seconds timeout;

    void configureTlsStream(boost::beast::ssl_stream<boost::beast::tcp_stream>& stream);
    boost::asio::awaitable<boost::asio::ip::tcp::resolver::results_type> resolve(boost::asio::ip::tcp::resolver& resolver);
    boost::asio::awaitable<void> connect(boost::asio::ip::tcp::resolver::results_type results, boost::beast::ssl_stream<boost::beast::tcp_stream>& stream);
    boost::beast::http::request<boost::beast::http::string_body> buildGetRequest(std::string const& target) const;
    boost::asio::awaitable<void> sendRequest(boost::beast::ssl_stream<boost::beast::tcp_stream>& stream, boost::beast::http::request<boost::beast::http::string_body> const& request);
    boost::asio::awaitable<boost::beast::http::response<boost::beast::http::string_body>> readResponse(boost::beast::ssl_stream<boost::beast::tcp_stream>& stream);
    boost::asio::awaitable<void> shutdownStream(boost::beast::ssl_stream<boost::beast::tcp_stream>& stream);
    boost::asio::awaitable<std::string> get(std::string const& target);

public:
    SlClient(boost::asio::io_context& ioc, std::chrono::seconds requestTimeout = std::chrono::seconds(10));

    boost::asio::awaitable<std::string> fetchDepartures(std::string const& siteId) override;
    boost::asio::awaitable<std::string> fetchSites() override;

    // Throws FetchError for any status outside 2xx.
    static void checkStatus(std::string const& target, unsigned status);
};
