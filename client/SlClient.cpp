#include <boost/asio/redirect_error.hpp>
#include "ConfigurationManager.hpp"
#include "Errors.hpp"
#include "SlClient.hpp"

SlClient::SlClient(boost::asio::io_context& ioc, std::chrono::seconds requestTimeout)
        : ioContext(ioc)
        , sslContext(boost::asio::ssl::context::tlsv12_client)
        , timeout(requestTimeout)
    {
        sslContext.set_options(
            boost::asio::ssl::context::default_workarounds
            | boost::asio::ssl::context::no_sslv2
            | boost::asio::ssl::context::single_dh_use
        );

        sslContext.set_default_verify_paths();
        sslContext.set_verify_mode(boost::asio::ssl::verify_peer);
    }


void SlClient::configureTlsStream(boost::beast::ssl_stream<boost::beast::tcp_stream>& stream)
{
    if (!SSL_set_tlsext_host_name(stream.native_handle(), ConfigurationManager::SL_HOST.c_str()))
    {
        throw boost::beast::system_error(boost::system::error_code(static_cast<int>(::ERR_get_error()), boost::asio::error::get_ssl_category()), "Failed to set SNI");
    }
    stream.set_verify_callback(boost::asio::ssl::host_name_verification(ConfigurationManager::SL_HOST));
}

boost::asio::awaitable<boost::asio::ip::tcp::resolver::results_type> SlClient::resolve(boost::asio::ip::tcp::resolver& resolver)
{
    boost::asio::ip::tcp::resolver::results_type results = co_await resolver.async_resolve(ConfigurationManager::SL_HOST, ConfigurationManager::SL_PORT, boost::asio::use_awaitable);
    co_return results;
}

boost::asio::awaitable<void> SlClient::connect(boost::asio::ip::tcp::resolver::results_type results, boost::beast::ssl_stream<boost::beast::tcp_stream>& stream)
{
    boost::beast::get_lowest_layer(stream).expires_after(timeout);
    co_await boost::beast::get_lowest_layer(stream).async_connect(results, boost::asio::use_awaitable);

    boost::beast::get_lowest_layer(stream).expires_after(timeout);
    co_await stream.async_handshake(boost::asio::ssl::stream_base::client, boost::asio::use_awaitable);
    co_return;
}

boost::beast::http::request<boost::beast::http::string_body> SlClient::buildGetRequest(std::string const& target) const
{
    boost::beast::http::request<boost::beast::http::string_body> request(boost::beast::http::verb::get, target, 11);
    request.set(boost::beast::http::field::host, ConfigurationManager::SL_HOST);
    request.set(boost::beast::http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    request.set(boost::beast::http::field::accept, "application/json");

    return request;
}

boost::asio::awaitable<void> SlClient::sendRequest(boost::beast::ssl_stream<boost::beast::tcp_stream>& stream, boost::beast::http::request<boost::beast::http::string_body> const& request)
{
    boost::beast::get_lowest_layer(stream).expires_after(timeout);
    co_await boost::beast::http::async_write(stream, request, boost::asio::use_awaitable);
}

boost::asio::awaitable<boost::beast::http::response<boost::beast::http::string_body>> SlClient::readResponse(boost::beast::ssl_stream<boost::beast::tcp_stream>& stream)
{
    boost::beast::http::response<boost::beast::http::string_body> response;
    boost::beast::flat_buffer buffer;
    boost::beast::get_lowest_layer(stream).expires_after(timeout);
    co_await boost::beast::http::async_read(stream, buffer, response, boost::asio::use_awaitable);
    co_return response;
}

boost::asio::awaitable<void> SlClient::shutdownStream(boost::beast::ssl_stream<boost::beast::tcp_stream>& stream)
{
    // Servers routinely drop the connection instead of answering close_notify.
    boost::system::error_code ec;
    boost::beast::get_lowest_layer(stream).expires_after(timeout);
    co_await stream.async_shutdown(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    co_return;
}

boost::asio::awaitable<std::string> SlClient::get(std::string const& target)
{
    boost::beast::http::response<boost::beast::http::string_body> response;

    try
    {
        auto executor = co_await boost::asio::this_coro::executor;
        boost::asio::ip::tcp::resolver resolver(ioContext);
        boost::beast::ssl_stream<boost::beast::tcp_stream> stream(executor, sslContext);

        configureTlsStream(stream);
        boost::asio::ip::tcp::resolver::results_type results = co_await resolve(resolver);
        co_await connect(results, stream);
        boost::beast::http::request<boost::beast::http::string_body> request = buildGetRequest(target);
        co_await sendRequest(stream, request);
        response = co_await readResponse(stream);
        co_await shutdownStream(stream);
    }
    catch (boost::system::system_error const& e)
    {
        throw FetchError("GET " + target + " failed: " + e.what());
    }

    checkStatus(target, response.result_int());
    co_return response.body();
}

void SlClient::checkStatus(std::string const& target, unsigned status)
{
    if (status < 200 || status >= 300)
    {
        throw FetchError("GET " + target + " returned HTTP " + std::to_string(status));
    }
}

boost::asio::awaitable<std::string> SlClient::fetchDepartures(std::string const& siteId)
{
    co_return co_await get(ConfigurationManager::departuresPath(siteId));
}

boost::asio::awaitable<std::string> SlClient::fetchSites()
{
    co_return co_await get(ConfigurationManager::sitesPath());
}
