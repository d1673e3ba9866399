#include <contractrunner/server.hpp>

#include <algorithm>   // std::max
#include <chrono>      // std::chrono::seconds
#include <csignal>     // SIGINT, SIGTERM
#include <cstddef>     // std::size_t
#include <cstdint>     // std::uint64_t
#include <exception>   // std::exception
#include <format>      // std::format
#include <memory>      // std::enable_shared_from_this, std::make_shared
#include <optional>    // std::optional
#include <string>      // std::string
#include <string_view> // std::string_view
#include <utility>     // std::move

#include <boost/asio/error.hpp>       // boost::asio::error::operation_aborted
#include <boost/asio/ip/address.hpp>  // boost::asio::ip::make_address
#include <boost/asio/post.hpp>        // boost::asio::post
#include <boost/asio/socket_base.hpp> // boost::asio::socket_base
#include <boost/beast/core.hpp>       // boost::beast::bind_front_handler, boost::beast::error_code, boost::beast::flat_buffer, boost::beast::tcp_stream
#include <boost/beast/http.hpp>       // boost::beast::http::async_read, boost::beast::http::async_write, boost::beast::http::field, boost::beast::http::request_parser, boost::beast::http::verb

#include <nlohmann/json.hpp> // nlohmann::json

#include <contractrunner/logging.hpp>      // logd, logging::error, logging::info, logging::warn
#include <contractrunner/orchestrator.hpp> // ContractRunner::Orchestrator
#include <contractrunner/request.hpp>      // ContractRunner::ExecutionRequest

namespace
{

namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

using namespace std::string_view_literals;

constexpr auto idle_timeout { std::chrono::seconds { 30 } };
constexpr auto text_plain { "text/plain; charset=utf-8"sv };

ContractRunner::http_response make_response(unsigned int version, bool keep_alive, unsigned int status_code, std::string body, std::string_view content_type)
{
    ContractRunner::http_response response;

    response.version(version);
    response.result(status_code);
    response.keep_alive(keep_alive);
    response.set(http::field::access_control_allow_origin, "*");
    response.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
    response.set(http::field::access_control_allow_headers, "Content-Type");

    if (!content_type.empty())
        response.set(http::field::content_type, content_type);

    response.body() = std::move(body);
    response.prepare_payload();

    return response;
}

ContractRunner::http_response make_response(const ContractRunner::http_request& request, unsigned int status_code, std::string body, std::string_view content_type = text_plain)
{
    return make_response(request.version(), request.keep_alive(), status_code, std::move(body), content_type);
}

/** Reads requests from one connection and writes back their responses, in order. */
class Session : public std::enable_shared_from_this<Session>
{
public:
    Session(tcp::socket socket, const ContractRunner::Orchestrator& orchestrator, boost::asio::thread_pool& workers, std::uint64_t body_limit) :
        m_stream { std::move(socket) }, m_orchestrator { orchestrator }, m_workers { workers }, m_body_limit { body_limit } { }

    void run() { read(); }

private:
    void read()
    {
        m_parser.emplace();
        m_parser->body_limit(m_body_limit);

        m_stream.expires_after(idle_timeout);

        http::async_read(m_stream, m_buffer, *m_parser, beast::bind_front_handler(&Session::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t)
    {
        if (ec == http::error::end_of_stream)
            return close();

        if (ec == http::error::body_limit)
            return send(make_response(11, false, 413, std::format("The request body exceeds {:d} bytes.", m_body_limit), text_plain));

        if (ec)
        {
            logd("Dropping a connection: {:s}", ec.message());
            return;
        }

        // The execution has its own deadline.
        m_stream.expires_never();

        boost::asio::post(m_workers, [self = shared_from_this(), request = m_parser->release()]
            {
                ContractRunner::http_response response;

                try
                {
                    response = ContractRunner::route(request, self->m_orchestrator);
                }
                catch (const std::exception& exception)
                {
                    logging::error("Could not handle `{:s}`: {:s}", std::string_view { request.target() }, exception.what());
                    response = make_response(request, 500, std::format("Server error: {:s}", exception.what()));
                }

                boost::asio::post(self->m_stream.get_executor(), [self, response = std::move(response)]() mutable
                    { self->send(std::move(response)); }); });
    }

    void send(ContractRunner::http_response response)
    {
        m_response = std::move(response);

        m_stream.expires_after(idle_timeout);

        http::async_write(m_stream, m_response, beast::bind_front_handler(&Session::on_write, shared_from_this(), m_response.keep_alive()));
    }

    void on_write(bool keep_alive, beast::error_code ec, std::size_t)
    {
        if (ec)
        {
            logd("Could not write a response: {:s}", ec.message());
            return;
        }

        if (!keep_alive)
            return close();

        read();
    }

    void close()
    {
        beast::error_code ec;
        m_stream.socket().shutdown(tcp::socket::shutdown_send, ec);
    }

    beast::tcp_stream m_stream;
    beast::flat_buffer m_buffer;
    std::optional<http::request_parser<http::string_body>> m_parser;
    ContractRunner::http_response m_response;

    const ContractRunner::Orchestrator& m_orchestrator;
    boost::asio::thread_pool& m_workers;
    std::uint64_t m_body_limit;
};

}

namespace ContractRunner
{

http_response route(const http_request& request, const Orchestrator& orchestrator)
{
    std::string_view target { request.target() };
    target = target.substr(0, target.find('?'));

    if (request.method() == http::verb::options)
        return make_response(request, 204, {}, {});

    if (target == "/health"sv)
    {
        if (request.method() != http::verb::get)
            return make_response(request, 405, "Method not allowed.");

        auto health = Orchestrator::health_check();

        return make_response(request, health.status_code, std::move(health.body), health.content_type);
    }

    if (target == "/run"sv)
    {
        if (request.method() != http::verb::post)
            return make_response(request, 405, "Method not allowed.");

        const auto json = nlohmann::json::parse(request.body(), nullptr, false);

        if (json.is_discarded() || !json.is_object())
            return make_response(request, 400, "The body must be a JSON object.");

        // Anything that is not a string is treated as missing.
        const auto field = [&json](const char* name)
        {
            const auto it = json.find(name);

            return it != json.end() && it->is_string() ? it->get<std::string>() : std::string {};
        };

        const ExecutionRequest execution_request {
            .contract_code = field("contractCode"),
            .test_code = field("testCode"),
            .entry_name = field("entryName")
        };

        auto response = orchestrator.handle(execution_request);

        return make_response(request, response.status_code, std::move(response.body), response.content_type);
    }

    return make_response(request, 404, "Not found.");
}

Server::Server(const Orchestrator& orchestrator, const server_args& args) :
    m_orchestrator { orchestrator },
    m_body_limit { args.body_limit },
    m_acceptor { m_context },
    m_signals { m_context, SIGINT, SIGTERM },
    m_workers { static_cast<std::size_t>(std::max<std::uint64_t>(args.n_jobs, 1)) }
{
    const tcp::endpoint endpoint { boost::asio::ip::make_address(args.address), args.port };

    m_acceptor.open(endpoint.protocol());
    m_acceptor.set_option(boost::asio::socket_base::reuse_address(true));
    m_acceptor.bind(endpoint);
    m_acceptor.listen(boost::asio::socket_base::max_listen_connections);

    m_signals.async_wait([this](boost::system::error_code ec, int signal)
        {
            if (ec)
                return;

            logging::info("Received signal {:d}, shutting down.", signal);
            stop(); });

    accept();
}

Server::~Server()
{
    stop();
    m_workers.join();
}

void Server::run()
{
    logging::info("Listening on {:s}:{:d}.", m_acceptor.local_endpoint().address().to_string(), m_acceptor.local_endpoint().port());

    m_context.run();

    // Requests already running are allowed to finish and clean up.
    m_workers.join();
}

void Server::stop()
{
    m_context.stop();
}

unsigned short Server::port() const
{
    return m_acceptor.local_endpoint().port();
}

void Server::accept()
{
    m_acceptor.async_accept(m_context, [this](beast::error_code ec, tcp::socket socket)
        {
            if (ec == boost::asio::error::operation_aborted)
                return;

            if (ec)
                logging::warn("Could not accept a connection: {:s}", ec.message());
            else
                std::make_shared<Session>(std::move(socket), m_orchestrator, m_workers, m_body_limit)->run();

            accept(); });
}

} // namespace ContractRunner
