#ifndef CONTRACTRUNNER_SERVER_HPP
#define CONTRACTRUNNER_SERVER_HPP

#include <cstdint> // std::uint64_t
#include <string>  // std::string

#include <boost/asio/io_context.hpp>  // boost::asio::io_context
#include <boost/asio/ip/tcp.hpp>      // boost::asio::ip::tcp
#include <boost/asio/signal_set.hpp>  // boost::asio::signal_set
#include <boost/asio/thread_pool.hpp> // boost::asio::thread_pool
#include <boost/beast/http.hpp>       // boost::beast::http::request, boost::beast::http::response, boost::beast::http::string_body

#include <contractrunner/orchestrator.hpp> // ContractRunner::Orchestrator

/**
 * @file
 * @brief The HTTP front end.
 */
namespace ContractRunner
{

using http_request = boost::beast::http::request<boost::beast::http::string_body>;
using http_response = boost::beast::http::response<boost::beast::http::string_body>;

/** Arguments for the ContractRunner::Server. */
struct server_args
{
    /** The address to listen on. */
    std::string address;

    /** The port to listen on. If zero, a free port is chosen. */
    unsigned short port;

    /** The amount of requests that can be executed at the same time. */
    std::uint64_t n_jobs;

    /** The maximum size of a request body, in bytes. */
    std::uint64_t body_limit;
};

/**
 * Maps an HTTP request to the orchestrator:
 *
 * - `POST /run` with a JSON object `{ "contractCode", "testCode", "entryName" }`.
 * - `GET /health`.
 * - `OPTIONS` on any target, for browser preflights.
 *
 * Malformed bodies are answered with 400, unknown targets with 404 and unsupported methods with 405.
 * Every response allows any origin.
 */
[[nodiscard]] http_response route(const http_request& request, const Orchestrator& orchestrator);

/**
 * Accepts connections on a single thread and runs the requests on a pool of
 * server_args::n_jobs threads, so a slow sandbox never blocks the other connections.
 */
class Server
{
public:
    /**
     * Binds the listening socket.
     *
     * @throws boost::system::system_error if the address cannot be bound.
     */
    Server(const Orchestrator& orchestrator, const server_args& args);

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    ~Server();

    /** Serves until stop() is called or the process receives `SIGINT` or `SIGTERM`. */
    void run();

    /** Stops accepting connections and makes run() return. Can be called from any thread. */
    void stop();

    /** The port the server is listening on. */
    [[nodiscard]] unsigned short port() const;

private:
    void accept();

    const Orchestrator& m_orchestrator;
    std::uint64_t m_body_limit;

    boost::asio::io_context m_context;
    boost::asio::ip::tcp::acceptor m_acceptor;
    boost::asio::signal_set m_signals;
    boost::asio::thread_pool m_workers;
};

} // namespace ContractRunner

#endif
