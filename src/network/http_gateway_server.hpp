#ifndef PROMPTGUARD_NETWORK_HTTP_GATEWAY_SERVER_HPP
#define PROMPTGUARD_NETWORK_HTTP_GATEWAY_SERVER_HPP

#include <atomic>
#include <cstdint>
#include <string>
#include <thread>
#include "../gateway/gateway.hpp"
#include "../util/thread_pool.hpp"

namespace promptguard {
namespace network {

/*
  HttpGatewayServer
  --------------------------------------------------------
  A minimal HTTP/1.1 front end for the Gateway.

  Endpoints:
    POST /chat     {"message": "...", "session": "..."}  -> {"response": "..."}
    GET  /health                       -> {"status":"healthy","protected":bool,"ready":bool}

  "session" is optional. Messages that share a session id share
  one vault, so placeholders from earlier turns can be restored.
  A message without one is scanned in a one-shot session that is
  closed as soon as the reply is built.

  One request per connection (Connection: close). The accept
  loop runs on its own thread and hands every connection to a
  fixed-size ThreadPool, so a slow generation only occupies one
  worker. Request bodies above kMaxBodyBytes are refused.
*/

struct HttpResponse
{
    int status;
    std::string contentType;
    std::string body;
};

class HttpGatewayServer {
  public:
    static constexpr size_t kMaxBodyBytes = 1024 * 1024;

    HttpGatewayServer(gateway::Gateway& gw, uint16_t port = 5000, size_t workerThreads = 4)
        : m_gateway(gw), m_port(port), m_pool(workerThreads), m_running(false), m_serverFd(-1) {}

    ~HttpGatewayServer() { Stop(); }

    HttpGatewayServer(const HttpGatewayServer&) = delete;
    HttpGatewayServer& operator=(const HttpGatewayServer&) = delete;

    /**
     * @brief Bind and start the accept thread.
     * @return false if already running or the port cannot be bound.
     */
    bool Start();

    /// Stop accepting, finish in-flight requests, join the accept thread.
    void Stop();

    bool IsRunning() const { return m_running.load(); }

    uint16_t Port() const { return m_port; }

    /**
     * @brief Route one parsed request to the gateway. Socket-free, used by tests.
     */
    static HttpResponse routeRequest(gateway::Gateway& gw,
                                     const std::string& method,
                                     const std::string& path,
                                     const std::string& body);

  private:
    void run();
    void handleClient(int fd);
    static void sendResponse(int fd, const HttpResponse& response);
    static const char* reasonPhrase(int status);

    gateway::Gateway& m_gateway;
    uint16_t m_port;
    util::ThreadPool m_pool;
    std::atomic_bool m_running;
    int m_serverFd;
    std::thread m_thread;
};

} // namespace network
} // namespace promptguard

#endif // PROMPTGUARD_NETWORK_HTTP_GATEWAY_SERVER_HPP
