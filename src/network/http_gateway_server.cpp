#include "network/http_gateway_server.hpp"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include "service/json_codec.hpp"
#include "util/hashing.hpp"
#include "util/logger.hpp"
#include "util/text_utils.hpp"

namespace promptguard {
namespace network {

namespace {

std::string jsonReply(const std::string& text) {
    return "{\"response\":\"" + service::escapeJson(text) + "\"}";
}

HttpResponse badRequest() {
    return {400, "application/json", jsonReply("Error: invalid request")};
}

// Client session ids: 1-128 characters from [A-Za-z0-9_.-].
bool isValidSessionId(const std::string& id) {
    if (id.empty() || id.size() > 128)
        return false;
    for (unsigned char c : id) {
        if (!std::isalnum(c) && c != '_' && c != '-' && c != '.')
            return false;
    }
    return true;
}

} // namespace

bool HttpGatewayServer::Start() {
    if (m_running.load())
        return false;

    int server_fd = socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd < 0) {
        util::logger::error("[HttpGatewayServer] socket() failed: " + std::string(std::strerror(errno)));
        return false;
    }
    int opt = 1;
    setsockopt(server_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(m_port);
    addr.sin_addr.s_addr = INADDR_ANY;
    if (bind(server_fd, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        util::logger::error("[HttpGatewayServer] cannot bind port " + std::to_string(m_port) + ": "
                            + std::string(std::strerror(errno)));
        close(server_fd);
        return false;
    }
    if (listen(server_fd, 64) < 0) {
        util::logger::error("[HttpGatewayServer] listen() failed: " + std::string(std::strerror(errno)));
        close(server_fd);
        return false;
    }

    m_serverFd = server_fd;
    m_running = true;
    m_thread = std::thread([this]() { run(); });
    util::logger::info("[HttpGatewayServer] listening on port " + std::to_string(m_port)
                       + " with " + std::to_string(m_pool.size()) + " workers");
    return true;
}

void HttpGatewayServer::Stop() {
    if (!m_running.exchange(false))
        return;
    if (m_thread.joinable())
        m_thread.join();
    size_t inFlight = m_pool.pending() + m_pool.active();
    if (inFlight > 0) {
        util::logger::info("[HttpGatewayServer] finishing " + std::to_string(inFlight) + " in-flight requests");
    }
    m_pool.shutdown();
    if (m_serverFd >= 0) {
        close(m_serverFd);
        m_serverFd = -1;
    }
    util::logger::info("[HttpGatewayServer] stopped");
}

void HttpGatewayServer::run() {
    while (m_running.load()) {
        pollfd pfd{};
        pfd.fd = m_serverFd;
        pfd.events = POLLIN;
        int ready = poll(&pfd, 1, 500);
        if (ready <= 0) {
            continue;
        }
        int client = accept(m_serverFd, nullptr, nullptr);
        if (client < 0) {
            continue;
        }
        timeval tv{};
        tv.tv_sec = 10;
        setsockopt(client, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        try {
            m_pool.enqueue([this, client]() {
                handleClient(client);
                close(client);
            });
        }
        catch (const std::runtime_error& ex) {
            util::logger::warn("[HttpGatewayServer] dropping connection: " + std::string(ex.what()));
            close(client);
        }
    }
}

void HttpGatewayServer::handleClient(int fd) {
    std::string raw;
    char buffer[4096];
    size_t headerEnd = std::string::npos;
    while (headerEnd == std::string::npos) {
        ssize_t n = recv(fd, buffer, sizeof(buffer), 0);
        if (n <= 0)
            return;
        raw.append(buffer, static_cast<size_t>(n));
        headerEnd = raw.find("\r\n\r\n");
        if (headerEnd == std::string::npos && raw.size() > 64 * 1024) {
            sendResponse(fd, badRequest());
            return;
        }
    }

    std::istringstream head(raw.substr(0, headerEnd));
    std::string requestLine;
    std::getline(head, requestLine);
    util::text::trim(requestLine);
    std::istringstream rl(requestLine);
    std::string method, path, version;
    rl >> method >> path >> version;
    if (method.empty() || path.empty()) {
        sendResponse(fd, badRequest());
        return;
    }

    size_t contentLength = 0;
    std::string line;
    while (std::getline(head, line)) {
        auto colon = line.find(':');
        if (colon == std::string::npos)
            continue;
        std::string name = util::text::toLower(line.substr(0, colon));
        std::string value = line.substr(colon + 1);
        util::text::trim(name);
        util::text::trim(value);
        if (name == "content-length") {
            contentLength = static_cast<size_t>(std::strtoull(value.c_str(), nullptr, 10));
        }
    }
    if (contentLength > kMaxBodyBytes) {
        sendResponse(fd, {413, "application/json", jsonReply("Error: invalid request")});
        return;
    }

    std::string body = raw.substr(headerEnd + 4);
    while (body.size() < contentLength) {
        ssize_t n = recv(fd, buffer, sizeof(buffer), 0);
        if (n <= 0) {
            sendResponse(fd, badRequest());
            return;
        }
        body.append(buffer, static_cast<size_t>(n));
    }
    body.resize(contentLength);

    HttpResponse response{500, "application/json", jsonReply("Error: internal error")};
    try {
        response = routeRequest(m_gateway, method, path, body);
    }
    catch (const std::exception& ex) {
        util::logger::error("[HttpGatewayServer] " + method + " " + path + " failed: " + ex.what());
    }
    sendResponse(fd, response);
}

HttpResponse HttpGatewayServer::routeRequest(gateway::Gateway& gw,
                                             const std::string& method,
                                             const std::string& path,
                                             const std::string& body) {
    std::string route = path.substr(0, path.find('?'));

    if (route == "/health") {
        if (method != "GET")
            return {405, "application/json", "{\"error\":\"method not allowed\"}"};
        gateway::GatewayStatus s = gw.status();
        std::stringstream ss;
        ss << "{\"status\":\"healthy\",\"protected\":" << (s.protectedMode ? "true" : "false")
           << ",\"ready\":" << (s.ready ? "true" : "false") << "}";
        return {200, "application/json", ss.str()};
    }

    if (route == "/chat") {
        if (method != "POST")
            return {405, "application/json", "{\"error\":\"method not allowed\"}"};
        std::optional<std::string> message;
        std::optional<std::string> session;
        try {
            message = service::extractStringField(body, "message");
            session = service::extractStringField(body, "session");
        }
        catch (const std::runtime_error& ex) {
            util::logger::warn("[HttpGatewayServer] malformed /chat body: " + std::string(ex.what()));
            return badRequest();
        }
        if (!message) {
            return badRequest();
        }
        if (session && !isValidSessionId(*session)) {
            return badRequest();
        }
        if (session) {
            gateway::GatewayReply reply = gw.handleMessage(*message, *session);
            return {200, "application/json", jsonReply(reply.response)};
        }
        // No session: the request is its own conversation. '~' cannot appear in
        // a client id, so the one-shot id never collides with one.
        const std::string oneShot = "~" + util::hashing::randomHex(8);
        gateway::GatewayReply reply = gw.handleMessage(*message, oneShot);
        gw.endSession(oneShot);
        return {200, "application/json", jsonReply(reply.response)};
    }

    return {404, "text/plain", "Not Found"};
}

const char* HttpGatewayServer::reasonPhrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        default:  return "Internal Server Error";
    }
}

void HttpGatewayServer::sendResponse(int fd, const HttpResponse& response) {
    std::stringstream ss;
    ss << "HTTP/1.1 " << response.status << " " << reasonPhrase(response.status)
       << "\r\nContent-Type: " << response.contentType
       << "\r\nContent-Length: " << response.body.size()
       << "\r\nConnection: close\r\n\r\n"
       << response.body;
    std::string resp = ss.str();
    size_t sent = 0;
    while (sent < resp.size()) {
        ssize_t n = send(fd, resp.c_str() + sent, resp.size() - sent, MSG_NOSIGNAL);
        if (n <= 0)
            return;
        sent += static_cast<size_t>(n);
    }
}

} // namespace network
} // namespace promptguard
