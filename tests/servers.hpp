#pragma once

#include <crow.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <future>
#include <stdexcept>
#include <string>

namespace api::testing {

// An ephemeral loopback port the kernel just handed out; nothing listens on it.
inline int unused_port() {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) throw std::runtime_error("socket failed");

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    socklen_t len = sizeof(addr);
    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
        ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
        ::close(fd);
        throw std::runtime_error("bind failed");
    }
    ::close(fd);
    return ntohs(addr.sin_port);
}

// Loopback Crow app serving the routes the transport and client tests use.
class TestServer {
public:
    TestServer() : port(unused_port()) {
        app.loglevel(crow::LogLevel::Warning);

        CROW_ROUTE(app, "/ok")([] { return "ok"; });

        CROW_ROUTE(app, "/big")([] { return std::string(1 << 20, 'x'); });

        CROW_ROUTE(app, "/n/<int>")([](int n) { return std::to_string(n); });

        CROW_ROUTE(app, "/status/<int>")([](int code) {
            return crow::response(code, "status " + std::to_string(code));
        });

        CROW_ROUTE(app, "/auth")([](const crow::request& req) {
            return req.get_header_value("Authorization");
        });

        CROW_ROUTE(app, "/headers")([] {
            crow::response res(200, "with headers");
            res.add_header("X-Test", "yes");
            return res;
        });

        CROW_ROUTE(app, "/echo")
            .methods(crow::HTTPMethod::POST, crow::HTTPMethod::PUT)([](const crow::request& req) {
                crow::response res(200, req.body);
                res.add_header("X-Method", crow::method_name(req.method));
                res.add_header("X-Content-Type", req.get_header_value("Content-Type"));
                return res;
            });

        CROW_ROUTE(app, "/token").methods(crow::HTTPMethod::POST)([](const crow::request& req) {
            if (req.body.find("\"refresh_token\":\"good\"") == std::string::npos) {
                return crow::response(401, "{\"error\":\"invalid_grant\"}");
            }
            return crow::response(200, "{\"access_token\":\"fresh\",\"refresh_token\":\"next\"}");
        });

        running = app.bindaddr("127.0.0.1").port(port).concurrency(4).run_async();
        app.wait_for_server_start();
    }

    ~TestServer() {
        app.stop();
        running.wait();
    }

    std::string url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(port) + path;
    }

private:
    int port;
    crow::SimpleApp app;
    std::future<void> running;
};

// Accepts TCP connections (through the kernel backlog) and never answers.
class SilentServer {
public:
    SilentServer() {
        fd = ::socket(AF_INET, SOCK_STREAM, 0);
        if (fd < 0) throw std::runtime_error("socket failed");

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 || ::listen(fd, 16) != 0) {
            ::close(fd);
            throw std::runtime_error("bind/listen failed");
        }

        socklen_t len = sizeof(addr);
        ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);
        port = ntohs(addr.sin_port);
    }

    ~SilentServer() { ::close(fd); }

    SilentServer(const SilentServer&) = delete;
    SilentServer& operator=(const SilentServer&) = delete;

    std::string url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(port) + path;
    }

private:
    int fd = -1;
    int port = 0;
};

} // namespace api::testing
