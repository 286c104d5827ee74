#pragma once

#include "supervisor/supervisor.hpp"

#include <memory>
#include <string>

/// JSON/plain-text HTTP API with a Server-Sent Events log stream.
class HttpServer {
public:
    struct Options {
        std::string host = "127.0.0.1";
        int port = 8000;                // 0 = pick any free port
        std::string username;
        std::string password;
        std::string token;
        int max_streams = 16;           // open log streams; more get 503
    };

    HttpServer(Supervisor& supervisor, Options opts);
    ~HttpServer();

    /// Bind and serve on a background thread
    bool start();

    /// Stop accepting, end open streams and join the thread
    void stop();

    bool running() const;

    /// Port actually bound (differs from Options::port when it was 0)
    int port() const;

    // Auth helpers

    /// Decode standard base64; false on malformed input
    static bool base64_decode(const std::string& in, std::string& out);

    static bool constant_time_equals(const std::string& a, const std::string& b);

    /// Bearer token when configured, HTTP Basic otherwise;
    /// open when no credential is configured at all
    static bool authorized(const std::string& authorization, const Options& opts);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};
