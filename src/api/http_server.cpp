#include "api/http_server.hpp"
#include "daemon/protocol.hpp"

#define CPPHTTPLIB_OPENSSL_SUPPORT
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <cctype>
#include <thread>

using json = nlohmann::json;

static constexpr int SSE_BATCH_MS = 250;
static constexpr int SSE_KEEPALIVE_MS = 10000;
// Workers left for API requests while every stream slot is taken
static constexpr int API_WORKERS = 8;

// ── Auth helpers ────────────────────────────────────────────

bool HttpServer::base64_decode(const std::string& in, std::string& out) {
    out.clear();
    if (in.empty()) return true;
    if (in.size() % 4 != 0) return false;

    std::string buf(in.size() / 4 * 3, '\0');
    int n = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(&buf[0]),
                            reinterpret_cast<const unsigned char*>(in.data()),
                            static_cast<int>(in.size()));
    if (n < 0) return false;

    // EVP_DecodeBlock counts padding bytes as output
    size_t len = static_cast<size_t>(n);
    if (in[in.size() - 1] == '=') len--;
    if (in[in.size() - 2] == '=') len--;
    buf.resize(len);
    out = std::move(buf);
    return true;
}

bool HttpServer::constant_time_equals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    if (a.empty()) return true;
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

bool HttpServer::authorized(const std::string& authorization, const Options& opts) {
    static const std::string bearer = "Bearer ";
    static const std::string basic = "Basic ";

    if (!opts.token.empty() && authorization.compare(0, bearer.size(), bearer) == 0) {
        std::string presented = authorization.substr(bearer.size());
        while (!presented.empty() && presented.back() == ' ') presented.pop_back();
        return constant_time_equals(presented, opts.token);
    }

    if (authorization.size() > basic.size()) {
        std::string scheme = authorization.substr(0, basic.size());
        for (auto& c : scheme) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        if (scheme == "basic ") {
            std::string decoded;
            if (!base64_decode(authorization.substr(basic.size()), decoded)) return false;
            size_t colon = decoded.find(':');
            if (colon == std::string::npos) return false;
            bool user_ok = constant_time_equals(decoded.substr(0, colon), opts.username);
            bool pass_ok = constant_time_equals(decoded.substr(colon + 1), opts.password);
            return user_ok && pass_ok;
        }
    }

    return opts.username.empty() && opts.password.empty() && opts.token.empty();
}

// ── Server ──────────────────────────────────────────────────

struct HttpServer::Impl {
    Supervisor& supervisor;
    Options opts;
    httplib::Server server;
    std::thread thread;
    std::atomic<bool> stopping{false};
    std::atomic<bool> listening{false};
    std::atomic<int> active_streams{0};
    int bound_port = -1;

    Impl(Supervisor& sup, Options o) : supervisor(sup), opts(std::move(o)) {
        if (opts.max_streams < 1) opts.max_streams = 1;
        // Each open stream holds a worker for its whole lifetime
        size_t workers = static_cast<size_t>(opts.max_streams + API_WORKERS);
        server.new_task_queue = [workers] { return new httplib::ThreadPool(workers); };
    }

    static void text(httplib::Response& res, int status, const std::string& body) {
        res.status = status;
        res.set_content(body, "text/plain; charset=utf-8");
    }

    static int http_status(SupervisorError error) {
        switch (error) {
            case SupervisorError::NotFound: return 404;
            case SupervisorError::IOError: return 500;
            case SupervisorError::BackendError: return 500;
            case SupervisorError::None: break;
        }
        return 200;
    }

    static bool form_flag(const httplib::Request& req, const char* key) {
        if (!req.has_param(key)) return false;
        std::string v = req.get_param_value(key);
        for (auto& c : v) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        return v == "true" || v == "1" || v == "on" || v == "yes";
    }

    void setup_routes();
    void stream(const httplib::Request& req, httplib::Response& res);
};

void HttpServer::Impl::setup_routes() {
    server.set_pre_routing_handler([this](const httplib::Request& req, httplib::Response& res) {
        if (authorized(req.get_header_value("Authorization"), opts)) {
            return httplib::Server::HandlerResponse::Unhandled;
        }
        res.set_header("WWW-Authenticate", "Basic");
        text(res, 401, "Not authenticated");
        return httplib::Server::HandlerResponse::Handled;
    });

    server.Get("/api/status", [this](const httplib::Request&, httplib::Response& res) {
        json arr = json::array();
        for (const auto& st : supervisor.status_all()) {
            arr.push_back(Protocol::status_to_json(st));
        }
        res.set_content(arr.dump(), "application/json");
    });

    server.Get(R"(/api/status/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        auto result = supervisor.status(req.matches[1]);
        if (!result.success) {
            text(res, http_status(result.error), result.message);
            return;
        }
        res.set_content(Protocol::status_to_json(result.status).dump(), "application/json");
    });

    server.Get(R"(/api/logs/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        int lines = LogTailer::DEFAULT_LINES;
        if (req.has_param("lines")) {
            try {
                lines = std::stoi(req.get_param_value("lines"));
            } catch (const std::exception&) {
                text(res, 400, "Invalid lines parameter");
                return;
            }
        }
        auto result = supervisor.tail(req.matches[1], lines);
        if (!result.success) {
            text(res, http_status(result.error), result.message);
            return;
        }
        std::string body;
        for (size_t i = 0; i < result.lines.size(); ++i) {
            if (i > 0) body += '\n';
            body += result.lines[i];
        }
        text(res, 200, body);
    });

    server.Post("/action", [this](const httplib::Request& req, httplib::Response& res) {
        std::string name = req.get_param_value("name");
        std::string op = req.get_param_value("op");
        if (!supervisor.registry().contains(name)) {
            text(res, 404, "Site not found");
            return;
        }

        ActionResult result;
        if (op == "start") {
            result = supervisor.start(name);
        } else if (op == "stop") {
            result = supervisor.stop(name);
        } else if (op == "restart") {
            result = supervisor.restart(name);
        } else {
            text(res, 400, "Unknown op");
            return;
        }
        text(res, result.success ? 200 : http_status(result.error), result.message);
    });

    server.Get(R"(/stream/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        stream(req, res);
    });

    server.Post("/api/sites", [this](const httplib::Request& req, httplib::Response& res) {
        Site site;
        site.name = req.get_param_value("name");
        site.cwd = req.get_param_value("cwd");
        site.cmd = req.get_param_value("cmd");
        site.log = req.has_param("log") ? req.get_param_value("log") : "activity.log";
        if (site.log.empty()) site.log = "activity.log";
        std::string port = req.get_param_value("port");
        if (!port.empty()) {
            try {
                site.port = std::stoi(port);
            } catch (const std::exception&) {
                text(res, 400, "Invalid port: " + port);
                return;
            }
        }
        site.autostart = form_flag(req, "autostart");
        site.autorestart = form_flag(req, "autorestart");

        if (!SiteRegistry::is_valid_name(site.name)) {
            text(res, 400, "Invalid name (letters, digits, '-' and '_' only).");
            return;
        }
        if (supervisor.registry().contains(site.name)) {
            text(res, 409, "A site with that name already exists.");
            return;
        }

        bool start_after = form_flag(req, "start_after_add");
        auto result = supervisor.add_site(site, start_after);
        if (!result.success && !supervisor.registry().contains(site.name)) {
            text(res, 400, result.message);
            return;
        }
        text(res, result.success ? 200 : http_status(result.error), result.message);
    });

    server.Post("/api/sites/delete", [this](const httplib::Request& req, httplib::Response& res) {
        auto result = supervisor.remove_site(req.get_param_value("name"));
        text(res, result.success ? 200 : http_status(result.error), result.message);
    });

    server.Post("/api/reload", [this](const httplib::Request&, httplib::Response& res) {
        if (!supervisor.registry().reload()) {
            text(res, 500, "Failed to reload config");
            return;
        }
        text(res, 200, "Config reloaded");
    });
}

struct StreamState {
    explicit StreamState(LogCursor c) : cursor(std::move(c)) {}
    LogCursor cursor;
    bool cleared = false;
    std::chrono::steady_clock::time_point last_keepalive = std::chrono::steady_clock::now();
};

void HttpServer::Impl::stream(const httplib::Request& req, httplib::Response& res) {
    std::string name = req.matches[1];
    auto cursor = supervisor.open_cursor(name);
    if (!cursor) {
        text(res, 404, "Site not found");
        return;
    }

    if (++active_streams > opts.max_streams) {
        --active_streams;
        spdlog::warn("[HTTP] Refusing log stream for {}: {} viewers open", name, opts.max_streams);
        res.set_header("Retry-After", "5");
        text(res, 503, "Too many log viewers");
        return;
    }

    auto state = std::make_shared<StreamState>(std::move(*cursor));
    res.set_header("Cache-Control", "no-cache");
    res.set_chunked_content_provider("text/event-stream",
        [this, state, name](size_t, httplib::DataSink& sink) {
            if (!state->cleared) {
                state->cleared = true;
                static const std::string clear = "data: __CLEAR__\n\n";
                return sink.write(clear.data(), clear.size());
            }

            for (int slept = 0; slept < SSE_BATCH_MS && !stopping.load(); slept += 50) {
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
            if (stopping.load()) {
                sink.done();
                return true;
            }

            auto polled = state->cursor.poll();
            if (!polled.success) {
                spdlog::warn("[HTTP] Log stream for {} ended: {}", name, polled.error);
                sink.done();
                return true;
            }

            std::string payload;
            if (!polled.lines.empty()) {
                for (const auto& line : polled.lines) {
                    payload += "data: " + line + "\n";
                }
                payload += "\n";
            }
            auto now = std::chrono::steady_clock::now();
            if (now - state->last_keepalive >= std::chrono::milliseconds(SSE_KEEPALIVE_MS)) {
                payload += ": keep-alive\n\n";
                state->last_keepalive = now;
            }
            if (payload.empty()) return true;
            // false here means the viewer went away
            return sink.write(payload.data(), payload.size());
        },
        [this](bool) { --active_streams; });
}

HttpServer::HttpServer(Supervisor& supervisor, Options opts)
    : impl_(std::make_unique<Impl>(supervisor, std::move(opts))) {
    impl_->setup_routes();
}

HttpServer::~HttpServer() {
    stop();
}

bool HttpServer::start() {
    if (impl_->listening.load()) return true;
    impl_->stopping.store(false);

    auto& opts = impl_->opts;
    if (opts.port == 0) {
        impl_->bound_port = impl_->server.bind_to_any_port(opts.host);
    } else if (impl_->server.bind_to_port(opts.host, opts.port)) {
        impl_->bound_port = opts.port;
    } else {
        impl_->bound_port = -1;
    }
    if (impl_->bound_port <= 0) {
        spdlog::error("[HTTP] Cannot bind {}:{}", opts.host, opts.port);
        return false;
    }

    impl_->listening.store(true);
    impl_->thread = std::thread([this]() {
        impl_->server.listen_after_bind();
        impl_->listening.store(false);
    });
    spdlog::info("[HTTP] Listening on http://{}:{}", opts.host, impl_->bound_port);
    return true;
}

void HttpServer::stop() {
    impl_->stopping.store(true);
    impl_->server.stop();
    if (impl_->thread.joinable()) {
        impl_->thread.join();
    }
    impl_->listening.store(false);
}

bool HttpServer::running() const {
    return impl_->listening.load();
}

int HttpServer::port() const {
    return impl_->bound_port;
}
