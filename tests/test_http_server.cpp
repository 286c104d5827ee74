#include <gtest/gtest.h>
#include "api/http_server.hpp"
#include "core/logging.hpp"

#define CPPHTTPLIB_OPENSSL_SUPPORT
#include <httplib.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <set>
#include <thread>
#include <vector>
#include <unistd.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

// ── Auth helpers ────────────────────────────────────────────

TEST(HttpAuth, Base64Decode) {
    std::string out;
    ASSERT_TRUE(HttpServer::base64_decode("YWRtaW46cGFzc3dvcmQ=", out));
    EXPECT_EQ(out, "admin:password");

    ASSERT_TRUE(HttpServer::base64_decode("YTpi", out));
    EXPECT_EQ(out, "a:b");

    ASSERT_TRUE(HttpServer::base64_decode("YTo=", out));
    EXPECT_EQ(out, "a:");

    EXPECT_FALSE(HttpServer::base64_decode("abc", out));
    EXPECT_FALSE(HttpServer::base64_decode("!!!!", out));
}

TEST(HttpAuth, ConstantTimeEquals) {
    EXPECT_TRUE(HttpServer::constant_time_equals("secret", "secret"));
    EXPECT_TRUE(HttpServer::constant_time_equals("", ""));
    EXPECT_FALSE(HttpServer::constant_time_equals("secret", "secreT"));
    EXPECT_FALSE(HttpServer::constant_time_equals("secret", "secrets"));
}

TEST(HttpAuth, BasicCredentials) {
    HttpServer::Options opts;
    opts.username = "admin";
    opts.password = "password";

    EXPECT_TRUE(HttpServer::authorized("Basic YWRtaW46cGFzc3dvcmQ=", opts));
    EXPECT_TRUE(HttpServer::authorized("basic YWRtaW46cGFzc3dvcmQ=", opts));
    // admin:wrong
    EXPECT_FALSE(HttpServer::authorized("Basic YWRtaW46d3Jvbmc=", opts));
    EXPECT_FALSE(HttpServer::authorized("Basic not-base64", opts));
    EXPECT_FALSE(HttpServer::authorized("", opts));
}

TEST(HttpAuth, BearerTokenWhenConfigured) {
    HttpServer::Options opts;
    opts.username = "admin";
    opts.password = "password";
    opts.token = "t0ken";

    EXPECT_TRUE(HttpServer::authorized("Bearer t0ken", opts));
    EXPECT_FALSE(HttpServer::authorized("Bearer nope", opts));
    // Basic still works alongside a token
    EXPECT_TRUE(HttpServer::authorized("Basic YWRtaW46cGFzc3dvcmQ=", opts));
}

TEST(HttpAuth, BearerIgnoredWithoutToken) {
    HttpServer::Options opts;
    opts.username = "admin";
    opts.password = "password";
    EXPECT_FALSE(HttpServer::authorized("Bearer anything", opts));
}

TEST(HttpAuth, OpenWhenNothingConfigured) {
    HttpServer::Options opts;
    EXPECT_TRUE(HttpServer::authorized("", opts));
}

// ── Live server ─────────────────────────────────────────────

class FlagBackend : public Backend {
public:
    ActionResult start(const Site& site) override {
        std::lock_guard<std::mutex> lock(mu_);
        running_.insert(site.name);
        return ActionResult::ok("Started " + site.name);
    }
    ActionResult stop(const Site& site) override {
        std::lock_guard<std::mutex> lock(mu_);
        running_.erase(site.name);
        return ActionResult::ok("Stopped " + site.name);
    }
    ProbeResult status(const Site& site) override {
        std::lock_guard<std::mutex> lock(mu_);
        ProbeResult probe;
        if (running_.count(site.name)) {
            probe.state = RunState::Running;
            probe.pid = 99;
        }
        return probe;
    }
    BackendMode mode() const override { return BackendMode::Background; }

private:
    std::mutex mu_;
    std::set<std::string> running_;
};

class HttpServerTest : public ::testing::Test {
protected:
    std::string test_dir;
    std::unique_ptr<Config> config;
    std::unique_ptr<SiteRegistry> registry;
    std::unique_ptr<Supervisor> supervisor;
    std::unique_ptr<HttpServer> server;

    void SetUp() override {
        init_logging("off");
        test_dir = (fs::temp_directory_path() / ("pisite-test-http-" + std::to_string(::getpid()))).string();
        fs::create_directories(test_dir + "/site");
        setenv("PSM_CONFIG_DIR", (test_dir + "/cfg").c_str(), 1);

        config = std::make_unique<Config>();
        SiteInfo info;
        info.name = "demo";
        info.cwd = test_dir + "/site";
        info.cmd = "sleep 30";
        info.port = 3000;
        config->data().sites.push_back(info);
        registry = std::make_unique<SiteRegistry>(*config);
        supervisor = std::make_unique<Supervisor>(*registry, std::make_unique<FlagBackend>(),
                                                  Supervisor::Options{0, 20});

        HttpServer::Options opts;
        opts.host = "127.0.0.1";
        opts.port = 0;
        opts.username = "admin";
        opts.password = "password";
        server = std::make_unique<HttpServer>(*supervisor, opts);
        ASSERT_TRUE(server->start());
        ASSERT_GT(server->port(), 0);
    }

    void TearDown() override {
        if (server) server->stop();
        server.reset();
        supervisor.reset();
        registry.reset();
        config.reset();
        unsetenv("PSM_CONFIG_DIR");
        fs::remove_all(test_dir);
    }

    httplib::Client client() {
        httplib::Client cli("127.0.0.1", server->port());
        cli.set_basic_auth("admin", "password");
        cli.set_read_timeout(5, 0);
        return cli;
    }
};

TEST_F(HttpServerTest, RejectsMissingCredentials) {
    httplib::Client cli("127.0.0.1", server->port());
    auto res = cli.Get("/api/status");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 401);
    EXPECT_EQ(res->get_header_value("WWW-Authenticate"), "Basic");
}

TEST_F(HttpServerTest, StatusListsSites) {
    auto cli = client();
    auto res = cli.Get("/api/status");
    ASSERT_TRUE(res);
    ASSERT_EQ(res->status, 200);

    auto arr = json::parse(res->body);
    ASSERT_EQ(arr.size(), 1u);
    EXPECT_EQ(arr[0]["name"], "demo");
    EXPECT_EQ(arr[0]["running"], false);
    EXPECT_EQ(arr[0]["port"], 3000);

    auto missing = cli.Get("/api/status/ghost");
    ASSERT_TRUE(missing);
    EXPECT_EQ(missing->status, 404);
}

TEST_F(HttpServerTest, ActionStartsAndStops) {
    auto cli = client();
    auto res = cli.Post("/action", httplib::Params{{"name", "demo"}, {"op", "start"}});
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_TRUE(supervisor->status("demo").status.running());

    auto one = cli.Get("/api/status/demo");
    ASSERT_TRUE(one);
    EXPECT_EQ(json::parse(one->body)["pid"], 99);

    res = cli.Post("/action", httplib::Params{{"name", "demo"}, {"op", "stop"}});
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_FALSE(supervisor->status("demo").status.running());
}

TEST_F(HttpServerTest, ActionErrors) {
    auto cli = client();
    auto res = cli.Post("/action", httplib::Params{{"name", "ghost"}, {"op", "start"}});
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 404);

    res = cli.Post("/action", httplib::Params{{"name", "demo"}, {"op", "explode"}});
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
}

TEST_F(HttpServerTest, LogsReturnsPlainTail) {
    {
        std::ofstream out(test_dir + "/site/activity.log");
        out << "a\nb\nc\n";
    }
    auto cli = client();
    auto res = cli.Get("/api/logs/demo?lines=2");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(res->body, "b\nc");

    res = cli.Get("/api/logs/demo?lines=many");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
}

TEST_F(HttpServerTest, AddAndDeleteSite) {
    auto cli = client();
    httplib::Params form{
        {"name", "blog"}, {"cwd", test_dir + "/site"}, {"cmd", "sleep 30"},
        {"port", "4000"}, {"autorestart", "on"}
    };
    auto res = cli.Post("/api/sites", form);
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200) << res->body;
    auto blog = registry->get("blog");
    ASSERT_TRUE(blog.has_value());
    EXPECT_EQ(blog->port, 4000);
    EXPECT_TRUE(blog->autorestart);
    EXPECT_FALSE(blog->autostart);

    res = cli.Post("/api/sites", form);
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 409);

    res = cli.Post("/api/sites", httplib::Params{{"name", "../x"}, {"cwd", test_dir}, {"cmd", "true"}});
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);

    res = cli.Post("/api/sites/delete", httplib::Params{{"name", "blog"}});
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_FALSE(registry->contains("blog"));
}

TEST_F(HttpServerTest, StreamStartsWithClearEvent) {
    auto cli = client();
    std::string received;
    auto res = cli.Get("/stream/demo", [&](const char* data, size_t len) {
        received.append(data, len);
        // Stop reading once the first event arrived
        return received.find("\n\n") == std::string::npos;
    });
    EXPECT_EQ(received.rfind("data: __CLEAR__\n\n", 0), 0u);
}

TEST_F(HttpServerTest, StreamUnknownSiteIs404) {
    auto cli = client();
    auto res = cli.Get("/stream/ghost");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 404);
}

// Holds a log stream open on a thread until the server stops
static std::thread open_viewer(int port, std::atomic<int>& connected) {
    return std::thread([port, &connected] {
        httplib::Client cli("127.0.0.1", port);
        cli.set_basic_auth("admin", "password");
        cli.set_read_timeout(30, 0);
        bool counted = false;
        auto res = cli.Get("/stream/demo", [&](const char* data, size_t len) {
            if (!counted && std::string(data, len).find("__CLEAR__") != std::string::npos) {
                counted = true;
                ++connected;
            }
            return true;
        });
        (void)res;
    });
}

static bool wait_for_count(const std::atomic<int>& count, int want) {
    for (int i = 0; i < 100 && count.load() < want; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return count.load() >= want;
}

TEST_F(HttpServerTest, ApiAnswersWhileManyStreamsAreOpen) {
    std::atomic<int> connected{0};
    std::vector<std::thread> viewers;
    for (int i = 0; i < 10; ++i) viewers.push_back(open_viewer(server->port(), connected));
    ASSERT_TRUE(wait_for_count(connected, 10));

    auto cli = client();
    auto status = cli.Get("/api/status");
    ASSERT_TRUE(status);
    EXPECT_EQ(status->status, 200);

    httplib::Params params{{"name", "demo"}, {"op", "start"}};
    auto action = cli.Post("/action", params);
    ASSERT_TRUE(action);
    EXPECT_EQ(action->status, 200);

    server->stop();
    for (auto& t : viewers) t.join();
}

TEST_F(HttpServerTest, StreamsBeyondTheCapAreRefused) {
    server->stop();

    HttpServer::Options opts;
    opts.host = "127.0.0.1";
    opts.port = 0;
    opts.username = "admin";
    opts.password = "password";
    opts.max_streams = 1;
    server = std::make_unique<HttpServer>(*supervisor, opts);
    ASSERT_TRUE(server->start());

    std::atomic<int> connected{0};
    std::thread viewer = open_viewer(server->port(), connected);
    ASSERT_TRUE(wait_for_count(connected, 1));

    auto cli = client();
    auto refused = cli.Get("/stream/demo");
    ASSERT_TRUE(refused);
    EXPECT_EQ(refused->status, 503);

    // API routes are not counted against the cap
    auto status = cli.Get("/api/status");
    ASSERT_TRUE(status);
    EXPECT_EQ(status->status, 200);

    server->stop();
    viewer.join();
}
