#undef NDEBUG
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <asio/buffers_iterator.hpp>
#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/read.hpp>
#include <asio/read_until.hpp>
#include <asio/streambuf.hpp>
#include <asio/write.hpp>
#include <nlohmann/json.hpp>

#include "drcv/http.hpp"
#include "drcv/server/admin_app.hpp"
#include "drcv/server/cloudflare_tunnel.hpp"
#include "drcv/server/http_server.hpp"
#include "drcv/server/liveness.hpp"
#include "drcv/server/process.hpp"
#include "drcv/server/tunnel.hpp"
#include "drcv/server/upload_app.hpp"
#include "test_support.hpp"

using namespace drcv;
using namespace drcv::server;
using namespace drcv::testing;
using namespace std::chrono_literals;

namespace
{

    class FakeProcess : public Process
    {
    public:
        int wait() override
        {
            std::unique_lock lock(mutex_);
            exited_cv_.wait(lock, [this]
                            { return exited_; });
            return code_;
        }

        bool running() const override
        {
            std::lock_guard lock(mutex_);
            return !exited_;
        }

        void terminate(std::chrono::milliseconds /*grace*/) override { exit(143); }

        void exit(int code)
        {
            {
                std::lock_guard lock(mutex_);
                if (exited_)
                {
                    return;
                }
                exited_ = true;
                code_ = code;
            }
            exited_cv_.notify_all();
        }

    private:
        mutable std::mutex mutex_;
        std::condition_variable exited_cv_;
        bool exited_{false};
        int code_{0};
    };

    // Scripted stand-in for the cloudflared CLI.
    class FakeLauncher : public ProcessLauncher
    {
    public:
        bool installed{true};
        bool logged_in{true};

        CommandResult run(const std::vector<std::string> &argv, std::chrono::milliseconds /*timeout*/) override
        {
            std::lock_guard lock(mutex_);
            std::string line;
            for (const auto &arg : argv)
            {
                line += (line.empty() ? "" : " ") + arg;
            }
            commands_.push_back(line);

            if (!installed)
            {
                return {.exit_code = 127, .out = {}, .err = "exec failed", .timed_out = false};
            }
            if (argv.size() >= 2 && argv[1] == "--version")
            {
                return {.exit_code = 0, .out = "cloudflared version 2024.6.1\n", .err = {}, .timed_out = false};
            }
            if (argv.size() >= 3 && argv[1] == "tunnel" && argv[2] == "list")
            {
                if (!logged_in)
                {
                    return {.exit_code = 1,
                            .out = {},
                            .err = "Cannot determine default origin certificate path. Run cloudflared tunnel login",
                            .timed_out = false};
                }
                std::string listing = "ID                                   NAME          CREATED\n"
                                      "11111111-2222-4333-8444-555555555555 drcv-decoy0x  2024-05-01T12:00:00Z\n";
                for (std::size_t i = 0; i < tunnels_.size(); ++i)
                {
                    listing += "00000000-0000-4000-8000-00000000000" + std::to_string(i + 1) + " " + tunnels_[i] +
                               " 2024-05-01T12:00:00Z\n";
                }
                return {.exit_code = 0, .out = listing, .err = {}, .timed_out = false};
            }
            if (argv.size() >= 4 && argv[1] == "tunnel" && argv[2] == "create")
            {
                tunnels_.push_back(argv[3]);
                return {.exit_code = 0, .out = "Created tunnel " + argv[3] + "\n", .err = {}, .timed_out = false};
            }
            if (argv.size() >= 6 && argv[1] == "tunnel" && argv[2] == "route")
            {
                if (!routes_.insert(argv[5]).second)
                {
                    return {.exit_code = 1,
                            .out = {},
                            .err = "Failed to add route: code: 1003, reason: An A, AAAA, or CNAME record with that "
                                   "host already exists.",
                            .timed_out = false};
                }
                return {.exit_code = 0, .out = {}, .err = {}, .timed_out = false};
            }
            return {.exit_code = 1, .out = {}, .err = "unexpected command", .timed_out = false};
        }

        std::unique_ptr<Process> spawn(const std::vector<std::string> &argv, LineCallback on_stderr) override
        {
            auto process = std::make_unique<FakeProcess>();
            {
                std::lock_guard lock(mutex_);
                spawned_.push_back(argv);
                last_ = process.get();
            }
            if (on_stderr)
            {
                on_stderr("Registered tunnel connection");
            }
            return process;
        }

        std::size_t count(const std::string &prefix) const
        {
            std::lock_guard lock(mutex_);
            std::size_t matches = 0;
            for (const auto &command : commands_)
            {
                if (command.rfind(prefix, 0) == 0)
                {
                    ++matches;
                }
            }
            return matches;
        }

        std::size_t spawned() const
        {
            std::lock_guard lock(mutex_);
            return spawned_.size();
        }

        std::vector<std::string> last_spawn() const
        {
            std::lock_guard lock(mutex_);
            return spawned_.back();
        }

        FakeProcess *last_process() const
        {
            std::lock_guard lock(mutex_);
            return last_;
        }

    private:
        mutable std::mutex mutex_;
        std::vector<std::string> commands_;
        std::vector<std::string> tunnels_;
        std::set<std::string> routes_;
        std::vector<std::vector<std::string>> spawned_;
        FakeProcess *last_{nullptr};
    };

    template <typename Predicate>
    bool eventually(Predicate &&predicate, std::chrono::milliseconds limit = 3000ms)
    {
        const auto deadline = std::chrono::steady_clock::now() + limit;
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (predicate())
            {
                return true;
            }
            std::this_thread::sleep_for(5ms);
        }
        return predicate();
    }

    TunnelConfig tunnel_config(const std::filesystem::path &dir)
    {
        TunnelConfig config{};
        config.provider = "cloudflare";
        config.domain_root = "example.test";
        config.local_port = 8080;
        config.config_dir = dir / "cloudflared";
        config.max_restarts = 0;
        config.restart_backoff = 10ms;
        config.shutdown_grace = 50ms;
        return config;
    }

    std::optional<std::string> header_value(const http::Response &response, const std::string &name)
    {
        for (const auto &[key, value] : response.headers)
        {
            if (http::to_lower(key) == http::to_lower(name))
            {
                return value;
            }
        }
        return std::nullopt;
    }

    void test_tunnel_identifiers()
    {
        assert(is_valid_tunnel_identifier("abc123"));
        assert(!is_valid_tunnel_identifier("ABC123"));
        assert(!is_valid_tunnel_identifier("abc12"));
        assert(!is_valid_tunnel_identifier("abc-12"));

        auto launcher = std::make_shared<FakeLauncher>();
        assert(make_tunnel_provider("CloudFlare", launcher)->name() == "cloudflare");
        assert(expect_error<TunnelFailure>([&]
                                           { (void)make_tunnel_provider("ngrok", launcher); }) ==
               ErrorCode::TunnelError);
    }

    void test_tunnel_hostname_survives_restart()
    {
        const auto dir = fresh_directory("drcv_tunnel_persist");
        ManualClock clock;
        auto launcher = std::make_shared<FakeLauncher>();
        {
            Store store(dir / "drcv.db", clock.clock());
            EventBroadcaster events(64);
            const auto config = tunnel_config(dir);

            std::string first_hostname;
            {
                TunnelService service(config, store, events, make_tunnel_provider("cloudflare", launcher));
                service.start();
                service.wait_established();
                const auto status = service.status();
                assert(status.healthy);
                assert(status.state == TunnelState::Running);
                assert(status.hostname);
                first_hostname = *status.hostname;

                const auto identifier = store.get_fact(std::string(kCloudflareHostnameFact));
                assert(identifier && is_valid_tunnel_identifier(*identifier));
                assert(first_hostname == *identifier + ".example.test");
                assert(std::filesystem::exists(dir / "cloudflared" / ("config-" + first_hostname + ".yml")));

                const auto json = nlohmann::json(status);
                assert(json["url"] == "https://" + first_hostname);
                assert(launcher->last_spawn().back() == "run");

                service.stop();
                const auto stopped = service.status();
                assert(!stopped.healthy);
                assert(!stopped.hostname);
            }
            {
                TunnelService service(config, store, events, make_tunnel_provider("cloudflare", launcher));
                service.start();
                service.wait_established();
                assert(service.status().hostname == std::optional<std::string>(first_hostname));
            }
            assert(launcher->count("cloudflared tunnel create") == 1);
            assert(launcher->count("cloudflared tunnel route dns") == 2);
        }
        cleanup_path(dir);
    }

    void test_tunnel_dependency_missing()
    {
        const auto dir = fresh_directory("drcv_tunnel_missing");
        ManualClock clock;
        auto launcher = std::make_shared<FakeLauncher>();
        launcher->installed = false;
        {
            Store store(dir / "drcv.db", clock.clock());
            EventBroadcaster events(64);
            const auto config = tunnel_config(dir);

            CloudflareProvider provider(launcher);
            assert(expect_error<TunnelFailure>([&]
                                               { (void)provider.ensure(store, config); }) ==
                   ErrorCode::DependencyMissing);

            TunnelService service(config, store, events, std::make_unique<CloudflareProvider>(launcher));
            service.start();
            service.wait_established();
            const auto status = service.status();
            assert(status.state == TunnelState::Unavailable);
            assert(!status.healthy);
            assert(status.detail.find("not installed") != std::string::npos);
            assert(nlohmann::json(status)["hostname"].is_null());
            assert(!store.get_fact(std::string(kCloudflareHostnameFact)));

            launcher->installed = true;
            launcher->logged_in = false;
            assert(expect_error<TunnelFailure>([&]
                                               { (void)provider.ensure(store, config); }) == ErrorCode::TunnelError);
        }
        cleanup_path(dir);
    }

    void test_tunnel_process_exit()
    {
        const auto dir = fresh_directory("drcv_tunnel_exit");
        ManualClock clock;
        auto launcher = std::make_shared<FakeLauncher>();
        {
            Store store(dir / "drcv.db", clock.clock());
            EventBroadcaster events(64);
            auto subscription = events.subscribe();

            auto config = tunnel_config(dir);
            {
                TunnelService service(config, store, events, make_tunnel_provider("cloudflare", launcher));
                service.start();
                service.wait_established();
                assert(service.status().healthy);

                launcher->last_process()->exit(1);
                assert(eventually([&]
                                  { return !service.status().healthy; }));
                const auto status = service.status();
                assert(status.state == TunnelState::Unavailable);
                assert(!status.hostname);
                assert(status.detail.find("exited with code 1") != std::string::npos);
                assert(launcher->spawned() == 1);
            }

            // With a restart budget the supervisor brings the process back.
            config.max_restarts = 1;
            {
                TunnelService service(config, store, events, make_tunnel_provider("cloudflare", launcher));
                service.start();
                service.wait_established();
                launcher->last_process()->exit(2);
                assert(eventually([&]
                                  { return launcher->spawned() == 3 && service.status().healthy; }));
            }

            bool saw_unhealthy = false;
            for (const auto &event : subscription->drain())
            {
                if (event.type == EventType::TunnelStatus && event.payload["healthy"] == false &&
                    event.payload["detail"].get<std::string>().find("exited") != std::string::npos)
                {
                    saw_unhealthy = true;
                }
            }
            assert(saw_unhealthy);
        }
        cleanup_path(dir);
    }

    void test_resolve_client_address()
    {
        http::Request request;
        request.remote_address = "127.0.0.1";
        request.headers["cf-connecting-ip"] = "203.0.113.9";
        assert(resolve_client_address(request, true) == "203.0.113.9");
        assert(resolve_client_address(request, false) == "127.0.0.1");

        request.remote_address = "198.51.100.1";
        assert(resolve_client_address(request, true) == "198.51.100.1");

        request.headers.clear();
        request.remote_address = "::ffff:127.0.0.1";
        request.headers["x-forwarded-for"] = "203.0.113.5, 10.0.0.1";
        assert(resolve_client_address(request, true) == "203.0.113.5");

        request.headers["x-forwarded-for"] = "garbage";
        assert(resolve_client_address(request, true) == "::ffff:127.0.0.1");
    }

    http::Request make_request(const std::string &method, const std::string &target, const std::string &remote)
    {
        auto request = http::parse_request_head(method + " " + target + " HTTP/1.1\r\nHost: test\r\n\r\n").request;
        request.remote_address = remote;
        request.headers["user-agent"] = "drcv-test";
        return request;
    }

    http::Request chunk_request(const std::string &remote, const std::vector<std::pair<std::string, std::string>> &fields)
    {
        auto request = make_request("POST", "/upload", remote);
        request.headers["content-type"] = "multipart/form-data; boundary=drcvtest";
        for (const auto &[name, value] : fields)
        {
            request.body += "--drcvtest\r\nContent-Disposition: form-data; name=\"" + name + "\"";
            if (name == "chunk")
            {
                request.body += "; filename=\"blob\"\r\nContent-Type: application/octet-stream";
            }
            request.body += "\r\n\r\n" + value + "\r\n";
        }
        request.body += "--drcvtest--\r\n";
        return request;
    }

    void test_upload_app_routes()
    {
        EngineHarness h("drcv_upload_app");
        LivenessTracker liveness(h.store, h.engine, h.filesystem, h.events, LivenessSettings{});
        UploadApp app(h.engine, liveness, true);

        auto reply = app.handle(make_request("GET", "/upload?filename=doc.txt", "192.0.2.10"));
        assert(reply.response.status == 200);
        assert(header_value(reply.response, "x-upload-status") == std::optional<std::string>("init"));
        assert(header_value(reply.response, "x-chunk-size") == std::optional<std::string>("4"));
        const auto opening = nlohmann::json::parse(reply.response.body);
        assert(opening["uploaded_bytes"] == 0);
        const auto id = opening["upload_id"].get<std::int64_t>();
        assert(h.store.find_client("192.0.2.10"));

        reply = app.handle(chunk_request("192.0.2.10", {{"filename", "doc.txt"}, {"chunk_index", "0"},
                                                        {"total_chunks", "2"}, {"chunk", "ABCD"}}));
        assert(reply.response.status == 200);
        assert(reply.response.body == std::to_string(id));
        assert(header_value(reply.response, "x-uploaded-bytes") == std::optional<std::string>("4"));

        reply = app.handle(chunk_request("192.0.2.10", {{"filename", "doc.txt"}, {"chunk_index", "1"},
                                                        {"total_chunks", "2"}, {"chunk", "EFGHI"}}));
        assert(reply.response.status == 400);
        assert(nlohmann::json::parse(reply.response.body)["error"] == "invalid_chunk");
        assert(header_value(reply.response, "x-uploaded-bytes") == std::optional<std::string>("4"));

        // The chunk part's filename attribute is not consulted when the field is present.
        reply = app.handle(chunk_request("192.0.2.10", {{"filename", "doc.txt"}, {"chunk_index", "1"},
                                                        {"total_chunks", "2"}, {"chunk", "EF"}}));
        assert(header_value(reply.response, "x-upload-status") == std::optional<std::string>("complete"));
        assert(read_file(h.filesystem.root() / "doc.txt") == "ABCDEF");

        reply = app.handle(chunk_request("192.0.2.10", {{"filename", "doc.txt"}, {"chunk_index", "one"},
                                                        {"total_chunks", "2"}, {"chunk", "ABCD"}}));
        assert(reply.response.status == 400);
        assert(nlohmann::json::parse(reply.response.body)["error"] == "invalid_request");

        auto not_multipart = make_request("POST", "/upload", "192.0.2.10");
        not_multipart.headers["content-type"] = "application/json";
        assert(app.handle(not_multipart).response.status == 400);

        auto heartbeat = make_request("POST", "/heartbeat", "192.0.2.10");
        heartbeat.body = nlohmann::json{{"upload_ids", {id, 4242}}}.dump();
        reply = app.handle(heartbeat);
        assert(reply.response.status == 200);
        assert(nlohmann::json::parse(reply.response.body)["ignored"] == 2);

        heartbeat.body = "not json";
        assert(app.handle(heartbeat).response.status == 400);
        heartbeat.body = R"({"upload_ids": ["seven"]})";
        assert(app.handle(heartbeat).response.status == 400);

        reply = app.handle(make_request("PUT", "/upload", "192.0.2.10"));
        assert(reply.response.status == 405);
        assert(header_value(reply.response, "Allow"));
        assert(app.handle(make_request("GET", "/heartbeat", "192.0.2.10")).response.status == 405);
        assert(app.handle(make_request("GET", "/missing", "192.0.2.10")).response.status == 404);
        assert(app.handle(make_request("GET", "/upload", "192.0.2.10")).response.status == 400);
        assert(app.handle(make_request("GET", "/", "192.0.2.10")).response.status == 200);
    }

    void test_admin_app_routes()
    {
        EngineHarness h("drcv_admin_app");
        TunnelService tunnel(TunnelConfig{}, h.store, h.events, nullptr);
        AdminApp admin(h.store, h.events, tunnel, h.engine, 2);

        h.send("alpha-1.bin", "10.0.0.1", 0, 1, "A");
        h.send("alpha-2.bin", "10.0.0.1", 0, 1, "B");
        h.send("beta.bin", "10.0.0.2", 0, 1, "C");
        h.store.touch_client("10.0.0.1", "curl/8");

        auto reply = admin.handle(make_request("GET", "/data?page=0", "127.0.0.1"));
        assert(reply.response.status == 200);
        auto body = nlohmann::json::parse(reply.response.body);
        assert(body["page"] == 1);
        assert(body["page_size"] == 2);
        assert(body["total"] == 3);
        assert(body["uploads"].size() == 2);
        assert(body["uploads"][0]["filename"] == "beta.bin");

        body = nlohmann::json::parse(admin.handle(make_request("GET", "/data?page=2", "127.0.0.1")).response.body);
        assert(body["uploads"].size() == 1);
        body = nlohmann::json::parse(admin.handle(make_request("GET", "/data?page=-4&q=alpha", "127.0.0.1")).response.body);
        assert(body["page"] == 1);
        assert(body["total"] == 2);
        assert(admin.handle(make_request("GET", "/data?page=two", "127.0.0.1")).response.status == 400);

        body = nlohmann::json::parse(admin.handle(make_request("GET", "/clients", "127.0.0.1")).response.body);
        assert(body["clients"].size() == 1);
        assert(body["clients"][0]["address"] == "10.0.0.1");

        body = nlohmann::json::parse(admin.handle(make_request("GET", "/tunnel", "127.0.0.1")).response.body);
        assert(body["state"] == "unavailable");
        assert(body["healthy"] == false);
        assert(body["hostname"].is_null());
        assert(body["detail"] == "tunnel disabled");

        body = nlohmann::json::parse(admin.handle(make_request("GET", "/stats", "127.0.0.1")).response.body);
        assert(body["uploads"]["complete"] == 3);
        assert(body["clients"]["total"] == 1);
        assert(body["open_sessions"] == 0);

        reply = admin.handle(make_request("POST", "/data", "127.0.0.1"));
        assert(reply.response.status == 405);
        assert(admin.handle(make_request("GET", "/nope", "127.0.0.1")).response.status == 404);

        const auto before = h.events.subscriber_count();
        {
            auto stream = admin.handle(make_request("GET", "/events", "127.0.0.1"));
            assert(stream.stream);
            assert(header_value(stream.response, "Content-Type") == std::optional<std::string>("text/event-stream"));
            assert(h.events.subscriber_count() == before + 1);
        }
        // A stream that never started does not keep its subscription alive.
        assert(h.events.subscriber_count() == before);
    }

    std::string read_response(asio::ip::tcp::socket &socket)
    {
        std::string data;
        std::error_code ec;
        asio::read(socket, asio::dynamic_buffer(data), ec);
        assert(ec == asio::error::eof || !ec);
        return data;
    }

    void test_http_listener_roundtrip()
    {
        asio::io_context io_context;
        HttpListener listener(io_context, ListenerOptions{.name = "Test", .address = "127.0.0.1", .port = 0, .body_limit = 16},
                              [](const http::Request &request)
                              {
                                  HttpReply reply;
                                  reply.response = http::text_response(200, request.method + " " + request.path + " " +
                                                                                request.body + " " +
                                                                                request.remote_address);
                                  return reply;
                              });
        listener.start();
        std::thread runner([&io_context]
                           { io_context.run(); });
        const asio::ip::tcp::endpoint endpoint(asio::ip::make_address("127.0.0.1"), listener.port());

        {
            asio::ip::tcp::socket socket(io_context);
            socket.connect(endpoint);
            const std::string request = "POST /echo HTTP/1.1\r\nHost: x\r\nContent-Length: 5\r\nConnection: close\r\n\r\nhello";
            asio::write(socket, asio::buffer(request));
            const auto response = read_response(socket);
            assert(response.rfind("HTTP/1.1 200 OK\r\n", 0) == 0);
            assert(response.find("Connection: close") != std::string::npos);
            assert(response.substr(response.size() - 26) == "POST /echo hello 127.0.0.1");
        }
        {
            asio::ip::tcp::socket socket(io_context);
            socket.connect(endpoint);
            const std::string request = "POST /echo HTTP/1.1\r\nHost: x\r\nContent-Length: 100\r\n\r\n";
            asio::write(socket, asio::buffer(request));
            const auto response = read_response(socket);
            assert(response.rfind("HTTP/1.1 413 ", 0) == 0);
            assert(response.find("payload_too_large") != std::string::npos);
        }
        {
            asio::ip::tcp::socket socket(io_context);
            socket.connect(endpoint);
            const std::string request = "POST /echo HTTP/1.1\r\nHost: x\r\nTransfer-Encoding: chunked\r\n\r\n";
            asio::write(socket, asio::buffer(request));
            assert(read_response(socket).rfind("HTTP/1.1 501 ", 0) == 0);
        }

        io_context.stop();
        runner.join();
        listener.stop();
    }

    void test_event_stream_over_socket()
    {
        EngineHarness h("drcv_event_stream");
        TunnelService tunnel(TunnelConfig{}, h.store, h.events, nullptr);
        AdminApp admin(h.store, h.events, tunnel, h.engine, 10);

        asio::io_context io_context;
        HttpListener listener(io_context,
                              ListenerOptions{.name = "Admin", .address = "127.0.0.1", .port = 0, .body_limit = 1024},
                              [&admin](const http::Request &request)
                              { return admin.handle(request); });
        listener.start();
        std::thread runner([&io_context]
                           { io_context.run(); });

        {
            asio::ip::tcp::socket socket(io_context);
            socket.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), listener.port()));
            const std::string request = "GET /events HTTP/1.1\r\nHost: x\r\n\r\n";
            asio::write(socket, asio::buffer(request));

            asio::streambuf buffer;
            asio::read_until(socket, buffer, "\r\n\r\n");
            assert(h.events.subscriber_count() == 1);

            h.send("live.bin", "10.0.0.9", 0, 2, "AAAA");
            asio::read_until(socket, buffer, "\"type\":\"upload_progress\"}\n\n");
            const std::string received(asio::buffers_begin(buffer.data()), asio::buffers_end(buffer.data()));
            assert(received.find("text/event-stream") != std::string::npos);
            assert(received.find("event: upload_created\ndata: ") != std::string::npos);
            assert(received.find("\"filename\":\"live.bin\"") != std::string::npos);

            std::error_code ec;
            socket.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
            socket.close(ec);
        }
        assert(eventually([&]
                          { return h.events.subscriber_count() == 0; }));

        io_context.stop();
        runner.join();
        listener.stop();
    }

    void test_event_stream_stalled_reader()
    {
        EngineHarness h("drcv_event_stream_stalled");
        TunnelService tunnel(TunnelConfig{}, h.store, h.events, nullptr);
        AdminApp admin(h.store, h.events, tunnel, h.engine, 10);

        asio::io_context io_context;
        HttpListener listener(io_context,
                              ListenerOptions{.name = "Admin", .address = "127.0.0.1", .port = 0, .body_limit = 1024},
                              [&admin](const http::Request &request)
                              { return admin.handle(request); });
        listener.start();
        std::thread runner([&io_context]
                           { io_context.run(); });

        {
            asio::ip::tcp::socket socket(io_context);
            socket.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), listener.port()));
            const std::string request = "GET /events HTTP/1.1\r\nHost: x\r\n\r\n";
            asio::write(socket, asio::buffer(request));
            asio::streambuf buffer;
            asio::read_until(socket, buffer, "\r\n\r\n");
            assert(h.events.subscriber_count() == 1);

            // The client stops reading; far more than the socket buffers can hold is published.
            const std::string filler(256 * 1024, 'x');
            for (int i = 0; i < 200; ++i)
            {
                h.events.publish(EventType::TunnelStatus, nlohmann::json{{"detail", filler}, {"seq", i}});
            }
            assert(eventually([&]
                              { return h.events.dropped_total() > 0; }));

            std::error_code ec;
            socket.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
            socket.close(ec);
        }
        assert(eventually([&]
                          { return h.events.subscriber_count() == 0; }));

        io_context.stop();
        runner.join();
        listener.stop();
    }

} // namespace

void run_server_surface_tests()
{
    test_tunnel_identifiers();
    test_tunnel_hostname_survives_restart();
    test_tunnel_dependency_missing();
    test_tunnel_process_exit();
    test_resolve_client_address();
    test_upload_app_routes();
    test_admin_app_routes();
    test_http_listener_roundtrip();
    test_event_stream_over_socket();
    test_event_stream_stalled_reader();
}
