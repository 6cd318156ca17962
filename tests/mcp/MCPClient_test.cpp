#include "mcp/MCPClient.hpp"
#include "MockTransport.hpp"
#include "core/Errors.hpp"
#include "mcp/JsonRpc.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <future>
#include <thread>

using namespace mcp_host;
using namespace std::chrono_literals;

namespace {

template <typename Predicate>
bool wait_until(Predicate predicate, std::chrono::milliseconds timeout = 2000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(5ms);
    }
    return predicate();
}

std::string method_of(const json& message) {
    return message.value("method", "");
}

} // namespace

class MCPClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.name = "notes";
        config_.command = "notes-mcp";

        options_.request_timeout = 500ms;
        options_.shutdown_timeout = 200ms;
        options_.poll_interval = 20ms;
    }

    std::unique_ptr<MCPClient> make_client() {
        auto client = std::make_unique<MCPClient>(config_, options_, mock_.factory());
        client->add_listener([this](const ClientEvent& event) {
            std::lock_guard<std::mutex> lock(events_mutex_);
            events_.push_back(event);
        });
        return client;
    }

    std::vector<ClientEvent::Type> event_types() {
        std::lock_guard<std::mutex> lock(events_mutex_);
        std::vector<ClientEvent::Type> types;
        for (const auto& event : events_) {
            types.push_back(event.type);
        }
        return types;
    }

    std::vector<ClientEvent> events_of(ClientEvent::Type type) {
        std::lock_guard<std::mutex> lock(events_mutex_);
        std::vector<ClientEvent> matching;
        for (const auto& event : events_) {
            if (event.type == type) {
                matching.push_back(event);
            }
        }
        return matching;
    }

    // Default behaviour except for the named method, which is left unanswered
    void ignore_method(const std::string& ignored) {
        mock_.set_responder([ignored](MockServer& server, const json& message) {
            if (method_of(message) != ignored) {
                server.standard_reply(message);
            }
        });
    }

    MockServer mock_;
    ServerConfig config_;
    ClientOptions options_;

    std::mutex events_mutex_;
    std::vector<ClientEvent> events_;
};

TEST_F(MCPClientTest, HandshakeListsTools) {
    auto client = make_client();
    client->start();

    EXPECT_EQ(client->status(), ConnectionStatus::Connected);
    EXPECT_FALSE(client->last_error().has_value());
    EXPECT_EQ(client->server_info()["name"], "mock-server");
    EXPECT_EQ(client->pid(), 4242);

    auto tools = client->tools();
    ASSERT_EQ(tools.size(), 2);
    EXPECT_EQ(tools[0].name, "echo");
    EXPECT_EQ(tools[0].description, "Echo the arguments back");
    EXPECT_EQ(tools[0].input_schema["type"], "object");
    EXPECT_EQ(tools[1].name, "add");
    EXPECT_TRUE(tools[1].input_schema.is_null());

    auto written = mock_.written();
    ASSERT_EQ(written.size(), 3);
    EXPECT_EQ(method_of(written[0]), "initialize");
    EXPECT_EQ(written[0]["params"]["protocolVersion"], "2024-11-05");
    EXPECT_EQ(written[0]["params"]["clientInfo"]["name"], "mcp-host");
    EXPECT_TRUE(written[0]["params"]["capabilities"].contains("tools"));
    EXPECT_EQ(method_of(written[1]), "notifications/initialized");
    EXPECT_FALSE(written[1].contains("id"));
    EXPECT_EQ(method_of(written[2]), "tools/list");

    auto types = event_types();
    ASSERT_EQ(types.size(), 2);
    EXPECT_EQ(types[0], ClientEvent::Type::Tools);
    EXPECT_EQ(types[1], ClientEvent::Type::Connected);
}

TEST_F(MCPClientTest, StartWhenConnectedIsNoOp) {
    auto client = make_client();
    client->start();
    client->start();

    EXPECT_EQ(mock_.opens(), 1);
    EXPECT_EQ(client->status(), ConnectionStatus::Connected);
}

TEST_F(MCPClientTest, InitializeErrorFailsStart) {
    mock_.set_responder([](MockServer& server, const json& message) {
        if (method_of(message) == "initialize") {
            server.respond_error(message, -32600, "Unsupported protocol version");
        }
    });

    auto client = make_client();
    try {
        client->start();
        FAIL() << "Expected RpcError";
    } catch (const RpcError& e) {
        EXPECT_EQ(e.code(), -32600);
    }

    EXPECT_EQ(client->status(), ConnectionStatus::Error);
    EXPECT_EQ(client->last_error(), "Unsupported protocol version");
    EXPECT_EQ(mock_.terminations(), 1);

    auto methods = mock_.written_methods();
    EXPECT_EQ(std::count(methods.begin(), methods.end(), "notifications/initialized"), 0);

    auto errors = events_of(ClientEvent::Type::Error);
    ASSERT_EQ(errors.size(), 1);
    EXPECT_EQ(errors[0].message, "Unsupported protocol version");
}

TEST_F(MCPClientTest, ToolsListFailureFailsStart) {
    mock_.set_responder([](MockServer& server, const json& message) {
        if (method_of(message) == "tools/list") {
            server.respond_error(message, -32603, "Index not ready");
        } else {
            server.standard_reply(message);
        }
    });

    auto client = make_client();
    EXPECT_THROW(client->start(), RpcError);
    EXPECT_EQ(client->status(), ConnectionStatus::Error);
    EXPECT_TRUE(client->tools().empty());
    EXPECT_FALSE(client->pid().has_value());
    EXPECT_TRUE(events_of(ClientEvent::Type::Connected).empty());
}

TEST_F(MCPClientTest, SpawnFailureFailsStart) {
    mock_.fail_next_open("Failed to spawn 'notes-mcp': command not found (No such file or directory)");

    auto client = make_client();
    EXPECT_THROW(client->start(), SpawnError);
    EXPECT_EQ(client->status(), ConnectionStatus::Error);
    ASSERT_TRUE(client->last_error().has_value());
    EXPECT_NE(client->last_error()->find("command not found"), std::string::npos);
    EXPECT_TRUE(mock_.written().empty());

    // The next attempt spawns normally
    client->start();
    EXPECT_EQ(client->status(), ConnectionStatus::Connected);
    EXPECT_FALSE(client->last_error().has_value());
}

TEST_F(MCPClientTest, UnsupportedTransportFailsStart) {
    config_.transport = TransportKind::Http;
    config_.url = "http://localhost:1234/mcp";

    auto client = make_client();
    try {
        client->start();
        FAIL() << "Expected McpError";
    } catch (const McpError& e) {
        EXPECT_NE(std::string(e.what()).find("Unsupported transport"), std::string::npos);
    }
    EXPECT_EQ(mock_.opens(), 0);
    EXPECT_EQ(client->status(), ConnectionStatus::Error);
}

TEST_F(MCPClientTest, ExitDuringInitializeFailsStart) {
    mock_.set_responder([](MockServer& server, const json& message) {
        if (method_of(message) == "initialize") {
            server.push_stderr("fatal: vault not found\n");
            server.exit(3);
        }
    });

    auto client = make_client();
    try {
        client->start();
        FAIL() << "Expected ConnectionClosedError";
    } catch (const ConnectionClosedError& e) {
        EXPECT_STREQ(e.what(), "Connection closed: Exit code 3");
    }
    EXPECT_EQ(client->status(), ConnectionStatus::Error);
}

TEST_F(MCPClientTest, CallToolWhenNotConnected) {
    auto client = make_client();

    EXPECT_THROW(client->call_tool("echo", {{"text", "hi"}}), NotConnectedError);
    EXPECT_TRUE(mock_.written().empty());
}

TEST_F(MCPClientTest, CallToolRoundTrip) {
    auto client = make_client();
    client->start();

    auto result = client->call_tool("echo", {{"text", "hi"}});

    EXPECT_FALSE(result.is_error);
    ASSERT_EQ(result.content.size(), 1);
    EXPECT_EQ(result.content[0]["type"], "text");
    EXPECT_EQ(json::parse(result.content[0]["text"].get<std::string>())["text"], "hi");

    auto written = mock_.written();
    const auto& call = written.back();
    EXPECT_EQ(method_of(call), "tools/call");
    EXPECT_EQ(call["params"]["name"], "echo");
    EXPECT_EQ(call["params"]["arguments"]["text"], "hi");
}

TEST_F(MCPClientTest, ToolErrorResultIsPassedThrough) {
    mock_.set_responder([](MockServer& server, const json& message) {
        if (method_of(message) == "tools/call") {
            server.respond(message, {
                {"content", json::array({{{"type", "text"}, {"text", "Note not found"}}})},
                {"isError", true}
            });
        } else {
            server.standard_reply(message);
        }
    });

    auto client = make_client();
    client->start();
    auto result = client->call_tool("echo", json::object());

    EXPECT_TRUE(result.is_error);
    EXPECT_EQ(result.content[0]["text"], "Note not found");
    EXPECT_EQ(client->status(), ConnectionStatus::Connected);
}

TEST_F(MCPClientTest, RpcErrorKeepsConnection) {
    std::atomic<int> calls{0};
    mock_.set_responder([&calls](MockServer& server, const json& message) {
        if (method_of(message) == "tools/call" && calls++ == 0) {
            server.respond_error(message, -32602, "Invalid params");
        } else {
            server.standard_reply(message);
        }
    });

    auto client = make_client();
    client->start();

    try {
        client->call_tool("echo", {{"bad", true}});
        FAIL() << "Expected RpcError";
    } catch (const RpcError& e) {
        EXPECT_EQ(e.code(), -32602);
        EXPECT_STREQ(e.what(), "Invalid params");
    }

    EXPECT_EQ(client->status(), ConnectionStatus::Connected);
    EXPECT_FALSE(client->call_tool("echo", {{"text", "again"}}).is_error);
}

TEST_F(MCPClientTest, RequestTimeoutKeepsConnection) {
    ignore_method("tools/call");
    options_.request_timeout = 100ms;

    auto client = make_client();
    client->start();

    auto started = std::chrono::steady_clock::now();
    try {
        client->call_tool("echo", json::object());
        FAIL() << "Expected TimeoutError";
    } catch (const TimeoutError& e) {
        EXPECT_STREQ(e.what(), "Request timeout: tools/call");
    }
    EXPECT_LT(std::chrono::steady_clock::now() - started, 2s);

    EXPECT_EQ(client->status(), ConnectionStatus::Connected);
    EXPECT_EQ(client->pending_requests(), 0);
}

TEST_F(MCPClientTest, ExplicitRequestTimeoutOverridesDefault) {
    ignore_method("slow/op");

    auto client = make_client();
    client->start();

    auto future = client->send_request("slow/op", json::object(), 30ms);
    ASSERT_EQ(future.wait_for(1s), std::future_status::ready);
    EXPECT_THROW(future.get(), TimeoutError);
}

TEST_F(MCPClientTest, StopSendsShutdownAndRejectsPending) {
    ignore_method("slow/op");

    auto client = make_client();
    client->start();

    auto pending = client->send_request("slow/op", json::object());
    client->stop();

    EXPECT_THROW(pending.get(), ConnectionClosedError);
    EXPECT_EQ(client->status(), ConnectionStatus::Disconnected);
    EXPECT_EQ(client->pending_requests(), 0);
    EXPECT_FALSE(client->pid().has_value());

    auto methods = mock_.written_methods();
    EXPECT_NE(std::find(methods.begin(), methods.end(), "shutdown"), methods.end());
    EXPECT_EQ(events_of(ClientEvent::Type::Disconnected).size(), 1);

    // Stopping again changes nothing
    client->stop();
    EXPECT_EQ(events_of(ClientEvent::Type::Disconnected).size(), 1);
}

TEST_F(MCPClientTest, StopWithoutShutdownReply) {
    ignore_method("shutdown");

    auto client = make_client();
    client->start();

    auto started = std::chrono::steady_clock::now();
    client->stop();

    EXPECT_LT(std::chrono::steady_clock::now() - started, 2s);
    EXPECT_EQ(client->status(), ConnectionStatus::Disconnected);
}

TEST_F(MCPClientTest, RequestsAfterStopFailImmediately) {
    auto client = make_client();
    client->start();
    client->stop();

    auto future = client->send_request("tools/list", json::object());
    ASSERT_EQ(future.wait_for(0ms), std::future_status::ready);
    EXPECT_THROW(future.get(), ConnectionClosedError);
    EXPECT_THROW(client->send_notification("notifications/cancelled"), ConnectionClosedError);
}

TEST_F(MCPClientTest, UnsolicitedExitRejectsPendingAndDisconnects) {
    ignore_method("slow/op");

    auto client = make_client();
    client->start();

    auto pending = client->send_request("slow/op", json::object());
    mock_.exit(1);

    try {
        pending.get();
        FAIL() << "Expected ConnectionClosedError";
    } catch (const ConnectionClosedError& e) {
        EXPECT_STREQ(e.what(), "Connection closed: Exit code 1");
    }

    // Status flips before pending requests are rejected
    EXPECT_EQ(client->status(), ConnectionStatus::Disconnected);
    EXPECT_THROW(client->call_tool("echo", json::object()), NotConnectedError);

    ASSERT_TRUE(wait_until([&] { return !events_of(ClientEvent::Type::Disconnected).empty(); }));
    auto disconnects = events_of(ClientEvent::Type::Disconnected);
    ASSERT_EQ(disconnects.size(), 1);
    EXPECT_EQ(disconnects[0].message, "Exit code 1");
}

TEST_F(MCPClientTest, ClosedOutputTerminatesRunningProcess) {
    auto client = make_client();
    client->start();
    ASSERT_EQ(mock_.terminations(), 0);

    mock_.close_output();

    ASSERT_TRUE(wait_until([&] { return !events_of(ClientEvent::Type::Disconnected).empty(); }));
    EXPECT_EQ(events_of(ClientEvent::Type::Disconnected)[0].message, "Server closed its output");
    EXPECT_EQ(client->status(), ConnectionStatus::Disconnected);
    EXPECT_EQ(mock_.terminations(), 1);
    EXPECT_FALSE(client->pid().has_value());
}

TEST_F(MCPClientTest, ExitRightAfterHandshakeNeverLeavesStaleConnection) {
    for (int attempt = 0; attempt < 20; ++attempt) {
        MockServer server;
        server.set_responder([](MockServer& self, const json& message) {
            self.standard_reply(message);
            if (method_of(message) == "tools/list") {
                self.exit(0);
            }
        });

        std::atomic<int> disconnects{0};
        MCPClient client(config_, options_, server.factory());
        client.add_listener([&disconnects](const ClientEvent& event) {
            if (event.type == ClientEvent::Type::Disconnected) {
                ++disconnects;
            }
        });

        bool started = true;
        try {
            client.start();
        } catch (const ConnectionClosedError&) {
            started = false;
        }

        if (started) {
            // Either the close was seen before Connected, or it is reported afterwards
            ASSERT_TRUE(wait_until([&] { return disconnects.load() == 1; }));
            EXPECT_EQ(client.status(), ConnectionStatus::Disconnected);
        } else {
            EXPECT_EQ(client.status(), ConnectionStatus::Error);
            EXPECT_EQ(disconnects.load(), 0);
        }
    }
}

TEST_F(MCPClientTest, RestartAfterExitUsesNewIds) {
    auto client = make_client();
    client->start();
    mock_.exit(0);
    ASSERT_TRUE(wait_until([&] { return client->status() == ConnectionStatus::Disconnected; }));

    client->start();
    EXPECT_EQ(client->status(), ConnectionStatus::Connected);
    EXPECT_EQ(mock_.opens(), 2);

    std::vector<int64_t> init_ids;
    for (const auto& message : mock_.written()) {
        if (method_of(message) == "initialize") {
            init_ids.push_back(message["id"].get<int64_t>());
        }
    }
    ASSERT_EQ(init_ids.size(), 2);
    EXPECT_GT(init_ids[1], init_ids[0]);

    EXPECT_FALSE(client->call_tool("echo", json::object()).is_error);
}

TEST_F(MCPClientTest, MalformedOutputAndStderrAreIgnored) {
    mock_.set_responder([](MockServer& server, const json& message) {
        if (method_of(message) == "initialize") {
            server.push_stderr("Server starting on stdio\n");
            server.push_stdout("Loading vault...\n{broken json\n[1,2]\n");
        }
        if (method_of(message) == "tools/list") {
            // Duplicate response: the second copy finds nothing to settle
            server.standard_reply(message);
        }
        server.standard_reply(message);
    });

    auto client = make_client();
    client->start();

    EXPECT_EQ(client->status(), ConnectionStatus::Connected);
    EXPECT_EQ(client->tools().size(), 2);
    EXPECT_FALSE(client->call_tool("echo", {{"text", "ok"}}).is_error);
}

TEST_F(MCPClientTest, ResponseSplitAcrossChunks) {
    mock_.set_responder([](MockServer& server, const json& message) {
        if (method_of(message) == "tools/call") {
            std::string line = json{
                {"jsonrpc", "2.0"},
                {"id", message["id"]},
                {"result", {{"content", json::array({{{"type", "text"}, {"text", "split"}}})}}}
            }.dump() + "\n";
            server.push_stdout(line.substr(0, 10));
            server.push_stdout(line.substr(10));
        } else {
            server.standard_reply(message);
        }
    });

    auto client = make_client();
    client->start();

    EXPECT_EQ(client->call_tool("echo", json::object()).content[0]["text"], "split");
}

TEST_F(MCPClientTest, NotificationsReachListeners) {
    auto client = make_client();
    client->start();

    mock_.push_stdout(R"({"jsonrpc":"2.0","method":"notifications/tools/list_changed","params":{"reason":"reload"}})" "\n");

    ASSERT_TRUE(wait_until([&] { return !events_of(ClientEvent::Type::Notification).empty(); }));
    auto notifications = events_of(ClientEvent::Type::Notification);
    EXPECT_EQ(notifications[0].method, "notifications/tools/list_changed");
    EXPECT_EQ(notifications[0].params["reason"], "reload");
}

TEST_F(MCPClientTest, ServerRequestsAreIgnored) {
    auto client = make_client();
    client->start();

    mock_.push_stdout(R"({"jsonrpc":"2.0","id":"srv-1","method":"roots/list"})" "\n");

    EXPECT_FALSE(client->call_tool("echo", json::object()).is_error);
    EXPECT_TRUE(events_of(ClientEvent::Type::Notification).empty());
}

TEST_F(MCPClientTest, ThrowingListenerDoesNotBreakOthers) {
    auto client = make_client();

    std::atomic<bool> second_called{false};
    client->add_listener([](const ClientEvent&) {
        throw std::runtime_error("listener failure");
    });
    client->add_listener([&second_called](const ClientEvent& event) {
        if (event.type == ClientEvent::Type::Connected) {
            second_called = true;
        }
    });

    client->start();
    EXPECT_TRUE(second_called);
    EXPECT_EQ(client->status(), ConnectionStatus::Connected);
}

TEST_F(MCPClientTest, RemovedListenerIsNotCalled) {
    auto client = make_client();

    std::atomic<int> calls{0};
    auto id = client->add_listener([&calls](const ClientEvent&) { ++calls; });
    client->remove_listener(id);

    client->start();
    EXPECT_EQ(calls, 0);
}

TEST_F(MCPClientTest, LifecycleCallsFromReaderListenerAreRejected) {
    auto client = make_client();
    MCPClient* raw = client.get();

    std::atomic<bool> rejected{false};
    client->add_listener([raw, &rejected](const ClientEvent& event) {
        if (event.type != ClientEvent::Type::Notification) {
            return;
        }
        try {
            raw->stop();
        } catch (const std::logic_error&) {
            rejected = true;
        }
    });

    client->start();
    mock_.push_stdout(R"({"jsonrpc":"2.0","method":"notifications/message","params":{}})" "\n");

    ASSERT_TRUE(wait_until([&] { return rejected.load(); }));
    EXPECT_EQ(client->status(), ConnectionStatus::Connected);
}

TEST_F(MCPClientTest, RequestsFromReaderListenerFailFast) {
    options_.request_timeout = 300ms;
    auto client = make_client();
    MCPClient* raw = client.get();

    std::atomic<int> rejected{0};
    client->add_listener([raw, &rejected](const ClientEvent& event) {
        if (event.type != ClientEvent::Type::Notification) {
            return;
        }
        try {
            raw->call_tool("echo", json::object());
        } catch (const std::logic_error&) {
            ++rejected;
        }
        try {
            raw->send_request("tools/list", json::object());
        } catch (const std::logic_error&) {
            ++rejected;
        }
    });

    client->start();
    mock_.push_stdout(R"({"jsonrpc":"2.0","method":"notifications/tools/list_changed"})" "\n");

    ASSERT_TRUE(wait_until([&] { return rejected.load() == 2; }, 1s));

    // The read loop is still alive: calls from this thread go through
    EXPECT_FALSE(client->call_tool("echo", json::object()).is_error);

    auto stopped = std::async(std::launch::async, [&client] { client->stop(); });
    ASSERT_EQ(stopped.wait_for(2s), std::future_status::ready);
    stopped.get();
    EXPECT_EQ(client->status(), ConnectionStatus::Disconnected);
}

TEST_F(MCPClientTest, StopBeforeStartDoesNothing) {
    auto client = make_client();

    client->stop();

    EXPECT_EQ(client->status(), ConnectionStatus::Disconnected);
    EXPECT_EQ(mock_.opens(), 0);
    EXPECT_TRUE(mock_.written().empty());
    EXPECT_TRUE(event_types().empty());
}

TEST_F(MCPClientTest, UnencodableArgumentsRaiseRpcError) {
    auto client = make_client();
    client->start();

    try {
        client->call_tool("echo", {{"text", std::string("bad \xff byte")}});
        FAIL() << "Expected RpcError";
    } catch (const RpcError& e) {
        EXPECT_EQ(e.code(), jsonrpc::kInvalidParams);
    }

    EXPECT_EQ(client->status(), ConnectionStatus::Connected);
    EXPECT_EQ(client->pending_requests(), 0);
    EXPECT_FALSE(client->call_tool("echo", json::object()).is_error);
}

TEST_F(MCPClientTest, DestructorStopsRunningServer) {
    {
        auto client = make_client();
        client->start();
    }
    EXPECT_EQ(mock_.terminations(), 1);
}

TEST_F(MCPClientTest, EmptyNameIsRejected) {
    config_.name.clear();
    EXPECT_THROW({ MCPClient client(config_, options_, mock_.factory()); }, std::invalid_argument);
}
