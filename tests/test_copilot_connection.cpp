// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include "test_support.hpp"

#include <condition_variable>
#include <gtest/gtest.h>
#include <hangul_ai/conversation.hpp>
#include <hangul_ai/copilot_connection.hpp>
#include <hangul_ai/error.hpp>
#include <map>
#include <mutex>
#include <thread>

using namespace hangul_ai;
using hangul_ai::testing::LoopbackTransport;
using namespace std::chrono_literals;

namespace
{

/// In-process stand-in for `copilot --server --stdio`
///
/// Answers ping, session.create, session.send and session.destroy. After each
/// session.send it streams the configured events for that session.
class ScriptedServer
{
  public:
    explicit ScriptedServer(std::unique_ptr<LoopbackTransport> transport, int protocol_version = 2)
        : transport_(std::move(transport)), framer_(*transport_), protocol_version_(protocol_version)
    {
        thread_ = std::thread([this] { run(); });
    }

    ~ScriptedServer()
    {
        transport_->close();
        if (thread_.joinable())
            thread_.join();
    }

    /// Events sent after every session.send, as `event` objects
    std::vector<json> events = {
        {{"type", "assistant.message_delta"}, {"data", {{"messageId", "m1"}, {"deltaContent", "ㅎ is "}}}},
        {{"type", "assistant.message_delta"}, {"data", {{"messageId", "m1"}, {"deltaContent", "g"}}}},
        {{"type", "session.idle"}, {"data", json::object()}},
    };

    /// Stop writing after the first session.send's events but keep reading,
    /// like a CLI that died with its stdin still open
    bool go_silent_after_events = false;

    /// Send a request to the client and wait for its response
    json request(const std::string& method, const json& params)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        int id = next_request_id_++;
        write(json{{"jsonrpc", "2.0"}, {"method", method}, {"params", params}, {"id", id}}, lock);
        cv_.wait_for(lock, 2s, [&] { return responses_.count(id) > 0; });
        return responses_.count(id) ? responses_[id] : json();
    }

    /// Drop the connection the way a crashed CLI would
    void hang_up()
    {
        transport_->close();
    }

    std::vector<std::string> methods() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return methods_;
    }

    std::vector<json> create_params() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return create_params_;
    }

    std::vector<std::string> prompts() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return prompts_;
    }

    std::vector<std::string> destroyed() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return destroyed_;
    }

  private:
    void run()
    {
        try
        {
            while (true)
                handle(json::parse(framer_.read_message()));
        }
        catch (const TransportError&)
        {
            // Client went away
        }
    }

    void handle(const json& message)
    {
        std::unique_lock<std::mutex> lock(mutex_);

        if (!message.contains("method"))
        {
            responses_[message["id"].get<int>()] = message;
            cv_.notify_all();
            return;
        }

        std::string method = message["method"];
        const json& params = message.contains("params") ? message["params"] : json::object();
        methods_.push_back(method);

        json result = json::object();
        std::vector<json> followups;

        if (method == "ping")
        {
            result = {{"message", "pong"}, {"protocolVersion", protocol_version_}};
        }
        else if (method == "session.create")
        {
            create_params_.push_back(params);
            result = {{"sessionId", "session-" + std::to_string(++session_counter_)}};
        }
        else if (method == "session.send")
        {
            prompts_.push_back(params.value("prompt", std::string{}));
            result = {{"messageId", "m1"}};
            for (const auto& event : events)
            {
                followups.push_back(json{
                    {"jsonrpc", "2.0"},
                    {"method", "session.event"},
                    {"params", {{"sessionId", params["sessionId"]}, {"event", event}}}
                });
            }
        }
        else if (method == "session.destroy")
        {
            destroyed_.push_back(params.value("sessionId", std::string{}));
        }

        write(json{{"jsonrpc", "2.0"}, {"result", result}, {"id", message["id"]}}, lock);
        for (const auto& notification : followups)
            write(notification, lock);
        if (!followups.empty() && go_silent_after_events)
            transport_->shutdown_write();
    }

    void write(const json& message, std::unique_lock<std::mutex>&)
    {
        framer_.write_message(message.dump());
    }

    std::unique_ptr<LoopbackTransport> transport_;
    MessageFramer framer_;
    int protocol_version_;
    std::thread thread_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<int, json> responses_;
    int next_request_id_ = 1000;
    int session_counter_ = 0;
    std::vector<std::string> methods_;
    std::vector<json> create_params_;
    std::vector<std::string> prompts_;
    std::vector<std::string> destroyed_;
};

/// Content-Length framed message as the CLI writes it to stdout
std::string framed(const json& message)
{
    std::string body = message.dump();
    return "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body;
}

struct ConnectionFixture
{
    explicit ConnectionFixture(int protocol_version = 2)
    {
        auto [client_transport, server_transport] = LoopbackTransport::create_pair();
        server = std::make_unique<ScriptedServer>(std::move(server_transport), protocol_version);
        connection = std::make_unique<CopilotConnection>(std::move(client_transport));
    }

    ~ConnectionFixture()
    {
        connection.reset();
        server.reset();
    }

    std::unique_ptr<ScriptedServer> server;
    std::unique_ptr<CopilotConnection> connection;
};

} // namespace

// =============================================================================
// Request builders
// =============================================================================

TEST(CopilotConnectionTest, SessionCreateRequestMinimal)
{
    EXPECT_EQ(build_session_create_request(SessionConfig{}), json::object());
}

TEST(CopilotConnectionTest, SessionCreateRequestFull)
{
    SessionConfig config;
    config.model = "gpt-4.1";
    config.system_message = SystemMessageConfig{SystemMessageMode::Replace, std::string("persona")};
    config.streaming = true;

    auto request = build_session_create_request(config);

    EXPECT_EQ(request["model"], "gpt-4.1");
    EXPECT_EQ(request["systemMessage"]["mode"], "replace");
    EXPECT_EQ(request["systemMessage"]["content"], "persona");
    EXPECT_EQ(request["streaming"], true);
}

TEST(CopilotConnectionTest, ResolveCliCommandPassesNativeExecutable)
{
    auto [executable, args] =
        CopilotConnection::resolve_cli_command("copilot", {"--server", "--stdio"});
    EXPECT_EQ(executable, "copilot");
    EXPECT_EQ(args, (std::vector<std::string>{"--server", "--stdio"}));
}

// =============================================================================
// Lifecycle
// =============================================================================

TEST(CopilotConnectionTest, StartVerifiesProtocolVersion)
{
    ConnectionFixture f;

    f.connection->start().get();

    EXPECT_EQ(f.connection->state(), ConnectionState::Connected);
    EXPECT_EQ(f.server->methods().at(0), "ping");

    f.connection->stop().get();
    EXPECT_EQ(f.connection->state(), ConnectionState::Disconnected);
}

TEST(CopilotConnectionTest, VersionMismatchFailsStart)
{
    ConnectionFixture f(3);

    try
    {
        f.connection->start().get();
        FAIL() << "Expected version mismatch";
    }
    catch (const std::runtime_error& e)
    {
        EXPECT_NE(std::string(e.what()).find("Protocol version mismatch"), std::string::npos);
    }
    EXPECT_EQ(f.connection->state(), ConnectionState::Error);
}

TEST(CopilotConnectionTest, SpawnFailureFailsStart)
{
    ServiceOptions options;
    options.cli_path = "this_copilot_does_not_exist_12345";
    CopilotConnection connection(options);

    EXPECT_THROW(connection.start().get(), ProcessError);
    EXPECT_EQ(connection.state(), ConnectionState::Error);
}

TEST(CopilotConnectionTest, CreateSessionBeforeStartFails)
{
    ConnectionFixture f;
    EXPECT_THROW(f.connection->create_session(SessionConfig{}).get(), std::runtime_error);
}

// =============================================================================
// Sessions
// =============================================================================

TEST(CopilotConnectionTest, CreateSessionSendsConfig)
{
    ConnectionFixture f;
    f.connection->start().get();

    SessionConfig config;
    config.streaming = true;
    auto session = f.connection->create_session(config).get();

    EXPECT_EQ(session->session_id(), "session-1");
    EXPECT_EQ(f.connection->session_count(), 1u);
    EXPECT_EQ(f.server->create_params().at(0)["streaming"], true);

    f.connection->stop().get();
}

TEST(CopilotConnectionTest, EventsRoutedToSubscribers)
{
    ConnectionFixture f;
    f.connection->start().get();

    auto session = f.connection->create_session(SessionConfig{}).get();
    auto stream = session->subscribe();

    EXPECT_EQ(session->send("How do I type 한?").get(), "m1");

    auto first = stream->next(1000ms);
    ASSERT_EQ(first.status, NextStatus::Received);
    EXPECT_EQ(first.event->try_as<AssistantMessageDeltaData>()->delta_content, "ㅎ is ");

    auto second = stream->next(1000ms);
    ASSERT_EQ(second.status, NextStatus::Received);
    auto third = stream->next(1000ms);
    ASSERT_EQ(third.status, NextStatus::Received);
    EXPECT_EQ(third.event->type, StreamEventType::SessionIdle);

    EXPECT_EQ(f.server->prompts().at(0), "How do I type 한?");

    session->destroy().get();
    f.connection->stop().get();
}

TEST(CopilotConnectionTest, EventsForOtherSessionsAreIgnored)
{
    ConnectionFixture f;
    f.connection->start().get();

    auto first = f.connection->create_session(SessionConfig{}).get();
    auto second = f.connection->create_session(SessionConfig{}).get();
    auto first_stream = first->subscribe();
    auto second_stream = second->subscribe();

    second->send("Hi").get();

    EXPECT_EQ(second_stream->next(1000ms).status, NextStatus::Received);
    EXPECT_EQ(first_stream->next(100ms).status, NextStatus::TimedOut);

    f.connection->stop().get();
}

TEST(CopilotConnectionTest, AskEndToEnd)
{
    ConnectionFixture f;
    f.connection->start().get();

    LearningContext ctx;
    ctx.current_level = 2;
    ctx.current_target = "한";

    auto answer = ask(*f.connection, "What key is ㅎ?", ctx);

    EXPECT_EQ(answer.content, "ㅎ is g");
    EXPECT_EQ(f.server->prompts().at(0), build_prompt("What key is ㅎ?", ctx));

    auto created = f.server->create_params().at(0);
    EXPECT_EQ(created["systemMessage"]["mode"], "replace");
    EXPECT_EQ(created["systemMessage"]["content"], kTutorPersona);
    EXPECT_EQ(created["streaming"], true);

    EXPECT_EQ(f.server->destroyed(), (std::vector<std::string>{"session-1"}));
    EXPECT_EQ(f.connection->session_count(), 0u);

    f.connection->stop().get();
}

TEST(CopilotConnectionTest, SessionErrorFailsAsk)
{
    ConnectionFixture f;
    f.server->events = {
        {{"type", "session.error"}, {"data", {{"errorType", "quota"}, {"message", "Quota exceeded"}}}}
    };
    f.connection->start().get();

    try
    {
        ask(*f.connection, "Hi");
        FAIL() << "Expected AssistantError";
    }
    catch (const AssistantError& e)
    {
        EXPECT_EQ(e.code(), AssistantErrorCode::SendFailed);
        EXPECT_EQ(e.detail(), "Quota exceeded");
    }

    f.connection->stop().get();
}

TEST(CopilotConnectionTest, StopDestroysOpenSessions)
{
    ConnectionFixture f;
    f.connection->start().get();

    auto session = f.connection->create_session(SessionConfig{}).get();
    auto stream = session->subscribe();

    f.connection->stop().get();

    EXPECT_EQ(f.server->destroyed(), (std::vector<std::string>{"session-1"}));
    EXPECT_EQ(f.connection->session_count(), 0u);
    EXPECT_EQ(stream->next(100ms).status, NextStatus::Closed);
}

// =============================================================================
// Server requests and disconnects
// =============================================================================

TEST(CopilotConnectionTest, PermissionRequestsAreDenied)
{
    ConnectionFixture f;
    f.connection->start().get();

    auto response = f.server->request(
        "permission.request", {{"sessionId", "session-1"}, {"permissionRequest", {{"kind", "shell"}}}}
    );

    ASSERT_TRUE(response.contains("result"));
    EXPECT_EQ(
        response["result"]["result"]["kind"],
        "denied-no-approval-rule-and-could-not-request-from-user"
    );

    f.connection->stop().get();
}

TEST(CopilotConnectionTest, UnknownServerRequestIsMethodNotFound)
{
    ConnectionFixture f;
    f.connection->start().get();

    auto response = f.server->request("tool.call", {{"toolName", "search"}});

    ASSERT_TRUE(response.contains("error"));
    EXPECT_EQ(response["error"]["code"], static_cast<int>(JsonRpcErrorCode::MethodNotFound));

    f.connection->stop().get();
}

TEST(CopilotConnectionTest, ServerHangUpEndsStreams)
{
    ConnectionFixture f;
    f.connection->start().get();

    auto session = f.connection->create_session(SessionConfig{}).get();
    auto stream = session->subscribe();

    f.server->hang_up();

    EXPECT_EQ(stream->next(1000ms).status, NextStatus::Closed);
    EXPECT_EQ(f.connection->state(), ConnectionState::Error);
    EXPECT_THROW(session->send("Hi").get(), std::exception);

    f.connection->stop().get();
    EXPECT_EQ(f.connection->state(), ConnectionState::Disconnected);
}

TEST(CopilotConnectionTest, SilentServerMidAnswerReturnsPartialWithoutDestroy)
{
    ConnectionFixture f;
    f.server->events = {
        {{"type", "assistant.message_delta"}, {"data", {{"messageId", "m1"}, {"deltaContent", "ㅎ is "}}}},
    };
    f.server->go_silent_after_events = true;
    f.connection->start().get();

    auto started = std::chrono::steady_clock::now();
    auto answer = ask(*f.connection, "What key is ㅎ?");

    EXPECT_EQ(answer.content, "ㅎ is ");
    EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);
    EXPECT_TRUE(f.server->destroyed().empty());
    EXPECT_EQ(f.connection->session_count(), 0u);

    f.connection->stop().get();
}

TEST(CopilotConnectionTest, CliExitingMidAnswerReturnsPartial)
{
    // A shell script plays the CLI: it answers ping, session.create and
    // session.send, streams one delta and exits with its stdin unread
    json ping = {{"jsonrpc", "2.0"}, {"id", 1}, {"result", {{"message", "pong"}, {"protocolVersion", 2}}}};
    json create = {{"jsonrpc", "2.0"}, {"id", 2}, {"result", {{"sessionId", "cli-1"}}}};
    json send = {{"jsonrpc", "2.0"}, {"id", 3}, {"result", {{"messageId", "m1"}}}};
    json delta = {
        {"jsonrpc", "2.0"},
        {"method", "session.event"},
        {"params",
         {{"sessionId", "cli-1"},
          {"event",
           {{"type", "assistant.message_delta"},
            {"data", {{"messageId", "m1"}, {"deltaContent", "ㅎ is "}}}}}}}
    };

    ServiceOptions options;
    options.cli_path = "sh";
    options.cli_args = {
        "-c",
        "sleep 0.3; printf '%s' \"$1\"; sleep 0.3; printf '%s' \"$2\"; "
        "sleep 0.3; printf '%s%s' \"$3\" \"$4\"; exit 0",
        "fake-cli",
        framed(ping),
        framed(create),
        framed(send),
        framed(delta),
    };

    CopilotConnection connection(options);
    connection.start().get();

    auto answer = ask(connection, "What key is ㅎ?");
    EXPECT_EQ(answer.content, "ㅎ is ");
    EXPECT_EQ(connection.session_count(), 0u);

    // The dead CLI is reported as an error
    EXPECT_THROW(connection.create_session(SessionConfig{}).get(), std::exception);

    connection.stop().get();
    EXPECT_EQ(connection.state(), ConnectionState::Disconnected);
}
