// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <chrono>
#include <hangul_ai/copilot_connection.hpp>
#include <hangul_ai/logging.hpp>

namespace hangul_ai
{

// =============================================================================
// Request Builder Helpers (exposed for unit testing)
// =============================================================================

json build_session_create_request(const SessionConfig& config)
{
    json request = json::object();

    if (config.model.has_value())
        request["model"] = *config.model;
    if (config.system_message.has_value())
        request["systemMessage"] = *config.system_message;
    if (config.streaming)
        request["streaming"] = true;

    return request;
}

// =============================================================================
// Constructor / Destructor
// =============================================================================

CopilotConnection::CopilotConnection(ServiceOptions options)
    : options_(std::move(options)), sessions_(std::make_shared<SessionRegistry>())
{
}

CopilotConnection::CopilotConnection(std::unique_ptr<ITransport> transport, ServiceOptions options)
    : options_(std::move(options)),
      transport_(std::move(transport)),
      sessions_(std::make_shared<SessionRegistry>())
{
}

CopilotConnection::~CopilotConnection()
{
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_->close_all_streams();
    sessions_->take_all();
    teardown(false);
}

// =============================================================================
// Connection Management
// =============================================================================

std::future<void> CopilotConnection::start()
{
    return std::async(
        std::launch::async,
        [this]()
        {
            std::lock_guard<std::mutex> lock(mutex_);

            if (state_ == ConnectionState::Connected)
                return;

            state_ = ConnectionState::Connecting;

            try
            {
                if (!transport_)
                    start_cli_server();
                connect_to_server();
                verify_protocol_version();
                state_ = ConnectionState::Connected;
                logger()->info("Connected to Copilot CLI server");
            }
            catch (const std::exception& e)
            {
                logger()->error("Failed to connect to Copilot CLI server: {}", e.what());
                teardown(false);
                state_ = ConnectionState::Error;
                throw;
            }
        }
    );
}

std::future<void> CopilotConnection::stop()
{
    return std::async(
        std::launch::async,
        [this]()
        {
            std::lock_guard<std::mutex> lock(mutex_);

            // In-flight readers end with what they have received so far
            auto sessions = sessions_->take_all();
            for (auto& session : sessions)
                session->close_streams();

            if (rpc_ && rpc_->is_running())
            {
                for (auto& session : sessions)
                {
                    try
                    {
                        session->destroy().get();
                    }
                    catch (const std::exception& e)
                    {
                        logger()->warn(
                            "Failed to destroy session {}: {}", session->session_id(), e.what()
                        );
                    }
                }
            }

            teardown(true);
            state_ = ConnectionState::Disconnected;
            logger()->info("Copilot CLI connection stopped");
        }
    );
}

void CopilotConnection::teardown(bool graceful)
{
    // Stop the process FIRST so the reader sees EOF and unblocks
    if (process_)
    {
        try
        {
            if (graceful)
            {
                process_->terminate();
                process_->wait_or_kill(std::chrono::seconds(5));
            }
            else
            {
                process_->kill();
                process_->wait();
            }
        }
        catch (const ProcessError& e)
        {
            logger()->warn("Failed to stop Copilot CLI process: {}", e.what());
        }
    }

    if (rpc_)
    {
        rpc_->set_close_handler(nullptr);
        rpc_->set_notification_handler(nullptr);
        rpc_->set_request_handler(nullptr);
        rpc_->stop();
        rpc_.reset();
    }

    process_.reset();
}

// =============================================================================
// CLI Server Management
// =============================================================================

std::pair<std::string, std::vector<std::string>>
CopilotConnection::resolve_cli_command(
    const std::string& cli_path, const std::vector<std::string>& args
)
{
    if (is_node_script(cli_path))
    {
        auto node_path = find_node();
        if (!node_path.has_value())
            throw std::runtime_error("Node.js not found in PATH but required for .js CLI");
        std::vector<std::string> full_args = {cli_path};
        full_args.insert(full_args.end(), args.begin(), args.end());
        return {*node_path, full_args};
    }

    return {cli_path, args};
}

void CopilotConnection::start_cli_server()
{
    std::vector<std::string> args = options_.cli_args;
    args.push_back("--server");
    args.push_back("--log-level");
    args.push_back(options_.log_level);
    args.push_back("--stdio");

    auto [executable, full_args] = resolve_cli_command(options_.cli_path, args);

    ProcessOptions proc_opts;
    proc_opts.redirect_stdin = true;
    proc_opts.redirect_stdout = true;
    proc_opts.redirect_stderr = false;

    if (options_.cwd)
        proc_opts.working_directory = *options_.cwd;

    if (options_.environment.has_value())
    {
        proc_opts.inherit_environment = false;
        proc_opts.environment = *options_.environment;
    }

    // Debug output on stdout would corrupt the JSON-RPC stream
    proc_opts.environment.erase("NODE_DEBUG");

    logger()->debug("Spawning {} with {} argument(s)", executable, full_args.size());

    process_ = std::make_unique<Process>();
    process_->spawn(executable, full_args, proc_opts);
}

void CopilotConnection::connect_to_server()
{
    std::unique_ptr<ITransport> transport;
    if (process_)
        transport =
            std::make_unique<PipeTransport>(process_->stdin_pipe(), process_->stdout_pipe());
    else if (transport_)
        transport = std::move(transport_);
    else
        throw std::runtime_error("No transport available; a connection built on a transport "
                                 "cannot be restarted");

    rpc_ = std::make_shared<JsonRpcClient>(std::move(transport));

    rpc_->set_notification_handler(
        [this](const std::string& method, const json& params)
        {
            if (method == "session.event")
                handle_session_event(params);
        }
    );

    rpc_->set_request_handler(
        [this](const std::string& method, const json& params) -> json
        { return handle_server_request(method, params); }
    );

    // Peer went away: end every in-flight conversation
    std::weak_ptr<SessionRegistry> registry = sessions_;
    rpc_->set_close_handler(
        [this, registry]()
        {
            logger()->warn("Copilot CLI server closed the connection");
            state_ = ConnectionState::Error;
            if (auto sessions = registry.lock())
                sessions->close_all_streams();
        }
    );

    rpc_->start();
}

void CopilotConnection::verify_protocol_version()
{
    auto response =
        rpc_->invoke("ping", json{{"message", nullptr}}, options_.request_timeout).get();

    if (!response.is_object() || !response.contains("protocolVersion") ||
        response["protocolVersion"].is_null())
    {
        throw std::runtime_error(
            "Protocol version mismatch: expected version " + std::to_string(kProtocolVersion) +
            ", but server does not report a protocol version."
        );
    }

    int server_version = response["protocolVersion"].get<int>();
    if (server_version != kProtocolVersion)
    {
        throw std::runtime_error(
            "Protocol version mismatch: expected version " + std::to_string(kProtocolVersion) +
            ", but server reports version " + std::to_string(server_version)
        );
    }
}

// =============================================================================
// Session Management
// =============================================================================

std::future<std::shared_ptr<ConversationSession>>
CopilotConnection::create_session(SessionConfig config)
{
    return std::async(
        std::launch::async,
        [this, config = std::move(config)]() -> std::shared_ptr<ConversationSession>
        {
            std::shared_ptr<JsonRpcClient> rpc;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (state_ != ConnectionState::Connected || !rpc_)
                    throw std::runtime_error("Client not connected. Call start() first.");
                rpc = rpc_;
            }

            auto response = rpc->invoke(
                                   "session.create",
                                   build_session_create_request(config),
                                   options_.request_timeout
            )
                                .get();
            std::string session_id = response.at("sessionId").get<std::string>();

            auto session = std::make_shared<CopilotSession>(
                session_id, rpc, sessions_, options_.request_timeout
            );
            sessions_->add(session);

            logger()->debug("Created session {}", session_id);
            return session;
        }
    );
}

// =============================================================================
// RPC Handlers
// =============================================================================

void CopilotConnection::handle_session_event(const json& params)
{
    if (!params.contains("sessionId") || !params.contains("event"))
        return;

    auto session = sessions_->find(params["sessionId"].get<std::string>());
    if (!session)
        return;

    session->dispatch_event(parse_stream_event(params["event"]));
}

json CopilotConnection::handle_server_request(const std::string& method, const json& params)
{
    // The tutor registers no tools, so nothing needs approval
    if (method == "permission.request")
    {
        logger()->debug("Denying permission request for session {}",
                        params.value("sessionId", std::string{}));
        return json{
            {"result", {{"kind", "denied-no-approval-rule-and-could-not-request-from-user"}}}
        };
    }
    throw JsonRpcError(JsonRpcErrorCode::MethodNotFound, "Unknown method: " + method);
}

} // namespace hangul_ai
