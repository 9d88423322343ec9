// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

/// @file tutor_cli.cpp
/// @brief Command-line host that drives the assistant service and prints JSON envelopes
///
/// Usage:
///   tutor_cli check
///   tutor_cli status
///   tutor_cli ask "How do I type 한?"
///   tutor_cli hint 한 ㅎ 3
///   tutor_cli explain 글
///   tutor_cli mistake 가 거
///   tutor_cli repl
///
/// Every command except check and status starts the assistant first and
/// shuts it down before exiting.

#include <hangul_ai/hangul_ai.hpp>
#include <iostream>
#include <string>
#include <vector>

namespace
{

void print(const hangul_ai::json& envelope)
{
    std::cout << envelope.dump(2) << "\n";
}

int usage()
{
    std::cerr << "usage: tutor_cli <check|status|ask|hint|explain|mistake|repl> [args...]\n";
    return 2;
}

/// One JSON request per line: {"command": "...", "args": {...}}
int run_repl(hangul_ai::AssistantService& service)
{
    std::string line;
    while (std::getline(std::cin, line))
    {
        if (line.empty())
            continue;
        if (line == "quit" || line == "exit")
            break;

        hangul_ai::json request = hangul_ai::json::parse(line, nullptr, false);
        if (request.is_discarded() || !request.is_object() || !request.contains("command") ||
            !request["command"].is_string())
        {
            print(hangul_ai::json{
                {"success", false}, {"data", nullptr}, {"error", "Malformed request"}
            });
            continue;
        }

        auto name = request["command"].get<std::string>();
        auto args = request.value("args", hangul_ai::json::object());
        std::cout << hangul_ai::dispatch_command(service, name, args).dump() << std::endl;
    }
    return 0;
}

} // namespace

int main(int argc, char** argv)
{
    std::vector<std::string> args(argv + 1, argv + argc);
    if (args.empty())
        return usage();

    const std::string command = args[0];

    try
    {
        hangul_ai::AssistantService service(hangul_ai::ServiceOptions::from_env());

        if (command == "check")
        {
            print(hangul_ai::check_command(service));
            return 0;
        }
        if (command == "status")
        {
            print(hangul_ai::status_command(service));
            return 0;
        }

        auto init = hangul_ai::init_command(service);
        if (command != "repl" || !init.data->running)
            print(init);
        if (!init.data->running)
            return 1;

        int rc = 0;
        if (command == "ask" && args.size() >= 2)
            print(hangul_ai::ask_command(service, args[1]));
        else if (command == "hint" && args.size() >= 4)
            print(hangul_ai::hint_command(
                service, args[1], args[2], static_cast<uint32_t>(std::stoul(args[3]))
            ));
        else if (command == "explain" && args.size() >= 2)
            print(hangul_ai::explain_command(service, args[1]));
        else if (command == "mistake" && args.size() >= 3)
            print(hangul_ai::analyze_mistake_command(service, args[1], args[2]));
        else if (command == "repl")
            rc = run_repl(service);
        else
            rc = usage();

        print(hangul_ai::shutdown_command(service));
        return rc;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
