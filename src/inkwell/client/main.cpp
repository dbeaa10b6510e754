#include "commands.h"

#include <inkwell/rpc/socket-path.h>

#include <args.hxx>

#include <cstdlib>
#include <iostream>
#include <string>
#include <unordered_map>
#include <vector>

using namespace inkwell;
using namespace inkwell::client;

// Read default socket path from $INKWELL_SOCKET
static std::string defaultSocketPath() {
    if (auto path = rpc::discoverSocketPath()) {
        return *path;
    }
    return "";
}

int main(int argc, const char** argv) {
    const std::unordered_map<std::string, CmdFn> commands = {
        {"enqueue", cmdEnqueue},
        {"batch",   cmdBatch},
        {"exec",    cmdExec},
        {"mouse",   cmdMouse},
        {"window",  cmdWindow},
        {"groups",  cmdGroups},
        {"scene",   cmdScene},
        {"watch",   cmdWatch},
    };

    const std::vector<std::string> args(argv + 1, argv + argc);
    args::ArgumentParser parser("inkwellc", "inkwell RPC client");
    parser.Prog(argv[0]);
    parser.Epilog(
        "commands:\n"
        "  enqueue  Queue a sequenced command (enqueue CALL_ID NAME [ARGS...])\n"
        "  batch    Run [name, [args]] entries immediately\n"
        "  exec     Run one command immediately (exec NAME [ARGS...])\n"
        "  mouse    Report the pointer position (mouse X Y)\n"
        "  window   Report the window geometry (window X Y W H)\n"
        "  groups   Show active/frozen groups\n"
        "  scene    Dump the scene tree\n"
        "  watch    Print server notifications\n"
    );
    args::HelpFlag help(parser, "help", "Show this help", {'h', "help"});
    args::ValueFlag<std::string> socketFlag(parser, "path",
        "Socket path (default: $INKWELL_SOCKET)", {'s', "socket"}, defaultSocketPath());
    args::MapPositional<std::string, CmdFn> command(parser, "command",
        "Command to run", commands);
    command.KickOut(true);

    try {
        auto next = parser.ParseArgs(args);
        if (command) {
            auto socketPath = args::get(socketFlag);
            if (socketPath.empty()) {
                std::cerr << "error: no socket path. Set $INKWELL_SOCKET or use --socket.\n";
                return 1;
            }
            CmdContext ctx{argv[0], socketPath};
            auto result = args::get(command)(ctx, next, args.end());
            if (!result) {
                std::cerr << "error: " << error_msg(result) << "\n";
                return 1;
            }
            return 0;
        }
        std::cout << parser;
        return 0;
    } catch (const args::Help&) {
        std::cout << parser;
        return 0;
    } catch (const args::Error& e) {
        std::cerr << e.what() << "\n";
        std::cerr << parser;
        return 1;
    }
}
