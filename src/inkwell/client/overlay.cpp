#include "commands.h"

#include <args.hxx>

#include <iostream>
#include <string>

using namespace inkwell::rpc;

namespace inkwell::client {

Result<RpcClient::Ptr> openClient(const CmdContext& ctx) {
    auto clientResult = RpcClient::create(ctx.socketPath);
    if (!clientResult) {
        return Err<RpcClient::Ptr>("failed to create client", clientResult);
    }
    auto client = *clientResult;
    if (auto res = client->connect(); !res) {
        return Err<RpcClient::Ptr>("failed to connect", res);
    }
    return Ok(client);
}

static Result<List> parseArgs(const std::vector<std::string>& texts) {
    List out;
    out.reserve(texts.size());
    for (const auto& text : texts) {
        auto v = parseArg(text);
        if (!v) {
            return Err<List>("bad argument", v);
        }
        out.push_back(std::move(*v));
    }
    return Ok(std::move(out));
}

// ─── enqueue ─────────────────────────────────────────────────────────────────

Result<void> cmdEnqueue(const CmdContext& ctx, ArgIt begin, ArgIt end) {
    args::ArgumentParser parser("Queue one sequenced command.",
        "Arguments are YAML: 0xFF00FF00, 12.5, true, \"42\", [1, 2], {name: x}.\n"
        "Example: enqueue 1 overlay_rect 0xFF00FF00 10 10 50 50 5000 10");
    parser.Prog(ctx.prog + " enqueue");
    args::HelpFlag help(parser, "help", "Show this help", {'h', "help"});
    args::Positional<int64_t> callId(parser, "call-id", "Sequence number (0 resets the engine)");
    args::Positional<std::string> command(parser, "command", "Command name, e.g. overlay_rect");
    args::PositionalList<std::string> commandArgs(parser, "args", "Command arguments");

    try {
        parser.ParseArgs(begin, end);
    } catch (const args::Help&) {
        std::cout << parser;
        return Ok();
    } catch (const args::Error& e) {
        return Err("enqueue: " + std::string(e.what()));
    }

    if (!callId || !command) {
        return Err<void>("enqueue: call-id and command are required");
    }

    auto list = parseArgs(args::get(commandArgs));
    if (!list) {
        return Err<void>("enqueue", list);
    }

    auto client = openClient(ctx);
    if (!client) {
        return Err<void>("enqueue", client);
    }
    return (*client)->enqueue(args::get(callId), args::get(command), *list);
}

// ─── batch ───────────────────────────────────────────────────────────────────

Result<void> cmdBatch(const CmdContext& ctx, ArgIt begin, ArgIt end) {
    args::ArgumentParser parser("Run a list of commands immediately, bypassing the sequencer.",
        "Each entry is YAML of the form [name, [args...]].\n"
        "Example: batch '[overlay_set_group, [hud]]' '[overlay_rect, [0xFFFFFFFF, 0, 0, 5, 5, 0, 1]]'");
    parser.Prog(ctx.prog + " batch");
    args::HelpFlag help(parser, "help", "Show this help", {'h', "help"});
    args::PositionalList<std::string> entries(parser, "entries", "Batch entries");

    try {
        parser.ParseArgs(begin, end);
    } catch (const args::Help&) {
        std::cout << parser;
        return Ok();
    } catch (const args::Error& e) {
        return Err("batch: " + std::string(e.what()));
    }

    auto list = parseArgs(args::get(entries));
    if (!list) {
        return Err<void>("batch", list);
    }

    auto client = openClient(ctx);
    if (!client) {
        return Err<void>("batch", client);
    }
    return (*client)->batch(*list);
}

// ─── exec ────────────────────────────────────────────────────────────────────

Result<void> cmdExec(const CmdContext& ctx, ArgIt begin, ArgIt end) {
    args::ArgumentParser parser("Run one command immediately, bypassing the sequencer.",
        "Example: exec overlay_freeze_group hud");
    parser.Prog(ctx.prog + " exec");
    args::HelpFlag help(parser, "help", "Show this help", {'h', "help"});
    args::Positional<std::string> command(parser, "command", "Command name");
    args::PositionalList<std::string> commandArgs(parser, "args", "Command arguments");

    try {
        parser.ParseArgs(begin, end);
    } catch (const args::Help&) {
        std::cout << parser;
        return Ok();
    } catch (const args::Error& e) {
        return Err("exec: " + std::string(e.what()));
    }

    if (!command) {
        return Err<void>("exec: command is required");
    }

    auto list = parseArgs(args::get(commandArgs));
    if (!list) {
        return Err<void>("exec", list);
    }

    auto client = openClient(ctx);
    if (!client) {
        return Err<void>("exec", client);
    }
    return (*client)->execute(args::get(command), *list);
}

} // namespace inkwell::client
