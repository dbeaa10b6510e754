#include "commands.h"

#include <args.hxx>

#include <iostream>
#include <string>

using namespace inkwell::rpc;

namespace inkwell::client {

// ─── groups ──────────────────────────────────────────────────────────────────

Result<void> cmdGroups(const CmdContext& ctx, ArgIt begin, ArgIt end) {
    args::ArgumentParser parser("Show active and frozen groups and the current group.");
    parser.Prog(ctx.prog + " groups");
    args::HelpFlag help(parser, "help", "Show this help", {'h', "help"});

    try {
        parser.ParseArgs(begin, end);
    } catch (const args::Help&) {
        std::cout << parser;
        return Ok();
    } catch (const args::Error& e) {
        return Err("groups: " + std::string(e.what()));
    }

    auto client = openClient(ctx);
    if (!client) {
        return Err<void>("groups", client);
    }
    auto groups = (*client)->groups();
    if (!groups) {
        return Err<void>("groups", groups);
    }
    std::cout << toYamlString(*groups) << "\n";
    return Ok();
}

// ─── scene ───────────────────────────────────────────────────────────────────

Result<void> cmdScene(const CmdContext& ctx, ArgIt begin, ArgIt end) {
    args::ArgumentParser parser("Dump the retained scene tree as YAML.");
    parser.Prog(ctx.prog + " scene");
    args::HelpFlag help(parser, "help", "Show this help", {'h', "help"});

    try {
        parser.ParseArgs(begin, end);
    } catch (const args::Help&) {
        std::cout << parser;
        return Ok();
    } catch (const args::Error& e) {
        return Err("scene: " + std::string(e.what()));
    }

    auto client = openClient(ctx);
    if (!client) {
        return Err<void>("scene", client);
    }
    auto tree = (*client)->sceneTree();
    if (!tree) {
        return Err<void>("scene", tree);
    }
    std::cout << *tree << "\n";
    return Ok();
}

// ─── watch ───────────────────────────────────────────────────────────────────

Result<void> cmdWatch(const CmdContext& ctx, ArgIt begin, ArgIt end) {
    args::ArgumentParser parser("Print server notifications (e.g. hide-group) as they arrive.");
    parser.Prog(ctx.prog + " watch");
    args::HelpFlag help(parser, "help", "Show this help", {'h', "help"});
    args::ValueFlag<int> count(parser, "N", "Exit after N notifications", {'n', "count"}, 0);

    try {
        parser.ParseArgs(begin, end);
    } catch (const args::Help&) {
        std::cout << parser;
        return Ok();
    } catch (const args::Error& e) {
        return Err("watch: " + std::string(e.what()));
    }

    auto client = openClient(ctx);
    if (!client) {
        return Err<void>("watch", client);
    }

    // Round-trip once so the server has accepted this connection before blocking
    if (auto res = (*client)->groups(); !res) {
        return Err<void>("watch", res);
    }

    int limit = args::get(count);
    for (int seen = 0; limit <= 0 || seen < limit; ++seen) {
        auto msg = (*client)->waitNotification();
        if (!msg) {
            return Err<void>("watch", msg);
        }
        std::cout << msg->method << " " << msg->params.repr() << std::endl;
    }
    return Ok();
}

} // namespace inkwell::client
