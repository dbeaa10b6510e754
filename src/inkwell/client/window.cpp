#include "commands.h"

#include <args.hxx>

#include <iostream>
#include <string>

namespace inkwell::client {

// ─── mouse ───────────────────────────────────────────────────────────────────

Result<void> cmdMouse(const CmdContext& ctx, ArgIt begin, ArgIt end) {
    args::ArgumentParser parser("Report the pointer position (screen coordinates).");
    parser.Prog(ctx.prog + " mouse");
    args::HelpFlag help(parser, "help", "Show this help", {'h', "help"});
    args::Positional<float> x(parser, "x", "Pointer X");
    args::Positional<float> y(parser, "y", "Pointer Y");

    try {
        parser.ParseArgs(begin, end);
    } catch (const args::Help&) {
        std::cout << parser;
        return Ok();
    } catch (const args::Error& e) {
        return Err("mouse: " + std::string(e.what()));
    }

    if (!x || !y) {
        return Err<void>("mouse: x and y are required");
    }

    auto client = openClient(ctx);
    if (!client) {
        return Err<void>("mouse", client);
    }
    return (*client)->mouseMove(args::get(x), args::get(y));
}

// ─── window ──────────────────────────────────────────────────────────────────

Result<void> cmdWindow(const CmdContext& ctx, ArgIt begin, ArgIt end) {
    args::ArgumentParser parser("Report the target window geometry (screen coordinates).");
    parser.Prog(ctx.prog + " window");
    args::HelpFlag help(parser, "help", "Show this help", {'h', "help"});
    args::Positional<float> x(parser, "x", "Window X");
    args::Positional<float> y(parser, "y", "Window Y");
    args::Positional<float> width(parser, "width", "Window width");
    args::Positional<float> height(parser, "height", "Window height");

    try {
        parser.ParseArgs(begin, end);
    } catch (const args::Help&) {
        std::cout << parser;
        return Ok();
    } catch (const args::Error& e) {
        return Err("window: " + std::string(e.what()));
    }

    if (!x || !y || !width || !height) {
        return Err<void>("window: x, y, width and height are required");
    }

    auto client = openClient(ctx);
    if (!client) {
        return Err<void>("window", client);
    }
    return (*client)->windowGeometry(args::get(x), args::get(y),
                                     args::get(width), args::get(height));
}

} // namespace inkwell::client
