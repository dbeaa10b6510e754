//=============================================================================
// Config Tests
//
// Layering of defaults, config file, INKWELL_* environment variables and
// command-line overrides.
//=============================================================================

#include <boost/ut.hpp>
#include <inkwell/config.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

using namespace boost::ut;
using namespace inkwell;

namespace {

namespace fs = std::filesystem;

// Temporary directory used as XDG_CONFIG_HOME so the user's own config
// never leaks into a test.
class TempConfigDir {
public:
    TempConfigDir() {
        _dir = fs::temp_directory_path() / ("inkwell-config-test-" + std::to_string(::getpid()));
        fs::create_directories(_dir);
        const char* old = std::getenv("XDG_CONFIG_HOME");
        if (old) _oldXdg = old;
        _hadXdg = old != nullptr;
        ::setenv("XDG_CONFIG_HOME", _dir.c_str(), 1);
    }

    ~TempConfigDir() {
        if (_hadXdg) ::setenv("XDG_CONFIG_HOME", _oldXdg.c_str(), 1);
        else ::unsetenv("XDG_CONFIG_HOME");
        std::error_code ec;
        fs::remove_all(_dir, ec);
    }

    fs::path write(const std::string& name, const std::string& content) const {
        fs::path path = _dir / name;
        fs::create_directories(path.parent_path());
        std::ofstream out(path);
        out << content;
        return path;
    }

private:
    fs::path _dir;
    std::string _oldXdg;
    bool _hadXdg = false;
};

} // namespace

suite config_layer_tests = [] {
    "defaults apply without any file"_test = [] {
        TempConfigDir tmp;
        auto config = Config::create();
        expect(bool(config));
        expect((*config)->loadedPath().empty());
        expect((*config)->socketPath() == "");
        expect((*config)->attachOnStart());
        expect((*config)->maxFontSize() == 50_i);
        expect((*config)->fallbackFont() == "Menlo");
        expect((*config)->animationMs() == 500_i);
        expect((*config)->imageCacheSize() == 100_i);
        expect((*config)->logLevel() == "info");
    };

    "file values merge over defaults"_test = [] {
        TempConfigDir tmp;
        auto path = tmp.write("custom.yaml",
            "overlay:\n"
            "  text:\n"
            "    max-font-size: 72\n"
            "log:\n"
            "  level: debug\n");

        auto config = Config::create(path.string());
        expect(bool(config));
        expect((*config)->loadedPath() == path.string());
        expect((*config)->maxFontSize() == 72_i);
        expect((*config)->logLevel() == "debug");
        // Siblings of overridden keys keep their defaults
        expect((*config)->fallbackFont() == "Menlo");
        expect((*config)->animationMs() == 500_i);
    };

    "the XDG file is picked up when no path is given"_test = [] {
        TempConfigDir tmp;
        auto path = tmp.write("inkwell/config.yaml", "rpc:\n  socket: /tmp/xdg.sock\n");
        expect(Config::getXDGConfigPath() == path);

        auto config = Config::create();
        expect(bool(config));
        expect((*config)->socketPath() == "/tmp/xdg.sock");
    };

    "a broken XDG file only warns"_test = [] {
        TempConfigDir tmp;
        tmp.write("inkwell/config.yaml", "- just\n- a list\n");
        auto config = Config::create();
        expect(bool(config));
        expect((*config)->loadedPath().empty());
        expect((*config)->maxFontSize() == 50_i);
    };

    "an explicit path that cannot be loaded is fatal"_test = [] {
        TempConfigDir tmp;
        expect(!Config::create("/nonexistent/inkwell.yaml"));
        auto bad = tmp.write("bad.yaml", "overlay: [unclosed\n");
        expect(!Config::create(bad.string()));
    };

    "environment overrides the file"_test = [] {
        TempConfigDir tmp;
        auto path = tmp.write("custom.yaml", "overlay:\n  text:\n    max-font-size: 72\n");
        ::setenv("INKWELL_OVERLAY_TEXT_MAX_FONT_SIZE", "30", 1);
        ::setenv("INKWELL_OVERLAY_ATTACH_ON_START", "0", 1);

        auto config = Config::create(path.string());
        ::unsetenv("INKWELL_OVERLAY_TEXT_MAX_FONT_SIZE");
        ::unsetenv("INKWELL_OVERLAY_ATTACH_ON_START");

        expect(bool(config));
        expect((*config)->maxFontSize() == 30_i);
        expect(!(*config)->attachOnStart());
    };

    "command line overrides win"_test = [] {
        TempConfigDir tmp;
        ::setenv("INKWELL_LOG_LEVEL", "warn", 1);

        YAML::Node overrides;
        overrides["log"]["level"] = "trace";
        overrides["rpc"]["socket"] = "/tmp/cli.sock";
        auto config = Config::create("", overrides);
        ::unsetenv("INKWELL_LOG_LEVEL");

        expect(bool(config));
        expect((*config)->logLevel() == "trace");
        expect((*config)->socketPath() == "/tmp/cli.sock");
    };
};

suite config_lookup_tests = [] {
    "typed lookups report missing and mistyped keys"_test = [] {
        TempConfigDir tmp;
        auto config = *Config::create();
        expect(config->has("overlay.text"));
        expect(!config->has("overlay.nope"));
        expect(!config->get<int>("overlay.nope").has_value());
        expect(!config->get<int>("overlay.text.fallback-font").has_value());
        expect(config->get<int>("overlay.nope", 7) == 7_i);
        expect(!config->get<int>("log.level.deeper").has_value());
    };

    "lookups do not create keys"_test = [] {
        TempConfigDir tmp;
        auto config = *Config::create();
        (void)config->get<std::string>("ghost.key");
        expect(!config->root()["ghost"].IsDefined());
    };

    "env variable names follow the dotted path"_test = [] {
        expect(Config::pathToEnvVar("overlay.text.max-font-size") == "INKWELL_OVERLAY_TEXT_MAX_FONT_SIZE");
        expect(Config::pathToEnvVar("log.level") == "INKWELL_LOG_LEVEL");
    };
};
