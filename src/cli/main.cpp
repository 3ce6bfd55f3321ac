#include "shared/config.hpp"
#include "shared/util/term_color.hpp"
#include "srvlist/client_config.hpp"
#include "srvlist/context.hpp"
#include "srvlist/directory.hpp"
#include "srvlist/executor.hpp"
#include "srvlist/file_transport.hpp"
#include "srvlist/log.hpp"
#include "srvlist/updater.hpp"

#include <charconv>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <cstdio>
#include <cstdlib>
#include <cxxopts.hpp>
#include <exception>
#include <filesystem>
#include <fmt/chrono.h>
#include <fmt/core.h>
#include <fmt/format.h>
#include <future>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

using namespace srvlist;
using namespace fmt::literals;

static auto cli_config = cxxopts::Options(PROG_NAME);

namespace {
class PrintingListener final : public UpdaterListener {
  private:
    std::promise<int> m_exit_code;

    void done(int const exit_code) {
        m_exit_code.set_value(exit_code);
    }

  public:
    std::future<int> exit_code() {
        return m_exit_code.get_future();
    }

    void no_data() override {
        fmt::print(stderr, "no server list to pick a server from\n");
        done(EXIT_FAILURE);
    }

    void network_not_available() override {
        fmt::print(stderr, "network not available\n");
        done(EXIT_FAILURE);
    }

    void offline_mode_enabled() override {
        fmt::print(stderr, "offline mode enabled\n");
        done(EXIT_FAILURE);
    }

    void error(std::error_code const code, std::string_view const reason)
        override {
        fmt::print(
            stderr,
            "update failed: {} ({}:{})\n",
            reason,
            code.category().name(),
            code.value()
        );
        done(EXIT_FAILURE);
    }

    void updated(std::shared_ptr<Directory const> const directory) override {
        fmt::print("updated server list, {} servers\n", directory->size());
        done(EXIT_SUCCESS);
    }
};
} // namespace

static void print_directory(Directory const& directory) {
    fmt::print(
        "timestamp: {:%F %T} UTC\n",
        fmt::gmtime(static_cast<std::time_t>(
            directory.timestamp().time_since_epoch().count()
        ))
    );
    for (Endpoint const& endpoint : directory.endpoints()) {
        fmt::print("{}\n", endpoint);
    }
}

static std::chrono::milliseconds parse_timeout(std::string const& timeout_str) {
    char const* const timeout_begin = timeout_str.c_str();
    char const* const timeout_end = timeout_begin + timeout_str.length();
    std::uint32_t millis;
    auto const [end, err] = std::from_chars(timeout_begin, timeout_end, millis);
    if (err != std::errc() or end != timeout_end) {
        switch (err) {
            case std::errc::result_out_of_range:
                throw std::invalid_argument("timeout out of range");
            default:
                throw std::invalid_argument("invalid timeout");
        }
    }
    return std::chrono::milliseconds(millis);
}

int main(int argc, char* argv[]) try {
    std::ios::sync_with_stdio(false);
    std::cin.tie(nullptr);

    // clang-format off
    cli_config.add_options()
    (
        "help",
        "Display this information."
    )
    (
        "version",
        "Display version information."
    )
    (
        "verbose",
        "Enable verbose output.",
        cxxopts::value<bool>()->default_value("false")
    )
    (
        "config",
        "Specify the path to the configuration file.",
        cxxopts::value<std::filesystem::path>()->default_value(DEFAULT_CONFIG_PATH)
    )
    (
        "show",
        "Print the current server list."
    )
    (
        "resolve",
        "Print the server a client should connect to."
    )
    (
        "refresh-from",
        "Refresh the server list with the servers listed in a file.",
        cxxopts::value<std::filesystem::path>()
    )
    (
        "delete-cache",
        "Forget the downloaded server list."
    )
    (
        "timeout",
        "Specify the refresh timeout in milliseconds.",
        cxxopts::value<std::string>()
    )
    ;
    // clang-format on

    cxxopts::ParseResult const cli_options = cli_config.parse(argc, argv);

    if (cli_options.count("help") > 0) {
        fmt::print("{}\n", cli_config.help());
        return EXIT_SUCCESS;
    }

    if (cli_options.count("version") > 0) {
        fmt::print(
            "{prog_name} {major}.{minor}.{patch}\n",
            "prog_name"_a = PROG_NAME,
            "major"_a = VERSION_MAJOR,
            "minor"_a = VERSION_MINOR,
            "patch"_a = VERSION_PATCH
        );
        return EXIT_SUCCESS;
    }

    auto const verbose = cli_options["verbose"].as<bool>();
    Log::set_level(verbose ? Log::Level::INFO : Log::Level::WARN);
    Log::flush_on(verbose ? Log::Level::INFO : Log::Level::WARN);

    auto config = ClientConfig::from_file(
        std::filesystem::path(cli_options["config"].as<std::filesystem::path>())
    );
    if (not config.log_path().empty()) {
        Log::set_log(config.log_path());
    }
    Log::info(
        fmt::format("parsed configuration file '{}'", config.path().native())
    );

    if (cli_options.count("timeout") > 0) {
        config.set_refresh_timeout(
            parse_timeout(cli_options["timeout"].as<std::string>())
        );
    }

    auto ctx = Context(config);

    if (cli_options.count("delete-cache") > 0) {
        ctx.reset();
    }

    int exit_code = EXIT_SUCCESS;
    if (cli_options.count("refresh-from") > 0) {
        ThreadExecutor background;
        SerialExecutor ordered;
        FileTransport transport(
            cli_options["refresh-from"].as<std::filesystem::path>(),
            background,
            ordered
        );
        PrintingListener listener;
        std::future<int> result = listener.exit_code();
        std::unique_ptr<Updater> const updater = ctx.make_updater(transport);
        updater->set_listener(&listener);
        updater->start();
        exit_code = result.get();
    }

    if (cli_options.count("show") > 0) {
        std::shared_ptr<Directory const> const directory = ctx.cache().current();
        if (directory == nullptr) {
            throw std::runtime_error("no server list available");
        }
        print_directory(*directory);
    }

    if (cli_options.count("resolve") > 0) {
        std::optional<Endpoint> const endpoint = ctx.endpoint();
        if (not endpoint) {
            throw std::runtime_error("no server available");
        }
        fmt::print("{}\n", *endpoint);
    }

    return exit_code;
} catch (std::exception const& err) {
    fmt::print(
        stderr,
        "{prog_name}: {error}: {reason}.\n",
        "prog_name"_a = bold_white(PROG_NAME),
        "error"_a = bold_red("error"),
        "reason"_a = err.what()
    );
    auto const cli_err = dynamic_cast<cxxopts::OptionException const*>(&err);
    if (cli_err != nullptr) {
        fmt::print(stderr, "{}\n", cli_config.help());
    }
    return EXIT_FAILURE;
}
