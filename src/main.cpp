#include "api/client.hpp"
#include "api/static_config.hpp"
#include "cli.hpp"
#include "utils.hpp"

#include <csignal>
#include <iostream>
#include <pthread.h>
#include <string>
#include <thread>
#include <vector>

namespace {

// SIGINT cancels the request instead of killing the process.
void cancel_on_interrupt(api::CancelFunc cancel) {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    pthread_sigmask(SIG_BLOCK, &set, nullptr);

    std::thread([set, cancel] {
        int sig = 0;
        if (sigwait(&set, &sig) == 0) {
            std::cerr << "api-client: interrupted\n";
            cancel();
        }
    }).detach();
}

} // namespace

int main(int argc, char** argv) {
    namespace cli = api::cli;

    cli::Arguments args;
    try {
        args = cli::parse_args(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const cli::UsageError& e) {
        std::cerr << "api-client: " << e.what() << "\n" << cli::kUsage;
        return cli::kExitUsage;
    }
    if (args.help) {
        std::cout << cli::kUsage;
        return cli::kExitOk;
    }

    auto scoped = api::Context::WithCancel(api::Context::Background());
    api::ContextPtr ctx = scoped.first;
    cancel_on_interrupt(scoped.second);

    std::shared_ptr<api::Client> client;
    try {
        const std::string path = api::get_env("API_CONFIG", "");
        api::StaticConfig config = path.empty() ? api::StaticConfig::FromEnv()
                                                : api::StaticConfig::FromFile(path);
        client = api::NewClient(ctx, config, nullptr, args.options);
    } catch (const api::Error& e) {
        std::cerr << "api-client: " << e.what() << "\n";
        return cli::kExitUsage;
    }

    auto url = client->URL(args.endpoint);
    if (!url) {
        std::cerr << "api-client: unknown endpoint " << args.endpoint << "\n";
        return cli::kExitUsage;
    }

    api::Result result = client->Do(ctx, cli::build_request(args, *url));
    if (!result.ok()) {
        std::cerr << "api-client: " << api::to_string(result.error->kind()) << " error: "
                  << result.error->what() << "\n";
        return cli::exit_code(result);
    }

    std::cout << result.body;
    if (!result.body.empty() && result.body.back() != '\n') {
        std::cout << "\n";
    }
    return cli::exit_code(result);
}
