#include <gwlink/gateway_client.hpp>
#include <gwlink/monitoring/prometheus_observer.hpp>
#include <gwlink/version.hpp>

#include <prometheus/text_serializer.h>

#include <iostream>
#include <memory>
#include <string>

namespace
{
void usage(const char* argv0)
{
    std::cerr << gwlink::version_full() << std::endl;
    std::cerr << "Usage: " << argv0 << " <ws-url> [token]" << std::endl;
    std::cerr << "       " << argv0 << " --config <file.json> [pings]" << std::endl;
    std::cerr << "       " << argv0 << " --quick <ws-url> [token]" << std::endl;
    std::cerr << "Example: " << argv0 << " ws://127.0.0.1:18789 secret" << std::endl;
}

int quick_test(const std::string& url, const std::string& token)
{
    boost::asio::io_context io;
    int exit_code = 1;

    gwlink::connection_test_options options;
    options.gateway_url = url;
    options.auth_token = token;

    gwlink::test_connection(&io, options, [&exit_code](gwlink::connection_test_result result) {
        if (result.success)
        {
            std::cout << "OK  latency=" << result.latency->count() << "ms"
                      << "  version=" << result.version.value_or("?") << std::endl;
            exit_code = 0;
        }
        else
        {
            std::cout << "FAIL  " << result.error.value_or("unknown error") << std::endl;
        }
    });

    io.run();
    return exit_code;
}

// connect -> ping x N -> status -> disconnect
class probe : public std::enable_shared_from_this<probe>
{
    std::shared_ptr<gwlink::gateway_client> client_;
    int remaining_;
    int exit_code_{0};

public:
    probe(std::shared_ptr<gwlink::gateway_client> client, int pings)
      : client_(std::move(client))
      , remaining_(pings)
    {
    }

    void start()
    {
        client_->connect([self = shared_from_this()](std::optional<gwlink::gateway_error> error) {
            if (error)
                return self->fail("connect", *error);

            std::cout << "connected to " << self->client_->rpc().config().gateway_url << std::endl;
            self->next_ping();
        });
    }

    int exit_code() const { return exit_code_; }

private:
    void next_ping()
    {
        if (remaining_-- <= 0)
            return query_status();

        client_->ping([self = shared_from_this()](std::optional<gwlink::gateway_error> error, gwlink::ping_result pong) {
            if (error)
                return self->fail("ping", *error);

            std::cout << "pong latency=" << pong.latency.count() << "ms" << std::endl;
            self->next_ping();
        });
    }

    void query_status()
    {
        client_->get_gateway_status([self = shared_from_this()](std::optional<gwlink::gateway_error> error, gwlink::gateway_status status) {
            if (error)
                return self->fail("status", *error);

            std::cout << "gateway version=" << status.version
                      << " active_sessions=" << status.active_sessions
                      << " uptime=" << status.uptime << "s" << std::endl;
            self->client_->disconnect();
        });
    }

    void fail(const std::string& step, const gwlink::gateway_error& error)
    {
        std::cerr << step << " failed (" << gwlink::to_string(error.kind()) << "): " << error.what() << std::endl;
        exit_code_ = 1;
        client_->disconnect();
    }
};

void print_metrics(const prometheus::Registry& registry)
{
    prometheus::TextSerializer serializer;
    std::cout << std::endl << serializer.Serialize(registry.Collect());
}
} // namespace

int main(int argc, char* argv[])
{
    try
    {
        if (argc < 2)
        {
            usage(argv[0]);
            return 1;
        }

        std::string first = argv[1];
        if (first == "--quick")
        {
            if (argc < 3)
            {
                usage(argv[0]);
                return 1;
            }
            return quick_test(argv[2], argc > 3 ? argv[3] : "");
        }

        gwlink::client_config config;
        int pings = 3;

        if (first == "--config")
        {
            if (argc < 3)
            {
                usage(argv[0]);
                return 1;
            }
            config = gwlink::load_client_config(argv[2]);
            if (argc > 3)
                pings = std::stoi(argv[3]);
        }
        else
        {
            config.gateway_url = first;
            if (argc > 2)
                config.auth_token = argv[2];
        }

        auto registry = std::make_shared<prometheus::Registry>();
        config.observer = std::make_shared<gwlink::monitoring::prometheus_observer>(registry);
        config.logger = gwlink::console_logger();
        config.reconnect.enabled = false;

        boost::asio::io_context io;
        auto session = std::make_shared<probe>(std::make_shared<gwlink::gateway_client>(&io, config), pings);
        session->start();

        io.run();

        print_metrics(*registry);
        return session->exit_code();
    }
    catch (const std::exception& e)
    {
        std::cerr << "Exception: " << e.what() << std::endl;
        return 1;
    }
}
