#include <gwlink/gateway_client.hpp>

#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <iostream>
#include <memory>
#include <string>

int main(int argc, char* argv[])
{
    try
    {
        if (argc < 3)
        {
            std::cerr << "Usage: " << argv[0] << " <ws-url> <prompt> [token] [working-dir]" << std::endl;
            std::cerr << "Example: " << argv[0] << " ws://127.0.0.1:18789 \"Fix the failing test\" secret /srv/repo" << std::endl;
            return 1;
        }

        gwlink::client_config config;
        config.gateway_url = argv[1];
        if (argc > 3)
            config.auth_token = argv[3];
        config.logger = gwlink::console_logger();

        gwlink::send_task_options task;
        task.prompt = argv[2];
        if (argc > 4)
            task.working_dir = argv[4];

        boost::asio::io_context io;
        auto client = std::make_shared<gwlink::gateway_client>(&io, config);

        // Kept alive until the task finishes
        auto events = std::make_shared<gwlink::subscription>();

        boost::asio::signal_set signals(io, SIGINT, SIGTERM);
        signals.async_wait([client, events](const boost::system::error_code& ec, int) {
            if (ec)
                return;
            std::cout << "Interrupted, disconnecting" << std::endl;
            events->unsubscribe();
            client->disconnect();
        });

        client->connect([client, task, events, &signals](std::optional<gwlink::gateway_error> error) {
            if (error)
            {
                std::cerr << "Connect failed: " << error->what() << std::endl;
                signals.cancel();
                return;
            }

            client->send_task(task, [client, events, &signals](std::optional<gwlink::gateway_error> error, gwlink::send_task_result result) {
                if (error)
                {
                    std::cerr << "send_task failed: " << error->what() << std::endl;
                    client->disconnect();
                    signals.cancel();
                    return;
                }

                std::cout << "Session " << result.session_id << " started" << std::endl;

                *events = client->subscribe(result.session_id, [client, events, &signals](const gwlink::session_event& event) {
                    std::cout << "[" << gwlink::to_string(event.type) << "] " << event.data.toStyledString();

                    if (event.type == gwlink::event_type::complete || event.type == gwlink::event_type::error)
                    {
                        events->unsubscribe();
                        client->disconnect();
                        signals.cancel();
                    }
                });
            });
        });

        io.run();
    }
    catch (const std::exception& e)
    {
        std::cerr << "Exception: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
