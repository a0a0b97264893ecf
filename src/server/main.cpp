#include <pthread.h>
#include <atomic>
#include <csignal>
#include <exception>
#include <iostream>
#include <thread>
#include "logger/Mylogger.hpp"
#include "server/initiation/initiation.hpp"
#include "server/upload_receiver/upload_receiver.hpp"

std::atomic<bool> server_running(true);

int main(int argc, char *argv[])
{
    if (argc < 2)
    {
        std::cerr << "Usage: " << argv[0] << " <server_config_path>" << std::endl;
        return 1;
    }

    // Blocked before any thread starts so only the watcher below ever sees them
    sigset_t shutdown_signals;
    sigemptyset(&shutdown_signals);
    sigaddset(&shutdown_signals, SIGINT);
    sigaddset(&shutdown_signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &shutdown_signals, nullptr);

    try
    {
        MyLogger::info("Initializing server using configuration file: " + std::string(argv[1]));
        Initiation::ServerConfig config = Initiation::initialize(argv[1]);
        MyLogger::init(config.log_level, config.log_file);

        upload_receiver::UploadReceiver receiver(upload_receiver::fromConfig(config));

        std::thread signal_watcher([&receiver, &shutdown_signals]()
                                   {
            int signal_number = 0;
            sigwait(&shutdown_signals, &signal_number);
            if (server_running)
            {
                MyLogger::info("Received shutdown signal (" + std::to_string(signal_number) + "). Stopping server...");
                receiver.waitUntilReady();
                receiver.stop();
            } });

        bool served = receiver.listen();
        server_running = false;
        // Wakes the watcher when the loop ended without a signal
        pthread_kill(signal_watcher.native_handle(), SIGTERM);
        signal_watcher.join();

        if (!served)
        {
            return 1;
        }
        MyLogger::info("Server stopped successfully");
    }
    catch (const std::exception &e)
    {
        MyLogger::error("Server failed: " + std::string(e.what()));
        return 1;
    }
    return 0;
}
