#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include "client/chunk_store/chunk_store.hpp"
#include "client/transport/http_transport.hpp"
#include "client/upload_client/upload_client.hpp"
#include "common/errors/errors.hpp"
#include "common/load_config/load_config.hpp"
#include "logger/Mylogger.hpp"

namespace
{
    void usage(const char *prog)
    {
        std::cerr << "Usage: " << prog << " <client_config_path> <command> [args]\n"
                  << "Commands:\n"
                  << "  add <file>...            stage files in the local chunk store\n"
                  << "  upload <url>             upload every staged file\n"
                  << "  send <file> <url>        upload one file directly, resuming if possible\n"
                  << "  list                     list staged files\n"
                  << "  clear                    drop every staged chunk\n"
                  << "  status <url> <filename>  show the chunks the server already holds\n";
    }

    int run(upload_client::UploadClient &client, const std::string &command, const std::vector<std::string> &args)
    {
        if (command == "add" && !args.empty())
        {
            for (const auto &path : args)
            {
                int chunks = client.addFile(path);
                std::cout << path << ": " << chunks << " chunks staged" << std::endl;
            }
            return 0;
        }
        if (command == "upload" && args.size() == 1)
        {
            auto report = client.uploadBufferedFiles(args[0]);
            for (const auto &[source, target] : report.uploaded)
            {
                std::cout << source << " -> " << target << std::endl;
            }
            for (const auto &[source, error] : report.failed)
            {
                std::cerr << source << " failed: " << error << std::endl;
            }
            return report.failed.empty() ? 0 : 1;
        }
        if (command == "send" && args.size() == 2)
        {
            for (const auto &[source, target] : client.uploadFile(args[0], args[1]))
            {
                std::cout << source << " -> " << target << std::endl;
            }
            return 0;
        }
        if (command == "list" && args.empty())
        {
            auto files = client.getBufferedFiles();
            if (files.empty())
            {
                std::cout << "No buffered files" << std::endl;
            }
            for (const auto &file : files)
            {
                std::cout << file << std::endl;
            }
            return 0;
        }
        if (command == "clear" && args.empty())
        {
            client.clearBuffer();
            std::cout << "Buffer cleared" << std::endl;
            return 0;
        }
        if (command == "status" && args.size() == 2)
        {
            auto received = client.getReceivedChunks(args[0], args[1]);
            std::cout << args[1] << ": " << received.size() << " chunks received [";
            bool first = true;
            for (int index : received)
            {
                std::cout << (first ? "" : ",") << index;
                first = false;
            }
            std::cout << "]" << std::endl;
            return 0;
        }
        return -1;
    }
}

int main(int argc, char *argv[])
{
    if (argc < 3)
    {
        usage(argv[0]);
        return 1;
    }

    try
    {
        json config = ConfigReader::load(argv[1]);
        MyLogger::init(ConfigReader::get_config_string("log_level", config, "info"),
                       ConfigReader::get_config_string("log_file", config, ""));

        upload_client::ClientOptions options = upload_client::loadOptions(config);
        auto store = std::make_shared<chunk_store::ChunkStore>(options.dbPath);
        auto transport = std::make_shared<transport::CurlTransport>();
        upload_client::UploadClient client(options, transport, store);

        std::vector<std::string> args(argv + 3, argv + argc);
        int rc = run(client, argv[2], args);
        if (rc < 0)
        {
            usage(argv[0]);
            return 1;
        }
        return rc;
    }
    catch (const errors::TransferExhausted &e)
    {
        MyLogger::error("Upload failed: " + std::string(e.what()));
        std::cerr << "Upload failed after " << e.attempts() << " attempts: " << e.lastError().what() << std::endl;
    }
    catch (const errors::TransferError &e)
    {
        MyLogger::error(e.what());
        std::cerr << e.what() << std::endl;
    }
    catch (const std::exception &e)
    {
        MyLogger::error("Unexpected error: " + std::string(e.what()));
        std::cerr << e.what() << std::endl;
    }
    return 1;
}
