#include "upload_receiver.hpp"
#include "common/protocol/protocol.hpp"
#include "logger/Mylogger.hpp"
#include "server/authentication/authentication.hpp"
#include <nlohmann/json.hpp>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <stdexcept>
#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace upload_receiver
{
    namespace
    {
        // Appends data and fsyncs before returning, so the ledger entry written
        // afterwards never describes bytes that are not on disk.
        void appendDurably(const std::string &target, const std::string &data)
        {
            int fd = ::open(target.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
            if (fd < 0)
            {
                throw std::runtime_error("open " + target + ": " + std::strerror(errno));
            }

            const char *cursor = data.data();
            std::size_t remaining = data.size();
            while (remaining > 0)
            {
                ssize_t written = ::write(fd, cursor, remaining);
                if (written < 0)
                {
                    if (errno == EINTR)
                        continue;
                    int err = errno;
                    ::close(fd);
                    throw std::runtime_error("write " + target + ": " + std::strerror(err));
                }
                cursor += written;
                remaining -= static_cast<std::size_t>(written);
            }

            if (::fsync(fd) != 0)
            {
                int err = errno;
                ::close(fd);
                throw std::runtime_error("fsync " + target + ": " + std::strerror(err));
            }
            ::close(fd);
        }

        // Missing header means index 0; anything but a non-negative integer is rejected.
        bool parseChunkIndex(const httplib::Request &req, int &index)
        {
            if (!req.has_header(protocol::HEADER_CHUNK_INDEX))
            {
                index = 0;
                return true;
            }
            const std::string value = req.get_header_value(protocol::HEADER_CHUNK_INDEX);
            try
            {
                std::size_t consumed = 0;
                index = std::stoi(value, &consumed);
                return consumed == value.size() && index >= 0;
            }
            catch (const std::exception &)
            {
                return false;
            }
        }

        bool isProtectedPath(const std::string &path)
        {
            return path == protocol::UPLOAD_PATH || path == protocol::STATUS_PATH;
        }
    }

    ReceiverOptions fromConfig(const Initiation::ServerConfig &config)
    {
        ReceiverOptions options;
        options.host = config.server_ip;
        options.port = config.server_port;
        options.outputDir = config.output_dir.empty() ? fs::current_path().string() : config.output_dir;
        options.apiKey = config.api_key;
        options.legacyTextResponses = config.legacy_text_responses;
        return options;
    }

    namespace
    {
        ReceiverOptions normalize(ReceiverOptions options)
        {
            if (options.outputDir.empty())
            {
                options.outputDir = fs::current_path().string();
            }
            if (options.apiKey.empty())
            {
                options.apiKey = Authentication::generate_api_key();
            }
            if (!options.policy)
            {
                options.policy = std::make_shared<naming::BasenamePolicy>();
            }
            return options;
        }
    }

    UploadReceiver::UploadReceiver(ReceiverOptions options)
        : options_(normalize(std::move(options))),
          tracker_(options_.outputDir)
    {
        registerRoutes();
    }

    UploadReceiver::~UploadReceiver()
    {
        stop();
    }

    void UploadReceiver::registerRoutes()
    {
        server_.set_default_headers({{"Access-Control-Allow-Origin", protocol::CORS_ALLOW_ORIGIN},
                                     {"Access-Control-Allow-Methods", protocol::CORS_ALLOW_METHODS},
                                     {"Access-Control-Allow-Headers", protocol::CORS_ALLOW_HEADERS}});

        server_.set_logger([](const httplib::Request &req, const httplib::Response &res)
                           { MyLogger::debug("Request: " + req.method + " " + req.path + " -> " + std::to_string(res.status)); });

        // Clients that send "Expect: 100-continue" are rejected before they transmit the body.
        server_.set_expect_100_continue_handler([this](const httplib::Request &req, httplib::Response &res)
                                                {
            if (isProtectedPath(req.path) && !Authentication::authenticate_request(req, res, options_.apiKey))
            {
                return res.status;
            }
            return 100; });

        // Runs before httplib reads the body, so a rejected delivery never touches its bytes.
        server_.set_pre_routing_handler([this](const httplib::Request &req, httplib::Response &res)
                                        {
            if (req.method == "OPTIONS" || !isProtectedPath(req.path))
            {
                return httplib::Server::HandlerResponse::Unhandled;
            }
            if (!Authentication::authenticate_request(req, res, options_.apiKey))
            {
                // The unread body would otherwise be parsed as the next request
                res.set_header("Connection", "close");
                return httplib::Server::HandlerResponse::Handled;
            }
            return httplib::Server::HandlerResponse::Unhandled; });

        server_.Post(protocol::UPLOAD_PATH, [this](const httplib::Request &req, httplib::Response &res)
                     { handleUpload(req, res); });

        server_.Get(protocol::STATUS_PATH, [this](const httplib::Request &req, httplib::Response &res)
                    { handleStatus(req, res); });

        server_.Options(".*", [](const httplib::Request &, httplib::Response &res)
                        {
            res.status = 200;
            res.set_header("Access-Control-Max-Age", protocol::CORS_MAX_AGE); });

        server_.set_error_handler([](const httplib::Request &, httplib::Response &res)
                                  {
            if (res.status == 404 && res.body.empty())
            {
                res.set_content("Not Found", protocol::CONTENT_TYPE_TEXT);
            } });
    }

    void UploadReceiver::handleUpload(const httplib::Request &req, httplib::Response &res)
    {
        int chunk_index = 0;
        if (!parseChunkIndex(req, chunk_index))
        {
            res.status = 400;
            res.set_content(protocol::errorBody("Invalid chunk index"), protocol::CONTENT_TYPE_JSON);
            MyLogger::warning("Rejected upload with chunk index '" + req.get_header_value(protocol::HEADER_CHUNK_INDEX) + "'");
            return;
        }

        const std::string client_filename = req.has_header(protocol::HEADER_FILE_NAME)
                                                ? req.get_header_value(protocol::HEADER_FILE_NAME)
                                                : protocol::DEFAULT_CLIENT_FILENAME;

        try
        {
            const std::string actual_filename =
                options_.policy->resolve(client_filename, chunk_index, naming::contextFrom(req));

            protocol::ChunkAck ack;
            ack.actualFilename = actual_filename;
            ack.chunkIndex = chunk_index;
            ack.clientFilename = client_filename;

            auto lock = fileLock(actual_filename);
            std::lock_guard<std::mutex> guard(*lock);

            if (tracker_.isReceived(actual_filename, chunk_index))
            {
                ack.message = "Chunk already received (skipped)";
                ack.alreadyReceived = true;
                MyLogger::info("Chunk " + std::to_string(chunk_index) + " for " + actual_filename + " already received, skipping");
            }
            else
            {
                const std::string target = (fs::path(options_.outputDir) / actual_filename).string();
                repairUncommittedTail(actual_filename, target);
                appendDurably(target, req.body);
                tracker_.markReceived(actual_filename, chunk_index, fs::file_size(target));

                ack.message = "Chunk received";
                MyLogger::info("Chunk " + std::to_string(chunk_index) + " received for " + client_filename +
                               " -> " + actual_filename + " (" + std::to_string(req.body.size()) + " bytes)");
            }

            res.status = 200;
            if (options_.legacyTextResponses)
            {
                res.set_content(ack.message + "\n", protocol::CONTENT_TYPE_TEXT);
            }
            else
            {
                res.set_content(json(ack).dump(), protocol::CONTENT_TYPE_JSON);
            }
        }
        catch (const std::exception &e)
        {
            MyLogger::error("Upload error for chunk " + std::to_string(chunk_index) + " of " + client_filename + ": " + e.what());
            res.status = 500;
            res.set_content(protocol::errorBody(std::string("Upload error: ") + e.what()), protocol::CONTENT_TYPE_JSON);
        }
    }

    void UploadReceiver::repairUncommittedTail(const std::string &filename, const std::string &target)
    {
        if (!fs::exists(target))
        {
            return;
        }
        // No committed length means no chunk of this file was ever marked, so
        // every byte on disk belongs to an append that never committed.
        const std::uint64_t committed = tracker_.committedLength(filename).value_or(0);
        const std::uint64_t on_disk = fs::file_size(target);
        if (on_disk > committed)
        {
            MyLogger::warning("Truncating " + target + " from " + std::to_string(on_disk) + " to committed length " +
                              std::to_string(committed));
            fs::resize_file(target, committed);
        }
        else if (on_disk < committed)
        {
            MyLogger::error(target + " is shorter (" + std::to_string(on_disk) + ") than its committed length " +
                            std::to_string(committed));
        }
    }

    void UploadReceiver::handleStatus(const httplib::Request &req, httplib::Response &res)
    {
        const std::string filename = req.get_param_value("filename");
        if (filename.empty())
        {
            res.status = 400;
            res.set_content(protocol::errorBody("Missing filename parameter"), protocol::CONTENT_TYPE_JSON);
            return;
        }

        try
        {
            protocol::StatusResponse status;
            status.filename = filename;
            status.receivedChunks = tracker_.receivedSet(filename);
            res.status = 200;
            res.set_content(json(status).dump(), protocol::CONTENT_TYPE_JSON);
            MyLogger::info("Status for " + filename + ": " + std::to_string(status.receivedChunks.size()) + " chunks received");
        }
        catch (const std::exception &e)
        {
            MyLogger::error("Status error for " + filename + ": " + e.what());
            res.status = 500;
            res.set_content(protocol::errorBody(std::string("Status error: ") + e.what()), protocol::CONTENT_TYPE_JSON);
        }
    }

    std::shared_ptr<std::mutex> UploadReceiver::fileLock(const std::string &filename)
    {
        std::lock_guard<std::mutex> lock(locks_mutex_);
        auto &entry = file_locks_[filename];
        if (!entry)
        {
            entry = std::make_shared<std::mutex>();
        }
        return entry;
    }

    bool UploadReceiver::bind()
    {
        if (options_.port == 0)
        {
            bound_port_ = server_.bind_to_any_port(options_.host);
            return bound_port_ > 0;
        }
        if (!server_.bind_to_port(options_.host, options_.port))
        {
            return false;
        }
        bound_port_ = options_.port;
        return true;
    }

    void UploadReceiver::announce() const
    {
        const std::string base = "http://" + options_.host + ":" + std::to_string(bound_port_);
        MyLogger::info("Server listening on " + base);
        MyLogger::info("API Key: " + options_.apiKey);
        MyLogger::info("Include this API key in requests using the Authorization: Bearer <token> header");
        MyLogger::info("Upload endpoint: " + base + protocol::UPLOAD_PATH);
        MyLogger::info("Output directory: " + options_.outputDir);
    }

    void UploadReceiver::start()
    {
        if (!bind())
        {
            MyLogger::error("Failed to start server. Check IP/port binding. Server IP: " + options_.host +
                            " | Server Port: " + std::to_string(options_.port));
            throw std::runtime_error("Failed to bind " + options_.host + ":" + std::to_string(options_.port));
        }
        announce();
        loop_exited_ = false;
        server_thread_ = std::thread([this]
                                     {
            if (!server_.listen_after_bind())
            {
                MyLogger::error("Server loop exited with an error");
            }
            loop_exited_ = true; });
    }

    bool UploadReceiver::listen()
    {
        loop_exited_ = false;
        if (!bind())
        {
            MyLogger::error("Failed to start server. Check IP/port binding. Server IP: " + options_.host +
                            " | Server Port: " + std::to_string(options_.port));
            loop_exited_ = true;
            return false;
        }
        announce();
        bool ok = server_.listen_after_bind();
        loop_exited_ = true;
        return ok;
    }

    void UploadReceiver::waitUntilReady() const
    {
        while (!server_.is_running() && !loop_exited_)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }

    void UploadReceiver::stop()
    {
        if (server_thread_.joinable())
        {
            waitUntilReady();
        }
        if (server_.is_running())
        {
            MyLogger::info("Stopping server...");
            server_.stop();
        }
        if (server_thread_.joinable())
        {
            server_thread_.join();
        }
    }
}
