#ifndef UPLOAD_RECEIVER_HPP
#define UPLOAD_RECEIVER_HPP

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <httplib.h>
#include "server/chunk_tracker/chunk_tracker.hpp"
#include "server/initiation/initiation.hpp"
#include "server/naming/filename_policy.hpp"

namespace upload_receiver
{
    struct ReceiverOptions
    {
        std::string host = "localhost";
        int port = 3000;                 // 0 binds an ephemeral port
        std::string outputDir = ".";
        std::string apiKey;              // empty: one is generated
        bool legacyTextResponses = false;
        std::shared_ptr<naming::FilenamePolicy> policy; // null: BasenamePolicy
    };

    ReceiverOptions fromConfig(const Initiation::ServerConfig &config);

    // HTTP endpoint that appends delivered chunks to files in outputDir.
    //
    //   POST /upload          Authenticate -> ResolveTargetFilename -> CheckAlreadyReceived
    //                         -> [AppendBytes -> MarkReceived] -> Respond
    //   GET  /upload/status   Authenticate -> ReadReceivedSet -> Respond
    //   OPTIONS *             CORS preflight
    //
    // Authentication runs before the request body is read. Deliveries for the
    // same target filename are serialized by a per-file mutex.
    class UploadReceiver
    {
    public:
        explicit UploadReceiver(ReceiverOptions options);
        ~UploadReceiver();

        UploadReceiver(const UploadReceiver &) = delete;
        UploadReceiver &operator=(const UploadReceiver &) = delete;

        // Binds, then serves on a background thread. Throws std::runtime_error if binding fails.
        void start();
        // Binds and serves on the calling thread until stop(). Returns false if binding fails.
        bool listen();
        void stop();
        // Blocks until the server accepts connections or its loop has exited.
        void waitUntilReady() const;

        int port() const { return bound_port_; }
        const std::string &apiKey() const { return options_.apiKey; }
        const std::string &outputDir() const { return options_.outputDir; }
        chunk_tracker::ChunkTracker &tracker() { return tracker_; }

    private:
        void registerRoutes();
        bool bind();
        void announce() const;

        void handleUpload(const httplib::Request &req, httplib::Response &res);
        void handleStatus(const httplib::Request &req, httplib::Response &res);

        // Cuts off bytes appended by a delivery whose mark never committed. A file the
        // ledger has never committed a length for is cut back to empty.
        void repairUncommittedTail(const std::string &filename, const std::string &target);

        std::shared_ptr<std::mutex> fileLock(const std::string &filename);

        ReceiverOptions options_;
        chunk_tracker::ChunkTracker tracker_;
        httplib::Server server_;
        std::thread server_thread_;
        std::atomic<bool> loop_exited_{false};
        int bound_port_ = 0;

        std::mutex locks_mutex_;
        std::map<std::string, std::shared_ptr<std::mutex>> file_locks_;
    };
}

#endif // UPLOAD_RECEIVER_HPP
