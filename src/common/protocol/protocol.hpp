#pragma once

#include <set>
#include <string>
#include <optional>
#include <variant>
#include <nlohmann/json.hpp>

// Wire contract shared by the upload client and the upload receiver.
namespace protocol
{
    // Endpoints
    inline const std::string UPLOAD_PATH = "/upload";
    inline const std::string STATUS_PATH = "/upload/status";

    // Headers
    inline const std::string HEADER_CHUNK_INDEX = "X-Chunk-Index";
    inline const std::string HEADER_FILE_NAME = "X-File-Name";
    inline const std::string HEADER_AUTHORIZATION = "Authorization";
    inline const std::string HEADER_CONTENT_TYPE = "Content-Type";
    inline const std::string BEARER_PREFIX = "Bearer ";

    inline const std::string CONTENT_TYPE_OCTET = "application/octet-stream";
    inline const std::string CONTENT_TYPE_JSON = "application/json";
    inline const std::string CONTENT_TYPE_TEXT = "text/plain";

    // Used by the receiver when X-File-Name is absent or sanitizes to nothing.
    inline const std::string DEFAULT_CLIENT_FILENAME = "uploaded_file.txt";

    // CORS
    inline const std::string CORS_ALLOW_ORIGIN = "*";
    inline const std::string CORS_ALLOW_METHODS = "GET, POST, OPTIONS";
    inline const std::string CORS_ALLOW_HEADERS = "Content-Type, Authorization, X-File-Name, X-Chunk-Index";
    inline const std::string CORS_MAX_AGE = "3600";

    // Structured acknowledgement of a chunk delivery.
    struct ChunkAck
    {
        std::string message;
        std::string actualFilename;
        int chunkIndex = 0;
        std::string clientFilename;
        bool alreadyReceived = false;
    };

    void to_json(nlohmann::json &j, const ChunkAck &ack);
    void from_json(const nlohmann::json &j, ChunkAck &ack);

    // Body of a legacy peer that answers in plain text.
    struct PlainText
    {
        std::string message;
    };

    // Decided once at the protocol boundary; callers never sniff the body again.
    using DeliverResponse = std::variant<ChunkAck, PlainText>;

    DeliverResponse parseDeliverResponse(const std::string &contentType, const std::string &body);

    const std::string &messageOf(const DeliverResponse &response);
    std::optional<std::string> actualFilenameOf(const DeliverResponse &response);
    bool isAlreadyReceived(const DeliverResponse &response);

    struct StatusResponse
    {
        std::string filename;
        std::set<int> receivedChunks;
    };

    void to_json(nlohmann::json &j, const StatusResponse &status);
    void from_json(const nlohmann::json &j, StatusResponse &status);

    // Throws nlohmann::json::exception on a malformed body.
    StatusResponse parseStatusResponse(const std::string &body);

    std::string errorBody(const std::string &message);
    std::string bearer(const std::string &apiKey);

    // Returns the token of a "Bearer <token>" header, or nullopt.
    std::optional<std::string> extractBearer(const std::string &headerValue);

    // http://host:3000/upload -> http://host:3000/upload/status?filename=<encoded>
    std::string statusUrl(const std::string &uploadUrl, const std::string &filename);
}
