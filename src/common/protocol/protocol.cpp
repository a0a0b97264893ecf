#include "protocol.hpp"
#include <httplib.h>

using json = nlohmann::json;

namespace protocol
{
    void to_json(json &j, const ChunkAck &ack)
    {
        j = json{
            {"message", ack.message},
            {"actualFilename", ack.actualFilename},
            {"chunkIndex", ack.chunkIndex},
            {"clientFilename", ack.clientFilename}};
        // Only present when true, as older receivers never send it.
        if (ack.alreadyReceived)
        {
            j["alreadyReceived"] = true;
        }
    }

    void from_json(const json &j, ChunkAck &ack)
    {
        ack.message = j.value("message", std::string());
        ack.actualFilename = j.value("actualFilename", std::string());
        ack.chunkIndex = j.value("chunkIndex", 0);
        ack.clientFilename = j.value("clientFilename", std::string());
        ack.alreadyReceived = j.value("alreadyReceived", false);
    }

    DeliverResponse parseDeliverResponse(const std::string &contentType, const std::string &body)
    {
        if (contentType.find(CONTENT_TYPE_JSON) != std::string::npos)
        {
            // A body that claims JSON but is not an object falls back to text
            json parsed = json::parse(body, nullptr, false);
            if (!parsed.is_discarded() && parsed.is_object())
            {
                try
                {
                    return parsed.get<ChunkAck>();
                }
                catch (const json::exception &)
                {
                    // mistyped fields: keep the raw body as the message
                }
            }
        }
        return PlainText{body};
    }

    const std::string &messageOf(const DeliverResponse &response)
    {
        if (const auto *ack = std::get_if<ChunkAck>(&response))
        {
            return ack->message;
        }
        return std::get<PlainText>(response).message;
    }

    std::optional<std::string> actualFilenameOf(const DeliverResponse &response)
    {
        const auto *ack = std::get_if<ChunkAck>(&response);
        if (ack == nullptr || ack->actualFilename.empty())
        {
            return std::nullopt;
        }
        return ack->actualFilename;
    }

    bool isAlreadyReceived(const DeliverResponse &response)
    {
        const auto *ack = std::get_if<ChunkAck>(&response);
        return ack != nullptr && ack->alreadyReceived;
    }

    void to_json(json &j, const StatusResponse &status)
    {
        j = json{
            {"filename", status.filename},
            {"receivedChunks", status.receivedChunks}};
    }

    void from_json(const json &j, StatusResponse &status)
    {
        j.at("filename").get_to(status.filename);
        status.receivedChunks.clear();
        for (const auto &index : j.at("receivedChunks"))
        {
            status.receivedChunks.insert(index.get<int>());
        }
    }

    StatusResponse parseStatusResponse(const std::string &body)
    {
        return json::parse(body).get<StatusResponse>();
    }

    std::string errorBody(const std::string &message)
    {
        return json{{"error", message}}.dump();
    }

    std::string bearer(const std::string &apiKey)
    {
        return BEARER_PREFIX + apiKey;
    }

    std::optional<std::string> extractBearer(const std::string &headerValue)
    {
        if (headerValue.rfind(BEARER_PREFIX, 0) != 0)
        {
            return std::nullopt;
        }
        return headerValue.substr(BEARER_PREFIX.size());
    }

    std::string statusUrl(const std::string &uploadUrl, const std::string &filename)
    {
        std::string base = uploadUrl;
        while (!base.empty() && base.back() == '/')
        {
            base.pop_back();
        }
        if (base.size() >= UPLOAD_PATH.size() &&
            base.compare(base.size() - UPLOAD_PATH.size(), UPLOAD_PATH.size(), UPLOAD_PATH) == 0)
        {
            base.erase(base.size() - UPLOAD_PATH.size());
        }
        return base + STATUS_PATH + "?filename=" + httplib::encode_query_param(filename);
    }
}
