/**
 * Message — content kinds exchanged over the message socket and their
 * JSON representation.
 */

#include "protocol/message.h"

#include "crypto/crypto_manager.h"

namespace {

constexpr std::size_t kIdBytes = 8;

} // namespace

TextRequest TextRequest::create(std::string value) {
    return TextRequest{CryptoManager::random_hex(kIdBytes), std::move(value)};
}

FilesRequest FilesRequest::create(std::vector<FileInfo> files) {
    return FilesRequest{CryptoManager::random_hex(kIdBytes), std::move(files)};
}

const char* content_type_name(const MessageContent& content) {
    return std::visit(overloaded{
        [](const TextRequest&)   { return "textRequest"; },
        [](const TextResponse&)  { return "textResponse"; },
        [](const FilesRequest&)  { return "filesRequest"; },
        [](const FilesResponse&) { return "filesResponse"; },
    }, content);
}

bool is_valid(const MessageContent& content) {
    return std::visit(overloaded{
        [](const TextRequest& m)   { return !m.id.empty() && !m.value.empty(); },
        [](const TextResponse& m)  { return !m.id.empty(); },
        [](const FilesRequest& m)  {
            if (m.id.empty() || m.files.empty()) return false;
            for (const auto& f : m.files) {
                if (f.name.empty()) return false;
            }
            return true;
        },
        [](const FilesResponse& m) { return !m.id.empty(); },
    }, content);
}

bool is_file_content(const MessageContent& content) {
    return std::holds_alternative<FilesRequest>(content) ||
           std::holds_alternative<FilesResponse>(content);
}

const std::string& content_id(const MessageContent& content) {
    return std::visit([](const auto& m) -> const std::string& { return m.id; }, content);
}

InvalidMessageError::InvalidMessageError(const MessageContent& content)
    : std::invalid_argument(std::string("invalid ") + content_type_name(content) +
                            " message (id '" + content_id(content) + "')") {}

void to_json(nlohmann::json& j, const DeviceInfo& d) {
    j = nlohmann::json{{"id", d.id}, {"displayName", d.display_name}};
}

void from_json(const nlohmann::json& j, DeviceInfo& d) {
    j.at("id").get_to(d.id);
    d.display_name = j.value("displayName", std::string());
}

void to_json(nlohmann::json& j, const FileInfo& f) {
    j = nlohmann::json{{"name", f.name}, {"size", f.size}};
}

void from_json(const nlohmann::json& j, FileInfo& f) {
    j.at("name").get_to(f.name);
    f.size = j.value("size", uint64_t{0});
}

void to_json(nlohmann::json& j, const MessageContent& content) {
    j = std::visit(overloaded{
        [](const TextRequest& m) {
            return nlohmann::json{{"id", m.id}, {"value", m.value}};
        },
        [](const TextResponse& m) {
            return nlohmann::json{{"id", m.id}};
        },
        [](const FilesRequest& m) {
            return nlohmann::json{{"id", m.id}, {"files", m.files}};
        },
        [](const FilesResponse& m) {
            return nlohmann::json{{"id", m.id}, {"isAccepted", m.is_accepted}};
        },
    }, content);
    j["type"] = content_type_name(content);
}

void from_json(const nlohmann::json& j, MessageContent& content) {
    const auto type = j.at("type").get<std::string>();
    const auto id = j.at("id").get<std::string>();

    if (type == "textRequest") {
        content = TextRequest{id, j.at("value").get<std::string>()};
    } else if (type == "textResponse") {
        content = TextResponse{id};
    } else if (type == "filesRequest") {
        content = FilesRequest{id, j.at("files").get<std::vector<FileInfo>>()};
    } else if (type == "filesResponse") {
        content = FilesResponse{id, j.at("isAccepted").get<bool>()};
    } else {
        throw std::invalid_argument("unknown message type '" + type + "'");
    }
}
