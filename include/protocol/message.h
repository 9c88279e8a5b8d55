#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

/**
 * Identity of a device taking part in the channel.
 */
struct DeviceInfo {
    std::string id;
    std::string display_name;

    bool operator==(const DeviceInfo& other) const {
        return id == other.id && display_name == other.display_name;
    }
};

/// A plain message.
struct TextRequest {
    std::string id;
    std::string value;

    /// New request with a random id.
    static TextRequest create(std::string value);

    bool operator==(const TextRequest& o) const { return id == o.id && value == o.value; }
};

/// Confirms delivery of the TextRequest with the same id.
struct TextResponse {
    std::string id;

    bool operator==(const TextResponse& o) const { return id == o.id; }
};

struct FileInfo {
    std::string name;
    uint64_t size = 0;

    bool operator==(const FileInfo& o) const { return name == o.name && size == o.size; }
};

/// Offer of files; its id becomes the transfer id of the file socket.
struct FilesRequest {
    std::string id;
    std::vector<FileInfo> files;

    static FilesRequest create(std::vector<FileInfo> files);

    bool operator==(const FilesRequest& o) const { return id == o.id && files == o.files; }
};

/// Answer to the FilesRequest with the same id.
struct FilesResponse {
    std::string id;
    bool is_accepted = false;

    bool operator==(const FilesResponse& o) const {
        return id == o.id && is_accepted == o.is_accepted;
    }
};

/// Visitor built from lambdas, for std::visit over MessageContent.
template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

using MessageContent = std::variant<TextRequest, TextResponse, FilesRequest, FilesResponse>;

/// Wire name of the content kind ("textRequest", "filesResponse", ...).
const char* content_type_name(const MessageContent& content);

/// Checks the structural requirements of a content value.
bool is_valid(const MessageContent& content);

/// True for FilesRequest and FilesResponse.
bool is_file_content(const MessageContent& content);

const std::string& content_id(const MessageContent& content);

struct OutgoingMessage {
    MessageContent content;
    DeviceInfo receiver;

    [[nodiscard]] bool is_valid() const {
        return !receiver.id.empty() && ::is_valid(content);
    }
};

struct ReceivedMessage {
    MessageContent content;
    DeviceInfo sender;

    bool operator==(const ReceivedMessage& o) const {
        return content == o.content && sender == o.sender;
    }
};

/// Thrown by ChannelManager::send for a message that fails validation.
class InvalidMessageError : public std::invalid_argument {
public:
    explicit InvalidMessageError(const MessageContent& content);
};

// nlohmann::json conversions
void to_json(nlohmann::json& j, const DeviceInfo& d);
void from_json(const nlohmann::json& j, DeviceInfo& d);
void to_json(nlohmann::json& j, const FileInfo& f);
void from_json(const nlohmann::json& j, FileInfo& f);
void to_json(nlohmann::json& j, const MessageContent& content);
void from_json(const nlohmann::json& j, MessageContent& content);
