#include <rsp/entities/messages.h>
#include <rsp/crypto/crypto_utils.h>

namespace rsp {
namespace entities {

nlohmann::json make_error_response(RSPError error, const std::string& message) {
    return nlohmann::json{
        {"status", "error"},
        {"message", message.empty() ? error_message(error) : message},
        {"error", error_name(error)}
    };
}

nlohmann::json make_success_response() {
    return nlohmann::json{{"status", "success"}};
}

RSPError response_error(const nlohmann::json& response) {
    if (!response.is_object()) {
        return RSPError::INVALID_MESSAGE_FORMAT;
    }
    auto status = response.find("status");
    if (status == response.end() || !status->is_string()) {
        return RSPError::INVALID_MESSAGE_FORMAT;
    }
    if (status->get<std::string>() != "error") {
        return RSPError::SUCCESS;
    }
    auto error = response.find("error");
    if (error == response.end() || !error->is_string()) {
        return RSPError::INTERNAL_ERROR;
    }
    return error_from_name(error->get<std::string>());
}

Result<std::string> get_string(const nlohmann::json& message, const char* field) {
    if (!message.is_object()) {
        return make_error<std::string>(RSPError::INVALID_MESSAGE_FORMAT);
    }
    auto it = message.find(field);
    if (it == message.end() || !it->is_string()) {
        return make_error<std::string>(RSPError::INVALID_MESSAGE_FORMAT);
    }
    return it->get<std::string>();
}

Result<uint64_t> get_unsigned(const nlohmann::json& message, const char* field) {
    if (!message.is_object()) {
        return make_error<uint64_t>(RSPError::INVALID_MESSAGE_FORMAT);
    }
    auto it = message.find(field);
    if (it == message.end() || !it->is_number_integer()) {
        return make_error<uint64_t>(RSPError::INVALID_MESSAGE_FORMAT);
    }
    if (!it->is_number_unsigned() && it->get<int64_t>() < 0) {
        return make_error<uint64_t>(RSPError::INVALID_MESSAGE_FORMAT);
    }
    return it->get<uint64_t>();
}

Result<const nlohmann::json*> get_object(const nlohmann::json& message, const char* field) {
    if (!message.is_object()) {
        return make_error<const nlohmann::json*>(RSPError::INVALID_MESSAGE_FORMAT);
    }
    auto it = message.find(field);
    if (it == message.end() || !it->is_object()) {
        return make_error<const nlohmann::json*>(RSPError::INVALID_MESSAGE_FORMAT);
    }
    return &*it;
}

Result<std::vector<uint8_t>> get_base64(const nlohmann::json& message, const char* field) {
    auto text = get_string(message, field);
    if (!text) {
        return make_error<std::vector<uint8_t>>(text.error());
    }
    return crypto::utils::base64_decode(*text);
}

} // namespace entities
} // namespace rsp
