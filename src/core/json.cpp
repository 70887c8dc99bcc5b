/**
 * @file json.cpp
 * @brief jsoncpp reader/writer wrappers.
 * @author Dimitris Kafetzis
 */

#include "core/json.hpp"

#include <memory>

namespace sandbox_engine {

Result<Json::Value> parse_json(std::string_view text) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
        return Error{ErrorCode::ValidationFailed, "Invalid JSON: " + errors};
    }
    return root;
}

std::string write_json(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, value);
}

std::string write_json_pretty(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, value);
}

}  // namespace sandbox_engine
