#include "../../include/telegram/entities.hpp"
#include "../../include/utils/json_parser.hpp"
#include "../../include/utils/logger.hpp"

#include <boost/property_tree/json_parser.hpp>

#include <sstream>

namespace forumbot {

int64_t utf16Length(const std::string& utf8) {
    int64_t length = 0;
    for (unsigned char c : utf8) {
        if ((c & 0xC0) == 0x80) {
            continue;
        }
        // 4-byte sequences are outside the BMP and take a surrogate pair.
        length += ((c & 0xF8) == 0xF0) ? 2 : 1;
    }
    return length;
}

std::vector<MessageEntity> entitiesFromTree(const boost::property_tree::ptree& node) {
    std::vector<MessageEntity> out;
    for (const auto& item : node) {
        const auto& e = item.second;
        MessageEntity entity;
        entity.type = e.get<std::string>("type", "");
        entity.offset = e.get<int64_t>("offset", 0);
        entity.length = e.get<int64_t>("length", 0);
        entity.url = e.get<std::string>("url", "");
        entity.language = e.get<std::string>("language", "");
        entity.custom_emoji_id = e.get<std::string>("custom_emoji_id", "");
        entity.user_id = e.get<int64_t>("user.id", 0);
        if (entity.type.empty()) {
            continue;
        }
        out.push_back(entity);
    }
    return out;
}

std::vector<MessageEntity> parseEntities(const std::string& json) {
    if (json.empty()) {
        return {};
    }
    // property_tree wants an object at the top level.
    std::istringstream ss("{\"entities\":" + json + "}");
    boost::property_tree::ptree root;
    try {
        boost::property_tree::read_json(ss, root);
    } catch (const boost::property_tree::json_parser_error& e) {
        Logger::getInstance().warning(std::string("Ignoring malformed entities: ") + e.what());
        return {};
    }
    auto node = root.get_child_optional("entities");
    if (!node) {
        return {};
    }
    return entitiesFromTree(*node);
}

std::string serializeEntities(const std::vector<MessageEntity>& entities) {
    if (entities.empty()) {
        return "";
    }
    std::ostringstream out;
    out << "[";
    bool first = true;
    for (const auto& e : entities) {
        if (!first) out << ",";
        first = false;
        out << "{\"type\":" << JsonParser::quote(e.type)
            << ",\"offset\":" << e.offset
            << ",\"length\":" << e.length;
        if (!e.url.empty()) {
            out << ",\"url\":" << JsonParser::quote(e.url);
        }
        if (!e.language.empty()) {
            out << ",\"language\":" << JsonParser::quote(e.language);
        }
        if (!e.custom_emoji_id.empty()) {
            out << ",\"custom_emoji_id\":" << JsonParser::quote(e.custom_emoji_id);
        }
        if (e.user_id != 0) {
            out << ",\"user\":{\"id\":" << e.user_id << "}";
        }
        out << "}";
    }
    out << "]";
    return out.str();
}

std::string shiftEntities(const std::string& json, int64_t delta) {
    auto entities = parseEntities(json);
    for (auto& e : entities) {
        e.offset += delta;
    }
    return serializeEntities(entities);
}

} // namespace forumbot
