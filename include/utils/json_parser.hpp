#ifndef FORUMBOT_JSON_PARSER_HPP
#define FORUMBOT_JSON_PARSER_HPP

#include <string>

namespace forumbot {

// String escaping for the JSON bodies written by hand (Bot API requests,
// entity arrays, keyboards). Reading goes through boost::property_tree.
class JsonParser {
public:
    static std::string escapeJson(const std::string& str);
    static std::string quote(const std::string& str);
};

} // namespace forumbot

#endif // FORUMBOT_JSON_PARSER_HPP
