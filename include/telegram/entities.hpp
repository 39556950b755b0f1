#ifndef FORUMBOT_ENTITIES_HPP
#define FORUMBOT_ENTITIES_HPP

#include <cstdint>
#include <string>
#include <vector>

#include <boost/property_tree/ptree.hpp>

#include "types.hpp"

namespace forumbot {

// Length of a UTF-8 string in UTF-16 code units, the unit entity offsets use.
int64_t utf16Length(const std::string& utf8);

// Reads a Bot API "entities" array node.
std::vector<MessageEntity> entitiesFromTree(const boost::property_tree::ptree& node);

// Parses the stored JSON array form. Malformed input is logged and yields no entities.
std::vector<MessageEntity> parseEntities(const std::string& json);

// JSON array with numeric offsets, "" for an empty list.
std::string serializeEntities(const std::vector<MessageEntity>& entities);

// Moves every entity right by `delta` code units; used when a prefix is put in front of the text.
std::string shiftEntities(const std::string& json, int64_t delta);

} // namespace forumbot

#endif // FORUMBOT_ENTITIES_HPP
