#include "excelpager/reader/RelationshipsParser.hpp"
#include "excelpager/utils/ModuleLoggers.hpp"

namespace excelpager {
namespace reader {

void RelationshipsParser::onStartElement(std::string_view name, span<const xml::XMLAttribute> attributes, int /*depth*/) {
    if (name != "Relationship") {
        return;
    }

    auto id = findAttribute(attributes, "Id");
    auto type = findAttribute(attributes, "Type");
    auto target = findAttribute(attributes, "Target");
    auto target_mode = findAttribute(attributes, "TargetMode");

    if (id && target && !id->empty() && !target->empty()) {
        Relationship rel;
        rel.id = std::string(*id);
        rel.type = type ? std::string(*type) : std::string();
        rel.target = std::string(*target);
        if (target_mode) {
            rel.target_mode = std::string(*target_mode);
        }

        id_index_[rel.id] = relationships_.size();
        READER_TRACE("Parsed relationship: {} -> {}", rel.id, rel.target);
        relationships_.push_back(std::move(rel));
    } else {
        READER_WARN("Skipping incomplete relationship: id='{}', target='{}'",
                    id ? *id : std::string_view{}, target ? *target : std::string_view{});
    }
}

void RelationshipsParser::onEndElement(std::string_view /*name*/, int /*depth*/) {
}

const RelationshipsParser::Relationship* RelationshipsParser::findById(const std::string& id) const {
    auto it = id_index_.find(id);
    if (it != id_index_.end() && it->second < relationships_.size()) {
        return &relationships_[it->second];
    }
    return nullptr;
}

std::unordered_map<std::string, std::string> RelationshipsParser::getTargetMap() const {
    std::unordered_map<std::string, std::string> result;
    for (const auto& rel : relationships_) {
        if (rel.target_mode != "External") {
            result[rel.id] = rel.target;
        }
    }
    return result;
}

std::string RelationshipsParser::resolvePartPath(const std::string& base_dir, const std::string& target) {
    std::string combined = (!target.empty() && target[0] == '/') ? target.substr(1) : base_dir + target;

    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= combined.size()) {
        size_t slash = combined.find('/', start);
        if (slash == std::string::npos) {
            slash = combined.size();
        }
        std::string part = combined.substr(start, slash - start);
        if (part == "..") {
            if (!parts.empty()) {
                parts.pop_back();
            }
        } else if (!part.empty() && part != ".") {
            parts.push_back(std::move(part));
        }
        start = slash + 1;
    }

    std::string result;
    for (const auto& part : parts) {
        if (!result.empty()) {
            result += '/';
        }
        result += part;
    }
    return result;
}

}} // namespace excelpager::reader
