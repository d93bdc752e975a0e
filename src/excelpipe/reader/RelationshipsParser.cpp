#include "excelpipe/reader/RelationshipsParser.hpp"

namespace excelpipe {
namespace reader {

void RelationshipsParser::onStartElement(std::string_view name, const std::vector<xml::XMLAttribute>& attributes, int /*depth*/) {
    if (localName(name) != "Relationship") {
        return;
    }

    auto id = findAttribute(attributes, "Id");
    auto type = findAttribute(attributes, "Type");
    auto target = findAttribute(attributes, "Target");
    if (!id || !type || !target || id->empty() || target->empty()) {
        READER_WARN("Skipping incomplete relationship: id='{}', target='{}'",
                    id ? *id : std::string_view{}, target ? *target : std::string_view{});
        return;
    }

    Relationship rel;
    rel.id = std::string(*id);
    rel.type = std::string(*type);
    rel.target = std::string(*target);
    rel.target_mode = getAttributeOr(attributes, "TargetMode", "Internal");

    id_index_[rel.id] = relationships_.size();
    READER_DEBUG("Parsed relationship: {} -> {}", rel.id, rel.target);
    relationships_.push_back(std::move(rel));
}

const RelationshipsParser::Relationship* RelationshipsParser::findById(const std::string& id) const {
    auto it = id_index_.find(id);
    if (it != id_index_.end() && it->second < relationships_.size()) {
        return &relationships_[it->second];
    }
    return nullptr;
}

std::vector<const RelationshipsParser::Relationship*> RelationshipsParser::findByTypeSuffix(std::string_view suffix) const {
    std::vector<const Relationship*> result;
    for (const auto& rel : relationships_) {
        if (rel.type.size() >= suffix.size() &&
            rel.type.compare(rel.type.size() - suffix.size(), suffix.size(), suffix) == 0) {
            result.push_back(&rel);
        }
    }
    return result;
}

}} // namespace excelpipe::reader
