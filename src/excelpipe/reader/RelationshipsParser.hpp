#pragma once

#include "excelpipe/reader/BaseSAXParser.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace excelpipe {
namespace reader {

/**
 * @brief .rels 关系文件解析器
 */
class RelationshipsParser : public BaseSAXParser {
public:
    struct Relationship {
        std::string id;          // 如 "rId1"
        std::string type;        // 如 ".../relationships/worksheet"
        std::string target;      // 如 "worksheets/sheet1.xml"
        std::string target_mode = "Internal";
    };

    bool parse(std::string_view xml_content) {
        clear();
        return parseXML(xml_content);
    }

    const std::vector<Relationship>& getRelationships() const { return relationships_; }

    /**
     * @brief 根据ID查找关系，未找到返回nullptr
     */
    const Relationship* findById(const std::string& id) const;

    /**
     * @brief 关系类型以指定后缀结尾（如 "/table"）的全部关系
     */
    std::vector<const Relationship*> findByTypeSuffix(std::string_view suffix) const;

    void clear() {
        relationships_.clear();
        id_index_.clear();
    }

private:
    void onStartElement(std::string_view name, const std::vector<xml::XMLAttribute>& attributes, int depth) override;
    void onEndElement(std::string_view /*name*/, int /*depth*/) override {}

    std::vector<Relationship> relationships_;
    std::unordered_map<std::string, size_t> id_index_;
};

}} // namespace excelpipe::reader
