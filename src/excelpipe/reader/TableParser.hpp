#pragma once

#include "excelpipe/reader/BaseSAXParser.hpp"
#include "excelpipe/core/CellRange.hpp"

namespace excelpipe {
namespace reader {

/**
 * @brief xl/tables/tableN.xml 解析器
 */
class TableParser : public BaseSAXParser {
public:
    bool parse(std::string_view xml_content) {
        table_ = core::TableDefinition{};
        has_ref_ = false;
        return parseXML(xml_content) && validate();
    }

    const core::TableDefinition& getTable() const { return table_; }
    core::TableDefinition releaseTable() { return std::move(table_); }

private:
    void onStartElement(std::string_view name, const std::vector<xml::XMLAttribute>& attributes, int depth) override;
    void onEndElement(std::string_view /*name*/, int /*depth*/) override {}
    bool validate();

    core::TableDefinition table_;
    bool has_ref_ = false;
};

}} // namespace excelpipe::reader
