#pragma once

#include "excelpipe/reader/BaseSAXParser.hpp"
#include "excelpipe/core/Worksheet.hpp"

#include <string>
#include <vector>

namespace excelpipe {
namespace reader {

/**
 * @brief 工作表XML解析器
 *
 * 把 sheetData 中的单元格写入目标 Worksheet，并收集 tableParts 的关系ID。
 * 公式只保留文本和缓存值。
 */
class WorksheetParser : public BaseSAXParser {
public:
    WorksheetParser(core::Worksheet& worksheet, const std::vector<std::string>& shared_strings)
        : worksheet_(worksheet), shared_strings_(shared_strings) {}

    bool parse(std::string_view xml_content) {
        table_rel_ids_.clear();
        cells_parsed_ = 0;
        current_row_ = -1;
        next_col_ = 0;
        return parseXML(xml_content);
    }

    const std::vector<std::string>& getTableRelationshipIds() const { return table_rel_ids_; }
    size_t getCellsParsed() const { return cells_parsed_; }

private:
    struct CellState {
        int row = -1;
        int col = -1;
        std::string type;
        std::string value;
        std::string formula;
        std::string inline_text;
        bool has_value = false;

        void reset() {
            row = -1;
            col = -1;
            type.clear();
            value.clear();
            formula.clear();
            inline_text.clear();
            has_value = false;
        }
    };

    void onStartElement(std::string_view name, const std::vector<xml::XMLAttribute>& attributes, int depth) override;
    void onEndElement(std::string_view name, int depth) override;
    bool trimText() const override { return false; }

    void handleCellStart(const std::vector<xml::XMLAttribute>& attributes);
    void commitCell();

    core::Worksheet& worksheet_;
    const std::vector<std::string>& shared_strings_;
    std::vector<std::string> table_rel_ids_;

    CellState cell_;
    bool in_cell_ = false;
    int current_row_ = -1;
    int next_col_ = 0;
    size_t cells_parsed_ = 0;
};

}} // namespace excelpipe::reader
