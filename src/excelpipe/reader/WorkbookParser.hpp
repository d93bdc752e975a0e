/**
 * @file WorkbookParser.hpp
 * @brief xl/workbook.xml 解析器
 */

#pragma once

#include "excelpipe/reader/BaseSAXParser.hpp"

#include <string>
#include <vector>

namespace excelpipe {
namespace reader {

/**
 * @brief 工作表信息（sheets/sheet）
 */
struct WorksheetInfo {
    std::string name;
    int sheet_id = 0;
    std::string rel_id;
};

/**
 * @brief 定义名称信息（definedNames/definedName）
 */
struct DefinedNameInfo {
    std::string name;
    std::string formula;
    int local_sheet_id = -1;
    bool hidden = false;
};

class WorkbookParser : public BaseSAXParser {
public:
    bool parse(std::string_view xml_content) {
        worksheets_.clear();
        defined_names_.clear();
        return parseXML(xml_content);
    }

    const std::vector<WorksheetInfo>& getWorksheets() const { return worksheets_; }
    const std::vector<DefinedNameInfo>& getDefinedNames() const { return defined_names_; }

private:
    void onStartElement(std::string_view name, const std::vector<xml::XMLAttribute>& attributes, int depth) override;
    void onEndElement(std::string_view name, int depth) override;

    std::vector<WorksheetInfo> worksheets_;
    std::vector<DefinedNameInfo> defined_names_;
    bool in_defined_name_ = false;
};

}} // namespace excelpipe::reader
