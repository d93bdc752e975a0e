#pragma once

#include "excelpipe/core/Expected.hpp"
#include "excelpipe/core/Path.hpp"

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace excelpipe {
namespace core {
class Workbook;
class Worksheet;
struct TableDefinition;
}

namespace writer {

/**
 * @brief XLSX文件写出器
 *
 * 字符串一律写成内联字符串（inlineStr），不生成 sharedStrings 部件。
 * 表格 id 按写出顺序重新编号，表格列名取自表头单元格。
 */
class XLSXWriter {
public:
    explicit XLSXWriter(const core::Workbook& workbook);

    /**
     * @brief 生成全部部件并写入ZIP文件（已存在时覆盖）
     */
    core::VoidResult write(const core::Path& path);

    /**
     * @brief 表格的列名：表头单元格文本，空表头退回已登记的列名，再退回 ColumnN；结果保证唯一
     */
    static std::vector<std::string> resolveTableColumns(const core::Worksheet& worksheet,
                                                        const core::TableDefinition& table);

    // 各部件的XML（供写出和测试使用）
    std::string generateContentTypesXML() const;
    std::string generateRootRelsXML() const;
    std::string generateWorkbookXML() const;
    std::string generateWorkbookRelsXML() const;
    std::string generateStylesXML() const;
    std::string generateWorksheetXML(size_t sheet_index) const;
    std::string generateWorksheetRelsXML(size_t sheet_index) const;
    std::string generateTableXML(size_t sheet_index, size_t table_index) const;

private:
    using HeaderOverrides = std::map<std::pair<int, int>, std::string>;

    void assignTableIds();
    HeaderOverrides collectHeaderOverrides(const core::Worksheet& worksheet) const;

    const core::Workbook& workbook_;
    std::vector<std::vector<int>> table_ids_;   // [sheet][table] -> 包内表格编号（1 起）
};

}} // namespace excelpipe::writer
