#pragma once

#include "excelpipe/archive/ZipReader.hpp"
#include "excelpipe/core/ErrorCode.hpp"
#include "excelpipe/core/Path.hpp"

#include <memory>
#include <string>
#include <vector>

namespace excelpipe {
namespace core {
class Workbook;
class Worksheet;
}

namespace reader {

class RelationshipsParser;

/**
 * @brief XLSX文件读取器
 *
 * 读取顺序：包关系 -> 工作簿关系 -> 共享字符串 -> 工作簿 -> 各工作表及其表格部件 -> 定义名称。
 * 定义名称放在最后登记，这样它们引用的工作表都已经存在。
 *
 * 使用示例：
 * @code
 * XLSXReader reader(path);
 * if (reader.open() == core::ErrorCode::Ok) {
 *     std::unique_ptr<core::Workbook> workbook;
 *     auto result = reader.loadWorkbook(workbook);
 *     reader.close();
 * }
 * @endcode
 */
class XLSXReader {
public:
    explicit XLSXReader(const core::Path& path);
    ~XLSXReader();

    XLSXReader(const XLSXReader&) = delete;
    XLSXReader& operator=(const XLSXReader&) = delete;

    /**
     * @brief 打开压缩包并检查必需部件
     */
    core::ErrorCode open();
    void close();
    bool isOpen() const { return is_open_; }

    /**
     * @brief 加载整个工作簿
     * @param workbook 输出的工作簿对象
     */
    core::ErrorCode loadWorkbook(std::unique_ptr<core::Workbook>& workbook);

    /**
     * @brief 把关系目标解析为包内路径
     *
     * 以 "/" 开头的目标相对于包根，其余相对于源部件所在目录，并处理 ".."。
     */
    static std::string resolvePartPath(const std::string& source_part, const std::string& target);

    /**
     * @brief 部件对应的关系文件路径（xl/worksheets/sheet1.xml -> xl/worksheets/_rels/sheet1.xml.rels）
     */
    static std::string relationshipsPathFor(const std::string& part_path);

private:
    core::ErrorCode extractPart(const std::string& path, std::string& content);
    std::string locateWorkbookPart();
    core::ErrorCode parseSharedStrings(const std::string& workbook_part, const RelationshipsParser& rels);
    core::ErrorCode parseWorksheet(const std::string& part_path, core::Worksheet& worksheet);
    core::ErrorCode parseTables(const std::string& sheet_part, const std::vector<std::string>& rel_ids,
                                core::Worksheet& worksheet);

    core::Path filepath_;
    std::unique_ptr<archive::ZipReader> zip_reader_;
    std::vector<std::string> shared_strings_;
    bool is_open_ = false;
};

}} // namespace excelpipe::reader
