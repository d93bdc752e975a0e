#pragma once

#include "excelpipe/core/Worksheet.hpp"
#include "excelpipe/core/Expected.hpp"
#include "excelpipe/core/Path.hpp"

#include <memory>
#include <string>
#include <vector>

namespace excelpipe {
namespace core {

/**
 * @brief 无法绑定为命名区域的定义名（公式、常量、多区域、工作表级名称等），保存时原样写回
 */
struct DefinedName {
    std::string name;
    std::string formula;
    int local_sheet_id = -1;
    bool hidden = false;
};

/**
 * @brief 命名区域清单条目：名称 + 限定地址（如 'My Sheet'!$A$1:$C$4）
 */
struct NamedRangeEntry {
    std::string name;
    std::string qualified_address;
};

/**
 * @brief 工作簿：工作表集合 + 定义名
 */
class Workbook {
public:
    Workbook() = default;
    ~Workbook() = default;

    Workbook(const Workbook&) = delete;
    Workbook& operator=(const Workbook&) = delete;

    /**
     * @brief 读取 .xlsx 文件
     */
    static Result<std::unique_ptr<Workbook>> open(const Path& path);

    /**
     * @brief 写出为 .xlsx 文件
     */
    VoidResult save(const Path& path) const;

    // ========== 工作表 ==========

    /**
     * @throws ParameterException 名称为空、过长、含非法字符或重复
     */
    Worksheet& addWorksheet(const std::string& name);

    Worksheet* getWorksheet(const std::string& name);
    const Worksheet* getWorksheet(const std::string& name) const;
    Worksheet* getWorksheet(size_t index);
    const Worksheet* getWorksheet(size_t index) const;
    size_t getWorksheetCount() const { return worksheets_.size(); }
    const std::vector<std::unique_ptr<Worksheet>>& worksheets() const { return worksheets_; }

    // ========== 定义名 ==========

    /**
     * @brief 登记定义名
     *
     * 工作簿级、单一区域且目标工作表存在的引用会绑定为目标工作表上的 NamedRange，
     * 其余的作为 DefinedName 保留。
     * @return 是否绑定为命名区域
     */
    bool addDefinedName(const std::string& name, const std::string& formula,
                        int local_sheet_id = -1, bool hidden = false);

    /**
     * @brief 直接在指定工作表上创建命名区域
     * @throws ParameterException 工作表不存在
     */
    NamedRange& addNamedRange(const std::string& name, const std::string& sheet_name, const CellRange& range);

    /**
     * @brief 所有命名区域的名称与限定地址（按工作表顺序）
     */
    std::vector<NamedRangeEntry> namedRanges() const;

    const std::vector<DefinedName>& otherDefinedNames() const { return other_names_; }

private:
    static bool isValidSheetName(const std::string& name);

    std::vector<std::unique_ptr<Worksheet>> worksheets_;
    std::vector<DefinedName> other_names_;
    int next_sheet_id_ = 1;
};

}} // namespace excelpipe::core
