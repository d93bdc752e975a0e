#pragma once

#include "excelpipe/core/Diagnostic.hpp"
#include "excelpipe/core/Expected.hpp"
#include "excelpipe/core/Path.hpp"
#include "excelpipe/core/Workbook.hpp"
#include "excelpipe/view/RangeView.hpp"
#include "excelpipe/view/TableView.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace excelpipe {
namespace view {

/**
 * @brief 工作簿索引：按名称查找表格视图和命名区域视图
 *
 * 持有工作簿与诊断收集器，所有视图共享同一个 DiagnosticLog。
 * 表格名与区域名各自唯一；重名时保留先出现的一个并报告 DuplicateName 警告。
 *
 * 插入行列之后，同一工作表上其他视图的锚点不会自动更新，
 * 需要调用 refresh() 重新建立视图，之前取得的视图指针随之失效。
 */
class WorkbookIndex {
public:
    explicit WorkbookIndex(std::unique_ptr<core::Workbook> workbook);
    ~WorkbookIndex() = default;

    WorkbookIndex(const WorkbookIndex&) = delete;
    WorkbookIndex& operator=(const WorkbookIndex&) = delete;

    /**
     * @brief 读取 .xlsx 文件并建立索引
     */
    static core::Result<std::unique_ptr<WorkbookIndex>> load(const core::Path& path);

    /**
     * @brief 精确查找，找不到时返回 nullptr，不产生诊断
     */
    TableView* findTable(const std::string& name);
    RangeView* findRange(const std::string& name);

    /**
     * @brief 按发现顺序列出名称
     */
    const std::vector<std::string>& tableNames() const { return table_names_; }
    const std::vector<std::string>& rangeNames() const { return range_names_; }

    size_t tableCount() const { return tables_.size(); }
    size_t rangeCount() const { return ranges_.size(); }

    /**
     * @brief 重新发现所有表格和命名区域
     */
    void refresh();

    core::VoidResult save(const core::Path& path) const;

    core::Workbook& workbook() { return *workbook_; }
    const core::Workbook& workbook() const { return *workbook_; }

    core::DiagnosticLog& diagnostics() { return diagnostics_; }
    const core::DiagnosticLog& diagnostics() const { return diagnostics_; }

private:
    std::unique_ptr<core::Workbook> workbook_;
    core::DiagnosticLog diagnostics_;

    std::vector<std::unique_ptr<TableView>> tables_;
    std::vector<std::unique_ptr<RangeView>> ranges_;
    std::unordered_map<std::string, TableView*> table_lookup_;
    std::unordered_map<std::string, RangeView*> range_lookup_;
    std::vector<std::string> table_names_;
    std::vector<std::string> range_names_;
};

}} // namespace excelpipe::view
