#pragma once

#include <cstddef>

namespace excelpipe {
namespace core {

// 通用常量集中定义，便于统一调整与复用
struct Constants {
    // I/O 缓冲区大小
    static constexpr size_t kIOBufferSize = 8192;

    // Excel 工作表上限
    static constexpr int kMaxRows = 1048576;
    static constexpr int kMaxColumns = 16384;

    // 配方键的槽位数（最多三种原料）
    static constexpr size_t kRecipeKeySlots = 3;

    // 写出表格时使用的默认样式
    static constexpr const char* kDefaultTableStyle = "TableStyleMedium2";
};

} // namespace core
} // namespace excelpipe
