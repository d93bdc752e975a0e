#pragma once

#include "excelpipe/utils/CommonUtils.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <stdexcept>

namespace excelpipe {
namespace utils {

/**
 * @brief 限定范围地址解析结果，行列索引基于0
 */
struct QualifiedRange {
    std::string sheet_name;
    int first_row = 0;
    int first_col = 0;
    int last_row = 0;
    int last_col = 0;
};

/**
 * @brief Excel 地址解析工具类
 *
 * 支持：
 * - 单个地址：A1, $B$2
 * - 带工作表：Sheet1!A1, 'My Sheet'!$B$2, 'O''Brien'!A1
 * - 范围地址：A1:C3, Sheet1!$A$1:$C$3
 */
class AddressParser {
public:
    /**
     * @brief 拆分 "Sheet!A1:B2" 为 (工作表名, 地址部分)
     *
     * 工作表名两侧的单引号会被去掉，'' 还原为 '。没有 ! 时工作表名为空。
     * @throws std::invalid_argument 引号不匹配
     */
    static std::pair<std::string, std::string> splitSheetReference(std::string_view qualified) {
        std::string_view text = qualified;
        if (!text.empty() && text.front() == '=') {
            text.remove_prefix(1);
        }

        if (!text.empty() && text.front() == '\'') {
            std::string sheet;
            size_t i = 1;
            while (i < text.size()) {
                if (text[i] == '\'') {
                    if (i + 1 < text.size() && text[i + 1] == '\'') {
                        sheet.push_back('\'');
                        i += 2;
                        continue;
                    }
                    break;
                }
                sheet.push_back(text[i]);
                ++i;
            }
            if (i >= text.size() || i + 1 >= text.size() || text[i + 1] != '!') {
                throw std::invalid_argument("Unterminated quoted sheet name: " + std::string(qualified));
            }
            return {sheet, std::string(text.substr(i + 2))};
        }

        auto bang = text.find('!');
        if (bang == std::string_view::npos) {
            return {std::string(), std::string(text)};
        }
        return {std::string(text.substr(0, bang)), std::string(text.substr(bang + 1))};
    }

    /**
     * @brief 解析范围地址 "A1:C3" 或 "'Sheet 1'!$A$1:$C$3"
     * @throws std::invalid_argument 格式不正确或跨工作表
     */
    static QualifiedRange parseRange(std::string_view range) {
        auto [sheet, area] = splitSheetReference(range);
        if (area.find(',') != std::string::npos) {
            throw std::invalid_argument("Multi-area references are not supported: " + std::string(range));
        }

        QualifiedRange result;
        result.sheet_name = sheet;

        auto colon_pos = area.find(':');
        if (colon_pos == std::string::npos) {
            auto [row, col] = CommonUtils::parseReference(area);
            result.first_row = result.last_row = row;
            result.first_col = result.last_col = col;
            return result;
        }

        auto [start_row, start_col] = CommonUtils::parseReference(area.substr(0, colon_pos));
        auto [end_row, end_col] = CommonUtils::parseReference(std::string_view(area).substr(colon_pos + 1));

        result.first_row = std::min(start_row, end_row);
        result.last_row = std::max(start_row, end_row);
        result.first_col = std::min(start_col, end_col);
        result.last_col = std::max(start_col, end_col);
        return result;
    }

    /**
     * @brief 不抛异常的 parseRange
     */
    static std::optional<QualifiedRange> tryParseRange(std::string_view range) {
        try {
            return parseRange(range);
        } catch (const std::invalid_argument&) {
            return std::nullopt;
        }
    }

    /**
     * @brief 生成绝对引用形式的范围地址，如 'My Sheet'!$A$1:$C$3
     */
    static std::string toAbsoluteRange(const std::string& sheet_name,
                                       int first_row, int first_col, int last_row, int last_col) {
        std::string result = quoteSheetName(sheet_name) + "!" + absoluteCell(first_row, first_col);
        if (first_row != last_row || first_col != last_col) {
            result += ":" + absoluteCell(last_row, last_col);
        }
        return result;
    }

    /**
     * @brief 需要时为工作表名加引号（内部的 ' 转义为 ''）
     */
    static std::string quoteSheetName(const std::string& sheet_name) {
        if (!needsQuoting(sheet_name)) {
            return sheet_name;
        }
        std::string quoted = "'";
        for (char c : sheet_name) {
            if (c == '\'') quoted.push_back('\'');
            quoted.push_back(c);
        }
        quoted.push_back('\'');
        return quoted;
    }

    /**
     * @brief 判断工作表名是否需要引号括起来
     */
    static bool needsQuoting(const std::string& sheet_name) {
        if (sheet_name.empty()) return false;
        if (std::isdigit(static_cast<unsigned char>(sheet_name.front()))) return true;
        for (char c : sheet_name) {
            unsigned char uc = static_cast<unsigned char>(c);
            if (uc >= 0x80) return true;  // 非ASCII字符
            if (!std::isalnum(uc) && c != '_' && c != '.') return true;
        }
        return false;
    }

private:
    static std::string absoluteCell(int row, int col) {
        return "$" + CommonUtils::columnToLetter(col) + "$" + std::to_string(row + 1);
    }
};

}} // namespace excelpipe::utils
