#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <system_error>
#include <fast_float/fast_float.h>

namespace excelpipe {
namespace utils {

/**
 * @brief 通用工具类 - 坐标换算与字符串处理
 */
class CommonUtils {
public:
    // ========== 坐标工具 ==========

    /**
     * @brief 列号转换为字母表示（A, B, ..., Z, AA, AB, ...）
     * @param col 列号（0开始）
     */
    static std::string columnToLetter(int col) {
        std::string result;
        while (col >= 0) {
            result.insert(result.begin(), static_cast<char>('A' + (col % 26)));
            col = col / 26 - 1;
        }
        return result;
    }

    /**
     * @brief 生成单元格引用（如A1, B2等）
     * @param row 行号（0开始）
     * @param col 列号（0开始）
     */
    static std::string cellReference(int row, int col) {
        return columnToLetter(col) + std::to_string(row + 1);
    }

    /**
     * @brief 生成范围引用（如A1:B2），单个单元格时只返回 A1
     */
    static std::string rangeReference(int first_row, int first_col, int last_row, int last_col) {
        if (first_row == last_row && first_col == last_col) {
            return cellReference(first_row, first_col);
        }
        return cellReference(first_row, first_col) + ":" + cellReference(last_row, last_col);
    }

    /**
     * @brief 解析单元格引用（如A1 -> (0, 0)），允许 $ 绝对引用标记
     * @return 行列坐标（0开始）
     * @throws std::invalid_argument 如果引用格式不正确
     */
    static std::pair<int, int> parseReference(std::string_view reference) {
        if (reference.empty()) {
            throw std::invalid_argument("Empty cell reference");
        }

        size_t i = 0;
        if (reference[i] == '$') ++i;

        int col = 0;
        while (i < reference.length() && std::isalpha(static_cast<unsigned char>(reference[i]))) {
            char c = static_cast<char>(std::toupper(static_cast<unsigned char>(reference[i])));
            col = col * 26 + (c - 'A' + 1);
            if (col > 16384) {
                throw std::invalid_argument("Column out of range in reference: " + std::string(reference));
            }
            ++i;
        }

        if (col == 0) {
            throw std::invalid_argument("No column part in reference: " + std::string(reference));
        }
        col -= 1;

        if (i < reference.length() && reference[i] == '$') ++i;

        if (i >= reference.length() || !std::isdigit(static_cast<unsigned char>(reference[i]))) {
            throw std::invalid_argument("No row part in reference: " + std::string(reference));
        }

        int row = 0;
        while (i < reference.length() && std::isdigit(static_cast<unsigned char>(reference[i]))) {
            row = row * 10 + (reference[i] - '0');
            if (row > 1048576) {
                throw std::invalid_argument("Row out of range in reference: " + std::string(reference));
            }
            ++i;
        }

        if (row == 0) {
            throw std::invalid_argument("Invalid row number in reference: " + std::string(reference));
        }
        row -= 1;

        if (i < reference.length()) {
            throw std::invalid_argument("Invalid characters at end of reference: " + std::string(reference));
        }

        return std::make_pair(row, col);
    }

    /**
     * @brief 验证单元格位置是否有效（Excel 2007+ 上限）
     */
    static bool isValidCellPosition(int row, int col) {
        return row >= 0 && col >= 0 && row <= 1048575 && col <= 16383;
    }

    // ========== 字符串工具 ==========

    /**
     * @brief 去除首尾空白
     */
    static std::string trim(std::string_view text) {
        size_t begin = 0;
        size_t end = text.size();
        while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
        while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
        return std::string(text.substr(begin, end - begin));
    }

    static bool isBlank(std::string_view text) {
        return std::all_of(text.begin(), text.end(),
                           [](unsigned char c) { return std::isspace(c) != 0; });
    }

    static std::string toLower(std::string_view text) {
        std::string result(text);
        std::transform(result.begin(), result.end(), result.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return result;
    }

    /**
     * @brief 用 fast_float 解析整个字符串为 double（首尾空白会被忽略）
     * @return 全部字符都被消费时返回 true
     */
    static bool parseDouble(std::string_view text, double& out) {
        std::string trimmed = trim(text);
        if (trimmed.empty()) {
            return false;
        }
        const char* first = trimmed.data();
        const char* last = first + trimmed.size();
        if (*first == '+') ++first;
        auto result = fast_float::from_chars(first, last, out);
        return result.ec == std::errc() && result.ptr == last;
    }
};

}} // namespace excelpipe::utils
