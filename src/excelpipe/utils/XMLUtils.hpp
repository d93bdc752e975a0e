#pragma once

#include <string>
#include <string_view>

namespace excelpipe {
namespace utils {

/**
 * @brief XML工具类 - 转义与名称检查
 */
class XMLUtils {
public:
    /**
     * @brief 文本节点转义
     *
     * 转义 < > & 三个字符，跳过 XML 1.0 不允许的控制字符（保留制表符、换行符、回车符）。
     */
    static std::string escapeText(std::string_view text) {
        std::string result;
        result.reserve(text.size() + text.size() / 8);
        for (char c : text) {
            switch (c) {
                case '<': result.append("&lt;"); break;
                case '>': result.append("&gt;"); break;
                case '&': result.append("&amp;"); break;
                default:
                    if (isDroppedControl(c)) continue;
                    result.push_back(c);
                    break;
            }
        }
        return result;
    }

    /**
     * @brief 属性值转义，额外处理引号和换行
     */
    static std::string escapeAttribute(std::string_view text) {
        std::string result;
        result.reserve(text.size() + text.size() / 8);
        for (char c : text) {
            switch (c) {
                case '<':  result.append("&lt;"); break;
                case '>':  result.append("&gt;"); break;
                case '&':  result.append("&amp;"); break;
                case '"':  result.append("&quot;"); break;
                case '\'': result.append("&apos;"); break;
                case '\n': result.append("&#xA;"); break;
                default:
                    if (isDroppedControl(c)) continue;
                    result.push_back(c);
                    break;
            }
        }
        return result;
    }

    /**
     * @brief 文本首尾是否有需要 xml:space="preserve" 的空白
     */
    static bool needsSpacePreserve(std::string_view text) {
        if (text.empty()) return false;
        auto isSpace = [](char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; };
        return isSpace(text.front()) || isSpace(text.back());
    }

private:
    static bool isDroppedControl(char c) {
        // 使用unsigned char比较，避免把UTF-8多字节字符当成控制字符
        unsigned char uc = static_cast<unsigned char>(c);
        return uc < 0x20 && uc != 0x09 && uc != 0x0A && uc != 0x0D;
    }
};

}} // namespace excelpipe::utils
