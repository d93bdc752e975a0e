#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace excelpipe {
namespace xml {

/**
 * @brief 内存XML写入器
 *
 * 属性在元素开始标签关闭前缓存，没有子内容的元素自动写成自闭合形式。
 * 所有文本和属性值都会转义。
 */
class XMLStreamWriter {
public:
    XMLStreamWriter();

    XMLStreamWriter(const XMLStreamWriter&) = delete;
    XMLStreamWriter& operator=(const XMLStreamWriter&) = delete;

    /**
     * @brief 写 XML 声明（standalone="yes"）
     */
    void startDocument();

    /**
     * @brief 关闭所有未关闭的元素
     */
    void endDocument();

    void startElement(const std::string& name);
    void endElement();
    void writeEmptyElement(const std::string& name);

    void writeAttribute(const std::string& name, std::string_view value);
    void writeAttribute(const std::string& name, const char* value);
    void writeAttribute(const std::string& name, int value);

    void writeText(std::string_view text);
    void writeText(double value);

    const std::string& toString() const { return buffer_; }
    std::string release();

    size_t openElementCount() const { return element_stack_.size(); }

private:
    void ensureElementClosed();
    void flushAttributes();
    void requireOpenTag(const char* operation) const;

    std::string buffer_;
    std::vector<std::string> element_stack_;
    std::vector<std::pair<std::string, std::string>> pending_attributes_;
    bool in_element_ = false;
};

}} // namespace excelpipe::xml
