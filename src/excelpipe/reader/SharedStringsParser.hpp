#pragma once

#include "excelpipe/reader/BaseSAXParser.hpp"

#include <string>
#include <vector>

namespace excelpipe {
namespace reader {

/**
 * @brief xl/sharedStrings.xml 解析器
 *
 * 富文本（多个 r/t 运行）拼接为纯文本，拼音注释 rPh 忽略。
 */
class SharedStringsParser : public BaseSAXParser {
public:
    bool parse(std::string_view xml_content) {
        strings_.clear();
        in_item_ = false;
        return parseXML(xml_content);
    }

    const std::vector<std::string>& getStrings() const { return strings_; }
    size_t size() const { return strings_.size(); }

    /**
     * @brief 按索引取字符串，越界返回nullptr
     */
    const std::string* getString(size_t index) const {
        return index < strings_.size() ? &strings_[index] : nullptr;
    }

    std::vector<std::string> releaseStrings() { return std::move(strings_); }

private:
    void onStartElement(std::string_view name, const std::vector<xml::XMLAttribute>& attributes, int depth) override;
    void onEndElement(std::string_view name, int depth) override;
    bool trimText() const override { return false; }

    std::vector<std::string> strings_;
    std::string current_item_;
    bool in_item_ = false;
};

}} // namespace excelpipe::reader
