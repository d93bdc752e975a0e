#pragma once

#include "excelpipe/xml/XMLStreamReader.hpp"
#include "excelpipe/utils/ModuleLoggers.hpp"

#include <charconv>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace excelpipe {
namespace reader {

/**
 * @brief SAX解析器基类 - 为各个包内部件解析器提供统一的事件分发
 *
 * 子类只需实现 onStartElement / onEndElement，
 * 需要元素文本时在开始元素里调用 startCollectingText()，在结束元素里读取 getCurrentText()。
 */
class BaseSAXParser {
protected:
    struct ParseState {
        std::vector<std::string> element_stack;
        std::string current_text;
        bool collecting_text = false;
        bool has_error = false;
        std::string error_message;

        void reset() {
            element_stack.clear();
            current_text.clear();
            collecting_text = false;
            has_error = false;
            error_message.clear();
        }
    };

    ParseState state_;

public:
    BaseSAXParser() = default;
    virtual ~BaseSAXParser() = default;

    BaseSAXParser(const BaseSAXParser&) = delete;
    BaseSAXParser& operator=(const BaseSAXParser&) = delete;

    /**
     * @brief 解析XML内容的统一入口
     * @return 是否解析成功
     */
    bool parseXML(std::string_view xml_content) {
        state_.reset();
        if (xml_content.empty()) {
            setError("Empty XML content");
            return false;
        }

        xml::XMLStreamReader reader;
        reader.setTrimWhitespace(trimText());
        reader.setStartElementCallback([this](std::string_view name, const std::vector<xml::XMLAttribute>& attributes, int depth) {
            state_.element_stack.emplace_back(localName(name));
            state_.current_text.clear();
            onStartElement(name, attributes, depth);
        });
        reader.setEndElementCallback([this](std::string_view name, int depth) {
            onEndElement(name, depth);
            if (!state_.element_stack.empty()) {
                state_.element_stack.pop_back();
            }
            state_.current_text.clear();
        });
        reader.setTextCallback([this](std::string_view text, int /*depth*/) {
            if (state_.collecting_text) {
                state_.current_text.append(text);
            }
        });
        reader.setErrorCallback([this](xml::XMLParseError /*error*/, const std::string& message, int line, int column) {
            setError("XML Parse Error at line " + std::to_string(line) +
                     ", column " + std::to_string(column) + ": " + message);
        });

        auto result = reader.parseFromString(xml_content);
        if (result != xml::XMLParseError::Ok) {
            if (!state_.has_error) {
                setError("XML parsing failed");
            }
            return false;
        }
        return !state_.has_error;
    }

    bool hasError() const { return state_.has_error; }
    const std::string& getErrorMessage() const { return state_.error_message; }

protected:
    virtual void onStartElement(std::string_view name, const std::vector<xml::XMLAttribute>& attributes, int depth) = 0;
    virtual void onEndElement(std::string_view name, int depth) = 0;

    /**
     * @brief 文本首尾空白是否裁剪；单元格内容解析器需要返回 false
     */
    virtual bool trimText() const { return true; }

    // ==================== 通用工具方法 ====================

    static std::optional<std::string_view> findAttribute(const std::vector<xml::XMLAttribute>& attributes,
                                                         std::string_view name) {
        for (const auto& attr : attributes) {
            if (attr.name == name) {
                return attr.value;
            }
        }
        return std::nullopt;
    }

    static std::optional<int> findIntAttribute(const std::vector<xml::XMLAttribute>& attributes,
                                               std::string_view name) {
        auto val = findAttribute(attributes, name);
        if (!val) {
            return std::nullopt;
        }
        int result = 0;
        auto [ptr, ec] = std::from_chars(val->data(), val->data() + val->size(), result);
        if (ec != std::errc() || ptr != val->data() + val->size()) {
            return std::nullopt;
        }
        return result;
    }

    static std::string getAttributeOr(const std::vector<xml::XMLAttribute>& attributes,
                                      std::string_view name, std::string_view default_value) {
        auto val = findAttribute(attributes, name);
        return std::string(val ? *val : default_value);
    }

    static int getIntAttributeOr(const std::vector<xml::XMLAttribute>& attributes,
                                 std::string_view name, int default_value) {
        auto val = findIntAttribute(attributes, name);
        return val ? *val : default_value;
    }

    static bool getBoolAttributeOr(const std::vector<xml::XMLAttribute>& attributes,
                                   std::string_view name, bool default_value) {
        auto val = findAttribute(attributes, name);
        if (!val) {
            return default_value;
        }
        return *val == "1" || *val == "true";
    }

    /**
     * @brief 去掉命名空间前缀（x:c -> c）
     */
    static std::string_view localName(std::string_view name) {
        auto pos = name.find(':');
        return pos == std::string_view::npos ? name : name.substr(pos + 1);
    }

    /**
     * @brief 关系ID属性（r:id，兼容其他前缀）
     */
    static std::optional<std::string_view> findRelationshipId(const std::vector<xml::XMLAttribute>& attributes) {
        if (auto id = findAttribute(attributes, "r:id")) {
            return id;
        }
        for (const auto& attr : attributes) {
            if (attr.name.find(':') != std::string_view::npos && localName(attr.name) == "id") {
                return attr.value;
            }
        }
        return std::nullopt;
    }

    // ==================== 文本收集 ====================

    void startCollectingText() {
        state_.collecting_text = true;
        state_.current_text.clear();
    }

    void stopCollectingText() {
        state_.collecting_text = false;
    }

    const std::string& getCurrentText() const { return state_.current_text; }

    bool isInElement(std::string_view element_name) const {
        for (const auto& name : state_.element_stack) {
            if (name == element_name) return true;
        }
        return false;
    }

    void setError(const std::string& message) {
        state_.has_error = true;
        state_.error_message = message;
        READER_ERROR("SAX Parser Error: {}", message);
    }
};

}} // namespace excelpipe::reader
