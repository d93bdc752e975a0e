#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>
#include <expat.h>

namespace excelpipe {
namespace xml {

/**
 * @brief 流式XML解析器，基于libexpat
 *
 * 事件驱动：开始元素、结束元素、文本。
 * 文本在元素结束时整体回调一次（expat 可能分多次给出字符数据），
 * 实体已由 expat 解码，回调拿到的就是最终文本。
 */

// 解析错误枚举
enum class XMLParseError {
    Ok,                    // 解析成功
    InvalidInput,          // 无效输入
    ParserCreateFailed,    // 解析器创建失败
    ParseFailed,           // 解析失败
    CallbackError          // 回调函数错误
};

constexpr bool isSuccess(XMLParseError error) noexcept {
    return error == XMLParseError::Ok;
}

constexpr bool isError(XMLParseError error) noexcept {
    return error != XMLParseError::Ok;
}

// XML属性（只在回调期间有效）
struct XMLAttribute {
    std::string_view name;
    std::string_view value;

    XMLAttribute(std::string_view n, std::string_view v)
        : name(n), value(v) {}
};

class XMLStreamReader {
public:
    using StartElementCallback = std::function<void(std::string_view name, const std::vector<XMLAttribute>& attributes, int depth)>;
    using EndElementCallback = std::function<void(std::string_view name, int depth)>;
    using TextCallback = std::function<void(std::string_view text, int depth)>;
    using ErrorCallback = std::function<void(XMLParseError error, const std::string& message, int line, int column)>;

    XMLStreamReader() = default;
    ~XMLStreamReader();

    XMLStreamReader(const XMLStreamReader&) = delete;
    XMLStreamReader& operator=(const XMLStreamReader&) = delete;

    void setStartElementCallback(StartElementCallback callback) { start_element_callback_ = std::move(callback); }
    void setEndElementCallback(EndElementCallback callback) { end_element_callback_ = std::move(callback); }
    void setTextCallback(TextCallback callback) { text_callback_ = std::move(callback); }
    void setErrorCallback(ErrorCallback callback) { error_callback_ = std::move(callback); }

    /**
     * @brief 是否裁剪文本首尾空白（默认裁剪）
     *
     * 单元格文本需要保留前后空格时关闭。
     */
    void setTrimWhitespace(bool trim) { trim_whitespace_ = trim; }

    /**
     * @brief 解析内存中的完整文档
     */
    XMLParseError parseFromString(std::string_view xml_content);

    XMLParseError getLastError() const { return last_error_; }
    const std::string& getLastErrorMessage() const { return last_error_message_; }
    size_t getElementsParsed() const { return elements_parsed_; }

private:
    bool initializeParser();
    void cleanupParser();
    void resetState();
    void handleError(XMLParseError error, const std::string& message);
    static std::string_view trimStringView(std::string_view str);

    static void XMLCALL startElementHandler(void* userData, const XML_Char* name, const XML_Char** attrs);
    static void XMLCALL endElementHandler(void* userData, const XML_Char* name);
    static void XMLCALL characterDataHandler(void* userData, const XML_Char* data, int len);

    XML_Parser parser_ = nullptr;

    int current_depth_ = 0;
    XMLParseError last_error_ = XMLParseError::Ok;
    std::string last_error_message_;
    size_t elements_parsed_ = 0;

    std::vector<XMLAttribute> attributes_;
    std::string current_text_;

    StartElementCallback start_element_callback_;
    EndElementCallback end_element_callback_;
    TextCallback text_callback_;
    ErrorCallback error_callback_;

    bool trim_whitespace_ = true;
};

}} // namespace excelpipe::xml
