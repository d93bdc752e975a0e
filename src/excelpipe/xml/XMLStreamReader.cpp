#include "excelpipe/xml/XMLStreamReader.hpp"
#include "excelpipe/utils/ModuleLoggers.hpp"

#include <cstring>
#include <limits>
#include <fmt/format.h>

namespace excelpipe {
namespace xml {

XMLStreamReader::~XMLStreamReader() {
    cleanupParser();
}

bool XMLStreamReader::initializeParser() {
    cleanupParser();

    parser_ = XML_ParserCreate("UTF-8");
    if (!parser_) {
        handleError(XMLParseError::ParserCreateFailed, "Failed to create XML parser");
        return false;
    }

    XML_SetUserData(parser_, this);
    XML_SetElementHandler(parser_, startElementHandler, endElementHandler);
    XML_SetCharacterDataHandler(parser_, characterDataHandler);
    return true;
}

void XMLStreamReader::cleanupParser() {
    if (parser_) {
        XML_ParserFree(parser_);
        parser_ = nullptr;
    }
}

void XMLStreamReader::resetState() {
    current_depth_ = 0;
    last_error_ = XMLParseError::Ok;
    last_error_message_.clear();
    elements_parsed_ = 0;
    attributes_.clear();
    current_text_.clear();
}

XMLParseError XMLStreamReader::parseFromString(std::string_view xml_content) {
    if (xml_content.empty() || xml_content.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
        handleError(XMLParseError::InvalidInput, "Invalid buffer or size");
        return XMLParseError::InvalidInput;
    }

    resetState();
    if (!initializeParser()) {
        return last_error_;
    }

    if (XML_Parse(parser_, xml_content.data(), static_cast<int>(xml_content.size()), 1) == XML_STATUS_ERROR) {
        // 回调出错时已经记录了错误并停止解析
        if (last_error_ == XMLParseError::Ok) {
            std::string error_msg = fmt::format("Parse error at line {}, column {}: {}",
                XML_GetCurrentLineNumber(parser_),
                XML_GetCurrentColumnNumber(parser_),
                XML_ErrorString(XML_GetErrorCode(parser_)));
            handleError(XMLParseError::ParseFailed, error_msg);
        }
        cleanupParser();
        return last_error_;
    }

    cleanupParser();
    XML_DEBUG("Parsed {} bytes, {} elements", xml_content.size(), elements_parsed_);
    return last_error_;
}

void XMLCALL XMLStreamReader::startElementHandler(void* userData, const XML_Char* name, const XML_Char** attrs) {
    auto* reader = static_cast<XMLStreamReader*>(userData);
    std::string_view element_name{name, std::strlen(name)};
    reader->elements_parsed_++;

    reader->attributes_.clear();
    if (attrs) {
        for (int i = 0; attrs[i] && attrs[i + 1]; i += 2) {
            reader->attributes_.emplace_back(
                std::string_view{attrs[i], std::strlen(attrs[i])},
                std::string_view{attrs[i + 1], std::strlen(attrs[i + 1])});
        }
    }

    // 子元素开始时丢弃父元素已累积的混合内容
    reader->current_text_.clear();

    if (reader->start_element_callback_) {
        try {
            reader->start_element_callback_(element_name, reader->attributes_, reader->current_depth_);
        } catch (const std::exception& e) {
            reader->handleError(XMLParseError::CallbackError, "Start element callback error: " + std::string(e.what()));
            XML_StopParser(reader->parser_, XML_FALSE);
            return;
        }
    }
    reader->current_depth_++;
}

void XMLCALL XMLStreamReader::endElementHandler(void* userData, const XML_Char* name) {
    auto* reader = static_cast<XMLStreamReader*>(userData);
    reader->current_depth_--;
    std::string_view element_name{name, std::strlen(name)};

    try {
        if (!reader->current_text_.empty() && reader->text_callback_) {
            std::string_view text_content = reader->trim_whitespace_
                ? trimStringView(reader->current_text_)
                : std::string_view{reader->current_text_};
            if (!text_content.empty()) {
                reader->text_callback_(text_content, reader->current_depth_);
            }
        }
        reader->current_text_.clear();

        if (reader->end_element_callback_) {
            reader->end_element_callback_(element_name, reader->current_depth_);
        }
    } catch (const std::exception& e) {
        reader->handleError(XMLParseError::CallbackError, "End element callback error: " + std::string(e.what()));
        XML_StopParser(reader->parser_, XML_FALSE);
    }
}

void XMLCALL XMLStreamReader::characterDataHandler(void* userData, const XML_Char* data, int len) {
    auto* reader = static_cast<XMLStreamReader*>(userData);
    if (len > 0) {
        reader->current_text_.append(data, static_cast<size_t>(len));
    }
}

std::string_view XMLStreamReader::trimStringView(std::string_view str) {
    size_t start = str.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) {
        return std::string_view{};
    }
    size_t end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

void XMLStreamReader::handleError(XMLParseError error, const std::string& message) {
    last_error_ = error;
    last_error_message_ = message;
    XML_ERROR("XML parse error: {}", message);

    if (error_callback_) {
        int line = parser_ ? static_cast<int>(XML_GetCurrentLineNumber(parser_)) : -1;
        int column = parser_ ? static_cast<int>(XML_GetCurrentColumnNumber(parser_)) : -1;
        error_callback_(error, message, line, column);
    }
}

}} // namespace excelpipe::xml
