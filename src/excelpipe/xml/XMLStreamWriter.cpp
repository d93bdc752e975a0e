#include "excelpipe/xml/XMLStreamWriter.hpp"
#include "excelpipe/core/Exception.hpp"
#include "excelpipe/utils/XMLUtils.hpp"
#include "excelpipe/utils/ModuleLoggers.hpp"

#include <fmt/format.h>

namespace excelpipe {
namespace xml {

XMLStreamWriter::XMLStreamWriter() {
    buffer_.reserve(4096);
    pending_attributes_.reserve(16);
}

void XMLStreamWriter::startDocument() {
    buffer_.append("<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n");
}

void XMLStreamWriter::endDocument() {
    while (!element_stack_.empty()) {
        XML_WARN("Auto-closing unclosed element: {}", element_stack_.back());
        endElement();
    }
}

void XMLStreamWriter::startElement(const std::string& name) {
    EXCELPIPE_THROW_IF(name.empty(), "Element name cannot be empty", "name");

    ensureElementClosed();
    buffer_.push_back('<');
    buffer_.append(name);
    element_stack_.push_back(name);
    in_element_ = true;
}

void XMLStreamWriter::endElement() {
    if (element_stack_.empty()) {
        throw core::OperationException("No element to close", "endElement",
                                       core::ErrorCode::InvalidArgument, __FILE__, __LINE__);
    }

    std::string element_name = std::move(element_stack_.back());
    element_stack_.pop_back();

    if (in_element_) {
        // 自闭合元素
        flushAttributes();
        buffer_.append("/>");
        in_element_ = false;
    } else {
        buffer_.append("</");
        buffer_.append(element_name);
        buffer_.push_back('>');
    }
}

void XMLStreamWriter::writeEmptyElement(const std::string& name) {
    EXCELPIPE_THROW_IF(name.empty(), "Element name cannot be empty", "name");

    ensureElementClosed();
    buffer_.push_back('<');
    buffer_.append(name);
    flushAttributes();
    buffer_.append("/>");
}

void XMLStreamWriter::writeAttribute(const std::string& name, std::string_view value) {
    requireOpenTag("writeAttribute");
    EXCELPIPE_THROW_IF(name.empty(), "Attribute name cannot be empty", "name");
    pending_attributes_.emplace_back(name, std::string(value));
}

void XMLStreamWriter::writeAttribute(const std::string& name, const char* value) {
    writeAttribute(name, std::string_view(value ? value : ""));
}

void XMLStreamWriter::writeAttribute(const std::string& name, int value) {
    requireOpenTag("writeAttribute");
    pending_attributes_.emplace_back(name, fmt::format("{}", value));
}

void XMLStreamWriter::writeText(std::string_view text) {
    if (text.empty()) {
        return;
    }
    ensureElementClosed();
    buffer_.append(utils::XMLUtils::escapeText(text));
}

void XMLStreamWriter::writeText(double value) {
    ensureElementClosed();
    buffer_.append(fmt::format("{}", value));
}

std::string XMLStreamWriter::release() {
    endDocument();
    std::string result = std::move(buffer_);
    buffer_.clear();
    return result;
}

void XMLStreamWriter::ensureElementClosed() {
    if (in_element_) {
        flushAttributes();
        buffer_.push_back('>');
        in_element_ = false;
    }
}

void XMLStreamWriter::flushAttributes() {
    for (const auto& [name, value] : pending_attributes_) {
        buffer_.push_back(' ');
        buffer_.append(name);
        buffer_.append("=\"");
        buffer_.append(utils::XMLUtils::escapeAttribute(value));
        buffer_.push_back('"');
    }
    pending_attributes_.clear();
}

void XMLStreamWriter::requireOpenTag(const char* operation) const {
    if (!in_element_) {
        throw core::OperationException("Cannot write attribute outside of element", operation,
                                       core::ErrorCode::InvalidArgument, __FILE__, __LINE__);
    }
}

}} // namespace excelpipe::xml
