#include "excelpipe/reader/SharedStringsParser.hpp"

namespace excelpipe {
namespace reader {

void SharedStringsParser::onStartElement(std::string_view name, const std::vector<xml::XMLAttribute>& /*attributes*/, int /*depth*/) {
    auto local = localName(name);
    if (local == "si") {
        in_item_ = true;
        current_item_.clear();
    } else if (local == "t" && in_item_ && !isInElement("rPh")) {
        startCollectingText();
    }
}

void SharedStringsParser::onEndElement(std::string_view name, int /*depth*/) {
    auto local = localName(name);
    if (local == "t" && state_.collecting_text) {
        current_item_ += getCurrentText();
        stopCollectingText();
    } else if (local == "si" && in_item_) {
        strings_.push_back(std::move(current_item_));
        current_item_.clear();
        in_item_ = false;
    } else if (local == "sst") {
        READER_DEBUG("Parsed {} shared strings", strings_.size());
    }
}

}} // namespace excelpipe::reader
