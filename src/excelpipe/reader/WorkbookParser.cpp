#include "excelpipe/reader/WorkbookParser.hpp"

namespace excelpipe {
namespace reader {

void WorkbookParser::onStartElement(std::string_view name, const std::vector<xml::XMLAttribute>& attributes, int /*depth*/) {
    auto local = localName(name);
    if (local == "sheet" && isInElement("sheets")) {
        auto sheet_name = findAttribute(attributes, "name");
        auto rel_id = findRelationshipId(attributes);
        if (!sheet_name || !rel_id) {
            READER_WARN("Skipping sheet entry without name or relationship id");
            return;
        }
        WorksheetInfo info;
        info.name = std::string(*sheet_name);
        info.sheet_id = getIntAttributeOr(attributes, "sheetId", 0);
        info.rel_id = std::string(*rel_id);
        worksheets_.push_back(std::move(info));
    } else if (local == "definedName") {
        DefinedNameInfo info;
        info.name = getAttributeOr(attributes, "name", "");
        info.local_sheet_id = getIntAttributeOr(attributes, "localSheetId", -1);
        info.hidden = getBoolAttributeOr(attributes, "hidden", false);
        defined_names_.push_back(std::move(info));
        in_defined_name_ = true;
        startCollectingText();
    }
}

void WorkbookParser::onEndElement(std::string_view name, int /*depth*/) {
    if (in_defined_name_ && localName(name) == "definedName") {
        defined_names_.back().formula = getCurrentText();
        stopCollectingText();
        in_defined_name_ = false;
        if (defined_names_.back().name.empty()) {
            READER_WARN("Dropping defined name without a name attribute");
            defined_names_.pop_back();
        }
    }
}

}} // namespace excelpipe::reader
