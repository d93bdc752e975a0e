#include "excelpipe/reader/TableParser.hpp"
#include "excelpipe/utils/AddressParser.hpp"

namespace excelpipe {
namespace reader {

void TableParser::onStartElement(std::string_view name, const std::vector<xml::XMLAttribute>& attributes, int /*depth*/) {
    auto local = localName(name);

    if (local == "table") {
        table_.id = getIntAttributeOr(attributes, "id", 0);
        table_.name = getAttributeOr(attributes, "name", "");
        table_.display_name = getAttributeOr(attributes, "displayName", table_.name);
        if (table_.name.empty()) {
            table_.name = table_.display_name;
        }
        table_.header_row_count = getIntAttributeOr(attributes, "headerRowCount", 1) > 0 ? 1 : 0;
        table_.totals_row_count = getIntAttributeOr(attributes, "totalsRowCount", 0) > 0 ? 1 : 0;

        auto ref = getAttributeOr(attributes, "ref", "");
        if (auto parsed = utils::AddressParser::tryParseRange(ref)) {
            table_.ref = core::CellRange(parsed->first_row, parsed->first_col, parsed->last_row, parsed->last_col);
            has_ref_ = true;
        } else {
            setError("Table '" + table_.name + "' has invalid ref '" + ref + "'");
        }
    } else if (local == "tableColumn") {
        table_.column_names.push_back(getAttributeOr(attributes, "name", ""));
    }
}

bool TableParser::validate() {
    if (table_.name.empty() || !has_ref_) {
        setError("Table part is missing its name or ref");
        return false;
    }
    if (!table_.column_names.empty() &&
        table_.column_names.size() != static_cast<size_t>(table_.ref.columns())) {
        READER_WARN("Table '{}' declares {} columns but spans {}", table_.name,
                    table_.column_names.size(), table_.ref.columns());
        table_.column_names.resize(static_cast<size_t>(table_.ref.columns()));
    }
    return true;
}

}} // namespace excelpipe::reader
