#include "excelpipe/reader/WorksheetParser.hpp"
#include "excelpipe/utils/CommonUtils.hpp"

#include <stdexcept>

namespace excelpipe {
namespace reader {

void WorksheetParser::onStartElement(std::string_view name, const std::vector<xml::XMLAttribute>& attributes, int /*depth*/) {
    auto local = localName(name);

    if (local == "row") {
        // r 属性缺省时按顺序递增
        current_row_ = getIntAttributeOr(attributes, "r", current_row_ + 2) - 1;
        next_col_ = 0;
    } else if (local == "c" && isInElement("sheetData")) {
        handleCellStart(attributes);
    } else if (in_cell_ && (local == "v" || local == "f")) {
        startCollectingText();
    } else if (in_cell_ && local == "t" && isInElement("is") && !isInElement("rPh")) {
        startCollectingText();
    } else if (local == "tablePart") {
        if (auto rel_id = findRelationshipId(attributes)) {
            table_rel_ids_.emplace_back(*rel_id);
        }
    }
}

void WorksheetParser::onEndElement(std::string_view name, int /*depth*/) {
    auto local = localName(name);
    if (!in_cell_) {
        return;
    }

    if (local == "v") {
        cell_.value = getCurrentText();
        cell_.has_value = true;
        stopCollectingText();
    } else if (local == "f") {
        cell_.formula = getCurrentText();
        stopCollectingText();
    } else if (local == "t" && state_.collecting_text) {
        cell_.inline_text += getCurrentText();
        cell_.has_value = true;
        stopCollectingText();
    } else if (local == "c") {
        commitCell();
        in_cell_ = false;
    }
}

void WorksheetParser::handleCellStart(const std::vector<xml::XMLAttribute>& attributes) {
    cell_.reset();
    in_cell_ = true;

    cell_.row = current_row_ < 0 ? 0 : current_row_;
    cell_.col = next_col_;
    if (auto ref = findAttribute(attributes, "r")) {
        try {
            auto [row, col] = utils::CommonUtils::parseReference(*ref);
            cell_.row = row;
            cell_.col = col;
        } catch (const std::invalid_argument& e) {
            READER_WARN("Invalid cell reference '{}' on sheet '{}': {}", *ref, worksheet_.getName(), e.what());
        }
    }
    next_col_ = cell_.col + 1;
    cell_.type = getAttributeOr(attributes, "t", "n");
}

void WorksheetParser::commitCell() {
    if (!utils::CommonUtils::isValidCellPosition(cell_.row, cell_.col)) {
        READER_WARN("Skipping cell outside sheet bounds ({}, {}) on sheet '{}'",
                    cell_.row, cell_.col, worksheet_.getName());
        return;
    }

    core::Cell cell;
    if (cell_.type == "s") {
        if (cell_.has_value) {
            double parsed = 0.0;
            long long index = -1;
            if (utils::CommonUtils::parseDouble(cell_.value, parsed) && parsed >= 0.0) {
                index = static_cast<long long>(parsed);
            }
            if (index >= 0 && static_cast<size_t>(index) < shared_strings_.size()) {
                cell.setValue(shared_strings_[static_cast<size_t>(index)]);
            } else {
                READER_WARN("Shared string index '{}' out of range at {} on sheet '{}'", cell_.value,
                            utils::CommonUtils::cellReference(cell_.row, cell_.col), worksheet_.getName());
            }
        }
    } else if (cell_.type == "inlineStr") {
        cell.setValue(cell_.inline_text);
    } else if (cell_.type == "str") {
        cell.setValue(cell_.value);
    } else if (cell_.type == "b") {
        if (cell_.has_value) {
            cell.setValue(utils::CommonUtils::trim(cell_.value) == "1");
        }
    } else if (cell_.type == "e") {
        if (cell_.has_value) {
            cell = core::Cell::makeError(cell_.value);
        }
    } else if (cell_.has_value && !cell_.value.empty()) {
        double number = 0.0;
        if (utils::CommonUtils::parseDouble(cell_.value, number)) {
            cell.setValue(number);
        } else {
            READER_WARN("Non-numeric value '{}' in numeric cell {} on sheet '{}'", cell_.value,
                        utils::CommonUtils::cellReference(cell_.row, cell_.col), worksheet_.getName());
            cell.setValue(cell_.value);
        }
    }

    if (!cell_.formula.empty()) {
        cell.setFormula(cell_.formula);
    }
    if (cell.isEmpty() && !cell.hasFormula()) {
        return;
    }

    worksheet_.setCell(cell_.row, cell_.col, cell);
    ++cells_parsed_;
}

}} // namespace excelpipe::reader
