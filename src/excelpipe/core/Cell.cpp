#include "excelpipe/core/Cell.hpp"
#include "excelpipe/utils/CommonUtils.hpp"

#include <fmt/format.h>

namespace excelpipe {
namespace core {

namespace {
const std::string kEmptyString;
}

Cell Cell::makeError(const std::string& error_text) {
    Cell cell(error_text);
    cell.is_error_ = true;
    return cell;
}

CellType Cell::getType() const {
    switch (value_.index()) {
        case 1: return CellType::Number;
        case 2: return CellType::Boolean;
        case 3: return is_error_ ? CellType::Error : CellType::String;
        default: return CellType::Empty;
    }
}

bool Cell::isBlank() const {
    if (isEmpty()) return true;
    if (const auto* text = std::get_if<std::string>(&value_)) {
        return !is_error_ && utils::CommonUtils::isBlank(*text);
    }
    return false;
}

double Cell::getNumberValue() const {
    if (const auto* number = std::get_if<double>(&value_)) {
        return *number;
    }
    return 0.0;
}

bool Cell::getBooleanValue() const {
    if (const auto* flag = std::get_if<bool>(&value_)) {
        return *flag;
    }
    return false;
}

const std::string& Cell::getStringValue() const {
    if (const auto* text = std::get_if<std::string>(&value_)) {
        return *text;
    }
    return kEmptyString;
}

std::string Cell::toText() const {
    switch (getType()) {
        case CellType::Number:
            return fmt::format("{}", std::get<double>(value_));
        case CellType::Boolean:
            return std::get<bool>(value_) ? "TRUE" : "FALSE";
        case CellType::String:
        case CellType::Error:
            return std::get<std::string>(value_);
        default:
            return std::string();
    }
}

std::optional<double> Cell::tryAsNumber() const {
    switch (getType()) {
        case CellType::Number:
            return std::get<double>(value_);
        case CellType::Boolean:
            return std::get<bool>(value_) ? 1.0 : 0.0;
        case CellType::String: {
            double parsed = 0.0;
            if (utils::CommonUtils::parseDouble(std::get<std::string>(value_), parsed)) {
                return parsed;
            }
            return std::nullopt;
        }
        default:
            return std::nullopt;
    }
}

std::optional<bool> Cell::tryAsBoolean() const {
    switch (getType()) {
        case CellType::Boolean:
            return std::get<bool>(value_);
        case CellType::Number:
            return std::get<double>(value_) != 0.0;
        case CellType::String: {
            std::string text = utils::CommonUtils::toLower(utils::CommonUtils::trim(std::get<std::string>(value_)));
            if (text == "true" || text == "1" || text == "yes") return true;
            if (text == "false" || text == "0" || text == "no") return false;
            return std::nullopt;
        }
        default:
            return std::nullopt;
    }
}

void Cell::clear() {
    value_ = std::monostate{};
    formula_.clear();
    is_error_ = false;
}

}} // namespace excelpipe::core
