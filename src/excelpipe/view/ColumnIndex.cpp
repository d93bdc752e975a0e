#include "excelpipe/view/ColumnIndex.hpp"
#include "excelpipe/utils/CommonUtils.hpp"

#include <fmt/format.h>

namespace excelpipe {
namespace view {

using utils::CommonUtils;

ColumnIndex::ColumnIndex(const std::vector<std::string>& headers) {
    names_.reserve(headers.size());
    for (const auto& header : headers) {
        append(header);
    }
}

std::optional<int> ColumnIndex::resolve(const std::string& name) const {
    auto it = positions_.find(name);
    if (it == positions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

int ColumnIndex::append(const std::string& name) {
    int position = static_cast<int>(names_.size());
    names_.push_back(CommonUtils::trim(name));
    // emplace 不覆盖，重复表头保留第一列
    positions_.emplace(names_.back(), position);
    return position;
}

std::optional<std::string> ColumnIndex::nearMatch(const std::string& name) const {
    const std::string wanted = CommonUtils::toLower(CommonUtils::trim(name));
    for (const auto& known : names_) {
        if (CommonUtils::toLower(known) == wanted) {
            return known;
        }
    }
    return std::nullopt;
}

std::string ColumnIndex::describeMissing(const std::string& name, const std::string& table_name) const {
    std::string info = "Valid columns are...";
    for (const auto& known : names_) {
        info += fmt::format(" '{}'", known);
    }
    if (hasNearMatch(name)) {
        info += "\n(Check capitalization and whitespace)";
    }
    return fmt::format("Cannot find column named '{}' in table {}.\n{}", name, table_name, info);
}

}} // namespace excelpipe::view
