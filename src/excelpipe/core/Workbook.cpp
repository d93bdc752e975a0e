#include "excelpipe/core/Workbook.hpp"
#include "excelpipe/core/Exception.hpp"
#include "excelpipe/reader/XLSXReader.hpp"
#include "excelpipe/writer/XLSXWriter.hpp"
#include "excelpipe/utils/AddressParser.hpp"
#include "excelpipe/utils/ModuleLoggers.hpp"

namespace excelpipe {
namespace core {

Result<std::unique_ptr<Workbook>> Workbook::open(const Path& path) {
    if (!path.exists()) {
        CORE_ERROR("File not found: {}", path.string());
        return makeError(ErrorCode::FileNotFound, "Workbook file not found", path.string());
    }

    reader::XLSXReader reader(path);
    auto result = reader.open();
    if (result != ErrorCode::Ok) {
        CORE_ERROR("Failed to open XLSX file for reading: {}, error: {}", path.string(), toString(result));
        return makeError(result, "Failed to open workbook package", path.string());
    }

    std::unique_ptr<Workbook> workbook;
    result = reader.loadWorkbook(workbook);
    reader.close();

    if (result != ErrorCode::Ok || !workbook) {
        CORE_ERROR("Failed to load workbook from file: {}, error: {}", path.string(), toString(result));
        return makeError(result == ErrorCode::Ok ? ErrorCode::InvalidWorkbook : result,
                         "Failed to load workbook", path.string());
    }

    CORE_INFO("Loaded workbook {} ({} sheets)", path.string(), workbook->getWorksheetCount());
    return std::move(workbook);
}

VoidResult Workbook::save(const Path& path) const {
    writer::XLSXWriter writer(*this);
    return writer.write(path);
}

Worksheet& Workbook::addWorksheet(const std::string& name) {
    EXCELPIPE_THROW_IF(!isValidSheetName(name), "Invalid worksheet name '" + name + "'", "name");
    EXCELPIPE_THROW_IF(getWorksheet(name) != nullptr, "Worksheet '" + name + "' already exists", "name");

    worksheets_.push_back(std::make_unique<Worksheet>(name, next_sheet_id_++));
    CORE_DEBUG("Added worksheet '{}'", name);
    return *worksheets_.back();
}

Worksheet* Workbook::getWorksheet(const std::string& name) {
    for (auto& sheet : worksheets_) {
        if (sheet->getName() == name) return sheet.get();
    }
    return nullptr;
}

const Worksheet* Workbook::getWorksheet(const std::string& name) const {
    for (const auto& sheet : worksheets_) {
        if (sheet->getName() == name) return sheet.get();
    }
    return nullptr;
}

Worksheet* Workbook::getWorksheet(size_t index) {
    return index < worksheets_.size() ? worksheets_[index].get() : nullptr;
}

const Worksheet* Workbook::getWorksheet(size_t index) const {
    return index < worksheets_.size() ? worksheets_[index].get() : nullptr;
}

bool Workbook::addDefinedName(const std::string& name, const std::string& formula,
                              int local_sheet_id, bool hidden) {
    // _xlnm.Print_Area 等内置名称以及工作表级名称不作为命名区域
    bool candidate = local_sheet_id < 0 && !hidden && name.rfind("_xlnm.", 0) != 0;
    if (candidate) {
        auto parsed = utils::AddressParser::tryParseRange(formula);
        if (parsed && !parsed->sheet_name.empty()) {
            if (auto* sheet = getWorksheet(parsed->sheet_name)) {
                sheet->addNamedRange(name, CellRange(parsed->first_row, parsed->first_col,
                                                     parsed->last_row, parsed->last_col));
                CORE_DEBUG("Bound defined name '{}' to {}", name, formula);
                return true;
            }
            CORE_WARN("Defined name '{}' refers to unknown sheet '{}'", name, parsed->sheet_name);
        }
    }

    other_names_.push_back(DefinedName{name, formula, local_sheet_id, hidden});
    return false;
}

NamedRange& Workbook::addNamedRange(const std::string& name, const std::string& sheet_name, const CellRange& range) {
    auto* sheet = getWorksheet(sheet_name);
    EXCELPIPE_THROW_IF(sheet == nullptr, "Worksheet '" + sheet_name + "' does not exist", "sheet_name");
    return sheet->addNamedRange(name, range);
}

std::vector<NamedRangeEntry> Workbook::namedRanges() const {
    std::vector<NamedRangeEntry> entries;
    for (const auto& sheet : worksheets_) {
        for (const auto& range : sheet->namedRanges()) {
            const auto& r = range->range;
            entries.push_back(NamedRangeEntry{
                range->name,
                utils::AddressParser::toAbsoluteRange(sheet->getName(), r.first_row, r.first_col,
                                                      r.last_row, r.last_col)});
        }
    }
    return entries;
}

bool Workbook::isValidSheetName(const std::string& name) {
    if (name.empty() || name.length() > 31) {
        return false;
    }
    if (name.front() == '\'' || name.back() == '\'') {
        return false;
    }
    return name.find_first_of("[]*/\\?:") == std::string::npos;
}

}} // namespace excelpipe::core
