#include "excelpipe/writer/XLSXWriter.hpp"
#include "excelpipe/archive/ZipWriter.hpp"
#include "excelpipe/core/Constants.hpp"
#include "excelpipe/core/Workbook.hpp"
#include "excelpipe/utils/AddressParser.hpp"
#include "excelpipe/utils/CommonUtils.hpp"
#include "excelpipe/utils/ModuleLoggers.hpp"
#include "excelpipe/utils/XMLUtils.hpp"
#include "excelpipe/xml/XMLStreamWriter.hpp"

#include <cmath>
#include <set>
#include <fmt/format.h>

namespace excelpipe {
namespace writer {

namespace {

constexpr const char* kMainNamespace = "http://schemas.openxmlformats.org/spreadsheetml/2006/main";
constexpr const char* kRelNamespace = "http://schemas.openxmlformats.org/officeDocument/2006/relationships";
constexpr const char* kPackageRelNamespace = "http://schemas.openxmlformats.org/package/2006/relationships";
constexpr const char* kRelTypeBase = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/";
constexpr const char* kContentTypeBase = "application/vnd.openxmlformats-officedocument.spreadsheetml.";

std::string sheetPartName(size_t sheet_index) {
    return fmt::format("xl/worksheets/sheet{}.xml", sheet_index + 1);
}

std::string tablePartName(int table_id) {
    return fmt::format("xl/tables/table{}.xml", table_id);
}

void writeRelationship(xml::XMLStreamWriter& writer, const std::string& id,
                       const std::string& type, const std::string& target) {
    writer.startElement("Relationship");
    writer.writeAttribute("Id", id);
    writer.writeAttribute("Type", std::string(kRelTypeBase) + type);
    writer.writeAttribute("Target", target);
    writer.endElement();
}

void writeOverride(xml::XMLStreamWriter& writer, const std::string& part, const std::string& type) {
    writer.startElement("Override");
    writer.writeAttribute("PartName", "/" + part);
    writer.writeAttribute("ContentType", std::string(kContentTypeBase) + type);
    writer.endElement();
}

/**
 * @brief 写出一个单元格元素；数字为 NaN/Inf 时跳过
 */
void writeCell(xml::XMLStreamWriter& writer, int row, int col, const core::Cell& cell,
               const std::string& sheet_name) {
    const std::string ref = utils::CommonUtils::cellReference(row, col);
    const bool has_formula = cell.hasFormula();

    if (cell.isNumber() && !std::isfinite(cell.getNumberValue())) {
        WRITER_WARN("Skipping non-finite number at {} on sheet '{}'", ref, sheet_name);
        return;
    }

    writer.startElement("c");
    writer.writeAttribute("r", ref);

    switch (cell.getType()) {
        case core::CellType::Number:
            if (has_formula) {
                writer.startElement("f");
                writer.writeText(cell.getFormula());
                writer.endElement();
            }
            writer.startElement("v");
            writer.writeText(cell.getNumberValue());
            writer.endElement();
            break;

        case core::CellType::Boolean:
            writer.writeAttribute("t", "b");
            if (has_formula) {
                writer.startElement("f");
                writer.writeText(cell.getFormula());
                writer.endElement();
            }
            writer.startElement("v");
            writer.writeText(cell.getBooleanValue() ? "1" : "0");
            writer.endElement();
            break;

        case core::CellType::Error:
            writer.writeAttribute("t", "e");
            if (has_formula) {
                writer.startElement("f");
                writer.writeText(cell.getFormula());
                writer.endElement();
            }
            writer.startElement("v");
            writer.writeText(cell.getStringValue());
            writer.endElement();
            break;

        case core::CellType::String:
            if (has_formula) {
                writer.writeAttribute("t", "str");
                writer.startElement("f");
                writer.writeText(cell.getFormula());
                writer.endElement();
                writer.startElement("v");
                writer.writeText(cell.getStringValue());
                writer.endElement();
            } else {
                writer.writeAttribute("t", "inlineStr");
                writer.startElement("is");
                writer.startElement("t");
                if (utils::XMLUtils::needsSpacePreserve(cell.getStringValue())) {
                    writer.writeAttribute("xml:space", "preserve");
                }
                writer.writeText(cell.getStringValue());
                writer.endElement();
                writer.endElement();
            }
            break;

        case core::CellType::Empty:
            // 只有公式没有缓存值
            if (has_formula) {
                writer.startElement("f");
                writer.writeText(cell.getFormula());
                writer.endElement();
            }
            break;
    }

    writer.endElement(); // c
}

} // namespace

XLSXWriter::XLSXWriter(const core::Workbook& workbook)
    : workbook_(workbook) {
    assignTableIds();
}

core::VoidResult XLSXWriter::write(const core::Path& path) {
    if (workbook_.getWorksheetCount() == 0) {
        return core::makeError(core::ErrorCode::InvalidWorkbook, "Workbook has no worksheets", path.string());
    }
    if (!path.createParentDirectories()) {
        return core::makeError(core::ErrorCode::FileWriteError, "Cannot create output directory", path.string());
    }

    archive::ZipWriter zip(path);
    if (!zip.open()) {
        WRITER_ERROR("Cannot create output file: {}", path.string());
        return core::makeError(core::ErrorCode::FileAccessDenied, "Cannot create output file", path.string());
    }

    std::vector<std::pair<std::string, std::string>> parts;
    parts.emplace_back("[Content_Types].xml", generateContentTypesXML());
    parts.emplace_back("_rels/.rels", generateRootRelsXML());
    parts.emplace_back("xl/workbook.xml", generateWorkbookXML());
    parts.emplace_back("xl/_rels/workbook.xml.rels", generateWorkbookRelsXML());
    parts.emplace_back("xl/styles.xml", generateStylesXML());

    for (size_t i = 0; i < workbook_.getWorksheetCount(); ++i) {
        parts.emplace_back(sheetPartName(i), generateWorksheetXML(i));
        if (table_ids_[i].empty()) {
            continue;
        }
        parts.emplace_back(fmt::format("xl/worksheets/_rels/sheet{}.xml.rels", i + 1), generateWorksheetRelsXML(i));
        for (size_t t = 0; t < table_ids_[i].size(); ++t) {
            parts.emplace_back(tablePartName(table_ids_[i][t]), generateTableXML(i, t));
        }
    }

    for (const auto& [name, content] : parts) {
        auto error = zip.addFile(name, content);
        if (archive::isError(error)) {
            WRITER_ERROR("Failed to write part {}: {}", name, archive::toString(error));
            if (!zip.close()) {
                WRITER_WARN("Failed to finalize partial archive {}", path.string());
            }
            return core::makeError(core::ErrorCode::FileWriteError,
                                   fmt::format("Failed to write part {}", name), path.string());
        }
    }

    if (!zip.close()) {
        return core::makeError(core::ErrorCode::FileWriteError, "Failed to finalize archive", path.string());
    }

    WRITER_INFO("Saved workbook {} ({} parts)", path.string(), parts.size());
    return {};
}

std::vector<std::string> XLSXWriter::resolveTableColumns(const core::Worksheet& worksheet,
                                                         const core::TableDefinition& table) {
    std::vector<std::string> names;
    std::set<std::string> seen;
    const int columns = table.ref.columns();
    names.reserve(static_cast<size_t>(columns));

    for (int i = 0; i < columns; ++i) {
        std::string name;
        if (table.header_row_count > 0) {
            name = utils::CommonUtils::trim(worksheet.getCell(table.ref.first_row, table.ref.first_col + i).toText());
        }
        if (name.empty() && static_cast<size_t>(i) < table.column_names.size()) {
            name = table.column_names[static_cast<size_t>(i)];
        }
        if (name.empty()) {
            name = fmt::format("Column{}", i + 1);
        }

        // 列名不区分大小写，重复时追加序号
        std::string candidate = name;
        for (int suffix = 2; seen.count(utils::CommonUtils::toLower(candidate)) > 0; ++suffix) {
            candidate = name + std::to_string(suffix);
        }
        seen.insert(utils::CommonUtils::toLower(candidate));
        names.push_back(std::move(candidate));
    }
    return names;
}

std::string XLSXWriter::generateContentTypesXML() const {
    xml::XMLStreamWriter writer;
    writer.startDocument();
    writer.startElement("Types");
    writer.writeAttribute("xmlns", "http://schemas.openxmlformats.org/package/2006/content-types");

    writer.startElement("Default");
    writer.writeAttribute("Extension", "rels");
    writer.writeAttribute("ContentType", "application/vnd.openxmlformats-package.relationships+xml");
    writer.endElement();
    writer.startElement("Default");
    writer.writeAttribute("Extension", "xml");
    writer.writeAttribute("ContentType", "application/xml");
    writer.endElement();

    writeOverride(writer, "xl/workbook.xml", "sheet.main+xml");
    for (size_t i = 0; i < workbook_.getWorksheetCount(); ++i) {
        writeOverride(writer, sheetPartName(i), "worksheet+xml");
    }
    for (const auto& sheet_ids : table_ids_) {
        for (int id : sheet_ids) {
            writeOverride(writer, tablePartName(id), "table+xml");
        }
    }
    writeOverride(writer, "xl/styles.xml", "styles+xml");

    writer.endElement();
    return writer.release();
}

std::string XLSXWriter::generateRootRelsXML() const {
    xml::XMLStreamWriter writer;
    writer.startDocument();
    writer.startElement("Relationships");
    writer.writeAttribute("xmlns", kPackageRelNamespace);
    writeRelationship(writer, "rId1", "officeDocument", "xl/workbook.xml");
    writer.endElement();
    return writer.release();
}

std::string XLSXWriter::generateWorkbookXML() const {
    xml::XMLStreamWriter writer;
    writer.startDocument();
    writer.startElement("workbook");
    writer.writeAttribute("xmlns", kMainNamespace);
    writer.writeAttribute("xmlns:r", kRelNamespace);

    writer.startElement("sheets");
    for (size_t i = 0; i < workbook_.getWorksheetCount(); ++i) {
        const auto* sheet = workbook_.getWorksheet(i);
        writer.startElement("sheet");
        writer.writeAttribute("name", sheet->getName());
        writer.writeAttribute("sheetId", static_cast<int>(i + 1));
        writer.writeAttribute("r:id", fmt::format("rId{}", i + 1));
        writer.endElement();
    }
    writer.endElement(); // sheets

    auto named = workbook_.namedRanges();
    const auto& others = workbook_.otherDefinedNames();
    if (!named.empty() || !others.empty()) {
        writer.startElement("definedNames");
        for (const auto& entry : named) {
            writer.startElement("definedName");
            writer.writeAttribute("name", entry.name);
            writer.writeText(entry.qualified_address);
            writer.endElement();
        }
        for (const auto& other : others) {
            writer.startElement("definedName");
            writer.writeAttribute("name", other.name);
            if (other.local_sheet_id >= 0) {
                writer.writeAttribute("localSheetId", other.local_sheet_id);
            }
            if (other.hidden) {
                writer.writeAttribute("hidden", "1");
            }
            writer.writeText(other.formula);
            writer.endElement();
        }
        writer.endElement(); // definedNames
    }

    writer.endElement(); // workbook
    return writer.release();
}

std::string XLSXWriter::generateWorkbookRelsXML() const {
    xml::XMLStreamWriter writer;
    writer.startDocument();
    writer.startElement("Relationships");
    writer.writeAttribute("xmlns", kPackageRelNamespace);
    const size_t count = workbook_.getWorksheetCount();
    for (size_t i = 0; i < count; ++i) {
        writeRelationship(writer, fmt::format("rId{}", i + 1), "worksheet",
                          fmt::format("worksheets/sheet{}.xml", i + 1));
    }
    writeRelationship(writer, fmt::format("rId{}", count + 1), "styles", "styles.xml");
    writer.endElement();
    return writer.release();
}

std::string XLSXWriter::generateStylesXML() const {
    xml::XMLStreamWriter writer;
    writer.startDocument();
    writer.startElement("styleSheet");
    writer.writeAttribute("xmlns", kMainNamespace);

    writer.startElement("fonts");
    writer.writeAttribute("count", 1);
    writer.startElement("font");
    writer.startElement("sz");
    writer.writeAttribute("val", 11);
    writer.endElement();
    writer.startElement("name");
    writer.writeAttribute("val", "Calibri");
    writer.endElement();
    writer.startElement("family");
    writer.writeAttribute("val", 2);
    writer.endElement();
    writer.endElement(); // font
    writer.endElement(); // fonts

    writer.startElement("fills");
    writer.writeAttribute("count", 2);
    for (const char* pattern : {"none", "gray125"}) {
        writer.startElement("fill");
        writer.startElement("patternFill");
        writer.writeAttribute("patternType", pattern);
        writer.endElement();
        writer.endElement();
    }
    writer.endElement(); // fills

    writer.startElement("borders");
    writer.writeAttribute("count", 1);
    writer.startElement("border");
    for (const char* side : {"left", "right", "top", "bottom", "diagonal"}) {
        writer.writeEmptyElement(side);
    }
    writer.endElement(); // border
    writer.endElement(); // borders

    writer.startElement("cellStyleXfs");
    writer.writeAttribute("count", 1);
    writer.startElement("xf");
    writer.writeAttribute("numFmtId", 0);
    writer.writeAttribute("fontId", 0);
    writer.writeAttribute("fillId", 0);
    writer.writeAttribute("borderId", 0);
    writer.endElement();
    writer.endElement();

    writer.startElement("cellXfs");
    writer.writeAttribute("count", 1);
    writer.startElement("xf");
    writer.writeAttribute("numFmtId", 0);
    writer.writeAttribute("fontId", 0);
    writer.writeAttribute("fillId", 0);
    writer.writeAttribute("borderId", 0);
    writer.writeAttribute("xfId", 0);
    writer.endElement();
    writer.endElement();

    writer.startElement("cellStyles");
    writer.writeAttribute("count", 1);
    writer.startElement("cellStyle");
    writer.writeAttribute("name", "Normal");
    writer.writeAttribute("xfId", 0);
    writer.writeAttribute("builtinId", 0);
    writer.endElement();
    writer.endElement();

    writer.endElement(); // styleSheet
    return writer.release();
}

std::string XLSXWriter::generateWorksheetXML(size_t sheet_index) const {
    const auto* sheet = workbook_.getWorksheet(sheet_index);
    xml::XMLStreamWriter writer;
    writer.startDocument();
    writer.startElement("worksheet");
    writer.writeAttribute("xmlns", kMainNamespace);
    writer.writeAttribute("xmlns:r", kRelNamespace);

    writer.startElement("dimension");
    auto used = sheet->getUsedRange();
    writer.writeAttribute("ref", used ? used->toReference() : std::string("A1"));
    writer.endElement();

    // 表头单元格需要与表格列名一致，不一致的按列名写出
    core::Worksheet::CellMap cells = sheet->cells();
    for (const auto& [pos, name] : collectHeaderOverrides(*sheet)) {
        cells[pos] = core::Cell(name);
    }

    writer.startElement("sheetData");
    int open_row = -1;
    for (const auto& [pos, cell] : cells) {
        if (pos.first != open_row) {
            if (open_row >= 0) {
                writer.endElement(); // row
            }
            writer.startElement("row");
            writer.writeAttribute("r", pos.first + 1);
            open_row = pos.first;
        }
        writeCell(writer, pos.first, pos.second, cell, sheet->getName());
    }
    if (open_row >= 0) {
        writer.endElement(); // row
    }
    writer.endElement(); // sheetData

    const auto& tables = table_ids_[sheet_index];
    if (!tables.empty()) {
        writer.startElement("tableParts");
        writer.writeAttribute("count", static_cast<int>(tables.size()));
        for (size_t t = 0; t < tables.size(); ++t) {
            writer.startElement("tablePart");
            writer.writeAttribute("r:id", fmt::format("rId{}", t + 1));
            writer.endElement();
        }
        writer.endElement();
    }

    writer.endElement(); // worksheet
    return writer.release();
}

std::string XLSXWriter::generateWorksheetRelsXML(size_t sheet_index) const {
    xml::XMLStreamWriter writer;
    writer.startDocument();
    writer.startElement("Relationships");
    writer.writeAttribute("xmlns", kPackageRelNamespace);
    const auto& tables = table_ids_[sheet_index];
    for (size_t t = 0; t < tables.size(); ++t) {
        writeRelationship(writer, fmt::format("rId{}", t + 1), "table",
                          fmt::format("../tables/table{}.xml", tables[t]));
    }
    writer.endElement();
    return writer.release();
}

std::string XLSXWriter::generateTableXML(size_t sheet_index, size_t table_index) const {
    const auto* sheet = workbook_.getWorksheet(sheet_index);
    const auto& table = *sheet->tables()[table_index];
    auto columns = resolveTableColumns(*sheet, table);

    xml::XMLStreamWriter writer;
    writer.startDocument();
    writer.startElement("table");
    writer.writeAttribute("xmlns", kMainNamespace);
    writer.writeAttribute("id", table_ids_[sheet_index][table_index]);
    writer.writeAttribute("name", table.name);
    writer.writeAttribute("displayName", table.display_name.empty() ? table.name : table.display_name);
    writer.writeAttribute("ref", table.ref.toReference());
    if (table.header_row_count == 0) {
        writer.writeAttribute("headerRowCount", 0);
    }
    if (table.totals_row_count > 0) {
        writer.writeAttribute("totalsRowCount", 1);
    } else {
        writer.writeAttribute("totalsRowShown", 0);
    }

    if (table.header_row_count > 0) {
        core::CellRange filter = table.ref;
        filter.last_row -= table.totals_row_count;
        writer.startElement("autoFilter");
        writer.writeAttribute("ref", filter.toReference());
        writer.endElement();
    }

    writer.startElement("tableColumns");
    writer.writeAttribute("count", static_cast<int>(columns.size()));
    for (size_t i = 0; i < columns.size(); ++i) {
        writer.startElement("tableColumn");
        writer.writeAttribute("id", static_cast<int>(i + 1));
        writer.writeAttribute("name", columns[i]);
        writer.endElement();
    }
    writer.endElement(); // tableColumns

    writer.startElement("tableStyleInfo");
    writer.writeAttribute("name", core::Constants::kDefaultTableStyle);
    writer.writeAttribute("showFirstColumn", 0);
    writer.writeAttribute("showLastColumn", 0);
    writer.writeAttribute("showRowStripes", 1);
    writer.writeAttribute("showColumnStripes", 0);
    writer.endElement();

    writer.endElement(); // table
    return writer.release();
}

void XLSXWriter::assignTableIds() {
    int next_id = 1;
    table_ids_.clear();
    for (const auto& sheet : workbook_.worksheets()) {
        std::vector<int> ids;
        for (size_t t = 0; t < sheet->tables().size(); ++t) {
            ids.push_back(next_id++);
        }
        table_ids_.push_back(std::move(ids));
    }
}

XLSXWriter::HeaderOverrides XLSXWriter::collectHeaderOverrides(const core::Worksheet& worksheet) const {
    HeaderOverrides overrides;
    for (const auto& table : worksheet.tables()) {
        if (table->header_row_count == 0) {
            continue;
        }
        auto columns = resolveTableColumns(worksheet, *table);
        for (size_t i = 0; i < columns.size(); ++i) {
            const int row = table->ref.first_row;
            const int col = table->ref.first_col + static_cast<int>(i);
            const auto& cell = worksheet.getCell(row, col);
            if (!cell.isString() || cell.hasFormula() || cell.getStringValue() != columns[i]) {
                overrides[{row, col}] = columns[i];
            }
        }
    }
    return overrides;
}

}} // namespace excelpipe::writer
