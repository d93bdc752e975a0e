#include "excelpipe/reader/XLSXReader.hpp"
#include "excelpipe/reader/RelationshipsParser.hpp"
#include "excelpipe/reader/SharedStringsParser.hpp"
#include "excelpipe/reader/TableParser.hpp"
#include "excelpipe/reader/WorkbookParser.hpp"
#include "excelpipe/reader/WorksheetParser.hpp"
#include "excelpipe/core/Exception.hpp"
#include "excelpipe/core/Workbook.hpp"
#include "excelpipe/utils/ModuleLoggers.hpp"

#include <sstream>

namespace excelpipe {
namespace reader {

namespace {

constexpr const char* kPackageRels = "_rels/.rels";
constexpr const char* kDefaultWorkbookPart = "xl/workbook.xml";

} // namespace

XLSXReader::XLSXReader(const core::Path& path)
    : filepath_(path)
    , zip_reader_(std::make_unique<archive::ZipReader>(path)) {
}

XLSXReader::~XLSXReader() {
    if (is_open_) {
        close();
    }
}

core::ErrorCode XLSXReader::open() {
    if (is_open_) {
        return core::ErrorCode::Ok;
    }

    if (!zip_reader_->open()) {
        READER_ERROR("Cannot open XLSX package: {}", filepath_.string());
        return core::ErrorCode::FileAccessDenied;
    }

    if (!zip_reader_->hasFile("[Content_Types].xml")) {
        READER_ERROR("Missing [Content_Types].xml, not an XLSX package: {}", filepath_.string());
        zip_reader_->close();
        return core::ErrorCode::XmlInvalidFormat;
    }

    is_open_ = true;
    READER_INFO("Opened XLSX package: {}", filepath_.string());
    return core::ErrorCode::Ok;
}

void XLSXReader::close() {
    if (!is_open_) {
        return;
    }
    zip_reader_->close();
    shared_strings_.clear();
    is_open_ = false;
    READER_DEBUG("Closed XLSX package: {}", filepath_.string());
}

core::ErrorCode XLSXReader::loadWorkbook(std::unique_ptr<core::Workbook>& workbook) {
    if (!is_open_) {
        READER_ERROR("Package not open, cannot load workbook");
        return core::ErrorCode::InvalidArgument;
    }

    const std::string workbook_part = locateWorkbookPart();

    std::string rels_xml;
    auto result = extractPart(relationshipsPathFor(workbook_part), rels_xml);
    if (result != core::ErrorCode::Ok) {
        return core::ErrorCode::InvalidWorkbook;
    }
    RelationshipsParser rels;
    if (!rels.parse(rels_xml)) {
        READER_ERROR("Failed to parse workbook relationships: {}", rels.getErrorMessage());
        return core::ErrorCode::XmlParseError;
    }

    result = parseSharedStrings(workbook_part, rels);
    if (result != core::ErrorCode::Ok) {
        return result;
    }

    std::string workbook_xml;
    result = extractPart(workbook_part, workbook_xml);
    if (result != core::ErrorCode::Ok) {
        return core::ErrorCode::InvalidWorkbook;
    }
    WorkbookParser workbook_parser;
    if (!workbook_parser.parse(workbook_xml)) {
        READER_ERROR("Failed to parse {}: {}", workbook_part, workbook_parser.getErrorMessage());
        return core::ErrorCode::XmlParseError;
    }
    if (workbook_parser.getWorksheets().empty()) {
        READER_ERROR("Workbook declares no worksheets");
        return core::ErrorCode::XmlMissingElement;
    }

    auto loaded = std::make_unique<core::Workbook>();
    for (const auto& info : workbook_parser.getWorksheets()) {
        const auto* rel = rels.findById(info.rel_id);
        if (!rel) {
            READER_ERROR("Sheet '{}' refers to missing relationship '{}'", info.name, info.rel_id);
            return core::ErrorCode::InvalidWorksheet;
        }

        core::Worksheet* worksheet = nullptr;
        try {
            worksheet = &loaded->addWorksheet(info.name);
        } catch (const core::ParameterException& e) {
            READER_ERROR("Cannot add worksheet '{}': {}", info.name, e.what());
            return core::ErrorCode::InvalidWorksheet;
        }

        const std::string sheet_part = resolvePartPath(workbook_part, rel->target);
        result = parseWorksheet(sheet_part, *worksheet);
        if (result != core::ErrorCode::Ok) {
            return result;
        }
    }

    size_t bound = 0;
    for (const auto& name : workbook_parser.getDefinedNames()) {
        if (loaded->addDefinedName(name.name, name.formula, name.local_sheet_id, name.hidden)) {
            ++bound;
        }
    }

    READER_INFO("Loaded workbook: {} sheets, {} named ranges, {} other defined names",
                loaded->getWorksheetCount(), bound, loaded->otherDefinedNames().size());
    workbook = std::move(loaded);
    return core::ErrorCode::Ok;
}

std::string XLSXReader::resolvePartPath(const std::string& source_part, const std::string& target) {
    std::vector<std::string> segments;
    std::string combined;
    if (!target.empty() && target.front() == '/') {
        combined = target.substr(1);
    } else {
        auto slash = source_part.rfind('/');
        combined = (slash == std::string::npos ? std::string() : source_part.substr(0, slash + 1)) + target;
    }

    std::istringstream stream(combined);
    std::string segment;
    while (std::getline(stream, segment, '/')) {
        if (segment.empty() || segment == ".") {
            continue;
        }
        if (segment == "..") {
            if (!segments.empty()) segments.pop_back();
            continue;
        }
        segments.push_back(segment);
    }

    std::string resolved;
    for (const auto& part : segments) {
        if (!resolved.empty()) resolved.push_back('/');
        resolved += part;
    }
    return resolved;
}

std::string XLSXReader::relationshipsPathFor(const std::string& part_path) {
    auto slash = part_path.rfind('/');
    if (slash == std::string::npos) {
        return "_rels/" + part_path + ".rels";
    }
    return part_path.substr(0, slash + 1) + "_rels/" + part_path.substr(slash + 1) + ".rels";
}

core::ErrorCode XLSXReader::extractPart(const std::string& path, std::string& content) {
    auto error = zip_reader_->extractFile(path, content);
    if (archive::isError(error)) {
        READER_ERROR("Failed to extract part '{}': {}", path, archive::toString(error));
        return error == archive::ZipError::FileNotFound ? core::ErrorCode::FileNotFound
                                                        : core::ErrorCode::ZipError;
    }
    READER_DEBUG("Extracted part {} ({} bytes)", path, content.size());
    return core::ErrorCode::Ok;
}

std::string XLSXReader::locateWorkbookPart() {
    if (!zip_reader_->hasFile(kPackageRels)) {
        return kDefaultWorkbookPart;
    }
    std::string xml;
    if (extractPart(kPackageRels, xml) != core::ErrorCode::Ok) {
        return kDefaultWorkbookPart;
    }
    RelationshipsParser parser;
    if (!parser.parse(xml)) {
        READER_WARN("Cannot parse package relationships, assuming {}", kDefaultWorkbookPart);
        return kDefaultWorkbookPart;
    }
    auto documents = parser.findByTypeSuffix("/officeDocument");
    if (documents.empty()) {
        return kDefaultWorkbookPart;
    }
    return resolvePartPath("", documents.front()->target);
}

core::ErrorCode XLSXReader::parseSharedStrings(const std::string& workbook_part, const RelationshipsParser& rels) {
    shared_strings_.clear();

    auto targets = rels.findByTypeSuffix("/sharedStrings");
    if (targets.empty()) {
        READER_DEBUG("Workbook has no shared strings part");
        return core::ErrorCode::Ok;
    }

    std::string xml;
    const std::string part = resolvePartPath(workbook_part, targets.front()->target);
    auto result = extractPart(part, xml);
    if (result != core::ErrorCode::Ok) {
        return core::ErrorCode::CorruptedSharedStrings;
    }

    SharedStringsParser parser;
    if (!parser.parse(xml)) {
        READER_ERROR("Failed to parse shared strings: {}", parser.getErrorMessage());
        return core::ErrorCode::CorruptedSharedStrings;
    }
    shared_strings_ = parser.releaseStrings();
    return core::ErrorCode::Ok;
}

core::ErrorCode XLSXReader::parseWorksheet(const std::string& part_path, core::Worksheet& worksheet) {
    std::string xml;
    auto result = extractPart(part_path, xml);
    if (result != core::ErrorCode::Ok) {
        return core::ErrorCode::InvalidWorksheet;
    }

    WorksheetParser parser(worksheet, shared_strings_);
    if (!parser.parse(xml)) {
        READER_ERROR("Failed to parse worksheet '{}': {}", worksheet.getName(), parser.getErrorMessage());
        return core::ErrorCode::XmlParseError;
    }
    READER_DEBUG("Parsed worksheet '{}': {} cells", worksheet.getName(), parser.getCellsParsed());

    if (parser.getTableRelationshipIds().empty()) {
        return core::ErrorCode::Ok;
    }
    return parseTables(part_path, parser.getTableRelationshipIds(), worksheet);
}

core::ErrorCode XLSXReader::parseTables(const std::string& sheet_part, const std::vector<std::string>& rel_ids,
                                        core::Worksheet& worksheet) {
    std::string rels_xml;
    if (extractPart(relationshipsPathFor(sheet_part), rels_xml) != core::ErrorCode::Ok) {
        return core::ErrorCode::InvalidWorksheet;
    }
    RelationshipsParser rels;
    if (!rels.parse(rels_xml)) {
        return core::ErrorCode::XmlParseError;
    }

    for (const auto& rel_id : rel_ids) {
        const auto* rel = rels.findById(rel_id);
        if (!rel) {
            READER_WARN("Sheet '{}' references missing table relationship '{}'", worksheet.getName(), rel_id);
            continue;
        }

        std::string table_xml;
        const std::string table_part = resolvePartPath(sheet_part, rel->target);
        if (extractPart(table_part, table_xml) != core::ErrorCode::Ok) {
            return core::ErrorCode::InvalidWorksheet;
        }

        TableParser parser;
        if (!parser.parse(table_xml)) {
            READER_ERROR("Failed to parse table part {}: {}", table_part, parser.getErrorMessage());
            return core::ErrorCode::XmlParseError;
        }
        auto& table = worksheet.addTable(parser.releaseTable());
        READER_DEBUG("Loaded table '{}' at {} on sheet '{}'", table.name, table.ref.toReference(),
                     worksheet.getName());
    }
    return core::ErrorCode::Ok;
}

}} // namespace excelpipe::reader
