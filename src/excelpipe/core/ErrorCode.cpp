#include "excelpipe/core/ErrorCode.hpp"

namespace excelpipe {
namespace core {

Error::Error(ErrorCode c) : code(c), message(toString(c)) {}

const char* toString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok:                     return "Success";

        // 通用错误
        case ErrorCode::InvalidArgument:        return "Invalid argument";
        case ErrorCode::InternalError:          return "Internal error";

        // 文件操作错误
        case ErrorCode::FileNotFound:           return "File not found";
        case ErrorCode::FileAccessDenied:       return "File access denied";
        case ErrorCode::FileCorrupted:          return "File corrupted";
        case ErrorCode::FileWriteError:         return "File write error";
        case ErrorCode::FileReadError:          return "File read error";

        // Excel结构错误
        case ErrorCode::InvalidWorkbook:        return "Invalid workbook";
        case ErrorCode::InvalidWorksheet:       return "Invalid worksheet";
        case ErrorCode::CorruptedSharedStrings: return "Corrupted shared strings";

        // ZIP/XML处理错误
        case ErrorCode::ZipError:               return "ZIP error";
        case ErrorCode::XmlParseError:          return "XML parse error";
        case ErrorCode::XmlInvalidFormat:       return "Invalid XML format";
        case ErrorCode::XmlMissingElement:      return "Missing XML element";

        // 视图访问
        case ErrorCode::ColumnNotFound:         return "Column not found";
        case ErrorCode::TableNotFound:          return "Table not found";
        case ErrorCode::RangeNotFound:          return "Named range not found";
        case ErrorCode::EnumLabelNotFound:      return "Enum label not found";
        case ErrorCode::RowOutOfRange:          return "Row out of range";
        case ErrorCode::InvalidCellValue:       return "Invalid cell value";
        case ErrorCode::StructuralGrowthFailed: return "Structural growth failed";
        case ErrorCode::DuplicateName:          return "Duplicate name";

        // 配方索引
        case ErrorCode::DuplicateRecipe:        return "Duplicate recipe";
        case ErrorCode::NoIngredients:          return "No ingredients";
        case ErrorCode::ProductNotFound:        return "Product not found";
        case ErrorCode::TooManyIngredients:     return "Too many ingredients";

        default:                                return "Unknown error";
    }
}

}} // namespace excelpipe::core
