#pragma once

#include <string>
#include <string_view>
#include <optional>
#include <variant>
#include <cstdint>
#include <cmath>
#include <limits>
#include <type_traits>

namespace excelpipe {
namespace core {

enum class CellType : uint8_t {
    Empty = 0,
    Number = 1,
    String = 2,
    Boolean = 3,
    Error = 4    // #N/A、#REF! 等错误值，保存原文
};

/**
 * @brief 单元格原始值
 *
 * 只保存值本身和可选的公式文本；公式不求值，读取时使用缓存结果。
 */
class Cell {
public:
    Cell() = default;
    explicit Cell(double value) : value_(value) {}
    explicit Cell(int value) : value_(static_cast<double>(value)) {}
    explicit Cell(bool value) : value_(value) {}
    explicit Cell(const std::string& value) : value_(value) {}
    explicit Cell(const char* value) : value_(std::string(value ? value : "")) {}

    static Cell makeError(const std::string& error_text);

    CellType getType() const;

    bool isEmpty() const { return getType() == CellType::Empty; }
    bool isNumber() const { return getType() == CellType::Number; }
    bool isString() const { return getType() == CellType::String; }
    bool isBoolean() const { return getType() == CellType::Boolean; }
    bool isError() const { return is_error_; }

    /**
     * @brief 空单元格或只含空白的字符串
     */
    bool isBlank() const;

    // 公式（仅保留文本，不参与计算）
    void setFormula(const std::string& formula) { formula_ = formula; }
    const std::string& getFormula() const { return formula_; }
    bool hasFormula() const { return !formula_.empty(); }

    double getNumberValue() const;
    bool getBooleanValue() const;
    const std::string& getStringValue() const;

    /**
     * @brief 渲染成文本：数字用最短表示，布尔为 TRUE/FALSE，空单元格为空串
     */
    std::string toText() const;

    /**
     * @brief 按目标类型转换
     *
     * 空单元格和无法转换时返回 std::nullopt；
     * 数字转整数时四舍五入，字符串转数字使用 fast_float。
     */
    template<typename T>
    std::optional<T> tryGetValue() const {
        if (isEmpty()) {
            return std::nullopt;
        }
        if constexpr (std::is_same_v<T, std::string>) {
            return toText();
        } else if constexpr (std::is_same_v<T, bool>) {
            return tryAsBoolean();
        } else if constexpr (std::is_floating_point_v<T>) {
            auto number = tryAsNumber();
            if (!number) return std::nullopt;
            return static_cast<T>(*number);
        } else if constexpr (std::is_integral_v<T>) {
            auto number = tryAsNumber();
            if (!number || !std::isfinite(*number)) return std::nullopt;
            double rounded = std::round(*number);
            // 上界取 2^digits（不含），max() 转成 double 时可能向上舍入
            if (rounded < static_cast<double>(std::numeric_limits<T>::lowest()) ||
                rounded >= std::ldexp(1.0, std::numeric_limits<T>::digits)) {
                return std::nullopt;
            }
            return static_cast<T>(rounded);
        } else {
            static_assert(std::is_same_v<T, std::string>,
                          "Unsupported type for Cell::tryGetValue<T>()");
        }
    }

    template<typename T>
    T getValueOr(const T& default_value) const {
        return tryGetValue<T>().value_or(default_value);
    }

    /**
     * @brief 写入值，同时清除公式；空字符串等价于清空单元格
     */
    template<typename T>
    void setValue(const T& value) {
        formula_.clear();
        is_error_ = false;
        if constexpr (std::is_same_v<T, bool>) {
            value_ = value;
        } else if constexpr (std::is_arithmetic_v<T>) {
            value_ = static_cast<double>(value);
        } else if constexpr (std::is_convertible_v<T, std::string_view>) {
            std::string_view text(value);
            if (text.empty()) {
                value_ = std::monostate{};
            } else {
                value_ = std::string(text);
            }
        } else {
            static_assert(std::is_arithmetic_v<T>,
                          "Unsupported type for Cell::setValue<T>()");
        }
    }

    void clear();

    bool operator==(const Cell& other) const {
        return value_ == other.value_ && formula_ == other.formula_ && is_error_ == other.is_error_;
    }
    bool operator!=(const Cell& other) const { return !(*this == other); }

private:
    std::optional<double> tryAsNumber() const;
    std::optional<bool> tryAsBoolean() const;

    std::variant<std::monostate, double, bool, std::string> value_;
    std::string formula_;
    bool is_error_ = false;
};

}} // namespace excelpipe::core
