#pragma once
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace partbuf
{

// The element types a property column can hold.
enum class ElementType : std::uint8_t
{
    Int8,
    Uint8,
    Uint8Clamped,
    Int16,
    Uint16,
    Int32,
    Uint32,
    Float32,
    Float64
};

constexpr std::uint32_t element_width(ElementType t) noexcept
{
    switch (t)
    {
    case ElementType::Int8:
    case ElementType::Uint8:
    case ElementType::Uint8Clamped:
        return 1;
    case ElementType::Int16:
    case ElementType::Uint16:
        return 2;
    case ElementType::Int32:
    case ElementType::Uint32:
    case ElementType::Float32:
        return 4;
    case ElementType::Float64:
        return 8;
    }
    return 0;
}

const char *element_type_name(ElementType t) noexcept;

// True if v can be stored exactly as an initial value of type t:
// integers must be integral and in range, floats must not be NaN.
bool is_valid_value(ElementType t, double v) noexcept;

struct SchemaProperty
{
    std::string name;
    ElementType type;
    std::optional<double> initial; // absent means 0
};

// Ordered list of properties making up one row of a partition.
class Schema
{
public:
    using const_iterator = std::vector<SchemaProperty>::const_iterator;

    Schema() = default;
    Schema(std::initializer_list<SchemaProperty> props) : props_(props) {}

    Schema &add(std::string name, ElementType type)
    {
        props_.push_back(SchemaProperty{std::move(name), type, std::nullopt});
        return *this;
    }
    Schema &add(std::string name, ElementType type, double initial)
    {
        props_.push_back(SchemaProperty{std::move(name), type, initial});
        return *this;
    }

    const std::vector<SchemaProperty> &properties() const noexcept { return props_; }
    std::size_t size() const noexcept { return props_.size(); }
    bool empty() const noexcept { return props_.empty(); }
    const_iterator begin() const noexcept { return props_.begin(); }
    const_iterator end() const noexcept { return props_.end(); }

    const SchemaProperty *find(std::string_view name) const noexcept;

    // Non-empty, unique valid property names, representable initial values.
    bool is_valid() const { return !first_problem().has_value(); }

    // Throws ValidationError describing the first problem found.
    void validate() const;

private:
    std::optional<std::string> first_problem() const;

    std::vector<SchemaProperty> props_;
};

// Bytes one row of this schema occupies when laid out in a partition,
// i.e. the per-property alignment rule applied with a single row.
// Throws ValidationError for an invalid schema.
std::uint64_t entity_size(const Schema &schema);

} // namespace partbuf
