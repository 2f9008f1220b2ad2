#include "schema.hpp"

#include <cmath>
#include <unordered_set>

#include "align.hpp"
#include "errors.hpp"
#include "names.hpp"

namespace partbuf
{

namespace
{

bool integral_in(double v, double lo, double hi)
{
    return std::trunc(v) == v && v >= lo && v <= hi;
}

} // namespace

const char *element_type_name(ElementType t) noexcept
{
    switch (t)
    {
    case ElementType::Int8:
        return "int8";
    case ElementType::Uint8:
        return "uint8";
    case ElementType::Uint8Clamped:
        return "uint8_clamped";
    case ElementType::Int16:
        return "int16";
    case ElementType::Uint16:
        return "uint16";
    case ElementType::Int32:
        return "int32";
    case ElementType::Uint32:
        return "uint32";
    case ElementType::Float32:
        return "float32";
    case ElementType::Float64:
        return "float64";
    }
    return "unknown";
}

bool is_valid_value(ElementType t, double v) noexcept
{
    if (std::isnan(v))
        return false;
    switch (t)
    {
    case ElementType::Int8:
        return integral_in(v, -128.0, 127.0);
    case ElementType::Uint8:
    case ElementType::Uint8Clamped:
        return integral_in(v, 0.0, 255.0);
    case ElementType::Int16:
        return integral_in(v, -32768.0, 32767.0);
    case ElementType::Uint16:
        return integral_in(v, 0.0, 65535.0);
    case ElementType::Int32:
        return integral_in(v, -2147483648.0, 2147483647.0);
    case ElementType::Uint32:
        return integral_in(v, 0.0, 4294967295.0);
    case ElementType::Float32:
    case ElementType::Float64:
        return true;
    }
    return false;
}

const SchemaProperty *Schema::find(std::string_view name) const noexcept
{
    for (const auto &p : props_)
        if (p.name == name)
            return &p;
    return nullptr;
}

std::optional<std::string> Schema::first_problem() const
{
    if (props_.empty())
        return std::string("schema has no properties");
    std::unordered_set<std::string_view> seen;
    for (const auto &p : props_)
    {
        if (!is_valid_name(p.name))
            return "invalid property name '" + p.name + "'";
        if (!seen.insert(p.name).second)
            return "duplicate property name '" + p.name + "'";
        if (element_width(p.type) == 0)
            return "property '" + p.name + "' has an unknown element type";
        if (p.initial && !is_valid_value(p.type, *p.initial))
            return "initial value " + std::to_string(*p.initial) + " of property '" + p.name +
                   "' is not representable as " + element_type_name(p.type);
    }
    return std::nullopt;
}

void Schema::validate() const
{
    if (auto problem = first_problem())
        throw ValidationError(*problem);
}

std::uint64_t entity_size(const Schema &schema)
{
    schema.validate();
    std::uint64_t size = 0;
    std::uint64_t max_align = MIN_ALIGNMENT;
    for (const auto &p : schema)
    {
        std::uint32_t w = element_width(p.type);
        std::uint32_t a = element_alignment(w);
        size = align_up(size, a) + w;
        if (a > max_align)
            max_align = a;
    }
    return align_up(size, max_align);
}

} // namespace partbuf
