#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

#include "errors.hpp"
#include "schema.hpp"

namespace partbuf
{

template <typename T>
struct element_type_of;
template <>
struct element_type_of<std::int8_t> { static constexpr ElementType value = ElementType::Int8; };
template <>
struct element_type_of<std::uint8_t> { static constexpr ElementType value = ElementType::Uint8; };
template <>
struct element_type_of<std::int16_t> { static constexpr ElementType value = ElementType::Int16; };
template <>
struct element_type_of<std::uint16_t> { static constexpr ElementType value = ElementType::Uint16; };
template <>
struct element_type_of<std::int32_t> { static constexpr ElementType value = ElementType::Int32; };
template <>
struct element_type_of<std::uint32_t> { static constexpr ElementType value = ElementType::Uint32; };
template <>
struct element_type_of<float> { static constexpr ElementType value = ElementType::Float32; };
template <>
struct element_type_of<double> { static constexpr ElementType value = ElementType::Float64; };

// Non-owning, fixed-length view of one property column inside a buffer.
// Numeric stores convert the way typed arrays do: integers truncate and wrap,
// uint8_clamped rounds half to even and saturates, float32 narrows.
class ColumnView
{
public:
    ColumnView() noexcept : base_(nullptr), offset_(0), length_(0), type_(ElementType::Uint8) {}

    // A view of length elements of type starting at base + byte_offset.
    ColumnView(std::byte *base, std::uint32_t byte_offset, std::uint32_t length, ElementType type) noexcept
        : base_(base), offset_(byte_offset), length_(length), type_(type) {}

    ElementType type() const noexcept { return type_; }
    std::uint32_t length() const noexcept { return length_; }
    std::uint32_t width() const noexcept { return element_width(type_); }
    // Offset from the start of the owning buffer.
    std::uint32_t byte_offset() const noexcept { return offset_; }
    std::uint32_t byte_length() const noexcept { return length_ * width(); }
    bool empty() const noexcept { return length_ == 0; }

    std::byte *bytes() noexcept { return base_ + offset_; }
    const std::byte *bytes() const noexcept { return base_ + offset_; }

    // Bounds-checked element access; throws std::out_of_range.
    double get(std::uint32_t i) const;
    void set(std::uint32_t i, double v);

    double operator[](std::uint32_t i) const { return get(i); }

    void fill(double v) noexcept;

    // Typed access to the raw column; T must match the element type
    // (uint8_t also matches uint8_clamped). Throws TypeError otherwise.
    template <typename T>
    T *as()
    {
        check_type_<T>();
        return reinterpret_cast<T *>(bytes());
    }
    template <typename T>
    const T *as() const
    {
        check_type_<T>();
        return reinterpret_cast<const T *>(bytes());
    }

private:
    template <typename T>
    void check_type_() const
    {
        constexpr ElementType want = element_type_of<T>::value;
        if (want != type_ && !(want == ElementType::Uint8 && type_ == ElementType::Uint8Clamped))
            throw TypeError(std::string("column holds ") + element_type_name(type_) + ", not " +
                            element_type_name(want));
    }

    void bounds_check_(std::uint32_t i) const;

    std::byte *base_;
    std::uint32_t offset_;
    std::uint32_t length_;
    ElementType type_;
};

// Raw element load/store with typed-array conversion rules.
double load_element(ElementType t, const std::byte *p) noexcept;
void store_element(ElementType t, std::byte *p, double v) noexcept;

} // namespace partbuf
