#include "column_view.hpp"

#include <cmath>
#include <cstring>
#include <stdexcept>
#include <string>

namespace partbuf
{

namespace
{

// ToUint32-style modular conversion; the narrower integer types take the low bits.
std::uint32_t wrap_u32(double v) noexcept
{
    if (!std::isfinite(v))
        return 0;
    double m = std::fmod(std::trunc(v), 4294967296.0);
    if (m < 0)
        m += 4294967296.0;
    return static_cast<std::uint32_t>(m);
}

std::uint8_t clamp_u8(double v) noexcept
{
    if (std::isnan(v) || v <= 0.0)
        return 0;
    if (v >= 255.0)
        return 255;
    return static_cast<std::uint8_t>(std::nearbyint(v));
}

template <typename T>
T load_as(const std::byte *p) noexcept
{
    T x;
    std::memcpy(&x, p, sizeof x);
    return x;
}

template <typename T>
void store_as(std::byte *p, T x) noexcept
{
    std::memcpy(p, &x, sizeof x);
}

} // namespace

double load_element(ElementType t, const std::byte *p) noexcept
{
    switch (t)
    {
    case ElementType::Int8:
        return load_as<std::int8_t>(p);
    case ElementType::Uint8:
    case ElementType::Uint8Clamped:
        return load_as<std::uint8_t>(p);
    case ElementType::Int16:
        return load_as<std::int16_t>(p);
    case ElementType::Uint16:
        return load_as<std::uint16_t>(p);
    case ElementType::Int32:
        return load_as<std::int32_t>(p);
    case ElementType::Uint32:
        return load_as<std::uint32_t>(p);
    case ElementType::Float32:
        return load_as<float>(p);
    case ElementType::Float64:
        return load_as<double>(p);
    }
    return 0.0;
}

void store_element(ElementType t, std::byte *p, double v) noexcept
{
    switch (t)
    {
    case ElementType::Int8:
        store_as(p, static_cast<std::int8_t>(wrap_u32(v) & 0xffu));
        break;
    case ElementType::Uint8:
        store_as(p, static_cast<std::uint8_t>(wrap_u32(v) & 0xffu));
        break;
    case ElementType::Uint8Clamped:
        store_as(p, clamp_u8(v));
        break;
    case ElementType::Int16:
        store_as(p, static_cast<std::int16_t>(wrap_u32(v) & 0xffffu));
        break;
    case ElementType::Uint16:
        store_as(p, static_cast<std::uint16_t>(wrap_u32(v) & 0xffffu));
        break;
    case ElementType::Int32:
        store_as(p, static_cast<std::int32_t>(wrap_u32(v)));
        break;
    case ElementType::Uint32:
        store_as(p, wrap_u32(v));
        break;
    case ElementType::Float32:
        store_as(p, static_cast<float>(v));
        break;
    case ElementType::Float64:
        store_as(p, v);
        break;
    }
}

void ColumnView::bounds_check_(std::uint32_t i) const
{
    if (i >= length_)
        throw std::out_of_range("ColumnView index " + std::to_string(i) + " >= length " +
                                std::to_string(length_));
}

double ColumnView::get(std::uint32_t i) const
{
    bounds_check_(i);
    return load_element(type_, bytes() + static_cast<std::size_t>(i) * width());
}

void ColumnView::set(std::uint32_t i, double v)
{
    bounds_check_(i);
    store_element(type_, bytes() + static_cast<std::size_t>(i) * width(), v);
}

void ColumnView::fill(double v) noexcept
{
    if (length_ == 0)
        return;
    if (v == 0.0)
    {
        std::memset(bytes(), 0, byte_length());
        return;
    }
    // Encode once, then replicate the element pattern.
    std::uint32_t w = width();
    std::byte *p = bytes();
    store_element(type_, p, v);
    for (std::uint32_t i = 1; i < length_; ++i)
        std::memcpy(p + static_cast<std::size_t>(i) * w, p, w);
}

} // namespace partbuf
