#pragma once

#include "dvid.common.hh"
#include "errors.hh"

#include <cstddef> // size_t, std::byte
#include <cstdint>
#include <span>
#include <string>
#include <type_traits>
#include <vector>

namespace dvid {
/**
 * @brief Get the data type corresponding to a C++ scalar type.
 */
template<typename T>
constexpr DvidDataType
dtype_of()
{
    if constexpr (std::is_same_v<T, uint8_t>) {
        return DvidDataType_uint8;
    } else if constexpr (std::is_same_v<T, uint16_t>) {
        return DvidDataType_uint16;
    } else if constexpr (std::is_same_v<T, uint32_t>) {
        return DvidDataType_uint32;
    } else if constexpr (std::is_same_v<T, uint64_t>) {
        return DvidDataType_uint64;
    } else if constexpr (std::is_same_v<T, int8_t>) {
        return DvidDataType_int8;
    } else if constexpr (std::is_same_v<T, int16_t>) {
        return DvidDataType_int16;
    } else if constexpr (std::is_same_v<T, int32_t>) {
        return DvidDataType_int32;
    } else if constexpr (std::is_same_v<T, int64_t>) {
        return DvidDataType_int64;
    } else if constexpr (std::is_same_v<T, float>) {
        return DvidDataType_float32;
    } else {
        static_assert(std::is_same_v<T, double>, "Unsupported element type");
        return DvidDataType_float64;
    }
}

/**
 * @brief An owning, row-major N-dimensional array of fixed-width scalars.
 * @details Elements are stored in native byte order. The last axis varies
 * fastest.
 */
class NdArray
{
  public:
    NdArray();

    /** @brief Allocate a zero-filled array. */
    NdArray(std::vector<size_t> shape, DvidDataType dtype);

    /** @brief Take ownership of @p data, which must hold exactly the bytes of
     * @p shape. */
    NdArray(std::vector<size_t> shape,
            DvidDataType dtype,
            std::vector<std::byte>&& data);

    template<typename T>
    static NdArray full(std::vector<size_t> shape, T value)
    {
        NdArray array(std::move(shape), dtype_of<T>());
        for (auto& v : array.values<T>()) {
            v = value;
        }
        return array;
    }

    const std::vector<size_t>& shape() const noexcept { return shape_; }
    DvidDataType dtype() const noexcept { return dtype_; }
    size_t ndims() const noexcept { return shape_.size(); }

    /** @brief The number of elements. */
    size_t size() const noexcept;
    size_t bytes_of_data() const noexcept { return data_.size(); }

    std::span<std::byte> bytes() noexcept { return data_; }
    std::span<const std::byte> bytes() const noexcept { return data_; }

    template<typename T>
    std::span<T> values()
    {
        check_dtype_(dtype_of<T>());
        return { reinterpret_cast<T*>(data_.data()), size() };
    }

    template<typename T>
    std::span<const T> values() const
    {
        check_dtype_(dtype_of<T>());
        return { reinterpret_cast<const T*>(data_.data()), size() };
    }

    template<typename T>
    T& at(const std::vector<size_t>& index)
    {
        return values<T>()[flat_index(index)];
    }

    template<typename T>
    const T& at(const std::vector<size_t>& index) const
    {
        return values<T>()[flat_index(index)];
    }

    /**
     * @brief Compute the row-major element offset of @p index.
     * @throw dvid::BoundsError if the index has the wrong rank or is out of
     * range.
     */
    size_t flat_index(const std::vector<size_t>& index) const;

    /**
     * @brief Reinterpret the array with a new shape of the same element count.
     * @throw dvid::ShapeMismatchError if the element counts differ.
     */
    NdArray reshaped(std::vector<size_t> shape) &&;

    bool operator==(const NdArray& other) const;

  private:
    std::vector<size_t> shape_;
    DvidDataType dtype_;
    std::vector<std::byte> data_;

    void check_dtype_(DvidDataType requested) const;
};

/** @brief Format a shape as "(4, 100, 100, 100)". */
std::string
format_shape(const std::vector<size_t>& shape);
} // namespace dvid
