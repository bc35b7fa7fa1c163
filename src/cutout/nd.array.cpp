#include "macros.hh"
#include "nd.array.hh"

#include <sstream>

dvid::NdArray::NdArray()
  : dtype_{ DvidDataType_uint8 }
{
}

dvid::NdArray::NdArray(std::vector<size_t> shape, DvidDataType dtype)
  : shape_{ std::move(shape) }
  , dtype_{ dtype }
  , data_(product(shape_) * bytes_of_type(dtype), std::byte{ 0 })
{
}

dvid::NdArray::NdArray(std::vector<size_t> shape,
                       DvidDataType dtype,
                       std::vector<std::byte>&& data)
  : shape_{ std::move(shape) }
  , dtype_{ dtype }
  , data_{ std::move(data) }
{
    EXPECT_AS(ShapeMismatchError,
              data_.size() == product(shape_) * bytes_of_type(dtype_),
              "Buffer of ",
              data_.size(),
              " bytes does not match shape ",
              format_shape(shape_),
              " of ",
              data_type_to_string(dtype_));
}

size_t
dvid::NdArray::size() const noexcept
{
    return product(shape_);
}

size_t
dvid::NdArray::flat_index(const std::vector<size_t>& index) const
{
    EXPECT_AS(BoundsError,
              index.size() == shape_.size(),
              "Index has ",
              index.size(),
              " dimensions, but the array has ",
              shape_.size());

    size_t offset = 0;
    for (size_t i = 0; i < shape_.size(); ++i) {
        EXPECT_AS(BoundsError,
                  index[i] < shape_[i],
                  "Index ",
                  index[i],
                  " is out of range for axis ",
                  i,
                  " of size ",
                  shape_[i]);
        offset = offset * shape_[i] + index[i];
    }
    return offset;
}

dvid::NdArray
dvid::NdArray::reshaped(std::vector<size_t> shape) &&
{
    EXPECT_AS(ShapeMismatchError,
              product(shape) == size(),
              "Cannot reshape array of shape ",
              format_shape(shape_),
              " to ",
              format_shape(shape));

    return { std::move(shape), dtype_, std::move(data_) };
}

bool
dvid::NdArray::operator==(const NdArray& other) const
{
    return shape_ == other.shape_ && dtype_ == other.dtype_ &&
           data_ == other.data_;
}

void
dvid::NdArray::check_dtype_(DvidDataType requested) const
{
    EXPECT_AS(DtypeMismatchError,
              requested == dtype_,
              "Requested elements of type ",
              data_type_to_string(requested),
              " from an array of ",
              data_type_to_string(dtype_));
}

std::string
dvid::format_shape(const std::vector<size_t>& shape)
{
    std::ostringstream ss;
    ss << "(";
    for (size_t i = 0; i < shape.size(); ++i) {
        ss << (i > 0 ? ", " : "") << shape[i];
    }
    ss << ")";
    return ss.str();
}
