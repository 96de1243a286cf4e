/**
 * @file Math.hpp
 * @brief Element-wise operators and fills for tensors.
 *
 * All operations run on the calling thread's current queue and return
 * without waiting for it. Binary operators require operands of identical
 * shape; there is no broadcasting.
 */

#ifndef STRATUM_MATH_HPP
#define STRATUM_MATH_HPP

#include <cstdint>
#include <vector>

#include "Tensor.hpp"

namespace stratum
{

/**
 * @brief Element-wise addition.
 *
 * The result is a new dense tensor in the element order of @p a.
 *
 * @throws validation_error if the shapes differ.
 */
template <typename value_t>
Tensor<value_t> operator+(const Tensor<value_t>& a, const Tensor<value_t>& b);
/// Explicit instantiation of operator+ for float
extern template Tensor<float> operator+
    (const Tensor<float>&, const Tensor<float>&);
/// Explicit instantiation of operator+ for double
extern template Tensor<double> operator+
    (const Tensor<double>&, const Tensor<double>&);
/// Explicit instantiation of operator+ for int32_t
extern template Tensor<int32_t> operator+
    (const Tensor<int32_t>&, const Tensor<int32_t>&);

/**
 * @brief Element-wise subtraction.
 * @throws validation_error if the shapes differ.
 */
template <typename value_t>
Tensor<value_t> operator-(const Tensor<value_t>& a, const Tensor<value_t>& b);
/// Explicit instantiation of operator- for float
extern template Tensor<float> operator-
    (const Tensor<float>&, const Tensor<float>&);
/// Explicit instantiation of operator- for double
extern template Tensor<double> operator-
    (const Tensor<double>&, const Tensor<double>&);
/// Explicit instantiation of operator- for int32_t
extern template Tensor<int32_t> operator-
    (const Tensor<int32_t>&, const Tensor<int32_t>&);

/**
 * @brief Element-wise multiplication.
 * @throws validation_error if the shapes differ.
 */
template <typename value_t>
Tensor<value_t> operator*(const Tensor<value_t>& a, const Tensor<value_t>& b);
/// Explicit instantiation of operator* for float
extern template Tensor<float> operator*
    (const Tensor<float>&, const Tensor<float>&);
/// Explicit instantiation of operator* for double
extern template Tensor<double> operator*
    (const Tensor<double>&, const Tensor<double>&);
/// Explicit instantiation of operator* for int32_t
extern template Tensor<int32_t> operator*
    (const Tensor<int32_t>&, const Tensor<int32_t>&);

/**
 * @brief Element-wise division.
 *
 * Floating point division by zero follows IEEE rules; integer division
 * by zero is undefined.
 *
 * @throws validation_error if the shapes differ.
 */
template <typename value_t>
Tensor<value_t> operator/(const Tensor<value_t>& a, const Tensor<value_t>& b);
/// Explicit instantiation of operator/ for float
extern template Tensor<float> operator/
    (const Tensor<float>&, const Tensor<float>&);
/// Explicit instantiation of operator/ for double
extern template Tensor<double> operator/
    (const Tensor<double>&, const Tensor<double>&);
/// Explicit instantiation of operator/ for int32_t
extern template Tensor<int32_t> operator/
    (const Tensor<int32_t>&, const Tensor<int32_t>&);

/**
 * @brief Element-wise negation.
 */
template <typename value_t>
Tensor<value_t> operator-(const Tensor<value_t>& a);
/// Explicit instantiation of unary operator- for float
extern template Tensor<float> operator-(const Tensor<float>&);
/// Explicit instantiation of unary operator- for double
extern template Tensor<double> operator-(const Tensor<double>&);
/// Explicit instantiation of unary operator- for int32_t
extern template Tensor<int32_t> operator-(const Tensor<int32_t>&);

} // namespace stratum

namespace stratum::math
{

/**
 * @brief Element-wise absolute value.
 */
template <typename value_t>
Tensor<value_t> abs(const Tensor<value_t>& x);
/// Explicit instantiation of abs for float
extern template Tensor<float> abs<float>(const Tensor<float>&);
/// Explicit instantiation of abs for double
extern template Tensor<double> abs<double>(const Tensor<double>&);
/// Explicit instantiation of abs for int32_t
extern template Tensor<int32_t> abs<int32_t>(const Tensor<int32_t>&);

/**
 * @brief Element-wise square root.
 */
template <typename value_t>
Tensor<value_t> sqrt(const Tensor<value_t>& x);
/// Explicit instantiation of sqrt for float
extern template Tensor<float> sqrt<float>(const Tensor<float>&);
/// Explicit instantiation of sqrt for double
extern template Tensor<double> sqrt<double>(const Tensor<double>&);

/**
 * @brief Element-wise natural exponential.
 */
template <typename value_t>
Tensor<value_t> exp(const Tensor<value_t>& x);
/// Explicit instantiation of exp for float
extern template Tensor<float> exp<float>(const Tensor<float>&);
/// Explicit instantiation of exp for double
extern template Tensor<double> exp<double>(const Tensor<double>&);

/**
 * @brief Fused multiply-add: `a * b + c` in one ternary pass.
 * @throws validation_error if the shapes differ.
 */
template <typename value_t>
Tensor<value_t> fma(const Tensor<value_t>& a,
                    const Tensor<value_t>& b,
                    const Tensor<value_t>& c);
/// Explicit instantiation of fma for float
extern template Tensor<float> fma<float>
    (const Tensor<float>&, const Tensor<float>&, const Tensor<float>&);
/// Explicit instantiation of fma for double
extern template Tensor<double> fma<double>
    (const Tensor<double>&, const Tensor<double>&, const Tensor<double>&);
/// Explicit instantiation of fma for int32_t
extern template Tensor<int32_t> fma<int32_t>
    (const Tensor<int32_t>&, const Tensor<int32_t>&, const Tensor<int32_t>&);

/**
 * @brief Select elements: `condition ? y : x`.
 * @throws validation_error if the shapes differ.
 */
template <typename value_t>
Tensor<value_t> replace(const Tensor<value_t>& x,
                        const Tensor<value_t>& y,
                        const Tensor<bool>& condition);
/// Explicit instantiation of replace for float
extern template Tensor<float> replace<float>
    (const Tensor<float>&, const Tensor<float>&, const Tensor<bool>&);
/// Explicit instantiation of replace for double
extern template Tensor<double> replace<double>
    (const Tensor<double>&, const Tensor<double>&, const Tensor<bool>&);
/// Explicit instantiation of replace for int32_t
extern template Tensor<int32_t> replace<int32_t>
    (const Tensor<int32_t>&, const Tensor<int32_t>&, const Tensor<bool>&);

/**
 * @brief Element-wise `a > b`.
 * @throws validation_error if the shapes differ.
 */
template <typename value_t>
Tensor<bool> greater(const Tensor<value_t>& a, const Tensor<value_t>& b);
/// Explicit instantiation of greater for float
extern template Tensor<bool> greater<float>
    (const Tensor<float>&, const Tensor<float>&);
/// Explicit instantiation of greater for double
extern template Tensor<bool> greater<double>
    (const Tensor<double>&, const Tensor<double>&);
/// Explicit instantiation of greater for int32_t
extern template Tensor<bool> greater<int32_t>
    (const Tensor<int32_t>&, const Tensor<int32_t>&);

/**
 * @brief Sets every element of @p t to @p value.
 */
template <typename value_t>
void fill(Tensor<value_t>& t, value_t value);
/// Explicit instantiation of fill for float
extern template void fill<float>(Tensor<float>&, float);
/// Explicit instantiation of fill for double
extern template void fill<double>(Tensor<double>&, double);
/// Explicit instantiation of fill for int32_t
extern template void fill<int32_t>(Tensor<int32_t>&, int32_t);
/// Explicit instantiation of fill for bool
extern template void fill<bool>(Tensor<bool>&, bool);

/**
 * @brief Fills @p t with `start, start + step, ...` in logical
 * row-major order.
 */
template <typename value_t>
void fill_with_index(Tensor<value_t>& t,
                     value_t start = value_t(0),
                     value_t step = value_t(1));
/// Explicit instantiation of fill_with_index for float
extern template void fill_with_index<float>(Tensor<float>&, float, float);
/// Explicit instantiation of fill_with_index for double
extern template void fill_with_index<double>(Tensor<double>&, double, double);
/// Explicit instantiation of fill_with_index for int32_t
extern template void fill_with_index<int32_t>
    (Tensor<int32_t>&, int32_t, int32_t);

/**
 * @brief Copies the elements of @p from into @p to, logical index for
 * logical index, whatever their layouts.
 *
 * @throws validation_error if the shapes differ.
 */
template <typename value_t>
void copy(const Tensor<value_t>& from, Tensor<value_t>& to);
/// Explicit instantiation of copy for float
extern template void copy<float>(const Tensor<float>&, Tensor<float>&);
/// Explicit instantiation of copy for double
extern template void copy<double>(const Tensor<double>&, Tensor<double>&);
/// Explicit instantiation of copy for int32_t
extern template void copy<int32_t>(const Tensor<int32_t>&, Tensor<int32_t>&);
/// Explicit instantiation of copy for bool
extern template void copy<bool>(const Tensor<bool>&, Tensor<bool>&);

/**
 * @brief Tensor of @p shape drawn uniformly from `[lower, upper)`.
 *
 * Seeded from the Platform seed sequence, so a fixed configured seed
 * reproduces the same tensors in the same call order.
 *
 * @throws validation_error if `lower >= upper`.
 */
template <typename value_t>
Tensor<value_t> random_uniform(const std::vector<uint64_t>& shape,
                               value_t lower = value_t(0),
                               value_t upper = value_t(1));
/// Explicit instantiation of random_uniform for float
extern template Tensor<float> random_uniform<float>
    (const std::vector<uint64_t>&, float, float);
/// Explicit instantiation of random_uniform for double
extern template Tensor<double> random_uniform<double>
    (const std::vector<uint64_t>&, double, double);

/**
 * @brief Tensor of @p shape drawn from a normal distribution.
 * @throws validation_error if @p stddev is not positive.
 */
template <typename value_t>
Tensor<value_t> random_normal(const std::vector<uint64_t>& shape,
                              value_t mean = value_t(0),
                              value_t stddev = value_t(1));
/// Explicit instantiation of random_normal for float
extern template Tensor<float> random_normal<float>
    (const std::vector<uint64_t>&, float, float);
/// Explicit instantiation of random_normal for double
extern template Tensor<double> random_normal<double>
    (const std::vector<uint64_t>&, double, double);

/**
 * @brief Dense tensor of ones with the shape and order of @p like.
 */
template <typename value_t>
Tensor<value_t> ones_like(const Tensor<value_t>& like);
/// Explicit instantiation of ones_like for float
extern template Tensor<float> ones_like<float>(const Tensor<float>&);
/// Explicit instantiation of ones_like for double
extern template Tensor<double> ones_like<double>(const Tensor<double>&);
/// Explicit instantiation of ones_like for int32_t
extern template Tensor<int32_t> ones_like<int32_t>(const Tensor<int32_t>&);

/**
 * @brief Dense tensor of zeros with the shape and order of @p like.
 */
template <typename value_t>
Tensor<value_t> zeros_like(const Tensor<value_t>& like);
/// Explicit instantiation of zeros_like for float
extern template Tensor<float> zeros_like<float>(const Tensor<float>&);
/// Explicit instantiation of zeros_like for double
extern template Tensor<double> zeros_like<double>(const Tensor<double>&);
/// Explicit instantiation of zeros_like for int32_t
extern template Tensor<int32_t> zeros_like<int32_t>(const Tensor<int32_t>&);

} // namespace stratum::math

#endif // STRATUM_MATH_HPP
