/**
 * @file Math.cpp
 * @brief Element-wise operator and fill definitions.
 */

#include "stratum/Math.hpp"
#include "stratum/Errors.hpp"
#include "stratum/MapOps.hpp"
#include "stratum/Platform.hpp"

#include <random>
#include <utility>

namespace stratum
{

template <typename value_t>
Tensor<value_t> operator+(const Tensor<value_t>& a, const Tensor<value_t>& b)
{
    Tensor<value_t> result(a.get_shape(), a.get_order());
    map_op(current_queue(), a, b, result,
        [](value_t x, value_t y) { return x + y; });
    return result;
}
template Tensor<float> operator+(const Tensor<float>&, const Tensor<float>&);
template Tensor<double> operator+(const Tensor<double>&, const Tensor<double>&);
template Tensor<int32_t> operator+
    (const Tensor<int32_t>&, const Tensor<int32_t>&);

template <typename value_t>
Tensor<value_t> operator-(const Tensor<value_t>& a, const Tensor<value_t>& b)
{
    Tensor<value_t> result(a.get_shape(), a.get_order());
    map_op(current_queue(), a, b, result,
        [](value_t x, value_t y) { return x - y; });
    return result;
}
template Tensor<float> operator-(const Tensor<float>&, const Tensor<float>&);
template Tensor<double> operator-(const Tensor<double>&, const Tensor<double>&);
template Tensor<int32_t> operator-
    (const Tensor<int32_t>&, const Tensor<int32_t>&);

template <typename value_t>
Tensor<value_t> operator*(const Tensor<value_t>& a, const Tensor<value_t>& b)
{
    Tensor<value_t> result(a.get_shape(), a.get_order());
    map_op(current_queue(), a, b, result,
        [](value_t x, value_t y) { return x * y; });
    return result;
}
template Tensor<float> operator*(const Tensor<float>&, const Tensor<float>&);
template Tensor<double> operator*(const Tensor<double>&, const Tensor<double>&);
template Tensor<int32_t> operator*
    (const Tensor<int32_t>&, const Tensor<int32_t>&);

template <typename value_t>
Tensor<value_t> operator/(const Tensor<value_t>& a, const Tensor<value_t>& b)
{
    Tensor<value_t> result(a.get_shape(), a.get_order());
    map_op(current_queue(), a, b, result,
        [](value_t x, value_t y) { return x / y; });
    return result;
}
template Tensor<float> operator/(const Tensor<float>&, const Tensor<float>&);
template Tensor<double> operator/(const Tensor<double>&, const Tensor<double>&);
template Tensor<int32_t> operator/
    (const Tensor<int32_t>&, const Tensor<int32_t>&);

template <typename value_t>
Tensor<value_t> operator-(const Tensor<value_t>& a)
{
    Tensor<value_t> result(a.get_shape(), a.get_order());
    map_op(current_queue(), a, result, [](value_t x) { return -x; });
    return result;
}
template Tensor<float> operator-(const Tensor<float>&);
template Tensor<double> operator-(const Tensor<double>&);
template Tensor<int32_t> operator-(const Tensor<int32_t>&);

} // namespace stratum

namespace stratum::math
{

template <typename value_t>
Tensor<value_t> abs(const Tensor<value_t>& x)
{
    Tensor<value_t> result(x.get_shape(), x.get_order());
    map_op(current_queue(), x, result,
        [](value_t v) { return v < value_t(0) ? -v : v; });
    return result;
}
template Tensor<float> abs<float>(const Tensor<float>&);
template Tensor<double> abs<double>(const Tensor<double>&);
template Tensor<int32_t> abs<int32_t>(const Tensor<int32_t>&);

template <typename value_t>
Tensor<value_t> sqrt(const Tensor<value_t>& x)
{
    Tensor<value_t> result(x.get_shape(), x.get_order());
    map_op(current_queue(), x, result,
        [](value_t v) { return sycl::sqrt(v); });
    return result;
}
template Tensor<float> sqrt<float>(const Tensor<float>&);
template Tensor<double> sqrt<double>(const Tensor<double>&);

template <typename value_t>
Tensor<value_t> exp(const Tensor<value_t>& x)
{
    Tensor<value_t> result(x.get_shape(), x.get_order());
    map_op(current_queue(), x, result,
        [](value_t v) { return sycl::exp(v); });
    return result;
}
template Tensor<float> exp<float>(const Tensor<float>&);
template Tensor<double> exp<double>(const Tensor<double>&);

template <typename value_t>
Tensor<value_t> fma(const Tensor<value_t>& a,
                    const Tensor<value_t>& b,
                    const Tensor<value_t>& c)
{
    Tensor<value_t> result(a.get_shape(), a.get_order());
    map_op(current_queue(), a, b, c, result,
        [](value_t x, value_t y, value_t z) { return x * y + z; });
    return result;
}
template Tensor<float> fma<float>
    (const Tensor<float>&, const Tensor<float>&, const Tensor<float>&);
template Tensor<double> fma<double>
    (const Tensor<double>&, const Tensor<double>&, const Tensor<double>&);
template Tensor<int32_t> fma<int32_t>
    (const Tensor<int32_t>&, const Tensor<int32_t>&, const Tensor<int32_t>&);

template <typename value_t>
Tensor<value_t> replace(const Tensor<value_t>& x,
                        const Tensor<value_t>& y,
                        const Tensor<bool>& condition)
{
    Tensor<value_t> result(x.get_shape(), x.get_order());
    map_op(current_queue(), x, y, condition, result,
        [](value_t a, value_t b, bool c) { return c ? b : a; });
    return result;
}
template Tensor<float> replace<float>
    (const Tensor<float>&, const Tensor<float>&, const Tensor<bool>&);
template Tensor<double> replace<double>
    (const Tensor<double>&, const Tensor<double>&, const Tensor<bool>&);
template Tensor<int32_t> replace<int32_t>
    (const Tensor<int32_t>&, const Tensor<int32_t>&, const Tensor<bool>&);

template <typename value_t>
Tensor<bool> greater(const Tensor<value_t>& a, const Tensor<value_t>& b)
{
    Tensor<bool> result(a.get_shape(), a.get_order());
    map_op(current_queue(), a, b, result,
        [](value_t x, value_t y) { return x > y; });
    return result;
}
template Tensor<bool> greater<float>(const Tensor<float>&, const Tensor<float>&);
template Tensor<bool> greater<double>
    (const Tensor<double>&, const Tensor<double>&);
template Tensor<bool> greater<int32_t>
    (const Tensor<int32_t>&, const Tensor<int32_t>&);

template <typename value_t>
void fill(Tensor<value_t>& t, value_t value)
{
    generator_op(current_queue(), t, [value]() { return value; });
}
template void fill<float>(Tensor<float>&, float);
template void fill<double>(Tensor<double>&, double);
template void fill<int32_t>(Tensor<int32_t>&, int32_t);
template void fill<bool>(Tensor<bool>&, bool);

template <typename value_t>
void fill_with_index(Tensor<value_t>& t, value_t start, value_t step)
{
    generator_op(current_queue(), t,
        [next = start, step]() mutable
        {
            const value_t v = next;
            next += step;
            return v;
        });
}
template void fill_with_index<float>(Tensor<float>&, float, float);
template void fill_with_index<double>(Tensor<double>&, double, double);
template void fill_with_index<int32_t>(Tensor<int32_t>&, int32_t, int32_t);

template <typename value_t>
void copy(const Tensor<value_t>& from, Tensor<value_t>& to)
{
    map_op(current_queue(), from, to, [](value_t v) { return v; });
}
template void copy<float>(const Tensor<float>&, Tensor<float>&);
template void copy<double>(const Tensor<double>&, Tensor<double>&);
template void copy<int32_t>(const Tensor<int32_t>&, Tensor<int32_t>&);
template void copy<bool>(const Tensor<bool>&, Tensor<bool>&);

template <typename value_t>
Tensor<value_t> random_uniform(const std::vector<uint64_t>& shape,
                               value_t lower,
                               value_t upper)
{
    STRATUM_CHECK(!(lower < upper),
        validation_error,
        R"(random_uniform: lower bound must be below the upper bound.)");

    Tensor<value_t> result(shape);
    std::mt19937_64 engine(Platform::get().next_random_seed());
    std::uniform_real_distribution<value_t> dist(lower, upper);
    generator_op(current_queue(), result,
        [engine, dist]() mutable { return dist(engine); });
    return result;
}
template Tensor<float> random_uniform<float>
    (const std::vector<uint64_t>&, float, float);
template Tensor<double> random_uniform<double>
    (const std::vector<uint64_t>&, double, double);

template <typename value_t>
Tensor<value_t> random_normal(const std::vector<uint64_t>& shape,
                              value_t mean,
                              value_t stddev)
{
    STRATUM_CHECK(!(stddev > value_t(0)),
        validation_error,
        R"(random_normal: standard deviation must be positive.)");

    Tensor<value_t> result(shape);
    std::mt19937_64 engine(Platform::get().next_random_seed());
    std::normal_distribution<value_t> dist(mean, stddev);
    generator_op(current_queue(), result,
        [engine, dist]() mutable { return dist(engine); });
    return result;
}
template Tensor<float> random_normal<float>
    (const std::vector<uint64_t>&, float, float);
template Tensor<double> random_normal<double>
    (const std::vector<uint64_t>&, double, double);

template <typename value_t>
Tensor<value_t> ones_like(const Tensor<value_t>& like)
{
    Tensor<value_t> result(like.get_shape(), like.get_order());
    fill(result, value_t(1));
    return result;
}
template Tensor<float> ones_like<float>(const Tensor<float>&);
template Tensor<double> ones_like<double>(const Tensor<double>&);
template Tensor<int32_t> ones_like<int32_t>(const Tensor<int32_t>&);

template <typename value_t>
Tensor<value_t> zeros_like(const Tensor<value_t>& like)
{
    return Tensor<value_t>(like.get_shape(), like.get_order());
}
template Tensor<float> zeros_like<float>(const Tensor<float>&);
template Tensor<double> zeros_like<double>(const Tensor<double>&);
template Tensor<int32_t> zeros_like<int32_t>(const Tensor<int32_t>&);

} // namespace stratum::math
