/**
 * @file Reductions.cpp
 * @brief Axis reduction definitions.
 */

#include "stratum/Reductions.hpp"
#include "stratum/Errors.hpp"
#include "stratum/MapOps.hpp"
#include "stratum/Platform.hpp"
#include "stratum/Utils.hpp"

#include <string>
#include <utility>

namespace stratum
{

namespace
{

/// Normalized axes and the zero-seeded result of reducing @p x along them.
template <typename value_t>
struct ReductionSetup
{
    std::vector<int64_t> axes;
    Tensor<value_t>      result;
};

template <typename value_t, typename x_t>
ReductionSetup<value_t> prepare(const Tensor<x_t>& x,
                                const std::vector<int64_t>& axes)
{
    std::vector<int64_t> norm = utils::normalize_axes(axes,
        static_cast<int64_t>(x.get_rank()));
    std::vector<uint64_t> shape = utils::reduction_shape(x.get_shape(), norm);
    return ReductionSetup<value_t>{std::move(norm),
        Tensor<value_t>(shape, x.get_order())};
}

/// Number of elements folded into each result element.
uint64_t reduced_count(const std::vector<uint64_t>& shape,
                       const std::vector<int64_t>& axes)
{
    uint64_t count = 1;
    for (int64_t a : axes)
    {
        count *= shape[a];
    }
    return count;
}

/**
 * Seeds @p result with the first element along the reduced axes,
 * i.e. the slice of @p x at the origin with the result's shape.
 */
template <typename value_t>
void seed_with_origin(DeviceQueue& q,
                      const Tensor<value_t>& x,
                      Tensor<value_t>& result,
                      const char* op_name)
{
    STRATUM_CHECK(x.get_num_elements() == 0 && result.get_num_elements() != 0,
        validation_error,
        std::string(op_name) + ": cannot reduce over an empty axis");

    if (result.get_num_elements() == 0)
    {
        return;
    }
    const std::vector<uint64_t> origin(x.get_rank(), 0);
    map_op(q, x.slice(origin, result.get_shape()), result,
        [](value_t v) { return v; });
}

template <typename value_t>
void seed_with_one(DeviceQueue& q, Tensor<value_t>& result)
{
    generator_op(q, result, []() { return static_cast<value_t>(1); });
}

} // namespace

template <typename value_t>
Tensor<value_t> sum(const Tensor<value_t>& x, const std::vector<int64_t>& axes)
{
    DeviceQueue& q = current_queue();
    ReductionSetup<value_t> s = prepare<value_t>(x, axes);
    reduction_op(q, x, s.result,
        [](value_t acc, value_t v) { return acc + v; });
    return s.result;
}

template <typename value_t>
Tensor<value_t> mean(const Tensor<value_t>& x, const std::vector<int64_t>& axes)
{
    DeviceQueue& q = current_queue();
    ReductionSetup<value_t> s = prepare<value_t>(x, axes);
    const value_t divisor =
        static_cast<value_t>(reduced_count(x.get_shape(), s.axes));
    reduction_op(q, x, s.result,
        [](value_t acc, value_t v) { return acc + v; },
        [divisor](value_t acc) { return acc / divisor; });
    return s.result;
}

template <typename value_t>
Tensor<value_t> prod(const Tensor<value_t>& x, const std::vector<int64_t>& axes)
{
    DeviceQueue& q = current_queue();
    ReductionSetup<value_t> s = prepare<value_t>(x, axes);
    seed_with_one(q, s.result);
    reduction_op(q, x, s.result,
        [](value_t acc, value_t v) { return acc * v; });
    return s.result;
}

template <typename value_t>
Tensor<value_t> prod_non_zeros(const Tensor<value_t>& x,
                               const std::vector<int64_t>& axes)
{
    DeviceQueue& q = current_queue();
    ReductionSetup<value_t> s = prepare<value_t>(x, axes);
    seed_with_one(q, s.result);
    reduction_op(q, x, s.result,
        [](value_t acc, value_t v)
        {
            return v == static_cast<value_t>(0) ? acc : acc * v;
        });
    return s.result;
}

template <typename value_t>
Tensor<value_t> min(const Tensor<value_t>& x, const std::vector<int64_t>& axes)
{
    DeviceQueue& q = current_queue();
    ReductionSetup<value_t> s = prepare<value_t>(x, axes);
    seed_with_origin(q, x, s.result, "min");
    reduction_op(q, x, s.result,
        [](value_t acc, value_t v) { return acc <= v ? acc : v; });
    return s.result;
}

template <typename value_t>
Tensor<value_t> max(const Tensor<value_t>& x, const std::vector<int64_t>& axes)
{
    DeviceQueue& q = current_queue();
    ReductionSetup<value_t> s = prepare<value_t>(x, axes);
    seed_with_origin(q, x, s.result, "max");
    reduction_op(q, x, s.result,
        [](value_t acc, value_t v) { return acc >= v ? acc : v; });
    return s.result;
}

template <typename value_t>
Tensor<value_t> absmax(const Tensor<value_t>& x,
                       const std::vector<int64_t>& axes)
{
    DeviceQueue& q = current_queue();
    ReductionSetup<value_t> s = prepare<value_t>(x, axes);
    seed_with_origin(q, x, s.result, "absmax");
    // The seed element is folded again, so a negative seed is replaced
    // by its magnitude.
    reduction_op(q, x, s.result,
        [](value_t acc, value_t v)
        {
            const value_t m = v < static_cast<value_t>(0) ? -v : v;
            return acc >= m ? acc : m;
        });
    return s.result;
}

template <typename value_t>
Tensor<value_t> abssum(const Tensor<value_t>& x,
                       const std::vector<int64_t>& axes)
{
    DeviceQueue& q = current_queue();
    ReductionSetup<value_t> s = prepare<value_t>(x, axes);
    reduction_op(q, x, s.result,
        [](value_t acc, value_t v)
        {
            return acc + (v < static_cast<value_t>(0) ? -v : v);
        });
    return s.result;
}

template <typename value_t>
Tensor<value_t> sqrt_sum_squares(const Tensor<value_t>& x,
                                 const std::vector<int64_t>& axes)
{
    DeviceQueue& q = current_queue();
    ReductionSetup<value_t> s = prepare<value_t>(x, axes);
    reduction_op(q, x, s.result,
        [](value_t acc, value_t v) { return acc + v * v; },
        [](value_t acc) { return sycl::sqrt(acc); });
    return s.result;
}

Tensor<bool> all(const Tensor<bool>& x, const std::vector<int64_t>& axes)
{
    DeviceQueue& q = current_queue();
    ReductionSetup<bool> s = prepare<bool>(x, axes);
    seed_with_origin(q, x, s.result, "all");
    reduction_op(q, x, s.result,
        [](bool acc, bool v) { return acc && v; });
    return s.result;
}

Tensor<bool> any(const Tensor<bool>& x, const std::vector<int64_t>& axes)
{
    DeviceQueue& q = current_queue();
    ReductionSetup<bool> s = prepare<bool>(x, axes);
    seed_with_origin(q, x, s.result, "any");
    reduction_op(q, x, s.result,
        [](bool acc, bool v) { return acc || v; });
    return s.result;
}

#define STRATUM_INSTANTIATE_REDUCTION(fn, T) \
    template Tensor<T> fn<T>(const Tensor<T>&, const std::vector<int64_t>&);

STRATUM_INSTANTIATE_REDUCTION(sum, float)
STRATUM_INSTANTIATE_REDUCTION(sum, double)
STRATUM_INSTANTIATE_REDUCTION(sum, int32_t)
STRATUM_INSTANTIATE_REDUCTION(mean, float)
STRATUM_INSTANTIATE_REDUCTION(mean, double)
STRATUM_INSTANTIATE_REDUCTION(prod, float)
STRATUM_INSTANTIATE_REDUCTION(prod, double)
STRATUM_INSTANTIATE_REDUCTION(prod, int32_t)
STRATUM_INSTANTIATE_REDUCTION(prod_non_zeros, float)
STRATUM_INSTANTIATE_REDUCTION(prod_non_zeros, double)
STRATUM_INSTANTIATE_REDUCTION(prod_non_zeros, int32_t)
STRATUM_INSTANTIATE_REDUCTION(min, float)
STRATUM_INSTANTIATE_REDUCTION(min, double)
STRATUM_INSTANTIATE_REDUCTION(min, int32_t)
STRATUM_INSTANTIATE_REDUCTION(max, float)
STRATUM_INSTANTIATE_REDUCTION(max, double)
STRATUM_INSTANTIATE_REDUCTION(max, int32_t)
STRATUM_INSTANTIATE_REDUCTION(absmax, float)
STRATUM_INSTANTIATE_REDUCTION(absmax, double)
STRATUM_INSTANTIATE_REDUCTION(absmax, int32_t)
STRATUM_INSTANTIATE_REDUCTION(abssum, float)
STRATUM_INSTANTIATE_REDUCTION(abssum, double)
STRATUM_INSTANTIATE_REDUCTION(abssum, int32_t)
STRATUM_INSTANTIATE_REDUCTION(sqrt_sum_squares, float)
STRATUM_INSTANTIATE_REDUCTION(sqrt_sum_squares, double)

#undef STRATUM_INSTANTIATE_REDUCTION

} // namespace stratum
