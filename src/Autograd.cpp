/**
 * @file Autograd.cpp
 * @brief Gradient edge definitions.
 */

#include "stratum/Autograd.hpp"
#include "stratum/Errors.hpp"
#include "stratum/MapOps.hpp"
#include "stratum/Math.hpp"
#include "stratum/Platform.hpp"
#include "stratum/Reductions.hpp"

#include <string>
#include <utility>

namespace stratum
{

namespace
{

template <typename value_t>
void check_grad(const Tensor<value_t>& grad,
                const Tensor<value_t>& output,
                const std::string& op_name)
{
    STRATUM_CHECK(grad.get_shape() != output.get_shape(),
        validation_error,
        op_name + "(backward): gradient shape does not match the output.");
}

/// Stride-0 view of a reduced tensor over the shape it was reduced from.
template <typename value_t>
Tensor<value_t> broadcast(const Tensor<value_t>& t,
                          const std::vector<uint64_t>& shape)
{
    return Tensor<value_t>(t.get_storage(), t.get_view().broadcast_to(shape));
}

} // namespace

template <typename value_t>
AddEdge<value_t>::AddEdge(Tensor<value_t> a, Tensor<value_t> b)
    : BinaryEdge<value_t>("add", std::move(a), std::move(b))
{
    forward();
}

template <typename value_t>
void AddEdge<value_t>::forward()
{
    this->m_output = this->m_a + this->m_b;
}

template <typename value_t>
std::vector<Tensor<value_t>>
AddEdge<value_t>::backward(const Tensor<value_t>& grad_output) const
{
    check_grad(grad_output, this->m_output, this->m_op_name);
    return {grad_output.clone(), grad_output.clone()};
}

template <typename value_t>
SubtractEdge<value_t>::SubtractEdge(Tensor<value_t> a, Tensor<value_t> b)
    : BinaryEdge<value_t>("subtract", std::move(a), std::move(b))
{
    forward();
}

template <typename value_t>
void SubtractEdge<value_t>::forward()
{
    this->m_output = this->m_a - this->m_b;
}

template <typename value_t>
std::vector<Tensor<value_t>>
SubtractEdge<value_t>::backward(const Tensor<value_t>& grad_output) const
{
    check_grad(grad_output, this->m_output, this->m_op_name);
    return {grad_output.clone(), -grad_output};
}

template <typename value_t>
MultiplyEdge<value_t>::MultiplyEdge(Tensor<value_t> a, Tensor<value_t> b)
    : BinaryEdge<value_t>("multiply", std::move(a), std::move(b))
{
    forward();
}

template <typename value_t>
void MultiplyEdge<value_t>::forward()
{
    this->m_output = this->m_a * this->m_b;
}

template <typename value_t>
std::vector<Tensor<value_t>>
MultiplyEdge<value_t>::backward(const Tensor<value_t>& grad_output) const
{
    check_grad(grad_output, this->m_output, this->m_op_name);
    return {grad_output * this->m_b, grad_output * this->m_a};
}

template <typename value_t>
DivideEdge<value_t>::DivideEdge(Tensor<value_t> a, Tensor<value_t> b)
    : BinaryEdge<value_t>("divide", std::move(a), std::move(b))
{
    forward();
}

template <typename value_t>
void DivideEdge<value_t>::forward()
{
    this->m_output = this->m_a / this->m_b;
}

template <typename value_t>
std::vector<Tensor<value_t>>
DivideEdge<value_t>::backward(const Tensor<value_t>& grad_output) const
{
    check_grad(grad_output, this->m_output, this->m_op_name);

    Tensor<value_t> grad_a(this->m_a.get_shape(), this->m_a.get_order());
    Tensor<value_t> grad_b(this->m_b.get_shape(), this->m_b.get_order());
    map_op(current_queue(), grad_output, this->m_a, this->m_b, grad_a, grad_b,
        [](value_t g, value_t a, value_t b)
        {
            const value_t ga = g / b;
            return std::pair<value_t, value_t>(ga, -ga * a / b);
        });
    return {grad_a, grad_b};
}

template <typename value_t>
NegateEdge<value_t>::NegateEdge(Tensor<value_t> x)
    : UnaryEdge<value_t>("negate", std::move(x))
{
    forward();
}

template <typename value_t>
void NegateEdge<value_t>::forward()
{
    this->m_output = -this->m_x;
}

template <typename value_t>
std::vector<Tensor<value_t>>
NegateEdge<value_t>::backward(const Tensor<value_t>& grad_output) const
{
    check_grad(grad_output, this->m_output, this->m_op_name);
    return {-grad_output};
}

template <typename value_t>
SumEdge<value_t>::SumEdge(Tensor<value_t> x, std::vector<int64_t> axes)
    : UnaryEdge<value_t>("sum", std::move(x), std::move(axes))
{
    forward();
}

template <typename value_t>
void SumEdge<value_t>::forward()
{
    this->m_output = sum(this->m_x, this->m_axes);
}

template <typename value_t>
std::vector<Tensor<value_t>>
SumEdge<value_t>::backward(const Tensor<value_t>& grad_output) const
{
    check_grad(grad_output, this->m_output, this->m_op_name);
    return {broadcast(grad_output, this->m_x.get_shape()).clone()};
}

template <typename value_t>
MeanEdge<value_t>::MeanEdge(Tensor<value_t> x, std::vector<int64_t> axes)
    : UnaryEdge<value_t>("mean", std::move(x), std::move(axes))
{
    forward();
}

template <typename value_t>
void MeanEdge<value_t>::forward()
{
    this->m_output = mean(this->m_x, this->m_axes);
}

template <typename value_t>
std::vector<Tensor<value_t>>
MeanEdge<value_t>::backward(const Tensor<value_t>& grad_output) const
{
    check_grad(grad_output, this->m_output, this->m_op_name);

    const uint64_t out_n = this->m_output.get_num_elements();
    const value_t count = static_cast<value_t>(out_n == 0 ? 1 :
        this->m_x.get_num_elements() / out_n);

    Tensor<value_t> grad(this->m_x.get_shape(), this->m_x.get_order());
    map_op(current_queue(), broadcast(grad_output, this->m_x.get_shape()),
        grad, [count](value_t g) { return g / count; });
    return {grad};
}

template <typename value_t>
MinEdge<value_t>::MinEdge(Tensor<value_t> x, std::vector<int64_t> axes)
    : UnaryEdge<value_t>("min", std::move(x), std::move(axes))
{
    forward();
}

template <typename value_t>
void MinEdge<value_t>::forward()
{
    this->m_output = min(this->m_x, this->m_axes);
}

template <typename value_t>
std::vector<Tensor<value_t>>
MinEdge<value_t>::backward(const Tensor<value_t>& grad_output) const
{
    check_grad(grad_output, this->m_output, this->m_op_name);

    const std::vector<uint64_t>& shape = this->m_x.get_shape();
    Tensor<value_t> grad(shape, this->m_x.get_order());
    map_op(current_queue(), this->m_x, broadcast(this->m_output, shape),
        broadcast(grad_output, shape), grad,
        [](value_t x, value_t m, value_t g) { return x == m ? g : value_t(0); });
    return {grad};
}

template <typename value_t>
MaxEdge<value_t>::MaxEdge(Tensor<value_t> x, std::vector<int64_t> axes)
    : UnaryEdge<value_t>("max", std::move(x), std::move(axes))
{
    forward();
}

template <typename value_t>
void MaxEdge<value_t>::forward()
{
    this->m_output = max(this->m_x, this->m_axes);
}

template <typename value_t>
std::vector<Tensor<value_t>>
MaxEdge<value_t>::backward(const Tensor<value_t>& grad_output) const
{
    check_grad(grad_output, this->m_output, this->m_op_name);

    const std::vector<uint64_t>& shape = this->m_x.get_shape();
    Tensor<value_t> grad(shape, this->m_x.get_order());
    map_op(current_queue(), this->m_x, broadcast(this->m_output, shape),
        broadcast(grad_output, shape), grad,
        [](value_t x, value_t m, value_t g) { return x == m ? g : value_t(0); });
    return {grad};
}

template <typename value_t>
AbsmaxEdge<value_t>::AbsmaxEdge(Tensor<value_t> x, std::vector<int64_t> axes)
    : UnaryEdge<value_t>("absmax", std::move(x), std::move(axes))
{
    forward();
}

template <typename value_t>
void AbsmaxEdge<value_t>::forward()
{
    this->m_output = absmax(this->m_x, this->m_axes);
}

template <typename value_t>
std::vector<Tensor<value_t>>
AbsmaxEdge<value_t>::backward(const Tensor<value_t>& grad_output) const
{
    check_grad(grad_output, this->m_output, this->m_op_name);

    const std::vector<uint64_t>& shape = this->m_x.get_shape();
    Tensor<value_t> grad(shape, this->m_x.get_order());
    map_op(current_queue(), this->m_x, broadcast(this->m_output, shape),
        broadcast(grad_output, shape), grad,
        [](value_t x, value_t m, value_t g)
        {
            if (x == m)
            {
                return g;
            }
            return -x == m ? -g : value_t(0);
        });
    return {grad};
}

template <typename value_t>
AbssumEdge<value_t>::AbssumEdge(Tensor<value_t> x, std::vector<int64_t> axes)
    : UnaryEdge<value_t>("abssum", std::move(x), std::move(axes))
{
    forward();
}

template <typename value_t>
void AbssumEdge<value_t>::forward()
{
    this->m_output = abssum(this->m_x, this->m_axes);
}

template <typename value_t>
std::vector<Tensor<value_t>>
AbssumEdge<value_t>::backward(const Tensor<value_t>& grad_output) const
{
    check_grad(grad_output, this->m_output, this->m_op_name);

    const std::vector<uint64_t>& shape = this->m_x.get_shape();
    Tensor<value_t> grad(shape, this->m_x.get_order());
    map_op(current_queue(), this->m_x, broadcast(grad_output, shape), grad,
        [](value_t x, value_t g)
        {
            if (x > value_t(0))
            {
                return g;
            }
            return x < value_t(0) ? -g : value_t(0);
        });
    return {grad};
}

template <typename value_t>
SqrtSumSquaresEdge<value_t>::SqrtSumSquaresEdge(Tensor<value_t> x,
                                                std::vector<int64_t> axes)
    : UnaryEdge<value_t>("sqrt_sum_squares", std::move(x), std::move(axes))
{
    forward();
}

template <typename value_t>
void SqrtSumSquaresEdge<value_t>::forward()
{
    this->m_output = sqrt_sum_squares(this->m_x, this->m_axes);
}

template <typename value_t>
std::vector<Tensor<value_t>>
SqrtSumSquaresEdge<value_t>::backward(const Tensor<value_t>& grad_output) const
{
    check_grad(grad_output, this->m_output, this->m_op_name);

    const std::vector<uint64_t>& shape = this->m_x.get_shape();
    Tensor<value_t> grad(shape, this->m_x.get_order());
    map_op(current_queue(), this->m_x, broadcast(this->m_output, shape),
        broadcast(grad_output, shape), grad,
        [](value_t x, value_t norm, value_t g)
        {
            return norm == value_t(0) ? value_t(0) : g * x / norm;
        });
    return {grad};
}

template class AddEdge<float>;
template class AddEdge<double>;
template class SubtractEdge<float>;
template class SubtractEdge<double>;
template class MultiplyEdge<float>;
template class MultiplyEdge<double>;
template class DivideEdge<float>;
template class DivideEdge<double>;
template class NegateEdge<float>;
template class NegateEdge<double>;
template class SumEdge<float>;
template class SumEdge<double>;
template class MeanEdge<float>;
template class MeanEdge<double>;
template class MinEdge<float>;
template class MinEdge<double>;
template class MaxEdge<float>;
template class MaxEdge<double>;
template class AbsmaxEdge<float>;
template class AbsmaxEdge<double>;
template class AbssumEdge<float>;
template class AbssumEdge<double>;
template class SqrtSumSquaresEdge<float>;
template class SqrtSumSquaresEdge<double>;

} // namespace stratum
