/**
 * @file Autograd.hpp
 * @brief Gradient edges of the primitive operators.
 *
 * Defines FunctionEdge, representing one primitive application: it keeps
 * the inputs, can re-run the forward computation, and maps the gradient
 * of its output to one gradient per input. There is no graph recording;
 * callers chain edges explicitly.
 */

#ifndef STRATUM_AUTOGRAD_HPP
#define STRATUM_AUTOGRAD_HPP

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "Tensor.hpp"

namespace stratum
{

/**
 * @brief Base interface for a functional edge.
 *
 * A FunctionEdge represents the mathematical relationship between
 * input tensors and their output. It stores context to re-run the
 * calculation (forward) or compute gradients (backward).
 */
template <typename value_t>
class FunctionEdge
{
public:
    /**
     * @brief Construct an edge with a mandatory operation name.
     * @param op_name Unique identifier (e.g., "add", "sum").
     */
    explicit FunctionEdge(std::string op_name)
        : m_op_name(std::move(op_name)) {}

    /**
     * @brief Virtual destructor for safe inheritance.
     */
    virtual ~FunctionEdge() = default;

    /**
     * @brief Get the unique name of the operation.
     * @return A constant reference to the name string.
     */
    const std::string& name() const { return m_op_name; }

    /**
     * @brief Re-execute the forward pass.
     * Uses stored input tensors to re-calculate the output.
     */
    virtual void forward() = 0;

    /**
     * @brief Gradients of the inputs given the gradient of the output.
     *
     * @param grad_output Gradient of the loss w.r.t. the output; must
     * have the output's shape.
     * @return One gradient per input, in input order, each with the
     * shape of its input.
     *
     * @throws validation_error if @p grad_output has the wrong shape.
     */
    virtual std::vector<Tensor<value_t>>
    backward(const Tensor<value_t>& grad_output) const = 0;

    /**
     * @brief Get the input tensors connected by this edge.
     */
    virtual std::vector<Tensor<value_t>> inputs() const = 0;

    /**
     * @brief Get the output tensor produced by the last forward pass.
     */
    const Tensor<value_t>& output() const { return m_output; }

protected:
    std::string     m_op_name; ///< Unique identifier of the operation.
    Tensor<value_t> m_output;  ///< Result of the last forward pass.
};

/**
 * @brief Edge with two same-shaped inputs.
 */
template <typename value_t>
class BinaryEdge : public FunctionEdge<value_t>
{
public:
    BinaryEdge(std::string op_name, Tensor<value_t> a, Tensor<value_t> b)
        : FunctionEdge<value_t>(std::move(op_name)),
          m_a(std::move(a)),
          m_b(std::move(b)) {}

    std::vector<Tensor<value_t>> inputs() const override
    {
        return {m_a, m_b};
    }

protected:
    Tensor<value_t> m_a;
    Tensor<value_t> m_b;
};

/**
 * @brief Edge with one input and an optional list of reduced axes.
 */
template <typename value_t>
class UnaryEdge : public FunctionEdge<value_t>
{
public:
    UnaryEdge(std::string op_name,
              Tensor<value_t> x,
              std::vector<int64_t> axes = {})
        : FunctionEdge<value_t>(std::move(op_name)),
          m_x(std::move(x)),
          m_axes(std::move(axes)) {}

    std::vector<Tensor<value_t>> inputs() const override
    {
        return {m_x};
    }

protected:
    Tensor<value_t>      m_x;
    std::vector<int64_t> m_axes;
};

/// `a + b`; both gradients are the output gradient.
template <typename value_t>
class AddEdge : public BinaryEdge<value_t>
{
public:
    AddEdge(Tensor<value_t> a, Tensor<value_t> b);
    void forward() override;
    std::vector<Tensor<value_t>>
    backward(const Tensor<value_t>& grad_output) const override;
};

/// `a - b`.
template <typename value_t>
class SubtractEdge : public BinaryEdge<value_t>
{
public:
    SubtractEdge(Tensor<value_t> a, Tensor<value_t> b);
    void forward() override;
    std::vector<Tensor<value_t>>
    backward(const Tensor<value_t>& grad_output) const override;
};

/// `a * b`.
template <typename value_t>
class MultiplyEdge : public BinaryEdge<value_t>
{
public:
    MultiplyEdge(Tensor<value_t> a, Tensor<value_t> b);
    void forward() override;
    std::vector<Tensor<value_t>>
    backward(const Tensor<value_t>& grad_output) const override;
};

/**
 * @brief `a / b`.
 *
 * Both gradients, `g / b` and `-g * a / b^2`, come from one two-result
 * map pass.
 */
template <typename value_t>
class DivideEdge : public BinaryEdge<value_t>
{
public:
    DivideEdge(Tensor<value_t> a, Tensor<value_t> b);
    void forward() override;
    std::vector<Tensor<value_t>>
    backward(const Tensor<value_t>& grad_output) const override;
};

/// `-x`.
template <typename value_t>
class NegateEdge : public UnaryEdge<value_t>
{
public:
    explicit NegateEdge(Tensor<value_t> x);
    void forward() override;
    std::vector<Tensor<value_t>>
    backward(const Tensor<value_t>& grad_output) const override;
};

/// `sum(x, axes)`; the gradient is broadcast back over the reduced axes.
template <typename value_t>
class SumEdge : public UnaryEdge<value_t>
{
public:
    SumEdge(Tensor<value_t> x, std::vector<int64_t> axes = {});
    void forward() override;
    std::vector<Tensor<value_t>>
    backward(const Tensor<value_t>& grad_output) const override;
};

/// `mean(x, axes)`.
template <typename value_t>
class MeanEdge : public UnaryEdge<value_t>
{
public:
    MeanEdge(Tensor<value_t> x, std::vector<int64_t> axes = {});
    void forward() override;
    std::vector<Tensor<value_t>>
    backward(const Tensor<value_t>& grad_output) const override;
};

/// `min(x, axes)`; the gradient flows to every element equal to the result.
template <typename value_t>
class MinEdge : public UnaryEdge<value_t>
{
public:
    MinEdge(Tensor<value_t> x, std::vector<int64_t> axes = {});
    void forward() override;
    std::vector<Tensor<value_t>>
    backward(const Tensor<value_t>& grad_output) const override;
};

/// `max(x, axes)`; the gradient flows to every element equal to the result.
template <typename value_t>
class MaxEdge : public UnaryEdge<value_t>
{
public:
    MaxEdge(Tensor<value_t> x, std::vector<int64_t> axes = {});
    void forward() override;
    std::vector<Tensor<value_t>>
    backward(const Tensor<value_t>& grad_output) const override;
};

/// `absmax(x, axes)`; the gradient carries the sign of the selected element.
template <typename value_t>
class AbsmaxEdge : public UnaryEdge<value_t>
{
public:
    AbsmaxEdge(Tensor<value_t> x, std::vector<int64_t> axes = {});
    void forward() override;
    std::vector<Tensor<value_t>>
    backward(const Tensor<value_t>& grad_output) const override;
};

/// `abssum(x, axes)`; gradient `g * sign(x)`.
template <typename value_t>
class AbssumEdge : public UnaryEdge<value_t>
{
public:
    AbssumEdge(Tensor<value_t> x, std::vector<int64_t> axes = {});
    void forward() override;
    std::vector<Tensor<value_t>>
    backward(const Tensor<value_t>& grad_output) const override;
};

/// `sqrt_sum_squares(x, axes)`; gradient `g * x / norm`, 0 where the norm is 0.
template <typename value_t>
class SqrtSumSquaresEdge : public UnaryEdge<value_t>
{
public:
    SqrtSumSquaresEdge(Tensor<value_t> x, std::vector<int64_t> axes = {});
    void forward() override;
    std::vector<Tensor<value_t>>
    backward(const Tensor<value_t>& grad_output) const override;
};

} // namespace stratum

#endif // STRATUM_AUTOGRAD_HPP
