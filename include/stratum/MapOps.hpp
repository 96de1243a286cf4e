/**
 * @file MapOps.hpp
 * @brief Generic element-wise and reduction dispatch over any queue.
 *
 * Every operator of the library reduces to one of the templates below.
 * Each of them:
 *
 * 1. validates operand shapes on the calling thread;
 * 2. stages inputs with `read(queue)` and outputs with
 *    `read_write(queue)`, which orders the queue after the producers;
 * 3. picks a traversal. Operands that are all dense, share one order
 *    and one shape are walked as flat buffers. Otherwise every operand
 *    is walked in the output's logical order through its own strides,
 *    so elements correspond index for index;
 * 4. executes. On a CPU queue the whole loop is one unit of work passed
 *    to `submit()` (inline for a sync queue, deferred for an async one).
 *    On an accelerator queue the loop becomes one SYCL kernel.
 *
 * The element functions must be callable on the host and in a SYCL
 * kernel: plain lambdas without captured references.
 */

#ifndef STRATUM_MAPOPS_HPP
#define STRATUM_MAPOPS_HPP

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "DeviceQueue.hpp"
#include "Errors.hpp"
#include "Logging.hpp"
#include "SYCLQueue.hpp"
#include "SYCLUtils.hpp"
#include "StridedView.hpp"
#include "Tensor.hpp"

namespace stratum
{

namespace detail
{

/// Host staging type; `std::vector<bool>` has no contiguous storage.
template <typename value_t>
using staged_t = std::conditional_t<std::is_same<value_t, bool>::value,
    uint8_t, value_t>;

template <typename value_t>
inline const value_t* data_of(const std::shared_ptr<const DeviceMemory>& mem)
{
    return static_cast<const value_t*>(mem->get_data());
}

template <typename value_t>
inline value_t* data_of(const std::shared_ptr<DeviceMemory>& mem)
{
    return static_cast<value_t*>(mem->get_data());
}

/**
 * @brief True if all views are dense, in one order and of one shape.
 */
inline bool flat_compatible(std::initializer_list<const StridedView*> views)
{
    const StridedView& first = **views.begin();
    for (const StridedView* p_view : views)
    {
        if (!p_view->is_dense() ||
            p_view->get_order() != first.get_order() ||
            p_view->get_shape() != first.get_shape())
        {
            return false;
        }
    }
    return true;
}

inline void check_shape(const StridedView& operand,
                        const StridedView& result,
                        const char* op_name)
{
    STRATUM_CHECK(operand.get_shape() != result.get_shape(),
        validation_error,
        std::string(op_name) +
        ": operand shape does not match the result shape");
}

inline AcceleratorQueue& as_accelerator(DeviceQueue& q)
{
    AcceleratorQueue* p_acc = dynamic_cast<AcceleratorQueue*>(&q);
    STRATUM_CHECK(p_acc == nullptr,
        device_error,
        q.get_name() + ": queue has no kernel backend");
    return *p_acc;
}

inline void log_dispatch(const char* op_name,
                         uint64_t count,
                         const DeviceQueue& q,
                         bool flat)
{
    log::diagnostic(log::Category::SCHEDULING, "{} {} elements on {} ({})",
        op_name, count, q.get_name(), flat ? "flat" : "strided");
}

} // namespace detail

/**
 * @brief Nullary map: `out[i] = op()`.
 *
 * @p op is called once per element, in the logical row-major order of
 * @p out, so stateful generators (index ramps, random engines) produce
 * the same values whatever the layout. On an accelerator queue the values
 * are generated on the host and scattered by a kernel.
 */
template <typename out_t, typename op_t>
void generator_op(DeviceQueue& q, Tensor<out_t>& out, op_t op)
{
    const StridedView ov = out.get_view();
    const uint64_t n = ov.get_num_elements();
    std::shared_ptr<DeviceMemory> out_mem = out.read_write(q);

    if (q.uses_cpu())
    {
        const bool flat = ov.is_dense() && ov.get_order() == Order::ROW_MAJOR;
        detail::log_dispatch("generator_op", n, q, flat);

        q.submit([out_mem, ov, n, flat, op]() mutable
        {
            out_t* p_out = detail::data_of<out_t>(out_mem);
            if (flat)
            {
                const uint64_t base = ov.get_offset();
                for (uint64_t i = 0; i < n; ++i)
                {
                    p_out[base + i] = op();
                }
                return;
            }
            for (uint64_t off : ov.row_sequential())
            {
                p_out[off] = op();
            }
        });
        return;
    }

    AcceleratorQueue& acc = detail::as_accelerator(q);
    detail::log_dispatch("generator_op", n, q, false);

    using host_t = detail::staged_t<out_t>;
    auto host_values = std::make_shared<std::vector<host_t>>(n);
    for (uint64_t i = 0; i < n; ++i)
    {
        (*host_values)[i] = static_cast<host_t>(op());
    }
    std::shared_ptr<DeviceMemory> staged = acc.stage_to_device(host_values);

    const sycl_utils::KernelView kv =
        sycl_utils::make_kernel_view(ov, Order::ROW_MAJOR);
    const host_t* p_src = static_cast<const host_t*>(staged->get_data());
    out_t* p_out = detail::data_of<out_t>(out_mem);

    acc.launch(n, [=](uint64_t i)
    {
        p_out[sycl_utils::idx_of(i, kv)] = static_cast<out_t>(p_src[i]);
    }, {staged, out_mem});
}

/**
 * @brief Unary map in place: `x[i] = op(x[i])`.
 */
template <typename value_t, typename op_t>
void in_place_op(DeviceQueue& q, Tensor<value_t>& x, op_t op)
{
    const StridedView xv = x.get_view();
    const uint64_t n = xv.get_num_elements();
    std::shared_ptr<DeviceMemory> x_mem = x.read_write(q);

    if (q.uses_cpu())
    {
        const bool flat = xv.is_dense();
        detail::log_dispatch("in_place_op", n, q, flat);

        q.submit([x_mem, xv, n, flat, op]()
        {
            value_t* p_x = detail::data_of<value_t>(x_mem);
            if (flat)
            {
                const uint64_t base = xv.get_offset();
                for (uint64_t i = 0; i < n; ++i)
                {
                    p_x[base + i] = op(p_x[base + i]);
                }
                return;
            }
            for (uint64_t off : xv.sequential())
            {
                p_x[off] = op(p_x[off]);
            }
        });
        return;
    }

    AcceleratorQueue& acc = detail::as_accelerator(q);
    detail::log_dispatch("in_place_op", n, q, false);

    const sycl_utils::KernelView kv =
        sycl_utils::make_kernel_view(xv, xv.get_order());
    value_t* p_x = detail::data_of<value_t>(x_mem);

    acc.launch(n, [=](uint64_t i)
    {
        const uint64_t off = sycl_utils::idx_of(i, kv);
        p_x[off] = op(p_x[off]);
    }, {x_mem});
}

/**
 * @brief Unary map: `out[i] = op(a[i])`.
 *
 * @throws validation_error if the shapes differ.
 */
template <typename a_t, typename out_t, typename op_t>
void map_op(DeviceQueue& q, const Tensor<a_t>& a, Tensor<out_t>& out, op_t op)
{
    const StridedView av = a.get_view();
    const StridedView ov = out.get_view();
    detail::check_shape(av, ov, "map_op");

    const uint64_t n = ov.get_num_elements();
    std::shared_ptr<const DeviceMemory> a_mem = a.read(q);
    std::shared_ptr<DeviceMemory> out_mem = out.read_write(q);

    if (q.uses_cpu())
    {
        const bool flat = detail::flat_compatible({&av, &ov});
        detail::log_dispatch("map_op", n, q, flat);

        q.submit([a_mem, out_mem, av, ov, n, flat, op]()
        {
            const a_t* p_a = detail::data_of<a_t>(a_mem);
            out_t* p_out = detail::data_of<out_t>(out_mem);
            if (flat)
            {
                const uint64_t a0 = av.get_offset();
                const uint64_t o0 = ov.get_offset();
                for (uint64_t i = 0; i < n; ++i)
                {
                    p_out[o0 + i] = op(p_a[a0 + i]);
                }
                return;
            }

            const Order order = ov.get_order();
            StridedSequence a_seq = av.sequential(order);
            StridedSequence o_seq = ov.sequential(order);
            auto ia = a_seq.begin();
            for (auto io = o_seq.begin(); io != o_seq.end(); ++io, ++ia)
            {
                p_out[*io] = op(p_a[*ia]);
            }
        });
        return;
    }

    AcceleratorQueue& acc = detail::as_accelerator(q);
    detail::log_dispatch("map_op", n, q, false);

    const Order order = ov.get_order();
    const sycl_utils::KernelView akv = sycl_utils::make_kernel_view(av, order);
    const sycl_utils::KernelView okv = sycl_utils::make_kernel_view(ov, order);
    const a_t* p_a = detail::data_of<a_t>(a_mem);
    out_t* p_out = detail::data_of<out_t>(out_mem);

    acc.launch(n, [=](uint64_t i)
    {
        p_out[sycl_utils::idx_of(i, okv)] = op(p_a[sycl_utils::idx_of(i, akv)]);
    }, {a_mem, out_mem});
}

/**
 * @brief Binary map: `out[i] = op(a[i], b[i])`.
 *
 * @throws validation_error if the shapes differ.
 */
template <typename a_t, typename b_t, typename out_t, typename op_t>
void map_op(DeviceQueue& q,
            const Tensor<a_t>& a,
            const Tensor<b_t>& b,
            Tensor<out_t>& out,
            op_t op)
{
    const StridedView av = a.get_view();
    const StridedView bv = b.get_view();
    const StridedView ov = out.get_view();
    detail::check_shape(av, ov, "map_op");
    detail::check_shape(bv, ov, "map_op");

    const uint64_t n = ov.get_num_elements();
    std::shared_ptr<const DeviceMemory> a_mem = a.read(q);
    std::shared_ptr<const DeviceMemory> b_mem = b.read(q);
    std::shared_ptr<DeviceMemory> out_mem = out.read_write(q);

    if (q.uses_cpu())
    {
        const bool flat = detail::flat_compatible({&av, &bv, &ov});
        detail::log_dispatch("map_op", n, q, flat);

        q.submit([a_mem, b_mem, out_mem, av, bv, ov, n, flat, op]()
        {
            const a_t* p_a = detail::data_of<a_t>(a_mem);
            const b_t* p_b = detail::data_of<b_t>(b_mem);
            out_t* p_out = detail::data_of<out_t>(out_mem);
            if (flat)
            {
                const uint64_t a0 = av.get_offset();
                const uint64_t b0 = bv.get_offset();
                const uint64_t o0 = ov.get_offset();
                for (uint64_t i = 0; i < n; ++i)
                {
                    p_out[o0 + i] = op(p_a[a0 + i], p_b[b0 + i]);
                }
                return;
            }

            const Order order = ov.get_order();
            StridedSequence a_seq = av.sequential(order);
            StridedSequence b_seq = bv.sequential(order);
            StridedSequence o_seq = ov.sequential(order);
            auto ia = a_seq.begin();
            auto ib = b_seq.begin();
            for (auto io = o_seq.begin(); io != o_seq.end(); ++io, ++ia, ++ib)
            {
                p_out[*io] = op(p_a[*ia], p_b[*ib]);
            }
        });
        return;
    }

    AcceleratorQueue& acc = detail::as_accelerator(q);
    detail::log_dispatch("map_op", n, q, false);

    const Order order = ov.get_order();
    const sycl_utils::KernelView akv = sycl_utils::make_kernel_view(av, order);
    const sycl_utils::KernelView bkv = sycl_utils::make_kernel_view(bv, order);
    const sycl_utils::KernelView okv = sycl_utils::make_kernel_view(ov, order);
    const a_t* p_a = detail::data_of<a_t>(a_mem);
    const b_t* p_b = detail::data_of<b_t>(b_mem);
    out_t* p_out = detail::data_of<out_t>(out_mem);

    acc.launch(n, [=](uint64_t i)
    {
        p_out[sycl_utils::idx_of(i, okv)] =
            op(p_a[sycl_utils::idx_of(i, akv)], p_b[sycl_utils::idx_of(i, bkv)]);
    }, {a_mem, b_mem, out_mem});
}

/**
 * @brief Ternary map: `out[i] = op(a[i], b[i], c[i])`.
 *
 * @throws validation_error if the shapes differ.
 */
template <typename a_t, typename b_t, typename c_t,
          typename out_t, typename op_t>
void map_op(DeviceQueue& q,
            const Tensor<a_t>& a,
            const Tensor<b_t>& b,
            const Tensor<c_t>& c,
            Tensor<out_t>& out,
            op_t op)
{
    const StridedView av = a.get_view();
    const StridedView bv = b.get_view();
    const StridedView cv = c.get_view();
    const StridedView ov = out.get_view();
    detail::check_shape(av, ov, "map_op");
    detail::check_shape(bv, ov, "map_op");
    detail::check_shape(cv, ov, "map_op");

    const uint64_t n = ov.get_num_elements();
    std::shared_ptr<const DeviceMemory> a_mem = a.read(q);
    std::shared_ptr<const DeviceMemory> b_mem = b.read(q);
    std::shared_ptr<const DeviceMemory> c_mem = c.read(q);
    std::shared_ptr<DeviceMemory> out_mem = out.read_write(q);

    if (q.uses_cpu())
    {
        const bool flat = detail::flat_compatible({&av, &bv, &cv, &ov});
        detail::log_dispatch("map_op", n, q, flat);

        q.submit([a_mem, b_mem, c_mem, out_mem, av, bv, cv, ov, n, flat, op]()
        {
            const a_t* p_a = detail::data_of<a_t>(a_mem);
            const b_t* p_b = detail::data_of<b_t>(b_mem);
            const c_t* p_c = detail::data_of<c_t>(c_mem);
            out_t* p_out = detail::data_of<out_t>(out_mem);
            if (flat)
            {
                const uint64_t a0 = av.get_offset();
                const uint64_t b0 = bv.get_offset();
                const uint64_t c0 = cv.get_offset();
                const uint64_t o0 = ov.get_offset();
                for (uint64_t i = 0; i < n; ++i)
                {
                    p_out[o0 + i] = op(p_a[a0 + i], p_b[b0 + i], p_c[c0 + i]);
                }
                return;
            }

            const Order order = ov.get_order();
            StridedSequence a_seq = av.sequential(order);
            StridedSequence b_seq = bv.sequential(order);
            StridedSequence c_seq = cv.sequential(order);
            StridedSequence o_seq = ov.sequential(order);
            auto ia = a_seq.begin();
            auto ib = b_seq.begin();
            auto ic = c_seq.begin();
            for (auto io = o_seq.begin(); io != o_seq.end();
                 ++io, ++ia, ++ib, ++ic)
            {
                p_out[*io] = op(p_a[*ia], p_b[*ib], p_c[*ic]);
            }
        });
        return;
    }

    AcceleratorQueue& acc = detail::as_accelerator(q);
    detail::log_dispatch("map_op", n, q, false);

    const Order order = ov.get_order();
    const sycl_utils::KernelView akv = sycl_utils::make_kernel_view(av, order);
    const sycl_utils::KernelView bkv = sycl_utils::make_kernel_view(bv, order);
    const sycl_utils::KernelView ckv = sycl_utils::make_kernel_view(cv, order);
    const sycl_utils::KernelView okv = sycl_utils::make_kernel_view(ov, order);
    const a_t* p_a = detail::data_of<a_t>(a_mem);
    const b_t* p_b = detail::data_of<b_t>(b_mem);
    const c_t* p_c = detail::data_of<c_t>(c_mem);
    out_t* p_out = detail::data_of<out_t>(out_mem);

    acc.launch(n, [=](uint64_t i)
    {
        p_out[sycl_utils::idx_of(i, okv)] =
            op(p_a[sycl_utils::idx_of(i, akv)],
               p_b[sycl_utils::idx_of(i, bkv)],
               p_c[sycl_utils::idx_of(i, ckv)]);
    }, {a_mem, b_mem, c_mem, out_mem});
}

/**
 * @brief Ternary map with two results:
 * `(out1[i], out2[i]) = op(a[i], b[i], c[i])`.
 *
 * @p op returns a `std::pair`. Used where two results share most of
 * their computation, such as both gradients of a division.
 *
 * @throws validation_error if the shapes differ.
 */
template <typename a_t, typename b_t, typename c_t,
          typename out1_t, typename out2_t, typename op_t>
void map_op(DeviceQueue& q,
            const Tensor<a_t>& a,
            const Tensor<b_t>& b,
            const Tensor<c_t>& c,
            Tensor<out1_t>& out1,
            Tensor<out2_t>& out2,
            op_t op)
{
    const StridedView av = a.get_view();
    const StridedView bv = b.get_view();
    const StridedView cv = c.get_view();
    const StridedView o1v = out1.get_view();
    const StridedView o2v = out2.get_view();
    detail::check_shape(av, o1v, "map_op");
    detail::check_shape(bv, o1v, "map_op");
    detail::check_shape(cv, o1v, "map_op");
    detail::check_shape(o2v, o1v, "map_op");

    const Order order = o1v.get_order();

    const uint64_t n = o1v.get_num_elements();
    std::shared_ptr<const DeviceMemory> a_mem = a.read(q);
    std::shared_ptr<const DeviceMemory> b_mem = b.read(q);
    std::shared_ptr<const DeviceMemory> c_mem = c.read(q);
    std::shared_ptr<DeviceMemory> o1_mem = out1.read_write(q);
    std::shared_ptr<DeviceMemory> o2_mem = out2.read_write(q);

    if (q.uses_cpu())
    {
        const bool flat = detail::flat_compatible({&av, &bv, &cv, &o1v, &o2v});
        detail::log_dispatch("map_op2", n, q, flat);

        q.submit([a_mem, b_mem, c_mem, o1_mem, o2_mem,
                  av, bv, cv, o1v, o2v, n, flat, order, op]()
        {
            const a_t* p_a = detail::data_of<a_t>(a_mem);
            const b_t* p_b = detail::data_of<b_t>(b_mem);
            const c_t* p_c = detail::data_of<c_t>(c_mem);
            out1_t* p_o1 = detail::data_of<out1_t>(o1_mem);
            out2_t* p_o2 = detail::data_of<out2_t>(o2_mem);
            if (flat)
            {
                const uint64_t a0 = av.get_offset();
                const uint64_t b0 = bv.get_offset();
                const uint64_t c0 = cv.get_offset();
                const uint64_t r0 = o1v.get_offset();
                const uint64_t s0 = o2v.get_offset();
                for (uint64_t i = 0; i < n; ++i)
                {
                    const auto r = op(p_a[a0 + i], p_b[b0 + i], p_c[c0 + i]);
                    p_o1[r0 + i] = r.first;
                    p_o2[s0 + i] = r.second;
                }
                return;
            }

            StridedSequence a_seq = av.sequential(order);
            StridedSequence b_seq = bv.sequential(order);
            StridedSequence c_seq = cv.sequential(order);
            StridedSequence r_seq = o1v.sequential(order);
            StridedSequence s_seq = o2v.sequential(order);
            auto ia = a_seq.begin();
            auto ib = b_seq.begin();
            auto ic = c_seq.begin();
            auto is = s_seq.begin();
            for (auto ir = r_seq.begin(); ir != r_seq.end();
                 ++ir, ++is, ++ia, ++ib, ++ic)
            {
                const auto r = op(p_a[*ia], p_b[*ib], p_c[*ic]);
                p_o1[*ir] = r.first;
                p_o2[*is] = r.second;
            }
        });
        return;
    }

    AcceleratorQueue& acc = detail::as_accelerator(q);
    detail::log_dispatch("map_op2", n, q, false);

    const sycl_utils::KernelView akv = sycl_utils::make_kernel_view(av, order);
    const sycl_utils::KernelView bkv = sycl_utils::make_kernel_view(bv, order);
    const sycl_utils::KernelView ckv = sycl_utils::make_kernel_view(cv, order);
    const sycl_utils::KernelView rkv = sycl_utils::make_kernel_view(o1v, order);
    const sycl_utils::KernelView skv = sycl_utils::make_kernel_view(o2v, order);
    const a_t* p_a = detail::data_of<a_t>(a_mem);
    const b_t* p_b = detail::data_of<b_t>(b_mem);
    const c_t* p_c = detail::data_of<c_t>(c_mem);
    out1_t* p_o1 = detail::data_of<out1_t>(o1_mem);
    out2_t* p_o2 = detail::data_of<out2_t>(o2_mem);

    acc.launch(n, [=](uint64_t i)
    {
        const auto r = op(p_a[sycl_utils::idx_of(i, akv)],
                          p_b[sycl_utils::idx_of(i, bkv)],
                          p_c[sycl_utils::idx_of(i, ckv)]);
        p_o1[sycl_utils::idx_of(i, rkv)] = r.first;
        p_o2[sycl_utils::idx_of(i, skv)] = r.second;
    }, {a_mem, b_mem, c_mem, o1_mem, o2_mem});
}

/**
 * @brief Reduction: folds every element of @p x into the element of
 * @p out it projects onto, then applies @p finish once per result.
 *
 * @p out must have the rank of @p x, with every extent either equal to
 * the one of @p x (kept axis) or 1 (reduced axis). It holds the seed of
 * the fold on entry: `out[j] = finish(fold(...fold(out[j], x[i0])..., x[ik]))`.
 *
 * On a CPU queue the result view is broadcast to the shape of @p x (stride
 * 0 along reduced axes) and walked together with @p x. On an accelerator
 * each work item owns one result element and loops over its reduced
 * elements.
 *
 * @throws validation_error if @p out does not match the projection.
 */
template <typename x_t, typename out_t, typename fold_t, typename finish_t>
void reduction_op(DeviceQueue& q,
                  const Tensor<x_t>& x,
                  Tensor<out_t>& out,
                  fold_t fold,
                  finish_t finish)
{
    const StridedView xv = x.get_view();
    const StridedView ov = out.get_view();

    STRATUM_CHECK(xv.get_rank() != ov.get_rank(),
        validation_error,
        R"(reduction_op: result rank must match the input rank.)");

    std::vector<uint64_t> reduced_shape(xv.get_shape());
    for (uint64_t d = 0; d < xv.get_rank(); ++d)
    {
        const uint64_t xe = xv.get_shape()[d];
        const uint64_t oe = ov.get_shape()[d];
        STRATUM_CHECK(oe != xe && oe != 1,
            validation_error,
            R"(reduction_op: result extent must equal the input
                extent or be 1.)");
        if (oe == xe && xe != 1)
        {
            reduced_shape[d] = 1;
        }
    }

    const Order order = xv.get_order();
    std::shared_ptr<const DeviceMemory> x_mem = x.read(q);
    std::shared_ptr<DeviceMemory> out_mem = out.read_write(q);

    if (q.uses_cpu())
    {
        detail::log_dispatch("reduction_op", xv.get_num_elements(), q, false);

        q.submit([x_mem, out_mem, xv, ov, order, fold, finish]()
        {
            const x_t* p_x = detail::data_of<x_t>(x_mem);
            out_t* p_out = detail::data_of<out_t>(out_mem);

            const StridedView bv = ov.broadcast_to(xv.get_shape());
            StridedSequence x_seq = xv.sequential(order);
            StridedSequence b_seq = bv.sequential(order);
            auto ib = b_seq.begin();
            for (auto ix = x_seq.begin(); ix != x_seq.end(); ++ix, ++ib)
            {
                p_out[*ib] = fold(p_out[*ib], p_x[*ix]);
            }

            for (uint64_t off : ov.sequential(order))
            {
                p_out[off] = finish(p_out[off]);
            }
        });
        return;
    }

    AcceleratorQueue& acc = detail::as_accelerator(q);
    detail::log_dispatch("reduction_op", xv.get_num_elements(), q, false);

    const uint64_t n_out = ov.get_num_elements();
    const uint64_t n_reduced = utils::element_count(reduced_shape);

    // Result element i starts at idx_of(i, outer) in x; its reduced
    // elements sit at relative offsets idx_of(r, inner).
    const sycl_utils::KernelView okv = sycl_utils::make_kernel_view(ov, order);
    const sycl_utils::KernelView outer = sycl_utils::make_kernel_view(
        StridedView(ov.get_shape(), xv.get_strides(), xv.get_offset()), order);
    const sycl_utils::KernelView inner = sycl_utils::make_kernel_view(
        StridedView(reduced_shape, xv.get_strides(), 0), order);

    const x_t* p_x = detail::data_of<x_t>(x_mem);
    out_t* p_out = detail::data_of<out_t>(out_mem);

    acc.launch(n_out, [=](uint64_t i)
    {
        const uint64_t o = sycl_utils::idx_of(i, okv);
        const uint64_t base = sycl_utils::idx_of(i, outer);
        out_t acc_v = p_out[o];
        for (uint64_t r = 0; r < n_reduced; ++r)
        {
            acc_v = fold(acc_v, p_x[base + sycl_utils::idx_of(r, inner)]);
        }
        p_out[o] = finish(acc_v);
    }, {x_mem, out_mem});
}

/**
 * @brief Reduction without a finishing transform.
 */
template <typename x_t, typename out_t, typename fold_t>
void reduction_op(DeviceQueue& q,
                  const Tensor<x_t>& x,
                  Tensor<out_t>& out,
                  fold_t fold)
{
    reduction_op(q, x, out, fold, [](out_t v) { return v; });
}

} // namespace stratum

#endif // STRATUM_MAPOPS_HPP
