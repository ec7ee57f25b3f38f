#pragma once
//
// Created by moinshaikh on 2/23/26.
//

#ifndef REPLICATE_SAMPLEBIJECTOR_HPP
#define REPLICATE_SAMPLEBIJECTOR_HPP

#include<memory>

#include"Bijector.hpp"
#include"../Distribution/Distribution.hpp"
#include"../Shape/ShapeValidator.hpp"

namespace Replicate
{
    /**
     * @class SampleBijector
     * @brief The default event space bijector of a SampleDistribution.
     *
     * Lifts the base distribution's bijector to tensors laid out as prefix ++ batch ++ sample ++
     * event. Before the inner bijector runs, the sample axes are moved in front of the batch axes
     * so that per-batch parameters of the inner bijector broadcast against the batch axes; the
     * result is moved back afterwards.
     *
     * The sample shape and the base shapes are read once at the start of every call, so a
     * Variable backed sample shape is honoured exactly like SampleDistribution honours it.
     *
     * Log-det-Jacobians are expanded to the full sample shape before the sample axes are summed,
     * so an input with size-1 sample axes counts every replicate.
     */
    class SampleBijector : public Bijector
    {
    private:
        std::shared_ptr<Distribution> base;   ///< Distribution whose shapes drive the layout
        std::shared_ptr<Bijector> inner;      ///< The base distribution's bijector
        SampleShape sampleShape;              ///< Replicate shape of the owning SampleDistribution
        bool useKahanSum;                     ///< Compensated reduction over the sample axes

        struct Snapshot
        {
            Shape sample;      ///< K
            Shape batch;       ///< Base batch shape
            Shape event;       ///< Base event shape (constrained side)
            Shape inputEvent;  ///< inner.inverseEventShape(event) (unconstrained side)
        };

        Snapshot snapshot() const;

        /// Moves the sample axes of a batch-major tensor in front of its batch axes.
        static torch::Tensor toSampleMajor(const torch::Tensor &value, const Snapshot &shapes, int64_t eventNdims,
                                           int64_t &prefixNdims);

        /// Moves the sample axes of a sample-major tensor back behind its batch axes.
        static torch::Tensor toBatchMajor(const torch::Tensor &value, const Snapshot &shapes, int64_t prefixNdims);

        /// Keeps the leading dimensions and K of @p shape and maps the trailing inner event with the inner bijector.
        Shape mapEventShape(const Shape &shape, int64_t sampleNdims, int64_t innerNdims, bool forward) const;

        /// Expands an inner log-det-Jacobian to prefix ++ K ++ B and sums it down to the caller's event rank.
        torch::Tensor liftLogDetJacobian(const torch::Tensor &logDetJacobian, const torch::Tensor &permuted,
                                         const Snapshot &shapes, int64_t prefixNdims, int64_t extraNdims) const;
    public:
        /**
         * @param base The replicated distribution.
         * @param sampleShape The replicate shape.
         * @param useKahanSum Sum Jacobians over the sample axes with compensated summation.
         *
         * @throws UnsupportedStatisticError If the base has no default event space bijector.
         */
        SampleBijector(std::shared_ptr<Distribution> base, SampleShape sampleShape, bool useKahanSum);

        torch::Tensor forward(const torch::Tensor &x) const override;
        torch::Tensor inverse(const torch::Tensor &y) const override;

        torch::Tensor forwardLogDetJacobian(const torch::Tensor &x, int64_t eventNdims) const override;
        torch::Tensor inverseLogDetJacobian(const torch::Tensor &y, int64_t eventNdims) const override;

        /**
         * @brief Maps prefix ++ K ++ inner input event to prefix ++ K ++ inner output event.
         *
         * K and the base shapes are read once for the whole query.
         */
        Shape forwardEventShape(const Shape &inputShape) const override;
        Shape inverseEventShape(const Shape &outputShape) const override;

        int64_t forwardMinEventNdims() const override;
        int64_t inverseMinEventNdims() const override;

        inline bool isConstantJacobian() const override
        {
            return inner->isConstantJacobian();
        }

        inline std::string name() const override
        {
            return "Sample" + inner->name();
        }

        inline const std::shared_ptr<Bijector> &getInner() const
        {
            return inner;
        }

    };
}

#endif //REPLICATE_SAMPLEBIJECTOR_HPP
