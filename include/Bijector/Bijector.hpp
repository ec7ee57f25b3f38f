#pragma once
//
// Created by moinshaikh on 2/18/26.
//

#ifndef REPLICATE_BIJECTOR_HPP
#define REPLICATE_BIJECTOR_HPP

#include<memory>
#include<string>

#include<torch/torch.h>

#include"../Shape/ShapeAlgebra.hpp"

namespace Replicate
{
    /**
     * @class Bijector
     * @brief Abstract base class for invertible, differentiable transforms.
     *
     * A bijector maps an unconstrained x to a constrained y = forward(x). Each one declares the
     * minimum number of trailing dimensions it treats as a single event on either side; all
     * leading dimensions are batch-like and are carried through unchanged. Bijectors that change
     * rank (e.g. vector to matrix) have different forward and inverse minimum event ranks.
     *
     * Log-det-Jacobian terms are computed at the minimum event rank by the subclass and then
     * summed over any further dimensions requested through @p eventNdims.
     *
     * @see SampleBijector
     */
    class Bijector
    {
    public:
        virtual ~Bijector() = default;

        virtual torch::Tensor forward(const torch::Tensor &x) const = 0;

        virtual torch::Tensor inverse(const torch::Tensor &y) const = 0;

        /**
         * @brief log|det J_forward(x)| summed over the trailing @p eventNdims dimensions of x.
         *
         * @throws ShapeError If @p eventNdims is below forwardMinEventNdims().
         */
        virtual torch::Tensor forwardLogDetJacobian(const torch::Tensor &x, int64_t eventNdims) const;

        /**
         * @brief log|det J_inverse(y)| summed over the trailing @p eventNdims dimensions of y.
         *
         * @throws ShapeError If @p eventNdims is below inverseMinEventNdims().
         */
        virtual torch::Tensor inverseLogDetJacobian(const torch::Tensor &y, int64_t eventNdims) const;

        virtual int64_t forwardMinEventNdims() const = 0;

        virtual int64_t inverseMinEventNdims() const = 0;

        /**
         * @brief Shape of forward(x) given the shape of x.
         *
         * Only the trailing forwardMinEventNdims() dimensions are transformed.
         */
        virtual Shape forwardEventShape(const Shape &inputShape) const;

        /**
         * @brief Shape of inverse(y) given the shape of y.
         */
        virtual Shape inverseEventShape(const Shape &outputShape) const;

        /**
         * @brief True when the Jacobian does not depend on the input, e.g. Scale.
         */
        virtual bool isConstantJacobian() const
        {
            return false;
        }

        virtual std::string name() const = 0;

    protected:
        /// Maps an event shape of exactly forwardMinEventNdims() dimensions. Identity by default.
        virtual Shape forwardEventShapeImpl(const Shape &eventShape) const;

        /// Maps an event shape of exactly inverseMinEventNdims() dimensions. Identity by default.
        virtual Shape inverseEventShapeImpl(const Shape &eventShape) const;

        /// Forward log-det-Jacobian at the minimum event rank. Defaults to -inverse(forward(x)).
        virtual torch::Tensor forwardLogDetJacobianImpl(const torch::Tensor &x) const;

        /// Inverse log-det-Jacobian at the minimum event rank. Defaults to -forward(inverse(y)).
        virtual torch::Tensor inverseLogDetJacobianImpl(const torch::Tensor &y) const;

        /**
         * @brief Sums a log-det-Jacobian over @p extraNdims dimensions beyond the minimum event rank.
         *
         * @param logDetJacobian Term computed at the minimum event rank. It may be smaller than
         *        @p batchLikeShape (a constant Jacobian is parameter shaped).
         * @param batchLikeShape Shape of the input with the minimum event dimensions removed.
         * @param extraNdims Number of trailing dimensions of @p batchLikeShape to sum over.
         */
        static torch::Tensor reduceLogDetJacobian(const torch::Tensor &logDetJacobian,
                                                  const Shape &batchLikeShape,
                                                  int64_t extraNdims);
    };
}

#endif //REPLICATE_BIJECTOR_HPP
