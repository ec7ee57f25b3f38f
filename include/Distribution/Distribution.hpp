#pragma once
//
// Created by moinshaikh on 1/27/26.
//

#ifndef REPLICATE_DISTRIBUTION_HPP
#define REPLICATE_DISTRIBUTION_HPP

#include<memory>
#include<optional>
#include<string>
#include<vector>

#include<c10/util/ArrayRef.h>
#include<torch/torch.h>

#include"../Shape/ShapeAlgebra.hpp"

namespace Replicate
{
    class Bijector;

    /**
     * @class Distribution
     * @brief Abstract base class for probability distributions.
     *
     * The Distribution class defines the capability set every distribution exposes: shape
     * queries, sampling and log density evaluation are required; summary statistics and a
     * default event space bijector are optional and throw UnsupportedStatisticError unless a
     * subclass provides them.
     *
     * Shapes come in two flavours. batchShape()/eventShape() are the static shapes, known
     * without reading any Variable; they are nullopt when a Variable contributes. The
     * batchShapeTensor()/eventShapeTensor() queries always resolve the current shape. Both
     * agree whenever the static shape is known.
     *
     * @see Normal
     * @see Independent
     * @see SampleDistribution
     */
    class Distribution
    {
    protected:
        /**
         * @brief Computes the extended shape for sampling operations.
         *
         * Combines the sample shape, batch shape, and event shape into a single
         * extended shape for tensor operations.
         *
         * @param sampleShapes The desired shape for samples
         * @return Shape The extended shape combining sample, batch, and event shapes
         */
        Shape extendedShape(c10::ArrayRef<int64_t> sampleShapes) const;
    public:
        /**
         * @brief Virtual destructor.
         *
         * Pure virtual destructor to ensure proper cleanup of derived classes.
         */
        virtual ~Distribution() = 0;

        /**
         * @brief Batch shape known without reading any Variable, nullopt otherwise.
         */
        virtual std::optional<Shape> batchShape() const = 0;

        /**
         * @brief Event shape known without reading any Variable, nullopt otherwise.
         */
        virtual std::optional<Shape> eventShape() const = 0;

        /**
         * @brief Current batch shape as an int64 vector tensor.
         */
        virtual torch::Tensor batchShapeTensor() const = 0;

        /**
         * @brief Current event shape as an int64 vector tensor.
         */
        virtual torch::Tensor eventShapeTensor() const = 0;

        /**
         * @brief The static batch shape when there is one, the resolved one otherwise.
         */
        Shape resolvedBatchShape() const;

        /**
         * @brief The static event shape when there is one, the resolved one otherwise.
         */
        Shape resolvedEventShape() const;

        /**
         * @brief Generates samples from the distribution.
         *
         * @param sampleShape The desired number of samples and their dimensions (default: {})
         * @param generator Randomness source; the global default generator when not given
         * @return torch::Tensor A tensor of sampled values with shape [sample_shape, batch_shape, event_shape]
         */
        virtual torch::Tensor sample(c10::ArrayRef<int64_t> sampleShape = {},
                                     c10::optional<at::Generator> generator = c10::nullopt) = 0;

        /**
         * @brief Computes the log probability density/mass of a value under this distribution.
         *
         * @param value A tensor representing the value(s) to evaluate. Should have a shape
         *              compatible with the distribution's shape parameters.
         * @return torch::Tensor A tensor of log probabilities with shape [prefix, batch_shape]
         */
        virtual torch::Tensor logProbability(torch::Tensor value) = 0;

        /**
         * @brief Log density up to an additive constant. Defaults to logProbability().
         */
        virtual torch::Tensor unnormalizedLogProbability(torch::Tensor value);

        /**
         * @brief Computes the entropy of the distribution.
         *
         * @return torch::Tensor A tensor containing entropy values with shape matching batch_shape
         * @throws UnsupportedStatisticError Unless overridden.
         */
        virtual torch::Tensor entropy();

        /// @throws UnsupportedStatisticError Unless overridden.
        virtual torch::Tensor mean();

        /// @throws UnsupportedStatisticError Unless overridden.
        virtual torch::Tensor variance();

        /// Square root of variance() unless overridden.
        virtual torch::Tensor stddev();

        /// @throws UnsupportedStatisticError Unless overridden.
        virtual torch::Tensor mode();

        /**
         * @brief Bijector from unconstrained space onto the support of this distribution.
         *
         * @throws UnsupportedStatisticError Unless overridden.
         */
        virtual std::shared_ptr<Bijector> defaultEventSpaceBijector() const;

        virtual std::string name() const = 0;
    };

    inline Distribution::~Distribution() {

    }
}

#endif //REPLICATE_DISTRIBUTION_HPP
