#pragma once
//
// Created by moinshaikh on 2/23/26.
//

#ifndef REPLICATE_SAMPLEDISTRIBUTION_HPP
#define REPLICATE_SAMPLEDISTRIBUTION_HPP

#include<memory>
#include<string>

#include<torch/torch.h>
#include<c10/util/ArrayRef.h>
#include"Distribution.hpp"
#include"../Shape/ShapeValidator.hpp"

namespace Replicate
{
    /**
     * @brief Construction options of a SampleDistribution.
     */
    struct SampleOptions
    {
        bool useKahanSum = false;    ///< Reduce log densities and Jacobians with compensated summation
        std::string name = "Sample"; ///< Name reported by name() and in log messages
    };

    /**
     * @class SampleDistribution
     * @brief Joint distribution of K i.i.d. draws from a base distribution.
     *
     * With a base of batch shape B and event shape E, and a sample shape K, the result has
     * batch shape B and event shape K ++ E. Each batch member is replicated independently, so
     * tensors seen by callers are laid out as prefix ++ B ++ K ++ E while the base draws and
     * evaluates in prefix ++ K ++ B ++ E. Every operation moves the K axes between the two.
     *
     * The sample shape may be backed by a Variable. It is then read, and validated, once at the
     * start of every operation together with the base shapes, and every shape computed during
     * that operation derives from that one reading.
     *
     * @see SampleBijector
     */
    class SampleDistribution : public Distribution
    {
    private:
        std::shared_ptr<Distribution> base;  ///< Replicated distribution
        SampleShape sampleShape;             ///< Replicate shape K
        SampleOptions options;               ///< Reduction mode and name

        /// One reading of every shape an operation needs.
        struct Snapshot
        {
            Shape sample;  ///< K
            Shape batch;   ///< B
            Shape event;   ///< Base event shape E
        };

        Snapshot snapshot() const;

        /// Broadcasts a B ++ E statistic of the base to B ++ K ++ E.
        static torch::Tensor replicateStatistic(const torch::Tensor &statistic, const Snapshot &shapes);

        torch::Tensor reduceReplicates(const torch::Tensor &value, bool normalized);
    public:
        /**
         * @brief Constructs a SampleDistribution.
         *
         * @param base Distribution to replicate.
         * @param sampleShape Replicate shape; a fixed one is validated here, a Variable backed
         *        one on every use.
         * @param options Reduction mode and name.
         *
         * @throws std::runtime_error If @p base is null.
         * @throws ShapeError If a fixed @p sampleShape is invalid.
         */
        SampleDistribution(std::shared_ptr<Distribution> base, SampleShape sampleShape,
                           SampleOptions options = SampleOptions());

        std::optional<Shape> batchShape() const override;
        std::optional<Shape> eventShape() const override;
        torch::Tensor batchShapeTensor() const override;
        torch::Tensor eventShapeTensor() const override;

        /**
         * @brief Draws prefix ++ B ++ K ++ E shaped samples.
         *
         * @details Asks the base for sample_shape ++ K draws and moves the K axes behind the
         * batch axes.
         */
        torch::Tensor sample(c10::ArrayRef<int64_t> sample_shape = {},
                             c10::optional<at::Generator> generator = c10::nullopt) override;

        /**
         * @brief Joint log density of the K replicates.
         *
         * @param value Broadcastable against B ++ K ++ E from the right; size-1 axes stand for
         *        every replicate along them.
         * @return Log densities of shape prefix ++ B.
         * @throws ShapeError If @p value does not broadcast against the batch and event shapes.
         */
        torch::Tensor logProbability(torch::Tensor value) override;
        torch::Tensor unnormalizedLogProbability(torch::Tensor value) override;

        /// prod(K) times the base entropy.
        torch::Tensor entropy() override;
        torch::Tensor mean() override;
        torch::Tensor variance() override;
        torch::Tensor stddev() override;
        torch::Tensor mode() override;

        /**
         * @brief The base's bijector lifted to the replicated layout.
         *
         * @throws UnsupportedStatisticError If the base has none.
         */
        std::shared_ptr<Bijector> defaultEventSpaceBijector() const override;

        inline std::string name() const override
        {
            return options.name;
        }

        inline const std::shared_ptr<Distribution> &getBase() const
        {
            return base;
        }

        inline const SampleShape &getSampleShape() const
        {
            return sampleShape;
        }

        inline bool usesKahanSum() const
        {
            return options.useKahanSum;
        }
    };
}

#endif //REPLICATE_SAMPLEDISTRIBUTION_HPP
