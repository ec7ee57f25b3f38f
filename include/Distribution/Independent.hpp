#pragma once
//
// Created by moinshaikh on 2/22/26.
//

#ifndef REPLICATE_INDEPENDENT_HPP
#define REPLICATE_INDEPENDENT_HPP

#include<memory>

#include<torch/torch.h>
#include<c10/util/ArrayRef.h>
#include"Distribution.hpp"

namespace Replicate
{
    /**
     * @class Independent
     * @brief Reinterprets the trailing batch dimensions of a distribution as event dimensions.
     *
     * Given a base with batch shape B and event shape E, and k reinterpreted dimensions, the
     * batch shape becomes B[:-k] and the event shape B[-k:] ++ E. Log densities are summed over
     * the reinterpreted dimensions; samples are those of the base.
     *
     * The default event space bijector is the base's, unchanged. It is not lifted the way
     * SampleDistribution lifts its base's bijector, so its log-det-Jacobian does not
     * broadcast size-1 inputs up to the base batch shape.
     */
    class Independent : public Distribution
    {
    private:
        std::shared_ptr<Distribution> base;  ///< The wrapped distribution
        int64_t reinterpretedBatchNdims;     ///< Number of trailing base batch dims moved into the event
        bool useKahanSum;                    ///< Compensated reduction of log densities

        std::vector<int64_t> reinterpretedAxes() const;
    public:
        /**
         * @param base The distribution whose batch dimensions are reinterpreted.
         * @param reinterpretedBatchNdims How many trailing batch dimensions become event dimensions.
         * @param useKahanSum Sum log densities with compensated summation.
         *
         * @throws std::runtime_error If @p base is null or @p reinterpretedBatchNdims is not positive.
         * @throws ShapeError If the base has a fixed batch shape of lower rank.
         */
        Independent(std::shared_ptr<Distribution> base, int64_t reinterpretedBatchNdims, bool useKahanSum = false);

        std::optional<Shape> batchShape() const override;
        std::optional<Shape> eventShape() const override;
        torch::Tensor batchShapeTensor() const override;
        torch::Tensor eventShapeTensor() const override;

        torch::Tensor sample(c10::ArrayRef<int64_t> sample_shape = {},
                             c10::optional<at::Generator> generator = c10::nullopt) override;

        torch::Tensor logProbability(torch::Tensor value) override;
        torch::Tensor unnormalizedLogProbability(torch::Tensor value) override;

        /**
         * @brief Sum of the base entropies over the reinterpreted dimensions.
         */
        torch::Tensor entropy() override;
        torch::Tensor mean() override;
        torch::Tensor variance() override;
        torch::Tensor stddev() override;
        torch::Tensor mode() override;

        std::shared_ptr<Bijector> defaultEventSpaceBijector() const override;

        inline std::string name() const override
        {
            return "Independent";
        }

        inline const std::shared_ptr<Distribution> &getBase() const
        {
            return base;
        }

        inline int64_t getReinterpretedBatchNdims() const
        {
            return reinterpretedBatchNdims;
        }
    };
}

#endif //REPLICATE_INDEPENDENT_HPP
