#pragma once
//
// Created by moinshaikh on 2/20/26.
//

#ifndef REPLICATE_POISSON_HPP
#define REPLICATE_POISSON_HPP

#include<torch/torch.h>
#include<c10/util/ArrayRef.h>
#include"Distribution.hpp"
#include"../Variable.hpp"

namespace Replicate
{
    /**
     * @class Poisson
     * @brief Poisson distribution over non-negative integer counts.
     *
     * The distribution can be parameterized by its rate or by the log of its rate; exactly one
     * of the two must be given. Counts are represented in the floating dtype of the parameter.
     *
     * Entropy has no closed form and no default event space bijector exists for a discrete
     * support; both throw UnsupportedStatisticError.
     */
    class Poisson : public Distribution
    {
    private:
        Parameter param;  ///< Primary parameterization (either rate or logRate)
        bool isLogRate;   ///< True when param holds the log of the rate
    public:
        /**
         * @brief Constructs a Poisson distribution.
         *
         * @param rate Pointer to the rate parameter. Can be nullptr if logRate is provided.
         * @param logRate Pointer to the log rate parameter. Can be nullptr if rate is provided.
         * @throws std::runtime_error If both or neither of rate and logRate are provided.
         */
        Poisson(const Parameter *rate, const Parameter *logRate);

        std::optional<Shape> batchShape() const override;
        std::optional<Shape> eventShape() const override;
        torch::Tensor batchShapeTensor() const override;
        torch::Tensor eventShapeTensor() const override;

        /**
         * @brief x log(rate) - rate - log(x!).
         */
        torch::Tensor logProbability(torch::Tensor value) override;

        torch::Tensor sample(c10::ArrayRef<int64_t> sample_shape = {},
                             c10::optional<at::Generator> generator = c10::nullopt) override;

        torch::Tensor mean() override;
        torch::Tensor variance() override;
        torch::Tensor mode() override;

        inline std::string name() const override
        {
            return "Poisson";
        }

        torch::Tensor getRate() const;

        torch::Tensor getLogRate() const;
    };
}

#endif //REPLICATE_POISSON_HPP
