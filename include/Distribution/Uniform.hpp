#pragma once
//
// Created by moinshaikh on 2/20/26.
//

#ifndef REPLICATE_UNIFORM_HPP
#define REPLICATE_UNIFORM_HPP

#include<torch/torch.h>
#include<c10/util/ArrayRef.h>
#include"Distribution.hpp"
#include"../Variable.hpp"

namespace Replicate
{
    /**
     * @class Uniform
     * @brief Continuous uniform distribution on [low, high).
     *
     * low and high broadcast against each other to give the batch shape. The mode is not
     * unique and is therefore not provided.
     */
    class Uniform : public Distribution
    {
    private:
        Parameter low;   ///< Inclusive lower bound
        Parameter high;  ///< Exclusive upper bound
    public:
        Uniform(Parameter low, Parameter high);

        std::optional<Shape> batchShape() const override;
        std::optional<Shape> eventShape() const override;
        torch::Tensor batchShapeTensor() const override;
        torch::Tensor eventShapeTensor() const override;

        /**
         * @brief -log(high - low) inside the support, -inf outside it.
         */
        torch::Tensor logProbability(torch::Tensor value) override;

        torch::Tensor sample(c10::ArrayRef<int64_t> sample_shape = {},
                             c10::optional<at::Generator> generator = c10::nullopt) override;

        torch::Tensor entropy() override;
        torch::Tensor mean() override;
        torch::Tensor variance() override;

        /**
         * @brief Sigmoid onto (low, high).
         */
        std::shared_ptr<Bijector> defaultEventSpaceBijector() const override;

        inline std::string name() const override
        {
            return "Uniform";
        }

        inline torch::Tensor getLow() const
        {
            return low.value();
        }

        inline torch::Tensor getHigh() const
        {
            return high.value();
        }
    };
}

#endif //REPLICATE_UNIFORM_HPP
