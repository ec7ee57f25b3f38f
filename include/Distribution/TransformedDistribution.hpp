#pragma once
//
// Created by moinshaikh on 2/22/26.
//

#ifndef REPLICATE_TRANSFORMEDDISTRIBUTION_HPP
#define REPLICATE_TRANSFORMEDDISTRIBUTION_HPP

#include<memory>

#include<torch/torch.h>
#include<c10/util/ArrayRef.h>
#include"Distribution.hpp"
#include"../Bijector/Bijector.hpp"

namespace Replicate
{
    /**
     * @class TransformedDistribution
     * @brief The push-forward of a distribution through a bijector.
     *
     * Samples are bijector.forward(base samples). The log density of y is the base log density
     * of bijector.inverse(y) plus the inverse log-det-Jacobian taken over the whole event.
     */
    class TransformedDistribution : public Distribution
    {
    private:
        std::shared_ptr<Distribution> base;  ///< Distribution before the transform
        std::shared_ptr<Bijector> bijector;  ///< Transform applied to samples of the base
    public:
        /**
         * @throws std::runtime_error If either argument is null.
         */
        TransformedDistribution(std::shared_ptr<Distribution> base, std::shared_ptr<Bijector> bijector);

        std::optional<Shape> batchShape() const override;
        std::optional<Shape> eventShape() const override;
        torch::Tensor batchShapeTensor() const override;
        torch::Tensor eventShapeTensor() const override;

        torch::Tensor sample(c10::ArrayRef<int64_t> sample_shape = {},
                             c10::optional<at::Generator> generator = c10::nullopt) override;

        torch::Tensor logProbability(torch::Tensor value) override;

        /**
         * @brief Chain of the transform after the base's own event space bijector.
         */
        std::shared_ptr<Bijector> defaultEventSpaceBijector() const override;

        inline std::string name() const override
        {
            return "Transformed" + base->name();
        }

        inline const std::shared_ptr<Distribution> &getBase() const
        {
            return base;
        }

        inline const std::shared_ptr<Bijector> &getBijector() const
        {
            return bijector;
        }
    };
}

#endif //REPLICATE_TRANSFORMEDDISTRIBUTION_HPP
