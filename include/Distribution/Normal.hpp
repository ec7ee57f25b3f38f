#pragma once
//
// Created by moinshaikh on 1/27/26.
//

#ifndef REPLICATE_NORMAL_HPP
#define REPLICATE_NORMAL_HPP

#include<torch/torch.h>
#include<c10/util/ArrayRef.h>
#include"Distribution.hpp"
#include"../Variable.hpp"



namespace Replicate
{
    /**
     * @class Normal
     * @brief Univariate normal (Gaussian) distribution with a batch of parameters.
     *
     * The distribution is parameterized by mean (loc) and standard deviation (scale)
     * parameters which broadcast against each other to give the batch shape. Events are
     * scalars; wrap in Independent to treat trailing batch dimensions as one event.
     *
     * Either parameter may be backed by a Variable, in which case the batch shape is
     * recomputed on every call.
     *
     * @inherits Distribution
     */
    class Normal : public Distribution
    {
    private:
        Parameter loc;    ///< Mean (location) parameter of the normal distribution
        Parameter scale;  ///< Standard deviation (scale) parameter of the normal distribution
    public:
        /**
         * @brief Constructs a normal distribution with given mean and standard deviation.
         *
         * @param loc The mean (location) parameter. Can be scalar or multi-dimensional.
         * @param scale The standard deviation (scale) parameter. Must broadcast against loc
         *              and contain positive values.
         *
         * @throws ShapeError If loc and scale are fixed and do not broadcast.
         */
        Normal(Parameter loc, Parameter scale);

        std::optional<Shape> batchShape() const override;
        std::optional<Shape> eventShape() const override;
        torch::Tensor batchShapeTensor() const override;
        torch::Tensor eventShapeTensor() const override;

        /**
         * @brief Computes the entropy of the normal distribution.
         *
         * For a normal distribution, entropy = 0.5 * log(2 * pi * e * scale^2)
         *
         * @return torch::Tensor A tensor containing entropy values with shape matching batch_shape
         */
        torch::Tensor entropy() override;

        /**
         * @brief Computes the elementwise log probability density of a value.
         *
         * @param value A tensor representing the value(s) to evaluate. Should have a shape
         *              compatible with the distribution's shape parameters.
         * @return torch::Tensor A tensor of log probabilities with shape [prefix, batch_shape]
         */
        torch::Tensor logProbability(torch::Tensor value) override;

        /**
         * @brief Generates samples from the normal distribution.
         *
         * @param sample_shape The desired number of samples and their dimensions (default: {})
         * @param generator Randomness source (default: global generator)
         * @return torch::Tensor Sampled values with shape [sample_shape, batch_shape]
         */
        torch::Tensor sample(c10::ArrayRef<int64_t> sample_shape = {},
                             c10::optional<at::Generator> generator = c10::nullopt) override;

        torch::Tensor mean() override;
        torch::Tensor variance() override;
        torch::Tensor stddev() override;
        torch::Tensor mode() override;

        /**
         * @brief Identity; the normal distribution is supported on all of R.
         */
        std::shared_ptr<Bijector> defaultEventSpaceBijector() const override;

        inline std::string name() const override
        {
            return "Normal";
        }

        inline torch::Tensor getLoc() const
        {
            return loc.value();
        }

        inline torch::Tensor getScale() const
        {
            return scale.value();
        }
    };
}

#endif //REPLICATE_NORMAL_HPP
