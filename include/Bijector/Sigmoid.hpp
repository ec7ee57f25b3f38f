#pragma once
//
// Created by moinshaikh on 2/18/26.
//

#ifndef REPLICATE_SIGMOID_HPP
#define REPLICATE_SIGMOID_HPP

#include"Bijector.hpp"
#include"../Variable.hpp"

namespace Replicate
{
    /**
     * @class Sigmoid
     * @brief y = low + (high - low) * sigmoid(x), mapping R onto (low, high).
     *
     * low and high carry the batch shape of the Uniform distribution this bijector comes from,
     * so inputs must broadcast against them from the right.
     */
    class Sigmoid : public Bijector
    {
    private:
        Parameter low;   ///< Lower bound of the image
        Parameter high;  ///< Upper bound of the image
    public:
        Sigmoid(Parameter low, Parameter high);

        torch::Tensor forward(const torch::Tensor &x) const override;
        torch::Tensor inverse(const torch::Tensor &y) const override;

        inline int64_t forwardMinEventNdims() const override { return 0; }
        inline int64_t inverseMinEventNdims() const override { return 0; }
        inline std::string name() const override { return "Sigmoid"; }

    protected:
        torch::Tensor forwardLogDetJacobianImpl(const torch::Tensor &x) const override;
    };
}

#endif //REPLICATE_SIGMOID_HPP
