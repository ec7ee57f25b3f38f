#pragma once
//
// Created by moinshaikh on 2/18/26.
//

#ifndef REPLICATE_EXP_HPP
#define REPLICATE_EXP_HPP

#include"Bijector.hpp"

namespace Replicate
{
    /**
     * @class Exp
     * @brief y = exp(x), mapping R onto the positive reals.
     */
    class Exp : public Bijector
    {
    public:
        torch::Tensor forward(const torch::Tensor &x) const override;
        torch::Tensor inverse(const torch::Tensor &y) const override;

        inline int64_t forwardMinEventNdims() const override { return 0; }
        inline int64_t inverseMinEventNdims() const override { return 0; }
        inline std::string name() const override { return "Exp"; }

    protected:
        torch::Tensor forwardLogDetJacobianImpl(const torch::Tensor &x) const override;
        torch::Tensor inverseLogDetJacobianImpl(const torch::Tensor &y) const override;
    };
}

#endif //REPLICATE_EXP_HPP
