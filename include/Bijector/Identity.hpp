#pragma once
//
// Created by moinshaikh on 2/18/26.
//

#ifndef REPLICATE_IDENTITY_HPP
#define REPLICATE_IDENTITY_HPP

#include"Bijector.hpp"

namespace Replicate
{
    /**
     * @class Identity
     * @brief y = x. The default event space bijector of distributions supported on all of R^n.
     */
    class Identity : public Bijector
    {
    public:
        torch::Tensor forward(const torch::Tensor &x) const override;
        torch::Tensor inverse(const torch::Tensor &y) const override;

        inline int64_t forwardMinEventNdims() const override { return 0; }
        inline int64_t inverseMinEventNdims() const override { return 0; }
        inline bool isConstantJacobian() const override { return true; }
        inline std::string name() const override { return "Identity"; }

    protected:
        torch::Tensor forwardLogDetJacobianImpl(const torch::Tensor &x) const override;
        torch::Tensor inverseLogDetJacobianImpl(const torch::Tensor &y) const override;
    };
}

#endif //REPLICATE_IDENTITY_HPP
