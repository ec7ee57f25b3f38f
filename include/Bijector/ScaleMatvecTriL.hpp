#pragma once
//
// Created by moinshaikh on 2/19/26.
//

#ifndef REPLICATE_SCALEMATVECTRIL_HPP
#define REPLICATE_SCALEMATVECTRIL_HPP

#include"Bijector.hpp"
#include"../Variable.hpp"

namespace Replicate
{
    /**
     * @class ScaleMatvecTriL
     * @brief y = L x for a lower triangular L acting on the last dimension.
     *
     * The inverse is a triangular solve. log|det L| = sum(log|diag(L)|) is constant.
     */
    class ScaleMatvecTriL : public Bijector
    {
    private:
        Parameter scaleTril;  ///< Lower triangular [..., n, n] matrix
    public:
        explicit ScaleMatvecTriL(Parameter scaleTril);

        torch::Tensor forward(const torch::Tensor &x) const override;
        torch::Tensor inverse(const torch::Tensor &y) const override;

        inline int64_t forwardMinEventNdims() const override { return 1; }
        inline int64_t inverseMinEventNdims() const override { return 1; }
        inline bool isConstantJacobian() const override { return true; }
        inline std::string name() const override { return "ScaleMatvecTriL"; }

    protected:
        torch::Tensor forwardLogDetJacobianImpl(const torch::Tensor &x) const override;
    };
}

#endif //REPLICATE_SCALEMATVECTRIL_HPP
