#pragma once
//
// Created by moinshaikh on 2/18/26.
//

#ifndef REPLICATE_SCALE_HPP
#define REPLICATE_SCALE_HPP

#include"Bijector.hpp"
#include"../Variable.hpp"

namespace Replicate
{
    /**
     * @class Scale
     * @brief y = scale * x, elementwise.
     *
     * The log-det-Jacobian log|scale| is constant and has the shape of @p scale, not of x.
     */
    class Scale : public Bijector
    {
    private:
        Parameter scale;  ///< Multiplier, broadcast against the input
    public:
        explicit Scale(Parameter scale);

        torch::Tensor forward(const torch::Tensor &x) const override;
        torch::Tensor inverse(const torch::Tensor &y) const override;

        inline int64_t forwardMinEventNdims() const override { return 0; }
        inline int64_t inverseMinEventNdims() const override { return 0; }
        inline bool isConstantJacobian() const override { return true; }
        inline std::string name() const override { return "Scale"; }

        inline torch::Tensor getScale() const
        {
            return scale.value();
        }

    protected:
        torch::Tensor forwardLogDetJacobianImpl(const torch::Tensor &x) const override;
    };
}

#endif //REPLICATE_SCALE_HPP
