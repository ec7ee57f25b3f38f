#pragma once
//
// Created by moinshaikh on 2/19/26.
//

#ifndef REPLICATE_CHAIN_HPP
#define REPLICATE_CHAIN_HPP

#include<memory>
#include<vector>

#include"Bijector.hpp"

namespace Replicate
{
    /**
     * @class Chain
     * @brief Composition of bijectors, applied right to left.
     *
     * Chain({f, g}).forward(x) is f(g(x)). Event ranks are tracked through every stage so
     * rank changing members (such as CorrelationCholesky) compose with elementwise ones.
     */
    class Chain : public Bijector
    {
    private:
        std::vector<std::shared_ptr<Bijector>> bijectors;  ///< Members, outermost first
        int64_t forwardMinNdims;                           ///< Derived from the members
        int64_t inverseMinNdims;                           ///< Derived from the members
    public:
        explicit Chain(std::vector<std::shared_ptr<Bijector>> bijectors);

        torch::Tensor forward(const torch::Tensor &x) const override;
        torch::Tensor inverse(const torch::Tensor &y) const override;

        inline int64_t forwardMinEventNdims() const override { return forwardMinNdims; }
        inline int64_t inverseMinEventNdims() const override { return inverseMinNdims; }
        bool isConstantJacobian() const override;
        inline std::string name() const override { return "Chain"; }

        inline const std::vector<std::shared_ptr<Bijector>> &getBijectors() const
        {
            return bijectors;
        }

    protected:
        Shape forwardEventShapeImpl(const Shape &eventShape) const override;
        Shape inverseEventShapeImpl(const Shape &eventShape) const override;
        torch::Tensor forwardLogDetJacobianImpl(const torch::Tensor &x) const override;
        torch::Tensor inverseLogDetJacobianImpl(const torch::Tensor &y) const override;
    };
}

#endif //REPLICATE_CHAIN_HPP
