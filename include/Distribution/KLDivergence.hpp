#pragma once
//
// Created by moinshaikh on 2/24/26.
//

#ifndef REPLICATE_KLDIVERGENCE_HPP
#define REPLICATE_KLDIVERGENCE_HPP

#include<functional>
#include<typeindex>

#include<torch/torch.h>
#include"Distribution.hpp"

namespace Replicate
{
    /// Computes KL(p || q) for one pair of concrete distribution types.
    using KLFunction = std::function<torch::Tensor(Distribution &, Distribution &)>;

    /**
     * @brief Registers the KL divergence for the pair (@p p, @p q) of concrete types.
     *
     * A later registration for the same pair replaces the earlier one. (Sample, Sample),
     * (Independent, Independent) and (Normal, Normal) are registered out of the box.
     */
    void registerKLDivergence(std::type_index p, std::type_index q, KLFunction function);

    /**
     * @brief Typed convenience wrapper over registerKLDivergence().
     */
    template<typename P, typename Q>
    void registerKLDivergence(std::function<torch::Tensor(P &, Q &)> function)
    {
        registerKLDivergence(std::type_index(typeid(P)), std::type_index(typeid(Q)),
                             [function](Distribution &p, Distribution &q)
                             {
                                 return function(static_cast<P &>(p), static_cast<Q &>(q));
                             });
    }

    /**
     * @brief KL(p || q), looked up by the dynamic types of @p p and @p q.
     *
     * @return Divergences of shape batch_shape.
     * @throws UnsupportedStatisticError If no function is registered for the pair.
     * @throws ShapeError If both are SampleDistributions with different sample shapes, or both
     *         are Independent with different event shapes.
     */
    torch::Tensor klDivergence(Distribution &p, Distribution &q);
}

#endif //REPLICATE_KLDIVERGENCE_HPP
