#pragma once
//
// Created by moinshaikh on 2/16/26.
//

#ifndef REPLICATE_REDUCTIONENGINE_HPP
#define REPLICATE_REDUCTIONENGINE_HPP

#include<vector>

#include<torch/torch.h>

namespace Replicate
{
    namespace ReductionEngine
    {
        /**
         * @brief Sums per-element log densities over @p axes.
         *
         * @param values Elementwise log densities.
         * @param axes Axes to reduce; negative axes count from the end. Empty returns @p values.
         * @param useCompensatedSum Use kahanSum() instead of a plain torch sum.
         * @return @p values with @p axes removed.
         */
        torch::Tensor reduceLogDensity(const torch::Tensor &values,
                                       const std::vector<int64_t> &axes,
                                       bool useCompensatedSum);

        /**
         * @brief Compensated (Kahan-Babuska) summation over @p axes.
         *
         * Accumulates in the dtype of @p values (half, bfloat16, float or double). The reduced
         * axes are visited in row-major order, last reduced axis fastest, which is the order
         * replicates are generated in; the result is therefore reproducible for a given input.
         */
        torch::Tensor kahanSum(const torch::Tensor &values, const std::vector<int64_t> &axes);
    }
}

#endif //REPLICATE_REDUCTIONENGINE_HPP
