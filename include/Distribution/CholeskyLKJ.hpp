#pragma once
//
// Created by moinshaikh on 2/21/26.
//

#ifndef REPLICATE_CHOLESKYLKJ_HPP
#define REPLICATE_CHOLESKYLKJ_HPP

#include<torch/torch.h>
#include<c10/util/ArrayRef.h>
#include"Distribution.hpp"
#include"../Variable.hpp"

namespace Replicate
{
    /**
     * @class CholeskyLKJ
     * @brief LKJ distribution over Cholesky factors of correlation matrices.
     *
     * Events are lower triangular [dimension, dimension] matrices L with a positive diagonal
     * such that L L^T has a unit diagonal. The batch shape is the shape of the concentration.
     * A concentration of 1 is uniform over correlation matrices.
     *
     * Its default event space bijector is CorrelationCholesky, which changes rank, making this
     * the distribution used to exercise rank changing bijectors.
     */
    class CholeskyLKJ : public Distribution
    {
    private:
        int64_t dimension;        ///< Size of the correlation matrices
        Parameter concentration;  ///< Shape parameter, one per batch member
    public:
        /**
         * @throws std::runtime_error If @p dimension is below 1.
         */
        CholeskyLKJ(int64_t dimension, Parameter concentration);

        std::optional<Shape> batchShape() const override;
        std::optional<Shape> eventShape() const override;
        torch::Tensor batchShapeTensor() const override;
        torch::Tensor eventShapeTensor() const override;

        torch::Tensor logProbability(torch::Tensor value) override;

        /**
         * @brief Draws Cholesky factors with the onion method.
         */
        torch::Tensor sample(c10::ArrayRef<int64_t> sample_shape = {},
                             c10::optional<at::Generator> generator = c10::nullopt) override;

        std::shared_ptr<Bijector> defaultEventSpaceBijector() const override;

        inline std::string name() const override
        {
            return "CholeskyLKJ";
        }

        inline int64_t getDimension() const
        {
            return dimension;
        }

        inline torch::Tensor getConcentration() const
        {
            return concentration.value();
        }

    private:
        /// Log of the normalizing constant, per batch member.
        torch::Tensor logNormalization(const torch::Tensor &concentration) const;
    };
}

#endif //REPLICATE_CHOLESKYLKJ_HPP
