#pragma once
//
// Created by moinshaikh on 2/19/26.
//

#ifndef REPLICATE_CORRELATIONCHOLESKY_HPP
#define REPLICATE_CORRELATIONCHOLESKY_HPP

#include"Bijector.hpp"

namespace Replicate
{
    /**
     * @class CorrelationCholesky
     * @brief Maps R^k onto Cholesky factors of m x m correlation matrices, k = m(m-1)/2.
     *
     * The forward map writes x into the strictly lower triangle of an m x m matrix in row-major
     * order, sets a unit diagonal and then normalizes every row to unit Euclidean norm. The
     * result is lower triangular with a positive diagonal and L L^T has a unit diagonal.
     *
     * This bijector changes rank: forward consumes one event dimension and produces two.
     */
    class CorrelationCholesky : public Bijector
    {
    public:
        torch::Tensor forward(const torch::Tensor &x) const override;
        torch::Tensor inverse(const torch::Tensor &y) const override;

        inline int64_t forwardMinEventNdims() const override { return 1; }
        inline int64_t inverseMinEventNdims() const override { return 2; }
        inline std::string name() const override { return "CorrelationCholesky"; }

        /**
         * @brief Matrix size m for a vector of k = m(m-1)/2 unconstrained values.
         *
         * @throws ShapeError If k is not a triangular number.
         */
        static int64_t matrixSize(int64_t vectorSize);

    protected:
        Shape forwardEventShapeImpl(const Shape &eventShape) const override;
        Shape inverseEventShapeImpl(const Shape &eventShape) const override;
        torch::Tensor forwardLogDetJacobianImpl(const torch::Tensor &x) const override;
    };
}

#endif //REPLICATE_CORRELATIONCHOLESKY_HPP
