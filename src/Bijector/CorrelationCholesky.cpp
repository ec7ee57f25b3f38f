//
// Created by moinshaikh on 2/19/26.
//

#include<cmath>

#include<torch/torch.h>

#include"../../include/Bijector/CorrelationCholesky.hpp"
#include"../../include/Errors.hpp"
#include<doctest/doctest.h>

namespace Replicate
{
    namespace
    {
        /// Flat [m * m] positions of the strictly lower triangle, row-major.
        torch::Tensor strictLowerPositions(int64_t m, const torch::Device &device)
        {
            auto indices = torch::tril_indices(m, m, -1, torch::TensorOptions().dtype(torch::kLong).device(device));
            return indices[0] * m + indices[1];
        }
    }

    int64_t CorrelationCholesky::matrixSize(int64_t vectorSize)
    {
        auto m = static_cast<int64_t>(std::llround((1.0 + std::sqrt(1.0 + 8.0 * vectorSize)) / 2.0));
        if (vectorSize < 0 || m * (m - 1) / 2 != vectorSize)
        {
            throw ShapeError("CorrelationCholesky needs m(m-1)/2 inputs, got " + std::to_string(vectorSize));
        }
        return m;
    }

    /**
     * @brief Unconstrained vector to correlation Cholesky factor.
     *
     * @details Writes x into the strictly lower triangle, adds the identity and divides every
     * row by its norm. Row i then has the form (x_i, 1) / sqrt(1 + |x_i|^2).
     */
    torch::Tensor CorrelationCholesky::forward(const torch::Tensor &x) const
    {
        const auto m = matrixSize(x.size(-1));
        auto batch = x.sizes().vec();
        batch.pop_back();

        auto flatShape = batch;
        flatShape.push_back(m * m);
        auto flat = torch::zeros(flatShape, x.options()).index_copy(-1, strictLowerPositions(m, x.device()), x);

        auto matrixShape = batch;
        matrixShape.insert(matrixShape.end(), {m, m});
        auto y = flat.reshape(matrixShape) + torch::eye(m, x.options());
        return y / (y * y).sum(-1, true).sqrt();
    }

    /**
     * @brief Correlation Cholesky factor to unconstrained vector.
     *
     * @details The diagonal entry of each row is the reciprocal of the norm removed by forward(),
     * so dividing the row by it restores the raw values.
     */
    torch::Tensor CorrelationCholesky::inverse(const torch::Tensor &y) const
    {
        const auto m = y.size(-1);
        auto batch = y.sizes().vec();
        batch.resize(batch.size() - 2);

        auto unnormalized = y / y.diagonal(0, -2, -1).unsqueeze(-1);
        auto flatShape = batch;
        flatShape.push_back(m * m);
        return unnormalized.reshape(flatShape).index_select(-1, strictLowerPositions(m, y.device()));
    }

    Shape CorrelationCholesky::forwardEventShapeImpl(const Shape &eventShape) const
    {
        const auto m = matrixSize(eventShape.back());
        return {m, m};
    }

    Shape CorrelationCholesky::inverseEventShapeImpl(const Shape &eventShape) const
    {
        if (eventShape[0] != eventShape[1])
        {
            throw ShapeError("CorrelationCholesky needs square matrices, got " + ShapeAlgebra::toString(eventShape));
        }
        const auto m = eventShape[0];
        return {m * (m - 1) / 2};
    }

    /**
     * @brief Forward log-det-Jacobian.
     *
     * @details Row i normalizes i free values; the map v -> v / sqrt(1 + |v|^2) on R^i has
     * determinant (1 + |v|^2)^{-(i+2)/2} = L_ii^{i+2}, hence
     * \f[ \log|J| = \sum_i (i + 2) \log L_{ii}. \f]
     */
    torch::Tensor CorrelationCholesky::forwardLogDetJacobianImpl(const torch::Tensor &x) const
    {
        auto y = forward(x);
        const auto m = y.size(-1);
        auto weights = torch::arange(2, m + 2, x.options());
        return (weights * torch::log(y.diagonal(0, -2, -1))).sum(-1);
    }

    TEST_CASE("CorrelationCholesky")
    {
        CorrelationCholesky bijector;

        SUBCASE("Event shapes change rank")
        {
            CHECK(bijector.forwardEventShape({6}) == Shape{4, 4});
            CHECK(bijector.inverseEventShape({4, 4}) == Shape{6});
            CHECK(bijector.forwardEventShape({3, 5, 2, 6}) == Shape{3, 5, 2, 4, 4});
            CHECK(bijector.inverseEventShape({3, 5, 2, 4, 4}) == Shape{3, 5, 2, 6});
            CHECK_THROWS_AS(bijector.forwardEventShape({5}), ShapeError);
            CHECK_THROWS_AS(bijector.inverseEventShape({4}), ShapeError);
        }

        SUBCASE("Forward gives a correlation Cholesky factor")
        {
            auto x = torch::randn({3, 6}, torch::kDouble);
            auto y = bijector.forward(x);
            CHECK(y.sizes().vec() == Shape{3, 4, 4});
            CHECK(torch::allclose(y, y.tril()));
            CHECK((y.diagonal(0, -2, -1) > 0).all().item().toBool());
            auto correlation = torch::matmul(y, y.transpose(-2, -1));
            CHECK(torch::allclose(correlation.diagonal(0, -2, -1), torch::ones({3, 4}, torch::kDouble)));
        }

        SUBCASE("Round trips")
        {
            auto x = torch::randn({2, 5, 6}, torch::kDouble);
            CHECK(torch::allclose(bijector.inverse(bijector.forward(x)), x, 1e-8, 1e-8));
        }

        SUBCASE("Jacobian matches a finite difference for 2 x 2 factors")
        {
            // With m = 2 the only free entry is y[1][0] = x / sqrt(1 + x^2).
            double value = 0.7;
            double step = 1e-6;
            auto y = [](double v) { return v / std::sqrt(1 + v * v); };
            double expected = std::log((y(value + step) - y(value - step)) / (2 * step));

            auto x = torch::full({1}, value, torch::kDouble);
            CHECK(bijector.forwardLogDetJacobian(x, 1).item().toDouble() == doctest::Approx(expected).epsilon(1e-6));
        }

        SUBCASE("Forward and inverse Jacobians are negatives")
        {
            auto x = torch::randn({5, 6}, torch::kDouble);
            auto y = bijector.forward(x);
            CHECK(torch::allclose(bijector.forwardLogDetJacobian(x, 1),
                                  -bijector.inverseLogDetJacobian(y, 2)));
        }
    }
}
