//
// Created by moinshaikh on 2/21/26.
//
#include<math.h>
#include<cmath>

#include<torch/torch.h>
#include<doctest/doctest.h>
#include"../../include/Distribution/CholeskyLKJ.hpp"
#include"../../include/Bijector/CorrelationCholesky.hpp"

namespace Replicate
{
    namespace
    {
        /// Beta(a, b) variates as a ratio of standard gamma variates.
        torch::Tensor sampleBeta(const torch::Tensor &a, const torch::Tensor &b, c10::optional<at::Generator> generator)
        {
            auto x = at::_standard_gamma(a, generator);
            auto y = at::_standard_gamma(b, generator);
            return x / (x + y);
        }

        torch::Tensor zeroPadding(const Shape &leading, int64_t width, const torch::TensorOptions &options)
        {
            auto shape = leading;
            shape.push_back(width);
            return torch::zeros(shape, options);
        }
    }

    CholeskyLKJ::CholeskyLKJ(int64_t dimension, Parameter concentration)
        : dimension(dimension), concentration(std::move(concentration))
    {
        if (dimension < 1)
        {
            throw std::runtime_error("CholeskyLKJ needs a dimension of at least 1");
        }
    }

    std::optional<Shape> CholeskyLKJ::batchShape() const
    {
        return concentration.staticShape();
    }

    std::optional<Shape> CholeskyLKJ::eventShape() const
    {
        return Shape{dimension, dimension};
    }

    torch::Tensor CholeskyLKJ::batchShapeTensor() const
    {
        return ShapeAlgebra::toTensor(concentration.value().sizes().vec());
    }

    torch::Tensor CholeskyLKJ::eventShapeTensor() const
    {
        return ShapeAlgebra::toTensor({dimension, dimension});
    }

    /**
     * @brief Log density of a Cholesky factor.
     *
     * @details With concentration \f$ \eta \f$ and \f$ d \f$ the dimension,
     * \f[
     * \log p(L) = \sum_{i=0}^{d-1} (2\eta - 2 + d - 1 - i) \log L_{ii} - \log Z(\eta)
     * \f]
     * where the \f$ d - 1 - i \f$ term is the Jacobian of L -> L L^T.
     */
    torch::Tensor CholeskyLKJ::logProbability(torch::Tensor value)
    {
        auto eta = concentration.value().to(value.scalar_type());
        auto logDiagonal = torch::log(value.diagonal(0, -2, -1));
        auto exponent = 2 * eta.unsqueeze(-1) - 2 + torch::linspace(dimension - 1, 0, dimension, value.options());
        return (exponent * logDiagonal).sum(-1) - logNormalization(eta);
    }

    /**
     * @details The normalizer of the LKJ density over correlation matrices:
     * \f[
     * \log Z(\eta) = \sum_{k=1}^{d-1} \left[ \frac{k}{2}\log\pi
     *     + \log\Gamma\left(\eta + \frac{d-1-k}{2}\right)
     *     - \log\Gamma\left(\eta + \frac{d-1}{2}\right) \right]
     * \f]
     */
    torch::Tensor CholeskyLKJ::logNormalization(const torch::Tensor &eta) const
    {
        auto result = torch::zeros_like(eta);
        for (int64_t k = 1; k < dimension; ++k)
        {
            auto effective = eta + (dimension - 1 - k) / 2.0;
            result = result + std::log(M_PI) * (k / 2.0) + torch::lgamma(effective) - torch::lgamma(effective + k / 2.0);
        }
        return result;
    }

    /**
     * @brief Onion method sampling, carried out row by row on the Cholesky factor.
     *
     * @details Row 0 is e_0. Row 1 has its off-diagonal entry drawn from a Beta shifted onto
     * (-1, 1). Every later row n gets a uniformly random direction in R^n scaled by the square
     * root of a Beta(n/2, beta) draw, and the remaining unit norm goes on the diagonal.
     */
    torch::Tensor CholeskyLKJ::sample(c10::ArrayRef<int64_t> sample_shape, c10::optional<at::Generator> generator)
    {
        auto no_grad_guard = torch::NoGradGuard();
        auto eta = concentration.value();
        auto options = eta.options();
        Shape leading = sample_shape.vec();
        auto batch = resolvedBatchShape();
        leading.insert(leading.end(), batch.begin(), batch.end());
        eta = eta.expand(leading).contiguous();

        std::vector<torch::Tensor> rows;
        rows.push_back(torch::cat({torch::ones(ShapeAlgebra::concat(leading, {1}), options),
                                   zeroPadding(leading, dimension - 1, options)}, -1));
        if (dimension == 1)
        {
            return torch::stack(rows, -2);
        }

        auto betaConcentration = eta + (dimension - 2) / 2.0;
        auto edge = 2 * sampleBeta(betaConcentration, betaConcentration, generator) - 1;
        rows.push_back(torch::cat({edge.unsqueeze(-1), torch::sqrt(1 - edge * edge).unsqueeze(-1),
                                   zeroPadding(leading, dimension - 2, options)}, -1));

        for (int64_t n = 2; n < dimension; ++n)
        {
            betaConcentration = betaConcentration - 0.5;
            auto radius = sampleBeta(torch::full_like(eta, n / 2.0), betaConcentration, generator);
            auto direction = at::randn(ShapeAlgebra::concat(leading, {n}), generator, options);
            direction = direction / direction.norm(2, -1, true);
            auto offDiagonal = torch::sqrt(radius).unsqueeze(-1) * direction;
            auto diagonal = torch::sqrt(torch::clamp_min(1 - radius, 0)).unsqueeze(-1);
            rows.push_back(torch::cat({offDiagonal, diagonal, zeroPadding(leading, dimension - n - 1, options)}, -1));
        }
        return torch::stack(rows, -2);
    }

    std::shared_ptr<Bijector> CholeskyLKJ::defaultEventSpaceBijector() const
    {
        return std::make_shared<CorrelationCholesky>();
    }

    TEST_CASE("CholeskyLKJ")
    {
        CholeskyLKJ dist(4, torch::ones({5}));

        SUBCASE("Shapes")
        {
            CHECK(*dist.batchShape() == Shape{5});
            CHECK(*dist.eventShape() == Shape{4, 4});
            CHECK(ShapeAlgebra::fromTensor(dist.eventShapeTensor()) == Shape{4, 4});
            CHECK_THROWS(CholeskyLKJ(0, 1.0));
        }

        SUBCASE("Samples are correlation Cholesky factors")
        {
            auto samples = dist.sample({7});
            CHECK(samples.sizes().vec() == std::vector<int64_t>{7, 5, 4, 4});
            CHECK(torch::allclose(samples, samples.tril()));
            CHECK((samples.diagonal(0, -2, -1) > 0).all().item().toBool());
            auto correlation = torch::matmul(samples, samples.transpose(-2, -1));
            CHECK(torch::allclose(correlation.diagonal(0, -2, -1), torch::ones({7, 5, 4}), 1e-5, 1e-5));
        }

        SUBCASE("Single row factors are the identity")
        {
            CholeskyLKJ scalar(1, 2.0);
            CHECK(torch::equal(scalar.sample({3}), torch::ones({3, 1, 1})));
        }

        SUBCASE("Uniform 2 x 2 correlations have density 1/2")
        {
            // For eta = 1 every exponent multiplies a log of 1 or is zero.
            CholeskyLKJ uniform(2, torch::ones({1}, torch::kDouble));
            auto rho = 0.3;
            auto factor = torch::tensor({1.0, 0.0, rho, std::sqrt(1 - rho * rho)}, torch::kDouble).reshape({2, 2});
            auto expected = -std::log(2.0);
            CHECK(uniform.logProbability(factor)[0].item().toDouble() == doctest::Approx(expected));
        }

        SUBCASE("log_prob() of samples has the sample and batch shape")
        {
            auto samples = dist.sample({3});
            auto log_probs = dist.logProbability(samples);
            CHECK(log_probs.sizes().vec() == std::vector<int64_t>{3, 5});
            CHECK(torch::isfinite(log_probs).all().item().toBool());
        }
    }
}
