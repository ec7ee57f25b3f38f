//
// Created by moinshaikh on 2/1/26.
//
#include<math.h>
#include<cmath>
#include<limits>

#include<c10/util/ArrayRef.h>
#include<torch/torch.h>
#include<doctest/doctest.h>
#include"../../include/Distribution/Normal.hpp"
#include"../../include/Bijector/Identity.hpp"
#include"../../include/Errors.hpp"

namespace Replicate
{
    /**
     * @brief Constructs a Normal distribution.
     *
     * @details Fixed parameters are checked for broadcast compatibility right away. The
     * batch shape is the broadcast shape of `loc` and `scale`; the event shape is empty
     * (independent scalar distributions).
     *
     * @param loc The mean (location) of the distribution.
     * @param scale The standard deviation (scale) of the distribution.
     */
    Normal::Normal(Parameter loc, Parameter scale) : loc(std::move(loc)), scale(std::move(scale))
    {
        batchShape();
    }

    std::optional<Shape> Normal::batchShape() const
    {
        auto locShape = loc.staticShape();
        auto scaleShape = scale.staticShape();
        if (!locShape || !scaleShape)
        {
            return std::nullopt;
        }
        return ShapeAlgebra::broadcastShapes(*locShape, *scaleShape);
    }

    std::optional<Shape> Normal::eventShape() const
    {
        return Shape{};
    }

    torch::Tensor Normal::batchShapeTensor() const
    {
        return ShapeAlgebra::toTensor(ShapeAlgebra::broadcastShapes(loc.value().sizes(), scale.value().sizes()));
    }

    torch::Tensor Normal::eventShapeTensor() const
    {
        return ShapeAlgebra::toTensor({});
    }

    /**
     * @brief Computes the entropy of the normal distribution.
     *
     * @details For a univariate normal distribution \f$ \mathcal{N}(\mu, \sigma^2) \f$, the entropy is given by:
     * \f[
     * H(X) = \frac{1}{2} \ln(2\pi e \sigma^2) = \frac{1}{2} + \frac{1}{2}\ln(2\pi) + \ln(\sigma)
     * \f]
     *
     * The result is broadcast to the batch shape, so a scalar scale with a batched loc still
     * gives one entropy per batch member.
     *
     * @return A tensor containing the entropy values.
     */
    torch::Tensor Normal::entropy()
    {
        return (0.5 + 0.5 * std::log(2 * M_PI) + torch::log(scale.value())).expand(resolvedBatchShape());
    }

    /**
     * @brief Computes the log probability density of a value.
     *
     * @details For a normal distribution \f$ \mathcal{N}(\mu, \sigma^2) \f$:
     * \f[
     * \log P(x) = -\frac{(x-\mu)^2}{2\sigma^2} - \ln(\sigma) - \frac{1}{2}\ln(2\pi)
     * \f]
     *
     * @param value The input value(s) to evaluate.
     * @return A tensor of log probabilities.
     */
    torch::Tensor Normal::logProbability(torch::Tensor value)
    {
        auto location = loc.value();
        auto deviation = scale.value();
        auto variance = deviation.pow(2);
        auto logScale = deviation.log();
        return (-(value - location).pow(2) / (2 * variance) - logScale - std::log(std::sqrt(2 * M_PI)));
    }

    /**
     * @brief Samples from the normal distribution.
     *
     * @details Expands `loc` and `scale` to the requested `sample_shape` combined with the
     * batch shape and draws with `at::normal`.
     *
     * @param sample_shape The desired shape of the samples (e.g., {num_samples}).
     * @return A tensor of sampled values.
     */
    torch::Tensor Normal::sample(c10::ArrayRef<int64_t> sample_shape, c10::optional<at::Generator> generator)
    {
        auto shape = extendedShape(sample_shape);
        auto no_grad_guard = torch::NoGradGuard();
        auto location = loc.value();
        return at::normal(location.expand(shape), scale.value().to(location.scalar_type()).expand(shape), generator);
    }

    torch::Tensor Normal::mean()
    {
        return loc.value().expand(resolvedBatchShape());
    }

    torch::Tensor Normal::variance()
    {
        return scale.value().pow(2).expand(resolvedBatchShape());
    }

    torch::Tensor Normal::stddev()
    {
        return scale.value().expand(resolvedBatchShape());
    }

    torch::Tensor Normal::mode()
    {
        return mean();
    }

    std::shared_ptr<Bijector> Normal::defaultEventSpaceBijector() const
    {
        return std::make_shared<Identity>();
    }

    TEST_CASE("Normal")
{
    float locs_array[] = {0, 1, 2, 3, 4, 5};
    float scales_array[] = {5, 4, 3, 2, 1, 0};
    auto locs = torch::from_blob(locs_array, {2, 3});
    auto scales = torch::from_blob(scales_array, {2, 3});
    auto dist = Normal(locs, scales);

    SUBCASE("Sampled tensors have correct shape")
    {
        CHECK(dist.sample().sizes().vec() == std::vector<int64_t>{2, 3});
        CHECK(dist.sample({20}).sizes().vec() == std::vector<int64_t>{20, 2, 3});
        CHECK(dist.sample({2, 20}).sizes().vec() == std::vector<int64_t>{2, 20, 2, 3});
        CHECK(dist.sample({1, 2, 3, 4, 5}).sizes().vec() == std::vector<int64_t>{1, 2, 3, 4, 5, 2, 3});
    }

    SUBCASE("Seeded generators reproduce draws")
    {
        auto first = at::make_generator<at::CPUGeneratorImpl>(42);
        auto second = at::make_generator<at::CPUGeneratorImpl>(42);
        CHECK(torch::equal(dist.sample({4}, first), dist.sample({4}, second)));
    }

    SUBCASE("entropy()")
    {
        auto entropies = dist.entropy();

        SUBCASE("Returns correct values")
        {
            INFO("Entropies: \n"
                 << entropies);

            CHECK(entropies[0].sum().item().toDouble() ==
                  doctest::Approx(8.3512).epsilon(1e-3));
            CHECK(entropies[1][2].item().toDouble() ==
                  -std::numeric_limits<float>::infinity());
        }

        SUBCASE("Output tensor is the correct size")
        {
            CHECK(entropies.sizes().vec() == std::vector<int64_t>{2, 3});
        }
    }

    SUBCASE("log_prob()")
    {
        float actions[2][3] = {{0, 1, 2},
                               {0, 1, 2}};
        auto actions_tensor = torch::from_blob(actions, {2, 3});
        auto log_probs = dist.logProbability(actions_tensor);

        INFO(log_probs << "\n");
        SUBCASE("Returns correct values")
        {
            CHECK(log_probs[0][0].item().toDouble() ==
                  doctest::Approx(-2.5284).epsilon(1e-3));
            CHECK(log_probs[0][1].item().toDouble() ==
                  doctest::Approx(-2.3052).epsilon(1e-3));
            CHECK(log_probs[0][2].item().toDouble() ==
                  doctest::Approx(-2.0176).epsilon(1e-3));
            CHECK(log_probs[1][0].item().toDouble() ==
                  doctest::Approx(-2.7371).epsilon(1e-3));
            CHECK(log_probs[1][1].item().toDouble() ==
                  doctest::Approx(-5.4189).epsilon(1e-3));
            CHECK(std::isnan(log_probs[1][2].item().toDouble()));
        }

        SUBCASE("Output tensor is correct size")
        {
            CHECK(log_probs.sizes().vec() == std::vector<int64_t>{2, 3});
        }
    }

    SUBCASE("Statistics are broadcast to the batch shape")
    {
        Normal broadcast(torch::zeros({3, 2}), 2.0);
        CHECK(broadcast.mean().sizes().vec() == std::vector<int64_t>{3, 2});
        CHECK(broadcast.stddev().sizes().vec() == std::vector<int64_t>{3, 2});
        CHECK(broadcast.variance()[2][1].item().toDouble() == doctest::Approx(4.0));
        CHECK(torch::equal(broadcast.mode(), broadcast.mean()));
    }

    SUBCASE("Shapes follow variables")
    {
        Variable loc(torch::zeros({4, 5}));
        Normal dynamic(loc, 1.0);
        CHECK_FALSE(dynamic.batchShape().has_value());
        CHECK(dynamic.resolvedBatchShape() == Shape{4, 5});

        loc.assign(torch::zeros({3}));
        CHECK(ShapeAlgebra::fromTensor(dynamic.batchShapeTensor()) == Shape{3});
        CHECK(dynamic.eventShape()->empty());
    }

    SUBCASE("Static and dynamic shapes agree")
    {
        Normal fixed(torch::zeros({3, 1}), torch::ones({2}));
        CHECK(*fixed.batchShape() == Shape{3, 2});
        CHECK(ShapeAlgebra::fromTensor(fixed.batchShapeTensor()) == *fixed.batchShape());
    }

    SUBCASE("Parameters that do not broadcast are rejected")
    {
        CHECK_THROWS_AS(Normal(torch::zeros({3}), torch::ones({4})), ShapeError);
    }
}
}
