//
// Created by moinshaikh on 2/20/26.
//
#include<cmath>
#include<limits>

#include<torch/torch.h>
#include<doctest/doctest.h>
#include"../../include/Distribution/Uniform.hpp"
#include"../../include/Bijector/Sigmoid.hpp"
#include"../../include/Errors.hpp"

namespace Replicate
{
    Uniform::Uniform(Parameter low, Parameter high) : low(std::move(low)), high(std::move(high))
    {
        batchShape();
    }

    std::optional<Shape> Uniform::batchShape() const
    {
        auto lowShape = low.staticShape();
        auto highShape = high.staticShape();
        if (!lowShape || !highShape)
        {
            return std::nullopt;
        }
        return ShapeAlgebra::broadcastShapes(*lowShape, *highShape);
    }

    std::optional<Shape> Uniform::eventShape() const
    {
        return Shape{};
    }

    torch::Tensor Uniform::batchShapeTensor() const
    {
        return ShapeAlgebra::toTensor(ShapeAlgebra::broadcastShapes(low.value().sizes(), high.value().sizes()));
    }

    torch::Tensor Uniform::eventShapeTensor() const
    {
        return ShapeAlgebra::toTensor({});
    }

    torch::Tensor Uniform::logProbability(torch::Tensor value)
    {
        auto lower = low.value();
        auto upper = high.value();
        auto inside = (value >= lower).logical_and(value < upper);
        auto density = -torch::log(upper - lower) + torch::zeros_like(value);
        return torch::where(inside, density, torch::full_like(density, -std::numeric_limits<double>::infinity()));
    }

    /**
     * @brief Draws low + (high - low) * u with u ~ U[0, 1).
     */
    torch::Tensor Uniform::sample(c10::ArrayRef<int64_t> sample_shape, c10::optional<at::Generator> generator)
    {
        auto shape = extendedShape(sample_shape);
        auto no_grad_guard = torch::NoGradGuard();
        auto lower = low.value();
        auto unit = at::rand(shape, generator, lower.options());
        return lower + (high.value() - lower) * unit;
    }

    torch::Tensor Uniform::entropy()
    {
        return torch::log(high.value() - low.value()).expand(resolvedBatchShape());
    }

    torch::Tensor Uniform::mean()
    {
        return ((low.value() + high.value()) / 2).expand(resolvedBatchShape());
    }

    torch::Tensor Uniform::variance()
    {
        return ((high.value() - low.value()).pow(2) / 12).expand(resolvedBatchShape());
    }

    std::shared_ptr<Bijector> Uniform::defaultEventSpaceBijector() const
    {
        return std::make_shared<Sigmoid>(low, high);
    }

    TEST_CASE("Uniform")
    {
        Uniform dist(torch::tensor({0.f, -1.f}), torch::tensor({2.f, 3.f}));

        SUBCASE("Samples stay in the support")
        {
            auto samples = dist.sample({1000});
            CHECK(samples.sizes().vec() == std::vector<int64_t>{1000, 2});
            CHECK((samples.select(1, 0) >= 0).all().item().toBool());
            CHECK((samples.select(1, 0) < 2).all().item().toBool());
            CHECK((samples.select(1, 1) >= -1).all().item().toBool());
            CHECK((samples.select(1, 1) < 3).all().item().toBool());
        }

        SUBCASE("log_prob()")
        {
            auto inside = dist.logProbability(torch::tensor({1.f, 0.f}));
            CHECK(inside[0].item().toDouble() == doctest::Approx(-std::log(2.0)));
            CHECK(inside[1].item().toDouble() == doctest::Approx(-std::log(4.0)));

            auto outside = dist.logProbability(torch::tensor({2.f, -2.f}));
            CHECK(std::isinf(outside[0].item().toDouble()));
            CHECK(std::isinf(outside[1].item().toDouble()));

            CHECK(dist.logProbability(torch::zeros({5, 1, 2})).sizes().vec() == std::vector<int64_t>{5, 1, 2});
        }

        SUBCASE("Statistics")
        {
            CHECK(torch::allclose(dist.mean(), torch::tensor({1.f, 1.f})));
            CHECK(torch::allclose(dist.variance(), torch::tensor({4.f / 12, 16.f / 12})));
            CHECK(torch::allclose(dist.entropy(), torch::log(torch::tensor({2.f, 4.f}))));
            CHECK_THROWS_AS(dist.mode(), UnsupportedStatisticError);
        }

        SUBCASE("Default bijector maps onto the support")
        {
            auto bijector = dist.defaultEventSpaceBijector();
            auto y = bijector->forward(torch::randn({7, 2}));
            CHECK((y.select(1, 0) > 0).all().item().toBool());
            CHECK((y.select(1, 1) < 3).all().item().toBool());
        }
    }
}
