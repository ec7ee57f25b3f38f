//
// Created by moinshaikh on 2/22/26.
//
#include<cmath>

#include<torch/torch.h>
#include<doctest/doctest.h>
#include"../../include/Distribution/TransformedDistribution.hpp"
#include"../../include/Distribution/Independent.hpp"
#include"../../include/Distribution/Normal.hpp"
#include"../../include/Bijector/Chain.hpp"
#include"../../include/Bijector/Exp.hpp"
#include"../../include/Bijector/ScaleMatvecTriL.hpp"
#include"../../include/Errors.hpp"

namespace Replicate
{
    TransformedDistribution::TransformedDistribution(std::shared_ptr<Distribution> base,
                                                     std::shared_ptr<Bijector> bijector)
        : base(std::move(base)), bijector(std::move(bijector))
    {
        if (this->base == nullptr || this->bijector == nullptr)
        {
            throw std::runtime_error("TransformedDistribution needs a base distribution and a bijector");
        }
        eventShape();
    }

    std::optional<Shape> TransformedDistribution::batchShape() const
    {
        return base->batchShape();
    }

    std::optional<Shape> TransformedDistribution::eventShape() const
    {
        auto event = base->eventShape();
        if (!event)
        {
            return std::nullopt;
        }
        return bijector->forwardEventShape(*event);
    }

    torch::Tensor TransformedDistribution::batchShapeTensor() const
    {
        return base->batchShapeTensor();
    }

    torch::Tensor TransformedDistribution::eventShapeTensor() const
    {
        return ShapeAlgebra::toTensor(bijector->forwardEventShape(ShapeAlgebra::fromTensor(base->eventShapeTensor())));
    }

    torch::Tensor TransformedDistribution::sample(c10::ArrayRef<int64_t> sample_shape,
                                                  c10::optional<at::Generator> generator)
    {
        auto no_grad_guard = torch::NoGradGuard();
        return bijector->forward(base->sample(sample_shape, generator));
    }

    /**
     * @brief Change of variables: log p_base(f^{-1}(y)) + log|det J_{f^{-1}}(y)|.
     *
     * @details The Jacobian term is summed over every event dimension of the transformed
     * distribution, so a constant Jacobian counts once per event element.
     */
    torch::Tensor TransformedDistribution::logProbability(torch::Tensor value)
    {
        const auto eventNdims = static_cast<int64_t>(resolvedEventShape().size());
        auto x = bijector->inverse(value);
        return base->logProbability(x) + bijector->inverseLogDetJacobian(value, eventNdims);
    }

    std::shared_ptr<Bijector> TransformedDistribution::defaultEventSpaceBijector() const
    {
        return std::make_shared<Chain>(std::vector<std::shared_ptr<Bijector>>{bijector, base->defaultEventSpaceBijector()});
    }

    TEST_CASE("TransformedDistribution")
    {
        SUBCASE("Exp of a normal is log-normal")
        {
            auto normal = std::make_shared<Normal>(torch::zeros({3}), 1.0);
            TransformedDistribution dist(normal, std::make_shared<Exp>());
            CHECK(*dist.batchShape() == Shape{3});
            CHECK(dist.eventShape()->empty());

            auto y = dist.sample({10});
            CHECK(y.sizes().vec() == std::vector<int64_t>{10, 3});
            CHECK((y > 0).all().item().toBool());

            // log N(log 2; 0, 1) - log 2
            double expected = -0.5 * std::log(2.0) * std::log(2.0) - 0.5 * std::log(2 * M_PI) - std::log(2.0);
            auto log_probs = dist.logProbability(torch::full({3}, 2.f));
            CHECK(log_probs[1].item().toDouble() == doctest::Approx(expected).epsilon(1e-5));
        }

        SUBCASE("Affine transform of a multivariate normal")
        {
            auto mvn = std::make_shared<Independent>(std::make_shared<Normal>(torch::zeros({2}), 1.0), 1);
            auto tril = torch::tensor({0.75f, 0.f, 0.05f, 0.5f}).reshape({2, 2});
            auto affine = std::make_shared<ScaleMatvecTriL>(tril);
            TransformedDistribution dist(mvn, affine);
            CHECK(*dist.eventShape() == Shape{2});

            auto y = dist.sample({4});
            auto x = affine->inverse(y);
            auto expected = mvn->logProbability(x) - affine->forwardLogDetJacobian(x, 1);
            auto actual = dist.logProbability(y);
            CHECK(actual.sizes().vec() == std::vector<int64_t>{4});
            CHECK(torch::allclose(actual, expected, 1e-3, 0));
        }

        SUBCASE("Default bijector chains the transform after the base bijector")
        {
            auto normal = std::make_shared<Normal>(torch::zeros({3}), 1.0);
            TransformedDistribution dist(normal, std::make_shared<Exp>());
            auto bijector = dist.defaultEventSpaceBijector();
            auto x = torch::randn({3});
            CHECK(torch::allclose(bijector->forward(x), torch::exp(x)));
        }

        SUBCASE("Null arguments")
        {
            CHECK_THROWS_AS(TransformedDistribution(nullptr, std::make_shared<Exp>()), std::runtime_error);
        }
    }
}
