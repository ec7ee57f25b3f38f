//
// Created by moinshaikh on 2/23/26.
//

#include<cmath>
#include<numeric>

#include<torch/torch.h>

#include"../../include/Bijector/SampleBijector.hpp"
#include"../../include/Bijector/Scale.hpp"
#include"../../include/Distribution/CholeskyLKJ.hpp"
#include"../../include/Distribution/Independent.hpp"
#include"../../include/Distribution/Normal.hpp"
#include"../../include/Distribution/Poisson.hpp"
#include"../../include/Distribution/SampleDistribution.hpp"
#include"../../include/Distribution/TransformedDistribution.hpp"
#include"../../include/Distribution/Uniform.hpp"
#include"../../include/Shape/ReductionEngine.hpp"
#include"../../include/Errors.hpp"
#include<doctest/doctest.h>

namespace Replicate
{
    SampleBijector::SampleBijector(std::shared_ptr<Distribution> base, SampleShape sampleShape, bool useKahanSum)
        : base(std::move(base)), sampleShape(std::move(sampleShape)), useKahanSum(useKahanSum)
    {
        if (this->base == nullptr)
        {
            throw std::runtime_error("SampleBijector needs a base distribution");
        }
        inner = this->base->defaultEventSpaceBijector();
    }

    SampleBijector::Snapshot SampleBijector::snapshot() const
    {
        Snapshot shapes;
        shapes.sample = sampleShape.resolve();
        shapes.batch = base->resolvedBatchShape();
        shapes.event = base->resolvedEventShape();
        shapes.inputEvent = inner->inverseEventShape(shapes.event);
        return shapes;
    }

    int64_t SampleBijector::forwardMinEventNdims() const
    {
        auto shapes = snapshot();
        return static_cast<int64_t>(shapes.sample.size() + shapes.inputEvent.size());
    }

    int64_t SampleBijector::inverseMinEventNdims() const
    {
        auto shapes = snapshot();
        return static_cast<int64_t>(shapes.sample.size() + shapes.event.size());
    }

    torch::Tensor SampleBijector::toSampleMajor(const torch::Tensor &value, const Snapshot &shapes, int64_t eventNdims,
                                                int64_t &prefixNdims)
    {
        const auto batchNdims = static_cast<int64_t>(shapes.batch.size());
        const auto sampleNdims = static_cast<int64_t>(shapes.sample.size());
        auto expanded = ShapeAlgebra::expandToRank(value, batchNdims + sampleNdims + eventNdims);
        prefixNdims = expanded.dim() - batchNdims - sampleNdims - eventNdims;
        AxisLayout layout{prefixNdims, batchNdims, sampleNdims, eventNdims};
        return expanded.permute(ShapeAlgebra::permutation(layout, kBatchMajor, kSampleMajor));
    }

    torch::Tensor SampleBijector::toBatchMajor(const torch::Tensor &value, const Snapshot &shapes, int64_t prefixNdims)
    {
        const auto batchNdims = static_cast<int64_t>(shapes.batch.size());
        const auto sampleNdims = static_cast<int64_t>(shapes.sample.size());
        AxisLayout layout{prefixNdims, batchNdims, sampleNdims, value.dim() - prefixNdims - sampleNdims - batchNdims};
        return value.permute(ShapeAlgebra::permutation(layout, kSampleMajor, kBatchMajor));
    }

    torch::Tensor SampleBijector::forward(const torch::Tensor &x) const
    {
        auto shapes = snapshot();
        int64_t prefixNdims = 0;
        auto permuted = toSampleMajor(x, shapes, static_cast<int64_t>(shapes.inputEvent.size()), prefixNdims);
        return toBatchMajor(inner->forward(permuted), shapes, prefixNdims);
    }

    torch::Tensor SampleBijector::inverse(const torch::Tensor &y) const
    {
        auto shapes = snapshot();
        int64_t prefixNdims = 0;
        auto permuted = toSampleMajor(y, shapes, static_cast<int64_t>(shapes.event.size()), prefixNdims);
        return toBatchMajor(inner->inverse(permuted), shapes, prefixNdims);
    }

    /**
     * @brief Brings an inner log-det-Jacobian to the caller's event rank.
     *
     * @details The inner term has the shape prefix ++ K' ++ B', where K' and B' are the sample
     * and batch axes of the input, possibly of size 1, and where a constant Jacobian may be
     * smaller still. Expanding to prefix ++ K ++ B before reducing K makes every replicate count.
     */
    torch::Tensor SampleBijector::liftLogDetJacobian(const torch::Tensor &logDetJacobian, const torch::Tensor &permuted,
                                                     const Snapshot &shapes, int64_t prefixNdims,
                                                     int64_t extraNdims) const
    {
        Shape prefix(permuted.sizes().begin(), permuted.sizes().begin() + prefixNdims);
        auto target = ShapeAlgebra::concat(ShapeAlgebra::concat(prefix, shapes.sample), shapes.batch);
        auto expanded = logDetJacobian.expand(target);

        std::vector<int64_t> sampleAxes(shapes.sample.size());
        std::iota(sampleAxes.begin(), sampleAxes.end(), prefixNdims);
        auto reduced = ReductionEngine::reduceLogDensity(expanded, sampleAxes, useKahanSum);
        return reduceLogDetJacobian(reduced, ShapeAlgebra::concat(prefix, shapes.batch), extraNdims);
    }

    torch::Tensor SampleBijector::forwardLogDetJacobian(const torch::Tensor &x, int64_t eventNdims) const
    {
        auto shapes = snapshot();
        const auto innerNdims = static_cast<int64_t>(shapes.inputEvent.size());
        const auto minNdims = static_cast<int64_t>(shapes.sample.size()) + innerNdims;
        if (eventNdims < minNdims)
        {
            throw ShapeError(name() + " needs at least " + std::to_string(minNdims) +
                             " event dimensions, got " + std::to_string(eventNdims));
        }
        int64_t prefixNdims = 0;
        auto permuted = toSampleMajor(ShapeAlgebra::expandToRank(x, eventNdims), shapes, innerNdims, prefixNdims);
        auto logDetJacobian = inner->forwardLogDetJacobian(permuted, innerNdims);
        return liftLogDetJacobian(logDetJacobian, permuted, shapes, prefixNdims, eventNdims - minNdims);
    }

    torch::Tensor SampleBijector::inverseLogDetJacobian(const torch::Tensor &y, int64_t eventNdims) const
    {
        auto shapes = snapshot();
        const auto innerNdims = static_cast<int64_t>(shapes.event.size());
        const auto minNdims = static_cast<int64_t>(shapes.sample.size()) + innerNdims;
        if (eventNdims < minNdims)
        {
            throw ShapeError(name() + " needs at least " + std::to_string(minNdims) +
                             " event dimensions, got " + std::to_string(eventNdims));
        }
        int64_t prefixNdims = 0;
        auto permuted = toSampleMajor(ShapeAlgebra::expandToRank(y, eventNdims), shapes, innerNdims, prefixNdims);
        auto logDetJacobian = inner->inverseLogDetJacobian(permuted, innerNdims);
        return liftLogDetJacobian(logDetJacobian, permuted, shapes, prefixNdims, eventNdims - minNdims);
    }

    Shape SampleBijector::mapEventShape(const Shape &shape, int64_t sampleNdims, int64_t innerNdims, bool forward) const
    {
        const auto minNdims = sampleNdims + innerNdims;
        if (static_cast<int64_t>(shape.size()) < minNdims)
        {
            throw ShapeError(name() + " needs a shape of rank at least " + std::to_string(minNdims) +
                             ", got " + ShapeAlgebra::toString(shape));
        }
        auto split = shape.end() - innerNdims;
        Shape kept(shape.begin(), split);
        Shape event(split, shape.end());
        return ShapeAlgebra::concat(kept, forward ? inner->forwardEventShape(event) : inner->inverseEventShape(event));
    }

    /// K passes through; only the trailing inner event part is mapped.
    Shape SampleBijector::forwardEventShape(const Shape &inputShape) const
    {
        auto shapes = snapshot();
        return mapEventShape(inputShape, static_cast<int64_t>(shapes.sample.size()),
                             static_cast<int64_t>(shapes.inputEvent.size()), true);
    }

    Shape SampleBijector::inverseEventShape(const Shape &outputShape) const
    {
        auto shapes = snapshot();
        return mapEventShape(outputShape, static_cast<int64_t>(shapes.sample.size()),
                             static_cast<int64_t>(shapes.event.size()), false);
    }

    TEST_CASE("SampleBijector")
    {
        SUBCASE("Event shapes with an elementwise inner bijector")
        {
            auto uniform = std::make_shared<Uniform>(torch::zeros({5}), 1.0);
            SampleDistribution dist(uniform, 2);
            auto bijector = dist.defaultEventSpaceBijector();
            CHECK(*dist.eventShape() == Shape{2});
            CHECK(bijector->inverseEventShape({2}) == Shape{2});
            CHECK(bijector->forwardEventShape({2}) == Shape{2});
            CHECK(bijector->forwardEventShape({5, 2}) == Shape{5, 2});
            CHECK(bijector->inverseEventShape({5, 2}) == Shape{5, 2});
            CHECK(bijector->forwardEventShape({3, 5, 2}) == Shape{3, 5, 2});
        }

        SUBCASE("Event shapes with a rank changing inner bijector")
        {
            auto lkj = std::make_shared<CholeskyLKJ>(4, torch::ones({5}));
            SampleDistribution dist(lkj, 2);
            auto bijector = dist.defaultEventSpaceBijector();
            CHECK(*dist.eventShape() == Shape{2, 4, 4});
            CHECK(bijector->forwardMinEventNdims() == 2);
            CHECK(bijector->inverseMinEventNdims() == 3);
            CHECK(bijector->inverseEventShape({5, 2, 4, 4}) == Shape{5, 2, 6});
            CHECK(bijector->forwardEventShape({5, 2, 6}) == Shape{5, 2, 4, 4});
            CHECK(bijector->inverseEventShape({3, 5, 2, 4, 4}) == Shape{3, 5, 2, 6});
            CHECK(bijector->forwardEventShape({3, 5, 2, 6}) == Shape{3, 5, 2, 4, 4});
        }

        SUBCASE("Per-batch inner parameters broadcast against the batch axes")
        {
            auto uniform = std::make_shared<Uniform>(torch::zeros({5}), 1.0);
            SampleDistribution dist(uniform, 2);
            auto bijector = dist.defaultEventSpaceBijector();

            auto half = bijector->forward(0.5 * torch::ones({5, 2}));
            CHECK(half.sizes().vec() == std::vector<int64_t>{5, 2});

            auto samples = dist.sample({3});
            CHECK(bijector->inverse(samples).sizes().vec() == std::vector<int64_t>{3, 5, 2});
            CHECK(bijector->inverse(dist.sample()).sizes().vec() == std::vector<int64_t>{5, 2});

            auto init = torch::rand({3, 5, 2}) * 4 - 2;
            auto y = bijector->forward(init);
            CHECK(torch::allclose(bijector->inverse(y), init, 1e-4, 1e-4));
            CHECK(dist.logProbability(y).sizes().vec() == std::vector<int64_t>{3, 5});
        }

        SUBCASE("Round trips and Jacobians agree with Independent for CholeskyLKJ")
        {
            auto lkj = std::make_shared<CholeskyLKJ>(4, torch::ones({5}, torch::kDouble));
            SampleDistribution dist(lkj, 2);
            auto bijector = dist.defaultEventSpaceBijector();

            auto y = dist.sample({7});
            CHECK(y.sizes().vec() == std::vector<int64_t>{7, 5, 2, 4, 4});
            auto x = bijector->inverse(y);
            CHECK(x.sizes().vec() == std::vector<int64_t>{7, 5, 2, 6});
            CHECK(torch::allclose(y, bijector->forward(x)));

            Independent independent(std::make_shared<CholeskyLKJ>(4, torch::ones({5, 2}, torch::kDouble)), 1);
            auto reference = independent.defaultEventSpaceBijector();
            CHECK(torch::allclose(reference->forwardLogDetJacobian(x, 2), bijector->forwardLogDetJacobian(x, 2)));
            CHECK(torch::allclose(reference->inverseLogDetJacobian(y, 3), bijector->inverseLogDetJacobian(y, 3)));

            // A single replicate stands for all of them.
            auto xSliced = x.narrow(-2, 0, 1);
            auto xBroadcast = torch::cat({xSliced, xSliced}, -2);
            CHECK(torch::allclose(reference->forwardLogDetJacobian(xBroadcast, 2),
                                  bijector->forwardLogDetJacobian(xSliced, 2)));

            auto ySliced = y.narrow(-3, 0, 1);
            auto yBroadcast = torch::cat({ySliced, ySliced}, -3);
            CHECK(torch::allclose(reference->inverseLogDetJacobian(yBroadcast, 3),
                                  bijector->inverseLogDetJacobian(ySliced, 3)));
            CHECK(torch::allclose(bijector->forwardLogDetJacobian(xSliced, 2),
                                  -bijector->inverseLogDetJacobian(yBroadcast, 3), 1e-5));
        }

        SUBCASE("Multi-axis sample shapes and extra event dimensions")
        {
            auto lkj = std::make_shared<CholeskyLKJ>(4, torch::ones({5}, torch::kDouble));
            SampleDistribution dist(lkj, {2, 7});
            auto bijector = dist.defaultEventSpaceBijector();
            auto y = dist.sample({11});
            auto x = bijector->inverse(y);
            CHECK(torch::allclose(y, bijector->forward(x)));

            Independent independent(std::make_shared<CholeskyLKJ>(4, torch::ones({5, 2, 7}, torch::kDouble)), 2);
            auto reference = independent.defaultEventSpaceBijector();
            CHECK(torch::allclose(reference->forwardLogDetJacobian(x, 3), bijector->forwardLogDetJacobian(x, 3)));
            CHECK(torch::allclose(reference->inverseLogDetJacobian(y, 4), bijector->inverseLogDetJacobian(y, 4)));

            // Batch [5, 7] with a single sample axis lines up with the same reference.
            auto batched = std::make_shared<CholeskyLKJ>(4, torch::ones({5, 7}, torch::kDouble));
            SampleDistribution other(batched, 2);
            auto otherBijector = other.defaultEventSpaceBijector();
            auto y2 = other.sample({11});
            auto x2 = otherBijector->inverse(y2);
            CHECK(torch::allclose(y2, otherBijector->forward(x2)));
            CHECK(torch::allclose(reference->forwardLogDetJacobian(x2, 3), otherBijector->forwardLogDetJacobian(x2, 3)));
            CHECK(torch::allclose(reference->inverseLogDetJacobian(y2, 4), otherBijector->inverseLogDetJacobian(y2, 4)));
            CHECK(torch::allclose(reference->forwardLogDetJacobian(x2, 4), otherBijector->forwardLogDetJacobian(x2, 4)));
            CHECK(torch::allclose(reference->inverseLogDetJacobian(y2, 5), otherBijector->inverseLogDetJacobian(y2, 5)));
        }

        SUBCASE("Event rank below the minimum is rejected")
        {
            auto lkj = std::make_shared<CholeskyLKJ>(4, torch::ones({5}));
            SampleDistribution dist(lkj, 2);
            auto bijector = dist.defaultEventSpaceBijector();
            CHECK_THROWS_AS(bijector->forwardLogDetJacobian(torch::zeros({5, 2, 6}), 1), ShapeError);
            CHECK_THROWS_AS(bijector->inverseLogDetJacobian(torch::zeros({5, 2, 4, 4}), 2), ShapeError);
        }

        SUBCASE("Zero inner Jacobian stays zero")
        {
            SampleDistribution dist(std::make_shared<Normal>(0.0, 1.0), Shape{1});
            auto bijector = dist.defaultEventSpaceBijector();
            CHECK(bijector->inverseLogDetJacobian(torch::zeros({1, 1}), 1).sum().item().toDouble() == 0.0);
            CHECK(bijector->inverseLogDetJacobian(torch::zeros({1, 1}), 2).item().toDouble() == 0.0);
        }

        SUBCASE("Constant inner Jacobian counts every replicate")
        {
            auto transformed = std::make_shared<TransformedDistribution>(
                    std::make_shared<Normal>(torch::zeros({2}), 1.0),
                    std::make_shared<Scale>(torch::tensor({2.f, 3.f})));
            SampleDistribution dist(transformed, Shape{3});
            auto bijector = dist.defaultEventSpaceBijector();

            auto ildj = bijector->inverseLogDetJacobian(torch::zeros({2, 3}), 1);
            CHECK(torch::allclose(ildj, -3 * torch::log(torch::tensor({2.f, 3.f}))));

            auto total = bijector->inverseLogDetJacobian(torch::zeros({2, 3}), 2);
            CHECK(total.item().toDouble() == doctest::Approx(-3 * (std::log(2.0) + std::log(3.0))).epsilon(1e-5));
        }

        SUBCASE("Event shapes follow a variable sample shape")
        {
            Variable sampleShape(torch::tensor({2}, torch::kLong));
            SampleDistribution dist(std::make_shared<CholeskyLKJ>(3, torch::ones({5})), sampleShape);
            auto bijector = dist.defaultEventSpaceBijector();
            CHECK(bijector->forwardEventShape({7, 5, 2, 3}) == Shape{7, 5, 2, 3, 3});
            CHECK(bijector->inverseEventShape({5, 2, 3, 3}) == Shape{5, 2, 3});

            sampleShape.assign(torch::tensor({4, 1}, torch::kLong));
            CHECK(bijector->forwardEventShape({5, 4, 1, 3}) == Shape{5, 4, 1, 3, 3});
            CHECK(bijector->inverseEventShape({5, 4, 1, 3, 3}) == Shape{5, 4, 1, 3});
            CHECK_THROWS_AS(bijector->forwardEventShape({1, 3}), ShapeError);
            CHECK_THROWS_AS(bijector->inverseEventShape({4, 3, 3}), ShapeError);
        }

        SUBCASE("Bases without a bijector propagate the error")
        {
            Parameter rate(torch::ones({3}));
            SampleDistribution dist(std::make_shared<Poisson>(&rate, nullptr), 4);
            CHECK_THROWS_AS(dist.defaultEventSpaceBijector(), UnsupportedStatisticError);
        }
    }
}
