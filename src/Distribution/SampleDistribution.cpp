//
// Created by moinshaikh on 2/23/26.
//
#include<numeric>

#include<spdlog/spdlog.h>
#include<torch/torch.h>
#include<doctest/doctest.h>
#include"../../include/Distribution/SampleDistribution.hpp"
#include"../../include/Distribution/Independent.hpp"
#include"../../include/Distribution/Normal.hpp"
#include"../../include/Distribution/Poisson.hpp"
#include"../../include/Distribution/TransformedDistribution.hpp"
#include"../../include/Distribution/Uniform.hpp"
#include"../../include/Bijector/Exp.hpp"
#include"../../include/Bijector/SampleBijector.hpp"
#include"../../include/Bijector/Scale.hpp"
#include"../../include/Bijector/ScaleMatvecTriL.hpp"
#include"../../include/Shape/ReductionEngine.hpp"
#include"../../include/Errors.hpp"

namespace Replicate
{
    SampleDistribution::SampleDistribution(std::shared_ptr<Distribution> base, SampleShape sampleShape,
                                           SampleOptions options)
        : base(std::move(base)), sampleShape(std::move(sampleShape)), options(std::move(options))
    {
        if (this->base == nullptr)
        {
            throw std::runtime_error("SampleDistribution needs a base distribution");
        }
        const auto &fixed = this->sampleShape.staticValue();
        spdlog::debug("{}: replicating {} with sample shape {}{}", this->options.name, this->base->name(),
                      fixed ? ShapeAlgebra::toString(*fixed) : "<variable>",
                      this->options.useKahanSum ? " (compensated sums)" : "");
    }

    SampleDistribution::Snapshot SampleDistribution::snapshot() const
    {
        Snapshot shapes;
        shapes.sample = sampleShape.resolve();
        shapes.batch = base->resolvedBatchShape();
        shapes.event = base->resolvedEventShape();
        return shapes;
    }

    std::optional<Shape> SampleDistribution::batchShape() const
    {
        auto batch = base->batchShape();
        if (!batch)
        {
            return std::nullopt;
        }
        return ShapeAlgebra::batchShape(*batch);
    }

    std::optional<Shape> SampleDistribution::eventShape() const
    {
        const auto &sample = sampleShape.staticValue();
        auto event = base->eventShape();
        if (!sample || !event)
        {
            return std::nullopt;
        }
        return ShapeAlgebra::eventShape(*sample, *event);
    }

    torch::Tensor SampleDistribution::batchShapeTensor() const
    {
        return ShapeAlgebra::toTensor(ShapeAlgebra::batchShape(ShapeAlgebra::fromTensor(base->batchShapeTensor())));
    }

    torch::Tensor SampleDistribution::eventShapeTensor() const
    {
        auto event = ShapeAlgebra::fromTensor(base->eventShapeTensor());
        return ShapeAlgebra::toTensor(ShapeAlgebra::eventShape(sampleShape.resolve(), event));
    }

    torch::Tensor SampleDistribution::sample(c10::ArrayRef<int64_t> sample_shape, c10::optional<at::Generator> generator)
    {
        auto shapes = snapshot();
        auto request = ShapeAlgebra::concat(sample_shape.vec(), shapes.sample);
        auto drawn = base->sample(request, generator);

        AxisLayout layout{static_cast<int64_t>(sample_shape.size()), static_cast<int64_t>(shapes.batch.size()),
                          static_cast<int64_t>(shapes.sample.size()), static_cast<int64_t>(shapes.event.size())};
        return drawn.permute(ShapeAlgebra::permutation(layout, kSampleMajor, kBatchMajor));
    }

    /**
     * @brief Evaluates the base on the replicates of @p value and sums them.
     *
     * @details @p value is first broadcast against B ++ K ++ E, so that a size-1 replicate axis
     * stands for all K of them and a batch mismatch surfaces as a ShapeError, then padded with
     * leading unit axes to the full rank of B ++ K ++ E. Whatever lies in front of that is the
     * caller's prefix.
     */
    torch::Tensor SampleDistribution::reduceReplicates(const torch::Tensor &value, bool normalized)
    {
        auto shapes = snapshot();
        auto event = ShapeAlgebra::eventShape(shapes.sample, shapes.event);
        auto x = value.expand(ShapeAlgebra::broadcastShapes(value.sizes(), ShapeAlgebra::concat(shapes.batch, event)));

        const auto batchNdims = static_cast<int64_t>(shapes.batch.size());
        const auto sampleNdims = static_cast<int64_t>(shapes.sample.size());
        const auto eventNdims = static_cast<int64_t>(shapes.event.size());
        x = ShapeAlgebra::expandToRank(x, batchNdims + sampleNdims + eventNdims);
        const auto prefixNdims = x.dim() - batchNdims - sampleNdims - eventNdims;

        AxisLayout layout{prefixNdims, batchNdims, sampleNdims, eventNdims};
        x = x.permute(ShapeAlgebra::permutation(layout, kBatchMajor, kSampleMajor));
        auto logDensity = normalized ? base->logProbability(x) : base->unnormalizedLogProbability(x);

        std::vector<int64_t> sampleAxes(sampleNdims);
        std::iota(sampleAxes.begin(), sampleAxes.end(), prefixNdims);
        return ReductionEngine::reduceLogDensity(logDensity, sampleAxes, options.useKahanSum);
    }

    torch::Tensor SampleDistribution::logProbability(torch::Tensor value)
    {
        return reduceReplicates(value, true);
    }

    torch::Tensor SampleDistribution::unnormalizedLogProbability(torch::Tensor value)
    {
        return reduceReplicates(value, false);
    }

    torch::Tensor SampleDistribution::entropy()
    {
        auto shapes = snapshot();
        auto replicates = static_cast<double>(ShapeAlgebra::numElements(shapes.sample));
        return (base->entropy() * replicates).expand(shapes.batch);
    }

    torch::Tensor SampleDistribution::replicateStatistic(const torch::Tensor &statistic, const Snapshot &shapes)
    {
        auto withUnits = shapes.batch;
        withUnits.insert(withUnits.end(), shapes.sample.size(), 1);
        withUnits.insert(withUnits.end(), shapes.event.begin(), shapes.event.end());

        auto full = ShapeAlgebra::concat(ShapeAlgebra::concat(shapes.batch, shapes.sample), shapes.event);
        return statistic.expand(ShapeAlgebra::concat(shapes.batch, shapes.event)).reshape(withUnits).expand(full);
    }

    torch::Tensor SampleDistribution::mean()
    {
        auto shapes = snapshot();
        return replicateStatistic(base->mean(), shapes);
    }

    torch::Tensor SampleDistribution::variance()
    {
        auto shapes = snapshot();
        return replicateStatistic(base->variance(), shapes);
    }

    torch::Tensor SampleDistribution::stddev()
    {
        auto shapes = snapshot();
        return replicateStatistic(base->stddev(), shapes);
    }

    torch::Tensor SampleDistribution::mode()
    {
        auto shapes = snapshot();
        return replicateStatistic(base->mode(), shapes);
    }

    std::shared_ptr<Bijector> SampleDistribution::defaultEventSpaceBijector() const
    {
        return std::make_shared<SampleBijector>(base, sampleShape, options.useKahanSum);
    }

    TEST_CASE("SampleDistribution")
    {
        SUBCASE("Everything scalar")
        {
            SampleDistribution dist(std::make_shared<Normal>(0.0, 1.0), 5);
            auto x = dist.sample();
            auto log_prob = dist.logProbability(x);
            CHECK(x.sizes().vec() == std::vector<int64_t>{5});
            CHECK(log_prob.dim() == 0);
            auto expected = dist.getBase()->logProbability(x).sum(0);
            CHECK(log_prob.item().toDouble() == doctest::Approx(expected.item().toDouble()).epsilon(1e-3));
        }

        SUBCASE("Everything non-scalar")
        {
            auto mvn = std::make_shared<Independent>(std::make_shared<Normal>(torch::zeros({3, 2}), 1.0), 1);
            SampleDistribution dist(mvn, {5, 4});
            CHECK(*dist.batchShape() == Shape{3});
            CHECK(*dist.eventShape() == Shape{5, 4, 2});

            auto x = dist.sample({6, 1});
            CHECK(x.sizes().vec() == std::vector<int64_t>{6, 1, 3, 5, 4, 2});
            auto log_prob = dist.logProbability(x);
            CHECK(log_prob.sizes().vec() == std::vector<int64_t>{6, 1, 3});

            auto expected = mvn->logProbability(x.permute({0, 1, 3, 4, 2, 5})).sum({2, 3});
            CHECK(torch::allclose(log_prob, expected, 1e-3, 1e-5));
        }

        SUBCASE("Mixed scalar")
        {
            auto mvn = std::make_shared<Independent>(std::make_shared<Normal>(torch::zeros({2}), 1.0), 1);
            SampleDistribution dist(mvn, 3);
            auto x = dist.sample({4});
            CHECK(x.sizes().vec() == std::vector<int64_t>{4, 3, 2});
            CHECK(dist.logProbability(x).sizes().vec() == std::vector<int64_t>{4});
        }

        SUBCASE("Seeded generators reproduce draws")
        {
            SampleDistribution dist(std::make_shared<Normal>(torch::zeros({3}), 1.0), {2, 2});
            auto first = at::make_generator<at::CPUGeneratorImpl>(7);
            auto second = at::make_generator<at::CPUGeneratorImpl>(7);
            CHECK(torch::equal(dist.sample({4}, first), dist.sample({4}, second)));
        }

        SUBCASE("Transformed distributions, both ways round")
        {
            auto mvn = std::make_shared<Independent>(std::make_shared<Normal>(torch::zeros({2}), 1.0), 1);
            auto affine = std::make_shared<ScaleMatvecTriL>(torch::tensor({0.75f, 0.f, 0.05f, 0.5f}).reshape({2, 2}));
            auto exp = std::make_shared<Exp>();

            for (const std::shared_ptr<Bijector> &bijector : {std::shared_ptr<Bijector>(affine), std::shared_ptr<Bijector>(exp)})
            {
                INFO("Bijector: " << bijector->name());
                auto expectedLogProbability = [&](const torch::Tensor &y)
                {
                    auto x = bijector->inverse(y);
                    auto fldj = bijector->forwardLogDetJacobian(x, 1);
                    return (mvn->logProbability(x) - fldj).sum(1);
                };

                TransformedDistribution transformedSample(std::make_shared<SampleDistribution>(mvn, 3), bijector);
                auto y = transformedSample.sample({4});
                CHECK(y.sizes().vec() == std::vector<int64_t>{4, 3, 2});
                auto actual = transformedSample.logProbability(y);
                CHECK(actual.sizes().vec() == std::vector<int64_t>{4});
                CHECK(torch::allclose(actual, expectedLogProbability(y), 1e-3, 1e-5));

                SampleDistribution sampledTransform(std::make_shared<TransformedDistribution>(mvn, bijector), 3);
                y = sampledTransform.sample({4});
                CHECK(y.sizes().vec() == std::vector<int64_t>{4, 3, 2});
                actual = sampledTransform.logProbability(y);
                CHECK(actual.sizes().vec() == std::vector<int64_t>{4});
                CHECK(torch::allclose(actual, expectedLogProbability(y), 1e-3, 1e-5));
            }
        }

        SUBCASE("Summary statistics are replicated")
        {
            auto mvn = std::make_shared<Independent>(std::make_shared<Normal>(torch::zeros({3, 2}), 1.0), 1);
            SampleDistribution dist(mvn, {5, 4});
            auto ones = torch::ones({3, 5, 4, 2});

            CHECK(torch::equal(dist.mean(), mvn->mean().unsqueeze(1).unsqueeze(1) * ones));
            CHECK(torch::equal(dist.stddev(), mvn->stddev().unsqueeze(1).unsqueeze(1) * ones));
            CHECK(torch::equal(dist.variance(), mvn->variance().unsqueeze(1).unsqueeze(1) * ones));
            CHECK(torch::equal(dist.mode(), mvn->mode().unsqueeze(1).unsqueeze(1) * ones));
        }

        SUBCASE("Entropy scales with the number of replicates")
        {
            auto normal = std::make_shared<Normal>(0.0, torch::tensor({0.25f, 0.5f}).reshape({1, 2}));
            auto mvn = std::make_shared<Independent>(normal, 1);
            SampleDistribution dist(mvn, {3, 4});
            auto expected = 12 * normal->entropy().sum(-1);
            auto actual = dist.entropy();
            CHECK(actual.sizes().vec() == std::vector<int64_t>{1});
            CHECK(torch::allclose(actual, expected));
        }

        SUBCASE("Missing statistics propagate from the base")
        {
            Parameter rate(torch::ones({3}));
            SampleDistribution counts(std::make_shared<Poisson>(&rate, nullptr), 4);
            CHECK_THROWS_AS(counts.entropy(), UnsupportedStatisticError);
            CHECK(counts.mean().sizes().vec() == std::vector<int64_t>{3, 4});

            SampleDistribution uniform(std::make_shared<Uniform>(0.0, 1.0), 2);
            CHECK_THROWS_AS(uniform.mode(), UnsupportedStatisticError);
        }

        SUBCASE("Variable parameters and sample shape change shapes between calls")
        {
            Variable loc(torch::zeros({4, 5, 3}));
            Variable scale(torch::ones({}));
            Variable sampleShape(torch::tensor({1, 2}, torch::kLong));
            SampleDistribution dist(std::make_shared<Independent>(std::make_shared<Normal>(loc, scale), 1), sampleShape);
            CHECK_FALSE(dist.batchShape().has_value());
            CHECK_FALSE(dist.eventShape().has_value());

            auto x = dist.mean();
            CHECK(x.sizes().vec() == std::vector<int64_t>{4, 5, 1, 2, 3});
            CHECK(dist.sample({7, 2}).sizes().vec() == std::vector<int64_t>{7, 2, 4, 5, 1, 2, 3});
            CHECK(dist.logProbability(x).sizes().vec() == std::vector<int64_t>{4, 5});
            CHECK(dist.logProbability(torch::scalar_tensor(0.f)).sizes().vec() == std::vector<int64_t>{4, 5});
            CHECK(ShapeAlgebra::fromTensor(dist.batchShapeTensor()) == Shape{4, 5});
            CHECK(ShapeAlgebra::fromTensor(dist.eventShapeTensor()) == Shape{1, 2, 3});

            loc.assign(torch::zeros({}));
            scale.assign(torch::ones({3, 1, 2}));
            sampleShape.assign(torch::scalar_tensor(6, torch::kLong));

            x = dist.mean();
            CHECK(x.sizes().vec() == std::vector<int64_t>{3, 1, 6, 2});
            CHECK(dist.sample({7, 2}).sizes().vec() == std::vector<int64_t>{7, 2, 3, 1, 6, 2});
            CHECK(dist.logProbability(x).sizes().vec() == std::vector<int64_t>{3, 1});
            CHECK(dist.logProbability(torch::scalar_tensor(0.f)).sizes().vec() == std::vector<int64_t>{3, 1});
            CHECK(ShapeAlgebra::fromTensor(dist.batchShapeTensor()) == Shape{3, 1});
            CHECK(ShapeAlgebra::fromTensor(dist.eventShapeTensor()) == Shape{6, 2});
        }

        SUBCASE("An invalid variable sample shape fails on first use")
        {
            Variable sampleShape(torch::tensor({1, 2}, torch::kLong).reshape({1, 2}));
            auto base = std::make_shared<Independent>(std::make_shared<Normal>(torch::zeros({4, 5, 3}), 1.0), 1);
            SampleDistribution dist(base, sampleShape);
            CHECK_THROWS_AS(dist.mean(), ValidationDeferredError);
            CHECK_THROWS_WITH(dist.sample(), "Argument `sample_shape` must be either a scalar or a vector.");

            sampleShape.assign(torch::tensor({2}, torch::kLong));
            CHECK(dist.mean().sizes().vec() == std::vector<int64_t>{4, 5, 2, 3});
        }

        SUBCASE("Observations broadcast against the event shape")
        {
            SampleDistribution dist(std::make_shared<Normal>(0.0, 1.0), 4);
            auto twoBatch = dist.logProbability(torch::zeros({2, 4}));
            CHECK(twoBatch.sizes().vec() == std::vector<int64_t>{2});
            CHECK(torch::equal(twoBatch, dist.logProbability(torch::zeros({2, 1}))));
        }

        SUBCASE("Observations that do not broadcast are rejected")
        {
            SampleDistribution dist(std::make_shared<Normal>(0.0, 1.0), 4);
            CHECK_THROWS_AS(dist.logProbability(torch::zeros({3})), ShapeError);

            auto mvn = std::make_shared<Independent>(std::make_shared<Normal>(torch::zeros({3, 2}), 1.0), 1);
            SampleDistribution batched(mvn, {5, 4});
            CHECK_THROWS_AS(batched.logProbability(torch::zeros({4, 5, 4, 2})), ShapeError);
            CHECK_THROWS_AS(batched.unnormalizedLogProbability(torch::zeros({2, 4, 5, 4, 2})), ShapeError);
            CHECK(batched.logProbability(torch::zeros({2, 1, 5, 4, 2})).sizes().vec() == std::vector<int64_t>{2, 3});
            try
            {
                dist.logProbability(torch::zeros({3}));
            }
            catch (const ShapeError &error)
            {
                CHECK(std::string(error.what()).find("Incompatible shapes for broadcasting") != std::string::npos);
            }
        }

        SUBCASE("Compensated summation keeps float32 close to float64")
        {
            torch::manual_seed(0);
            const int64_t n = 20000;
            Parameter unitRate(1.0);
            auto samples = Poisson(&unitRate, nullptr).sample({n});
            auto logRate = Normal(0.0, 0.2).sample();

            Parameter logRate32(logRate);
            SampleOptions compensated;
            compensated.useKahanSum = true;
            SampleDistribution dist(std::make_shared<Poisson>(nullptr, &logRate32), n, compensated);
            auto log_prob = dist.logProbability(samples).to(torch::kDouble);

            Parameter logRate64(logRate.to(torch::kDouble));
            SampleDistribution reference(std::make_shared<Poisson>(nullptr, &logRate64), n);
            auto expected = reference.logProbability(samples.to(torch::kDouble));

            CHECK(std::abs(log_prob.item().toDouble() - expected.item().toDouble()) < 0.01);
            CHECK(dist.usesKahanSum());
        }

        SUBCASE("Gradients reach the base parameters")
        {
            for (bool compensated : {false, true})
            {
                INFO("Compensated: " << compensated);
                auto loc = torch::zeros({3}).requires_grad_();
                auto scale = torch::ones({3}).requires_grad_();
                SampleOptions options;
                options.useKahanSum = compensated;
                SampleDistribution dist(std::make_shared<Normal>(loc, scale), 4, options);

                auto x = dist.sample();
                auto log_prob = dist.logProbability(x);
                CHECK(log_prob.requires_grad());
                log_prob.sum().backward();
                REQUIRE(loc.grad().defined());
                REQUIRE(scale.grad().defined());
                CHECK(torch::allclose(loc.grad(), x.sum(-1), 1e-4, 1e-4));
                CHECK(torch::allclose(scale.grad(), (x.pow(2) - 1).sum(-1), 1e-4, 1e-4));

                auto factor = torch::tensor({2.f, 3.f}).requires_grad_();
                auto transformed = std::make_shared<TransformedDistribution>(
                        std::make_shared<Normal>(torch::zeros({2}), 1.0), std::make_shared<Scale>(factor));
                SampleDistribution replicated(transformed, 3, options);
                auto ildj = replicated.defaultEventSpaceBijector()->inverseLogDetJacobian(torch::ones({2, 3}), 1);
                CHECK(ildj.requires_grad());
                ildj.sum().backward();
                REQUIRE(factor.grad().defined());
                CHECK(torch::allclose(factor.grad(), torch::tensor({-1.5f, -1.f}), 1e-5, 1e-5));
            }
        }

        SUBCASE("Samples of samples nest")
        {
            auto normal = std::make_shared<Normal>(torch::zeros({3}), 1.0);
            auto inner = std::make_shared<SampleDistribution>(normal, 2);
            SampleDistribution outer(inner, 4);
            CHECK(*outer.batchShape() == Shape{3});
            CHECK(*outer.eventShape() == Shape{4, 2});

            auto x = outer.sample({5});
            CHECK(x.sizes().vec() == std::vector<int64_t>{5, 3, 4, 2});
            auto expected = normal->logProbability(x.permute({0, 2, 3, 1})).sum({1, 2});
            CHECK(torch::allclose(outer.logProbability(x), expected, 1e-5, 1e-5));
            CHECK(outer.mean().sizes().vec() == std::vector<int64_t>{3, 4, 2});
            CHECK(torch::allclose(outer.entropy(), normal->entropy() * 8));
        }

        SUBCASE("Unnormalized log density follows the same path")
        {
            auto mvn = std::make_shared<Independent>(std::make_shared<Normal>(torch::zeros({3, 2}), 1.0), 1);
            SampleDistribution dist(mvn, {5, 4});
            auto x = dist.sample({2});
            CHECK(torch::allclose(dist.unnormalizedLogProbability(x), dist.logProbability(x)));
        }

        SUBCASE("Names and construction errors")
        {
            SampleOptions named;
            named.name = "Replicates";
            SampleDistribution dist(std::make_shared<Normal>(0.0, 1.0), 2, named);
            CHECK(dist.name() == "Replicates");
            CHECK_THROWS_AS(SampleDistribution(nullptr, 2), std::runtime_error);
            CHECK_THROWS_AS(SampleDistribution(std::make_shared<Normal>(0.0, 1.0), Shape{-1}), ShapeError);
        }
    }
}
