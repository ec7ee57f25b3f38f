//
// Created by moinshaikh on 2/22/26.
//
#include<numeric>

#include<torch/torch.h>
#include<doctest/doctest.h>
#include"../../include/Distribution/Independent.hpp"
#include"../../include/Distribution/Normal.hpp"
#include"../../include/Distribution/Poisson.hpp"
#include"../../include/Bijector/Bijector.hpp"
#include"../../include/Shape/ReductionEngine.hpp"
#include"../../include/Errors.hpp"

namespace Replicate
{
    namespace
    {
        std::pair<Shape, Shape> splitBatch(const Shape &batch, int64_t reinterpreted)
        {
            if (static_cast<int64_t>(batch.size()) < reinterpreted)
            {
                throw ShapeError("Independent cannot reinterpret " + std::to_string(reinterpreted) +
                                 " dimensions of batch shape " + ShapeAlgebra::toString(batch));
            }
            auto split = batch.end() - reinterpreted;
            return {Shape(batch.begin(), split), Shape(split, batch.end())};
        }
    }

    Independent::Independent(std::shared_ptr<Distribution> base, int64_t reinterpretedBatchNdims, bool useKahanSum)
        : base(std::move(base)), reinterpretedBatchNdims(reinterpretedBatchNdims), useKahanSum(useKahanSum)
    {
        if (this->base == nullptr)
        {
            throw std::runtime_error("Independent needs a base distribution");
        }
        if (reinterpretedBatchNdims <= 0)
        {
            throw std::runtime_error("reinterpretedBatchNdims must be positive");
        }
        batchShape();
    }

    std::vector<int64_t> Independent::reinterpretedAxes() const
    {
        std::vector<int64_t> axes(reinterpretedBatchNdims);
        std::iota(axes.begin(), axes.end(), -reinterpretedBatchNdims);
        return axes;
    }

    std::optional<Shape> Independent::batchShape() const
    {
        auto batch = base->batchShape();
        if (!batch)
        {
            return std::nullopt;
        }
        return splitBatch(*batch, reinterpretedBatchNdims).first;
    }

    std::optional<Shape> Independent::eventShape() const
    {
        auto batch = base->batchShape();
        auto event = base->eventShape();
        if (!batch || !event)
        {
            return std::nullopt;
        }
        return ShapeAlgebra::concat(splitBatch(*batch, reinterpretedBatchNdims).second, *event);
    }

    torch::Tensor Independent::batchShapeTensor() const
    {
        auto batch = ShapeAlgebra::fromTensor(base->batchShapeTensor());
        return ShapeAlgebra::toTensor(splitBatch(batch, reinterpretedBatchNdims).first);
    }

    torch::Tensor Independent::eventShapeTensor() const
    {
        auto batch = ShapeAlgebra::fromTensor(base->batchShapeTensor());
        auto event = ShapeAlgebra::fromTensor(base->eventShapeTensor());
        return ShapeAlgebra::toTensor(ShapeAlgebra::concat(splitBatch(batch, reinterpretedBatchNdims).second, event));
    }

    torch::Tensor Independent::sample(c10::ArrayRef<int64_t> sample_shape, c10::optional<at::Generator> generator)
    {
        return base->sample(sample_shape, generator);
    }

    torch::Tensor Independent::logProbability(torch::Tensor value)
    {
        return ReductionEngine::reduceLogDensity(base->logProbability(std::move(value)), reinterpretedAxes(), useKahanSum);
    }

    torch::Tensor Independent::unnormalizedLogProbability(torch::Tensor value)
    {
        return ReductionEngine::reduceLogDensity(base->unnormalizedLogProbability(std::move(value)),
                                                 reinterpretedAxes(), useKahanSum);
    }

    torch::Tensor Independent::entropy()
    {
        return base->entropy().sum(reinterpretedAxes());
    }

    torch::Tensor Independent::mean()
    {
        return base->mean();
    }

    torch::Tensor Independent::variance()
    {
        return base->variance();
    }

    torch::Tensor Independent::stddev()
    {
        return base->stddev();
    }

    torch::Tensor Independent::mode()
    {
        return base->mode();
    }

    std::shared_ptr<Bijector> Independent::defaultEventSpaceBijector() const
    {
        return base->defaultEventSpaceBijector();
    }

    TEST_CASE("Independent")
    {
        auto normal = std::make_shared<Normal>(torch::zeros({4, 3, 2}), torch::ones({2}));

        SUBCASE("Reinterprets trailing batch dimensions")
        {
            Independent dist(normal, 2);
            CHECK(*dist.batchShape() == Shape{4});
            CHECK(*dist.eventShape() == Shape{3, 2});
            CHECK(ShapeAlgebra::fromTensor(dist.batchShapeTensor()) == Shape{4});
            CHECK(ShapeAlgebra::fromTensor(dist.eventShapeTensor()) == Shape{3, 2});
            CHECK(dist.sample({5}).sizes().vec() == std::vector<int64_t>{5, 4, 3, 2});
        }

        SUBCASE("log_prob() sums the reinterpreted dimensions")
        {
            Independent dist(normal, 2);
            auto value = torch::randn({5, 4, 3, 2});
            auto log_probs = dist.logProbability(value);
            CHECK(log_probs.sizes().vec() == std::vector<int64_t>{5, 4});
            CHECK(torch::allclose(log_probs, normal->logProbability(value).sum({-2, -1})));

            Independent compensated(normal, 2, true);
            CHECK(torch::allclose(compensated.logProbability(value), log_probs, 1e-5, 1e-5));
        }

        SUBCASE("Statistics pass through and entropy is summed")
        {
            Independent dist(normal, 1);
            CHECK(dist.mean().sizes().vec() == std::vector<int64_t>{4, 3, 2});
            CHECK(torch::allclose(dist.stddev(), torch::ones({4, 3, 2})));
            CHECK(torch::allclose(dist.entropy(), normal->entropy().sum(-1)));
        }

        SUBCASE("Missing statistics propagate")
        {
            Parameter rate(torch::ones({3}));
            Independent dist(std::make_shared<Poisson>(&rate, nullptr), 1);
            CHECK_THROWS_AS(dist.entropy(), UnsupportedStatisticError);
            CHECK_THROWS_AS(dist.defaultEventSpaceBijector(), UnsupportedStatisticError);
        }

        SUBCASE("Invalid arguments")
        {
            CHECK_THROWS_AS(Independent(nullptr, 1), std::runtime_error);
            CHECK_THROWS_AS(Independent(normal, 0), std::runtime_error);
            CHECK_THROWS_AS(Independent(normal, 4), ShapeError);
        }
    }
}
