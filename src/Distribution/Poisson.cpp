//
// Created by moinshaikh on 2/20/26.
//
#include<cmath>

#include<torch/torch.h>
#include<doctest/doctest.h>
#include"../../include/Distribution/Poisson.hpp"
#include"../../include/Errors.hpp"

namespace Replicate
{
    namespace
    {
        const Parameter &chooseParameter(const Parameter *rate, const Parameter *logRate)
        {
            if ((rate == nullptr) == (logRate == nullptr))
            {
                throw std::runtime_error("Exactly one of rate or logRate must be provided");
            }
            return rate != nullptr ? *rate : *logRate;
        }
    }

    /**
     * @brief Constructs a Poisson distribution from a rate or a log rate.
     *
     * @details The parameter is kept as given; the other parameterization is derived on demand,
     * so a Variable backed parameter keeps tracking its Variable.
     */
    Poisson::Poisson(const Parameter *rate, const Parameter *logRate)
        : param(chooseParameter(rate, logRate)), isLogRate(logRate != nullptr)
    {

    }

    torch::Tensor Poisson::getRate() const
    {
        return isLogRate ? torch::exp(param.value()) : param.value();
    }

    torch::Tensor Poisson::getLogRate() const
    {
        return isLogRate ? param.value() : torch::log(param.value());
    }

    std::optional<Shape> Poisson::batchShape() const
    {
        return param.staticShape();
    }

    std::optional<Shape> Poisson::eventShape() const
    {
        return Shape{};
    }

    torch::Tensor Poisson::batchShapeTensor() const
    {
        return ShapeAlgebra::toTensor(param.value().sizes().vec());
    }

    torch::Tensor Poisson::eventShapeTensor() const
    {
        return ShapeAlgebra::toTensor({});
    }

    torch::Tensor Poisson::logProbability(torch::Tensor value)
    {
        return value * getLogRate() - getRate() - torch::lgamma(value + 1);
    }

    torch::Tensor Poisson::sample(c10::ArrayRef<int64_t> sample_shape, c10::optional<at::Generator> generator)
    {
        auto shape = extendedShape(sample_shape);
        auto no_grad_guard = torch::NoGradGuard();
        return at::poisson(getRate().expand(shape).contiguous(), generator);
    }

    torch::Tensor Poisson::mean()
    {
        return getRate();
    }

    torch::Tensor Poisson::variance()
    {
        return getRate();
    }

    torch::Tensor Poisson::mode()
    {
        return torch::floor(getRate());
    }

    TEST_CASE("Poisson")
    {
        SUBCASE("Throws when provided both rate and logRate")
        {
            Parameter rate(torch::ones({3}));
            Parameter logRate(torch::zeros({3}));

            CHECK_THROWS(Poisson(&rate, &logRate));
            CHECK_THROWS(Poisson(nullptr, nullptr));
        }

        Parameter rate(torch::tensor({1.5f, 4.f}));
        Poisson dist(&rate, nullptr);

        SUBCASE("log_prob()")
        {
            auto log_probs = dist.logProbability(torch::tensor({0.f, 3.f}));
            CHECK(log_probs[0].item().toDouble() == doctest::Approx(-1.5));
            CHECK(log_probs[1].item().toDouble() ==
                  doctest::Approx(3 * std::log(4.0) - 4 - std::log(6.0)).epsilon(1e-5));
        }

        SUBCASE("Rate and log rate parameterizations agree")
        {
            Parameter logRate(torch::log(torch::tensor({1.5f, 4.f})));
            Poisson fromLog(nullptr, &logRate);
            auto value = torch::tensor({2.f, 7.f});
            CHECK(torch::allclose(fromLog.logProbability(value), dist.logProbability(value)));
            CHECK(torch::allclose(fromLog.getRate(), dist.getRate()));
        }

        SUBCASE("Samples are non-negative counts")
        {
            auto samples = dist.sample({200});
            CHECK(samples.sizes().vec() == std::vector<int64_t>{200, 2});
            CHECK((samples >= 0).all().item().toBool());
            CHECK(torch::equal(samples, samples.floor()));
        }

        SUBCASE("Statistics")
        {
            CHECK(torch::allclose(dist.mean(), torch::tensor({1.5f, 4.f})));
            CHECK(torch::allclose(dist.variance(), torch::tensor({1.5f, 4.f})));
            CHECK(torch::allclose(dist.mode(), torch::tensor({1.f, 4.f})));
            CHECK_THROWS_AS(dist.entropy(), UnsupportedStatisticError);
            CHECK_THROWS_AS(dist.defaultEventSpaceBijector(), UnsupportedStatisticError);
        }
    }
}
