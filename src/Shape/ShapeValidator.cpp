//
// Created by moinshaikh on 2/15/26.
//

#include<torch/torch.h>
#include<spdlog/spdlog.h>

#include"../../include/Shape/ShapeValidator.hpp"
#include"../../include/Errors.hpp"
#include<doctest/doctest.h>

namespace Replicate
{
    namespace ShapeValidator
    {
        Shape normalize(const torch::Tensor &value)
        {
            if (value.dim() > 1)
            {
                throw ShapeError("Argument `sample_shape` must be either a scalar or a vector.");
            }
            if (value.is_floating_point() || value.is_complex() || value.scalar_type() == torch::kBool)
            {
                throw ShapeError("Argument `sample_shape` must have an integer dtype.");
            }
            auto dims = ShapeAlgebra::fromTensor(value);
            for (auto dim : dims)
            {
                if (dim < 0)
                {
                    throw ShapeError("Argument `sample_shape` must be non-negative, got " +
                                     ShapeAlgebra::toString(dims) + ".");
                }
            }
            return dims;
        }
    }

    SampleShape::SampleShape(int64_t size) : SampleShape(torch::scalar_tensor(size, torch::kLong))
    {

    }

    SampleShape::SampleShape(std::initializer_list<int64_t> dims) : SampleShape(Shape(dims))
    {

    }

    SampleShape::SampleShape(const Shape &dims) : SampleShape(ShapeAlgebra::toTensor(dims))
    {

    }

    SampleShape::SampleShape(torch::Tensor value) : value(value), validated(ShapeValidator::normalize(value))
    {

    }

    SampleShape::SampleShape(const Variable &variable) : value(variable)
    {

    }

    /**
     * @brief Resolves the sample shape for one evaluation.
     *
     * @details A fixed shape returns the value validated at construction. A dynamic shape is read
     * from its Variable and validated now; a failure is re-raised as ValidationDeferredError so the
     * caller can tell it apart from a construction-time failure while still catching ShapeError.
     */
    Shape SampleShape::resolve() const
    {
        if (validated)
        {
            return *validated;
        }
        try
        {
            return ShapeValidator::normalize(value.value());
        }
        catch (const ShapeError &error)
        {
            spdlog::warn("Deferred sample_shape validation failed: {}", error.what());
            throw ValidationDeferredError(error.what());
        }
    }

    TEST_CASE("ShapeValidator")
    {
        SUBCASE("A scalar becomes a single sample axis")
        {
            CHECK(ShapeValidator::normalize(torch::scalar_tensor(5, torch::kLong)) == Shape{5});
            CHECK(SampleShape(3).resolve() == Shape{3});
        }

        SUBCASE("A vector is returned unchanged")
        {
            CHECK(ShapeValidator::normalize(torch::tensor({5, 4})) == Shape{5, 4});
            CHECK(SampleShape({5, 4}).resolve() == Shape{5, 4});
            CHECK(SampleShape(Shape{}).resolve().empty());
        }

        SUBCASE("Rank 2 and above is rejected at construction")
        {
            auto matrix = torch::tensor({1, 2}).reshape({1, 2});
            CHECK_THROWS_AS(SampleShape{matrix}, ShapeError);
            CHECK_THROWS_WITH(ShapeValidator::normalize(matrix),
                              "Argument `sample_shape` must be either a scalar or a vector.");
        }

        SUBCASE("Negative and non-integer values are rejected")
        {
            CHECK_THROWS_AS(SampleShape(Shape{2, -1}), ShapeError);
            CHECK_THROWS_AS(ShapeValidator::normalize(torch::tensor({1.5f})), ShapeError);
        }

        SUBCASE("Fixed shapes are static, variable shapes are not")
        {
            SampleShape fixed({1, 2});
            CHECK_FALSE(fixed.isDynamic());
            REQUIRE(fixed.staticValue().has_value());
            CHECK(*fixed.staticValue() == Shape{1, 2});

            Variable cell(torch::tensor({1, 2}));
            SampleShape dynamic(cell);
            CHECK(dynamic.isDynamic());
            CHECK_FALSE(dynamic.staticValue().has_value());
            CHECK(dynamic.resolve() == Shape{1, 2});

            cell.assign(torch::scalar_tensor(6, torch::kLong));
            CHECK(dynamic.resolve() == Shape{6});
        }

        SUBCASE("A variable that becomes a matrix fails when resolved")
        {
            Variable cell(torch::tensor({1, 2}));
            SampleShape dynamic(cell);
            cell.assign(torch::tensor({1, 2}).reshape({1, 2}));
            CHECK_THROWS_AS(dynamic.resolve(), ValidationDeferredError);
            CHECK_THROWS_WITH(dynamic.resolve(),
                              "Argument `sample_shape` must be either a scalar or a vector.");
        }

        SUBCASE("A variable that starts as a matrix constructs but never resolves")
        {
            Variable cell(torch::tensor({1, 2}).reshape({1, 2}));
            SampleShape dynamic(cell);
            CHECK_THROWS_AS(dynamic.resolve(), ShapeError);
        }
    }
}
