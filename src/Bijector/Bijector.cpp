//
// Created by moinshaikh on 2/18/26.
//

#include<numeric>

#include<torch/torch.h>

#include"../../include/Bijector/Bijector.hpp"
#include"../../include/Errors.hpp"

namespace Replicate
{
    namespace
    {
        void checkEventNdims(const std::string &name, int64_t eventNdims, int64_t minNdims, int64_t rank)
        {
            if (eventNdims < minNdims)
            {
                throw ShapeError(name + " needs at least " + std::to_string(minNdims) +
                                 " event dimensions, got " + std::to_string(eventNdims));
            }
            if (rank < eventNdims)
            {
                throw ShapeError(name + " got a rank " + std::to_string(rank) + " input for " +
                                 std::to_string(eventNdims) + " event dimensions");
            }
        }

        std::pair<Shape, Shape> splitTrailing(const std::string &name, const Shape &shape, int64_t ndims)
        {
            if (static_cast<int64_t>(shape.size()) < ndims)
            {
                throw ShapeError(name + " needs a shape of rank at least " + std::to_string(ndims) +
                                 ", got " + ShapeAlgebra::toString(shape));
            }
            auto split = shape.end() - ndims;
            return {Shape(shape.begin(), split), Shape(split, shape.end())};
        }
    }

    torch::Tensor Bijector::forwardLogDetJacobian(const torch::Tensor &x, int64_t eventNdims) const
    {
        const auto minNdims = forwardMinEventNdims();
        checkEventNdims(name(), eventNdims, minNdims, x.dim());
        auto batchLikeShape = splitTrailing(name(), x.sizes().vec(), minNdims).first;
        return reduceLogDetJacobian(forwardLogDetJacobianImpl(x), batchLikeShape, eventNdims - minNdims);
    }

    torch::Tensor Bijector::inverseLogDetJacobian(const torch::Tensor &y, int64_t eventNdims) const
    {
        const auto minNdims = inverseMinEventNdims();
        checkEventNdims(name(), eventNdims, minNdims, y.dim());
        auto batchLikeShape = splitTrailing(name(), y.sizes().vec(), minNdims).first;
        return reduceLogDetJacobian(inverseLogDetJacobianImpl(y), batchLikeShape, eventNdims - minNdims);
    }

    Shape Bijector::forwardEventShape(const Shape &inputShape) const
    {
        auto parts = splitTrailing(name(), inputShape, forwardMinEventNdims());
        return ShapeAlgebra::concat(parts.first, forwardEventShapeImpl(parts.second));
    }

    Shape Bijector::inverseEventShape(const Shape &outputShape) const
    {
        auto parts = splitTrailing(name(), outputShape, inverseMinEventNdims());
        return ShapeAlgebra::concat(parts.first, inverseEventShapeImpl(parts.second));
    }

    Shape Bijector::forwardEventShapeImpl(const Shape &eventShape) const
    {
        return eventShape;
    }

    Shape Bijector::inverseEventShapeImpl(const Shape &eventShape) const
    {
        return eventShape;
    }

    torch::Tensor Bijector::forwardLogDetJacobianImpl(const torch::Tensor &x) const
    {
        return -inverseLogDetJacobianImpl(forward(x));
    }

    torch::Tensor Bijector::inverseLogDetJacobianImpl(const torch::Tensor &y) const
    {
        return -forwardLogDetJacobianImpl(inverse(y));
    }

    /**
     * @brief Sums a log-det-Jacobian over the extra event dimensions.
     *
     * @details Multiplying by ones of the reduced shape before summing makes a constant,
     * parameter-shaped term count once per reduced element, exactly like a term that was
     * computed elementwise and already has the full shape.
     */
    torch::Tensor Bijector::reduceLogDetJacobian(const torch::Tensor &logDetJacobian,
                                                 const Shape &batchLikeShape,
                                                 int64_t extraNdims)
    {
        if (extraNdims <= 0)
        {
            return logDetJacobian;
        }
        Shape reduceShape(batchLikeShape.end() - extraNdims, batchLikeShape.end());
        std::vector<int64_t> axes(extraNdims);
        std::iota(axes.begin(), axes.end(), -extraNdims);
        return (logDetJacobian * torch::ones(reduceShape, logDetJacobian.options())).sum(axes);
    }
}
