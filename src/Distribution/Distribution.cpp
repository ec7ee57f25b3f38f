//
// Created by moinshaikh on 1/30/26.
//

#include"../../include/Distribution/Distribution.hpp"
#include"../../include/Bijector/Bijector.hpp"
#include"../../include/Errors.hpp"
#include<vector>

namespace Replicate
{
    namespace
    {
        UnsupportedStatisticError unsupported(const std::string &distribution, const std::string &what)
        {
            return UnsupportedStatisticError(distribution + " does not implement " + what);
        }
    }

    Shape Distribution::extendedShape(c10::ArrayRef<int64_t> sampleShapes) const
    {
        auto batch_shape = resolvedBatchShape();
        auto event_shape = resolvedEventShape();
        Shape outputShape;
        outputShape.insert(outputShape.end(), sampleShapes.begin(), sampleShapes.end());
        outputShape.insert(outputShape.end(),batch_shape.begin(), batch_shape.end());
        outputShape.insert(outputShape.end(),event_shape.begin(), event_shape.end());
        return outputShape;

    }

    Shape Distribution::resolvedBatchShape() const
    {
        auto shape = batchShape();
        return shape ? *shape : ShapeAlgebra::fromTensor(batchShapeTensor());
    }

    Shape Distribution::resolvedEventShape() const
    {
        auto shape = eventShape();
        return shape ? *shape : ShapeAlgebra::fromTensor(eventShapeTensor());
    }

    torch::Tensor Distribution::unnormalizedLogProbability(torch::Tensor value)
    {
        return logProbability(std::move(value));
    }

    torch::Tensor Distribution::entropy()
    {
        throw unsupported(name(), "entropy");
    }

    torch::Tensor Distribution::mean()
    {
        throw unsupported(name(), "mean");
    }

    torch::Tensor Distribution::variance()
    {
        throw unsupported(name(), "variance");
    }

    torch::Tensor Distribution::stddev()
    {
        return torch::sqrt(variance());
    }

    torch::Tensor Distribution::mode()
    {
        throw unsupported(name(), "mode");
    }

    std::shared_ptr<Bijector> Distribution::defaultEventSpaceBijector() const
    {
        throw unsupported(name(), "a default event space bijector");
    }
}
