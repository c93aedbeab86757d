#include "mediamix/Array.hpp"
#include <sstream>

namespace mediamix {

using namespace Eigen;

std::string to_string(const Shape &shape) {
    std::ostringstream s;
    s << "(";
    for (size_t i = 0; i < shape.size(); i++) {
        if (i > 0) s << ", ";
        s << shape[i];
    }
    if (shape.size() == 1) s << ",";
    s << ")";
    return s.str();
}

Array::ShapeError::ShapeError(const std::string &what) : std::logic_error(what) {}

Array::Array(Shape shape, ArrayXd values) : shape_(std::move(shape)), values_(std::move(values)) {
    Index n = 1;
    for (const auto &d : shape_) {
        if (d < 0) throw ShapeError("Array: negative extent in shape " + to_string(shape_));
        n *= d;
    }
    if (n != values_.size())
        throw ShapeError("Array: cannot store " + std::to_string(values_.size()) + " values in shape " + to_string(shape_));
}

Array::Array(const VectorXd &v) : shape_{v.size()}, values_(v.array()) {}

Array::Array(const ArrayXd &v) : shape_{v.size()}, values_(v) {}

Array::Array(const MatrixXd &m) : shape_{m.rows(), m.cols()}, values_(Map<const ArrayXd>(m.data(), m.size())) {}

Array::Array(const ArrayXXd &m) : shape_{m.rows(), m.cols()}, values_(Map<const ArrayXd>(m.data(), m.size())) {}

Array::Array(const Tensor<double, 3> &t)
    : shape_{t.dimension(0), t.dimension(1), t.dimension(2)}, values_(Map<const ArrayXd>(t.data(), t.size()))
{}

Index Array::dim(size_t i) const {
    if (i >= shape_.size())
        throw std::out_of_range("Array::dim(" + std::to_string(i) + ") called on array of shape " + to_string(shape_));
    return shape_[i];
}

ArrayXXd Array::matrix() const {
    if (rank() > 2) throw ShapeError("Array::matrix() called on array of shape " + to_string(shape_));
    Index rows = rank() >= 1 ? shape_[0] : 1, cols = rank() == 2 ? shape_[1] : 1;
    return Map<const ArrayXXd>(values_.data(), rows, cols);
}

Tensor<double, 3> Array::tensor() const {
    if (rank() > 3) throw ShapeError("Array::tensor() called on array of shape " + to_string(shape_));
    Index d[3] = {1, 1, 1};
    for (size_t i = 0; i < rank(); i++) d[i] = shape_[i];
    return TensorMap<const Tensor<double, 3>>(values_.data(), d[0], d[1], d[2]);
}

std::ostream& operator<<(std::ostream &os, const Array &a) {
    os << "Array" << to_string(a.shape_) << " [";
    for (Index i = 0; i < a.values_.size(); i++) {
        if (i > 0) os << ", ";
        os << a.values_[i];
    }
    return os << "]";
}

}
