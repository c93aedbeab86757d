#pragma once
#include <Eigen/Core>
#include <unsupported/Eigen/CXX11/Tensor>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace mediamix {

/// The extents of an Array, outermost (time) axis first.
using Shape = std::vector<Eigen::Index>;

/// Returns a printable "(a, b, c)" representation of a shape.
std::string to_string(const Shape &shape);

/** Simple n-dimensional array of doubles.  Values are stored flat in column-major order (the first
 * index varies fastest), which is the storage order of both Eigen matrices and Eigen tensors, so
 * that an Array can be converted to and from either without reordering.
 *
 * Arrays are used for model inputs (media, target, extra features) and for the values of every
 * site declared into a Handler.  They do no arithmetic of their own: computations convert to an
 * Eigen matrix or tensor via matrix() or tensor().
 */
class Array {
    public:
        /// Default constructs an empty array of shape (0).
        Array() = default;

        /** Constructs an array of the given shape from flat column-major values.
         *
         * \throws ShapeError if the number of values does not match the product of the extents
         */
        Array(Shape shape, Eigen::ArrayXd values);

        /// Constructs a rank 1 array from a vector
        explicit Array(const Eigen::VectorXd &v);
        /// Constructs a rank 1 array from an array
        explicit Array(const Eigen::ArrayXd &v);
        /// Constructs a rank 2 array from a matrix
        explicit Array(const Eigen::MatrixXd &m);
        /// Constructs a rank 2 array from a 2D array
        explicit Array(const Eigen::ArrayXXd &m);
        /// Constructs a rank 3 array from a tensor
        explicit Array(const Eigen::Tensor<double, 3> &t);

        /// The number of axes
        size_t rank() const { return shape_.size(); }

        /// The extents of each axis
        const Shape& shape() const { return shape_; }

        /** The extent of axis `i`.
         *
         * \throws std::out_of_range if `i >= rank()`
         */
        Eigen::Index dim(size_t i) const;

        /// The total number of values
        Eigen::Index size() const { return values_.size(); }

        /// True if the array holds no values
        bool empty() const { return values_.size() == 0; }

        /// The flat, column-major values
        const Eigen::ArrayXd& values() const { return values_; }

        /** Returns the values as a 2D array.  A rank 0 array becomes 1x1, a rank 1 array of
         * extent n becomes n x 1.
         *
         * \throws ShapeError if rank() > 2
         */
        Eigen::ArrayXXd matrix() const;

        /** Returns the values as a rank 3 tensor, padding missing trailing axes with extent 1.
         *
         * \throws ShapeError if rank() > 3
         */
        Eigen::Tensor<double, 3> tensor() const;

        /** Exception class thrown when array shapes do not conform: when constructing, reshaping,
         * or broadcasting values of incompatible shapes.
         */
        class ShapeError : public std::logic_error {
            public:
                /// Constructs with the given message
                explicit ShapeError(const std::string &what);
        };

        /// Prints the shape and values of the array
        friend std::ostream& operator<<(std::ostream &os, const Array &a);

    private:
        Shape shape_{0};
        Eigen::ArrayXd values_;
};

/** Returns true if an array of `rows` x `cols` can be broadcast to `to_rows` x `to_cols`: each
 * extent must either match or be 1.
 */
inline bool broadcastable(Eigen::Index rows, Eigen::Index cols, Eigen::Index to_rows, Eigen::Index to_cols) {
    return (rows == to_rows or rows == 1) and (cols == to_cols or cols == 1);
}

}
