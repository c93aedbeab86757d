#include "mediamix/data/inputs.hpp"
#include "mediamix/data/CSVParser.hpp"
#include <stdexcept>
#include <vector>

namespace mediamix { namespace data {

using namespace Eigen;

MatrixXd readMatrix(const std::string &filename) {
    CSVParser csv(filename);
    std::vector<RowVectorXd> rows;
    for (auto &row : csv) rows.push_back(row);
    if (rows.empty()) throw std::invalid_argument("`" + filename + "' contains no data rows");

    MatrixXd m(rows.size(), csv.fields().size());
    for (size_t t = 0; t < rows.size(); t++) m.row(t) = rows[t];
    return m;
}

Array readRegressors(const std::string &filename, Index geos) {
    MatrixXd m = readMatrix(filename);
    if (geos == 0) return Array(m);

    if (m.cols() % geos != 0)
        throw std::invalid_argument("`" + filename + "' has " + std::to_string(m.cols()) + " columns, which is not a multiple of " +
                std::to_string(geos) + " geos");
    const Index T = m.rows(), K = m.cols() / geos;
    Tensor<double, 3> t(T, K, geos);
    for (Index k = 0; k < K; k++) for (Index g = 0; g < geos; g++)
        for (Index r = 0; r < T; r++) t(r, k, g) = m(r, k * geos + g);
    return Array(t);
}

Array readTarget(const std::string &filename, Index geos) {
    MatrixXd m = readMatrix(filename);
    const Index expected = geos == 0 ? 1 : geos;
    if (m.cols() != expected)
        throw std::invalid_argument("`" + filename + "' has " + std::to_string(m.cols()) + " target columns; expected " + std::to_string(expected));
    if (geos == 0) return Array(VectorXd(m.col(0)));
    return Array(m);
}

}}
