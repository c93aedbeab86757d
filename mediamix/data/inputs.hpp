#pragma once
#include "mediamix/Array.hpp"
#include <Eigen/Core>
#include <string>

namespace mediamix { namespace data {

/** Reads time-indexed regressors (media or extra features) from a CSV file with one row per
 * timestep.
 *
 * With `geos` of 0 the result is a rank 2 (time, column) array.  Otherwise the columns are read
 * as `column / geos` variables for each of `geos` geos, in variable-major order (the geo index
 * varying fastest: `tv_geo1, tv_geo2, radio_geo1, radio_geo2, ...`), and the result is a rank 3
 * (time, variable, geo) array.
 *
 * \throws std::invalid_argument if the file has no data rows, or if its number of columns is not
 * a multiple of `geos`
 * \throws std::ios_base::failure if the file cannot be read
 */
Array readRegressors(const std::string &filename, Eigen::Index geos = 0);

/** Reads the target from a CSV file with one row per timestep.  With `geos` of 0 the file must have
 * a single column and the result is a rank 1 (time) array; otherwise it must have `geos` columns
 * and the result is a rank 2 (time, geo) array.
 *
 * \throws std::invalid_argument if the file has no data rows or the wrong number of columns
 * \throws std::ios_base::failure if the file cannot be read
 */
Array readTarget(const std::string &filename, Eigen::Index geos = 0);

/** Reads all rows of a CSV file into a (row, field) matrix.
 *
 * \throws std::invalid_argument if the file has no data rows
 */
Eigen::MatrixXd readMatrix(const std::string &filename);

}}
