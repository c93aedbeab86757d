#include "mediamix/ModelAssembler.hpp"
#include "mediamix/PriorCatalog.hpp"
#include "mediamix/Trace.hpp"
#include "mediamix/cmdargs/PriorCheck.hpp"
#include "mediamix/data/inputs.hpp"
#include "mediamix/transform/Kind.hpp"
#include <eris/Random.hpp>
#include <Eigen/Core>
#include <boost/optional.hpp>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

using namespace mediamix;
using namespace Eigen;

// Converts a vector of option values to a rank 1 Array
Array vector_array(const std::vector<double> &v) {
    return Array(Shape{(Index) v.size()}, Map<const ArrayXd>(v.data(), v.size()));
}

// Prints the CSV header: one column per element of each latent site of the trace
void print_header(const Trace &trace) {
    std::cout << "draw,log_joint";
    for (const auto &site : trace.sites()) {
        if (site.type != Site::Type::Sample) continue;
        const Shape &shape = site.value.shape();
        if (shape.empty()) { std::cout << "," << site.name; continue; }
        const Index rows = shape[0], cols = shape.size() > 1 ? shape[1] : 1;
        for (Index i = 0; i < rows; i++) for (Index j = 0; j < cols; j++) {
            std::cout << "," << site.name << "[" << i;
            if (shape.size() > 1) std::cout << "," << j;
            std::cout << "]";
        }
    }
    std::cout << "\n";
}

// Prints one row of latent values, in the same (row-major) order as print_header()
void print_draw(unsigned int draw, const Trace &trace) {
    std::cout << draw << "," << trace.logJoint();
    for (const auto &site : trace.sites()) {
        if (site.type != Site::Type::Sample) continue;
        const ArrayXXd v = site.value.matrix();
        for (Index i = 0; i < v.rows(); i++) for (Index j = 0; j < v.cols(); j++)
            std::cout << "," << v(i, j);
    }
    std::cout << "\n";
}

int main(int argc, char *argv[]) {
    cmdargs::PriorCheck args;
    try {
        args.parse(argc, argv);
    }
    catch (const std::exception &e) {
        std::cerr << "Invalid arguments: " << e.what() << "\n\n" << args.usage() << "\nRun with --help for details.\n";
        exit(1);
    }

    Array media, target;
    boost::optional<Array> extra;
    try {
        media = data::readRegressors(args.media, args.geos);
        target = data::readTarget(args.target, args.geos);
        if (not args.extra_features.empty()) extra = data::readRegressors(args.extra_features, args.geos);
    }
    catch (std::ios_base::failure &) {
        std::cerr << "Unable to read input data: " << std::strerror(errno) << "\n";
        exit(1);
    }
    catch (std::exception &e) {
        std::cerr << "Unable to read input data: " << e.what() << "\n";
        exit(1);
    }

    for (const auto &unused : PriorCatalog::unusedPriorNames(args.settings.custom_priors, transform::parse(args.settings.transform),
                args.settings.trend, bool(extra)))
        std::cerr << "Warning: custom prior for `" << unused << "' is not used by the " << args.settings.transform << " model\n";

    ModelAssembler model(
            media, target,
            vector_array(args.media_prior), vector_array(args.media_sigma),
            args.settings, extra);

    std::cout.precision(std::numeric_limits<double>::max_digits10);
    try {
        for (unsigned int d = 0; d < args.draws; d++) {
            Tracer tracer;
            model(tracer);
            if (d == 0) print_header(tracer.trace());
            print_draw(d, tracer.trace());
        }
    }
    catch (std::exception &e) {
        std::cerr << "Unable to declare model: " << e.what() << "\n";
        exit(1);
    }
}
