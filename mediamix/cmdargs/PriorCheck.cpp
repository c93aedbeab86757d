#include "mediamix/cmdargs/PriorCheck.hpp"
#include "mediamix/Prior.hpp"
#include "mediamix/transform/Kind.hpp"
#include <boost/program_options/options_description.hpp>
#include <boost/program_options/variables_map.hpp>
#include <boost/program_options/errors.hpp>
#include <boost/program_options/value_semantic.hpp>
#include <algorithm>
#include <cctype>
#include <string>

namespace mediamix { namespace cmdargs {

namespace po = boost::program_options;

void PriorCheck::addOptions() {

    CmdArgs::addOptions(); // for --help, --version

    std::vector<std::string> transform_names;
    for (auto k : transform::kinds()) transform_names.push_back(transform::name(k));

    po::options_description input("Data");
    input.add_options()
        ("media,m", value(media), "CSV file of media data, one row per period.  For geo data the columns are grouped by channel, "
            "with one column per geo within each channel.  Required.")
        ("target,y", value(target), "CSV file of target data, one row per period and one column per geo (a single column for "
            "national data).  Required.")
        ("extra-features,x", value(extra_features), "CSV file of extra features, laid out like the media data.")
        ("geos,g", value(geos), "The number of geos in the data files; 0 (the default) for national data.")
        ;
    options_.add(input);

    po::options_description model("Model");
    model.add_options()
        ("media-prior", value(media_prior), "The prior mean of the media coefficient of each channel.  Required.")
        ("media-sigma", value<Above<double, 0>>(media_sigma), "The prior scale of the media coefficient of each channel, or a single "
            "scale for all channels.  The default is 1.")
        ("transform,t", value(settings.transform), ("The media transform: one of " + join(transform_names) + ".").c_str())
        ("prior,p", value(prior_args_), "A custom prior as NAME=SPEC, where SPEC is a distribution such as `beta(2,1)' or "
            "`half_normal(2)', a single value (the first parameter of the default prior), a comma-separated list of the parameters "
            "of the default prior, or `name=value;name=value' pairs.  May be repeated.")
        ("normalise", value(normalise_), "Whether the adstock is normalised: true, false, or auto (the transform's default).")
        ("number-lags", min<1>(settings.transform_options.number_lags), "The number of lags of the carryover transform.")
        ("trend", value(settings.trend), "If specified, adds a linear time trend to the model.")
        ;
    options_.add(model);

    po::options_description output("Output");
    output.add_options()
        ("draws,n", min<1>(draws), "The number of prior draws to print.")
        ("seed", value(seed), "Random seed to use.  If omitted, a random seed is obtained from the operating system's random source.")
        ;
    options_.add(output);
}

void PriorCheck::postParse(boost::program_options::variables_map&) {
    if (media.empty()) throw po::required_option("media");
    if (target.empty()) throw po::required_option("target");
    if (media_prior.empty()) throw po::required_option("media-prior");

    try {
        transform::parse(settings.transform);
    }
    catch (const transform::UnknownTransformName &) {
        throw po::invalid_option_value(settings.transform);
    }

    settings.custom_priors.clear();
    for (const auto &arg : prior_args_) {
        try {
            auto assignment = splitAssignment(arg);
            settings.custom_priors.erase(assignment.first);
            settings.custom_priors.emplace(assignment.first, Prior::parse(assignment.second));
        }
        catch (const std::invalid_argument &) {
            throw po::invalid_option_value(arg);
        }
    }

    std::string norm = normalise_;
    std::transform(norm.begin(), norm.end(), norm.begin(), [](unsigned char c) { return std::tolower(c); });
    if (norm == "auto") settings.transform_options.normalise = boost::none;
    else if (norm == "true" or norm == "1" or norm == "yes") settings.transform_options.normalise = true;
    else if (norm == "false" or norm == "0" or norm == "no") settings.transform_options.normalise = false;
    else throw po::invalid_option_value(normalise_);

    // Setting a seed resets the RNG, so only do it if the user actually gave one
    if (eris::Random::seed() != seed) {
        eris::Random::seed(seed);
    }
}

std::string PriorCheck::usage() const {
    return "Usage: " + (prog_name_.empty() ? std::string("mediamix-prior-check") : prog_name_) +
        " --media FILE --target FILE --media-prior V [V ...] [OPTIONS]";
}

std::string PriorCheck::help() const {
    return CmdArgs::help() +
        "Output:\n"
        "  One CSV row per prior draw: the draw number, the log joint density, then\n"
        "  every element of every latent site (named site[i] or site[i,j]).\n\n";
}

std::string PriorCheck::versionSuffix() const {
    return " -- prior predictive check";
}

}}
