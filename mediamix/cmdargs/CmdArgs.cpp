#include "mediamix/cmdargs/CmdArgs.hpp"
#include "mediamix/config.hpp"
#include <boost/program_options/variables_map.hpp>
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/errors.hpp>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>

namespace po = boost::program_options;

namespace mediamix { namespace cmdargs {

void CmdArgs::addOptions() {
    po::options_description about("About");
    about.add_options()
        ("help,h", "Prints this help and exits.")
        ("version", "Prints the version and exits.");
    options_.add(about);
}

void CmdArgs::postParse(boost::program_options::variables_map&) {}

void CmdArgs::parse(int argc, char const* const* argv) {
    if (options_.options().empty()) addOptions();

    prog_name_ = argv[0];

    // Values are stored into the members by the option notifiers; the map itself is not kept
    po::variables_map vars;
    po::store(po::parse_command_line(argc, argv, options_), vars);

    if (vars.count("help") or vars.count("version")) {
        std::cout << version() << "\n\n";
        if (vars.count("help")) std::cout << help();
        std::exit(0);
    }

    po::notify(vars);

    postParse(vars);
}

std::string CmdArgs::version() const {
    std::ostringstream version;
    version << "mediamix v" << VERSION[0] << "." << VERSION[1] << "." << VERSION[2] << versionSuffix();
    return version.str();
}

std::string CmdArgs::versionSuffix() const {
    return "";
}

std::string CmdArgs::usage() const {
    return "Usage: " + (prog_name_.empty() ? std::string("mediamix") : prog_name_) + " [OPTIONS]";
}

std::string CmdArgs::help() const {
    std::ostringstream out;
    out << usage() << "\n\n" << options_ << "\n";
    return out.str();
}

}}
