#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <boost/program_options.hpp>
#include "stampbook/embed.h"
#include "stampbook/errors.h"

namespace po = boost::program_options;

constexpr auto kProgram{"stampbook-embed"};

enum ExitCode {
    kSuccess = 0,
    kUsageError = 1,
    kEmbedError = 2,
};

struct embed_request {
    std::string root;
    std::string image;
    std::string output;
    stampbook::header_options header;
    bool verbose{};
};

void print_usage(const po::options_description& desc)
{
    std::cout << "Usage: " << kProgram << " --image <path> --name <identifier> [options]\n\n"
              << "Packs a black and white image into a header defining a constexpr\n"
              << "stampbook::stamp.\n\n"
              << desc << "\n";
}

int run(const embed_request& req)
{
    auto bitmap = stampbook::embed(req.root, req.image);
    if (req.verbose) {
        std::clog << "Loaded " << req.image << " (" << bitmap.width() << "x" << bitmap.height()
                  << ", " << bitmap.size() << " bytes)\n";
    }

    // Render fully before touching the output so a failure never leaves a
    // truncated header behind.
    std::ostringstream rendered;
    stampbook::write_header(rendered, req.header, bitmap);

    if (req.output.empty()) {
        std::cout << rendered.str();
        return kSuccess;
    }

    std::ofstream f(req.output, std::ios::trunc);
    if (!f)
        throw stampbook::embed_error("cannot open " + req.output + " for writing");
    f << rendered.str();
    f.close();
    if (!f)
        throw stampbook::embed_error("write error on " + req.output);

    if (req.verbose)
        std::clog << "Wrote " << req.output << "\n";
    return kSuccess;
}

int main(int argc, char* argv[])
{
    po::options_description desc("Available options");
    desc.add_options()
        ("help", "produce help message")
        ("root", po::value<std::string>()->default_value("."), "project root that --image is relative to")
        ("image", po::value<std::string>(), "image to embed (png, bmp, pbm/pgm/ppm/pnm)")
        ("name", po::value<std::string>(), "identifier of the generated stamp")
        ("namespace", po::value<std::string>()->default_value(""), "namespace of the generated stamp")
        ("output", po::value<std::string>(), "header to write (default: standard output)")
        ("verbose", "report progress on standard error")
    ;

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << kProgram << ": " << e.what() << "\n";
        print_usage(desc);
        return kUsageError;
    }

    if (vm.count("help")) {
        print_usage(desc);
        return kSuccess;
    }

    if (!vm.count("image") || !vm.count("name")) {
        std::cerr << kProgram << ": --image and --name are required.\n";
        print_usage(desc);
        return kUsageError;
    }

    embed_request req;
    req.root = vm["root"].as<std::string>();
    req.image = vm["image"].as<std::string>();
    req.header.name = vm["name"].as<std::string>();
    req.header.name_space = vm["namespace"].as<std::string>();
    req.header.source = req.image;
    if (vm.count("output"))
        req.output = vm["output"].as<std::string>();
    req.verbose = vm.count("verbose") > 0;

    try {
        return run(req);
    } catch (const stampbook::embed_error& e) {
        std::cerr << kProgram << ": error: " << e.what() << "\n";
        return kEmbedError;
    }
}
