#include <boost/any.hpp>
#include <boost/program_options.hpp>
#include <json/json.h>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>
#include "FileMerger.hpp"
#include "MergeConfig.hpp"
#include "MergeError.hpp"

#ifndef FILEMERGE_VERSION
#define FILEMERGE_VERSION "0.0.0"
#endif

namespace po = boost::program_options;

static std::string compactJson(const Json::Value& value) {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";  // Compact output
    return Json::writeString(writer, value);
}

static void rejectTogether(const po::variables_map& vm, const char* a, const char* b) {
    auto given = [&vm](const char* name) {
        if (!vm.count(name) || vm[name].defaulted()) return false;
        const bool* flag = boost::any_cast<bool>(&vm[name].value());
        return flag == nullptr || *flag;
    };
    if (given(a) && given(b)) {
        throw po::error(std::string("options '--") + a + "' and '--" + b + "' cannot be used together");
    }
}

// Paths on stdin are separated by spaces or newlines.
static std::vector<std::string> readPathsFromStdin() {
    std::vector<std::string> paths;
    std::istream_iterator<std::string> it(std::cin), end;
    for (; it != end; ++it) {
        paths.push_back(*it);
    }
    return paths;
}

int main(int argc, char* argv[]) {
    MergeConfig config;
    std::vector<std::string> inputs;
    std::string output;
    std::string configPath;
    bool headonce = false;
    bool tailonce = false;
    bool progress = false;
    bool jsonErrors = false;
    bool verbose = false;
    bool newline = false;

    po::options_description generic("filemerge options");
    generic.add_options()
        ("help,h", "produce help message")
        ("version", "print version string")
        ("input,i", po::value<std::vector<std::string>>(&inputs)->multitoken(),
         "Input files; read from <STDIN> (space or newline separated) if not present")
        ("output,o", po::value<std::string>(&output),
         "Write output to FILE instead of <STDOUT>")
        ("skip-head,s", po::value<uint64_t>(), "Skip a number of lines/bytes from the head of each file")
        ("skip-tail,e", po::value<uint64_t>(), "Skip a number of lines/bytes from the tail of each file")
        ("skip-head-once,S", po::value<uint64_t>(),
         "Leave the first file untouched and skip from the head of the rest")
        ("skip-tail-once,E", po::value<uint64_t>(),
         "Leave the last file untouched and skip from the tail of the rest")
        ("headonce,H", po::bool_switch(&headonce), "Same as --skip-head-once=1")
        ("tailonce,T", po::bool_switch(&tailonce), "Same as --skip-tail-once=1")
        ("skip-mode,m", po::value<std::string>(), "Skip unit: lines (default) or bytes")
        ("padding,p", po::value<std::string>(), "Padding inserted around files")
        ("pad-mode,P", po::value<std::string>(),
         "Where padding goes: beforestart, afterend, between (default) or all")
        ("newline,n", po::bool_switch(&newline), "Append a newline to each file not already ending with one")
        ("newline-style,N", po::value<std::string>(), "Newline style: lf (default) or crlf")
        ("config,c", po::value<std::string>(&configPath), "JSON config file; flags override its values")
        ("progress", po::bool_switch(&progress), "Report per-file progress as JSON lines on <STDERR>")
        ("json-errors", po::bool_switch(&jsonErrors), "Report failures as JSON on <STDERR>")
        ("verbose,v", po::bool_switch(&verbose), "Print what is being merged");

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).options(generic).run(), vm);
        if (vm.count("help")) {
            std::cout << "Merges files into <STDOUT> or a file, optionally trimming,\n"
                         "padding and newline-terminating each one.\n\n"
                      << generic << std::endl;
            return 0;
        }
        if (vm.count("version")) {
            std::cout << "filemerge " << FILEMERGE_VERSION << std::endl;
            return 0;
        }
        po::notify(vm);
        rejectTogether(vm, "skip-head", "skip-head-once");
        rejectTogether(vm, "skip-head", "headonce");
        rejectTogether(vm, "skip-head-once", "headonce");
        rejectTogether(vm, "skip-tail", "skip-tail-once");
        rejectTogether(vm, "skip-tail", "tailonce");
        rejectTogether(vm, "skip-tail-once", "tailonce");
    } catch (const po::error& e) {
        std::cerr << "filemerge: " << e.what() << "\n";
        std::cerr << "Try 'filemerge --help' for more information." << std::endl;
        return 2;
    }

    try {
        if (!configPath.empty()) {
            config = MergeConfig::loadFile(configPath);
        }
        // Flags for one end replace whatever the config file set for it.
        if (vm.count("skip-head")) { config.skipHead = vm["skip-head"].as<uint64_t>(); config.skipHeadOnce.reset(); }
        if (vm.count("skip-head-once")) { config.skipHeadOnce = vm["skip-head-once"].as<uint64_t>(); config.skipHead.reset(); }
        if (headonce) { config.skipHeadOnce = 1; config.skipHead.reset(); }
        if (vm.count("skip-tail")) { config.skipTail = vm["skip-tail"].as<uint64_t>(); config.skipTailOnce.reset(); }
        if (vm.count("skip-tail-once")) { config.skipTailOnce = vm["skip-tail-once"].as<uint64_t>(); config.skipTail.reset(); }
        if (tailonce) { config.skipTailOnce = 1; config.skipTail.reset(); }
        if (vm.count("skip-mode")) config.skipMode = vm["skip-mode"].as<std::string>();
        if (vm.count("padding")) config.padding = vm["padding"].as<std::string>();
        if (vm.count("pad-mode")) config.padMode = vm["pad-mode"].as<std::string>();
        if (newline) config.newline = true;
        if (vm.count("newline-style")) config.newlineStyle = vm["newline-style"].as<std::string>();
        if (!inputs.empty()) config.inputs = inputs;
        if (!output.empty()) config.output = output;

        MergeOptions options = config.toOptions();
        if (config.inputs.empty()) {
            config.inputs = readPathsFromStdin();
        }
        if (verbose) {
            std::cerr << "Info: merging " << config.inputs.size() << " file(s) into "
                      << (config.output.empty() ? std::string("<stdout>") : config.output) << std::endl;
        }

        FileMerger merger(options);
        FileMerger::ProgressCallback report;
        if (progress) {
            report = [](const Json::Value& p) { std::cerr << compactJson(p) << std::endl; };
        }

        MergeResult result;
        if (!config.output.empty()) {
            std::ofstream out(config.output, std::ios::binary | std::ios::trunc);
            if (!out.is_open()) {
                throw MergeError::ioFromErrno("cannot open output file " + config.output);
            }
            result = merger.write(config.inputs, out, report);
            out.flush();
            if (!out) {
                throw MergeError::ioFromErrno("cannot flush output file " + config.output);
            }
        } else {
            result = merger.write(config.inputs, std::cout, report);
            std::cout.flush();
            if (!std::cout) {
                throw MergeError::ioFromErrno("cannot flush standard output");
            }
        }
        if (verbose) {
            std::cerr << "Info: wrote " << result.bytesWritten << " bytes from "
                      << result.filesMerged << " file(s)" << std::endl;
        }
    } catch (const MergeError& e) {
        if (jsonErrors) {
            Json::Value response;
            response["error"] = e.toJson();
            std::cerr << compactJson(response) << std::endl;
        } else {
            std::cerr << "filemerge: " << e.what() << std::endl;
            if (e.outputPosition() && *e.outputPosition() > 0) {
                std::cerr << "filemerge: " << *e.outputPosition()
                          << " bytes were already written and are left in place" << std::endl;
            }
        }
        return 1;
    }
    return 0;
}
