#include <cxxopts.hpp>
#include <iostream>
#include <string>
#include <vector>
#include "treelink/Log.hpp"
#include "treelink/Plan.hpp"
#include "treelink/Run.hpp"

using namespace treelink;

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("treelink", "Merge packages of hierarchical documents and relocate references");

        options.add_options()
            ("d,dst", "Destination document (JSON)", cxxopts::value<std::string>())
            ("s,src", "Comma-separated source documents (JSON)", cxxopts::value<std::string>())
            ("p,plan", "Merge plan (JSON/TOML)", cxxopts::value<std::string>())
            ("o,out", "Output document (JSON)", cxxopts::value<std::string>())
            ("set", "Plan override KEY=VALUE (repeatable)", cxxopts::value<std::vector<std::string>>())
            ("log-level", "debug|info|warning|error|off", cxxopts::value<std::string>())
            ("h,help", "Show help");

        auto result = options.parse(argc, argv);
        if (result.count("help")) {
            std::cout << options.help() << "\n";
            return 0;
        }

        for (const char* required : {"dst", "src", "out"}) {
            if (!result.count(required)) {
                std::cerr << "Error: --" << required << " is required\n";
                return 1;
            }
        }

        RunOptions run;
        run.dst_path = result["dst"].as<std::string>();
        run.src_paths = split_list(result["src"].as<std::string>(), ',');
        run.out_path = result["out"].as<std::string>();
        if (result.count("plan")) run.plan.file_path = result["plan"].as<std::string>();
        if (result.count("set")) {
            for (const auto& assignment : result["set"].as<std::vector<std::string>>()) {
                run.plan.overrides.insert(parse_override(assignment));
            }
        }
        if (result.count("log-level")) {
            run.log_level = log::parse_level(result["log-level"].as<std::string>());
        }

        return run_merge(run, std::cerr);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
