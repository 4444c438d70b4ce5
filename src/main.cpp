#include "AutoConfig.h"
#include "AutomationPipeline.h"
#include "SynthraExceptions.h"
#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    if (argc >= 2) {
        const std::string first = argv[1];
        if (first == "--help" || first == "-h") {
            std::cout << AutoConfig::usage() << "\n";
            return 0;
        }
    }

    try {
        const AutoConfig config = AutoConfig::fromArgs(argc, argv);
        AutomationPipeline pipeline;
        return pipeline.run(config);
    } catch (const Synthra::SynthraException& e) {
        std::cerr << "[Synthra][Error] " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[Synthra][Error] Unexpected failure: " << e.what() << "\n";
        return 1;
    }
}
