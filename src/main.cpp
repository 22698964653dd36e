#include "AutoConfig.h"
#include "AutomationPipeline.h"
#include "SurvexExceptions.h"

#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    if (argc >= 2 && (std::string(argv[1]) == "--help" || std::string(argv[1]) == "-h")) {
        std::cout << AutoConfig::usage() << "\n";
        return 0;
    }

    try {
        const AutoConfig config = AutoConfig::fromArgs(argc, argv);
        AutomationPipeline pipeline;
        return pipeline.run(config);
    } catch (const Survex::ConfigurationException& e) {
        std::cerr << "[Survex][Error] " << e.what() << "\n";
        return 2;
    } catch (const Survex::SurvexException& e) {
        std::cerr << "[Survex][Error] " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[Survex][Exception] " << e.what() << "\n";
        return 1;
    }
}
