#include <iostream>
#include <string>

#include "ConfigGlobal.hpp"
#include "ControlFlow.hpp"

int main(int argc, char* argv[])
{
    ConfigGlobal::InitializeDefaults();

    std::string DevicePath;
    for (int i = 1; i < argc; ++i)
    {
        std::string Arg = argv[i];
        if ((Arg == "--config" || Arg == "-c") && i + 1 < argc)
        {
            ConfigGlobal::ConfigFile = argv[++i];
        }
        else if ((Arg == "--device" || Arg == "-d") && i + 1 < argc)
        {
            DevicePath = argv[++i];
        }
        else
        {
            std::cerr << "Usage: " << argv[0] << " [--config <file>] [--device <block device>]\n";
            return 2;
        }
    }

    ControlFlow Flow;
    return DevicePath.empty() ? Flow.Run() : Flow.RunSingleDevice(DevicePath);
}
