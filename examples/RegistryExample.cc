#include "ConfigManager.hh"
#include "Fetcher.hh"
#include "Logger.hh"
#include "ModuleRegistry.hh"
#include "RegistryError.hh"

#include <iostream>
#include <memory>
#include <string>

// registry_example [-c config.yaml] <list|add URL|delete ID|show ID|refresh>
int main(int argc, char **argv)
{
    ConfigManager config;
    int arg = 1;
    try
    {
        if (arg + 1 < argc && std::string(argv[arg]) == "-c")
        {
            config.LoadYAMLFile(argv[arg + 1]);
            arg += 2;
        }
        config.LoadEnvironment();
        config.ApplyLogging();
    }
    catch (const std::runtime_error &e)
    {
        LOG_ERROR("CONFIG", e.what());
        return 2;
    }

    if (arg >= argc)
    {
        std::cerr << "usage: " << argv[0] << " [-c config.yaml] <list|add URL|delete ID|show ID|refresh>" << std::endl;
        return 2;
    }
    const std::string command = argv[arg];
    const std::string operand = arg + 1 < argc ? argv[arg + 1] : "";

    auto fetcher = std::make_shared<CurlFetcher>(FetchOptions::FromConfig(config));
    ModuleRegistry registry(config.Get<std::string>("storage_dir"), fetcher);

    try
    {
        if (command == "list")
        {
            for (const auto &m : registry.ListModules())
                std::cout << m.ID << "  " << m.Name << std::endl;
        }
        else if (command == "add" && !operand.empty())
        {
            ModuleRecord r = registry.AddModule(operand);
            std::cout << r.ID << std::endl;
        }
        else if (command == "delete" && !operand.empty())
        {
            registry.DeleteModule(operand);
        }
        else if (command == "show" && !operand.empty())
        {
            std::cout << registry.GetModuleContent(operand);
        }
        else if (command == "refresh")
        {
            RefreshReport report = registry.RefreshModules();
            return report.Failed == 0 ? 0 : 1;
        }
        else
        {
            std::cerr << "unknown command: " << command << std::endl;
            return 2;
        }
    }
    catch (const RegistryError &e)
    {
        LOG_ERROR("REGISTRY", ErrorCodeName(e.Code()) << ": " << e.what());
        return 1;
    }
    return 0;
}
