#include "ConfigManager.hh"
#include "Fetcher.hh"
#include "Logger.hh"
#include "ModuleRegistry.hh"
#include "RegistryError.hh"
#include "Version.hh"
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

namespace py = pybind11;

namespace
{

// Same shape as the entries of modules.json, extra metadata fields included.
py::dict RecordToDict(const ModuleRecord &r)
{
    py::object loads = py::module_::import("json").attr("loads");
    return loads(RecordToJSON(r).dump(-1, ' ', false, json::error_handler_t::replace)).cast<py::dict>();
}

std::unique_ptr<ModuleRegistry> RegistryFromConfig(const ConfigManager &config)
{
    auto fetcher = std::make_shared<CurlFetcher>(FetchOptions::FromConfig(config));
    return std::make_unique<ModuleRegistry>(config.Get<std::string>("storage_dir"), fetcher);
}

void SetFromPy(ConfigManager &config, const std::string &key, const py::object &obj)
{
    if (py::isinstance<py::bool_>(obj))
        config.Set(key, obj.cast<bool>());
    else if (py::isinstance<py::int_>(obj))
        config.Set(key, obj.cast<long long>());
    else if (py::isinstance<py::float_>(obj))
        config.Set(key, obj.cast<double>());
    else if (py::isinstance<py::str>(obj))
        config.SetFromString(key, obj.cast<std::string>());
    else
        throw std::runtime_error("ConfigManager: unsupported Python type for key: " + key);
}

} // namespace

PYBIND11_MODULE(_harvest, m)
{
    m.attr("__version__") = HarvestVersionString();
    m.attr("version_info") = py::make_tuple(HarvestVersionMajor(), HarvestVersionMinor(), HarvestVersionPatch());

    static py::exception<RegistryError> registryError(m, "RegistryError");
    static py::exception<RegistryError> alreadyExists(m, "AlreadyExistsError", registryError.ptr());
    static py::exception<RegistryError> notFound(m, "NotFoundError", registryError.ptr());
    static py::exception<RegistryError> fetchError(m, "FetchError", registryError.ptr());
    static py::exception<RegistryError> parseError(m, "ParseError", registryError.ptr());
    static py::exception<RegistryError> storageError(m, "StorageIOError", registryError.ptr());
    py::register_exception_translator(
        [](std::exception_ptr p)
        {
            try
            {
                if (p) std::rethrow_exception(p);
            }
            catch (const RegistryError &e)
            {
                switch (e.Code())
                {
                case ErrorCode::AlreadyExists:
                    alreadyExists(e.what());
                    break;
                case ErrorCode::NotFound:
                    notFound(e.what());
                    break;
                case ErrorCode::FetchError:
                    fetchError(e.what());
                    break;
                case ErrorCode::ParseError:
                    parseError(e.what());
                    break;
                case ErrorCode::IOError:
                    storageError(e.what());
                    break;
                }
            }
        });

    py::class_<ConfigManager>(m, "ConfigManager")
        .def(py::init<>())
        .def("load_yaml", &ConfigManager::LoadYAMLFile)
        .def("save_yaml", &ConfigManager::SaveYAMLFile)
        .def("load_json", &ConfigManager::LoadJSONFile)
        .def("save_json", &ConfigManager::SaveJSONFile)
        .def("load_env", &ConfigManager::LoadEnvironment, py::arg("prefix") = "HARVEST_")
        .def("set", &SetFromPy)
        .def("get", [](const ConfigManager &c, const std::string &key) { return c.Get<ConfigValue>(key); })
        .def("keys", &ConfigManager::Keys)
        .def("dump_yaml", &ConfigManager::DumpYAML, py::arg("indent") = 2)
        .def("dump_json", &ConfigManager::DumpJSON, py::arg("indent") = 2)
        .def("apply_logging", &ConfigManager::ApplyLogging);

    py::class_<RefreshReport>(m, "RefreshReport")
        .def_readonly("checked", &RefreshReport::Checked)
        .def_readonly("updated", &RefreshReport::Updated)
        .def_readonly("unchanged", &RefreshReport::Unchanged)
        .def_readonly("failed", &RefreshReport::Failed);

    py::class_<ModuleRegistry>(m, "ModuleRegistry")
        .def(py::init<const std::string &>(), py::arg("storage_dir"))
        .def(py::init(&RegistryFromConfig), py::arg("config"))
        .def("load", &ModuleRegistry::Load, py::call_guard<py::gil_scoped_release>())
        .def("save", &ModuleRegistry::Save, py::call_guard<py::gil_scoped_release>())
        .def(
            "add_module",
            [](ModuleRegistry &r, const std::string &url, const std::string &dir)
            {
                ModuleRecord record;
                {
                    py::gil_scoped_release release;
                    record = dir.empty() ? r.AddModule(url) : r.AddModule(url, dir);
                }
                return RecordToDict(record);
            },
            py::arg("metadata_url"), py::arg("storage_dir") = "")
        .def(
            "delete_module",
            [](ModuleRegistry &r, const std::string &id, const std::string &dir) { dir.empty() ? r.DeleteModule(id) : r.DeleteModule(id, dir); },
            py::arg("id"), py::arg("storage_dir") = "", py::call_guard<py::gil_scoped_release>())
        .def(
            "list_modules",
            [](const ModuleRegistry &r)
            {
                std::vector<ModuleSummary> summaries;
                {
                    py::gil_scoped_release release;
                    summaries = r.ListModules();
                }
                py::list out;
                for (const auto &s : summaries)
                {
                    py::dict d;
                    d["id"] = s.ID;
                    d["name"] = s.Name;
                    out.append(d);
                }
                return out;
            })
        .def(
            "get_module_content",
            [](const ModuleRegistry &r, const std::string &id, const std::string &dir)
            {
                std::string content;
                {
                    py::gil_scoped_release release;
                    content = dir.empty() ? r.GetModuleContent(id) : r.GetModuleContent(id, dir);
                }
                // scripts are opaque bytes, not necessarily UTF-8
                return py::bytes(content);
            },
            py::arg("id"), py::arg("storage_dir") = "")
        .def(
            "refresh_modules",
            [](ModuleRegistry &r, const std::string &dir) { return dir.empty() ? r.RefreshModules() : r.RefreshModules(dir); },
            py::arg("storage_dir") = "", py::call_guard<py::gil_scoped_release>())
        .def_property_readonly("storage_dir", &ModuleRegistry::StorageDir)
        .def_property_readonly("file_path", &ModuleRegistry::FilePath);

    py::enum_<logger::LogLevel>(m, "log_level")
        .value("DEBUG", logger::LogLevel::DEBUG)
        .value("INFO", logger::LogLevel::INFO)
        .value("WARN", logger::LogLevel::WARN)
        .value("ERROR", logger::LogLevel::ERROR)
        .value("NONE", logger::LogLevel::NONE);
    m.def("set_log_level", [](logger::LogLevel level) { logger::Logger::Get().SetLogLevel(level); });
    m.def("set_log_file", [](const std::string &path) { logger::Logger::Get().InitLogFile(path); });
}
