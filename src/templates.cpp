#include "engage/templates.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>

#include <yaml-cpp/yaml.h>

#include "engage/common.hpp"

namespace engage {

TemplateLibrary TemplateLibrary::loadManifest(const std::string& path)
{
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& ex) {
        throw std::runtime_error("Failed to parse template manifest " + path + ": " + ex.what());
    }

    if (!root["templates"] || !root["templates"].IsSequence()) {
        throw std::runtime_error("Template manifest missing 'templates' list: " + path);
    }

    std::filesystem::path manifestPath = std::filesystem::absolute(path).lexically_normal();
    std::filesystem::path baseDir = manifestPath.parent_path();

    double defaultThreshold = kDefaultThreshold;
    if (root["default_threshold"]) {
        defaultThreshold = root["default_threshold"].as<double>();
    }

    TemplateLibrary library;
    for (const auto& entry : root["templates"]) {
        if (!entry["name"] || !entry["path"]) {
            throw std::runtime_error("Template entry needs 'name' and 'path' in " + path);
        }

        ReferenceTemplate tmpl;
        tmpl.name = entry["name"].as<std::string>();
        std::filesystem::path imagePath = entry["path"].as<std::string>();
        if (!imagePath.is_absolute()) {
            imagePath = baseDir / imagePath;
        }
        tmpl.path = imagePath.lexically_normal().generic_string();
        tmpl.threshold = entry["threshold"] ? entry["threshold"].as<double>() : defaultThreshold;
        if (tmpl.threshold < 0.0 || tmpl.threshold > 1.0) {
            throw std::runtime_error("Threshold for template '" + tmpl.name + "' must be within [0, 1]");
        }
        tmpl.image = loadImageFile(tmpl.path);

        std::cerr << "[Templates] loaded " << tmpl.name << " (" << tmpl.image.cols << "x"
                  << tmpl.image.rows << ", threshold " << tmpl.threshold << ")" << std::endl;
        library.add(std::move(tmpl));
    }
    return library;
}

void TemplateLibrary::add(ReferenceTemplate tmpl)
{
    if (tmpl.name.empty()) {
        throw std::invalid_argument("Template name must not be empty");
    }
    if (tmpl.image.empty()) {
        throw ImageLoadError("Template '" + tmpl.name + "' has no image data");
    }
    std::string name = tmpl.name;
    templates_[name] = std::move(tmpl);
}

bool TemplateLibrary::contains(const std::string& name) const
{
    return templates_.find(name) != templates_.end();
}

const ReferenceTemplate& TemplateLibrary::at(const std::string& name) const
{
    auto it = templates_.find(name);
    if (it == templates_.end()) {
        throw ImageLoadError("Unknown template: " + name);
    }
    return it->second;
}

std::vector<std::string> TemplateLibrary::names() const
{
    std::vector<std::string> out;
    out.reserve(templates_.size());
    for (const auto& kv : templates_) {
        out.push_back(kv.first);
    }
    return out;
}

}  // namespace engage
