#include "store/key_path.hpp"
#include <sstream>

namespace profprune {

std::vector<std::string> KeyPath::split(const std::string& path) {
    std::vector<std::string> components;
    std::istringstream stream(path);
    std::string component;

    while (std::getline(stream, component, SEPARATOR)) {
        if (!component.empty()) {
            components.push_back(component);
        }
    }
    return components;
}

std::string KeyPath::join(const std::vector<std::string>& components) {
    std::string result;
    for (const auto& component : components) {
        if (component.empty()) continue;
        if (!result.empty()) result += SEPARATOR;
        result += component;
    }
    return result;
}

std::string KeyPath::child(const std::string& parent, const std::string& name) {
    auto components = split(parent);
    for (auto& c : split(name)) {
        components.push_back(std::move(c));
    }
    return join(components);
}

std::string KeyPath::parent(const std::string& path) {
    auto components = split(path);
    if (components.empty()) return "";
    components.pop_back();
    return join(components);
}

std::string KeyPath::leaf(const std::string& path) {
    auto components = split(path);
    return components.empty() ? "" : components.back();
}

std::string KeyPath::normalize(const std::string& path) {
    return join(split(path));
}

} // namespace profprune
