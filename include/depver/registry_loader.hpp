#pragma once
#include "depver/registry.hpp"

#include <string>

namespace depver {

// Builds a Registry from a configuration source. Throws LoadError when the
// source cannot be read or is structurally wrong; duplicate names and the
// like are left for Registry::validate().
class RegistryLoader {
public:
    Registry load_from_json(const std::string& json_path);
    Registry parse_json(const std::string& json_text);

    Registry load_from_struct_table(const std::string& path);
};

} // namespace depver
