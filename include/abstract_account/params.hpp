#pragma once

#include <abstract_account/constants.hpp>

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <filesystem>

namespace abstract_account {

struct params
{
   uint64_t max_gas_before = default_max_gas_before;
   uint64_t max_gas_after  = default_max_gas_after;
};

void validate_params( const params& p );

// Values in section take precedence over values in global
params params_from_yaml( const YAML::Node& section, const YAML::Node& global = YAML::Node() );

// Reads basedir/config.yml, falling back to basedir/config.yaml, then to defaults
params load_params( const std::filesystem::path& basedir );

} // abstract_account
