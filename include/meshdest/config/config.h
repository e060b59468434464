#pragma once

#include <string>
#include <string_view>

#include <meshdest/core/status.h>

#include <chjson/chjson.hpp>

namespace meshdest::config {

// Flat JSON object of settings. Lookups are by top-level key.
class Config {
public:
    static meshdest::Result<Config> LoadFile(std::string path);

    bool Has(std::string_view key) const;

    meshdest::Result<std::string> GetString(std::string_view key) const;
    meshdest::Result<int> GetInt(std::string_view key) const;

private:
    meshdest::Result<const chjson::sv_value*> Find(std::string_view key) const;

    chjson::document doc_;
};

} // namespace meshdest::config
