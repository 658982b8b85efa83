#pragma once

#include <string>

#include "domain/app_config.hpp"

namespace jh::client::infra {

class AppConfigRepository {
public:
    // Relative paths in the file resolve against `baseDir`.
    AppConfigRepository(std::string path, std::string baseDir);

    // Load settings from the JSON file.
    // A missing or invalid file yields the defaults and logs a warning;
    // missing keys keep their defaults.
    jh::client::domain::AppConfig load() const;

    jh::client::domain::AppConfig defaults() const;

private:
    std::string resolve(const std::string& path) const;

    std::string path_;
    std::string baseDir_;
};

} // namespace jh::client::infra
