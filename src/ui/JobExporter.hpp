#pragma once

#include <QJsonDocument>
#include <QString>
#include <string>
#include <vector>

#include "domain/domain_model.hpp"

namespace jh::client::ui {

class JobExporter final {
public:
    static QJsonDocument toJson(const std::vector<jh::client::domain::Job>& jobs);
    static QString       logsToText(const std::vector<std::string>& logs);

    // Writes `data` to `path`; false (and a warning) on failure.
    static bool writeFile(const QString& path, const QByteArray& data);

private:
    JobExporter() = delete;
};

} // namespace jh::client::ui
