#pragma once

#include <QJsonArray>
#include <QJsonObject>
#include <QJsonValue>

#include <optional>
#include <vector>

#include "domain/domain_model.hpp"

namespace jh::client::net {

// Wire/storage representation of jobs and applications.
// Field names follow the worker's JSON output (snake_case).
class JobJsonCodec final {
public:
    JobJsonCodec() = delete;

    // nullopt if the value is not an object or carries no usable id.
    // Numeric ids are normalised to their decimal string.
    static std::optional<domain::Job> jobFromJson(const QJsonValue& value);
    static QJsonObject                jobToJson(const domain::Job& job);

    // Malformed entries are skipped.
    static std::vector<domain::Job> jobsFromJson(const QJsonValue& value);
    static QJsonArray               jobsToJson(const std::vector<domain::Job>& jobs);

    static std::optional<domain::GeneratedApplication> applicationFromJson(const QJsonValue& value);
    static std::vector<domain::GeneratedApplication>   applicationsFromJson(const QJsonValue& value);

    static QJsonObject approvalToJson(const domain::ApprovalItem& item);

    // "42", 42 and 42.0 -> "42"; anything else -> nullopt.
    static std::optional<domain::JobId> idFromJson(const QJsonValue& value);
};

} // namespace jh::client::net
