#include "net/JobJsonCodec.hpp"

#include <QDebug>
#include <QString>

#include <cmath>

namespace jh::client::net {

using namespace jh::client::domain;

namespace {

// Largest magnitude a JSON number holds as an exact integer.
constexpr double kMaxExactInteger = 9007199254740992.0;

std::string str(const QJsonObject& o, const char* key) {
    return o.value(QLatin1String(key)).toString().toStdString();
}

std::optional<std::string> optStr(const QJsonObject& o, const char* key) {
    const auto v = o.value(QLatin1String(key));
    if (!v.isString()) {
        return std::nullopt;
    }
    return v.toString().toStdString();
}

std::optional<double> optNumber(const QJsonObject& o, const char* key) {
    const auto v = o.value(QLatin1String(key));
    if (!v.isDouble()) {
        return std::nullopt;
    }
    return v.toDouble();
}

std::optional<bool> optBool(const QJsonObject& o, const char* key) {
    const auto v = o.value(QLatin1String(key));
    if (!v.isBool()) {
        return std::nullopt;
    }
    return v.toBool();
}

std::optional<Ampel> parseAmpel(const QJsonValue& v) {
    if (!v.isObject()) {
        return std::nullopt;
    }
    const auto ao = v.toObject();
    const auto color = ampelColorFromString(str(ao, "color"));
    if (!color) {
        return std::nullopt;
    }

    Ampel a;
    a.color      = *color;
    a.label      = str(ao, "label");
    a.priority   = ao.value(QStringLiteral("priority")).toInt(0);
    a.percentile = ao.value(QStringLiteral("percentile")).toDouble(0.0);
    a.tier       = str(ao, "score_tier");
    return a;
}

QJsonObject ampelToJson(const Ampel& a) {
    QJsonObject o;
    o.insert(QStringLiteral("color"), QString::fromStdString(to_string(a.color)));
    o.insert(QStringLiteral("label"), QString::fromStdString(a.label));
    o.insert(QStringLiteral("priority"), a.priority);
    o.insert(QStringLiteral("percentile"), a.percentile);
    o.insert(QStringLiteral("score_tier"), QString::fromStdString(a.tier));
    return o;
}

template <typename T>
void insertOpt(QJsonObject& o, const char* key, const std::optional<T>& v) {
    if (v.has_value()) {
        o.insert(QLatin1String(key), *v);
    }
}

void insertOpt(QJsonObject& o, const char* key, const std::optional<std::string>& v) {
    if (v.has_value()) {
        o.insert(QLatin1String(key), QString::fromStdString(*v));
    }
}

QJsonValue nullableString(const std::optional<std::string>& v) {
    if (!v.has_value()) {
        return QJsonValue(QJsonValue::Null);
    }
    return QString::fromStdString(*v);
}

} // namespace

std::optional<JobId> JobJsonCodec::idFromJson(const QJsonValue& value) {
    if (value.isString()) {
        const auto s = value.toString().trimmed();
        if (s.isEmpty()) {
            return std::nullopt;
        }
        return s.toStdString();
    }
    if (value.isDouble()) {
        const double d = value.toDouble();
        if (!std::isfinite(d) || d != std::floor(d) || std::fabs(d) > kMaxExactInteger) {
            return std::nullopt;
        }
        return QString::number(static_cast<qint64>(d)).toStdString();
    }
    return std::nullopt;
}

std::optional<Job> JobJsonCodec::jobFromJson(const QJsonValue& value) {
    if (!value.isObject()) {
        return std::nullopt;
    }
    const auto jo = value.toObject();

    const auto id = idFromJson(jo.value(QStringLiteral("id")));
    if (!id) {
        return std::nullopt;
    }

    Job job;
    job.id             = *id;
    job.title          = str(jo, "title");
    job.company        = str(jo, "company");
    job.location       = str(jo, "location");
    job.platform       = str(jo, "platform");
    job.url            = str(jo, "url");
    job.relevanceScore = jo.value(QStringLiteral("relevance_score")).toDouble(0.0);

    job.mlScore       = optNumber(jo, "ml_score");
    job.combinedScore = optNumber(jo, "combined_score");
    job.ampel         = parseAmpel(jo.value(QStringLiteral("ampel")));

    job.applied = jo.value(QStringLiteral("applied")).toBool(false);
    job.hidden  = optBool(jo, "is_hidden");

    job.datePosted           = optStr(jo, "date_posted");
    job.firstSeen            = optStr(jo, "first_seen");
    job.isNewSinceLastSearch = optBool(jo, "is_new_since_last_search");
    job.description          = optStr(jo, "description");
    job.salaryInfo           = optStr(jo, "salary_info");
    return job;
}

QJsonObject JobJsonCodec::jobToJson(const Job& job) {
    QJsonObject o;
    o.insert(QStringLiteral("id"), QString::fromStdString(job.id));
    o.insert(QStringLiteral("title"), QString::fromStdString(job.title));
    o.insert(QStringLiteral("company"), QString::fromStdString(job.company));
    o.insert(QStringLiteral("location"), QString::fromStdString(job.location));
    o.insert(QStringLiteral("platform"), QString::fromStdString(job.platform));
    o.insert(QStringLiteral("url"), QString::fromStdString(job.url));
    o.insert(QStringLiteral("relevance_score"), job.relevanceScore);
    o.insert(QStringLiteral("applied"), job.applied);

    insertOpt(o, "ml_score", job.mlScore);
    insertOpt(o, "combined_score", job.combinedScore);
    if (job.ampel) {
        o.insert(QStringLiteral("ampel"), ampelToJson(*job.ampel));
    }
    insertOpt(o, "is_hidden", job.hidden);
    insertOpt(o, "date_posted", job.datePosted);
    insertOpt(o, "first_seen", job.firstSeen);
    insertOpt(o, "is_new_since_last_search", job.isNewSinceLastSearch);
    insertOpt(o, "description", job.description);
    insertOpt(o, "salary_info", job.salaryInfo);
    return o;
}

std::vector<Job> JobJsonCodec::jobsFromJson(const QJsonValue& value) {
    std::vector<Job> out;
    if (!value.isArray()) {
        return out;
    }

    const auto arr = value.toArray();
    out.reserve(static_cast<size_t>(arr.size()));
    for (const auto& v : arr) {
        auto job = jobFromJson(v);
        if (!job) {
            qDebug() << "Skipping malformed job entry";
            continue;
        }
        out.push_back(std::move(*job));
    }
    return out;
}

QJsonArray JobJsonCodec::jobsToJson(const std::vector<Job>& jobs) {
    QJsonArray arr;
    for (const auto& j : jobs) {
        arr.append(jobToJson(j));
    }
    return arr;
}

std::optional<GeneratedApplication> JobJsonCodec::applicationFromJson(const QJsonValue& value) {
    if (!value.isObject()) {
        return std::nullopt;
    }
    const auto ao = value.toObject();

    const auto idVal = ao.value(QStringLiteral("job_id"));
    bool okId = false;
    int jobId = 0;
    if (idVal.isDouble()) {
        jobId = idVal.toInt();
        okId  = true;
    } else if (idVal.isString()) {
        jobId = idVal.toString().trimmed().toInt(&okId);
    }
    if (!okId) {
        return std::nullopt;
    }

    GeneratedApplication app;
    app.jobId            = jobId;
    app.jobTitle         = str(ao, "job_title");
    app.company          = str(ao, "company");
    app.applicationText  = str(ao, "application_text");
    app.filename         = str(ao, "filename");
    app.filePath         = str(ao, "file_path");
    app.pdfPath          = optStr(ao, "pdf_path");
    app.foundAddress     = optStr(ao, "found_address");
    app.addressAvailable = ao.value(QStringLiteral("address_available")).toBool(false);
    return app;
}

std::vector<GeneratedApplication> JobJsonCodec::applicationsFromJson(const QJsonValue& value) {
    std::vector<GeneratedApplication> out;
    if (!value.isArray()) {
        return out;
    }

    const auto arr = value.toArray();
    out.reserve(static_cast<size_t>(arr.size()));
    for (const auto& v : arr) {
        auto app = applicationFromJson(v);
        if (!app) {
            qDebug() << "Skipping malformed application entry";
            continue;
        }
        out.push_back(std::move(*app));
    }
    return out;
}

QJsonObject JobJsonCodec::approvalToJson(const ApprovalItem& item) {
    QJsonObject o;
    o.insert(QStringLiteral("job_id"), item.jobId);
    o.insert(QStringLiteral("application_text"), nullableString(item.applicationText));
    o.insert(QStringLiteral("company_address"), nullableString(item.companyAddress));
    if (item.forcePdf.has_value()) {
        o.insert(QStringLiteral("force_pdf"), *item.forcePdf);
    }
    return o;
}

} // namespace jh::client::net
