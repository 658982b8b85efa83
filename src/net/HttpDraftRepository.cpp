#include "net/HttpDraftRepository.hpp"

#include <QDateTime>
#include <QDebug>
#include <QJsonArray>
#include <QJsonDocument>

#include "net/HttpJsonClient.hpp"
#include "net/JobJsonCodec.hpp"

namespace jh::client::net {

using namespace jh::client::domain;
using jh::client::app::ApplicationStatusResult;
using jh::client::app::DraftSaveResult;

struct HttpDraftRepository::Batch {
    std::vector<ApprovalItem>                    items;
    std::size_t                                  next{0};
    std::function<void(const DraftSaveResult&)>  done;
};

namespace {

QJsonValue stringOrNull(const std::optional<std::string>& v) {
    if (!v.has_value()) {
        return QJsonValue(QJsonValue::Null);
    }
    return QString::fromStdString(*v);
}

QString orDefault(const std::string& s, const char* fallback) {
    const auto q = QString::fromStdString(s).trimmed();
    return q.isEmpty() ? QString::fromUtf8(fallback) : q;
}

// The API answers {"success": false, ...} for rejected drafts.
bool acceptedByApi(const QByteArray& payload) {
    const auto doc = QJsonDocument::fromJson(payload);
    if (!doc.isObject()) {
        return true;
    }
    const auto success = doc.object().value(QStringLiteral("success"));
    return !(success.isBool() && !success.toBool());
}

std::optional<std::string> optText(const QJsonObject& o, const char* key) {
    const auto v = o.value(QLatin1String(key));
    if (v.isString()) {
        return v.toString().toStdString();
    }
    if (v.isDouble()) {
        return QString::number(v.toDouble(), 'g', 16).toStdString();
    }
    return std::nullopt;
}

} // namespace

HttpDraftRepository::HttpDraftRepository(HttpJsonClient& http, QUrl draftsUrl)
    : http_(http)
    , draftsUrl_(std::move(draftsUrl)) {
}

QJsonObject HttpDraftRepository::draftToJson(const ApprovalItem& item, const QString& createdAtIso) {
    QJsonObject o;
    o.insert(QStringLiteral("company"), orDefault(item.company, "Unknown Company"));
    o.insert(QStringLiteral("title"), orDefault(item.jobTitle, "Manual Job"));
    o.insert(QStringLiteral("letter_text"), stringOrNull(item.applicationText));
    o.insert(QStringLiteral("company_address"), stringOrNull(item.companyAddress));
    o.insert(QStringLiteral("source"), QStringLiteral("manual_job"));
    o.insert(QStringLiteral("job_id"), item.jobId);
    o.insert(QStringLiteral("created_at"), createdAtIso);
    return o;
}

void HttpDraftRepository::saveDrafts(const std::vector<ApprovalItem>& items,
                                     std::function<void(const DraftSaveResult&)> done) {
    auto batch   = std::make_shared<Batch>();
    batch->items = items;
    batch->done  = std::move(done);
    postNext(batch);
}

void HttpDraftRepository::postNext(const std::shared_ptr<Batch>& batch) {
    if (batch->next >= batch->items.size()) {
        batch->done(DraftSaveResult{true, static_cast<int>(batch->items.size()), {}});
        return;
    }

    const auto& item = batch->items[batch->next];
    const auto  now  = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
    const auto  body = QJsonDocument(draftToJson(item, now)).toJson(QJsonDocument::Compact);

    http_.post(draftsUrl_, body, [this, batch](const HttpReply& reply) {
        const auto index = batch->next;
        if (!reply.ok || !acceptedByApi(reply.payload)) {
            const QString why = reply.ok ? QStringLiteral("rejected by drafts API") : reply.errorMessage;
            qWarning() << "Saving draft" << index + 1 << "of" << batch->items.size() << "failed:" << why;
            batch->done(DraftSaveResult{false, static_cast<int>(index), why.toStdString()});
            return;
        }
        ++batch->next;
        postNext(batch);
    });
}

QUrl HttpDraftRepository::applicationStatusUrl(const QUrl& draftsUrl) {
    QUrl url = draftsUrl;
    QString path = url.path();
    while (path.endsWith(QLatin1Char('/'))) {
        path.chop(1);
    }
    url.setPath(path + QStringLiteral("/application-status"));
    return url;
}

QJsonObject HttpDraftRepository::applicationStatusRequest(const std::vector<Job>& jobs) {
    QJsonObject o;
    o.insert(QStringLiteral("jobs"), JobJsonCodec::jobsToJson(jobs));
    return o;
}

ApplicationStatusResult HttpDraftRepository::parseApplicationStatus(const QByteArray& payload) {
    ApplicationStatusResult result;

    QJsonParseError err{};
    const auto doc = QJsonDocument::fromJson(payload, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        result.message = "malformed application status reply";
        return result;
    }
    const auto root = doc.object();

    if (!root.value(QStringLiteral("success")).toBool(false)) {
        const auto error = root.value(QStringLiteral("error")).toString();
        result.message   = error.isEmpty() ? std::string("application status request failed")
                                           : error.toStdString();
        return result;
    }

    const auto statuses = root.value(QStringLiteral("application_status")).toObject();
    for (auto it = statuses.begin(); it != statuses.end(); ++it) {
        const auto so = it.value().toObject();
        ApplicationStatus status;
        status.hasApplication  = so.value(QStringLiteral("has_application")).toBool(false);
        status.applicationDate = optText(so, "application_date");
        status.draftId         = optText(so, "draft_id");
        result.statuses.emplace(it.key().toStdString(), std::move(status));
    }
    result.ok = true;
    return result;
}

void HttpDraftRepository::fetchApplicationStatus(const std::vector<Job>& jobs,
                                                 std::function<void(const ApplicationStatusResult&)> done) {
    const auto body = QJsonDocument(applicationStatusRequest(jobs)).toJson(QJsonDocument::Compact);

    http_.post(applicationStatusUrl(draftsUrl_), body, [done = std::move(done)](const HttpReply& reply) {
        if (!reply.ok) {
            ApplicationStatusResult failed;
            failed.message = reply.errorMessage.toStdString();
            qWarning() << "Application status request failed:" << reply.errorMessage;
            done(failed);
            return;
        }
        const auto result = parseApplicationStatus(reply.payload);
        if (result.ok) {
            qDebug() << "Application status received for" << result.statuses.size() << "jobs";
        } else {
            qWarning() << "Application status rejected:" << QString::fromStdString(result.message);
        }
        done(result);
    });
}

} // namespace jh::client::net
