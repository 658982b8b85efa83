#include "net/HttpJobCacheClient.hpp"

#include <QDebug>
#include <QJsonDocument>

#include "net/HttpJsonClient.hpp"

namespace jh::client::net {

using jh::client::app::JobCacheAction;
using jh::client::app::JobCacheOutcome;

namespace {

constexpr int kHttpNotFound = 404;

} // namespace

HttpJobCacheClient::HttpJobCacheClient(HttpJsonClient& http, QUrl baseUrl, QString profileName)
    : http_(http)
    , baseUrl_(std::move(baseUrl))
    , profileName_(std::move(profileName)) {
}

JobCacheOutcome HttpJobCacheClient::classify(const HttpReply& reply) {
    if (reply.ok) {
        return JobCacheOutcome::Ok;
    }
    if (!reply.reachable) {
        return JobCacheOutcome::Unreachable;
    }
    if (reply.status == kHttpNotFound) {
        return JobCacheOutcome::NotFound;
    }
    return JobCacheOutcome::Failed;
}

void HttpJobCacheClient::send(JobCacheAction action,
                              const domain::JobId& jobId,
                              std::function<void(JobCacheOutcome)> done) {
    QString base = baseUrl_.toString();
    while (base.endsWith(QLatin1Char('/'))) {
        base.chop(1);
    }
    const QUrl url(base + QLatin1Char('/') + QString::fromLatin1(to_string(action)));

    QJsonObject body;
    body.insert(QStringLiteral("job_id"), QString::fromStdString(jobId));
    body.insert(QStringLiteral("profile_name"), profileName_);

    http_.post(url, QJsonDocument(body).toJson(QJsonDocument::Compact),
               [done = std::move(done)](const HttpReply& reply) {
        done(classify(reply));
    });
}

} // namespace jh::client::net
