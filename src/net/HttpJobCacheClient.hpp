#pragma once

#include <QJsonObject>
#include <QUrl>

#include "app/IJobCacheClient.hpp"

namespace jh::client::net {

struct HttpReply;
class HttpJsonClient;

// POST {job_id, profile_name} to <base>/hide | /unhide | /delete.
class HttpJobCacheClient final : public app::IJobCacheClient {
public:
    HttpJobCacheClient(HttpJsonClient& http, QUrl baseUrl, QString profileName);

    void send(app::JobCacheAction action,
              const domain::JobId& jobId,
              std::function<void(app::JobCacheOutcome)> done) override;

    static app::JobCacheOutcome classify(const HttpReply& reply);

private:
    HttpJsonClient& http_;
    QUrl            baseUrl_;
    QString         profileName_;
};

} // namespace jh::client::net
