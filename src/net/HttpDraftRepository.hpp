#pragma once

#include <QByteArray>
#include <QJsonObject>
#include <QUrl>

#include <memory>

#include "app/IDraftRepository.hpp"

namespace jh::client::net {

class HttpJsonClient;

// Saves approved letters through the drafts API, one POST per item, in order.
// Stops at the first failed item.
//
// Application status is one POST of the job list to
// <draftsUrl>/application-status.
class HttpDraftRepository final : public app::IDraftRepository {
public:
    HttpDraftRepository(HttpJsonClient& http, QUrl draftsUrl);

    void saveDrafts(const std::vector<domain::ApprovalItem>& items,
                    std::function<void(const app::DraftSaveResult&)> done) override;

    void fetchApplicationStatus(const std::vector<domain::Job>& jobs,
                                std::function<void(const app::ApplicationStatusResult&)> done) override;

    static QJsonObject draftToJson(const domain::ApprovalItem& item, const QString& createdAtIso);
    static QUrl applicationStatusUrl(const QUrl& draftsUrl);
    static QJsonObject applicationStatusRequest(const std::vector<domain::Job>& jobs);
    static app::ApplicationStatusResult parseApplicationStatus(const QByteArray& payload);

private:
    struct Batch;
    void postNext(const std::shared_ptr<Batch>& batch);

    HttpJsonClient& http_;
    QUrl            draftsUrl_;
};

} // namespace jh::client::net
