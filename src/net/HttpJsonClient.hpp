#pragma once

#include <QByteArray>
#include <QNetworkAccessManager>
#include <QObject>
#include <QString>
#include <QUrl>

#include <functional>

namespace jh::client::net {

struct HttpReply {
    bool       ok{false};          // 2xx and no network error
    bool       reachable{false};   // the server answered at all
    int        status{0};          // HTTP status, 0 if none
    QByteArray payload;
    QString    errorMessage;
};

// JSON-over-HTTP POST on top of one QNetworkAccessManager.
// No timeout beyond Qt's defaults.
class HttpJsonClient final : public QObject {
    Q_OBJECT

public:
    using ReplyHandler = std::function<void(const HttpReply&)>;

    explicit HttpJsonClient(QObject* parent = nullptr);

    void post(const QUrl& url, const QByteArray& jsonBody, ReplyHandler done);

private:
    QNetworkAccessManager nam_;
};

} // namespace jh::client::net
