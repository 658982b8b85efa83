#include "net/HttpJsonClient.hpp"

#include <QDebug>
#include <QNetworkReply>
#include <QNetworkRequest>

namespace jh::client::net {

HttpJsonClient::HttpJsonClient(QObject* parent)
    : QObject(parent) {
}

void HttpJsonClient::post(const QUrl& url, const QByteArray& jsonBody, ReplyHandler done) {
    QNetworkRequest req(url);
    req.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));
    req.setAttribute(QNetworkRequest::CacheLoadControlAttribute, QNetworkRequest::AlwaysNetwork);

    QNetworkReply* reply = nam_.post(req, jsonBody);

    QObject::connect(reply, &QNetworkReply::finished, this, [reply, url, done = std::move(done)]() {
        HttpReply r;
        const auto statusAttr = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
        r.status    = statusAttr.isValid() ? statusAttr.toInt() : 0;
        r.reachable = r.status != 0;
        r.payload   = reply->readAll();
        r.ok        = reply->error() == QNetworkReply::NoError && r.status >= 200 && r.status < 300;
        if (!r.ok) {
            r.errorMessage = r.reachable
                                 ? QStringLiteral("HTTP %1").arg(r.status)
                                 : reply->errorString();
            qDebug() << "POST" << url.toString() << "failed:" << r.errorMessage;
        }
        reply->deleteLater();
        if (done) {
            done(r);
        }
    });
}

} // namespace jh::client::net
