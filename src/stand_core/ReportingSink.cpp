#include "standkit/core/ReportingSink.h"

#include <QByteArray>
#include <QCoreApplication>
#include <QDebug>
#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QUrl>

#include <utility>

namespace standkit {

ReportingSink::ReportingSink(std::string endpoint, int timeout_ms)
    : endpoint_(std::move(endpoint)),
      timeout_ms_(timeout_ms > 0 ? timeout_ms : kDefaultTimeoutMs)
{
    while (!endpoint_.empty() && endpoint_.back() == '/') endpoint_.pop_back();
}

bool ReportingSink::reportStand(const StandConfig& stand) {
    const std::string body = stand.registrationJson();
    const bool ok = post(kStandsPath, body);
    if (ok) {
        qInfo().noquote() << "[ReportingSink] Stand registered:" << QString::fromStdString(stand.name);
    }
    return ok;
}

bool ReportingSink::reportSession(const SessionRecord& record) {
    const std::string body = sessionRecordToJson(record);
    const bool ok = post(kVisitsPath, body);
    if (ok) {
        qInfo().noquote() << "[ReportingSink] Visit reported:" << QString::fromStdString(body);
    }
    return ok;
}

bool ReportingSink::post(const std::string& path, const std::string& body) {
    const QUrl url(QString::fromStdString(endpoint_ + path));
    if (!url.isValid() || url.scheme().isEmpty()) {
        qWarning().noquote() << "[ReportingSink] Invalid endpoint url" << url.toString() << "- event dropped";
        return false;
    }
    if (!QCoreApplication::instance()) {
        qWarning() << "[ReportingSink] No QCoreApplication, cannot POST - event dropped";
        return false;
    }

    // a private manager per call: the worker thread has no long-lived Qt objects
    QNetworkAccessManager manager;
    QNetworkRequest request(url);
    request.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));
    request.setRawHeader("User-Agent", "DataSender/1.0");
    request.setTransferTimeout(timeout_ms_);

    QNetworkReply* reply = manager.post(request, QByteArray::fromStdString(body));

    QEventLoop loop;
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    if (!reply->isFinished()) loop.exec();

    const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    const bool ok = reply->error() == QNetworkReply::NoError && status >= 200 && status < 300;
    if (!ok) {
        const bool timed_out = reply->error() == QNetworkReply::TimeoutError
                            || reply->error() == QNetworkReply::OperationCanceledError;
        const QString reason = timed_out
            ? QStringLiteral("timeout after %1 ms").arg(timeout_ms_)
            : (status > 0 ? QStringLiteral("HTTP %1 %2").arg(status).arg(reply->errorString())
                          : reply->errorString());
        qWarning().noquote() << "[ReportingSink] POST" << url.toString() << "failed:" << reason << "- event dropped";
    }

    reply->deleteLater();
    return ok;
}

} // namespace standkit
