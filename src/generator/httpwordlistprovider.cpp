#include "httpwordlistprovider.h"

#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>

#include <memory>
#include <utility>

namespace {

constexpr qint64 kMaxBodyBytes = 4 * 1024 * 1024;
constexpr int kTransferTimeoutMs = 15000;

} // namespace

HttpWordlistProvider::HttpWordlistProvider(QUrl url, QObject *parent)
    : WordlistProvider(parent), url_(std::move(url))
{
    network_ = new QNetworkAccessManager(this);
}

HttpWordlistProvider::~HttpWordlistProvider()
{
    const auto replies = pending_.values();
    pending_.clear();
    for (auto *reply : replies)
        reply->abort();
}

QString HttpWordlistProvider::name() const
{
    return url_.toString();
}

void HttpWordlistProvider::fetch(const QString &requestId)
{
    // Reusing a pending id replaces the earlier download.
    cancel(requestId);

    QNetworkRequest req(url_);
    req.setHeader(QNetworkRequest::UserAgentHeader, "passforge/1.0");
    req.setAttribute(QNetworkRequest::RedirectPolicyAttribute, QNetworkRequest::NoLessSafeRedirectPolicy);
    req.setTransferTimeout(kTransferTimeoutMs);

    auto *reply = network_->get(req);
    pending_.insert(requestId, reply);

    auto tooLarge = std::make_shared<bool>(false);
    connect(reply, &QNetworkReply::downloadProgress, this, [reply, tooLarge](qint64 received, qint64) {
        if (received > kMaxBodyBytes && !*tooLarge) {
            *tooLarge = true;
            reply->abort();
        }
    });

    connect(reply, &QNetworkReply::finished, this, [this, reply, requestId, tooLarge]() {
        reply->deleteLater();

        // Cancelled, or replaced by a newer fetch under the same id.
        if (pending_.value(requestId) != reply)
            return;
        pending_.remove(requestId);

        if (*tooLarge) {
            emit failed(requestId, QString("词表过大（超过 %1 字节）").arg(kMaxBodyBytes));
            return;
        }

        if (reply->error() != QNetworkReply::NoError) {
            emit failed(requestId, QString("下载词表失败：%1").arg(reply->errorString()));
            return;
        }

        // file:// and other non-HTTP schemes carry no status code.
        const auto statusAttr = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
        if (statusAttr.isValid()) {
            const auto status = statusAttr.toInt();
            if (status < 200 || status >= 300) {
                emit failed(requestId, QString("下载词表失败：HTTP %1").arg(status));
                return;
            }
        }

        const auto bytes = reply->readAll();
        if (bytes.size() > kMaxBodyBytes) {
            emit failed(requestId, QString("词表过大（超过 %1 字节）").arg(kMaxBodyBytes));
            return;
        }

        const auto wordlist = Wordlist::fromText(bytes);
        if (wordlist.isEmpty()) {
            emit failed(requestId, "下载的词表中没有可用的单词");
            return;
        }

        emit finished(requestId, wordlist);
    });
}

void HttpWordlistProvider::cancel(const QString &requestId)
{
    auto *reply = pending_.take(requestId);
    if (reply)
        reply->abort();
}
