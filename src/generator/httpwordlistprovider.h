#pragma once

#include "wordlistprovider.h"

#include <QHash>
#include <QUrl>

class QNetworkAccessManager;
class QNetworkReply;

class HttpWordlistProvider final : public WordlistProvider
{
    Q_OBJECT

public:
    explicit HttpWordlistProvider(QUrl url, QObject *parent = nullptr);
    ~HttpWordlistProvider() override;

    QString name() const override;
    bool isRemote() const override { return true; }

    void fetch(const QString &requestId) override;
    void cancel(const QString &requestId) override;

private:
    QUrl url_;
    QNetworkAccessManager *network_ = nullptr;
    QHash<QString, QNetworkReply *> pending_;
};
