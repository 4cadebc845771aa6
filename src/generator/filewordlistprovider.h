#pragma once

#include "wordlistprovider.h"

#include <QSet>

class FileWordlistProvider final : public WordlistProvider
{
    Q_OBJECT

public:
    explicit FileWordlistProvider(QString path, QObject *parent = nullptr);
    ~FileWordlistProvider() override;

    QString name() const override;
    bool isRemote() const override { return false; }

    void fetch(const QString &requestId) override;
    void cancel(const QString &requestId) override;

private:
    void load(const QString &requestId);

    QString path_;
    QSet<QString> pending_;
};
