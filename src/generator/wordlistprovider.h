#pragma once

#include "wordlist.h"

#include <QObject>
#include <QString>

class WordlistProvider : public QObject
{
    Q_OBJECT

public:
    explicit WordlistProvider(QObject *parent = nullptr) : QObject(parent) {}
    ~WordlistProvider() override = default;

    virtual QString name() const = 0;
    // Whether lists from this source are worth copying into the on-disk cache.
    virtual bool isRemote() const = 0;

    // Completion is always delivered later through finished/failed, never from inside fetch().
    virtual void fetch(const QString &requestId) = 0;
    // A cancelled request emits nothing.
    virtual void cancel(const QString &requestId) = 0;

signals:
    void finished(const QString &requestId, const Wordlist &wordlist);
    void failed(const QString &requestId, const QString &error);
};
