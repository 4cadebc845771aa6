#pragma once

#include "wordlist.h"

#include <QObject>
#include <QString>

class WordlistProvider;

// Caller-held, lazily loaded wordlist. The presentation layer owns one instance,
// waits for ready() and then passes wordlist() into generatePassphrase().
class WordlistCache final : public QObject
{
    Q_OBJECT

public:
    explicit WordlistCache(WordlistProvider *provider, QObject *parent = nullptr);
    ~WordlistCache() override;

    // http(s):// and file:// URLs use HttpWordlistProvider, anything else is read as a local path.
    static WordlistProvider *createProvider(const QString &source, QObject *parent = nullptr);

    // Takes ownership. Cancels any in-flight fetch and drops the loaded list.
    void setProvider(WordlistProvider *provider);
    WordlistProvider *provider() const { return provider_; }

    void setDiskCachePath(const QString &path) { diskCachePath_ = path; }
    QString diskCachePath() const { return diskCachePath_; }
    void setDiskCacheEnabled(bool enabled) { diskCacheEnabled_ = enabled; }

    bool isLoaded() const { return !wordlist_.isEmpty(); }
    bool isLoading() const { return !pendingId_.isEmpty(); }
    const Wordlist &wordlist() const { return wordlist_; }

    void ensureLoaded();
    void cancel();

signals:
    void ready(int wordCount);
    void failed(const QString &error);

private:
    bool loadFromDisk();
    void saveToDisk() const;
    void emitReadyLater();

    void onFinished(const QString &requestId, const Wordlist &wordlist);
    void onFailed(const QString &requestId, const QString &error);

    WordlistProvider *provider_ = nullptr;
    Wordlist wordlist_;
    QString pendingId_;
    QString diskCachePath_;
    bool diskCacheEnabled_ = true;
};
