#include "wordlistcache.h"

#include "core/apppaths.h"
#include "filewordlistprovider.h"
#include "httpwordlistprovider.h"

#include <QDateTime>
#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QTimer>
#include <QUrl>
#include <QUuid>

namespace {

constexpr qint64 kDiskCacheTtlSecs = 30 * 86400;
constexpr char kSourceHeader[] = "# source: ";

} // namespace

WordlistCache::WordlistCache(WordlistProvider *provider, QObject *parent)
    : QObject(parent), diskCachePath_(AppPaths::wordlistCacheFilePath())
{
    setProvider(provider);
}

WordlistCache::~WordlistCache()
{
    cancel();
}

WordlistProvider *WordlistCache::createProvider(const QString &source, QObject *parent)
{
    const auto trimmed = source.trimmed();
    const QUrl url(trimmed);
    const auto scheme = url.scheme().toLower();
    if (scheme == "http" || scheme == "https" || scheme == "file")
        return new HttpWordlistProvider(url, parent);
    return new FileWordlistProvider(trimmed, parent);
}

void WordlistCache::setProvider(WordlistProvider *provider)
{
    if (provider == provider_)
        return;

    cancel();
    wordlist_ = Wordlist();

    if (provider_)
        provider_->deleteLater();

    provider_ = provider;
    if (!provider_)
        return;

    provider_->setParent(this);
    connect(provider_, &WordlistProvider::finished, this, &WordlistCache::onFinished);
    connect(provider_, &WordlistProvider::failed, this, &WordlistCache::onFailed);
}

void WordlistCache::ensureLoaded()
{
    if (isLoaded()) {
        emitReadyLater();
        return;
    }

    if (isLoading())
        return;

    if (!provider_) {
        QTimer::singleShot(0, this, [this]() { emit failed("未配置词表来源"); });
        return;
    }

    if (provider_->isRemote() && loadFromDisk()) {
        emitReadyLater();
        return;
    }

    pendingId_ = QUuid::createUuid().toString(QUuid::WithoutBraces);
    qInfo() << "Fetching wordlist from" << provider_->name();
    provider_->fetch(pendingId_);
}

void WordlistCache::cancel()
{
    if (!isLoading())
        return;

    const auto id = pendingId_;
    pendingId_.clear();
    if (provider_)
        provider_->cancel(id);
    qInfo() << "Wordlist fetch cancelled";
}

bool WordlistCache::loadFromDisk()
{
    if (!diskCacheEnabled_ || diskCachePath_.isEmpty())
        return false;

    const QFileInfo info(diskCachePath_);
    if (!info.exists())
        return false;

    // A timestamp in the future cannot be trusted to age out.
    const auto age = info.lastModified().secsTo(QDateTime::currentDateTime());
    if (age < 0 || age >= kDiskCacheTtlSecs)
        return false;

    QFile file(diskCachePath_);
    if (!file.open(QIODevice::ReadOnly))
        return false;

    const auto header = file.readLine().trimmed();
    if (header != QByteArray(kSourceHeader) + provider_->name().toUtf8())
        return false;

    const auto wordlist = Wordlist::fromText(file.readAll());
    if (wordlist.isEmpty())
        return false;

    wordlist_ = wordlist;
    qInfo() << "Loaded" << wordlist_.size() << "words from disk cache" << diskCachePath_;
    return true;
}

void WordlistCache::saveToDisk() const
{
    if (!diskCacheEnabled_ || diskCachePath_.isEmpty())
        return;

    QSaveFile file(diskCachePath_);
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "Cannot write wordlist cache" << diskCachePath_ << file.errorString();
        return;
    }

    file.write(QByteArray(kSourceHeader) + provider_->name().toUtf8() + "\n");
    file.write(wordlist_.toText());
    if (!file.commit())
        qWarning() << "Cannot write wordlist cache" << diskCachePath_ << file.errorString();
}

void WordlistCache::emitReadyLater()
{
    QTimer::singleShot(0, this, [this]() {
        if (isLoaded())
            emit ready(static_cast<int>(wordlist_.size()));
    });
}

void WordlistCache::onFinished(const QString &requestId, const Wordlist &wordlist)
{
    if (requestId != pendingId_)
        return;
    pendingId_.clear();

    wordlist_ = wordlist;
    qInfo() << "Loaded" << wordlist_.size() << "words from" << provider_->name();

    if (provider_->isRemote())
        saveToDisk();

    emit ready(static_cast<int>(wordlist_.size()));
}

void WordlistCache::onFailed(const QString &requestId, const QString &error)
{
    if (requestId != pendingId_)
        return;
    pendingId_.clear();

    qWarning() << "Wordlist fetch failed:" << error;
    emit failed(error);
}
