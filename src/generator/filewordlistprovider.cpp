#include "filewordlistprovider.h"

#include <QFile>
#include <QTimer>

#include <utility>

namespace {

constexpr qint64 kMaxFileBytes = 4 * 1024 * 1024;

} // namespace

FileWordlistProvider::FileWordlistProvider(QString path, QObject *parent)
    : WordlistProvider(parent), path_(std::move(path))
{
}

FileWordlistProvider::~FileWordlistProvider() = default;

QString FileWordlistProvider::name() const
{
    return path_;
}

void FileWordlistProvider::fetch(const QString &requestId)
{
    pending_.insert(requestId);
    QTimer::singleShot(0, this, [this, requestId]() { load(requestId); });
}

void FileWordlistProvider::cancel(const QString &requestId)
{
    pending_.remove(requestId);
}

void FileWordlistProvider::load(const QString &requestId)
{
    if (!pending_.remove(requestId))
        return;

    QFile file(path_);
    if (!file.open(QIODevice::ReadOnly)) {
        emit failed(requestId, QString("无法打开词表文件：%1（%2）").arg(path_, file.errorString()));
        return;
    }

    if (file.size() > kMaxFileBytes) {
        emit failed(requestId, QString("词表文件过大：%1").arg(path_));
        return;
    }

    const auto wordlist = Wordlist::fromText(file.readAll());
    if (wordlist.isEmpty()) {
        emit failed(requestId, QString("词表文件中没有可用的单词：%1").arg(path_));
        return;
    }

    emit finished(requestId, wordlist);
}
