#include "core/models/model_fetcher.h"

#include "core/shared/logging.h"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>

#include <curl/curl.h>

#include <algorithm>
#include <mutex>

namespace gt {

namespace {

struct DownloadSink {
    QFile* file = nullptr;
    qint64 written = 0;
    bool failed = false;
};

size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp)
{
    auto* sink = static_cast<DownloadSink*>(userp);
    const size_t total = size * nmemb;
    const qint64 wrote = sink->file->write(static_cast<const char*>(contents),
                                           static_cast<qint64>(total));
    if (wrote != static_cast<qint64>(total)) {
        sink->failed = true;
        return 0;  // aborts the transfer
    }
    sink->written += wrote;
    return total;
}

void ensureCurlInitialized()
{
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

qint64 nowMs()
{
    return QDateTime::currentMSecsSinceEpoch();
}

bool artifactPresent(const QString& path)
{
    const QFileInfo info(path);
    return info.exists() && info.isFile() && info.size() > 0;
}

} // anonymous namespace

ModelFetcher::ModelFetcher(int totalTimeoutMs)
    : m_totalTimeoutMs(totalTimeoutMs)
    , m_deadlineMs(nowMs() + totalTimeoutMs)
{
}

long ModelFetcher::remainingMs() const
{
    return static_cast<long>(std::max<qint64>(0, m_deadlineMs - nowMs()));
}

bool ModelFetcher::ensureArtifacts(const std::vector<ModelArtifact>& artifacts,
                                   const QString& modelsDir, QString* errorOut)
{
    const QDir dir(modelsDir);
    for (const ModelArtifact& artifact : artifacts) {
        const QString dest = dir.filePath(artifact.fileName);
        if (artifactPresent(dest)) {
            continue;
        }
        if (artifact.url.isEmpty()) {
            if (errorOut) {
                *errorOut = QStringLiteral("%1 is missing and has no download URL").arg(dest);
            }
            return false;
        }
        if (!download(artifact.url, dest, errorOut)) {
            return false;
        }
    }
    return true;
}

bool ModelFetcher::download(const QString& url, const QString& destPath, QString* errorOut)
{
    const long budgetMs = remainingMs();
    if (budgetMs <= 0) {
        if (errorOut) {
            *errorOut = QStringLiteral("model download budget of %1 ms exhausted").arg(m_totalTimeoutMs);
        }
        return false;
    }

    if (!QDir().mkpath(QFileInfo(destPath).absolutePath())) {
        if (errorOut) {
            *errorOut = QStringLiteral("cannot create %1").arg(QFileInfo(destPath).absolutePath());
        }
        return false;
    }

    const QString partPath = destPath + QStringLiteral(".part");
    QFile part(partPath);
    if (!part.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        if (errorOut) {
            *errorOut = QStringLiteral("cannot write %1").arg(partPath);
        }
        return false;
    }

    ensureCurlInitialized();
    CURL* curl = curl_easy_init();
    if (!curl) {
        part.close();
        part.remove();
        if (errorOut) {
            *errorOut = QStringLiteral("curl_easy_init failed");
        }
        return false;
    }

    LOG_INFO(gotoEmbedding, "Downloading %s (budget %ld ms)", qPrintable(url), budgetMs);

    const QByteArray urlBytes = url.toUtf8();
    DownloadSink sink;
    sink.file = &part;

    curl_easy_setopt(curl, CURLOPT_URL, urlBytes.constData());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &sink);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, std::min(kConnectTimeoutMs, budgetMs));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, budgetMs);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "goto-model-fetcher");

    const CURLcode code = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    curl_easy_cleanup(curl);

    part.close();

    if (code != CURLE_OK || sink.failed || sink.written == 0) {
        part.remove();
        const QString reason = sink.failed
            ? QStringLiteral("write to %1 failed").arg(partPath)
            : QStringLiteral("%1 (HTTP %2)").arg(QString::fromUtf8(curl_easy_strerror(code))).arg(status);
        LOG_WARN(gotoEmbedding, "Download of %s failed: %s", qPrintable(url), qPrintable(reason));
        if (errorOut) {
            *errorOut = reason;
        }
        return false;
    }

    QFile::remove(destPath);
    if (!QFile::rename(partPath, destPath)) {
        QFile::remove(partPath);
        if (errorOut) {
            *errorOut = QStringLiteral("cannot move %1 into place").arg(partPath);
        }
        return false;
    }

    LOG_INFO(gotoEmbedding, "Downloaded %lld bytes to %s",
             static_cast<long long>(sink.written), qPrintable(destPath));
    return true;
}

} // namespace gt
