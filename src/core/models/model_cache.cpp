#include "core/models/model_cache.h"

#include "core/shared/app_paths.h"
#include "core/shared/logging.h"

#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QFileInfo>

namespace gt {

namespace {

const QString kManifestName = QStringLiteral("manifest.json");
const QString kVocabName = QStringLiteral("vocab.txt");

QString shippedModelsDir()
{
    QStringList roots{QStringLiteral(":/goto/models")};
    const QString appDir = QCoreApplication::applicationDirPath();
    if (!appDir.isEmpty()) {
        roots << appDir + QStringLiteral("/../share/goto/models");
    }
#ifdef GOTO_SOURCE_DIR
    roots << QString::fromUtf8(GOTO_SOURCE_DIR) + QStringLiteral("/data/models");
#endif

    for (const QString& root : roots) {
        if (QFileInfo::exists(QDir(root).filePath(kManifestName))) {
            return QDir::cleanPath(root);
        }
    }
    return QString();
}

bool installFile(const QString& from, const QString& to)
{
    QFile::remove(to);
    if (!QFile::copy(from, to)) {
        return false;
    }
    // Files copied out of a Qt resource keep its read-only mode.
    return QFile::setPermissions(to, QFileDevice::ReadOwner | QFileDevice::WriteOwner
                                         | QFileDevice::ReadGroup | QFileDevice::ReadOther);
}

} // namespace

QString writableModelsDir()
{
    return QDir::cleanPath(writableModelsDirectory());
}

bool seedModelCache(const QString& cacheDir, QString* errorOut)
{
    const QDir cache(cacheDir);
    if (QFileInfo::exists(cache.filePath(kManifestName))) {
        return true;
    }

    const QString shipped = shippedModelsDir();
    if (shipped.isEmpty()) {
        if (errorOut) {
            *errorOut = QStringLiteral("no shipped model manifest found");
        }
        return false;
    }
    if (!QDir().mkpath(cacheDir)) {
        if (errorOut) {
            *errorOut = QStringLiteral("cannot create %1").arg(cacheDir);
        }
        return false;
    }

    const QDir source(shipped);
    if (!installFile(source.filePath(kManifestName), cache.filePath(kManifestName))) {
        if (errorOut) {
            *errorOut = QStringLiteral("cannot copy manifest into %1").arg(cacheDir);
        }
        return false;
    }
    if (QFileInfo::exists(source.filePath(kVocabName))
        && !QFileInfo::exists(cache.filePath(kVocabName))
        && !installFile(source.filePath(kVocabName), cache.filePath(kVocabName))) {
        LOG_DEBUG(gotoEmbedding, "Shipped vocab not copied, it will be downloaded");
    }

    LOG_INFO(gotoEmbedding, "Model cache seeded at %s from %s",
             qPrintable(cacheDir), qPrintable(shipped));
    return true;
}

QString resolveModelsDir()
{
    const QString fromEnv = qEnvironmentVariable("GOTO_MODELS_DIR");
    if (!fromEnv.isEmpty()) {
        return QDir::cleanPath(fromEnv);
    }

    const QString cacheDir = writableModelsDir();
    QString error;
    if (!seedModelCache(cacheDir, &error)) {
        LOG_DEBUG(gotoEmbedding, "Model cache not seeded: %s", qPrintable(error));
    }
    return cacheDir;
}

} // namespace gt
