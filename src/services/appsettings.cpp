#include "appsettings.h"

#include <QDir>
#include <QHash>
#include <QStandardPaths>

namespace {

const QHash<QString, QString> &defaultPlatformUrls()
{
    static const QHash<QString, QString> urls = {
        {"ps3", "https://myrient.erista.me/files/Redump/Sony%20-%20PlayStation%203/"},
        {"psn", "https://myrient.erista.me/files/No-Intro/Sony%20-%20PlayStation%203%20(PSN)%20(Content)/"},
        {"ps2", "https://myrient.erista.me/files/Redump/Sony%20-%20PlayStation%202/"},
        {"psx", "https://myrient.erista.me/files/Redump/Sony%20-%20PlayStation/"},
        {"psp", "https://myrient.erista.me/files/Redump/Sony%20-%20PlayStation%20Portable/"},
        {"xbox360", "https://myrient.erista.me/files/Redump/Microsoft%20-%20Xbox%20360/"},
        {"gamecube", "https://myrient.erista.me/files/Redump/Nintendo%20-%20GameCube%20-%20NKit%20RVZ%20[zstd-19-128k]/"},
        {"wii", "https://myrient.erista.me/files/Redump/Nintendo%20-%20Wii%20-%20NKit%20RVZ%20[zstd-19-128k]/"},
    };
    return urls;
}

const QHash<QString, QString> &defaultOutputDirNames()
{
    static const QHash<QString, QString> names = {
        {"ps3", "PS3ISO"},
        {"psn", "packages"},
        {"ps2", "PS2ISO"},
        {"psx", "PSXISO"},
        {"psp", "PSPISO"},
    };
    return names;
}

const char *const DefaultPs3DkeyUrl =
    "https://myrient.erista.me/files/Redump/Sony%20-%20PlayStation%203%20-%20Disc%20Keys%20TXT/";

} // namespace

AppSettings::AppSettings(const QString &iniPath, const QString &dataRoot)
    : settings_(std::make_unique<QSettings>(iniPath, QSettings::IniFormat))
    , defaultDataRoot_(dataRoot)
{
}

QString AppSettings::defaultDataRoot()
{
    return QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
}

QString AppSettings::iniPath() const
{
    return settings_->fileName();
}

void AppSettings::sync()
{
    settings_->sync();
}

QString AppSettings::dataRoot() const
{
    return settings_->value("paths/data_root", defaultDataRoot_).toString();
}

QString AppSettings::configDir() const
{
    return QDir(dataRoot()).filePath("config");
}

QString AppSettings::processingDir() const
{
    return settings_->value("paths/processing_dir",
                            QDir(dataRoot()).filePath("processing")).toString();
}

QString AppSettings::rapDir() const
{
    return settings_->value("paths/rap_dir", QDir(dataRoot()).filePath("exdata")).toString();
}

QString AppSettings::platformOutputDir(const QString &platformId) const
{
    QString id = platformId.toLower();
    QString name = defaultOutputDirNames().value(id, id.toUpper());
    return settings_->value("paths/platforms/" + id, QDir(dataRoot()).filePath(name)).toString();
}

QString AppSettings::queueFilePath() const
{
    return QDir(configDir()).filePath("queue.json");
}

QString AppSettings::pauseStateFilePath() const
{
    return QDir(configDir()).filePath("pause_state.json");
}

void AppSettings::setDataRoot(const QString &path)
{
    settings_->setValue("paths/data_root", path);
}

void AppSettings::setProcessingDir(const QString &path)
{
    settings_->setValue("paths/processing_dir", path);
}

void AppSettings::setPlatformOutputDir(const QString &platformId, const QString &path)
{
    settings_->setValue("paths/platforms/" + platformId.toLower(), path);
}

QString AppSettings::platformUrl(const QString &platformId) const
{
    QString id = platformId.toLower();
    return settings_->value("platforms/" + id + "/url", defaultPlatformUrls().value(id)).toString();
}

QString AppSettings::dkeyUrl(const QString &platformId) const
{
    QString id = platformId.toLower();
    QString fallback = id == QLatin1String("ps3") ? QString::fromLatin1(DefaultPs3DkeyUrl) : QString();
    return settings_->value("platforms/" + id + "/dkeys", fallback).toString();
}

QStringList AppSettings::mirrorHosts() const
{
    return settings_->value("mirrors/hosts").toStringList();
}

void AppSettings::setPlatformUrl(const QString &platformId, const QString &url)
{
    settings_->setValue("platforms/" + platformId.toLower() + "/url", url);
}

void AppSettings::setDkeyUrl(const QString &platformId, const QString &url)
{
    settings_->setValue("platforms/" + platformId.toLower() + "/dkeys", url);
}

void AppSettings::setMirrorHosts(const QStringList &hosts)
{
    settings_->setValue("mirrors/hosts", hosts);
}

QString AppSettings::toolPath(const QString &toolName) const
{
    return settings_->value("tools/" + toolName).toString();
}

void AppSettings::setToolPath(const QString &toolName, const QString &path)
{
    settings_->setValue("tools/" + toolName, path);
}

PipelineOptions AppSettings::options() const
{
    PipelineOptions defaults;
    PipelineOptions options;
    settings_->beginGroup("options");
    options.decryptIso = settings_->value("decrypt_iso", defaults.decryptIso).toBool();
    options.extractIso = settings_->value("extract_iso", defaults.extractIso).toBool();
    options.splitLargeFiles = settings_->value("split_large_files", defaults.splitLargeFiles).toBool();
    options.splitPkg = settings_->value("split_pkg", defaults.splitPkg).toBool();
    options.keepUnsplitFile = settings_->value("keep_unsplit_file", defaults.keepUnsplitFile).toBool();
    options.keepEncryptedIso = settings_->value("keep_encrypted_iso", defaults.keepEncryptedIso).toBool();
    options.keepDecryptedIso = settings_->value("keep_decrypted_iso", defaults.keepDecryptedIso).toBool();
    options.keepDkeyFile = settings_->value("keep_dkey_file", defaults.keepDkeyFile).toBool();
    options.organizeIntoTitleFolders =
        settings_->value("organize_into_title_folders", defaults.organizeIntoTitleFolders).toBool();
    options.maxRetries = settings_->value("max_retries", defaults.maxRetries).toInt();
    options.splitPartSize = settings_->value("split_part_size", defaults.splitPartSize).toLongLong();
    settings_->endGroup();

    if (options.maxRetries < 1) {
        options.maxRetries = 1;
    }
    if (options.splitPartSize <= 0) {
        options.splitPartSize = defaults.splitPartSize;
    }
    return options;
}

void AppSettings::setOption(const QString &key, const QVariant &value)
{
    settings_->setValue("options/" + key, value);
}

QUrl AppSettings::buildDownloadUrl(const QString &baseUrl, const QString &fileName)
{
    QString base = QUrl(baseUrl).toString(QUrl::FullyEncoded);
    while (base.endsWith('/')) {
        base.chop(1);
    }
    QByteArray encoded = base.toUtf8() + '/' + QUrl::toPercentEncoding(fileName);
    return QUrl::fromEncoded(encoded);
}
