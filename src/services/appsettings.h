/**
 * @file appsettings.h
 * @brief Directory, option and platform configuration.
 */

#ifndef APPSETTINGS_H
#define APPSETTINGS_H

#include <QSettings>
#include <QString>
#include <QStringList>
#include <QUrl>

#include <memory>

/**
 * @brief Processing options for one run.
 *
 * Read from AppSettings when the run starts; changes made while a run is
 * active apply to the next run.
 */
struct PipelineOptions {
    bool decryptIso = true;
    bool extractIso = true;
    bool splitLargeFiles = true;
    bool splitPkg = true;
    bool keepUnsplitFile = false;
    bool keepEncryptedIso = false;
    bool keepDecryptedIso = false;
    bool keepDkeyFile = false;
    bool organizeIntoTitleFolders = false;
    int maxRetries = 50;
    qint64 splitPartSize = 4294967295LL;  ///< FAT32 maximum file size
};

/**
 * @brief Application configuration backed by an INI file.
 *
 * Keys:
 * - paths/data_root, paths/processing_dir, paths/rap_dir,
 *   paths/platforms/<id>
 * - platforms/<id>/url, platforms/<id>/dkeys
 * - mirrors/hosts
 * - tools/ps3dec, tools/extractps3iso
 * - options/... (see PipelineOptions)
 *
 * Every getter falls back to a built-in default, so an empty file is a
 * working configuration.
 */
class AppSettings
{
public:
    /**
     * @brief Opens the settings file at @p iniPath.
     * @param iniPath INI file location. Created on first write.
     * @param dataRoot Default data root when the file does not set one.
     */
    AppSettings(const QString &iniPath, const QString &dataRoot);

    /**
     * @brief Default data root: the application data location.
     */
    [[nodiscard]] static QString defaultDataRoot();

    [[nodiscard]] QString iniPath() const;
    void sync();

    /// @name Directories
    /// @{
    [[nodiscard]] QString dataRoot() const;
    [[nodiscard]] QString configDir() const;
    [[nodiscard]] QString processingDir() const;
    [[nodiscard]] QString rapDir() const;
    [[nodiscard]] QString platformOutputDir(const QString &platformId) const;
    [[nodiscard]] QString queueFilePath() const;
    [[nodiscard]] QString pauseStateFilePath() const;

    void setDataRoot(const QString &path);
    void setProcessingDir(const QString &path);
    void setPlatformOutputDir(const QString &platformId, const QString &path);
    /// @}

    /// @name Remote Locations
    /// @{
    [[nodiscard]] QString platformUrl(const QString &platformId) const;
    [[nodiscard]] QString dkeyUrl(const QString &platformId) const;
    [[nodiscard]] QStringList mirrorHosts() const;

    void setPlatformUrl(const QString &platformId, const QString &url);
    void setDkeyUrl(const QString &platformId, const QString &url);
    void setMirrorHosts(const QStringList &hosts);
    /// @}

    /// @name External Tools
    /// @{
    [[nodiscard]] QString toolPath(const QString &toolName) const;
    void setToolPath(const QString &toolName, const QString &path);
    /// @}

    /// @name Options
    /// @{
    [[nodiscard]] PipelineOptions options() const;
    void setOption(const QString &key, const QVariant &value);
    /// @}

    /**
     * @brief Builds "<base without trailing slash>/<percent-encoded name>".
     */
    [[nodiscard]] static QUrl buildDownloadUrl(const QString &baseUrl, const QString &fileName);

private:
    std::unique_ptr<QSettings> settings_;
    QString defaultDataRoot_;
};

#endif // APPSETTINGS_H
