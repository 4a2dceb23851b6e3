#include <QtTest>
#include <QTemporaryDir>

#include <memory>

#include "services/appsettings.h"

class TestAppSettings : public QObject
{
    Q_OBJECT

private slots:
    void init()
    {
        tempDir_ = std::make_unique<QTemporaryDir>();
        QVERIFY(tempDir_->isValid());
        settings_ = std::make_unique<AppSettings>(tempDir_->filePath("config/rompipe.ini"),
                                                  tempDir_->filePath("data"));
    }

    void cleanup()
    {
        settings_.reset();
        tempDir_.reset();
    }

    // ========== Directory layout ==========

    void testDefaultLayout()
    {
        const QString root = tempDir_->filePath("data");
        QCOMPARE(settings_->dataRoot(), root);
        QCOMPARE(settings_->processingDir(), root + "/processing");
        QCOMPARE(settings_->rapDir(), root + "/exdata");
        QCOMPARE(settings_->queueFilePath(), root + "/config/queue.json");
        QCOMPARE(settings_->pauseStateFilePath(), root + "/config/pause_state.json");
    }

    void testPlatformOutputDirs()
    {
        const QString root = tempDir_->filePath("data");
        QCOMPARE(settings_->platformOutputDir("ps3"), root + "/PS3ISO");
        QCOMPARE(settings_->platformOutputDir("PSN"), root + "/packages");
        QCOMPARE(settings_->platformOutputDir("ps2"), root + "/PS2ISO");
        QCOMPARE(settings_->platformOutputDir("psx"), root + "/PSXISO");
        QCOMPARE(settings_->platformOutputDir("psp"), root + "/PSPISO");
        QCOMPARE(settings_->platformOutputDir("wii"), root + "/WII");
    }

    void testOverriddenDirectories()
    {
        settings_->setDataRoot("/mnt/usb");
        settings_->setProcessingDir("/tmp/work");
        settings_->setPlatformOutputDir("PS3", "/mnt/usb/games");

        QCOMPARE(settings_->processingDir(), QString("/tmp/work"));
        QCOMPARE(settings_->platformOutputDir("ps3"), QString("/mnt/usb/games"));
        QCOMPARE(settings_->platformOutputDir("ps2"), QString("/mnt/usb/PS2ISO"));
        QCOMPARE(settings_->queueFilePath(), QString("/mnt/usb/config/queue.json"));
    }

    void testValuesSurviveReopen()
    {
        settings_->setToolPath("ps3dec", "/opt/bin/ps3dec");
        settings_->setMirrorHosts({"mirror.one", "mirror.two"});
        settings_->sync();

        AppSettings reopened(tempDir_->filePath("config/rompipe.ini"), tempDir_->filePath("data"));
        QCOMPARE(reopened.toolPath("ps3dec"), QString("/opt/bin/ps3dec"));
        QCOMPARE(reopened.mirrorHosts(), (QStringList{"mirror.one", "mirror.two"}));
    }

    // ========== Remote sources ==========

    void testPlatformUrls()
    {
        QVERIFY(settings_->platformUrl("ps3").contains("PlayStation%203"));
        QVERIFY(settings_->platformUrl("gamecube").contains("GameCube"));
        QVERIFY(settings_->platformUrl("dreamcast").isEmpty());

        settings_->setPlatformUrl("dreamcast", "https://example.org/dc/");
        QCOMPARE(settings_->platformUrl("DREAMCAST"), QString("https://example.org/dc/"));
    }

    void testDkeyUrlOnlyForPs3()
    {
        QVERIFY(!settings_->dkeyUrl("ps3").isEmpty());
        QVERIFY(settings_->dkeyUrl("ps2").isEmpty());
    }

    // ========== Options ==========

    void testDefaultOptions()
    {
        PipelineOptions options = settings_->options();
        QVERIFY(options.decryptIso);
        QVERIFY(options.extractIso);
        QVERIFY(options.splitLargeFiles);
        QVERIFY(options.splitPkg);
        QVERIFY(!options.keepUnsplitFile);
        QVERIFY(!options.keepEncryptedIso);
        QVERIFY(!options.keepDecryptedIso);
        QVERIFY(!options.keepDkeyFile);
        QVERIFY(!options.organizeIntoTitleFolders);
        QCOMPARE(options.maxRetries, 50);
        QCOMPARE(options.splitPartSize, qint64(4294967295LL));
    }

    void testSetOptions()
    {
        settings_->setOption("extract_iso", false);
        settings_->setOption("organize_into_title_folders", true);
        settings_->setOption("max_retries", 0);
        settings_->setOption("split_part_size", 1000);

        PipelineOptions options = settings_->options();
        QVERIFY(!options.extractIso);
        QVERIFY(options.organizeIntoTitleFolders);
        QCOMPARE(options.maxRetries, 1);
        QCOMPARE(options.splitPartSize, qint64(1000));
    }

    // ========== URL building ==========

    void testBuildDownloadUrl()
    {
        QUrl url = AppSettings::buildDownloadUrl(
            "https://myrient.example/files/Sony%20-%20PlayStation%203/", "Game (USA) [Rev 1].zip");

        QCOMPARE(url.host(), QString("myrient.example"));
        QCOMPARE(url.fileName(), QString("Game (USA) [Rev 1].zip"));
        QVERIFY(url.toString(QUrl::FullyEncoded).startsWith(
            "https://myrient.example/files/Sony%20-%20PlayStation%203/Game%20"));
        QVERIFY(!url.toString(QUrl::FullyEncoded).contains("//Game"));
    }

    void testBuildDownloadUrlEncodesReservedCharacters()
    {
        QUrl url = AppSettings::buildDownloadUrl("https://host/dir", "A & B #1?.zip");
        QCOMPARE(url.fileName(), QString("A & B #1?.zip"));
        QVERIFY(url.query().isEmpty());
        QVERIFY(url.fragment().isEmpty());
    }

private:
    std::unique_ptr<QTemporaryDir> tempDir_;
    std::unique_ptr<AppSettings> settings_;
};

QTEST_MAIN(TestAppSettings)
#include "test_appsettings.moc"
