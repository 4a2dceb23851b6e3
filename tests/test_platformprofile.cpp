#include <QtTest>

#include "models/platformprofile.h"
#include "models/queueitem.h"

class TestPlatformProfile : public QObject
{
    Q_OBJECT

private slots:
    // ========== Platform kinds ==========

    void testKindFromId()
    {
        QCOMPARE(platformKindFromId("ps3"), PlatformKind::Ps3);
        QCOMPARE(platformKindFromId("PS3"), PlatformKind::Ps3);
        QCOMPARE(platformKindFromId("psn"), PlatformKind::Psn);
        QCOMPARE(platformKindFromId("ps2"), PlatformKind::Ps2);
        QCOMPARE(platformKindFromId("psx"), PlatformKind::Psx);
        QCOMPARE(platformKindFromId("psp"), PlatformKind::Psp);
        QCOMPARE(platformKindFromId("wii"), PlatformKind::Generic);
        QCOMPARE(platformKindFromId("xbox360"), PlatformKind::Generic);
        QCOMPARE(platformKindFromId(""), PlatformKind::Generic);
    }

    // ========== Stage configuration ==========

    void testPs3Profile()
    {
        const PlatformProfile &profile = platformProfile("ps3");
        QVERIFY(profile.supportsDecrypt);
        QVERIFY(profile.supportsImageExtract);
        QVERIFY(!profile.supportsSplit);
        QVERIFY(!profile.hasLicenseFiles);
        QCOMPARE(profile.primaryExtensions, QStringList{".iso"});
    }

    void testPsnProfile()
    {
        const PlatformProfile &profile = platformProfile("psn");
        QVERIFY(!profile.supportsDecrypt);
        QVERIFY(profile.supportsSplit);
        QVERIFY(profile.hasLicenseFiles);
        QCOMPARE(profile.splitNaming, SplitNaming::Ps3Package);
        QCOMPARE(profile.primaryExtensions, QStringList{".pkg"});
    }

    void testSplitPlatforms()
    {
        QVERIFY(platformProfile("ps2").supportsSplit);
        QCOMPARE(platformProfile("ps2").splitNaming, SplitNaming::NumericSuffix);
        QVERIFY(platformProfile("psp").supportsSplit);
        QVERIFY(!platformProfile("psx").supportsSplit);
    }

    void testGenericProfileDoesNothingExtra()
    {
        const PlatformProfile &profile = platformProfile("gamecube");
        QVERIFY(!profile.supportsDecrypt);
        QVERIFY(!profile.supportsImageExtract);
        QVERIFY(!profile.supportsSplit);
        QVERIFY(profile.primaryExtensions.isEmpty());
    }

    // ========== Queue item naming ==========

    void testDisplayName()
    {
        QCOMPARE(QueueItem::makeDisplayName("ps3", "Game (USA).zip"), QString("(PS3) Game (USA).zip"));

        QueueItem item = QueueItem::fromDisplayName("(PS3) Game (USA) (En,Fr).zip", "3 GiB");
        QCOMPARE(item.platformId, QString("ps3"));
        QCOMPARE(item.fileName(), QString("Game (USA) (En,Fr).zip"));
        QCOMPARE(item.baseName(), QString("Game (USA) (En,Fr)"));
        QCOMPARE(item.sizeLabel, QString("3 GiB"));
    }

    void testDisplayNameWithoutPrefix()
    {
        QueueItem item = QueueItem::fromDisplayName("Loose File.zip");
        QVERIFY(item.platformId.isEmpty());
        QCOMPARE(item.fileName(), QString("Loose File.zip"));
    }

    void testOperationNames()
    {
        QCOMPARE(stageToOperation(ItemStage::Downloading), QString("download"));
        QCOMPARE(stageToOperation(ItemStage::Relocating), QString("move"));
        QVERIFY(stageToOperation(ItemStage::Completed).isEmpty());
        QCOMPARE(operationToStage("split"), ItemStage::Splitting);
        QCOMPARE(operationToStage("bogus"), ItemStage::Queued);
    }
};

QTEST_MAIN(TestPlatformProfile)
#include "test_platformprofile.moc"
