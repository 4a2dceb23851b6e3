#ifndef PLATFORMPROFILE_H
#define PLATFORMPROFILE_H

#include <QString>
#include <QStringList>

/**
 * @brief Known platform kinds.
 *
 * Every platform id that is not one of the named kinds (gamecube, wii,
 * xbox360, ...) maps to Generic.
 */
enum class PlatformKind { Ps3, Psn, Ps2, Psx, Psp, Generic };

/**
 * @brief Naming convention for split parts.
 */
enum class SplitNaming {
    NumericSuffix,  ///< "<stem>.iso.0", "<stem>.iso.1", ...
    Ps3Package      ///< "<stem>.pkg.66600", "<stem>.pkg.66601", ...
};

/**
 * @brief Stage configuration for one platform kind.
 *
 * Profiles are looked up once per queue item; the orchestrator reads the
 * flags instead of branching on platform identifiers.
 */
struct PlatformProfile {
    PlatformKind kind = PlatformKind::Generic;
    bool supportsDecrypt = false;        ///< Disc image needs a dkey and ps3dec
    bool supportsImageExtract = false;   ///< Disc image can be unpacked to a folder
    bool supportsSplit = false;          ///< Artifacts may exceed the FAT32 ceiling
    SplitNaming splitNaming = SplitNaming::NumericSuffix;
    QStringList primaryExtensions;       ///< Final artifact types, lower case with dot
    bool hasLicenseFiles = false;        ///< .rap files go to a separate root
};

/**
 * @brief Maps a platform id ("ps3", "psn", "wii", ...) to its kind.
 */
[[nodiscard]] PlatformKind platformKindFromId(const QString &platformId);

/**
 * @brief Returns the profile for @p kind.
 */
[[nodiscard]] const PlatformProfile &platformProfile(PlatformKind kind);

/**
 * @brief Convenience lookup by platform id.
 */
[[nodiscard]] const PlatformProfile &platformProfile(const QString &platformId);

#endif // PLATFORMPROFILE_H
