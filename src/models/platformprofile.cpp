#include "platformprofile.h"

namespace {

PlatformProfile makeProfile(PlatformKind kind)
{
    PlatformProfile profile;
    profile.kind = kind;

    switch (kind) {
    case PlatformKind::Ps3:
        profile.supportsDecrypt = true;
        profile.supportsImageExtract = true;
        profile.primaryExtensions = {".iso"};
        break;
    case PlatformKind::Psn:
        profile.supportsSplit = true;
        profile.splitNaming = SplitNaming::Ps3Package;
        profile.primaryExtensions = {".pkg"};
        profile.hasLicenseFiles = true;
        break;
    case PlatformKind::Ps2:
        profile.supportsSplit = true;
        profile.primaryExtensions = {".iso", ".bin"};
        break;
    case PlatformKind::Psp:
        profile.supportsSplit = true;
        profile.primaryExtensions = {".iso"};
        break;
    case PlatformKind::Psx:
        profile.primaryExtensions = {".bin", ".cue"};
        break;
    case PlatformKind::Generic:
        break;
    }
    return profile;
}

} // namespace

PlatformKind platformKindFromId(const QString &platformId)
{
    const QString id = platformId.toLower();
    if (id == QLatin1String("ps3") || id == QLatin1String("ps3iso")) {
        return PlatformKind::Ps3;
    }
    if (id == QLatin1String("psn")) {
        return PlatformKind::Psn;
    }
    if (id == QLatin1String("ps2") || id == QLatin1String("ps2iso")) {
        return PlatformKind::Ps2;
    }
    if (id == QLatin1String("psx") || id == QLatin1String("psxiso")) {
        return PlatformKind::Psx;
    }
    if (id == QLatin1String("psp") || id == QLatin1String("pspiso")) {
        return PlatformKind::Psp;
    }
    return PlatformKind::Generic;
}

const PlatformProfile &platformProfile(PlatformKind kind)
{
    static const PlatformProfile ps3 = makeProfile(PlatformKind::Ps3);
    static const PlatformProfile psn = makeProfile(PlatformKind::Psn);
    static const PlatformProfile ps2 = makeProfile(PlatformKind::Ps2);
    static const PlatformProfile psx = makeProfile(PlatformKind::Psx);
    static const PlatformProfile psp = makeProfile(PlatformKind::Psp);
    static const PlatformProfile generic = makeProfile(PlatformKind::Generic);

    switch (kind) {
    case PlatformKind::Ps3: return ps3;
    case PlatformKind::Psn: return psn;
    case PlatformKind::Ps2: return ps2;
    case PlatformKind::Psx: return psx;
    case PlatformKind::Psp: return psp;
    case PlatformKind::Generic: return generic;
    }
    return generic;
}

const PlatformProfile &platformProfile(const QString &platformId)
{
    return platformProfile(platformKindFromId(platformId));
}
