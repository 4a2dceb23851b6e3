/**
 * @file fileutils.h
 * @brief Filesystem helpers shared by the pipeline stages.
 */

#ifndef FILEUTILS_H
#define FILEUTILS_H

#include <QString>

namespace FileUtils {

/**
 * @brief Formats a byte count for display.
 *
 * Bytes are shown as integers, KB and MB with one decimal and GB with two.
 * Negative values are treated as zero.
 */
[[nodiscard]] QString formatFileSize(qint64 bytes);

/**
 * @brief Returns the first non-existing "name (n).ext" variant of @p filePath.
 *
 * The counter starts at 1 and the original path itself is never returned.
 */
[[nodiscard]] QString generateUniqueFilename(const QString &filePath);

/**
 * @brief Returns the first non-existing "name (n)" variant of @p dirPath.
 */
[[nodiscard]] QString generateUniqueDirname(const QString &dirPath);

/**
 * @brief Removes every empty directory below @p root, deepest first.
 * @param root Directory to prune. The root itself is kept.
 * @return Number of directories removed.
 */
int removeEmptyDirectories(const QString &root);

/**
 * @brief Removes empty parent directories of @p path up to, but not
 *        including, @p stopAt.
 */
void removeEmptyParents(const QString &path, const QString &stopAt);

/**
 * @brief Strips the last extension from a file name ("Game (USA).zip" -> "Game (USA)").
 */
[[nodiscard]] QString stripExtension(const QString &fileName);

} // namespace FileUtils

#endif // FILEUTILS_H
