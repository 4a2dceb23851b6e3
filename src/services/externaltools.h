/**
 * @file externaltools.h
 * @brief Lookup and execution of the disc image tools.
 */

#ifndef EXTERNALTOOLS_H
#define EXTERNALTOOLS_H

#include <QMutex>
#include <QString>
#include <QStringList>

#include <functional>
#include <memory>

class AppSettings;

/**
 * @brief Outcome of running an external tool to completion.
 */
struct ToolResult {
    bool started = false;
    bool crashed = false;
    bool cancelled = false;  ///< Killed because the caller gave up on it
    int exitCode = -1;
    QString output;       ///< Combined stdout and stderr
    QString errorMessage;

    [[nodiscard]] bool isSuccess() const { return started && !crashed && exitCode == 0; }
};

/**
 * @brief Finds and runs ps3dec and extractps3iso.
 *
 * A path configured in settings (tools/<name>) wins; otherwise the tool
 * is looked up on PATH under each of its known executable names.
 *
 * run() blocks the calling thread until the process exits. It is meant to
 * be called from a stage worker thread. The process is killed when the
 * caller's cancel check turns true.
 */
class ExternalTools
{
public:
    static constexpr const char *Ps3Dec = "ps3dec";
    static constexpr const char *ExtractPs3Iso = "extractps3iso";
    static constexpr int DefaultTimeoutMs = 6 * 60 * 60 * 1000;
    static constexpr int CancelPollMs = 100;

    /**
     * @brief Called when a tool cannot be found.
     *
     * The handler may install the tool (e.g. ask for its location and call
     * AppSettings::setToolPath()) and return true to retry the lookup.
     */
    using MissingToolHandler = std::function<bool(const QString &toolName)>;

    /// Polled while a tool runs; returning true kills the process
    using CancelCheck = std::function<bool()>;

    explicit ExternalTools(std::shared_ptr<AppSettings> settings);

    /**
     * @brief Resolves @p toolName to an executable path.
     * @return The absolute path, or an empty string if not found.
     */
    [[nodiscard]] QString locate(const QString &toolName) const;

    /**
     * @brief Like locate(), but offers the missing-tool handler once.
     */
    QString require(const QString &toolName);

    /**
     * @brief Runs @p program with @p arguments and waits for it.
     * @param isCancelled Checked every CancelPollMs; may be empty.
     * @param timeoutMs The process is killed after this long.
     */
    ToolResult run(const QString &program, const QStringList &arguments,
                   const CancelCheck &isCancelled = CancelCheck(),
                   int timeoutMs = DefaultTimeoutMs) const;

    void setMissingToolHandler(MissingToolHandler handler);

    /**
     * @brief Executable names tried on PATH for @p toolName.
     */
    [[nodiscard]] static QStringList candidateNames(const QString &toolName);

private:
    std::shared_ptr<AppSettings> settings_;
    mutable QMutex mutex_;
    MissingToolHandler missingToolHandler_;
};

#endif // EXTERNALTOOLS_H
