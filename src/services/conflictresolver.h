/**
 * @file conflictresolver.h
 * @brief Destination conflict decisions with session-wide "apply to all".
 */

#ifndef CONFLICTRESOLVER_H
#define CONFLICTRESOLVER_H

#include <QList>
#include <QMetaType>
#include <QMutex>
#include <QObject>
#include <QString>
#include <QWaitCondition>

#include <functional>
#include <memory>

/**
 * @brief A destination path that already exists.
 */
struct Conflict {
    QString path;
    qint64 existingSizeBytes = 0;
    qint64 newSizeBytes = -1;  ///< -1 when not known yet (downloads)
};

enum class ConflictDecision { Overwrite, Skip, Rename, Cancel };

/**
 * @brief Where the conflict was discovered.
 *
 * Rename is not offered for Downloading since the size of the incoming
 * file is normally unknown before the transfer.
 */
enum class ConflictContext { Downloading, Extraction, Processing };

struct ConflictResponse {
    ConflictDecision decision = ConflictDecision::Cancel;
    bool applyToAll = false;
};

[[nodiscard]] inline const char* conflictDecisionToString(ConflictDecision decision) {
    switch (decision) {
        case ConflictDecision::Overwrite: return "Overwrite";
        case ConflictDecision::Skip: return "Skip";
        case ConflictDecision::Rename: return "Rename";
        case ConflictDecision::Cancel: return "Cancel";
    }
    return "Unknown";
}

/**
 * @brief Something that can answer a conflict question.
 */
class IConflictDecisionSource
{
public:
    virtual ~IConflictDecisionSource() = default;

    /**
     * @brief Obtains a decision. May block.
     * @param conflicts One or more conflicting destinations.
     * @param context The operation that hit the conflicts.
     * @param offered The decisions that are valid in @p context.
     */
    virtual ConflictResponse decide(const QList<Conflict> &conflicts,
                                    ConflictContext context,
                                    const QList<ConflictDecision> &offered) = 0;
};

/**
 * @brief Decision source backed by a plain callable.
 */
class CallbackDecisionSource : public IConflictDecisionSource
{
public:
    using Callback = std::function<ConflictResponse(const QList<Conflict> &,
                                                    ConflictContext,
                                                    const QList<ConflictDecision> &)>;

    explicit CallbackDecisionSource(Callback callback)
        : callback_(std::move(callback))
    {
    }

    ConflictResponse decide(const QList<Conflict> &conflicts,
                            ConflictContext context,
                            const QList<ConflictDecision> &offered) override
    {
        return callback_(conflicts, context, offered);
    }

private:
    Callback callback_;
};

/**
 * @brief Cross-thread rendezvous between a pipeline worker and the thread
 *        that owns the prompt.
 *
 * decide() emits conflictRequested() and blocks the worker on a condition
 * variable until provideResponse() is called. The worker holds no other
 * lock while it waits, so a slow answer cannot deadlock the pipeline.
 * Connect conflictRequested() with a queued connection to the prompting
 * object.
 *
 * @par Example usage:
 * @code
 * auto channel = std::make_shared<BlockingDecisionChannel>();
 * connect(channel.get(), &BlockingDecisionChannel::conflictRequested,
 *         prompt, &Prompt::ask, Qt::QueuedConnection);
 * // ... later, on the prompt's thread:
 * channel->provideResponse(ConflictDecision::Skip, true);
 * @endcode
 */
class BlockingDecisionChannel : public QObject, public IConflictDecisionSource
{
    Q_OBJECT

public:
    explicit BlockingDecisionChannel(QObject *parent = nullptr);
    ~BlockingDecisionChannel() override = default;

    ConflictResponse decide(const QList<Conflict> &conflicts,
                            ConflictContext context,
                            const QList<ConflictDecision> &offered) override;

    /**
     * @brief Delivers the answer to the waiting worker.
     */
    void provideResponse(ConflictDecision decision, bool applyToAll);

    /**
     * @brief Wakes any waiting worker with Cancel and rejects future
     *        requests. Used on shutdown.
     */
    void abort();

    [[nodiscard]] bool isWaiting() const;

signals:
    /**
     * @brief Emitted on the worker thread when a decision is needed.
     */
    void conflictRequested(const QList<Conflict> &conflicts,
                           ConflictContext context,
                           const QList<ConflictDecision> &offered);

private:
    mutable QMutex mutex_;
    QWaitCondition responded_;
    bool waiting_ = false;
    bool hasResponse_ = false;
    bool aborted_ = false;
    ConflictResponse response_;
};

/**
 * @brief Resolves destination conflicts for one processing run.
 *
 * An apply-to-all answer is remembered and returned without asking again
 * until reset() is called at the start of the next run. Thread-safe.
 */
class ConflictResolver
{
public:
    explicit ConflictResolver(std::shared_ptr<IConflictDecisionSource> source = nullptr);

    void setDecisionSource(std::shared_ptr<IConflictDecisionSource> source);

    /**
     * @brief Returns the decision for @p conflicts.
     *
     * Without a decision source every conflict resolves to Cancel.
     */
    ConflictResponse resolve(const QList<Conflict> &conflicts, ConflictContext context);

    /**
     * @brief Convenience overload for a single conflict.
     */
    ConflictResponse resolve(const Conflict &conflict, ConflictContext context);

    /**
     * @brief Forgets any remembered apply-to-all decision.
     */
    void reset();

    [[nodiscard]] bool hasRememberedDecision() const;

    /**
     * @brief The decisions a source may choose from in @p context.
     */
    [[nodiscard]] static QList<ConflictDecision> offeredDecisions(ConflictContext context);

private:
    mutable QMutex mutex_;
    std::shared_ptr<IConflictDecisionSource> source_;
    bool hasRemembered_ = false;
    ConflictDecision remembered_ = ConflictDecision::Cancel;
};

Q_DECLARE_METATYPE(Conflict)
Q_DECLARE_METATYPE(ConflictContext)
Q_DECLARE_METATYPE(ConflictDecision)

#endif // CONFLICTRESOLVER_H
