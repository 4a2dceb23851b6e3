#include "conflictresolver.h"
#include "../utils/logging.h"

#include <QMutexLocker>

BlockingDecisionChannel::BlockingDecisionChannel(QObject *parent)
    : QObject(parent)
{
    qRegisterMetaType<Conflict>("Conflict");
    qRegisterMetaType<QList<Conflict>>("QList<Conflict>");
    qRegisterMetaType<ConflictContext>("ConflictContext");
    qRegisterMetaType<QList<ConflictDecision>>("QList<ConflictDecision>");
}

ConflictResponse BlockingDecisionChannel::decide(const QList<Conflict> &conflicts,
                                                 ConflictContext context,
                                                 const QList<ConflictDecision> &offered)
{
    {
        QMutexLocker locker(&mutex_);
        if (aborted_) {
            return ConflictResponse{};
        }
        waiting_ = true;
        hasResponse_ = false;
    }

    // Emitted without holding the lock: a direct connection may answer
    // synchronously through provideResponse()
    emit conflictRequested(conflicts, context, offered);

    QMutexLocker locker(&mutex_);
    while (!hasResponse_ && !aborted_) {
        responded_.wait(&mutex_);
    }
    waiting_ = false;

    if (!hasResponse_) {
        return ConflictResponse{};
    }
    hasResponse_ = false;
    return response_;
}

void BlockingDecisionChannel::provideResponse(ConflictDecision decision, bool applyToAll)
{
    QMutexLocker locker(&mutex_);
    response_.decision = decision;
    response_.applyToAll = applyToAll;
    hasResponse_ = true;
    responded_.wakeAll();
}

void BlockingDecisionChannel::abort()
{
    QMutexLocker locker(&mutex_);
    aborted_ = true;
    responded_.wakeAll();
}

bool BlockingDecisionChannel::isWaiting() const
{
    QMutexLocker locker(&mutex_);
    return waiting_;
}

ConflictResolver::ConflictResolver(std::shared_ptr<IConflictDecisionSource> source)
    : source_(std::move(source))
{
}

void ConflictResolver::setDecisionSource(std::shared_ptr<IConflictDecisionSource> source)
{
    QMutexLocker locker(&mutex_);
    source_ = std::move(source);
}

QList<ConflictDecision> ConflictResolver::offeredDecisions(ConflictContext context)
{
    if (context == ConflictContext::Downloading) {
        return {ConflictDecision::Overwrite, ConflictDecision::Skip, ConflictDecision::Cancel};
    }
    return {ConflictDecision::Overwrite, ConflictDecision::Skip,
            ConflictDecision::Rename, ConflictDecision::Cancel};
}

ConflictResponse ConflictResolver::resolve(const QList<Conflict> &conflicts, ConflictContext context)
{
    const QList<ConflictDecision> offered = offeredDecisions(context);
    std::shared_ptr<IConflictDecisionSource> source;
    {
        QMutexLocker locker(&mutex_);
        if (hasRemembered_ && offered.contains(remembered_)) {
            return ConflictResponse{remembered_, true};
        }
        source = source_;
    }

    if (!source) {
        qWarning() << "No conflict decision source; cancelling";
        return ConflictResponse{};
    }

    // Ask without holding our lock
    ConflictResponse response = source->decide(conflicts, context, offered);

    if (!offered.contains(response.decision)) {
        qWarning() << "Decision" << conflictDecisionToString(response.decision)
                   << "is not available here; cancelling";
        return ConflictResponse{};
    }

    LOG_VERBOSE() << "Conflict on" << (conflicts.isEmpty() ? QString() : conflicts.first().path)
                  << "->" << conflictDecisionToString(response.decision)
                  << (response.applyToAll ? "(all)" : "");

    if (response.applyToAll) {
        QMutexLocker locker(&mutex_);
        hasRemembered_ = true;
        remembered_ = response.decision;
    }
    return response;
}

ConflictResponse ConflictResolver::resolve(const Conflict &conflict, ConflictContext context)
{
    return resolve(QList<Conflict>{conflict}, context);
}

void ConflictResolver::reset()
{
    QMutexLocker locker(&mutex_);
    hasRemembered_ = false;
    remembered_ = ConflictDecision::Cancel;
}

bool ConflictResolver::hasRememberedDecision() const
{
    QMutexLocker locker(&mutex_);
    return hasRemembered_;
}
