#ifndef CONSOLEDECISIONSOURCE_H
#define CONSOLEDECISIONSOURCE_H

#include <QMutex>
#include <QTextStream>

#include "conflictresolver.h"

/**
 * @brief Answers conflicts by prompting on the terminal.
 *
 * With a fixed decision (from --overwrite or --skip-existing) no prompt
 * is shown and the decision is applied to every conflict of the run.
 * Prompts are serialized; decide() may be called from any thread.
 */
class ConsoleDecisionSource : public IConflictDecisionSource
{
public:
    ConsoleDecisionSource();
    explicit ConsoleDecisionSource(ConflictDecision fixedDecision);

    ConflictResponse decide(const QList<Conflict> &conflicts,
                            ConflictContext context,
                            const QList<ConflictDecision> &offered) override;

    /**
     * @brief Maps a typed answer ("o", "S", "rename", "a"...) to a decision.
     * @param answer The line as typed.
     * @param response Receives the decision; an upper-case letter or a
     *        trailing '!' also sets applyToAll.
     * @return False if the answer is not recognized.
     */
    [[nodiscard]] static bool parseAnswer(const QString &answer, ConflictResponse *response);

private:
    bool hasFixedDecision_ = false;
    ConflictDecision fixedDecision_ = ConflictDecision::Cancel;
    QMutex mutex_;
};

#endif // CONSOLEDECISIONSOURCE_H
