#include "consoledecisionsource.h"
#include "../utils/fileutils.h"

#include <QMutexLocker>

#include <cstdio>

namespace {

QString contextToString(ConflictContext context)
{
    switch (context) {
    case ConflictContext::Downloading: return QStringLiteral("download");
    case ConflictContext::Extraction: return QStringLiteral("extraction");
    case ConflictContext::Processing: return QStringLiteral("processing");
    }
    return QString();
}

} // namespace

ConsoleDecisionSource::ConsoleDecisionSource() = default;

ConsoleDecisionSource::ConsoleDecisionSource(ConflictDecision fixedDecision)
    : hasFixedDecision_(true)
    , fixedDecision_(fixedDecision)
{
}

bool ConsoleDecisionSource::parseAnswer(const QString &answer, ConflictResponse *response)
{
    QString text = answer.trimmed();
    if (text.isEmpty()) {
        return false;
    }

    bool applyToAll = false;
    if (text.endsWith('!')) {
        applyToAll = true;
        text.chop(1);
    } else if (text.size() == 1 && text.at(0).isUpper()) {
        applyToAll = true;
    }

    QString word = text.toLower();
    ConflictDecision decision;
    if (word == "o" || word == "overwrite") {
        decision = ConflictDecision::Overwrite;
    } else if (word == "s" || word == "skip") {
        decision = ConflictDecision::Skip;
    } else if (word == "r" || word == "rename") {
        decision = ConflictDecision::Rename;
    } else if (word == "c" || word == "cancel") {
        decision = ConflictDecision::Cancel;
    } else {
        return false;
    }

    response->decision = decision;
    response->applyToAll = applyToAll;
    return true;
}

ConflictResponse ConsoleDecisionSource::decide(const QList<Conflict> &conflicts,
                                               ConflictContext context,
                                               const QList<ConflictDecision> &offered)
{
    if (hasFixedDecision_) {
        ConflictResponse response;
        response.decision = offered.contains(fixedDecision_) ? fixedDecision_ : ConflictDecision::Skip;
        response.applyToAll = true;
        return response;
    }

    QMutexLocker locker(&mutex_);
    QTextStream out(stdout);
    QTextStream in(stdin);

    out << "\nAlready exists (" << contextToString(context) << "):\n";
    for (const Conflict &conflict : conflicts) {
        out << "  " << conflict.path << "  " << FileUtils::formatFileSize(conflict.existingSizeBytes);
        if (conflict.newSizeBytes >= 0) {
            out << " -> " << FileUtils::formatFileSize(conflict.newSizeBytes);
        }
        out << "\n";
    }

    QStringList choices;
    for (ConflictDecision decision : offered) {
        QString name = QString::fromLatin1(conflictDecisionToString(decision));
        choices.append("[" + name.left(1).toLower() + "]" + name.mid(1).toLower());
    }

    while (true) {
        out << choices.join(' ') << " (capital or trailing ! = apply to all): " << Qt::flush;
        QString line = in.readLine();
        if (line.isNull()) {
            // stdin closed
            return ConflictResponse{};
        }
        ConflictResponse response;
        if (parseAnswer(line, &response) && offered.contains(response.decision)) {
            return response;
        }
        out << "Please choose one of the offered answers.\n";
    }
}
