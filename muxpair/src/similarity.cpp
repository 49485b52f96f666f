#include "similarity.h"
#include <QStringList>
#include <QVector>
#include <QtMath>
#include <algorithm>

namespace Similarity {

QString normalize(const QString &text)
{
    const QString lower = text.toLower();
    QString result;
    result.reserve(lower.size());
    for (const QChar ch : lower) {
        const ushort code = ch.unicode();
        if ((code >= 'a' && code <= 'z') || (code >= '0' && code <= '9')) {
            result.append(ch);
        }
    }
    return result;
}

double indelRatio(const QString &a, const QString &b)
{
    const int total = a.size() + b.size();
    if (total == 0) {
        return 1.0;
    }

    // Longest common subsequence, two rolling rows
    QVector<int> previous(b.size() + 1, 0);
    QVector<int> current(b.size() + 1, 0);
    for (int i = 1; i <= a.size(); ++i) {
        for (int j = 1; j <= b.size(); ++j) {
            if (a.at(i - 1) == b.at(j - 1)) {
                current[j] = previous[j - 1] + 1;
            } else {
                current[j] = std::max(previous[j], current[j - 1]);
            }
        }
        std::swap(previous, current);
    }
    const int lcs = previous[b.size()];

    return (2.0 * lcs) / total;
}

static QString sortedTokens(const QString &text)
{
    QStringList tokens = text.simplified().split(' ', Qt::SkipEmptyParts);
    std::sort(tokens.begin(), tokens.end());
    return tokens.join(' ');
}

double tokenSortRatio(const QString &a, const QString &b)
{
    const double ratio = indelRatio(sortedTokens(a), sortedTokens(b));
    return qRound(ratio * 100.0) / 100.0;
}

double similarity(const QString &a, const QString &b)
{
    const QString normA = normalize(a);
    const QString normB = normalize(b);

    if (normA.isEmpty() || normB.isEmpty()) {
        return 0.0;
    }

    return tokenSortRatio(normA, normB);
}

} // namespace Similarity
