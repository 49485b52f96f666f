#ifndef SIMILARITY_H
#define SIMILARITY_H

#include <QString>

/**
 * Fuzzy comparison of show names
 */
namespace Similarity {

/**
 * Lowercase and keep only ASCII letters and digits
 * ("Re:Zero - Kara" -> "rezerokara")
 */
QString normalize(const QString &text);

/**
 * Indel ratio of two strings in [0, 1]: 2 * LCS / (|a| + |b|).
 * Two empty strings compare as identical.
 */
double indelRatio(const QString &a, const QString &b);

/**
 * Token sorted ratio, rounded to a whole percent and returned in [0, 1].
 * Tokens are split on whitespace and sorted before comparing.
 */
double tokenSortRatio(const QString &a, const QString &b);

/**
 * Similarity of two show names in [0, 1]. Returns 0 when either side
 * normalizes to an empty string.
 */
double similarity(const QString &a, const QString &b);

} // namespace Similarity

#endif // SIMILARITY_H
