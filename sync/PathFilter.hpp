// Glob-based exclusion/include matching on '/'-separated relative paths.
//   *    any run of characters within one segment
//   **   any run across segments ("**/" may also match nothing)
//   ?    one character within a segment
// A pattern without '/' is also tried against the last segment. An exclusion
// additionally matches when it occurs literally anywhere in the path.
#pragma once
#include "SyncTypes.hpp"
#include <QRegularExpression>
#include <QString>
#include <QStringList>
#include <vector>

class PathFilter {
public:
    PathFilter() = default;
    PathFilter(const QStringList &exclusions, const QStringList &includes, SyncMode mode);

    bool isExcluded(const QString &relativePath) const;
    // Exclusions, plus the include allow-list in selective mode. Push only.
    bool isIncludedForPush(const QString &relativePath) const;

    static QRegularExpression globToRegex(const QString &pattern);
    static bool matchesGlob(const QString &relativePath, const QString &pattern);

private:
    struct Compiled {
        QString literal;
        QRegularExpression rx;
        bool basenameOnly = false; // pattern has no '/'
    };
    static Compiled compile(const QString &pattern);
    static bool matches(const Compiled &c, const QString &relativePath);

    std::vector<Compiled> exclusions_;
    std::vector<Compiled> includes_;
    SyncMode mode_ = SyncMode::Mirror;
};
