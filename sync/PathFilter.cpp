#include "PathFilter.hpp"

PathFilter::PathFilter(const QStringList &exclusions, const QStringList &includes,
                       SyncMode mode)
    : mode_(mode) {
    for (const QString &p : exclusions) {
        if (!p.trimmed().isEmpty())
            exclusions_.push_back(compile(p.trimmed()));
    }
    for (const QString &p : includes) {
        if (!p.trimmed().isEmpty())
            includes_.push_back(compile(p.trimmed()));
    }
}

QRegularExpression PathFilter::globToRegex(const QString &pattern) {
    QString rx;
    rx.reserve(pattern.size() * 2 + 2);
    rx += QLatin1Char('^');
    for (int i = 0; i < pattern.size(); ++i) {
        const QChar c = pattern.at(i);
        if (c == QLatin1Char('*')) {
            if (i + 1 < pattern.size() && pattern.at(i + 1) == QLatin1Char('*')) {
                ++i;
                if (i + 1 < pattern.size() && pattern.at(i + 1) == QLatin1Char('/')) {
                    ++i;
                    rx += QStringLiteral("(?:.*/)?");
                } else {
                    rx += QStringLiteral(".*");
                }
            } else {
                rx += QStringLiteral("[^/]*");
            }
        } else if (c == QLatin1Char('?')) {
            rx += QStringLiteral("[^/]");
        } else {
            rx += QRegularExpression::escape(QString(c));
        }
    }
    rx += QLatin1Char('$');
    return QRegularExpression(rx);
}

PathFilter::Compiled PathFilter::compile(const QString &pattern) {
    Compiled c;
    c.literal = pattern;
    c.rx = globToRegex(pattern);
    c.basenameOnly = !pattern.contains(QLatin1Char('/'));
    return c;
}

bool PathFilter::matches(const Compiled &c, const QString &relativePath) {
    if (c.rx.match(relativePath).hasMatch())
        return true;
    if (c.basenameOnly) {
        const int slash = relativePath.lastIndexOf(QLatin1Char('/'));
        if (slash >= 0 && c.rx.match(relativePath.mid(slash + 1)).hasMatch())
            return true;
    }
    return false;
}

bool PathFilter::matchesGlob(const QString &relativePath, const QString &pattern) {
    return matches(compile(pattern), relativePath);
}

bool PathFilter::isExcluded(const QString &relativePath) const {
    for (const Compiled &c : exclusions_) {
        if (matches(c, relativePath) || relativePath.contains(c.literal))
            return true;
    }
    return false;
}

bool PathFilter::isIncludedForPush(const QString &relativePath) const {
    if (isExcluded(relativePath))
        return false;
    if (mode_ == SyncMode::Mirror || includes_.empty())
        return true;
    for (const Compiled &c : includes_) {
        if (matches(c, relativePath))
            return true;
    }
    return false;
}
