#include "episodekey.h"

EpisodeKey::EpisodeKey()
    : m_season(-1), m_episode(-1)
{
}

EpisodeKey::EpisodeKey(int season, int episode)
    : m_season(season < 0 ? -1 : season)
    , m_episode(episode < 0 ? -1 : episode)
{
}

EpisodeKey EpisodeKey::episodeOnly(int episode)
{
    return EpisodeKey(-1, episode);
}

QString EpisodeKey::toDisplayString() const
{
    if(!hasEpisode())
        return "";

    if(hasSeason())
        return QString("S%1E%2").arg(m_season, 2, 10, QChar('0')).arg(m_episode, 2, 10, QChar('0'));

    return QString("%1").arg(m_episode, 2, 10, QChar('0'));
}

QString EpisodeKey::toDebugString() const
{
    QString season = hasSeason() ? QString::number(m_season) : QString("?");
    QString episode = hasEpisode() ? QString::number(m_episode) : QString("?");
    return QString("S%1E%2").arg(season, episode);
}

bool EpisodeKey::operator==(const EpisodeKey& other) const
{
    return m_season == other.m_season && m_episode == other.m_episode;
}

bool EpisodeKey::operator!=(const EpisodeKey& other) const
{
    return !(*this == other);
}
