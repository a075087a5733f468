#include "log_manager.h"
#include <QDateTime>
#include <QDir>
#include <QMutexLocker>
#include <QTextStream>
#include <cstdio>

namespace {

const char* const kLevelNames[] = {"DEBUG", "INFO", "WARN", "ERROR"};

}

LogManager& LogManager::instance() {
    static LogManager s_instance;
    return s_instance;
}

LogManager::~LogManager()
{
    if (m_logFile.isOpen()) {
        m_logFile.flush();
        m_logFile.close();
    }
}

bool LogManager::initialize(const QString& logDir, Level minimumLevel) {
    QMutexLocker locker(&m_mutex);
    m_minimumLevel = minimumLevel;

    if (m_logFile.isOpen())
        m_logFile.close();
    if (logDir.isEmpty())
        return true;

    if (!QDir().mkpath(logDir)) {
        std::fprintf(stderr, "LogManager: failed to create log directory: %s\n",
                     qPrintable(logDir));
        return false;
    }

    QString logPath = logDir + "/openai-api-proxy.log";
    m_logFile.setFileName(logPath);
    if (!m_logFile.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        std::fprintf(stderr, "LogManager: failed to open log file: %s\n",
                     qPrintable(logPath));
        return false;
    }
    return true;
}

void LogManager::log(Level level, const QString& category, const QString& message) {
    if (level < Debug || level > Error) {
        level = Error;
    }
    if (level < m_minimumLevel)
        return;

    const QString formatted = formatMessage(level, category, message);

    QMutexLocker locker(&m_mutex);
    std::fprintf(stderr, "%s\n", formatted.toLocal8Bit().constData());
    std::fflush(stderr);

    if (m_logFile.isOpen()) {
        QTextStream stream(&m_logFile);
        stream << formatted << "\n";
        stream.flush();
    }
}

QString LogManager::formatMessage(Level level, const QString& category, const QString& message) {
    QString timestamp = QDateTime::currentDateTime().toString("yyyy-MM-dd hh:mm:ss.zzz");
    return QString("[%1] [%2] [%3] %4")
        .arg(timestamp, kLevelNames[level], category, message);
}

bool LogManager::parseLevel(const QString& name, Level* level) {
    const QString n = name.trimmed().toLower();
    Level parsed;
    if (n == "debug")
        parsed = Debug;
    else if (n == "info")
        parsed = Info;
    else if (n == "warn")
        parsed = Warning;
    else if (n == "error")
        parsed = Error;
    else
        return false;

    if (level)
        *level = parsed;
    return true;
}
