#include "CommandDispatcher.h"
#include "AppState.h"

#include <QEventLoop>
#include <QTimer>

CommandDispatcher::CommandDispatcher(AppState* state, QObject* parent)
    : QObject(parent)
    , m_state(state)
{
}

CommandDispatcher::~CommandDispatcher()
{
    if (!m_inFlight.isEmpty())
        qDebug() << "[CommandDispatcher] Destroyed with" << m_inFlight.size()
                 << "submission(s) in flight — results will be dropped";
}

QThreadPool* CommandDispatcher::threadPool() const
{
    return m_pool ? m_pool : QThreadPool::globalInstance();
}

bool CommandDispatcher::waitForIdle(int timeoutMs)
{
    if (m_inFlight.isEmpty())
        return true;

    QEventLoop loop;
    QTimer timeout;
    timeout.setSingleShot(true);
    connect(this, &CommandDispatcher::idle, &loop, &QEventLoop::quit);
    connect(&timeout, &QTimer::timeout, &loop, &QEventLoop::quit);
    timeout.start(timeoutMs);
    loop.exec();

    if (!m_inFlight.isEmpty()) {
        qWarning() << "[CommandDispatcher] Still" << m_inFlight.size()
                   << "submission(s) in flight after" << timeoutMs << "ms";
        return false;
    }
    return true;
}

quint64 CommandDispatcher::beginSubmission(const QString& name)
{
    const quint64 token = m_nextToken++;
    m_inFlight.insert(token);
    qDebug() << "[CommandDispatcher] Submit" << name << "#" << token;
    emit commandSubmitted(name, token);
    return token;
}

void CommandDispatcher::finishSubmission(const QString& name, quint64 token)
{
    m_inFlight.remove(token);
    emit commandCompleted(name, token);
    if (m_inFlight.isEmpty())
        emit idle();
}
