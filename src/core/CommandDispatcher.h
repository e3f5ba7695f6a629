#pragma once

#include <QObject>
#include <QHash>
#include <QSet>
#include <QString>
#include <QThread>
#include <QThreadPool>
#include <QFutureWatcher>
#include <QtConcurrent>
#include <QDebug>
#include <exception>
#include <functional>
#include <memory>

#include "Result.h"

struct AppState;
class CommandDispatcher;

// Payload type for commands that carry none.
struct NoPayload {};

// Passed to before/after hooks. `token` identifies the submission and is
// unique for the dispatcher's lifetime.
struct CommandContext {
    CommandDispatcher* dispatcher = nullptr;
    QString            name;
    quint64            token = 0;
};

// Typed command identifier. The payload and result types are part of the
// identity: submitting with types other than the registration's is rejected.
template<typename P, typename T>
struct Command {
    using Payload = P;
    using Output  = T;
    using Handler = std::function<Result<T>(const P&)>;
    using Before  = std::function<void(const CommandContext&, AppState&, const P&)>;
    using After   = std::function<void(const CommandContext&, AppState&, const P&, Result<T>)>;

    QString name;
};

// Routes named commands to an async handler and its result back into AppState.
//
//   submit ──▶ before(state, payload)            owning thread, synchronous
//          ──▶ handler(payload)                  thread pool
//          ──▶ after(state, payload, result)     owning thread, exactly once
//
// Hooks get the state by reference and are the only place it changes, so no
// locking is needed around it. Nothing orders different submissions; stale
// results are filtered by the Promise keys the hooks use.
class CommandDispatcher : public QObject {
    Q_OBJECT

public:
    explicit CommandDispatcher(AppState* state, QObject* parent = nullptr);
    ~CommandDispatcher() override;

    AppState* state() const { return m_state; }

    // Defaults to QThreadPool::globalInstance(). Not owned.
    void setThreadPool(QThreadPool* pool) { m_pool = pool; }
    QThreadPool* threadPool() const;

    // ── Registration ─────────────────────────────────────────────────
    template<typename P, typename T>
    void registerCommand(const Command<P, T>& command,
                         typename Command<P, T>::Handler handler,
                         typename Command<P, T>::Before before = {},
                         typename Command<P, T>::After after = {});

    bool isRegistered(const QString& name) const { return m_registry.contains(name); }
    void unregisterCommand(const QString& name) { m_registry.remove(name); }

    // ── Submission ───────────────────────────────────────────────────
    // Returns the submission token, or 0 if the command was rejected or had
    // to be re-posted to the owning thread.
    template<typename P, typename T>
    quint64 submit(const Command<P, T>& command,
                   typename Command<P, T>::Payload payload = {});

    int inFlightCount() const { return m_inFlight.size(); }
    bool isIdle() const { return m_inFlight.isEmpty(); }

    // Spins an event loop until no submission is in flight. For drivers and
    // tests; interactive code observes stateChanged() instead.
    bool waitForIdle(int timeoutMs = 30000);

signals:
    void commandSubmitted(const QString& name, quint64 token);
    void commandCompleted(const QString& name, quint64 token);
    void stateChanged();
    void idle();

private:
    struct RegistrationBase {
        virtual ~RegistrationBase() = default;
    };

    template<typename P, typename T>
    struct Registration : RegistrationBase {
        typename Command<P, T>::Handler handler;
        typename Command<P, T>::Before  before;
        typename Command<P, T>::After   after;
    };

    quint64 beginSubmission(const QString& name);
    void finishSubmission(const QString& name, quint64 token);

    AppState*    m_state;
    QThreadPool* m_pool = nullptr;
    QHash<QString, std::shared_ptr<RegistrationBase>> m_registry;
    QSet<quint64> m_inFlight;
    quint64       m_nextToken = 1;
};

// ═════════════════════════════════════════════════════════════════════
//  Template implementation
// ═════════════════════════════════════════════════════════════════════

template<typename P, typename T>
void CommandDispatcher::registerCommand(const Command<P, T>& command,
                                        typename Command<P, T>::Handler handler,
                                        typename Command<P, T>::Before before,
                                        typename Command<P, T>::After after)
{
    if (m_registry.contains(command.name))
        qWarning() << "[CommandDispatcher] Replacing registration for" << command.name;

    auto reg = std::make_shared<Registration<P, T>>();
    reg->handler = std::move(handler);
    reg->before  = std::move(before);
    reg->after   = std::move(after);
    m_registry.insert(command.name, reg);
}

template<typename P, typename T>
quint64 CommandDispatcher::submit(const Command<P, T>& command,
                                  typename Command<P, T>::Payload payload)
{
    // Hooks only ever run on the owning thread.
    if (QThread::currentThread() != thread()) {
        QMetaObject::invokeMethod(this, [this, command, payload]() {
            submit(command, payload);
        }, Qt::QueuedConnection);
        return 0;
    }

    auto it = m_registry.constFind(command.name);
    if (it == m_registry.constEnd()) {
        qWarning() << "[CommandDispatcher] Unregistered command:" << command.name;
        return 0;
    }
    auto reg = std::dynamic_pointer_cast<Registration<P, T>>(it.value());
    if (!reg || !reg->handler) {
        qWarning() << "[CommandDispatcher] Type mismatch or missing handler for" << command.name;
        return 0;
    }

    const quint64 token = beginSubmission(command.name);
    const CommandContext ctx{this, command.name, token};

    if (reg->before) {
        reg->before(ctx, *m_state, payload);
        emit stateChanged();
    }

    auto* watcher = new QFutureWatcher<Result<T>>(this);
    connect(watcher, &QFutureWatcher<Result<T>>::finished, this,
            [this, watcher, reg, ctx, payload]() {
        watcher->deleteLater();
        Result<T> result = watcher->result();
        if (result.isErr())
            qDebug() << "[CommandDispatcher]" << ctx.name << "#" << ctx.token
                     << "failed:" << result.error();

        if (reg->after) {
            reg->after(ctx, *m_state, payload, std::move(result));
            emit stateChanged();
        }
        finishSubmission(ctx.name, ctx.token);
    });

    typename Command<P, T>::Handler handler = reg->handler;
    watcher->setFuture(QtConcurrent::run(threadPool(), [handler, payload]() -> Result<T> {
        try {
            return handler(payload);
        } catch (const std::exception& e) {
            return AppError::webApi(QString::fromUtf8(e.what()));
        }
    }));

    return token;
}
