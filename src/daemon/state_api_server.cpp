#include "daemon/state_api_server.hpp"

#include <string>
#include <utility>

#include <QDir>
#include <QFile>
#include <QFileInfo>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "common/state_error.hpp"

namespace hoststate {

namespace {

constexpr int kMaxRequestBytes = 64 * 1024 * 1024;

// True while `payload` is a prefix of a JSON value: the parser only failed
// because it ran out of input.
bool isIncompleteJson(const QByteArray &payload)
{
    if (payload.trimmed().isEmpty()) {
        return true;
    }
    try {
        static_cast<void>(nlohmann::json::parse(payload.constData(),
                                                payload.constData() + payload.size()));
        return false;
    } catch (const nlohmann::json::parse_error &ex) {
        return ex.byte > static_cast<std::size_t>(payload.size());
    }
}

} // namespace

StateApiServer::StateApiServer(RequestHandler &handler, QString socketPath, QObject *parent)
    : QObject(parent)
    , m_handler(handler)
    , m_socketPath(std::move(socketPath))
{
}

StateApiServer::~StateApiServer() = default;

bool StateApiServer::start()
{
    if (m_socketPath.contains('/')) {
        const QFileInfo socketInfo(m_socketPath);
        if (!QDir().mkpath(socketInfo.absolutePath())) {
            HSLOG_ERROR(QStringLiteral("StateApiServer"),
                        QStringLiteral("start"),
                        QStringLiteral("socket_dir_failed"),
                        QStringLiteral("mkpath"),
                        QStringLiteral("local_socket"),
                        hoststate::logging::defaultWho(),
                        QString(),
                        (nlohmann::json{{"dir", socketInfo.absolutePath().toStdString()}}));
            return false;
        }

        if (QFile::exists(m_socketPath) && !QLocalServer::removeServer(m_socketPath)) {
            HSLOG_ERROR(QStringLiteral("StateApiServer"),
                        QStringLiteral("start"),
                        QStringLiteral("stale_socket_remove_failed"),
                        QStringLiteral("socket_in_use"),
                        QStringLiteral("local_socket"),
                        hoststate::logging::defaultWho(),
                        QString(),
                        (nlohmann::json{{"socket", m_socketPath.toStdString()}}));
            return false;
        }
    } else {
        QLocalServer::removeServer(m_socketPath);
    }

    m_server.setSocketOptions(QLocalServer::UserAccessOption);
    if (!m_server.listen(m_socketPath)) {
        HSLOG_ERROR(QStringLiteral("StateApiServer"),
                    QStringLiteral("start"),
                    QStringLiteral("listen_failed"),
                    m_server.errorString(),
                    QStringLiteral("local_socket"),
                    hoststate::logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"socket", m_socketPath.toStdString()}}));
        return false;
    }

    connect(&m_server, &QLocalServer::newConnection,
            this, &StateApiServer::handleNewConnection);

    HSLOG_INFO(QStringLiteral("StateApiServer"),
               QStringLiteral("start"),
               QStringLiteral("listening"),
               QStringLiteral("daemon_start"),
               QStringLiteral("local_socket"),
               hoststate::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"socket", m_socketPath.toStdString()}}));
    return true;
}

void StateApiServer::handleNewConnection()
{
    while (m_server.hasPendingConnections()) {
        QLocalSocket *socket = m_server.nextPendingConnection();
        if (!socket) {
            continue;
        }
        connect(socket, &QLocalSocket::readyRead,
                this, &StateApiServer::handleClientReadyRead);
        connect(socket, &QLocalSocket::disconnected, this, [this, socket]() {
            m_pending.remove(socket);
            socket->deleteLater();
        });
    }
}

void StateApiServer::handleClientReadyRead()
{
    auto *socket = qobject_cast<QLocalSocket *>(sender());
    if (!socket) {
        return;
    }

    QByteArray &buffer = m_pending[socket];
    buffer += socket->readAll();

    if (buffer.size() > kMaxRequestBytes) {
        HSLOG_WARN(QStringLiteral("StateApiServer"),
                   QStringLiteral("handleClientReadyRead"),
                   QStringLiteral("request_too_large"),
                   QStringLiteral("size_limit"),
                   QStringLiteral("local_socket"),
                   hoststate::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"bytes", buffer.size()}, {"limit", kMaxRequestBytes}}));
        m_pending.remove(socket);
        const StateError error(ErrorCode::ValidationError,
                               "Request exceeds " + std::to_string(kMaxRequestBytes) + " bytes");
        respond(socket, QByteArray::fromStdString(makeErrorResponse(error.toJson(), -1).dump()));
        return;
    }
    if (isIncompleteJson(buffer)) {
        return;
    }

    const QByteArray payload = m_pending.take(socket);
    respond(socket, m_handler.handlePayload(payload));
}

void StateApiServer::respond(QLocalSocket *socket, const QByteArray &response)
{
    // Stop reading; the rest of an oversized request is discarded.
    disconnect(socket, &QLocalSocket::readyRead,
               this, &StateApiServer::handleClientReadyRead);
    socket->write(response);
    socket->flush();
    // Pending bytes are written before the connection closes.
    socket->disconnectFromServer();
}

} // namespace hoststate
